#include <kiosk_provision/platform/process_runner.hpp>

#include <kiosk_provision/core/log.hpp>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace kiosk_provision {

namespace {

constexpr const char* kComponent = "process";

Error StartError(std::string_view program, const std::string& detail) {
    return Error{"RunProcess", std::string(program), std::nullopt,
                 "could not start process: " + detail,
                 std::string("Check that the tool is installed and on PATH"),
                 ErrorCategory::Process};
}

} // namespace

std::string QuoteWindowsArgument(const std::string& value) {
    if (value.empty()) return "\"\"";
    if (value.find_first_of(" \t\"") == std::string::npos) return value;

    std::string out;
    out.push_back('"');
    size_t slash_count = 0;
    for (char c : value) {
        if (c == '\\') {
            ++slash_count;
            continue;
        }
        if (c == '"') {
            out.append(slash_count * 2 + 1, '\\');
            out.push_back('"');
            slash_count = 0;
            continue;
        }
        out.append(slash_count, '\\');
        slash_count = 0;
        out.push_back(c);
    }
    out.append(slash_count * 2, '\\');
    out.push_back('"');
    return out;
}

std::string FormatCommandLine(std::string_view program,
                              const std::vector<std::string>& args) {
    std::string command_line = QuoteWindowsArgument(std::string(program));
    for (const auto& arg : args) {
        command_line.push_back(' ');
        command_line += QuoteWindowsArgument(arg);
    }
    return command_line;
}

#ifdef _WIN32

Result<ProcessOutput, Error> SystemProcessRunner::Run(
    std::string_view program,
    const std::vector<std::string>& args) {
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!CreatePipe(&read_end, &write_end, &sa, 0)) {
        return Result<ProcessOutput, Error>::Err(
            StartError(program, "CreatePipe failed (" + std::to_string(GetLastError()) + ")"));
    }
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA startup{};
    startup.cb = sizeof(startup);
    startup.dwFlags = STARTF_USESTDHANDLES;
    startup.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    startup.hStdOutput = write_end;
    startup.hStdError = write_end;

    PROCESS_INFORMATION process{};
    auto command_line = FormatCommandLine(program, args);
    std::vector<char> mutable_cmd(command_line.begin(), command_line.end());
    mutable_cmd.push_back('\0');

    const BOOL started = CreateProcessA(nullptr, mutable_cmd.data(), nullptr, nullptr,
                                        TRUE, CREATE_NO_WINDOW, nullptr, nullptr,
                                        &startup, &process);
    CloseHandle(write_end);
    if (!started) {
        const DWORD code = GetLastError();
        CloseHandle(read_end);
        return Result<ProcessOutput, Error>::Err(
            StartError(program, "CreateProcess failed (" + std::to_string(code) + ")"));
    }

    ProcessOutput result;
    char buffer[4096];
    DWORD bytes_read = 0;
    while (ReadFile(read_end, buffer, sizeof(buffer), &bytes_read, nullptr) && bytes_read > 0) {
        result.output.append(buffer, bytes_read);
    }
    CloseHandle(read_end);

    WaitForSingleObject(process.hProcess, INFINITE);
    DWORD exit_code = 1;
    GetExitCodeProcess(process.hProcess, &exit_code);
    CloseHandle(process.hProcess);
    CloseHandle(process.hThread);

    result.exit_code = static_cast<int>(exit_code);
    LogDebug(kComponent, std::string(program) + " exited with " +
                             std::to_string(result.exit_code));
    return Result<ProcessOutput, Error>::Ok(std::move(result));
}

#else

Result<ProcessOutput, Error> SystemProcessRunner::Run(
    std::string_view program,
    const std::vector<std::string>& args) {
    const std::string program_str(program);

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        return Result<ProcessOutput, Error>::Err(
            StartError(program, std::string("pipe: ") + std::strerror(errno)));
    }
    // Close-on-exec pipe: the child writes errno here only if execvp fails.
    int exec_pipe[2];
    if (pipe(exec_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return Result<ProcessOutput, Error>::Err(
            StartError(program, std::string("pipe: ") + std::strerror(errno)));
    }
    fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program_str.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return Result<ProcessOutput, Error>::Err(
            StartError(program, std::string("fork: ") + std::strerror(errno)));
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(exec_pipe[0]);
        execvp(program_str.c_str(), argv.data());
        const int exec_errno = errno;
        ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    const ssize_t exec_bytes = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    close(exec_pipe[0]);

    ProcessOutput result;
    char buffer[4096];
    ssize_t n = 0;
    while ((n = read(out_pipe[0], buffer, sizeof(buffer))) > 0) {
        result.output.append(buffer, static_cast<size_t>(n));
    }
    close(out_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (exec_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        return Result<ProcessOutput, Error>::Err(
            StartError(program, std::strerror(exec_errno)));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    LogDebug(kComponent, program_str + " exited with " + std::to_string(result.exit_code));
    return Result<ProcessOutput, Error>::Ok(std::move(result));
}

#endif

} // namespace kiosk_provision
