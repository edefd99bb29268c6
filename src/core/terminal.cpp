#include <kiosk_provision/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace kiosk_provision {

namespace {

#ifdef _WIN32
void EnableAnsiForHandle(DWORD std_handle_id) {
    HANDLE handle = GetStdHandle(std_handle_id);
    if (handle == nullptr || handle == INVALID_HANDLE_VALUE) return;

    DWORD mode = 0;
    if (!GetConsoleMode(handle, &mode)) return;
    SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
}
#endif

} // namespace

bool IsStderrTty() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

bool IsStdoutTty() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

bool IsStdinTty() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

void EnableVirtualTerminal() {
#ifdef _WIN32
    EnableAnsiForHandle(STD_OUTPUT_HANDLE);
    EnableAnsiForHandle(STD_ERROR_HANDLE);
#endif
}

} // namespace kiosk_provision
