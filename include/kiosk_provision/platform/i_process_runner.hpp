#pragma once

#include <kiosk_provision/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// ProcessOutput: exit code plus combined stdout/stderr of a child process.
// ---------------------------------------------------------------------------
struct ProcessOutput {
    int exit_code = 0;
    std::string output;
};

// ---------------------------------------------------------------------------
// IProcessRunner: runs a system tool and waits for it.
//
// Every OS-facing collaborator (accounts, registry, scheduled tasks, package
// installer) goes through this interface, which keeps them testable offline
// via MockProcessRunner.
//
// Run() returns Err only when the process could not be started. A process
// that starts and exits non-zero is an Ok result; the caller decides what a
// given exit code means.
// ---------------------------------------------------------------------------
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    IProcessRunner(const IProcessRunner&) = delete;
    IProcessRunner& operator=(const IProcessRunner&) = delete;
    IProcessRunner(IProcessRunner&&) = delete;
    IProcessRunner& operator=(IProcessRunner&&) = delete;

    [[nodiscard]] virtual Result<ProcessOutput, Error> Run(
        std::string_view program,
        const std::vector<std::string>& args) = 0;

protected:
    IProcessRunner() = default;
};

} // namespace kiosk_provision
