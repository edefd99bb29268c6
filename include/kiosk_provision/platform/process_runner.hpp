#pragma once

#include <kiosk_provision/platform/i_process_runner.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// SystemProcessRunner: runs a child process with stdout and stderr merged
// into one captured buffer. CreateProcess on Windows, fork/exec elsewhere.
// ---------------------------------------------------------------------------
class SystemProcessRunner : public IProcessRunner {
public:
    SystemProcessRunner() = default;

    [[nodiscard]] Result<ProcessOutput, Error> Run(
        std::string_view program,
        const std::vector<std::string>& args) override;
};

// Quote one argument the way the MSVC runtime (CommandLineToArgvW) splits it.
std::string QuoteWindowsArgument(const std::string& value);

// Join program + args into a single Windows command line.
std::string FormatCommandLine(std::string_view program,
                              const std::vector<std::string>& args);

} // namespace kiosk_provision
