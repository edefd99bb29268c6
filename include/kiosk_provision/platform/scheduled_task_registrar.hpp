#pragma once

#include <kiosk_provision/platform/i_launch_registrar.hpp>
#include <kiosk_provision/platform/i_process_runner.hpp>

#include <string>

namespace kiosk_provision {

/// Render a Task Scheduler 1.2 definition: logon trigger for `task.account`,
/// interactive least-privilege principal, one Exec action.
std::string BuildTaskXml(const LaunchTask& task);

// ---------------------------------------------------------------------------
// ScheduledTaskRegistrar: writes the task XML to a temporary file and runs
// `schtasks /Create /TN <name> /XML <file> /F`. /F replaces an existing task
// of the same name, so registering twice leaves one task.
// ---------------------------------------------------------------------------
class ScheduledTaskRegistrar : public ILaunchRegistrar {
public:
    explicit ScheduledTaskRegistrar(IProcessRunner& runner);

    [[nodiscard]] Result<void, Error> Register(const LaunchTask& task) override;

private:
    IProcessRunner& runner_;
};

} // namespace kiosk_provision
