#pragma once

#include <kiosk_provision/core/result.hpp>

#include <string>
#include <vector>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// LaunchTask: "when <account> logs on, run <executable> <arguments>".
// ---------------------------------------------------------------------------
struct LaunchTask {
    std::string task_name;
    std::string account;
    std::string executable;
    std::vector<std::string> arguments;
    std::string description;
};

// ---------------------------------------------------------------------------
// ILaunchRegistrar: registers the logon launch. Registering a task whose
// name already exists replaces it.
// ---------------------------------------------------------------------------
class ILaunchRegistrar {
public:
    virtual ~ILaunchRegistrar() = default;

    ILaunchRegistrar(const ILaunchRegistrar&) = delete;
    ILaunchRegistrar& operator=(const ILaunchRegistrar&) = delete;
    ILaunchRegistrar(ILaunchRegistrar&&) = delete;
    ILaunchRegistrar& operator=(ILaunchRegistrar&&) = delete;

    [[nodiscard]] virtual Result<void, Error> Register(const LaunchTask& task) = 0;

protected:
    ILaunchRegistrar() = default;
};

} // namespace kiosk_provision
