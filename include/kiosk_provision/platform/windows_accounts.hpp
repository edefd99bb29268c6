#pragma once

#include <kiosk_provision/platform/i_account_provisioner.hpp>
#include <kiosk_provision/platform/i_auto_login_configurator.hpp>
#include <kiosk_provision/platform/i_host_info.hpp>
#include <kiosk_provision/platform/i_process_runner.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace kiosk_provision {

// Registry key holding the automatic sign-in values.
inline constexpr const char* kWinlogonKey =
    "HKLM\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion\\Winlogon";

// Registry key holding CurrentBuildNumber.
inline constexpr const char* kCurrentVersionKey =
    "HKLM\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion";

// ---------------------------------------------------------------------------
// WindowsAccountProvisioner: local accounts via `net user`. Accounts
// created by `net user /add` belong to the Users group only.
//
// Holds a reference to the runner; the runner must outlive this object.
// ---------------------------------------------------------------------------
class WindowsAccountProvisioner : public IAccountProvisioner {
public:
    explicit WindowsAccountProvisioner(IProcessRunner& runner);

    [[nodiscard]] Result<bool, Error> AccountExists(const AccountName& name) override;

    [[nodiscard]] Result<AccountOutcome, Error> EnsureAccount(
        const AccountRequest& request) override;

private:
    Result<void, Error> CreateAccount(const AccountRequest& request);
    Result<void, Error> SetPassword(const AccountName& name, const std::string& password);

    IProcessRunner& runner_;
};

// ---------------------------------------------------------------------------
// WinlogonAutoLoginConfigurator: AutoAdminLogon / DefaultUserName /
// DefaultPassword under the Winlogon key, written with `reg`.
// ---------------------------------------------------------------------------
class WinlogonAutoLoginConfigurator : public IAutoLoginConfigurator {
public:
    explicit WinlogonAutoLoginConfigurator(IProcessRunner& runner);

    [[nodiscard]] Result<void, Error> Enable(
        const AccountName& account,
        const std::optional<std::string>& password) override;

    [[nodiscard]] Result<void, Error> Disable() override;

private:
    Result<void, Error> SetValue(const std::string& name, const std::string& data);
    Result<void, Error> DeleteValue(const std::string& name);

    IProcessRunner& runner_;
};

// ---------------------------------------------------------------------------
// WindowsHostInfo: reads CurrentBuildNumber with `reg query`.
// ---------------------------------------------------------------------------
class WindowsHostInfo : public IHostInfo {
public:
    explicit WindowsHostInfo(IProcessRunner& runner);

    [[nodiscard]] Result<int, Error> BuildNumber() override;

private:
    IProcessRunner& runner_;
};

// Extract the data column of `value_name` from `reg query` output, e.g.
//   "    CurrentBuildNumber    REG_SZ    19045"  ->  "19045"
std::optional<std::string> ParseRegQueryValue(std::string_view output,
                                              std::string_view value_name);

} // namespace kiosk_provision
