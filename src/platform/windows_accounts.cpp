#include <kiosk_provision/platform/windows_accounts.hpp>

#include <kiosk_provision/core/log.hpp>

#include <cctype>
#include <sstream>
#include <vector>

namespace kiosk_provision {

namespace {

constexpr const char* kComponent = "account";

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// Re-tag a runner error so the caller sees which step failed.
Error Retag(Error error, const char* operation, ErrorCategory category) {
    error.operation = operation;
    error.category = category;
    return error;
}

bool IsUserNotFound(const ProcessOutput& out) {
    // NERR_UserNotFound
    return Contains(out.output, "2221") || Contains(out.output, "could not be found");
}

bool IsRegistryValueMissing(const ProcessOutput& out) {
    return Contains(out.output, "unable to find");
}

} // namespace

// ---------------------------------------------------------------------------
// WindowsAccountProvisioner
// ---------------------------------------------------------------------------
WindowsAccountProvisioner::WindowsAccountProvisioner(IProcessRunner& runner)
    : runner_(runner) {}

Result<bool, Error> WindowsAccountProvisioner::AccountExists(const AccountName& name) {
    auto run = runner_.Run("net", {"user", name.Value()});
    if (run.IsErr()) {
        return Result<bool, Error>::Err(
            Retag(std::move(run).Error(), "AccountExists", ErrorCategory::Account));
    }
    const auto& out = run.Value();
    if (out.exit_code == 0) {
        return Result<bool, Error>::Ok(true);
    }
    if (IsUserNotFound(out)) {
        return Result<bool, Error>::Ok(false);
    }
    return Result<bool, Error>::Err(Error::FromProcessExit(
        "AccountExists", name.Value(), out.exit_code, out.output, ErrorCategory::Account));
}

Result<AccountOutcome, Error> WindowsAccountProvisioner::EnsureAccount(
    const AccountRequest& request) {
    auto exists = AccountExists(request.name);
    if (exists.IsErr()) {
        return Result<AccountOutcome, Error>::Err(std::move(exists).Error());
    }

    if (!exists.Value()) {
        auto created = CreateAccount(request);
        if (created.IsErr()) {
            return Result<AccountOutcome, Error>::Err(std::move(created).Error());
        }
        LogInfo(kComponent, "Created local account '" + request.name.Value() + "'");
        return Result<AccountOutcome, Error>::Ok(AccountOutcome::Created);
    }

    if (request.password.has_value()) {
        auto updated = SetPassword(request.name, *request.password);
        if (updated.IsErr()) {
            return Result<AccountOutcome, Error>::Err(std::move(updated).Error());
        }
        LogInfo(kComponent, "Account '" + request.name.Value() +
                                "' exists; credential re-attached");
        return Result<AccountOutcome, Error>::Ok(AccountOutcome::PasswordUpdated);
    }

    LogInfo(kComponent, "Account '" + request.name.Value() + "' already exists");
    return Result<AccountOutcome, Error>::Ok(AccountOutcome::AlreadyExists);
}

Result<void, Error> WindowsAccountProvisioner::CreateAccount(const AccountRequest& request) {
    std::vector<std::string> args = {"user", request.name.Value()};
    if (request.password.has_value()) {
        args.push_back(*request.password);
    }
    args.push_back("/add");
    args.push_back("/fullname:" + request.display_name);
    args.push_back("/passwordchg:no");
    args.push_back("/expires:never");
    if (!request.password.has_value()) {
        args.push_back("/passwordreq:no");
    }

    auto run = runner_.Run("net", args);
    if (run.IsErr()) {
        return Result<void, Error>::Err(
            Retag(std::move(run).Error(), "CreateAccount", ErrorCategory::Account));
    }
    if (run.Value().exit_code != 0) {
        return Result<void, Error>::Err(Error::FromProcessExit(
            "CreateAccount", request.name.Value(), run.Value().exit_code,
            run.Value().output, ErrorCategory::Account));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> WindowsAccountProvisioner::SetPassword(const AccountName& name,
                                                           const std::string& password) {
    auto run = runner_.Run("net", {"user", name.Value(), password});
    if (run.IsErr()) {
        return Result<void, Error>::Err(
            Retag(std::move(run).Error(), "SetPassword", ErrorCategory::Account));
    }
    if (run.Value().exit_code != 0) {
        return Result<void, Error>::Err(Error::FromProcessExit(
            "SetPassword", name.Value(), run.Value().exit_code,
            run.Value().output, ErrorCategory::Account));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// WinlogonAutoLoginConfigurator
// ---------------------------------------------------------------------------
WinlogonAutoLoginConfigurator::WinlogonAutoLoginConfigurator(IProcessRunner& runner)
    : runner_(runner) {}

Result<void, Error> WinlogonAutoLoginConfigurator::Enable(
    const AccountName& account,
    const std::optional<std::string>& password) {
    auto step = SetValue("AutoAdminLogon", "1");
    if (step.IsErr()) return step;
    step = SetValue("DefaultUserName", account.Value());
    if (step.IsErr()) return step;
    step = SetValue("DefaultDomainName", ".");
    if (step.IsErr()) return step;

    step = password.has_value() ? SetValue("DefaultPassword", *password)
                                : DeleteValue("DefaultPassword");
    if (step.IsErr()) return step;

    // A leftover AutoLogonCount would switch auto-login off after N boots.
    step = DeleteValue("AutoLogonCount");
    if (step.IsErr()) return step;

    LogInfo(kComponent, "Automatic sign-in enabled for '" + account.Value() + "'");
    return Result<void, Error>::Ok();
}

Result<void, Error> WinlogonAutoLoginConfigurator::Disable() {
    auto step = SetValue("AutoAdminLogon", "0");
    if (step.IsErr()) return step;
    step = DeleteValue("DefaultPassword");
    if (step.IsErr()) return step;

    LogInfo(kComponent, "Automatic sign-in disabled");
    return Result<void, Error>::Ok();
}

Result<void, Error> WinlogonAutoLoginConfigurator::SetValue(const std::string& name,
                                                            const std::string& data) {
    auto run = runner_.Run("reg", {"add", kWinlogonKey, "/v", name,
                                   "/t", "REG_SZ", "/d", data, "/f"});
    if (run.IsErr()) {
        return Result<void, Error>::Err(
            Retag(std::move(run).Error(), "SetWinlogonValue", ErrorCategory::AutoLogin));
    }
    if (run.Value().exit_code != 0) {
        return Result<void, Error>::Err(Error::FromProcessExit(
            "SetWinlogonValue", name, run.Value().exit_code,
            run.Value().output, ErrorCategory::AutoLogin));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> WinlogonAutoLoginConfigurator::DeleteValue(const std::string& name) {
    auto run = runner_.Run("reg", {"delete", kWinlogonKey, "/v", name, "/f"});
    if (run.IsErr()) {
        return Result<void, Error>::Err(
            Retag(std::move(run).Error(), "DeleteWinlogonValue", ErrorCategory::AutoLogin));
    }
    const auto& out = run.Value();
    if (out.exit_code != 0 && !IsRegistryValueMissing(out)) {
        return Result<void, Error>::Err(Error::FromProcessExit(
            "DeleteWinlogonValue", name, out.exit_code, out.output,
            ErrorCategory::AutoLogin));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// WindowsHostInfo
// ---------------------------------------------------------------------------
WindowsHostInfo::WindowsHostInfo(IProcessRunner& runner) : runner_(runner) {}

Result<int, Error> WindowsHostInfo::BuildNumber() {
    auto run = runner_.Run("reg", {"query", kCurrentVersionKey, "/v", "CurrentBuildNumber"});
    if (run.IsErr()) {
        return Result<int, Error>::Err(
            Retag(std::move(run).Error(), "BuildNumber", ErrorCategory::HostInfo));
    }
    const auto& out = run.Value();
    if (out.exit_code != 0) {
        return Result<int, Error>::Err(Error::FromProcessExit(
            "BuildNumber", kCurrentVersionKey, out.exit_code, out.output,
            ErrorCategory::HostInfo));
    }

    auto value = ParseRegQueryValue(out.output, "CurrentBuildNumber");
    if (!value.has_value() || value->empty() ||
        value->find_first_not_of("0123456789") != std::string::npos ||
        value->size() > 9) {
        return Result<int, Error>::Err(Error{
            "BuildNumber", kCurrentVersionKey, std::nullopt,
            "unexpected reg query output", std::nullopt, ErrorCategory::HostInfo});
    }
    return Result<int, Error>::Ok(std::stoi(*value));
}

std::optional<std::string> ParseRegQueryValue(std::string_view output,
                                              std::string_view value_name) {
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string name;
        std::string type;
        if (!(fields >> name >> type)) continue;
        if (name != value_name || type.rfind("REG_", 0) != 0) continue;

        std::string data;
        std::getline(fields, data);
        auto first = data.find_first_not_of(" \t");
        auto last = data.find_last_not_of(" \t\r");
        if (first == std::string::npos) return std::string();
        return data.substr(first, last - first + 1);
    }
    return std::nullopt;
}

} // namespace kiosk_provision
