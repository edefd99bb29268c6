#include <kiosk_provision/workflow/provision_workflow.hpp>

#include <kiosk_provision/core/log.hpp>
#include <kiosk_provision/platform/browser_locator.hpp>
#include <kiosk_provision/platform/secret_protector.hpp>
#include <kiosk_provision/policy/auto_login_policy.hpp>

#include <sstream>

namespace kiosk_provision {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kComponent = "workflow";

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

void Warn(ProvisionResult& result, const std::string& message) {
    LogWarn(kComponent, message);
    result.warnings.push_back(message);
}

std::string BrowserName(BrowserKind kind) {
    return BrowserKindName(kind);
}

} // namespace

const char* StepOutcomeName(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return "completed";
        case StepOutcome::Skipped:   return "skipped";
        case StepOutcome::Failed:    return "failed";
    }
    return "unknown";
}

ProvisionWorkflow::ProvisionWorkflow(const Collaborators& services,
                                     const KioskSettings& settings,
                                     RunOptions options)
    : services_(services), settings_(settings), options_(options) {}

ProvisionWorkflow::~ProvisionWorkflow() = default;

Result<ProvisionResult, Error> ProvisionWorkflow::Execute(Subcommand cmd) {
    switch (cmd) {
        case Subcommand::Provision:
            return ExecuteProvision();
        case Subcommand::InstallBrowser:
            return ExecuteInstallBrowser();
        default:
            return Result<ProvisionResult, Error>::Err(Error{
                "ProvisionWorkflow", "", std::nullopt,
                "subcommand does not run the provisioning workflow",
                std::nullopt, ErrorCategory::Internal});
    }
}

Result<ProvisionResult, Error> ProvisionWorkflow::ExecuteProvision() {
    auto total_start = Clock::now();
    ProvisionResult result;
    result.dry_run = options_.dry_run;
    result.warnings = options_.settings_warnings;

    // Step 1: Preflight. Nothing has been changed if this fails.
    auto preflight = RunPreflight(result);
    if (preflight.IsErr()) {
        return Result<ProvisionResult, Error>::Err(std::move(preflight).Error());
    }
    result.steps.push_back(preflight.Value());

    // `net user` would refuse such a name; fail the account step before it runs.
    auto account = AccountName::Create(settings_.account_name);
    if (account.IsErr()) {
        return Result<ProvisionResult, Error>::Err(Error{
            "CreateAccount", settings_.account_name, std::nullopt, account.Error(),
            std::string("Choose a local account name Windows accepts"),
            ErrorCategory::Account});
    }

    // Step 2: Account (fatal).
    auto account_step = RunAccountStep(account.Value());
    if (account_step.IsErr()) {
        password_.reset();
        return Result<ProvisionResult, Error>::Err(std::move(account_step).Error());
    }
    result.steps.push_back(account_step.Value());

    // Step 3: Auto-login.
    auto auto_login_step = RunAutoLoginStep(account.Value(), result.auto_login_enabled);
    password_.reset();
    if (auto_login_step.outcome == StepOutcome::Failed) {
        result.degraded = true;
        Warn(result, "Automatic sign-in was not configured: " + auto_login_step.message);
    }
    result.steps.push_back(auto_login_step);

    // Step 4: Browser.
    auto browser_step = RunBrowserStep(result, settings_.install_browser_if_missing);
    if (browser_step.outcome == StepOutcome::Failed) {
        result.degraded = true;
        Warn(result, browser_step.message);
    }
    result.steps.push_back(browser_step);

    // Step 5: Scheduled launch.
    auto schedule_step = RunScheduleStep(result);
    if (schedule_step.outcome == StepOutcome::Failed) {
        result.degraded = true;
        Warn(result, "Kiosk launch was not scheduled: " + schedule_step.message);
    } else if (schedule_step.outcome == StepOutcome::Skipped && !options_.dry_run) {
        result.degraded = true;
    }
    result.steps.push_back(schedule_step);

    result.success = true;
    result.total_duration = Elapsed(total_start);

    std::ostringstream oss;
    if (options_.dry_run) {
        oss << "Preview only; no changes were made";
    } else if (result.degraded) {
        oss << "Kiosk account '" << settings_.account_name
            << "' provisioned with warnings (" << result.warnings.size() << ")";
    } else {
        oss << "Kiosk account '" << settings_.account_name << "' provisioned";
    }
    result.summary = oss.str();
    LogInfo(kComponent, result.summary);

    return Result<ProvisionResult, Error>::Ok(std::move(result));
}

Result<ProvisionResult, Error> ProvisionWorkflow::ExecuteInstallBrowser() {
    auto total_start = Clock::now();
    ProvisionResult result;
    result.dry_run = options_.dry_run;
    result.warnings = options_.settings_warnings;

    // The explicit subcommand always permits installation.
    auto step = RunBrowserStep(result, true);
    result.steps.push_back(step);
    result.total_duration = Elapsed(total_start);

    if (step.outcome == StepOutcome::Failed) {
        return Result<ProvisionResult, Error>::Err(Error{
            "InstallBrowser", BrowserName(settings_.browser), std::nullopt,
            step.message,
            std::string("Install ") + BrowserName(settings_.browser) + " manually",
            ErrorCategory::BrowserNotFound});
    }

    result.success = true;
    result.summary = step.message;
    return Result<ProvisionResult, Error>::Ok(std::move(result));
}

Result<StepResult, Error> ProvisionWorkflow::RunPreflight(ProvisionResult& result) {
    auto start = Clock::now();

    auto decision = ShouldEnableAutoLogin(settings_,
                                          options_.disable_requested_via_cli,
                                          options_.confirmed_via_cli);
    if (decision.IsErr()) {
        return Result<StepResult, Error>::Err(std::move(decision).Error());
    }
    result.auto_login_enabled = decision.Value();

    std::ostringstream message;
    message << "auto-login " << (result.auto_login_enabled ? "enabled" : "disabled");

    // Advisory OS build gate.
    auto build = services_.host.BuildNumber();
    if (build.IsErr()) {
        Warn(result, "Could not determine the OS build: " + build.Error().message);
    } else {
        message << ", build " << build.Value();
        if (build.Value() < settings_.minimum_build_number) {
            const std::string gate = "OS build " + std::to_string(build.Value()) +
                                     " is older than the recommended minimum " +
                                     std::to_string(settings_.minimum_build_number);
            if (options_.force || options_.dry_run) {
                Warn(result, gate);
            } else if (!services_.prompt.Confirm(gate + ". Continue anyway?")) {
                return Result<StepResult, Error>::Err(Error{
                    "Preflight", "", std::nullopt, gate + "; provisioning aborted",
                    std::string("Pass --force to continue on this build"),
                    ErrorCategory::Aborted});
            } else {
                Warn(result, gate + " (continuing at operator request)");
            }
        }
    }

    // Credential artifact. Missing is a warning; unreadable is fatal.
    if (settings_.encrypted_credential_ref.has_value()) {
        const auto& path = *settings_.encrypted_credential_ref;
        if (!CredentialArtifactExists(path)) {
            Warn(result, "Credential artifact '" + path +
                             "' not found; the account is provisioned without a password");
        } else if (options_.dry_run) {
            message << ", credential artifact present";
        } else {
            auto password = ReadCredentialArtifact(services_.secrets, path);
            if (password.IsErr()) {
                return Result<StepResult, Error>::Err(std::move(password).Error());
            }
            password_ = std::move(password).Value();
            message << ", credential loaded";
        }
    }

    return Result<StepResult, Error>::Ok(
        StepResult{"preflight", StepOutcome::Completed, message.str(), Elapsed(start)});
}

Result<StepResult, Error> ProvisionWorkflow::RunAccountStep(const AccountName& account) {
    auto start = Clock::now();

    if (options_.dry_run) {
        return Result<StepResult, Error>::Ok(StepResult{
            "account", StepOutcome::Skipped,
            "would create or reuse local account '" + account.Value() + "'",
            Elapsed(start)});
    }

    AccountRequest request{account, settings_.account_display_name, password_};
    auto outcome = services_.accounts.EnsureAccount(request);
    if (outcome.IsErr()) {
        return Result<StepResult, Error>::Err(std::move(outcome).Error());
    }

    std::string message;
    switch (outcome.Value()) {
        case AccountOutcome::Created:
            message = "created local account '" + account.Value() + "'";
            break;
        case AccountOutcome::PasswordUpdated:
            message = "account '" + account.Value() + "' exists, password updated";
            break;
        case AccountOutcome::AlreadyExists:
            message = "account '" + account.Value() + "' already exists";
            break;
    }
    return Result<StepResult, Error>::Ok(
        StepResult{"account", StepOutcome::Completed, message, Elapsed(start)});
}

StepResult ProvisionWorkflow::RunAutoLoginStep(const AccountName& account, bool enable) {
    auto start = Clock::now();

    if (options_.dry_run) {
        return StepResult{"auto-login", StepOutcome::Skipped,
                          enable ? "would enable automatic sign-in for '" + account.Value() + "'"
                                 : std::string("would disable automatic sign-in"),
                          Elapsed(start)};
    }

    auto applied = enable ? services_.auto_login.Enable(account, password_)
                          : services_.auto_login.Disable();
    if (applied.IsErr()) {
        return StepResult{"auto-login", StepOutcome::Failed,
                          applied.Error().ToString() +
                              "; configure automatic sign-in manually (netplwiz)",
                          Elapsed(start)};
    }
    return StepResult{"auto-login", StepOutcome::Completed,
                      enable ? "automatic sign-in enabled" : "automatic sign-in disabled",
                      Elapsed(start)};
}

StepResult ProvisionWorkflow::RunBrowserStep(ProvisionResult& result, bool allow_install) {
    auto start = Clock::now();
    const auto name = BrowserName(settings_.browser);

    result.browser_path = services_.browsers.Locate(settings_.browser);
    if (result.browser_path.has_value()) {
        return StepResult{"browser", StepOutcome::Completed,
                          name + " found at " + *result.browser_path, Elapsed(start)};
    }

    if (!allow_install) {
        return StepResult{"browser", StepOutcome::Failed,
                          name + " is not installed; install it or pass --install-browser",
                          Elapsed(start)};
    }

    if (options_.dry_run) {
        return StepResult{"browser", StepOutcome::Skipped,
                          "would install " + name + " with winget", Elapsed(start)};
    }

    auto installed = services_.browsers.Install(settings_.browser);
    if (installed.IsErr()) {
        return StepResult{"browser", StepOutcome::Failed,
                          installed.Error().ToString(), Elapsed(start)};
    }

    result.browser_path = services_.browsers.Locate(settings_.browser);
    if (!result.browser_path.has_value()) {
        return StepResult{"browser", StepOutcome::Failed,
                          name + " was installed but could not be located", Elapsed(start)};
    }
    return StepResult{"browser", StepOutcome::Completed,
                      "installed " + name + " at " + *result.browser_path, Elapsed(start)};
}

StepResult ProvisionWorkflow::RunScheduleStep(const ProvisionResult& result) {
    auto start = Clock::now();

    if (!result.browser_path.has_value()) {
        return StepResult{"schedule", StepOutcome::Skipped,
                          "no browser available; create a logon task for '" +
                              settings_.account_name + "' manually once it is installed",
                          Elapsed(start)};
    }

    LaunchTask task;
    task.task_name = settings_.task_name;
    task.account = settings_.account_name;
    task.executable = *result.browser_path;
    task.arguments = BuildKioskArguments(settings_.browser, settings_.target_url);
    task.description = "Open " + settings_.target_url + " in " +
                       BrowserName(settings_.browser) + " kiosk mode at sign-in";

    if (options_.dry_run) {
        return StepResult{"schedule", StepOutcome::Skipped,
                          "would register logon task '" + task.task_name + "'",
                          Elapsed(start)};
    }

    auto registered = services_.launches.Register(task);
    if (registered.IsErr()) {
        return StepResult{"schedule", StepOutcome::Failed,
                          registered.Error().ToString(), Elapsed(start)};
    }
    return StepResult{"schedule", StepOutcome::Completed,
                      "registered logon task '" + task.task_name + "'", Elapsed(start)};
}

} // namespace kiosk_provision
