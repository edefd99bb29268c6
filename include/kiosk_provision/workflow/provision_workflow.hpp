#pragma once

#include <kiosk_provision/config/kiosk_settings.hpp>
#include <kiosk_provision/core/result.hpp>
#include <kiosk_provision/platform/i_account_provisioner.hpp>
#include <kiosk_provision/platform/i_auto_login_configurator.hpp>
#include <kiosk_provision/platform/i_browser_locator.hpp>
#include <kiosk_provision/platform/i_host_info.hpp>
#include <kiosk_provision/platform/i_launch_registrar.hpp>
#include <kiosk_provision/platform/i_operator_prompt.hpp>
#include <kiosk_provision/platform/i_secret_protector.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// Subcommand: the CLI subcommand to execute.
// ---------------------------------------------------------------------------
enum class Subcommand {
    Provision,        // Full pipeline (default)
    ShowConfig,       // Print resolved settings
    InstallBrowser,   // Locate, install if missing
    EncryptPassword,  // Write the credential artifact
    EditConfig,       // Interactive settings editor
};

// ---------------------------------------------------------------------------
// StepOutcome: outcome for each phase of the workflow.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

const char* StepOutcomeName(StepOutcome outcome);

// ---------------------------------------------------------------------------
// StepResult: outcome + timing for a single workflow step.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// ---------------------------------------------------------------------------
// ProvisionResult: per-step results of one run.
//
// `degraded` means a non-fatal step failed (auto-login, browser, scheduled
// launch); the run still counts as a success for the exit status.
// ---------------------------------------------------------------------------
struct ProvisionResult {
    bool success = false;
    bool degraded = false;
    bool dry_run = false;
    bool auto_login_enabled = false;
    std::optional<std::string> browser_path;
    std::vector<StepResult> steps;
    std::vector<std::string> warnings;
    std::string summary;
    std::chrono::milliseconds total_duration{0};
};

// ---------------------------------------------------------------------------
// RunOptions: per-invocation switches that are not part of KioskSettings.
// ---------------------------------------------------------------------------
struct RunOptions {
    bool dry_run = false;
    bool force = false;                      // continue past the build gate
    bool disable_requested_via_cli = false;
    bool confirmed_via_cli = false;
    // Raised while resolving settings; reported first in ProvisionResult::warnings.
    std::vector<std::string> settings_warnings;
};

// ---------------------------------------------------------------------------
// Collaborators: the OS-facing services the workflow drives.
// ---------------------------------------------------------------------------
struct Collaborators {
    IAccountProvisioner& accounts;
    IAutoLoginConfigurator& auto_login;
    IHostInfo& host;
    IBrowserLocator& browsers;
    ILaunchRegistrar& launches;
    ISecretProtector& secrets;
    IOperatorPrompt& prompt;
};

// ---------------------------------------------------------------------------
// ProvisionWorkflow: preflight -> account -> auto-login -> browser ->
//                     scheduled launch.
//
// Preflight evaluates the auto-login policy, the OS build gate and the
// credential artifact before anything is changed, so a refused run leaves
// the machine untouched. Account failure is fatal; later steps degrade.
//
// Takes ownership of nothing. Collaborators and settings must outlive this
// object.
// ---------------------------------------------------------------------------
class ProvisionWorkflow {
public:
    ProvisionWorkflow(const Collaborators& services,
                      const KioskSettings& settings,
                      RunOptions options);

    ~ProvisionWorkflow();

    // Non-copyable, non-movable.
    ProvisionWorkflow(const ProvisionWorkflow&) = delete;
    ProvisionWorkflow& operator=(const ProvisionWorkflow&) = delete;
    ProvisionWorkflow(ProvisionWorkflow&&) = delete;
    ProvisionWorkflow& operator=(ProvisionWorkflow&&) = delete;

    // Execute Provision or InstallBrowser. Err carries a fatal failure.
    [[nodiscard]] Result<ProvisionResult, Error> Execute(Subcommand cmd);

private:
    Collaborators services_;
    const KioskSettings& settings_;
    RunOptions options_;

    // Decrypted only between preflight and the auto-login step.
    std::optional<std::string> password_;

    Result<ProvisionResult, Error> ExecuteProvision();
    Result<ProvisionResult, Error> ExecuteInstallBrowser();

    Result<StepResult, Error> RunPreflight(ProvisionResult& result);
    Result<StepResult, Error> RunAccountStep(const AccountName& account);
    StepResult RunAutoLoginStep(const AccountName& account, bool enable);
    StepResult RunBrowserStep(ProvisionResult& result, bool allow_install);
    StepResult RunScheduleStep(const ProvisionResult& result);
};

} // namespace kiosk_provision
