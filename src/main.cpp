#include <kiosk_provision/cli/console_prompt.hpp>
#include <kiosk_provision/cli/output_formatter.hpp>
#include <kiosk_provision/cli/settings_wizard.hpp>
#include <kiosk_provision/config/config_loader.hpp>
#include <kiosk_provision/core/log.hpp>
#include <kiosk_provision/core/terminal.hpp>
#include <kiosk_provision/core/version.hpp>
#include <kiosk_provision/platform/browser_locator.hpp>
#include <kiosk_provision/platform/process_runner.hpp>
#include <kiosk_provision/platform/scheduled_task_registrar.hpp>
#include <kiosk_provision/platform/secret_protector.hpp>
#include <kiosk_provision/platform/windows_accounts.hpp>
#include <kiosk_provision/workflow/provision_workflow.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

constexpr const char* kDefaultSettingsFile = "kiosk-settings.json";

struct SubcommandParse {
    kiosk_provision::Subcommand cmd;
    bool found_subcommand;
};

SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    using kiosk_provision::Subcommand;
    if (argc < 2) {
        return {Subcommand::Provision, false};
    }
    std::string_view arg1{argv[1]};
    if (arg1 == "provision") {
        return {Subcommand::Provision, true};
    }
    if (arg1 == "show-config") {
        return {Subcommand::ShowConfig, true};
    }
    if (arg1 == "install-browser") {
        return {Subcommand::InstallBrowser, true};
    }
    if (arg1 == "encrypt-password") {
        return {Subcommand::EncryptPassword, true};
    }
    if (arg1 == "edit-config") {
        return {Subcommand::EditConfig, true};
    }
    // Not a subcommand; flags for the default "provision" command.
    return {Subcommand::Provision, false};
}

// Build argv without the subcommand token, so LoadFromCli sees plain flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv,
                                         bool has_subcommand) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (has_subcommand && i == 1) {
            continue;
        }
        stripped.push_back(argv[i]);
    }
    return stripped;
}

bool HasFlag(int argc, const char* const* argv, std::string_view a, std::string_view b = {}) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == a || (!b.empty() && arg == b)) return true;
    }
    return false;
}

// Resolve color mode for help output (stdout-based, before logger init).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    bool force_color = HasFlag(argc, argv, "--color");
    bool force_no_color = HasFlag(argc, argv, "--no-color");
    if (kiosk_provision::NoColorEnvSet()) force_no_color = true;
    return !force_no_color && (force_color || kiosk_provision::IsStdoutTty());
}

void PrintHelp(std::ostream& out, bool color) {
    using namespace kiosk_provision::ansi;
    const char* bold = color ? kBold : "";
    const char* reset = color ? kReset : "";

    out << bold << "kiosk-provision" << reset << " " << kiosk_provision::kVersion
        << " - provision a locked-down browser kiosk login\n\n";
    out << bold << "Usage:" << reset << "\n"
        << "  kiosk-provision [provision] [flags]      full pipeline (default)\n"
        << "  kiosk-provision show-config [flags]      print resolved settings\n"
        << "  kiosk-provision install-browser [flags]  locate, install if missing\n"
        << "  kiosk-provision encrypt-password [flags] write the credential artifact\n"
        << "  kiosk-provision edit-config [flags]      interactive settings editor\n\n";
    out << kiosk_provision::CliUsage();
    out << "  -h, --help       show this help\n"
        << "  --version        print version and exit\n";
}

int Fail(const kiosk_provision::OutputFormatter& formatter, const kiosk_provision::Error& error) {
    formatter.PrintError(error);
    return error.ExitCode();
}

kiosk_provision::Error UsageError(std::string message, std::string hint) {
    return kiosk_provision::Error{"CommandLine", "", std::nullopt, std::move(message),
                                  std::move(hint), kiosk_provision::ErrorCategory::Usage};
}

// ---------------------------------------------------------------------------
// Subcommand handlers
// ---------------------------------------------------------------------------

int RunShowConfig(const kiosk_provision::OutputFormatter& formatter,
                  const kiosk_provision::ResolvedSettings& resolved) {
    formatter.PrintSettings(resolved);
    return kExitSuccess;
}

int RunEditConfig(const kiosk_provision::OutputFormatter& formatter,
                  const kiosk_provision::CliInvocation& cli,
                  const kiosk_provision::ResolvedSettings& resolved) {
    using namespace kiosk_provision;

    if (!IsStdinTty() || !IsStdoutTty()) {
        return Fail(formatter, UsageError("edit-config needs an interactive terminal",
                                          "Edit the settings file with a text editor instead"));
    }

    auto edited = RunSettingsWizard(resolved.settings);
    if (!edited.has_value()) {
        return Fail(formatter, Error{"EditConfig", "", std::nullopt, "cancelled",
                                     std::nullopt, ErrorCategory::Aborted});
    }
    auto valid = ValidateSettings(*edited);
    if (valid.IsErr()) {
        return Fail(formatter, valid.Error());
    }

    const std::string path = cli.config_path.value_or(kDefaultSettingsFile);
    auto saved = SaveSettingsJson(path, *edited);
    if (saved.IsErr()) {
        return Fail(formatter, saved.Error());
    }
    formatter.PrintSuccess("Saved settings to " + path);
    return kExitSuccess;
}

int RunEncryptPassword(const kiosk_provision::OutputFormatter& formatter,
                       const kiosk_provision::CliInvocation& cli,
                       const kiosk_provision::KioskSettings& settings) {
    using namespace kiosk_provision;

    auto out_path = cli.output_path.has_value() ? cli.output_path
                                                : settings.encrypted_credential_ref;
    if (!out_path.has_value()) {
        return Fail(formatter, UsageError("No output path for the credential artifact",
                                          "Pass --out <path> or set encryptedPasswordFile"));
    }

    std::string password;
    if (cli.password_env.has_value()) {
        password = GetEnv(cli.password_env->c_str());
        if (password.empty()) {
            return Fail(formatter, UsageError("Environment variable " + *cli.password_env +
                                                  " is not set or empty",
                                              "Export the password or omit --password-env"));
        }
    } else if (IsStdinTty() && IsStdoutTty()) {
        auto entered = RunPasswordForm(settings.account_name);
        if (!entered.has_value()) {
            return Fail(formatter, Error{"EncryptPassword", "", std::nullopt, "cancelled",
                                         std::nullopt, ErrorCategory::Aborted});
        }
        password = std::move(*entered);
    } else {
        return Fail(formatter, UsageError("No password source",
                                          "Pass --password-env <VAR> when not on a terminal"));
    }

    DpapiSecretProtector protector;
    auto written = WriteCredentialArtifact(protector, *out_path, password);
    password.assign(password.size(), '\0');
    if (written.IsErr()) {
        return Fail(formatter, written.Error());
    }
    formatter.PrintSuccess("Wrote encrypted credential to " + *out_path);
    return kExitSuccess;
}

int RunWorkflow(const kiosk_provision::OutputFormatter& formatter,
                const kiosk_provision::CliInvocation& cli,
                const kiosk_provision::KioskSettings& settings,
                const std::vector<std::string>& settings_warnings,
                kiosk_provision::Subcommand subcommand) {
    using namespace kiosk_provision;

#ifndef _WIN32
    if (!cli.dry_run) {
        return Fail(formatter, Error{"ProvisionWorkflow", "", std::nullopt,
                                     "provisioning changes are only supported on Windows",
                                     std::string("Use --dry-run to preview the actions"),
                                     ErrorCategory::Unsupported});
    }
#endif

    SystemProcessRunner runner;
    WindowsAccountProvisioner accounts(runner);
    WinlogonAutoLoginConfigurator auto_login(runner);
    WindowsHostInfo host(runner);
    BrowserLocator browsers(runner);
    ScheduledTaskRegistrar launches(runner);
    DpapiSecretProtector secrets;
    ConsolePrompt prompt(IsStdinTty() && !cli.json_output);

    Collaborators services{accounts, auto_login, host, browsers, launches, secrets, prompt};

    RunOptions options;
    options.dry_run = cli.dry_run;
    options.force = cli.force;
    options.disable_requested_via_cli = cli.DisableRequestedViaCli();
    options.confirmed_via_cli = cli.confirm;
    options.settings_warnings = settings_warnings;

    ProvisionWorkflow workflow(services, settings, options);
    auto result = workflow.Execute(subcommand);
    if (result.IsErr()) {
        return Fail(formatter, result.Error());
    }

    if (!cli.quiet || cli.json_output) {
        formatter.PrintProvisionResult(result.Value());
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace kiosk_provision;

    EnableVirtualTerminal();

    if (HasFlag(argc, argv, "--help", "-h")) {
        PrintHelp(std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }
    if (HasFlag(argc, argv, "--version")) {
        std::cout << "kiosk-provision " << kVersion << "\n";
        return kExitSuccess;
    }

    auto [subcommand, has_subcommand] = ParseSubcommand(argc, argv);
    auto stripped = StripSubcommand(argc, argv, has_subcommand);

    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        OutputFormatter plain(false, false);
        plain.PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    auto cli = std::move(cli_result).Value();

    bool use_color = cli.color.value_or(IsStdoutTty()) && !NoColorEnvSet();
    if (cli.color.value_or(false)) use_color = true;
    OutputFormatter formatter(cli.json_output, use_color);

    auto log_level = cli.verbose ? LogLevel::Debug
                                 : (cli.quiet ? LogLevel::Error : LogLevel::Warn);
    auto make_console_sink = [&]() -> std::unique_ptr<ILogSink> {
        if (cli.json_output) {
            return std::make_unique<JsonSink>(std::cerr);
        }
        bool log_color = cli.color.value_or(IsStderrTty()) && !NoColorEnvSet();
        if (cli.color.value_or(false)) log_color = true;
        return std::make_unique<ColorConsoleSink>(log_color);
    };
    InitGlobalLogger(make_console_sink(), log_level);

    // Settings: defaults <- file <- command line.
    std::optional<Result<SettingsLayer, Error>> file_layer;
    if (cli.config_path.has_value()) {
        file_layer = LoadSettingsFile(*cli.config_path);
    }
    auto resolved = ResolveSettings(DefaultSettings(), file_layer, cli.overrides);
    const auto& settings = resolved.settings;

    // The log file is itself a setting, so it is attached after resolution.
    if (settings.log_file.has_value()) {
        auto file_sink = std::make_unique<FileSink>(*settings.log_file);
        if (!file_sink->IsOpen()) {
            resolved.warnings.push_back("Cannot open log file " + *settings.log_file);
        } else {
            // The file records Info and up (Debug with -v); the console keeps
            // the level chosen by -v/-q.
            const auto file_level = cli.verbose ? LogLevel::Debug : LogLevel::Info;
            std::vector<std::unique_ptr<ILogSink>> sinks;
            sinks.push_back(std::make_unique<LevelFilterSink>(make_console_sink(), log_level));
            sinks.push_back(std::move(file_sink));
            InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)),
                             std::min(file_level, log_level));
        }
    }
    LogInfo("main", std::string("kiosk-provision ") + kVersion + " starting");

    if (subcommand == Subcommand::EditConfig) {
        return RunEditConfig(formatter, cli, resolved);
    }

    auto valid = ValidateSettings(settings);
    if (valid.IsErr()) {
        return Fail(formatter, valid.Error());
    }

    for (auto& advisory : SettingsAdvisories(settings)) {
        resolved.warnings.push_back(std::move(advisory));
    }
    for (const auto& warning : resolved.warnings) {
        formatter.PrintWarning(warning);
    }

    switch (subcommand) {
        case Subcommand::ShowConfig:
            return RunShowConfig(formatter, resolved);
        case Subcommand::EncryptPassword:
            return RunEncryptPassword(formatter, cli, settings);
        case Subcommand::Provision:
        case Subcommand::InstallBrowser:
            return RunWorkflow(formatter, cli, settings, resolved.warnings, subcommand);
        case Subcommand::EditConfig:
            break;
    }
    return kExitSuccess;
}
