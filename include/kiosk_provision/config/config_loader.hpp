#pragma once

#include <kiosk_provision/config/kiosk_settings.hpp>
#include <kiosk_provision/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// CliInvocation: everything the command line said for this run.
//
// `overrides` holds the settings the operator set explicitly; the remaining
// members describe the run itself and are never persisted.
// ---------------------------------------------------------------------------
struct CliInvocation {
    SettingsLayer overrides;
    std::optional<std::string> config_path;
    bool dry_run = false;
    bool confirm = false;          // accepts the auto-login opt-out
    bool force = false;            // continue past the build gate unprompted
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    std::optional<bool> color;     // --color / --no-color
    std::optional<std::string> output_path;   // encrypt-password --out
    std::optional<std::string> password_env;  // encrypt-password --password-env

    /// True when --disable-auto-login was passed on this command line.
    [[nodiscard]] bool DisableRequestedViaCli() const {
        return overrides.disable_auto_login.value_or(false);
    }
};

// Parse a JSON settings document. Applies the legacy confirmAutoLogin rule.
Result<SettingsLayer, Error> ParseSettingsJson(std::string_view text);

// Parse a YAML settings document with the same keys as the JSON form.
Result<SettingsLayer, Error> ParseSettingsYaml(std::string_view text);

// Read a settings file; .yaml/.yml files go through the YAML parser, anything
// else is treated as JSON.
Result<SettingsLayer, Error> LoadSettingsFile(std::string_view file_path);

// Parse CLI arguments (subcommand token already removed).
// --help and --version are handled by the caller.
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv);

// Flag reference generated from the same parser LoadFromCli uses.
std::string CliUsage();

// Legacy key adapter: an explicit disableAutoLogin wins; otherwise
// confirmAutoLogin maps to its inverse; otherwise the source is silent.
std::optional<bool> ResolveDisableAutoLogin(std::optional<bool> disable_auto_login,
                                            std::optional<bool> confirm_auto_login);

// Merge defaults <- file layer <- CLI layer. A file layer holding an error is
// dropped as a whole and reported as a warning; merging never fails.
// `file_layer` is nullopt when no settings file was used.
ResolvedSettings ResolveSettings(
    const KioskSettings& defaults,
    const std::optional<Result<SettingsLayer, Error>>& file_layer,
    const SettingsLayer& cli_overrides);

// Identity and target strings must be non-empty and minimumBuildNumber must
// not be negative. File values are already checked while parsing, so in
// practice an error here comes from the command line.
Result<void, Error> ValidateSettings(const KioskSettings& settings);

// Non-fatal observations about otherwise valid settings, e.g. a targetUrl
// without a scheme.
std::vector<std::string> SettingsAdvisories(const KioskSettings& settings);

// Serialize settings in the settings-file format (always disableAutoLogin,
// never the legacy key).
std::string SettingsToJson(const KioskSettings& settings);

// Write SettingsToJson() output to `file_path`.
Result<void, Error> SaveSettingsJson(std::string_view file_path,
                                     const KioskSettings& settings);

} // namespace kiosk_provision
