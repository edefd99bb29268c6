#include <kiosk_provision/config/config_loader.hpp>

#include <kiosk_provision/core/log.hpp>
#include <kiosk_provision/core/version.hpp>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace kiosk_provision {

namespace {

constexpr const char* kComponent = "config";

Error MakeConfigError(const std::string& message, const std::string& target = "") {
    return Error{"ConfigLoader", target, std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Error MakeUsageError(const std::string& message) {
    return Error{"CommandLine", "", std::nullopt, message,
                 std::string("Run 'kiosk-provision --help' for the list of flags"),
                 ErrorCategory::Usage};
}

// ---------------------------------------------------------------------------
// Source readers. Both expose Has/String/Bool/Int and throw
// std::invalid_argument naming the key when a value has the wrong type.
// ---------------------------------------------------------------------------
class JsonReader {
public:
    explicit JsonReader(const nlohmann::json& root) : root_(root) {}

    bool Has(const char* key) const {
        return root_.contains(key) && !root_.at(key).is_null();
    }

    std::string String(const char* key) const {
        const auto& v = root_.at(key);
        if (!v.is_string()) throw TypeError(key, "a string");
        return v.get<std::string>();
    }

    bool Bool(const char* key) const {
        const auto& v = root_.at(key);
        if (!v.is_boolean()) throw TypeError(key, "true or false");
        return v.get<bool>();
    }

    int Int(const char* key) const {
        const auto& v = root_.at(key);
        if (!v.is_number_integer()) throw TypeError(key, "an integer");
        if (v.is_number_unsigned()) {
            if (v.get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                throw TypeError(key, "an integer");
            }
            return static_cast<int>(v.get<std::uint64_t>());
        }
        const auto wide = v.get<std::int64_t>();
        if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
            throw TypeError(key, "an integer");
        }
        return static_cast<int>(wide);
    }

private:
    static std::invalid_argument TypeError(const char* key, const char* expected) {
        return std::invalid_argument(std::string("'") + key + "' must be " + expected);
    }

    const nlohmann::json& root_;
};

class YamlReader {
public:
    explicit YamlReader(const YAML::Node& root) : root_(root) {}

    bool Has(const char* key) const {
        return root_[key] && !root_[key].IsNull();
    }

    std::string String(const char* key) const {
        const auto node = root_[key];
        if (!node.IsScalar()) throw TypeError(key, "a string");
        return node.as<std::string>();
    }

    bool Bool(const char* key) const {
        try {
            return root_[key].as<bool>();
        } catch (const YAML::Exception&) {
            throw TypeError(key, "true or false");
        }
    }

    int Int(const char* key) const {
        try {
            return root_[key].as<int>();
        } catch (const YAML::Exception&) {
            throw TypeError(key, "an integer");
        }
    }

private:
    static std::invalid_argument TypeError(const char* key, const char* expected) {
        return std::invalid_argument(std::string("'") + key + "' must be " + expected);
    }

    const YAML::Node& root_;
};

std::optional<std::string> NonEmpty(std::string value) {
    if (value.empty()) return std::nullopt;
    return value;
}

template <typename Reader>
std::string RequiredString(const Reader& in, const char* key) {
    auto value = in.String(key);
    if (value.empty()) {
        throw std::invalid_argument(std::string("'") + key + "' must not be empty");
    }
    return value;
}

template <typename Reader>
SettingsLayer ReadLayer(const Reader& in) {
    SettingsLayer layer;

    if (in.Has("accountName")) {
        layer.account_name = RequiredString(in, "accountName");
    }
    if (in.Has("accountDisplayName")) {
        layer.account_display_name = RequiredString(in, "accountDisplayName");
    }
    if (in.Has("targetUrl")) {
        layer.target_url = RequiredString(in, "targetUrl");
    }
    if (in.Has("browser")) {
        auto kind = ParseBrowserKind(in.String("browser"));
        if (kind.IsErr()) {
            throw std::invalid_argument(kind.Error());
        }
        layer.browser = kind.Value();
    }
    if (in.Has("enableAutoLogin")) {
        layer.enable_auto_login = in.Bool("enableAutoLogin");
    }

    std::optional<bool> disable;
    std::optional<bool> confirm;
    if (in.Has("disableAutoLogin")) {
        disable = in.Bool("disableAutoLogin");
    }
    if (in.Has("confirmAutoLogin")) {
        confirm = in.Bool("confirmAutoLogin");
    }
    layer.disable_auto_login = ResolveDisableAutoLogin(disable, confirm);

    if (in.Has("minimumBuildNumber")) {
        layer.minimum_build_number = in.Int("minimumBuildNumber");
        if (*layer.minimum_build_number < 0) {
            throw std::invalid_argument("'minimumBuildNumber' must not be negative");
        }
    }
    if (in.Has("installBrowserIfMissing")) {
        layer.install_browser_if_missing = in.Bool("installBrowserIfMissing");
    }

    // encryptedCredentialRef is the newer spelling and wins over
    // encryptedPasswordFile when a file carries both.
    if (in.Has("encryptedCredentialRef")) {
        layer.encrypted_credential_ref = NonEmpty(in.String("encryptedCredentialRef"));
    } else if (in.Has("encryptedPasswordFile")) {
        layer.encrypted_credential_ref = NonEmpty(in.String("encryptedPasswordFile"));
    }

    if (in.Has("taskName")) {
        layer.task_name = RequiredString(in, "taskName");
    }
    if (in.Has("logFile")) {
        layer.log_file = NonEmpty(in.String("logFile"));
    }
    return layer;
}

bool EndsWithIgnoreCase(std::string_view s, std::string_view suffix) {
    if (s.size() < suffix.size()) return false;
    auto tail = s.substr(s.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

template <typename T>
void Overlay(T& target, const std::optional<T>& value) {
    if (value.has_value()) {
        target = *value;
    }
}

template <typename T>
void Overlay(std::optional<T>& target, const std::optional<T>& value) {
    if (value.has_value()) {
        target = value;
    }
}

void ApplyLayer(KioskSettings& settings, const SettingsLayer& layer) {
    Overlay(settings.account_name, layer.account_name);
    Overlay(settings.account_display_name, layer.account_display_name);
    Overlay(settings.target_url, layer.target_url);
    Overlay(settings.browser, layer.browser);
    Overlay(settings.enable_auto_login, layer.enable_auto_login);
    Overlay(settings.disable_auto_login, layer.disable_auto_login);
    Overlay(settings.minimum_build_number, layer.minimum_build_number);
    Overlay(settings.install_browser_if_missing, layer.install_browser_if_missing);
    Overlay(settings.encrypted_credential_ref, layer.encrypted_credential_ref);
    Overlay(settings.task_name, layer.task_name);
    Overlay(settings.log_file, layer.log_file);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DefaultSettings
// ---------------------------------------------------------------------------
KioskSettings DefaultSettings() {
    KioskSettings defaults;
    defaults.account_name = "KioskUser";
    defaults.account_display_name = "Kiosk User";
    defaults.target_url = "https://www.example.com";
    defaults.browser = BrowserKind::Edge;
    defaults.enable_auto_login = true;
    defaults.disable_auto_login = false;
    defaults.minimum_build_number = 17763; // Windows 10 1809 / Server 2019
    defaults.install_browser_if_missing = false;
    defaults.task_name = "KioskBrowserLaunch";
    return defaults;
}

// ---------------------------------------------------------------------------
// ResolveDisableAutoLogin
// ---------------------------------------------------------------------------
std::optional<bool> ResolveDisableAutoLogin(std::optional<bool> disable_auto_login,
                                            std::optional<bool> confirm_auto_login) {
    if (disable_auto_login.has_value()) {
        return disable_auto_login;
    }
    if (confirm_auto_login.has_value()) {
        return !*confirm_auto_login;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ParseSettingsJson / ParseSettingsYaml / LoadSettingsFile
// ---------------------------------------------------------------------------
Result<SettingsLayer, Error> ParseSettingsJson(std::string_view text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<SettingsLayer, Error>::Err(
            MakeConfigError("Failed to parse JSON settings: " + std::string(e.what())));
    }
    if (!root.is_object()) {
        return Result<SettingsLayer, Error>::Err(
            MakeConfigError("Settings document must be a JSON object"));
    }

    try {
        return Result<SettingsLayer, Error>::Ok(ReadLayer(JsonReader(root)));
    } catch (const std::invalid_argument& e) {
        return Result<SettingsLayer, Error>::Err(
            MakeConfigError(std::string("Invalid settings value: ") + e.what()));
    }
}

Result<SettingsLayer, Error> ParseSettingsYaml(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return Result<SettingsLayer, Error>::Err(
            MakeConfigError("Failed to parse YAML settings: " + std::string(e.what())));
    }
    if (root.IsNull()) {
        return Result<SettingsLayer, Error>::Ok(SettingsLayer{});
    }
    if (!root.IsMap()) {
        return Result<SettingsLayer, Error>::Err(
            MakeConfigError("Settings document must be a YAML mapping"));
    }

    try {
        return Result<SettingsLayer, Error>::Ok(ReadLayer(YamlReader(root)));
    } catch (const std::invalid_argument& e) {
        return Result<SettingsLayer, Error>::Err(
            MakeConfigError(std::string("Invalid settings value: ") + e.what()));
    }
}

Result<SettingsLayer, Error> LoadSettingsFile(std::string_view file_path) {
    const std::string path(file_path);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<SettingsLayer, Error>::Err(
            MakeConfigError("Cannot read settings file", path));
    }
    std::ostringstream contents;
    contents << in.rdbuf();

    auto layer = (EndsWithIgnoreCase(path, ".yaml") || EndsWithIgnoreCase(path, ".yml"))
                     ? ParseSettingsYaml(contents.str())
                     : ParseSettingsJson(contents.str());
    if (layer.IsErr()) {
        auto err = std::move(layer).Error();
        err.target = path;
        return Result<SettingsLayer, Error>::Err(std::move(err));
    }
    return layer;
}

namespace {

void AddCliArguments(argparse::ArgumentParser& program) {
    // Settings overrides
    program.add_argument("--account-name")
        .help("Local kiosk account name");
    program.add_argument("--display-name")
        .help("Full name shown for the kiosk account");
    program.add_argument("--url")
        .help("URL opened in kiosk mode");
    program.add_argument("--browser")
        .help("Edge or Chrome");
    program.add_argument("--auto-login")
        .help("Enable automatic sign-in")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-auto-login")
        .help("Turn the automatic sign-in master switch off")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--disable-auto-login")
        .help("Opt out of automatic sign-in (requires --confirm)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--allow-auto-login")
        .help("Clear an opt-out set in the settings file")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--minimum-build")
        .help("Minimum recommended OS build number")
        .scan<'i', int>();
    program.add_argument("--install-browser")
        .help("Run the browser installer when the browser is missing")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-install-browser")
        .help("Never run the browser installer")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--encrypted-password-file")
        .help("Path to the encrypted credential artifact");
    program.add_argument("--task-name")
        .help("Scheduled task name for the kiosk launch");
    program.add_argument("--log-file")
        .help("Append log output to this file");

    // Run options
    program.add_argument("-c", "--config")
        .help("Path to JSON or YAML settings file");
    program.add_argument("--dry-run")
        .help("Report every action without performing it")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--confirm")
        .help("Confirm the auto-login opt-out requested on this command line")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--force")
        .help("Continue on an OS build below the minimum without asking")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--out")
        .help("Output path for encrypt-password");
    program.add_argument("--password-env")
        .help("Environment variable holding the password for encrypt-password");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .default_value(false)
        .implicit_value(true);
}

} // namespace

std::string CliUsage() {
    argparse::ArgumentParser program("kiosk-provision", kVersion,
                                     argparse::default_arguments::none);
    AddCliArguments(program);
    return program.help().str();
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("kiosk-provision", kVersion,
                                     argparse::default_arguments::none);

    AddCliArguments(program);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliInvocation, Error>::Err(
            MakeUsageError("CLI parse error: " + std::string(e.what())));
    }

    CliInvocation cli;
    auto& o = cli.overrides;

    if (auto val = program.present("--account-name")) {
        o.account_name = *val;
    }
    if (auto val = program.present("--display-name")) {
        o.account_display_name = *val;
    }
    if (auto val = program.present("--url")) {
        o.target_url = *val;
    }
    if (auto val = program.present("--browser")) {
        auto kind = ParseBrowserKind(*val);
        if (kind.IsErr()) {
            return Result<CliInvocation, Error>::Err(
                MakeUsageError("Invalid --browser: " + kind.Error()));
        }
        o.browser = kind.Value();
    }

    if (program.get<bool>("--auto-login") && program.get<bool>("--no-auto-login")) {
        return Result<CliInvocation, Error>::Err(
            MakeUsageError("Cannot use both --auto-login and --no-auto-login"));
    }
    if (program.get<bool>("--auto-login")) {
        o.enable_auto_login = true;
    }
    if (program.get<bool>("--no-auto-login")) {
        o.enable_auto_login = false;
    }
    if (program.get<bool>("--disable-auto-login") && program.get<bool>("--allow-auto-login")) {
        return Result<CliInvocation, Error>::Err(
            MakeUsageError("Cannot use both --disable-auto-login and --allow-auto-login"));
    }
    if (program.get<bool>("--disable-auto-login")) {
        o.disable_auto_login = true;
    }
    if (program.get<bool>("--allow-auto-login")) {
        o.disable_auto_login = false;
    }
    if (auto val = program.present<int>("--minimum-build")) {
        o.minimum_build_number = *val;
    }

    if (program.get<bool>("--install-browser") && program.get<bool>("--no-install-browser")) {
        return Result<CliInvocation, Error>::Err(
            MakeUsageError("Cannot use both --install-browser and --no-install-browser"));
    }
    if (program.get<bool>("--install-browser")) {
        o.install_browser_if_missing = true;
    }
    if (program.get<bool>("--no-install-browser")) {
        o.install_browser_if_missing = false;
    }
    if (auto val = program.present("--encrypted-password-file")) {
        o.encrypted_credential_ref = *val;
    }
    if (auto val = program.present("--task-name")) {
        o.task_name = *val;
    }
    if (auto val = program.present("--log-file")) {
        o.log_file = *val;
    }

    cli.config_path = program.present("--config");
    cli.dry_run = program.get<bool>("--dry-run");
    cli.confirm = program.get<bool>("--confirm");
    cli.force = program.get<bool>("--force");
    cli.output_path = program.present("--out");
    cli.password_env = program.present("--password-env");
    cli.json_output = program.get<bool>("--json");
    cli.verbose = program.get<bool>("--verbose");
    cli.quiet = program.get<bool>("--quiet");

    if (cli.verbose && cli.quiet) {
        return Result<CliInvocation, Error>::Err(
            MakeUsageError("Cannot use both --verbose and --quiet"));
    }
    if (program.get<bool>("--color")) {
        cli.color = true;
    }
    if (program.get<bool>("--no-color")) {
        cli.color = false;
    }

    return Result<CliInvocation, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ResolveSettings
// ---------------------------------------------------------------------------
ResolvedSettings ResolveSettings(
    const KioskSettings& defaults,
    const std::optional<Result<SettingsLayer, Error>>& file_layer,
    const SettingsLayer& cli_overrides) {
    ResolvedSettings resolved;
    resolved.settings = defaults;

    if (file_layer.has_value()) {
        if (file_layer->IsOk()) {
            ApplyLayer(resolved.settings, file_layer->Value());
        } else {
            auto warning = "Ignoring settings file, using defaults and command-line values: " +
                           file_layer->Error().ToString();
            LogInfo(kComponent, warning);
            resolved.warnings.push_back(std::move(warning));
        }
    }

    ApplyLayer(resolved.settings, cli_overrides);
    return resolved;
}

// ---------------------------------------------------------------------------
// ValidateSettings
// ---------------------------------------------------------------------------
Result<void, Error> ValidateSettings(const KioskSettings& settings) {
    const std::pair<const char*, const std::string*> required[] = {
        {"accountName", &settings.account_name},
        {"accountDisplayName", &settings.account_display_name},
        {"targetUrl", &settings.target_url},
        {"taskName", &settings.task_name},
    };
    for (const auto& [key, value] : required) {
        if (value->empty()) {
            return Result<void, Error>::Err(
                MakeConfigError(std::string("Missing required field: ") + key));
        }
    }
    if (settings.minimum_build_number < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("minimumBuildNumber must not be negative, got " +
                            std::to_string(settings.minimum_build_number)));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// SettingsAdvisories
// ---------------------------------------------------------------------------
std::vector<std::string> SettingsAdvisories(const KioskSettings& settings) {
    std::vector<std::string> advisories;
    auto url = KioskUrl::Create(settings.target_url);
    if (url.IsErr()) {
        advisories.push_back("targetUrl '" + settings.target_url +
                             "' may not open in the browser: " + url.Error());
    }
    return advisories;
}

// ---------------------------------------------------------------------------
// SettingsToJson / SaveSettingsJson
// ---------------------------------------------------------------------------
std::string SettingsToJson(const KioskSettings& settings) {
    nlohmann::ordered_json j;
    j["accountName"] = settings.account_name;
    j["accountDisplayName"] = settings.account_display_name;
    j["targetUrl"] = settings.target_url;
    j["browser"] = BrowserKindName(settings.browser);
    j["enableAutoLogin"] = settings.enable_auto_login;
    j["disableAutoLogin"] = settings.disable_auto_login;
    j["minimumBuildNumber"] = settings.minimum_build_number;
    j["installBrowserIfMissing"] = settings.install_browser_if_missing;
    if (settings.encrypted_credential_ref.has_value()) {
        j["encryptedPasswordFile"] = *settings.encrypted_credential_ref;
    }
    j["taskName"] = settings.task_name;
    if (settings.log_file.has_value()) {
        j["logFile"] = *settings.log_file;
    }
    return j.dump(2);
}

Result<void, Error> SaveSettingsJson(std::string_view file_path,
                                     const KioskSettings& settings) {
    const std::string path(file_path);
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot write settings file", path));
    }
    out << SettingsToJson(settings) << "\n";
    if (!out) {
        return Result<void, Error>::Err(
            MakeConfigError("Failed while writing settings file", path));
    }
    return Result<void, Error>::Ok();
}

} // namespace kiosk_provision
