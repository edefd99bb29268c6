#pragma once

#include <kiosk_provision/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// KioskSettings: the merged, effective settings for one run.
// Produced by ResolveSettings() and not modified afterwards.
// ---------------------------------------------------------------------------
struct KioskSettings {
    std::string account_name;
    std::string account_display_name;
    std::string target_url;
    BrowserKind browser = BrowserKind::Edge;
    bool enable_auto_login = true;
    bool disable_auto_login = false;
    int minimum_build_number = 0;
    bool install_browser_if_missing = false;
    std::optional<std::string> encrypted_credential_ref; // artifact path, never plaintext
    std::string task_name;
    std::optional<std::string> log_file;

    bool operator==(const KioskSettings& other) const {
        return account_name == other.account_name &&
               account_display_name == other.account_display_name &&
               target_url == other.target_url &&
               browser == other.browser &&
               enable_auto_login == other.enable_auto_login &&
               disable_auto_login == other.disable_auto_login &&
               minimum_build_number == other.minimum_build_number &&
               install_browser_if_missing == other.install_browser_if_missing &&
               encrypted_credential_ref == other.encrypted_credential_ref &&
               task_name == other.task_name &&
               log_file == other.log_file;
    }

    bool operator!=(const KioskSettings& other) const {
        return !(*this == other);
    }
};

// ---------------------------------------------------------------------------
// SettingsLayer: one configuration source (settings file or command line).
// Each field is present only if that source set it explicitly; a value equal
// to the default still counts as set.
// ---------------------------------------------------------------------------
struct SettingsLayer {
    std::optional<std::string> account_name;
    std::optional<std::string> account_display_name;
    std::optional<std::string> target_url;
    std::optional<BrowserKind> browser;
    std::optional<bool> enable_auto_login;
    std::optional<bool> disable_auto_login;
    std::optional<int> minimum_build_number;
    std::optional<bool> install_browser_if_missing;
    std::optional<std::string> encrypted_credential_ref;
    std::optional<std::string> task_name;
    std::optional<std::string> log_file;
};

// ---------------------------------------------------------------------------
// ResolvedSettings: merge output plus any non-fatal warnings raised while
// merging (e.g. a settings file that could not be parsed).
// ---------------------------------------------------------------------------
struct ResolvedSettings {
    KioskSettings settings;
    std::vector<std::string> warnings;
};

/// Built-in defaults used when neither the settings file nor the command
/// line provides a value.
KioskSettings DefaultSettings();

} // namespace kiosk_provision
