#pragma once

#include <kiosk_provision/config/kiosk_settings.hpp>

#include <optional>
#include <string>

namespace kiosk_provision {

// Show the interactive settings editor pre-populated from `initial`.
// Returns the edited settings on Save, std::nullopt on Cancel/Escape.
// Values are not validated here; callers run ValidateSettings().
std::optional<KioskSettings> RunSettingsWizard(const KioskSettings& initial);

// Ask for a password twice with masked input. Returns std::nullopt on
// Cancel/Escape. The two entries must match and be non-empty to save.
std::optional<std::string> RunPasswordForm(const std::string& account_name);

} // namespace kiosk_provision
