#pragma once

#include <kiosk_provision/config/kiosk_settings.hpp>
#include <kiosk_provision/core/result.hpp>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// ShouldEnableAutoLogin: decides whether automatic sign-in is configured.
//
// Evaluated in order:
//   1. enable_auto_login == false                          -> false
//   2. disable_auto_login == true
//        requested via CLI without --confirm               -> ConfirmationRequired
//        otherwise (settings file, or confirmed on CLI)    -> false
//   3. otherwise                                           -> true
//
// The two CLI booleans describe this invocation only; they cannot be derived
// from the merged settings. Pure function, no side effects.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<bool, Error> ShouldEnableAutoLogin(bool enable_auto_login,
                                                        bool disable_auto_login,
                                                        bool disable_requested_via_cli,
                                                        bool confirmed_via_cli);

// Convenience overload reading the two persisted flags from `settings`.
[[nodiscard]] Result<bool, Error> ShouldEnableAutoLogin(const KioskSettings& settings,
                                                        bool disable_requested_via_cli,
                                                        bool confirmed_via_cli);

} // namespace kiosk_provision
