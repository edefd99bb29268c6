#include <kiosk_provision/policy/auto_login_policy.hpp>

namespace kiosk_provision {

Result<bool, Error> ShouldEnableAutoLogin(bool enable_auto_login,
                                          bool disable_auto_login,
                                          bool disable_requested_via_cli,
                                          bool confirmed_via_cli) {
    if (!enable_auto_login) {
        return Result<bool, Error>::Ok(false);
    }

    if (disable_auto_login) {
        if (disable_requested_via_cli && !confirmed_via_cli) {
            return Result<bool, Error>::Err(Error{
                "AutoLoginPolicy", "", std::nullopt,
                "Disabling automatic sign-in from the command line requires confirmation",
                std::string("Pass --disable-auto-login together with --confirm"),
                ErrorCategory::ConfirmationRequired});
        }
        return Result<bool, Error>::Ok(false);
    }

    return Result<bool, Error>::Ok(true);
}

Result<bool, Error> ShouldEnableAutoLogin(const KioskSettings& settings,
                                          bool disable_requested_via_cli,
                                          bool confirmed_via_cli) {
    return ShouldEnableAutoLogin(settings.enable_auto_login,
                                 settings.disable_auto_login,
                                 disable_requested_via_cli,
                                 confirmed_via_cli);
}

} // namespace kiosk_provision
