#pragma once

#include <kiosk_provision/core/result.hpp>
#include <kiosk_provision/core/types.hpp>

#include <optional>
#include <string>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// IAutoLoginConfigurator: writes or clears the OS automatic sign-in values.
// Both operations are idempotent.
// ---------------------------------------------------------------------------
class IAutoLoginConfigurator {
public:
    virtual ~IAutoLoginConfigurator() = default;

    IAutoLoginConfigurator(const IAutoLoginConfigurator&) = delete;
    IAutoLoginConfigurator& operator=(const IAutoLoginConfigurator&) = delete;
    IAutoLoginConfigurator(IAutoLoginConfigurator&&) = delete;
    IAutoLoginConfigurator& operator=(IAutoLoginConfigurator&&) = delete;

    [[nodiscard]] virtual Result<void, Error> Enable(
        const AccountName& account,
        const std::optional<std::string>& password) = 0;

    [[nodiscard]] virtual Result<void, Error> Disable() = 0;

protected:
    IAutoLoginConfigurator() = default;
};

} // namespace kiosk_provision
