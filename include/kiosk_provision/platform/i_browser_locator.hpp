#pragma once

#include <kiosk_provision/core/result.hpp>
#include <kiosk_provision/core/types.hpp>

#include <optional>
#include <string>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// IBrowserLocator: finds a browser executable and, when permitted, installs
// the browser. A missing browser is reported as std::nullopt, never as a
// fatal error.
// ---------------------------------------------------------------------------
class IBrowserLocator {
public:
    virtual ~IBrowserLocator() = default;

    IBrowserLocator(const IBrowserLocator&) = delete;
    IBrowserLocator& operator=(const IBrowserLocator&) = delete;
    IBrowserLocator(IBrowserLocator&&) = delete;
    IBrowserLocator& operator=(IBrowserLocator&&) = delete;

    [[nodiscard]] virtual std::optional<std::string> Locate(BrowserKind kind) = 0;

    [[nodiscard]] virtual Result<void, Error> Install(BrowserKind kind) = 0;

protected:
    IBrowserLocator() = default;
};

} // namespace kiosk_provision
