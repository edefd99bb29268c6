#pragma once

#include <kiosk_provision/core/result.hpp>

#include <string>
#include <string_view>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// BrowserKind: the browsers a kiosk can launch.
// ---------------------------------------------------------------------------
enum class BrowserKind {
    Edge,
    Chrome,
};

/// Parse "Edge" / "Chrome" (case-insensitive). Any other value is an error,
/// never a silent default.
Result<BrowserKind, std::string> ParseBrowserKind(std::string_view value);

/// Canonical spelling used in settings files and output ("Edge", "Chrome").
const char* BrowserKindName(BrowserKind kind);

// ---------------------------------------------------------------------------
// AccountName: validated local account name.
//
// Rules (Windows SAM account names):
//   - 1 to 20 characters
//   - none of  " / \ [ ] : ; | = , + * ? < > @
//   - not made up only of dots and spaces
// ---------------------------------------------------------------------------
class AccountName {
public:
    static Result<AccountName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const AccountName& other) const { return value_ == other.value_; }
    bool operator!=(const AccountName& other) const { return value_ != other.value_; }

private:
    explicit AccountName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// KioskUrl: absolute URI with no whitespace. Any scheme is accepted
// (file:///, edge://); http and https must also name a host.
// ---------------------------------------------------------------------------
class KioskUrl {
public:
    static Result<KioskUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const KioskUrl& other) const { return value_ == other.value_; }
    bool operator!=(const KioskUrl& other) const { return value_ != other.value_; }

private:
    explicit KioskUrl(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace kiosk_provision
