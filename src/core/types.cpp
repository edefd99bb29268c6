#include <kiosk_provision/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace kiosk_provision {

namespace {

constexpr std::string_view kForbiddenAccountChars = "\"/\\[]:;|=,+*?<>@";
constexpr size_t kMaxAccountNameLength = 20;

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool HasWhitespace(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BrowserKind
// ---------------------------------------------------------------------------
Result<BrowserKind, std::string> ParseBrowserKind(std::string_view value) {
    const auto lower = ToLower(value);
    if (lower == "edge") {
        return Result<BrowserKind, std::string>::Ok(BrowserKind::Edge);
    }
    if (lower == "chrome") {
        return Result<BrowserKind, std::string>::Ok(BrowserKind::Chrome);
    }
    return Result<BrowserKind, std::string>::Err(
        "Unsupported browser '" + std::string(value) + "' (expected Edge or Chrome)");
}

const char* BrowserKindName(BrowserKind kind) {
    switch (kind) {
        case BrowserKind::Edge:   return "Edge";
        case BrowserKind::Chrome: return "Chrome";
    }
    return "Edge";
}

// ---------------------------------------------------------------------------
// AccountName
// ---------------------------------------------------------------------------
Result<AccountName, std::string> AccountName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<AccountName, std::string>::Err("Account name must not be empty");
    }
    if (name.size() > kMaxAccountNameLength) {
        return Result<AccountName, std::string>::Err(
            "Account name must be at most 20 characters, got " +
            std::to_string(name.size()));
    }
    auto bad = name.find_first_of(kForbiddenAccountChars);
    if (bad != std::string_view::npos) {
        return Result<AccountName, std::string>::Err(
            std::string("Account name must not contain '") + name[bad] + "'");
    }
    if (name.find_first_not_of(". ") == std::string_view::npos) {
        return Result<AccountName, std::string>::Err(
            "Account name must not consist only of dots and spaces");
    }
    return Result<AccountName, std::string>::Ok(AccountName(std::string(name)));
}

// ---------------------------------------------------------------------------
// KioskUrl
// ---------------------------------------------------------------------------
Result<KioskUrl, std::string> KioskUrl::Create(std::string_view url) {
    if (url.empty()) {
        return Result<KioskUrl, std::string>::Err("URL must not be empty");
    }
    if (HasWhitespace(url)) {
        return Result<KioskUrl, std::string>::Err("URL must not contain whitespace");
    }

    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ), then ':'
    const auto colon = url.find(':');
    const auto scheme = url.substr(0, colon == std::string_view::npos ? 0 : colon);
    const bool scheme_ok =
        !scheme.empty() && std::isalpha(static_cast<unsigned char>(scheme[0])) &&
        std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '+' || c == '-' || c == '.';
        });
    if (!scheme_ok) {
        return Result<KioskUrl, std::string>::Err(
            "URL must start with a scheme such as https://");
    }

    const auto lower_scheme = ToLower(scheme);
    if (lower_scheme == "http" || lower_scheme == "https") {
        auto rest = url.substr(colon + 1);
        if (rest.rfind("//", 0) != 0) {
            return Result<KioskUrl, std::string>::Err("URL must contain a host");
        }
        const auto host_end = rest.find_first_of("/?#", 2);
        if (host_end == 2 || rest.size() == 2) {
            return Result<KioskUrl, std::string>::Err("URL must contain a host");
        }
    }
    return Result<KioskUrl, std::string>::Ok(KioskUrl(std::string(url)));
}

} // namespace kiosk_provision
