#include <catch2/catch_test_macros.hpp>

#include <kiosk_provision/core/types.hpp>

#include <string>

using namespace kiosk_provision;

// ===========================================================================
// BrowserKind
// ===========================================================================

TEST_CASE("ParseBrowserKind: accepts known names in any case", "[types][BrowserKind]") {
    SECTION("Edge") {
        auto r = ParseBrowserKind("Edge");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == BrowserKind::Edge);
    }
    SECTION("lowercase chrome") {
        auto r = ParseBrowserKind("chrome");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == BrowserKind::Chrome);
    }
    SECTION("uppercase EDGE") {
        auto r = ParseBrowserKind("EDGE");
        REQUIRE(r.IsOk());
        CHECK(r.Value() == BrowserKind::Edge);
    }
}

TEST_CASE("ParseBrowserKind: rejects anything else", "[types][BrowserKind]") {
    SECTION("firefox") {
        auto r = ParseBrowserKind("Firefox");
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("Firefox") != std::string::npos);
        CHECK(r.Error().find("Edge or Chrome") != std::string::npos);
    }
    SECTION("empty") {
        CHECK(ParseBrowserKind("").IsErr());
    }
    SECTION("padded") {
        CHECK(ParseBrowserKind(" Edge").IsErr());
    }
}

TEST_CASE("BrowserKindName: canonical spelling", "[types][BrowserKind]") {
    CHECK(std::string(BrowserKindName(BrowserKind::Edge)) == "Edge");
    CHECK(std::string(BrowserKindName(BrowserKind::Chrome)) == "Chrome");
}

// ===========================================================================
// AccountName
// ===========================================================================

TEST_CASE("AccountName: valid names", "[types][AccountName]") {
    SECTION("default kiosk name") {
        auto r = AccountName::Create("KioskUser");
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == "KioskUser");
    }
    SECTION("with space and dot") {
        CHECK(AccountName::Create("Lobby Kiosk.1").IsOk());
    }
    SECTION("max 20 chars") {
        CHECK(AccountName::Create(std::string(20, 'k')).IsOk());
    }
}

TEST_CASE("AccountName: invalid names", "[types][AccountName]") {
    SECTION("empty") {
        auto r = AccountName::Create("");
        REQUIRE(r.IsErr());
        CHECK(r.Error() == "Account name must not be empty");
    }
    SECTION("too long") {
        auto r = AccountName::Create(std::string(21, 'k'));
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("21") != std::string::npos);
    }
    SECTION("forbidden characters") {
        for (const char* name : {"a/b", "a\\b", "a@b", "a:b", "a*b", "a\"b", "a<b"}) {
            INFO(name);
            CHECK(AccountName::Create(name).IsErr());
        }
    }
    SECTION("reports the offending character") {
        auto r = AccountName::Create("kiosk@lobby");
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("'@'") != std::string::npos);
    }
    SECTION("only dots and spaces") {
        CHECK(AccountName::Create(". .").IsErr());
    }
}

TEST_CASE("AccountName: equality", "[types][AccountName]") {
    auto a = AccountName::Create("KioskUser").Value();
    auto b = AccountName::Create("KioskUser").Value();
    auto c = AccountName::Create("Other").Value();
    CHECK(a == b);
    CHECK(a != c);
}

// ===========================================================================
// KioskUrl
// ===========================================================================

TEST_CASE("KioskUrl: valid URLs", "[types][KioskUrl]") {
    for (const char* url : {"https://www.example.com", "http://intranet/dashboard",
                            "HTTPS://Example.com/path?q=1#top", "http://10.0.0.5:8080",
                            "file:///C:/kiosk/index.html", "edge://settings",
                            "ms-settings:display"}) {
        INFO(url);
        auto r = KioskUrl::Create(url);
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == url);
    }
}

TEST_CASE("KioskUrl: invalid URLs", "[types][KioskUrl]") {
    SECTION("empty") {
        CHECK(KioskUrl::Create("").Error() == "URL must not be empty");
    }
    SECTION("no scheme") {
        CHECK(KioskUrl::Create("www.example.com").Error() ==
              "URL must start with a scheme such as https://");
    }
    SECTION("malformed scheme") {
        CHECK(KioskUrl::Create("1http://example.com").IsErr());
        CHECK(KioskUrl::Create("://example.com").IsErr());
    }
    SECTION("http without authority") {
        CHECK(KioskUrl::Create("http:example.com").Error() == "URL must contain a host");
    }
    SECTION("no host") {
        CHECK(KioskUrl::Create("https:///path").Error() == "URL must contain a host");
    }
    SECTION("whitespace") {
        CHECK(KioskUrl::Create("https://example.com/a b").Error() ==
              "URL must not contain whitespace");
    }
}
