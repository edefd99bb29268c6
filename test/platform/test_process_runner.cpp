#include <catch2/catch_test_macros.hpp>

#include <kiosk_provision/platform/process_runner.hpp>

#include <string>
#include <vector>

using namespace kiosk_provision;

// ===========================================================================
// QuoteWindowsArgument
// ===========================================================================

TEST_CASE("QuoteWindowsArgument: plain values pass through", "[platform][process]") {
    CHECK(QuoteWindowsArgument("user") == "user");
    CHECK(QuoteWindowsArgument("/fullname:Kiosk") == "/fullname:Kiosk");
    CHECK(QuoteWindowsArgument("C:\\kiosk\\cred.json") == "C:\\kiosk\\cred.json");
}

TEST_CASE("QuoteWindowsArgument: empty value becomes a quoted empty string",
          "[platform][process]") {
    CHECK(QuoteWindowsArgument("") == "\"\"");
}

TEST_CASE("QuoteWindowsArgument: whitespace is quoted", "[platform][process]") {
    CHECK(QuoteWindowsArgument("/fullname:Kiosk User") == "\"/fullname:Kiosk User\"");
    CHECK(QuoteWindowsArgument("a\tb") == "\"a\tb\"");
}

TEST_CASE("QuoteWindowsArgument: embedded quotes are escaped", "[platform][process]") {
    CHECK(QuoteWindowsArgument("say \"hi\"") == "\"say \\\"hi\\\"\"");
}

TEST_CASE("QuoteWindowsArgument: backslashes before a quote are doubled",
          "[platform][process]") {
    // a\"b  ->  "a\\\"b"
    CHECK(QuoteWindowsArgument("a\\\"b") == "\"a\\\\\\\"b\"");
}

TEST_CASE("QuoteWindowsArgument: trailing backslashes are doubled inside quotes",
          "[platform][process]") {
    CHECK(QuoteWindowsArgument("C:\\Program Files\\") == "\"C:\\Program Files\\\\\"");
}

TEST_CASE("QuoteWindowsArgument: inner backslashes stay single", "[platform][process]") {
    CHECK(QuoteWindowsArgument("C:\\Program Files\\Kiosk") == "\"C:\\Program Files\\Kiosk\"");
}

// ===========================================================================
// FormatCommandLine
// ===========================================================================

TEST_CASE("FormatCommandLine: joins program and quoted args", "[platform][process]") {
    CHECK(FormatCommandLine("net", {"user", "KioskUser", "/add", "/fullname:Kiosk User"}) ==
          "net user KioskUser /add \"/fullname:Kiosk User\"");
}

TEST_CASE("FormatCommandLine: program path with spaces is quoted", "[platform][process]") {
    CHECK(FormatCommandLine("C:\\Program Files\\tool.exe", {}) ==
          "\"C:\\Program Files\\tool.exe\"");
}

// ===========================================================================
// SystemProcessRunner
// ===========================================================================

#ifndef _WIN32

TEST_CASE("SystemProcessRunner: captures stdout and stderr with exit code",
          "[platform][process]") {
    SystemProcessRunner runner;
    auto result = runner.Run("sh", {"-c", "echo out-line; echo err-line 1>&2; exit 3"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().exit_code == 3);
    CHECK(result.Value().output.find("out-line") != std::string::npos);
    CHECK(result.Value().output.find("err-line") != std::string::npos);
}

TEST_CASE("SystemProcessRunner: passes arguments verbatim", "[platform][process]") {
    SystemProcessRunner runner;
    auto result = runner.Run("echo", {"Kiosk User", "/fullname:x"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().exit_code == 0);
    CHECK(result.Value().output == "Kiosk User /fullname:x\n");
}

TEST_CASE("SystemProcessRunner: missing program is a start error", "[platform][process]") {
    SystemProcessRunner runner;
    auto result = runner.Run("kiosk-provision-no-such-tool", {});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Process);
    CHECK(result.Error().target == "kiosk-provision-no-such-tool");
    CHECK(result.Error().message.find("could not start process") != std::string::npos);
}

#else

TEST_CASE("SystemProcessRunner: runs a console tool", "[platform][process]") {
    SystemProcessRunner runner;
    auto result = runner.Run("cmd", {"/c", "echo kiosk& exit 3"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().exit_code == 3);
    CHECK(result.Value().output.find("kiosk") != std::string::npos);
}

TEST_CASE("SystemProcessRunner: missing program is a start error", "[platform][process]") {
    SystemProcessRunner runner;
    auto result = runner.Run("kiosk-provision-no-such-tool", {});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Process);
}

#endif
