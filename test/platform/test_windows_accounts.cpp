#include <catch2/catch_test_macros.hpp>

#include <kiosk_provision/platform/windows_accounts.hpp>

#include "mocks/mock_process_runner.hpp"

#include <string>
#include <vector>

using namespace kiosk_provision;
using namespace kiosk_provision::testing;

namespace {

const char* kUserNotFound =
    "The user name could not be found.\r\n\r\n"
    "More help is available by typing NET HELPMSG 2221.\r\n\r\n";

const char* kAccessDenied = "System error 5 has occurred.\r\n\r\nAccess is denied.\r\n\r\n";

const char* kRegValueMissing =
    "ERROR: The system was unable to find the specified registry key or value.\r\n";

AccountName Kiosk() {
    return AccountName::Create("KioskUser").Value();
}

AccountRequest Request(std::optional<std::string> password = std::nullopt) {
    return AccountRequest{Kiosk(), "Kiosk User", std::move(password)};
}

} // anonymous namespace

// ===========================================================================
// WindowsAccountProvisioner::AccountExists
// ===========================================================================

TEST_CASE("AccountExists: exit 0 means the account exists", "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(0, "User name                    KioskUser\r\n");
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.AccountExists(Kiosk());
    REQUIRE(result.IsOk());
    CHECK(result.Value());
    REQUIRE(runner.CallCount() == 1);
    CHECK(runner.Calls()[0].CommandLine() == "net user KioskUser");
}

TEST_CASE("AccountExists: NERR_UserNotFound means absent", "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(2, kUserNotFound);
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.AccountExists(Kiosk());
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value());
}

TEST_CASE("AccountExists: other failures are account errors", "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(2, kAccessDenied);
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.AccountExists(Kiosk());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Account);
    CHECK(result.Error().target == "KioskUser");
    CHECK(result.Error().hint.has_value());
}

TEST_CASE("AccountExists: runner start failure is re-tagged", "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueStartFailure("net");
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.AccountExists(Kiosk());
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "AccountExists");
    CHECK(result.Error().category == ErrorCategory::Account);
    CHECK(result.Error().ExitCode() == 3);
}

// ===========================================================================
// WindowsAccountProvisioner::EnsureAccount
// ===========================================================================

TEST_CASE("EnsureAccount: creates a missing account without a password",
          "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(2, kUserNotFound);
    runner.EnqueueExit(0, "The command completed successfully.\r\n");
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.EnsureAccount(Request());
    REQUIRE(result.IsOk());
    CHECK(result.Value() == AccountOutcome::Created);

    REQUIRE(runner.CallCount() == 2);
    const std::vector<std::string> expected = {"user", "KioskUser", "/add",
                                               "/fullname:Kiosk User", "/passwordchg:no",
                                               "/expires:never", "/passwordreq:no"};
    CHECK(runner.Calls()[1].program == "net");
    CHECK(runner.Calls()[1].args == expected);
}

TEST_CASE("EnsureAccount: creates a missing account with the decrypted password",
          "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(2, kUserNotFound);
    runner.EnqueueExit(0);
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.EnsureAccount(Request(std::string("S3cret!")));
    REQUIRE(result.IsOk());
    CHECK(result.Value() == AccountOutcome::Created);

    REQUIRE(runner.CallCount() == 2);
    const auto& args = runner.Calls()[1].args;
    REQUIRE(args.size() >= 3);
    CHECK(args[2] == "S3cret!");
    for (const auto& arg : args) {
        CHECK(arg != "/passwordreq:no");
    }
}

TEST_CASE("EnsureAccount: existing account gets its password re-attached",
          "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(0);
    runner.EnqueueExit(0);
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.EnsureAccount(Request(std::string("S3cret!")));
    REQUIRE(result.IsOk());
    CHECK(result.Value() == AccountOutcome::PasswordUpdated);
    REQUIRE(runner.CallCount() == 2);
    CHECK(runner.Calls()[1].CommandLine() == "net user KioskUser S3cret!");
}

TEST_CASE("EnsureAccount: existing account without password is left alone",
          "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(0);
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.EnsureAccount(Request());
    REQUIRE(result.IsOk());
    CHECK(result.Value() == AccountOutcome::AlreadyExists);
    CHECK(runner.CallCount() == 1);
}

TEST_CASE("EnsureAccount: creation failure is fatal", "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(2, kUserNotFound);
    runner.EnqueueExit(2, "System error 1378 has occurred.\r\n\r\n"
                          "The password does not meet the password policy requirements.\r\n");
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.EnsureAccount(Request(std::string("short")));
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "CreateAccount");
    CHECK(result.Error().category == ErrorCategory::Account);
    CHECK(result.Error().message.find("password policy") != std::string::npos);
}

TEST_CASE("EnsureAccount: password update failure is reported", "[platform][accounts]") {
    MockProcessRunner runner;
    runner.EnqueueExit(0);
    runner.EnqueueExit(2, kAccessDenied);
    WindowsAccountProvisioner accounts(runner);

    auto result = accounts.EnsureAccount(Request(std::string("S3cret!")));
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "SetPassword");
}

// ===========================================================================
// WinlogonAutoLoginConfigurator
// ===========================================================================

TEST_CASE("WinlogonAutoLoginConfigurator: Enable with password", "[platform][autologin]") {
    MockProcessRunner runner;
    WinlogonAutoLoginConfigurator winlogon(runner);

    auto result = winlogon.Enable(Kiosk(), std::string("S3cret!"));
    REQUIRE(result.IsOk());

    REQUIRE(runner.CallCount() == 5);
    const std::vector<std::string> set_auto = {"add", kWinlogonKey, "/v", "AutoAdminLogon",
                                               "/t", "REG_SZ", "/d", "1", "/f"};
    CHECK(runner.Calls()[0].program == "reg");
    CHECK(runner.Calls()[0].args == set_auto);
    CHECK(runner.Calls()[1].args[3] == "DefaultUserName");
    CHECK(runner.Calls()[1].args[7] == "KioskUser");
    CHECK(runner.Calls()[2].args[3] == "DefaultDomainName");
    CHECK(runner.Calls()[2].args[7] == ".");
    CHECK(runner.Calls()[3].args[3] == "DefaultPassword");
    CHECK(runner.Calls()[3].args[7] == "S3cret!");
    CHECK(runner.Calls()[4].args[0] == "delete");
    CHECK(runner.Calls()[4].args[3] == "AutoLogonCount");
}

TEST_CASE("WinlogonAutoLoginConfigurator: Enable without password clears DefaultPassword",
          "[platform][autologin]") {
    MockProcessRunner runner;
    runner.EnqueueExit(0);
    runner.EnqueueExit(0);
    runner.EnqueueExit(0);
    runner.EnqueueExit(1, kRegValueMissing);  // no DefaultPassword to delete
    runner.EnqueueExit(1, kRegValueMissing);  // no AutoLogonCount to delete
    WinlogonAutoLoginConfigurator winlogon(runner);

    auto result = winlogon.Enable(Kiosk(), std::nullopt);
    REQUIRE(result.IsOk());
    REQUIRE(runner.CallCount() == 5);
    CHECK(runner.Calls()[3].args[0] == "delete");
    CHECK(runner.Calls()[3].args[3] == "DefaultPassword");
}

TEST_CASE("WinlogonAutoLoginConfigurator: stops at the first failed write",
          "[platform][autologin]") {
    MockProcessRunner runner;
    runner.EnqueueExit(1, "ERROR: Access is denied.\r\n");
    WinlogonAutoLoginConfigurator winlogon(runner);

    auto result = winlogon.Enable(Kiosk(), std::nullopt);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::AutoLogin);
    CHECK(result.Error().target == "AutoAdminLogon");
    CHECK(result.Error().hint.has_value());
    CHECK(runner.CallCount() == 1);
}

TEST_CASE("WinlogonAutoLoginConfigurator: delete failure other than missing value",
          "[platform][autologin]") {
    MockProcessRunner runner;
    runner.EnqueueExit(0);
    runner.EnqueueExit(1, "ERROR: Access is denied.\r\n");
    WinlogonAutoLoginConfigurator winlogon(runner);

    auto result = winlogon.Disable();
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "DeleteWinlogonValue");
}

TEST_CASE("WinlogonAutoLoginConfigurator: Disable", "[platform][autologin]") {
    MockProcessRunner runner;
    WinlogonAutoLoginConfigurator winlogon(runner);

    auto result = winlogon.Disable();
    REQUIRE(result.IsOk());
    REQUIRE(runner.CallCount() == 2);
    CHECK(runner.Calls()[0].args[3] == "AutoAdminLogon");
    CHECK(runner.Calls()[0].args[7] == "0");
    CHECK(runner.Calls()[1].args[0] == "delete");
    CHECK(runner.Calls()[1].args[3] == "DefaultPassword");
}

// ===========================================================================
// WindowsHostInfo / ParseRegQueryValue
// ===========================================================================

TEST_CASE("WindowsHostInfo: parses CurrentBuildNumber", "[platform][host]") {
    MockProcessRunner runner;
    runner.EnqueueExit(0,
                       "\r\nHKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion\r\n"
                       "    CurrentBuildNumber    REG_SZ    19045\r\n\r\n");
    WindowsHostInfo host(runner);

    auto result = host.BuildNumber();
    REQUIRE(result.IsOk());
    CHECK(result.Value() == 19045);
    REQUIRE(runner.CallCount() == 1);
    CHECK(runner.Calls()[0].args[0] == "query");
    CHECK(runner.Calls()[0].args[3] == "CurrentBuildNumber");
}

TEST_CASE("WindowsHostInfo: unexpected output", "[platform][host]") {
    MockProcessRunner runner;
    runner.EnqueueExit(0, "    CurrentBuildNumber    REG_SZ    abc\r\n");
    WindowsHostInfo host(runner);

    auto result = host.BuildNumber();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::HostInfo);
}

TEST_CASE("WindowsHostInfo: reg failure", "[platform][host]") {
    MockProcessRunner runner;
    runner.EnqueueExit(1, kRegValueMissing);
    WindowsHostInfo host(runner);

    auto result = host.BuildNumber();
    REQUIRE(result.IsErr());
    CHECK(result.Error().exit_code == 1);
}

TEST_CASE("ParseRegQueryValue: finds the named value only", "[platform][host]") {
    const std::string output =
        "HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion\n"
        "    ProductName    REG_SZ    Windows 10 Pro\n"
        "    CurrentBuildNumber    REG_SZ    22631\n";

    CHECK(ParseRegQueryValue(output, "ProductName") ==
          std::optional<std::string>("Windows 10 Pro"));
    CHECK(ParseRegQueryValue(output, "CurrentBuildNumber") ==
          std::optional<std::string>("22631"));
    CHECK_FALSE(ParseRegQueryValue(output, "EditionID").has_value());
}
