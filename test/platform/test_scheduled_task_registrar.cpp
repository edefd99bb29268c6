#include <catch2/catch_test_macros.hpp>

#include <kiosk_provision/platform/scheduled_task_registrar.hpp>

#include "mocks/mock_process_runner.hpp"

#include <tinyxml2.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace kiosk_provision;
using namespace kiosk_provision::testing;

namespace {

LaunchTask EdgeTask() {
    LaunchTask task;
    task.task_name = "KioskBrowserLaunch";
    task.account = "KioskUser";
    task.executable = "C:\\Program Files (x86)\\Microsoft\\Edge\\Application\\msedge.exe";
    task.arguments = {"--kiosk", "https://lobby.example.com/?a=1&b=2",
                      "--edge-kiosk-type=fullscreen"};
    task.description = "Open https://lobby.example.com/?a=1&b=2 in Edge kiosk mode at sign-in";
    return task;
}

const char* ChildText(const tinyxml2::XMLElement* parent, const char* name) {
    if (parent == nullptr) return nullptr;
    const auto* child = parent->FirstChildElement(name);
    return child != nullptr ? child->GetText() : nullptr;
}

// Reads the XML file handed to schtasks while it still exists.
class XmlCapturingRunner : public IProcessRunner {
public:
    Result<ProcessOutput, Error> Run(std::string_view program,
                                     const std::vector<std::string>& args) override {
        calls.push_back(RunCall{std::string(program), args});
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "/XML") {
                xml_path = args[i + 1];
                std::ifstream in(xml_path, std::ios::binary);
                std::ostringstream oss;
                oss << in.rdbuf();
                xml_content = oss.str();
            }
        }
        return Result<ProcessOutput, Error>::Ok(ProcessOutput{exit_code, output});
    }

    std::vector<RunCall> calls;
    int exit_code = 0;
    std::string output;
    std::string xml_path;
    std::string xml_content;
};

} // anonymous namespace

// ===========================================================================
// BuildTaskXml
// ===========================================================================

TEST_CASE("BuildTaskXml: well-formed task definition", "[platform][schedule]") {
    auto xml = BuildTaskXml(EdgeTask());

    tinyxml2::XMLDocument doc;
    REQUIRE(doc.Parse(xml.c_str()) == tinyxml2::XML_SUCCESS);

    const auto* task = doc.FirstChildElement("Task");
    REQUIRE(task != nullptr);
    CHECK(std::string(task->Attribute("version")) == "1.2");
    CHECK(std::string(task->Attribute("xmlns")) ==
          "http://schemas.microsoft.com/windows/2004/02/mit/task");

    const auto* info = task->FirstChildElement("RegistrationInfo");
    REQUIRE(ChildText(info, "URI") != nullptr);
    CHECK(std::string(ChildText(info, "URI")) == "\\KioskBrowserLaunch");
    CHECK(std::string(ChildText(info, "Description")).find("Edge kiosk mode") !=
          std::string::npos);
}

TEST_CASE("BuildTaskXml: logon trigger and principal target the kiosk account",
          "[platform][schedule]") {
    tinyxml2::XMLDocument doc;
    REQUIRE(doc.Parse(BuildTaskXml(EdgeTask()).c_str()) == tinyxml2::XML_SUCCESS);
    const auto* task = doc.FirstChildElement("Task");
    REQUIRE(task != nullptr);

    const auto* triggers = task->FirstChildElement("Triggers");
    REQUIRE(triggers != nullptr);
    const auto* logon = triggers->FirstChildElement("LogonTrigger");
    REQUIRE(ChildText(logon, "UserId") != nullptr);
    CHECK(std::string(ChildText(logon, "UserId")) == "KioskUser");

    const auto* principals = task->FirstChildElement("Principals");
    REQUIRE(principals != nullptr);
    const auto* principal = principals->FirstChildElement("Principal");
    REQUIRE(principal != nullptr);
    CHECK(std::string(ChildText(principal, "UserId")) == "KioskUser");
    CHECK(std::string(ChildText(principal, "LogonType")) == "InteractiveToken");
    CHECK(std::string(ChildText(principal, "RunLevel")) == "LeastPrivilege");

    const auto* settings = task->FirstChildElement("Settings");
    CHECK(std::string(ChildText(settings, "ExecutionTimeLimit")) == "PT0S");
    CHECK(std::string(ChildText(settings, "MultipleInstancesPolicy")) == "IgnoreNew");
}

TEST_CASE("BuildTaskXml: exec action carries command and escaped arguments",
          "[platform][schedule]") {
    tinyxml2::XMLDocument doc;
    REQUIRE(doc.Parse(BuildTaskXml(EdgeTask()).c_str()) == tinyxml2::XML_SUCCESS);

    const auto* actions = doc.FirstChildElement("Task")->FirstChildElement("Actions");
    REQUIRE(actions != nullptr);
    CHECK(std::string(actions->Attribute("Context")) == "Author");
    const auto* exec = actions->FirstChildElement("Exec");
    REQUIRE(exec != nullptr);
    CHECK(std::string(ChildText(exec, "Command")) ==
          "C:\\Program Files (x86)\\Microsoft\\Edge\\Application\\msedge.exe");
    CHECK(std::string(ChildText(exec, "Arguments")) ==
          "--kiosk https://lobby.example.com/?a=1&b=2 --edge-kiosk-type=fullscreen");
}

TEST_CASE("BuildTaskXml: arguments with spaces are quoted", "[platform][schedule]") {
    auto task = EdgeTask();
    task.arguments = {"--user-data-dir=C:\\Kiosk Data", "--kiosk"};

    tinyxml2::XMLDocument doc;
    REQUIRE(doc.Parse(BuildTaskXml(task).c_str()) == tinyxml2::XML_SUCCESS);
    const auto* exec =
        doc.FirstChildElement("Task")->FirstChildElement("Actions")->FirstChildElement("Exec");
    CHECK(std::string(ChildText(exec, "Arguments")) ==
          "\"--user-data-dir=C:\\Kiosk Data\" --kiosk");
}

TEST_CASE("BuildTaskXml: no Arguments element without arguments", "[platform][schedule]") {
    auto task = EdgeTask();
    task.arguments.clear();

    tinyxml2::XMLDocument doc;
    REQUIRE(doc.Parse(BuildTaskXml(task).c_str()) == tinyxml2::XML_SUCCESS);
    const auto* exec =
        doc.FirstChildElement("Task")->FirstChildElement("Actions")->FirstChildElement("Exec");
    REQUIRE(exec != nullptr);
    CHECK(exec->FirstChildElement("Arguments") == nullptr);
}

// ===========================================================================
// ScheduledTaskRegistrar::Register
// ===========================================================================

TEST_CASE("Register: hands the XML file to schtasks and removes it", "[platform][schedule]") {
    XmlCapturingRunner runner;
    ScheduledTaskRegistrar registrar(runner);

    auto result = registrar.Register(EdgeTask());
    REQUIRE(result.IsOk());

    REQUIRE(runner.calls.size() == 1);
    const auto& call = runner.calls[0];
    CHECK(call.program == "schtasks");
    REQUIRE(call.args.size() == 6);
    CHECK(call.args[0] == "/Create");
    CHECK(call.args[1] == "/TN");
    CHECK(call.args[2] == "KioskBrowserLaunch");
    CHECK(call.args[3] == "/XML");
    CHECK(call.args[5] == "/F");

    // UTF-8 byte order mark, then the task definition.
    REQUIRE(runner.xml_content.size() > 3);
    CHECK(runner.xml_content.substr(0, 3) == "\xEF\xBB\xBF");
    CHECK(runner.xml_content.find("<LogonTrigger>") != std::string::npos);

    CHECK_FALSE(std::filesystem::exists(runner.xml_path));
}

TEST_CASE("Register: schtasks failure is a scheduling error with guidance",
          "[platform][schedule]") {
    XmlCapturingRunner runner;
    runner.exit_code = 1;
    runner.output = "ERROR: The task XML contains a value which is incorrectly formatted.\r\n";
    ScheduledTaskRegistrar registrar(runner);

    auto result = registrar.Register(EdgeTask());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Scheduling);
    CHECK(result.Error().target == "KioskBrowserLaunch");
    REQUIRE(result.Error().hint.has_value());
    CHECK(result.Error().hint->find("Task Scheduler") != std::string::npos);
    CHECK_FALSE(std::filesystem::exists(runner.xml_path));
}

TEST_CASE("Register: schtasks could not start", "[platform][schedule]") {
    MockProcessRunner runner;
    runner.EnqueueStartFailure("schtasks");
    ScheduledTaskRegistrar registrar(runner);

    auto result = registrar.Register(EdgeTask());
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "RegisterLaunch");
    CHECK(result.Error().category == ErrorCategory::Scheduling);
}

TEST_CASE("Register: task names with folders map to a flat file name",
          "[platform][schedule]") {
    XmlCapturingRunner runner;
    ScheduledTaskRegistrar registrar(runner);

    auto task = EdgeTask();
    task.task_name = "Kiosk\\Lobby Launch";
    REQUIRE(registrar.Register(task).IsOk());
    CHECK(std::filesystem::path(runner.xml_path).filename().string() ==
          "kiosk-provision-Kiosk_Lobby_Launch.xml");
    CHECK(runner.calls[0].args[2] == "Kiosk\\Lobby Launch");
}
