#include <kiosk_provision/platform/scheduled_task_registrar.hpp>

#include <kiosk_provision/core/log.hpp>
#include <kiosk_provision/platform/process_runner.hpp>

#include <tinyxml2.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace kiosk_provision {

namespace {

constexpr const char* kComponent = "schedule";
constexpr const char* kTaskNamespace = "http://schemas.microsoft.com/windows/2004/02/mit/task";

void AddText(tinyxml2::XMLDocument& doc, tinyxml2::XMLElement* parent,
             const char* name, const std::string& text) {
    auto* element = doc.NewElement(name);
    element->SetText(text.c_str());
    parent->InsertEndChild(element);
}

std::string JoinArguments(const std::vector<std::string>& arguments) {
    std::string joined;
    for (const auto& arg : arguments) {
        if (!joined.empty()) joined.push_back(' ');
        joined += QuoteWindowsArgument(arg);
    }
    return joined;
}

Error SchedulingError(const std::string& task_name, std::string message) {
    return Error{"RegisterLaunch", task_name, std::nullopt, std::move(message),
                 std::string("Create a logon task for the kiosk account manually in Task Scheduler"),
                 ErrorCategory::Scheduling};
}

// Task names may contain '\' folder separators; keep the file name flat.
std::string SafeFileName(const std::string& task_name) {
    std::string out;
    for (char c : task_name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '_';
        out.push_back(ok ? c : '_');
    }
    return out;
}

} // namespace

std::string BuildTaskXml(const LaunchTask& task) {
    tinyxml2::XMLDocument doc;
    doc.InsertEndChild(doc.NewDeclaration());

    auto* root = doc.NewElement("Task");
    root->SetAttribute("version", "1.2");
    root->SetAttribute("xmlns", kTaskNamespace);
    doc.InsertEndChild(root);

    auto* info = doc.NewElement("RegistrationInfo");
    AddText(doc, info, "Description", task.description);
    AddText(doc, info, "URI", "\\" + task.task_name);
    root->InsertEndChild(info);

    auto* triggers = doc.NewElement("Triggers");
    auto* logon = doc.NewElement("LogonTrigger");
    AddText(doc, logon, "Enabled", "true");
    AddText(doc, logon, "UserId", task.account);
    triggers->InsertEndChild(logon);
    root->InsertEndChild(triggers);

    auto* principals = doc.NewElement("Principals");
    auto* principal = doc.NewElement("Principal");
    principal->SetAttribute("id", "Author");
    AddText(doc, principal, "UserId", task.account);
    AddText(doc, principal, "LogonType", "InteractiveToken");
    AddText(doc, principal, "RunLevel", "LeastPrivilege");
    principals->InsertEndChild(principal);
    root->InsertEndChild(principals);

    auto* settings = doc.NewElement("Settings");
    AddText(doc, settings, "MultipleInstancesPolicy", "IgnoreNew");
    AddText(doc, settings, "DisallowStartIfOnBatteries", "false");
    AddText(doc, settings, "StopIfGoingOnBatteries", "false");
    AddText(doc, settings, "AllowHardTerminate", "true");
    AddText(doc, settings, "StartWhenAvailable", "true");
    AddText(doc, settings, "AllowStartOnDemand", "true");
    AddText(doc, settings, "Enabled", "true");
    AddText(doc, settings, "Hidden", "false");
    // PT0S: no execution time limit.
    AddText(doc, settings, "ExecutionTimeLimit", "PT0S");
    AddText(doc, settings, "Priority", "7");
    root->InsertEndChild(settings);

    auto* actions = doc.NewElement("Actions");
    actions->SetAttribute("Context", "Author");
    auto* exec = doc.NewElement("Exec");
    AddText(doc, exec, "Command", task.executable);
    if (!task.arguments.empty()) {
        AddText(doc, exec, "Arguments", JoinArguments(task.arguments));
    }
    actions->InsertEndChild(exec);
    root->InsertEndChild(actions);

    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return printer.CStr();
}

ScheduledTaskRegistrar::ScheduledTaskRegistrar(IProcessRunner& runner)
    : runner_(runner) {}

Result<void, Error> ScheduledTaskRegistrar::Register(const LaunchTask& task) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return Result<void, Error>::Err(
            SchedulingError(task.task_name, "no temporary directory: " + ec.message()));
    }
    const auto xml_path = (dir / ("kiosk-provision-" + SafeFileName(task.task_name) + ".xml")).string();

    {
        std::ofstream out(xml_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void, Error>::Err(
                SchedulingError(task.task_name, "cannot write " + xml_path));
        }
        out << "\xEF\xBB\xBF" << BuildTaskXml(task);
    }

    auto run = runner_.Run("schtasks", {"/Create", "/TN", task.task_name,
                                        "/XML", xml_path, "/F"});
    std::filesystem::remove(xml_path, ec);

    if (run.IsErr()) {
        auto error = std::move(run).Error();
        error.operation = "RegisterLaunch";
        error.category = ErrorCategory::Scheduling;
        return Result<void, Error>::Err(std::move(error));
    }
    if (run.Value().exit_code != 0) {
        auto error = Error::FromProcessExit("RegisterLaunch", task.task_name,
                                            run.Value().exit_code, run.Value().output,
                                            ErrorCategory::Scheduling);
        if (!error.hint.has_value()) {
            error.hint = "Create a logon task for the kiosk account manually in Task Scheduler";
        }
        return Result<void, Error>::Err(std::move(error));
    }

    LogInfo(kComponent, "Registered logon task '" + task.task_name + "' for " + task.account);
    return Result<void, Error>::Ok();
}

} // namespace kiosk_provision
