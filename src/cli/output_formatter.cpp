#include <kiosk_provision/cli/output_formatter.hpp>

#include <kiosk_provision/config/config_loader.hpp>
#include <kiosk_provision/core/terminal.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace kiosk_provision {

namespace {

using namespace kiosk_provision::ansi;

const char* YesNo(bool value) {
    return value ? "yes" : "no";
}

const char* OutcomeColor(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return kGreen;
        case StepOutcome::Skipped:   return kDim;
        case StepOutcome::Failed:    return kYellow;
    }
    return kReset;
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto array = nlohmann::ordered_json::array();
        for (const auto& row : rows) {
            nlohmann::ordered_json obj;
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(obj);
        }
        out_ << array.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    // Plain table: compute column widths.
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c])) << headers[c];
    }
    out_ << "\n";

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << kBold << error.operation << kReset;
        if (!error.target.empty()) {
            err_ << kDim << " [" << error.target << "]" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (error.hint.has_value() && !error.hint->empty()) {
            err_ << "  " << kYellow << "Hint: " << kReset << error.hint.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.target.empty()) {
        err_ << " [" << error.target << "]";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (error.hint.has_value() && !error.hint->empty()) {
        err_ << "  Hint: " << error.hint.value() << "\n";
    }
}

void OutputFormatter::PrintWarning(const std::string& message) const {
    if (json_mode_) return;
    if (color_mode_) {
        err_ << kYellow << "Warning: " << kReset << message << "\n";
        return;
    }
    err_ << "Warning: " << message << "\n";
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::ordered_json j;
        j["success"] = true;
        j["message"] = message;
        out_ << j.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

void OutputFormatter::PrintSettings(const ResolvedSettings& resolved) const {
    const auto& s = resolved.settings;

    if (json_mode_) {
        nlohmann::ordered_json j;
        j["settings"] = nlohmann::ordered_json::parse(SettingsToJson(s));
        j["warnings"] = resolved.warnings;
        out_ << j.dump(2) << "\n";
        return;
    }

    PrintTable({"Setting", "Value"},
               {
                   {"accountName", s.account_name},
                   {"accountDisplayName", s.account_display_name},
                   {"targetUrl", s.target_url},
                   {"browser", BrowserKindName(s.browser)},
                   {"enableAutoLogin", YesNo(s.enable_auto_login)},
                   {"disableAutoLogin", YesNo(s.disable_auto_login)},
                   {"minimumBuildNumber", std::to_string(s.minimum_build_number)},
                   {"installBrowserIfMissing", YesNo(s.install_browser_if_missing)},
                   {"encryptedPasswordFile", s.encrypted_credential_ref.value_or("-")},
                   {"taskName", s.task_name},
                   {"logFile", s.log_file.value_or("-")},
               });
}

void OutputFormatter::PrintProvisionResult(const ProvisionResult& result) const {
    if (json_mode_) {
        nlohmann::ordered_json j;
        j["success"] = result.success;
        j["degraded"] = result.degraded;
        j["dry_run"] = result.dry_run;
        j["auto_login_enabled"] = result.auto_login_enabled;
        if (result.browser_path.has_value()) {
            j["browser_path"] = *result.browser_path;
        } else {
            j["browser_path"] = nullptr;
        }
        auto steps = nlohmann::ordered_json::array();
        for (const auto& step : result.steps) {
            nlohmann::ordered_json js;
            js["step"] = step.step_name;
            js["outcome"] = StepOutcomeName(step.outcome);
            js["message"] = step.message;
            js["duration_ms"] = step.duration.count();
            steps.push_back(js);
        }
        j["steps"] = steps;
        j["warnings"] = result.warnings;
        j["summary"] = result.summary;
        j["duration_ms"] = result.total_duration.count();
        out_ << j.dump(2) << "\n";
        return;
    }

    for (const auto& step : result.steps) {
        if (color_mode_) {
            out_ << OutcomeColor(step.outcome) << std::left << std::setw(10)
                 << StepOutcomeName(step.outcome) << kReset;
        } else {
            out_ << std::left << std::setw(10) << StepOutcomeName(step.outcome);
        }
        out_ << std::setw(12) << step.step_name << step.message << "\n";
    }
    out_ << "\n";

    if (color_mode_) {
        out_ << (result.degraded ? kYellow : kGreen) << result.summary << kReset << "\n";
    } else {
        out_ << result.summary << "\n";
    }
}

} // namespace kiosk_provision
