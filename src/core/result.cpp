#include <kiosk_provision/core/result.hpp>

#include <sstream>
#include <vector>

namespace kiosk_provision {

namespace {

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> NonEmptyLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto trimmed = Trim(line);
        if (!trimmed.empty()) lines.push_back(std::move(trimmed));
    }
    return lines;
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// Windows console tools print a generic banner first ("System error 5 has
// occurred.") and the actual reason on the last line.
std::string MostUsefulLine(const std::string& output) {
    auto lines = NonEmptyLines(output);
    if (lines.empty()) return "";
    for (const auto& line : lines) {
        if (Contains(line, "ERROR:")) return line;
    }
    return lines.back();
}

// Escape a string for JSON output (handles \, ", and control characters).
void JsonEscape(std::ostream& out, const std::string& s) {
    static const char* kHex = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    const auto u = static_cast<unsigned char>(c);
                    out << "\\u00" << kHex[u >> 4] << kHex[u & 0x0F];
                } else {
                    out << c;
                }
                break;
        }
    }
}

} // anonymous namespace

Error Error::FromProcessExit(const std::string& operation,
                             const std::string& target,
                             int exit_code,
                             const std::string& output,
                             ErrorCategory category) {
    std::string detail = MostUsefulLine(output);
    std::optional<std::string> hint;

    if (Contains(output, "Access is denied") || exit_code == 5) {
        hint = "Run kiosk-provision from an elevated (Administrator) prompt";
    } else if (exit_code == 9009 || Contains(output, "is not recognized")) {
        hint = "The required system tool is not on PATH";
    }

    std::string message = "command exited with code " + std::to_string(exit_code);
    if (!detail.empty()) {
        message += ": " + detail;
    }

    return Error{operation, target, exit_code, message, hint, category};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    oss << ": " << message;
    if (hint.has_value() && !hint->empty()) {
        oss << " (hint: " << *hint << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{"category":")" << CategoryName() << R"(","operation":")";
    JsonEscape(oss, operation);
    oss << '"';
    if (!target.empty()) {
        oss << R"(,"target":")";
        JsonEscape(oss, target);
        oss << '"';
    }
    if (exit_code.has_value()) {
        oss << R"(,"process_exit_code":)" << *exit_code;
    }
    oss << R"(,"message":")";
    JsonEscape(oss, message);
    oss << '"';
    if (hint.has_value() && !hint->empty()) {
        oss << R"(,"hint":")";
        JsonEscape(oss, *hint);
        oss << '"';
    }
    oss << R"(,"exit_code":)" << ExitCode() << "}}";
    return oss.str();
}

} // namespace kiosk_provision
