#include <kiosk_provision/cli/console_prompt.hpp>

#include <kiosk_provision/core/log.hpp>

#include <string>

namespace kiosk_provision {

bool ConsolePrompt::Confirm(std::string_view question) {
    if (!interactive_) {
        LogDebug("prompt", "not interactive, declining: " + std::string(question));
        return false;
    }

    out_ << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) {
        return false;
    }
    auto first = answer.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    const char c = answer[first];
    return c == 'y' || c == 'Y';
}

} // namespace kiosk_provision
