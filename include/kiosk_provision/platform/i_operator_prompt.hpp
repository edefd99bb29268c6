#pragma once

#include <string_view>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// IOperatorPrompt: asks the person running the tool a yes/no question.
// Implementations that cannot ask (no terminal) answer "no".
// ---------------------------------------------------------------------------
class IOperatorPrompt {
public:
    virtual ~IOperatorPrompt() = default;

    [[nodiscard]] virtual bool Confirm(std::string_view question) = 0;
};

} // namespace kiosk_provision
