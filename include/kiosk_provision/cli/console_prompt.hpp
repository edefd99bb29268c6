#pragma once

#include <kiosk_provision/platform/i_operator_prompt.hpp>

#include <iostream>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// ConsolePrompt: "question [y/N]" on the terminal. Answers no when stdin is
// not a terminal, or when `interactive` is false.
// ---------------------------------------------------------------------------
class ConsolePrompt : public IOperatorPrompt {
public:
    explicit ConsolePrompt(bool interactive,
                           std::istream& in = std::cin,
                           std::ostream& out = std::cerr)
        : interactive_(interactive), in_(in), out_(out) {}

    [[nodiscard]] bool Confirm(std::string_view question) override;

private:
    bool interactive_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace kiosk_provision
