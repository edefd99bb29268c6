#include <catch2/catch_test_macros.hpp>

#include <kiosk_provision/cli/console_prompt.hpp>

#include <sstream>
#include <string>

using namespace kiosk_provision;

TEST_CASE("ConsolePrompt: non-interactive always declines", "[cli][prompt]") {
    std::istringstream in("y\n");
    std::ostringstream out;
    ConsolePrompt prompt(false, in, out);

    CHECK_FALSE(prompt.Confirm("Continue anyway?"));
    CHECK(out.str().empty());
}

TEST_CASE("ConsolePrompt: yes answers", "[cli][prompt]") {
    for (const char* answer : {"y\n", "Y\n", "yes\n", "  y\n", "Yes please\n"}) {
        INFO(answer);
        std::istringstream in(answer);
        std::ostringstream out;
        ConsolePrompt prompt(true, in, out);
        CHECK(prompt.Confirm("Continue anyway?"));
    }
}

TEST_CASE("ConsolePrompt: anything else is no", "[cli][prompt]") {
    for (const char* answer : {"n\n", "\n", "   \n", "no\n", "sure\n"}) {
        INFO(answer);
        std::istringstream in(answer);
        std::ostringstream out;
        ConsolePrompt prompt(true, in, out);
        CHECK_FALSE(prompt.Confirm("Continue anyway?"));
    }
}

TEST_CASE("ConsolePrompt: end of input is no", "[cli][prompt]") {
    std::istringstream in("");
    std::ostringstream out;
    ConsolePrompt prompt(true, in, out);
    CHECK_FALSE(prompt.Confirm("Continue anyway?"));
}

TEST_CASE("ConsolePrompt: shows the question with the default", "[cli][prompt]") {
    std::istringstream in("n\n");
    std::ostringstream out;
    ConsolePrompt prompt(true, in, out);

    CHECK_FALSE(prompt.Confirm("OS build 17134 is older than the recommended minimum 17763. "
                               "Continue anyway?"));
    CHECK(out.str() == "OS build 17134 is older than the recommended minimum 17763. "
                       "Continue anyway? [y/N] ");
}

TEST_CASE("ConsolePrompt: reads one answer per question", "[cli][prompt]") {
    std::istringstream in("y\nn\n");
    std::ostringstream out;
    ConsolePrompt prompt(true, in, out);

    CHECK(prompt.Confirm("first?"));
    CHECK_FALSE(prompt.Confirm("second?"));
}
