#include <kiosk_provision/cli/settings_wizard.hpp>

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

namespace kiosk_provision {

namespace {

// Filter input to allow only digit characters.
ftxui::ComponentDecorator DigitsOnly() {
    return ftxui::CatchEvent([](ftxui::Event event) {
        return event.is_character() && !std::isdigit(event.character()[0]);
    });
}

int ParseBuildOrDefault(const std::string& text, int default_build) {
    if (text.empty()) {
        return default_build;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE ||
        value < 0 || value > std::numeric_limits<int>::max()) {
        return default_build;
    }
    return static_cast<int>(value);
}

// Escape closes the form without saving.
ftxui::ComponentDecorator EscapeExits(ftxui::ScreenInteractive& screen) {
    return ftxui::CatchEvent([&screen](ftxui::Event event) {
        if (event == ftxui::Event::Escape) {
            screen.Exit();
            return true;
        }
        return false;
    });
}

} // namespace

std::optional<KioskSettings> RunSettingsWizard(const KioskSettings& initial) {
    using namespace ftxui;

    std::string account = initial.account_name;
    std::string display_name = initial.account_display_name;
    std::string url = initial.target_url;
    std::vector<std::string> browsers = {"Edge", "Chrome"};
    int browser_index = initial.browser == BrowserKind::Chrome ? 1 : 0;
    bool enable_auto_login = initial.enable_auto_login;
    bool disable_auto_login = initial.disable_auto_login;
    std::string build_str = std::to_string(initial.minimum_build_number);
    bool install_browser = initial.install_browser_if_missing;
    std::string credential = initial.encrypted_credential_ref.value_or("");
    std::string task_name = initial.task_name;

    bool saved = false;

    auto screen = ScreenInteractive::FitComponent();

    auto account_input = Input(&account, "account name");
    auto display_input = Input(&display_name, "full name");
    auto url_input = Input(&url, "https://...");
    auto browser_radio = Radiobox(&browsers, &browser_index);
    auto enable_checkbox = Checkbox("Enable automatic sign-in", &enable_auto_login);
    auto disable_checkbox = Checkbox("Opt out of automatic sign-in", &disable_auto_login);
    auto build_input = Input(&build_str, "17763") | DigitsOnly();
    auto install_checkbox = Checkbox("Install browser if missing", &install_browser);
    auto credential_input = Input(&credential, "encrypted password file");
    auto task_input = Input(&task_name, "task name");

    auto save_button = Button("  Save  ", [&] {
        saved = true;
        screen.Exit();
    });
    auto cancel_button = Button(" Cancel ", [&] { screen.Exit(); });

    auto form = Container::Vertical({
        account_input,
        display_input,
        url_input,
        browser_radio,
        enable_checkbox,
        disable_checkbox,
        build_input,
        install_checkbox,
        credential_input,
        task_input,
        Container::Horizontal({save_button, cancel_button}),
    });
    form |= EscapeExits(screen);

    auto renderer = Renderer(form, [&] {
        auto label_width = 16;
        auto make_row = [&](const std::string& label, Element field) {
            return hbox({
                text(label) | size(WIDTH, EQUAL, label_width),
                field | flex,
            });
        };
        auto indent = [&](Element field) {
            return hbox({text("") | size(WIDTH, EQUAL, label_width), field});
        };

        return vbox({
                   text("Kiosk Settings") | bold | center,
                   separator(),
                   make_row("Account:", account_input->Render()),
                   make_row("Display name:", display_input->Render()),
                   make_row("URL:", url_input->Render()),
                   make_row("Browser:", browser_radio->Render()),
                   indent(enable_checkbox->Render()),
                   indent(disable_checkbox->Render()),
                   make_row("Minimum build:", build_input->Render()),
                   indent(install_checkbox->Render()),
                   make_row("Password file:", credential_input->Render()),
                   make_row("Task name:", task_input->Render()),
                   separator(),
                   hbox({
                       save_button->Render(),
                       text("  "),
                       cancel_button->Render(),
                   }) | center,
               }) |
               border | size(WIDTH, LESS_THAN, 72);
    });

    screen.Loop(renderer);

    if (!saved) {
        return std::nullopt;
    }

    KioskSettings edited = initial;
    edited.account_name = account;
    edited.account_display_name = display_name;
    edited.target_url = url;
    edited.browser = browser_index == 1 ? BrowserKind::Chrome : BrowserKind::Edge;
    edited.enable_auto_login = enable_auto_login;
    edited.disable_auto_login = disable_auto_login;
    edited.minimum_build_number = ParseBuildOrDefault(build_str, initial.minimum_build_number);
    edited.install_browser_if_missing = install_browser;
    edited.encrypted_credential_ref =
        credential.empty() ? std::nullopt : std::optional<std::string>(credential);
    edited.task_name = task_name;
    return edited;
}

std::optional<std::string> RunPasswordForm(const std::string& account_name) {
    using namespace ftxui;

    std::string password;
    std::string repeat;
    std::string problem;
    bool saved = false;

    auto screen = ScreenInteractive::FitComponent();

    InputOption password_opt;
    password_opt.password = true;
    auto password_input = Input(&password, "password", password_opt);
    auto repeat_input = Input(&repeat, "repeat", password_opt);

    auto save_button = Button("  Save  ", [&] {
        if (password.empty()) {
            problem = "Password must not be empty";
            return;
        }
        if (password != repeat) {
            problem = "Passwords do not match";
            repeat.clear();
            return;
        }
        saved = true;
        screen.Exit();
    });
    auto cancel_button = Button(" Cancel ", [&] { screen.Exit(); });

    auto form = Container::Vertical({
        password_input,
        repeat_input,
        Container::Horizontal({save_button, cancel_button}),
    });
    form |= EscapeExits(screen);

    auto renderer = Renderer(form, [&] {
        auto label_width = 12;
        auto make_row = [&](const std::string& label, Element field) {
            return hbox({
                text(label) | size(WIDTH, EQUAL, label_width),
                field | flex,
            });
        };

        Elements rows = {
            text("Password for " + account_name) | bold | center,
            separator(),
            make_row("Password:", password_input->Render()),
            make_row("Repeat:", repeat_input->Render()),
        };
        if (!problem.empty()) {
            rows.push_back(text(problem) | color(Color::Red));
        }
        rows.push_back(separator());
        rows.push_back(hbox({
                           save_button->Render(),
                           text("  "),
                           cancel_button->Render(),
                       }) | center);
        return vbox(std::move(rows)) | border | size(WIDTH, LESS_THAN, 60);
    });

    screen.Loop(renderer);

    if (!saved) {
        return std::nullopt;
    }
    return password;
}

} // namespace kiosk_provision
