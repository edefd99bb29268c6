#include <kiosk_provision/platform/browser_locator.hpp>

#include <kiosk_provision/core/log.hpp>
#include <kiosk_provision/core/terminal.hpp>

#include <filesystem>
#include <system_error>

namespace kiosk_provision {

namespace {

constexpr const char* kComponent = "browser";

const char* RelativeExecutable(BrowserKind kind) {
    switch (kind) {
        case BrowserKind::Edge:   return "Microsoft\\Edge\\Application\\msedge.exe";
        case BrowserKind::Chrome: return "Google\\Chrome\\Application\\chrome.exe";
    }
    return "";
}

std::string JoinPath(const std::string& root, const std::string& relative) {
    if (root.empty()) return relative;
    const char last = root.back();
    if (last == '\\' || last == '/') return root + relative;
    return root + "\\" + relative;
}

bool FileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string EnvOr(const char* name, const char* fallback) {
    auto value = GetEnv(name);
    return value.empty() ? std::string(fallback) : value;
}

Error InstallError(BrowserKind kind, std::string message, std::optional<std::string> hint) {
    return Error{"InstallBrowser", BrowserKindName(kind), std::nullopt,
                 std::move(message), std::move(hint), ErrorCategory::Install};
}

} // namespace

std::vector<std::string> DefaultSearchRoots() {
    std::vector<std::string> roots;
    roots.push_back(EnvOr("ProgramFiles", "C:\\Program Files"));
    roots.push_back(EnvOr("ProgramFiles(x86)", "C:\\Program Files (x86)"));
    auto local = GetEnv("LOCALAPPDATA");
    if (!local.empty()) {
        roots.push_back(local);
    }
    return roots;
}

std::vector<std::string> CandidatePaths(BrowserKind kind,
                                        const std::vector<std::string>& roots) {
    std::vector<std::string> paths;
    paths.reserve(roots.size());
    for (const auto& root : roots) {
        paths.push_back(JoinPath(root, RelativeExecutable(kind)));
    }
    return paths;
}

std::vector<std::string> BuildKioskArguments(BrowserKind kind, const std::string& url) {
    switch (kind) {
        case BrowserKind::Edge:
            return {"--kiosk", url, "--edge-kiosk-type=fullscreen", "--no-first-run"};
        case BrowserKind::Chrome:
            return {"--kiosk", url, "--no-first-run", "--noerrdialogs", "--disable-infobars"};
    }
    return {"--kiosk", url};
}

const char* WingetPackageId(BrowserKind kind) {
    switch (kind) {
        case BrowserKind::Edge:   return "Microsoft.Edge";
        case BrowserKind::Chrome: return "Google.Chrome";
    }
    return "";
}

// ---------------------------------------------------------------------------
// BrowserLocator
// ---------------------------------------------------------------------------
BrowserLocator::BrowserLocator(IProcessRunner& runner)
    : BrowserLocator(runner, DefaultSearchRoots(), FileExists) {}

BrowserLocator::BrowserLocator(IProcessRunner& runner,
                               std::vector<std::string> search_roots,
                               PathExistsFn path_exists)
    : runner_(runner),
      search_roots_(std::move(search_roots)),
      path_exists_(std::move(path_exists)) {}

std::optional<std::string> BrowserLocator::Locate(BrowserKind kind) {
    for (const auto& candidate : CandidatePaths(kind, search_roots_)) {
        if (path_exists_(candidate)) {
            LogDebug(kComponent, std::string(BrowserKindName(kind)) + " found at " + candidate);
            return candidate;
        }
        LogDebug(kComponent, "not at " + candidate);
    }
    LogInfo(kComponent, std::string(BrowserKindName(kind)) + " is not installed");
    return std::nullopt;
}

Result<void, Error> BrowserLocator::Install(BrowserKind kind) {
    auto probe = runner_.Run("winget", {"--version"});
    if (probe.IsErr() || probe.Value().exit_code != 0) {
        return Result<void, Error>::Err(InstallError(
            kind, "winget is not available",
            std::string("Install ") + BrowserKindName(kind) +
                " manually, or install App Installer from the Microsoft Store"));
    }

    LogInfo(kComponent, std::string("Installing ") + BrowserKindName(kind) + " with winget");
    auto run = runner_.Run("winget", {"install", "--id", WingetPackageId(kind), "--exact",
                                      "--silent", "--accept-package-agreements",
                                      "--accept-source-agreements", "--scope", "machine"});
    if (run.IsErr()) {
        auto error = std::move(run).Error();
        error.operation = "InstallBrowser";
        error.category = ErrorCategory::Install;
        return Result<void, Error>::Err(std::move(error));
    }
    if (run.Value().exit_code != 0) {
        return Result<void, Error>::Err(Error::FromProcessExit(
            "InstallBrowser", WingetPackageId(kind), run.Value().exit_code,
            run.Value().output, ErrorCategory::Install));
    }
    return Result<void, Error>::Ok();
}

} // namespace kiosk_provision
