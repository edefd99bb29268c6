#pragma once

#include <kiosk_provision/platform/i_browser_locator.hpp>
#include <kiosk_provision/platform/i_process_runner.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kiosk_provision {

using PathExistsFn = std::function<bool(const std::string&)>;

/// Program Files, Program Files (x86) and the per-user LocalAppData root,
/// read from the environment with the stock Windows paths as fallbacks.
std::vector<std::string> DefaultSearchRoots();

/// Every location `kind` may be installed at under `roots`, in probe order.
std::vector<std::string> CandidatePaths(BrowserKind kind,
                                        const std::vector<std::string>& roots);

/// Command-line arguments that open `url` fullscreen in kiosk mode.
std::vector<std::string> BuildKioskArguments(BrowserKind kind, const std::string& url);

/// winget package identifier ("Microsoft.Edge", "Google.Chrome").
const char* WingetPackageId(BrowserKind kind);

// ---------------------------------------------------------------------------
// BrowserLocator: probes the well-known install locations and installs a
// missing browser through winget.
//
// The filesystem probe is injectable so tests never touch the disk.
// ---------------------------------------------------------------------------
class BrowserLocator : public IBrowserLocator {
public:
    explicit BrowserLocator(IProcessRunner& runner);
    BrowserLocator(IProcessRunner& runner,
                   std::vector<std::string> search_roots,
                   PathExistsFn path_exists);

    [[nodiscard]] std::optional<std::string> Locate(BrowserKind kind) override;

    [[nodiscard]] Result<void, Error> Install(BrowserKind kind) override;

private:
    IProcessRunner& runner_;
    std::vector<std::string> search_roots_;
    PathExistsFn path_exists_;
};

} // namespace kiosk_provision
