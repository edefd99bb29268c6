#pragma once

#include <kiosk_provision/core/result.hpp>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// IHostInfo: facts about the machine being provisioned.
// ---------------------------------------------------------------------------
class IHostInfo {
public:
    virtual ~IHostInfo() = default;

    IHostInfo(const IHostInfo&) = delete;
    IHostInfo& operator=(const IHostInfo&) = delete;
    IHostInfo(IHostInfo&&) = delete;
    IHostInfo& operator=(IHostInfo&&) = delete;

    // OS build number (e.g. 19045).
    [[nodiscard]] virtual Result<int, Error> BuildNumber() = 0;

protected:
    IHostInfo() = default;
};

} // namespace kiosk_provision
