#pragma once

#include <kiosk_provision/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// ISecretProtector: encrypts secrets so that only the identity that
// protected them can recover them.
// ---------------------------------------------------------------------------
class ISecretProtector {
public:
    virtual ~ISecretProtector() = default;

    ISecretProtector(const ISecretProtector&) = delete;
    ISecretProtector& operator=(const ISecretProtector&) = delete;
    ISecretProtector(ISecretProtector&&) = delete;
    ISecretProtector& operator=(ISecretProtector&&) = delete;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, Error> Protect(
        std::string_view plaintext) = 0;

    [[nodiscard]] virtual Result<std::string, Error> Unprotect(
        const std::vector<uint8_t>& blob) = 0;

protected:
    ISecretProtector() = default;
};

} // namespace kiosk_provision
