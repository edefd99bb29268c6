#pragma once

#include <kiosk_provision/platform/i_secret_protector.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// DpapiSecretProtector: Windows Data Protection API, current-user scope.
// Only the account that protected a blob can unprotect it. On other
// platforms both operations return an Unsupported error.
// ---------------------------------------------------------------------------
class DpapiSecretProtector : public ISecretProtector {
public:
    DpapiSecretProtector() = default;

    [[nodiscard]] Result<std::vector<uint8_t>, Error> Protect(
        std::string_view plaintext) override;

    [[nodiscard]] Result<std::string, Error> Unprotect(
        const std::vector<uint8_t>& blob) override;
};

std::string HexEncode(const std::vector<uint8_t>& bytes);

/// Lower- or upper-case hex, even length. Err on any other character.
Result<std::vector<uint8_t>, std::string> HexDecode(std::string_view hex);

// ---------------------------------------------------------------------------
// Credential artifact: a small JSON file holding the protected blob:
//
//   {"format": "kiosk-provision-credential", "version": 1,
//    "protection": "dpapi-user", "blob": "<hex>"}
//
// Plaintext is held only for the duration of the call and is never written
// to disk or logged.
// ---------------------------------------------------------------------------

[[nodiscard]] Result<void, Error> WriteCredentialArtifact(ISecretProtector& protector,
                                                          const std::string& path,
                                                          std::string_view plaintext);

[[nodiscard]] Result<std::string, Error> ReadCredentialArtifact(ISecretProtector& protector,
                                                                const std::string& path);

/// True when `path` names an existing regular file.
bool CredentialArtifactExists(const std::string& path);

} // namespace kiosk_provision
