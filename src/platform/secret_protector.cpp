#include <kiosk_provision/platform/secret_protector.hpp>

#include <kiosk_provision/core/log.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <system_error>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#include <wincrypt.h>
#else
#include <sys/stat.h>
#endif

namespace kiosk_provision {

namespace {

constexpr const char* kComponent = "secret";
constexpr const char* kArtifactFormat = "kiosk-provision-credential";
constexpr int kArtifactVersion = 1;

Error SecretError(std::string operation, std::string target, std::string message,
                  std::optional<std::string> hint = std::nullopt) {
    return Error{std::move(operation), std::move(target), std::nullopt,
                 std::move(message), std::move(hint), ErrorCategory::Secret};
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// ---------------------------------------------------------------------------
// DpapiSecretProtector
// ---------------------------------------------------------------------------
#ifdef _WIN32

Result<std::vector<uint8_t>, Error> DpapiSecretProtector::Protect(std::string_view plaintext) {
    DATA_BLOB in{};
    in.pbData = reinterpret_cast<BYTE*>(const_cast<char*>(plaintext.data()));
    in.cbData = static_cast<DWORD>(plaintext.size());
    DATA_BLOB out{};

    if (!CryptProtectData(&in, L"kiosk-provision", nullptr, nullptr, nullptr,
                          CRYPTPROTECT_UI_FORBIDDEN, &out)) {
        return Result<std::vector<uint8_t>, Error>::Err(SecretError(
            "ProtectSecret", "", "CryptProtectData failed (" +
                                     std::to_string(GetLastError()) + ")"));
    }
    std::vector<uint8_t> blob(out.pbData, out.pbData + out.cbData);
    LocalFree(out.pbData);
    return Result<std::vector<uint8_t>, Error>::Ok(std::move(blob));
}

Result<std::string, Error> DpapiSecretProtector::Unprotect(const std::vector<uint8_t>& blob) {
    DATA_BLOB in{};
    in.pbData = const_cast<BYTE*>(blob.data());
    in.cbData = static_cast<DWORD>(blob.size());
    DATA_BLOB out{};

    if (!CryptUnprotectData(&in, nullptr, nullptr, nullptr, nullptr,
                            CRYPTPROTECT_UI_FORBIDDEN, &out)) {
        return Result<std::string, Error>::Err(SecretError(
            "UnprotectSecret", "",
            "CryptUnprotectData failed (" + std::to_string(GetLastError()) + ")",
            std::string("The credential can only be decrypted by the account that "
                        "created it; re-run encrypt-password as that account")));
    }
    std::string plaintext(reinterpret_cast<const char*>(out.pbData), out.cbData);
    SecureZeroMemory(out.pbData, out.cbData);
    LocalFree(out.pbData);
    return Result<std::string, Error>::Ok(std::move(plaintext));
}

#else

Result<std::vector<uint8_t>, Error> DpapiSecretProtector::Protect(std::string_view) {
    return Result<std::vector<uint8_t>, Error>::Err(Error{
        "ProtectSecret", "", std::nullopt,
        "the Windows data protection API is not available on this platform",
        std::nullopt, ErrorCategory::Unsupported});
}

Result<std::string, Error> DpapiSecretProtector::Unprotect(const std::vector<uint8_t>&) {
    return Result<std::string, Error>::Err(Error{
        "UnprotectSecret", "", std::nullopt,
        "the Windows data protection API is not available on this platform",
        std::nullopt, ErrorCategory::Unsupported});
}

#endif

// ---------------------------------------------------------------------------
// Hex
// ---------------------------------------------------------------------------
std::string HexEncode(const std::vector<uint8_t>& bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

Result<std::vector<uint8_t>, std::string> HexDecode(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, std::string>::Err("odd number of hex digits");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = HexValue(hex[i]);
        const int lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Result<std::vector<uint8_t>, std::string>::Err(
                "invalid hex digit at offset " + std::to_string(hi < 0 ? i : i + 1));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return Result<std::vector<uint8_t>, std::string>::Ok(std::move(bytes));
}

// ---------------------------------------------------------------------------
// Credential artifact
// ---------------------------------------------------------------------------
Result<void, Error> WriteCredentialArtifact(ISecretProtector& protector,
                                            const std::string& path,
                                            std::string_view plaintext) {
    if (plaintext.empty()) {
        return Result<void, Error>::Err(
            SecretError("WriteCredential", path, "password is empty"));
    }

    auto blob = protector.Protect(plaintext);
    if (blob.IsErr()) {
        auto error = std::move(blob).Error();
        error.target = path;
        return Result<void, Error>::Err(std::move(error));
    }

    nlohmann::ordered_json j;
    j["format"] = kArtifactFormat;
    j["version"] = kArtifactVersion;
    j["protection"] = "dpapi-user";
    j["blob"] = HexEncode(blob.Value());

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        return Result<void, Error>::Err(
            SecretError("WriteCredential", path, "cannot open file for writing"));
    }
    ofs << j.dump(2) << "\n";
    ofs.close();
    if (!ofs) {
        return Result<void, Error>::Err(
            SecretError("WriteCredential", path, "write failed"));
    }

#ifndef _WIN32
    // Owner read/write only (chmod 600).
    chmod(path.c_str(), S_IRUSR | S_IWUSR);
#endif
    LogInfo(kComponent, "Wrote credential artifact " + path);
    return Result<void, Error>::Ok();
}

Result<std::string, Error> ReadCredentialArtifact(ISecretProtector& protector,
                                                  const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Result<std::string, Error>::Err(
            SecretError("ReadCredential", path, "cannot open credential artifact",
                        std::string("Create it with: kiosk-provision encrypt-password --out ") +
                            path));
    }

    std::vector<uint8_t> blob;
    try {
        auto j = nlohmann::json::parse(ifs);
        if (!j.is_object() || j.value("format", "") != kArtifactFormat) {
            return Result<std::string, Error>::Err(
                SecretError("ReadCredential", path, "not a kiosk-provision credential artifact"));
        }
        if (j.value("version", 0) != kArtifactVersion) {
            return Result<std::string, Error>::Err(SecretError(
                "ReadCredential", path,
                "unsupported artifact version " + std::to_string(j.value("version", 0))));
        }
        auto decoded = HexDecode(j.value("blob", ""));
        if (decoded.IsErr()) {
            return Result<std::string, Error>::Err(
                SecretError("ReadCredential", path, "corrupt blob: " + decoded.Error()));
        }
        blob = std::move(decoded).Value();
    } catch (const nlohmann::json::exception& e) {
        return Result<std::string, Error>::Err(
            SecretError("ReadCredential", path, std::string("invalid JSON: ") + e.what()));
    }

    if (blob.empty()) {
        return Result<std::string, Error>::Err(
            SecretError("ReadCredential", path, "credential blob is empty"));
    }

    auto plaintext = protector.Unprotect(blob);
    if (plaintext.IsErr()) {
        auto error = std::move(plaintext).Error();
        error.target = path;
        return Result<std::string, Error>::Err(std::move(error));
    }
    LogDebug(kComponent, "Decrypted credential artifact " + path);
    return plaintext;
}

bool CredentialArtifactExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace kiosk_provision
