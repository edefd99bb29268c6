#pragma once

#include <kiosk_provision/core/result.hpp>
#include <kiosk_provision/core/types.hpp>

#include <optional>
#include <string>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// AccountRequest: the kiosk account to create or reuse.
// `password` is plaintext only for the duration of the call; it comes from
// the decrypted credential artifact and must never be logged.
// ---------------------------------------------------------------------------
struct AccountRequest {
    AccountName name;
    std::string display_name;
    std::optional<std::string> password;
};

enum class AccountOutcome {
    Created,          // account did not exist and was created
    PasswordUpdated,  // account existed; credential re-attached
    AlreadyExists,    // account existed; nothing changed
};

// ---------------------------------------------------------------------------
// IAccountProvisioner: idempotent create-or-skip of an unprivileged local
// account. The account is only ever added to the local Users group.
// ---------------------------------------------------------------------------
class IAccountProvisioner {
public:
    virtual ~IAccountProvisioner() = default;

    IAccountProvisioner(const IAccountProvisioner&) = delete;
    IAccountProvisioner& operator=(const IAccountProvisioner&) = delete;
    IAccountProvisioner(IAccountProvisioner&&) = delete;
    IAccountProvisioner& operator=(IAccountProvisioner&&) = delete;

    [[nodiscard]] virtual Result<bool, Error> AccountExists(const AccountName& name) = 0;

    [[nodiscard]] virtual Result<AccountOutcome, Error> EnsureAccount(
        const AccountRequest& request) = 0;

protected:
    IAccountProvisioner() = default;
};

} // namespace kiosk_provision
