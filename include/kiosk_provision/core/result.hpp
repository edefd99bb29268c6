#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace kiosk_provision {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies errors for exit codes and structured output.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Usage,                 // bad command line
    Config,                // unreadable / invalid settings
    Aborted,               // operator declined to continue
    ConfirmationRequired,  // auto-login opt-out needs --confirm
    Account,               // account creation failed
    AutoLogin,             // Winlogon values could not be written
    HostInfo,              // OS build could not be determined
    BrowserNotFound,       // no browser executable, no installer
    Install,               // installer ran and failed
    Scheduling,            // scheduled task registration failed
    Secret,                // credential artifact could not be produced/read
    Process,               // child process could not be started
    Unsupported,           // operation not available on this platform
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error type for provisioning operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;                 // account, path or task the op acted on
    std::optional<int> exit_code;       // child process exit code, if any
    std::string message;
    std::optional<std::string> hint;    // remediation shown to the operator
    ErrorCategory category = ErrorCategory::Internal;

    /// Create an Error from a failed child process. Picks the most useful
    /// line of the captured output and attaches a hint for well-known
    /// Windows failures (access denied, command not found).
    static Error FromProcessExit(const std::string& operation,
                                 const std::string& target,
                                 int exit_code,
                                 const std::string& output,
                                 ErrorCategory category);

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Aborted:              return 1;
            case ErrorCategory::Usage:                return 2;
            case ErrorCategory::Config:               return 2;
            case ErrorCategory::Account:              return 3;
            case ErrorCategory::ConfirmationRequired: return 4;
            case ErrorCategory::Secret:               return 5;
            case ErrorCategory::Unsupported:          return 5;
            case ErrorCategory::BrowserNotFound:      return 6;
            case ErrorCategory::Install:              return 6;
            case ErrorCategory::AutoLogin:            return 99;
            case ErrorCategory::HostInfo:             return 99;
            case ErrorCategory::Scheduling:           return 99;
            case ErrorCategory::Process:              return 99;
            case ErrorCategory::Internal:             return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Usage:                return "usage";
            case ErrorCategory::Config:               return "config";
            case ErrorCategory::Aborted:              return "aborted";
            case ErrorCategory::ConfirmationRequired: return "confirmation_required";
            case ErrorCategory::Account:              return "account";
            case ErrorCategory::AutoLogin:            return "auto_login";
            case ErrorCategory::HostInfo:             return "host_info";
            case ErrorCategory::BrowserNotFound:      return "browser_not_found";
            case ErrorCategory::Install:              return "install";
            case ErrorCategory::Scheduling:           return "scheduling";
            case ErrorCategory::Secret:               return "secret";
            case ErrorCategory::Process:              return "process";
            case ErrorCategory::Unsupported:          return "unsupported";
            case ErrorCategory::Internal:             return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               exit_code == other.exit_code &&
               message == other.message &&
               hint == other.hint &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace kiosk_provision
