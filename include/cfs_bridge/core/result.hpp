#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cfs_bridge {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access (const&) ----------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    // -- Access (&&) --------------------------------------------------------

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

    // -- Monadic: AndThen ---------------------------------------------------
    // fn: T -> Result<U, E>

    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
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
// Result<void, E> — specialization for operations that succeed with no value.
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
// ErrorCategory — classifies bridge failures so callers can pick a recovery
// policy per kind.
//
//   Transport        cannot connect, peer closed, read timeout; connection
//                    is faulted and rebuilt on the next call
//   Protocol         reply is not valid JSON or misses required fields;
//                    connection is faulted
//   Application      remote status != 0; connection stays healthy
//   SafetyViolation  missing/incorrect confirmation token; nothing was sent
//   InvalidArgument  tool arguments rejected before encoding
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Transport,
    Protocol,
    Application,
    SafetyViolation,
    InvalidArgument,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error type for bridge operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> remote_status;
    std::string message;
    std::optional<std::string> remote_error;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<int> sys_errno;

    /// Error for a response envelope whose status is non-zero. The remote
    /// error text is kept verbatim; "Unknown error" when the endpoint sent none.
    static Error FromRemoteStatus(const std::string& operation,
                                  const std::string& endpoint,
                                  int status,
                                  const std::optional<std::string>& remote_error);

    /// Error for a failed OS call; message gets strerror(errnum) appended.
    static Error FromErrno(const std::string& operation,
                           const std::string& endpoint,
                           const std::string& message,
                           int errnum);

    [[nodiscard]] bool IsTransport() const noexcept {
        return category == ErrorCategory::Transport;
    }

    // Errors after which the connection must be torn down and rebuilt.
    [[nodiscard]] bool FaultsConnection() const noexcept {
        return category == ErrorCategory::Transport ||
               category == ErrorCategory::Protocol;
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Transport:       return 1;
            case ErrorCategory::Protocol:        return 2;
            case ErrorCategory::Application:     return 3;
            case ErrorCategory::SafetyViolation: return 4;
            case ErrorCategory::InvalidArgument: return 5;
            case ErrorCategory::Config:          return 6;
            case ErrorCategory::Internal:        return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Transport:       return "transport";
            case ErrorCategory::Protocol:        return "protocol";
            case ErrorCategory::Application:     return "application";
            case ErrorCategory::SafetyViolation: return "safety_violation";
            case ErrorCategory::InvalidArgument: return "invalid_argument";
            case ErrorCategory::Config:          return "config";
            case ErrorCategory::Internal:        return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const;

    // Machine-readable form used in tool results and --json style output.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               remote_status == other.remote_status &&
               message == other.message &&
               remote_error == other.remote_error &&
               category == other.category &&
               sys_errno == other.sys_errno;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace cfs_bridge
