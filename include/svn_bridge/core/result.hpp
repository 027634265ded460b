#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// Result<T, E> — holds either a value or an error.
//
// Parsers and the command runner return Result instead of throwing; an empty
// report that is a legitimate outcome is an Ok value, never an Err.
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

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(default_value);
    }

    [[nodiscard]] T ValueOr(T default_value) && {
        return IsOk() ? std::get<0>(std::move(storage_)) : std::move(default_value);
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
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
// Result<void, E> — for operations that succeed without a payload
// (svn add, revert, cleanup, ...).
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
// ErrorCategory — the error taxonomy callers switch on.
//
//   CommandExecution — the svn binary exited non-zero (stderr attached)
//   Parse            — malformed XML report (raw input attached)
//   EmptyInput       — empty report where no empty result exists (info)
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    CommandExecution,
    Parse,
    EmptyInput,
    Timeout,
    Cancelled,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// FailureKind — refinement of CommandExecution derived from the tool's own
// diagnostic text (see svn/stderr_classifier.hpp).
// ---------------------------------------------------------------------------
enum class FailureKind {
    Generic,
    Authentication,
    Conflict,
    Network,
    WorkingCopy,
};

// ---------------------------------------------------------------------------
// Error — the single error shape shared by the runner, every extractor and
// the facade.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    // CommandExecution
    std::optional<int> exit_code;
    std::string stderr_text;
    FailureKind failure = FailureKind::Generic;
    std::string failure_detail;              // realm, URL or path
    std::vector<std::string> conflicted_paths;

    // Parse
    std::optional<std::string> raw_input;
    std::optional<std::string> cause;

    /// Non-zero exit of the svn binary. The message is the captured stderr,
    /// or "exit code N" when the tool wrote nothing. The diagnostic is
    /// classified into a FailureKind.
    static Error CommandFailed(std::string operation, int exit_code,
                               std::string stderr_text);

    /// Structural failure while parsing a report. raw_input keeps the
    /// original text for replay in tests.
    static Error ParseFailure(std::string operation, std::string message,
                              std::string raw_input,
                              std::optional<std::string> cause = std::nullopt);

    static Error EmptyInput(std::string operation, std::string message);

    static Error Make(std::string operation, std::string message,
                      ErrorCategory category) {
        Error e;
        e.operation = std::move(operation);
        e.message = std::move(message);
        e.category = category;
        return e;
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::CommandExecution: return 1;
            case ErrorCategory::Parse:            return 2;
            case ErrorCategory::EmptyInput:       return 3;
            case ErrorCategory::Timeout:          return 4;
            case ErrorCategory::Cancelled:        return 5;
            case ErrorCategory::Config:           return 6;
            case ErrorCategory::Internal:         return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::CommandExecution: return "command_execution";
            case ErrorCategory::Parse:            return "parse";
            case ErrorCategory::EmptyInput:       return "empty_input";
            case ErrorCategory::Timeout:          return "timeout";
            case ErrorCategory::Cancelled:        return "cancelled";
            case ErrorCategory::Config:           return "config";
            case ErrorCategory::Internal:         return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string FailureName() const;

    [[nodiscard]] std::string ToString() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               message == other.message &&
               category == other.category &&
               exit_code == other.exit_code &&
               stderr_text == other.stderr_text &&
               failure == other.failure &&
               raw_input == other.raw_input &&
               cause == other.cause;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace svn_bridge
