#include <svn_bridge/core/result.hpp>

#include <sstream>

namespace svn_bridge {

namespace {

// Drop trailing newlines the tool appends to its diagnostics.
std::string TrimTrailingNewlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // anonymous namespace

Error Error::CommandFailed(std::string operation, int exit_code,
                           std::string stderr_text) {
    Error e;
    e.operation = std::move(operation);
    e.category = ErrorCategory::CommandExecution;
    e.exit_code = exit_code;
    auto trimmed = TrimTrailingNewlines(stderr_text);
    e.message = trimmed.empty()
        ? "exit code " + std::to_string(exit_code)
        : std::move(trimmed);
    e.stderr_text = std::move(stderr_text);
    return e;
}

Error Error::ParseFailure(std::string operation, std::string message,
                          std::string raw_input,
                          std::optional<std::string> cause) {
    Error e;
    e.operation = std::move(operation);
    e.message = std::move(message);
    e.category = ErrorCategory::Parse;
    e.raw_input = std::move(raw_input);
    e.cause = std::move(cause);
    return e;
}

Error Error::EmptyInput(std::string operation, std::string message) {
    return Make(std::move(operation), std::move(message),
                ErrorCategory::EmptyInput);
}

std::string Error::FailureName() const {
    switch (failure) {
        case FailureKind::Generic:        return "generic";
        case FailureKind::Authentication: return "authentication";
        case FailureKind::Conflict:       return "conflict";
        case FailureKind::Network:        return "network";
        case FailureKind::WorkingCopy:    return "working_copy";
    }
    return "generic";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (exit_code.has_value()) {
        oss << " (exit " << *exit_code << ")";
    }
    oss << ": " << message;
    if (cause.has_value() && !cause->empty()) {
        oss << " [" << *cause << "]";
    }
    return oss.str();
}

} // namespace svn_bridge
