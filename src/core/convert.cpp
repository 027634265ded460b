#include <svn_bridge/core/convert.hpp>

#include <cctype>
#include <limits>

namespace svn_bridge::convert {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string Lower(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // anonymous namespace

std::string_view Trim(std::string_view value) {
    while (!value.empty() && IsSpace(value.front())) value.remove_prefix(1);
    while (!value.empty() && IsSpace(value.back())) value.remove_suffix(1);
    return value;
}

bool IsBlank(const std::optional<std::string>& value) {
    return !value.has_value() || Trim(*value).empty();
}

std::string StringOr(const std::optional<std::string>& value,
                     std::string_view default_value) {
    if (!value.has_value()) {
        return std::string(default_value);
    }
    return *value;
}

std::string NonEmptyOr(const std::optional<std::string>& value,
                       std::string_view default_value) {
    if (IsBlank(value)) {
        return std::string(default_value);
    }
    return *value;
}

std::optional<int64_t> ParseInt(std::string_view value) {
    value = Trim(value);
    if (value.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    if (value.front() == '+' || value.front() == '-') {
        negative = value.front() == '-';
        value.remove_prefix(1);
        if (value.empty()) {
            return std::nullopt;
        }
    }

    constexpr auto kMax = std::numeric_limits<int64_t>::max();
    int64_t result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const int digit = c - '0';
        if (result > (kMax - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    return negative ? -result : result;
}

int64_t IntOr(const std::optional<std::string>& value, int64_t default_value) {
    if (!value.has_value()) {
        return default_value;
    }
    auto parsed = ParseInt(*value);
    return parsed.has_value() ? *parsed : default_value;
}

int64_t NonNegativeOr(const std::optional<std::string>& value,
                      int64_t default_value) {
    auto number = IntOr(value, default_value);
    return number < 0 ? default_value : number;
}

std::optional<int64_t> OptionalNonNegative(const std::optional<std::string>& value,
                                           int64_t default_value) {
    if (!value.has_value()) {
        return std::nullopt;
    }
    return NonNegativeOr(value, default_value);
}

std::optional<bool> ParseBool(std::string_view value) {
    const auto lower = Lower(Trim(value));
    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    return std::nullopt;
}

} // namespace svn_bridge::convert
