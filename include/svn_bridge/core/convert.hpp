#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace svn_bridge::convert {

// ---------------------------------------------------------------------------
// Validated conversions from loosely-typed report values.
//
// Every extractor funnels raw attribute/element text through these helpers,
// so a missing or malformed value turns into an explicit default instead of
// leaking into a typed field.
// ---------------------------------------------------------------------------

/// Strip leading/trailing ASCII whitespace.
std::string_view Trim(std::string_view value);

/// True if the value is absent or whitespace only.
bool IsBlank(const std::optional<std::string>& value);

/// The value, or default_value when absent. A present empty string is kept.
std::string StringOr(const std::optional<std::string>& value,
                     std::string_view default_value = "");

/// The value, or default_value when absent or blank.
std::string NonEmptyOr(const std::optional<std::string>& value,
                       std::string_view default_value);

/// Parse a base-10 integer. Surrounding whitespace is ignored; anything else
/// (sign-only, trailing garbage, fractions, overflow) yields nullopt.
std::optional<int64_t> ParseInt(std::string_view value);

/// ParseInt, or default_value when absent or not numeric.
int64_t IntOr(const std::optional<std::string>& value, int64_t default_value = 0);

/// Like IntOr, but negative numbers also fall back to default_value.
/// Used for revisions and sizes.
int64_t NonNegativeOr(const std::optional<std::string>& value,
                      int64_t default_value = 0);

/// nullopt when absent; otherwise the non-negative number or default_value.
std::optional<int64_t> OptionalNonNegative(const std::optional<std::string>& value,
                                           int64_t default_value = 0);

/// Parse "true"/"false"/"yes"/"no"/"1"/"0" (case-insensitive).
std::optional<bool> ParseBool(std::string_view value);

} // namespace svn_bridge::convert
