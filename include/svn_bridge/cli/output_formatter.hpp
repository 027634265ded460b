#pragma once

#include <svn_bridge/core/result.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// OutputFormatter — human-readable and JSON output for CLI commands.
//
// In color mode (never together with JSON) tables are rendered with FTXUI
// and messages get ANSI escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Aligned table; in JSON mode an array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // "key: value" block under a title.
    void PrintDetail(const std::string& title,
                     const std::vector<std::pair<std::string, std::string>>& fields) const;

    // Print a serialized JSON document to stdout.
    void PrintJson(const std::string& json) const;

    // Print an error to stderr (JSON object in JSON mode).
    void PrintError(const Error& error) const;

    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

/// JSON document for an error: {"error": {"operation", "category",
/// "message", ...}}. Optional members are omitted when empty.
std::string ErrorToJson(const Error& error);

} // namespace svn_bridge
