#include <svn_bridge/cli/output_formatter.hpp>
#include <svn_bridge/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace svn_bridge {

namespace {

using namespace svn_bridge::ansi;

} // anonymous namespace

std::string ErrorToJson(const Error& error) {
    nlohmann::json body;
    body["operation"] = error.operation;
    body["category"] = error.CategoryName();
    body["message"] = error.message;
    if (error.exit_code.has_value()) {
        body["exit_code"] = *error.exit_code;
    }
    if (error.category == ErrorCategory::CommandExecution) {
        body["failure"] = error.FailureName();
        if (!error.failure_detail.empty()) {
            body["detail"] = error.failure_detail;
        }
        if (!error.conflicted_paths.empty()) {
            body["conflicted_paths"] = error.conflicted_paths;
        }
        if (!error.stderr_text.empty()) {
            body["stderr"] = error.stderr_text;
        }
    }
    if (error.cause.has_value()) {
        body["cause"] = *error.cause;
    }
    nlohmann::json j;
    j["error"] = body;
    return j.dump();
}

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            j.push_back(std::move(obj));
        }
        out_ << j.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.reserve(rows.size() + 1);
        table_data.push_back(headers);
        table_data.insert(table_data.end(), rows.begin(), rows.end());

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& row) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            // No padding after the last column.
            if (c + 1 == headers.size()) {
                out_ << row[c];
            } else {
                out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
            }
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<std::pair<std::string, std::string>>& fields) const {
    if (json_mode_) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [key, value] : fields) {
            j[key] = value;
        }
        out_ << j.dump() << "\n";
        return;
    }

    size_t width = 0;
    for (const auto& field : fields) {
        width = std::max(width, field.first.size());
    }

    if (color_mode_) {
        out_ << kBold << title << kReset << "\n";
    } else {
        out_ << title << "\n";
    }
    for (const auto& [key, value] : fields) {
        out_ << "  ";
        if (color_mode_) out_ << kDim;
        out_ << std::left << std::setw(static_cast<int>(width + 1)) << (key + ":");
        if (color_mode_) out_ << kReset;
        out_ << " " << value << "\n";
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << ErrorToJson(error) << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << kBold << error.operation << kReset;
    } else {
        err_ << "Error: " << error.operation;
    }
    if (error.exit_code.has_value()) {
        err_ << " (exit " << *error.exit_code << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";

    if (error.category == ErrorCategory::CommandExecution &&
        error.failure != FailureKind::Generic) {
        if (color_mode_) err_ << "  " << kYellow << "Kind: " << kReset;
        else err_ << "  Kind: ";
        err_ << error.FailureName();
        if (!error.failure_detail.empty()) {
            err_ << " (" << error.failure_detail << ")";
        }
        err_ << "\n";
        for (const auto& path : error.conflicted_paths) {
            err_ << "  Conflict: " << path << "\n";
        }
    }
    if (error.cause.has_value()) {
        if (color_mode_) err_ << "  " << kDim << "Cause: " << kReset;
        else err_ << "  Cause: ";
        err_ << *error.cause << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json j;
        j["success"] = true;
        j["message"] = message;
        out_ << j.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace svn_bridge
