#include <svn_bridge/svn/stderr_classifier.hpp>

#include <svn_bridge/core/convert.hpp>

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace svn_bridge {

namespace {

std::string Lower(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool ContainsAny(const std::string& haystack,
                 std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) {
        return haystack.find(n) != std::string::npos;
    });
}

// Value after "<label>:" up to end of line, e.g. "realm: <https://x> Repo".
std::string LabelValue(std::string_view text, const std::string& lower,
                       std::string_view label) {
    auto pos = lower.find(label);
    if (pos == std::string::npos) return {};
    pos += label.size();
    if (pos >= text.size() || text[pos] != ':') return {};
    ++pos;
    auto end = text.find('\n', pos);
    auto value = text.substr(pos, end == std::string_view::npos ? end : end - pos);
    return std::string(convert::Trim(value));
}

bool IsPathDelimiter(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'';
}

std::string FirstUrl(std::string_view text, const std::string& lower) {
    for (std::string_view scheme : {"https://", "http://"}) {
        auto pos = lower.find(scheme);
        if (pos == std::string::npos) continue;
        auto end = pos;
        while (end < text.size() && !IsPathDelimiter(text[end])) ++end;
        return std::string(text.substr(pos, end - pos));
    }
    return {};
}

// Absolute POSIX paths and drive-letter paths, de-duplicated, order kept.
std::vector<std::string> ExtractPaths(std::string_view text) {
    std::vector<std::string> paths;
    size_t i = 0;
    while (i < text.size()) {
        const bool at_boundary = i == 0 || IsPathDelimiter(text[i - 1]);
        const bool posix = text[i] == '/';
        const bool drive = i + 2 < text.size() &&
            std::isalpha(static_cast<unsigned char>(text[i])) &&
            text[i + 1] == ':' && text[i + 2] == '\\';
        if (at_boundary && (posix || drive)) {
            auto end = i;
            while (end < text.size() && !IsPathDelimiter(text[end])) ++end;
            std::string path(text.substr(i, end - i));
            // Strip trailing punctuation such as "'/wc/a.txt'." endings.
            while (!path.empty() && (path.back() == '.' || path.back() == ',' ||
                                     path.back() == ':')) {
                path.pop_back();
            }
            if (path.size() > 1 &&
                std::find(paths.begin(), paths.end(), path) == paths.end()) {
                paths.push_back(std::move(path));
            }
            i = end;
            continue;
        }
        ++i;
    }
    return paths;
}

} // anonymous namespace

StderrClassification ClassifyStderr(std::string_view stderr_text) {
    StderrClassification out;
    const auto trimmed = convert::Trim(stderr_text);
    if (trimmed.empty()) {
        out.summary = "Unknown svn error";
        return out;
    }
    out.summary = std::string(trimmed.substr(0, trimmed.find('\n')));

    const auto lower = Lower(stderr_text);
    if (ContainsAny(lower, {"authentication", "authorization", "access forbidden"})) {
        out.kind = FailureKind::Authentication;
        out.detail = LabelValue(stderr_text, lower, "realm");
    } else if (lower.find("conflict") != std::string::npos) {
        out.kind = FailureKind::Conflict;
        out.conflicted_paths = ExtractPaths(stderr_text);
    } else if (ContainsAny(lower, {"connection", "network", "timeout", "host"})) {
        out.kind = FailureKind::Network;
        out.detail = FirstUrl(stderr_text, lower);
    } else if (ContainsAny(lower, {"working copy", "locked", "cleanup"})) {
        out.kind = FailureKind::WorkingCopy;
        out.detail = LabelValue(stderr_text, lower, "path");
    }
    return out;
}

void ApplyStderrClassification(Error& error) {
    if (error.category != ErrorCategory::CommandExecution) {
        return;
    }
    auto classification = ClassifyStderr(error.stderr_text);
    error.failure = classification.kind;
    error.failure_detail = std::move(classification.detail);
    error.conflicted_paths = std::move(classification.conflicted_paths);
}

} // namespace svn_bridge
