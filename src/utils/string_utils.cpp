/**
 * @file string_utils.cpp
 * @brief Implementation of sandbox string helpers
 *
 * **Truncation Format**:
 * ```
 * <first max_chars bytes>\n... (truncated, <original bytes> total chars)
 * ```
 *
 * **Path Normalization**:
 * Purely lexical, mirrors POSIX normpath semantics:
 * - "/workspace/./a//b"    -> "/workspace/a/b"
 * - "/workspace/a/../b"    -> "/workspace/b"
 * - "/../etc/passwd"       -> "/etc/passwd"
 * - "a/../../b"            -> "../b"
 *
 * @date 2026
 */

#include "sandkit/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace sandkit {
namespace utils {

// ============================================================================
// BASIC MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << strings[i];
    }
    return oss.str();
}

std::string StringUtils::ReplaceAll(const std::string& str, const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return ToLower(str).find(ToLower(substring)) != std::string::npos;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    return str.substr(0, max_length) + suffix;
}

// ============================================================================
// SHELL QUOTING
// ============================================================================

std::string StringUtils::ShellQuote(const std::string& str) {
    std::string quoted;
    quoted.reserve(str.size() + 2);
    quoted += '\'';
    for (char c : str) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

// ============================================================================
// OUTPUT TRUNCATION
// ============================================================================

std::string StringUtils::TruncationMarker(std::size_t original_length) {
    return "\n... (truncated, " + std::to_string(original_length) + " total chars)";
}

bool StringUtils::IsTruncatedOutput(const std::string& text, std::size_t max_chars) {
    if (text.size() <= max_chars) {
        return false;
    }

    static const std::regex marker_regex(R"(^\n\.\.\. \(truncated, (\d+) total chars\)$)");

    std::string tail = text.substr(max_chars);
    std::smatch match;
    if (!std::regex_match(tail, match, marker_regex)) {
        return false;
    }

    // The recorded original length must exceed what was kept
    try {
        return std::stoull(match[1].str()) > max_chars;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string StringUtils::TruncateOutput(const std::string& text, std::size_t max_chars) {
    if (text.size() <= max_chars || IsTruncatedOutput(text, max_chars)) {
        return text;
    }
    return text.substr(0, max_chars) + TruncationMarker(text.size());
}

// ============================================================================
// POSIX PATHS
// ============================================================================

std::string StringUtils::NormalizePosixPath(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    const bool absolute = path[0] == '/';
    std::vector<std::string> components;

    for (const auto& part : Split(path, '/')) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!components.empty() && components.back() != "..") {
                components.pop_back();
            } else if (!absolute) {
                components.push_back(part);
            }
            // ".." above the root of an absolute path stays at the root
            continue;
        }
        components.push_back(part);
    }

    std::string joined = Join(components, "/");
    if (absolute) {
        return "/" + joined;
    }
    return joined.empty() ? "." : joined;
}

bool StringUtils::IsWithinRoot(const std::string& normalized_path, const std::string& root) {
    if (normalized_path == root) {
        return true;
    }
    if (root == "/") {
        return StartsWith(normalized_path, "/");
    }
    return StartsWith(normalized_path, root) &&
           normalized_path.size() > root.size() &&
           normalized_path[root.size()] == '/';
}

std::string StringUtils::ParentPath(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::string StringUtils::BaseName(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

} // namespace utils
} // namespace sandkit
