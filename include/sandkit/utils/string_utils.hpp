/**
 * @file string_utils.hpp
 * @brief String helpers shared by the sandbox backends and the tool layer
 *
 * Provides the small set of string operations the sandbox core relies on:
 * trimming and splitting command output, POSIX shell quoting for commands
 * handed to an isolated environment, bounded output truncation, and
 * component-aware POSIX path normalization used by path validation.
 *
 * @date 2026
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace sandkit {
namespace utils {

/**
 * @class StringUtils
 * @brief String utilities for sandbox command and path handling
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * // Build a command that survives arbitrary user input
 * std::string cmd = "mkdir -p " + StringUtils::ShellQuote(dir);
 *
 * // Bound what flows back to the caller
 * std::string out = StringUtils::TruncateOutput(result.GetStdout(), 16000);
 *
 * // Component-aware containment check
 * auto normalized = StringUtils::NormalizePosixPath("/workspace/a/../b");
 * bool inside = StringUtils::IsWithinRoot(normalized, "/workspace");
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     **************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     * @param str Input string
     * @param delimiter Delimiter character
     * @return Vector of non-empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     * @param strings Strings to join
     * @param delimiter Delimiter placed between elements
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace all occurrences of a substring
     * @param str Input string
     * @param from Substring to replace (must not be empty)
     * @param to Replacement
     * @return Resulting string
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Case-insensitive substring search
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /**
     * @brief Shorten a string for log output
     * @param str Input string
     * @param max_length Maximum characters kept
     * @param suffix Appended when shortened
     * @return Preview string
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");

    /***************************************************************************
     * Shell Quoting
     **************************************************************************/

    /**
     * @brief Quote a string as a single POSIX shell word
     *
     * Wraps the input in single quotes and rewrites embedded single quotes
     * as `'"'"'`, so the result is always interpreted literally by sh/bash.
     *
     * @param str Arbitrary input
     * @return Shell-safe single word
     *
     * **Example**:
     * @code
     * StringUtils::ShellQuote("it's");   // 'it'"'"'s'
     * StringUtils::ShellQuote("");       // ''
     * @endcode
     */
    static std::string ShellQuote(const std::string& str);

    /***************************************************************************
     * Output Truncation
     **************************************************************************/

    /**
     * @brief Build the marker appended to truncated output
     * @param original_length Length of the untruncated text in bytes
     * @return "\n... (truncated, N total chars)"
     */
    static std::string TruncationMarker(std::size_t original_length);

    /**
     * @brief Bound text to max_chars and append a truncation marker
     *
     * Text no longer than max_chars is returned unchanged. Longer text is cut
     * to exactly max_chars bytes followed by the marker. Output that already
     * carries a marker at exactly that position is returned unchanged, so
     * truncation is idempotent.
     *
     * @param text Text to bound
     * @param max_chars Maximum bytes of original text kept
     * @return Bounded text
     */
    static std::string TruncateOutput(const std::string& text, std::size_t max_chars);

    /**
     * @brief Check whether text is already the truncated form for max_chars
     */
    static bool IsTruncatedOutput(const std::string& text, std::size_t max_chars);

    /***************************************************************************
     * POSIX Paths
     **************************************************************************/

    /**
     * @brief Lexically normalize a POSIX path
     *
     * Collapses repeated separators, removes "." components and resolves
     * ".." against preceding components. ".." at the root of an absolute
     * path stays at the root. No filesystem access is performed.
     *
     * @param path Input path
     * @return Normalized path ("." for an empty relative result)
     */
    static std::string NormalizePosixPath(const std::string& path);

    /**
     * @brief Check whether a normalized path equals or descends from root
     *
     * Comparison is per path component: "/workspace2/x" is not inside
     * "/workspace".
     *
     * @param normalized_path Normalized absolute path
     * @param root Normalized absolute root
     * @return true if inside root
     */
    static bool IsWithinRoot(const std::string& normalized_path, const std::string& root);

    /**
     * @brief Parent directory of a POSIX path ("/" for top-level entries)
     */
    static std::string ParentPath(const std::string& path);

    /**
     * @brief Final component of a POSIX path
     */
    static std::string BaseName(const std::string& path);
};

} // namespace utils
} // namespace sandkit
