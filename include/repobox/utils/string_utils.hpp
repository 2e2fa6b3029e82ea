/**
 * @file string_utils.hpp
 * @brief String helpers shared by the runtime adapter, the core and the API layer
 *
 * Covers trimming/splitting of command output, validation of repository
 * URLs and git references supplied by callers, and the encodings needed to
 * put file content on the wire.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace repobox {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    // ========================================================================
    // Basic Manipulation
    // ========================================================================

    /**
     * @brief Trim whitespace from both ends of string
     */
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * Empty fields are kept, so "a\t\tb" split on '\t' yields three parts.
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split string by delimiter into at most @p max_parts fields
     *
     * The last field receives the unsplit remainder. Used for records whose
     * final field (a file name) may itself contain the delimiter.
     */
    static std::vector<std::string> SplitN(const std::string& str, char delimiter,
                                           std::size_t max_parts);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    // ========================================================================
    // Validation
    // ========================================================================

    /**
     * @brief Check if string is a clonable repository URL
     *
     * Accepts http(s)://, ssh://, git:// and file:// URLs as well as the
     * scp-like form `user@host:path`. Whitespace, control characters and a
     * leading '-' (option injection into git) are rejected.
     */
    static bool IsRepositoryURL(const std::string& str);

    /**
     * @brief Extract the host part of a repository URL
     * @return Lower-cased host, or std::nullopt for URLs without one (file://)
     */
    static std::optional<std::string> ExtractHost(const std::string& url);

    /**
     * @brief Check if string is an acceptable git branch/ref name
     *
     * Mirrors the parts of git-check-ref-format that matter for argv
     * safety: no leading '-', no "..", no whitespace or control
     * characters, no `~^:?*[\`, no trailing '/' or ".lock".
     */
    static bool IsGitRefName(const std::string& str);

    /**
     * @brief Check if string is an abbreviated or full commit hash (4-64 hex chars)
     */
    static bool IsCommitHash(const std::string& str);

    /**
     * @brief Check if string is a POSIX environment variable name
     */
    static bool IsEnvVarName(const std::string& str);

    /**
     * @brief Check if byte sequence is well-formed UTF-8 without NUL bytes
     */
    static bool IsPrintableUtf8(const std::string& data);

    // ========================================================================
    // Encoding
    // ========================================================================

    static std::string ToBase64(const std::string& str);

    /**
     * @brief Truncate string to maximum length
     *
     * @param str Input string
     * @param max_length Maximum length including the suffix
     * @param suffix Appended when truncated
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");

private:
    StringUtils() = delete;
};

} // namespace utils
} // namespace repobox
