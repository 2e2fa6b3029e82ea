/**
 * @file path_utils.hpp
 * @brief Lexical POSIX path handling for paths that live inside a sandbox
 *
 * These helpers never touch the host filesystem: the paths they operate on
 * belong to a container, so std::filesystem::canonical() would resolve them
 * against the wrong tree.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace repobox {
namespace utils {

class PathUtils {
public:
    /**
     * @brief Normalize an absolute POSIX path lexically
     *
     * Collapses repeated separators, removes "." components and resolves
     * ".." against the preceding component. ".." at the root stays at the
     * root. The result has no trailing '/' except for "/" itself.
     */
    static std::string Normalize(const std::string& path);

    /**
     * @brief Resolve @p path against @p base and normalize
     *
     * Absolute paths ignore @p base. An empty path resolves to @p base.
     */
    static std::string Resolve(const std::string& base, const std::string& path);

    /**
     * @brief Check that normalized @p path equals @p root or lies below it
     *
     * Both arguments must already be normalized. Component-wise, so
     * "/workspace-other" is not inside "/workspace".
     */
    static bool IsWithin(const std::string& root, const std::string& path);

private:
    PathUtils() = delete;
};

} // namespace utils
} // namespace repobox
