#include "repobox/utils/path_utils.hpp"
#include "repobox/utils/string_utils.hpp"

#include <vector>

namespace repobox {
namespace utils {

std::string PathUtils::Normalize(const std::string& path) {
    std::vector<std::string> stack;
    for (const auto& component : StringUtils::Split(path, '/')) {
        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            if (!stack.empty()) {
                stack.pop_back();
            }
            continue;
        }
        stack.push_back(component);
    }
    return "/" + StringUtils::Join(stack, "/");
}

std::string PathUtils::Resolve(const std::string& base, const std::string& path) {
    if (path.empty()) {
        return Normalize(base);
    }
    if (path.front() == '/') {
        return Normalize(path);
    }
    return Normalize(base + "/" + path);
}

bool PathUtils::IsWithin(const std::string& root, const std::string& path) {
    if (root == "/") {
        return !path.empty() && path.front() == '/';
    }
    if (path == root) {
        return true;
    }
    return StringUtils::StartsWith(path, root) &&
           path.size() > root.size() &&
           path[root.size()] == '/';
}

} // namespace utils
} // namespace repobox
