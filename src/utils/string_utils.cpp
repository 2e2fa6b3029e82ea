/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * **Repository URL forms accepted**:
 * - `https://host/org/repo(.git)`, `http://...`
 * - `ssh://user@host/org/repo.git`, `git://host/repo.git`
 * - `file:///srv/git/repo.git` (local mirrors, mostly for tests)
 * - `git@host:org/repo.git` (scp-like)
 *
 * @date 2025
 */

#include "repobox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace repobox {
namespace utils {

// ============================================================================
// BASIC STRING MANIPULATION
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
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> StringUtils::SplitN(const std::string& str, char delimiter,
                                             std::size_t max_parts) {
    std::vector<std::string> parts;
    if (max_parts == 0) {
        return parts;
    }

    std::string::size_type start = 0;
    while (parts.size() + 1 < max_parts) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(str.substr(start));
    return parts;
}

std::string StringUtils::Join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::string result;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// VALIDATION
// ============================================================================

namespace {

bool HasControlOrSpace(const std::string& str) {
    return std::any_of(str.begin(), str.end(), [](unsigned char c) {
        return c <= 0x20 || c == 0x7f;
    });
}

const std::regex& UrlPattern() {
    static const std::regex pattern(
        R"(^(https?|ssh|git)://([^/@\s]+@)?([A-Za-z0-9.-]+)(:[0-9]+)?/[^\s]+$)",
        std::regex::icase);
    return pattern;
}

const std::regex& FileUrlPattern() {
    static const std::regex pattern(R"(^file:///[^\s]+$)", std::regex::icase);
    return pattern;
}

const std::regex& ScpPattern() {
    static const std::regex pattern(R"(^[A-Za-z0-9._-]+@([A-Za-z0-9.-]+):[^\s/][^\s]*$)");
    return pattern;
}

} // anonymous namespace

bool StringUtils::IsRepositoryURL(const std::string& str) {
    if (str.empty() || str.size() > 2048 || str.front() == '-' || HasControlOrSpace(str)) {
        return false;
    }
    return std::regex_match(str, UrlPattern()) ||
           std::regex_match(str, FileUrlPattern()) ||
           std::regex_match(str, ScpPattern());
}

std::optional<std::string> StringUtils::ExtractHost(const std::string& url) {
    std::smatch match;
    if (std::regex_match(url, match, UrlPattern())) {
        return ToLower(match[3].str());
    }
    if (std::regex_match(url, match, ScpPattern())) {
        return ToLower(match[1].str());
    }
    return std::nullopt;
}

bool StringUtils::IsGitRefName(const std::string& str) {
    if (str.empty() || str.size() > 255) {
        return false;
    }
    if (str.front() == '-' || str.front() == '/' || str.back() == '/' || str.back() == '.') {
        return false;
    }
    if (HasControlOrSpace(str) || Contains(str, "..") || Contains(str, "//") ||
        Contains(str, "@{") || EndsWith(str, ".lock")) {
        return false;
    }
    static const std::string forbidden = "~^:?*[\\";
    return str.find_first_of(forbidden) == std::string::npos;
}

bool StringUtils::IsCommitHash(const std::string& str) {
    if (str.size() < 4 || str.size() > 64) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool StringUtils::IsEnvVarName(const std::string& str) {
    static const std::regex pattern(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
    return std::regex_match(str, pattern);
}

bool StringUtils::IsPrintableUtf8(const std::string& data) {
    std::size_t i = 0;
    while (i < data.size()) {
        auto c = static_cast<unsigned char>(data[i]);
        if (c == 0) {
            return false;
        }

        std::size_t continuation = 0;
        if (c < 0x80) {
            continuation = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            continuation = 1;
        } else if ((c & 0xF0) == 0xE0) {
            continuation = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            continuation = 3;
        } else {
            return false;
        }

        if (i + continuation >= data.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= continuation; ++k) {
            auto next = static_cast<unsigned char>(data[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
        }
        i += continuation + 1;
    }
    return true;
}

// ============================================================================
// ENCODING
// ============================================================================

std::string StringUtils::ToBase64(const std::string& str) {
    static const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((str.size() + 2) / 3) * 4);

    unsigned int val = 0;
    int valb = -6;

    for (unsigned char c : str) {
        val = ((val << 8) + c) & 0xFFFFFFu;
        valb += 8;

        while (valb >= 0) {
            result.push_back(base64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_length,
                                  const std::string& suffix) {
    if (str.size() <= max_length) {
        return str;
    }
    if (max_length <= suffix.size()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.size()) + suffix;
}

} // namespace utils
} // namespace repobox
