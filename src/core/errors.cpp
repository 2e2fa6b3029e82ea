#include "repobox/core/errors.hpp"

namespace repobox {
namespace core {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:        return "validation";
        case ErrorKind::NOT_FOUND:         return "not_found";
        case ErrorKind::INVALID_STATE:     return "invalid_state";
        case ErrorKind::PROVISION:         return "provision";
        case ErrorKind::EXECUTION_TIMEOUT: return "execution_timeout";
        case ErrorKind::SIZE_EXCEEDED:     return "size_exceeded";
        case ErrorKind::PATH_TRAVERSAL:    return "path_traversal";
        case ErrorKind::INFRASTRUCTURE:    return "infrastructure";
    }
    return "unknown";
}

} // namespace core
} // namespace repobox
