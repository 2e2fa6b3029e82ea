/**
 * @file errors.hpp
 * @brief Exception taxonomy of the lifecycle core
 *
 * Every failure surfaced to a caller is a SandboxError carrying an ErrorKind.
 * The API layer turns the kind into the wire name of the error response.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace repobox {
namespace core {

/**
 * @enum ErrorKind
 * @brief Failure categories reported to callers
 */
enum class ErrorKind {
    VALIDATION,          ///< Malformed or out-of-range input
    NOT_FOUND,           ///< Unknown sandbox id or path
    INVALID_STATE,       ///< Operation not allowed in current status
    PROVISION,           ///< Clone, checkout or bootstrap failed
    EXECUTION_TIMEOUT,   ///< A bounded internal probe exceeded its limit
    SIZE_EXCEEDED,       ///< File larger than the read limit
    PATH_TRAVERSAL,      ///< Path escapes the sandbox workspace
    INFRASTRUCTURE       ///< Container runtime unreachable or failing
};

/**
 * @brief Wire name of an error kind ("not_found", "path_traversal", ...)
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * @class SandboxError
 * @brief Base class of all errors raised by the core
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public SandboxError {
public:
    explicit ValidationError(const std::string& message)
        : SandboxError(ErrorKind::VALIDATION, message) {}
};

class NotFoundError : public SandboxError {
public:
    explicit NotFoundError(const std::string& message)
        : SandboxError(ErrorKind::NOT_FOUND, message) {}
};

class InvalidStateError : public SandboxError {
public:
    explicit InvalidStateError(const std::string& message)
        : SandboxError(ErrorKind::INVALID_STATE, message) {}
};

class ProvisionError : public SandboxError {
public:
    explicit ProvisionError(const std::string& message)
        : SandboxError(ErrorKind::PROVISION, message) {}
};

class ExecutionTimeoutError : public SandboxError {
public:
    explicit ExecutionTimeoutError(const std::string& message)
        : SandboxError(ErrorKind::EXECUTION_TIMEOUT, message) {}
};

class SizeExceededError : public SandboxError {
public:
    explicit SizeExceededError(const std::string& message)
        : SandboxError(ErrorKind::SIZE_EXCEEDED, message) {}
};

class PathTraversalError : public SandboxError {
public:
    explicit PathTraversalError(const std::string& message)
        : SandboxError(ErrorKind::PATH_TRAVERSAL, message) {}
};

class InfrastructureError : public SandboxError {
public:
    explicit InfrastructureError(const std::string& message)
        : SandboxError(ErrorKind::INFRASTRUCTURE, message) {}
};

} // namespace core
} // namespace repobox
