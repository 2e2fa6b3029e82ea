/**
 * @file json_codec.hpp
 * @brief JSON views of core types and request parsing
 *
 * Timestamps are ISO-8601 UTC strings. File content that is not printable
 * UTF-8 is base64 encoded.
 *
 * @date 2025
 */

#pragma once

#include "repobox/core/sandbox_types.hpp"
#include "repobox/core/sandbox_manager.hpp"
#include "repobox/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace repobox {
namespace api {

using json = nlohmann::json;

/**
 * @brief Format timestamp as ISO 8601 (e.g. 2025-01-31T12:00:00Z)
 */
std::string FormatTimestamp(const core::TimePoint& timestamp);

json ToJson(const core::ContainerRecord& record);
json ToJson(const core::ContainerListing& listing);
json ToJson(const core::CommandResult& result);
json ToJson(const core::DirectoryListing& listing);
json ToJson(const core::FileContent& content);
json ToJson(const core::HealthReport& report);
json ToJson(const core::ReadinessReport& report);

/**
 * @brief Service identity and runtime settings
 */
json InfoJson(const core::ServiceConfig& config, const std::string& runtime_name);

/**
 * @brief Uniform error body {error, detail, timestamp}
 */
json MakeErrorResponse(const std::string& error, const std::string& detail);
json MakeErrorResponse(const core::SandboxError& error);

/**
 * @brief Parse the body of a create request
 * @throws core::ValidationError on missing or wrongly typed fields
 */
core::CreateRequest ParseCreateRequest(const json& body);

/**
 * @brief Parse the body of an execute request
 * @throws core::ValidationError on missing or wrongly typed fields
 */
core::ExecuteRequest ParseExecuteRequest(const json& body);

} // namespace api
} // namespace repobox
