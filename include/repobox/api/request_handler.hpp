/**
 * @file request_handler.hpp
 * @brief Newline-delimited JSON control protocol over a stream pair
 *
 * **Request** (one JSON object per line):
 * @code
 * {"id": 7, "op": "execute", "container_id": "repo-container-...", "command": "ls", "timeout_secs": 5}
 * @endcode
 *
 * **Response** (one JSON object per line, same id):
 * @code
 * {"id": 7, "ok": true, "result": {...}}
 * {"id": 7, "ok": false, "error": "not_found", "detail": "...", "timestamp": "..."}
 * @endcode
 *
 * Operations: create, list, get, delete, execute, browse, read_file,
 * health, ready, live, info.
 *
 * @date 2025
 */

#pragma once

#include "repobox/core/sandbox_manager.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <future>
#include <istream>
#include <list>
#include <mutex>
#include <ostream>
#include <string>

namespace repobox {
namespace api {

class RequestHandler {
public:
    explicit RequestHandler(core::SandboxManager& manager);

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    /**
     * @brief Handle one parsed request and build its response envelope
     *
     * Never throws for request-level failures; they become error envelopes.
     */
    nlohmann::json Handle(const nlohmann::json& request);

    /**
     * @brief Parse one line, handle it and serialize the response
     */
    std::string HandleLine(const std::string& line);

    /**
     * @brief Serve requests from @p in until EOF or @p stop_requested
     *
     * Each request runs on its own thread so a long command does not block
     * the rest; responses may therefore arrive out of order and carry the
     * request id. Finished requests are released as new lines arrive.
     * Returns after all in-flight requests have answered.
     */
    void Serve(std::istream& in, std::ostream& out, const std::atomic<bool>& stop_requested);

    /// Requests started by Serve() that have not been released yet
    std::size_t InFlightRequests() const;

private:
    nlohmann::json Dispatch(const std::string& op, const nlohmann::json& request);
    void PruneFinishedWorkers();

    core::SandboxManager& manager_;
    std::mutex output_mutex_;   ///< Serializes response lines

    mutable std::mutex workers_mutex_;
    std::list<std::future<void>> workers_;
};

} // namespace api
} // namespace repobox
