#include "repobox/api/request_handler.hpp"
#include "repobox/api/json_codec.hpp"
#include "repobox/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace repobox {
namespace api {

using core::ValidationError;

namespace {

std::string RequireString(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ValidationError(std::string("Field '") + key + "' is required and must be a string");
    }
    return it->get<std::string>();
}

std::string OptionalPath(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw ValidationError(std::string("Field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

json Success(const json& id, json result) {
    return {{"id", id}, {"ok", true}, {"result", std::move(result)}};
}

json Failure(const json& id, json error_body) {
    error_body["id"] = id;
    error_body["ok"] = false;
    return error_body;
}

} // anonymous namespace

RequestHandler::RequestHandler(core::SandboxManager& manager)
    : manager_(manager) {
}

// ============================================================================
// REQUEST DISPATCH
// ============================================================================

json RequestHandler::Handle(const json& request) {
    json id = nullptr;
    if (request.is_object() && request.contains("id")) {
        id = request.at("id");
    }

    try {
        if (!request.is_object()) {
            throw ValidationError("Request must be a JSON object");
        }
        auto op = RequireString(request, "op");
        spdlog::debug("Request {}: {}", id.dump(), op);
        return Success(id, Dispatch(op, request));
    } catch (const core::SandboxError& e) {
        if (e.Kind() == core::ErrorKind::INFRASTRUCTURE) {
            spdlog::error("Request {} failed: {}", id.dump(), e.what());
        } else {
            spdlog::debug("Request {} rejected ({}): {}", id.dump(), core::ErrorKindName(e.Kind()), e.what());
        }
        return Failure(id, MakeErrorResponse(e));
    } catch (const json::exception& e) {
        return Failure(id, MakeErrorResponse("validation", e.what()));
    } catch (const std::exception& e) {
        spdlog::error("Request {} failed unexpectedly: {}", id.dump(), e.what());
        return Failure(id, MakeErrorResponse("internal", e.what()));
    }
}

json RequestHandler::Dispatch(const std::string& op, const json& request) {
    if (op == "create") {
        return ToJson(manager_.CreateContainer(ParseCreateRequest(request)));
    }
    if (op == "list") {
        return ToJson(manager_.ListContainers());
    }
    if (op == "get") {
        return ToJson(manager_.GetContainer(RequireString(request, "container_id")));
    }
    if (op == "delete") {
        auto container_id = RequireString(request, "container_id");
        manager_.DeleteContainer(container_id);
        return {{"message", "Container " + container_id + " deleted"}};
    }
    if (op == "execute") {
        auto container_id = RequireString(request, "container_id");
        return ToJson(manager_.ExecuteCommand(container_id, ParseExecuteRequest(request)));
    }
    if (op == "browse") {
        auto container_id = RequireString(request, "container_id");
        return ToJson(manager_.BrowseDirectory(container_id, OptionalPath(request, "path")));
    }
    if (op == "read_file") {
        auto container_id = RequireString(request, "container_id");
        return ToJson(manager_.ReadFile(container_id, RequireString(request, "file_path")));
    }
    if (op == "health") {
        return ToJson(manager_.Health());
    }
    if (op == "ready") {
        return ToJson(manager_.Ready());
    }
    if (op == "live") {
        return {{"status", manager_.Live() ? "alive" : "dead"}};
    }
    if (op == "info") {
        return InfoJson(manager_.Config(), manager_.RuntimeName());
    }
    throw ValidationError("Unknown operation: " + op);
}

std::string RequestHandler::HandleLine(const std::string& line) {
    json response;
    try {
        response = Handle(json::parse(line));
    } catch (const json::parse_error& e) {
        response = Failure(nullptr, MakeErrorResponse("validation", std::string("Malformed JSON: ") + e.what()));
    }
    // Command output is arbitrary bytes; invalid UTF-8 is replaced rather than rejected
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// STREAM SERVER
// ============================================================================

void RequestHandler::Serve(std::istream& in, std::ostream& out, const std::atomic<bool>& stop_requested) {
    std::size_t served = 0;
    std::string line;

    spdlog::info("Serving JSON-lines requests on stdin");

    while (!stop_requested && std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.push_back(std::async(std::launch::async, [this, &out, request_line = line] {
                auto response = HandleLine(request_line);
                std::lock_guard<std::mutex> output_lock(output_mutex_);
                out << response << '\n';
                out.flush();
            }));
        }
        ++served;
        PruneFinishedWorkers();
    }

    std::list<std::future<void>> remaining;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        remaining.swap(workers_);
    }
    for (auto& worker : remaining) {
        worker.get();
    }
    spdlog::info("Request stream closed after {} request(s)", served);
}

std::size_t RequestHandler::InFlightRequests() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

void RequestHandler::PruneFinishedWorkers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->get();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace api
} // namespace repobox
