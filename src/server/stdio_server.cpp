#include "server/stdio_server.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <ostream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace gatehouse::server {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;
using nlohmann::json;

namespace {

double elapsed_ms(const std::chrono::steady_clock::time_point& started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

GatehouseError invalid_request(const std::string& message) {
    return GatehouseError{ErrorCategory::Input, message, "invalid_request",
                          "Send one JSON object per line with \"id\" and \"method\"."};
}

// Guards and argument checks refuse before any OS operation; anything else
// means the call was allowed to run.
bool is_refusal(const GatehouseError& error) {
    return error.category == ErrorCategory::Policy || error.category == ErrorCategory::Input;
}

template <typename T>
void report_audit_failure(const core::errors::Result<T>& written) {
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        GATEHOUSE_LOG_WARN("Audit write failed [" + err.code + "]: " + err.message);
    }
}

json content_to_json(const std::vector<protocol::ContentBlock>& blocks) {
    json content = json::array();
    for (const auto& block : blocks) {
        content.push_back({{"type", block.type},
                           {"uri", block.uri},
                           {"mime_type", block.mime_type},
                           {"data", block.data}});
    }
    return content;
}

json result_response(const std::string& id, const protocol::ToolResult& result) {
    json response;
    response["id"] = id;
    response["success"] = result.success;
    response["output"] = result.output;
    if (!result.success) {
        response["error"] = {{"code", "tool_failed"},
                             {"category", core::errors::to_string(ErrorCategory::Execution)},
                             {"message", result.error_message},
                             {"hint", ""}};
    }
    if (!result.content.empty()) {
        response["content"] = content_to_json(result.content);
    }
    response["duration_ms"] = result.duration_ms;
    return response;
}

}  // namespace

json error_response(const std::string& id, const GatehouseError& error,
                    const double duration_ms) {
    json response;
    response["id"] = id;
    response["success"] = false;
    response["output"] = "";
    response["error"] = {{"code", error.code},
                         {"category", core::errors::to_string(error.category)},
                         {"message", error.message},
                         {"hint", error.hint}};
    response["duration_ms"] = duration_ms;
    return response;
}

StdioServer::StdioServer(const app::ServiceContext& context, const session::AuditWriter& audit,
                         std::istream& in, std::ostream& out)
    : context_(context), audit_(audit), in_(in), out_(out) {}

StdioServer::~StdioServer() {
    join_workers();
}

std::size_t StdioServer::run() {
    GATEHOUSE_LOG_INFO("StdioServer: serving " +
                       std::to_string(context_.dispatcher().list_tools().size()) + " tools");
    std::size_t requests = 0;
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        ++requests;
        handle_request(line);
    }
    GATEHOUSE_LOG_INFO("StdioServer: input closed, waiting for in-flight calls");
    join_workers();
    return requests;
}

void StdioServer::handle_request(const std::string& line) {
    const json request = json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        write_response(error_response("", invalid_request("Request is not a JSON object.")));
        return;
    }

    std::string id;
    if (request.contains("id")) {
        if (request.at("id").is_string()) {
            id = request.at("id").get<std::string>();
        } else if (request.at("id").is_number_integer()) {
            id = std::to_string(request.at("id").get<std::int64_t>());
        }
    }
    if (id.empty()) {
        write_response(error_response("", invalid_request("Request is missing a string \"id\".")));
        return;
    }
    if (!request.contains("method") || !request.at("method").is_string()) {
        write_response(error_response(id, invalid_request("Request is missing \"method\".")));
        return;
    }

    const std::string method = request.at("method").get<std::string>();
    const auto string_field = [&request](const char* key) -> std::string {
        if (request.contains(key) && request.at(key).is_string()) {
            return request.at(key).get<std::string>();
        }
        return "";
    };

    if (method == "list_tools") {
        write_response(handle_list_tools(id));
    } else if (method == "get_prompt") {
        write_response(handle_get_prompt(id, string_field("name")));
    } else if (method == "read_resource") {
        write_response(handle_read_resource(id, string_field("uri")));
    } else if (method == "cancel") {
        write_response(handle_cancel(id, string_field("target")));
    } else if (method == "call_tool") {
        protocol::ToolCall call;
        call.id = id;
        call.name = string_field("name");
        if (call.name.empty()) {
            write_response(error_response(id, invalid_request("call_tool requires \"name\".")));
            return;
        }
        call.arguments = request.contains("arguments") ? request.at("arguments") : json::object();
        if (!call.arguments.is_object()) {
            write_response(
                error_response(id, invalid_request("\"arguments\" must be a JSON object.")));
            return;
        }

        // Registered before the worker starts so an immediate cancel finds it.
        const auto started = std::chrono::steady_clock::now();
        auto registered = register_call(call);
        if (core::errors::is_error(registered)) {
            write_response(
                error_response(id, core::errors::get_error(registered), elapsed_ms(started)));
            return;
        }
        auto cancel_token = core::errors::get_value(registered);

        auto done = std::make_shared<std::atomic_bool>(false);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        reap_finished_workers();
        try {
            std::thread worker([this, call, cancel_token, started, done]() {
                write_response(run_call(call, cancel_token, started));
                auto released = calls_.release_call(call.id);
                if (core::errors::is_error(released)) {
                    GATEHOUSE_LOG_DEBUG("Call " + call.id + " not released: " +
                                        core::errors::get_error(released).message);
                }
                done->store(true);
            });
            workers_.push_back(Worker{std::move(worker), done});
        } catch (const std::system_error& e) {
            GATEHOUSE_LOG_ERROR("StdioServer: unable to start worker: " + std::string(e.what()));
            const GatehouseError error{ErrorCategory::Internal, "Unable to start worker thread.",
                                       "worker_start_failed"};
            auto failed = calls_.mark_failed(id, error.message);
            if (core::errors::is_error(failed)) {
                GATEHOUSE_LOG_DEBUG("Call " + id + " already terminal");
            }
            write_response(error_response(id, error));
            auto released = calls_.release_call(id);
            if (core::errors::is_error(released)) {
                GATEHOUSE_LOG_DEBUG("Call " + id + " not released: " +
                                    core::errors::get_error(released).message);
            }
        }
    } else {
        write_response(error_response(id, invalid_request("Unknown method: " + method)));
    }
}

json StdioServer::handle_call(const protocol::ToolCall& call) {
    const auto started = std::chrono::steady_clock::now();
    auto registered = register_call(call);
    if (core::errors::is_error(registered)) {
        return error_response(call.id, core::errors::get_error(registered), elapsed_ms(started));
    }
    return run_call(call, core::errors::get_value(registered), started);
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> StdioServer::register_call(
    const protocol::ToolCall& call) {
    report_audit_failure(audit_.write_call(call));
    return calls_.start_call(call.id, call.name);
}

json StdioServer::run_call(const protocol::ToolCall& call,
                           std::shared_ptr<std::atomic_bool> cancel_token,
                           const std::chrono::steady_clock::time_point started) {
    auto dispatched = context_.dispatcher().dispatch(call, std::move(cancel_token));
    const double duration = elapsed_ms(started);

    if (core::errors::is_error(dispatched)) {
        const auto& error = core::errors::get_error(dispatched);
        if (error.category == ErrorCategory::Policy) {
            GATEHOUSE_LOG_WARN("Refused " + call.name + " [" + error.code + "]: " + error.message +
                               (error.hint.empty() ? "" : " Hint: " + error.hint));
        } else {
            GATEHOUSE_LOG_INFO("Call " + call.id + " (" + call.name + ") failed [" + error.code +
                               "]: " + error.message);
        }
        report_audit_failure(audit_.write_decision(call.id, call.name, !is_refusal(error),
                                                   is_refusal(error)
                                                       ? std::optional<GatehouseError>(error)
                                                       : std::nullopt));
        auto failed = calls_.mark_failed(call.id, error.message);
        if (core::errors::is_error(failed)) {
            GATEHOUSE_LOG_DEBUG("Call " + call.id + " already terminal: " +
                                core::errors::get_error(failed).message);
        }
        return error_response(call.id, error, duration);
    }

    const auto& result = core::errors::get_value(dispatched);
    report_audit_failure(audit_.write_decision(call.id, call.name, true));
    report_audit_failure(audit_.write_result(call.id, result));

    auto terminal = result.success ? calls_.mark_completed(call.id)
                                   : calls_.mark_failed(call.id, result.error_message);
    if (core::errors::is_error(terminal)) {
        // cancel_call already moved it to Cancelled.
        GATEHOUSE_LOG_DEBUG("Call " + call.id + " already terminal: " +
                            core::errors::get_error(terminal).message);
    }

    return result_response(call.id, result);
}

json StdioServer::handle_read_resource(const std::string& id, const std::string& uri) const {
    if (uri.empty()) {
        return error_response(id, invalid_request("read_resource requires \"uri\"."));
    }
    auto read = context_.dispatcher().read_resource(uri);
    if (core::errors::is_error(read)) {
        const auto& error = core::errors::get_error(read);
        if (error.category == ErrorCategory::Policy) {
            GATEHOUSE_LOG_WARN("Refused read_resource [" + error.code + "]: " + error.message);
        }
        return error_response(id, error);
    }

    const auto& result = core::errors::get_value(read);
    return result_response(id, result);
}

json StdioServer::handle_cancel(const std::string& id, const std::string& target) {
    if (target.empty()) {
        return error_response(id, invalid_request("cancel requires \"target\"."));
    }
    auto cancelled = calls_.cancel_call(target);
    if (core::errors::is_error(cancelled)) {
        return error_response(id, core::errors::get_error(cancelled));
    }
    GATEHOUSE_LOG_INFO("Call " + target + " cancelled by request " + id);
    json response;
    response["id"] = id;
    response["success"] = true;
    response["output"] = "Cancelled " + target;
    response["duration_ms"] = 0.0;
    return response;
}

json StdioServer::handle_get_prompt(const std::string& id, const std::string& name) const {
    auto prompt = context_.prompts().get(name);
    if (core::errors::is_error(prompt)) {
        return error_response(id, core::errors::get_error(prompt));
    }
    json response;
    response["id"] = id;
    response["success"] = true;
    response["output"] = core::errors::get_value(prompt);
    response["duration_ms"] = 0.0;
    return response;
}

json StdioServer::handle_list_tools(const std::string& id) const {
    json tools = json::array();
    for (const auto& descriptor : context_.dispatcher().list_tools()) {
        tools.push_back({{"name", descriptor.name},
                         {"description", descriptor.description},
                         {"input_schema", descriptor.input_schema}});
    }
    json response;
    response["id"] = id;
    response["success"] = true;
    response["tools"] = std::move(tools);
    response["prompts"] = context_.prompts().names();
    return response;
}

void StdioServer::write_response(const json& response) {
    const std::string text = response.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text << '\n';
    out_.flush();
}

std::size_t StdioServer::worker_count() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

// Caller holds workers_mutex_.
void StdioServer::reap_finished_workers() {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void StdioServer::join_workers() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

}  // namespace gatehouse::server
