#pragma once

#include <atomic>
#include <chrono>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "app/service_context.hpp"
#include "protocol/tool_contract.hpp"
#include "session/audit_writer.hpp"
#include "session/call_manager.hpp"

namespace gatehouse::server {

// Newline-delimited JSON over a pair of streams.
//   {"id","method":"list_tools"}
//   {"id","method":"call_tool","name","arguments":{...}}
//   {"id","method":"get_prompt","name"}
//   {"id","method":"read_resource","uri":"file:///..."}
//   {"id","method":"cancel","target":"<call id>"}
// call_tool runs on a worker thread; everything else is answered inline.
class StdioServer {
public:
    StdioServer(const app::ServiceContext& context, const session::AuditWriter& audit,
                std::istream& in, std::ostream& out);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    // Serves until EOF, then waits for every in-flight call. Returns the
    // number of requests read.
    std::size_t run();

    // Answers one request line. call_tool is handed to a worker.
    void handle_request(const std::string& line);

    // Runs one call_tool request to completion on the calling thread.
    nlohmann::json handle_call(const protocol::ToolCall& call);

    const session::CallManager& calls() const { return calls_; }
    std::size_t worker_count() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    core::errors::Result<std::shared_ptr<std::atomic_bool>> register_call(
        const protocol::ToolCall& call);
    nlohmann::json run_call(const protocol::ToolCall& call,
                            std::shared_ptr<std::atomic_bool> cancel_token,
                            std::chrono::steady_clock::time_point started);
    nlohmann::json handle_cancel(const std::string& id, const std::string& target);
    nlohmann::json handle_read_resource(const std::string& id, const std::string& uri) const;
    nlohmann::json handle_get_prompt(const std::string& id, const std::string& name) const;
    nlohmann::json handle_list_tools(const std::string& id) const;

    void write_response(const nlohmann::json& response);
    void reap_finished_workers();
    void join_workers();

    const app::ServiceContext& context_;
    const session::AuditWriter& audit_;
    std::istream& in_;
    std::ostream& out_;
    session::CallManager calls_;

    std::mutex out_mutex_;
    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

nlohmann::json error_response(const std::string& id, const core::errors::GatehouseError& error,
                              double duration_ms = 0.0);

}  // namespace gatehouse::server
