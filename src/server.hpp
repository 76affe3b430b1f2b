#pragma once
#include "dispatcher.hpp"
#include "process.hpp"
#include <nlohmann/json.hpp>
#include <list>
#include <memory>
#include <string>
#include <vector>

namespace gitmcp {

// MCP server over newline-delimited JSON-RPC 2.0. A single thread polls
// the input descriptor together with the pipes of every running child, so
// a slow script never stalls other calls. Responses are written as soon
// as each call resolves, in completion order.
class McpServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kServerName = "git-scripts-mcp";
    static constexpr const char* kServerVersion = "1.0.0";

    McpServer(const Dispatcher& dispatcher, int in_fd, int out_fd);

    // Serve until the input reaches EOF and every in-flight call has been
    // answered. Returns the process exit code.
    int run();

private:
    struct ActiveCall {
        nlohmann::json id;
        PendingCall call;
        std::vector<ExecutionOutcome> outcomes;
        std::unique_ptr<ChildProcess> child;
    };

    // Process one inbound line. Calls that need a child stay in flight
    // until run() drives them.
    void handle_line(const std::string& line);
    void handle_message(const nlohmann::json& msg);
    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_list_tools() const;
    void start_call(const nlohmann::json& id, const nlohmann::json& params);

    // Start the next command of `active` or send its response. Returns
    // true once the response is sent.
    bool advance(ActiveCall& active);

    void read_input();
    void service_children(const std::vector<struct pollfd>& fds);

    void send_result(const nlohmann::json& id, nlohmann::json result);
    void send_error(const nlohmann::json& id, int code, const std::string& message);
    void send(const nlohmann::json& msg);

    const Dispatcher& dispatcher_;
    int in_fd_;
    int out_fd_;
    std::string input_buffer_;
    bool input_open_ = true;
    std::list<std::unique_ptr<ActiveCall>> calls_;
};

// {content:[{type:"text", text}], isError} as sent for tools/call
nlohmann::json envelope_to_json(const ResultEnvelope& envelope);

} // namespace gitmcp
