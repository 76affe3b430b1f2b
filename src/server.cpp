#include "server.hpp"
#include "log.hpp"
#include "util.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace gitmcp {

// JSON-RPC 2.0 error codes
static constexpr int kParseError = -32700;
static constexpr int kInvalidRequest = -32600;
static constexpr int kMethodNotFound = -32601;
static constexpr int kInvalidParams = -32602;
static constexpr int kInternalError = -32603;

nlohmann::json envelope_to_json(const ResultEnvelope& envelope) {
    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", envelope.text}},
        })},
        {"isError", envelope.is_error},
    };
}

McpServer::McpServer(const Dispatcher& dispatcher, int in_fd, int out_fd)
    : dispatcher_(dispatcher)
    , in_fd_(in_fd)
    , out_fd_(out_fd)
{}

int McpServer::run() {
    std::vector<struct pollfd> fds;
    while (input_open_ || !calls_.empty()) {
        fds.clear();
        bool reaping = false;
        for (const auto& active : calls_) {
            active->child->add_poll_fds(fds);
            if (active->child->awaiting_exit()) reaping = true;
        }
        size_t input_index = fds.size();
        if (input_open_) fds.push_back({in_fd_, POLLIN, 0});

        int ret = ::poll(fds.data(), fds.size(), reaping ? kReapPollIntervalMs : -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            log_error("server", std::string("poll failed: ") + std::strerror(errno));
            return 1;
        }

        // Children first: a descriptor closed here may be reused by a
        // child spawned while reading input below.
        service_children(fds);
        if (input_open_ && fds[input_index].revents != 0) {
            read_input();
        }
    }

    log_info("server", "Input closed, shutting down");
    return 0;
}

void McpServer::service_children(const std::vector<struct pollfd>& fds) {
    for (auto it = calls_.begin(); it != calls_.end();) {
        (*it)->child->handle_events(fds);
        if (advance(**it)) {
            it = calls_.erase(it);
        } else {
            ++it;
        }
    }
}

void McpServer::read_input() {
    std::array<char, 4096> buffer;
    ssize_t n = ::read(in_fd_, buffer.data(), buffer.size());
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        log_error("server", std::string("read failed: ") + std::strerror(errno));
        input_open_ = false;
        return;
    }

    if (n == 0) {
        input_open_ = false;
        if (!input_buffer_.empty()) {
            std::string last = std::move(input_buffer_);
            input_buffer_.clear();
            handle_line(last);
        }
        return;
    }

    input_buffer_.append(buffer.data(), static_cast<size_t>(n));
    size_t pos;
    while ((pos = input_buffer_.find('\n')) != std::string::npos) {
        std::string line = input_buffer_.substr(0, pos);
        input_buffer_.erase(0, pos + 1);
        handle_line(line);
    }
}

void McpServer::handle_line(const std::string& line) {
    std::string text = trim(line);
    if (text.empty()) return;

    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        log_warn("server", std::string("Malformed message: ") + e.what());
        send_error(nullptr, kParseError, "Parse error");
        return;
    }

    try {
        handle_message(msg);
    } catch (const std::exception& e) {
        log_error("server", std::string("Failed to handle message: ") + e.what());
        if (msg.is_object() && msg.contains("id")) {
            send_error(msg["id"], kInternalError, std::string("Internal error: ") + e.what());
        }
    }
}

void McpServer::handle_message(const nlohmann::json& msg) {
    if (!msg.is_object()) {
        send_error(nullptr, kInvalidRequest, "Invalid Request");
        return;
    }

    auto method_it = msg.find("method");
    if (method_it == msg.end() || !method_it->is_string()) {
        // A client response to something we never asked; nothing to do
        if (msg.contains("result") || msg.contains("error")) return;
        send_error(msg.contains("id") ? msg["id"] : nlohmann::json(nullptr),
                   kInvalidRequest, "Invalid Request");
        return;
    }

    std::string method = method_it->get<std::string>();
    if (!msg.contains("id")) {
        log_debug("server", "Notification: " + method);
        return;
    }

    const nlohmann::json& id = msg["id"];
    nlohmann::json params = msg.contains("params") ? msg["params"] : nlohmann::json::object();

    if (method == "initialize") {
        send_result(id, handle_initialize(params));
    } else if (method == "ping") {
        send_result(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        send_result(id, handle_list_tools());
    } else if (method == "tools/call") {
        start_call(id, params);
    } else {
        send_error(id, kMethodNotFound, "Method not found: " + method);
    }
}

nlohmann::json McpServer::handle_initialize(const nlohmann::json& params) const {
    std::string version = kProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }
    log_info("server", "Client initialized (protocol " + version + ")");
    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
    };
}

nlohmann::json McpServer::handle_list_tools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& def : dispatcher_.list_tools()) {
        tools.push_back(def.to_json());
    }
    return {{"tools", std::move(tools)}};
}

void McpServer::start_call(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        send_error(id, kInvalidParams, "Invalid params: 'name' must be a string");
        return;
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            send_error(id, kInvalidParams, "Invalid params: 'arguments' must be an object");
            return;
        }
        arguments = params["arguments"];
    }

    std::string name = params["name"].get<std::string>();
    log_debug("server", "Calling " + name);

    auto active = std::make_unique<ActiveCall>();
    active->id = id;
    active->call = dispatcher_.begin(name, arguments);
    if (!advance(*active)) {
        calls_.push_back(std::move(active));
    }
}

bool McpServer::advance(ActiveCall& active) {
    while (true) {
        if (active.child) {
            if (!active.child->done()) return false;
            active.outcomes.push_back(active.child->outcome());
            active.child.reset();
        }

        // Commands run one after another, never in parallel within a call
        size_t next = active.outcomes.size();
        if (!active.call.result && next < active.call.commands.size()) {
            active.child = std::make_unique<ChildProcess>(active.call.commands[next]);
            continue;
        }

        ResultEnvelope envelope = dispatcher_.finish(active.call, active.outcomes);
        send_result(active.id, envelope_to_json(envelope));
        return true;
    }
}

void McpServer::send_result(const nlohmann::json& id, nlohmann::json result) {
    send({{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
}

void McpServer::send_error(const nlohmann::json& id, int code, const std::string& message) {
    send({
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    });
}

void McpServer::send(const nlohmann::json& msg) {
    std::string line = msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line += '\n';

    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(out_fd_, line.data() + written, line.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        // Nobody is listening any more; stop taking new requests
        log_error("server", std::string("write failed: ") + std::strerror(errno));
        input_open_ = false;
        return;
    }
}

} // namespace gitmcp
