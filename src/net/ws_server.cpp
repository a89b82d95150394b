#include "net/ws_server.hpp"

#include <charconv>
#include <chrono>
#include <cstring>
#include <deque>
#include <filesystem>
#include <functional>
#include <utility>
#include <vector>
#include <libwebsockets.h>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "session/client_session.hpp"

namespace turnstile::net {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

constexpr const char* kDefaultReconnect = "main";
constexpr std::size_t kMaxPeerName = 128;
constexpr std::size_t kMaxArgBytes = 256;

constexpr std::uint16_t kCloseNormal = 1000;
constexpr std::uint16_t kClosePolicy = 1008;
constexpr std::uint16_t kCloseTooLarge = 1009;
constexpr std::uint16_t kCloseInternal = 1011;
constexpr std::uint16_t kCloseTryAgain = 1013;
constexpr std::uint16_t kCloseReplaced = 4000;

std::optional<std::uint64_t> parse_id(const std::string& value) {
    std::uint64_t id = 0;
    const auto* begin = value.data();
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(begin, end, id);
    if (ec != std::errc() || ptr != end || value.empty() || id == 0) {
        return std::nullopt;
    }
    return id;
}

unsigned int refusal_status(const ServiceError& error) {
    if (error.category == ErrorCategory::Auth) {
        return 401;
    }
    if (error.code == "not_found" || error.code == "workdir_not_found") {
        return 404;
    }
    if (error.code == "terminal_unavailable") {
        return 503;
    }
    return 400;
}

void emit_lws_log(const int level, const char* line) {
    std::string message(line == nullptr ? "" : line);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    if ((level & LLL_ERR) != 0) {
        LOG_ERROR("libwebsockets: " + message);
    } else {
        LOG_WARN("libwebsockets: " + message);
    }
}

bool send_frame(lws* wsi, const std::string& payload, const lws_write_protocol protocol) {
    std::vector<unsigned char> buffer(LWS_PRE + payload.size());
    if (!payload.empty()) {
        std::memcpy(buffer.data() + LWS_PRE, payload.data(), payload.size());
    }
    return lws_write(wsi, buffer.data() + LWS_PRE, payload.size(), protocol) >= 0;
}

void set_close_reason(lws* wsi, const std::uint16_t code, const std::string& reason) {
    std::string text = reason;
    lws_close_reason(wsi, static_cast<lws_close_status>(code),
                     reinterpret_cast<unsigned char*>(text.data()), text.size());
}

std::string header_value(lws* wsi, const lws_token_indexes token) {
    const int length = lws_hdr_total_length(wsi, token);
    if (length <= 0) {
        return "";
    }
    std::vector<char> buffer(static_cast<std::size_t>(length) + 1);
    const int copied = lws_hdr_copy(wsi, buffer.data(), static_cast<int>(buffer.size()), token);
    return copied < 0 ? std::string() : std::string(buffer.data(), static_cast<std::size_t>(copied));
}

// Per-connection queue between a PTY session and the service thread.
class PtyStream : public pty::PtyListener {
public:
    enum class Next {
        Frame,
        Empty,
        Overflow,
        Detached
    };

    struct Frame {
        bool binary = true;
        std::string payload;
    };

    PtyStream(const std::size_t backlog_limit, std::function<void()> wake)
        : backlog_limit_(backlog_limit), wake_(std::move(wake)) {}

    void on_output(const std::string_view bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || overflowed_) {
            return;
        }
        if (queued_bytes_ + bytes.size() > backlog_limit_) {
            overflowed_ = true;
        } else {
            frames_.push_back(Frame{true, std::string(bytes)});
            queued_bytes_ += bytes.size();
        }
        wake_();
    }

    void on_exited() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        frames_.push_back(Frame{false, json{{"type", "exited"}}.dump()});
        wake_();
    }

    void on_detached() override {
        std::lock_guard<std::mutex> lock(mutex_);
        detached_ = true;
        wake_();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        frames_.clear();
    }

    Next try_pop(Frame& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!frames_.empty()) {
            out = std::move(frames_.front());
            frames_.pop_front();
            if (out.binary) {
                queued_bytes_ -= out.payload.size();
            }
            return Next::Frame;
        }
        if (overflowed_) {
            return Next::Overflow;
        }
        if (detached_) {
            return Next::Detached;
        }
        return Next::Empty;
    }

private:
    std::mutex mutex_;
    std::deque<Frame> frames_;
    std::size_t queued_bytes_ = 0;
    std::size_t backlog_limit_;
    std::function<void()> wake_;
    bool overflowed_ = false;
    bool detached_ = false;
    bool closed_ = false;
};

void write_terminal_input(pty::PtySession& terminal, const std::string& bytes) {
    auto written = terminal.write_input(bytes);
    if (core::errors::is_error(written)) {
        LOG_DEBUG("WsServer: terminal input dropped: " + core::errors::get_error(written).message);
    }
}

// Binary frames are raw keystrokes; text frames are JSON `input` or `resize`.
void handle_terminal_message(pty::PtySession& terminal, const std::string& payload,
                             const bool binary) {
    if (binary) {
        write_terminal_input(terminal, payload);
        return;
    }
    const json value = json::parse(payload, nullptr, false);
    if (value.is_discarded() || !value.is_object() || !value.contains("type") ||
        !value.at("type").is_string()) {
        LOG_DEBUG("WsServer: ignoring malformed terminal message");
        return;
    }
    const std::string type = value.at("type").get<std::string>();
    if (type == "input" && value.contains("data") && value.at("data").is_string()) {
        write_terminal_input(terminal, value.at("data").get<std::string>());
    } else if (type == "resize" && value.contains("cols") && value.contains("rows") &&
               value.at("cols").is_number_unsigned() && value.at("rows").is_number_unsigned()) {
        const auto cols = value.at("cols").get<std::uint64_t>();
        const auto rows = value.at("rows").get<std::uint64_t>();
        if (cols == 0 || rows == 0 || cols > 0xFFFF || rows > 0xFFFF) {
            return;
        }
        auto resized = terminal.resize(static_cast<std::uint16_t>(cols),
                                       static_cast<std::uint16_t>(rows));
        if (core::errors::is_error(resized)) {
            LOG_DEBUG("WsServer: terminal resize failed: " +
                      core::errors::get_error(resized).message);
        }
    } else {
        LOG_DEBUG("WsServer: ignoring terminal message of type '" + type + "'");
    }
}

}  // namespace

struct WsServer::Connection {
    WsRoute route;
    std::filesystem::path cwd;
    std::string peer;
    bool open = false;

    std::string message;  // reassembly of a fragmented client message
    bool message_binary = false;

    std::unique_ptr<session::ClientSession> events;
    std::shared_ptr<pty::PtySession> terminal;
    std::shared_ptr<PtyStream> stream;

    std::optional<std::pair<std::uint16_t, std::string>> closing;
};

// libwebsockets entry point; every call arrives on the service thread.
class WsCallbacks {
public:
    static int handle(lws* wsi, lws_callback_reasons reason, void* /*user*/, void* in,
                      std::size_t len) {
        lws_context* context = wsi == nullptr ? nullptr : lws_get_context(wsi);
        auto* server = context == nullptr ? nullptr
                                          : static_cast<WsServer*>(lws_context_user(context));
        if (server == nullptr) {
            return 0;
        }

        switch (reason) {
            case LWS_CALLBACK_HTTP: {
                // Plain HTTP on the WebSocket listener.
                const std::string path = in == nullptr ? "" : static_cast<const char*>(in);
                const auto route = parse_ws_route(path, std::nullopt);
                const bool known = !core::errors::is_error(route);
                if (lws_return_http_status(wsi, known ? 400 : 404,
                                           known ? "websocket upgrade required" : "not found")) {
                    return -1;
                }
                return lws_http_transaction_completed(wsi) ? -1 : 0;
            }
            case LWS_CALLBACK_FILTER_PROTOCOL_CONNECTION: {
                auto admitted = server->admit(wsi);
                if (core::errors::is_error(admitted)) {
                    const auto& err = core::errors::get_error(admitted);
                    static_cast<void>(
                        lws_return_http_status(wsi, refusal_status(err), err.message.c_str()));
                    return 1;
                }
                return 0;
            }
            case LWS_CALLBACK_ESTABLISHED:
                return server->open_connection(wsi) ? 0 : -1;
            case LWS_CALLBACK_RECEIVE:
                return server->receive(wsi, static_cast<const char*>(in), len) ? 0 : -1;
            case LWS_CALLBACK_SERVER_WRITEABLE:
                return server->writable(wsi) ? 0 : -1;
            case LWS_CALLBACK_CLOSED:
            case LWS_CALLBACK_WSI_DESTROY:
                server->close_connection(wsi);
                return 0;
            case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
                server->request_writes();
                return 0;
            default:
                return 0;
        }
    }
};

namespace {

const lws_protocols kProtocols[] = {
    {"turnstile", &WsCallbacks::handle, 0, 0, 0, nullptr, 0},
    LWS_PROTOCOL_LIST_TERM
};

}  // namespace

core::errors::Result<WsRoute> parse_ws_route(const std::string& path,
                                             const std::optional<std::string>& reconnect) {
    WsRoute route;
    if (path == "/api/events") {
        route.kind = WsRoute::Kind::Events;
        return route;
    }

    const std::string pty_prefix = "/api/pty/";
    if (path.compare(0, pty_prefix.size(), pty_prefix) != 0) {
        return ServiceError{ErrorCategory::Input, "No WebSocket endpoint at " + path,
                            "not_found"};
    }
    const std::string rest = path.substr(pty_prefix.size());
    const auto slash = rest.find('/');
    const auto workdir_id = parse_id(rest.substr(0, slash));
    const auto task_id =
        slash == std::string::npos ? std::nullopt : parse_id(rest.substr(slash + 1));
    if (!workdir_id.has_value() || !task_id.has_value()) {
        return ServiceError{ErrorCategory::Input, "Invalid terminal path: " + path,
                            "invalid_path"};
    }
    route.kind = WsRoute::Kind::Terminal;
    route.key = protocol::TaskKey{workdir_id.value(), task_id.value()};
    route.reconnect = reconnect.has_value() && !reconnect->empty() ? reconnect.value()
                                                                   : std::string(kDefaultReconnect);
    return route;
}

WsServer::WsServer(WsServerOptions options, session::CommandDispatcher& dispatcher,
                   session::EventHub& hub, session::TaskStore& store,
                   pty::PtyRegistry* terminals, policy::AuthGuard& auth)
    : options_(std::move(options)),
      dispatcher_(dispatcher),
      hub_(hub),
      store_(store),
      terminals_(terminals),
      auth_(auth) {}

WsServer::~WsServer() {
    stop();
}

core::errors::Result<std::uint16_t> WsServer::start() {
    if (running_.load()) {
        return ServiceError{ErrorCategory::State, "WebSocket server already running.",
                            "already_running"};
    }

    lws_set_log_level(LLL_ERR | LLL_WARN, emit_lws_log);

    lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.options = LWS_SERVER_OPTION_EXPLICIT_VHOSTS | LWS_SERVER_OPTION_VALIDATE_UTF8;
    info.user = this;
    info.gid = -1;
    info.uid = -1;
    lws_context* context = lws_create_context(&info);
    if (context == nullptr) {
        return ServiceError{ErrorCategory::Internal, "Unable to create the WebSocket context.",
                            "context_failed"};
    }

    const std::string host = options_.host == "localhost" ? "127.0.0.1" : options_.host;
    info.port = options_.port;
    info.iface = host.c_str();
    info.protocols = kProtocols;
    info.vhost_name = "turnstile";
    lws_vhost* vhost = lws_create_vhost(context, &info);
    if (vhost == nullptr) {
        lws_context_destroy(context);
        return ServiceError{ErrorCategory::Transport,
                            "Unable to listen on " + options_.host + ":" +
                                std::to_string(options_.port),
                            "bind_failed"};
    }
    const auto port = static_cast<std::uint16_t>(lws_get_vhost_listen_port(vhost));

    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        context_ = context;
    }
    running_.store(true);
    service_thread_ = std::thread(&WsServer::service_loop, this);
    LOG_INFO("WsServer: listening on " + options_.host + ":" + std::to_string(port));
    return port;
}

void WsServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    wake();
    if (service_thread_.joinable()) {
        service_thread_.join();
    }
    LOG_INFO("WsServer: stopped");
}

void WsServer::service_loop() {
    while (running_.load()) {
        if (lws_service(context_, 0) < 0) {
            LOG_ERROR("WsServer: event loop failed");
            break;
        }
    }

    lws_context* context = nullptr;
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        context = std::exchange(context_, nullptr);
    }
    // Closes every connection; their callbacks still run on this thread.
    lws_context_destroy(context);

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
}

void WsServer::wake() {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (context_ != nullptr) {
        lws_cancel_service(context_);
    }
}

std::size_t WsServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::size_t count = 0;
    for (const auto& [wsi, connection] : connections_) {
        if (connection->open) {
            ++count;
        }
    }
    return count;
}

WsServer::Connection* WsServer::find(lws* wsi) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(wsi);
    return it == connections_.end() ? nullptr : it->second.get();
}

core::errors::Result<WsRoute> WsServer::admit(lws* wsi) {
    char peer[kMaxPeerName] = {0};
    const char* peer_name = lws_get_peer_simple(wsi, peer, sizeof(peer));
    const std::string peer_text = peer_name == nullptr ? "unknown" : peer_name;
    const std::string path = header_value(wsi, WSI_TOKEN_GET_URI);

    if (!auth_.authorize(header_value(wsi, WSI_TOKEN_HTTP_COOKIE))) {
        LOG_WARN("WsServer: " + peer_text + " unauthorized upgrade to " + path);
        return ServiceError{ErrorCategory::Auth, "unauthorized", "unauthorized"};
    }

    char arg[kMaxArgBytes] = {0};
    const char* reconnect = lws_get_urlarg_by_name(wsi, "reconnect=", arg, sizeof(arg));
    auto route = parse_ws_route(path, reconnect == nullptr ? std::nullopt
                                                           : std::optional<std::string>(reconnect));
    if (core::errors::is_error(route)) {
        return core::errors::get_error(route);
    }

    auto connection = std::make_unique<Connection>();
    connection->route = core::errors::get_value(route);
    connection->peer = peer_text;
    if (connection->route.kind == WsRoute::Kind::Terminal) {
        const auto workdir = store_.find_workdir(connection->route.key.workdir_id);
        if (!workdir.has_value()) {
            return ServiceError{ErrorCategory::State, "workdir not found", "workdir_not_found"};
        }
        if (terminals_ == nullptr) {
            return ServiceError{ErrorCategory::State, "terminals unavailable",
                                "terminal_unavailable"};
        }
        connection->cwd = workdir->path;
    }

    const WsRoute admitted = connection->route;
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_[wsi] = std::move(connection);
    return admitted;
}

bool WsServer::open_connection(lws* wsi) {
    Connection* connection = find(wsi);
    if (connection == nullptr) {
        return false;
    }
    connection->open = true;

    if (connection->route.kind == WsRoute::Kind::Events) {
        connection->events = std::make_unique<session::ClientSession>(
            dispatcher_, hub_, options_.subscriber_capacity, connection->peer,
            [this] { wake(); });
        return true;
    }

    connection->terminal = terminals_->get_or_create(connection->route.key,
                                                     connection->route.reconnect, connection->cwd);
    connection->stream =
        std::make_shared<PtyStream>(options_.pty_backlog_bytes, [this] { wake(); });
    auto attached = connection->terminal->attach(connection->stream);
    if (core::errors::is_error(attached)) {
        const auto& err = core::errors::get_error(attached);
        LOG_ERROR("WsServer: attach to " + connection->terminal->id() + " failed: " +
                  err.message);
        connection->closing = std::make_pair(kCloseInternal, std::string("terminal unavailable"));
    } else {
        LOG_INFO("WsServer: " + connection->peer + " attached to terminal " +
                 connection->terminal->id());
    }
    lws_callback_on_writable(wsi);
    return true;
}

bool WsServer::receive(lws* wsi, const char* data, const std::size_t len) {
    Connection* connection = find(wsi);
    if (connection == nullptr || !connection->open) {
        return true;
    }
    if (connection->message.empty()) {
        connection->message_binary = lws_frame_is_binary(wsi) != 0;
    }
    if (connection->message.size() + len > options_.max_message_bytes) {
        LOG_WARN("WsServer: " + connection->peer + " sent a message over " +
                 std::to_string(options_.max_message_bytes) + " bytes");
        set_close_reason(wsi, kCloseTooLarge, "message too large");
        return false;
    }
    connection->message.append(data, len);
    if (!lws_is_final_fragment(wsi) || lws_remaining_packet_payload(wsi) != 0) {
        return true;
    }

    std::string message;
    message.swap(connection->message);
    if (connection->events) {
        if (connection->message_binary) {
            LOG_DEBUG("WsServer: " + connection->peer + " sent a binary frame on /api/events");
            return true;
        }
        connection->events->handle_text(message);
        if (connection->events->backlog_exceeded()) {
            LOG_WARN("WsServer: " + connection->peer + " stopped reading replies; closing");
            set_close_reason(wsi, kCloseTryAgain, "reply backlog exceeded");
            return false;
        }
        lws_callback_on_writable(wsi);
    } else if (connection->terminal) {
        handle_terminal_message(*connection->terminal, message, connection->message_binary);
    }
    return true;
}

bool WsServer::writable(lws* wsi) {
    Connection* connection = find(wsi);
    if (connection == nullptr || !connection->open) {
        return true;
    }
    if (!running_.load()) {
        set_close_reason(wsi, kCloseNormal, "server stopping");
        return false;
    }
    if (connection->closing.has_value()) {
        set_close_reason(wsi, connection->closing->first, connection->closing->second);
        return false;
    }

    if (connection->events) {
        auto frame = connection->events->drain(std::chrono::milliseconds(0));
        if (!frame.has_value()) {
            if (connection->events->backlog_exceeded()) {
                set_close_reason(wsi, kCloseTryAgain, "reply backlog exceeded");
                return false;
            }
            return true;
        }
        if (!send_frame(wsi, frame->text, LWS_WRITE_TEXT)) {
            return false;
        }
        if (frame->close_after) {
            connection->closing = std::make_pair(kClosePolicy, std::string("protocol error"));
        }
        lws_callback_on_writable(wsi);
        return true;
    }

    if (connection->stream) {
        PtyStream::Frame frame;
        switch (connection->stream->try_pop(frame)) {
            case PtyStream::Next::Frame:
                if (!send_frame(wsi, frame.payload,
                                frame.binary ? LWS_WRITE_BINARY : LWS_WRITE_TEXT)) {
                    return false;
                }
                lws_callback_on_writable(wsi);
                return true;
            case PtyStream::Next::Empty:
                return true;
            case PtyStream::Next::Overflow:
                LOG_WARN("WsServer: terminal " + connection->terminal->id() +
                         " output backlog exceeded; closing viewer");
                set_close_reason(wsi, kCloseTryAgain, "output backlog exceeded");
                return false;
            case PtyStream::Next::Detached:
                set_close_reason(wsi, kCloseReplaced, "attached elsewhere");
                return false;
        }
    }
    return true;
}

void WsServer::close_connection(lws* wsi) {
    std::unique_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(wsi);
        if (it == connections_.end()) {
            return;
        }
        connection = std::move(it->second);
        connections_.erase(it);
    }
    if (connection->terminal && connection->stream) {
        connection->terminal->detach(connection->stream);
        connection->stream->close();
        LOG_INFO("WsServer: " + connection->peer + " detached from terminal " +
                 connection->terminal->id());
    }
    if (connection->events) {
        connection->events->close();
    }
}

void WsServer::request_writes() {
    std::vector<lws*> targets;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& [wsi, connection] : connections_) {
            if (connection->open) {
                targets.push_back(wsi);
            }
        }
    }
    for (lws* wsi : targets) {
        lws_callback_on_writable(wsi);
    }
}

}  // namespace turnstile::net
