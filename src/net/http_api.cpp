#include "net/http_api.hpp"

#include <utility>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "net/http_query.hpp"
#include "protocol/json_codec.hpp"

namespace turnstile::net {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

constexpr const char* kJson = "application/json";
constexpr std::size_t kMultipartOverheadBytes = 64 * 1024;

QueryParams query_of(const httplib::Request& req) {
    QueryParams params;
    for (const auto& [name, value] : req.params) {
        params.emplace(name, value);
    }
    return params;
}

void reply_error(httplib::Response& res, const ServiceError& error) {
    res.status = http_status_for(error);
    res.set_content(error_body(error), kJson);
}

void reply_json(httplib::Response& res, const nlohmann::json& body) {
    res.status = 200;
    res.set_content(body.dump(), kJson);
}

bool is_public_path(const std::string& path) {
    return path == "/api/health" || path == "/auth";
}

std::string auth_page(const bool ok) {
    if (ok) {
        return "<!doctype html><html><head><meta http-equiv=\"refresh\" content=\"0; url=/\">"
               "</head><body>Signed in.</body></html>";
    }
    return "<!doctype html><html><body>Invalid token.</body></html>";
}

}  // namespace

HttpApi::HttpApi(HttpApiOptions options, session::CommandDispatcher& dispatcher,
                 session::TaskStore& store, session::AttachmentStore* attachments,
                 policy::AuthGuard& auth)
    : options_(std::move(options)),
      dispatcher_(dispatcher),
      store_(store),
      attachments_(attachments),
      auth_(auth) {}

HttpApi::~HttpApi() {
    stop();
}

core::errors::Result<std::uint16_t> HttpApi::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (server_) {
        return ServiceError{ErrorCategory::State, "HTTP server already running.",
                            "already_running"};
    }

    server_ = std::make_unique<httplib::Server>();
    if (attachments_ != nullptr) {
        server_->set_payload_max_length(attachments_->max_bytes() + kMultipartOverheadBytes);
    }
    configure_routes(*server_);

    int bound_port = options_.port;
    if (options_.port == 0) {
        bound_port = server_->bind_to_any_port(options_.host);
    } else if (!server_->bind_to_port(options_.host, options_.port)) {
        bound_port = -1;
    }
    if (bound_port < 0) {
        server_.reset();
        return ServiceError{ErrorCategory::Transport,
                            "Unable to listen on " + options_.host + ":" +
                                std::to_string(options_.port),
                            "bind_failed"};
    }

    running_.store(true);
    server_thread_ = std::thread([this] {
        server_->listen_after_bind();
        running_.store(false);
    });
    lock.unlock();
    server_->wait_until_ready();

    LOG_INFO("HttpApi: listening on " + options_.host + ":" + std::to_string(bound_port));
    return static_cast<std::uint16_t>(bound_port);
}

void HttpApi::stop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!server_) {
        return;
    }
    server_->stop();
    lock.unlock();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    lock.lock();
    server_.reset();
    running_.store(false);
    LOG_INFO("HttpApi: stopped");
}

void HttpApi::configure_routes(httplib::Server& server) {
    server.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (is_public_path(req.path) || auth_.authorize(req.get_header_value("Cookie"))) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        LOG_WARN("HttpApi: unauthorized " + req.method + " " + req.path + " from " +
                 req.remote_addr);
        res.status = 401;
        res.set_content("unauthorized", "text/plain");
        return httplib::Server::HandlerResponse::Handled;
    });

    server.Get("/api/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("ok", "text/plain");
    });

    server.Get("/auth", [this](const httplib::Request& req, httplib::Response& res) {
        if (!auth_.enabled()) {
            res.status = 404;
            res.set_content("not found", "text/plain");
            return;
        }
        auto exchanged = auth_.exchange(req.get_param_value("token"));
        if (core::errors::is_error(exchanged)) {
            LOG_WARN("HttpApi: rejected auth exchange from " + req.remote_addr);
            res.status = 401;
            res.set_content(auth_page(false), "text/html");
            return;
        }
        res.set_header("Set-Cookie",
                       auth_.set_cookie_header(core::errors::get_value(exchanged)));
        res.set_content(auth_page(true), "text/html");
    });

    server.Get("/api/app", [this](const httplib::Request&, httplib::Response& res) {
        reply_json(res, protocol::codec::to_json(dispatcher_.app_snapshot()));
    });

    server.Get("/api/tasks", [this](const httplib::Request& req, httplib::Response& res) {
        auto filter = parse_task_filter(query_of(req));
        if (core::errors::is_error(filter)) {
            reply_error(res, core::errors::get_error(filter));
            return;
        }
        reply_json(res, protocol::codec::to_json(
                            dispatcher_.tasks_snapshot(core::errors::get_value(filter))));
    });

    const auto workdir_tasks = [this](const httplib::Request& req, httplib::Response& res) {
        auto workdir_id = parse_path_id(req.matches[1].str(), "workdir id");
        if (core::errors::is_error(workdir_id)) {
            reply_error(res, core::errors::get_error(workdir_id));
            return;
        }
        auto snapshot = dispatcher_.workdir_tasks_snapshot(core::errors::get_value(workdir_id));
        if (core::errors::is_error(snapshot)) {
            reply_error(res, core::errors::get_error(snapshot));
            return;
        }
        reply_json(res, protocol::codec::to_json(core::errors::get_value(snapshot)));
    };
    server.Get(R"(/api/workdirs/(\d+)/tasks)", workdir_tasks);
    server.Get(R"(/api/workspaces/(\d+)/threads)", workdir_tasks);

    server.Get(R"(/api/(?:workdirs|workspaces)/(\d+)/conversations/(\d+))",
               [this](const httplib::Request& req, httplib::Response& res) {
                   auto workdir_id = parse_path_id(req.matches[1].str(), "workdir id");
                   auto task_id = parse_path_id(req.matches[2].str(), "task id");
                   auto query = parse_conversation_query(query_of(req));
                   if (core::errors::is_error(workdir_id)) {
                       reply_error(res, core::errors::get_error(workdir_id));
                       return;
                   }
                   if (core::errors::is_error(task_id)) {
                       reply_error(res, core::errors::get_error(task_id));
                       return;
                   }
                   if (core::errors::is_error(query)) {
                       reply_error(res, core::errors::get_error(query));
                       return;
                   }
                   const auto& parsed = core::errors::get_value(query);
                   auto snapshot = dispatcher_.conversation_snapshot(
                       protocol::TaskKey{core::errors::get_value(workdir_id),
                                         core::errors::get_value(task_id)},
                       parsed.before, parsed.limit);
                   if (core::errors::is_error(snapshot)) {
                       reply_error(res, core::errors::get_error(snapshot));
                       return;
                   }
                   reply_json(res, protocol::codec::to_json(core::errors::get_value(snapshot)));
               });

    server.Post(R"(/api/(?:workdirs|workspaces)/(\d+)/attachments)",
                [this](const httplib::Request& req, httplib::Response& res) {
                    auto workdir_id = parse_path_id(req.matches[1].str(), "workdir id");
                    if (core::errors::is_error(workdir_id)) {
                        reply_error(res, core::errors::get_error(workdir_id));
                        return;
                    }
                    const auto id = core::errors::get_value(workdir_id);
                    if (!store_.find_workdir(id).has_value()) {
                        reply_error(res, ServiceError{ErrorCategory::State,
                                                      "Unknown workdir " + std::to_string(id),
                                                      "workdir_not_found"});
                        return;
                    }
                    if (attachments_ == nullptr) {
                        reply_error(res, ServiceError{ErrorCategory::Internal,
                                                      "Attachments are not configured.",
                                                      "attachments_unavailable"});
                        return;
                    }
                    if (!req.has_file("file")) {
                        reply_error(res, ServiceError{ErrorCategory::Input,
                                                      "Multipart field 'file' is required.",
                                                      "missing_file"});
                        return;
                    }
                    const auto file = req.get_file_value("file");
                    std::optional<std::string> mime;
                    if (!file.content_type.empty()) {
                        mime = file.content_type;
                    }
                    auto stored = attachments_->store(id, file.filename, file.content, mime);
                    if (core::errors::is_error(stored)) {
                        const auto& err = core::errors::get_error(stored);
                        LOG_WARN("HttpApi: upload to workdir " + std::to_string(id) +
                                 " rejected [" + err.code + "]");
                        reply_error(res, err);
                        return;
                    }
                    reply_json(res, protocol::codec::to_json(core::errors::get_value(stored)));
                });

    server.Get(R"(/api/(?:workdirs|workspaces)/(\d+)/attachments/([A-Za-z0-9_]+))",
               [this](const httplib::Request& req, httplib::Response& res) {
                   auto workdir_id = parse_path_id(req.matches[1].str(), "workdir id");
                   if (core::errors::is_error(workdir_id)) {
                       reply_error(res, core::errors::get_error(workdir_id));
                       return;
                   }
                   if (attachments_ == nullptr) {
                       reply_error(res, ServiceError{ErrorCategory::State,
                                                     "Attachment not found.",
                                                     "attachment_not_found"});
                       return;
                   }
                   const auto id = core::errors::get_value(workdir_id);
                   const std::string attachment_id = req.matches[2].str();
                   auto found = attachments_->find(id, attachment_id);
                   if (core::errors::is_error(found)) {
                       reply_error(res, core::errors::get_error(found));
                       return;
                   }
                   auto bytes = attachments_->read(id, attachment_id);
                   if (core::errors::is_error(bytes)) {
                       reply_error(res, core::errors::get_error(bytes));
                       return;
                   }
                   const auto& ref = core::errors::get_value(found).ref;
                   res.set_content(core::errors::get_value(bytes),
                                   ref.mime.value_or("application/octet-stream"));
               });
}

}  // namespace turnstile::net
