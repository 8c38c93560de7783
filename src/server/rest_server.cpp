#include "callguard/server/rest_server.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <stdexcept>

#include "callguard/errors.hpp"
#include "callguard/logging.hpp"
#include "callguard/metrics.hpp"
#include "callguard/model/json.hpp"

namespace callguard {

namespace {

constexpr int64_t kMaxSignalWaitMs = 30000;
constexpr size_t kMaxEventPage = 1000;

nlohmann::json parse_body(const httplib::Request& request) {
    if (request.body.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::invalid_argument(std::string("invalid request body: ") + ex.what());
    }
    if (!body.is_object()) {
        throw std::invalid_argument("request body must be a JSON object");
    }
    return body;
}

std::string required(const nlohmann::json& body, const std::string& key) {
    if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
        throw std::invalid_argument("missing field: " + key);
    }
    return body[key].get<std::string>();
}

std::string actor(const httplib::Request& request) {
    const auto value = request.get_header_value("X-User-Id");
    if (value.empty()) {
        throw Unauthorized("missing X-User-Id header");
    }
    return value;
}

int64_t query_int(const httplib::Request& request, const std::string& key, int64_t fallback) {
    if (!request.has_param(key)) {
        return fallback;
    }
    const auto raw = request.get_param_value(key);
    try {
        return std::stoll(raw);
    } catch (const std::exception&) {
        throw std::invalid_argument("query parameter " + key + " is not an integer");
    }
}

RestResponse ok(nlohmann::json body, int status = 200) {
    RestResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

nlohmann::json error_body(const std::string& code, const std::string& message) {
    return {{"error", code}, {"message", message}};
}

}

RestResponse error_response(const std::exception& ex) {
    RestResponse response;
    if (dynamic_cast<const InvalidParticipants*>(&ex)) {
        response.status = 400;
        response.body = error_body("invalid_participants", ex.what());
    } else if (dynamic_cast<const SessionClosed*>(&ex)) {
        response.status = 409;
        response.body = error_body("session_closed", ex.what());
    } else if (dynamic_cast<const ConsentRequired*>(&ex)) {
        response.status = 409;
        response.body = error_body("consent_required", ex.what());
    } else if (dynamic_cast<const InvalidStateTransition*>(&ex)) {
        response.status = 409;
        response.body = error_body("invalid_state_transition", ex.what());
    } else if (dynamic_cast<const Unauthorized*>(&ex)) {
        response.status = 403;
        response.body = error_body("unauthorized", ex.what());
    } else if (dynamic_cast<const NotFound*>(&ex)) {
        response.status = 404;
        response.body = error_body("not_found", ex.what());
    } else if (dynamic_cast<const StorageUnavailable*>(&ex)) {
        response.status = 503;
        response.body = error_body("unavailable", ex.what());
    } else if (dynamic_cast<const UploadExhausted*>(&ex)) {
        response.status = 500;
        response.body = error_body("upload_exhausted", ex.what());
    } else if (dynamic_cast<const std::invalid_argument*>(&ex) ||
               dynamic_cast<const std::out_of_range*>(&ex) ||
               dynamic_cast<const nlohmann::json::exception*>(&ex)) {
        response.status = 400;
        response.body = error_body("invalid_request", ex.what());
    } else {
        response.status = 500;
        response.body = error_body("internal_error", ex.what());
    }
    return response;
}

RestServer::RestServer(const Config& config, Services services)
    : config_(config), services_(services) {}

RestServer::~RestServer() {
    stop();
}

httplib::Server::Handler RestServer::wrap(const std::string& name, Handler handler) {
    return [this, name, handler](const httplib::Request& req, httplib::Response& res) {
        const auto started = std::chrono::steady_clock::now();
        Metrics::instance().increment_request();
        if (authorize_request(req, res)) {
            try {
                write_json(res, handler(req));
            } catch (const std::exception& ex) {
                const auto payload = error_response(ex);
                if (payload.status >= 500) {
                    logging::error("Request failed",
                                   {kv("route", name), kv("status", payload.status),
                                    kv("error", ex.what())});
                } else {
                    logging::warn("Request rejected",
                                  {kv("route", name), kv("status", payload.status),
                                   kv("error", ex.what())});
                }
                write_json(res, payload);
            }
        }
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started).count();
        Metrics::instance().observe_response_time(name, elapsed);
    };
}

void RestServer::route_get(const std::string& pattern, const std::string& name,
                           Handler handler) {
    server_->Get(pattern, wrap(name, std::move(handler)));
}

void RestServer::route_post(const std::string& pattern, const std::string& name,
                            Handler handler) {
    server_->Post(pattern, wrap(name, std::move(handler)));
}

void RestServer::route_put(const std::string& pattern, const std::string& name,
                           Handler handler) {
    server_->Put(pattern, wrap(name, std::move(handler)));
}

void RestServer::route_delete(const std::string& pattern, const std::string& name,
                              Handler handler) {
    server_->Delete(pattern, wrap(name, std::move(handler)));
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    register_calls();
    register_recordings();
    register_admin();

    if (config_.rest_api_port == 0) {
        port_ = server_->bind_to_any_port(config_.rest_api_host);
    } else if (server_->bind_to_port(config_.rest_api_host, config_.rest_api_port)) {
        port_ = config_.rest_api_port;
    } else {
        port_ = -1;
    }
    if (port_ < 0) {
        throw std::runtime_error("REST server cannot bind " + config_.rest_api_host + ":" +
                                 std::to_string(config_.rest_api_port));
    }

    server_thread_ = std::thread([this]() {
        logging::info("REST server listening",
                      {kv("host", config_.rest_api_host), kv("port", port_)});
        if (!server_->listen_after_bind()) {
            logging::error("REST server stopped listening",
                           {kv("host", config_.rest_api_host), kv("port", port_)});
        }
    });
}

void RestServer::register_calls() {
    auto& s = services_;

    route_post("/calls", "create_call", [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        const auto call_type = parse_call_type(body.value("call_type", "consultation"));
        const auto context = body.contains("context") ? body["context"].dump() : "{}";
        const auto call = s.sessions.create(required(body, "initiator_id"),
                                            required(body, "counterpart_id"),
                                            call_type, context);
        return ok(call, 201);
    });

    route_get("/calls", "list_calls", [&s](const httplib::Request&) {
        return ok({{"calls", s.sessions.list_active()}});
    });

    route_get(R"(/calls/([A-Za-z0-9_-]+))", "get_call", [&s](const httplib::Request& req) {
        const auto call_id = req.matches[1].str();
        nlohmann::json body = s.sessions.get(call_id);
        body["escalations"] = s.escalations.escalations_for(call_id);
        if (auto recording = s.store.find_recording_for_call(call_id)) {
            body["recording_id"] = recording->id;
        }
        return ok(body);
    });

    route_post(R"(/calls/([A-Za-z0-9_-]+)/signals)", "post_signal",
               [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        const auto payload = body.contains("payload") && !body["payload"].is_string()
                                 ? body["payload"].dump()
                                 : body.value("payload", "");
        const auto result = s.sessions.relay_signal(req.matches[1].str(),
                                                    required(body, "sender_id"),
                                                    parse_signal_kind(required(body, "kind")),
                                                    payload);
        return ok({{"message_id", result.message_id}, {"call", result.call}}, 201);
    });

    route_get(R"(/calls/([A-Za-z0-9_-]+)/signals)", "fetch_signals",
              [&s](const httplib::Request& req) {
        const auto call_id = req.matches[1].str();
        if (!req.has_param("recipient")) {
            throw std::invalid_argument("missing query parameter: recipient");
        }
        const auto recipient = req.get_param_value("recipient");
        const auto call = s.sessions.get(call_id);
        if (!call.is_participant(recipient)) {
            throw InvalidParticipants("user " + recipient + " is not part of call " + call_id);
        }
        const auto wait_ms = std::clamp<int64_t>(query_int(req, "wait_ms", 0), 0,
                                                 kMaxSignalWaitMs);
        signaling::Delivery delivery;
        if (is_terminal(call.status)) {
            delivery.messages = s.relay.fetch(call_id, recipient);
            delivery.closed = true;
        } else if (wait_ms > 0) {
            delivery = s.relay.wait(call_id, recipient, std::chrono::milliseconds(wait_ms));
        } else {
            delivery.messages = s.relay.fetch(call_id, recipient);
            delivery.closed = !s.relay.is_open(call_id);
        }
        return ok({{"messages", delivery.messages}, {"closed", delivery.closed}});
    });

    route_post(R"(/calls/([A-Za-z0-9_-]+)/end)", "end_call", [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        return ok(s.sessions.end(req.matches[1].str(), body.value("reason", "ended")));
    });

    route_post(R"(/calls/([A-Za-z0-9_-]+)/fail)", "fail_call", [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        return ok(s.sessions.fail(req.matches[1].str(), body.value("reason", "transport_failure")));
    });

    route_post(R"(/calls/([A-Za-z0-9_-]+)/flag)", "flag_call", [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        return ok(s.sessions.flag(req.matches[1].str(), body.value("reason", "urgent")));
    });

    route_post(R"(/calls/([A-Za-z0-9_-]+)/heartbeat)", "heartbeat",
               [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        return ok(s.sessions.heartbeat(req.matches[1].str(), required(body, "user_id")));
    });

    route_post(R"(/calls/([A-Za-z0-9_-]+)/consent)", "record_consent",
               [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        const auto consent = s.sessions.record_consent(
            req.matches[1].str(), actor(req), parse_consent_type(required(body, "type")),
            parse_consent_status(body.value("status", "given")),
            body.value("method", "web_form"), req.remote_addr);
        return ok(consent, 201);
    });

    route_get(R"(/calls/([A-Za-z0-9_-]+)/consent)", "list_consent",
              [&s](const httplib::Request& req) {
        return ok({{"consents", s.sessions.consents(req.matches[1].str())}});
    });

    route_post(R"(/escalations/([A-Za-z0-9_-]+)/ack)", "ack_escalation",
               [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        return ok(s.escalations.acknowledge(req.matches[1].str(), required(body, "by")));
    });

    route_get("/events", "read_events", [&s](const httplib::Request& req) {
        const auto cursor = query_int(req, "cursor", 0);
        const auto limit = std::clamp<int64_t>(query_int(req, "limit", 100), 1,
                                               static_cast<int64_t>(kMaxEventPage));
        const auto events = s.events.read(cursor, static_cast<size_t>(limit));
        const auto next = events.empty() ? cursor : events.back().seq;
        return ok({{"events", events}, {"next_cursor", next}});
    });
}

void RestServer::register_recordings() {
    auto& s = services_;

    route_post(R"(/calls/([A-Za-z0-9_-]+)/recording)", "start_recording",
               [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        const auto recording = s.recordings.start(req.matches[1].str(),
                                                  required(body, "initiated_by"),
                                                  parse_media_format(body.value("format", "audio")));
        return ok(recording, 201);
    });

    route_post(R"(/recordings/([A-Za-z0-9_-]+)/(pause|resume|stop))", "recording_action",
               [&s](const httplib::Request& req) {
        const auto recording_id = req.matches[1].str();
        const auto action = req.matches[2].str();
        if (action == "pause") {
            return ok(s.recordings.pause(recording_id));
        }
        if (action == "resume") {
            return ok(s.recordings.resume(recording_id));
        }
        return ok(s.recordings.stop(recording_id));
    });

    route_post(R"(/recordings/([A-Za-z0-9_-]+)/media)", "write_media",
               [&s](const httplib::Request& req) {
        s.recordings.write_media(req.matches[1].str(), req.body);
        return ok({{"accepted", req.body.size()}}, 202);
    });

    route_get(R"(/recordings/([A-Za-z0-9_-]+))", "get_recording",
              [&s](const httplib::Request& req) {
        const auto recording_id = req.matches[1].str();
        s.access.require(recording_id, actor(req), AccessAction::View, req.remote_addr);
        const auto view = s.recordings.status(recording_id);
        nlohmann::json body = view.recording;
        body["segments"] = view.segments;
        return ok(body);
    });

    route_get(R"(/recordings/([A-Za-z0-9_-]+)/segments/(\d+))", "download_segment",
              [&s](const httplib::Request& req) {
        const auto recording_id = req.matches[1].str();
        s.access.require(recording_id, actor(req), AccessAction::Download, req.remote_addr);
        RestResponse response;
        response.raw_body = s.recordings.read_segment(recording_id,
                                                      std::stoi(req.matches[2].str()));
        response.content_type = "application/octet-stream";
        return response;
    });

    route_get(R"(/recordings/([A-Za-z0-9_-]+)/access-log)", "access_log",
              [&s](const httplib::Request& req) {
        const auto user = s.store.find_user(actor(req));
        if (!user || !user->is_admin) {
            throw Unauthorized("access log requires administrative capability");
        }
        return ok({{"entries", s.access.access_log(req.matches[1].str())}});
    });

    route_get(R"(/users/([A-Za-z0-9_-]+)/recordings)", "user_recordings",
              [&s](const httplib::Request& req) {
        return ok({{"recordings", s.access.list_accessible_recordings(req.matches[1].str())}});
    });

    route_post(R"(/recordings/([A-Za-z0-9_-]+)/grants)", "create_grant",
               [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        if (!body.contains("ttl_sec") || !body["ttl_sec"].is_number_integer() ||
            body["ttl_sec"].get<int64_t>() <= 0) {
            throw std::invalid_argument("ttl_sec must be a positive integer");
        }
        const auto expires_at = s.clock.now() +
                                std::chrono::seconds(body["ttl_sec"].get<int64_t>());
        const auto grant = s.access.grant(req.matches[1].str(),
                                          required(body, "grantee_id"),
                                          parse_permission(body.value("permission", "view")),
                                          actor(req), expires_at);
        return ok(grant, 201);
    });

    route_post(R"(/recordings/([A-Za-z0-9_-]+)/legal-hold)", "legal_hold",
               [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        if (!body.contains("held") || !body["held"].is_boolean()) {
            throw std::invalid_argument("held must be a boolean");
        }
        return ok(s.recordings.set_legal_hold(req.matches[1].str(), actor(req),
                                              body["held"].get<bool>()));
    });

    route_delete(R"(/grants/([A-Za-z0-9_-]+))", "revoke_grant",
                 [&s](const httplib::Request& req) {
        return ok(s.access.revoke(req.matches[1].str(), actor(req)));
    });
}

void RestServer::register_admin() {
    auto& s = services_;

    route_put(R"(/admin/users/([A-Za-z0-9_-]+))", "upsert_user",
              [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        UserRecord user;
        user.id = req.matches[1].str();
        user.role = required(body, "role");
        user.is_admin = body.value("is_admin", false);
        s.store.upsert_user(user);
        return ok(user);
    });

    route_put(R"(/admin/rules/([A-Za-z0-9_-]+))", "upsert_rule",
              [&s](const httplib::Request& req) {
        auto body = parse_body(req);
        body["id"] = req.matches[1].str();
        const auto rule = rule_from_json(body);
        s.store.upsert_rule(rule);
        logging::info("Escalation rule saved", {kv("rule_id", rule.id)});
        return ok(rule);
    });

    route_get("/admin/rules", "list_rules", [&s](const httplib::Request&) {
        return ok({{"rules", s.store.rules()}});
    });

    route_get("/admin/settings", "get_settings", [&s](const httplib::Request&) {
        return ok(s.settings.current().to_map());
    });

    route_put("/admin/settings", "put_settings", [&s](const httplib::Request& req) {
        const auto body = parse_body(req);
        std::map<std::string, std::string> values;
        for (auto it = body.begin(); it != body.end(); ++it) {
            values[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
        }
        return ok(s.settings.update(values).to_map());
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    if (!payload.content_type.empty()) {
        response.set_content(payload.raw_body, payload.content_type);
        return;
    }
    response.set_content(payload.body.dump(), "application/json");
}

}
