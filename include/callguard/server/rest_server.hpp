#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "callguard/access/access_control.hpp"
#include "callguard/config.hpp"
#include "callguard/escalation/escalation_engine.hpp"
#include "callguard/events/event_stream.hpp"
#include "callguard/recording/recording_pipeline.hpp"
#include "callguard/session/session_manager.hpp"
#include "callguard/settings/settings.hpp"
#include "callguard/storage/store.hpp"
#include "callguard/utils/clock.hpp"

namespace callguard {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
    // Non-JSON payload, sent when content_type is set.
    std::string raw_body;
    std::string content_type;
};

struct Services {
    storage::Store& store;
    session::SessionManager& sessions;
    signaling::Relay& relay;
    recording::RecordingPipeline& recordings;
    escalation::EscalationEngine& escalations;
    access::AccessControl& access;
    events::EventStream& events;
    SettingsProvider& settings;
    const utils::Clock& clock;
};

// Maps an in-flight exception to the HTTP status and body returned to callers.
RestResponse error_response(const std::exception& ex);

class RestServer {
public:
    RestServer(const Config& config, Services services);
    ~RestServer();

    // Binds before returning; a configured port of 0 picks a free one.
    void start();
    void stop();
    int port() const { return port_; }

private:
    using Handler = std::function<RestResponse(const httplib::Request&)>;

    void route_get(const std::string& pattern, const std::string& name, Handler handler);
    void route_post(const std::string& pattern, const std::string& name, Handler handler);
    void route_put(const std::string& pattern, const std::string& name, Handler handler);
    void route_delete(const std::string& pattern, const std::string& name, Handler handler);
    httplib::Server::Handler wrap(const std::string& name, Handler handler);

    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;
    void register_calls();
    void register_recordings();
    void register_admin();

    const Config& config_;
    Services services_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    int port_ = 0;
};

}
