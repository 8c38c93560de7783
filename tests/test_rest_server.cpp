#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "callguard/errors.hpp"
#include "callguard/server/rest_server.hpp"
#include "test_support.hpp"

using namespace callguard;
using callguard::testing::Harness;

namespace {

int status_of(const std::exception& ex) {
    return error_response(ex).status;
}

Config loopback_config() {
    Config config;
    config.rest_api_host = "127.0.0.1";
    config.rest_api_port = 0;
    return config;
}

// REST server over a harness, bound to a free loopback port.
struct Api {
    explicit Api(Harness& h)
        : config(loopback_config()),
          server(config, Services{h.store, h.sessions, h.relay, h.recordings, h.engine,
                                  h.access, h.events, h.settings, h.clock}) {
        server.start();
    }

    httplib::Client client() const {
        httplib::Client client("127.0.0.1", server.port());
        client.set_read_timeout(10, 0);
        return client;
    }

    Config config;
    RestServer server;
};

httplib::Headers as_user(const std::string& user_id) {
    return {{"X-User-Id", user_id}};
}

nlohmann::json body_of(const httplib::Result& result) {
    REQUIRE(result);
    return nlohmann::json::parse(result->body);
}

}

TEST_CASE("domain errors map to HTTP statuses") {
    REQUIRE(status_of(InvalidParticipants("x")) == 400);
    REQUIRE(status_of(SessionClosed("x")) == 409);
    REQUIRE(status_of(InvalidStateTransition("x")) == 409);
    REQUIRE(status_of(ConsentRequired("x")) == 409);
    REQUIRE(status_of(Unauthorized("x")) == 403);
    REQUIRE(status_of(NotFound("x")) == 404);
    REQUIRE(status_of(StorageUnavailable("x")) == 503);
    REQUIRE(status_of(UploadExhausted("x")) == 500);
    REQUIRE(status_of(std::invalid_argument("x")) == 400);
    REQUIRE(status_of(std::runtime_error("x")) == 500);
}

TEST_CASE("malformed JSON is a client error") {
    try {
        (void)nlohmann::json::parse("{not json");
        FAIL("parse should throw");
    } catch (const nlohmann::json::exception& ex) {
        const auto response = error_response(ex);
        REQUIRE(response.status == 400);
        REQUIRE(response.body.at("error").get<std::string>() == "invalid_request");
    }
}

TEST_CASE("error bodies carry a code and the message") {
    const auto response = error_response(SessionClosed("call c-1 is ended"));
    REQUIRE(response.body.at("error").get<std::string>() == "session_closed");
    REQUIRE(response.body.at("message").get<std::string>() == "call c-1 is ended");
    REQUIRE(response.content_type.empty());
}

TEST_CASE("calls are created and read back over HTTP") {
    Harness h;
    Api api(h);
    auto client = api.client();

    const auto created = client.Post(
        "/calls", R"({"initiator_id":"client-1","counterpart_id":"reader-1"})",
        "application/json");
    REQUIRE(created);
    REQUIRE(created->status == 201);
    const auto call_id = body_of(created).at("id").get<std::string>();
    REQUIRE(body_of(created).at("status").get<std::string>() == "initiated");

    const auto fetched = client.Get("/calls/" + call_id);
    REQUIRE(fetched->status == 200);
    REQUIRE(body_of(fetched).at("counterpart_id").get<std::string>() == "reader-1");

    const auto missing = client.Get("/calls/nope");
    REQUIRE(missing->status == 404);
    REQUIRE(body_of(missing).at("error").get<std::string>() == "not_found");

    const auto invalid = client.Post("/calls", "{not json", "application/json");
    REQUIRE(invalid->status == 400);
}

TEST_CASE("signal polling on a finished call reports closed at once") {
    Harness h;
    Api api(h);
    auto client = api.client();
    const auto call = h.connected_call();
    h.sessions.end(call.id, "completed");
    h.relay.collect_garbage(h.clock.now() - std::chrono::hours(1));
    const auto channels = h.relay.channel_count();

    const auto started = std::chrono::steady_clock::now();
    const auto polled =
        client.Get("/calls/" + call.id + "/signals?recipient=reader-1&wait_ms=5000");
    REQUIRE(polled->status == 200);
    REQUIRE(body_of(polled).at("closed").get<bool>());
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    REQUIRE(h.relay.channel_count() == channels);
}

TEST_CASE("recording over HTTP needs consent from both sides") {
    Harness h;
    Api api(h);
    auto client = api.client();
    const auto call = h.connected_call();
    const auto path = "/calls/" + call.id;

    const auto refused = client.Post(path + "/recording", R"({"initiated_by":"reader-1"})",
                                     "application/json");
    REQUIRE(refused->status == 409);
    REQUIRE(body_of(refused).at("error").get<std::string>() == "consent_required");

    for (const auto* user : {"client-1", "reader-1"}) {
        const auto consent = client.Post(path + "/consent", as_user(user),
                                         R"({"type":"recording","status":"given"})",
                                         "application/json");
        REQUIRE(consent->status == 201);
        REQUIRE(body_of(consent).at("user_id").get<std::string>() == user);
    }
    const auto listed = client.Get(path + "/consent");
    REQUIRE(body_of(listed).at("consents").size() == 2);

    const auto started = client.Post(path + "/recording", R"({"initiated_by":"reader-1"})",
                                     "application/json");
    REQUIRE(started->status == 201);
    REQUIRE(body_of(started).at("consent_verified").get<bool>());
}

TEST_CASE("grant expiry and legal hold follow the service clock") {
    Harness h;
    Api api(h);
    auto client = api.client();
    const auto call = h.recordable_call();
    const auto recording = h.recordings.start(call.id, "reader-1", MediaFormat::Audio);
    h.recordings.stop(recording.id);
    h.recordings.drain();

    const auto granted = client.Post("/recordings/" + recording.id + "/grants",
                                     as_user("admin-1"),
                                     R"({"grantee_id":"supervisor-1","ttl_sec":60})",
                                     "application/json");
    REQUIRE(granted->status == 201);
    const auto grant = h.store.find_grant(body_of(granted).at("id").get<std::string>());
    REQUIRE(grant.has_value());
    REQUIRE(grant->expires_at == h.clock.now() + std::chrono::seconds(60));

    const auto denied = client.Post("/recordings/" + recording.id + "/legal-hold",
                                    as_user("client-1"), R"({"held":true})", "application/json");
    REQUIRE(denied->status == 403);
    const auto held = client.Post("/recordings/" + recording.id + "/legal-hold",
                                  as_user("admin-1"), R"({"held":true})", "application/json");
    REQUIRE(held->status == 200);
    REQUIRE(body_of(held).at("legal_hold").get<bool>());
    REQUIRE(h.store.find_recording(recording.id)->legal_hold);
}
