#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "callguard/errors.hpp"
#include "test_support.hpp"

using namespace callguard;
using callguard::testing::Harness;

namespace {

size_t count_of(const std::vector<std::string>& types, const std::string& type) {
    return static_cast<size_t>(std::count(types.begin(), types.end(), type));
}

}

TEST_CASE("create rejects unusable participant pairs") {
    Harness h;
    REQUIRE_THROWS_AS(h.sessions.create("client-1", "client-1"), InvalidParticipants);
    REQUIRE_THROWS_AS(h.sessions.create("client-1", ""), InvalidParticipants);
    REQUIRE_THROWS_AS(h.sessions.create("ghost", "reader-1"), InvalidParticipants);
    REQUIRE_THROWS_AS(h.sessions.create("client-1", "ghost"), InvalidParticipants);
    REQUIRE(h.sessions.list_active().empty());
}

TEST_CASE("create rejects a second live call for the same initiator") {
    Harness h;
    const auto first = h.sessions.create("client-1", "reader-1");
    REQUIRE(first.status == CallStatus::Initiated);
    REQUIRE_THROWS_AS(h.sessions.create("client-1", "supervisor-1"), InvalidParticipants);

    h.sessions.end(first.id, "cancelled");
    const auto second = h.sessions.create("client-1", "supervisor-1");
    REQUIRE(second.id != first.id);
}

TEST_CASE("create requires the context to be a JSON object") {
    Harness h;
    REQUIRE_THROWS_AS(h.sessions.create("client-1", "reader-1", CallType::Scheduled, "[1,2]"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(h.sessions.create("client-1", "reader-1", CallType::Scheduled, "{oops"),
                      std::invalid_argument);
    const auto call =
        h.sessions.create("client-1", "reader-1", CallType::Scheduled, R"({"topic":"tarot"})");
    REQUIRE(call.context == R"({"topic":"tarot"})");
}

TEST_CASE("offer moves an initiated call to ringing once") {
    Harness h;
    const auto call = h.sessions.create("client-1", "reader-1");
    auto result = h.sessions.relay_signal(call.id, "client-1", SignalKind::Offer, "sdp-1");
    REQUIRE(result.call.status == CallStatus::Ringing);
    REQUIRE(result.message_id > 0);

    result = h.sessions.relay_signal(call.id, "client-1", SignalKind::Offer, "sdp-2");
    REQUIRE(result.call.status == CallStatus::Ringing);
    REQUIRE(count_of(h.event_types(call.id), "call.ringing") == 1);
}

TEST_CASE("answer connects a ringing call") {
    Harness h;
    const auto call = h.connected_call();
    REQUIRE(call.status == CallStatus::Connected);
    REQUIRE(call.answered_at.has_value());
    REQUIRE(call.counterpart_seen_at.has_value());

    const auto types = h.event_types(call.id);
    REQUIRE(types == std::vector<std::string>{"call.ringing", "call.connected"});
}

TEST_CASE("answer before offer passes through ringing") {
    Harness h;
    const auto call = h.sessions.create("client-1", "reader-1");
    const auto result =
        h.sessions.relay_signal(call.id, "reader-1", SignalKind::Answer, "sdp-answer");
    REQUIRE(result.call.status == CallStatus::Connected);
    REQUIRE(h.event_types(call.id) ==
            std::vector<std::string>{"call.ringing", "call.connected"});
}

TEST_CASE("ice candidates leave the state unchanged but refresh activity") {
    Harness h;
    const auto call = h.connected_call();
    h.clock.advance_seconds(30);
    const auto result =
        h.sessions.relay_signal(call.id, "client-1", SignalKind::IceCandidate, "candidate:1");
    REQUIRE(result.call.status == CallStatus::Connected);
    REQUIRE(result.call.last_activity_at > call.last_activity_at);
}

TEST_CASE("end is idempotent and emits one event") {
    Harness h;
    const auto call = h.connected_call();
    const auto ended = h.sessions.end(call.id, "completed");
    REQUIRE(ended.status == CallStatus::Ended);
    REQUIRE(ended.end_reason == "completed");
    REQUIRE(ended.ended_at.has_value());

    const auto again = h.sessions.end(call.id, "completed");
    REQUIRE(again.status == CallStatus::Ended);
    REQUIRE(count_of(h.event_types(call.id), "call.ended") == 1);
    REQUIRE_FALSE(h.relay.is_open(call.id));
}

TEST_CASE("signals on a terminated call are rejected") {
    Harness h;
    const auto call = h.connected_call();
    h.sessions.end(call.id, "completed");
    REQUIRE_THROWS_AS(
        h.sessions.relay_signal(call.id, "client-1", SignalKind::IceCandidate, "late"),
        SessionClosed);
    REQUIRE_THROWS_AS(h.sessions.heartbeat(call.id, "client-1"), SessionClosed);
    REQUIRE_THROWS_AS(h.sessions.flag(call.id, "urgent"), SessionClosed);
}

TEST_CASE("hangup ends the call") {
    Harness h;
    const auto call = h.connected_call();
    const auto result = h.sessions.relay_signal(call.id, "reader-1", SignalKind::Hangup, "");
    REQUIRE(result.call.status == CallStatus::Ended);
    REQUIRE(result.call.end_reason == "hangup");
}

TEST_CASE("a second hangup on an ended call is a no-op") {
    Harness h;
    const auto call = h.connected_call();
    h.sessions.relay_signal(call.id, "reader-1", SignalKind::Hangup, "");
    const auto signals = h.store.signals_for(call.id).size();

    const auto again = h.sessions.relay_signal(call.id, "client-1", SignalKind::Hangup, "");
    REQUIRE(again.message_id == 0);
    REQUIRE(again.call.status == CallStatus::Ended);
    REQUIRE(again.call.end_reason == "hangup");
    REQUIRE(h.store.signals_for(call.id).size() == signals);
    REQUIRE(count_of(h.event_types(call.id), "call.ended") == 1);

    REQUIRE_THROWS_AS(h.sessions.relay_signal(call.id, "client-2", SignalKind::Hangup, ""),
                      InvalidParticipants);
}

TEST_CASE("only participants may signal") {
    Harness h;
    const auto call = h.connected_call();
    REQUIRE_THROWS_AS(
        h.sessions.relay_signal(call.id, "client-2", SignalKind::IceCandidate, "x"),
        InvalidParticipants);
    REQUIRE_THROWS_AS(h.sessions.heartbeat(call.id, "client-2"), InvalidParticipants);
    REQUIRE_THROWS_AS(
        h.sessions.relay_signal("missing", "client-1", SignalKind::Offer, "x"), NotFound);
}

TEST_CASE("mark_missed applies only to ringing calls") {
    Harness h;
    const auto ringing = h.ringing_call();
    const auto missed = h.sessions.mark_missed(ringing.id);
    REQUIRE(missed.status == CallStatus::Missed);
    REQUIRE(missed.end_reason == "ring_timeout");
    REQUIRE(h.sessions.mark_missed(ringing.id).status == CallStatus::Missed);

    const auto connected = h.connected_call("client-2", "reader-1");
    REQUIRE_THROWS_AS(h.sessions.mark_missed(connected.id), InvalidStateTransition);
}

TEST_CASE("expire_idle fails calls without recent signaling") {
    Harness h;
    const auto quiet = h.connected_call("client-1", "reader-1");
    h.clock.advance_seconds(100);
    const auto busy = h.connected_call("client-2", "supervisor-1");
    h.clock.advance_seconds(30);

    REQUIRE(h.sessions.expire_idle(h.clock.now()) == 1);
    const auto expired = h.sessions.get(quiet.id);
    REQUIRE(expired.status == CallStatus::Failed);
    REQUIRE(expired.end_reason == "signaling_idle_timeout");
    REQUIRE(h.sessions.get(busy.id).status == CallStatus::Connected);
    REQUIRE(h.sessions.expire_idle(h.clock.now()) == 0);
}

TEST_CASE("heartbeat keeps a quiet call alive") {
    Harness h;
    const auto call = h.connected_call();
    h.clock.advance_seconds(100);
    h.sessions.heartbeat(call.id, "reader-1");
    h.clock.advance_seconds(30);
    REQUIRE(h.sessions.expire_idle(h.clock.now()) == 0);
}

TEST_CASE("emergency calls are flagged at creation") {
    Harness h;
    const auto call = h.sessions.create("client-1", "reader-1", CallType::Emergency);
    REQUIRE(call.flagged_at.has_value());
    REQUIRE(call.flag_reason == "emergency");
    REQUIRE(h.event_types(call.id) == std::vector<std::string>{"call.flagged"});
}

TEST_CASE("flag is recorded once") {
    Harness h;
    const auto call = h.connected_call();
    const auto flagged = h.sessions.flag(call.id, "distress");
    REQUIRE(flagged.flag_reason == "distress");
    const auto again = h.sessions.flag(call.id, "other");
    REQUIRE(again.flag_reason == "distress");
    REQUIRE(again.flagged_at == flagged.flagged_at);
    REQUIRE(count_of(h.event_types(call.id), "call.flagged") == 1);
}

TEST_CASE("event stream resumes from a cursor") {
    Harness h;
    const auto call = h.connected_call();
    const auto all = h.events.read(0, 100);
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].seq < all[1].seq);

    const auto rest = h.events.read(all[0].seq, 100);
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].type == "call.connected");
    REQUIRE(rest[0].call_id == call.id);

    h.sessions.end(call.id, "completed");
    const auto tail = h.events.read(all[1].seq, 100);
    REQUIRE(tail.size() == 1);
    REQUIRE(tail[0].type == "call.ended");
}

TEST_CASE("restore reopens channels of live calls") {
    Harness h;
    const auto live = h.connected_call();
    h.relay.close(live.id);
    REQUIRE_FALSE(h.relay.is_open(live.id));
    h.sessions.restore();
    REQUIRE(h.relay.is_open(live.id));
}

TEST_CASE("consent is logged per participant and the latest entry wins") {
    Harness h;
    const auto call = h.connected_call();
    const auto given = h.sessions.record_consent(call.id, "client-1", ConsentType::Recording,
                                                 ConsentStatus::Given, "verbal", "10.0.0.7");
    REQUIRE(given.id > 0);
    REQUIRE(given.method == "verbal");
    REQUIRE(given.source_address == "10.0.0.7");
    h.sessions.record_consent(call.id, "client-1", ConsentType::Recording,
                              ConsentStatus::Withdrawn);

    const auto latest = h.store.latest_consent(call.id, "client-1", ConsentType::Recording);
    REQUIRE(latest.has_value());
    REQUIRE(latest->status == ConsentStatus::Withdrawn);
    REQUIRE_FALSE(h.store.latest_consent(call.id, "reader-1", ConsentType::Recording));
    REQUIRE(h.sessions.consents(call.id).size() == 2);
    REQUIRE(count_of(h.event_types(call.id), "call.consent_withdrawn") == 1);

    REQUIRE_THROWS_AS(h.sessions.record_consent(call.id, "client-2", ConsentType::Recording,
                                                ConsentStatus::Given),
                      InvalidParticipants);
    REQUIRE_THROWS_AS(h.sessions.record_consent("missing", "client-1", ConsentType::Recording,
                                                ConsentStatus::Given),
                      NotFound);
}

TEST_CASE("consent can be withdrawn but not given after the call ends") {
    Harness h;
    const auto call = h.connected_call();
    h.sessions.end(call.id, "completed");
    REQUIRE_THROWS_AS(h.sessions.record_consent(call.id, "reader-1", ConsentType::DataSharing,
                                                ConsentStatus::Given),
                      SessionClosed);
    const auto withdrawn = h.sessions.record_consent(call.id, "reader-1",
                                                     ConsentType::DataSharing,
                                                     ConsentStatus::Withdrawn);
    REQUIRE(withdrawn.type == ConsentType::DataSharing);
    REQUIRE(h.sessions.consents(call.id).size() == 1);
}
