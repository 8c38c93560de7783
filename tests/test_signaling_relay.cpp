#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <thread>

#include "callguard/errors.hpp"
#include "test_support.hpp"

using namespace callguard;
using callguard::testing::Harness;
using namespace std::chrono_literals;

TEST_CASE("fetch returns the peer's messages in order and consumes them") {
    Harness h;
    const auto call = h.connected_call();
    h.sessions.relay_signal(call.id, "client-1", SignalKind::IceCandidate, "candidate:1");
    h.sessions.relay_signal(call.id, "client-1", SignalKind::IceCandidate, "candidate:2");

    const auto for_reader = h.relay.fetch(call.id, "reader-1");
    REQUIRE(for_reader.size() == 3);
    REQUIRE(for_reader[0].kind == SignalKind::Offer);
    REQUIRE(for_reader[1].payload == "candidate:1");
    REQUIRE(for_reader[2].payload == "candidate:2");
    REQUIRE(for_reader[0].id < for_reader[1].id);

    REQUIRE(h.relay.fetch(call.id, "reader-1").empty());

    const auto for_client = h.relay.fetch(call.id, "client-1");
    REQUIRE(for_client.size() == 1);
    REQUIRE(for_client[0].kind == SignalKind::Answer);
    REQUIRE(for_client[0].sender_id == "reader-1");
}

TEST_CASE("wait wakes up when the peer appends a message") {
    Harness h;
    const auto call = h.connected_call();
    h.relay.fetch(call.id, "reader-1");

    auto waiter = std::async(std::launch::async, [&]() {
        return h.relay.wait(call.id, "reader-1", 5000ms);
    });
    std::this_thread::sleep_for(50ms);
    h.sessions.relay_signal(call.id, "client-1", SignalKind::IceCandidate, "candidate:late");

    const auto delivery = waiter.get();
    REQUIRE_FALSE(delivery.closed);
    REQUIRE(delivery.messages.size() == 1);
    REQUIRE(delivery.messages[0].payload == "candidate:late");
}

TEST_CASE("ending the call cancels a pending wait") {
    Harness h;
    const auto call = h.connected_call();
    h.relay.fetch(call.id, "reader-1");

    auto waiter = std::async(std::launch::async, [&]() {
        return h.relay.wait(call.id, "reader-1", 5000ms);
    });
    std::this_thread::sleep_for(50ms);
    h.sessions.end(call.id, "completed");

    const auto delivery = waiter.get();
    REQUIRE(delivery.closed);
    REQUIRE(delivery.messages.empty());
}

TEST_CASE("wait on a closed channel returns immediately") {
    Harness h;
    const auto call = h.connected_call();
    h.relay.fetch(call.id, "reader-1");
    h.sessions.end(call.id, "completed");

    const auto started = std::chrono::steady_clock::now();
    const auto delivery = h.relay.wait(call.id, "reader-1", 5000ms);
    REQUIRE(delivery.closed);
    REQUIRE(std::chrono::steady_clock::now() - started < 1000ms);
}

TEST_CASE("wait times out with no messages") {
    Harness h;
    const auto call = h.connected_call();
    h.relay.fetch(call.id, "client-1");
    const auto delivery = h.relay.wait(call.id, "client-1", 30ms);
    REQUIRE_FALSE(delivery.closed);
    REQUIRE(delivery.messages.empty());
}

TEST_CASE("append to a closed channel is rejected") {
    Harness h;
    const auto call = h.connected_call();
    h.sessions.end(call.id, "completed");

    SignalingMessage message;
    message.call_id = call.id;
    message.sender_id = "client-1";
    message.kind = SignalKind::IceCandidate;
    message.payload = "late";
    message.created_at = h.clock.now();
    REQUIRE_THROWS_AS(h.relay.append(message), SessionClosed);
}

TEST_CASE("garbage collection purges messages of long-finished calls") {
    Harness h;
    const auto finished = h.connected_call("client-1", "reader-1");
    const auto live = h.connected_call("client-2", "supervisor-1");
    h.sessions.end(finished.id, "completed");
    h.clock.advance_seconds(10);

    REQUIRE(h.relay.collect_garbage(h.clock.now() - std::chrono::seconds(60)) == 0);
    REQUIRE(h.store.signals_for(finished.id).size() == 2);

    REQUIRE(h.relay.collect_garbage(h.clock.now()) == 2);
    REQUIRE(h.store.signals_for(finished.id).empty());
    REQUIRE(h.store.signals_for(live.id).size() == 2);
    REQUIRE(h.relay.is_open(live.id));
}

TEST_CASE("collected channels stay closed and are not recreated") {
    Harness h;
    const auto call = h.connected_call();
    h.sessions.end(call.id, "completed");
    h.relay.collect_garbage(h.clock.now() - std::chrono::seconds(60));
    const auto channels = h.relay.channel_count();

    const auto started = std::chrono::steady_clock::now();
    const auto delivery = h.relay.wait(call.id, "reader-1", 5000ms);
    REQUIRE(delivery.closed);
    REQUIRE(std::chrono::steady_clock::now() - started < 1000ms);
    REQUIRE(h.relay.wait("never-opened", "reader-1", 5000ms).closed);
    h.relay.fetch(call.id, "reader-1");
    h.relay.close("never-opened");
    REQUIRE(h.relay.channel_count() == channels);
    REQUIRE_FALSE(h.relay.is_open(call.id));

    SignalingMessage message;
    message.call_id = call.id;
    message.sender_id = "client-1";
    message.kind = SignalKind::IceCandidate;
    message.created_at = h.clock.now();
    REQUIRE_THROWS_AS(h.relay.append(message), SessionClosed);
}
