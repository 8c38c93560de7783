#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "callguard/errors.hpp"
#include "callguard/escalation/channels.hpp"
#include "callguard/escalation/dispatcher.hpp"
#include "test_support.hpp"

using namespace callguard;
using callguard::testing::Harness;
using namespace std::chrono_literals;

namespace {

EscalationRule make_rule(const std::string& id,
                         TriggerCondition trigger,
                         int threshold_seconds,
                         const std::string& role,
                         int priority = 1,
                         std::vector<std::string> channels = {"log"},
                         int cooldown_seconds = 0) {
    EscalationRule rule;
    rule.id = id;
    rule.trigger = trigger;
    rule.threshold_seconds = threshold_seconds;
    rule.escalate_to_role = role;
    rule.priority_level = priority;
    rule.notification_channels = std::move(channels);
    rule.cooldown_seconds = cooldown_seconds;
    return rule;
}

// Holds the first caller of now() until released.
class BlockingClock : public utils::Clock {
public:
    Timestamp now() const override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!blocked_once_) {
            blocked_once_ = true;
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [&]() { return released_; });
        }
        return from_millis(callguard::testing::kEpochMs);
    }

    void wait_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return entered_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable bool blocked_once_ = false;
    mutable bool entered_ = false;
    bool released_ = false;
};

// Fails the call update that follows the next escalation insert.
class FlakyStore : public storage::SqliteStore {
public:
    explicit FlakyStore(const std::string& path) : storage::SqliteStore(path) {}

    bool insert_escalation(const EscalationEvent& event) override {
        const bool inserted = storage::SqliteStore::insert_escalation(event);
        if (inserted && fail_after_escalation.exchange(false)) {
            fail_next_update = true;
        }
        return inserted;
    }

    void update_call(const CallSession& call) override {
        if (fail_next_update.exchange(false)) {
            throw StorageUnavailable("calls table locked");
        }
        storage::SqliteStore::update_call(call);
    }

    std::atomic<bool> fail_after_escalation{false};

private:
    std::atomic<bool> fail_next_update{false};
};

class ScriptedChannel : public escalation::NotificationChannel {
public:
    explicit ScriptedChannel(int failures) : failures_(failures) {}

    std::string name() const override { return "pager"; }

    escalation::SendResult send(const std::string& recipient,
                                const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        recipients.push_back(recipient);
        payloads.push_back(payload);
        if (failures_ > 0) {
            --failures_;
            return escalation::SendResult::failure("pager gateway returned 503");
        }
        return escalation::SendResult::success();
    }

    std::vector<std::string> recipients;
    std::vector<std::string> payloads;

private:
    std::mutex mutex_;
    int failures_;
};

}

TEST_CASE("unanswered call escalates once per rule") {
    Harness h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "supervisor"));
    const auto call = h.ringing_call();

    h.clock.advance_seconds(29);
    REQUIRE(h.engine.tick().raised == 0);

    h.clock.advance_seconds(2);
    const auto report = h.engine.tick();
    REQUIRE(report.raised == 1);
    REQUIRE(report.evaluated == 1);

    const auto escalations = h.engine.escalations_for(call.id);
    REQUIRE(escalations.size() == 1);
    REQUIRE(escalations[0].level == 1);
    REQUIRE(escalations[0].rule_id == "ring-30");

    const auto updated = h.sessions.get(call.id);
    REQUIRE(updated.escalation_level == 1);
    REQUIRE(updated.escalated_to == std::optional<std::string>("supervisor-1"));

    h.clock.advance_seconds(5);
    REQUIRE(h.engine.tick().raised == 0);
    REQUIRE(h.engine.escalations_for(call.id).size() == 1);
}

TEST_CASE("a later rule raises the next level") {
    Harness h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "supervisor", 1));
    h.store.upsert_rule(make_rule("ring-60", TriggerCondition::UnansweredTimeout, 60,
                                  "admin", 2));
    const auto call = h.ringing_call();

    h.clock.advance_seconds(61);
    REQUIRE(h.engine.tick().raised == 1);
    REQUIRE(h.engine.tick().raised == 1);
    REQUIRE(h.engine.tick().raised == 0);

    const auto escalations = h.engine.escalations_for(call.id);
    REQUIRE(escalations.size() == 2);
    REQUIRE(escalations[0].level == 1);
    REQUIRE(escalations[0].rule_id == "ring-30");
    REQUIRE(escalations[1].level == 2);
    REQUIRE(escalations[1].rule_id == "ring-60");
    REQUIRE(h.sessions.get(call.id).escalated_to == std::optional<std::string>("admin-1"));
}

TEST_CASE("cooldown delays the next escalation of a call") {
    Harness h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "supervisor", 1));
    h.store.upsert_rule(make_rule("ring-40", TriggerCondition::UnansweredTimeout, 40,
                                  "admin", 2, {"log"}, 45));
    const auto call = h.ringing_call();

    h.clock.advance_seconds(31);
    REQUIRE(h.engine.tick().raised == 1);
    h.clock.advance_seconds(30);
    REQUIRE(h.engine.tick().raised == 0);
    h.clock.advance_seconds(15);
    REQUIRE(h.engine.tick().raised == 1);
    REQUIRE(h.engine.escalations_for(call.id).size() == 2);
}

TEST_CASE("ringing past the ring timeout is marked missed") {
    Harness h;
    const auto call = h.ringing_call();
    h.clock.advance_seconds(89);
    REQUIRE(h.engine.tick().missed == 0);
    h.clock.advance_seconds(2);
    REQUIRE(h.engine.tick().missed == 1);

    const auto missed = h.sessions.get(call.id);
    REQUIRE(missed.status == CallStatus::Missed);
    REQUIRE(missed.end_reason == "ring_timeout");
    REQUIRE(h.engine.tick().evaluated == 0);
}

TEST_CASE("idle connected calls are expired by the tick") {
    Harness h;
    const auto call = h.connected_call();
    h.clock.advance_seconds(121);
    REQUIRE(h.engine.tick().expired == 1);
    REQUIRE(h.sessions.get(call.id).status == CallStatus::Failed);
}

TEST_CASE("flagged calls escalate after the flag threshold") {
    Harness h;
    h.store.upsert_rule(make_rule("flag-0", TriggerCondition::Flagged, 0, "supervisor", 3));
    h.store.upsert_rule(make_rule("flag-20", TriggerCondition::Flagged, 20, "admin", 3));
    const auto call = h.sessions.create("client-1", "reader-1", CallType::Emergency);

    REQUIRE(h.engine.tick().raised == 1);
    REQUIRE(h.sessions.get(call.id).escalation_level == 1);

    const auto plain = h.connected_call("client-2", "supervisor-1");
    REQUIRE(h.engine.tick().raised == 0);
    h.sessions.flag(plain.id, "distress");
    h.clock.advance_seconds(20);
    const auto report = h.engine.tick();
    REQUIRE(report.raised == 2);
    REQUIRE(h.sessions.get(call.id).escalation_level == 2);
    REQUIRE(h.sessions.get(plain.id).escalation_level == 1);
}

TEST_CASE("a silent endpoint on a connected call escalates") {
    Harness h;
    h.store.upsert_rule(make_rule("offline-60", TriggerCondition::EndpointOffline, 60,
                                  "supervisor"));
    const auto call = h.connected_call();

    h.clock.advance_seconds(50);
    h.sessions.heartbeat(call.id, "client-1");
    h.sessions.heartbeat(call.id, "reader-1");
    h.clock.advance_seconds(11);
    REQUIRE(h.engine.tick().raised == 0);

    h.clock.advance_seconds(50);
    h.sessions.heartbeat(call.id, "reader-1");
    REQUIRE(h.engine.tick().raised == 1);
}

TEST_CASE("acknowledge records the first acknowledger only") {
    Harness h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "supervisor"));
    const auto call = h.ringing_call();
    h.clock.advance_seconds(31);
    h.engine.tick();
    const auto event_id = h.engine.escalations_for(call.id).at(0).id;

    h.clock.advance_seconds(3);
    const auto acked = h.engine.acknowledge(event_id, "supervisor-1");
    REQUIRE(acked.acknowledged_by == std::optional<std::string>("supervisor-1"));
    REQUIRE(acked.acknowledged_at.has_value());

    const auto again = h.engine.acknowledge(event_id, "admin-1");
    REQUIRE(again.acknowledged_by == std::optional<std::string>("supervisor-1"));
    REQUIRE(again.acknowledged_at == acked.acknowledged_at);

    size_t acknowledgements = 0;
    for (const auto& type : h.event_types(call.id)) {
        if (type == "escalation.acknowledged") {
            ++acknowledgements;
        }
    }
    REQUIRE(acknowledgements == 1);

    REQUIRE_THROWS_AS(h.engine.acknowledge(event_id, ""), std::invalid_argument);
    REQUIRE_THROWS_AS(h.engine.acknowledge("missing", "supervisor-1"), NotFound);
}

TEST_CASE("an overlapping tick is skipped") {
    Harness h;
    BlockingClock clock;
    escalation::EscalationEngine engine(h.store, h.sessions, h.events, h.settings, clock,
                                        h.locks);

    auto first = std::async(std::launch::async, [&]() { return engine.tick(); });
    clock.wait_entered();
    const auto overlapping = engine.tick();
    REQUIRE(overlapping.skipped);
    clock.release();
    REQUIRE_FALSE(first.get().skipped);
    REQUIRE_FALSE(engine.tick().skipped);
}

TEST_CASE("dispatcher delivers notification jobs") {
    Harness h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "supervisor", 1, {"pager"}));
    auto pager = std::make_shared<ScriptedChannel>(0);
    escalation::ChannelRegistry registry;
    registry.add(pager);
    escalation::NotificationDispatcher dispatcher(h.store, registry, h.settings, h.clock);

    const auto call = h.ringing_call();
    h.clock.advance_seconds(31);
    h.engine.tick();
    const auto event_id = h.engine.escalations_for(call.id).at(0).id;

    REQUIRE(dispatcher.dispatch_due() == 1);
    REQUIRE(pager->recipients == std::vector<std::string>{"supervisor-1"});
    const auto payload = nlohmann::json::parse(pager->payloads.at(0));
    REQUIRE(payload.at("call_id").get<std::string>() == call.id);
    REQUIRE(payload.at("level").get<int>() == 1);

    const auto jobs = h.store.jobs_for_event(event_id);
    REQUIRE(jobs.size() == 1);
    REQUIRE(jobs[0].state == JobState::Done);
    REQUIRE(dispatcher.dispatch_due() == 0);
}

TEST_CASE("failed notifications back off and eventually die") {
    Harness h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "night-shift", 1, {"pager"}));
    auto pager = std::make_shared<ScriptedChannel>(10);
    escalation::ChannelRegistry registry;
    registry.add(pager);
    escalation::NotificationDispatcher dispatcher(h.store, registry, h.settings, h.clock);

    const auto call = h.ringing_call();
    h.clock.advance_seconds(31);
    h.engine.tick();
    const auto event_id = h.engine.escalations_for(call.id).at(0).id;

    REQUIRE(dispatcher.dispatch_due() == 1);
    REQUIRE(pager->recipients == std::vector<std::string>{"role:night-shift"});
    auto job = h.store.jobs_for_event(event_id).at(0);
    REQUIRE(job.state == JobState::Pending);
    REQUIRE(job.attempts == 1);
    REQUIRE(job.last_error == "pager gateway returned 503");

    REQUIRE(dispatcher.dispatch_due() == 0);
    h.clock.advance_seconds(5);
    REQUIRE(dispatcher.dispatch_due() == 1);
    h.clock.advance_seconds(9);
    REQUIRE(dispatcher.dispatch_due() == 0);
    h.clock.advance_seconds(1);
    REQUIRE(dispatcher.dispatch_due() == 1);

    job = h.store.jobs_for_event(event_id).at(0);
    REQUIRE(job.state == JobState::Dead);
    REQUIRE(job.attempts == 3);
    h.clock.advance_seconds(3600);
    REQUIRE(dispatcher.dispatch_due() == 0);
}

TEST_CASE("jobs for an unregistered channel count as failures") {
    Harness h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "supervisor", 1, {"sms"}));
    escalation::ChannelRegistry registry;
    escalation::NotificationDispatcher dispatcher(h.store, registry, h.settings, h.clock);

    const auto call = h.ringing_call();
    h.clock.advance_seconds(31);
    h.engine.tick();
    const auto event_id = h.engine.escalations_for(call.id).at(0).id;

    REQUIRE(dispatcher.dispatch_due() == 1);
    const auto job = h.store.jobs_for_event(event_id).at(0);
    REQUIRE(job.attempts == 1);
    REQUIRE(job.last_error == "unknown channel: sms");
}

TEST_CASE("a failed escalation leaves no partial state and is retried") {
    callguard::testing::BasicHarness<FlakyStore> h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "supervisor", 1));
    h.store.upsert_rule(make_rule("ring-60", TriggerCondition::UnansweredTimeout, 60,
                                  "admin", 2));
    const auto call = h.ringing_call();

    h.clock.advance_seconds(31);
    h.store.fail_after_escalation = true;
    REQUIRE(h.engine.tick().raised == 0);
    REQUIRE(h.engine.escalations_for(call.id).empty());
    REQUIRE(h.sessions.get(call.id).escalation_level == 0);
    REQUIRE(h.store.due_jobs(h.clock.now(), 100).empty());

    REQUIRE(h.engine.tick().raised == 1);
    auto escalations = h.engine.escalations_for(call.id);
    REQUIRE(escalations.size() == 1);
    REQUIRE(escalations[0].level == 1);
    REQUIRE(h.store.jobs_for_event(escalations[0].id).size() == 1);
    REQUIRE(h.sessions.get(call.id).escalation_level == 1);

    h.clock.advance_seconds(40);
    REQUIRE(h.engine.tick().raised == 1);
    escalations = h.engine.escalations_for(call.id);
    REQUIRE(escalations.size() == 2);
    REQUIRE(escalations[1].rule_id == "ring-60");
    REQUIRE(escalations[1].level == 2);
    REQUIRE(h.store.jobs_for_event(escalations[1].id).size() == 1);
}

TEST_CASE("an escalated call can still be answered") {
    Harness h;
    h.store.upsert_rule(make_rule("ring-30", TriggerCondition::UnansweredTimeout, 30,
                                  "supervisor"));
    const auto call = h.ringing_call();
    h.clock.advance_seconds(31);
    REQUIRE(h.engine.tick().raised == 1);

    const auto answered =
        h.sessions.relay_signal(call.id, "reader-1", SignalKind::Answer, "v=0 answer").call;
    REQUIRE(answered.status == CallStatus::Connected);
    REQUIRE(answered.escalation_level == 1);
    REQUIRE(answered.escalated_to == std::optional<std::string>("supervisor-1"));

    const auto stored = h.sessions.get(call.id);
    REQUIRE(stored.status == CallStatus::Connected);
    REQUIRE(stored.escalation_level == 1);
    REQUIRE(stored.answered_at.has_value());

    h.clock.advance_seconds(60);
    REQUIRE(h.engine.tick().raised == 0);
}
