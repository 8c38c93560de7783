#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "callguard/errors.hpp"
#include "test_support.hpp"

using namespace callguard;
using callguard::testing::Harness;

namespace {

Recording ready_recording(Harness& h,
                          const std::string& initiator = "client-1",
                          const std::string& counterpart = "reader-1") {
    const auto call = h.recordable_call(initiator, counterpart);
    const auto recording = h.recordings.start(call.id, counterpart, MediaFormat::Audio);
    h.recordings.write_media(recording.id, "session audio");
    h.recordings.stop(recording.id);
    h.recordings.drain();
    return h.recordings.status(recording.id).recording;
}

bool contains(const std::vector<Recording>& recordings, const std::string& id) {
    return std::any_of(recordings.begin(), recordings.end(),
                       [&](const Recording& r) { return r.id == id; });
}

class FailingAuditStore : public storage::SqliteStore {
public:
    FailingAuditStore() : storage::SqliteStore(":memory:") {}

    int64_t append_access_log(const AccessLogEntry& entry) override {
        if (fail_audit) {
            throw StorageUnavailable("audit table locked");
        }
        return storage::SqliteStore::append_access_log(entry);
    }

    std::atomic<bool> fail_audit{false};
};

}

TEST_CASE("participants may view and download their recording") {
    Harness h;
    const auto recording = ready_recording(h);

    const auto view = h.access.authorize(recording.id, "client-1", AccessAction::View, "10.0.0.5");
    REQUIRE(view.allowed);
    REQUIRE(view.code == access::DecisionCode::Ok);
    REQUIRE(h.access.authorize(recording.id, "reader-1", AccessAction::Download).allowed);

    const auto log = h.access.access_log(recording.id);
    REQUIRE(log.size() == 2);
    REQUIRE(log[0].accessor_id == "client-1");
    REQUIRE(log[0].action == AccessAction::View);
    REQUIRE(log[0].allowed);
    REQUIRE(log[0].source_address == "10.0.0.5");
}

TEST_CASE("outsiders are denied and the denial is audited") {
    Harness h;
    const auto recording = ready_recording(h);

    const auto decision = h.access.authorize(recording.id, "client-2", AccessAction::View);
    REQUIRE_FALSE(decision.allowed);
    REQUIRE(decision.code == access::DecisionCode::Unauthorized);
    REQUIRE_THROWS_AS(h.access.require(recording.id, "client-2", AccessAction::Download),
                      Unauthorized);

    const auto log = h.access.access_log(recording.id);
    REQUIRE(log.size() == 2);
    for (const auto& entry : log) {
        REQUIRE(entry.accessor_id == "client-2");
        REQUIRE_FALSE(entry.allowed);
    }
}

TEST_CASE("unknown recordings are denied for non-admins") {
    Harness h;
    REQUIRE(h.access.authorize("missing", "client-1", AccessAction::View).code ==
            access::DecisionCode::Unauthorized);
    REQUIRE(h.access.access_log("missing").size() == 1);
}

TEST_CASE("administrators may access any recording") {
    Harness h;
    const auto recording = ready_recording(h);
    REQUIRE(h.access.authorize(recording.id, "admin-1", AccessAction::Download).allowed);
}

TEST_CASE("grants allow access until they expire or are revoked") {
    Harness h;
    const auto recording = ready_recording(h);
    const auto expires = h.clock.now() + std::chrono::hours(1);

    const auto view_grant = h.access.grant(recording.id, "client-2", Permission::View,
                                           "admin-1", expires);
    REQUIRE(h.access.authorize(recording.id, "client-2", AccessAction::View).allowed);
    REQUIRE_FALSE(h.access.authorize(recording.id, "client-2", AccessAction::Download).allowed);

    h.access.grant(recording.id, "supervisor-1", Permission::Download, "admin-1", expires);
    REQUIRE(h.access.authorize(recording.id, "supervisor-1", AccessAction::View).allowed);
    REQUIRE(h.access.authorize(recording.id, "supervisor-1", AccessAction::Download).allowed);

    h.access.revoke(view_grant.id, "admin-1");
    REQUIRE_FALSE(h.access.authorize(recording.id, "client-2", AccessAction::View).allowed);

    h.clock.advance(std::chrono::hours(1));
    REQUIRE_FALSE(h.access.authorize(recording.id, "supervisor-1", AccessAction::View).allowed);
}

TEST_CASE("grant management requires an administrator") {
    Harness h;
    const auto recording = ready_recording(h);
    const auto expires = h.clock.now() + std::chrono::hours(1);

    REQUIRE_THROWS_AS(
        h.access.grant(recording.id, "client-2", Permission::View, "reader-1", expires),
        Unauthorized);
    REQUIRE_THROWS_AS(
        h.access.grant("missing", "client-2", Permission::View, "admin-1", expires), NotFound);
    REQUIRE_THROWS_AS(
        h.access.grant(recording.id, "client-2", Permission::View, "admin-1", h.clock.now()),
        std::invalid_argument);

    const auto grant =
        h.access.grant(recording.id, "client-2", Permission::View, "admin-1", expires);
    REQUIRE_THROWS_AS(h.access.revoke(grant.id, "client-1"), Unauthorized);
    REQUIRE_THROWS_AS(h.access.revoke("missing", "admin-1"), NotFound);
}

TEST_CASE("a failed audit write denies access") {
    callguard::testing::ManualClock clock;
    FailingAuditStore store;
    store.upsert_user({"admin-1", "admin", true});
    access::AccessControl control(store, clock);

    REQUIRE(control.authorize("rec-1", "admin-1", AccessAction::View).allowed);

    store.fail_audit = true;
    const auto decision = control.authorize("rec-1", "admin-1", AccessAction::View);
    REQUIRE_FALSE(decision.allowed);
    REQUIRE(decision.code == access::DecisionCode::Unavailable);
    REQUIRE_THROWS_AS(control.require("rec-1", "admin-1", AccessAction::Download),
                      StorageUnavailable);

    store.fail_audit = false;
    REQUIRE(control.access_log("rec-1").size() == 1);
}

TEST_CASE("accessible recordings combine participation and live grants") {
    Harness h;
    const auto own = ready_recording(h, "client-1", "reader-1");
    const auto other = ready_recording(h, "client-2", "supervisor-1");

    auto visible = h.access.list_accessible_recordings("client-1");
    REQUIRE(visible.size() == 1);
    REQUIRE(contains(visible, own.id));

    h.access.grant(other.id, "client-1", Permission::View, "admin-1",
                   h.clock.now() + std::chrono::minutes(10));
    visible = h.access.list_accessible_recordings("client-1");
    REQUIRE(visible.size() == 2);
    REQUIRE(contains(visible, other.id));

    REQUIRE(h.access.list_accessible_recordings("reader-1").size() == 1);
    REQUIRE(h.access.list_accessible_recordings("admin-1").size() == 2);

    h.clock.advance(std::chrono::minutes(10));
    REQUIRE(h.access.list_accessible_recordings("client-1").size() == 1);
}
