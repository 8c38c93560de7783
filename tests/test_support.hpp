#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "callguard/access/access_control.hpp"
#include "callguard/escalation/escalation_engine.hpp"
#include "callguard/events/event_stream.hpp"
#include "callguard/recording/recording_pipeline.hpp"
#include "callguard/recording/segment_storage.hpp"
#include "callguard/session/session_manager.hpp"
#include "callguard/settings/settings.hpp"
#include "callguard/signaling/relay.hpp"
#include "callguard/storage/sqlite_store.hpp"
#include "callguard/utils/clock.hpp"
#include "callguard/utils/ids.hpp"
#include "callguard/utils/keyed_mutex.hpp"

namespace callguard::testing {

constexpr int64_t kEpochMs = 1700000000000;

class ManualClock : public utils::Clock {
public:
    Timestamp now() const override { return from_millis(millis_.load()); }

    void advance(std::chrono::milliseconds delta) { millis_ += delta.count(); }
    void advance_seconds(int seconds) { advance(std::chrono::seconds(seconds)); }

private:
    std::atomic<int64_t> millis_{kEpochMs};
};

class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                ("callguard-test-" + utils::make_uuid())) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// In-memory segment storage; uploads of listed sequence numbers always fail.
class ScriptedStorage : public recording::SegmentStorage {
public:
    void fail_sequence(int sequence_number) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(sequence_number);
    }

    void fail_next(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_next_ = count;
    }

    // Parks every put() until release().
    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        gate_.notify_all();
    }

    bool wait_until_parked(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return gate_.wait_for(lock, timeout, [&]() { return parked_ > 0; });
    }

    std::string put(const Recording& recording, const RecordingSegment& segment) override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (held_) {
            ++parked_;
            gate_.notify_all();
            gate_.wait(lock, [&]() { return !held_; });
            --parked_;
        }
        ++attempts_;
        if (failing_.count(segment.sequence_number) > 0) {
            throw std::runtime_error("simulated outage");
        }
        if (fail_next_ > 0) {
            --fail_next_;
            throw std::runtime_error("simulated transient outage");
        }
        std::ifstream in(segment.local_path, std::ios::binary);
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        const auto path = recording.id + "/" + std::to_string(segment.sequence_number);
        objects_[path] = bytes;
        return path;
    }

    std::string get(const Recording&, const RecordingSegment& segment) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(segment.storage_path);
        if (it == objects_.end()) {
            throw std::runtime_error("missing object " + segment.storage_path);
        }
        return it->second;
    }

    void remove(const std::string& storage_path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_.erase(storage_path);
    }

    size_t object_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.size();
    }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable gate_;
    bool held_ = false;
    int parked_ = 0;
    std::set<int> failing_;
    int fail_next_ = 0;
    int attempts_ = 0;
    std::map<std::string, std::string> objects_;
};

inline RuntimeSettings test_settings() {
    RuntimeSettings settings;
    settings.recording_retention_sec = 3600;
    settings.signaling_idle_timeout_sec = 120;
    settings.ring_timeout_sec = 90;
    settings.max_upload_attempts = 3;
    settings.upload_retry_base_ms = 1;
    settings.signaling_retention_sec = 600;
    settings.notify_max_attempts = 3;
    settings.notify_retry_base_sec = 5;
    return settings;
}

// Full in-process stack over a store (in-memory unless a path is given) and a
// manual clock. StoreT lets a test inject store faults.
template <typename StoreT = storage::SqliteStore>
struct BasicHarness {
    ManualClock clock;
    utils::KeyedMutex locks;
    StoreT store;
    SettingsProvider settings{store, test_settings()};
    events::EventStream events{store, clock};
    signaling::Relay relay{store};
    session::SessionManager sessions{store, relay, events, settings, clock, locks};
    ScriptedStorage segment_storage;
    TempDir spool;
    recording::RecordingPipeline recordings{store, events, settings, segment_storage,
                                            clock, locks, spool.path(), 2};
    escalation::EscalationEngine engine{store, sessions, events, settings, clock, locks};
    access::AccessControl access{store, clock};

    explicit BasicHarness(const std::string& db_path = ":memory:") : store(db_path) {
        settings.seed();
        store.upsert_user({"client-1", "client", false});
        store.upsert_user({"client-2", "client", false});
        store.upsert_user({"reader-1", "reader", false});
        store.upsert_user({"supervisor-1", "supervisor", false});
        store.upsert_user({"admin-1", "admin", true});
        events.subscribe([this](const LifecycleEvent& event) { recordings.on_event(event); });
        events.subscribe([this](const LifecycleEvent& event) { engine.on_event(event); });
    }

    ~BasicHarness() { recordings.shutdown(); }

    CallSession ringing_call(const std::string& initiator = "client-1",
                             const std::string& counterpart = "reader-1") {
        const auto call = sessions.create(initiator, counterpart);
        return sessions.relay_signal(call.id, initiator, SignalKind::Offer, "v=0 offer").call;
    }

    CallSession connected_call(const std::string& initiator = "client-1",
                               const std::string& counterpart = "reader-1") {
        const auto call = ringing_call(initiator, counterpart);
        return sessions.relay_signal(call.id, counterpart, SignalKind::Answer, "v=0 answer").call;
    }

    void consent_to_recording(const CallSession& call) {
        sessions.record_consent(call.id, call.initiator_id, ConsentType::Recording,
                                ConsentStatus::Given);
        sessions.record_consent(call.id, call.counterpart_id, ConsentType::Recording,
                                ConsentStatus::Given);
    }

    // Connected call whose participants both agreed to be recorded.
    CallSession recordable_call(const std::string& initiator = "client-1",
                                const std::string& counterpart = "reader-1") {
        const auto call = connected_call(initiator, counterpart);
        consent_to_recording(call);
        return call;
    }

    std::vector<std::string> event_types(const std::string& call_id) {
        std::vector<std::string> types;
        for (const auto& event : events.read(0, 1000)) {
            if (event.call_id == call_id) {
                types.push_back(event.type);
            }
        }
        return types;
    }
};

using Harness = BasicHarness<>;

}
