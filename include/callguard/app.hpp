#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "callguard/access/access_control.hpp"
#include "callguard/config.hpp"
#include "callguard/escalation/channels.hpp"
#include "callguard/escalation/dispatcher.hpp"
#include "callguard/escalation/escalation_engine.hpp"
#include "callguard/events/event_stream.hpp"
#include "callguard/recording/recording_pipeline.hpp"
#include "callguard/recording/segment_storage.hpp"
#include "callguard/server/rest_server.hpp"
#include "callguard/session/session_manager.hpp"
#include "callguard/settings/settings.hpp"
#include "callguard/signaling/relay.hpp"
#include "callguard/storage/sqlite_store.hpp"
#include "callguard/utils/clock.hpp"
#include "callguard/utils/keyed_mutex.hpp"

namespace callguard {

class CallguardApp {
public:
    explicit CallguardApp(Config config);
    ~CallguardApp();

    void init();
    // Runs maintenance until stop() is requested.
    void run();
    void stop();

    // One maintenance pass: retention purge and signaling garbage collection.
    void run_maintenance();

private:
    void register_channels();
    void seed_rules();
    void escalation_loop();
    void dispatch_loop();
    bool wait_for(std::chrono::milliseconds interval);

    Config config_;
    utils::SystemClock clock_;
    utils::KeyedMutex call_locks_;
    std::unique_ptr<storage::SqliteStore> store_;
    std::unique_ptr<SettingsProvider> settings_;
    std::unique_ptr<events::EventStream> events_;
    std::unique_ptr<signaling::Relay> relay_;
    std::unique_ptr<session::SessionManager> sessions_;
    std::unique_ptr<recording::FileSegmentStorage> segment_storage_;
    std::unique_ptr<recording::RecordingPipeline> recordings_;
    std::unique_ptr<escalation::EscalationEngine> escalations_;
    escalation::ChannelRegistry channels_;
    std::shared_ptr<escalation::WebSocketChannel> ws_channel_;
    std::unique_ptr<escalation::NotificationDispatcher> dispatcher_;
    std::unique_ptr<access::AccessControl> access_;
    std::unique_ptr<RestServer> rest_server_;

    std::atomic<bool> quitting_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread escalation_thread_;
    std::thread dispatch_thread_;
};

}
