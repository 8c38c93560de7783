#include "callguard/app.hpp"

#include <chrono>
#include <filesystem>

#include "callguard/logging.hpp"

namespace callguard {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

}

CallguardApp::CallguardApp(Config config) : config_(std::move(config)) {}

CallguardApp::~CallguardApp() {
    stop();
}

void CallguardApp::init() {
    std::filesystem::create_directories(config_.spool_dir);
    std::filesystem::create_directories(config_.archive_dir);
    const auto store_dir = std::filesystem::path(config_.store_path).parent_path();
    if (!store_dir.empty()) {
        std::filesystem::create_directories(store_dir);
    }

    store_ = std::make_unique<storage::SqliteStore>(config_.store_path);
    settings_ = std::make_unique<SettingsProvider>(*store_, RuntimeSettings::from_config(config_));
    settings_->seed();
    seed_rules();

    events_ = std::make_unique<events::EventStream>(*store_, clock_);
    relay_ = std::make_unique<signaling::Relay>(*store_);
    sessions_ = std::make_unique<session::SessionManager>(
        *store_, *relay_, *events_, *settings_, clock_, call_locks_);
    segment_storage_ = std::make_unique<recording::FileSegmentStorage>(
        config_.archive_dir, config_.recording_master_key);
    recordings_ = std::make_unique<recording::RecordingPipeline>(
        *store_, *events_, *settings_, *segment_storage_, clock_, call_locks_,
        config_.spool_dir, config_.upload_workers);
    escalations_ = std::make_unique<escalation::EscalationEngine>(
        *store_, *sessions_, *events_, *settings_, clock_, call_locks_);
    access_ = std::make_unique<access::AccessControl>(*store_, clock_);

    events_->subscribe([this](const LifecycleEvent& event) { recordings_->on_event(event); });
    events_->subscribe([this](const LifecycleEvent& event) { escalations_->on_event(event); });
    sessions_->restore();
    recordings_->restore();

    register_channels();
    dispatcher_ = std::make_unique<escalation::NotificationDispatcher>(
        *store_, channels_, *settings_, clock_);

    rest_server_ = std::make_unique<RestServer>(
        config_, Services{*store_, *sessions_, *relay_, *recordings_, *escalations_, *access_,
                          *events_, *settings_, clock_});
    rest_server_->start();

    escalation_thread_ = std::thread([this]() { escalation_loop(); });
    dispatch_thread_ = std::thread([this]() { dispatch_loop(); });
}

void CallguardApp::register_channels() {
    channels_.add(std::make_shared<escalation::LogChannel>());
    if (config_.notify_webhook_url) {
        channels_.add(std::make_shared<escalation::WebhookChannel>(
            *config_.notify_webhook_url, config_.notify_webhook_token,
            std::chrono::seconds(static_cast<int>(config_.notify_request_timeout))));
    }
    if (config_.notify_ws_url) {
        ws_channel_ = std::make_shared<escalation::WebSocketChannel>(*config_.notify_ws_url);
        ws_channel_->start();
        channels_.add(ws_channel_);
    }

    for (const auto& rule : store_->rules()) {
        for (const auto& channel : rule.notification_channels) {
            if (!channels_.find(channel)) {
                logging::warn("Escalation rule uses an unconfigured channel",
                              {kv("rule_id", rule.id), kv("channel", channel)});
            }
        }
    }
}

void CallguardApp::seed_rules() {
    for (const auto& rule : config_.escalation_rules) {
        store_->upsert_rule(rule);
        logging::info("Escalation rule seeded",
                      {kv("rule_id", rule.id),
                       kv("trigger", to_string(rule.trigger)),
                       kv("threshold_seconds", rule.threshold_seconds),
                       kv("role", rule.escalate_to_role)});
    }
}

bool CallguardApp::wait_for(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return !wait_cv_.wait_for(lock, interval, [this]() { return quitting_.load(); });
}

void CallguardApp::escalation_loop() {
    const auto interval = seconds_to_ms(config_.escalation_tick_sec);
    while (wait_for(interval)) {
        try {
            escalations_->tick();
        } catch (const std::exception& ex) {
            logging::error("Escalation tick failed", {kv("error", ex.what())});
        }
    }
}

void CallguardApp::dispatch_loop() {
    const auto interval = seconds_to_ms(config_.dispatch_poll_sec);
    while (wait_for(interval)) {
        try {
            dispatcher_->dispatch_due();
        } catch (const std::exception& ex) {
            logging::error("Notification dispatch failed", {kv("error", ex.what())});
        }
    }
}

void CallguardApp::run_maintenance() {
    const auto now = clock_.now();
    const auto settings = settings_->current();
    try {
        recordings_->restore();
    } catch (const std::exception& ex) {
        logging::error("Recording reconciliation failed", {kv("error", ex.what())});
    }
    try {
        recordings_->purge_expired(now);
    } catch (const std::exception& ex) {
        logging::error("Retention sweep failed", {kv("error", ex.what())});
    }
    try {
        relay_->collect_garbage(now - std::chrono::seconds(settings.signaling_retention_sec));
    } catch (const std::exception& ex) {
        logging::error("Signaling garbage collection failed", {kv("error", ex.what())});
    }
}

void CallguardApp::run() {
    const auto interval = std::chrono::seconds(config_.maintenance_interval_sec);
    run_maintenance();
    while (wait_for(interval)) {
        run_maintenance();
    }
}

void CallguardApp::stop() {
    if (quitting_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    if (rest_server_) {
        rest_server_->stop();
    }
    if (escalation_thread_.joinable()) {
        escalation_thread_.join();
    }
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    if (ws_channel_) {
        ws_channel_->stop();
    }
    if (recordings_) {
        recordings_->shutdown();
    }
    logging::info("callguard stopped");
}

}
