#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "callguard/storage/store.hpp"

struct sqlite3;

namespace callguard::storage {

// RAII owner of a sqlite3 connection configured for WAL and foreign keys.
class SqliteDb {
public:
    explicit SqliteDb(std::string path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

    void exec(const std::string& sql);

private:
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

class SqliteStore : public Store {
public:
    // ":memory:" opens a private in-memory database.
    explicit SqliteStore(const std::string& path);

    std::unique_ptr<Transaction> begin() override;

    void upsert_user(const UserRecord& user) override;
    std::optional<UserRecord> find_user(const std::string& id) override;
    std::vector<UserRecord> users_with_role(const std::string& role) override;

    void insert_call(const CallSession& call) override;
    void update_call(const CallSession& call) override;
    std::optional<CallSession> find_call(const std::string& id) override;
    std::vector<CallSession> active_calls() override;
    std::optional<CallSession> active_call_for(const std::string& initiator_id) override;

    int64_t append_signal(const SignalingMessage& message) override;
    std::vector<SignalingMessage> unconsumed_signals(const std::string& call_id,
                                                     const std::string& recipient_id) override;
    void mark_consumed(int64_t message_id) override;
    std::vector<SignalingMessage> signals_for(const std::string& call_id) override;
    size_t purge_signals(Timestamp ended_before) override;

    void insert_recording(const Recording& recording) override;
    void update_recording(const Recording& recording) override;
    std::optional<Recording> find_recording(const std::string& id) override;
    std::optional<Recording> find_recording_for_call(const std::string& call_id) override;
    std::vector<Recording> recordings_expired(Timestamp now) override;
    std::vector<Recording> unfinished_recordings() override;
    std::vector<Recording> recordings_for_participant(const std::string& user_id) override;
    std::vector<Recording> all_recordings() override;
    void delete_recording(const std::string& id) override;

    void insert_segment(const RecordingSegment& segment) override;
    void update_segment(const RecordingSegment& segment) override;
    std::vector<RecordingSegment> segments(const std::string& recording_id) override;

    int64_t append_consent(const ConsentRecord& consent) override;
    std::optional<ConsentRecord> latest_consent(const std::string& call_id,
                                                const std::string& user_id,
                                                ConsentType type) override;
    std::vector<ConsentRecord> consents_for(const std::string& call_id) override;

    void upsert_rule(const EscalationRule& rule) override;
    std::vector<EscalationRule> rules() override;

    bool insert_escalation(const EscalationEvent& event) override;
    void update_escalation(const EscalationEvent& event) override;
    std::optional<EscalationEvent> find_escalation(const std::string& id) override;
    std::vector<EscalationEvent> escalations_for(const std::string& call_id) override;

    int64_t insert_job(const NotificationJob& job) override;
    void update_job(const NotificationJob& job) override;
    std::vector<NotificationJob> due_jobs(Timestamp now, size_t limit) override;
    std::vector<NotificationJob> jobs_for_event(const std::string& event_id) override;

    void insert_grant(const AccessGrant& grant) override;
    void update_grant(const AccessGrant& grant) override;
    std::optional<AccessGrant> find_grant(const std::string& id) override;
    std::vector<AccessGrant> grants_for(const std::string& recording_id) override;
    std::vector<AccessGrant> grants_for_user(const std::string& grantee_id) override;

    int64_t append_access_log(const AccessLogEntry& entry) override;
    std::vector<AccessLogEntry> access_log(const std::string& recording_id) override;

    int64_t append_event(const LifecycleEvent& event) override;
    std::vector<LifecycleEvent> events_after(int64_t cursor, size_t limit) override;

    void put_setting(const std::string& key, const std::string& value) override;
    std::map<std::string, std::string> settings() override;

private:
    void migrate();

    // Recursive so a transaction can hold it across the calls it spans.
    std::recursive_mutex mutex_;
    std::unique_ptr<SqliteDb> db_;
};

}
