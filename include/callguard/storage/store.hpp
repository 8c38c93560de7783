#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "callguard/model/types.hpp"

namespace callguard::storage {

// Scope of an atomic multi-row write. Destroying an uncommitted transaction
// rolls it back.
class Transaction {
public:
    virtual ~Transaction() = default;

    virtual void commit() = 0;
    virtual bool committed() const = 0;
};

// Relational store for every persisted entity. Implementations are thread-safe
// and throw StorageUnavailable for transient failures.
class Store {
public:
    virtual ~Store() = default;

    // Writes from the calling thread join the transaction until it commits or
    // is destroyed; other threads wait for it.
    virtual std::unique_ptr<Transaction> begin() = 0;

    virtual void upsert_user(const UserRecord& user) = 0;
    virtual std::optional<UserRecord> find_user(const std::string& id) = 0;
    virtual std::vector<UserRecord> users_with_role(const std::string& role) = 0;

    virtual void insert_call(const CallSession& call) = 0;
    virtual void update_call(const CallSession& call) = 0;
    virtual std::optional<CallSession> find_call(const std::string& id) = 0;
    virtual std::vector<CallSession> active_calls() = 0;
    virtual std::optional<CallSession> active_call_for(const std::string& initiator_id) = 0;

    virtual int64_t append_signal(const SignalingMessage& message) = 0;
    virtual std::vector<SignalingMessage> unconsumed_signals(const std::string& call_id,
                                                             const std::string& recipient_id) = 0;
    virtual void mark_consumed(int64_t message_id) = 0;
    virtual std::vector<SignalingMessage> signals_for(const std::string& call_id) = 0;
    // Deletes messages of calls that terminated before `ended_before`.
    virtual size_t purge_signals(Timestamp ended_before) = 0;

    virtual void insert_recording(const Recording& recording) = 0;
    virtual void update_recording(const Recording& recording) = 0;
    virtual std::optional<Recording> find_recording(const std::string& id) = 0;
    virtual std::optional<Recording> find_recording_for_call(const std::string& call_id) = 0;
    // Past retention and not under legal hold.
    virtual std::vector<Recording> recordings_expired(Timestamp now) = 0;
    // Recordings that have not reached ready or failed.
    virtual std::vector<Recording> unfinished_recordings() = 0;
    virtual std::vector<Recording> recordings_for_participant(const std::string& user_id) = 0;
    virtual std::vector<Recording> all_recordings() = 0;
    virtual void delete_recording(const std::string& id) = 0;

    virtual void insert_segment(const RecordingSegment& segment) = 0;
    virtual void update_segment(const RecordingSegment& segment) = 0;
    virtual std::vector<RecordingSegment> segments(const std::string& recording_id) = 0;

    virtual int64_t append_consent(const ConsentRecord& consent) = 0;
    virtual std::optional<ConsentRecord> latest_consent(const std::string& call_id,
                                                        const std::string& user_id,
                                                        ConsentType type) = 0;
    virtual std::vector<ConsentRecord> consents_for(const std::string& call_id) = 0;

    virtual void upsert_rule(const EscalationRule& rule) = 0;
    virtual std::vector<EscalationRule> rules() = 0;

    // False when (call_id, level) already exists.
    virtual bool insert_escalation(const EscalationEvent& event) = 0;
    virtual void update_escalation(const EscalationEvent& event) = 0;
    virtual std::optional<EscalationEvent> find_escalation(const std::string& id) = 0;
    virtual std::vector<EscalationEvent> escalations_for(const std::string& call_id) = 0;

    virtual int64_t insert_job(const NotificationJob& job) = 0;
    virtual void update_job(const NotificationJob& job) = 0;
    virtual std::vector<NotificationJob> due_jobs(Timestamp now, size_t limit) = 0;
    virtual std::vector<NotificationJob> jobs_for_event(const std::string& event_id) = 0;

    virtual void insert_grant(const AccessGrant& grant) = 0;
    virtual void update_grant(const AccessGrant& grant) = 0;
    virtual std::optional<AccessGrant> find_grant(const std::string& id) = 0;
    virtual std::vector<AccessGrant> grants_for(const std::string& recording_id) = 0;
    virtual std::vector<AccessGrant> grants_for_user(const std::string& grantee_id) = 0;

    virtual int64_t append_access_log(const AccessLogEntry& entry) = 0;
    virtual std::vector<AccessLogEntry> access_log(const std::string& recording_id) = 0;

    virtual int64_t append_event(const LifecycleEvent& event) = 0;
    virtual std::vector<LifecycleEvent> events_after(int64_t cursor, size_t limit) = 0;

    virtual void put_setting(const std::string& key, const std::string& value) = 0;
    virtual std::map<std::string, std::string> settings() = 0;
};

}
