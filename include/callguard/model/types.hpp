#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace callguard {

using Timestamp = std::chrono::system_clock::time_point;

int64_t to_millis(Timestamp value);
Timestamp from_millis(int64_t millis);

enum class CallStatus {
    Initiated,
    Ringing,
    Connected,
    Ended,
    Missed,
    Failed
};

enum class CallType {
    Scheduled,
    Consultation,
    Emergency
};

enum class SignalKind {
    Offer,
    Answer,
    IceCandidate,
    Hangup
};

enum class RecordingStatus {
    Idle,
    Recording,
    Paused,
    Stopped,
    Uploading,
    Ready,
    Failed
};

enum class MediaFormat {
    Audio,
    Video,
    Screen
};

enum class SegmentState {
    Open,
    Pending,
    Uploaded,
    Failed
};

enum class TriggerCondition {
    UnansweredTimeout,
    Flagged,
    EndpointOffline
};

enum class Permission {
    View,
    Download
};

enum class AccessAction {
    View,
    Download,
    Purged,
    LegalHold,
    LegalHoldReleased
};

enum class ConsentType {
    CallParticipation,
    Recording,
    DataSharing,
    EmergencyExtension
};

enum class ConsentStatus {
    Given,
    Withdrawn
};

enum class JobState {
    Pending,
    Done,
    Dead
};

bool is_terminal(CallStatus status);
// Recording still accepts pause/resume/stop.
bool is_capturing(RecordingStatus status);

std::string to_string(CallStatus value);
std::string to_string(CallType value);
std::string to_string(SignalKind value);
std::string to_string(RecordingStatus value);
std::string to_string(MediaFormat value);
std::string to_string(SegmentState value);
std::string to_string(TriggerCondition value);
std::string to_string(Permission value);
std::string to_string(AccessAction value);
std::string to_string(JobState value);
std::string to_string(ConsentType value);
std::string to_string(ConsentStatus value);

CallStatus parse_call_status(const std::string& value);
CallType parse_call_type(const std::string& value);
SignalKind parse_signal_kind(const std::string& value);
RecordingStatus parse_recording_status(const std::string& value);
MediaFormat parse_media_format(const std::string& value);
SegmentState parse_segment_state(const std::string& value);
TriggerCondition parse_trigger_condition(const std::string& value);
Permission parse_permission(const std::string& value);
AccessAction parse_access_action(const std::string& value);
JobState parse_job_state(const std::string& value);
ConsentType parse_consent_type(const std::string& value);
ConsentStatus parse_consent_status(const std::string& value);

struct UserRecord {
    std::string id;
    std::string role;
    bool is_admin = false;
};

struct CallSession {
    std::string id;
    std::string initiator_id;
    std::string counterpart_id;
    std::optional<std::string> escalated_to;
    CallStatus status = CallStatus::Initiated;
    CallType call_type = CallType::Consultation;
    int escalation_level = 0;
    std::string context = "{}";
    Timestamp created_at{};
    std::optional<Timestamp> answered_at;
    std::optional<Timestamp> ended_at;
    std::string end_reason;
    std::optional<Timestamp> flagged_at;
    std::string flag_reason;
    Timestamp last_activity_at{};
    std::optional<Timestamp> initiator_seen_at;
    std::optional<Timestamp> counterpart_seen_at;

    bool is_participant(const std::string& user_id) const {
        return user_id == initiator_id || user_id == counterpart_id;
    }
};

struct SignalingMessage {
    int64_t id = 0;
    std::string call_id;
    std::string sender_id;
    SignalKind kind = SignalKind::Offer;
    std::string payload;
    Timestamp created_at{};
    bool consumed = false;
};

struct Recording {
    std::string id;
    std::string call_id;
    RecordingStatus status = RecordingStatus::Idle;
    MediaFormat format = MediaFormat::Audio;
    std::string initiated_by;
    std::string encryption_key_ref;
    Timestamp created_at{};
    int64_t duration_ms = 0;
    std::optional<Timestamp> retention_expires_at;
    std::string failure_reason;
    // Both participants had a live recording consent when capture started.
    bool consent_verified = false;
    // Held recordings are never purged.
    bool legal_hold = false;
};

struct RecordingSegment {
    std::string recording_id;
    int sequence_number = 0;
    int64_t start_offset_ms = 0;
    std::optional<int64_t> end_offset_ms;
    int64_t duration_ms = 0;
    std::string local_path;
    std::string storage_path;
    std::string checksum;
    SegmentState state = SegmentState::Open;
    int upload_attempts = 0;
};

struct EscalationRule {
    std::string id;
    TriggerCondition trigger = TriggerCondition::UnansweredTimeout;
    int threshold_seconds = 0;
    std::string escalate_to_role;
    int priority_level = 0;
    std::vector<std::string> notification_channels;
    int cooldown_seconds = 0;
    bool active = true;
};

struct EscalationEvent {
    std::string id;
    std::string call_id;
    std::string rule_id;
    int level = 0;
    Timestamp triggered_at{};
    std::optional<std::string> acknowledged_by;
    std::optional<Timestamp> acknowledged_at;
};

struct NotificationJob {
    int64_t id = 0;
    std::string event_id;
    std::string channel;
    std::string recipient;
    std::string payload;
    int attempts = 0;
    Timestamp next_attempt_at{};
    JobState state = JobState::Pending;
    std::string last_error;
};

struct AccessGrant {
    std::string id;
    std::string recording_id;
    std::string grantee_id;
    Permission permission = Permission::View;
    std::string granted_by;
    Timestamp granted_at{};
    Timestamp expires_at{};
};

struct AccessLogEntry {
    int64_t id = 0;
    std::string recording_id;
    std::string accessor_id;
    AccessAction action = AccessAction::View;
    bool allowed = false;
    Timestamp timestamp{};
    std::string source_address;
};

// Append-only; the latest entry per (call, user, type) is the effective one.
struct ConsentRecord {
    int64_t id = 0;
    std::string call_id;
    std::string user_id;
    ConsentType type = ConsentType::Recording;
    ConsentStatus status = ConsentStatus::Given;
    std::string method = "web_form";
    std::string source_address;
    Timestamp recorded_at{};
};

struct LifecycleEvent {
    int64_t seq = 0;
    std::string event_id;
    std::string type;
    std::string call_id;
    std::string subject_id;
    std::string payload = "{}";
    Timestamp created_at{};
};

}
