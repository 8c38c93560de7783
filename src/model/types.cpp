#include "callguard/model/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>

namespace callguard {

namespace {

template <typename Enum, size_t N>
Enum parse_enum(const std::string& value,
                const std::pair<const char*, Enum> (&table)[N],
                const char* what) {
    for (const auto& entry : table) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    throw std::invalid_argument(std::string("unknown ") + what + ": " + value);
}

template <typename Enum, size_t N>
std::string format_enum(Enum value, const std::pair<const char*, Enum> (&table)[N]) {
    for (const auto& entry : table) {
        if (value == entry.second) {
            return entry.first;
        }
    }
    return "unknown";
}

const std::pair<const char*, CallStatus> kCallStatus[] = {
    {"initiated", CallStatus::Initiated},
    {"ringing", CallStatus::Ringing},
    {"connected", CallStatus::Connected},
    {"ended", CallStatus::Ended},
    {"missed", CallStatus::Missed},
    {"failed", CallStatus::Failed},
};

const std::pair<const char*, CallType> kCallType[] = {
    {"scheduled", CallType::Scheduled},
    {"consultation", CallType::Consultation},
    {"emergency", CallType::Emergency},
};

const std::pair<const char*, SignalKind> kSignalKind[] = {
    {"offer", SignalKind::Offer},
    {"answer", SignalKind::Answer},
    {"ice-candidate", SignalKind::IceCandidate},
    {"hangup", SignalKind::Hangup},
};

const std::pair<const char*, RecordingStatus> kRecordingStatus[] = {
    {"idle", RecordingStatus::Idle},
    {"recording", RecordingStatus::Recording},
    {"paused", RecordingStatus::Paused},
    {"stopped", RecordingStatus::Stopped},
    {"uploading", RecordingStatus::Uploading},
    {"ready", RecordingStatus::Ready},
    {"failed", RecordingStatus::Failed},
};

const std::pair<const char*, MediaFormat> kMediaFormat[] = {
    {"audio", MediaFormat::Audio},
    {"video", MediaFormat::Video},
    {"screen", MediaFormat::Screen},
};

const std::pair<const char*, SegmentState> kSegmentState[] = {
    {"open", SegmentState::Open},
    {"pending", SegmentState::Pending},
    {"uploaded", SegmentState::Uploaded},
    {"failed", SegmentState::Failed},
};

const std::pair<const char*, TriggerCondition> kTrigger[] = {
    {"unanswered_timeout", TriggerCondition::UnansweredTimeout},
    {"flagged", TriggerCondition::Flagged},
    {"endpoint_offline", TriggerCondition::EndpointOffline},
};

const std::pair<const char*, Permission> kPermission[] = {
    {"view", Permission::View},
    {"download", Permission::Download},
};

const std::pair<const char*, AccessAction> kAccessAction[] = {
    {"view", AccessAction::View},
    {"download", AccessAction::Download},
    {"purged", AccessAction::Purged},
    {"legal_hold", AccessAction::LegalHold},
    {"legal_hold_released", AccessAction::LegalHoldReleased},
};

const std::pair<const char*, ConsentType> kConsentType[] = {
    {"call_participation", ConsentType::CallParticipation},
    {"recording", ConsentType::Recording},
    {"data_sharing", ConsentType::DataSharing},
    {"emergency_extension", ConsentType::EmergencyExtension},
};

const std::pair<const char*, ConsentStatus> kConsentStatus[] = {
    {"given", ConsentStatus::Given},
    {"withdrawn", ConsentStatus::Withdrawn},
};

const std::pair<const char*, JobState> kJobState[] = {
    {"pending", JobState::Pending},
    {"done", JobState::Done},
    {"dead", JobState::Dead},
};

}

int64_t to_millis(Timestamp value) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch())
        .count();
}

Timestamp from_millis(int64_t millis) {
    return Timestamp(std::chrono::milliseconds(millis));
}

bool is_terminal(CallStatus status) {
    return status == CallStatus::Ended || status == CallStatus::Missed ||
           status == CallStatus::Failed;
}

bool is_capturing(RecordingStatus status) {
    return status == RecordingStatus::Idle || status == RecordingStatus::Recording ||
           status == RecordingStatus::Paused;
}

std::string to_string(CallStatus value) { return format_enum(value, kCallStatus); }
std::string to_string(CallType value) { return format_enum(value, kCallType); }
std::string to_string(SignalKind value) { return format_enum(value, kSignalKind); }
std::string to_string(RecordingStatus value) { return format_enum(value, kRecordingStatus); }
std::string to_string(MediaFormat value) { return format_enum(value, kMediaFormat); }
std::string to_string(SegmentState value) { return format_enum(value, kSegmentState); }
std::string to_string(TriggerCondition value) { return format_enum(value, kTrigger); }
std::string to_string(Permission value) { return format_enum(value, kPermission); }
std::string to_string(AccessAction value) { return format_enum(value, kAccessAction); }
std::string to_string(JobState value) { return format_enum(value, kJobState); }
std::string to_string(ConsentType value) { return format_enum(value, kConsentType); }
std::string to_string(ConsentStatus value) { return format_enum(value, kConsentStatus); }

CallStatus parse_call_status(const std::string& value) {
    return parse_enum(value, kCallStatus, "call status");
}

CallType parse_call_type(const std::string& value) {
    return parse_enum(value, kCallType, "call type");
}

SignalKind parse_signal_kind(const std::string& value) {
    return parse_enum(value, kSignalKind, "signal kind");
}

RecordingStatus parse_recording_status(const std::string& value) {
    return parse_enum(value, kRecordingStatus, "recording status");
}

MediaFormat parse_media_format(const std::string& value) {
    return parse_enum(value, kMediaFormat, "media format");
}

SegmentState parse_segment_state(const std::string& value) {
    return parse_enum(value, kSegmentState, "segment state");
}

TriggerCondition parse_trigger_condition(const std::string& value) {
    return parse_enum(value, kTrigger, "trigger condition");
}

Permission parse_permission(const std::string& value) {
    return parse_enum(value, kPermission, "permission");
}

AccessAction parse_access_action(const std::string& value) {
    return parse_enum(value, kAccessAction, "access action");
}

JobState parse_job_state(const std::string& value) {
    return parse_enum(value, kJobState, "job state");
}

ConsentType parse_consent_type(const std::string& value) {
    return parse_enum(value, kConsentType, "consent type");
}

ConsentStatus parse_consent_status(const std::string& value) {
    return parse_enum(value, kConsentStatus, "consent status");
}

}
