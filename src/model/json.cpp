#include "callguard/model/json.hpp"

#include <stdexcept>

#include "callguard/logging.hpp"

namespace callguard {

namespace {

nlohmann::json time_or_null(const std::optional<Timestamp>& value) {
    if (!value) {
        return nullptr;
    }
    return logging::format_timestamp(*value);
}

template <typename T>
nlohmann::json value_or_null(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

}

void to_json(nlohmann::json& out, const UserRecord& value) {
    out = {{"id", value.id}, {"role", value.role}, {"is_admin", value.is_admin}};
}

void to_json(nlohmann::json& out, const CallSession& value) {
    nlohmann::json context = nlohmann::json::parse(value.context, nullptr, false);
    if (context.is_discarded()) {
        context = nlohmann::json::object();
    }
    out = {
        {"id", value.id},
        {"initiator_id", value.initiator_id},
        {"counterpart_id", value.counterpart_id},
        {"escalated_to", value_or_null(value.escalated_to)},
        {"status", to_string(value.status)},
        {"call_type", to_string(value.call_type)},
        {"escalation_level", value.escalation_level},
        {"context", context},
        {"created_at", logging::format_timestamp(value.created_at)},
        {"answered_at", time_or_null(value.answered_at)},
        {"ended_at", time_or_null(value.ended_at)},
        {"end_reason", value.end_reason},
        {"flagged_at", time_or_null(value.flagged_at)},
        {"flag_reason", value.flag_reason},
        {"last_activity_at", logging::format_timestamp(value.last_activity_at)},
    };
}

void to_json(nlohmann::json& out, const SignalingMessage& value) {
    out = {
        {"id", value.id},
        {"call_id", value.call_id},
        {"sender_id", value.sender_id},
        {"kind", to_string(value.kind)},
        {"payload", value.payload},
        {"created_at", logging::format_timestamp(value.created_at)},
    };
}

void to_json(nlohmann::json& out, const Recording& value) {
    out = {
        {"id", value.id},
        {"call_id", value.call_id},
        {"status", to_string(value.status)},
        {"format", to_string(value.format)},
        {"initiated_by", value.initiated_by},
        {"created_at", logging::format_timestamp(value.created_at)},
        {"duration_ms", value.duration_ms},
        {"retention_expires_at", time_or_null(value.retention_expires_at)},
        {"failure_reason", value.failure_reason},
        {"consent_verified", value.consent_verified},
        {"legal_hold", value.legal_hold},
    };
}

void to_json(nlohmann::json& out, const RecordingSegment& value) {
    out = {
        {"sequence_number", value.sequence_number},
        {"start_offset_ms", value.start_offset_ms},
        {"end_offset_ms", value_or_null(value.end_offset_ms)},
        {"duration_ms", value.duration_ms},
        {"storage_path", value.storage_path},
        {"checksum", value.checksum},
        {"state", to_string(value.state)},
        {"upload_attempts", value.upload_attempts},
    };
}

void to_json(nlohmann::json& out, const EscalationRule& value) {
    out = {
        {"id", value.id},
        {"trigger", to_string(value.trigger)},
        {"threshold_seconds", value.threshold_seconds},
        {"escalate_to_role", value.escalate_to_role},
        {"priority_level", value.priority_level},
        {"channels", value.notification_channels},
        {"cooldown_seconds", value.cooldown_seconds},
        {"active", value.active},
    };
}

void to_json(nlohmann::json& out, const EscalationEvent& value) {
    out = {
        {"id", value.id},
        {"call_id", value.call_id},
        {"rule_id", value.rule_id},
        {"level", value.level},
        {"triggered_at", logging::format_timestamp(value.triggered_at)},
        {"acknowledged_by", value_or_null(value.acknowledged_by)},
        {"acknowledged_at", time_or_null(value.acknowledged_at)},
    };
}

void to_json(nlohmann::json& out, const AccessGrant& value) {
    out = {
        {"id", value.id},
        {"recording_id", value.recording_id},
        {"grantee_id", value.grantee_id},
        {"permission", to_string(value.permission)},
        {"granted_by", value.granted_by},
        {"granted_at", logging::format_timestamp(value.granted_at)},
        {"expires_at", logging::format_timestamp(value.expires_at)},
    };
}

void to_json(nlohmann::json& out, const AccessLogEntry& value) {
    out = {
        {"id", value.id},
        {"recording_id", value.recording_id},
        {"accessor_id", value.accessor_id},
        {"action", to_string(value.action)},
        {"allowed", value.allowed},
        {"timestamp", logging::format_timestamp(value.timestamp)},
        {"source_address", value.source_address},
    };
}

void to_json(nlohmann::json& out, const ConsentRecord& value) {
    out = {
        {"id", value.id},
        {"call_id", value.call_id},
        {"user_id", value.user_id},
        {"type", to_string(value.type)},
        {"status", to_string(value.status)},
        {"method", value.method},
        {"recorded_at", logging::format_timestamp(value.recorded_at)},
    };
}

void to_json(nlohmann::json& out, const LifecycleEvent& value) {
    nlohmann::json payload = nlohmann::json::parse(value.payload, nullptr, false);
    if (payload.is_discarded()) {
        payload = nlohmann::json::object();
    }
    out = {
        {"seq", value.seq},
        {"event_id", value.event_id},
        {"type", value.type},
        {"call_id", value.call_id},
        {"subject_id", value.subject_id},
        {"payload", payload},
        {"created_at", logging::format_timestamp(value.created_at)},
    };
}

EscalationRule rule_from_json(const nlohmann::json& item) {
    if (!item.is_object()) {
        throw std::invalid_argument("escalation rule must be a JSON object");
    }
    EscalationRule rule;
    rule.id = item.at("id").get<std::string>();
    rule.trigger = parse_trigger_condition(item.at("trigger").get<std::string>());
    rule.threshold_seconds = item.at("threshold_seconds").get<int>();
    rule.escalate_to_role = item.at("escalate_to_role").get<std::string>();
    rule.priority_level = item.value("priority_level", 0);
    rule.cooldown_seconds = item.value("cooldown_seconds", 0);
    rule.active = item.value("active", true);
    if (item.contains("channels")) {
        rule.notification_channels = item["channels"].get<std::vector<std::string>>();
    } else {
        rule.notification_channels = {"log"};
    }
    if (rule.id.empty() || rule.escalate_to_role.empty()) {
        throw std::invalid_argument("escalation rule needs an id and a target role");
    }
    if (rule.threshold_seconds < 0 || rule.cooldown_seconds < 0) {
        throw std::invalid_argument("escalation rule " + rule.id +
                                    ": threshold_seconds must be zero or positive");
    }
    return rule;
}

}
