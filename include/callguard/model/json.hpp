#pragma once

#include <nlohmann/json.hpp>

#include "callguard/model/types.hpp"

namespace callguard {

// Wire representation of the model; timestamps are ISO-8601 UTC strings.
void to_json(nlohmann::json& out, const UserRecord& value);
void to_json(nlohmann::json& out, const CallSession& value);
void to_json(nlohmann::json& out, const SignalingMessage& value);
void to_json(nlohmann::json& out, const Recording& value);
void to_json(nlohmann::json& out, const RecordingSegment& value);
void to_json(nlohmann::json& out, const EscalationRule& value);
void to_json(nlohmann::json& out, const EscalationEvent& value);
void to_json(nlohmann::json& out, const AccessGrant& value);
void to_json(nlohmann::json& out, const AccessLogEntry& value);
void to_json(nlohmann::json& out, const ConsentRecord& value);
void to_json(nlohmann::json& out, const LifecycleEvent& value);

// Accepts {"id", "trigger", "threshold_seconds", "escalate_to_role",
// "priority_level"?, "channels"?, "cooldown_seconds"?, "active"?}.
EscalationRule rule_from_json(const nlohmann::json& item);

}
