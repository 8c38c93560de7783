#include "callguard/access/access_control.hpp"

#include <algorithm>
#include <set>

#include "callguard/errors.hpp"
#include "callguard/logging.hpp"
#include "callguard/metrics.hpp"
#include "callguard/utils/ids.hpp"

namespace callguard::access {

namespace {

bool covers(Permission permission, AccessAction action) {
    if (action == AccessAction::View) {
        return permission == Permission::View || permission == Permission::Download;
    }
    if (action == AccessAction::Download) {
        return permission == Permission::Download;
    }
    return false;
}

}

std::string to_string(DecisionCode code) {
    switch (code) {
        case DecisionCode::Ok:
            return "ok";
        case DecisionCode::Unauthorized:
            return "unauthorized";
        case DecisionCode::Unavailable:
            return "unavailable";
    }
    return "unknown";
}

AccessControl::AccessControl(storage::Store& store, const utils::Clock& clock)
    : store_(store), clock_(clock) {}

bool AccessControl::evaluate(const std::string& recording_id,
                             const std::string& accessor_id,
                             AccessAction action,
                             Timestamp now) {
    if (action == AccessAction::Purged) {
        return false;
    }
    auto user = store_.find_user(accessor_id);
    if (user && user->is_admin) {
        return true;
    }
    auto recording = store_.find_recording(recording_id);
    if (!recording) {
        return false;
    }
    auto call = store_.find_call(recording->call_id);
    if (call && call->is_participant(accessor_id)) {
        return true;
    }
    for (const auto& grant : store_.grants_for(recording_id)) {
        if (grant.grantee_id == accessor_id && grant.expires_at > now &&
            covers(grant.permission, action)) {
            return true;
        }
    }
    return false;
}

Decision AccessControl::authorize(const std::string& recording_id,
                                  const std::string& accessor_id,
                                  AccessAction action,
                                  const std::string& source_address) {
    const auto now = clock_.now();
    Decision decision;
    bool allowed = false;
    try {
        allowed = evaluate(recording_id, accessor_id, action, now);
    } catch (const std::exception& ex) {
        logging::error("Access evaluation failed",
                       {kv("recording_id", recording_id), kv("error", ex.what())});
        allowed = false;
    }

    AccessLogEntry entry;
    entry.recording_id = recording_id;
    entry.accessor_id = accessor_id;
    entry.action = action;
    entry.allowed = allowed;
    entry.timestamp = now;
    entry.source_address = source_address;
    try {
        store_.append_access_log(entry);
    } catch (const std::exception& ex) {
        logging::error("Audit write failed, denying access",
                       {kv("recording_id", recording_id),
                        kv("accessor", accessor_id),
                        kv("error", ex.what())});
        Metrics::instance().increment("access_decisions_total", "code", "unavailable");
        decision.allowed = false;
        decision.code = DecisionCode::Unavailable;
        return decision;
    }

    decision.allowed = allowed;
    decision.code = allowed ? DecisionCode::Ok : DecisionCode::Unauthorized;
    Metrics::instance().increment("access_decisions_total", "code", to_string(decision.code));
    if (!allowed) {
        logging::warn("Recording access denied",
                      {kv("recording_id", recording_id),
                       kv("accessor", accessor_id),
                       kv("action", callguard::to_string(action)),
                       kv("source", source_address)});
    }
    return decision;
}

void AccessControl::require(const std::string& recording_id,
                            const std::string& accessor_id,
                            AccessAction action,
                            const std::string& source_address) {
    const auto decision = authorize(recording_id, accessor_id, action, source_address);
    switch (decision.code) {
        case DecisionCode::Ok:
            return;
        case DecisionCode::Unavailable:
            throw StorageUnavailable("access audit unavailable for recording " + recording_id);
        case DecisionCode::Unauthorized:
            throw Unauthorized("user " + accessor_id + " may not " +
                               callguard::to_string(action) + " recording " + recording_id);
    }
}

void AccessControl::require_admin(const std::string& user_id) {
    auto user = store_.find_user(user_id);
    if (!user || !user->is_admin) {
        throw Unauthorized("user " + user_id + " lacks administrative capability");
    }
}

AccessGrant AccessControl::grant(const std::string& recording_id,
                                 const std::string& grantee_id,
                                 Permission permission,
                                 const std::string& granted_by,
                                 Timestamp expires_at) {
    require_admin(granted_by);
    if (!store_.find_recording(recording_id)) {
        throw NotFound("recording not found: " + recording_id);
    }
    const auto now = clock_.now();
    if (expires_at <= now) {
        throw std::invalid_argument("grant expiry must be in the future");
    }

    AccessGrant grant;
    grant.id = utils::make_uuid();
    grant.recording_id = recording_id;
    grant.grantee_id = grantee_id;
    grant.permission = permission;
    grant.granted_by = granted_by;
    grant.granted_at = now;
    grant.expires_at = expires_at;
    store_.insert_grant(grant);
    logging::info("Access granted",
                  {kv("grant_id", grant.id),
                   kv("recording_id", recording_id),
                   kv("grantee", grantee_id),
                   kv("permission", callguard::to_string(permission)),
                   kv("expires_at", expires_at)});
    return grant;
}

AccessGrant AccessControl::revoke(const std::string& grant_id, const std::string& revoked_by) {
    require_admin(revoked_by);
    auto grant = store_.find_grant(grant_id);
    if (!grant) {
        throw NotFound("grant not found: " + grant_id);
    }
    const auto now = clock_.now();
    if (grant->expires_at > now) {
        grant->expires_at = now;
        store_.update_grant(*grant);
    }
    logging::info("Access revoked", {kv("grant_id", grant_id), kv("by", revoked_by)});
    return *grant;
}

std::vector<Recording> AccessControl::list_accessible_recordings(const std::string& user_id) {
    auto user = store_.find_user(user_id);
    if (user && user->is_admin) {
        return store_.all_recordings();
    }

    auto recordings = store_.recordings_for_participant(user_id);
    std::set<std::string> seen;
    for (const auto& recording : recordings) {
        seen.insert(recording.id);
    }
    const auto now = clock_.now();
    for (const auto& grant : store_.grants_for_user(user_id)) {
        if (grant.expires_at <= now || seen.count(grant.recording_id) > 0) {
            continue;
        }
        if (auto recording = store_.find_recording(grant.recording_id)) {
            seen.insert(recording->id);
            recordings.push_back(*recording);
        }
    }
    return recordings;
}

std::vector<AccessLogEntry> AccessControl::access_log(const std::string& recording_id) {
    return store_.access_log(recording_id);
}

}
