#pragma once

#include <string>
#include <vector>

#include "callguard/model/types.hpp"
#include "callguard/storage/store.hpp"
#include "callguard/utils/clock.hpp"

namespace callguard::access {

enum class DecisionCode {
    Ok,
    Unauthorized,
    Unavailable
};

std::string to_string(DecisionCode code);

struct Decision {
    bool allowed = false;
    DecisionCode code = DecisionCode::Unauthorized;
};

// Gates every recording read. Each authorize() writes exactly one audit entry
// before returning; if that write fails the request is denied.
class AccessControl {
public:
    AccessControl(storage::Store& store, const utils::Clock& clock);

    Decision authorize(const std::string& recording_id,
                       const std::string& accessor_id,
                       AccessAction action,
                       const std::string& source_address = "");
    // authorize() that throws Unauthorized or StorageUnavailable on denial.
    void require(const std::string& recording_id,
                 const std::string& accessor_id,
                 AccessAction action,
                 const std::string& source_address = "");

    AccessGrant grant(const std::string& recording_id,
                      const std::string& grantee_id,
                      Permission permission,
                      const std::string& granted_by,
                      Timestamp expires_at);
    AccessGrant revoke(const std::string& grant_id, const std::string& revoked_by);

    std::vector<Recording> list_accessible_recordings(const std::string& user_id);
    std::vector<AccessLogEntry> access_log(const std::string& recording_id);

private:
    bool evaluate(const std::string& recording_id,
                  const std::string& accessor_id,
                  AccessAction action,
                  Timestamp now);
    void require_admin(const std::string& user_id);

    storage::Store& store_;
    const utils::Clock& clock_;
};

}
