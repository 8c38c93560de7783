#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "callguard/events/event_stream.hpp"
#include "callguard/model/types.hpp"
#include "callguard/settings/settings.hpp"
#include "callguard/signaling/relay.hpp"
#include "callguard/storage/store.hpp"
#include "callguard/utils/clock.hpp"
#include "callguard/utils/keyed_mutex.hpp"

namespace callguard::session {

struct SignalResult {
    CallSession call;
    int64_t message_id = 0;
};

// Owns the call state machine:
//   initiated -> ringing -> connected -> ended
//   ringing -> missed, initiated|ringing|connected -> failed
// initiated|ringing -> ended is a cancellation by either endpoint.
// Transitions of one call are serialized through the shared call lock; events
// are published after the lock is released.
class SessionManager {
public:
    SessionManager(storage::Store& store,
                   signaling::Relay& relay,
                   events::EventStream& events,
                   SettingsProvider& settings,
                   const utils::Clock& clock,
                   utils::KeyedMutex& call_locks);

    CallSession create(const std::string& initiator_id,
                       const std::string& counterpart_id,
                       CallType call_type = CallType::Consultation,
                       const std::string& context = "{}");
    SignalResult relay_signal(const std::string& call_id,
                              const std::string& sender_id,
                              SignalKind kind,
                              const std::string& payload);
    CallSession end(const std::string& call_id, const std::string& reason);
    CallSession fail(const std::string& call_id, const std::string& reason);
    CallSession mark_missed(const std::string& call_id);
    CallSession flag(const std::string& call_id, const std::string& reason);
    CallSession heartbeat(const std::string& call_id, const std::string& user_id);
    // Appends to the consent log. A withdrawal publishes call.consent_withdrawn.
    ConsentRecord record_consent(const std::string& call_id,
                                 const std::string& user_id,
                                 ConsentType type,
                                 ConsentStatus status,
                                 const std::string& method = "web_form",
                                 const std::string& source_address = "");
    std::vector<ConsentRecord> consents(const std::string& call_id);

    // Fails every live session without signaling activity for the idle timeout.
    size_t expire_idle(Timestamp now);

    CallSession get(const std::string& call_id);
    std::vector<CallSession> list_active();
    // Reopens relay channels of live sessions after a restart.
    void restore();

private:
    template <typename Fn>
    CallSession mutate(const std::string& call_id, Fn&& fn);

    void transition(CallSession& call,
                    CallStatus to,
                    const std::string& reason,
                    events::PendingEvents& pending);
    CallSession terminate(const std::string& call_id, CallStatus to, const std::string& reason);
    CallSession load(const std::string& call_id);

    storage::Store& store_;
    signaling::Relay& relay_;
    events::EventStream& events_;
    SettingsProvider& settings_;
    const utils::Clock& clock_;
    utils::KeyedMutex& call_locks_;
};

}
