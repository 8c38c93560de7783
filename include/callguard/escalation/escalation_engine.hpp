#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "callguard/events/event_stream.hpp"
#include "callguard/model/types.hpp"
#include "callguard/session/session_manager.hpp"
#include "callguard/settings/settings.hpp"
#include "callguard/storage/store.hpp"
#include "callguard/utils/clock.hpp"
#include "callguard/utils/keyed_mutex.hpp"

namespace callguard::escalation {

struct TickReport {
    bool skipped = false;
    size_t evaluated = 0;
    size_t raised = 0;
    size_t missed = 0;
    size_t expired = 0;
};

// Periodic evaluator over persisted calls, rules and escalation events. The
// only writer of CallSession::escalation_level.
class EscalationEngine {
public:
    EscalationEngine(storage::Store& store,
                     session::SessionManager& sessions,
                     events::EventStream& events,
                     SettingsProvider& settings,
                     const utils::Clock& clock,
                     utils::KeyedMutex& call_locks);

    // Returns immediately with skipped=true while another tick is running.
    TickReport tick();
    EscalationEvent acknowledge(const std::string& event_id, const std::string& by);
    std::vector<EscalationEvent> escalations_for(const std::string& call_id);

    void on_event(const LifecycleEvent& event);

private:
    TickReport evaluate();
    bool matches(const EscalationRule& rule, const CallSession& call, Timestamp now) const;
    std::optional<Timestamp> last_raised(const std::string& call_id,
                                         const std::vector<EscalationEvent>& history);
    bool raise(const std::string& call_id, const EscalationRule& rule, Timestamp now);

    storage::Store& store_;
    session::SessionManager& sessions_;
    events::EventStream& events_;
    SettingsProvider& settings_;
    const utils::Clock& clock_;
    utils::KeyedMutex& call_locks_;

    std::atomic<bool> running_{false};
    std::mutex cooldown_mutex_;
    std::unordered_map<std::string, Timestamp> last_raised_;
};

}
