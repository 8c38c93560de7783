#include "callguard/session/session_manager.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "callguard/errors.hpp"
#include "callguard/logging.hpp"
#include "callguard/metrics.hpp"
#include "callguard/utils/ids.hpp"

namespace callguard::session {

namespace {

bool transition_allowed(CallStatus from, CallStatus to) {
    switch (from) {
        case CallStatus::Initiated:
            return to == CallStatus::Ringing || to == CallStatus::Ended ||
                   to == CallStatus::Failed;
        case CallStatus::Ringing:
            return to == CallStatus::Connected || to == CallStatus::Missed ||
                   to == CallStatus::Ended || to == CallStatus::Failed;
        case CallStatus::Connected:
            return to == CallStatus::Ended || to == CallStatus::Failed;
        default:
            return false;
    }
}

void touch(CallSession& call, const std::string& user_id, Timestamp now) {
    call.last_activity_at = now;
    if (user_id == call.initiator_id) {
        call.initiator_seen_at = now;
    } else if (user_id == call.counterpart_id) {
        call.counterpart_seen_at = now;
    }
}

}

SessionManager::SessionManager(storage::Store& store,
                               signaling::Relay& relay,
                               events::EventStream& events,
                               SettingsProvider& settings,
                               const utils::Clock& clock,
                               utils::KeyedMutex& call_locks)
    : store_(store),
      relay_(relay),
      events_(events),
      settings_(settings),
      clock_(clock),
      call_locks_(call_locks) {}

CallSession SessionManager::load(const std::string& call_id) {
    auto call = store_.find_call(call_id);
    if (!call) {
        throw NotFound("call not found: " + call_id);
    }
    return *call;
}

template <typename Fn>
CallSession SessionManager::mutate(const std::string& call_id, Fn&& fn) {
    events::PendingEvents pending(events_);
    CallSession call;
    bool closed = false;
    {
        auto guard = call_locks_.lock(call_id);
        auto tx = store_.begin();
        call = load(call_id);
        const bool was_terminal = is_terminal(call.status);
        if (fn(call, pending)) {
            store_.update_call(call);
        }
        tx->commit();
        closed = !was_terminal && is_terminal(call.status);
    }
    if (closed) {
        relay_.close(call_id);
    }
    pending.flush();
    return call;
}

void SessionManager::transition(CallSession& call,
                                CallStatus to,
                                const std::string& reason,
                                events::PendingEvents& pending) {
    if (!transition_allowed(call.status, to)) {
        throw InvalidStateTransition("call " + call.id + ": " + to_string(call.status) +
                                     " -> " + to_string(to));
    }
    const auto now = clock_.now();
    const auto from = call.status;
    call.status = to;
    if (to == CallStatus::Connected) {
        call.answered_at = now;
    }
    if (is_terminal(to)) {
        call.ended_at = now;
        call.end_reason = reason;
    }

    nlohmann::json payload = {{"from", to_string(from)}, {"status", to_string(to)}};
    if (!reason.empty()) {
        payload["reason"] = reason;
    }
    pending.add("call." + to_string(to), call.id, call.initiator_id, payload);
    Metrics::instance().increment("call_transitions_total", "status", to_string(to));
    logging::info("Call transition",
                  {kv("call_id", call.id),
                   kv("from", to_string(from)),
                   kv("to", to_string(to)),
                   kv("reason", reason)});
}

CallSession SessionManager::create(const std::string& initiator_id,
                                   const std::string& counterpart_id,
                                   CallType call_type,
                                   const std::string& context) {
    if (initiator_id.empty() || counterpart_id.empty() || initiator_id == counterpart_id) {
        throw InvalidParticipants("initiator and counterpart must be two distinct users");
    }
    nlohmann::json parsed_context;
    try {
        parsed_context = nlohmann::json::parse(context.empty() ? "{}" : context);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::invalid_argument(std::string("call context is not JSON: ") + ex.what());
    }
    if (!parsed_context.is_object()) {
        throw std::invalid_argument("call context must be a JSON object");
    }

    events::PendingEvents pending(events_);
    CallSession call;
    {
        // Serializes concurrent creates by the same initiator.
        auto guard = call_locks_.lock("initiator:" + initiator_id);
        if (!store_.find_user(initiator_id)) {
            throw InvalidParticipants("unknown initiator: " + initiator_id);
        }
        if (!store_.find_user(counterpart_id)) {
            throw InvalidParticipants("unknown counterpart: " + counterpart_id);
        }
        if (auto active = store_.active_call_for(initiator_id)) {
            throw InvalidParticipants("initiator " + initiator_id +
                                      " already has an active call " + active->id);
        }

        const auto now = clock_.now();
        call.id = utils::make_uuid();
        call.initiator_id = initiator_id;
        call.counterpart_id = counterpart_id;
        call.call_type = call_type;
        call.context = parsed_context.dump();
        call.created_at = now;
        call.last_activity_at = now;
        call.initiator_seen_at = now;
        if (call_type == CallType::Emergency) {
            call.flagged_at = now;
            call.flag_reason = "emergency";
            pending.add("call.flagged", call.id, initiator_id, {{"reason", "emergency"}});
        }
        store_.insert_call(call);
        relay_.open(call.id);
    }

    Metrics::instance().increment("calls_created_total", "call_type", to_string(call_type));
    logging::info("Call created",
                  {kv("call_id", call.id),
                   kv("initiator", initiator_id),
                   kv("counterpart", counterpart_id),
                   kv("call_type", to_string(call_type))});
    pending.flush();
    return call;
}

SignalResult SessionManager::relay_signal(const std::string& call_id,
                                          const std::string& sender_id,
                                          SignalKind kind,
                                          const std::string& payload) {
    SignalResult result;
    result.call = mutate(call_id, [&](CallSession& call, events::PendingEvents& pending) {
        if (!call.is_participant(sender_id)) {
            throw InvalidParticipants("sender " + sender_id + " is not part of call " + call_id);
        }
        if (is_terminal(call.status) && kind == SignalKind::Hangup) {
            // Both endpoints may hang up at once; the later one is a no-op.
            logging::debug("Hangup on finished call",
                           {kv("call_id", call_id), kv("sender", sender_id),
                            kv("status", to_string(call.status))});
            return false;
        }
        if (is_terminal(call.status)) {
            throw SessionClosed("call " + call_id + " is " + to_string(call.status));
        }

        const auto now = clock_.now();
        SignalingMessage message;
        message.call_id = call_id;
        message.sender_id = sender_id;
        message.kind = kind;
        message.payload = payload;
        message.created_at = now;
        result.message_id = relay_.append(message);
        touch(call, sender_id, now);

        switch (kind) {
            case SignalKind::Offer:
                if (call.status == CallStatus::Initiated) {
                    transition(call, CallStatus::Ringing, "", pending);
                }
                break;
            case SignalKind::Answer:
                if (call.status == CallStatus::Initiated) {
                    transition(call, CallStatus::Ringing, "", pending);
                }
                if (call.status == CallStatus::Ringing) {
                    transition(call, CallStatus::Connected, "", pending);
                }
                break;
            case SignalKind::IceCandidate:
                break;
            case SignalKind::Hangup:
                transition(call, CallStatus::Ended, "hangup", pending);
                break;
        }
        return true;
    });
    return result;
}

CallSession SessionManager::terminate(const std::string& call_id,
                                      CallStatus to,
                                      const std::string& reason) {
    return mutate(call_id, [&](CallSession& call, events::PendingEvents& pending) {
        if (is_terminal(call.status)) {
            logging::debug("Call already terminal",
                           {kv("call_id", call_id), kv("status", to_string(call.status))});
            return false;
        }
        transition(call, to, reason, pending);
        return true;
    });
}

CallSession SessionManager::end(const std::string& call_id, const std::string& reason) {
    return terminate(call_id, CallStatus::Ended, reason.empty() ? "ended" : reason);
}

CallSession SessionManager::fail(const std::string& call_id, const std::string& reason) {
    return terminate(call_id, CallStatus::Failed, reason.empty() ? "failed" : reason);
}

CallSession SessionManager::mark_missed(const std::string& call_id) {
    return terminate(call_id, CallStatus::Missed, "ring_timeout");
}

CallSession SessionManager::flag(const std::string& call_id, const std::string& reason) {
    return mutate(call_id, [&](CallSession& call, events::PendingEvents& pending) {
        if (is_terminal(call.status)) {
            throw SessionClosed("call " + call_id + " is " + to_string(call.status));
        }
        if (call.flagged_at) {
            return false;
        }
        call.flagged_at = clock_.now();
        call.flag_reason = reason.empty() ? "urgent" : reason;
        pending.add("call.flagged", call_id, call.initiator_id, {{"reason", call.flag_reason}});
        logging::warn("Call flagged", {kv("call_id", call_id), kv("reason", call.flag_reason)});
        return true;
    });
}

CallSession SessionManager::heartbeat(const std::string& call_id, const std::string& user_id) {
    return mutate(call_id, [&](CallSession& call, events::PendingEvents&) {
        if (!call.is_participant(user_id)) {
            throw InvalidParticipants("user " + user_id + " is not part of call " + call_id);
        }
        if (is_terminal(call.status)) {
            throw SessionClosed("call " + call_id + " is " + to_string(call.status));
        }
        touch(call, user_id, clock_.now());
        return true;
    });
}

size_t SessionManager::expire_idle(Timestamp now) {
    const auto idle = std::chrono::seconds(settings_.current().signaling_idle_timeout_sec);
    size_t expired = 0;
    for (const auto& candidate : store_.active_calls()) {
        if (now - candidate.last_activity_at < idle) {
            continue;
        }
        bool changed = false;
        mutate(candidate.id, [&](CallSession& call, events::PendingEvents& pending) {
            // Re-checked under the lock; a message may have arrived meanwhile.
            if (is_terminal(call.status) || now - call.last_activity_at < idle) {
                return false;
            }
            transition(call, CallStatus::Failed, "signaling_idle_timeout", pending);
            changed = true;
            return true;
        });
        if (changed) {
            ++expired;
        }
    }
    return expired;
}

ConsentRecord SessionManager::record_consent(const std::string& call_id,
                                             const std::string& user_id,
                                             ConsentType type,
                                             ConsentStatus status,
                                             const std::string& method,
                                             const std::string& source_address) {
    ConsentRecord consent;
    mutate(call_id, [&](CallSession& call, events::PendingEvents& pending) {
        if (!call.is_participant(user_id)) {
            throw InvalidParticipants("user " + user_id + " is not part of call " + call_id);
        }
        // Withdrawal stays possible after the call ends.
        if (status == ConsentStatus::Given && is_terminal(call.status)) {
            throw SessionClosed("call " + call_id + " is " + to_string(call.status));
        }
        consent.call_id = call_id;
        consent.user_id = user_id;
        consent.type = type;
        consent.status = status;
        consent.method = method.empty() ? "web_form" : method;
        consent.source_address = source_address;
        consent.recorded_at = clock_.now();
        consent.id = store_.append_consent(consent);
        if (status == ConsentStatus::Withdrawn) {
            pending.add("call.consent_withdrawn", call_id, user_id,
                        {{"user_id", user_id}, {"type", to_string(type)}});
        }
        return false;
    });
    logging::info("Consent recorded",
                  {kv("call_id", call_id),
                   kv("user_id", user_id),
                   kv("type", to_string(type)),
                   kv("status", to_string(status))});
    return consent;
}

std::vector<ConsentRecord> SessionManager::consents(const std::string& call_id) {
    load(call_id);
    return store_.consents_for(call_id);
}

CallSession SessionManager::get(const std::string& call_id) {
    return load(call_id);
}

std::vector<CallSession> SessionManager::list_active() {
    return store_.active_calls();
}

void SessionManager::restore() {
    const auto active = store_.active_calls();
    for (const auto& call : active) {
        relay_.open(call.id);
    }
    logging::info("Signaling channels restored", {kv("count", active.size())});
}

}
