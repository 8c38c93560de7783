#include "callguard/escalation/escalation_engine.hpp"

#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <unordered_set>

#include "callguard/errors.hpp"
#include "callguard/logging.hpp"
#include "callguard/metrics.hpp"
#include "callguard/utils/ids.hpp"

namespace callguard::escalation {

namespace {

class TickGuard {
public:
    explicit TickGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~TickGuard() { flag_.store(false); }

    TickGuard(const TickGuard&) = delete;
    TickGuard& operator=(const TickGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

bool older_than(Timestamp since, Timestamp now, int threshold_seconds) {
    return now - since >= std::chrono::seconds(threshold_seconds);
}

}

EscalationEngine::EscalationEngine(storage::Store& store,
                                   session::SessionManager& sessions,
                                   events::EventStream& events,
                                   SettingsProvider& settings,
                                   const utils::Clock& clock,
                                   utils::KeyedMutex& call_locks)
    : store_(store),
      sessions_(sessions),
      events_(events),
      settings_(settings),
      clock_(clock),
      call_locks_(call_locks) {}

TickReport EscalationEngine::tick() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        logging::warn("Escalation tick still running, skipping");
        Metrics::instance().increment("escalation_ticks_total", "result", "skipped");
        TickReport report;
        report.skipped = true;
        return report;
    }
    TickGuard guard(running_);
    auto report = evaluate();
    Metrics::instance().increment("escalation_ticks_total", "result", "completed");
    return report;
}

bool EscalationEngine::matches(const EscalationRule& rule,
                               const CallSession& call,
                               Timestamp now) const {
    if (!rule.active || is_terminal(call.status)) {
        return false;
    }
    switch (rule.trigger) {
        case TriggerCondition::UnansweredTimeout:
            return call.status == CallStatus::Ringing &&
                   older_than(call.created_at, now, rule.threshold_seconds);
        case TriggerCondition::Flagged:
            return call.flagged_at.has_value() &&
                   older_than(*call.flagged_at, now, rule.threshold_seconds);
        case TriggerCondition::EndpointOffline: {
            if (call.status != CallStatus::Connected) {
                return false;
            }
            const auto base = call.answered_at.value_or(call.created_at);
            auto last_seen = [&](const std::optional<Timestamp>& seen) {
                return seen ? std::max(*seen, base) : base;
            };
            return older_than(last_seen(call.initiator_seen_at), now, rule.threshold_seconds) ||
                   older_than(last_seen(call.counterpart_seen_at), now, rule.threshold_seconds);
        }
    }
    return false;
}

std::optional<Timestamp> EscalationEngine::last_raised(
    const std::string& call_id,
    const std::vector<EscalationEvent>& history) {
    std::optional<Timestamp> latest;
    for (const auto& event : history) {
        if (!latest || event.triggered_at > *latest) {
            latest = event.triggered_at;
        }
    }
    std::lock_guard<std::mutex> lock(cooldown_mutex_);
    auto it = last_raised_.find(call_id);
    if (it != last_raised_.end() && (!latest || it->second > *latest)) {
        latest = it->second;
    }
    return latest;
}

TickReport EscalationEngine::evaluate() {
    TickReport report;
    const auto now = clock_.now();
    const auto settings = settings_.current();

    std::vector<EscalationRule> rules;
    for (const auto& rule : store_.rules()) {
        if (rule.active) {
            rules.push_back(rule);
        }
    }
    std::stable_sort(rules.begin(), rules.end(),
                     [](const EscalationRule& a, const EscalationRule& b) {
                         if (a.threshold_seconds != b.threshold_seconds) {
                             return a.threshold_seconds < b.threshold_seconds;
                         }
                         return a.priority_level > b.priority_level;
                     });

    for (const auto& call : store_.active_calls()) {
        ++report.evaluated;
        try {
            const auto history = store_.escalations_for(call.id);
            std::unordered_set<std::string> fired;
            for (const auto& event : history) {
                fired.insert(event.rule_id);
            }
            const auto previous = last_raised(call.id, history);

            for (const auto& rule : rules) {
                if (fired.count(rule.id) > 0 || !matches(rule, call, now)) {
                    continue;
                }
                if (previous && rule.cooldown_seconds > 0 &&
                    !older_than(*previous, now, rule.cooldown_seconds)) {
                    continue;
                }
                if (raise(call.id, rule, now)) {
                    ++report.raised;
                    break;
                }
            }

            if (call.status == CallStatus::Ringing &&
                older_than(call.created_at, now, settings.ring_timeout_sec)) {
                try {
                    const auto updated = sessions_.mark_missed(call.id);
                    if (updated.status == CallStatus::Missed) {
                        ++report.missed;
                    }
                } catch (const InvalidStateTransition& ex) {
                    logging::debug("Call moved on before ring timeout",
                                   {kv("call_id", call.id), kv("error", ex.what())});
                }
            }
        } catch (const std::exception& ex) {
            logging::error("Escalation evaluation failed",
                           {kv("call_id", call.id), kv("error", ex.what())});
        }
    }

    try {
        report.expired = sessions_.expire_idle(now);
    } catch (const std::exception& ex) {
        logging::error("Idle expiry failed", {kv("error", ex.what())});
    }

    if (report.raised > 0 || report.missed > 0 || report.expired > 0) {
        logging::info("Escalation tick",
                      {kv("calls", report.evaluated),
                       kv("raised", report.raised),
                       kv("missed", report.missed),
                       kv("expired", report.expired)});
    }
    return report;
}

bool EscalationEngine::raise(const std::string& call_id,
                             const EscalationRule& rule,
                             Timestamp now) {
    events::PendingEvents pending(events_);
    EscalationEvent event;
    size_t jobs = 0;
    {
        auto guard = call_locks_.lock(call_id);
        auto call = store_.find_call(call_id);
        if (!call || !matches(rule, *call, now)) {
            return false;
        }

        // The event, the level bump and its notification jobs land together or
        // not at all.
        auto tx = store_.begin();
        int level = call->escalation_level;
        for (const auto& previous : store_.escalations_for(call_id)) {
            level = std::max(level, previous.level);
        }

        event.id = utils::make_uuid();
        event.call_id = call_id;
        event.rule_id = rule.id;
        event.level = level + 1;
        event.triggered_at = now;
        if (!store_.insert_escalation(event)) {
            logging::debug("Escalation level already recorded",
                           {kv("call_id", call_id), kv("level", event.level)});
            return false;
        }

        const auto targets = store_.users_with_role(rule.escalate_to_role);
        call->escalation_level = event.level;
        if (!targets.empty()) {
            call->escalated_to = targets.front().id;
        }
        store_.update_call(*call);

        const nlohmann::json notification = {
            {"event_id", event.id},
            {"call_id", call_id},
            {"rule_id", rule.id},
            {"trigger", to_string(rule.trigger)},
            {"level", event.level},
            {"priority", rule.priority_level},
            {"role", rule.escalate_to_role},
            {"call_type", to_string(call->call_type)},
            {"status", to_string(call->status)},
            {"triggered_at", logging::format_timestamp(now)},
        };
        std::vector<std::string> recipients;
        for (const auto& target : targets) {
            recipients.push_back(target.id);
        }
        if (recipients.empty()) {
            recipients.push_back("role:" + rule.escalate_to_role);
        }
        for (const auto& channel : rule.notification_channels) {
            for (const auto& recipient : recipients) {
                NotificationJob job;
                job.event_id = event.id;
                job.channel = channel;
                job.recipient = recipient;
                job.payload = notification.dump();
                job.next_attempt_at = now;
                job.state = JobState::Pending;
                store_.insert_job(job);
                ++jobs;
            }
        }
        tx->commit();

        pending.add("escalation.raised", call_id, event.id,
                    {{"event_id", event.id},
                     {"rule_id", rule.id},
                     {"level", event.level},
                     {"escalated_to", call->escalated_to ? *call->escalated_to : ""}});
        {
            std::lock_guard<std::mutex> lock(cooldown_mutex_);
            last_raised_[call_id] = now;
        }
    }
    pending.flush();

    Metrics::instance().increment("escalations_raised_total", "trigger", to_string(rule.trigger));
    logging::warn("Call escalated",
                  {kv("call_id", call_id),
                   kv("rule_id", rule.id),
                   kv("level", event.level),
                   kv("jobs", jobs)});
    return true;
}

EscalationEvent EscalationEngine::acknowledge(const std::string& event_id,
                                              const std::string& by) {
    if (by.empty()) {
        throw std::invalid_argument("acknowledging user is required");
    }
    auto found = store_.find_escalation(event_id);
    if (!found) {
        throw NotFound("escalation event not found: " + event_id);
    }

    events::PendingEvents pending(events_);
    EscalationEvent event;
    {
        auto guard = call_locks_.lock(found->call_id);
        event = *store_.find_escalation(event_id);
        if (event.acknowledged_by) {
            return event;
        }
        event.acknowledged_by = by;
        event.acknowledged_at = clock_.now();
        store_.update_escalation(event);
        pending.add("escalation.acknowledged", event.call_id, event.id,
                    {{"event_id", event.id}, {"level", event.level}, {"by", by}});
    }
    pending.flush();
    logging::info("Escalation acknowledged",
                  {kv("event_id", event_id), kv("call_id", event.call_id), kv("by", by)});
    return event;
}

std::vector<EscalationEvent> EscalationEngine::escalations_for(const std::string& call_id) {
    return store_.escalations_for(call_id);
}

void EscalationEngine::on_event(const LifecycleEvent& event) {
    if (event.type != "call.ended" && event.type != "call.missed" &&
        event.type != "call.failed") {
        return;
    }
    std::lock_guard<std::mutex> lock(cooldown_mutex_);
    last_raised_.erase(event.call_id);
}

}
