#include "callguard/escalation/dispatcher.hpp"

#include <algorithm>
#include <chrono>

#include "callguard/logging.hpp"
#include "callguard/metrics.hpp"

namespace callguard::escalation {

namespace {

constexpr int64_t kMaxBackoffSec = 3600;

}

NotificationDispatcher::NotificationDispatcher(storage::Store& store,
                                               ChannelRegistry& channels,
                                               SettingsProvider& settings,
                                               const utils::Clock& clock)
    : store_(store), channels_(channels), settings_(settings), clock_(clock) {}

size_t NotificationDispatcher::dispatch_due(size_t limit) {
    const auto settings = settings_.current();
    auto jobs = store_.due_jobs(clock_.now(), limit);
    for (auto& job : jobs) {
        deliver(job, settings);
    }
    return jobs.size();
}

void NotificationDispatcher::deliver(NotificationJob& job, const RuntimeSettings& settings) {
    SendResult result;
    auto channel = channels_.find(job.channel);
    if (!channel) {
        result = SendResult::failure("unknown channel: " + job.channel);
    } else {
        try {
            result = channel->send(job.recipient, job.payload);
        } catch (const std::exception& ex) {
            result = SendResult::failure(ex.what());
        }
    }

    job.attempts += 1;
    if (result.ok) {
        job.state = JobState::Done;
        job.last_error.clear();
        store_.update_job(job);
        Metrics::instance().increment("notifications_total", "result", "sent");
        logging::info("Notification sent",
                      {kv("event_id", job.event_id),
                       kv("channel", job.channel),
                       kv("recipient", job.recipient),
                       kv("attempts", job.attempts)});
        return;
    }

    job.last_error = result.error;
    if (job.attempts >= settings.notify_max_attempts) {
        job.state = JobState::Dead;
        store_.update_job(job);
        Metrics::instance().increment("notifications_total", "result", "dead");
        logging::error("Notification abandoned",
                       {kv("event_id", job.event_id),
                        kv("channel", job.channel),
                        kv("recipient", job.recipient),
                        kv("attempts", job.attempts),
                        kv("error", result.error)});
        return;
    }

    const auto shift = std::min(job.attempts - 1, 20);
    const auto backoff = std::min<int64_t>(
        static_cast<int64_t>(settings.notify_retry_base_sec) << shift, kMaxBackoffSec);
    job.next_attempt_at = clock_.now() + std::chrono::seconds(backoff);
    store_.update_job(job);
    Metrics::instance().increment("notifications_total", "result", "retry");
    logging::warn("Notification failed, will retry",
                  {kv("event_id", job.event_id),
                   kv("channel", job.channel),
                   kv("attempts", job.attempts),
                   kv("retry_in_sec", backoff),
                   kv("error", result.error)});
}

}
