#pragma once

#include <cstddef>

#include "callguard/escalation/channels.hpp"
#include "callguard/settings/settings.hpp"
#include "callguard/storage/store.hpp"
#include "callguard/utils/clock.hpp"

namespace callguard::escalation {

// Delivers durable notification jobs; failures are rescheduled with
// exponential backoff until the attempt cap marks the job dead.
class NotificationDispatcher {
public:
    NotificationDispatcher(storage::Store& store,
                           ChannelRegistry& channels,
                           SettingsProvider& settings,
                           const utils::Clock& clock);

    // Runs one pass over due jobs; returns the number attempted.
    size_t dispatch_due(size_t limit = 100);

private:
    void deliver(NotificationJob& job, const RuntimeSettings& settings);

    storage::Store& store_;
    ChannelRegistry& channels_;
    SettingsProvider& settings_;
    const utils::Clock& clock_;
};

}
