#include "callguard/events/event_stream.hpp"

#include <utility>

#include "callguard/logging.hpp"
#include "callguard/utils/ids.hpp"

namespace callguard::events {

EventStream::EventStream(storage::Store& store, const utils::Clock& clock)
    : store_(store), clock_(clock) {}

LifecycleEvent EventStream::publish(const std::string& type,
                                    const std::string& call_id,
                                    const std::string& subject_id,
                                    const nlohmann::json& payload) {
    LifecycleEvent event;
    event.event_id = utils::make_uuid();
    event.type = type;
    event.call_id = call_id;
    event.subject_id = subject_id;
    event.payload = payload.dump();
    event.created_at = clock_.now();
    event.seq = store_.append_event(event);

    logging::debug("Lifecycle event",
                   {kv("type", type), kv("call_id", call_id), kv("seq", event.seq)});

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers = subscribers_;
    }
    for (const auto& subscriber : subscribers) {
        try {
            subscriber(event);
        } catch (const std::exception& ex) {
            logging::error("Event subscriber failed",
                           {kv("type", type), kv("call_id", call_id), kv("error", ex.what())});
        }
    }
    return event;
}

void EventStream::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.push_back(std::move(subscriber));
}

std::vector<LifecycleEvent> EventStream::read(int64_t cursor, size_t limit) {
    return store_.events_after(cursor, limit);
}

void PendingEvents::add(std::string type, std::string call_id, std::string subject_id,
                        nlohmann::json payload) {
    entries_.push_back({std::move(type), std::move(call_id), std::move(subject_id),
                        std::move(payload)});
}

void PendingEvents::flush() {
    auto entries = std::move(entries_);
    entries_.clear();
    for (const auto& entry : entries) {
        stream_.publish(entry.type, entry.call_id, entry.subject_id, entry.payload);
    }
}

}
