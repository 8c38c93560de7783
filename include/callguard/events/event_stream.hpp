#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "callguard/model/types.hpp"
#include "callguard/storage/store.hpp"
#include "callguard/utils/clock.hpp"

namespace callguard::events {

// Durable lifecycle stream: every event is persisted with a cursor before
// in-process subscribers see it.
class EventStream {
public:
    using Subscriber = std::function<void(const LifecycleEvent&)>;

    EventStream(storage::Store& store, const utils::Clock& clock);

    LifecycleEvent publish(const std::string& type,
                           const std::string& call_id,
                           const std::string& subject_id,
                           const nlohmann::json& payload = nlohmann::json::object());
    void subscribe(Subscriber subscriber);
    std::vector<LifecycleEvent> read(int64_t cursor, size_t limit);

private:
    storage::Store& store_;
    const utils::Clock& clock_;
    std::mutex subscribers_mutex_;
    std::vector<Subscriber> subscribers_;
};

// Lets a component collect events while holding a call lock and publish
// them once the lock is released.
class PendingEvents {
public:
    explicit PendingEvents(EventStream& stream) : stream_(stream) {}

    void add(std::string type, std::string call_id, std::string subject_id,
             nlohmann::json payload = nlohmann::json::object());
    void flush();

private:
    struct Entry {
        std::string type;
        std::string call_id;
        std::string subject_id;
        nlohmann::json payload;
    };

    EventStream& stream_;
    std::vector<Entry> entries_;
};

}
