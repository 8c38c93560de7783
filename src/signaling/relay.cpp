#include "callguard/signaling/relay.hpp"

#include "callguard/errors.hpp"
#include "callguard/logging.hpp"

namespace callguard::signaling {

Relay::Relay(storage::Store& store) : store_(store) {}

std::shared_ptr<Relay::Channel> Relay::channel(const std::string& call_id) {
    auto it = channels_.find(call_id);
    if (it == channels_.end()) {
        it = channels_.emplace(call_id, std::make_shared<Channel>()).first;
    }
    return it->second;
}

std::shared_ptr<Relay::Channel> Relay::find(const std::string& call_id) const {
    auto it = channels_.find(call_id);
    return it == channels_.end() ? nullptr : it->second;
}

void Relay::open(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel(call_id)->closed = false;
}

int64_t Relay::append(const SignalingMessage& message) {
    std::shared_ptr<Channel> target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = find(message.call_id);
        if (!target || target->closed) {
            throw SessionClosed("signaling channel closed: " + message.call_id);
        }
    }
    const auto id = store_.append_signal(message);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++target->version;
    }
    target->cv.notify_all();
    return id;
}

std::vector<SignalingMessage> Relay::fetch(const std::string& call_id,
                                           const std::string& recipient) {
    auto messages = store_.unconsumed_signals(call_id, recipient);
    for (auto& message : messages) {
        store_.mark_consumed(message.id);
        message.consumed = true;
    }
    return messages;
}

Delivery Relay::wait(const std::string& call_id,
                     const std::string& recipient,
                     std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::shared_ptr<Channel> target;
    uint64_t seen = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = find(call_id);
        if (target) {
            seen = target->version;
        }
    }
    if (!target) {
        Delivery delivery;
        delivery.messages = fetch(call_id, recipient);
        delivery.closed = true;
        return delivery;
    }

    while (true) {
        Delivery delivery;
        delivery.messages = fetch(call_id, recipient);
        if (!delivery.messages.empty()) {
            return delivery;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (target->closed) {
            delivery.closed = true;
            return delivery;
        }
        const bool woke = target->cv.wait_until(lock, deadline, [&]() {
            return target->closed || target->version != seen;
        });
        seen = target->version;
        if (!woke) {
            return delivery;
        }
        if (target->closed) {
            lock.unlock();
            delivery.messages = fetch(call_id, recipient);
            delivery.closed = true;
            return delivery;
        }
    }
}

void Relay::close(const std::string& call_id) {
    std::shared_ptr<Channel> target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = find(call_id);
        if (!target) {
            return;
        }
        target->closed = true;
    }
    target->cv.notify_all();
    logging::debug("Signaling channel closed", {kv("call_id", call_id)});
}

bool Relay::is_open(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(call_id);
    return it != channels_.end() && !it->second->closed;
}

size_t Relay::channel_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

size_t Relay::collect_garbage(Timestamp ended_before) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = channels_.begin(); it != channels_.end();) {
            if (it->second->closed) {
                it = channels_.erase(it);
            } else {
                ++it;
            }
        }
    }
    const auto removed = store_.purge_signals(ended_before);
    if (removed > 0) {
        logging::info("Signaling messages purged", {kv("count", removed)});
    }
    return removed;
}

}
