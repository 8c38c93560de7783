#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "callguard/model/types.hpp"
#include "callguard/storage/store.hpp"

namespace callguard::signaling {

struct Delivery {
    std::vector<SignalingMessage> messages;
    // Channel was closed while waiting; no further messages will arrive.
    bool closed = false;
};

// Durable store-and-forward channel between the two endpoints of a call.
// Knows nothing about call state.
class Relay {
public:
    explicit Relay(storage::Store& store);

    void open(const std::string& call_id);
    int64_t append(const SignalingMessage& message);
    // Unconsumed messages not sent by `recipient`, oldest first; marks them consumed.
    std::vector<SignalingMessage> fetch(const std::string& call_id,
                                        const std::string& recipient);
    // A channel that was never opened, or already collected, counts as closed.
    Delivery wait(const std::string& call_id,
                  const std::string& recipient,
                  std::chrono::milliseconds timeout);
    void close(const std::string& call_id);
    bool is_open(const std::string& call_id) const;
    size_t channel_count() const;
    size_t collect_garbage(Timestamp ended_before);

private:
    struct Channel {
        std::condition_variable cv;
        uint64_t version = 0;
        bool closed = false;
    };

    std::shared_ptr<Channel> channel(const std::string& call_id);
    std::shared_ptr<Channel> find(const std::string& call_id) const;

    storage::Store& store_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
};

}
