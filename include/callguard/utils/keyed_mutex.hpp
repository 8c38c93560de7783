#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace callguard::utils {

// One mutex per key, created on demand and dropped once no holder remains.
// Serializes state transitions of a single call without a global lock.
class KeyedMutex {
public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        KeyedMutex& owner_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
    };

    Guard lock(const std::string& key);
    size_t size() const;

private:
    struct Slot {
        std::shared_ptr<std::mutex> mutex;
        size_t holders = 0;
    };

    std::shared_ptr<std::mutex> acquire(const std::string& key);
    void release(const std::string& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
};

}
