#include "callguard/utils/keyed_mutex.hpp"

namespace callguard::utils {

KeyedMutex::Guard::Guard(KeyedMutex& owner, std::string key)
    : owner_(owner),
      key_(std::move(key)),
      mutex_(owner_.acquire(key_)) {
    mutex_->lock();
}

KeyedMutex::Guard::~Guard() {
    mutex_->unlock();
    owner_.release(key_);
}

KeyedMutex::Guard KeyedMutex::lock(const std::string& key) {
    return Guard(*this, key);
}

size_t KeyedMutex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

std::shared_ptr<std::mutex> KeyedMutex::acquire(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[key];
    if (!slot.mutex) {
        slot.mutex = std::make_shared<std::mutex>();
    }
    ++slot.holders;
    return slot.mutex;
}

void KeyedMutex::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return;
    }
    if (--it->second.holders == 0) {
        slots_.erase(it);
    }
}

}
