#pragma once

#include <map>
#include <mutex>
#include <string>

#include "callguard/config.hpp"
#include "callguard/storage/store.hpp"

namespace callguard {

// Admin-managed knobs read at evaluation time.
struct RuntimeSettings {
    int recording_retention_sec = 90 * 24 * 3600;
    int signaling_idle_timeout_sec = 120;
    int ring_timeout_sec = 90;
    int max_upload_attempts = 5;
    int upload_retry_base_ms = 500;
    int signaling_retention_sec = 24 * 3600;
    int notify_max_attempts = 8;
    int notify_retry_base_sec = 5;

    static RuntimeSettings from_config(const Config& config);
    std::map<std::string, std::string> to_map() const;
    // Unknown keys and non-positive values throw std::invalid_argument.
    void apply(const std::map<std::string, std::string>& values);
};

class SettingsProvider {
public:
    SettingsProvider(storage::Store& store, RuntimeSettings defaults);

    // Writes defaults for keys the store does not have yet.
    void seed();
    RuntimeSettings current();
    RuntimeSettings update(const std::map<std::string, std::string>& values);

private:
    storage::Store& store_;
    RuntimeSettings defaults_;
    std::mutex mutex_;
};

}
