#include "callguard/settings/settings.hpp"

#include <stdexcept>

#include "callguard/logging.hpp"

namespace callguard {

namespace {

int parse_positive(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("setting " + key + " is not an integer: " + value);
    }
    if (consumed != value.size() || parsed <= 0) {
        throw std::invalid_argument("setting " + key + " must be a positive integer");
    }
    return parsed;
}

}

RuntimeSettings RuntimeSettings::from_config(const Config& config) {
    RuntimeSettings settings;
    settings.recording_retention_sec = config.recording_retention_sec;
    settings.signaling_idle_timeout_sec = config.signaling_idle_timeout_sec;
    settings.ring_timeout_sec = config.ring_timeout_sec;
    settings.max_upload_attempts = config.max_upload_attempts;
    settings.upload_retry_base_ms = config.upload_retry_base_ms;
    settings.signaling_retention_sec = config.signaling_retention_sec;
    settings.notify_max_attempts = config.notify_max_attempts;
    settings.notify_retry_base_sec = config.notify_retry_base_sec;
    return settings;
}

std::map<std::string, std::string> RuntimeSettings::to_map() const {
    return {
        {"recording_retention_sec", std::to_string(recording_retention_sec)},
        {"signaling_idle_timeout_sec", std::to_string(signaling_idle_timeout_sec)},
        {"ring_timeout_sec", std::to_string(ring_timeout_sec)},
        {"max_upload_attempts", std::to_string(max_upload_attempts)},
        {"upload_retry_base_ms", std::to_string(upload_retry_base_ms)},
        {"signaling_retention_sec", std::to_string(signaling_retention_sec)},
        {"notify_max_attempts", std::to_string(notify_max_attempts)},
        {"notify_retry_base_sec", std::to_string(notify_retry_base_sec)},
    };
}

void RuntimeSettings::apply(const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        const int parsed = parse_positive(key, value);
        if (key == "recording_retention_sec") {
            recording_retention_sec = parsed;
        } else if (key == "signaling_idle_timeout_sec") {
            signaling_idle_timeout_sec = parsed;
        } else if (key == "ring_timeout_sec") {
            ring_timeout_sec = parsed;
        } else if (key == "max_upload_attempts") {
            max_upload_attempts = parsed;
        } else if (key == "upload_retry_base_ms") {
            upload_retry_base_ms = parsed;
        } else if (key == "signaling_retention_sec") {
            signaling_retention_sec = parsed;
        } else if (key == "notify_max_attempts") {
            notify_max_attempts = parsed;
        } else if (key == "notify_retry_base_sec") {
            notify_retry_base_sec = parsed;
        } else {
            throw std::invalid_argument("unknown setting: " + key);
        }
    }
}

SettingsProvider::SettingsProvider(storage::Store& store, RuntimeSettings defaults)
    : store_(store), defaults_(defaults) {}

void SettingsProvider::seed() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto stored = store_.settings();
    for (const auto& [key, value] : defaults_.to_map()) {
        if (stored.find(key) == stored.end()) {
            store_.put_setting(key, value);
        }
    }
}

RuntimeSettings SettingsProvider::current() {
    RuntimeSettings settings = defaults_;
    const auto stored = store_.settings();
    for (const auto& [key, value] : stored) {
        try {
            settings.apply({{key, value}});
        } catch (const std::invalid_argument& ex) {
            logging::warn("Ignoring stored setting", {kv("key", key), kv("error", ex.what())});
        }
    }
    return settings;
}

RuntimeSettings SettingsProvider::update(const std::map<std::string, std::string>& values) {
    std::lock_guard<std::mutex> lock(mutex_);
    RuntimeSettings validated = defaults_;
    validated.apply(values);
    for (const auto& [key, value] : values) {
        store_.put_setting(key, value);
    }
    logging::info("Runtime settings updated", {kv("keys", values.size())});
    return current();
}

}
