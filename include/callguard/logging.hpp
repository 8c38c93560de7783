#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "callguard/config.hpp"
#include "callguard/model/types.hpp"
#include "spdlog/logger.h"

namespace callguard {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

using Fields = std::initializer_list<KeyValue>;

std::string format_timestamp(Timestamp value);

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {key, oss.str()};
}

inline KeyValue kv(const std::string& key, bool value) {
    return {key, value ? "true" : "false"};
}

inline KeyValue kv(const std::string& key, Timestamp value) {
    return {key, format_timestamp(value)};
}

template <typename T>
inline KeyValue kv(const std::string& key, const std::optional<T>& value) {
    if (!value) {
        return {key, "-"};
    }
    return kv(key, *value);
}

// "message [k1=v1, k2=\"v 2\"]"; values with separators or quotes are quoted.
std::string with_kv(const std::string& message, Fields fields);

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

void log(spdlog::level::level_enum level, const std::string& message, Fields fields = {});

inline void debug(const std::string& message, Fields fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void info(const std::string& message, Fields fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void warn(const std::string& message, Fields fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void error(const std::string& message, Fields fields = {}) {
    log(spdlog::level::err, message, fields);
}

}

using logging::kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::warn;

}
