#include "callguard/logging.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace callguard::logging {

namespace {

std::mutex& name_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::string& logger_name() {
    static std::string name = "callguard";
    return name;
}

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "warning") {
        value = "warn";
    }
    // Unknown names map to off; fall back to info for those.
    const auto level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && value != "off") {
        return spdlog::level::info;
    }
    return level;
}

void append_value(std::string& out, const std::string& value) {
    const bool quote = value.empty() || value.find_first_of(" ,=\"") != std::string::npos;
    if (!quote) {
        out += value;
        return;
    }
    out += '"';
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            out += '\\';
        }
        out += ch;
    }
    out += '"';
}

}

std::string with_kv(const std::string& message, Fields fields) {
    if (fields.size() == 0) {
        return message;
    }
    std::string out = message + " [";
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += field.key;
        out += '=';
        append_value(out, field.value);
    }
    out += ']';
    return out;
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true));
    }

    {
        std::lock_guard<std::mutex> lock(name_mutex());
        logger_name() = config.log_name;
    }
    spdlog::drop(config.log_name);
    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(name_mutex());
        name = logger_name();
    }
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    return spdlog::default_logger();
}

void log(spdlog::level::level_enum level, const std::string& message, Fields fields) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, fields));
    }
}

std::string format_timestamp(Timestamp value) {
    const auto millis = to_millis(value);
    const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    std::tm tm_value{};
    gmtime_r(&seconds, &tm_value);
    std::ostringstream out;
    out << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << (millis % 1000) << 'Z';
    return out.str();
}

}
