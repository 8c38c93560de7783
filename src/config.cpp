#include "callguard/config.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "callguard/model/json.hpp"

namespace callguard {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Environment lookups; empty values count as unset. Numeric values that do
// not parse are reported with the variable name.
class Env {
public:
    std::optional<std::string> get(const char* name) const {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::string str(const char* name, const std::string& fallback) const {
        return get(name).value_or(fallback);
    }

    template <typename T>
    T number(const char* name, T fallback) const {
        const auto raw = get(name);
        if (!raw) {
            return fallback;
        }
        std::istringstream stream(trim(*raw));
        T parsed{};
        if (!(stream >> parsed) || !stream.eof()) {
            throw std::runtime_error(std::string(name) + " is not a number: " + *raw);
        }
        return parsed;
    }
};

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// KEY=VALUE lines, optional "export " prefix and quotes; variables already
// present in the environment win over the file.
void apply_dotenv(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream) {
        return;
    }
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        const auto key = trim(line.substr(0, eq));
        const auto value = unquote(trim(line.substr(eq + 1)));
        setenv(key.c_str(), value.c_str(), 0);
    }
}

std::string stamped_log_name(const std::filesystem::path& path) {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_value{};
    localtime_r(&now, &tm_value);
    std::ostringstream name;
    name << path.stem().string() << '_' << std::put_time(&tm_value, "%Y%m%d_%H%M%S")
         << path.extension().string();
    return name.str();
}

}

std::vector<EscalationRule> parse_escalation_rules(const std::string& raw) {
    std::vector<EscalationRule> rules;
    if (trim(raw).empty()) {
        return rules;
    }
    auto json = nlohmann::json::parse(raw);
    if (!json.is_array()) {
        throw std::runtime_error("ESCALATION_RULES must be a JSON array");
    }
    for (const auto& item : json) {
        rules.push_back(rule_from_json(item));
    }
    return rules;
}

Config Config::load() {
    apply_dotenv(std::filesystem::current_path() / ".env");
    const Env env;
    Config config;
    const auto data_base =
        env.str("CALLGUARD_DATA_DIR", (std::filesystem::current_path() / "data").string());

    config.store_path = env.str("STORE_PATH", data_base + "/callguard.db");
    config.spool_dir = env.str("RECORDING_SPOOL_DIR", data_base + "/spool");
    config.archive_dir = env.str("RECORDING_ARCHIVE_DIR", data_base + "/archive");
    config.recording_master_key = env.str("RECORDING_MASTER_KEY", "");

    config.rest_api_host = env.str("REST_API_HOST", "0.0.0.0");
    config.rest_api_port = env.number<int>("REST_API_PORT", 8000);
    config.authorization_token = env.get("AUTHORIZATION_TOKEN");

    config.escalation_tick_sec = env.number<double>("ESCALATION_TICK_SEC", 5.0);
    config.dispatch_poll_sec = env.number<double>("DISPATCH_POLL_SEC", 1.0);
    config.maintenance_interval_sec = env.number<int>("MAINTENANCE_INTERVAL_SEC", 60);
    config.upload_workers = env.number<int>("UPLOAD_WORKERS", 4);

    config.recording_retention_sec =
        env.number<int>("RECORDING_RETENTION_SEC", 90 * 24 * 3600);
    config.signaling_idle_timeout_sec = env.number<int>("SIGNALING_IDLE_TIMEOUT_SEC", 120);
    config.ring_timeout_sec = env.number<int>("RING_TIMEOUT_SEC", 90);
    config.max_upload_attempts = env.number<int>("MAX_UPLOAD_ATTEMPTS", 5);
    config.upload_retry_base_ms = env.number<int>("UPLOAD_RETRY_BASE_MS", 500);
    config.signaling_retention_sec = env.number<int>("SIGNALING_RETENTION_SEC", 24 * 3600);
    config.notify_max_attempts = env.number<int>("NOTIFY_MAX_ATTEMPTS", 8);
    config.notify_retry_base_sec = env.number<int>("NOTIFY_RETRY_BASE_SEC", 5);
    config.notify_request_timeout = env.number<double>("NOTIFY_REQUEST_TIMEOUT", 10.0);
    config.notify_webhook_url = env.get("NOTIFY_WEBHOOK_URL");
    config.notify_webhook_token = env.get("NOTIFY_WEBHOOK_TOKEN");
    config.notify_ws_url = env.get("NOTIFY_WS_URL");

    config.escalation_rules = parse_escalation_rules(env.str("ESCALATION_RULES", ""));

    config.log_level = env.str("LOG_LEVEL", "INFO");
    if (const auto log_filename = env.get("LOG_FILENAME")) {
        const auto stamped = stamped_log_name(*log_filename);
        config.logs_dir = env.get("LOGS_DIR");
        config.log_filename =
            config.logs_dir ? (*config.logs_dir / stamped).string() : stamped;
    }
    config.log_name = env.str("LOG_NAME", "callguard");

    return config;
}

void Config::validate() const {
    if (store_path.empty()) {
        throw std::runtime_error("STORE_PATH is required");
    }
    if (recording_master_key.size() < 16) {
        throw std::runtime_error("RECORDING_MASTER_KEY must be at least 16 characters");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (escalation_tick_sec <= 0.0) {
        throw std::runtime_error("ESCALATION_TICK_SEC must be positive");
    }
    if (dispatch_poll_sec <= 0.0) {
        throw std::runtime_error("DISPATCH_POLL_SEC must be positive");
    }
    if (upload_workers <= 0) {
        throw std::runtime_error("UPLOAD_WORKERS must be positive");
    }
    if (max_upload_attempts <= 0) {
        throw std::runtime_error("MAX_UPLOAD_ATTEMPTS must be positive");
    }
    if (notify_max_attempts <= 0) {
        throw std::runtime_error("NOTIFY_MAX_ATTEMPTS must be positive");
    }
    if (signaling_idle_timeout_sec <= 0) {
        throw std::runtime_error("SIGNALING_IDLE_TIMEOUT_SEC must be positive");
    }
    if (ring_timeout_sec <= 0) {
        throw std::runtime_error("RING_TIMEOUT_SEC must be positive");
    }
    if (recording_retention_sec <= 0) {
        throw std::runtime_error("RECORDING_RETENTION_SEC must be positive");
    }
}

}
