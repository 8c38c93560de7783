#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "callguard/model/types.hpp"

namespace callguard {

struct Config {
    std::string store_path = "callguard.db";
    std::filesystem::path spool_dir;
    std::filesystem::path archive_dir;
    std::string recording_master_key;
    std::string rest_api_host = "0.0.0.0";
    int rest_api_port = 8000;
    std::optional<std::string> authorization_token;
    double escalation_tick_sec = 5.0;
    double dispatch_poll_sec = 1.0;
    int maintenance_interval_sec = 60;
    int upload_workers = 4;
    int recording_retention_sec = 90 * 24 * 3600;
    int signaling_idle_timeout_sec = 120;
    int ring_timeout_sec = 90;
    int max_upload_attempts = 5;
    int upload_retry_base_ms = 500;
    int signaling_retention_sec = 24 * 3600;
    int notify_max_attempts = 8;
    int notify_retry_base_sec = 5;
    double notify_request_timeout = 10.0;
    std::optional<std::string> notify_webhook_url;
    std::optional<std::string> notify_webhook_token;
    std::optional<std::string> notify_ws_url;
    std::vector<EscalationRule> escalation_rules;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "callguard";

    static Config load();
    void validate() const;
};

// Parses the ESCALATION_RULES JSON array.
std::vector<EscalationRule> parse_escalation_rules(const std::string& raw);

}
