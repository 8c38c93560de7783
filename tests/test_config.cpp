#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "callguard/config.hpp"
#include "callguard/settings/settings.hpp"
#include "callguard/storage/sqlite_store.hpp"

using namespace callguard;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_.c_str()); }

private:
    std::string name_;
};

Config valid_config() {
    Config config;
    config.recording_master_key = "0123456789abcdef0123";
    return config;
}

}

TEST_CASE("parse_escalation_rules reads the rule list") {
    const auto rules = parse_escalation_rules(R"([
        {"id": "ring-30", "trigger": "unanswered_timeout", "threshold_seconds": 30,
         "escalate_to_role": "supervisor", "priority_level": 2,
         "channels": ["log", "webhook"], "cooldown_seconds": 15},
        {"id": "flag-now", "trigger": "flagged", "threshold_seconds": 0,
         "escalate_to_role": "admin", "active": false}
    ])");
    REQUIRE(rules.size() == 2);
    REQUIRE(rules[0].trigger == TriggerCondition::UnansweredTimeout);
    REQUIRE(rules[0].priority_level == 2);
    REQUIRE(rules[0].cooldown_seconds == 15);
    REQUIRE(rules[0].notification_channels.size() == 2);
    REQUIRE(rules[1].trigger == TriggerCondition::Flagged);
    REQUIRE(rules[1].notification_channels.size() == 1);
    REQUIRE(rules[1].notification_channels[0] == "log");
    REQUIRE_FALSE(rules[1].active);

    REQUIRE(parse_escalation_rules("").empty());
    REQUIRE(parse_escalation_rules("   ").empty());
}

TEST_CASE("parse_escalation_rules rejects malformed rules") {
    REQUIRE_THROWS_AS(parse_escalation_rules(R"({"id": "x"})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_escalation_rules(R"([{"id": "x", "trigger": "lunar",
        "threshold_seconds": 1, "escalate_to_role": "admin"}])"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(parse_escalation_rules(R"([{"id": "x", "trigger": "flagged",
        "threshold_seconds": -1, "escalate_to_role": "admin"}])"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(parse_escalation_rules(R"([{"id": "", "trigger": "flagged",
        "threshold_seconds": 1, "escalate_to_role": "admin"}])"),
                      std::invalid_argument);
}

TEST_CASE("validate enforces the master key and positive limits") {
    REQUIRE_NOTHROW(valid_config().validate());

    auto config = valid_config();
    config.recording_master_key = "short";
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = valid_config();
    config.ring_timeout_sec = 0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = valid_config();
    config.upload_workers = -1;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("load reads settings from the environment") {
    ScopedEnv port("REST_API_PORT", "9100");
    ScopedEnv ring("RING_TIMEOUT_SEC", "45");
    ScopedEnv key("RECORDING_MASTER_KEY", "an-adequately-long-secret");
    ScopedEnv token("AUTHORIZATION_TOKEN", "");
    ScopedEnv data("CALLGUARD_DATA_DIR", "/var/lib/callguard");
    ScopedEnv rules("ESCALATION_RULES",
                    R"([{"id": "r", "trigger": "endpoint_offline", "threshold_seconds": 60,
                        "escalate_to_role": "supervisor"}])");

    const auto config = Config::load();
    REQUIRE(config.rest_api_port == 9100);
    REQUIRE(config.ring_timeout_sec == 45);
    REQUIRE(config.recording_master_key == "an-adequately-long-secret");
    REQUIRE_FALSE(config.authorization_token.has_value());
    REQUIRE(config.store_path == "/var/lib/callguard/callguard.db");
    REQUIRE(config.spool_dir.string() == "/var/lib/callguard/spool");
    REQUIRE(config.escalation_rules.size() == 1);
    REQUIRE(config.escalation_rules[0].trigger == TriggerCondition::EndpointOffline);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("runtime settings overlay stored values on defaults") {
    storage::SqliteStore store(":memory:");
    auto config = valid_config();
    config.ring_timeout_sec = 60;
    SettingsProvider provider(store, RuntimeSettings::from_config(config));
    provider.seed();
    REQUIRE(provider.current().ring_timeout_sec == 60);

    const auto updated = provider.update({{"ring_timeout_sec", "30"}});
    REQUIRE(updated.ring_timeout_sec == 30);
    REQUIRE(provider.current().ring_timeout_sec == 30);
    REQUIRE(store.settings().at("ring_timeout_sec") == "30");

    REQUIRE_THROWS_AS(provider.update({{"ring_timeout_sec", "0"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(provider.update({{"lunar_phase", "3"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(provider.update({{"max_upload_attempts", "many"}}), std::invalid_argument);
    REQUIRE(provider.current().ring_timeout_sec == 30);

    SettingsProvider restarted(store, RuntimeSettings::from_config(config));
    restarted.seed();
    REQUIRE(restarted.current().ring_timeout_sec == 30);
}
