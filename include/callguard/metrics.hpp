#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>

namespace callguard {

class Metrics {
public:
    static Metrics& instance();

    void increment_request();
    void observe_response_time(const std::string& route, double seconds);

    // Labelled counter, e.g. increment("call_transitions_total", "status", "ended").
    void increment(const std::string& name,
                   const std::string& label_key,
                   const std::string& label_value);
    uint64_t counter(const std::string& name,
                     const std::string& label_key,
                     const std::string& label_value) const;

    std::string render_prometheus() const;

private:
    static constexpr std::array<double, 10> kLatencyBounds = {
        0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0};

    // Cumulative buckets; the last slot is +Inf.
    struct Latency {
        std::array<uint64_t, kLatencyBounds.size() + 1> buckets{};
        uint64_t count = 0;
        double sum = 0.0;

        void record(double seconds);
    };

    using Label = std::pair<std::string, std::string>;

    Metrics() = default;

    void render_counters(std::ostream& out) const;
    void render_latency(std::ostream& out) const;

    mutable std::mutex mutex_;
    uint64_t request_total_ = 0;
    std::map<std::string, Latency> latency_by_route_;
    std::map<std::string, std::map<Label, uint64_t>> counters_;
};

}
