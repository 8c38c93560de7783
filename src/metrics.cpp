#include "callguard/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace callguard {

namespace {

constexpr const char* kPrefix = "callguard_";
constexpr const char* kLatencyMetric = "callguard_http_response_seconds";

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

void Metrics::Latency::record(double seconds) {
    ++count;
    sum += seconds;
    for (size_t i = 0; i < kLatencyBounds.size(); ++i) {
        if (seconds <= kLatencyBounds[i]) {
            ++buckets[i];
        }
    }
    ++buckets.back();
}

void Metrics::increment_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++request_total_;
}

void Metrics::observe_response_time(const std::string& route, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_by_route_[route].record(seconds);
}

void Metrics::increment(const std::string& name,
                        const std::string& label_key,
                        const std::string& label_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[name][{label_key, label_value}];
}

uint64_t Metrics::counter(const std::string& name,
                          const std::string& label_key,
                          const std::string& label_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto family = counters_.find(name);
    if (family == counters_.end()) {
        return 0;
    }
    const auto it = family->second.find({label_key, label_value});
    return it == family->second.end() ? 0 : it->second;
}

void Metrics::render_counters(std::ostream& out) const {
    out << "# TYPE " << kPrefix << "http_requests_total counter\n"
        << kPrefix << "http_requests_total " << request_total_ << '\n';

    for (const auto& [name, series] : counters_) {
        out << "# TYPE " << kPrefix << name << " counter\n";
        for (const auto& [label, value] : series) {
            out << kPrefix << name << '{' << label.first << "=\"" << label.second << "\"} "
                << value << '\n';
        }
    }
}

void Metrics::render_latency(std::ostream& out) const {
    out << "# TYPE " << kLatencyMetric << " histogram\n";
    for (const auto& [route, latency] : latency_by_route_) {
        const std::string route_label = "route=\"" + route + "\"";
        for (size_t i = 0; i < latency.buckets.size(); ++i) {
            out << kLatencyMetric << "_bucket{" << route_label << ",le=\"";
            if (i < kLatencyBounds.size()) {
                out << kLatencyBounds[i];
            } else {
                out << "+Inf";
            }
            out << "\"} " << latency.buckets[i] << '\n';
        }
        out << kLatencyMetric << "_count{" << route_label << "} " << latency.count << '\n'
            << kLatencyMetric << "_sum{" << route_label << "} " << latency.sum << '\n';
    }
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out << std::fixed << std::setprecision(6);
    render_counters(out);
    render_latency(out);
    return out.str();
}

}
