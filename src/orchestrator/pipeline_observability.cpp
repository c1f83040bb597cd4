// EN: Metrics and tracing for pipeline runs.
// FR: Métriques et traçage des exécutions du pipeline.

#include "orchestrator/pipeline_observability.hpp"

#include <algorithm>

namespace LRP {
namespace Orchestrator {

void MetricsCollector::recordDuration(const std::string& name, double duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    DurationStats& stats = durations_[name];
    if (stats.count == 0) {
        stats.max_ms = duration_ms;
        stats.min_ms = duration_ms;
    } else {
        stats.max_ms = std::max(stats.max_ms, duration_ms);
        stats.min_ms = std::min(stats.min_ms, duration_ms);
    }
    stats.count++;
    stats.total_ms += duration_ms;
}

void MetricsCollector::increment(const std::string& counter, size_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counter] += amount;
}

nlohmann::json MetricsCollector::getSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json summary = nlohmann::json::object();
    for (const auto& [name, stats] : durations_) {
        summary[name + "_count"] = stats.count;
        summary[name + "_total_ms"] = stats.total_ms;
        summary[name + "_avg_ms"] = stats.count > 0 ? stats.total_ms / static_cast<double>(stats.count) : 0.0;
        summary[name + "_max_ms"] = stats.max_ms;
        summary[name + "_min_ms"] = stats.min_ms;
    }
    for (const auto& [name, value] : counters_) {
        summary[name] = value;
    }
    return summary;
}

size_t MetricsCollector::getCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto duration_it = durations_.find(name);
    if (duration_it != durations_.end()) {
        return duration_it->second.count;
    }
    auto counter_it = counters_.find(name);
    return counter_it != counters_.end() ? counter_it->second : 0;
}

void MetricsCollector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    durations_.clear();
    counters_.clear();
}

double TraceSpan::durationMs() const {
    const auto end = end_time.value_or(std::chrono::steady_clock::now());
    return std::chrono::duration<double, std::milli>(end - start_time).count();
}

Tracer::Tracer(std::string trace_id) : trace_id_(std::move(trace_id)) {}

std::string Tracer::startSpan(const std::string& name,
                              const std::unordered_map<std::string, std::string>& attributes,
                              const std::optional<std::string>& parent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    TraceSpan span;
    span.span_id = trace_id_.substr(0, 8) + "-" + std::to_string(next_span_++);
    span.parent_id = parent_id;
    span.name = name;
    span.start_time = std::chrono::steady_clock::now();
    span.attributes = attributes;
    spans_.push_back(span);
    return span.span_id;
}

void Tracer::endSpan(const std::string& span_id,
                     const std::unordered_map<std::string, std::string>& attributes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(spans_.begin(), spans_.end(),
                           [&span_id](const TraceSpan& span) { return span.span_id == span_id; });
    if (it == spans_.end() || it->isFinished()) {
        return;
    }
    it->end_time = std::chrono::steady_clock::now();
    for (const auto& [key, value] : attributes) {
        it->attributes[key] = value;
    }
}

std::vector<TraceSpan> Tracer::getSpans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
}

nlohmann::json Tracer::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json spans = nlohmann::json::array();
    for (const auto& span : spans_) {
        nlohmann::json entry;
        entry["span_id"] = span.span_id;
        entry["parent_id"] = span.parent_id ? nlohmann::json(*span.parent_id) : nlohmann::json(nullptr);
        entry["name"] = span.name;
        entry["duration_ms"] = span.durationMs();
        entry["finished"] = span.isFinished();
        entry["attributes"] = span.attributes;
        spans.push_back(entry);
    }
    return spans;
}

} // namespace Orchestrator
} // namespace LRP
