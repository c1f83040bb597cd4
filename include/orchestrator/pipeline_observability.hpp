#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace LRP {
namespace Orchestrator {

// EN: Thread-safe collector of duration samples and counters.
// FR: Collecteur thread-safe d'échantillons de durée et de compteurs.
class MetricsCollector {
public:
    void recordDuration(const std::string& name, double duration_ms);
    void increment(const std::string& counter, size_t amount = 1);

    // EN: Per duration name: <name>_count, <name>_avg_ms, <name>_max_ms, <name>_min_ms,
    //     <name>_total_ms. Counters are reported under their own name.
    // FR: Par nom de durée : <name>_count, <name>_avg_ms, <name>_max_ms, <name>_min_ms,
    //     <name>_total_ms. Les compteurs sont rapportés sous leur propre nom.
    nlohmann::json getSummary() const;

    size_t getCount(const std::string& name) const;
    void reset();

private:
    struct DurationStats {
        size_t count = 0;
        double total_ms = 0.0;
        double max_ms = 0.0;
        double min_ms = 0.0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, DurationStats> durations_;
    std::map<std::string, size_t> counters_;
};

// EN: One timed operation in a trace.
// FR: Une opération chronométrée dans une trace.
struct TraceSpan {
    std::string span_id;
    std::optional<std::string> parent_id;
    std::string name;
    std::chrono::steady_clock::time_point start_time;
    std::optional<std::chrono::steady_clock::time_point> end_time;
    std::unordered_map<std::string, std::string> attributes;

    bool isFinished() const { return end_time.has_value(); }
    double durationMs() const;
};

// EN: Span recorder for one pipeline run.
// FR: Enregistreur de spans pour une exécution du pipeline.
class Tracer {
public:
    explicit Tracer(std::string trace_id);

    const std::string& getTraceId() const { return trace_id_; }

    // EN: Returns the new span id.
    // FR: Retourne l'identifiant du nouveau span.
    std::string startSpan(const std::string& name,
                          const std::unordered_map<std::string, std::string>& attributes = {},
                          const std::optional<std::string>& parent_id = std::nullopt);

    // EN: Unknown or already finished spans are ignored.
    // FR: Les spans inconnus ou déjà terminés sont ignorés.
    void endSpan(const std::string& span_id,
                 const std::unordered_map<std::string, std::string>& attributes = {});

    std::vector<TraceSpan> getSpans() const;
    nlohmann::json toJson() const;

private:
    std::string trace_id_;
    mutable std::mutex mutex_;
    std::vector<TraceSpan> spans_;
    size_t next_span_ = 1;
};

} // namespace Orchestrator
} // namespace LRP
