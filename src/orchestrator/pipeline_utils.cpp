// EN: PipelineUtils implementation - enum conversions, formatting and JSON export.
// FR: Implémentation PipelineUtils - conversions d'énumérations, formatage et export JSON.

#include "orchestrator/pipeline_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace LRP {
namespace Orchestrator {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string PipelineUtils::stageTypeToString(StageType type) {
    switch (type) {
        case StageType::PREPROCESSING: return "preprocessing";
        case StageType::WORKING_AWARENESS: return "working_awareness";
        case StageType::COMPACTION: return "compaction";
        case StageType::RERANKING: return "reranking";
        case StageType::FINAL_RESPONSE: return "final_response";
        default: return "unknown";
    }
}

std::optional<StageType> PipelineUtils::parseStageType(const std::string& name) {
    const std::string lower = toLower(name);
    for (StageType type : kStageOrder) {
        if (stageTypeToString(type) == lower) {
            return type;
        }
    }
    return std::nullopt;
}

std::string PipelineUtils::statusToString(StageStatus status) {
    switch (status) {
        case StageStatus::PENDING: return "pending";
        case StageStatus::RUNNING: return "running";
        case StageStatus::COMPLETED: return "completed";
        case StageStatus::SKIPPED: return "skipped";
        case StageStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

std::string PipelineUtils::errorKindToString(StageErrorKind kind) {
    switch (kind) {
        case StageErrorKind::COLLABORATOR: return "collaborator";
        case StageErrorKind::CANCELLED: return "cancelled";
        case StageErrorKind::INTERNAL: return "internal";
        default: return "unknown";
    }
}

std::string PipelineUtils::errorStrategyToString(PipelineErrorStrategy strategy) {
    switch (strategy) {
        case PipelineErrorStrategy::FAIL_FAST: return "fail_fast";
        case PipelineErrorStrategy::CONTINUE: return "continue";
        default: return "unknown";
    }
}

std::optional<PipelineErrorStrategy> PipelineUtils::parseErrorStrategy(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "fail_fast") return PipelineErrorStrategy::FAIL_FAST;
    if (lower == "continue") return PipelineErrorStrategy::CONTINUE;
    return std::nullopt;
}

std::string PipelineUtils::cacheStrategyToString(CacheStrategy strategy) {
    switch (strategy) {
        case CacheStrategy::NONE: return "none";
        case CacheStrategy::MEMORY: return "memory";
        default: return "unknown";
    }
}

std::optional<CacheStrategy> PipelineUtils::parseCacheStrategy(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "none") return CacheStrategy::NONE;
    if (lower == "memory") return CacheStrategy::MEMORY;
    return std::nullopt;
}

std::string PipelineUtils::stageTitle(StageType type) {
    std::string title = stageTypeToString(type);
    bool capitalize = true;
    for (char& c : title) {
        if (c == '_') {
            c = ' ';
            capitalize = true;
        } else if (capitalize) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            capitalize = false;
        }
    }
    return title;
}

std::string PipelineUtils::formatDuration(double duration_ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << duration_ms << "ms";
    return oss.str();
}

std::string PipelineUtils::formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string PipelineUtils::truncate(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    return text.substr(0, max_chars) + "...";
}

bool PipelineUtils::isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

nlohmann::json PipelineUtils::stageResultToJson(const StageResult& result) {
    nlohmann::json json;
    json["stage_type"] = stageTypeToString(result.stage_type);
    json["status"] = statusToString(result.status);
    json["duration_ms"] = result.duration_ms;
    json["output"] = result.output ? *result.output : nlohmann::json(nullptr);
    json["error"] = result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr);
    if (result.error_kind) {
        json["error_kind"] = errorKindToString(*result.error_kind);
    }
    json["metadata"] = result.metadata;
    return json;
}

nlohmann::json PipelineUtils::resultToJson(const PipelineResult& result) {
    nlohmann::json json;
    json["final_response"] = result.final_response;
    json["total_duration_ms"] = result.total_duration_ms;
    json["cache_hits"] = result.cache_hits;
    json["completed_at"] = formatTimestamp(result.completed_at);

    nlohmann::json request;
    request["prompt"] = result.request.prompt;
    request["context"] = result.request.context ? nlohmann::json(*result.request.context)
                                                : nlohmann::json(nullptr);
    request["constraints"] = result.request.constraints;
    request["metadata"] = result.request.metadata;
    json["request"] = request;

    nlohmann::json stages = nlohmann::json::array();
    for (const auto& stage : result.stages) {
        stages.push_back(stageResultToJson(stage));
    }
    json["stages"] = stages;
    json["metadata"] = result.metadata;
    return json;
}

} // namespace Orchestrator
} // namespace LRP
