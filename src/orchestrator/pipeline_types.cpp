// EN: Data model of the reasoning pipeline: results, cancellation and per-run context.
// FR: Modèle de données du pipeline de raisonnement : résultats, annulation et contexte d'exécution.

#include "orchestrator/pipeline_types.hpp"
#include "orchestrator/pipeline_utils.hpp"

#include <stdexcept>

namespace LRP {
namespace Orchestrator {

std::string StageResult::outputText() const {
    if (!output || !output->is_object()) {
        return "";
    }
    auto it = output->find("text");
    if (it == output->end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

StageResult StageResult::completed(StageType type, nlohmann::json output, double duration_ms) {
    StageResult result;
    result.stage_type = type;
    result.status = StageStatus::COMPLETED;
    result.output = std::move(output);
    result.duration_ms = duration_ms;
    return result;
}

StageResult StageResult::skipped(StageType type, const std::string& reason) {
    StageResult result;
    result.stage_type = type;
    result.status = StageStatus::SKIPPED;
    result.duration_ms = 0.0;
    result.metadata["reason"] = reason;
    return result;
}

StageResult StageResult::failed(StageType type, const std::string& error, StageErrorKind kind,
                                double duration_ms) {
    StageResult result;
    result.stage_type = type;
    result.status = StageStatus::FAILED;
    result.error = error;
    result.error_kind = kind;
    result.duration_ms = duration_ms;
    return result;
}

bool CancellationToken::isCancelled() const {
    if (cancelled_.load()) {
        return true;
    }
    const int64_t deadline = deadline_ns_.load();
    if (deadline == 0) {
        return false;
    }
    const auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    return now >= deadline;
}

void CancellationToken::setDeadline(std::chrono::steady_clock::time_point deadline) {
    int64_t ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        deadline.time_since_epoch()).count();
    // EN: 0 is reserved for "no deadline".
    // FR: 0 est réservé pour "aucune échéance".
    deadline_ns_.store(ns == 0 ? 1 : ns);
}

void CancellationToken::setTimeout(std::chrono::milliseconds timeout) {
    setDeadline(std::chrono::steady_clock::now() + timeout);
}

std::optional<std::chrono::steady_clock::time_point> CancellationToken::getDeadline() const {
    const int64_t deadline = deadline_ns_.load();
    if (deadline == 0) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::nanoseconds(deadline)));
}

StageContext::StageContext(PipelineRequest request, bool cache_enabled,
                           const CancellationToken* cancellation)
    : request_(std::move(request)),
      cache_enabled_(cache_enabled),
      cancellation_(cancellation) {}

const nlohmann::json* StageContext::getOutput(StageType type) const {
    auto it = shared_data_.find(PipelineUtils::stageTypeToString(type));
    if (it == shared_data_.end()) {
        return nullptr;
    }
    return &*it;
}

std::optional<std::string> StageContext::getOutputText(StageType type) const {
    const nlohmann::json* output = getOutput(type);
    if (output == nullptr) {
        return std::nullopt;
    }
    auto it = output->find("text");
    if (it == output->end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void StageContext::appendResult(const StageResult& result) {
    previous_results_.push_back(result);
}

void StageContext::writeSharedData(StageType type, const nlohmann::json& output) {
    const std::string key = PipelineUtils::stageTypeToString(type);
    if (shared_data_.contains(key)) {
        throw std::logic_error("shared_data already holds an entry for stage " + key);
    }
    shared_data_[key] = output;
}

const StageResult* PipelineResult::findStage(StageType type) const {
    for (const auto& stage : stages) {
        if (stage.stage_type == type) {
            return &stage;
        }
    }
    return nullptr;
}

} // namespace Orchestrator
} // namespace LRP
