// EN: ReasoningStage template method: skip logic, timing, error conversion and cache access.
// FR: Méthode patron de ReasoningStage : saut, chronométrage, conversion d'erreurs et cache.

#include "orchestrator/reasoning_stages.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <chrono>

namespace LRP {
namespace Orchestrator {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

ReasoningStage::ReasoningStage(StageOptions options) : options_(std::move(options)) {}

std::string ReasoningStage::getName() const {
    return PipelineUtils::stageTypeToString(getStageType());
}

StageResult ReasoningStage::execute(StageContext& context) const {
    const StageType type = getStageType();
    const std::string name = getName();

    if (!options_.enabled) {
        LOG_DEBUG("stage", "Stage " + name + " is disabled, skipping");
        return StageResult::skipped(type, "disabled");
    }

    LOG_INFO("stage", "Starting stage: " + name);
    const auto start = std::chrono::steady_clock::now();
    StageRunInfo info;

    auto fail = [&](const std::string& message, StageErrorKind kind) {
        const double duration = elapsedMs(start);
        const std::string error = "Stage " + name + " failed: " + message;
        const std::unordered_map<std::string, std::string> meta = {
            {"stage", name}, {"error_kind", PipelineUtils::errorKindToString(kind)}};
        LOG_ERROR_META("stage", error, meta);
        StageResult result = StageResult::failed(type, error, kind, duration);
        result.metadata = info.metadata;
        return result;
    };

    try {
        throwIfCancelled(context);

        nlohmann::json output = executeInternal(context, info);
        if (!output.is_object() || !output.contains("text") || !output["text"].is_string()) {
            return fail("stage produced an output without a text field", StageErrorKind::INTERNAL);
        }

        context.writeSharedData(type, output);
        const double duration = elapsedMs(start);

        StageResult result = StageResult::completed(type, std::move(output), duration);
        result.metadata = info.metadata;
        if (info.cache_hits > 0 || info.cache_misses > 0) {
            result.metadata["cache_hits"] = std::to_string(info.cache_hits);
            result.metadata["cache_misses"] = std::to_string(info.cache_misses);
        }

        LOG_INFO("stage", "Stage " + name + " completed in " + PipelineUtils::formatDuration(duration));
        return result;

    } catch (const CancellationError& e) {
        return fail(e.what(), StageErrorKind::CANCELLED);
    } catch (const CollaboratorError& e) {
        return fail(e.what(), StageErrorKind::COLLABORATOR);
    } catch (const std::exception& e) {
        return fail(e.what(), StageErrorKind::INTERNAL);
    } catch (...) {
        return fail("unknown exception", StageErrorKind::INTERNAL);
    }
}

std::string ReasoningStage::cacheKey(StageType type, const std::string& input,
                                     const std::optional<std::string>& context) {
    return PipelineUtils::stageTypeToString(type) + ":" + context.value_or("") + "\x1f" + input;
}

std::optional<std::string> ReasoningStage::cacheGet(const StageContext& context, const std::string& key,
                                                    StageRunInfo& info) const {
    if (!context.isCacheEnabled() || !options_.cache) {
        return std::nullopt;
    }
    try {
        auto value = options_.cache->get(key);
        if (value) {
            info.cache_hits++;
        } else {
            info.cache_misses++;
        }
        return value;
    } catch (const CacheError& e) {
        LOG_WARN("stage", "Cache read failed for stage " + getName() + ", treating as miss: " + e.what());
        info.cache_misses++;
        return std::nullopt;
    }
}

void ReasoningStage::cachePut(const StageContext& context, const std::string& key,
                              const std::string& value) const {
    if (!context.isCacheEnabled() || !options_.cache) {
        return;
    }
    try {
        options_.cache->set(key, value, options_.cache_ttl);
    } catch (const CacheError& e) {
        LOG_WARN("stage", "Cache write failed for stage " + getName() + ": " + e.what());
    }
}

void ReasoningStage::throwIfCancelled(const StageContext& context) const {
    if (context.isCancelled()) {
        throw CancellationError("cancelled before completion");
    }
}

} // namespace Orchestrator
} // namespace LRP
