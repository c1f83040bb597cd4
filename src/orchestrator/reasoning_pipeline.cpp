// EN: ReasoningPipeline - builds the five stages and runs requests through them in order.
// FR: ReasoningPipeline - construit les cinq étapes et y fait passer les requêtes dans l'ordre.

#include "orchestrator/reasoning_pipeline.hpp"
#include "orchestrator/pipeline_observability.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "orchestrator/reasoning_stages.hpp"
#include "infrastructure/logging/logger.hpp"

#include <chrono>
#include <stdexcept>

namespace LRP {
namespace Orchestrator {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

size_t stageCacheHits(const StageResult& result) {
    auto it = result.metadata.find("cache_hits");
    if (it == result.metadata.end()) {
        return 0;
    }
    try {
        return static_cast<size_t>(std::stoul(it->second));
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

class ReasoningPipeline::ReasoningPipelineImpl {
public:
    PipelineConfig config;
    std::shared_ptr<ReasoningAgent> agent;
    std::shared_ptr<ThinkingCompactor> compactor;
    std::shared_ptr<ResultReranker> reranker;
    std::shared_ptr<Cache> cache;
    std::shared_ptr<ThreadPool> thread_pool;
    std::vector<std::unique_ptr<ReasoningStage>> stages;
    MetricsCollector metrics;

    bool cacheEnabled() const { return cache != nullptr; }
};

ReasoningPipeline::ReasoningPipeline(std::shared_ptr<ReasoningAgent> agent,
                                     PipelineConfig config,
                                     std::shared_ptr<ThinkingCompactor> compactor,
                                     std::shared_ptr<ResultReranker> reranker,
                                     std::shared_ptr<Cache> cache,
                                     std::shared_ptr<ThreadPool> thread_pool)
    : impl_(std::make_unique<ReasoningPipelineImpl>()) {
    std::vector<std::string> errors = config.validate();
    if (!agent) {
        errors.insert(errors.begin(), "a reasoning agent is required");
    }
    if (config.enable_reranking && !reranker) {
        errors.push_back("enable_reranking is set but no reranker was provided");
    }
    if (!errors.empty()) {
        throw ConfigurationError(errors);
    }

    Logger::getInstance().setLogLevel(parseLogLevel(config.log_level));

    impl_->config = std::move(config);
    impl_->agent = std::move(agent);
    impl_->compactor = std::move(compactor);
    impl_->reranker = std::move(reranker);
    const PipelineConfig& cfg = impl_->config;

    if (cfg.cache_strategy == CacheStrategy::MEMORY) {
        impl_->cache = cache ? std::move(cache) : std::make_shared<CacheSystem>();
    } else if (cache) {
        LOG_WARN("pipeline", "cache_strategy is none, ignoring the provided cache");
    }

    if (cfg.parallel_execution) {
        if (thread_pool) {
            impl_->thread_pool = std::move(thread_pool);
        } else {
            ThreadPoolConfig pool_config;
            pool_config.thread_count = cfg.max_parallel_perspectives;
            pool_config.max_queue_size = 0;
            pool_config.name = "perspectives";
            impl_->thread_pool = std::make_shared<ThreadPool>(pool_config);
        }
    }

    auto options = [this, &cfg](StageType type) {
        StageOptions stage_options;
        stage_options.enabled = cfg.isStageEnabled(type);
        stage_options.cache = impl_->cache;
        if (cfg.cache_ttl.count() > 0) {
            stage_options.cache_ttl = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.cache_ttl);
        }
        return stage_options;
    };

    WorkingAwarenessStage::Settings awareness;
    awareness.num_perspectives = cfg.num_perspectives;
    awareness.thread_pool = impl_->thread_pool;
    awareness.timeout = cfg.stage_timeout;

    impl_->stages.push_back(std::make_unique<PreprocessingStage>(impl_->agent, options(StageType::PREPROCESSING)));
    impl_->stages.push_back(std::make_unique<WorkingAwarenessStage>(impl_->agent, awareness,
                                                                    options(StageType::WORKING_AWARENESS)));
    impl_->stages.push_back(std::make_unique<CompactionStage>(impl_->compactor, options(StageType::COMPACTION)));
    impl_->stages.push_back(std::make_unique<RerankingStage>(impl_->reranker, options(StageType::RERANKING)));
    impl_->stages.push_back(std::make_unique<FinalResponseStage>(impl_->agent, options(StageType::FINAL_RESPONSE)));

    const std::unordered_map<std::string, std::string> meta = {
        {"perspectives", std::to_string(cfg.num_perspectives)},
        {"parallel", cfg.parallel_execution ? "true" : "false"},
        {"cache", PipelineUtils::cacheStrategyToString(cfg.cache_strategy)},
        {"error_strategy", PipelineUtils::errorStrategyToString(cfg.error_strategy)}};
    LOG_INFO_META("pipeline", "Reasoning pipeline initialized", meta);
}

ReasoningPipeline::~ReasoningPipeline() = default;

PipelineResult ReasoningPipeline::process(const PipelineRequest& request,
                                          const CancellationToken* cancellation) const {
    const PipelineConfig& cfg = impl_->config;
    const std::string trace_id = Logger::generateCorrelationId();
    ScopedCorrelationId correlation(trace_id);

    if (PipelineUtils::isBlank(request.prompt)) {
        LOG_WARN("pipeline", "Processing a request with a blank prompt");
    }

    std::unique_ptr<Tracer> tracer;
    std::string root_span;
    if (cfg.enable_tracing) {
        tracer = std::make_unique<Tracer>(trace_id);
        root_span = tracer->startSpan("pipeline", {{"prompt_chars", std::to_string(request.prompt.size())}});
    }

    LOG_INFO("pipeline", "Processing request: " + PipelineUtils::truncate(request.prompt, 80));

    StageContext context(request, impl_->cacheEnabled(), cancellation);
    const auto start = std::chrono::steady_clock::now();
    bool aborted = false;

    for (const auto& stage : impl_->stages) {
        std::string span_id;
        if (tracer) {
            span_id = tracer->startSpan(stage->getName(), {}, root_span);
        }

        StageResult result = aborted ? StageResult::skipped(stage->getStageType(), "aborted_after_failure")
                                     : stage->execute(context);

        if (tracer) {
            std::unordered_map<std::string, std::string> attributes = {
                {"status", PipelineUtils::statusToString(result.status)}};
            if (result.error) {
                attributes["error"] = *result.error;
            }
            tracer->endSpan(span_id, attributes);
        }

        if (result.status == StageStatus::FAILED && cfg.error_strategy == PipelineErrorStrategy::FAIL_FAST) {
            LOG_WARN("pipeline", "Stage " + stage->getName() + " failed, skipping remaining stages");
            aborted = true;
        }
        context.appendResult(result);
    }

    PipelineResult result;
    result.total_duration_ms = elapsedMs(start);
    result.stages = context.getPreviousResults();
    result.request = request;
    result.completed_at = std::chrono::system_clock::now();

    size_t completed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    double stage_total_ms = 0.0;
    for (const auto& stage_result : result.stages) {
        result.cache_hits += stageCacheHits(stage_result);
        stage_total_ms += stage_result.duration_ms;
        switch (stage_result.status) {
            case StageStatus::COMPLETED: ++completed; break;
            case StageStatus::SKIPPED: ++skipped; break;
            case StageStatus::FAILED: ++failed; break;
            default: break;
        }
    }

    // EN: FinalResponse text, else the last completed text in stage order, else the prompt.
    // FR: Texte de FinalResponse, sinon le dernier texte terminé dans l'ordre, sinon le prompt.
    result.final_response = request.prompt;
    for (auto it = result.stages.rbegin(); it != result.stages.rend(); ++it) {
        if (it->isSuccess()) {
            result.final_response = it->outputText();
            break;
        }
    }

    if (cfg.enable_metrics) {
        for (const auto& stage_result : result.stages) {
            if (stage_result.status != StageStatus::SKIPPED) {
                impl_->metrics.recordDuration(PipelineUtils::stageTypeToString(stage_result.stage_type),
                                              stage_result.duration_ms);
            }
            if (stage_result.status == StageStatus::FAILED) {
                impl_->metrics.increment("stage_failures");
            }
        }
        impl_->metrics.recordDuration("pipeline", result.total_duration_ms);
        impl_->metrics.increment("runs");
        impl_->metrics.increment("cache_hits_total", result.cache_hits);

        nlohmann::json metrics = impl_->metrics.getSummary();
        for (const auto& stage_result : result.stages) {
            metrics[PipelineUtils::stageTypeToString(stage_result.stage_type) + "_ms"] = stage_result.duration_ms;
        }
        metrics["total_stage_ms"] = stage_total_ms;
        metrics["pipeline_ms"] = result.total_duration_ms;
        metrics["cache_hits"] = result.cache_hits;
        metrics["stages_completed"] = completed;
        metrics["stages_skipped"] = skipped;
        metrics["stages_failed"] = failed;
        result.metadata["metrics"] = metrics;
    }

    if (tracer) {
        tracer->endSpan(root_span, {{"stages_failed", std::to_string(failed)}});
        result.metadata["trace_id"] = trace_id;
        result.metadata["trace"] = tracer->toJson();
    }

    const std::unordered_map<std::string, std::string> meta = {
        {"duration", PipelineUtils::formatDuration(result.total_duration_ms)},
        {"completed", std::to_string(completed)},
        {"skipped", std::to_string(skipped)},
        {"failed", std::to_string(failed)},
        {"cache_hits", std::to_string(result.cache_hits)}};
    LOG_INFO_META("pipeline", "Request processed", meta);

    return result;
}

PipelineResult ReasoningPipeline::process(const std::string& prompt) const {
    return process(PipelineRequest(prompt));
}

std::future<PipelineResult> ReasoningPipeline::processAsync(PipelineRequest request,
                                                            std::shared_ptr<CancellationToken> cancellation) const {
    return std::async(std::launch::async, [this, request = std::move(request), cancellation]() {
        return process(request, cancellation.get());
    });
}

const PipelineConfig& ReasoningPipeline::getConfig() const {
    return impl_->config;
}

std::vector<StageType> ReasoningPipeline::getStageOrder() const {
    std::vector<StageType> order;
    order.reserve(impl_->stages.size());
    for (const auto& stage : impl_->stages) {
        order.push_back(stage->getStageType());
    }
    return order;
}

std::shared_ptr<Cache> ReasoningPipeline::getCache() const {
    return impl_->cache;
}

nlohmann::json ReasoningPipeline::getMetricsSummary() const {
    return impl_->metrics.getSummary();
}

} // namespace Orchestrator
} // namespace LRP
