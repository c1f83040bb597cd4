#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/cache_system.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "orchestrator/collaborators.hpp"
#include "orchestrator/pipeline_config.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace LRP {
namespace Orchestrator {

// EN: Runs a request through Preprocessing, WorkingAwareness, Compaction, Reranking and
//     FinalResponse, in that order. The instance keeps no per-run state: concurrent
//     process() calls are safe and share only the cache, the thread pool and the
//     cumulative metrics.
// FR: Fait passer une requête par Preprocessing, WorkingAwareness, Compaction, Reranking et
//     FinalResponse, dans cet ordre. L'instance ne garde aucun état par exécution : les appels
//     concurrents à process() sont sûrs et ne partagent que le cache, le pool de threads et
//     les métriques cumulées.
class ReasoningPipeline {
public:
    // EN: Throws ConfigurationError when the agent is null, the configuration is invalid, or
    //     reranking is enabled without a reranker. A null cache is replaced by a CacheSystem
    //     when cache_strategy is MEMORY; a null pool by one sized to max_parallel_perspectives
    //     when parallel_execution is on.
    // FR: Lance ConfigurationError si l'agent est nul, si la configuration est invalide ou si le
    //     reranking est activé sans reranker. Un cache nul est remplacé par un CacheSystem si
    //     cache_strategy vaut MEMORY ; un pool nul par un pool de max_parallel_perspectives
    //     threads si parallel_execution est actif.
    // EN: config.log_level is applied to the process-wide Logger, so the last pipeline
    //     constructed sets the level for every pipeline in the process.
    // FR: config.log_level s'applique au Logger global du processus : le dernier pipeline
    //     construit fixe le niveau pour tous les pipelines du processus.
    ReasoningPipeline(std::shared_ptr<ReasoningAgent> agent,
                      PipelineConfig config = PipelineConfig{},
                      std::shared_ptr<ThinkingCompactor> compactor = nullptr,
                      std::shared_ptr<ResultReranker> reranker = nullptr,
                      std::shared_ptr<Cache> cache = nullptr,
                      std::shared_ptr<ThreadPool> thread_pool = nullptr);
    ~ReasoningPipeline();

    ReasoningPipeline(const ReasoningPipeline&) = delete;
    ReasoningPipeline& operator=(const ReasoningPipeline&) = delete;

    // EN: Never throws past construction: returns a result with one StageResult per stage,
    //     in definition order, whatever the prompt or the stage outcomes.
    // FR: Ne lance jamais après la construction : retourne un résultat avec un StageResult par
    //     étape, dans l'ordre de définition, quels que soient le prompt et les issues des étapes.
    PipelineResult process(const PipelineRequest& request,
                           const CancellationToken* cancellation = nullptr) const;

    PipelineResult process(const std::string& prompt) const;

    // EN: Runs process() on its own thread. The pipeline must outlive the returned future.
    // FR: Exécute process() sur son propre thread. Le pipeline doit survivre au future retourné.
    std::future<PipelineResult> processAsync(PipelineRequest request,
                                             std::shared_ptr<CancellationToken> cancellation = nullptr) const;

    const PipelineConfig& getConfig() const;
    std::vector<StageType> getStageOrder() const;

    // EN: Cache actually used by the pipeline, null when caching is off.
    // FR: Cache réellement utilisé par le pipeline, nul si le cache est désactivé.
    std::shared_ptr<Cache> getCache() const;

    // EN: Durations and counters accumulated over every run of this instance.
    // FR: Durées et compteurs accumulés sur toutes les exécutions de cette instance.
    nlohmann::json getMetricsSummary() const;

private:
    class ReasoningPipelineImpl;
    std::unique_ptr<ReasoningPipelineImpl> impl_;
};

} // namespace Orchestrator
} // namespace LRP
