#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace LRP {
namespace Orchestrator {

// EN: What the pipeline does with the remaining stages after one fails.
// FR: Ce que fait le pipeline des étapes restantes après un échec.
enum class PipelineErrorStrategy {
    FAIL_FAST = 0,      // EN: Skip remaining stages / FR: Ignorer les étapes restantes
    CONTINUE = 1        // EN: Run remaining stages / FR: Exécuter les étapes restantes
};

// EN: Where stage results are memoized.
// FR: Où les résultats d'étapes sont mémorisés.
enum class CacheStrategy {
    NONE = 0,           // EN: Always recompute / FR: Toujours recalculer
    MEMORY = 1          // EN: In-process CacheSystem / FR: CacheSystem en mémoire
};

constexpr const char* kPipelineConfigSection = "reasoning_pipeline";
constexpr size_t kMaxPerspectives = 16;

// EN: Pipeline configuration value object. Read by the pipeline, never modified by it.
// FR: Objet valeur de configuration du pipeline. Lu par le pipeline, jamais modifié par lui.
struct PipelineConfig {
    // EN: Stage toggles. A disabled stage is still reported, as SKIPPED.
    // FR: Activation des étapes. Une étape désactivée reste rapportée, en SKIPPED.
    bool enable_preprocessing = true;
    bool enable_working_awareness = true;
    bool enable_compaction = true;
    bool enable_reranking = true;
    bool enable_final_response = true;

    // EN: Fan out WorkingAwareness perspectives on a thread pool.
    // FR: Distribue les perspectives de WorkingAwareness sur un pool de threads.
    bool parallel_execution = true;
    size_t num_perspectives = 3;
    size_t max_parallel_perspectives = 4;

    PipelineErrorStrategy error_strategy = PipelineErrorStrategy::CONTINUE;

    // EN: Upper bound for one stage's fan-out join, zero disables it.
    // FR: Borne supérieure de l'attente d'une étape, zéro la désactive.
    std::chrono::milliseconds stage_timeout{60000};

    CacheStrategy cache_strategy = CacheStrategy::MEMORY;

    // EN: Lifetime of cached stage outputs, zero means they never expire.
    // FR: Durée de vie des sorties en cache, zéro signifie sans expiration.
    std::chrono::seconds cache_ttl{3600};

    bool enable_metrics = true;
    bool enable_tracing = false;
    std::string log_level = "INFO";

    bool isStageEnabled(StageType type) const;

    // EN: Every problem found, empty when the configuration is usable.
    // FR: Tous les problèmes trouvés, vide si la configuration est utilisable.
    std::vector<std::string> validate() const;
};

// EN: Build a PipelineConfig from a ConfigManager section. Missing keys keep their defaults;
//     a wrongly typed or invalid value throws ConfigurationError.
// FR: Construit un PipelineConfig depuis une section du ConfigManager. Les clés absentes gardent
//     leur valeur par défaut ; une valeur mal typée ou invalide lance ConfigurationError.
PipelineConfig loadPipelineConfig(const ConfigManager& manager,
                                  const std::string& section = kPipelineConfigSection);

// EN: Validation rules describing the pipeline section, for ConfigManager::addValidationRules.
// FR: Règles de validation décrivant la section pipeline, pour ConfigManager::addValidationRules.
std::vector<ConfigManager::ValidationRule> pipelineConfigRules(
    const std::string& section = kPipelineConfigSection);

} // namespace Orchestrator
} // namespace LRP
