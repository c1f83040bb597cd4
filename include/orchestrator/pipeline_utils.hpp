#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "orchestrator/pipeline_config.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace LRP {
namespace Orchestrator {

namespace PipelineUtils {

    // EN: Enum conversions. Stage names are the shared_data keys ("working_awareness").
    // FR: Conversions d'énumérations. Les noms d'étapes sont les clés de shared_data.
    std::string stageTypeToString(StageType type);
    std::optional<StageType> parseStageType(const std::string& name);
    std::string statusToString(StageStatus status);
    std::string errorKindToString(StageErrorKind kind);
    std::string errorStrategyToString(PipelineErrorStrategy strategy);
    std::optional<PipelineErrorStrategy> parseErrorStrategy(const std::string& name);
    std::string cacheStrategyToString(CacheStrategy strategy);
    std::optional<CacheStrategy> parseCacheStrategy(const std::string& name);

    // EN: "Working Awareness" style title for prompts and reports.
    // FR: Titre de style "Working Awareness" pour les prompts et rapports.
    std::string stageTitle(StageType type);

    // EN: Time and text utilities
    // FR: Utilitaires de temps et de texte
    std::string formatDuration(double duration_ms);
    std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);
    std::string truncate(const std::string& text, size_t max_chars);
    bool isBlank(const std::string& text);

    // EN: JSON views of results, for callers that need a wire form.
    // FR: Vues JSON des résultats, pour les appelants qui ont besoin d'un format d'échange.
    nlohmann::json stageResultToJson(const StageResult& result);
    nlohmann::json resultToJson(const PipelineResult& result);
}

} // namespace Orchestrator
} // namespace LRP
