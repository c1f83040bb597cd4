#include "orchestrator/reasoning_stages.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>

namespace LRP {
namespace Orchestrator {

RerankingStage::RerankingStage(std::shared_ptr<ResultReranker> reranker, StageOptions options)
    : ReasoningStage(std::move(options)), reranker_(std::move(reranker)) {
    if (!reranker_ && isEnabled()) {
        throw std::invalid_argument("RerankingStage is enabled but has no reranker");
    }
}

std::vector<std::string> RerankingStage::collectCandidates(const StageContext& context) {
    std::vector<std::string> candidates;

    if (const nlohmann::json* awareness = context.getOutput(StageType::WORKING_AWARENESS)) {
        auto it = awareness->find("perspectives");
        if (it != awareness->end() && it->is_array()) {
            for (const auto& perspective : *it) {
                if (perspective.is_string() && !perspective.get<std::string>().empty()) {
                    candidates.push_back(perspective.get<std::string>());
                }
            }
        }
    }
    if (auto compacted = context.getOutputText(StageType::COMPACTION)) {
        if (!compacted->empty()) {
            candidates.push_back(std::move(*compacted));
        }
    }

    // EN: Fallback: any completed text, in stage order.
    // FR: Repli : tout texte terminé, dans l'ordre des étapes.
    if (candidates.empty()) {
        for (const auto& result : context.getPreviousResults()) {
            if (result.isSuccess()) {
                std::string text = result.outputText();
                if (!text.empty()) {
                    candidates.push_back(std::move(text));
                }
            }
        }
    }
    return candidates;
}

nlohmann::json RerankingStage::executeInternal(const StageContext& context, StageRunInfo& info) const {
    const std::vector<std::string> candidates = collectCandidates(context);

    nlohmann::json output;
    output["candidate_count"] = candidates.size();
    output["ranked"] = nlohmann::json::array();

    if (candidates.empty()) {
        output["text"] = "No candidates available for reranking";
        return output;
    }
    if (candidates.size() == 1) {
        output["text"] = candidates.front();
        output["ranked"].push_back({{"document", candidates.front()}, {"score", 1.0}});
        return output;
    }

    const std::string& query = context.getRequest().prompt;
    std::vector<RankedDocument> ranked = callCollaborator("result reranker", [&] {
        return reranker_->rerank(query, candidates);
    });

    for (const auto& document : ranked) {
        output["ranked"].push_back({{"document", document.document}, {"score", document.score}});
    }

    if (ranked.empty()) {
        LOG_WARN("stage", "Reranker returned no documents, keeping first candidate");
        info.metadata["selection"] = "first_candidate";
        output["text"] = candidates.front();
    } else {
        info.metadata["top_score"] = std::to_string(ranked.front().score);
        output["text"] = ranked.front().document;
    }
    return output;
}

} // namespace Orchestrator
} // namespace LRP
