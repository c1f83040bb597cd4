#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace LRP {
namespace Orchestrator {

// EN: Text produced by a reasoning collaborator.
// FR: Texte produit par un collaborateur de raisonnement.
struct ReasoningResponse {
    std::string text;
    std::unordered_map<std::string, std::string> metadata;
};

// EN: One reranked candidate, best first in the returned sequence.
// FR: Un candidat reclassé, le meilleur en premier dans la séquence retournée.
struct RankedDocument {
    std::string document;
    double score = 0.0;
};

// EN: Reasoning collaborator. Implementations must be safe to call from several threads at once
//     and report failure by throwing. The pipeline never retries.
// FR: Collaborateur de raisonnement. Les implémentations doivent supporter des appels concurrents
//     et signaler un échec par exception. Le pipeline ne réessaie jamais.
class ReasoningAgent {
public:
    virtual ~ReasoningAgent() = default;

    virtual ReasoningResponse execute(const std::string& prompt,
                                      const std::optional<std::string>& context) = 0;
};

// EN: Compresses accumulated reasoning into a shorter representation.
// FR: Compresse le raisonnement accumulé en une représentation plus courte.
class ThinkingCompactor {
public:
    virtual ~ThinkingCompactor() = default;

    virtual std::string compact(const std::string& input) = 0;
};

// EN: Orders candidate documents by relevance to a query.
// FR: Ordonne les documents candidats par pertinence pour une requête.
class ResultReranker {
public:
    virtual ~ResultReranker() = default;

    virtual std::vector<RankedDocument> rerank(const std::string& query,
                                               const std::vector<std::string>& documents) = 0;
};

} // namespace Orchestrator
} // namespace LRP
