#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/cache_system.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "orchestrator/collaborators.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace LRP {
namespace Orchestrator {

// EN: Settings common to every stage.
// FR: Paramètres communs à toutes les étapes.
struct StageOptions {
    bool enabled = true;
    std::shared_ptr<Cache> cache;                           // EN: May be null / FR: Peut être nul
    std::optional<std::chrono::milliseconds> cache_ttl;     // EN: Absent = never expires / FR: Absent = n'expire jamais
};

// EN: Scratch data of one stage invocation, merged into the StageResult.
// FR: Données de travail d'une invocation d'étape, fusionnées dans le StageResult.
struct StageRunInfo {
    std::unordered_map<std::string, std::string> metadata;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
};

// EN: Base class of the five pipeline stages. execute() is the template method: it handles the
//     disabled case, timing, error conversion and the shared_data write; subclasses only
//     implement executeInternal(). Stages hold no per-run state, so one instance serves
//     concurrent runs.
// FR: Classe de base des cinq étapes. execute() est la méthode patron : elle gère le cas
//     désactivé, le chronométrage, la conversion d'erreurs et l'écriture dans shared_data ;
//     les sous-classes implémentent seulement executeInternal(). Les étapes n'ont pas d'état
//     par exécution, une instance sert donc des exécutions concurrentes.
class ReasoningStage {
public:
    explicit ReasoningStage(StageOptions options);
    virtual ~ReasoningStage() = default;

    ReasoningStage(const ReasoningStage&) = delete;
    ReasoningStage& operator=(const ReasoningStage&) = delete;

    virtual StageType getStageType() const = 0;

    std::string getName() const;
    bool isEnabled() const { return options_.enabled; }

    // EN: Never throws. Disabled stages return SKIPPED with duration 0 and touch nothing.
    // FR: Ne lance jamais. Une étape désactivée retourne SKIPPED avec durée 0 sans effet de bord.
    StageResult execute(StageContext& context) const;

    // EN: Cache key "<stage>:<context>\x1f<input>"; the context part is empty when absent.
    // FR: Clé de cache "<étape>:<contexte>\x1f<entrée>" ; la partie contexte est vide si absente.
    static std::string cacheKey(StageType type, const std::string& input,
                                const std::optional<std::string>& context);

protected:
    // EN: Must return an object with a string "text" field. May throw; execute() converts.
    // FR: Doit retourner un objet avec un champ "text" chaîne. Peut lancer ; execute() convertit.
    virtual nlohmann::json executeInternal(const StageContext& context, StageRunInfo& info) const = 0;

    // EN: Cache helpers. Both are no-ops when caching is off; CacheError is logged and ignored.
    // FR: Aides de cache. Sans effet si le cache est désactivé ; CacheError est journalisée et ignorée.
    std::optional<std::string> cacheGet(const StageContext& context, const std::string& key,
                                        StageRunInfo& info) const;
    void cachePut(const StageContext& context, const std::string& key, const std::string& value) const;

    // EN: Throws CancellationError if the run was cancelled.
    // FR: Lance CancellationError si l'exécution a été annulée.
    void throwIfCancelled(const StageContext& context) const;

    // EN: Call a collaborator, rethrowing its failure as CollaboratorError.
    // FR: Appelle un collaborateur, relance son échec en CollaboratorError.
    template<typename F>
    static auto callCollaborator(const std::string& collaborator, F&& call) -> decltype(call()) {
        try {
            return call();
        } catch (const CancellationError&) {
            throw;
        } catch (const CollaboratorError&) {
            throw;
        } catch (const std::exception& e) {
            throw CollaboratorError(collaborator, e.what());
        }
    }

    const StageOptions& options() const { return options_; }

private:
    StageOptions options_;
};

// EN: Normalizes the request with one reasoning call. Output: {text}.
// FR: Normalise la requête avec un appel de raisonnement. Sortie : {text}.
class PreprocessingStage : public ReasoningStage {
public:
    PreprocessingStage(std::shared_ptr<ReasoningAgent> agent, StageOptions options = {});

    StageType getStageType() const override { return StageType::PREPROCESSING; }

    static std::string buildPrompt(const PipelineRequest& request);

protected:
    nlohmann::json executeInternal(const StageContext& context, StageRunInfo& info) const override;

private:
    std::shared_ptr<ReasoningAgent> agent_;
};

// EN: Fan-out of N framed reasoning calls over the preprocessed input, joined by index.
//     Output: {text, perspectives[], perspective_indices[], failed_perspectives[]}.
// FR: Distribution de N appels de raisonnement cadrés sur l'entrée prétraitée, regroupés par
//     index. Sortie : {text, perspectives[], perspective_indices[], failed_perspectives[]}.
class WorkingAwarenessStage : public ReasoningStage {
public:
    struct Settings {
        size_t num_perspectives = 3;
        std::shared_ptr<ThreadPool> thread_pool;        // EN: Null = sequential / FR: Nul = séquentiel
        std::chrono::milliseconds timeout{0};           // EN: Zero = unbounded / FR: Zéro = illimité
    };

    WorkingAwarenessStage(std::shared_ptr<ReasoningAgent> agent, Settings settings,
                          StageOptions options = {});

    StageType getStageType() const override { return StageType::WORKING_AWARENESS; }

    // EN: Prompt for perspective `index` (0-based).
    // FR: Prompt pour la perspective `index` (base 0).
    static std::string perspectivePrompt(size_t index, const std::string& input);

    static std::string combinePerspectives(const std::vector<size_t>& indices,
                                           const std::vector<std::string>& perspectives);

protected:
    nlohmann::json executeInternal(const StageContext& context, StageRunInfo& info) const override;

private:
    // EN: Outcome of one perspective; error is set when it failed.
    // FR: Résultat d'une perspective ; error est renseigné en cas d'échec.
    struct PerspectiveOutcome {
        std::optional<std::string> text;
        std::optional<std::string> error;
        bool from_cache = false;
    };

    void runParallel(const StageContext& context, const std::vector<std::string>& prompts,
                     std::vector<PerspectiveOutcome>& outcomes) const;
    void runSequential(const StageContext& context, const std::vector<std::string>& prompts,
                       std::vector<PerspectiveOutcome>& outcomes) const;

    std::shared_ptr<ReasoningAgent> agent_;
    Settings settings_;
};

// EN: Consolidates Preprocessing and WorkingAwareness texts. Without a compactor the joined
//     input is passed through unchanged. Output: {text, input_count, passthrough}.
// FR: Consolide les textes de Preprocessing et WorkingAwareness. Sans compacteur l'entrée
//     jointe est transmise telle quelle. Sortie : {text, input_count, passthrough}.
class CompactionStage : public ReasoningStage {
public:
    explicit CompactionStage(std::shared_ptr<ThinkingCompactor> compactor, StageOptions options = {});

    StageType getStageType() const override { return StageType::COMPACTION; }

    static std::vector<std::string> collectInputs(const StageContext& context);

protected:
    nlohmann::json executeInternal(const StageContext& context, StageRunInfo& info) const override;

private:
    std::shared_ptr<ThinkingCompactor> compactor_;
};

// EN: Ranks candidate texts against the prompt and keeps the best one.
//     Output: {text, candidate_count, ranked[{document, score}]}.
// FR: Classe les textes candidats par rapport au prompt et garde le meilleur.
//     Sortie : {text, candidate_count, ranked[{document, score}]}.
class RerankingStage : public ReasoningStage {
public:
    explicit RerankingStage(std::shared_ptr<ResultReranker> reranker, StageOptions options = {});

    StageType getStageType() const override { return StageType::RERANKING; }

    static std::vector<std::string> collectCandidates(const StageContext& context);

protected:
    nlohmann::json executeInternal(const StageContext& context, StageRunInfo& info) const override;

private:
    std::shared_ptr<ResultReranker> reranker_;
};

// EN: Synthesizes the answer from every completed earlier stage. Output: {text}.
// FR: Synthétise la réponse depuis toutes les étapes terminées. Sortie : {text}.
class FinalResponseStage : public ReasoningStage {
public:
    static constexpr size_t kPreviewChars = 500;

    FinalResponseStage(std::shared_ptr<ReasoningAgent> agent, StageOptions options = {});

    StageType getStageType() const override { return StageType::FINAL_RESPONSE; }

    static std::string buildSynthesisPrompt(const StageContext& context);

protected:
    nlohmann::json executeInternal(const StageContext& context, StageRunInfo& info) const override;

private:
    std::shared_ptr<ReasoningAgent> agent_;
};

} // namespace Orchestrator
} // namespace LRP
