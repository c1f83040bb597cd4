#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace LRP {
namespace Orchestrator {

// EN: Stages of the reasoning pipeline, in definition order.
// FR: Étapes du pipeline de raisonnement, dans l'ordre de définition.
enum class StageType {
    PREPROCESSING = 0,      // EN: Normalize the request / FR: Normalise la requête
    WORKING_AWARENESS = 1,  // EN: Parallel perspectives / FR: Perspectives parallèles
    COMPACTION = 2,         // EN: Consolidate reasoning / FR: Consolide le raisonnement
    RERANKING = 3,          // EN: Select best candidate / FR: Sélectionne le meilleur candidat
    FINAL_RESPONSE = 4      // EN: Synthesize the answer / FR: Synthétise la réponse
};

constexpr std::array<StageType, 5> kStageOrder = {
    StageType::PREPROCESSING,
    StageType::WORKING_AWARENESS,
    StageType::COMPACTION,
    StageType::RERANKING,
    StageType::FINAL_RESPONSE
};

// EN: Lifecycle of one stage invocation. COMPLETED, SKIPPED and FAILED are terminal.
// FR: Cycle de vie d'une invocation d'étape. COMPLETED, SKIPPED et FAILED sont terminaux.
enum class StageStatus {
    PENDING = 0,
    RUNNING = 1,
    COMPLETED = 2,
    SKIPPED = 3,
    FAILED = 4
};

// EN: Why a stage failed.
// FR: Raison de l'échec d'une étape.
enum class StageErrorKind {
    COLLABORATOR = 0,   // EN: Agent, compactor or reranker threw / FR: Un collaborateur a échoué
    CANCELLED = 1,      // EN: Cancellation or deadline / FR: Annulation ou échéance
    INTERNAL = 2        // EN: Unexpected fault / FR: Défaut inattendu
};

// EN: A reasoning request. Treated as immutable once handed to the pipeline.
// FR: Une requête de raisonnement. Immuable une fois confiée au pipeline.
struct PipelineRequest {
    std::string prompt;
    std::optional<std::string> context;
    std::vector<std::string> constraints;
    std::unordered_map<std::string, std::string> metadata;

    PipelineRequest() = default;

    explicit PipelineRequest(std::string prompt_text,
                             std::optional<std::string> context_text = std::nullopt,
                             std::vector<std::string> constraint_list = {})
        : prompt(std::move(prompt_text)),
          context(std::move(context_text)),
          constraints(std::move(constraint_list)) {}
};

// EN: Outcome of one stage. output is present iff COMPLETED, error and error_kind iff FAILED.
// FR: Résultat d'une étape. output présent ssi COMPLETED, error et error_kind ssi FAILED.
struct StageResult {
    StageType stage_type = StageType::PREPROCESSING;
    StageStatus status = StageStatus::PENDING;
    std::optional<nlohmann::json> output;
    double duration_ms = 0.0;
    std::optional<std::string> error;
    std::optional<StageErrorKind> error_kind;
    std::unordered_map<std::string, std::string> metadata;

    bool isSuccess() const { return status == StageStatus::COMPLETED; }

    // EN: output["text"] or an empty string.
    // FR: output["text"] ou une chaîne vide.
    std::string outputText() const;

    static StageResult completed(StageType type, nlohmann::json output, double duration_ms);
    static StageResult skipped(StageType type, const std::string& reason);
    static StageResult failed(StageType type, const std::string& error, StageErrorKind kind,
                              double duration_ms);
};

// EN: Cooperative cancellation signal with an optional deadline. Safe to share between threads.
// FR: Signal d'annulation coopératif avec échéance optionnelle. Partageable entre threads.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }

    // EN: True once cancel() was called or the deadline has passed.
    // FR: Vrai dès que cancel() a été appelé ou que l'échéance est dépassée.
    bool isCancelled() const;

    void setDeadline(std::chrono::steady_clock::time_point deadline);
    void setTimeout(std::chrono::milliseconds timeout);
    std::optional<std::chrono::steady_clock::time_point> getDeadline() const;

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int64_t> deadline_ns_{0}; // EN: 0 means none / FR: 0 signifie aucune
};

class ReasoningPipeline;
class ReasoningStage;

// EN: Per-run state threaded through the stages. Created by the pipeline for one run only.
//     previous_results is appended by the pipeline; shared_data receives one entry per
//     completed stage, written by that stage.
// FR: État d'une exécution transmis aux étapes. Créé par le pipeline pour une seule exécution.
//     previous_results est complété par le pipeline ; shared_data reçoit une entrée par
//     étape terminée, écrite par cette étape.
class StageContext {
public:
    explicit StageContext(PipelineRequest request, bool cache_enabled = false,
                          const CancellationToken* cancellation = nullptr);

    const PipelineRequest& getRequest() const { return request_; }
    const std::vector<StageResult>& getPreviousResults() const { return previous_results_; }
    const nlohmann::json& getSharedData() const { return shared_data_; }
    bool isCacheEnabled() const { return cache_enabled_; }

    // EN: Output written by a completed stage, or nullptr.
    // FR: Sortie écrite par une étape terminée, ou nullptr.
    const nlohmann::json* getOutput(StageType type) const;

    // EN: "text" field of a completed stage's output.
    // FR: Champ "text" de la sortie d'une étape terminée.
    std::optional<std::string> getOutputText(StageType type) const;

    bool isCancelled() const { return cancellation_ != nullptr && cancellation_->isCancelled(); }
    const CancellationToken* getCancellationToken() const { return cancellation_; }

private:
    friend class ReasoningPipeline;
    friend class ReasoningStage;

    void appendResult(const StageResult& result);

    // EN: Throws std::logic_error if the stage already wrote its entry.
    // FR: Lance std::logic_error si l'étape a déjà écrit son entrée.
    void writeSharedData(StageType type, const nlohmann::json& output);

    PipelineRequest request_;
    std::vector<StageResult> previous_results_;
    nlohmann::json shared_data_ = nlohmann::json::object();
    bool cache_enabled_;
    const CancellationToken* cancellation_;
};

// EN: Result of one pipeline run.
// FR: Résultat d'une exécution du pipeline.
struct PipelineResult {
    std::string final_response;
    std::vector<StageResult> stages;
    double total_duration_ms = 0.0;
    PipelineRequest request;
    size_t cache_hits = 0;
    std::chrono::system_clock::time_point completed_at;
    nlohmann::json metadata = nlohmann::json::object();

    // EN: Result for the given stage, or nullptr.
    // FR: Résultat de l'étape donnée, ou nullptr.
    const StageResult* findStage(StageType type) const;
};

} // namespace Orchestrator
} // namespace LRP
