// EN: WorkingAwareness stage - fan-out of framed reasoning calls, joined in index order.
// FR: Étape WorkingAwareness - distribution d'appels de raisonnement cadrés, regroupés par index.

#include "orchestrator/reasoning_stages.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <future>
#include <sstream>
#include <stdexcept>

namespace LRP {
namespace Orchestrator {

namespace {

constexpr auto kJoinPollInterval = std::chrono::milliseconds(10);

const char* const kFramings[] = {
    "Analyze this problem from a logical, step-by-step perspective:",
    "Consider this problem from a creative, intuitive perspective:",
    "Examine this problem critically, identifying potential issues:",
    "Approach this problem practically, focusing on concrete implementation:",
    "Compare alternative approaches to this problem and weigh their trade-offs:"
};

constexpr size_t kFramingCount = sizeof(kFramings) / sizeof(kFramings[0]);

} // namespace

WorkingAwarenessStage::WorkingAwarenessStage(std::shared_ptr<ReasoningAgent> agent, Settings settings,
                                             StageOptions options)
    : ReasoningStage(std::move(options)), agent_(std::move(agent)), settings_(std::move(settings)) {
    if (!agent_) {
        throw std::invalid_argument("WorkingAwarenessStage requires a reasoning agent");
    }
    if (settings_.num_perspectives == 0) {
        throw std::invalid_argument("WorkingAwarenessStage requires at least one perspective");
    }
}

std::string WorkingAwarenessStage::perspectivePrompt(size_t index, const std::string& input) {
    if (index < kFramingCount) {
        return std::string(kFramings[index]) + "\n" + input;
    }
    return "Consider this problem from alternative perspective #" + std::to_string(index + 1) +
           ", distinct from the usual angles:\n" + input;
}

std::string WorkingAwarenessStage::combinePerspectives(const std::vector<size_t>& indices,
                                                       const std::vector<std::string>& perspectives) {
    std::ostringstream combined;
    combined << "Multiple reasoning perspectives:";
    for (size_t i = 0; i < perspectives.size() && i < indices.size(); ++i) {
        combined << "\n\nPerspective " << (indices[i] + 1) << ":\n" << perspectives[i];
    }
    return combined.str();
}

nlohmann::json WorkingAwarenessStage::executeInternal(const StageContext& context, StageRunInfo& info) const {
    const PipelineRequest& request = context.getRequest();
    const std::string input = context.getOutputText(StageType::PREPROCESSING).value_or(request.prompt);
    const size_t count = settings_.num_perspectives;

    std::vector<std::string> prompts;
    std::vector<std::string> keys;
    prompts.reserve(count);
    keys.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        prompts.push_back(perspectivePrompt(i, input));
        keys.push_back(cacheKey(getStageType(), prompts.back(), request.context));
    }

    // EN: Cache lookups stay on the calling thread; only agent calls are dispatched.
    // FR: Les lectures de cache restent sur le thread appelant ; seuls les appels d'agent sont distribués.
    std::vector<PerspectiveOutcome> outcomes(count);
    for (size_t i = 0; i < count; ++i) {
        if (auto cached = cacheGet(context, keys[i], info)) {
            outcomes[i].text = std::move(*cached);
            outcomes[i].from_cache = true;
        }
    }

    if (settings_.thread_pool) {
        runParallel(context, prompts, outcomes);
    } else {
        runSequential(context, prompts, outcomes);
    }

    nlohmann::json perspectives = nlohmann::json::array();
    nlohmann::json indices = nlohmann::json::array();
    nlohmann::json failed = nlohmann::json::array();
    std::vector<size_t> ok_indices;
    std::vector<std::string> ok_texts;

    for (size_t i = 0; i < count; ++i) {
        PerspectiveOutcome& outcome = outcomes[i];
        if (outcome.text) {
            if (!outcome.from_cache) {
                cachePut(context, keys[i], *outcome.text);
            }
            perspectives.push_back(*outcome.text);
            indices.push_back(i);
            ok_indices.push_back(i);
            ok_texts.push_back(*outcome.text);
        } else {
            failed.push_back(i);
            LOG_WARN("stage", "Perspective " + std::to_string(i + 1) + " failed: " +
                                  outcome.error.value_or("no output"));
        }
    }

    if (ok_texts.empty()) {
        throw CollaboratorError("reasoning agent",
                                "all " + std::to_string(count) + " perspectives failed, first error: " +
                                    outcomes.front().error.value_or("no output"));
    }

    info.metadata["perspectives"] = std::to_string(count);
    info.metadata["mode"] = settings_.thread_pool ? "parallel" : "sequential";
    if (!failed.empty()) {
        info.metadata["failed_perspectives"] = std::to_string(failed.size());
    }

    nlohmann::json output;
    output["text"] = combinePerspectives(ok_indices, ok_texts);
    output["perspectives"] = perspectives;
    output["perspective_indices"] = indices;
    output["failed_perspectives"] = failed;
    return output;
}

void WorkingAwarenessStage::runParallel(const StageContext& context, const std::vector<std::string>& prompts,
                                        std::vector<PerspectiveOutcome>& outcomes) const {
    const PipelineRequest& request = context.getRequest();
    std::vector<std::optional<std::future<ReasoningResponse>>> pending(prompts.size());

    for (size_t i = 0; i < prompts.size(); ++i) {
        if (outcomes[i].text) {
            continue;
        }
        // EN: The task owns copies of everything it touches, so it may outlive an abandoned join.
        // FR: La tâche possède des copies de tout ce qu'elle touche, elle peut survivre à une attente abandonnée.
        auto agent = agent_;
        auto prompt = prompts[i];
        auto request_context = request.context;
        try {
            pending[i] = settings_.thread_pool->submitNamed(
                "perspective-" + std::to_string(i + 1), TaskPriority::NORMAL,
                [agent, prompt, request_context]() { return agent->execute(prompt, request_context); });
        } catch (const TaskRejectedError& e) {
            LOG_WARN("stage", "Perspective " + std::to_string(i + 1) +
                                  " rejected by thread pool, running inline: " + e.what());
            try {
                outcomes[i].text = callCollaborator("reasoning agent", [&] {
                    return agent->execute(prompt, request_context);
                }).text;
            } catch (const CollaboratorError& error) {
                outcomes[i].error = error.what();
            }
        }
    }

    const bool bounded = settings_.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + settings_.timeout;

    for (size_t i = 0; i < pending.size(); ++i) {
        if (!pending[i]) {
            continue;
        }
        std::future<ReasoningResponse>& future = *pending[i];
        while (future.wait_for(kJoinPollInterval) != std::future_status::ready) {
            if (context.isCancelled()) {
                throw CancellationError("cancelled while waiting for perspectives");
            }
            if (bounded && std::chrono::steady_clock::now() >= deadline) {
                throw CancellationError("timed out after " + std::to_string(settings_.timeout.count()) +
                                        "ms waiting for perspectives");
            }
        }
        try {
            outcomes[i].text = future.get().text;
        } catch (const std::exception& e) {
            outcomes[i].error = e.what();
        }
    }
}

void WorkingAwarenessStage::runSequential(const StageContext& context, const std::vector<std::string>& prompts,
                                          std::vector<PerspectiveOutcome>& outcomes) const {
    const PipelineRequest& request = context.getRequest();
    const bool bounded = settings_.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + settings_.timeout;

    for (size_t i = 0; i < prompts.size(); ++i) {
        if (outcomes[i].text) {
            continue;
        }
        throwIfCancelled(context);
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            throw CancellationError("timed out after " + std::to_string(settings_.timeout.count()) +
                                    "ms running perspectives");
        }
        try {
            outcomes[i].text = callCollaborator("reasoning agent", [&] {
                return agent_->execute(prompts[i], request.context);
            }).text;
        } catch (const CollaboratorError& e) {
            outcomes[i].error = e.what();
        }
    }
}

} // namespace Orchestrator
} // namespace LRP
