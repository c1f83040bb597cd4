#include "orchestrator/reasoning_stages.hpp"
#include "infrastructure/logging/logger.hpp"

#include <sstream>
#include <stdexcept>

namespace LRP {
namespace Orchestrator {

PreprocessingStage::PreprocessingStage(std::shared_ptr<ReasoningAgent> agent, StageOptions options)
    : ReasoningStage(std::move(options)), agent_(std::move(agent)) {
    if (!agent_) {
        throw std::invalid_argument("PreprocessingStage requires a reasoning agent");
    }
}

std::string PreprocessingStage::buildPrompt(const PipelineRequest& request) {
    std::ostringstream prompt;
    prompt << "You are a preprocessing agent for a reasoning pipeline.\n"
           << "Your task is to validate, normalize, and prepare the following input for reasoning:\n"
           << "\nInput: " << request.prompt << "\n";

    if (request.context) {
        prompt << "\nContext: " << *request.context << "\n";
    }

    if (!request.constraints.empty()) {
        prompt << "\nConstraints:\n";
        for (const auto& constraint : request.constraints) {
            prompt << "- " << constraint << "\n";
        }
    }

    prompt << "\nProvide a clear, well-structured version of this task that will be "
              "easier for downstream reasoning stages to process.";
    return prompt.str();
}

nlohmann::json PreprocessingStage::executeInternal(const StageContext& context, StageRunInfo& info) const {
    const PipelineRequest& request = context.getRequest();
    const std::string prompt = buildPrompt(request);
    const std::string key = cacheKey(getStageType(), prompt, request.context);

    if (auto cached = cacheGet(context, key, info)) {
        info.metadata["cache"] = "hit";
        return {{"text", *cached}};
    }
    info.metadata["cache"] = context.isCacheEnabled() ? "miss" : "disabled";

    ReasoningResponse response = callCollaborator("reasoning agent", [&] {
        return agent_->execute(prompt, request.context);
    });

    LOG_DEBUG("stage", "Preprocessing produced " + std::to_string(response.text.size()) + " chars");
    cachePut(context, key, response.text);
    return {{"text", response.text}};
}

} // namespace Orchestrator
} // namespace LRP
