#include "orchestrator/reasoning_stages.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <sstream>
#include <stdexcept>

namespace LRP {
namespace Orchestrator {

FinalResponseStage::FinalResponseStage(std::shared_ptr<ReasoningAgent> agent, StageOptions options)
    : ReasoningStage(std::move(options)), agent_(std::move(agent)) {
    if (!agent_) {
        throw std::invalid_argument("FinalResponseStage requires a reasoning agent");
    }
}

std::string FinalResponseStage::buildSynthesisPrompt(const StageContext& context) {
    const PipelineRequest& request = context.getRequest();
    std::ostringstream prompt;
    prompt << "You are synthesizing the final response for a reasoning pipeline.\n"
           << "\nOriginal request: " << request.prompt << "\n";
    if (request.context) {
        prompt << "\nContext: " << *request.context << "\n";
    }
    prompt << "\nIntermediate results from the pipeline:\n";

    size_t included = 0;
    for (const auto& result : context.getPreviousResults()) {
        if (!result.isSuccess()) {
            continue;
        }
        prompt << "\n" << PipelineUtils::stageTitle(result.stage_type) << ":\n"
               << PipelineUtils::truncate(result.outputText(), kPreviewChars) << "\n";
        ++included;
    }
    if (included == 0) {
        prompt << "\n(none)\n";
    }

    prompt << "\nBased on all the above analysis, provide a comprehensive, well-reasoned final "
              "response to the original request.";

    if (!request.constraints.empty()) {
        prompt << "\n\nConstraints:";
        for (const auto& constraint : request.constraints) {
            prompt << "\n- " << constraint;
        }
    }
    return prompt.str();
}

nlohmann::json FinalResponseStage::executeInternal(const StageContext& context, StageRunInfo& info) const {
    const std::string prompt = buildSynthesisPrompt(context);
    const std::optional<std::string>& request_context = context.getRequest().context;

    ReasoningResponse response = callCollaborator("reasoning agent", [&] {
        return agent_->execute(prompt, request_context);
    });

    info.metadata["prompt_chars"] = std::to_string(prompt.size());
    return {{"text", response.text}};
}

} // namespace Orchestrator
} // namespace LRP
