#include "orchestrator/reasoning_stages.hpp"
#include "infrastructure/logging/logger.hpp"

namespace LRP {
namespace Orchestrator {

namespace {

const char* const kNoInputsText = "No reasoning outputs available for compaction";

std::string joinInputs(const std::vector<std::string>& inputs) {
    std::string joined;
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            joined += "\n\n";
        }
        joined += inputs[i];
    }
    return joined;
}

} // namespace

CompactionStage::CompactionStage(std::shared_ptr<ThinkingCompactor> compactor, StageOptions options)
    : ReasoningStage(std::move(options)), compactor_(std::move(compactor)) {}

std::vector<std::string> CompactionStage::collectInputs(const StageContext& context) {
    std::vector<std::string> inputs;
    for (StageType type : {StageType::PREPROCESSING, StageType::WORKING_AWARENESS}) {
        if (auto text = context.getOutputText(type)) {
            if (!text->empty()) {
                inputs.push_back(std::move(*text));
            }
        }
    }
    return inputs;
}

nlohmann::json CompactionStage::executeInternal(const StageContext& context, StageRunInfo& info) const {
    const std::vector<std::string> inputs = collectInputs(context);

    nlohmann::json output;
    output["input_count"] = inputs.size();
    output["passthrough"] = false;

    if (inputs.empty()) {
        output["text"] = kNoInputsText;
        return output;
    }
    if (inputs.size() == 1) {
        output["text"] = inputs.front();
        output["passthrough"] = true;
        return output;
    }

    const std::string joined = joinInputs(inputs);

    // EN: No compactor configured: forward the joined input unchanged.
    // FR: Aucun compacteur configuré : l'entrée jointe est transmise telle quelle.
    if (!compactor_) {
        LOG_DEBUG("stage", "No compactor configured, passing " + std::to_string(inputs.size()) +
                               " inputs through");
        info.metadata["compactor"] = "absent";
        output["text"] = joined;
        output["passthrough"] = true;
        return output;
    }

    const std::string key = cacheKey(getStageType(), joined, context.getRequest().context);
    if (auto cached = cacheGet(context, key, info)) {
        output["text"] = *cached;
        return output;
    }

    std::string compacted = callCollaborator("thinking compactor", [&] { return compactor_->compact(joined); });
    info.metadata["compression_ratio"] =
        std::to_string(joined.empty() ? 1.0 : static_cast<double>(compacted.size()) / joined.size());

    cachePut(context, key, compacted);
    output["text"] = compacted;
    return output;
}

} // namespace Orchestrator
} // namespace LRP
