// EN: PipelineConfig validation and loading from the ConfigManager.
// FR: Validation de PipelineConfig et chargement depuis le ConfigManager.

#include "orchestrator/pipeline_config.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cmath>

namespace LRP {
namespace Orchestrator {

namespace {

// EN: Typed accessors for one section. A present value of the wrong type is an error.
// FR: Accesseurs typés pour une section. Une valeur présente de mauvais type est une erreur.
class SectionReader {
public:
    SectionReader(const ConfigSection& section, std::string name)
        : section_(section), name_(std::move(name)) {}

    void readBool(const std::string& key, bool& target) {
        ConfigValue value = section_.get(key);
        if (!value.isValid()) return;
        if (auto typed = value.tryAs<bool>()) {
            target = *typed;
        } else {
            errors_.push_back(qualified(key) + " must be a boolean");
        }
    }

    void readCount(const std::string& key, size_t& target) {
        ConfigValue value = section_.get(key);
        if (!value.isValid()) return;
        auto typed = value.tryAs<int>();
        if (!typed) {
            errors_.push_back(qualified(key) + " must be an integer");
        } else if (*typed < 0) {
            errors_.push_back(qualified(key) + " must not be negative");
        } else {
            target = static_cast<size_t>(*typed);
        }
    }

    // EN: Seconds as int or double, returned in milliseconds.
    // FR: Secondes en entier ou double, retournées en millisecondes.
    std::optional<std::chrono::milliseconds> readSeconds(const std::string& key) {
        ConfigValue value = section_.get(key);
        if (!value.isValid()) return std::nullopt;
        double seconds = 0.0;
        if (auto as_int = value.tryAs<int>()) {
            seconds = static_cast<double>(*as_int);
        } else if (auto as_double = value.tryAs<double>()) {
            seconds = *as_double;
        } else {
            errors_.push_back(qualified(key) + " must be a number of seconds");
            return std::nullopt;
        }
        if (seconds < 0.0 || !std::isfinite(seconds)) {
            errors_.push_back(qualified(key) + " must not be negative");
            return std::nullopt;
        }
        return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
    }

    std::optional<std::string> readString(const std::string& key) {
        ConfigValue value = section_.get(key);
        if (!value.isValid()) return std::nullopt;
        if (auto typed = value.tryAs<std::string>()) {
            return typed;
        }
        errors_.push_back(qualified(key) + " must be a string");
        return std::nullopt;
    }

    void addError(const std::string& key, const std::string& message) {
        errors_.push_back(qualified(key) + " " + message);
    }

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::string qualified(const std::string& key) const { return name_ + "." + key; }

    const ConfigSection& section_;
    std::string name_;
    std::vector<std::string> errors_;
};

} // namespace

bool PipelineConfig::isStageEnabled(StageType type) const {
    switch (type) {
        case StageType::PREPROCESSING: return enable_preprocessing;
        case StageType::WORKING_AWARENESS: return enable_working_awareness;
        case StageType::COMPACTION: return enable_compaction;
        case StageType::RERANKING: return enable_reranking;
        case StageType::FINAL_RESPONSE: return enable_final_response;
        default: return false;
    }
}

std::vector<std::string> PipelineConfig::validate() const {
    std::vector<std::string> errors;

    if (num_perspectives < 1 || num_perspectives > kMaxPerspectives) {
        errors.push_back("num_perspectives must be between 1 and " + std::to_string(kMaxPerspectives));
    }
    if (max_parallel_perspectives < 1) {
        errors.push_back("max_parallel_perspectives must be at least 1");
    }
    if (stage_timeout.count() < 0) {
        errors.push_back("stage_timeout must not be negative");
    }
    if (cache_ttl.count() < 0) {
        errors.push_back("cache_ttl must not be negative");
    }
    if (!isValidLogLevel(log_level)) {
        errors.push_back("log_level must be one of DEBUG, INFO, WARN, ERROR (got '" + log_level + "')");
    }

    return errors;
}

PipelineConfig loadPipelineConfig(const ConfigManager& manager, const std::string& section) {
    PipelineConfig config;
    const ConfigSection values = manager.getSection(section);
    SectionReader reader(values, section);

    reader.readBool("enable_preprocessing", config.enable_preprocessing);
    reader.readBool("enable_working_awareness", config.enable_working_awareness);
    reader.readBool("enable_compaction", config.enable_compaction);
    reader.readBool("enable_reranking", config.enable_reranking);
    reader.readBool("enable_final_response", config.enable_final_response);
    reader.readBool("parallel_execution", config.parallel_execution);
    reader.readBool("enable_metrics", config.enable_metrics);
    reader.readBool("enable_tracing", config.enable_tracing);
    reader.readCount("num_perspectives", config.num_perspectives);
    reader.readCount("max_parallel_perspectives", config.max_parallel_perspectives);

    if (auto timeout = reader.readSeconds("stage_timeout_seconds")) {
        config.stage_timeout = *timeout;
    }
    if (auto ttl = reader.readSeconds("cache_ttl_seconds")) {
        config.cache_ttl = std::chrono::duration_cast<std::chrono::seconds>(*ttl);
    }

    if (auto strategy = reader.readString("error_strategy")) {
        if (auto parsed = PipelineUtils::parseErrorStrategy(*strategy)) {
            config.error_strategy = *parsed;
        } else {
            reader.addError("error_strategy", "must be one of fail_fast, continue");
        }
    }
    if (auto strategy = reader.readString("cache_strategy")) {
        if (auto parsed = PipelineUtils::parseCacheStrategy(*strategy)) {
            config.cache_strategy = *parsed;
        } else {
            reader.addError("cache_strategy", "must be one of none, memory");
        }
    }
    if (auto level = reader.readString("log_level")) {
        config.log_level = *level;
    }

    std::vector<std::string> errors = reader.errors();
    for (const auto& error : config.validate()) {
        errors.push_back(error);
    }
    if (!errors.empty()) {
        throw ConfigurationError(errors);
    }

    LOG_DEBUG("config", "Pipeline configuration loaded from section " + section);
    return config;
}

std::vector<ConfigManager::ValidationRule> pipelineConfigRules(const std::string& section) {
    auto rule = [&section](const std::string& key, const std::string& type) {
        ConfigManager::ValidationRule r;
        r.key = section + "." + key;
        r.type = type;
        return r;
    };

    std::vector<ConfigManager::ValidationRule> rules;
    for (const char* key : {"enable_preprocessing", "enable_working_awareness", "enable_compaction",
                            "enable_reranking", "enable_final_response", "parallel_execution",
                            "enable_metrics", "enable_tracing"}) {
        rules.push_back(rule(key, "bool"));
    }

    auto perspectives = rule("num_perspectives", "int");
    perspectives.min_value = 1;
    perspectives.max_value = static_cast<double>(kMaxPerspectives);
    rules.push_back(perspectives);

    auto parallel = rule("max_parallel_perspectives", "int");
    parallel.min_value = 1;
    rules.push_back(parallel);

    auto timeout = rule("stage_timeout_seconds", "double");
    timeout.min_value = 0;
    rules.push_back(timeout);

    auto ttl = rule("cache_ttl_seconds", "int");
    ttl.min_value = 0;
    rules.push_back(ttl);

    auto strategy = rule("error_strategy", "string");
    strategy.allowed_values = {"fail_fast", "continue"};
    rules.push_back(strategy);

    auto cache = rule("cache_strategy", "string");
    cache.allowed_values = {"none", "memory"};
    rules.push_back(cache);

    auto level = rule("log_level", "string");
    level.allowed_values = {"DEBUG", "INFO", "WARN", "ERROR"};
    rules.push_back(level);

    return rules;
}

} // namespace Orchestrator
} // namespace LRP
