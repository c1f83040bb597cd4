// EN: Implementation of the ConfigManager class. YAML parsing, validation and environment overrides.
// FR: Implémentation de la classe ConfigManager. Parsing YAML, validation et surcharges d'environnement.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

extern char** environ;

namespace LRP {

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        return false;
    }

    try {
        loadDocument(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }

    LOG_INFO("config", "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        loadDocument(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }

    LOG_DEBUG("config", "Configuration loaded from string");
    return true;
}

// EN: Top-level maps become sections; a top-level scalar becomes section.value.
// FR: Les maps de premier niveau deviennent des sections ; un scalaire devient section.value.
void ConfigManager::loadDocument(const YAML::Node& root) {
    if (!root.IsNull() && !root.IsMap()) {
        throw YAML::Exception(YAML::Mark::null_mark(), "configuration root must be a map");
    }

    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : root) {
        const std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else if (!section.second.IsNull()) {
            config_section.set("value", parseYamlValue(section.second));
        }
        loaded[section_name] = config_section;
    }
    sections_ = std::move(loaded);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(item.as<std::string>());
        }
        return ConfigValue(array_value);
    }
    if (!node.IsScalar()) {
        throw YAML::Exception(node.Mark(), "nested maps are not supported as configuration values");
    }

    const std::string str_val = node.as<std::string>();
    if (str_val == "true" || str_val == "false") {
        return ConfigValue(str_val == "true");
    }

    // EN: Quoted scalars always stay strings.
    // FR: Les scalaires entre guillemets restent des chaînes.
    if (node.Tag() != "!") {
        int int_val = 0;
        if (str_val.find_first_of(".eE") == std::string::npos &&
            YAML::convert<int>::decode(node, int_val)) {
            return ConfigValue(int_val);
        }
        double double_val = 0.0;
        if (YAML::convert<double>::decode(node, double_val)) {
            return ConfigValue(double_val);
        }
    }

    return ConfigValue(expandVariables(str_val));
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);

    YAML::Emitter emitter;
    emitter << YAML::BeginMap;

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        emitter << YAML::Key << section_name;
        emitter << YAML::Value << YAML::BeginMap;

        for (const std::string& key : section.keys()) {
            ConfigValue value = section.get(key);
            emitter << YAML::Key << key << YAML::Value;

            if (auto bool_val = value.tryAs<bool>()) {
                emitter << *bool_val;
            } else if (auto int_val = value.tryAs<int>()) {
                emitter << *int_val;
            } else if (auto double_val = value.tryAs<double>()) {
                emitter << *double_val;
            } else if (auto str_val = value.tryAs<std::string>()) {
                emitter << *str_val;
            } else if (auto array_val = value.tryAs<std::vector<std::string>>()) {
                emitter << YAML::BeginSeq;
                for (const auto& item : *array_val) {
                    emitter << item;
                }
                emitter << YAML::EndSeq;
            } else {
                emitter << YAML::Null;
            }
        }
        emitter << YAML::EndMap;
    }
    emitter << YAML::EndMap;

    std::ofstream file(filename);
    if (!file) {
        LOG_ERROR("config", "Failed to open configuration file for writing: " + filename);
        return false;
    }
    file << emitter.c_str() << '\n';
    if (!file) {
        LOG_ERROR("config", "Failed to write configuration file: " + filename);
        return false;
    }

    LOG_INFO("config", "Configuration saved to: " + filename);
    return true;
}

// EN: LRP_REASONING_PIPELINE__NUM_PERSPECTIVES=5 overrides reasoning_pipeline.num_perspectives.
// FR: LRP_REASONING_PIPELINE__NUM_PERSPECTIVES=5 surcharge reasoning_pipeline.num_perspectives.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t applied = 0;

    for (char** env = environ; env && *env; ++env) {
        const std::string entry(*env);
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string name = entry.substr(prefix.size(), eq - prefix.size());
        const std::string raw_value = entry.substr(eq + 1);

        const size_t sep = name.find("__");
        if (sep == std::string::npos || sep == 0 || sep + 2 >= name.size()) {
            continue;
        }
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const std::string section = name.substr(0, sep);
        const std::string key = name.substr(sep + 2);

        ConfigValue value;
        try {
            value = parseYamlValue(YAML::Load(raw_value));
        } catch (const YAML::Exception&) {
            value = ConfigValue(raw_value);
        }
        sections_[section].set(key, value);
        ++applied;
        LOG_INFO("config", "Environment override applied: " + section + "." + key);
    }

    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value = getUnlocked(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& key) const {
    return get("default", key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getUnlocked(section, key);
}

ConfigValue ConfigManager::getUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    set("default", key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& key) const {
    return has("default", key);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::remove(const std::string& key) {
    remove("default", key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream oss;
    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // EN: Integers are accepted where a double is expected.
    // FR: Les entiers sont acceptés là où un double est attendu.
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        const std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

// EN: Unknown ${VAR} references are left as-is.
// FR: Les références ${VAR} inconnues sont laissées telles quelles.
std::string ConfigManager::expandVariables(const std::string& value) {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");

    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

} // namespace LRP
