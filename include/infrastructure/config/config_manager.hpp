#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace LRP {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, ConfigValue>>>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (const T* typed = std::get_if<T>(&*value_)) {
            return *typed;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    // EN: Try to get value as specific type (returns nullopt if empty or type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (nullopt si vide ou type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* typed = std::get_if<T>(&*value_)) {
            return *typed;
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Configuration manager with YAML parsing, validation rules and environment overrides.
// FR: Gestionnaire de configuration avec parsing YAML, règles de validation et surcharges d'environnement.
class ConfigManager {
public:
    // EN: Validation rule for one "section.key" entry.
    // FR: Règle de validation pour une entrée "section.clé".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from a YAML file, replacing current sections.
    // FR: Charge la configuration depuis un fichier YAML, remplace les sections actuelles.
    bool loadFromFile(const std::string& filename);

    bool loadFromString(const std::string& yaml_content);

    bool saveToFile(const std::string& filename) const;

    // EN: Apply every <prefix><SECTION>__<KEY>=value environment variable; returns how many were applied.
    // FR: Applique chaque variable <prefix><SECTION>__<KEY>=valeur ; retourne le nombre appliqué.
    size_t loadEnvironmentOverrides(const std::string& prefix = "LRP_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& key);
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and validation rules.
    // FR: Remet à zéro toutes les données et règles de validation.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Convert a YAML document root into sections. Caller holds mutex_.
    // FR: Convertit la racine d'un document YAML en sections. L'appelant détient mutex_.
    void loadDocument(const YAML::Node& root);

    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    static std::string expandVariables(const std::string& value);
    static ConfigValue parseYamlValue(const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET(key) LRP::ConfigManager::getInstance().get(key)
#define CONFIG_GET_SECTION(section, key) LRP::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(key, value) LRP::ConfigManager::getInstance().set(key, LRP::ConfigValue(value))
#define CONFIG_SET_SECTION(section, key, value) LRP::ConfigManager::getInstance().set(section, key, LRP::ConfigValue(value))

} // namespace LRP
