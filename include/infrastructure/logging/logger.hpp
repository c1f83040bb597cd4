#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace LRP {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Parse a level name ("DEBUG", "INFO", "WARN"/"WARNING", "ERROR"), case-insensitive.
//     Throws std::invalid_argument on an unknown name.
// FR: Parse un nom de niveau, insensible à la casse. Lance std::invalid_argument si inconnu.
LogLevel parseLogLevel(const std::string& name);

// EN: Returns true when parseLogLevel would accept the name.
// FR: Retourne true si parseLogLevel accepterait le nom.
bool isValidLogLevel(const std::string& name);

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output). Returns false if it cannot be opened.
    // FR: Définit le fichier de sortie (désactive la console). Retourne false si l'ouverture échoue.
    bool setOutputFile(const std::string& filename);

    // EN: Restore console output and close any log file.
    // FR: Restaure la sortie console et ferme le fichier de log.
    void resetOutput();

    // EN: Process-wide correlation ID, used when the calling thread has no scoped one.
    // FR: ID de corrélation global, utilisé si le thread courant n'en a pas.
    void setCorrelationId(const std::string& correlation_id);

    // EN: Add global metadata that will be included in all log entries.
    // FR: Ajoute des métadonnées globales incluses dans toutes les entrées.
    void addGlobalMetadata(const std::string& key, const std::string& value);
    void clearGlobalMetadata();

    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    static std::string generateCorrelationId();

    // EN: Format an entry as a single NDJSON line (exposed for tests).
    // FR: Formate une entrée en ligne NDJSON (exposé pour les tests).
    static std::string formatAsNDJSON(const LogEntry& entry);

    static std::string levelToString(LogLevel level);

private:
    friend class ScopedCorrelationId;

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();

    // EN: Correlation ID bound to the current thread, empty when none.
    // FR: ID de corrélation lié au thread courant, vide si aucun.
    static std::string& threadCorrelationId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

// EN: RAII binding of a correlation ID to the current thread; restores the previous one on exit.
// FR: Liaison RAII d'un ID de corrélation au thread courant ; restaure le précédent à la sortie.
class ScopedCorrelationId {
public:
    explicit ScopedCorrelationId(const std::string& correlation_id);
    ~ScopedCorrelationId();

    ScopedCorrelationId(const ScopedCorrelationId&) = delete;
    ScopedCorrelationId& operator=(const ScopedCorrelationId&) = delete;

private:
    std::string previous_;
};

#define LOG_DEBUG(module, message) LRP::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) LRP::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) LRP::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) LRP::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) LRP::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) LRP::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) LRP::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) LRP::Logger::getInstance().error(module, message, metadata)

} // namespace LRP
