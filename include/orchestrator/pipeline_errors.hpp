#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "core/cache_system.hpp"

namespace LRP {
namespace Orchestrator {

// EN: Invalid or contradictory pipeline configuration, raised before any stage runs.
// FR: Configuration de pipeline invalide ou contradictoire, levée avant toute étape.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}

    explicit ConfigurationError(const std::vector<std::string>& errors)
        : std::runtime_error(join(errors)), errors_(errors) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    static std::string join(const std::vector<std::string>& errors) {
        std::string message = "Invalid pipeline configuration";
        for (size_t i = 0; i < errors.size(); ++i) {
            message += (i == 0 ? ": " : "; ") + errors[i];
        }
        return message;
    }

    std::vector<std::string> errors_;
};

// EN: A reasoning, compaction or reranking collaborator failed.
// FR: Un collaborateur de raisonnement, compaction ou reranking a échoué.
class CollaboratorError : public std::runtime_error {
public:
    CollaboratorError(const std::string& collaborator, const std::string& message)
        : std::runtime_error(collaborator + " failed: " + message), collaborator_(collaborator) {}

    const std::string& collaborator() const { return collaborator_; }

private:
    std::string collaborator_;
};

// EN: The run was cancelled by the caller or its deadline passed.
// FR: L'exécution a été annulée par l'appelant ou son échéance est dépassée.
class CancellationError : public std::runtime_error {
public:
    explicit CancellationError(const std::string& message) : std::runtime_error(message) {}
};

using LRP::CacheError;

} // namespace Orchestrator
} // namespace LRP
