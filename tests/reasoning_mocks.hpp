#pragma once

#include <gmock/gmock.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/cache_system.hpp"
#include "orchestrator/collaborators.hpp"

namespace LRP {
namespace Orchestrator {
namespace Testing {

// EN: Mock collaborators shared by the stage and pipeline tests
// FR: Collaborateurs simulés partagés par les tests d'étapes et de pipeline
class MockReasoningAgent : public ReasoningAgent {
public:
    MOCK_METHOD(ReasoningResponse, execute,
                (const std::string& prompt, const std::optional<std::string>& context), (override));
};

class MockThinkingCompactor : public ThinkingCompactor {
public:
    MOCK_METHOD(std::string, compact, (const std::string& input), (override));
};

class MockResultReranker : public ResultReranker {
public:
    MOCK_METHOD(std::vector<RankedDocument>, rerank,
                (const std::string& query, const std::vector<std::string>& documents), (override));
};

class MockCache : public Cache {
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
    MOCK_METHOD(void, set,
                (const std::string& key, const std::string& value,
                 std::optional<std::chrono::milliseconds> ttl), (override));
    MOCK_METHOD(bool, remove, (const std::string& key), (override));
    MOCK_METHOD(bool, exists, (const std::string& key), (override));
    MOCK_METHOD(void, clear, (), (override));
};

inline ReasoningResponse respond(const std::string& text) {
    ReasoningResponse response;
    response.text = text;
    return response;
}

// EN: First line of a prompt, used by fakes to echo which framing they received.
// FR: Première ligne d'un prompt, utilisée par les faux pour renvoyer le cadrage reçu.
inline std::string firstLine(const std::string& prompt) {
    return prompt.substr(0, prompt.find('\n'));
}

} // namespace Testing
} // namespace Orchestrator
} // namespace LRP
