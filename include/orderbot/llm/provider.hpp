#pragma once

#include <orderbot/result.hpp>

#include <memory>
#include <string>
#include <vector>

namespace orderbot::llm {

/**
 * One chat turn sent to the backend. The system prompt travels
 * separately in CompletionRequest, so only customer and assistant
 * turns are built here.
 */
struct Message {
    enum class Role { SYSTEM, USER, ASSISTANT };

    Role role = Role::USER;
    std::string content;

    static Message user(std::string text) { return {Role::USER, std::move(text)}; }
    static Message assistant(std::string text) { return {Role::ASSISTANT, std::move(text)}; }
};

struct CompletionRequest {
    std::string system_prompt;
    std::vector<Message> messages;

    int max_tokens = 256;
    float temperature = 0.3f;
    float top_p = 0.9f;
    bool json_mode = false;  // Constrain output to a JSON object
    int timeout_ms = 0;      // 0 uses the backend default
};

struct CompletionResult {
    std::string content;
    std::string stop_reason;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int latency_ms = 0;
};

struct ProviderInfo {
    std::string name;
    std::string model_id;
    bool is_local = false;
    size_t context_length = 4096;

    // "ollama (qwen2.5:1.5b-instruct, local)"
    std::string describe() const {
        return name + " (" + model_id + (is_local ? ", local)" : ")");
    }
};

/**
 * Backend used for intent extraction and reply wording. All failures,
 * including an unreachable server, come back as errors from complete().
 */
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    virtual ProviderInfo info() const = 0;

    virtual Result<void> initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_available() const = 0;

    virtual Result<CompletionResult> complete(const CompletionRequest& request) = 0;
};

using ProviderPtr = std::unique_ptr<LLMProvider>;

}  // namespace orderbot::llm
