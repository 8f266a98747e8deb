#pragma once

#include <orderbot/llm/provider.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace orderbot::llm {

struct OllamaConfig {
    std::string host = "http://localhost:11434";
    std::string model = "qwen2.5:1.5b-instruct";
    int timeout_ms = 30000;      // Per /api/chat call
    int context_length = 4096;   // Sent as options.num_ctx
    bool keep_alive = true;
};

/**
 * Talks to a local Ollama server. initialize() checks that the server
 * answers and that the configured model has been pulled; complete()
 * posts a non-streaming /api/chat request on a reused curl handle.
 *
 * Not thread-safe: one request at a time per instance.
 */
class OllamaProvider : public LLMProvider {
public:
    explicit OllamaProvider(OllamaConfig config);
    ~OllamaProvider() override;

    OllamaProvider(const OllamaProvider&) = delete;
    OllamaProvider& operator=(const OllamaProvider&) = delete;

    ProviderInfo info() const override;
    Result<void> initialize() override;
    void shutdown() override;
    bool is_available() const override;
    Result<CompletionResult> complete(const CompletionRequest& request) override;

    std::string build_request_body(const CompletionRequest& request) const;
    static Result<CompletionResult> parse_chat_response(const std::string& body);
    static bool has_model(const std::string& tags_body, const std::string& model);

    // Constructs and initializes; fails if the server or model is missing
    static Result<std::unique_ptr<OllamaProvider>> create(OllamaConfig config);

    // Reads ORDERBOT_OLLAMA_HOST and ORDERBOT_OLLAMA_MODEL over the defaults
    static Result<std::unique_ptr<OllamaProvider>> create_from_env();

private:
    void open_handle();
    void close_handle();

    OllamaConfig config_;
    void* curl_ = nullptr;
    std::atomic<bool> ready_{false};
};

}  // namespace orderbot::llm
