#pragma once

#include <orderbot/llm/provider.hpp>
#include <orderbot/result.hpp>
#include <orderbot/types.hpp>
#include <orderbot/util/logger.hpp>

#include <memory>
#include <optional>
#include <string>

namespace orderbot::llm {

/**
 * Intent classification produced by a generative provider.
 */
struct IntentExtraction {
    std::optional<Intent> intent;   // nullopt for labels outside the vocabulary
    Entities entities;
    double confidence = 0.5;
};

/**
 * Capability boundary to a generative text-understanding provider.
 *
 * Both calls report failure through Result and must not throw; callers
 * treat any error as "no usable output".
 */
class FallbackProvider {
public:
    virtual ~FallbackProvider() = default;

    /**
     * Classify a message the pattern table did not recognise.
     *
     * @param text Raw customer message
     * @param language Detected language ("en" or "ar")
     */
    virtual Result<IntentExtraction> extract_intent(const std::string& text,
                                                    const std::string& language) = 0;

    /**
     * Write a natural-language reply.
     *
     * @param text Raw customer message
     * @param context_blob History, action result and cart rendered as text
     * @param language Reply language
     * @return Non-empty reply text, or an error
     */
    virtual Result<std::string> generate_reply(const std::string& text,
                                               const std::string& context_blob,
                                               const std::string& language) = 0;
};

using FallbackProviderPtr = std::shared_ptr<FallbackProvider>;

/**
 * FallbackProvider backed by any LLMProvider (Ollama in production).
 */
class LLMFallbackProvider : public FallbackProvider {
public:
    explicit LLMFallbackProvider(ProviderPtr provider, LoggerPtr logger = nullptr);

    Result<IntentExtraction> extract_intent(const std::string& text,
                                            const std::string& language) override;

    Result<std::string> generate_reply(const std::string& text,
                                       const std::string& context_blob,
                                       const std::string& language) override;

    /**
     * Parse a model's JSON classification. Tolerates markdown code fences
     * and surrounding prose by taking the outermost {...} span.
     */
    static Result<IntentExtraction> parse_extraction(const std::string& raw);

private:
    ProviderPtr provider_;
    LoggerPtr logger_;
};

}  // namespace orderbot::llm
