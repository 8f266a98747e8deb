#include <orderbot/llm/fallback_provider.hpp>
#include <orderbot/llm/prompts.hpp>
#include <orderbot/util/text.hpp>

#include <nlohmann/json.hpp>

namespace orderbot::llm {

using json = nlohmann::json;

LLMFallbackProvider::LLMFallbackProvider(ProviderPtr provider, LoggerPtr logger)
    : provider_(std::move(provider))
    , logger_(logger ? std::move(logger) : make_null_logger()) {}

Result<IntentExtraction> LLMFallbackProvider::parse_extraction(const std::string& raw) {
    size_t open = raw.find('{');
    size_t close = raw.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return Error(ErrorCode::PARSE_ERROR, "No JSON object in model output");
    }

    json j = json::parse(raw.substr(open, close - open + 1), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error(ErrorCode::PARSE_ERROR, "Model output is not valid JSON");
    }

    IntentExtraction extraction;
    if (j.contains("intent") && j["intent"].is_string()) {
        extraction.intent = parse_intent(j["intent"].get<std::string>());
    }
    if (j.contains("entities")) {
        extraction.entities = Entities::from_json(j["entities"]);
    }
    if (j.contains("confidence") && j["confidence"].is_number()) {
        double c = j["confidence"].get<double>();
        if (c < 0.0) c = 0.0;
        if (c > 1.0) c = 1.0;
        extraction.confidence = c;
    }
    return extraction;
}

Result<IntentExtraction> LLMFallbackProvider::extract_intent(const std::string& text,
                                                             const std::string& language) {
    if (!provider_ || !provider_->is_available()) {
        return Error(ErrorCode::PROVIDER_UNAVAILABLE, "No completion provider");
    }

    CompletionRequest request;
    request.system_prompt = prompts::INTENT_EXTRACTION;
    request.messages.push_back(Message::user("Language: " + language + "\nMessage: " + text));
    request.temperature = 0.0f;
    request.max_tokens = 200;
    request.json_mode = true;

    auto completion = provider_->complete(request);
    if (!completion.ok()) {
        logger_->warning("Intent extraction failed: " + completion.error().to_string());
        return completion.error();
    }

    auto parsed = parse_extraction(completion.value().content);
    if (!parsed.ok()) {
        logger_->warning("Unusable intent output: " + parsed.error().to_string());
    }
    return parsed;
}

Result<std::string> LLMFallbackProvider::generate_reply(const std::string& text,
                                                        const std::string& context_blob,
                                                        const std::string& language) {
    if (!provider_ || !provider_->is_available()) {
        return Error(ErrorCode::PROVIDER_UNAVAILABLE, "No completion provider");
    }

    CompletionRequest request;
    request.system_prompt = prompts::REPLY_GENERATION;
    std::string reply_language = language == "ar" ? "Arabic (Egyptian)" : "English";
    request.messages.push_back(Message::user(
        context_blob + "\n\nReply language: " + reply_language +
        "\nCustomer message: " + text));
    request.temperature = 0.4f;
    request.max_tokens = 300;

    auto completion = provider_->complete(request);
    if (!completion.ok()) {
        logger_->warning("Reply generation failed: " + completion.error().to_string());
        return completion.error();
    }

    std::string reply = text::trim(completion.value().content);
    if (reply.empty()) {
        return Error(ErrorCode::PARSE_ERROR, "Model returned an empty reply");
    }
    return reply;
}

}  // namespace orderbot::llm
