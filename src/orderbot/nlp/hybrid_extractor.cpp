#include <orderbot/nlp/hybrid_extractor.hpp>
#include <orderbot/language_detector.hpp>

#include <exception>

namespace orderbot::nlp {

HybridExtractor::HybridExtractor(llm::FallbackProviderPtr fallback, LoggerPtr logger)
    : fallback_(std::move(fallback))
    , logger_(logger ? std::move(logger) : make_null_logger()) {}

ExtractionResult HybridExtractor::extract(const std::string& text) const {
    if (auto matched = matcher_.match(text)) {
        logger_->debug(std::string("Pattern match: ") + intent_label(matched->intent));
        return *matched;
    }

    ExtractionResult result;
    result.language = LanguageDetector::detect(text);
    result.confidence = 0.0;

    if (!fallback_) {
        result.source = ExtractionSource::NONE;
        logger_->debug("No pattern match and no fallback provider");
        return result;
    }

    Result<llm::IntentExtraction> extraction = Error(ErrorCode::INTERNAL_ERROR);
    try {
        extraction = fallback_->extract_intent(text, result.language);
    } catch (const std::exception& e) {
        extraction = Error(ErrorCode::INTERNAL_ERROR, e.what());
    }

    if (!extraction.ok()) {
        logger_->warning("Fallback extraction failed: " + extraction.error().to_string());
        result.source = ExtractionSource::ERROR;
        return result;
    }

    const auto& value = extraction.value();
    result.intent = value.intent;
    result.entities = value.entities;
    result.confidence = value.confidence;
    result.source = ExtractionSource::FALLBACK;
    logger_->debug(std::string("Fallback extraction: ") + intent_label(result.intent));
    return result;
}

}  // namespace orderbot::nlp
