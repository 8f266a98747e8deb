#pragma once

#include <orderbot/llm/fallback_provider.hpp>
#include <orderbot/nlp/pattern_matcher.hpp>
#include <orderbot/types.hpp>
#include <orderbot/util/logger.hpp>

#include <string>

namespace orderbot::nlp {

/**
 * Two-tier extractor: the pattern table first, the generative fallback
 * only when no rule matched.
 *
 * Never throws. Without a fallback the result is intent=none with
 * source=none; a failed fallback call yields source=error.
 */
class HybridExtractor {
public:
    explicit HybridExtractor(llm::FallbackProviderPtr fallback = nullptr,
                             LoggerPtr logger = nullptr);

    ExtractionResult extract(const std::string& text) const;

    bool has_fallback() const { return fallback_ != nullptr; }
    const PatternMatcher& matcher() const { return matcher_; }

private:
    PatternMatcher matcher_;
    llm::FallbackProviderPtr fallback_;
    LoggerPtr logger_;
};

}  // namespace orderbot::nlp
