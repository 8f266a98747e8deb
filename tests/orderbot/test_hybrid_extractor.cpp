#include <gtest/gtest.h>
#include <orderbot/nlp/hybrid_extractor.hpp>

#include <stdexcept>

using namespace orderbot;
using namespace orderbot::nlp;

namespace {

// Fallback that replays a fixed extraction and counts calls
class ScriptedFallback : public llm::FallbackProvider {
public:
    enum class Mode { SUCCEED, FAIL, THROW };

    Result<llm::IntentExtraction> extract_intent(const std::string& text,
                                                 const std::string& language) override {
        ++extract_calls;
        last_text = text;
        last_language = language;
        switch (mode) {
            case Mode::FAIL:
                return Error(ErrorCode::TIMEOUT, "timed out");
            case Mode::THROW:
                throw std::runtime_error("socket closed");
            case Mode::SUCCEED:
                break;
        }
        return extraction;
    }

    Result<std::string> generate_reply(const std::string&, const std::string&,
                                       const std::string&) override {
        return Error(ErrorCode::PROVIDER_UNAVAILABLE, "not scripted");
    }

    Mode mode = Mode::SUCCEED;
    llm::IntentExtraction extraction;
    int extract_calls = 0;
    std::string last_text;
    std::string last_language;
};

}  // namespace

class HybridExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        fallback_ = std::make_shared<ScriptedFallback>();
        fallback_->extraction.intent = Intent::TRACK_ORDER;
        fallback_->extraction.entities.order_id = "7";
        fallback_->extraction.confidence = 0.8;
    }

    std::shared_ptr<ScriptedFallback> fallback_;
};

// ============================================================================
// Tier selection
// ============================================================================

TEST_F(HybridExtractorTest, PatternHitSkipsFallback) {
    HybridExtractor extractor(fallback_);

    auto r = extractor.extract("show my cart");
    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::VIEW_CART);
    EXPECT_EQ(r.source, ExtractionSource::PATTERN);
    EXPECT_EQ(fallback_->extract_calls, 0);
}

TEST_F(HybridExtractorTest, PatternMissUsesFallback) {
    HybridExtractor extractor(fallback_);

    auto r = extractor.extract("did my food leave the shop yet");
    EXPECT_EQ(fallback_->extract_calls, 1);
    EXPECT_EQ(fallback_->last_text, "did my food leave the shop yet");
    EXPECT_EQ(fallback_->last_language, "en");

    ASSERT_TRUE(r.intent.has_value());
    EXPECT_EQ(*r.intent, Intent::TRACK_ORDER);
    EXPECT_EQ(r.entities.order_id.value_or(""), "7");
    EXPECT_EQ(r.source, ExtractionSource::FALLBACK);
    EXPECT_DOUBLE_EQ(r.confidence, 0.8);
}

TEST_F(HybridExtractorTest, NoFallbackMeansNoIntent) {
    HybridExtractor extractor;
    EXPECT_FALSE(extractor.has_fallback());

    auto r = extractor.extract("did my food leave the shop yet");
    EXPECT_FALSE(r.intent.has_value());
    EXPECT_EQ(r.source, ExtractionSource::NONE);
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
    EXPECT_TRUE(r.entities.empty());
}

// ============================================================================
// Fallback failures
// ============================================================================

TEST_F(HybridExtractorTest, FailedFallbackReportsError) {
    fallback_->mode = ScriptedFallback::Mode::FAIL;
    HybridExtractor extractor(fallback_);

    auto r = extractor.extract("something unusual");
    EXPECT_FALSE(r.intent.has_value());
    EXPECT_EQ(r.source, ExtractionSource::ERROR);
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
}

TEST_F(HybridExtractorTest, ThrowingFallbackIsContained) {
    fallback_->mode = ScriptedFallback::Mode::THROW;
    HybridExtractor extractor(fallback_);

    ExtractionResult r;
    EXPECT_NO_THROW(r = extractor.extract("something unusual"));
    EXPECT_FALSE(r.intent.has_value());
    EXPECT_EQ(r.source, ExtractionSource::ERROR);
}

TEST_F(HybridExtractorTest, FallbackLabelOutsideVocabulary) {
    fallback_->extraction.intent = std::nullopt;
    fallback_->extraction.entities = Entities{};
    HybridExtractor extractor(fallback_);

    auto r = extractor.extract("tell me a joke");
    EXPECT_FALSE(r.intent.has_value());
    EXPECT_EQ(r.source, ExtractionSource::FALLBACK);
}

TEST_F(HybridExtractorTest, ArabicLanguageReachesFallback) {
    HybridExtractor extractor(fallback_);

    extractor.extract("الجو حلو النهاردة");
    EXPECT_EQ(fallback_->extract_calls, 1);
    EXPECT_EQ(fallback_->last_language, "ar");
}
