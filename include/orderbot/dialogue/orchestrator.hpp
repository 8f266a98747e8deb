#pragma once

#include <orderbot/config.hpp>
#include <orderbot/dialogue/clarification_engine.hpp>
#include <orderbot/dialogue/context.hpp>
#include <orderbot/dialogue/intent_router.hpp>
#include <orderbot/dialogue/suggestion_protocol.hpp>
#include <orderbot/llm/fallback_provider.hpp>
#include <orderbot/nlp/hybrid_extractor.hpp>
#include <orderbot/recommendation/recommender.hpp>
#include <orderbot/store/state_store.hpp>
#include <orderbot/util/logger.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace orderbot::dialogue {

/**
 * Everything a caller learns about one processed message. The shape is
 * the same on success and on failure.
 */
struct ResponseEnvelope {
    bool success = true;
    std::string user_message;
    std::string reply;
    std::optional<Intent> intent;
    ExtractionSource source = ExtractionSource::NONE;
    double confidence = 0.0;
    bool handler_executed = false;
    std::string handler_name;
    json handler_result = json::object();
    store::Cart cart;
    std::vector<recommendation::Recommendation> recommendations;
    std::vector<std::string> suggested_actions;
    bool clarification_needed = false;
    std::string clarification_question;
    json metadata = json::object();

    json to_json() const;
};

/**
 * Orchestrator - the per-message dialogue pipeline.
 *
 * Stages run in a fixed order on a DialogueContext value:
 * extract, load state, clarify-or-route, respond, persist. A pending
 * clarification or a pending suggestion short-circuits routing or reply
 * generation. Every expected failure is turned into a structured result
 * at the stage where it happens; only unexpected exceptions reach the
 * outer boundary, which still returns a complete envelope.
 *
 * Not safe for concurrent calls with the same user id: the session's
 * pending action and suggestion are read at the start of a turn and
 * written back at the end without locking.
 */
class Orchestrator {
public:
    /**
     * @param store External state (users, carts, menu, history, sessions)
     * @param recommender Source of post-add recommendations
     * @param fallback Generative provider for extraction and replies; may be null
     * @param config Limits and timeouts
     * @param logger Optional logger
     */
    Orchestrator(store::StateStore& store,
                 recommendation::Recommender& recommender,
                 llm::FallbackProviderPtr fallback,
                 const Config& config = Config{},
                 LoggerPtr logger = nullptr);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Process one customer message end to end.
     *
     * @param user_id Customer
     * @param text Raw message
     * @return The envelope; success=false only for unexpected failures
     */
    ResponseEnvelope process_message(const store::UserId& user_id, const std::string& text);

    const IntentRouter& router() const { return *router_; }
    const nlp::HybridExtractor& extractor() const { return extractor_; }

    // Injectable for tests; drives suggestion expiry and pending-action timestamps
    void set_clock(std::function<TimePoint()> clock);

    // ------------------------------------------------------------------
    // Pipeline stages (public for direct testing)
    // ------------------------------------------------------------------

    DialogueContext extract(DialogueContext ctx) const;
    DialogueContext load_state(DialogueContext ctx) const;
    DialogueContext clarify_or_route(DialogueContext ctx) const;
    DialogueContext respond(DialogueContext ctx) const;
    DialogueContext persist(DialogueContext ctx) const;

private:
    store::StateStore& store_;
    recommendation::Recommender& recommender_;
    llm::FallbackProviderPtr fallback_;
    Config config_;
    LoggerPtr logger_;

    nlp::HybridExtractor extractor_;
    SuggestionProtocol suggestions_;
    ClarificationEngine clarifier_;
    std::unique_ptr<IntentRouter> router_;

    DialogueContext ask_for_clarification(DialogueContext ctx,
                                          const std::vector<std::string>& missing) const;
    DialogueContext refresh_cart(DialogueContext ctx) const;
    std::string generate_reply(const DialogueContext& ctx) const;

    static ResponseEnvelope make_envelope(const DialogueContext& ctx, bool success);
};

}  // namespace orderbot::dialogue
