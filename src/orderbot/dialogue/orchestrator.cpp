#include <orderbot/dialogue/orchestrator.hpp>
#include <orderbot/dialogue/response_policy.hpp>
#include <orderbot/handlers/registry.hpp>
#include <orderbot/util/text.hpp>

#include <exception>

namespace orderbot::dialogue {

namespace {

constexpr const char* ABANDONED_REPLY =
    "Sorry, I couldn't get the details. Let's start again: what would you like to do?";

// Intents whose handlers change the cart
bool mutates_cart(const DialogueContext& ctx) {
    if (ctx.is_batch()) return true;
    if (!ctx.intent) return false;
    switch (*ctx.intent) {
        case Intent::ADD_ITEM:
        case Intent::REMOVE_ITEM:
        case Intent::CONFIRMATION:
        case Intent::CLEAR_CART:
        case Intent::NEW_ORDER:
            return true;
        default:
            return false;
    }
}

}  // namespace

// ============================================================================
// ResponseEnvelope
// ============================================================================

json ResponseEnvelope::to_json() const {
    json recs = json::array();
    for (const auto& rec : recommendations) {
        recs.push_back(rec.to_json());
    }

    return {
        {"success", success},
        {"user_message", user_message},
        {"bot_response", reply},
        {"intent", intent ? json(intent_name(*intent)) : json(nullptr)},
        {"nlp_source", source_name(source)},
        {"confidence", confidence},
        {"handler_executed", handler_executed},
        {"handler_name", handler_name},
        {"handler_result", handler_result},
        {"cart", cart.to_json()},
        {"recommendations", recs},
        {"suggested_actions", suggested_actions},
        {"clarification_needed", clarification_needed},
        {"clarification_question", clarification_question},
        {"metadata", metadata}
    };
}

// ============================================================================
// Orchestrator
// ============================================================================

Orchestrator::Orchestrator(store::StateStore& store,
                           recommendation::Recommender& recommender,
                           llm::FallbackProviderPtr fallback,
                           const Config& config,
                           LoggerPtr logger)
    : store_(store)
    , recommender_(recommender)
    , fallback_(std::move(fallback))
    , config_(config)
    , logger_(logger ? std::move(logger) : make_null_logger())
    , extractor_(fallback_, logger_)
    , suggestions_(config.suggestion_ttl)
    , clarifier_(store, extractor_.matcher(), config.max_clarification_attempts, logger_)
    , router_(handlers::create_default_router({store, suggestions_, logger_})) {}

void Orchestrator::set_clock(std::function<TimePoint()> clock) {
    suggestions_.set_clock(clock);
    clarifier_.set_clock(std::move(clock));
}

ResponseEnvelope Orchestrator::process_message(const store::UserId& user_id,
                                               const std::string& text) {
    DialogueContext ctx(user_id, text);
    try {
        ctx = extract(ctx);
        ctx = load_state(ctx);
        ctx = clarify_or_route(ctx);
        ctx = respond(ctx);
        ctx = persist(ctx);
        return make_envelope(ctx, true);
    } catch (const std::exception& e) {
        logger_->error("Failed to process message for " + user_id + ": " + e.what());
        ctx.reply = ResponsePolicy::GENERIC_APOLOGY;
        ctx.response_data = {{"error", e.what()}};
        return make_envelope(ctx, false);
    }
}

DialogueContext Orchestrator::extract(DialogueContext ctx) const {
    ctx.apply_extraction(extractor_.extract(ctx.message));
    logger_->debug("Extracted " + intent_label(ctx.intent) + " via " + source_name(ctx.source));
    return ctx;
}

DialogueContext Orchestrator::load_state(DialogueContext ctx) const {
    auto user = store_.get_user(ctx.user_id);
    if (user.ok()) {
        ctx.user = std::move(user.value());
    } else {
        logger_->warning("User lookup failed: " + user.error().to_string());
    }

    auto cart = store_.get_cart(ctx.user_id);
    if (cart.ok()) {
        ctx.cart = std::move(cart.value());
    } else {
        logger_->warning("Cart lookup failed: " + cart.error().to_string());
    }

    auto history = store_.get_history(ctx.user_id, config_.history_limit);
    if (history.ok()) {
        ctx.history = std::move(history.value());
    } else {
        logger_->warning("History lookup failed: " + history.error().to_string());
    }

    auto session = store_.load_session(ctx.user_id);
    if (session.ok()) {
        ctx.session = std::move(session.value());
    } else {
        logger_->warning("Session lookup failed: " + session.error().to_string());
    }
    return ctx;
}

DialogueContext Orchestrator::clarify_or_route(DialogueContext ctx) const {
    // Batches skip clarification and drop any open question; each item is
    // validated by the batch handler
    if (ctx.is_batch() && ctx.session.pending_action) {
        clarifier_.discard_pending_action(ctx.session);
    }
    if (!ctx.is_batch()) {
        bool resolved = false;
        if (ctx.session.pending_action) {
            PendingResolution resolution = clarifier_.resolve_pending_action(
                ctx.session, ctx.intent, ctx.entities, ctx.message, ctx.language);

            switch (resolution.status) {
                case PendingResolution::Status::RESOLVED:
                    logger_->debug(std::string("Pending ") + intent_name(resolution.intent) + " resolved");
                    ctx.intent = resolution.intent;
                    ctx.entities = resolution.entities;
                    resolved = true;
                    break;

                case PendingResolution::Status::STILL_MISSING:
                    ctx.intent = resolution.intent;
                    ctx.entities = resolution.entities;
                    return ask_for_clarification(std::move(ctx), resolution.missing);

                case PendingResolution::Status::ABANDONED:
                    ctx.intent = resolution.intent;
                    ctx.handler.executed = false;
                    ctx.handler.result = {
                        {"success", false},
                        {"error", "Clarification abandoned"}
                    };
                    ctx.reply = ABANDONED_REPLY;
                    return ctx;

                case PendingResolution::Status::DISCARDED:
                case PendingResolution::Status::NONE:
                    break;
            }
        }

        if (!resolved && ctx.intent) {
            ClarificationCheck check = clarifier_.needs_clarification(*ctx.intent, ctx.entities);
            if (check.needed) {
                clarifier_.start_pending_action(ctx.session, *ctx.intent, ctx.entities, check.missing);
                return ask_for_clarification(std::move(ctx), check.missing);
            }
        }
    }

    ctx = router_->dispatch(std::move(ctx));
    if (ctx.handler.executed) {
        logger_->debug("Handled by " + ctx.handler.handler_name);
    }

    if (mutates_cart(ctx)) {
        ctx = refresh_cart(std::move(ctx));
    }
    return ctx;
}

DialogueContext Orchestrator::ask_for_clarification(DialogueContext ctx,
                                                    const std::vector<std::string>& missing) const {
    std::string question = clarifier_.generate_question(*ctx.intent, ctx.entities, missing,
                                                        ctx.language, ctx.cart);
    logger_->debug("Clarification needed for " + intent_label(ctx.intent) + ": " +
                   text::join(missing, ", "));

    ctx.clarification_needed = true;
    ctx.clarification_question = question;
    ctx.missing_fields = missing;
    ctx.reply = question;
    ctx.handler.executed = false;
    ctx.handler.handler_name.clear();
    ctx.handler.result = {
        {"success", false},
        {"clarification_needed", true},
        {"missing_fields", missing},
        {"question", question}
    };
    return ctx;
}

DialogueContext Orchestrator::refresh_cart(DialogueContext ctx) const {
    auto cart = store_.get_cart(ctx.user_id);
    if (cart.ok()) {
        ctx.cart = std::move(cart.value());
        logger_->debug("Cart refreshed: " + std::to_string(ctx.cart.item_count()) + " items");
    } else {
        logger_->warning("Cart refresh failed: " + cart.error().to_string());
    }
    return ctx;
}

std::string Orchestrator::generate_reply(const DialogueContext& ctx) const {
    std::string blob = ResponsePolicy::build_context_blob(ctx, config_.prompt_history);
    try {
        auto reply = fallback_->generate_reply(ctx.message, blob, ctx.language);
        if (reply.ok() && !text::trim(reply.value()).empty()) {
            return text::trim(reply.value());
        }
        if (!reply.ok()) {
            logger_->warning("Reply generation failed: " + reply.error().to_string());
        }
    } catch (const std::exception& e) {
        logger_->warning(std::string("Reply generation threw: ") + e.what());
    }
    return ResponsePolicy::handler_reply(ctx);
}

DialogueContext Orchestrator::respond(DialogueContext ctx) const {
    ReplyMode mode = ResponsePolicy::select_mode(ctx, fallback_ != nullptr);
    logger_->debug(std::string("Reply mode: ") + reply_mode_name(mode));

    switch (mode) {
        case ReplyMode::PRESET:
            break;
        case ReplyMode::STRUCTURED_CHECKOUT:
            ctx.reply = ResponsePolicy::format_checkout(ctx.handler.result);
            break;
        case ReplyMode::HANDLER_MESSAGE:
            ctx.reply = ResponsePolicy::handler_reply(ctx);
            break;
        case ReplyMode::GENERATIVE:
            ctx.reply = generate_reply(ctx);
            break;
    }

    if (ResponsePolicy::wants_recommendations(ctx)) {
        auto recs = recommender_.get_recommendations(ctx.user_id, ctx.cart,
                                                     config_.max_recommendations);
        if (!recs.ok()) {
            logger_->warning("Recommendations failed: " + recs.error().to_string());
        } else if (!recs.value().empty()) {
            ctx.recommendations = std::move(recs.value());
            std::string rec_text = recommender_.format_recommendations_text(ctx.recommendations,
                                                                            ctx.language);
            ctx.reply = ctx.reply.empty() ? rec_text : ctx.reply + "\n\n" + rec_text;
        }
    }

    ctx.suggested_actions = ResponsePolicy::suggested_actions(ctx);
    return ctx;
}

DialogueContext Orchestrator::persist(DialogueContext ctx) const {
    auto user_entry = store_.append_history(ctx.user_id, "user", ctx.message, {
        {"intent", intent_label(ctx.intent)},
        {"nlp_source", source_name(ctx.source)}
    });
    if (!user_entry.ok()) {
        logger_->error("Failed to save user message: " + user_entry.error().to_string());
    }

    auto bot_entry = store_.append_history(ctx.user_id, "bot", ctx.reply, {
        {"handler", ctx.handler.handler_name},
        {"handler_executed", ctx.handler.executed}
    });
    if (!bot_entry.ok()) {
        logger_->error("Failed to save bot reply: " + bot_entry.error().to_string());
    }

    auto saved = store_.save_session(ctx.user_id, ctx.session);
    if (!saved.ok()) {
        logger_->error("Failed to save session: " + saved.error().to_string());
    }
    return ctx;
}

ResponseEnvelope Orchestrator::make_envelope(const DialogueContext& ctx, bool success) {
    ResponseEnvelope envelope;
    envelope.success = success;
    envelope.user_message = ctx.message;
    envelope.reply = ctx.reply;
    envelope.intent = ctx.intent;
    envelope.source = ctx.source;
    envelope.confidence = ctx.confidence;
    envelope.handler_executed = ctx.handler.executed;
    envelope.handler_name = ctx.handler.handler_name;
    envelope.handler_result = ctx.handler.result;
    envelope.cart = ctx.cart;
    envelope.recommendations = ctx.recommendations;
    envelope.suggested_actions = ctx.suggested_actions;
    envelope.clarification_needed = ctx.clarification_needed;
    envelope.clarification_question = ctx.clarification_question;
    envelope.metadata = ctx.to_json();
    return envelope;
}

}  // namespace orderbot::dialogue
