#pragma once

#include <orderbot/dialogue/context.hpp>

#include <optional>
#include <string>
#include <vector>

namespace orderbot::dialogue {

/**
 * How the reply for a turn is produced.
 */
enum class ReplyMode {
    PRESET,                 // Reply already set (clarification or suggestion)
    STRUCTURED_CHECKOUT,    // Built only from the checkout result
    HANDLER_MESSAGE,        // Handler's own message, summary or error
    GENERATIVE              // Fallback provider, degrading to HANDLER_MESSAGE
};

const char* reply_mode_name(ReplyMode mode);

/**
 * Decision table for reply generation.
 *
 * view_cart, clear_cart, browse_menu, checkout, confirmation, rejection
 * and track_order are deterministic: their replies come from handler
 * data and never from the generative provider. A successful checkout is
 * always rendered from the structured result so totals cannot drift.
 */
class ResponsePolicy {
public:
    static constexpr const char* GENERIC_HELP =
        "I understand your message, but I need more specific menu commands. "
        "Try: 'add [item] [size]', 'show cart', or 'checkout'";

    static constexpr const char* GENERIC_APOLOGY =
        "Sorry, something went wrong on my side. Please try again.";

    static bool is_deterministic(const std::optional<Intent>& intent);

    /**
     * @param ctx Context after routing
     * @param generator_available Whether a reply generator is configured
     */
    static ReplyMode select_mode(const DialogueContext& ctx, bool generator_available);

    /**
     * "✅ Order placed successfully!" followed by one line per item,
     * the total and the order id, taken verbatim from a checkout result.
     */
    static std::string format_checkout(const json& result);

    /**
     * Reply from handler data: message, then summary, then error. Turns
     * no handler took get a fixed per-intent text.
     */
    static std::string handler_reply(const DialogueContext& ctx);

    /**
     * Prompt context for the reply generator: bounded history, the
     * handler result injected verbatim as authoritative data, the cart.
     */
    static std::string build_context_blob(const DialogueContext& ctx, size_t history_window);

    // True after a successful add (single, batch or confirmed suggestion)
    static bool wants_recommendations(const DialogueContext& ctx);

    // Next commands to offer, keyed by intent and outcome
    static std::vector<std::string> suggested_actions(const DialogueContext& ctx);
};

}  // namespace orderbot::dialogue
