#pragma once

#include <orderbot/dialogue/intent_handler.hpp>
#include <orderbot/handlers/handler_services.hpp>

namespace orderbot::handlers {

/**
 * "yes" to a pending suggestion: carries out the proposed action.
 */
class ConfirmationHandler : public dialogue::IntentHandler {
public:
    explicit ConfirmationHandler(HandlerServices services);

    std::string name() const override { return "confirmation"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;

    dialogue::DialogueContext confirm_add_item(dialogue::DialogueContext ctx,
                                               const PendingSuggestion& suggestion);
};

// "no": drops any pending suggestion
class RejectionHandler : public dialogue::IntentHandler {
public:
    explicit RejectionHandler(HandlerServices services);

    std::string name() const override { return "rejection"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
};

class WelcomeHandler : public dialogue::IntentHandler {
public:
    explicit WelcomeHandler(HandlerServices services);

    std::string name() const override { return "welcome"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
};

/**
 * Starts over: empties the cart and drops pending actions and suggestions.
 */
class NewOrderHandler : public dialogue::IntentHandler {
public:
    explicit NewOrderHandler(HandlerServices services);

    std::string name() const override { return "new_order"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
};

}  // namespace orderbot::handlers
