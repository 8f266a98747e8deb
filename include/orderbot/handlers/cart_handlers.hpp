#pragma once

#include <orderbot/dialogue/intent_handler.hpp>
#include <orderbot/handlers/handler_services.hpp>
#include <orderbot/handlers/item_validator.hpp>

namespace orderbot::handlers {

/**
 * Adds every item of a multi-item request ("1 fries 2 cola").
 * Each item is validated on its own; one bad item does not stop the rest.
 */
class BatchAddItemHandler : public dialogue::IntentHandler {
public:
    explicit BatchAddItemHandler(HandlerServices services);

    std::string name() const override { return "batch_add_item"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
    ItemValidator validator_;
};

/**
 * Adds a single item. When the name matches nothing but similar items
 * exist, proposes the closest one and asks for a yes/no answer.
 */
class AddItemHandler : public dialogue::IntentHandler {
public:
    explicit AddItemHandler(HandlerServices services);

    std::string name() const override { return "add_item"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
    ItemValidator validator_;

    dialogue::DialogueContext propose_alternative(dialogue::DialogueContext ctx,
                                                  const ValidationOutcome& outcome,
                                                  const std::string& requested,
                                                  int quantity);
};

/**
 * Removes a cart line, or reduces it when a quantity is given
 * ("remove 2 cola").
 */
class RemoveItemHandler : public dialogue::IntentHandler {
public:
    explicit RemoveItemHandler(HandlerServices services);

    std::string name() const override { return "remove_item"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
};

class ViewCartHandler : public dialogue::IntentHandler {
public:
    explicit ViewCartHandler(HandlerServices services);

    std::string name() const override { return "view_cart"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
};

class ClearCartHandler : public dialogue::IntentHandler {
public:
    explicit ClearCartHandler(HandlerServices services);

    std::string name() const override { return "clear_cart"; }
    bool can_handle(const dialogue::DialogueContext& ctx) const override;
    dialogue::DialogueContext execute(dialogue::DialogueContext ctx) override;

private:
    HandlerServices services_;
};

}  // namespace orderbot::handlers
