#pragma once

#include <orderbot/dialogue/intent_handler.hpp>
#include <orderbot/util/logger.hpp>

#include <vector>

namespace orderbot::dialogue {

/**
 * Ordered registry of handlers. route() returns the first handler whose
 * predicate accepts the context; registration order is the priority.
 *
 * The batch handler must be registered before the single-item add
 * handler: a batch context also satisfies the single-item predicate.
 */
class IntentRouter {
public:
    explicit IntentRouter(LoggerPtr logger = nullptr);

    // Append a handler at the lowest priority
    void register_handler(HandlerPtr handler);

    // First capable handler, or nullptr
    IntentHandler* route(const DialogueContext& ctx) const;

    /**
     * Execute the first capable handler.
     *
     * Sets handler.executed and handler.handler_name. With no capable
     * handler, executed stays false and the result is
     * {"success": false, "error": "No handler for intent: ...",
     *  "fallback_to_llm": true}. A std::exception escaping a handler
     * becomes {"success": false, "error": what()}.
     */
    DialogueContext dispatch(DialogueContext ctx) const;

    size_t size() const { return handlers_.size(); }

    // Handler names in priority order
    std::vector<std::string> handler_names() const;

private:
    std::vector<HandlerPtr> handlers_;
    LoggerPtr logger_;
};

}  // namespace orderbot::dialogue
