#include <orderbot/dialogue/intent_router.hpp>

#include <exception>

namespace orderbot::dialogue {

IntentRouter::IntentRouter(LoggerPtr logger)
    : logger_(logger ? std::move(logger) : make_null_logger()) {}

void IntentRouter::register_handler(HandlerPtr handler) {
    if (handler) {
        handlers_.push_back(std::move(handler));
    }
}

IntentHandler* IntentRouter::route(const DialogueContext& ctx) const {
    for (const auto& handler : handlers_) {
        if (handler->can_handle(ctx)) {
            return handler.get();
        }
    }
    return nullptr;
}

DialogueContext IntentRouter::dispatch(DialogueContext ctx) const {
    IntentHandler* handler = route(ctx);
    if (handler == nullptr) {
        logger_->debug("No handler for intent: " + intent_label(ctx.intent));
        ctx.handler.executed = false;
        ctx.handler.handler_name.clear();
        ctx.handler.result = {
            {"success", false},
            {"error", "No handler for intent: " + intent_label(ctx.intent)},
            {"fallback_to_llm", true}
        };
        return ctx;
    }

    std::string name = handler->name();
    logger_->debug("Dispatching to " + name);

    DialogueContext updated = ctx;
    try {
        updated = handler->execute(std::move(ctx));
    } catch (const std::exception& e) {
        logger_->error("Handler " + name + " failed: " + e.what());
        updated.handler.result = {
            {"success", false},
            {"error", e.what()}
        };
    }

    updated.handler.executed = true;
    updated.handler.handler_name = name;
    return updated;
}

std::vector<std::string> IntentRouter::handler_names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& handler : handlers_) {
        names.push_back(handler->name());
    }
    return names;
}

}  // namespace orderbot::dialogue
