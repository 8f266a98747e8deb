#pragma once

#include <orderbot/dialogue/context.hpp>

#include <memory>
#include <string>

namespace orderbot::dialogue {

/**
 * A capability-gated unit that executes one concrete intent against
 * external state.
 *
 * Implementations report validation failures as
 * {"success": false, "error": ...} in the returned context's
 * handler.result and do not throw for expected failures.
 */
class IntentHandler {
public:
    virtual ~IntentHandler() = default;

    // Stable identifier reported in envelopes and history
    virtual std::string name() const = 0;

    /**
     * Capability predicate. Must only read the context.
     */
    virtual bool can_handle(const DialogueContext& ctx) const = 0;

    /**
     * Run the intent.
     *
     * @param ctx Turn context (by value)
     * @return The updated context with handler.result filled in
     */
    virtual DialogueContext execute(DialogueContext ctx) = 0;
};

using HandlerPtr = std::unique_ptr<IntentHandler>;

}  // namespace orderbot::dialogue
