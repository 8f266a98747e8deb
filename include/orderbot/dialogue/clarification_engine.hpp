#pragma once

#include <orderbot/nlp/pattern_matcher.hpp>
#include <orderbot/store/state_store.hpp>
#include <orderbot/types.hpp>
#include <orderbot/util/logger.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace orderbot::dialogue {

struct ClarificationCheck {
    bool needed = false;
    std::vector<std::string> missing;
};

/**
 * Outcome of feeding a new turn to an outstanding PendingAction.
 */
struct PendingResolution {
    enum class Status {
        NONE,           // No pending action
        RESOLVED,       // All fields now known; intent/entities hold the full action
        STILL_MISSING,  // Asked again; missing lists what is still absent
        ABANDONED,      // Too many attempts; the pending action was dropped
        DISCARDED       // The user moved on to a different intent
    };

    Status status = Status::NONE;
    Intent intent = Intent::ADD_ITEM;
    Entities entities;
    std::vector<std::string> missing;
};

/**
 * Decides whether an intent has what it needs to run, writes follow-up
 * questions, and tracks at most one incomplete action per user inside
 * the caller's SessionState.
 */
class ClarificationEngine {
public:
    ClarificationEngine(store::StateStore& store,
                        const nlp::PatternMatcher& matcher,
                        int max_attempts = 3,
                        LoggerPtr logger = nullptr);

    /**
     * Fields an intent needs. add_item needs {item} for simple additions
     * (fries, drinks, water) and {item, size} for everything else.
     */
    std::vector<std::string> required_fields(Intent intent, const Entities& entities) const;

    /**
     * Compare required fields with the present, non-empty entities.
     * Returns (false, []) exactly when nothing is missing.
     */
    ClarificationCheck needs_clarification(Intent intent, const Entities& entities) const;

    /**
     * Write the follow-up question for the first thing that is missing.
     *
     * @param cart Current cart, used when asking what to remove
     */
    std::string generate_question(Intent intent, const Entities& entities,
                                  const std::vector<std::string>& missing,
                                  const std::string& language,
                                  const store::Cart& cart) const;

    /**
     * Record a new pending action, replacing any previous one, and move
     * the dialogue into the matching awaiting state.
     */
    void start_pending_action(SessionState& session, Intent intent, const Entities& entities,
                              const std::vector<std::string>& missing) const;

    // Drop any pending action and return to IDLE
    void discard_pending_action(SessionState& session) const;

    /**
     * Try to complete the pending action with this turn.
     *
     * The turn continues the action when it has no intent or the same
     * intent. Missing values are read from the reply text and from the
     * new entities, then merged into the partial data.
     */
    PendingResolution resolve_pending_action(SessionState& session,
                                             const std::optional<Intent>& intent,
                                             const Entities& entities,
                                             const std::string& message,
                                             const std::string& language) const;

    /**
     * Read values for the missing fields out of a short reply such as
     * "large", "3" or "order 42".
     */
    Entities extract_from_reply(const std::string& message,
                                const std::vector<std::string>& missing,
                                const std::string& language) const;

    // Injectable for tests
    void set_clock(std::function<TimePoint()> clock) { clock_ = std::move(clock); }

private:
    store::StateStore& store_;
    const nlp::PatternMatcher& matcher_;
    int max_attempts_;
    LoggerPtr logger_;
    std::function<TimePoint()> clock_;

    std::optional<store::MenuItem> resolve_menu_item(const std::string& name) const;
};

// Dialogue state that waits for the given missing field
DialogueState awaiting_state_for(const std::string& field);

}  // namespace orderbot::dialogue
