#pragma once

#include <orderbot/types.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace orderbot::dialogue {

/**
 * Result of looking up the pending suggestion on a confirmation turn.
 */
struct SuggestionClaim {
    enum class Status {
        NONE,       // Nothing was proposed
        EXPIRED,    // Proposed too long ago; it has been cleared
        ACTIVE      // Still valid; it has been cleared and handed back
    };

    Status status = Status::NONE;
    std::optional<PendingSuggestion> suggestion;
};

/**
 * Single proposed action awaiting a yes/no answer.
 *
 * A suggestion lives in the caller's SessionState. Expiry is checked
 * lazily when the suggestion is claimed, never in the background.
 * Claiming always clears the suggestion, so it resolves at most once.
 */
class SuggestionProtocol {
public:
    explicit SuggestionProtocol(std::chrono::seconds ttl = std::chrono::seconds(300));

    /**
     * Store a proposal, replacing any previous one, and move the
     * dialogue into awaiting_confirmation.
     */
    void propose(SessionState& session, Intent action, const Entities& proposed) const;

    // Take the suggestion for a confirmation turn
    SuggestionClaim claim(SessionState& session) const;

    /**
     * Clear the suggestion for a rejection turn.
     *
     * @return true if one was pending
     */
    bool reject(SessionState& session) const;

    bool is_expired(const PendingSuggestion& suggestion) const;

    std::chrono::seconds ttl() const { return ttl_; }

    // Injectable for tests
    void set_clock(std::function<TimePoint()> clock) { clock_ = std::move(clock); }

private:
    std::chrono::seconds ttl_;
    std::function<TimePoint()> clock_;
};

}  // namespace orderbot::dialogue
