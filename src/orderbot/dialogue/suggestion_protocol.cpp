#include <orderbot/dialogue/suggestion_protocol.hpp>

namespace orderbot::dialogue {

SuggestionProtocol::SuggestionProtocol(std::chrono::seconds ttl)
    : ttl_(ttl)
    , clock_([] { return Clock::now(); }) {}

void SuggestionProtocol::propose(SessionState& session, Intent action,
                                 const Entities& proposed) const {
    PendingSuggestion suggestion;
    suggestion.action = action;
    suggestion.proposed = proposed;
    suggestion.created_at = clock_();

    session.pending_suggestion = suggestion;
    session.state = DialogueState::AWAITING_CONFIRMATION;
}

bool SuggestionProtocol::is_expired(const PendingSuggestion& suggestion) const {
    return clock_() - suggestion.created_at > ttl_;
}

SuggestionClaim SuggestionProtocol::claim(SessionState& session) const {
    SuggestionClaim result;
    if (!session.pending_suggestion) {
        return result;
    }

    PendingSuggestion suggestion = *session.pending_suggestion;
    session.pending_suggestion.reset();
    if (session.state == DialogueState::AWAITING_CONFIRMATION) {
        session.state = DialogueState::IDLE;
    }

    if (is_expired(suggestion)) {
        result.status = SuggestionClaim::Status::EXPIRED;
        return result;
    }

    result.status = SuggestionClaim::Status::ACTIVE;
    result.suggestion = std::move(suggestion);
    return result;
}

bool SuggestionProtocol::reject(SessionState& session) const {
    bool had_suggestion = session.pending_suggestion.has_value();
    session.pending_suggestion.reset();
    if (session.state == DialogueState::AWAITING_CONFIRMATION) {
        session.state = DialogueState::IDLE;
    }
    return had_suggestion;
}

}  // namespace orderbot::dialogue
