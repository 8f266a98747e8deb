#pragma once

#include <orderbot/recommendation/recommender.hpp>
#include <orderbot/store/models.hpp>
#include <orderbot/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace orderbot::dialogue {

/**
 * What the router did with a turn.
 */
struct HandlerOutcome {
    bool executed = false;
    std::string handler_name;
    json result = json::object();

    // True when result carries "success": true
    bool succeeded() const;
};

/**
 * Per-turn record threaded through every pipeline stage.
 *
 * Created for one message and discarded after the turn; only history,
 * the session state and store mutations outlive it. Stages take it by
 * value and return the updated value.
 */
struct DialogueContext {
    // Inbound
    store::UserId user_id;
    std::string message;

    // Extraction
    std::string language = "en";
    std::optional<Intent> intent;
    Entities entities;
    std::vector<BatchItem> batch_items;
    ExtractionSource source = ExtractionSource::NONE;
    double confidence = 0.0;

    // Loaded from the store
    std::optional<store::UserProfile> user;
    store::Cart cart;
    std::vector<store::HistoryEntry> history;
    SessionState session;

    // Routing and reply
    HandlerOutcome handler;
    std::string reply;
    json response_data = json::object();
    bool clarification_needed = false;
    std::string clarification_question;
    std::vector<std::string> missing_fields;
    std::vector<recommendation::Recommendation> recommendations;
    std::vector<std::string> suggested_actions;

    DialogueContext() = default;
    DialogueContext(store::UserId user, std::string text)
        : user_id(std::move(user)), message(std::move(text)) {}

    /**
     * Replace the extraction fields wholesale. Entities are never merged
     * here; pending-action resolution is the only place that merges.
     */
    void apply_extraction(const ExtractionResult& extraction);

    bool has_reply() const { return !reply.empty(); }
    bool is_batch() const { return batch_items.size() >= 2; }

    /**
     * Render the last max_entries history lines as "User: ..." / "Bot: ...".
     */
    std::string history_text(size_t max_entries = 10) const;

    json to_json() const;
};

}  // namespace orderbot::dialogue
