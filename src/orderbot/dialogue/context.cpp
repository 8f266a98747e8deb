#include <orderbot/dialogue/context.hpp>

namespace orderbot::dialogue {

bool HandlerOutcome::succeeded() const {
    return result.is_object() && result.value("success", false);
}

void DialogueContext::apply_extraction(const ExtractionResult& extraction) {
    language = extraction.language;
    intent = extraction.intent;
    entities = extraction.entities;
    batch_items = extraction.batch_items;
    source = extraction.source;
    confidence = extraction.confidence;
}

std::string DialogueContext::history_text(size_t max_entries) const {
    size_t start = history.size() > max_entries ? history.size() - max_entries : 0;

    std::string out;
    for (size_t i = start; i < history.size(); ++i) {
        const auto& entry = history[i];
        out += (entry.role == "user" ? "User: " : "Bot: ") + entry.text + "\n";
    }
    return out;
}

json DialogueContext::to_json() const {
    json batch = json::array();
    for (const auto& item : batch_items) {
        batch.push_back(item.to_json());
    }

    json recs = json::array();
    for (const auto& rec : recommendations) {
        recs.push_back(rec.to_json());
    }

    return {
        {"user_id", user_id},
        {"message", message},
        {"language", language},
        {"intent", intent ? json(intent_name(*intent)) : json(nullptr)},
        {"entities", entities.to_json()},
        {"batch_items", batch},
        {"source", source_name(source)},
        {"confidence", confidence},
        {"dialogue_state", dialogue_state_name(session.state)},
        {"session", session.to_json()},
        {"history_length", history.size()},
        {"handler_executed", handler.executed},
        {"handler_name", handler.handler_name},
        {"handler_result", handler.result},
        {"response_data", response_data},
        {"clarification_needed", clarification_needed},
        {"missing_fields", missing_fields},
        {"recommendations", recs},
        {"suggested_actions", suggested_actions}
    };
}

}  // namespace orderbot::dialogue
