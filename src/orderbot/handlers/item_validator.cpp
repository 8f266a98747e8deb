#include <orderbot/handlers/item_validator.hpp>
#include <orderbot/util/text.hpp>

namespace orderbot::handlers {

const char* validation_status_name(ValidationOutcome::Status status) {
    switch (status) {
        case ValidationOutcome::Status::FOUND: return "found";
        case ValidationOutcome::Status::NOT_FOUND: return "not_found";
        case ValidationOutcome::Status::SIMILAR_FOUND: return "similar_found";
        case ValidationOutcome::Status::OUT_OF_STOCK: return "out_of_stock";
        case ValidationOutcome::Status::SIZE_UNAVAILABLE: return "size_unavailable";
        case ValidationOutcome::Status::INVALID_SIZE: return "invalid_size";
        case ValidationOutcome::Status::NO_SIZES: return "no_sizes";
    }
    return "unknown";
}

ItemValidator::ItemValidator(store::StateStore& store) : store_(store) {}

Result<ValidationOutcome> ItemValidator::validate(const std::string& item_name,
                                                  const std::optional<std::string>& size) const {
    using Status = ValidationOutcome::Status;
    ValidationOutcome outcome;

    std::string query = text::trim(item_name);
    if (query.empty()) {
        outcome.status = Status::NOT_FOUND;
        outcome.message = "Item name cannot be empty";
        return outcome;
    }

    auto found = store_.get_menu_item(query, true);
    if (!found.ok() && found.error_code() == ErrorCode::NOT_FOUND) {
        found = store_.get_menu_item(query, false);
    }

    if (!found.ok()) {
        if (found.error_code() != ErrorCode::NOT_FOUND) {
            return found.error();
        }

        auto similar = store_.search_menu(query);
        if (!similar.ok()) {
            return similar.error();
        }
        if (similar.value().empty()) {
            outcome.status = Status::NOT_FOUND;
            outcome.message = "'" + query + "' not found in menu";
            return outcome;
        }

        std::vector<std::string> names;
        for (const auto& candidate : similar.value()) {
            if (names.size() == MAX_SUGGESTIONS) break;
            names.push_back(candidate.name);
        }
        outcome.status = Status::SIMILAR_FOUND;
        outcome.similar = std::move(similar.value());
        outcome.message = "'" + query + "' not found. Did you mean: " + text::join(names, ", ") + "?";
        return outcome;
    }

    const store::MenuItem& item = found.value();
    outcome.item = item;

    if (!item.available) {
        outcome.status = Status::OUT_OF_STOCK;
        outcome.message = item.name + " is currently out of stock";
        return outcome;
    }

    auto available = item.available_sizes();
    std::string requested = size ? text::trim(*size) : "";

    if (requested.empty()) {
        if (available.empty()) {
            outcome.status = Status::NO_SIZES;
            outcome.message = item.name + " has no available sizes";
            return outcome;
        }
        outcome.status = Status::FOUND;
        outcome.size = available.front().code;
        outcome.price = available.front().price;
        outcome.message = item.name + " (" + outcome.size + ") is available";
        return outcome;
    }

    const store::MenuSize* menu_size = item.find_size(normalize_size_code(requested));
    if (menu_size == nullptr) {
        std::vector<std::string> codes;
        for (const auto& s : item.sizes) {
            codes.push_back(s.code);
        }
        outcome.status = Status::INVALID_SIZE;
        outcome.message = "Size " + requested + " not available. Try: " + text::join(codes, ", ");
        return outcome;
    }

    if (!menu_size->available) {
        outcome.status = Status::SIZE_UNAVAILABLE;
        outcome.message = menu_size->code + " size for " + item.name + " is currently unavailable";
        return outcome;
    }

    outcome.status = Status::FOUND;
    outcome.size = menu_size->code;
    outcome.price = menu_size->price;
    outcome.message = item.name + " (" + outcome.size + ") is available";
    return outcome;
}

}  // namespace orderbot::handlers
