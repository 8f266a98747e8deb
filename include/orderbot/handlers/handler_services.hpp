#pragma once

#include <orderbot/dialogue/suggestion_protocol.hpp>
#include <orderbot/store/state_store.hpp>
#include <orderbot/util/logger.hpp>

#include <string>

namespace orderbot::handlers {

/**
 * Collaborators shared by every handler. The referenced objects must
 * outlive the handlers built from them.
 */
struct HandlerServices {
    store::StateStore& store;
    const dialogue::SuggestionProtocol& suggestions;
    LoggerPtr logger;
};

// {"success": false, "error": message}
inline json failed_result(const std::string& message) {
    return {{"success", false}, {"error", message}};
}

}  // namespace orderbot::handlers
