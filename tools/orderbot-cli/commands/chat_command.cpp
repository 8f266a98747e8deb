#include "chat_command.hpp"

#include <orderbot/util/text.hpp>

namespace orderbot::cli {

void ChatCommand::setup(CLI::App& app) {
    app.add_flag("--suggestions", show_suggestions_, "Show suggested next commands after each reply");
}

int ChatCommand::execute(CommandContext& ctx) {
    std::cout << "Chatting as " << ctx.user_id << ". Type 'exit' to quit.\n";

    std::string line;
    while (true) {
        std::cout << "you> " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        std::string message = text::trim(line);
        if (message.empty()) continue;
        if (message == "exit" || message == "quit") break;

        auto envelope = ctx.orchestrator->process_message(ctx.user_id, message);
        std::cout << "bot> " << envelope.reply << "\n";

        if (show_suggestions_ && !envelope.suggested_actions.empty()) {
            std::cout << "     (try: " << text::join(envelope.suggested_actions, " | ") << ")\n";
        }

        int saved = save_state(ctx);
        if (saved != ORDERBOT_EXIT_SUCCESS) {
            return saved;
        }
    }

    return ORDERBOT_EXIT_SUCCESS;
}

}  // namespace orderbot::cli
