#include "say_command.hpp"

#include <orderbot/util/text.hpp>

namespace orderbot::cli {

void SayCommand::setup(CLI::App& app) {
    app.add_option("message", words_, "Message text")
        ->required()
        ->type_name("<text>");

    app.add_flag("--json", json_, "Print the full response envelope as JSON");
}

int SayCommand::execute(CommandContext& ctx) {
    std::string message = text::join(words_, " ");
    auto envelope = ctx.orchestrator->process_message(ctx.user_id, message);

    if (json_) {
        std::cout << envelope.to_json().dump(2) << "\n";
    } else {
        std::cout << envelope.reply << "\n";
        if (ctx.verbose) {
            std::cout << "[" << intent_label(envelope.intent) << " via "
                      << source_name(envelope.source) << "]\n";
        }
    }

    int saved = save_state(ctx);
    if (saved != ORDERBOT_EXIT_SUCCESS) {
        return saved;
    }
    return envelope.success ? ORDERBOT_EXIT_SUCCESS : ORDERBOT_EXIT_INTERNAL;
}

}  // namespace orderbot::cli
