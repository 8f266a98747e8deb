#include "commands/chat_command.hpp"
#include "commands/command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/menu_command.hpp"
#include "commands/say_command.hpp"

#include <orderbot/orderbot.hpp>

#ifdef ORDERBOT_ENABLE_LLM
#include <orderbot/llm/ollama_provider.hpp>
#endif

#include <exception>
#include <iostream>
#include <memory>
#include <vector>

using namespace orderbot;
using namespace orderbot::cli;

namespace {

// Generative fallback, or nullptr when disabled or unreachable
llm::FallbackProviderPtr make_fallback(bool disabled, const LoggerPtr& logger) {
    if (disabled) {
        return nullptr;
    }
#ifdef ORDERBOT_ENABLE_LLM
    auto provider = llm::OllamaProvider::create_from_env();
    if (!provider.ok()) {
        if (provider.error().is_transient()) {
            logger->warning("Generative provider unreachable, using patterns only: " +
                            provider.error().to_string());
        } else {
            logger->error("Generative provider misconfigured, using patterns only: " +
                          provider.error().to_string());
        }
        return nullptr;
    }
    logger->info("Generative provider: " + provider.value()->info().describe());
    return std::make_shared<llm::LLMFallbackProvider>(std::move(provider.value()), logger);
#else
    logger->debug("Built without generative provider support");
    return nullptr;
#endif
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"orderbot - natural-language ordering assistant"};
    app.require_subcommand(1);

    std::string user_id = "guest";
    std::string menu_path;
    std::string state_path;
    bool no_llm = false;
    bool verbose = false;

    app.add_option("-u,--user", user_id, "User id for the conversation");
    app.add_option("--menu", menu_path, "Menu JSON file (default: built-in menu)");
    app.add_option("--state", state_path, "State JSON file for carts, orders and history");
    app.add_flag("--no-llm", no_llm, "Disable the generative provider");
    app.add_flag("-v,--verbose", verbose, "Verbose logging");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<ChatCommand>());
    commands.push_back(std::make_unique<SayCommand>());
    commands.push_back(std::make_unique<MenuCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? ORDERBOT_EXIT_SUCCESS : ORDERBOT_EXIT_USER_ERROR;
    }

    Config config = Config::from_env();
    if (!menu_path.empty()) config.menu_path = menu_path;
    if (!state_path.empty()) config.state_path = state_path;
    if (verbose) config.verbose = true;

    LoggerPtr logger = make_console_logger("orderbot", config.effective_log_level());

    try {
        auto opened = store::MemoryStore::open(config, logger);
        if (!opened.ok()) {
            std::cerr << "Error: " << opened.error().to_string() << "\n";
            return ORDERBOT_EXIT_IO_ERROR;
        }
        std::unique_ptr<store::MemoryStore> store = std::move(opened.value());

        recommendation::MenuRecommender recommender(*store);
        dialogue::Orchestrator orchestrator(*store, recommender,
                                            make_fallback(no_llm, logger), config, logger);

        CommandContext ctx;
        ctx.store = store.get();
        ctx.orchestrator = &orchestrator;
        ctx.user_id = user_id;
        ctx.verbose = config.verbose;

        for (auto& [sub, command] : subcommands) {
            if (sub->parsed()) {
                return command->execute(ctx);
            }
        }
        return ORDERBOT_EXIT_USER_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return ORDERBOT_EXIT_INTERNAL;
    }
}
