#pragma once

#include "exit_codes.hpp"

#include <orderbot/orderbot.hpp>
#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

namespace orderbot::cli {

// Everything a subcommand needs once global options are applied
struct CommandContext {
    store::MemoryStore* store = nullptr;
    dialogue::Orchestrator* orchestrator = nullptr;
    store::UserId user_id = "guest";
    bool verbose = false;
};

/**
 * One `orderbot` subcommand. main() registers each command's options
 * with setup() and runs execute() on the one that was parsed.
 */
class Command {
public:
    virtual ~Command() = default;

    // Register positionals and flags on the subcommand
    virtual void setup(CLI::App& app) = 0;

    // @return One of the ORDERBOT_EXIT_* codes
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
};

// Persist carts, orders and sessions; reports failures on stderr
inline int save_state(CommandContext& ctx) {
    auto flushed = ctx.store->flush();
    if (!flushed.ok()) {
        std::cerr << "Error: " << flushed.error().to_string() << "\n";
        return ORDERBOT_EXIT_IO_ERROR;
    }
    return ORDERBOT_EXIT_SUCCESS;
}

}  // namespace orderbot::cli
