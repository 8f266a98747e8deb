#pragma once

#include "command.hpp"

namespace orderbot::cli {

/**
 * Interactive conversation on stdin/stdout until "exit" or EOF.
 */
class ChatCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "chat"; }
    std::string description() const override {
        return "Start an interactive ordering conversation";
    }

private:
    bool show_suggestions_ = false;
};

}  // namespace orderbot::cli
