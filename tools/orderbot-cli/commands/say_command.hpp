#pragma once

#include "command.hpp"

#include <vector>

namespace orderbot::cli {

/**
 * Process a single message and print the reply.
 */
class SayCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "say"; }
    std::string description() const override {
        return "Send one message and print the reply";
    }

private:
    std::vector<std::string> words_;
    bool json_ = false;
};

}  // namespace orderbot::cli
