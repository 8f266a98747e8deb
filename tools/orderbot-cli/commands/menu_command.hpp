#pragma once

#include "command.hpp"

namespace orderbot::cli {

/**
 * Print the menu with sizes and prices.
 */
class MenuCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "menu"; }
    std::string description() const override {
        return "Show the menu";
    }

private:
    std::string category_;
};

}  // namespace orderbot::cli
