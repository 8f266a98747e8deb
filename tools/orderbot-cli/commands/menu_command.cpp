#include "menu_command.hpp"

namespace orderbot::cli {

void MenuCommand::setup(CLI::App& app) {
    app.add_option("-c,--category", category_, "Only show one category")
        ->check(CLI::IsMember(std::vector<std::string>{store::CATEGORY_PIZZA, store::CATEGORY_ADDITION}));
}

int MenuCommand::execute(CommandContext& ctx) {
    auto items = ctx.store->list_menu(category_);
    if (!items.ok()) {
        std::cerr << "Error: " << items.error().to_string() << "\n";
        return ORDERBOT_EXIT_IO_ERROR;
    }

    std::string current;
    for (const auto& item : items.value()) {
        if (item.category != current) {
            if (!current.empty()) std::cout << "\n";
            current = item.category;
            std::cout << "# " << current << "\n";
        }
        std::cout << "  " << item.display_line() << "\n";
    }

    return ORDERBOT_EXIT_SUCCESS;
}

}  // namespace orderbot::cli
