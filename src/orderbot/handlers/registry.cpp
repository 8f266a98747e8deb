#include <orderbot/handlers/registry.hpp>
#include <orderbot/handlers/cart_handlers.hpp>
#include <orderbot/handlers/order_handlers.hpp>
#include <orderbot/handlers/session_handlers.hpp>

namespace orderbot::handlers {

std::unique_ptr<dialogue::IntentRouter> create_default_router(const HandlerServices& services) {
    HandlerServices shared{services.store, services.suggestions,
                           services.logger ? services.logger : make_null_logger()};
    auto router = std::make_unique<dialogue::IntentRouter>(shared.logger);

    // Batch before single add: "1 fries 2 cola" also satisfies add_item
    router->register_handler(std::make_unique<BatchAddItemHandler>(shared));
    router->register_handler(std::make_unique<AddItemHandler>(shared));
    router->register_handler(std::make_unique<RemoveItemHandler>(shared));
    router->register_handler(std::make_unique<ViewCartHandler>(shared));
    router->register_handler(std::make_unique<CheckoutHandler>(shared));
    router->register_handler(std::make_unique<BrowseMenuHandler>(shared));
    router->register_handler(std::make_unique<ClearCartHandler>(shared));
    router->register_handler(std::make_unique<ConfirmationHandler>(shared));
    router->register_handler(std::make_unique<RejectionHandler>(shared));
    router->register_handler(std::make_unique<TrackOrderHandler>(shared));
    router->register_handler(std::make_unique<WelcomeHandler>(shared));
    router->register_handler(std::make_unique<NewOrderHandler>(shared));

    return router;
}

}  // namespace orderbot::handlers
