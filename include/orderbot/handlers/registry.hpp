#pragma once

#include <orderbot/dialogue/intent_router.hpp>
#include <orderbot/handlers/handler_services.hpp>

#include <memory>

namespace orderbot::handlers {

/**
 * Build the router with every built-in handler, in priority order:
 * batch_add_item, add_item, remove_item, view_cart, checkout,
 * browse_menu, clear_cart, confirmation, rejection, track_order,
 * welcome, new_order.
 */
std::unique_ptr<dialogue::IntentRouter> create_default_router(const HandlerServices& services);

}  // namespace orderbot::handlers
