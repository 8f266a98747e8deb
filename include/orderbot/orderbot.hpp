#pragma once

/**
 * orderbot
 *
 * Dialogue engine for a natural-language food ordering assistant:
 * intent extraction, multi-turn clarification, suggestions and
 * priority-ordered intent handlers over a cart/menu/order store.
 */

#include <orderbot/config.hpp>
#include <orderbot/result.hpp>
#include <orderbot/types.hpp>
#include <orderbot/dialogue/orchestrator.hpp>
#include <orderbot/recommendation/recommender.hpp>
#include <orderbot/store/memory_store.hpp>
