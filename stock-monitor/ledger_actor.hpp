// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "ledger.hpp"
#include "stock_update.hpp"
#include "types.hpp"

#include <caf/fwd.hpp>
#include <caf/typed_actor.hpp>

#include <cstdint>
#include <utility>
#include <vector>

struct ledger_trait {
  using signatures = caf::type_list<
    // Retrieves all items.
    caf::result<std::vector<item>>(caf::get_atom),
    // Retrieves an item.
    caf::result<item>(caf::get_atom, int32_t),
    // Registers a new item, including its opening stock.
    caf::result<item>(caf::add_atom, item),
    // Applies a movement to an item.
    caf::result<movement>(apply_atom, movement_request),
    // Retrieves the movement history of an item.
    caf::result<std::vector<movement>>(history_atom, int32_t),
    // Classifies the current quantity of an item.
    caf::result<stock_status>(status_atom, int32_t),
    // Collects all items that match the filter.
    caf::result<std::vector<stock_alert>>(alerts_atom, alert_filter),
    // Predicts the shortage date of an item for a lookback window in days.
    caf::result<shortage_prediction>(predict_atom, int32_t, int32_t),
    // Predicts the shortage dates of all items for a lookback window in days.
    caf::result<std::vector<shortage_prediction>>(predict_all_atom, int32_t)>;
};

using ledger_actor = caf::typed_actor<ledger_trait>;

std::pair<ledger_actor, stock_events>
spawn_ledger_actor(caf::actor_system& sys, ledger_ptr ldg);
