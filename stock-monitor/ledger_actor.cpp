// (c) 2024, Interance GmbH & Co KG.

#include "ledger_actor.hpp"

#include "ec.hpp"
#include "log.hpp"

#include <caf/actor_from_state.hpp>
#include <caf/actor_system.hpp>
#include <caf/async/publisher.hpp>
#include <caf/error.hpp>
#include <caf/flow/multicaster.hpp>
#include <caf/flow/observable_builder.hpp>

#include <memory>

namespace {

template <class T>
caf::result<T> to_result(caf::expected<T>&& x) {
  if (x)
    return {std::move(*x)};
  return {std::move(x.error())};
}

struct ledger_actor_state {
  ledger_actor_state(ledger_actor::pointer self_ptr, ledger_ptr ldg_ptr,
                     stock_events* events)
    : self(self_ptr), ldg(std::move(ldg_ptr)), mcast(self) {
    *events = mcast.as_observable().to_publisher();
  }

  ledger_actor::behavior_type make_behavior();

  /// Informs all subscribers about an applied movement.
  void publish(const movement& change);

  ledger_actor::pointer self;
  ledger_ptr ldg;
  caf::flow::multicaster<stock_event> mcast;
};

ledger_actor::behavior_type ledger_actor_state::make_behavior() {
  return {
    [this](caf::get_atom) -> caf::result<std::vector<item>> {
      return to_result(ldg->items());
    },
    [this](caf::get_atom, int32_t id) -> caf::result<item> {
      return to_result(ldg->find(id));
    },
    [this](caf::add_atom, const item& new_item) -> caf::result<item> {
      return to_result(ldg->register_item(new_item));
    },
    [this](apply_atom, const movement_request& req) -> caf::result<movement> {
      auto res = ldg->apply(req);
      if (!res)
        return {std::move(res.error())};
      publish(*res);
      return {std::move(*res)};
    },
    [this](history_atom, int32_t id) -> caf::result<std::vector<movement>> {
      return to_result(ldg->history(id));
    },
    [this](status_atom, int32_t id) -> caf::result<stock_status> {
      return to_result(ldg->get_status(id));
    },
    [this](alerts_atom,
           const alert_filter& filter) -> caf::result<std::vector<stock_alert>> {
      return to_result(ldg->list_alerts(filter));
    },
    [this](predict_atom, int32_t id,
           int32_t lookback_days) -> caf::result<shortage_prediction> {
      return to_result(ldg->predict_shortage(id, lookback_days));
    },
    [this](predict_all_atom, int32_t lookback_days)
      -> caf::result<std::vector<shortage_prediction>> {
      return to_result(ldg->predict_all(lookback_days));
    },
  };
}

void ledger_actor_state::publish(const movement& change) {
  auto state = ldg->find(change.item_id);
  if (!state) {
    log::warning("cannot publish movement {}: {}", change.id, state.error());
    return;
  }
  auto status = classify(state->current_quantity, state->min_quantity,
                         ldg->config().warning_factor);
  mcast.push(std::make_shared<stock_update>(
    stock_update{change, std::move(*state), status}));
}

} // namespace

std::pair<ledger_actor, stock_events>
spawn_ledger_actor(caf::actor_system& sys, ledger_ptr ldg) {
  // Note: the storage back ends use blocking APIs and thus the actor should
  //       run in its own thread.
  using caf::actor_from_state;
  using caf::detached;
  stock_events events;
  auto hdl = sys.spawn<detached>(actor_from_state<ledger_actor_state>,
                                 std::move(ldg), &events);
  return {hdl, std::move(events)};
}
