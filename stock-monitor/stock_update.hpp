// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "item.hpp"
#include "movement.hpp"
#include "stock_status.hpp"

#include <caf/async/publisher.hpp>

#include <memory>

/// Published after each applied movement.
struct stock_update {
  movement change;
  /// The item after applying `change`.
  item state;
  stock_status status = stock_status::normal;
};

template <class Inspector>
bool inspect(Inspector& f, stock_update& x) {
  return f.object(x).fields(f.field("movement", x.change),
                            f.field("item", x.state),
                            f.field("status", x.status));
}

using stock_event = std::shared_ptr<const stock_update>;

using stock_events = caf::async::publisher<stock_event>;
