// (c) 2024, Interance GmbH & Co KG.

#include "ledger.hpp"

#include "log.hpp"

#include <algorithm>
#include <limits>

namespace {

bool valid_lookback(int32_t lookback_days) {
  return lookback_days > 0 && lookback_days <= max_lookback_days;
}

} // namespace

ledger::ledger(storage_ptr store, ledger_config cfg, clock_fn clock)
  : store_(std::move(store)), cfg_(cfg), clock_(std::move(clock)) {
  // nop
}

caf::error ledger::init() {
  auto pos = store_->position();
  if (!pos)
    return std::move(pos.error());
  std::lock_guard guard{position_mtx_};
  position_ = *pos;
  log::debug("ledger continues after movement {}", position_.last_id);
  return caf::error{};
}

caf::expected<item> ledger::register_item(item new_item,
                                          std::optional<int32_t> actor_id) {
  if (!valid(new_item))
    return caf::make_error(ec::invalid_argument, "malformed catalog entry");
  // The opening stock becomes the first movement of the item. Both land in
  // the storage in one transaction.
  std::optional<movement> opening;
  if (new_item.current_quantity > 0) {
    movement first;
    first.kind = movement_kind::adjustment;
    first.quantity = new_item.current_quantity;
    first.actor_id = actor_id;
    first.note = "opening stock";
    stamp(first);
    opening = std::move(first);
  }
  auto id = store_->insert(new_item, opening);
  if (!id) {
    log::warning("failed to register item with SKU {}: {}", new_item.sku,
                 id.error());
    return std::move(id.error());
  }
  new_item.id = *id;
  log::info("registered item {} with SKU {}", new_item.id, new_item.sku);
  return new_item;
}

caf::expected<movement> ledger::apply(const movement_request& req) {
  if (!valid_quantity(req.kind, req.quantity))
    return caf::make_error(ec::invalid_quantity);
  std::lock_guard guard{item_mutex(req.item_id)};
  auto subject = store_->get(req.item_id);
  if (!subject)
    return std::move(subject.error());
  if (cfg_.reject_overdraw && req.kind == movement_kind::out
      && req.quantity > subject->current_quantity)
    return caf::make_error(ec::insufficient_stock);
  auto next = apply_movement(subject->current_quantity, req.kind,
                             req.quantity);
  if (!(next < std::numeric_limits<double>::infinity()))
    return caf::make_error(ec::invalid_quantity);
  movement result;
  result.item_id = req.item_id;
  result.kind = req.kind;
  result.quantity = req.quantity;
  result.actor_id = req.actor_id;
  result.note = req.note;
  stamp(result);
  subject->current_quantity = next;
  if (auto err = store_->commit(*subject, result); err != ec::nil) {
    log::warning("failed to commit movement {} for item {}: {}", result.id,
                 result.item_id, to_string(err));
    return caf::make_error(err);
  }
  log::debug("applied movement {}: {} {} for item {} -> {}", result.id,
             to_string(result.kind), result.quantity, result.item_id, next);
  return result;
}

caf::expected<movement> ledger::apply(int32_t item_id, movement_kind kind,
                                      double quantity,
                                      std::optional<int32_t> actor_id,
                                      std::optional<std::string> note) {
  return apply(movement_request{item_id, kind, quantity, actor_id,
                                std::move(note)});
}

caf::expected<item> ledger::find(int32_t item_id) {
  return store_->get(item_id);
}

caf::expected<std::vector<item>> ledger::items() {
  return store_->items();
}

caf::expected<std::vector<movement>> ledger::history(int32_t item_id) {
  return list_recent(item_id, caf::timestamp::min());
}

caf::expected<std::vector<movement>>
ledger::list_recent(int32_t item_id, caf::timestamp since) {
  auto snapshot = store_->snapshot(item_id, since);
  if (!snapshot)
    return std::move(snapshot.error());
  return std::move(snapshot->movements);
}

caf::expected<stock_status> ledger::get_status(int32_t item_id) {
  auto subject = store_->get(item_id);
  if (!subject)
    return std::move(subject.error());
  return classify(subject->current_quantity, subject->min_quantity,
                  cfg_.warning_factor);
}

caf::expected<std::vector<stock_alert>>
ledger::list_alerts(const alert_filter& filter) {
  auto xs = store_->items();
  if (!xs)
    return std::move(xs.error());
  return collect_alerts(*xs, filter, cfg_.warning_factor);
}

caf::expected<shortage_prediction> ledger::predict_shortage(int32_t item_id) {
  return predict_shortage(item_id, cfg_.lookback_days);
}

caf::expected<shortage_prediction>
ledger::predict_shortage(int32_t item_id, int32_t lookback_days) {
  if (!valid_lookback(lookback_days))
    return caf::make_error(ec::invalid_argument, "invalid lookback window");
  return predict(item_id, lookback_days, clock_());
}

caf::expected<shortage_prediction>
ledger::estimate_shortage(int32_t item_id, double avg_daily_usage) {
  auto subject = store_->get(item_id);
  if (!subject)
    return std::move(subject.error());
  return ::predict_shortage(*subject, avg_daily_usage, clock_());
}

caf::expected<std::vector<shortage_prediction>>
ledger::predict_all(int32_t lookback_days) {
  if (!valid_lookback(lookback_days))
    return caf::make_error(ec::invalid_argument, "invalid lookback window");
  auto xs = store_->items();
  if (!xs)
    return std::move(xs.error());
  auto now = clock_();
  std::vector<shortage_prediction> result;
  result.reserve(xs->size());
  for (const auto& x : *xs) {
    auto prediction = predict(x.id, lookback_days, now);
    if (!prediction)
      return std::move(prediction.error());
    result.push_back(std::move(*prediction));
  }
  return result;
}

caf::expected<double> ledger::replay(int32_t item_id) {
  auto xs = history(item_id);
  if (!xs)
    return std::move(xs.error());
  return ::replay(*xs);
}

std::mutex& ledger::item_mutex(int32_t item_id) {
  auto index = static_cast<uint32_t>(item_id) % item_mutexes_.size();
  return item_mutexes_[index];
}

void ledger::stamp(movement& x) {
  auto now = clock_();
  std::lock_guard guard{position_mtx_};
  x.id = ++position_.last_id;
  x.timestamp = std::max(now, position_.last_timestamp);
  position_.last_timestamp = x.timestamp;
}

caf::expected<shortage_prediction>
ledger::predict(int32_t item_id, int32_t lookback_days, caf::timestamp now) {
  auto snapshot = store_->snapshot(item_id, lookback_start(now, lookback_days));
  if (!snapshot)
    return std::move(snapshot.error());
  auto usage = average_daily_usage(snapshot->movements, now, lookback_days);
  return ::predict_shortage(snapshot->subject, usage, now);
}
