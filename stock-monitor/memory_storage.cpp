// (c) 2024, Interance GmbH & Co KG.

#include "memory_storage.hpp"

#include <algorithm>

caf::error memory_storage::open() {
  return caf::error{};
}

caf::expected<ledger_position> memory_storage::position() {
  std::lock_guard guard{mtx_};
  ledger_position result;
  for (const auto& x : log_) {
    result.last_id = std::max(result.last_id, x.id);
    result.last_timestamp = std::max(result.last_timestamp, x.timestamp);
  }
  return result;
}

caf::expected<item> memory_storage::get(int32_t id) {
  std::lock_guard guard{mtx_};
  if (auto i = items_.find(id); i != items_.end())
    return i->second;
  return caf::make_error(ec::no_such_item);
}

caf::expected<std::vector<item>> memory_storage::items() {
  std::lock_guard guard{mtx_};
  std::vector<item> result;
  result.reserve(items_.size());
  for (const auto& kvp : items_)
    result.push_back(kvp.second);
  return result;
}

caf::expected<int32_t>
memory_storage::insert(const item& new_item,
                       const std::optional<movement>& opening) {
  std::lock_guard guard{mtx_};
  auto sku_taken = std::any_of(items_.begin(), items_.end(),
                               [&new_item](const auto& kvp) {
                                 return kvp.second.sku == new_item.sku;
                               });
  if (sku_taken || items_.count(new_item.id) > 0)
    return caf::make_error(ec::key_already_exists);
  auto id = new_item.id;
  if (id == 0)
    id = items_.empty() ? 1 : items_.rbegin()->first + 1;
  auto& entry = items_[id];
  entry = new_item;
  entry.id = id;
  if (opening) {
    auto& first = log_.emplace_back(*opening);
    first.item_id = id;
  }
  return id;
}

ec memory_storage::commit(const item& updated, const movement& appended) {
  std::lock_guard guard{mtx_};
  auto i = items_.find(updated.id);
  if (i == items_.end())
    return ec::no_such_item;
  i->second.current_quantity = updated.current_quantity;
  log_.push_back(appended);
  return ec::nil;
}

caf::expected<item_snapshot> memory_storage::snapshot(int32_t item_id,
                                                      caf::timestamp since) {
  std::lock_guard guard{mtx_};
  auto i = items_.find(item_id);
  if (i == items_.end())
    return caf::make_error(ec::no_such_item);
  item_snapshot result;
  result.subject = i->second;
  for (const auto& x : log_)
    if (x.item_id == item_id && x.timestamp >= since)
      result.movements.push_back(x);
  std::sort(result.movements.begin(), result.movements.end(),
            [](const movement& lhs, const movement& rhs) {
              return lhs.id < rhs.id;
            });
  return result;
}
