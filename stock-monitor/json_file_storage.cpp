// (c) 2024, Interance GmbH & Co KG.

#include "json_file_storage.hpp"

#include "log.hpp"

#include <caf/json_reader.hpp>
#include <caf/json_writer.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

caf::error json_file_storage::open() {
  std::lock_guard guard{mtx_};
  std::error_code err;
  if (!fs::exists(file_path_, err)) {
    log::info("creating a new stock file at {}", file_path_);
    if (auto code = store(stock_document{}); code != ec::nil)
      return caf::make_error(code, "could not create " + file_path_);
    return caf::error{};
  }
  if (auto doc = load(); !doc)
    return std::move(doc.error());
  return caf::error{};
}

caf::expected<ledger_position> json_file_storage::position() {
  std::lock_guard guard{mtx_};
  auto doc = load();
  if (!doc)
    return std::move(doc.error());
  ledger_position result;
  for (const auto& x : doc->stock_movements) {
    result.last_id = std::max(result.last_id, x.id);
    result.last_timestamp = std::max(result.last_timestamp, x.timestamp);
  }
  return result;
}

caf::expected<item> json_file_storage::get(int32_t id) {
  std::lock_guard guard{mtx_};
  auto doc = load();
  if (!doc)
    return std::move(doc.error());
  auto& xs = doc->inventory_items;
  auto i = std::find_if(xs.begin(), xs.end(),
                        [id](const item& x) { return x.id == id; });
  if (i == xs.end())
    return caf::make_error(ec::no_such_item);
  return std::move(*i);
}

caf::expected<std::vector<item>> json_file_storage::items() {
  std::lock_guard guard{mtx_};
  auto doc = load();
  if (!doc)
    return std::move(doc.error());
  auto& xs = doc->inventory_items;
  std::sort(xs.begin(), xs.end(),
            [](const item& lhs, const item& rhs) { return lhs.id < rhs.id; });
  return std::move(xs);
}

caf::expected<int32_t>
json_file_storage::insert(const item& new_item,
                          const std::optional<movement>& opening) {
  std::lock_guard guard{mtx_};
  auto doc = load();
  if (!doc)
    return std::move(doc.error());
  auto& xs = doc->inventory_items;
  auto max_id = int32_t{0};
  for (const auto& x : xs) {
    if (x.sku == new_item.sku || x.id == new_item.id)
      return caf::make_error(ec::key_already_exists);
    max_id = std::max(max_id, x.id);
  }
  auto& added = xs.emplace_back(new_item);
  if (added.id == 0)
    added.id = max_id + 1;
  auto id = added.id;
  if (opening) {
    auto& first = doc->stock_movements.emplace_back(*opening);
    first.item_id = id;
  }
  if (auto err = store(*doc); err != ec::nil)
    return caf::make_error(err);
  return id;
}

ec json_file_storage::commit(const item& updated, const movement& appended) {
  std::lock_guard guard{mtx_};
  auto doc = load();
  if (!doc)
    return ec::storage_unavailable;
  auto& xs = doc->inventory_items;
  auto i = std::find_if(xs.begin(), xs.end(), [&updated](const item& x) {
    return x.id == updated.id;
  });
  if (i == xs.end())
    return ec::no_such_item;
  i->current_quantity = updated.current_quantity;
  doc->stock_movements.push_back(appended);
  return store(*doc);
}

caf::expected<item_snapshot>
json_file_storage::snapshot(int32_t item_id, caf::timestamp since) {
  std::lock_guard guard{mtx_};
  auto doc = load();
  if (!doc)
    return std::move(doc.error());
  auto& xs = doc->inventory_items;
  auto i = std::find_if(xs.begin(), xs.end(),
                        [item_id](const item& x) { return x.id == item_id; });
  if (i == xs.end())
    return caf::make_error(ec::no_such_item);
  item_snapshot result;
  result.subject = std::move(*i);
  for (auto& x : doc->stock_movements)
    if (x.item_id == item_id && x.timestamp >= since)
      result.movements.push_back(std::move(x));
  std::stable_sort(result.movements.begin(), result.movements.end(),
                   [](const movement& lhs, const movement& rhs) {
                     return lhs.id < rhs.id;
                   });
  return result;
}

caf::expected<stock_document> json_file_storage::load() {
  std::ifstream in{file_path_};
  if (!in)
    return caf::make_error(ec::storage_unavailable,
                           "could not read " + file_path_);
  std::string content{std::istreambuf_iterator<char>{in},
                      std::istreambuf_iterator<char>{}};
  caf::json_reader reader;
  if (!reader.load(content)) {
    log::error("failed to parse {}: {}", file_path_, reader.get_error());
    return caf::make_error(ec::storage_unavailable,
                           "malformed JSON in " + file_path_);
  }
  stock_document result;
  if (!reader.apply(result)) {
    log::error("failed to read stock data from {}: {}", file_path_,
               reader.get_error());
    return caf::make_error(ec::storage_unavailable,
                           "malformed stock data in " + file_path_);
  }
  return result;
}

ec json_file_storage::store(const stock_document& doc) {
  caf::json_writer writer;
  writer.skip_object_type_annotation(true);
  writer.indentation(2);
  if (!writer.apply(doc)) {
    log::error("failed to serialize stock data: {}", writer.get_error());
    return ec::storage_unavailable;
  }
  // Write to a temporary file first and then replace the original in one
  // step, so readers never observe a partially written file.
  auto tmp_path = file_path_ + ".tmp";
  {
    std::ofstream out{tmp_path, std::ios::trunc};
    out << writer.str();
    out.flush();
    if (!out) {
      log::error("failed to write {}", tmp_path);
      return ec::storage_unavailable;
    }
  }
  std::error_code err;
  fs::rename(tmp_path, file_path_, err);
  if (err) {
    log::error("failed to replace {}: {}", file_path_, err.message());
    std::error_code cleanup_err;
    if (!fs::remove(tmp_path, cleanup_err) && cleanup_err)
      log::warning("failed to remove {}: {}", tmp_path, cleanup_err.message());
    return ec::storage_unavailable;
  }
  return ec::nil;
}
