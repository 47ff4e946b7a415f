// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "storage.hpp"

#include <mutex>
#include <string>
#include <vector>

/// The content of a JSON stock file.
struct stock_document {
  std::vector<item> inventory_items;
  std::vector<movement> stock_movements;
};

template <class Inspector>
bool inspect(Inspector& f, stock_document& x) {
  return f.object(x).fields(f.field("inventory_items", x.inventory_items),
                            f.field("stock_movements", x.stock_movements));
}

/// Stores the catalog and the movement log in a single JSON file. Each
/// operation reads the whole file and each write replaces it atomically, so
/// the file is only open for the duration of one transaction.
class json_file_storage : public storage {
public:
  explicit json_file_storage(std::string file_path)
    : file_path_(std::move(file_path)) {
    // nop
  }

  /// Creates an empty stock file if none exists yet and checks that an
  /// existing file is readable otherwise.
  caf::error open() override;

  caf::expected<ledger_position> position() override;

  caf::expected<item> get(int32_t id) override;

  caf::expected<std::vector<item>> items() override;

  caf::expected<int32_t>
  insert(const item& new_item,
         const std::optional<movement>& opening) override;

  ec commit(const item& updated, const movement& appended) override;

  caf::expected<item_snapshot> snapshot(int32_t item_id,
                                        caf::timestamp since) override;

private:
  caf::expected<stock_document> load();

  ec store(const stock_document& doc);

  std::string file_path_;
  std::mutex mtx_;
};
