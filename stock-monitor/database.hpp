// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "storage.hpp"

#include <mutex>
#include <string>

extern "C" {

struct sqlite3;

} // extern "C"

/// Stores the catalog and the movement log in an SQLite database.
class database : public storage {
public:
  explicit database(std::string db_file) : db_file_(std::move(db_file)) {
    // nop
  }

  ~database() override;

  /// Opens the database file and creates the tables if they do not exist.
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

  /// Retrieves the number of items in the database.
  [[nodiscard]] int count();

private:
  /// Runs a statement without parameters or results.
  bool exec(const char* sql);

  std::string db_file_;
  sqlite3* db_ = nullptr;
  std::mutex mtx_;
};
