// (c) 2024, Interance GmbH & Co KG.

#include "database.hpp"

#include "log.hpp"

#include <memory>
#include <optional>

#include <sqlite3.h>

namespace {

struct stmt_deleter {
  void operator()(sqlite3_stmt* ptr) const noexcept {
    sqlite3_finalize(ptr);
  }
};

using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_deleter>;

stmt_ptr prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return nullptr;
  }
  return stmt_ptr{stmt};
}

caf::error storage_error(sqlite3* db) {
  return caf::make_error(ec::storage_unavailable,
                         std::string{sqlite3_errmsg(db)});
}

bool bind_text(sqlite3_stmt* stmt, int index, const std::string& str) {
  return sqlite3_bind_text(stmt, index, str.c_str(), -1, SQLITE_TRANSIENT)
         == SQLITE_OK;
}

bool bind_text(sqlite3_stmt* stmt, int index,
               const std::optional<std::string>& str) {
  if (str)
    return bind_text(stmt, index, *str);
  return sqlite3_bind_null(stmt, index) == SQLITE_OK;
}

bool bind_int(sqlite3_stmt* stmt, int index, std::optional<int32_t> value) {
  if (value)
    return sqlite3_bind_int(stmt, index, *value) == SQLITE_OK;
  return sqlite3_bind_null(stmt, index) == SQLITE_OK;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
  if (auto str = sqlite3_column_text(stmt, col))
    return reinterpret_cast<const char*>(str);
  return {};
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
    return std::nullopt;
  return column_text(stmt, col);
}

int64_t to_integer(caf::timestamp ts) {
  return ts.time_since_epoch().count();
}

caf::timestamp to_timestamp(int64_t count) {
  return caf::timestamp{caf::timespan{count}};
}

// Reads the columns id, name, sku, category, unit, current_quantity,
// min_quantity, supplier and warehouse.
bool read_item(sqlite3_stmt* stmt, item& x) {
  x.id = sqlite3_column_int(stmt, 0);
  x.name = column_text(stmt, 1);
  x.sku = column_text(stmt, 2);
  x.unit = column_text(stmt, 4);
  x.current_quantity = sqlite3_column_double(stmt, 5);
  x.min_quantity = sqlite3_column_double(stmt, 6);
  x.supplier = column_optional_text(stmt, 7);
  x.warehouse = column_optional_text(stmt, 8);
  return from_string(column_text(stmt, 3), x.category);
}

// Reads the columns id, item_id, quantity, movement_type, user_id, notes and
// timestamp.
bool read_movement(sqlite3_stmt* stmt, movement& x) {
  x.id = sqlite3_column_int64(stmt, 0);
  x.item_id = sqlite3_column_int(stmt, 1);
  x.quantity = sqlite3_column_double(stmt, 2);
  if (sqlite3_column_type(stmt, 4) != SQLITE_NULL)
    x.actor_id = sqlite3_column_int(stmt, 4);
  x.note = column_optional_text(stmt, 5);
  x.timestamp = to_timestamp(sqlite3_column_int64(stmt, 6));
  return from_string(column_text(stmt, 3), x.kind);
}

caf::expected<item> query_item(sqlite3* db, int32_t id) {
  const char* get_query = R"_(
    SELECT id, name, sku, category, unit, current_quantity, min_quantity,
           supplier, warehouse
    FROM items WHERE id = ?
  )_";
  auto stmt = prepare(db, get_query);
  if (!stmt || sqlite3_bind_int(stmt.get(), 1, id) != SQLITE_OK)
    return storage_error(db);
  switch (sqlite3_step(stmt.get())) {
    case SQLITE_ROW:
      break;
    case SQLITE_DONE:
      return caf::make_error(ec::no_such_item);
    default:
      return storage_error(db);
  }
  item result;
  if (!read_item(stmt.get(), result))
    return caf::make_error(ec::storage_unavailable, "malformed item row");
  return result;
}

caf::expected<std::vector<movement>>
query_movements(sqlite3* db, int32_t item_id, caf::timestamp since) {
  const char* movements_query = R"_(
    SELECT id, item_id, quantity, movement_type, user_id, notes, timestamp
    FROM movements WHERE item_id = ? AND timestamp >= ?
    ORDER BY id
  )_";
  auto stmt = prepare(db, movements_query);
  if (!stmt || sqlite3_bind_int(stmt.get(), 1, item_id) != SQLITE_OK
      || sqlite3_bind_int64(stmt.get(), 2, to_integer(since)) != SQLITE_OK)
    return storage_error(db);
  std::vector<movement> result;
  for (;;) {
    auto rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
      return result;
    if (rc != SQLITE_ROW)
      return storage_error(db);
    auto& x = result.emplace_back();
    if (!read_movement(stmt.get(), x))
      return caf::make_error(ec::storage_unavailable,
                             "malformed movement row");
  }
}

// Inserts a movement into the log. Must run inside a transaction.
bool append_movement(sqlite3* db, const movement& x) {
  const char* append_query = R"_(
    INSERT INTO movements (id, item_id, quantity, movement_type, user_id,
                           notes, timestamp)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )_";
  auto stmt = prepare(db, append_query);
  if (!stmt)
    return false;
  auto* ptr = stmt.get();
  return sqlite3_bind_int64(ptr, 1, x.id) == SQLITE_OK
         && sqlite3_bind_int(ptr, 2, x.item_id) == SQLITE_OK
         && sqlite3_bind_double(ptr, 3, x.quantity) == SQLITE_OK
         && bind_text(ptr, 4, to_string(x.kind)) && bind_int(ptr, 5, x.actor_id)
         && bind_text(ptr, 6, x.note)
         && sqlite3_bind_int64(ptr, 7, to_integer(x.timestamp)) == SQLITE_OK
         && sqlite3_step(ptr) == SQLITE_DONE;
}

} // namespace

database::~database() {
  if (db_ != nullptr)
    sqlite3_close(db_);
}

caf::error database::open() {
  std::lock_guard guard{mtx_};
  // Open the database file.
  if (sqlite3_open(db_file_.c_str(), &db_) != SQLITE_OK) {
    sqlite3_close(db_);
    db_ = nullptr;
    return caf::make_error(ec::storage_unavailable, "could not open database");
  }
  // Create the tables if they do not exist.
  const char* create_tables = R"_(
    CREATE TABLE IF NOT EXISTS items (
      id INTEGER PRIMARY KEY,
      name TEXT NOT NULL,
      sku TEXT NOT NULL UNIQUE,
      category TEXT NOT NULL,
      unit TEXT NOT NULL,
      current_quantity REAL NOT NULL,
      min_quantity REAL NOT NULL,
      supplier TEXT,
      warehouse TEXT);
    CREATE TABLE IF NOT EXISTS movements (
      id INTEGER PRIMARY KEY,
      item_id INTEGER NOT NULL REFERENCES items(id),
      quantity REAL NOT NULL,
      movement_type TEXT NOT NULL,
      user_id INTEGER,
      notes TEXT,
      timestamp INTEGER NOT NULL);
    CREATE INDEX IF NOT EXISTS movements_by_item
      ON movements (item_id, timestamp);
  )_";
  char* err_msg = nullptr;
  if (sqlite3_exec(db_, create_tables, nullptr, nullptr, &err_msg)
      != SQLITE_OK) {
    auto msg = std::string{err_msg ? err_msg : "could not create tables"};
    sqlite3_free(err_msg);
    return caf::make_error(ec::storage_unavailable, std::move(msg));
  }
  return caf::error{};
}

int database::count() {
  std::lock_guard guard{mtx_};
  auto stmt = prepare(db_, "SELECT COUNT(*) FROM items");
  if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW)
    return 0;
  return sqlite3_column_int(stmt.get(), 0);
}

caf::expected<ledger_position> database::position() {
  std::lock_guard guard{mtx_};
  const char* position_query = R"_(
    SELECT COALESCE(MAX(id), 0), COALESCE(MAX(timestamp), 0)
    FROM movements
  )_";
  auto stmt = prepare(db_, position_query);
  if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW)
    return storage_error(db_);
  ledger_position result;
  result.last_id = sqlite3_column_int64(stmt.get(), 0);
  result.last_timestamp = to_timestamp(sqlite3_column_int64(stmt.get(), 1));
  return result;
}

caf::expected<item> database::get(int32_t id) {
  std::lock_guard guard{mtx_};
  return query_item(db_, id);
}

caf::expected<std::vector<item>> database::items() {
  std::lock_guard guard{mtx_};
  const char* items_query = R"_(
    SELECT id, name, sku, category, unit, current_quantity, min_quantity,
           supplier, warehouse
    FROM items ORDER BY id
  )_";
  auto stmt = prepare(db_, items_query);
  if (!stmt)
    return storage_error(db_);
  std::vector<item> result;
  for (;;) {
    auto rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
      return result;
    if (rc != SQLITE_ROW)
      return storage_error(db_);
    auto& x = result.emplace_back();
    if (!read_item(stmt.get(), x))
      return caf::make_error(ec::storage_unavailable, "malformed item row");
  }
}

caf::expected<int32_t>
database::insert(const item& new_item,
                 const std::optional<movement>& opening) {
  std::lock_guard guard{mtx_};
  if (!exec("BEGIN IMMEDIATE"))
    return caf::make_error(ec::storage_unavailable);
  auto result = [this, &new_item, &opening]() -> caf::expected<int32_t> {
    const char* insert_query = R"_(
      INSERT INTO items (id, name, sku, category, unit, current_quantity,
                         min_quantity, supplier, warehouse)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )_";
    auto stmt = prepare(db_, insert_query);
    if (!stmt)
      return storage_error(db_);
    auto* ptr = stmt.get();
    auto id = new_item.id != 0 ? std::optional<int32_t>{new_item.id}
                               : std::nullopt;
    if (!bind_int(ptr, 1, id) || !bind_text(ptr, 2, new_item.name)
        || !bind_text(ptr, 3, new_item.sku)
        || !bind_text(ptr, 4, to_string(new_item.category))
        || !bind_text(ptr, 5, new_item.unit)
        || sqlite3_bind_double(ptr, 6, new_item.current_quantity) != SQLITE_OK
        || sqlite3_bind_double(ptr, 7, new_item.min_quantity) != SQLITE_OK
        || !bind_text(ptr, 8, new_item.supplier)
        || !bind_text(ptr, 9, new_item.warehouse))
      return storage_error(db_);
    switch (sqlite3_step(ptr)) {
      case SQLITE_DONE:
        break;
      case SQLITE_CONSTRAINT:
        return caf::make_error(ec::key_already_exists);
      default:
        return storage_error(db_);
    }
    auto new_id = static_cast<int32_t>(sqlite3_last_insert_rowid(db_));
    if (opening) {
      auto first = *opening;
      first.item_id = new_id;
      if (!append_movement(db_, first))
        return storage_error(db_);
    }
    return new_id;
  }();
  if (result && exec("COMMIT"))
    return result;
  if (!exec("ROLLBACK"))
    log::error("failed to roll back the insertion of {}: {}", new_item.sku,
               sqlite3_errmsg(db_));
  if (!result)
    return result;
  return caf::make_error(ec::storage_unavailable);
}

ec database::commit(const item& updated, const movement& appended) {
  std::lock_guard guard{mtx_};
  if (!exec("BEGIN IMMEDIATE"))
    return ec::storage_unavailable;
  auto result = [this, &updated, &appended] {
    const char* update_query = R"_(
      UPDATE items SET current_quantity = ? WHERE id = ?
    )_";
    auto update = prepare(db_, update_query);
    if (!update
        || sqlite3_bind_double(update.get(), 1, updated.current_quantity)
             != SQLITE_OK
        || sqlite3_bind_int(update.get(), 2, updated.id) != SQLITE_OK
        || sqlite3_step(update.get()) != SQLITE_DONE)
      return ec::storage_unavailable;
    if (sqlite3_changes(db_) != 1)
      return ec::no_such_item;
    if (!append_movement(db_, appended))
      return ec::storage_unavailable;
    return ec::nil;
  }();
  if (result == ec::nil && exec("COMMIT"))
    return ec::nil;
  if (!exec("ROLLBACK"))
    log::error("failed to roll back a movement for item {}: {}", updated.id,
               sqlite3_errmsg(db_));
  return result == ec::nil ? ec::storage_unavailable : result;
}

caf::expected<item_snapshot> database::snapshot(int32_t item_id,
                                                caf::timestamp since) {
  // Commits also hold the mutex, so both queries see the same state.
  std::lock_guard guard{mtx_};
  auto subject = query_item(db_, item_id);
  if (!subject)
    return std::move(subject.error());
  auto xs = query_movements(db_, item_id, since);
  if (!xs)
    return std::move(xs.error());
  return item_snapshot{std::move(*subject), std::move(*xs)};
}

bool database::exec(const char* sql) {
  char* err_msg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    log::error("failed to run {}: {}", sql, err_msg ? err_msg : "n/a");
    sqlite3_free(err_msg);
    return false;
  }
  return true;
}
