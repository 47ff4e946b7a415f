// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "storage.hpp"

#include <map>
#include <mutex>
#include <vector>

/// Keeps the catalog and the movement log in memory.
class memory_storage : public storage {
public:
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
  std::mutex mtx_;
  std::map<int32_t, item> items_;
  std::vector<movement> log_;
};
