// (c) 2024, Interance GmbH & Co KG.

#include "json_file_storage.hpp"
#include "ledger.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

namespace {

const auto t0 = caf::timestamp{std::chrono::hours{24 * 19'000}};

// The layout written by the desktop tool: no categories, no user IDs.
constexpr std::string_view legacy_file = R"_({
  "inventory_items": [
    {
      "id": 1,
      "name": "Steel Sheets",
      "sku": "STL-001",
      "current_quantity": 150,
      "min_quantity": 50,
      "unit": "pc",
      "supplier": "MetalWorks Inc.",
      "warehouse": "Main Warehouse"
    },
    {
      "id": 2,
      "name": "Plastic Pellets",
      "sku": "PLA-001",
      "current_quantity": 500,
      "min_quantity": 200,
      "unit": "kg",
      "supplier": "Plastico",
      "warehouse": "Main Warehouse"
    }
  ],
  "stock_movements": []
})_";

// Movements as the desktop tool and the old web service wrote them: naive
// timestamps with or without fraction, "adjust" as movement type and notes
// that are null or missing altogether.
constexpr std::string_view legacy_file_with_movements = R"_({
  "inventory_items": [
    {
      "id": 1,
      "name": "Steel Sheets",
      "sku": "STL-001",
      "current_quantity": 120,
      "min_quantity": 50,
      "unit": "sheets",
      "supplier": "MetalWorks Inc.",
      "warehouse": "Main Warehouse"
    },
    {
      "id": 2,
      "name": "Cement",
      "sku": "CEM-001",
      "current_quantity": 100,
      "min_quantity": 20,
      "unit": "bags",
      "supplier": null,
      "warehouse": "Yard"
    }
  ],
  "stock_movements": [
    {
      "id": 1,
      "item_id": 1,
      "quantity": 30,
      "movement_type": "out",
      "notes": null,
      "timestamp": "2024-03-01T08:15:00.250000"
    },
    {
      "id": 2,
      "item_id": 2,
      "quantity": 100.0,
      "movement_type": "in",
      "timestamp": "2024-03-01T09:00:00"
    },
    {
      "id": 3,
      "item_id": 1,
      "quantity": 120,
      "movement_type": "adjust",
      "timestamp": "2024-03-02T17:45:12.000500"
    }
  ]
})_";

// 2024-03-01T00:00:00 UTC.
const auto march_first = caf::timestamp{std::chrono::hours{24 * 19'783}};

class json_file_storage_test : public testing::Test {
protected:
  void SetUp() override {
    auto* info = testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::temp_directory_path() / "stock-monitor-test";
    dir /= info->name();
    fs::remove_all(dir);
    fs::create_directories(dir);
    path = (dir / "stock_monitor_db.json").string();
  }

  void TearDown() override {
    std::error_code err;
    fs::remove_all(dir, err);
  }

  void write_legacy_file(std::string_view content = legacy_file) {
    std::ofstream out{path};
    out << content;
  }

  fs::path dir;
  std::string path;
};

} // namespace

TEST_F(json_file_storage_test, open_creates_a_missing_file) {
  json_file_storage store{path};
  ASSERT_FALSE(store.open());
  EXPECT_TRUE(fs::exists(path));
  auto xs = store.items();
  ASSERT_TRUE(xs);
  EXPECT_TRUE(xs->empty());
}

TEST_F(json_file_storage_test, legacy_files_are_readable) {
  write_legacy_file();
  json_file_storage store{path};
  ASSERT_FALSE(store.open());
  auto xs = store.items();
  ASSERT_TRUE(xs);
  ASSERT_EQ(xs->size(), 2u);
  EXPECT_EQ((*xs)[0].sku, "STL-001");
  EXPECT_EQ((*xs)[0].category, material_category::raw_material);
  EXPECT_EQ((*xs)[1].unit, "kg");
  auto pos = store.position();
  ASSERT_TRUE(pos);
  EXPECT_EQ(pos->last_id, 0);
}

TEST_F(json_file_storage_test, malformed_files_make_open_fail) {
  {
    std::ofstream out{path};
    out << R"_({"inventory_items": [{"id": "one"}]})_";
  }
  json_file_storage store{path};
  EXPECT_EQ(store.open(), ec::storage_unavailable);
}

TEST_F(json_file_storage_test, missing_directories_make_writes_fail) {
  json_file_storage store{(dir / "missing" / "stock.json").string()};
  EXPECT_EQ(store.open(), ec::storage_unavailable);
}

TEST_F(json_file_storage_test, movements_survive_a_restart) {
  write_legacy_file();
  auto now = t0;
  auto clock = [&now] { return now; };
  int64_t last_id = 0;
  {
    auto store = std::make_shared<json_file_storage>(path);
    ASSERT_FALSE(store->open());
    ledger uut{store, {}, clock};
    ASSERT_FALSE(uut.init());
    ASSERT_TRUE(uut.apply(1, movement_kind::out, 120));
    auto res = uut.apply(1, movement_kind::adjustment, 80, 3,
                         std::string{"stocktake"});
    ASSERT_TRUE(res);
    last_id = res->id;
  }
  auto store = std::make_shared<json_file_storage>(path);
  ASSERT_FALSE(store->open());
  ledger uut{store, {}, clock};
  ASSERT_FALSE(uut.init());
  auto x = uut.find(1);
  ASSERT_TRUE(x);
  EXPECT_EQ(x->current_quantity, 80);
  auto xs = uut.history(1);
  ASSERT_TRUE(xs);
  ASSERT_EQ(xs->size(), 2u);
  EXPECT_EQ((*xs)[1].kind, movement_kind::adjustment);
  EXPECT_EQ((*xs)[1].timestamp, t0);
  ASSERT_TRUE((*xs)[1].actor_id);
  EXPECT_EQ(*(*xs)[1].actor_id, 3);
  ASSERT_TRUE((*xs)[1].note);
  EXPECT_EQ(*(*xs)[1].note, "stocktake");
  auto next = uut.apply(2, movement_kind::in, 1);
  ASSERT_TRUE(next);
  EXPECT_GT(next->id, last_id);
}

TEST_F(json_file_storage_test, new_items_take_the_next_free_id) {
  write_legacy_file();
  json_file_storage store{path};
  ASSERT_FALSE(store.open());
  item x;
  x.name = "Solvent";
  x.sku = "SOL-010";
  x.unit = "L";
  auto id = store.insert(x, std::nullopt);
  ASSERT_TRUE(id);
  EXPECT_EQ(*id, 3);
  x.id = 0;
  auto dup = store.insert(x, std::nullopt);
  ASSERT_FALSE(dup);
  EXPECT_EQ(dup.error(), ec::key_already_exists);
}

TEST_F(json_file_storage_test, legacy_movements_are_readable) {
  using namespace std::literals;
  write_legacy_file(legacy_file_with_movements);
  auto store = std::make_shared<json_file_storage>(path);
  ASSERT_FALSE(store->open());
  auto pos = store->position();
  ASSERT_TRUE(pos);
  EXPECT_EQ(pos->last_id, 3);
  EXPECT_EQ(pos->last_timestamp, march_first + 24h + 17h + 45min + 12s + 500us);
  auto clock = [] { return t0; };
  ledger uut{store, {}, clock};
  ASSERT_FALSE(uut.init());
  auto steel = uut.find(1);
  ASSERT_TRUE(steel);
  EXPECT_EQ(steel->unit, "sheets");
  auto xs = uut.history(1);
  ASSERT_TRUE(xs);
  ASSERT_EQ(xs->size(), 2u);
  EXPECT_EQ((*xs)[0].kind, movement_kind::out);
  EXPECT_EQ((*xs)[0].timestamp, march_first + 8h + 15min + 250ms);
  EXPECT_FALSE((*xs)[0].note);
  EXPECT_FALSE((*xs)[0].actor_id);
  EXPECT_EQ((*xs)[1].kind, movement_kind::adjustment);
  EXPECT_FALSE((*xs)[1].note);
  EXPECT_EQ(replay(*xs), 120);
  auto cement = uut.history(2);
  ASSERT_TRUE(cement);
  ASSERT_EQ(cement->size(), 1u);
  EXPECT_EQ(cement->front().timestamp, march_first + 9h);
  // The clock lags behind the file, new movements still continue after it.
  auto next = uut.apply(2, movement_kind::out, 10);
  ASSERT_TRUE(next);
  EXPECT_EQ(next->id, 4);
  EXPECT_EQ(next->timestamp, pos->last_timestamp);
}

TEST_F(json_file_storage_test, movements_are_written_as_iso_dates) {
  using namespace std::literals;
  write_legacy_file();
  auto clock = [] { return march_first + 8h + 15min + 250ms; };
  {
    auto store = std::make_shared<json_file_storage>(path);
    ASSERT_FALSE(store->open());
    ledger uut{store, {}, clock};
    ASSERT_FALSE(uut.init());
    ASSERT_TRUE(uut.apply(1, movement_kind::in, 5));
  }
  std::ifstream in{path};
  auto content = std::string{std::istreambuf_iterator<char>{in},
                             std::istreambuf_iterator<char>{}};
  EXPECT_NE(content.find(R"_("timestamp": "2024-03-01T08:15:00.250000")_"),
            std::string::npos);
}
