// (c) 2024, Interance GmbH & Co KG.

#include "ledger.hpp"

#include "memory_storage.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <random>
#include <thread>

using namespace std::literals;

namespace {

const auto t0 = caf::timestamp{std::chrono::hours{24 * 19'000}};

constexpr auto day = std::chrono::hours{24};

// A storage that fails every write once `broken` is set.
class flaky_storage : public memory_storage {
public:
  caf::expected<int32_t>
  insert(const item& new_item,
         const std::optional<movement>& opening) override {
    if (broken)
      return caf::make_error(ec::storage_unavailable);
    return memory_storage::insert(new_item, opening);
  }

  ec commit(const item& updated, const movement& appended) override {
    if (broken)
      return ec::storage_unavailable;
    return memory_storage::commit(updated, appended);
  }

  std::atomic<bool> broken = false;
};

class ledger_test : public testing::Test {
protected:
  void SetUp() override {
    store = std::make_shared<flaky_storage>();
    ASSERT_FALSE(store->open());
    reset({});
  }

  void reset(ledger_config cfg) {
    uut = std::make_unique<ledger>(store, cfg, [this] { return now; });
    ASSERT_FALSE(uut->init());
  }

  int32_t add(std::string sku, double quantity, double min_quantity) {
    item x;
    x.name = "material " + sku;
    x.sku = std::move(sku);
    x.unit = "kg";
    x.current_quantity = quantity;
    x.min_quantity = min_quantity;
    x.supplier = "Plastico";
    x.warehouse = "Main Warehouse";
    auto res = uut->register_item(std::move(x));
    EXPECT_TRUE(res) << "failed to register an item";
    return res ? res->id : 0;
  }

  double quantity_of(int32_t id) {
    auto res = uut->find(id);
    EXPECT_TRUE(res) << "no item with ID " << id;
    return res ? res->current_quantity : -1;
  }

  stock_status status_of(int32_t id) {
    auto res = uut->get_status(id);
    EXPECT_TRUE(res) << "no status for item " << id;
    return res ? *res : stock_status::normal;
  }

  std::shared_ptr<flaky_storage> store;
  caf::timestamp now = t0;
  std::unique_ptr<ledger> uut;
};

} // namespace

TEST_F(ledger_test, movements_drive_the_traffic_light) {
  auto id = add("STL-001", 150, 50);
  EXPECT_EQ(status_of(id), stock_status::normal);
  ASSERT_TRUE(uut->apply(id, movement_kind::out, 120));
  EXPECT_EQ(quantity_of(id), 30);
  EXPECT_EQ(status_of(id), stock_status::warning);
  ASSERT_TRUE(uut->apply(id, movement_kind::out, 40));
  EXPECT_EQ(quantity_of(id), 0);
  EXPECT_EQ(status_of(id), stock_status::critical);
  ASSERT_TRUE(uut->apply(id, movement_kind::adjustment, 500));
  EXPECT_EQ(quantity_of(id), 500);
  EXPECT_EQ(status_of(id), stock_status::normal);
}

TEST_F(ledger_test, registering_records_the_opening_stock) {
  auto id = add("STL-001", 150, 50);
  auto xs = uut->history(id);
  ASSERT_TRUE(xs);
  ASSERT_EQ(xs->size(), 1u);
  EXPECT_EQ(xs->front().kind, movement_kind::adjustment);
  EXPECT_EQ(xs->front().quantity, 150);
  EXPECT_EQ(xs->front().timestamp, t0);
  ASSERT_TRUE(xs->front().note);
  EXPECT_EQ(*xs->front().note, "opening stock");
  auto empty = add("PLA-001", 0, 10);
  xs = uut->history(empty);
  ASSERT_TRUE(xs);
  EXPECT_TRUE(xs->empty());
}

TEST_F(ledger_test, failed_registrations_leave_no_trace) {
  store->broken = true;
  item x;
  x.name = "Steel Sheets";
  x.sku = "STL-001";
  x.current_quantity = 150;
  x.min_quantity = 50;
  auto res = uut->register_item(x);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), ec::storage_unavailable);
  auto xs = uut->items();
  ASSERT_TRUE(xs);
  EXPECT_TRUE(xs->empty());
  // Registering the same SKU again succeeds once the storage recovers.
  store->broken = false;
  res = uut->register_item(x);
  ASSERT_TRUE(res);
  EXPECT_EQ(quantity_of(res->id), 150);
  auto history = uut->history(res->id);
  ASSERT_TRUE(history);
  ASSERT_EQ(history->size(), 1u);
  EXPECT_EQ(history->front().item_id, res->id);
  auto replayed = uut->replay(res->id);
  ASSERT_TRUE(replayed);
  EXPECT_EQ(*replayed, 150);
}

TEST_F(ledger_test, registering_rejects_duplicate_skus) {
  add("STL-001", 150, 50);
  item dup;
  dup.name = "Other Steel";
  dup.sku = "STL-001";
  auto res = uut->register_item(dup);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), ec::key_already_exists);
  dup.sku.clear();
  res = uut->register_item(dup);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), ec::invalid_argument);
}

TEST_F(ledger_test, invalid_quantities_leave_the_item_untouched) {
  auto id = add("STL-001", 150, 50);
  for (auto [kind, quantity] : {std::pair{movement_kind::in, 0.0},
                                std::pair{movement_kind::in, -5.0},
                                std::pair{movement_kind::out, 0.0},
                                std::pair{movement_kind::adjustment, -1.0}}) {
    auto res = uut->apply(id, kind, quantity);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), ec::invalid_quantity);
  }
  EXPECT_EQ(quantity_of(id), 150);
  auto xs = uut->history(id);
  ASSERT_TRUE(xs);
  EXPECT_EQ(xs->size(), 1u);
}

TEST_F(ledger_test, quantities_are_checked_before_items) {
  auto res = uut->apply(99, movement_kind::in, -1);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), ec::invalid_quantity);
  res = uut->apply(99, movement_kind::in, 1);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), ec::no_such_item);
}

TEST_F(ledger_test, overflowing_quantities_are_rejected) {
  auto id = add("STL-001", 1e308, 0);
  auto res = uut->apply(id, movement_kind::in, 1e308);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), ec::invalid_quantity);
  EXPECT_EQ(quantity_of(id), 1e308);
}

TEST_F(ledger_test, unknown_items_have_no_status_or_history) {
  auto status = uut->get_status(42);
  ASSERT_FALSE(status);
  EXPECT_EQ(status.error(), ec::no_such_item);
  auto xs = uut->history(42);
  ASSERT_FALSE(xs);
  EXPECT_EQ(xs.error(), ec::no_such_item);
  auto prediction = uut->predict_shortage(42);
  ASSERT_FALSE(prediction);
  EXPECT_EQ(prediction.error(), ec::no_such_item);
}

TEST_F(ledger_test, movement_ids_increase_across_items) {
  auto a = add("A-1", 10, 1);
  auto b = add("B-1", 10, 1);
  int64_t last = 0;
  for (int i = 0; i < 20; ++i) {
    auto res = uut->apply(i % 2 == 0 ? a : b, movement_kind::in, 1);
    ASSERT_TRUE(res);
    EXPECT_GT(res->id, last);
    last = res->id;
  }
}

TEST_F(ledger_test, timestamps_never_go_backwards) {
  auto id = add("STL-001", 100, 10);
  now = t0 + 1h;
  auto first = uut->apply(id, movement_kind::out, 1);
  ASSERT_TRUE(first);
  now = t0; // The clock jumps back.
  auto second = uut->apply(id, movement_kind::out, 1);
  ASSERT_TRUE(second);
  EXPECT_GE(second->timestamp, first->timestamp);
  EXPECT_GT(second->id, first->id);
}

TEST_F(ledger_test, a_new_ledger_continues_the_movement_log) {
  auto id = add("STL-001", 100, 10);
  auto first = uut->apply(id, movement_kind::out, 1);
  ASSERT_TRUE(first);
  reset({});
  auto second = uut->apply(id, movement_kind::out, 1);
  ASSERT_TRUE(second);
  EXPECT_GT(second->id, first->id);
}

TEST_F(ledger_test, quantities_match_a_replay_of_the_history) {
  auto id = add("STL-001", 0, 10);
  std::mt19937 rng{42};
  std::uniform_int_distribution<int> kinds{0, 2};
  std::uniform_real_distribution<double> amounts{0.5, 300.0};
  for (int i = 0; i < 500; ++i) {
    auto kind = static_cast<movement_kind>(kinds(rng));
    auto res = uut->apply(id, kind, amounts(rng));
    ASSERT_TRUE(res);
    ASSERT_GE(quantity_of(id), 0);
  }
  auto replayed = uut->replay(id);
  ASSERT_TRUE(replayed);
  EXPECT_EQ(*replayed, quantity_of(id));
}

TEST_F(ledger_test, large_withdrawals_clamp_to_zero) {
  auto id = add("STL-001", 30, 50);
  auto res = uut->apply(id, movement_kind::out, 1e12);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->quantity, 1e12);
  EXPECT_EQ(quantity_of(id), 0);
}

TEST_F(ledger_test, overdraw_can_be_rejected) {
  ledger_config cfg;
  cfg.reject_overdraw = true;
  reset(cfg);
  auto id = add("STL-001", 30, 50);
  auto res = uut->apply(id, movement_kind::out, 40);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), ec::insufficient_stock);
  EXPECT_EQ(quantity_of(id), 30);
  EXPECT_TRUE(uut->apply(id, movement_kind::out, 30));
  EXPECT_EQ(quantity_of(id), 0);
}

TEST_F(ledger_test, storage_failures_leave_no_trace) {
  auto id = add("STL-001", 150, 50);
  store->broken = true;
  auto res = uut->apply(id, movement_kind::out, 20);
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error(), ec::storage_unavailable);
  store->broken = false;
  EXPECT_EQ(quantity_of(id), 150);
  auto xs = uut->history(id);
  ASSERT_TRUE(xs);
  EXPECT_EQ(xs->size(), 1u);
  EXPECT_TRUE(uut->apply(id, movement_kind::out, 20));
  EXPECT_EQ(quantity_of(id), 130);
}

TEST_F(ledger_test, concurrent_movements_on_one_item_are_serialized) {
  auto id = add("STL-001", 0, 10);
  constexpr int num_threads = 8;
  constexpr int num_movements = 250;
  std::vector<std::thread> threads;
  std::atomic<int> failures = 0;
  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, id, &failures] {
      for (int j = 0; j < num_movements; ++j)
        if (!uut->apply(id, movement_kind::in, 1))
          ++failures;
    });
  }
  for (auto& thread : threads)
    thread.join();
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(quantity_of(id), num_threads * num_movements);
  auto xs = uut->history(id);
  ASSERT_TRUE(xs);
  for (size_t i = 1; i < xs->size(); ++i)
    EXPECT_LT((*xs)[i - 1].id, (*xs)[i].id);
}

TEST_F(ledger_test, recent_movements_start_at_the_given_time) {
  auto id = add("STL-001", 100, 10);
  now = t0 + day;
  ASSERT_TRUE(uut->apply(id, movement_kind::out, 5));
  now = t0 + 2 * day;
  ASSERT_TRUE(uut->apply(id, movement_kind::out, 7));
  auto xs = uut->list_recent(id, t0 + day);
  ASSERT_TRUE(xs);
  ASSERT_EQ(xs->size(), 2u);
  EXPECT_EQ((*xs)[0].quantity, 5);
  EXPECT_EQ((*xs)[1].quantity, 7);
}

TEST_F(ledger_test, items_without_consumption_run_out_in_thirty_days) {
  auto id = add("STL-001", 100, 10);
  ASSERT_TRUE(uut->apply(id, movement_kind::in, 50));
  now = t0 + 3 * day;
  auto res = uut->predict_shortage(id);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->shortage_date, now + 30 * day);
  EXPECT_FALSE(res->reliable);
}

TEST_F(ledger_test, predictions_use_the_average_usage_from_the_ledger) {
  auto id = add("STL-001", 400, 10);
  now = t0 + day;
  ASSERT_TRUE(uut->apply(id, movement_kind::out, 300));
  now = t0 + 2 * day;
  auto res = uut->predict_shortage(id, 30);
  ASSERT_TRUE(res);
  EXPECT_DOUBLE_EQ(res->avg_daily_usage, 10.0);
  EXPECT_EQ(res->current_quantity, 100);
  EXPECT_EQ(res->shortage_date, now + 10 * day);
  EXPECT_TRUE(res->reliable);
}

TEST_F(ledger_test, estimates_accept_a_given_usage) {
  auto id = add("STL-001", 100, 10);
  auto res = uut->estimate_shortage(id, 10);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->shortage_date, t0 + 10 * day);
}

TEST_F(ledger_test, lookback_windows_must_be_positive) {
  auto id = add("STL-001", 100, 10);
  for (auto days : {0, -1, max_lookback_days + 1}) {
    auto res = uut->predict_shortage(id, days);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), ec::invalid_argument);
    auto all = uut->predict_all(days);
    ASSERT_FALSE(all);
    EXPECT_EQ(all.error(), ec::invalid_argument);
  }
}

TEST_F(ledger_test, predict_all_covers_every_item) {
  auto a = add("A-1", 100, 10);
  auto b = add("B-1", 50, 10);
  now = t0 + day;
  ASSERT_TRUE(uut->apply(a, movement_kind::out, 70));
  auto res = uut->predict_all(7);
  ASSERT_TRUE(res);
  ASSERT_EQ(res->size(), 2u);
  EXPECT_EQ((*res)[0].item_id, a);
  EXPECT_TRUE((*res)[0].reliable);
  EXPECT_DOUBLE_EQ((*res)[0].avg_daily_usage, 10.0);
  EXPECT_EQ((*res)[0].shortage_date, now + 3 * day);
  EXPECT_EQ((*res)[1].item_id, b);
  EXPECT_FALSE((*res)[1].reliable);
}

TEST_F(ledger_test, alerts_reflect_the_current_quantities) {
  auto a = add("A-1", 100, 10);
  auto b = add("B-1", 12, 10);
  auto alerts = uut->list_alerts();
  ASSERT_TRUE(alerts);
  ASSERT_EQ(alerts->size(), 1u);
  EXPECT_EQ(alerts->front().subject.id, b);
  ASSERT_TRUE(uut->apply(a, movement_kind::out, 100));
  alerts = uut->list_alerts();
  ASSERT_TRUE(alerts);
  ASSERT_EQ(alerts->size(), 2u);
  EXPECT_EQ((*alerts)[0].subject.id, a);
  EXPECT_EQ((*alerts)[0].status, stock_status::critical);
}
