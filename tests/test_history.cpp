#include "minitest.hpp"
#include "app/HistoryStore.hpp"

using namespace rtop;
using Clock = std::chrono::steady_clock;

TEST(history_series_evicts_oldest_when_full) {
  model::HistorySeries s("cpu", 3);
  auto t0 = Clock::now();
  for (int i = 0; i < 4; ++i) ASSERT_TRUE(s.push(t0 + std::chrono::seconds(i), i * 10.0));
  ASSERT_EQ(s.size(), 3u);
  ASSERT_EQ(s.capacity(), 3u);
  auto v = s.values();
  ASSERT_EQ(v.size(), 3u);
  ASSERT_NEAR(v[0], 10.0, 1e-9);
  ASSERT_NEAR(v[2], 30.0, 1e-9);
  ASSERT_NEAR(s.latest(), 30.0, 1e-9);
}

TEST(history_series_rejects_older_timestamp) {
  model::HistorySeries s("mem", 4);
  auto t0 = Clock::now();
  ASSERT_TRUE(s.push(t0 + std::chrono::seconds(2), 1.0));
  ASSERT_TRUE(!s.push(t0, 2.0));
  ASSERT_EQ(s.size(), 1u);
  // Equal timestamps are accepted
  ASSERT_TRUE(s.push(t0 + std::chrono::seconds(2), 3.0));
  ASSERT_EQ(s.size(), 2u);
}

TEST(history_series_zero_capacity_holds_one) {
  model::HistorySeries s("x", 0);
  ASSERT_EQ(s.capacity(), 1u);
  ASSERT_TRUE(s.empty());
  ASSERT_NEAR(s.latest(), 0.0, 1e-9);
}

TEST(history_store_appends_present_fields_only) {
  app::HistoryStore store(8);
  model::SystemSnapshot snap;
  snap.timestamp = Clock::now();
  model::CpuSnapshot cpu;
  cpu.usage_pct = 40;
  cpu.per_core_pct = {20, 60};
  snap.cpu = cpu;
  model::MemorySnapshot mem;
  mem.total = 200; mem.used = 50;
  snap.memory = mem; // no swap
  model::GpuSnapshot gpu;
  model::GpuDevice d;
  d.usage_pct = 12.5;
  model::GpuDevice idle; // usage absent
  gpu.devices = {d, idle};
  snap.gpu = gpu;
  store.append(snap);

  ASSERT_TRUE(store.find("cpu") != nullptr);
  ASSERT_NEAR(store.find("cpu.1")->latest(), 60.0, 1e-9);
  ASSERT_NEAR(store.find("mem")->latest(), 25.0, 1e-9);
  ASSERT_TRUE(store.find("swap") == nullptr);
  ASSERT_TRUE(store.find("net.rx") == nullptr);
  ASSERT_NEAR(store.find("gpu.0.usage")->latest(), 12.5, 1e-9);
  ASSERT_TRUE(store.find("gpu.1.usage") == nullptr);
  ASSERT_EQ(store.series_count(), 5u);
  ASSERT_EQ(store.find("cpu")->capacity(), 8u);
}

TEST(history_store_skips_stale_snapshot) {
  app::HistoryStore store(4);
  auto t0 = Clock::now();
  ASSERT_TRUE(store.push("net.rx", t0 + std::chrono::seconds(1), 5.0));
  model::SystemSnapshot old;
  old.timestamp = t0;
  model::NetSnapshot net;
  net.agg_rx_bps = 99;
  old.network = net;
  store.append(old);
  ASSERT_EQ(store.find("net.rx")->size(), 1u);
  ASSERT_NEAR(store.find("net.rx")->latest(), 5.0, 1e-9);
  ASSERT_EQ(store.find("net.tx")->size(), 1u);
}
