#include "minitest.hpp"
#include "fakes.hpp"
#include "app/ProcessTable.hpp"

using namespace rtop::app;
using Clock = std::chrono::steady_clock;

// Two samples one second apart: pid 1 uses 5 ticks, pid 2 uses 90.
TEST(processes_sorted_by_cpu_then_filtered_by_name) {
  fakes::ScriptedProcesses src;
  fakes::RecordingKiller killer;
  ProcessTable table(src, killer, false);
  auto t0 = Clock::now();
  src.current = {fakes::proc(1, 0, "a", 0), fakes::proc(2, 1, "b", 0)};
  table.refresh(t0);
  src.current = {fakes::proc(1, 0, "a", 5), fakes::proc(2, 1, "b", 90)};
  table.refresh(t0 + std::chrono::seconds(1));

  ASSERT_NEAR(table.find(1)->cpu_pct, 5.0, 1e-6);
  ASSERT_NEAR(table.find(2)->cpu_pct, 90.0, 1e-6);

  auto rows = table.visible_rows(SortMode::Cpu, "", false);
  ASSERT_EQ(rows.size(), 2u);
  ASSERT_EQ(rows[0].entry.pid, 2);
  ASSERT_EQ(rows[1].entry.pid, 1);

  auto filtered = table.visible_rows(SortMode::Cpu, "a", false);
  ASSERT_EQ(filtered.size(), 1u);
  ASSERT_EQ(filtered[0].entry.pid, 1);
}

TEST(sort_and_filter_free_functions_agree) {
  std::vector<rtop::model::ProcessEntry> es(2);
  es[0].pid = 1; es[0].name = "a"; es[0].cpu_pct = 5;
  es[1].pid = 2; es[1].name = "b"; es[1].cpu_pct = 90;
  auto sorted = sort_entries(es, SortMode::Cpu);
  ASSERT_EQ(sorted[0].pid, 2);
  auto only_a = filter_entries(sorted, "A");
  ASSERT_EQ(only_a.size(), 1u);
  ASSERT_EQ(only_a[0].pid, 1);
}
