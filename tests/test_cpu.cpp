#include "minitest.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/RaplMeter.hpp"
#include "collectors/ThermalCollector.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using rtop::model::UnavailableReason;

static fs::path make_root_cpu(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("rtop_test_cpu_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  fs::create_directories(root / "sys");
  return root;
}

TEST(cpu_busy_pct_basic_and_reset) {
  rtop::model::CpuTimes a{}; a.user = 100; a.system = 100; a.idle = 1000;
  rtop::model::CpuTimes b{}; b.user = 150; b.system = 150; b.idle = 1100;
  ASSERT_NEAR(rtop::collectors::busy_pct(a, b), 50.0, 1e-9);
  // Counters going backwards (hotplug, wrap) and no elapsed time both read as idle
  ASSERT_NEAR(rtop::collectors::busy_pct(b, a), 0.0, 1e-9);
  ASSERT_NEAR(rtop::collectors::busy_pct(a, a), 0.0, 1e-9);
}

TEST(cpu_collector_delta_usage) {
  auto root = make_root_cpu("delta");
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n"
                                       "cpu0 100 0 100 1000 0 0 0 0\n"
                                       "intr 12345\n";
  std::ofstream(root / "proc/cpuinfo") << "processor\t: 0\nmodel name\t: Test CPU @ 3.00GHz\n";
  setenv("RTOP_PROC_ROOT", root.c_str(), 1);
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  rtop::collectors::CpuCollector c;
  auto first = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(first.has_value());
  ASSERT_NEAR(first->usage_pct, 0.0, 1e-9);
  ASSERT_EQ(first->model, std::string("Test CPU @ 3.00GHz"));
  ASSERT_EQ(first->logical_threads, 1);
  std::ofstream(root / "proc/stat") << "cpu  150 0 150 1100 0 0 0 0\n"
                                       "cpu0 150 0 150 1100 0 0 0 0\n";
  auto second = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(second.has_value());
  ASSERT_NEAR(second->usage_pct, 50.0, 0.01);
  ASSERT_EQ(second->per_core_pct.size(), 1u);
  ASSERT_NEAR(second->per_core_pct[0], 50.0, 0.01);
  // Nothing under the fake /sys: temperature and power are absent, not zero
  ASSERT_TRUE(!second->temperature_c.has_value());
  ASSERT_TRUE(!second->power_w.has_value());
  ASSERT_TRUE(!second->load_avg.has_value());
  ASSERT_TRUE(!second->core_freq_mhz.has_value());
  fs::remove_all(root);
}

TEST(cpu_collector_missing_stat_is_read_failed) {
  auto root = make_root_cpu("missing");
  setenv("RTOP_PROC_ROOT", root.c_str(), 1);
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  rtop::collectors::CpuCollector c;
  auto r = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(!r.has_value());
  ASSERT_TRUE(r.error().reason == UnavailableReason::ReadFailed);
  fs::remove_all(root);
}

TEST(cpu_temperature_from_coretemp_hwmon) {
  auto root = make_root_cpu("hwmon");
  fs::create_directories(root / "sys/class/hwmon/hwmon0");
  fs::create_directories(root / "sys/class/hwmon/hwmon1");
  std::ofstream(root / "sys/class/hwmon/hwmon0/name") << "nvme\n";
  std::ofstream(root / "sys/class/hwmon/hwmon0/temp1_input") << 90000 << "\n";
  std::ofstream(root / "sys/class/hwmon/hwmon1/name") << "coretemp\n";
  std::ofstream(root / "sys/class/hwmon/hwmon1/temp1_input") << 56000 << "\n";
  std::ofstream(root / "sys/class/hwmon/hwmon1/temp2_input") << 61000 << "\n";
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  rtop::collectors::ThermalCollector t;
  auto c = t.cpu_package_c();
  ASSERT_TRUE(c.has_value());
  ASSERT_NEAR(*c, 61.0, 1e-9);
  fs::remove_all(root);
}

TEST(cpu_temperature_falls_back_to_thermal_zone) {
  auto root = make_root_cpu("zone");
  fs::create_directories(root / "sys/class/thermal/thermal_zone0");
  fs::create_directories(root / "sys/class/thermal/thermal_zone1");
  std::ofstream(root / "sys/class/thermal/thermal_zone0/type") << "iwlwifi_1\n";
  std::ofstream(root / "sys/class/thermal/thermal_zone0/temp") << 70000 << "\n";
  std::ofstream(root / "sys/class/thermal/thermal_zone1/type") << "x86_pkg_temp\n";
  std::ofstream(root / "sys/class/thermal/thermal_zone1/temp") << 48000 << "\n";
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  rtop::collectors::ThermalCollector t;
  auto c = t.cpu_package_c();
  ASSERT_TRUE(c.has_value());
  ASSERT_NEAR(*c, 48.0, 1e-9);
  ASSERT_NEAR(rtop::collectors::normalize_celsius(45.5), 45.5, 1e-9);
  fs::remove_all(root);
}

TEST(rapl_power_from_energy_counter_with_wrap) {
  auto root = make_root_cpu("rapl");
  auto dom = root / "sys/class/powercap/intel-rapl:0";
  fs::create_directories(dom);
  std::ofstream(dom / "name") << "package-0\n";
  std::ofstream(dom / "max_energy_range_uj") << 1000000000ull << "\n";
  std::ofstream(dom / "energy_uj") << 999000000ull << "\n";
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  auto path = rtop::collectors::find_rapl_package_domain();
  ASSERT_EQ(path, std::string("/sys/class/powercap/intel-rapl:0"));
  rtop::collectors::RaplMeter meter(path);
  auto t0 = std::chrono::steady_clock::now();
  auto first = meter.sample(t0);
  ASSERT_TRUE(!first.has_value()); // needs two readings
  // 1,000,000 + 10,000,000 uJ across the wrap in one second = 11 W
  std::ofstream(dom / "energy_uj") << 10000000ull << "\n";
  auto second = meter.sample(t0 + std::chrono::seconds(1));
  ASSERT_TRUE(second.has_value());
  ASSERT_NEAR(*second, 11.0, 1e-6);
  fs::remove_all(root);
}

TEST(cpu_load_average_parsed) {
  auto root = make_root_cpu("loadavg");
  std::ofstream(root / "proc/loadavg") << "0.52 1.25 2.00 3/467 12345\n";
  setenv("RTOP_PROC_ROOT", root.c_str(), 1);
  auto la = rtop::collectors::read_load_avg();
  ASSERT_TRUE(la.has_value());
  ASSERT_NEAR(la->one, 0.52, 1e-9);
  ASSERT_NEAR(la->five, 1.25, 1e-9);
  ASSERT_NEAR(la->fifteen, 2.0, 1e-9);
  std::ofstream(root / "proc/loadavg") << "garbage\n";
  auto bad = rtop::collectors::read_load_avg();
  ASSERT_TRUE(!bad.has_value());
  ASSERT_TRUE(bad.error().reason == UnavailableReason::ReadFailed);
  fs::remove_all(root);
}

TEST(cpu_frequency_prefers_cpufreq_then_cpuinfo) {
  auto root = make_root_cpu("freq");
  fs::create_directories(root / "sys/devices/system/cpu/cpu0/cpufreq");
  std::ofstream(root / "sys/devices/system/cpu/cpu0/cpufreq/scaling_cur_freq") << "2400000\n";
  std::ofstream(root / "proc/cpuinfo") << "processor\t: 0\ncpu MHz\t\t: 800.000\n\n"
                                         "processor\t: 1\ncpu MHz\t\t: 1600.500\n\n"
                                         "processor\t: 2\n\n";
  setenv("RTOP_PROC_ROOT", root.c_str(), 1);
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  auto f = rtop::collectors::read_core_frequencies(3);
  ASSERT_TRUE(f.has_value());
  ASSERT_EQ(f->size(), 3u);
  ASSERT_NEAR((*f)[0], 2400.0, 1e-9);
  ASSERT_NEAR((*f)[1], 1600.5, 1e-9);
  ASSERT_NEAR((*f)[2], 0.0, 1e-9);
  ASSERT_NEAR(rtop::collectors::mean_frequency_mhz(*f), 2000.25, 1e-9);
  fs::remove_all(root);
  auto none = rtop::collectors::read_core_frequencies(2);
  ASSERT_TRUE(!none.has_value());
  ASSERT_TRUE(none.error().reason == UnavailableReason::NotPresent);
}
