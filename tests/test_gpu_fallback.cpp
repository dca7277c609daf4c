#include "minitest.hpp"
#include "collectors/GpuCollector.hpp"
#include "collectors/IntelGpuCollector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using rtop::model::Reading;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;
using Clock = std::chrono::steady_clock;

// Fake /proc + /sys with one Intel card and nothing else.
static fs::path make_intel_root(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("rtop_test_gpu_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "sys/class/drm/card0/device");
  fs::create_directories(root / "sys/class/drm/card0-eDP-1");
  fs::create_directories(root / "proc");
  std::ofstream(root / "sys/class/drm/card0/device/vendor") << "0x8086\n";
  std::ofstream(root / "sys/class/drm/card0/device/device") << "0x9a49\n";
  std::ofstream(root / "proc/meminfo") <<
    "MemTotal:       16000000 kB\n"
    "MemAvailable:    8000000 kB\n"
    "Shmem:            500000 kB\n";
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  setenv("RTOP_PROC_ROOT", root.c_str(), 1);
  return root;
}

TEST(intel_usage_absent_but_temperature_present) {
  auto root = make_intel_root("indep");
  fs::create_directories(root / "sys/class/thermal/thermal_zone0");
  std::ofstream(root / "sys/class/thermal/thermal_zone0/type") << "x86_pkg_temp\n";
  std::ofstream(root / "sys/class/thermal/thermal_zone0/temp") << 48000 << "\n";
  rtop::collectors::IntelGpuCollector c;
  auto d = c.sample_at(Clock::now());
  ASSERT_TRUE(d.has_value());
  ASSERT_TRUE(d->vendor == rtop::model::GpuVendor::Intel);
  ASSERT_EQ(d->name, std::string("Intel Graphics [0x9a49]"));
  ASSERT_TRUE(!d->usage_pct.has_value());
  ASSERT_TRUE(d->usage_pct.error().reason == UnavailableReason::NotPresent);
  ASSERT_TRUE(d->temperature_c.has_value());
  ASSERT_NEAR(*d->temperature_c, 48.0, 1e-9);
  // No debugfs: memory comes from system RAM and says so
  ASSERT_EQ(d->mem_label, std::string("Shared"));
  ASSERT_TRUE(d->mem_used_bytes.has_value());
  ASSERT_EQ(*d->mem_used_bytes, 500000ull * 1024);
  ASSERT_TRUE(d->mem_total_bytes.has_value());
  ASSERT_EQ(*d->mem_total_bytes, 8500000ull * 1024);
  ASSERT_TRUE(!d->power_w.has_value());
  fs::remove_all(root);
}

TEST(intel_usage_from_busy_percent) {
  auto root = make_intel_root("busy");
  std::ofstream(root / "sys/class/drm/card0/device/gpu_busy_percent") << "37\n";
  rtop::collectors::IntelGpuCollector c;
  auto d = c.sample_at(Clock::now());
  ASSERT_TRUE(d.has_value());
  ASSERT_TRUE(d->usage_pct.has_value());
  ASSERT_NEAR(*d->usage_pct, 37.0, 1e-9);
  // Smoothed toward the next reading
  std::ofstream(root / "sys/class/drm/card0/device/gpu_busy_percent") << "87\n";
  auto d2 = c.sample_at(Clock::now());
  ASSERT_NEAR(*d2->usage_pct, 37.0 + (87.0 - 37.0) * 0.6, 1e-9);
  ASSERT_TRUE(!d2->temperature_c.has_value());
  fs::remove_all(root);
}

TEST(intel_usage_from_rc6_residency) {
  auto root = make_intel_root("rc6");
  fs::create_directories(root / "sys/class/drm/card0/power");
  std::ofstream(root / "sys/class/drm/card0/power/rc6_residency_ms") << 10000 << "\n";
  rtop::collectors::IntelGpuCollector c;
  auto t0 = Clock::now();
  auto first = c.sample_at(t0);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(!first->usage_pct.has_value()); // one reading is not a rate
  // 250 ms idle in one second = 75% busy
  std::ofstream(root / "sys/class/drm/card0/power/rc6_residency_ms") << 10250 << "\n";
  auto second = c.sample_at(t0 + std::chrono::seconds(1));
  ASSERT_TRUE(second->usage_pct.has_value());
  ASSERT_NEAR(*second->usage_pct, 75.0, 1e-6);
  fs::remove_all(root);
}

TEST(intel_no_card_is_not_present) {
  auto root = fs::temp_directory_path() / (std::string("rtop_test_gpu_none_") + std::to_string(::getpid()));
  fs::create_directories(root / "sys/class/drm/card0/device");
  std::ofstream(root / "sys/class/drm/card0/device/vendor") << "0x10de\n";
  setenv("RTOP_SYS_ROOT", root.c_str(), 1);
  rtop::collectors::IntelGpuCollector c;
  auto d = c.sample_at(Clock::now());
  ASSERT_TRUE(!d.has_value());
  ASSERT_TRUE(d.error().reason == UnavailableReason::NotPresent);
  fs::remove_all(root);
}

TEST(first_available_prefers_permission_denied) {
  auto r = rtop::collectors::first_available<double>({
    []() -> Reading<double> { return unavailable(UnavailableReason::NotPresent); },
    []() -> Reading<double> { return unavailable(UnavailableReason::PermissionDenied, "/sys/x"); },
    []() -> Reading<double> { return unavailable(UnavailableReason::ReadFailed); },
  });
  ASSERT_TRUE(!r.has_value());
  ASSERT_TRUE(r.error().reason == UnavailableReason::PermissionDenied);
  ASSERT_EQ(r.error().detail, std::string("/sys/x"));

  int calls = 0;
  auto ok = rtop::collectors::first_available<double>({
    [&]() -> Reading<double> { ++calls; return unavailable(UnavailableReason::NotPresent); },
    [&]() -> Reading<double> { ++calls; return 12.5; },
    [&]() -> Reading<double> { ++calls; return 99.0; },
  });
  ASSERT_TRUE(ok.has_value());
  ASSERT_NEAR(*ok, 12.5, 1e-9);
  ASSERT_EQ(calls, 2);
}

TEST(gem_objects_parse) {
  auto v = rtop::collectors::parse_gem_objects_bytes(
    "1234 shrinkable [0 free] objects, 524288000 bytes\n"
    "system: total:0x0000000400000000, available:0x00000003e0000000 bytes\n");
  ASSERT_TRUE(v.has_value());
  ASSERT_EQ(*v, 524288000ull);
  ASSERT_TRUE(!rtop::collectors::parse_gem_objects_bytes("no numbers here\n").has_value());
}

namespace {

class FakeNvidia : public rtop::collectors::NvidiaSource {
public:
  explicit FakeNvidia(Reading<std::vector<rtop::model::GpuDevice>> r) : r_(std::move(r)) {}
  Reading<std::vector<rtop::model::GpuDevice>> sample(std::chrono::milliseconds) override { return r_; }
  const char* name() const override { return "fake-nvidia"; }
private:
  Reading<std::vector<rtop::model::GpuDevice>> r_;
};

class FakeIntel : public rtop::collectors::IntelSource {
public:
  explicit FakeIntel(Reading<rtop::model::GpuDevice> r) : r_(std::move(r)) {}
  Reading<rtop::model::GpuDevice> sample(std::chrono::milliseconds) override { return r_; }
  const char* name() const override { return "fake-intel"; }
private:
  Reading<rtop::model::GpuDevice> r_;
};

} // namespace

TEST(gpu_collector_merges_vendors) {
  rtop::model::GpuDevice nv; nv.vendor = rtop::model::GpuVendor::Nvidia; nv.name = "RTX"; nv.usage_pct = 10.0;
  rtop::model::GpuDevice in; in.vendor = rtop::model::GpuVendor::Intel; in.name = "Intel Graphics";
  rtop::collectors::GpuCollector c(std::make_unique<FakeNvidia>(std::vector<rtop::model::GpuDevice>{nv}),
                                   std::make_unique<FakeIntel>(in));
  auto s = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(s->devices.size(), 2u);
  ASSERT_TRUE(s->devices[0].vendor == rtop::model::GpuVendor::Nvidia);
  ASSERT_TRUE(s->devices[1].vendor == rtop::model::GpuVendor::Intel);
}

TEST(gpu_collector_intel_only_when_nvml_missing) {
  rtop::model::GpuDevice in; in.vendor = rtop::model::GpuVendor::Intel;
  rtop::collectors::GpuCollector c(
      std::make_unique<FakeNvidia>(unavailable(UnavailableReason::NotPresent, "libnvidia-ml.so.1 not found")),
      std::make_unique<FakeIntel>(in));
  auto s = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(s.has_value());
  ASSERT_EQ(s->devices.size(), 1u);
}

TEST(gpu_collector_absent_when_no_vendor_reports) {
  rtop::collectors::GpuCollector c(
      std::make_unique<FakeNvidia>(unavailable(UnavailableReason::PermissionDenied, "nvmlInit")),
      std::make_unique<FakeIntel>(unavailable(UnavailableReason::NotPresent)));
  auto s = c.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(!s.has_value());
  ASSERT_TRUE(s.error().reason == UnavailableReason::PermissionDenied);

  rtop::collectors::GpuCollector none(nullptr, std::make_unique<FakeIntel>(unavailable(UnavailableReason::NotPresent)));
  auto n = none.sample(std::chrono::milliseconds(100));
  ASSERT_TRUE(!n.has_value());
  ASSERT_TRUE(n.error().reason == UnavailableReason::NotPresent);
}
