#include "util/NvmlDyn.hpp"
#include "util/Log.hpp"
#include "ui/Config.hpp"
#include <dlfcn.h>
#include <string>
#include <vector>

namespace rtop::util {

using rtop::model::GpuDevice;
using rtop::model::GpuVendor;
using rtop::model::UnavailableReason;
using rtop::model::unavailable;

static const int NVML_SUCCESS = 0;
static const unsigned int NVML_TEMPERATURE_GPU = 0;

NvmlDyn& NvmlDyn::instance() {
  static NvmlDyn inst;
  return inst;
}

NvmlDyn::~NvmlDyn() { shutdown(); }

bool NvmlDyn::load_once() {
  if (loaded_) return initialized_;
  loaded_ = true;
  const auto& nvcfg = rtop::ui::config().nvidia;
  if (nvcfg.disable_nvml) { error_ = "disabled by config"; return false; }

  std::vector<std::string> candidates;
  if (!nvcfg.nvml_path.empty()) {
    static const char* allowed_prefixes[] = {
      "/usr/lib", "/usr/lib64", "/usr/local/lib", "/usr/local/lib64", "/opt/nvidia", "/opt/cuda"
    };
    bool valid = false;
    for (const char* prefix : allowed_prefixes) {
      if (nvcfg.nvml_path.rfind(prefix, 0) == 0) { valid = true; break; }
    }
    if (valid) candidates.push_back(nvcfg.nvml_path);
    else log_msg("RTOP_NVML_PATH rejected (not under a system library prefix): %s", nvcfg.nvml_path.c_str());
  }
  candidates.emplace_back("libnvidia-ml.so.1");
  candidates.emplace_back("libnvidia-ml.so");

  for (const auto& lib : candidates) {
    handle_ = ::dlopen(lib.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (handle_) break;
  }
  if (!handle_) { error_ = "libnvidia-ml not found"; return false; }
  if (!dlsym_all()) {
    log_once("nvml.symbols", "libnvidia-ml is missing required symbols; NVIDIA telemetry disabled");
    ::dlclose(handle_); handle_ = nullptr;
    error_ = "libnvidia-ml incomplete";
    return false;
  }
  if (int rc = p_nvmlInit_v2(); rc != NVML_SUCCESS) {
    log_once("nvml.init", "nvmlInit failed (code %d); NVIDIA telemetry disabled", rc);
    ::dlclose(handle_); handle_ = nullptr;
    error_ = "nvmlInit failed";
    return false;
  }
  initialized_ = true;
  return true;
}

bool NvmlDyn::dlsym_all() {
  auto L = [&](const char* sym){ return ::dlsym(handle_, sym); };
  p_nvmlInit_v2 = (nvmlReturn_t (*)())L("nvmlInit_v2");
  p_nvmlShutdown = (nvmlReturn_t (*)())L("nvmlShutdown");
  p_nvmlDeviceGetCount_v2 = (nvmlReturn_t (*)(unsigned int*))L("nvmlDeviceGetCount_v2");
  p_nvmlDeviceGetHandleByIndex_v2 = (nvmlReturn_t (*)(unsigned int, nvmlDevice_t*))L("nvmlDeviceGetHandleByIndex_v2");
  p_nvmlDeviceGetName = (nvmlReturn_t (*)(nvmlDevice_t, char*, unsigned int))L("nvmlDeviceGetName");
  p_nvmlDeviceGetMemoryInfo = (nvmlReturn_t (*)(nvmlDevice_t, nvmlMemory_t*))L("nvmlDeviceGetMemoryInfo");
  p_nvmlDeviceGetTemperature = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int, unsigned int*))L("nvmlDeviceGetTemperature");
  p_nvmlDeviceGetUtilizationRates = (nvmlReturn_t (*)(nvmlDevice_t, nvmlUtilization_t*))L("nvmlDeviceGetUtilizationRates");
  p_nvmlDeviceGetPowerUsage = (nvmlReturn_t (*)(nvmlDevice_t, unsigned int*))L("nvmlDeviceGetPowerUsage");
  return p_nvmlInit_v2 && p_nvmlShutdown && p_nvmlDeviceGetCount_v2 && p_nvmlDeviceGetHandleByIndex_v2;
}

bool NvmlDyn::available() const { return handle_ != nullptr && initialized_; }

void NvmlDyn::shutdown() {
  if (initialized_ && p_nvmlShutdown) p_nvmlShutdown();
  initialized_ = false;
  if (handle_) { ::dlclose(handle_); handle_ = nullptr; }
}

bool NvmlDyn::read_devices(std::vector<GpuDevice>& out, unsigned max_devices) {
  out.clear();
  if (!load_once() || !available()) return false;

  unsigned int n = 0;
  if (p_nvmlDeviceGetCount_v2(&n) != NVML_SUCCESS) return false;
  if (n > max_devices) n = max_devices;

  for (unsigned int i = 0; i < n; ++i) {
    nvmlDevice_t dev{};
    if (p_nvmlDeviceGetHandleByIndex_v2(i, &dev) != NVML_SUCCESS) continue;

    GpuDevice rec{};
    rec.vendor = GpuVendor::Nvidia;
    if (p_nvmlDeviceGetName) {
      char name[96]; name[0] = '\0';
      if (p_nvmlDeviceGetName(dev, name, sizeof(name)) == NVML_SUCCESS && name[0]) rec.name = name;
    }
    if (rec.name.empty()) rec.name = "NVIDIA GPU " + std::to_string(i);

    // Each query is independent: a failing call leaves only its own field absent.
    rec.temperature_c = unavailable(UnavailableReason::NotSupported);
    if (p_nvmlDeviceGetTemperature) {
      unsigned int tc = 0;
      if (p_nvmlDeviceGetTemperature(dev, NVML_TEMPERATURE_GPU, &tc) == NVML_SUCCESS) rec.temperature_c = static_cast<double>(tc);
    }
    rec.usage_pct = unavailable(UnavailableReason::NotSupported);
    if (p_nvmlDeviceGetUtilizationRates) {
      nvmlUtilization_t ur{};
      if (p_nvmlDeviceGetUtilizationRates(dev, &ur) == NVML_SUCCESS) rec.usage_pct = static_cast<double>(ur.gpu);
    }
    rec.mem_used_bytes = unavailable(UnavailableReason::NotSupported);
    rec.mem_total_bytes = unavailable(UnavailableReason::NotSupported);
    if (p_nvmlDeviceGetMemoryInfo) {
      nvmlMemory_t mem{};
      if (p_nvmlDeviceGetMemoryInfo(dev, &mem) == NVML_SUCCESS && mem.total > 0) {
        rec.mem_used_bytes = static_cast<uint64_t>(mem.used);
        rec.mem_total_bytes = static_cast<uint64_t>(mem.total);
      }
    }
    rec.power_w = unavailable(UnavailableReason::NotSupported);
    if (p_nvmlDeviceGetPowerUsage) {
      unsigned int mw = 0;
      if (p_nvmlDeviceGetPowerUsage(dev, &mw) == NVML_SUCCESS) rec.power_w = static_cast<double>(mw) / 1000.0;
    }
    out.push_back(std::move(rec));
  }
  return !out.empty();
}

} // namespace rtop::util
