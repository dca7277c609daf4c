#pragma once
#include <string>
#include <vector>
#include "model/Gpu.hpp"

namespace rtop::util {

// Runtime NVML loader (dlopen/dlsym), so the binary has no link-time
// dependency on libnvidia-ml and runs unchanged on machines without it.
class NvmlDyn {
public:
  static NvmlDyn& instance();

  // Load libnvidia-ml and call nvmlInit once (idempotent). Honors config:
  //   [nvidia] disable_nvml / RTOP_DISABLE_NVML
  //   [nvidia] nvml_path / RTOP_NVML_PATH (system library prefixes only)
  bool load_once();

  // True if the library is loaded, core symbols resolved and nvmlInit succeeded.
  bool available() const;

  // Fill up to max_devices devices. Returns false if NVML is unusable or reports none.
  bool read_devices(std::vector<rtop::model::GpuDevice>& out, unsigned max_devices = 4);

  // Why load_once() failed, for the unavailability detail.
  const std::string& last_error() const { return error_; }

  void shutdown();

private:
  NvmlDyn() = default;
  ~NvmlDyn();
  NvmlDyn(const NvmlDyn&) = delete;
  NvmlDyn& operator=(const NvmlDyn&) = delete;

  void* handle_{};
  bool loaded_{false};
  bool initialized_{false};
  std::string error_{};

  using nvmlReturn_t = int; // NVML_SUCCESS == 0
  using nvmlDevice_t = void*;
  struct nvmlMemory_t { unsigned long long total, free, used; };
  struct nvmlUtilization_t { unsigned int gpu, memory; };

  nvmlReturn_t (*p_nvmlInit_v2)(){};
  nvmlReturn_t (*p_nvmlShutdown)(){};
  nvmlReturn_t (*p_nvmlDeviceGetCount_v2)(unsigned int* count){};
  nvmlReturn_t (*p_nvmlDeviceGetHandleByIndex_v2)(unsigned int index, nvmlDevice_t* device){};
  nvmlReturn_t (*p_nvmlDeviceGetName)(nvmlDevice_t device, char* name, unsigned int length){};
  nvmlReturn_t (*p_nvmlDeviceGetMemoryInfo)(nvmlDevice_t device, nvmlMemory_t* mem){};
  nvmlReturn_t (*p_nvmlDeviceGetTemperature)(nvmlDevice_t device, unsigned int sensorType, unsigned int* temp){};
  nvmlReturn_t (*p_nvmlDeviceGetUtilizationRates)(nvmlDevice_t device, nvmlUtilization_t* utilization){};
  nvmlReturn_t (*p_nvmlDeviceGetPowerUsage)(nvmlDevice_t device, unsigned int* milliwatts){};

  bool dlsym_all();
};

} // namespace rtop::util
