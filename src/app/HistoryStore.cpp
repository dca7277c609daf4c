#include "app/HistoryStore.hpp"

namespace rtop::app {

bool HistoryStore::push(const std::string& name, std::chrono::steady_clock::time_point ts, double value) {
  auto it = series_.find(name);
  if (it == series_.end()) it = series_.emplace(name, rtop::model::HistorySeries(name, capacity_)).first;
  return it->second.push(ts, value);
}

void HistoryStore::append(const rtop::model::SystemSnapshot& snap) {
  const auto ts = snap.timestamp;
  if (snap.cpu) {
    push("cpu", ts, snap.cpu->usage_pct);
    for (size_t i = 0; i < snap.cpu->per_core_pct.size(); ++i)
      push("cpu." + std::to_string(i), ts, snap.cpu->per_core_pct[i]);
  }
  if (snap.memory) {
    push("mem", ts, snap.memory->used_pct());
    if (snap.memory->swap_total > 0) push("swap", ts, snap.memory->swap_pct());
  }
  if (snap.network) {
    push("net.rx", ts, snap.network->rx_bps());
    push("net.tx", ts, snap.network->tx_bps());
  }
  if (snap.gpu) {
    for (size_t i = 0; i < snap.gpu->devices.size(); ++i) {
      const auto& d = snap.gpu->devices[i];
      if (d.usage_pct) push("gpu." + std::to_string(i) + ".usage", ts, *d.usage_pct);
    }
  }
}

const rtop::model::HistorySeries* HistoryStore::find(std::string_view name) const {
  auto it = series_.find(name);
  return it == series_.end() ? nullptr : &it->second;
}

} // namespace rtop::app
