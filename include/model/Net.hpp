#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rtop::model {

struct NetIf {
  std::string name;
  uint64_t rx_total{};  // cumulative bytes
  uint64_t tx_total{};
  uint64_t rx_delta{};  // bytes since previous sample; 0 on first sample or counter reset
  uint64_t tx_delta{};
  double rx_bps{};
  double tx_bps{};
};

struct NetSnapshot {
  std::vector<NetIf> interfaces;       // sorted by name
  std::optional<size_t> active_index;  // index into interfaces; nullopt = all
  double agg_rx_bps{};
  double agg_tx_bps{};

  // Rates of the active interface, or the aggregate when none is selected.
  double rx_bps() const { return active_index ? interfaces[*active_index].rx_bps : agg_rx_bps; }
  double tx_bps() const { return active_index ? interfaces[*active_index].tx_bps : agg_tx_bps; }
};

} // namespace rtop::model
