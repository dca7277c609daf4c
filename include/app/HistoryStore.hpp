#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include "model/History.hpp"
#include "model/Snapshot.hpp"

namespace rtop::app {

inline constexpr size_t kHistoryLen = 120;

// Named history series fed from each snapshot. Absent fields add no sample.
//   cpu, cpu.<n>, mem, swap, net.rx, net.tx, gpu.<n>.usage
class HistoryStore {
public:
  explicit HistoryStore(size_t capacity = kHistoryLen) : capacity_(capacity) {}

  void append(const rtop::model::SystemSnapshot& snap);
  bool push(const std::string& name, std::chrono::steady_clock::time_point ts, double value);

  const rtop::model::HistorySeries* find(std::string_view name) const;
  size_t capacity() const { return capacity_; }
  size_t series_count() const { return series_.size(); }

private:
  size_t capacity_;
  std::map<std::string, rtop::model::HistorySeries, std::less<>> series_;
};

} // namespace rtop::app
