#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace rtop::model {

// Fixed-capacity FIFO ring of (timestamp, value). Capacity never changes after
// construction; the oldest sample is overwritten when full.
class HistorySeries {
public:
  using Clock = std::chrono::steady_clock;
  using Point = std::pair<Clock::time_point, double>;

  HistorySeries(std::string name, size_t capacity)
    : name_(std::move(name)), buf_(capacity ? capacity : 1) {}

  // Returns false (and stores nothing) if ts is older than the newest sample.
  bool push(Clock::time_point ts, double value) {
    if (size_ > 0 && ts < at(size_ - 1).first) return false;
    buf_[head_] = {ts, value};
    head_ = (head_ + 1) % buf_.size();
    if (size_ < buf_.size()) ++size_;
    return true;
  }

  // i = 0 is the oldest retained sample.
  const Point& at(size_t i) const {
    size_t start = (head_ + buf_.size() - size_) % buf_.size();
    return buf_[(start + i) % buf_.size()];
  }

  std::vector<double> values() const {
    std::vector<double> out; out.reserve(size_);
    for (size_t i = 0; i < size_; ++i) out.push_back(at(i).second);
    return out;
  }

  double latest() const { return size_ ? at(size_ - 1).second : 0.0; }
  size_t size() const { return size_; }
  size_t capacity() const { return buf_.size(); }
  bool empty() const { return size_ == 0; }
  const std::string& name() const { return name_; }

private:
  std::string name_;
  std::vector<Point> buf_;
  size_t head_{0};
  size_t size_{0};
};

} // namespace rtop::model
