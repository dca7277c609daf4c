#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include "collectors/IMetricProvider.hpp"
#include "util/Log.hpp"

namespace rtop::app {

// One provider on its own worker thread. start() hands the worker a request
// and finish() waits for it up to a deadline; a provider that is still busy
// from an earlier request gets no new one and reads as Timeout until it returns.
template <class T>
class ProviderSlot {
public:
  ProviderSlot(std::unique_ptr<rtop::collectors::IMetricProvider<T>> provider, std::string domain)
    : shared_(std::make_shared<Shared>()) {
    shared_->provider = std::move(provider);
    shared_->domain = std::move(domain);
    worker_ = std::jthread([s = shared_](std::stop_token st) { work(*s, st); });
  }

  ProviderSlot(const ProviderSlot&) = delete;
  ProviderSlot& operator=(const ProviderSlot&) = delete;

  ~ProviderSlot() {
    bool stuck = false;
    {
      std::lock_guard<std::mutex> lk(shared_->mu);
      stuck = shared_->busy;
    }
    worker_.request_stop();
    // A worker blocked inside the provider cannot be joined; it owns its
    // state through the shared_ptr and exits when the call returns.
    if (stuck) worker_.detach();
  }

  // Hand the worker a request. False if it is still inside an earlier one.
  bool start(std::chrono::milliseconds budget) {
    std::lock_guard<std::mutex> lk(shared_->mu);
    if (shared_->busy) { pending_ = false; return false; }
    shared_->result.reset();
    shared_->budget = budget;
    shared_->requested = true;
    shared_->busy = true;
    pending_ = true;
    shared_->cv.notify_all();
    return true;
  }

  // Wait for the request made by start() until `deadline`.
  rtop::model::Reading<T> finish(std::chrono::steady_clock::time_point deadline) {
    using rtop::model::UnavailableReason;
    std::unique_lock<std::mutex> lk(shared_->mu);
    const std::string name = shared_->provider->name();
    if (!pending_) return rtop::model::unavailable(UnavailableReason::Timeout, name + " still running");
    pending_ = false;
    if (!shared_->cv.wait_until(lk, deadline, [this] { return !shared_->busy; })) {
      rtop::util::log_once(shared_->domain + ":timeout", "%s provider exceeded %lld ms budget",
                           shared_->domain.c_str(), static_cast<long long>(shared_->budget.count()));
      return rtop::model::unavailable(UnavailableReason::Timeout, name + " over budget");
    }
    rtop::model::Reading<T> r = std::move(*shared_->result);
    shared_->result.reset();
    return r;
  }

private:
  struct Shared {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_ptr<rtop::collectors::IMetricProvider<T>> provider;
    std::string domain;
    std::chrono::milliseconds budget{0};
    bool requested{false};
    bool busy{false};
    std::optional<rtop::model::Reading<T>> result;
  };

  static void work(Shared& s, std::stop_token st) {
    using rtop::model::UnavailableReason;
    for (;;) {
      std::chrono::milliseconds budget{0};
      {
        std::unique_lock<std::mutex> lk(s.mu);
        if (!s.cv.wait(lk, st, [&s] { return s.requested; })) return;
        s.requested = false;
        budget = s.budget;
      }
      rtop::model::Reading<T> r = rtop::model::unavailable(UnavailableReason::ReadFailed);
      try {
        r = s.provider->sample(budget);
      } catch (const std::exception& e) {
        rtop::util::log_once(s.domain + ":throw", "%s provider failed: %s", s.domain.c_str(), e.what());
        r = rtop::model::unavailable(UnavailableReason::ReadFailed, e.what());
      }
      {
        std::lock_guard<std::mutex> lk(s.mu);
        s.result = std::move(r);
        s.busy = false;
      }
      s.cv.notify_all();
      if (st.stop_requested()) return;
    }
  }

  std::shared_ptr<Shared> shared_;
  bool pending_{false}; // start() succeeded and finish() has not run
  std::jthread worker_;
};

} // namespace rtop::app
