#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace impact::engine {

/*
  Request-scoped cancellation: a deadline, an explicit Cancel(), and an
  optional external probe (e.g. grpc::ServerContext::IsCancelled).

  Copies share the cancelled flag.
*/
class CancellationToken {
 public:
  using SteadyClock = std::chrono::steady_clock;

  CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
  }

  static CancellationToken WithTimeout(std::chrono::milliseconds timeout, std::function<bool()> external = {}) {
    CancellationToken token;
    token.deadline_ = SteadyClock::now() + timeout;
    token.external_ = std::move(external);
    return token;
  }

  void Cancel() const {
    cancelled_->store(true, std::memory_order_relaxed);
  }

  bool IsCancelled() const {
    if (cancelled_->load(std::memory_order_relaxed)) {
      return true;
    }
    if (deadline_ && SteadyClock::now() >= *deadline_) {
      return true;
    }
    if (external_ && external_()) {
      Cancel();
      return true;
    }
    return false;
  }

  std::optional<SteadyClock::time_point> deadline() const {
    return deadline_;
  }

 private:
  std::shared_ptr<std::atomic<bool>>     cancelled_;
  std::optional<SteadyClock::time_point> deadline_;
  std::function<bool()>                  external_;
};

} // namespace impact::engine
