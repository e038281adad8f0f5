#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace impact::engine {

// 0 means hardware concurrency (at least 1).
inline std::size_t ResolveWorkerCount(std::size_t configured) {
  if (configured > 0) {
    return configured;
  }
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

/*
  Runs fn(i) for i in [0, count) on min(count, max_workers) threads that
  live only for this call. The calling thread is one of the workers.

  The first exception thrown by fn is rethrown after all workers joined.
*/
template <typename Fn>
void ParallelFor(std::size_t count, std::size_t max_workers, Fn&& fn) {
  if (count == 0) {
    return;
  }

  const std::size_t   workers = std::min(count, std::max<std::size_t>(1, max_workers));
  std::atomic<size_t> next{0};
  std::exception_ptr  first_error;
  std::mutex          error_mutex;

  auto run = [&] {
    for (;;) {
      const std::size_t i = next.fetch_add(1);
      if (i >= count) {
        return;
      }
      try {
        fn(i);
      } catch (...) {
        std::lock_guard lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers - 1);
  for (std::size_t w = 1; w < workers; ++w) {
    threads.emplace_back(run);
  }
  run();
  for (auto& t : threads) {
    t.join();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

} // namespace impact::engine
