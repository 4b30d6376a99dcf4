#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <system_error>
#include <thread>

namespace veilguard::common {

/// Most deadline workers alive at once, stalled ones included.
inline constexpr std::size_t MAX_DEADLINE_WORKERS = 32;

namespace detail {

inline std::atomic<std::size_t> &deadline_workers() {
  static std::atomic<std::size_t> count{0};
  return count;
}

} // namespace detail

/// Workers started by run_with_deadline that have not returned yet.
[[nodiscard]] inline std::size_t deadline_workers_in_flight() {
  return detail::deadline_workers().load();
}

/// Runs `fn` on a detached worker and waits at most `timeout` for it.
/// Returns std::nullopt when the deadline passes; the worker keeps running
/// and its result is discarded. Exceptions thrown by `fn` are rethrown here.
/// A zero timeout runs `fn` inline with no deadline.
///
/// A worker that outlives its deadline still counts against
/// MAX_DEADLINE_WORKERS until `fn` returns. Once the cap is reached `fn` is
/// not started and the call returns std::nullopt at once, so a backend that
/// hangs costs a bounded number of threads.
template <typename T>
[[nodiscard]] std::optional<T> run_with_deadline(std::function<T()> fn,
                                                 const std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    return fn();
  }

  auto &workers = detail::deadline_workers();
  if (workers.fetch_add(1) >= MAX_DEADLINE_WORKERS) {
    workers.fetch_sub(1);
    return std::nullopt;
  }

  auto task = std::make_shared<std::packaged_task<T()>>(std::move(fn));
  auto future = task->get_future();
  try {
    std::thread([task]() {
      (*task)();
      detail::deadline_workers().fetch_sub(1);
    }).detach();
  } catch (const std::system_error &) {
    workers.fetch_sub(1);
    throw;
  }

  if (future.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  return future.get();
}

} // namespace veilguard::common
