#pragma once

#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

// Workers take jobs in submission order. A job returning false halts the pool
// and drops whatever is still queued; otherwise the destructor waits until the
// queue is drained.
template <typename T>
  requires std::is_move_constructible_v<T>
class thread_pool {
  using Job = std::function<bool(T&&)>;

  const Job job;

  std::deque<T> queue;
  mutable std::mutex mtx;
  std::condition_variable_any cv;
  bool closed = false;
  size_t n_done = 0;

  std::stop_source halt;
  std::vector<std::jthread> workers;

  std::optional<T> next() {
    std::unique_lock lk{mtx};
    cv.wait(lk, halt.get_token(), [this] { return closed || !queue.empty(); });
    if (halt.stop_requested() || queue.empty())
      return std::nullopt;

    auto t = std::move(queue.front());
    queue.pop_front();
    return t;
  }

  void run() {
    while (auto t = next()) {
      auto keep_going = job(std::move(*t));
      {
        std::lock_guard lk{mtx};
        n_done++;
      }
      if (!keep_going) {
        halt.request_stop();
        break;
      }
    }
  }

 public:
  thread_pool(size_t n_threads, Job job, std::vector<T> jobs)
      : job{std::move(job)} {
    for (auto& t : jobs)
      queue.push_back(std::move(t));

    workers.reserve(n_threads);
    for (size_t i = 0; i < n_threads; i++)
      workers.emplace_back([this] { run(); });
  }

  ~thread_pool() {
    {
      std::lock_guard lk{mtx};
      closed = true;
    }
    cv.notify_all();
    workers.clear();
  }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;

  template <typename... Args>
    requires std::constructible_from<T, Args...>
  void submit(Args&&... args) {
    if (halt.stop_requested())
      throw std::runtime_error("submitted work to a halted thread_pool");
    {
      std::lock_guard lk{mtx};
      queue.emplace_back(std::forward<Args>(args)...);
    }
    cv.notify_one();
  }

  bool halted() const { return halt.stop_requested(); }

  size_t processed() const {
    std::lock_guard lk{mtx};
    return n_done;
  }
};
