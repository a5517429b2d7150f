// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_UTIL_THREADPOOL_HPP
#define FOLDCHAIN_UTIL_THREADPOOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace foldchain {
namespace util {

/**
 * Fixed-size worker pool
 *
 * Used by the accumulator to build partial states over disjoint digest
 * slices and to fold them pairwise.
 *
 * Usage:
 *   ThreadPool pool(4);  // 4 worker threads
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 *
 * Exceptions thrown by a task are delivered through its future.
 */
class ThreadPool {
public:
  /**
   * Create pool with the given number of threads
   * If num_threads == 0, uses hardware concurrency
   */
  explicit ThreadPool(size_t num_threads = 0);

  // Waits for all queued tasks to complete
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * Enqueue a task for execution
   * Returns a future that will contain the result
   * Throws std::runtime_error if the pool is shutting down
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>>;

  size_t size() const { return workers_.size(); }

private:
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  std::mutex queue_mutex_;
  std::condition_variable condition_;
  bool stop_{false};
};

// Template implementation (must be in header)
template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<std::invoke_result_t<F, Args...>> {
  using return_type = std::invoke_result_t<F, Args...>;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (stop_)
      throw std::runtime_error("enqueue on stopped ThreadPool");

    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace foldchain

#endif // FOLDCHAIN_UTIL_THREADPOOL_HPP
