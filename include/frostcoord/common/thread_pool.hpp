#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace frostcoord {

// Fixed-size worker pool for CPU-bound verification jobs.
class ThreadPool {
 public:
  explicit ThreadPool(size_t worker_count) {
    if (worker_count == 0) {
      throw std::invalid_argument("ThreadPool worker_count must be > 0");
    }

    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      workers_.emplace_back([this]() { Run(); });
    }
  }

  ~ThreadPool() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (std::thread& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;

    auto job = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> result = job->get_future();
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopping_) {
        throw std::runtime_error("ThreadPool is shutting down");
      }
      jobs_.push_back([job]() { (*job)(); });
    }
    cv_.notify_one();
    return result;
  }

  // Runs fn(item) for every item and returns the results in input order.
  // The first job exception is rethrown after all jobs have finished.
  template <typename T, typename Fn>
  auto Map(const std::vector<T>& items, Fn fn)
      -> std::vector<std::invoke_result_t<Fn, const T&>> {
    using Result = std::invoke_result_t<Fn, const T&>;

    std::vector<std::future<Result>> pending;
    pending.reserve(items.size());
    for (const T& item : items) {
      pending.push_back(Submit([&fn, &item]() { return fn(item); }));
    }

    std::vector<Result> out;
    out.reserve(pending.size());
    std::exception_ptr first_error;
    for (std::future<Result>& future : pending) {
      try {
        out.push_back(future.get());
      } catch (...) {
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
    if (first_error) {
      std::rethrow_exception(first_error);
    }
    return out;
  }

  size_t worker_count() const {
    return workers_.size();
  }

 private:
  void Run() {
    while (true) {
      std::function<void()> job;
      {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
        if (stopping_ && jobs_.empty()) {
          return;
        }
        job = std::move(jobs_.front());
        jobs_.pop_front();
      }
      job();
    }
  }

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> jobs_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_ = false;
};

}  // namespace frostcoord
