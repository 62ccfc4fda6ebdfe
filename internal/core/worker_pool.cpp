#include "worker_pool.hpp"

#include <exception>

namespace refiner::core {

void TaskQueue::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<TaskQueue::Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

WorkerPool::WorkerPool(std::size_t threads) {
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  queue_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

void WorkerPool::Run() {
  while (auto task = queue_.Dequeue()) {
    (*task)();
  }
}

void WorkerPool::ParallelFor(std::size_t count, const std::function<void(std::size_t)>& fn) {
  std::vector<std::exception_ptr> errors(count);

  if (workers_.empty()) {
    for (std::size_t i = 0; i < count; ++i) {
      try {
        fn(i);
      } catch (...) {
        errors[i] = std::current_exception();
      }
    }
  } else {
    std::mutex              mutex;
    std::condition_variable done;
    std::size_t             remaining = count;

    for (std::size_t i = 0; i < count; ++i) {
      queue_.Enqueue([&, i] {
        try {
          fn(i);
        } catch (...) {
          errors[i] = std::current_exception();
        }

        std::lock_guard lock(mutex);
        if (--remaining == 0) done.notify_all();
      });
    }

    std::unique_lock lock(mutex);
    done.wait(lock, [&] { return remaining == 0; });
  }

  for (const auto& error : errors) {
    if (error) std::rethrow_exception(error);
  }
}

} // namespace refiner::core
