#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace refiner::core {

/*
  Thread-safe blocking task queue.
*/
class TaskQueue {
 public:
  using Task = std::function<void()>;

  void Enqueue(Task task);

  // blocking wait; nullopt once shut down and drained
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

/*
  Fixed set of worker threads draining a TaskQueue.

  ParallelFor blocks until every index has run. If any call throws, the
  exception of the lowest failing index is rethrown after the batch
  completes, so a failing run reports the same error regardless of
  scheduling. With zero threads the work runs inline on the caller.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void ParallelFor(std::size_t count, const std::function<void(std::size_t)>& fn);

  std::size_t Size() const {
    return workers_.size();
  }

 private:
  void Run();

  TaskQueue                queue_;
  std::vector<std::thread> workers_;
};

} // namespace refiner::core
