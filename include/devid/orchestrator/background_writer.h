#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace devid::orchestrator {

// Single worker thread draining a bounded queue of best-effort tasks.
// Submit never waits for I/O. A task that throws is reported as an
// identity_persist_failed event; a task refused because the queue is full
// is reported as identity_persist_dropped. TSK305_Background_Persistence
class BackgroundWriter {
 public:
  using Task = std::function<void()>;

  static constexpr std::size_t kDefaultQueueDepth = 64;

  explicit BackgroundWriter(std::size_t max_queue_depth = kDefaultQueueDepth);
  ~BackgroundWriter(); // runs everything already queued, then joins

  BackgroundWriter(const BackgroundWriter&) = delete;
  BackgroundWriter& operator=(const BackgroundWriter&) = delete;

  // Returns false when the task was dropped.
  bool Submit(std::string name, Task task);
  // Blocks until every task submitted before the call has finished.
  void Flush();
  std::size_t Pending() const;

 private:
  struct PendingTask {
    std::string name;
    Task task;
  };

  void StartWorkerLocked();
  void WorkerLoop();
  static void RunTask(PendingTask& pending);

  const std::size_t max_queue_depth_;
  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<PendingTask> queue_;
  std::thread worker_;
  bool busy_{false};
  bool stop_{false};
};

}  // namespace devid::orchestrator
