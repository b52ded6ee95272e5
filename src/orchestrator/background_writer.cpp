#include "devid/orchestrator/background_writer.h"

#include <exception>
#include <utility>
#include <vector>

#include "devid/error.h"
#include "devid/errors.h"
#include "devid/orchestrator/diagnostics.h"

namespace devid::orchestrator {
namespace {

void PublishTaskEvent(std::string_view event_id, std::string_view message, const std::string& task,
                      const std::string& error) {
  std::vector<EventField> fields;
  fields.emplace_back("task", task);
  if (!error.empty()) {
    fields.emplace_back("error", error, FieldPrivacy::kRedact);
  }
  PublishIdentityEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, event_id, message,
                       std::move(fields));
}

}  // namespace

BackgroundWriter::BackgroundWriter(std::size_t max_queue_depth)
    : max_queue_depth_(max_queue_depth == 0 ? kDefaultQueueDepth : max_queue_depth) {}

BackgroundWriter::~BackgroundWriter() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  work_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void BackgroundWriter::StartWorkerLocked() {
  if (worker_.joinable()) {
    return;
  }
  worker_ = std::thread([this]() { WorkerLoop(); });
}

bool BackgroundWriter::Submit(std::string name, Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stop_ && queue_.size() < max_queue_depth_) {
      queue_.push_back(PendingTask{std::move(name), std::move(task)});
      StartWorkerLocked();
      work_cv_.notify_one();
      return true;
    }
  }
  PublishTaskEvent("identity_persist_dropped", errors::msg::kPersistDropped, name, {});
  return false;
}

void BackgroundWriter::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() { return queue_.empty() && !busy_; });
}

std::size_t BackgroundWriter::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size() + (busy_ ? 1 : 0);
}

void BackgroundWriter::RunTask(PendingTask& pending) {
  try {
    if (pending.task) {
      pending.task();
    }
  } catch (const Error& err) {
    PublishTaskEvent("identity_persist_failed", errors::msg::kPersistFailed, pending.name, err.what());
  } catch (const std::exception& ex) {
    PublishTaskEvent("identity_persist_failed", errors::msg::kPersistFailed, pending.name, ex.what());
  }
}

void BackgroundWriter::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    work_cv_.wait(lock, [this]() { return stop_ || !queue_.empty(); });
    if (queue_.empty()) {
      break; // stop requested and drained
    }
    PendingTask pending = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lock.unlock();
    RunTask(pending);
    lock.lock();
    busy_ = false;
    if (queue_.empty()) {
      idle_cv_.notify_all();
    }
  }
  idle_cv_.notify_all();
}

}  // namespace devid::orchestrator
