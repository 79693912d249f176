#include "finagent/metadata_recorder.hpp"

#include <utility>

namespace finagent {

MetadataRecorder::MetadataRecorder(MetadataStore& store, Logger logger, PersistenceFailureHandler on_failure)
    : store_(store), logger_(std::move(logger)), on_failure_(std::move(on_failure)) {
  worker_ = std::thread([this] { run_worker(); });
}

MetadataRecorder::~MetadataRecorder() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  work_available_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void MetadataRecorder::record_upload(UploadRecord record) {
  std::string key = record.file_id;
  enqueue(Task{"log_upload", std::move(key), [this, record = std::move(record)] { store_.log_upload(record); }});
}

void MetadataRecorder::record_run(RunRecord record) {
  std::string key = record.run_id;
  enqueue(Task{"log_run", std::move(key), [this, record = std::move(record)] { store_.log_run(record); }});
}

void MetadataRecorder::update_run_status(std::string run_id, std::string status) {
  std::string key = run_id;
  enqueue(Task{"update_run_status",
               std::move(key),
               [this, run_id = std::move(run_id), status = std::move(status)] {
                 store_.update_run_status(run_id, status);
               }});
}

void MetadataRecorder::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void MetadataRecorder::enqueue(Task task) {
  try {
    bool rejected = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        rejected = true;
      } else {
        queue_.push_back(std::move(task));
      }
    }
    if (rejected) {
      report_failure(task, "recorder is shutting down");
      return;
    }
    work_available_.notify_one();
  } catch (const std::exception& ex) {
    report_failure(task, ex.what());
  }
}

void MetadataRecorder::run_worker() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        // stopping_ with nothing left to drain.
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    try {
      task.write();
    } catch (const std::exception& ex) {
      report_failure(task, ex.what());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
      if (queue_.empty()) {
        idle_.notify_all();
      }
    }
  }
}

void MetadataRecorder::report_failure(const Task& task, const std::string& error) {
  ++failures_;
  logger_.error("metadata write failed", {{"operation", task.operation}, {"key", task.key}, {"error", error}});
  if (!on_failure_) {
    return;
  }
  try {
    on_failure_(task.operation, task.key, error);
  } catch (const std::exception& ex) {
    logger_.error("persistence failure handler threw", {{"operation", task.operation}, {"error", ex.what()}});
  }
}

}  // namespace finagent
