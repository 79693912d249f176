#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "finagent/logging.hpp"
#include "finagent/metadata_store.hpp"

namespace finagent {

// Runs on the writer thread. `key` is the file_id or run_id of the failed write.
using PersistenceFailureHandler =
    std::function<void(const std::string& operation, const std::string& key, const std::string& error)>;

/**
 * Best-effort side-write path in front of a MetadataStore.
 *
 * The record_* calls only enqueue and never throw. A failed write is counted
 * and forwarded to the optional handler instead of reaching the caller.
 * One worker thread applies writes in submission order.
 */
class MetadataRecorder {
public:
  explicit MetadataRecorder(MetadataStore& store,
                            Logger logger = {},
                            PersistenceFailureHandler on_failure = nullptr);
  ~MetadataRecorder();

  MetadataRecorder(const MetadataRecorder&) = delete;
  MetadataRecorder& operator=(const MetadataRecorder&) = delete;

  void record_upload(UploadRecord record);
  void record_run(RunRecord record);
  void update_run_status(std::string run_id, std::string status);

  void wait_idle();

  std::size_t failure_count() const { return failures_.load(); }

private:
  struct Task {
    std::string operation;
    std::string key;
    std::function<void()> write;
  };

  void enqueue(Task task);
  void run_worker();
  void report_failure(const Task& task, const std::string& error);

  MetadataStore& store_;
  Logger logger_;
  PersistenceFailureHandler on_failure_;

  std::mutex mutex_;
  std::condition_variable work_available_;
  std::condition_variable idle_;
  std::deque<Task> queue_;
  bool busy_ = false;
  bool stopping_ = false;
  std::atomic<std::size_t> failures_{0};
  std::thread worker_;
};

}  // namespace finagent
