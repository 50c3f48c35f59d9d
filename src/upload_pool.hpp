#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "upload_types.hpp"

// Runs chunk transfers on a fixed set of worker threads. At most
// `concurrency` tasks are active at once; completion order is unspecified.
//
// stop() only halts dispatch: running tasks finish on their own and queued
// work stays queued for the next start().
class UploadPool {
public:
  using Task = std::function<void(ChunkIndex)>;
  // Receives the task's exception, or null on success. Called on the worker
  // thread once the task's slot has been released; must not throw.
  using CompletionHandler = std::function<void(ChunkIndex, std::exception_ptr)>;

  UploadPool(std::size_t concurrency, Task task, CompletionHandler on_complete);
  ~UploadPool();

  UploadPool(const UploadPool&) = delete;
  UploadPool& operator=(const UploadPool&) = delete;

  void start();
  void stop();
  void enqueue(ChunkIndex index);
  void enqueue(const std::vector<ChunkIndex>& indices);

  // Drops queued work and returns it.
  std::vector<ChunkIndex> clear();

  // Blocks until no task is running. Completion handlers of the last tasks
  // may still be executing. Must not be called from a task.
  void wait_idle();

  // Stops, drops the queue and joins the workers.
  void shutdown();

  bool running() const;
  std::size_t concurrency() const { return concurrency_; }
  std::size_t active() const;
  std::size_t queued() const;
  std::size_t peak_active() const;

private:
  void worker_thread();

  std::size_t concurrency_;
  Task task_;
  CompletionHandler on_complete_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<ChunkIndex> queue_;
  std::size_t active_ = 0;
  std::size_t peak_active_ = 0;
  bool running_ = false;
  bool shutting_down_ = false;
  std::vector<std::thread> threads_;
};
