#include "upload_pool.hpp"

#include <algorithm>
#include <stdexcept>

UploadPool::UploadPool(std::size_t concurrency, Task task, CompletionHandler on_complete)
  : concurrency_(concurrency),
    task_(std::move(task)),
    on_complete_(std::move(on_complete)) {
  if(concurrency_ == 0) throw std::invalid_argument("upload concurrency must be positive");
  if(!task_) throw std::invalid_argument("upload pool requires a task");
  threads_.reserve(concurrency_);
  for(std::size_t i = 0; i < concurrency_; ++i) {
    threads_.emplace_back([this](){ worker_thread(); });
  }
}

UploadPool::~UploadPool() {
  shutdown();
}

void UploadPool::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(shutting_down_) return;
    running_ = true;
  }
  work_cv_.notify_all();
}

void UploadPool::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

void UploadPool::enqueue(ChunkIndex index) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(shutting_down_) return;
    queue_.push_back(index);
  }
  work_cv_.notify_one();
}

void UploadPool::enqueue(const std::vector<ChunkIndex>& indices) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(shutting_down_) return;
    queue_.insert(queue_.end(), indices.begin(), indices.end());
  }
  work_cv_.notify_all();
}

std::vector<ChunkIndex> UploadPool::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChunkIndex> dropped(queue_.begin(), queue_.end());
  queue_.clear();
  return dropped;
}

void UploadPool::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [&]{ return active_ == 0; });
}

void UploadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    shutting_down_ = true;
    queue_.clear();
  }
  work_cv_.notify_all();
  for(auto& thread : threads_) {
    if(thread.joinable()) thread.join();
  }
  threads_.clear();
}

bool UploadPool::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::size_t UploadPool::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::size_t UploadPool::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::size_t UploadPool::peak_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_active_;
}

void UploadPool::worker_thread() {
  while(true) {
    ChunkIndex index = 0;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [&]{
        return shutting_down_ || (running_ && !queue_.empty());
      });
      if(shutting_down_) break;
      index = queue_.front();
      queue_.pop_front();
      ++active_;
      peak_active_ = std::max(peak_active_, active_);
    }

    std::exception_ptr failure;
    try {
      task_(index);
    } catch(...) {
      failure = std::current_exception();
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
    }
    idle_cv_.notify_all();
    if(on_complete_) {
      on_complete_(index, failure);
    }
  }
}
