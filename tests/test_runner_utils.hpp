#pragma once

#include "log.hpp"
#include "memory_chunk_store.hpp"
#include "merger.hpp"
#include "upload_errors.hpp"
#include "upload_server.hpp"
#include "upload_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace chunkup::test {

// Scratch directory removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& name) {
    static std::atomic<unsigned> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("chunkup_" + name + "_" + std::to_string(counter.fetch_add(1)));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& leaf) const { return path_ / leaf; }

private:
  std::filesystem::path path_;
};

// Deterministic pseudo-random bytes; the seed keeps files distinct per test.
inline std::string make_content(std::size_t size, unsigned seed) {
  std::mt19937 rng(seed);
  std::string out(size, '\0');
  for(auto& ch : out) ch = static_cast<char>(rng() & 0xff);
  return out;
}

inline std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return path;
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  // Holds the server's logger, so the capture may outlive the server.
  void attach(UploadServer& server, const std::string& label = std::string()) {
    attach(server.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.emplace_back((label.empty() ? channel : label) + ": " + message);
      cv_.notify_all();
      return false;
    };
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Holds callers until opened.
class Gate {
public:
  void open() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }
  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]{ return open_; });
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
};

// Opens the gate when leaving scope, so an early test return never leaves a
// worker parked on it.
struct GateOpener {
  Gate& gate;
  ~GateOpener() { gate.open(); }
};

// UploadActions over an in-memory store that counts calls, tracks how many
// uploads run at once and can inject failures before a chunk is stored.
class RecordingActions : public UploadActions {
public:
  // Runs before a chunk upload touches the store; may throw or block.
  using UploadHook = std::function<void(ChunkIndex index, std::size_t attempt)>;

  RecordingActions()
    : store_(std::make_shared<MemoryChunkStore>()),
      merger_(std::make_shared<Merger>(store_)),
      service_(store_, merger_) {}

  void upload_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) override {
    std::size_t attempt = 0;
    UploadHook hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      attempt = attempts_[index]++;
      hook = before_upload_;
    }
    auto now = active_uploads_.fetch_add(1) + 1;
    auto peak = max_active_uploads_.load();
    while(now > peak && !max_active_uploads_.compare_exchange_weak(peak, now)) {}
    struct Leave {
      std::atomic<std::size_t>& active;
      ~Leave() { active.fetch_sub(1); }
    } leave{active_uploads_};

    upload_calls.fetch_add(1);
    if(upload_delay.count() > 0) std::this_thread::sleep_for(upload_delay);
    if(hook) hook(index, attempt);
    service_.upload_chunk(hash, index, data);
    std::lock_guard<std::mutex> lock(mutex_);
    stored_order_.push_back(index);
  }

  bool file_exists(const FileHash& hash) override {
    file_exists_calls.fetch_add(1);
    return service_.file_exists(hash);
  }

  bool chunk_exists(const FileHash& hash, ChunkIndex index) override {
    chunk_exists_calls.fetch_add(1);
    if(deny_chunk_exists.load()) return false;
    return service_.chunk_exists(hash, index);
  }

  void merge(const FileHash& hash, std::size_t chunk_count) override {
    merge_calls.fetch_add(1);
    if(merge_failures_left.load() > 0) {
      merge_failures_left.fetch_sub(1);
      throw StorageWriteError("injected merge failure");
    }
    service_.merge(hash, chunk_count);
  }

  std::optional<ChunkIndex> last_existed_chunk_index(const FileHash& hash) override {
    last_index_calls.fetch_add(1);
    return service_.last_existed_chunk_index(hash);
  }

  void set_before_upload(UploadHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    before_upload_ = std::move(hook);
  }

  std::size_t attempts(ChunkIndex index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(index);
    return it == attempts_.end() ? 0 : it->second;
  }

  std::vector<ChunkIndex> stored_order() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_order_;
  }

  std::shared_ptr<MemoryChunkStore> store() const { return store_; }
  std::shared_ptr<Merger> merger() const { return merger_; }
  std::size_t max_active_uploads() const { return max_active_uploads_.load(); }

  std::atomic<std::size_t> upload_calls{0};
  std::atomic<std::size_t> file_exists_calls{0};
  std::atomic<std::size_t> chunk_exists_calls{0};
  std::atomic<std::size_t> merge_calls{0};
  std::atomic<std::size_t> last_index_calls{0};
  std::atomic<std::size_t> merge_failures_left{0};
  std::atomic<bool> deny_chunk_exists{false};
  std::chrono::milliseconds upload_delay{0};

private:
  std::shared_ptr<MemoryChunkStore> store_;
  std::shared_ptr<Merger> merger_;
  UploadService service_;
  std::mutex mutex_;
  std::map<ChunkIndex, std::size_t> attempts_;
  std::vector<ChunkIndex> stored_order_;
  UploadHook before_upload_;
  std::atomic<std::size_t> active_uploads_{0};
  std::atomic<std::size_t> max_active_uploads_{0};
};

} // namespace chunkup::test
