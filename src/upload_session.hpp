#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "log.hpp"
#include "upload_actions.hpp"
#include "upload_errors.hpp"
#include "upload_pool.hpp"
#include "upload_types.hpp"

// Drives the upload of one file: hash, fast-upload check, resume probe,
// bounded parallel chunk transfer, merge.
//
//   Default -> CalculatingHash -> FastUploaded
//                              -> WaitForUpload -> Uploading <-> UploadStopped
//                                                  Uploading -> UploadSuccessfully
//   any active state -> Error;  restart() -> CalculatingHash
//
// Hashing runs on the thread calling start()/restart(). Chunk transfers run
// on the session's pool; the merge runs on whichever thread observes the last
// chunk completing. State changes are serialized on the session mutex and
// listeners are notified outside of it.
class UploadSession {
public:
  enum class State {
    Default,
    CalculatingHash,
    FastUploaded,
    WaitForUpload,
    Uploading,
    UploadStopped,
    UploadSuccessfully,
    Error
  };

  struct Options {
    Options() {}

    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t concurrency = kDefaultConcurrency;
    // Extra attempts per chunk after a retryable failure.
    std::size_t max_retries = 3;
    // Linear back-off: attempt n waits n * retry_backoff.
    std::chrono::milliseconds retry_backoff{200};
    // Ask the store whether each written chunk is really there.
    bool verify_chunks = true;
  };

  struct Snapshot {
    std::uint64_t sequence = 0;
    State state = State::Default;
    double progress = 0.0;
    std::optional<UploadError> error;
    FileHash hash;
    std::uint64_t file_size = 0;
    std::size_t chunk_count = 0;
    std::size_t completed = 0;
  };

  // Called after every state, progress or error change. Snapshots arrive in
  // order; a snapshot older than one already delivered is skipped. Listeners
  // run on session threads and must not call restart() or destroy().
  using Listener = std::function<void(const Snapshot&)>;
  using ListenerHandle = std::size_t;

  UploadSession(std::filesystem::path source,
                std::shared_ptr<UploadActions> actions,
                Options options = Options(),
                std::shared_ptr<Logger> logger = nullptr);
  ~UploadSession();

  UploadSession(const UploadSession&) = delete;
  UploadSession& operator=(const UploadSession&) = delete;

  // Default -> CalculatingHash. With auto_upload the transfer begins as soon
  // as the session reaches WaitForUpload.
  void start(bool auto_upload = true);
  // WaitForUpload/UploadStopped -> Uploading.
  void play();
  // Uploading -> UploadStopped. Transfers already running are not aborted.
  void stop();
  // Discards all session state and hashes again.
  void restart(bool auto_upload = true);
  // Stops the pool, waits for running transfers and drops listeners. Every
  // later operation throws SessionStateError.
  void destroy();

  State state() const;
  double progress() const;
  std::optional<UploadError> error() const;
  Snapshot snapshot() const;
  FileHash file_hash() const;
  std::size_t chunk_count() const;
  std::vector<ChunkIndex> pending_indices() const;
  std::vector<ChunkIndex> in_flight_indices() const;
  std::vector<ChunkIndex> completed_indices() const;
  const std::filesystem::path& source() const { return source_; }
  const Options& options() const { return options_; }

  // Waits until the session is terminal, or idle in Default, WaitForUpload or
  // UploadStopped with nothing in flight. Returns false on timeout.
  bool wait_until_settled(std::chrono::milliseconds timeout) const;

  ListenerHandle add_listener(Listener listener);
  void remove_listener(ListenerHandle handle);

  static const char* state_name(State state);
  static bool is_terminal(State state);

private:
  void run(bool auto_upload, std::uint64_t generation);
  std::set<ChunkIndex> probe_existing_chunks(const FileHash& hash, std::size_t count);
  void begin_upload(std::uint64_t generation);
  void transfer_chunk(ChunkIndex index, std::uint64_t generation);
  void send_chunk_once(const FileHash& hash, ChunkIndex index);
  std::string read_chunk(ChunkIndex index) const;
  bool wait_for_retry(std::chrono::milliseconds delay, std::uint64_t generation);
  void on_chunk_finished(ChunkIndex index, std::exception_ptr failure, std::uint64_t generation);
  void run_merge(std::uint64_t generation);
  void fail(const UploadError& error, std::uint64_t generation,
            std::optional<ChunkIndex> failed_chunk = std::nullopt);

  void reset_locked();
  void set_state_locked(State state);
  void touch_locked();
  bool settled_locked() const;
  Snapshot snapshot_locked() const;
  void require_alive_locked() const;
  void publish(const Snapshot& snapshot);

  std::filesystem::path source_;
  std::shared_ptr<UploadActions> actions_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  mutable std::condition_variable changed_cv_;
  State state_ = State::Default;
  FileHash hash_;
  std::uint64_t file_size_ = 0;
  std::size_t chunk_count_ = 0;
  std::set<ChunkIndex> pending_;
  std::set<ChunkIndex> in_flight_;
  std::set<ChunkIndex> completed_;
  double progress_ = 0.0;
  std::optional<UploadError> error_;
  bool merge_started_ = false;
  bool merging_ = false;
  bool destroyed_ = false;
  // Bumped by restart() and destroy(); work tagged with an older generation
  // no longer affects the session.
  std::uint64_t generation_ = 0;
  std::uint64_t sequence_ = 0;
  std::unique_ptr<UploadPool> pool_;

  std::recursive_mutex listener_mutex_;
  std::map<ListenerHandle, Listener> listeners_;
  ListenerHandle next_listener_id_ = 1;
  std::uint64_t delivered_sequence_ = 0;
};
