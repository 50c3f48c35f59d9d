#include "upload_session.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "content_hasher.hpp"

namespace {

UploadError to_upload_error(std::exception_ptr failure) {
  try {
    std::rethrow_exception(failure);
  } catch(const UploadError& e) {
    return e;
  } catch(const std::exception& e) {
    return TransferError(e.what());
  } catch(...) {
    return TransferError("unknown failure");
  }
}

} // namespace

UploadSession::UploadSession(std::filesystem::path source,
                             std::shared_ptr<UploadActions> actions,
                             Options options,
                             std::shared_ptr<Logger> logger)
  : source_(std::move(source)),
    actions_(std::move(actions)),
    options_(options),
    logger_(std::move(logger)) {
  if(!actions_) throw std::invalid_argument("UploadSession requires upload actions");
  if(options_.chunk_size == 0) throw std::invalid_argument("chunk_size must be positive");
  if(options_.concurrency == 0) throw std::invalid_argument("concurrency must be positive");
}

UploadSession::~UploadSession() {
  destroy();
}

const char* UploadSession::state_name(State state) {
  switch(state) {
    case State::Default: return "Default";
    case State::CalculatingHash: return "CalculatingHash";
    case State::FastUploaded: return "FastUploaded";
    case State::WaitForUpload: return "WaitForUpload";
    case State::Uploading: return "Uploading";
    case State::UploadStopped: return "UploadStopped";
    case State::UploadSuccessfully: return "UploadSuccessfully";
    case State::Error: return "Error";
  }
  return "Unknown";
}

bool UploadSession::is_terminal(State state) {
  return state == State::FastUploaded ||
         state == State::UploadSuccessfully ||
         state == State::Error;
}

// ---- operations -----------------------------------------------------------

void UploadSession::start(bool auto_upload) {
  Snapshot snap;
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    require_alive_locked();
    if(state_ != State::Default) {
      throw SessionStateError(std::string("cannot start a session in state ") + state_name(state_));
    }
    reset_locked();
    set_state_locked(State::CalculatingHash);
    generation = generation_;
    snap = snapshot_locked();
  }
  publish(snap);
  run(auto_upload, generation);
}

void UploadSession::play() {
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    require_alive_locked();
    if(state_ != State::WaitForUpload && state_ != State::UploadStopped) {
      throw SessionStateError(std::string("cannot play a session in state ") + state_name(state_));
    }
    generation = generation_;
  }
  begin_upload(generation);
}

void UploadSession::stop() {
  Snapshot snap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    require_alive_locked();
    if(state_ != State::Uploading) {
      throw SessionStateError(std::string("cannot stop a session in state ") + state_name(state_));
    }
    if(pool_) pool_->stop();
    set_state_locked(State::UploadStopped);
    snap = snapshot_locked();
  }
  log_info(logger_.get(), "upload {} paused with {} chunks pending",
           source_.filename().string(), snap.chunk_count - snap.completed);
  publish(snap);
}

void UploadSession::restart(bool auto_upload) {
  std::unique_ptr<UploadPool> old_pool;
  Snapshot snap;
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    require_alive_locked();
    if(state_ == State::CalculatingHash || state_ == State::Uploading || merging_) {
      throw SessionStateError(std::string("cannot restart a session in state ") + state_name(state_));
    }
    ++generation_;
    old_pool = std::move(pool_);
    reset_locked();
    set_state_locked(State::CalculatingHash);
    generation = generation_;
    snap = snapshot_locked();
  }
  changed_cv_.notify_all();
  // Transfers of the discarded run may still be in flight; their results
  // carry the old generation and are ignored.
  if(old_pool) old_pool->shutdown();
  log_info(logger_.get(), "restarting upload {}", source_.filename().string());
  publish(snap);
  run(auto_upload, generation);
}

void UploadSession::destroy() {
  std::unique_ptr<UploadPool> pool;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(destroyed_) return;
    destroyed_ = true;
    ++generation_;
    pool = std::move(pool_);
  }
  changed_cv_.notify_all();
  if(pool) pool->shutdown();
  {
    // Results of the joined transfers were discarded, so they are owed again.
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.insert(in_flight_.begin(), in_flight_.end());
    in_flight_.clear();
  }
  {
    std::lock_guard<std::recursive_mutex> lock(listener_mutex_);
    listeners_.clear();
  }
  log_debug(logger_.get(), "upload session for {} destroyed", source_.string());
}

// ---- hashing and resume probe ---------------------------------------------

void UploadSession::run(bool auto_upload, std::uint64_t generation) {
  const auto name = source_.filename().string();
  log_info(logger_.get(), "hashing {}", source_.string());

  FileHash hash;
  std::uint64_t size = 0;
  std::size_t count = 0;
  std::set<ChunkIndex> present;
  try {
    std::error_code ec;
    size = std::filesystem::file_size(source_, ec);
    if(ec) {
      throw HashComputationError("cannot stat " + source_.string() + ": " + ec.message());
    }
    hash = ContentHasher::hash_file(source_);
    count = ::chunk_count(size, options_.chunk_size);

    if(actions_->file_exists(hash)) {
      Snapshot snap;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if(generation != generation_) return;
        hash_ = hash;
        file_size_ = size;
        chunk_count_ = count;
        progress_ = 100.0;
        set_state_locked(State::FastUploaded);
        snap = snapshot_locked();
      }
      changed_cv_.notify_all();
      log_info(logger_.get(), "{} already stored as {}, nothing to send", name, hash);
      publish(snap);
      return;
    }

    present = probe_existing_chunks(hash, count);
  } catch(const UploadError& e) {
    fail(e, generation);
    return;
  } catch(const std::exception& e) {
    fail(TransferError(e.what()), generation);
    return;
  }

  Snapshot snap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_) return;
    hash_ = hash;
    file_size_ = size;
    chunk_count_ = count;
    completed_ = present;
    for(ChunkIndex index = 0; index < count; ++index) {
      if(!present.count(index)) pending_.insert(index);
    }
    progress_ = count == 0 ? 100.0 : 100.0 * static_cast<double>(completed_.size()) / count;
    set_state_locked(State::WaitForUpload);
    snap = snapshot_locked();
  }
  changed_cv_.notify_all();
  if(present.empty()) {
    log_info(logger_.get(), "{} ({} bytes) hashed as {}: {} chunks to send", name, size, hash, count);
  } else {
    log_info(logger_.get(), "{} hashed as {}: resuming with {} of {} chunks already stored",
             name, hash, present.size(), count);
  }
  publish(snap);

  if(auto_upload) begin_upload(generation);
}

std::set<ChunkIndex> UploadSession::probe_existing_chunks(const FileHash& hash, std::size_t count) {
  std::set<ChunkIndex> present;
  if(count == 0) return present;

  ChunkIndex next = 0;
  if(auto last = actions_->last_existed_chunk_index(hash)) {
    // Everything up to the contiguous prefix is known to exist.
    ChunkIndex end = std::min<ChunkIndex>(*last + 1, count);
    for(ChunkIndex index = 0; index < end; ++index) present.insert(index);
    next = end;
  }
  // Chunks may have been written out of order, so check the rest one by one.
  for(ChunkIndex index = next; index < count; ++index) {
    if(actions_->chunk_exists(hash, index)) present.insert(index);
  }
  return present;
}

// ---- transfer -------------------------------------------------------------

void UploadSession::begin_upload(std::uint64_t generation) {
  Snapshot snap;
  bool merge_now = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_ || destroyed_) return;
    if(state_ != State::WaitForUpload && state_ != State::UploadStopped) return;

    if(!pool_) {
      pool_ = std::make_unique<UploadPool>(
        options_.concurrency,
        [this, generation](ChunkIndex index){ transfer_chunk(index, generation); },
        [this, generation](ChunkIndex index, std::exception_ptr failure){
          on_chunk_finished(index, failure, generation);
        });
    }
    if(state_ == State::WaitForUpload) {
      pool_->enqueue(std::vector<ChunkIndex>(pending_.begin(), pending_.end()));
    }
    set_state_locked(State::Uploading);
    pool_->start();

    if(pending_.empty() && in_flight_.empty() && !merge_started_) {
      merge_started_ = true;
      merging_ = true;
      merge_now = true;
    }
    snap = snapshot_locked();
  }
  log_info(logger_.get(), "uploading {}: {} of {} chunks pending",
           source_.filename().string(), snap.chunk_count - snap.completed, snap.chunk_count);
  publish(snap);
  if(merge_now) run_merge(generation);
}

void UploadSession::transfer_chunk(ChunkIndex index, std::uint64_t generation) {
  FileHash hash;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_ || destroyed_) {
      throw SessionStateError("upload session was restarted");
    }
    // Dequeued just before a failure stopped the pool; the chunk stays owed.
    if(state_ == State::Error) {
      throw SessionStateError("upload session failed");
    }
    pending_.erase(index);
    in_flight_.insert(index);
    hash = hash_;
  }

  for(std::size_t attempt = 0;; ++attempt) {
    try {
      send_chunk_once(hash, index);
      return;
    } catch(const UploadError& e) {
      if(!e.retryable() || attempt >= options_.max_retries) throw;
      log_warn(logger_.get(), "chunk {} of {} failed (attempt {}/{}): {}",
               index, hash, attempt + 1, options_.max_retries + 1, e.what());
      if(!wait_for_retry(options_.retry_backoff * static_cast<int>(attempt + 1), generation)) {
        throw;
      }
    }
  }
}

void UploadSession::send_chunk_once(const FileHash& hash, ChunkIndex index) {
  std::istringstream payload(read_chunk(index));
  actions_->upload_chunk(hash, index, payload);
  if(options_.verify_chunks && !actions_->chunk_exists(hash, index)) {
    throw TransferError("chunk " + std::to_string(index) + " was not confirmed by the store");
  }
}

std::string UploadSession::read_chunk(ChunkIndex index) const {
  std::uint64_t file_size = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    file_size = file_size_;
  }
  auto range = chunk_range(index, file_size, options_.chunk_size);

  std::ifstream in(source_, std::ios::binary);
  if(!in) {
    throw HashComputationError("cannot open " + source_.string());
  }
  in.seekg(static_cast<std::streamoff>(range.offset), std::ios::beg);
  std::string buffer(range.size, '\0');
  in.read(buffer.data(), static_cast<std::streamsize>(range.size));
  if(static_cast<std::size_t>(in.gcount()) != range.size) {
    throw HashComputationError("short read of chunk " + std::to_string(index) + " from " +
                               source_.string() + " (file changed since hashing?)");
  }
  return buffer;
}

bool UploadSession::wait_for_retry(std::chrono::milliseconds delay, std::uint64_t generation) {
  std::unique_lock<std::mutex> lock(mutex_);
  bool cancelled = changed_cv_.wait_for(lock, delay, [&]{
    return destroyed_ || generation != generation_ || state_ == State::Error;
  });
  return !cancelled;
}

void UploadSession::on_chunk_finished(ChunkIndex index,
                                      std::exception_ptr failure,
                                      std::uint64_t generation) {
  if(failure) {
    fail(to_upload_error(failure), generation, index);
    return;
  }

  Snapshot snap;
  bool merge_now = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_) return;
    in_flight_.erase(index);
    completed_.insert(index);
    progress_ = 100.0 * static_cast<double>(completed_.size()) / chunk_count_;
    touch_locked();
    if(state_ == State::Uploading && pending_.empty() && in_flight_.empty() && !merge_started_) {
      merge_started_ = true;
      merging_ = true;
      merge_now = true;
    }
    snap = snapshot_locked();
  }
  changed_cv_.notify_all();
  log_debug(logger_.get(), "chunk {} of {} stored ({}/{})",
            index, snap.hash, snap.completed, snap.chunk_count);
  publish(snap);
  if(merge_now) run_merge(generation);
}

void UploadSession::run_merge(std::uint64_t generation) {
  FileHash hash;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_) return;
    hash = hash_;
    count = chunk_count_;
  }

  try {
    actions_->merge(hash, count);
  } catch(const UploadError& e) {
    fail(e, generation);
    return;
  } catch(const std::exception& e) {
    fail(TransferError(e.what()), generation);
    return;
  }

  Snapshot snap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_) return;
    merging_ = false;
    progress_ = 100.0;
    set_state_locked(State::UploadSuccessfully);
    snap = snapshot_locked();
  }
  changed_cv_.notify_all();
  log_info(logger_.get(), "upload of {} complete ({})", source_.filename().string(), hash);
  publish(snap);
}

void UploadSession::fail(const UploadError& error,
                         std::uint64_t generation,
                         std::optional<ChunkIndex> failed_chunk) {
  Snapshot snap;
  bool first_error = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_) return;
    if(failed_chunk) {
      in_flight_.erase(*failed_chunk);
      // A failed chunk stays owed; it is never dropped from the session.
      if(!completed_.count(*failed_chunk)) pending_.insert(*failed_chunk);
    }
    merging_ = false;
    if(!is_terminal(state_)) {
      first_error = true;
      error_ = error;
      if(pool_) {
        pool_->stop();
        pool_->clear();
      }
      set_state_locked(State::Error);
    } else {
      touch_locked();
    }
    snap = snapshot_locked();
  }
  changed_cv_.notify_all();
  if(first_error) {
    log_error(logger_.get(), "upload of {} failed: {} ({})",
              source_.filename().string(), error.what(), error.kind_name());
  }
  publish(snap);
}

// ---- state helpers --------------------------------------------------------

void UploadSession::reset_locked() {
  hash_.clear();
  file_size_ = 0;
  chunk_count_ = 0;
  pending_.clear();
  in_flight_.clear();
  completed_.clear();
  progress_ = 0.0;
  error_.reset();
  merge_started_ = false;
  merging_ = false;
}

void UploadSession::set_state_locked(State state) {
  if(state != state_) {
    log_debug(logger_.get(), "{}: {} -> {}", source_.filename().string(),
              state_name(state_), state_name(state));
  }
  state_ = state;
  touch_locked();
}

void UploadSession::touch_locked() {
  ++sequence_;
}

bool UploadSession::settled_locked() const {
  bool idle = in_flight_.empty() && !merging_ && (!pool_ || pool_->active() == 0);
  switch(state_) {
    case State::FastUploaded:
    case State::UploadSuccessfully:
      return true;
    case State::Error:
    case State::Default:
    case State::WaitForUpload:
    case State::UploadStopped:
      return idle;
    case State::CalculatingHash:
    case State::Uploading:
      return false;
  }
  return false;
}

UploadSession::Snapshot UploadSession::snapshot_locked() const {
  Snapshot snap;
  snap.sequence = sequence_;
  snap.state = state_;
  snap.progress = progress_;
  snap.error = error_;
  snap.hash = hash_;
  snap.file_size = file_size_;
  snap.chunk_count = chunk_count_;
  snap.completed = completed_.size();
  return snap;
}

void UploadSession::require_alive_locked() const {
  if(destroyed_) throw SessionStateError("upload session was destroyed");
}

void UploadSession::publish(const Snapshot& snapshot) {
  std::lock_guard<std::recursive_mutex> lock(listener_mutex_);
  if(snapshot.sequence <= delivered_sequence_) return;
  delivered_sequence_ = snapshot.sequence;
  std::vector<Listener> listeners;
  listeners.reserve(listeners_.size());
  for(const auto& entry : listeners_) listeners.push_back(entry.second);
  for(auto& listener : listeners) {
    try {
      listener(snapshot);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "upload listener threw: {}", e.what());
    }
  }
}

// ---- observers ------------------------------------------------------------

UploadSession::State UploadSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

double UploadSession::progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return progress_;
}

std::optional<UploadError> UploadSession::error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

UploadSession::Snapshot UploadSession::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_locked();
}

FileHash UploadSession::file_hash() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hash_;
}

std::size_t UploadSession::chunk_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunk_count_;
}

std::vector<ChunkIndex> UploadSession::pending_indices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<ChunkIndex>(pending_.begin(), pending_.end());
}

std::vector<ChunkIndex> UploadSession::in_flight_indices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<ChunkIndex>(in_flight_.begin(), in_flight_.end());
}

std::vector<ChunkIndex> UploadSession::completed_indices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<ChunkIndex>(completed_.begin(), completed_.end());
}

bool UploadSession::wait_until_settled(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return changed_cv_.wait_for(lock, timeout, [&]{ return settled_locked(); });
}

UploadSession::ListenerHandle UploadSession::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::recursive_mutex> lock(listener_mutex_);
  auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void UploadSession::remove_listener(ListenerHandle handle) {
  std::lock_guard<std::recursive_mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}
