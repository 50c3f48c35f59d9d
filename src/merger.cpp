#include "merger.hpp"

#include <stdexcept>
#include <vector>

#include "upload_errors.hpp"

namespace {

constexpr std::size_t kMissingListLimit = 8;

std::string describe_missing(const std::vector<ChunkIndex>& missing, bool truncated) {
  std::string out;
  for(std::size_t i = 0; i < missing.size(); ++i) {
    if(i > 0) out += ",";
    out += std::to_string(missing[i]);
  }
  if(truncated) {
    out += ",... (at least " + std::to_string(missing.size()) + " missing)";
  }
  return out;
}

} // namespace

Merger::Merger(std::shared_ptr<ChunkStore> store, std::shared_ptr<Logger> logger)
  : store_(std::move(store)), logger_(std::move(logger)) {
  if(!store_) throw std::invalid_argument("Merger requires a chunk store");
}

std::shared_ptr<Merger::HashLock> Merger::acquire_lock(const FileHash& hash) {
  std::lock_guard lg(locks_mutex_);
  auto& slot = locks_[hash];
  if(!slot) slot = std::make_shared<HashLock>();
  ++slot->users;
  return slot;
}

void Merger::release_lock(const FileHash& hash) {
  std::lock_guard lg(locks_mutex_);
  auto it = locks_.find(hash);
  if(it == locks_.end()) return;
  if(--it->second->users == 0) locks_.erase(it);
}

void Merger::merge(const FileHash& hash, std::size_t chunk_count) {
  auto hash_lock = acquire_lock(hash);
  struct Release {
    Merger* self;
    const FileHash& hash;
    ~Release() { self->release_lock(hash); }
  } release{this, hash};
  std::lock_guard merge_guard(hash_lock->mutex);

  if(store_->exists(hash)) {
    log_debug(logger_.get(), "merge {}: already merged", hash);
    return;
  }

  // chunk_count is client supplied: check the last index first and stop
  // after kMissingListLimit gaps.
  if(chunk_count > 0 && !store_->chunk_exists(hash, chunk_count - 1)) {
    throw IncompleteUploadError("cannot merge " + hash + ": missing chunk " +
                                std::to_string(chunk_count - 1) + " of " +
                                std::to_string(chunk_count));
  }
  std::vector<ChunkIndex> missing;
  bool truncated = false;
  for(ChunkIndex index = 0; index < chunk_count; ++index) {
    if(store_->chunk_exists(hash, index)) continue;
    if(missing.size() == kMissingListLimit) {
      truncated = true;
      break;
    }
    missing.push_back(index);
  }
  if(!missing.empty()) {
    throw IncompleteUploadError("cannot merge " + hash + ": missing chunks " +
                                describe_missing(missing, truncated));
  }

  store_->publish_artifact(hash, [&](std::ostream& out){
    for(ChunkIndex index = 0; index < chunk_count; ++index) {
      store_->read_chunk(hash, index, out);
    }
  });

  {
    std::lock_guard lg(locks_mutex_);
    ++merges_performed_;
  }
  log_info(logger_.get(), "merged {} ({} chunks)", hash, chunk_count);
}

std::size_t Merger::merges_performed() const {
  std::lock_guard lg(locks_mutex_);
  return merges_performed_;
}
