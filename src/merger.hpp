#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "chunk_store.hpp"
#include "log.hpp"

// Reassembles uploaded chunks into the final artifact.
class Merger {
public:
  explicit Merger(std::shared_ptr<ChunkStore> store,
                  std::shared_ptr<Logger> logger = nullptr);

  // Concatenates chunks [0, chunk_count) of hash in index order. A hash that
  // is already merged returns without touching the store. Missing chunks are
  // detected before anything is written (IncompleteUploadError); a failed
  // write leaves the chunks in place for a retry (StorageWriteError).
  // Concurrent calls for one hash run one at a time.
  void merge(const FileHash& hash, std::size_t chunk_count);

  std::size_t merges_performed() const;

private:
  struct HashLock {
    std::mutex mutex;
    std::size_t users = 0;
  };

  std::shared_ptr<HashLock> acquire_lock(const FileHash& hash);
  void release_lock(const FileHash& hash);

  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex locks_mutex_;
  std::unordered_map<FileHash, std::shared_ptr<HashLock>> locks_;
  std::size_t merges_performed_ = 0;
};
