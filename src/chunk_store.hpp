#pragma once

#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "upload_types.hpp"

// Durable storage for uploaded chunks and merged artifacts, keyed by
// (FileHash, ChunkIndex). Implementations must tolerate concurrent writers:
// a chunk write for a key that already exists is a silent success that leaves
// the stored bytes untouched.
class ChunkStore {
public:
  using ArtifactWriter = std::function<void(std::ostream&)>;

  virtual ~ChunkStore() = default;

  // True once a merged artifact exists for hash.
  virtual bool exists(const FileHash& hash) = 0;

  virtual bool chunk_exists(const FileHash& hash, ChunkIndex index) = 0;

  // Throws StorageWriteError on I/O failure.
  virtual void write_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) = 0;

  // Highest i such that chunks 0..i all exist.
  virtual std::optional<ChunkIndex> last_contiguous_index(const FileHash& hash);

  // Copies one chunk into out. Throws IncompleteUploadError when the chunk is
  // missing.
  virtual void read_chunk(const FileHash& hash, ChunkIndex index, std::ostream& out) = 0;

  // Runs writer against a staging location and publishes the result as the
  // artifact for hash in one step. If writer throws, nothing is published.
  virtual void publish_artifact(const FileHash& hash, const ArtifactWriter& writer) = 0;

  // Whole artifact contents. Throws IncompleteUploadError when absent.
  virtual std::string read_artifact(const FileHash& hash) = 0;
};
