#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "chunk_store.hpp"

// In-process store for tests and embedding. First writer of a key wins.
class MemoryChunkStore : public ChunkStore {
public:
  bool exists(const FileHash& hash) override;
  bool chunk_exists(const FileHash& hash, ChunkIndex index) override;
  void write_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) override;
  std::optional<ChunkIndex> last_contiguous_index(const FileHash& hash) override;
  void read_chunk(const FileHash& hash, ChunkIndex index, std::ostream& out) override;
  void publish_artifact(const FileHash& hash, const ArtifactWriter& writer) override;
  std::string read_artifact(const FileHash& hash) override;

  std::size_t chunk_total(const FileHash& hash);

private:
  struct Entry {
    std::map<ChunkIndex, std::string> chunks;
    std::optional<std::string> artifact;
  };

  std::mutex m_;
  std::unordered_map<FileHash, Entry> map_; // file_hash -> entry
};
