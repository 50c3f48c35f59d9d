#include "memory_chunk_store.hpp"

#include <iterator>
#include <sstream>

#include "upload_errors.hpp"

bool MemoryChunkStore::exists(const FileHash& hash) {
  std::lock_guard lg(m_);
  auto it = map_.find(hash);
  return it != map_.end() && it->second.artifact.has_value();
}

bool MemoryChunkStore::chunk_exists(const FileHash& hash, ChunkIndex index) {
  std::lock_guard lg(m_);
  auto it = map_.find(hash);
  return it != map_.end() && it->second.chunks.count(index) > 0;
}

void MemoryChunkStore::write_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) {
  std::string bytes((std::istreambuf_iterator<char>(data)), std::istreambuf_iterator<char>());
  if(data.bad()) {
    throw StorageWriteError("failed reading chunk " + std::to_string(index) + " of " + hash);
  }
  std::lock_guard lg(m_);
  map_[hash].chunks.emplace(index, std::move(bytes));
}

std::optional<ChunkIndex> MemoryChunkStore::last_contiguous_index(const FileHash& hash) {
  std::lock_guard lg(m_);
  auto it = map_.find(hash);
  if(it == map_.end()) return std::nullopt;
  std::optional<ChunkIndex> last;
  ChunkIndex expected = 0;
  for(const auto& chunk : it->second.chunks) {
    if(chunk.first != expected) break;
    last = expected++;
  }
  return last;
}

void MemoryChunkStore::read_chunk(const FileHash& hash, ChunkIndex index, std::ostream& out) {
  std::string bytes;
  {
    std::lock_guard lg(m_);
    auto it = map_.find(hash);
    if(it == map_.end() || !it->second.chunks.count(index)) {
      throw IncompleteUploadError("chunk " + std::to_string(index) + " of " + hash + " is missing");
    }
    bytes = it->second.chunks.at(index);
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if(!out) {
    throw StorageWriteError("failed copying chunk " + std::to_string(index) + " of " + hash);
  }
}

void MemoryChunkStore::publish_artifact(const FileHash& hash, const ArtifactWriter& writer) {
  std::ostringstream staging;
  writer(staging);
  if(!staging) {
    throw StorageWriteError("failed staging artifact " + hash);
  }
  std::lock_guard lg(m_);
  auto& entry = map_[hash];
  if(!entry.artifact) {
    entry.artifact = staging.str();
  }
}

std::string MemoryChunkStore::read_artifact(const FileHash& hash) {
  std::lock_guard lg(m_);
  auto it = map_.find(hash);
  if(it == map_.end() || !it->second.artifact) {
    throw IncompleteUploadError("no merged artifact for " + hash);
  }
  return *it->second.artifact;
}

std::size_t MemoryChunkStore::chunk_total(const FileHash& hash) {
  std::lock_guard lg(m_);
  auto it = map_.find(hash);
  return it == map_.end() ? 0 : it->second.chunks.size();
}
