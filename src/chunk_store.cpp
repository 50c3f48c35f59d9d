#include "chunk_store.hpp"

std::optional<ChunkIndex> ChunkStore::last_contiguous_index(const FileHash& hash) {
  std::optional<ChunkIndex> last;
  for(ChunkIndex index = 0; chunk_exists(hash, index); ++index) {
    last = index;
  }
  return last;
}
