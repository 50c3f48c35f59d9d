#pragma once

#include <cstddef>
#include <istream>
#include <optional>

#include "upload_types.hpp"

// The operations an upload client needs from the server side. Every call is
// independently invocable and idempotent. Implementations report failures
// with UploadError subclasses.
class UploadActions {
public:
  virtual ~UploadActions() = default;

  virtual void upload_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) = 0;
  virtual bool file_exists(const FileHash& hash) = 0;
  virtual bool chunk_exists(const FileHash& hash, ChunkIndex index) = 0;
  virtual void merge(const FileHash& hash, std::size_t chunk_count) = 0;
  virtual std::optional<ChunkIndex> last_existed_chunk_index(const FileHash& hash) = 0;
};
