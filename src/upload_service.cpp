#include "upload_service.hpp"

#include <stdexcept>

#include "content_hasher.hpp"
#include "upload_errors.hpp"

namespace {

void require_valid_hash(const FileHash& hash) {
  if(!is_valid_file_hash(hash)) {
    throw InvalidRequestError("invalid file hash '" + hash + "'");
  }
}

} // namespace

UploadService::UploadService(std::shared_ptr<ChunkStore> store,
                             std::shared_ptr<Merger> merger,
                             std::shared_ptr<Logger> logger)
  : store_(std::move(store)), merger_(std::move(merger)), logger_(std::move(logger)) {
  if(!store_) throw std::invalid_argument("UploadService requires a chunk store");
  if(!merger_) merger_ = std::make_shared<Merger>(store_, logger_);
}

void UploadService::upload_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) {
  require_valid_hash(hash);
  store_->write_chunk(hash, index, data);
}

bool UploadService::file_exists(const FileHash& hash) {
  require_valid_hash(hash);
  return store_->exists(hash);
}

bool UploadService::chunk_exists(const FileHash& hash, ChunkIndex index) {
  require_valid_hash(hash);
  return store_->chunk_exists(hash, index);
}

void UploadService::merge(const FileHash& hash, std::size_t chunk_count) {
  require_valid_hash(hash);
  merger_->merge(hash, chunk_count);
}

std::optional<ChunkIndex> UploadService::last_existed_chunk_index(const FileHash& hash) {
  require_valid_hash(hash);
  return store_->last_contiguous_index(hash);
}
