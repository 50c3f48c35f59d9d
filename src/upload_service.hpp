#pragma once

#include <memory>

#include "chunk_store.hpp"
#include "log.hpp"
#include "merger.hpp"
#include "upload_actions.hpp"

// Server side of UploadActions: validates requests and forwards them to a
// chunk store and merger supplied by the owner.
class UploadService : public UploadActions {
public:
  UploadService(std::shared_ptr<ChunkStore> store,
                std::shared_ptr<Merger> merger,
                std::shared_ptr<Logger> logger = nullptr);

  void upload_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) override;
  bool file_exists(const FileHash& hash) override;
  bool chunk_exists(const FileHash& hash, ChunkIndex index) override;
  void merge(const FileHash& hash, std::size_t chunk_count) override;
  std::optional<ChunkIndex> last_existed_chunk_index(const FileHash& hash) override;

  std::shared_ptr<ChunkStore> store() const { return store_; }
  std::shared_ptr<Merger> merger() const { return merger_; }

private:
  std::shared_ptr<ChunkStore> store_;
  std::shared_ptr<Merger> merger_;
  std::shared_ptr<Logger> logger_;
};
