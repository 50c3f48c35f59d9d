#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "chunk_store.hpp"
#include "log.hpp"

// Disk-backed store.
//
//   <root>/chunks/<hash>/<index>.chunk   uploaded chunks
//   <root>/files/<hash>                  merged artifacts
//
// Every file is written under a unique staging name first and then linked
// into place, so readers never observe a partial chunk or artifact and the
// first completed writer of a key wins.
class FileSystemChunkStore : public ChunkStore {
public:
  explicit FileSystemChunkStore(std::filesystem::path root,
                                std::shared_ptr<Logger> logger = nullptr);

  bool exists(const FileHash& hash) override;
  bool chunk_exists(const FileHash& hash, ChunkIndex index) override;
  void write_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) override;
  void read_chunk(const FileHash& hash, ChunkIndex index, std::ostream& out) override;
  void publish_artifact(const FileHash& hash, const ArtifactWriter& writer) override;
  std::string read_artifact(const FileHash& hash) override;

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path chunk_path(const FileHash& hash, ChunkIndex index) const;
  std::filesystem::path artifact_path(const FileHash& hash) const;

private:
  std::filesystem::path chunk_dir(const FileHash& hash) const;
  std::filesystem::path staging_path_for(const std::filesystem::path& target) const;
  void install(const std::filesystem::path& staged, const std::filesystem::path& target);

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;
};
