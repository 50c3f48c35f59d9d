#include "filesystem_chunk_store.hpp"

#include <unistd.h>

#include <array>
#include <atomic>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "content_hasher.hpp"
#include "upload_errors.hpp"

namespace {

// Removes a staging file on scope exit unless it was installed.
class StagingFile {
public:
  explicit StagingFile(std::filesystem::path path) : path_(std::move(path)) {}
  ~StagingFile() {
    if(path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

void require_valid_hash(const FileHash& hash) {
  if(!is_valid_file_hash(hash)) {
    throw InvalidRequestError("invalid file hash '" + hash + "'");
  }
}

void copy_stream(std::istream& in, std::ostream& out) {
  std::array<char, 64 * 1024> buffer{};
  while(in) {
    in.read(buffer.data(), buffer.size());
    std::streamsize read = in.gcount();
    if(read > 0) {
      out.write(buffer.data(), read);
      if(!out) return;
    }
  }
}

} // namespace

FileSystemChunkStore::FileSystemChunkStore(std::filesystem::path root,
                                           std::shared_ptr<Logger> logger)
  : root_(std::move(root)), logger_(std::move(logger)) {
  std::error_code ec;
  std::filesystem::create_directories(root_ / "chunks", ec);
  if(!ec) std::filesystem::create_directories(root_ / "files", ec);
  if(ec) {
    throw StorageWriteError("cannot create store at " + root_.string() + ": " + ec.message());
  }
}

std::filesystem::path FileSystemChunkStore::chunk_dir(const FileHash& hash) const {
  return root_ / "chunks" / hash;
}

std::filesystem::path FileSystemChunkStore::chunk_path(const FileHash& hash, ChunkIndex index) const {
  return chunk_dir(hash) / (std::to_string(index) + ".chunk");
}

std::filesystem::path FileSystemChunkStore::artifact_path(const FileHash& hash) const {
  return root_ / "files" / hash;
}

std::filesystem::path FileSystemChunkStore::staging_path_for(const std::filesystem::path& target) const {
  static std::atomic<uint64_t> counter{0};
  std::ostringstream name;
  name << target.filename().string() << ".tmp-" << ::getpid() << "-" << counter.fetch_add(1);
  return target.parent_path() / name.str();
}

void FileSystemChunkStore::install(const std::filesystem::path& staged,
                                   const std::filesystem::path& target) {
  std::error_code ec;
  std::filesystem::create_hard_link(staged, target, ec);
  if(!ec || ec == std::errc::file_exists) return;
  if(ec == std::errc::operation_not_supported || ec == std::errc::operation_not_permitted) {
    // Filesystems without hard links fall back to rename, which replaces a
    // concurrent writer's identical copy.
    std::error_code rename_ec;
    std::filesystem::rename(staged, target, rename_ec);
    if(!rename_ec) return;
    ec = rename_ec;
  }
  throw StorageWriteError("cannot install " + target.string() + ": " + ec.message());
}

bool FileSystemChunkStore::exists(const FileHash& hash) {
  require_valid_hash(hash);
  std::error_code ec;
  return std::filesystem::is_regular_file(artifact_path(hash), ec);
}

bool FileSystemChunkStore::chunk_exists(const FileHash& hash, ChunkIndex index) {
  require_valid_hash(hash);
  std::error_code ec;
  return std::filesystem::is_regular_file(chunk_path(hash, index), ec);
}

void FileSystemChunkStore::write_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) {
  require_valid_hash(hash);
  auto target = chunk_path(hash, index);
  if(chunk_exists(hash, index)) {
    log_debug(logger_.get(), "chunk {}#{} already stored", hash, index);
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if(ec) {
    throw StorageWriteError("cannot create " + target.parent_path().string() + ": " + ec.message());
  }

  StagingFile staged(staging_path_for(target));
  {
    std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
    if(!out) {
      throw StorageWriteError("cannot open " + staged.path().string());
    }
    copy_stream(data, out);
    if(data.bad()) {
      throw StorageWriteError("failed reading payload for chunk " + std::to_string(index));
    }
    out.flush();
    if(!out) {
      throw StorageWriteError("failed writing " + staged.path().string());
    }
  }
  install(staged.path(), target);
  log_debug(logger_.get(), "stored chunk {}#{}", hash, index);
}

void FileSystemChunkStore::read_chunk(const FileHash& hash, ChunkIndex index, std::ostream& out) {
  require_valid_hash(hash);
  std::ifstream in(chunk_path(hash, index), std::ios::binary);
  if(!in) {
    throw IncompleteUploadError("chunk " + std::to_string(index) + " of " + hash + " is missing");
  }
  copy_stream(in, out);
  if(!out) {
    throw StorageWriteError("failed copying chunk " + std::to_string(index) + " of " + hash);
  }
}

void FileSystemChunkStore::publish_artifact(const FileHash& hash, const ArtifactWriter& writer) {
  require_valid_hash(hash);
  auto target = artifact_path(hash);
  StagingFile staged(staging_path_for(target));
  {
    std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
    if(!out) {
      throw StorageWriteError("cannot open " + staged.path().string());
    }
    writer(out);
    out.flush();
    if(!out) {
      throw StorageWriteError("failed writing " + staged.path().string());
    }
  }
  install(staged.path(), target);
}

std::string FileSystemChunkStore::read_artifact(const FileHash& hash) {
  require_valid_hash(hash);
  std::ifstream in(artifact_path(hash), std::ios::binary);
  if(!in) {
    throw IncompleteUploadError("no merged artifact for " + hash);
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}
