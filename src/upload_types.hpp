#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

using FileHash = std::string;
using ChunkIndex = std::size_t;

inline constexpr std::size_t kDefaultChunkSize = 2 * 1024 * 1024;
inline constexpr std::size_t kDefaultConcurrency = 4;

struct ChunkRange {
  ChunkIndex index = 0;
  std::uint64_t offset = 0;
  std::size_t size = 0;
};

// ceil(file_size / chunk_size); an empty file has no chunks.
inline std::size_t chunk_count(std::uint64_t file_size, std::size_t chunk_size) {
  if(chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
  return static_cast<std::size_t>((file_size + chunk_size - 1) / chunk_size);
}

inline ChunkRange chunk_range(ChunkIndex index, std::uint64_t file_size, std::size_t chunk_size) {
  if(index >= chunk_count(file_size, chunk_size)) {
    throw std::out_of_range("chunk index " + std::to_string(index) + " beyond end of file");
  }
  ChunkRange range;
  range.index = index;
  range.offset = static_cast<std::uint64_t>(index) * chunk_size;
  range.size = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, file_size - range.offset));
  return range;
}
