#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "upload_types.hpp"

std::string hex_from_bytes(const std::vector<unsigned char>& bytes);

// SHA-256 identity of upload content. All digests are lowercase hex.
class ContentHasher {
public:
  static constexpr std::size_t kReadBufferSize = 64 * 1024;

  // Incremental digest for callers that already hold the bytes in pieces.
  class Accumulator {
  public:
    Accumulator();
    Accumulator(const Accumulator&) = delete;
    Accumulator& operator=(const Accumulator&) = delete;

    void update(const char* data, std::size_t size);
    std::string hex_digest();

  private:
    struct CtxDeleter {
      void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    bool finished_ = false;
  };

  // Reads until end of stream. Throws HashComputationError on a read failure.
  static FileHash hash_stream(std::istream& in);
  static FileHash hash_file(const std::filesystem::path& path);
  static std::string hash_bytes(const char* data, std::size_t size);
  static std::string hash_bytes(const std::string& data);
};

bool is_valid_file_hash(const std::string& hash);
