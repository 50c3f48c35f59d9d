#include "content_hasher.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "upload_errors.hpp"

std::string hex_from_bytes(const std::vector<unsigned char>& bytes) {
  std::ostringstream oss;
  for(auto c : bytes) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  return oss.str();
}

ContentHasher::Accumulator::Accumulator() : ctx_(EVP_MD_CTX_new()) {
  if(!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw HashComputationError("EVP_DigestInit_ex(sha256) failed");
  }
}

void ContentHasher::Accumulator::update(const char* data, std::size_t size) {
  if(finished_) {
    throw HashComputationError("digest already finalized");
  }
  if(size == 0) return;
  if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw HashComputationError("EVP_DigestUpdate failed");
  }
}

std::string ContentHasher::Accumulator::hex_digest() {
  if(finished_) {
    throw HashComputationError("digest already finalized");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
    throw HashComputationError("EVP_DigestFinal_ex failed");
  }
  finished_ = true;
  return hex_from_bytes(std::vector<unsigned char>(digest, digest + length));
}

FileHash ContentHasher::hash_stream(std::istream& in) {
  Accumulator acc;
  std::vector<char> buffer(kReadBufferSize);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = in.gcount();
    if(read > 0) {
      acc.update(buffer.data(), static_cast<std::size_t>(read));
    }
  }
  if(in.bad()) {
    throw HashComputationError("read error while hashing stream");
  }
  return acc.hex_digest();
}

FileHash ContentHasher::hash_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw HashComputationError("cannot open " + path.string());
  }
  try {
    return hash_stream(in);
  } catch(const HashComputationError& e) {
    throw HashComputationError(path.string() + ": " + e.what());
  }
}

std::string ContentHasher::hash_bytes(const char* data, std::size_t size) {
  Accumulator acc;
  acc.update(data, size);
  return acc.hex_digest();
}

std::string ContentHasher::hash_bytes(const std::string& data) {
  return hash_bytes(data.data(), data.size());
}

bool is_valid_file_hash(const std::string& hash) {
  if(hash.empty() || hash.size() > 128) return false;
  for(unsigned char ch : hash) {
    if(!std::isalnum(ch) && ch != '-' && ch != '_') return false;
  }
  return true;
}
