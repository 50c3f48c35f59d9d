#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log.hpp"
#include "upload_actions.hpp"

// UploadActions over TCP to an UploadServer. Calls block the caller; each
// call borrows an idle connection (or opens one), so pool workers talking to
// the server concurrently use separate sockets. A connection that saw an
// error is discarded rather than returned.
class RemoteUploadActions : public UploadActions {
public:
  RemoteUploadActions(std::string host, uint16_t port,
                      std::shared_ptr<Logger> logger = nullptr);
  ~RemoteUploadActions() override;

  // "host:port"; throws std::invalid_argument when malformed.
  static std::unique_ptr<RemoteUploadActions> from_address(const std::string& address,
                                                           std::shared_ptr<Logger> logger = nullptr);

  void upload_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) override;
  bool file_exists(const FileHash& hash) override;
  bool chunk_exists(const FileHash& hash, ChunkIndex index) override;
  void merge(const FileHash& hash, std::size_t chunk_count) override;
  std::optional<ChunkIndex> last_existed_chunk_index(const FileHash& hash) override;

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }
  std::size_t idle_connections() const;
  // Drops every idle connection.
  void close_idle();

private:
  struct Channel {
    explicit Channel(asio::io_context& io) : socket(io) {}
    asio::ip::tcp::socket socket;
    asio::streambuf read_buf;
  };

  nlohmann::json call(const std::string& name,
                      const nlohmann::json& args,
                      const std::string& payload = std::string());
  nlohmann::json exchange(Channel& channel, const std::string& header, const std::string& payload);
  // Sets reused when the channel came from the idle pool.
  std::unique_ptr<Channel> acquire(bool& reused);
  void release(std::unique_ptr<Channel> channel);
  std::unique_ptr<Channel> connect();

  std::string host_;
  uint16_t port_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  mutable std::mutex idle_mutex_;
  std::vector<std::unique_ptr<Channel>> idle_;
  std::atomic<uint64_t> next_request_id_{1};
};
