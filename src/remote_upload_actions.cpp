#include "remote_upload_actions.hpp"

#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "protocol.hpp"
#include "upload_errors.hpp"

using json = nlohmann::json;

RemoteUploadActions::RemoteUploadActions(std::string host, uint16_t port,
                                         std::shared_ptr<Logger> logger)
  : host_(std::move(host)), port_(port), logger_(std::move(logger)) {
  if(host_.empty()) throw std::invalid_argument("server host must not be empty");
}

RemoteUploadActions::~RemoteUploadActions() {
  close_idle();
}

std::unique_ptr<RemoteUploadActions> RemoteUploadActions::from_address(const std::string& address,
                                                                       std::shared_ptr<Logger> logger) {
  auto pos = address.rfind(':');
  if(pos == std::string::npos || pos == 0 || pos + 1 >= address.size()) {
    throw std::invalid_argument("server must be host:port (got '" + address + "')");
  }
  auto host = address.substr(0, pos);
  auto port_text = address.substr(pos + 1);
  std::size_t used = 0;
  int port = 0;
  try {
    port = std::stoi(port_text, &used);
  } catch(const std::exception&) {
    used = 0;
  }
  if(used != port_text.size() || port <= 0 || port > 65535) {
    throw std::invalid_argument("invalid server port '" + port_text + "'");
  }
  return std::make_unique<RemoteUploadActions>(host, static_cast<uint16_t>(port), std::move(logger));
}

std::size_t RemoteUploadActions::idle_connections() const {
  std::lock_guard<std::mutex> lock(idle_mutex_);
  return idle_.size();
}

void RemoteUploadActions::close_idle() {
  std::vector<std::unique_ptr<Channel>> dropped;
  {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    dropped.swap(idle_);
  }
  for(auto& channel : dropped) {
    std::error_code ec;
    channel->socket.close(ec);
  }
}

std::unique_ptr<RemoteUploadActions::Channel> RemoteUploadActions::connect() {
  asio::ip::tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(host_, std::to_string(port_));
  auto channel = std::make_unique<Channel>(io_);
  asio::connect(channel->socket, endpoints);
  channel->socket.set_option(asio::ip::tcp::no_delay(true));
  log_debug(logger_.get(), "Connected to {}:{}", host_, port_);
  return channel;
}

std::unique_ptr<RemoteUploadActions::Channel> RemoteUploadActions::acquire(bool& reused) {
  {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    if(!idle_.empty()) {
      auto channel = std::move(idle_.back());
      idle_.pop_back();
      reused = true;
      return channel;
    }
  }
  reused = false;
  return connect();
}

void RemoteUploadActions::release(std::unique_ptr<Channel> channel) {
  std::lock_guard<std::mutex> lock(idle_mutex_);
  idle_.push_back(std::move(channel));
}

json RemoteUploadActions::exchange(Channel& channel, const std::string& header, const std::string& payload) {
  std::vector<asio::const_buffer> buffers{asio::buffer(header)};
  if(!payload.empty()) buffers.push_back(asio::buffer(payload));
  asio::write(channel.socket, buffers);

  asio::read_until(channel.socket, channel.read_buf, "\n");
  std::istream is(&channel.read_buf);
  std::string line;
  std::getline(is, line);
  return json::parse(line);
}

json RemoteUploadActions::call(const std::string& name,
                               const json& args,
                               const std::string& payload) {
  auto request_id = std::to_string(next_request_id_.fetch_add(1));
  auto header = make_action_request(name, args, request_id, payload.size()).dump() + "\n";

  json response;
  for(int attempt = 0;; ++attempt) {
    bool reused = false;
    try {
      auto channel = acquire(reused);
      response = exchange(*channel, header, payload);
      release(std::move(channel));
      break;
    } catch(const std::system_error& ex) {
      // An idle socket may have been closed by the server in the meantime;
      // every action is idempotent, so one more try on a fresh socket is safe.
      if(reused && attempt == 0) {
        log_debug(logger_.get(), "{}: stale connection to {}:{} ({}), reconnecting", name, host_, port_, ex.what());
        continue;
      }
      log_debug(logger_.get(), "{} to {}:{} failed: {}", name, host_, port_, ex.what());
      throw TransferError(name + " to " + host_ + ":" + std::to_string(port_) + " failed: " + ex.what());
    } catch(const json::parse_error& ex) {
      throw TransferError(name + ": malformed response: " + ex.what());
    }
  }

  if(response.value("requestId", std::string()) != request_id) {
    throw TransferError(name + ": response does not match request " + request_id);
  }
  if(response.contains("error")) {
    const auto& err = response["error"];
    auto kind_name = err.value("kind", std::string());
    auto message = err.value("message", std::string("remote error"));
    auto kind = upload_error_kind_from_name(kind_name);
    if(!kind) {
      throw TransferError(name + ": unknown remote error '" + kind_name + "': " + message);
    }
    throw_upload_error(*kind, message);
  }
  if(!response.contains("result")) {
    throw TransferError(name + ": response has no result");
  }
  return response["result"];
}

void RemoteUploadActions::upload_chunk(const FileHash& hash, ChunkIndex index, std::istream& data) {
  std::string payload((std::istreambuf_iterator<char>(data)), std::istreambuf_iterator<char>());
  if(data.bad()) {
    throw TransferError("unable to read chunk " + std::to_string(index) + " for upload");
  }
  call(action_names::kUploadChunk, json::array({hash, index}), payload);
}

bool RemoteUploadActions::file_exists(const FileHash& hash) {
  auto result = call(action_names::kFileExists, json::array({hash}));
  if(!result.is_boolean()) throw TransferError("fileExists: expected boolean result");
  return result.get<bool>();
}

bool RemoteUploadActions::chunk_exists(const FileHash& hash, ChunkIndex index) {
  auto result = call(action_names::kChunkExists, json::array({hash, index}));
  if(!result.is_boolean()) throw TransferError("chunkExists: expected boolean result");
  return result.get<bool>();
}

void RemoteUploadActions::merge(const FileHash& hash, std::size_t chunk_count) {
  call(action_names::kMerge, json::array({hash, chunk_count}));
}

std::optional<ChunkIndex> RemoteUploadActions::last_existed_chunk_index(const FileHash& hash) {
  auto result = call(action_names::kGetLastExistedChunkIndex, json::array({hash}));
  if(result.is_null()) return std::nullopt;
  if(!result.is_number_unsigned()) {
    throw TransferError("getLastExistedChunkIndex: expected index or null");
  }
  return result.get<ChunkIndex>();
}
