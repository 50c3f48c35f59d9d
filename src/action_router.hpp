#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "log.hpp"
#include "protocol.hpp"
#include "upload_actions.hpp"

// Maps request names onto an UploadActions backend. One router is shared by
// every connection of a server; dispatch() is safe to call concurrently as
// long as the backend is.
class ActionRouter {
public:
  // Largest payload accepted by default (one chunk plus slack).
  static constexpr std::size_t kDefaultMaxRequestBytes = 64u * 1024u * 1024u;

  ActionRouter(std::shared_ptr<UploadActions> actions,
               std::shared_ptr<Logger> logger = nullptr,
               std::size_t max_request_bytes = kDefaultMaxRequestBytes);

  // Runs the named action and returns the full response object. Never throws
  // for request-level problems: they come back as an "error" member.
  json dispatch(const json& request, const std::string& payload);

  std::size_t max_request_bytes() const { return max_request_bytes_; }
  bool has_action(const std::string& name) const;

private:
  using Handler = std::function<json(const json& args, const std::string& payload)>;

  void register_actions();

  static FileHash hash_arg(const json& args, std::size_t pos);
  static std::size_t index_arg(const json& args, std::size_t pos);

  std::shared_ptr<UploadActions> actions_;
  std::shared_ptr<Logger> logger_;
  std::size_t max_request_bytes_;
  std::unordered_map<std::string, Handler> handlers_;
};
