#include "action_router.hpp"

#include <sstream>
#include <stdexcept>

#include "upload_errors.hpp"

ActionRouter::ActionRouter(std::shared_ptr<UploadActions> actions,
                           std::shared_ptr<Logger> logger,
                           std::size_t max_request_bytes)
  : actions_(std::move(actions)),
    logger_(std::move(logger)),
    max_request_bytes_(max_request_bytes) {
  if(!actions_) throw std::invalid_argument("action router requires a backend");
  register_actions();
}

bool ActionRouter::has_action(const std::string& name) const {
  return handlers_.count(name) > 0;
}

FileHash ActionRouter::hash_arg(const json& args, std::size_t pos) {
  if(!args.is_array() || args.size() <= pos || !args[pos].is_string()) {
    throw InvalidRequestError("argument " + std::to_string(pos) + " must be a file hash string");
  }
  return args[pos].get<std::string>();
}

std::size_t ActionRouter::index_arg(const json& args, std::size_t pos) {
  if(!args.is_array() || args.size() <= pos || !args[pos].is_number_integer() ||
     args[pos].get<long long>() < 0) {
    throw InvalidRequestError("argument " + std::to_string(pos) + " must be a non-negative integer");
  }
  return args[pos].get<std::size_t>();
}

void ActionRouter::register_actions() {
  handlers_[action_names::kUploadChunk] = [this](const json& args, const std::string& payload) {
    auto hash = hash_arg(args, 0);
    auto index = index_arg(args, 1);
    std::istringstream in(payload);
    actions_->upload_chunk(hash, index, in);
    return json(true);
  };
  handlers_[action_names::kFileExists] = [this](const json& args, const std::string&) {
    return json(actions_->file_exists(hash_arg(args, 0)));
  };
  handlers_[action_names::kChunkExists] = [this](const json& args, const std::string&) {
    return json(actions_->chunk_exists(hash_arg(args, 0), index_arg(args, 1)));
  };
  handlers_[action_names::kMerge] = [this](const json& args, const std::string&) {
    actions_->merge(hash_arg(args, 0), index_arg(args, 1));
    return json(true);
  };
  handlers_[action_names::kGetLastExistedChunkIndex] = [this](const json& args, const std::string&) {
    auto last = actions_->last_existed_chunk_index(hash_arg(args, 0));
    return last ? json(*last) : json(nullptr);
  };
}

json ActionRouter::dispatch(const json& request, const std::string& payload) {
  std::string request_id;
  if(request.is_object() && request.contains("requestId") && request["requestId"].is_string()) {
    request_id = request["requestId"].get<std::string>();
  }

  try {
    if(!request.is_object() || !request.contains("name") || !request["name"].is_string()) {
      throw InvalidRequestError("request has no action name");
    }
    auto name = request["name"].get<std::string>();
    auto it = handlers_.find(name);
    if(it == handlers_.end()) {
      throw InvalidRequestError("unknown action '" + name + "'");
    }
    if(payload.size() > max_request_bytes_) {
      throw InvalidRequestError("payload of " + std::to_string(payload.size()) +
                                " bytes exceeds limit of " + std::to_string(max_request_bytes_));
    }
    json args = request.value("args", json::array());
    log_debug(logger_.get(), "dispatch {} {}", name, args.dump());
    return make_action_result(request_id, it->second(args, payload));
  } catch(const UploadError& ex) {
    log_warn(logger_.get(), "request {} failed: {}: {}", request_id, ex.kind_name(), ex.what());
    return make_action_error(request_id, ex.kind(), ex.what());
  } catch(const json::exception& ex) {
    return make_action_error(request_id, UploadErrorKind::InvalidRequest, ex.what());
  } catch(const std::exception& ex) {
    // Anything else escaping a backend is a storage-side failure.
    log_error(logger_.get(), "request {} failed: {}", request_id, ex.what());
    return make_action_error(request_id, UploadErrorKind::StorageWrite, ex.what());
  }
}
