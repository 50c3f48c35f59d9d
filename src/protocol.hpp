#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

#include "upload_errors.hpp"

using json = nlohmann::json;

// Wire format: one JSON object per line. A request whose "size" is non-zero
// is followed by exactly that many raw payload bytes.
//
//   request   {"name": ..., "args": [...], "requestId": ..., "size": n}
//   response  {"requestId": ..., "result": ...}
//          or {"requestId": ..., "error": {"kind": ..., "message": ...}}

namespace action_names {
inline constexpr const char* kUploadChunk = "uploadChunk";
inline constexpr const char* kFileExists = "fileExists";
inline constexpr const char* kChunkExists = "chunkExists";
inline constexpr const char* kMerge = "merge";
inline constexpr const char* kGetLastExistedChunkIndex = "getLastExistedChunkIndex";
} // namespace action_names

json make_action_request(const std::string& name,
                         const json& args,
                         const std::string& request_id,
                         std::size_t payload_size = 0);
json make_action_result(const std::string& request_id, const json& result);
json make_action_error(const std::string& request_id,
                       UploadErrorKind kind,
                       const std::string& message);
