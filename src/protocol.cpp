#include "protocol.hpp"

json make_action_request(const std::string& name,
                         const json& args,
                         const std::string& request_id,
                         std::size_t payload_size) {
    json j;
    j["name"] = name;
    j["args"] = args.is_array() ? args : json::array();
    j["requestId"] = request_id;
    j["size"] = payload_size;
    return j;
}

json make_action_result(const std::string& request_id, const json& result){
    json j;
    j["requestId"] = request_id;
    j["result"] = result;
    return j;
}

json make_action_error(const std::string& request_id,
                       UploadErrorKind kind,
                       const std::string& message){
    json j;
    j["requestId"] = request_id;
    j["error"] = {{"kind", upload_error_kind_name(kind)}, {"message", message}};
    return j;
}
