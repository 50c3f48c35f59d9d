#include "upload_errors.hpp"

#include <array>
#include <utility>

namespace {

const std::array<std::pair<UploadErrorKind, const char*>, 6> kKindNames = {{
  {UploadErrorKind::HashComputation, "HashComputationError"},
  {UploadErrorKind::StorageWrite, "StorageWriteError"},
  {UploadErrorKind::IncompleteUpload, "IncompleteUploadError"},
  {UploadErrorKind::Transfer, "TransferError"},
  {UploadErrorKind::SessionState, "SessionStateError"},
  {UploadErrorKind::InvalidRequest, "InvalidRequestError"}
}};

} // namespace

const char* upload_error_kind_name(UploadErrorKind kind) {
  for(const auto& entry : kKindNames) {
    if(entry.first == kind) return entry.second;
  }
  return "UploadError";
}

std::optional<UploadErrorKind> upload_error_kind_from_name(const std::string& name) {
  for(const auto& entry : kKindNames) {
    if(name == entry.second) return entry.first;
  }
  return std::nullopt;
}

void throw_upload_error(UploadErrorKind kind, const std::string& message) {
  switch(kind) {
    case UploadErrorKind::HashComputation: throw HashComputationError(message);
    case UploadErrorKind::StorageWrite: throw StorageWriteError(message);
    case UploadErrorKind::IncompleteUpload: throw IncompleteUploadError(message);
    case UploadErrorKind::Transfer: throw TransferError(message);
    case UploadErrorKind::SessionState: throw SessionStateError(message);
    case UploadErrorKind::InvalidRequest: throw InvalidRequestError(message);
  }
  throw UploadError(kind, message);
}
