#pragma once

#include <optional>
#include <stdexcept>
#include <string>

enum class UploadErrorKind {
  HashComputation,
  StorageWrite,
  IncompleteUpload,
  Transfer,
  SessionState,
  InvalidRequest
};

const char* upload_error_kind_name(UploadErrorKind kind);
std::optional<UploadErrorKind> upload_error_kind_from_name(const std::string& name);

class UploadError : public std::runtime_error {
public:
  UploadError(UploadErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  UploadErrorKind kind() const { return kind_; }
  const char* kind_name() const { return upload_error_kind_name(kind_); }

  // Transfer and chunk write failures may succeed on a later attempt.
  bool retryable() const {
    return kind_ == UploadErrorKind::Transfer || kind_ == UploadErrorKind::StorageWrite;
  }

private:
  UploadErrorKind kind_;
};

// Source could not be opened or read.
class HashComputationError : public UploadError {
public:
  explicit HashComputationError(const std::string& message)
    : UploadError(UploadErrorKind::HashComputation, message) {}
};

class StorageWriteError : public UploadError {
public:
  explicit StorageWriteError(const std::string& message)
    : UploadError(UploadErrorKind::StorageWrite, message) {}
};

// Merge requested while chunks are still missing.
class IncompleteUploadError : public UploadError {
public:
  explicit IncompleteUploadError(const std::string& message)
    : UploadError(UploadErrorKind::IncompleteUpload, message) {}
};

class TransferError : public UploadError {
public:
  explicit TransferError(const std::string& message)
    : UploadError(UploadErrorKind::Transfer, message) {}
};

class SessionStateError : public UploadError {
public:
  explicit SessionStateError(const std::string& message)
    : UploadError(UploadErrorKind::SessionState, message) {}
};

class InvalidRequestError : public UploadError {
public:
  explicit InvalidRequestError(const std::string& message)
    : UploadError(UploadErrorKind::InvalidRequest, message) {}
};

// Throws the subclass matching kind. Used to rebuild errors reported by a
// remote peer.
[[noreturn]] void throw_upload_error(UploadErrorKind kind, const std::string& message);
