#pragma once

#include "partsink/object.address.hh"

#include <stdexcept>
#include <string>

namespace partsink {
enum class ErrorKind
{
    ProtocolViolation,
    RemoteOperationFailure,
    AddressExhaustion,
    Encoding,
};

enum class RemoteOperation
{
    CreateUpload,
    UploadPart,
    CompleteUpload,
    AbortUpload,
};

const char*
to_string(ErrorKind kind) noexcept;

const char*
to_string(RemoteOperation operation) noexcept;

/**
 * @brief Base class of every error raised by an upload.
 */
class UploadError : public std::runtime_error
{
  public:
    UploadError(ErrorKind kind, const std::string& what);

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

/**
 * @brief The caller broke the upload contract, e.g., by pushing to a
 * completed upload or completing an upload with no parts. Never retried.
 */
class ProtocolViolation : public UploadError
{
  public:
    explicit ProtocolViolation(const std::string& what);
};

/** @brief Settings were rejected by validation. */
class InvalidSettings : public ProtocolViolation
{
  public:
    explicit InvalidSettings(const std::string& what);
};

/**
 * @brief One of the four remote calls failed. The session it belonged to has
 * already been aborted (best-effort) by the time this is thrown.
 */
class RemoteOperationFailure : public UploadError
{
  public:
    RemoteOperationFailure(RemoteOperation operation,
                           ObjectAddress address,
                           std::string upload_id,
                           unsigned int part_number,
                           std::string cause);

    RemoteOperation operation() const noexcept { return operation_; }
    const ObjectAddress& address() const noexcept { return address_; }
    const std::string& upload_id() const noexcept { return upload_id_; }

    /** @brief The part being uploaded, or 0 if the operation has none. */
    unsigned int part_number() const noexcept { return part_number_; }

    /** @brief The message of the error reported by the client. */
    const std::string& cause() const noexcept { return cause_; }

  private:
    RemoteOperation operation_;
    ObjectAddress address_;
    std::string upload_id_;
    unsigned int part_number_;
    std::string cause_;
};

/**
 * @brief An unbounded upload ran out of destination addresses. The upload
 * cannot be used afterwards.
 */
class AddressExhaustion : public UploadError
{
  public:
    explicit AddressExhaustion(const std::string& what);
};

/** @brief A record could not be encoded. */
class EncodingError : public UploadError
{
  public:
    explicit EncodingError(const std::string& what);
};
} // namespace partsink
