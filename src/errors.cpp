#include "partsink/errors.hh"

#include <sstream>

namespace {
std::string
describe_failure(partsink::RemoteOperation operation,
                 const partsink::ObjectAddress& address,
                 const std::string& upload_id,
                 unsigned int part_number,
                 const std::string& cause)
{
    std::ostringstream ss;
    ss << partsink::to_string(operation);
    if (part_number > 0) {
        ss << " (part " << part_number << ")";
    }
    ss << " failed for " << address;
    if (!upload_id.empty()) {
        ss << " (upload " << upload_id << ")";
    }
    ss << ": " << cause;

    return ss.str();
}
} // namespace

const char*
partsink::to_string(ErrorKind kind) noexcept
{
    switch (kind) {
        case ErrorKind::ProtocolViolation:
            return "protocol violation";
        case ErrorKind::RemoteOperationFailure:
            return "remote operation failure";
        case ErrorKind::AddressExhaustion:
            return "address exhaustion";
        case ErrorKind::Encoding:
            return "encoding";
    }
    return "unknown";
}

const char*
partsink::to_string(RemoteOperation operation) noexcept
{
    switch (operation) {
        case RemoteOperation::CreateUpload:
            return "create multipart upload";
        case RemoteOperation::UploadPart:
            return "upload part";
        case RemoteOperation::CompleteUpload:
            return "complete multipart upload";
        case RemoteOperation::AbortUpload:
            return "abort multipart upload";
    }
    return "unknown operation";
}

partsink::UploadError::UploadError(ErrorKind kind, const std::string& what)
  : std::runtime_error(what)
  , kind_{ kind }
{
}

partsink::ProtocolViolation::ProtocolViolation(const std::string& what)
  : UploadError(ErrorKind::ProtocolViolation, what)
{
}

partsink::InvalidSettings::InvalidSettings(const std::string& what)
  : ProtocolViolation(what)
{
}

partsink::RemoteOperationFailure::RemoteOperationFailure(
  RemoteOperation operation,
  ObjectAddress address,
  std::string upload_id,
  unsigned int part_number,
  std::string cause)
  : UploadError(
      ErrorKind::RemoteOperationFailure,
      describe_failure(operation, address, upload_id, part_number, cause))
  , operation_{ operation }
  , address_{ std::move(address) }
  , upload_id_{ std::move(upload_id) }
  , part_number_{ part_number }
  , cause_{ std::move(cause) }
{
}

partsink::AddressExhaustion::AddressExhaustion(const std::string& what)
  : UploadError(ErrorKind::AddressExhaustion, what)
{
}

partsink::EncodingError::EncodingError(const std::string& what)
  : UploadError(ErrorKind::Encoding, what)
{
}
