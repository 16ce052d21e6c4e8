#include "macros.hh"
#include "partsink/upload.session.hh"

#include <chrono>

namespace {
bool
is_ready(const std::future<std::string>& result)
{
    using namespace std::chrono_literals;
    return result.wait_for(0s) == std::future_status::ready;
}
} // namespace

const char*
partsink::to_string(PartsinkSessionPhase phase) noexcept
{
    switch (phase) {
        case PartsinkSessionPhase_Unopened:
            return "unopened";
        case PartsinkSessionPhase_Open:
            return "open";
        case PartsinkSessionPhase_Completing:
            return "completing";
        case PartsinkSessionPhase_Completed:
            return "completed";
        case PartsinkSessionPhase_Aborted:
            return "aborted";
        default:
            return "(unknown)";
    }
}

partsink::UploadSession::UploadSession(std::shared_ptr<UploadClient> client,
                                       ObjectAddress address,
                                       const UploadSettings& settings)
  : client_{ std::move(client) }
  , address_{ std::move(address) }
  , max_part_count_{ settings.max_part_count }
  , phase_{ PartsinkSessionPhase_Unopened }
  , buffer_(settings.min_part_size, settings.max_part_size)
  , bytes_committed_{ 0 }
{
    EXPECT(client_, "Upload client not provided.");
    EXPECT_PROTOCOL(!address_.empty(),
                    "Destination address must have a bucket and a key: '",
                    address_,
                    "'");
    EXPECT_VALID_SETTINGS(validate_upload_settings(settings),
                          "Invalid upload settings for ",
                          address_);
}

partsink::UploadSession::~UploadSession() noexcept
{
    if (phase_ == PartsinkSessionPhase_Open ||
        phase_ == PartsinkSessionPhase_Completing) {
        LOG_WARNING("Closing incomplete multipart upload ",
                    upload_id_,
                    " for ",
                    address_,
                    " -> aborting");
        abandon_();
    }
}

void
partsink::UploadSession::open()
{
    EXPECT_PROTOCOL(phase_ == PartsinkSessionPhase_Unopened,
                    "Cannot open upload to ",
                    address_,
                    ": session is ",
                    to_string(phase_));

    std::future<std::string> result;
    try {
        result = client_->create_upload(address_);
    } catch (const std::exception& exc) {
        phase_ = PartsinkSessionPhase_Aborted;
        LOG_ERROR(
          "Failed to create multipart upload for ", address_, ": ", exc.what());
        throw RemoteOperationFailure(
          RemoteOperation::CreateUpload, address_, "", 0, exc.what());
    }

    pending_.emplace(
      PendingOperation{ RemoteOperation::CreateUpload, 0, {}, std::move(result) });
    phase_ = PartsinkSessionPhase_Open;

    LOG_DEBUG("Creating multipart upload for ", address_);
}

void
partsink::UploadSession::cut_part()
{
    EXPECT_PROTOCOL(phase_ == PartsinkSessionPhase_Open,
                    "Cannot cut a part for ",
                    address_,
                    ": session is ",
                    to_string(phase_));
    EXPECT_PROTOCOL(!pending_,
                    "Cannot cut a part for ",
                    address_,
                    " while another operation is in flight");
    EXPECT_PROTOCOL(buffer_.is_cut_ready(),
                    "Part of ",
                    buffer_.size(),
                    " bytes is below the minimum part size of ",
                    buffer_.min_part_size(),
                    " bytes");

    // the last part number is reserved for the final part
    const auto part_number = parts_committed() + 1;
    EXPECT_PROTOCOL(part_number < max_part_count_,
                    "Upload to ",
                    address_,
                    " has reached its limit of ",
                    max_part_count_,
                    " parts");

    issue_part_();
}

void
partsink::UploadSession::complete()
{
    if (phase_ == PartsinkSessionPhase_Unopened) {
        phase_ = PartsinkSessionPhase_Aborted;
        const std::string err = LOG_ERROR(
          "Cannot complete upload to ", address_, ": nothing was written");
        throw ProtocolViolation(err);
    }

    EXPECT_PROTOCOL(phase_ == PartsinkSessionPhase_Open,
                    "Cannot complete upload to ",
                    address_,
                    ": session is ",
                    to_string(phase_));
    EXPECT_PROTOCOL(!pending_,
                    "Cannot complete upload to ",
                    address_,
                    " while another operation is in flight");

    if (buffer_.empty() && parts_.empty()) {
        abort_remote_();
        phase_ = PartsinkSessionPhase_Aborted;
        const std::string err = LOG_ERROR(
          "Cannot complete upload to ", address_, ": nothing was written");
        throw ProtocolViolation(err);
    }

    if (buffer_.empty()) {
        phase_ = PartsinkSessionPhase_Completing;
        issue_complete_();
        return;
    }

    EXPECT_PROTOCOL(parts_committed() < max_part_count_,
                    "Upload to ",
                    address_,
                    " has no part number left for its final part");

    phase_ = PartsinkSessionPhase_Completing;
    issue_part_();
}

void
partsink::UploadSession::abort()
{
    EXPECT_PROTOCOL(!is_terminal(),
                    "Cannot abort upload to ",
                    address_,
                    ": session is ",
                    to_string(phase_));

    LOG_DEBUG("Aborting upload to ", address_);
    abandon_();
}

bool
partsink::UploadSession::poll()
{
    while (pending_ && is_ready(pending_->result)) {
        resolve_();
    }

    return !pending_;
}

void
partsink::UploadSession::wait() const
{
    if (pending_) {
        pending_->result.wait();
    }
}

bool
partsink::UploadSession::is_terminal() const noexcept
{
    return phase_ == PartsinkSessionPhase_Completed ||
           phase_ == PartsinkSessionPhase_Aborted;
}

unsigned int
partsink::UploadSession::parts_committed() const noexcept
{
    return static_cast<unsigned int>(parts_.size());
}

partsink::UploadProgress
partsink::UploadSession::progress() const
{
    return { address_,          upload_id_,     bytes_committed_,
             parts_committed(), buffer_.size(), phase_ };
}

void
partsink::UploadSession::issue_part_()
{
    const auto part_number = parts_committed() + 1;

    // the payload lives in the pending slot until the part is acknowledged
    pending_.emplace(PendingOperation{
      RemoteOperation::UploadPart, part_number, buffer_.take(), {} });

    try {
        pending_->result = client_->upload_part(
          address_, upload_id_, part_number, pending_->payload);
    } catch (const std::exception& exc) {
        pending_.reset();
        fail_(RemoteOperation::UploadPart, part_number, exc.what());
    }

    LOG_DEBUG("Uploading part ",
              part_number,
              " (",
              pending_->payload.size(),
              " bytes) of ",
              address_);
}

void
partsink::UploadSession::issue_complete_()
{
    std::vector<CompletedPart> parts;
    parts.reserve(parts_.size());
    for (const auto& [number, part] : parts_) {
        parts.push_back(part);
    }

    std::future<std::string> result;
    try {
        result = client_->complete_upload(address_, upload_id_, parts);
    } catch (const std::exception& exc) {
        fail_(RemoteOperation::CompleteUpload, 0, exc.what());
    }

    pending_.emplace(PendingOperation{
      RemoteOperation::CompleteUpload, 0, {}, std::move(result) });

    LOG_DEBUG(
      "Completing upload to ", address_, " with ", parts.size(), " parts");
}

void
partsink::UploadSession::resolve_()
{
    PendingOperation op = std::move(*pending_);
    pending_.reset();

    std::string value;
    try {
        value = op.result.get();
    } catch (const std::exception& exc) {
        if (op.operation == RemoteOperation::CreateUpload) {
            // no upload exists, so there is nothing to abort
            phase_ = PartsinkSessionPhase_Aborted;
            LOG_ERROR(
              "Failed to create upload for ", address_, ": ", exc.what());
            throw RemoteOperationFailure(
              op.operation, address_, "", 0, exc.what());
        }
        fail_(op.operation, op.part_number, exc.what());
    }

    switch (op.operation) {
        case RemoteOperation::CreateUpload:
            upload_id_ = std::move(value);
            LOG_DEBUG("Created upload ", upload_id_, " for ", address_);
            break;
        case RemoteOperation::UploadPart: {
            // part numbers are assigned sequentially and only one part is
            // ever in flight, so the acknowledged part is always the next one
            CHECK(op.part_number == parts_committed() + 1);

            const auto size = op.payload.size();
            parts_.emplace(op.part_number,
                           CompletedPart{ op.part_number, std::move(value), size });
            bytes_committed_ += size;
            buffer_.recycle(std::move(op.payload));

            if (phase_ == PartsinkSessionPhase_Completing) {
                issue_complete_();
            }
            break;
        }
        case RemoteOperation::CompleteUpload:
            set_completed_(std::move(value));
            break;
        default:
            CHECK(false);
    }
}

void
partsink::UploadSession::set_completed_(std::string etag)
{
    phase_ = PartsinkSessionPhase_Completed;
    completed_ = CompletedUpload{
        address_, upload_id_, std::move(etag), bytes_committed_, parts_committed()
    };

    LOG_INFO("Completed upload of ",
             bytes_committed_,
             " bytes in ",
             parts_committed(),
             " parts to ",
             address_);
}

void
partsink::UploadSession::fail_(RemoteOperation operation,
                               unsigned int part_number,
                               const std::string& cause)
{
    RemoteOperationFailure failure(
      operation, address_, upload_id_, part_number, cause);
    LOG_ERROR(failure.what());

    abort_remote_();
    phase_ = PartsinkSessionPhase_Aborted;

    throw failure;
}

void
partsink::UploadSession::abandon_() noexcept
{
    if (pending_) {
        // the payload must outlive the operation in flight
        pending_->result.wait();

        PendingOperation op = std::move(*pending_);
        pending_.reset();

        try {
            auto value = op.result.get();
            if (op.operation == RemoteOperation::CreateUpload) {
                upload_id_ = std::move(value);
            } else if (op.operation == RemoteOperation::CompleteUpload) {
                LOG_WARNING("Upload to ",
                            address_,
                            " completed before it could be aborted");
                set_completed_(std::move(value));
                return;
            }
        } catch (const std::exception& exc) {
            LOG_DEBUG("Operation in flight failed during abort: ", exc.what());
        }
    }

    if (upload_id_.empty()) {
        phase_ = PartsinkSessionPhase_Aborted;
        return;
    }

    abort_remote_();
    phase_ = PartsinkSessionPhase_Aborted;
}

void
partsink::UploadSession::abort_remote_() noexcept
{
    try {
        client_->abort_upload(address_, upload_id_).get();
        LOG_DEBUG("Aborted upload ", upload_id_, " for ", address_);
    } catch (const std::exception& exc) {
        LOG_ERROR("Failed to abort upload ",
                  upload_id_,
                  " for ",
                  address_,
                  ": ",
                  exc.what());
    }
}
