#include "macros.hh"
#include "partsink/upload.sink.hh"

partsink::UploadSink::UploadSink(std::shared_ptr<UploadClient> client,
                                 std::optional<ObjectAddress> address,
                                 UploadSettings settings,
                                 ObjectFraming framing)
  : client_{ std::move(client) }
  , settings_{ std::move(settings) }
  , framing_{ std::move(framing) }
  , staged_offset_{ 0 }
  , finishing_{ false }
  , closed_{ false }
{
    EXPECT(client_, "Upload client not provided.");
    EXPECT_VALID_SETTINGS(validate_upload_settings(settings_),
                          "Invalid upload settings");

    if (address) {
        session_ =
          std::make_unique<UploadSession>(client_, std::move(*address), settings_);
    }
}

bool
partsink::UploadSink::poll_ready()
{
    if (!session_ || closed_ || session_->is_terminal()) {
        return true; // start_send reports the error
    }

    if (!advance_()) {
        return false;
    }

    if (!finishing_ && should_complete_()) {
        LOG_DEBUG("Upload to ",
                  session_->address(),
                  " reached ",
                  session_->bytes_committed(),
                  " bytes in ",
                  session_->parts_committed(),
                  " parts, completing");
        begin_finish_();
        return advance_();
    }

    return true;
}

void
partsink::UploadSink::start_send(std::span<const std::byte> data)
{
    EXPECT_PROTOCOL(!closed_, "Cannot send to a closed upload");
    EXPECT_PROTOCOL(session_,
                    "Cannot send to an upload with no destination address");

    const auto phase = session_->phase();
    EXPECT_PROTOCOL(!finishing_ && !session_->is_terminal(),
                    "Cannot send to upload to ",
                    session_->address(),
                    ": session is ",
                    finishing_ && phase == PartsinkSessionPhase_Open
                      ? "finishing"
                      : to_string(phase));
    EXPECT_PROTOCOL(!session_->has_pending() && staged_.empty(),
                    "Upload to ",
                    session_->address(),
                    " is not ready to accept data");

    if (phase == PartsinkSessionPhase_Unopened) {
        if (framing_.begin_object) {
            framing_.begin_object(staged_);
        }
        session_->open();
    }

    staged_.insert(staged_.end(), data.begin(), data.end());
    (void)advance_();
}

bool
partsink::UploadSink::poll_flush()
{
    EXPECT_PROTOCOL(session_, "Cannot flush an upload with no destination");

    const auto phase = session_->phase();
    if (phase == PartsinkSessionPhase_Completed) {
        return true;
    }
    EXPECT_PROTOCOL(phase != PartsinkSessionPhase_Aborted,
                    "Cannot flush upload to ",
                    session_->address(),
                    ": session is aborted");

    if (!finishing_) {
        begin_finish_();
    }

    return advance_() &&
           session_->phase() == PartsinkSessionPhase_Completed;
}

bool
partsink::UploadSink::poll_close()
{
    closed_ = true;
    if (!session_) {
        return true;
    }

    return poll_flush();
}

void
partsink::UploadSink::push(std::span<const std::byte> data)
{
    while (!poll_ready()) {
        wait();
    }
    start_send(data);
}

const partsink::CompletedUpload&
partsink::UploadSink::flush()
{
    while (!poll_flush()) {
        wait();
    }
    return *session_->completed();
}

void
partsink::UploadSink::close()
{
    while (!poll_close()) {
        wait();
    }
}

void
partsink::UploadSink::start_new_upload(ObjectAddress address)
{
    EXPECT_PROTOCOL(!closed_, "Cannot start a new upload on a closed sink");
    EXPECT_PROTOCOL(!session_ || session_->is_terminal() ||
                      session_->phase() == PartsinkSessionPhase_Unopened,
                    "Cannot start a new upload to ",
                    address,
                    ": upload to ",
                    session_->address(),
                    " is still active");

    session_ =
      std::make_unique<UploadSession>(client_, std::move(address), settings_);
    staged_.clear();
    staged_offset_ = 0;
    finishing_ = false;
}

PartsinkSessionPhase
partsink::UploadSink::phase() const noexcept
{
    return session_ ? session_->phase() : PartsinkSessionPhase_Unopened;
}

const partsink::CompletedUpload*
partsink::UploadSink::completed() const noexcept
{
    if (!session_ || !session_->completed()) {
        return nullptr;
    }
    return &*session_->completed();
}

std::optional<partsink::UploadProgress>
partsink::UploadSink::progress() const
{
    if (!session_) {
        return std::nullopt;
    }

    auto progress = session_->progress();
    progress.bytes_buffered += staged_.size() - staged_offset_;
    return progress;
}

// Drive the session as far as it goes without blocking. Returns true once no
// operation is in flight and nothing is staged.
bool
partsink::UploadSink::advance_()
{
    while (session_->poll()) {
        if (!drain_staged_()) {
            continue;
        }

        if (session_->phase() != PartsinkSessionPhase_Open) {
            return true;
        }

        if (finishing_) {
            session_->complete();
        } else if (session_->buffer().is_cut_ready()) {
            session_->cut_part();
        } else {
            return true;
        }
    }

    return false;
}

// Move staged bytes into the part buffer. A record that does not fit fills
// the buffer to the maximum part size and spills into the next part. Returns
// false if bytes remain staged behind an operation in flight.
bool
partsink::UploadSink::drain_staged_()
{
    auto& buffer = session_->buffer();

    while (staged_offset_ < staged_.size()) {
        const std::span<const std::byte> rest(staged_.data() + staged_offset_,
                                              staged_.size() - staged_offset_);
        if (buffer.append(rest) == PartBuffer::AppendResult::Accepted) {
            break;
        }

        if (session_->has_pending()) {
            return false;
        }

        // the last part number is reserved for the final part
        if (session_->parts_committed() + 1 >= settings_.max_part_count) {
            const auto address = session_->address();
            const auto n_left = rest.size();
            staged_.clear();
            staged_offset_ = 0;
            session_->abort();

            const std::string err = LOG_ERROR("Record does not fit in upload to ",
                                              address,
                                              ": ",
                                              n_left,
                                              " bytes left over after ",
                                              settings_.max_part_count - 1,
                                              " parts, aborted");
            throw ProtocolViolation(err);
        }

        staged_offset_ += buffer.fill(rest);
        session_->cut_part();
    }

    staged_.clear();
    staged_offset_ = 0;
    return true;
}

bool
partsink::UploadSink::should_complete_() const
{
    if (session_->phase() != PartsinkSessionPhase_Open) {
        return false;
    }

    const auto& target = settings_.target_size;
    if (target && session_->bytes_committed() >= *target) {
        return true;
    }

    // leave a part number for the final part
    return session_->parts_committed() + 1 >= settings_.max_part_count;
}

void
partsink::UploadSink::begin_finish_()
{
    if (session_->phase() == PartsinkSessionPhase_Unopened) {
        session_->complete(); // throws, nothing was written
    }

    if (framing_.finalize) {
        framing_.finalize(staged_);
    }
    finishing_ = true;
}

void
partsink::UploadSink::wait() const
{
    if (session_) {
        session_->wait();
    }
}
