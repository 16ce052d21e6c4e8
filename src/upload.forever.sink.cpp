#include "macros.hh"
#include "partsink/upload.forever.sink.hh"

partsink::UploadForeverSink::UploadForeverSink(
  std::shared_ptr<UploadClient> client,
  std::unique_ptr<AddressSource> addresses,
  UploadSettings settings,
  ObjectFraming framing)
  : sink_(std::move(client), std::nullopt, settings, std::move(framing))
  , addresses_{ std::move(addresses) }
  , recorded_{ false }
  , exhausted_{ false }
{
    EXPECT(addresses_, "Address source not provided.");
    EXPECT_VALID_SETTINGS(settings.target_size.has_value(),
                          "Unbounded uploads require a target size");
}

bool
partsink::UploadForeverSink::poll_ready()
{
    check_usable_();
    if (!sink_.poll_ready()) {
        return false;
    }

    record_completion_();
    return true;
}

void
partsink::UploadForeverSink::start_send(std::span<const std::byte> data)
{
    EXPECT_PROTOCOL(!sink_.is_closed(), "Cannot send to a closed upload");
    check_usable_();

    if (!sink_.has_session() ||
        sink_.phase() == PartsinkSessionPhase_Completed) {
        record_completion_();
        next_upload_();
    }

    sink_.start_send(data);
}

bool
partsink::UploadForeverSink::poll_flush()
{
    if (!sink_.has_session()) {
        return true;
    }

    if (!sink_.poll_flush()) {
        return false;
    }

    record_completion_();
    return true;
}

bool
partsink::UploadForeverSink::poll_close()
{
    if (!sink_.poll_close()) {
        return false;
    }

    record_completion_();
    return true;
}

void
partsink::UploadForeverSink::push(std::span<const std::byte> data)
{
    check_usable_();
    while (!poll_ready()) {
        sink_.wait();
    }
    start_send(data);
}

void
partsink::UploadForeverSink::flush()
{
    if (sink_.has_session()) {
        (void)sink_.flush();
    }
    record_completion_();
}

void
partsink::UploadForeverSink::close()
{
    sink_.close();
    record_completion_();
}

void
partsink::UploadForeverSink::check_usable_() const
{
    if (exhausted_) {
        const std::string err =
          LOG_ERROR("Upload is unusable: ran out of destination addresses");
        throw AddressExhaustion(err);
    }
}

void
partsink::UploadForeverSink::record_completion_()
{
    const auto* completed = sink_.completed();
    if (completed && !recorded_) {
        completed_.push_back(*completed);
        recorded_ = true;
    }
}

void
partsink::UploadForeverSink::next_upload_()
{
    auto address = addresses_->next();
    if (!address) {
        exhausted_ = true;
        const std::string err =
          LOG_ERROR("Ran out of destination addresses after ",
                    completed_.size(),
                    " objects");
        throw AddressExhaustion(err);
    }

    LOG_DEBUG("Starting upload to ", *address);
    sink_.start_new_upload(std::move(*address));
    recorded_ = false;
}
