#pragma once

#include "partsink/part.encoder.hh"
#include "partsink/upload.sink.hh"

#include <memory>
#include <optional>
#include <vector>

namespace partsink {
/**
 * @brief Writes a bounded sequence of records into one object.
 *
 * Records are encoded as they are sent and buffered into parts; the upload is
 * completed by flush() or close(). See UploadSink for the driving contract.
 */
template<typename Encoder>
class Upload
{
  public:
    using record_type = typename Encoder::record_type;

    Upload(std::shared_ptr<UploadClient> client,
           ObjectAddress address,
           Encoder encoder = Encoder{},
           UploadSettings settings = {})
      : encoder_{ std::make_unique<Encoder>(std::move(encoder)) }
      , sink_(std::move(client),
              std::move(address),
              std::move(settings),
              make_framing(*encoder_))
    {
    }

    [[nodiscard]] bool poll_ready() { return sink_.poll_ready(); }

    /**
     * @throws EncodingError if @p record cannot be encoded.
     * @throws ProtocolViolation if the upload is closed, completed or aborted.
     */
    void start_send(const record_type& record)
    {
        scratch_.clear();
        encoder_->encode(record, scratch_);
        sink_.start_send(scratch_);
    }

    [[nodiscard]] bool poll_flush() { return sink_.poll_flush(); }
    [[nodiscard]] bool poll_close() { return sink_.poll_close(); }

    void push(const record_type& record)
    {
        while (!poll_ready()) {
            sink_.wait();
        }
        start_send(record);
    }

    /** @brief Complete the object. Repeated calls return the same result. */
    const CompletedUpload& flush() { return sink_.flush(); }

    const CompletedUpload& close()
    {
        sink_.close();
        return sink_.flush();
    }

    /** @brief Continue with a new object once the current one is finished. */
    void start_new_upload(ObjectAddress address)
    {
        sink_.start_new_upload(std::move(address));
    }

    /** @brief Block until the operation in flight, if any, has a result. */
    void wait() const { sink_.wait(); }

    std::optional<UploadProgress> progress() const { return sink_.progress(); }
    PartsinkSessionPhase phase() const noexcept { return sink_.phase(); }

    Encoder& encoder() noexcept { return *encoder_; }

  private:
    std::unique_ptr<Encoder> encoder_;
    std::vector<std::byte> scratch_;
    UploadSink sink_;
};
} // namespace partsink
