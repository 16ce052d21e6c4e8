#pragma once

#include "partsink/part.encoder.hh"
#include "partsink/upload.forever.sink.hh"

#include <memory>
#include <optional>
#include <vector>

namespace partsink {
/**
 * @brief Writes an unbounded sequence of records into a sequence of objects,
 * moving to the next address each time an object reaches the target size.
 *
 * Whether a header is repeated in every object is decided by the encoder.
 */
template<typename Encoder>
class UploadForever
{
  public:
    using record_type = typename Encoder::record_type;

    UploadForever(std::shared_ptr<UploadClient> client,
                  std::unique_ptr<AddressSource> addresses,
                  UploadSettings settings,
                  Encoder encoder = Encoder{})
      : encoder_{ std::make_unique<Encoder>(std::move(encoder)) }
      , sink_(std::move(client),
              std::move(addresses),
              std::move(settings),
              make_framing(*encoder_))
    {
    }

    [[nodiscard]] bool poll_ready() { return sink_.poll_ready(); }

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
        scratch_.clear();
        encoder_->encode(record, scratch_);
        sink_.push(scratch_);
    }

    void flush() { sink_.flush(); }
    void close() { sink_.close(); }

    const std::vector<CompletedUpload>& completed_uploads() const noexcept
    {
        return sink_.completed_uploads();
    }

    std::optional<UploadProgress> progress() const { return sink_.progress(); }

    Encoder& encoder() noexcept { return *encoder_; }

  private:
    std::unique_ptr<Encoder> encoder_;
    std::vector<std::byte> scratch_;
    UploadForeverSink sink_;
};
} // namespace partsink
