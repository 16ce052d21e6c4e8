#pragma once

#include "partsink/address.source.hh"
#include "partsink/upload.sink.hh"

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace partsink {
/**
 * @brief Drains an unbounded byte stream into a sequence of objects.
 *
 * Each object is completed once its committed bytes reach the target size.
 * The next object is started from the next address when more bytes arrive,
 * so an address is never taken for an object that would stay empty. Running
 * out of addresses raises AddressExhaustion and leaves the sink unusable.
 */
class UploadForeverSink
{
  public:
    UploadForeverSink(std::shared_ptr<UploadClient> client,
                      std::unique_ptr<AddressSource> addresses,
                      UploadSettings settings,
                      ObjectFraming framing = {});

    [[nodiscard]] bool poll_ready();

    /**
     * @throws AddressExhaustion if a new object is needed and no address is
     * left.
     * @throws ProtocolViolation if the sink is closed or its current upload
     * was aborted.
     */
    void start_send(std::span<const std::byte> data);

    /** @brief Complete the current object, if any. */
    [[nodiscard]] bool poll_flush();
    [[nodiscard]] bool poll_close();

    void push(std::span<const std::byte> data);
    void flush();
    void close();

    /** @brief Every object completed so far, in order. */
    const std::vector<CompletedUpload>& completed_uploads() const noexcept
    {
        return completed_;
    }

    std::optional<UploadProgress> progress() const { return sink_.progress(); }
    bool is_exhausted() const noexcept { return exhausted_; }

  private:
    UploadSink sink_;
    std::unique_ptr<AddressSource> addresses_;

    std::vector<CompletedUpload> completed_;
    bool recorded_; /* current session's completion is in completed_ */
    bool exhausted_;

    void check_usable_() const;
    void record_completion_();
    void next_upload_();
};
} // namespace partsink
