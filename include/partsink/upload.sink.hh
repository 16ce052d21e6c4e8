#pragma once

#include "partsink/upload.session.hh"

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace partsink {
/**
 * @brief Bytes written at the start and at the end of every object, e.g., a
 * header row. Either hook may be empty.
 */
struct ObjectFraming
{
    std::function<void(std::vector<std::byte>&)> begin_object;
    std::function<void(std::vector<std::byte>&)> finalize;
};

/**
 * @brief Drains a bounded byte stream into one object through one upload
 * session.
 *
 * The sink is driven cooperatively: poll_ready() reports whether start_send()
 * may be called, and poll_flush() and poll_close() report whether the object
 * has been completed. None of them block. push(), flush() and close() are the
 * blocking equivalents.
 *
 * A part is cut as soon as the part buffer reaches the minimum part size, and
 * no bytes are accepted while a remote operation is in flight. If a target
 * size is set, the object is completed as soon as the committed bytes reach
 * it, and the sink accepts no more bytes until start_new_upload() is called.
 */
class UploadSink
{
  public:
    UploadSink(std::shared_ptr<UploadClient> client,
               std::optional<ObjectAddress> address,
               UploadSettings settings,
               ObjectFraming framing = {});

    [[nodiscard]] bool poll_ready();

    /**
     * @brief Accept @p data for upload. The bytes are copied.
     * @throws ProtocolViolation if the sink is closed, its session is
     * completing, completed or aborted, or poll_ready() has not returned true.
     */
    void start_send(std::span<const std::byte> data);

    /**
     * @brief Upload buffered bytes as the final part and complete the object.
     * @return True once the object is completed.
     * @throws ProtocolViolation if nothing was written or the session was
     * aborted.
     */
    [[nodiscard]] bool poll_flush();

    /** @brief As poll_flush(), after which no bytes are accepted. */
    [[nodiscard]] bool poll_close();

    void push(std::span<const std::byte> data);
    const CompletedUpload& flush();
    void close();

    /**
     * @brief Bind the sink to a fresh session for a new destination.
     * @throws ProtocolViolation if the sink is closed or its current session is
     * still active.
     */
    void start_new_upload(ObjectAddress address);

    /** @brief Block until the operation in flight, if any, has a result. */
    void wait() const;

    bool is_closed() const noexcept { return closed_; }
    bool has_session() const noexcept { return session_ != nullptr; }

    /** @brief The phase of the current session, or Unopened if none. */
    PartsinkSessionPhase phase() const noexcept;

    /** @brief The completed upload of the current session, if any. */
    const CompletedUpload* completed() const noexcept;

    std::optional<UploadProgress> progress() const;
    const UploadSettings& settings() const noexcept { return settings_; }

  private:
    std::shared_ptr<UploadClient> client_;
    UploadSettings settings_;
    ObjectFraming framing_;

    std::unique_ptr<UploadSession> session_;

    std::vector<std::byte> staged_;
    size_t staged_offset_;

    bool finishing_;
    bool closed_;

    [[nodiscard]] bool advance_();
    [[nodiscard]] bool drain_staged_();
    [[nodiscard]] bool should_complete_() const;
    void begin_finish_();
};
} // namespace partsink
