#pragma once

#include "partsink.types.h"
#include "partsink/object.address.hh"
#include "partsink/part.buffer.hh"
#include "partsink/settings.hh"
#include "partsink/upload.client.hh"
#include "partsink/errors.hh"

#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace partsink {
/**
 * @brief A multipart upload that has been completed.
 */
struct CompletedUpload
{
    ObjectAddress address;
    std::string upload_id;
    std::string etag; /* entity tag of the assembled object */
    size_t size{ 0 };
    unsigned int n_parts{ 0 };
};

/**
 * @brief A snapshot of the state of an upload.
 */
struct UploadProgress
{
    ObjectAddress address;
    std::string upload_id;
    size_t bytes_committed{ 0 };
    unsigned int parts_committed{ 0 };
    size_t bytes_buffered{ 0 };
    PartsinkSessionPhase phase{ PartsinkSessionPhase_Unopened };
};

const char*
to_string(PartsinkSessionPhase phase) noexcept;

/**
 * @brief Protocol state machine for exactly one remote multipart upload.
 *
 * The session moves from Unopened to Open when the upload is created, from
 * Open to Completing when it is finalized, and ends in exactly one of
 * Completed or Aborted. At most one remote operation is in flight at a time;
 * it occupies the pending slot from the moment it is issued until its result
 * is consumed by poll().
 *
 * A remote failure aborts the upload (best-effort) before it is rethrown as a
 * RemoteOperationFailure. A session destroyed before it reaches a terminal
 * phase aborts its upload.
 */
class UploadSession
{
  public:
    UploadSession(std::shared_ptr<UploadClient> client,
                  ObjectAddress address,
                  const UploadSettings& settings);
    ~UploadSession() noexcept;

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    /**
     * @brief Issue "create multipart upload".
     * @throws ProtocolViolation if the session is not Unopened.
     */
    void open();

    /**
     * @brief Upload the contents of the part buffer as the next non-final
     * part.
     * @throws ProtocolViolation if the session is not Open and idle, the
     * buffer is not ready to cut, or the part would take the last part number
     * allowed, which is reserved for the final part.
     */
    void cut_part();

    /**
     * @brief Finalize the upload: buffered bytes become the final part, then
     * "complete multipart upload" is issued with every part.
     * @throws ProtocolViolation if the session is not Open and idle, or if
     * nothing was written to it. In the latter case the session is aborted.
     */
    void complete();

    /**
     * @brief Abandon the upload, waiting for any operation in flight.
     * @details Failure to abort the remote upload is logged, not thrown. If the
     * operation in flight turns out to have completed the upload, the session
     * is Completed instead.
     * @throws ProtocolViolation if the session is already Completed or
     * Aborted.
     */
    void abort();

    /**
     * @brief Consume the result of the operation in flight, if it is ready.
     * @details A successful final part immediately issues the completion.
     * @return True if no operation is in flight afterwards.
     * @throws RemoteOperationFailure if the operation failed.
     */
    [[nodiscard]] bool poll();

    /** @brief Block until the operation in flight, if any, has a result. */
    void wait() const;

    PartsinkSessionPhase phase() const noexcept { return phase_; }
    bool is_terminal() const noexcept;
    bool has_pending() const noexcept { return pending_.has_value(); }

    PartBuffer& buffer() noexcept { return buffer_; }
    const PartBuffer& buffer() const noexcept { return buffer_; }

    const ObjectAddress& address() const noexcept { return address_; }
    const std::string& upload_id() const noexcept { return upload_id_; }
    size_t bytes_committed() const noexcept { return bytes_committed_; }
    unsigned int parts_committed() const noexcept;

    /** @brief The completed upload, once the session is Completed. */
    const std::optional<CompletedUpload>& completed() const noexcept
    {
        return completed_;
    }

    UploadProgress progress() const;

  private:
    struct PendingOperation
    {
        RemoteOperation operation;
        unsigned int part_number; /* 0 unless operation is UploadPart */
        std::vector<std::byte> payload;
        std::future<std::string> result;
    };

    std::shared_ptr<UploadClient> client_;
    ObjectAddress address_;
    unsigned int max_part_count_;

    PartsinkSessionPhase phase_;
    std::string upload_id_;
    PartBuffer buffer_;

    std::optional<PendingOperation> pending_;
    std::map<unsigned int, CompletedPart> parts_;
    size_t bytes_committed_;

    std::optional<CompletedUpload> completed_;

    void issue_part_();
    void issue_complete_();
    void resolve_();

    void set_completed_(std::string etag);
    [[noreturn]] void fail_(RemoteOperation operation,
                            unsigned int part_number,
                            const std::string& cause);

    void abandon_() noexcept;
    void abort_remote_() noexcept;
};
} // namespace partsink
