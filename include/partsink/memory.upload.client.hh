#pragma once

#include "partsink/errors.hh"
#include "partsink/settings.hh"
#include "partsink/upload.client.hh"

#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace partsink {
/**
 * @brief An in-memory object store speaking the multipart upload protocol.
 *
 * Every call is recorded in a journal. Calls can be made to fail on demand,
 * and results can be held back until release_pending() to exercise
 * cooperative driving. Results of abort_upload() are never held back.
 *
 * Like S3, completion rejects a non-final part smaller than the minimum part
 * size, and a part list that does not match the uploaded parts.
 */
class MemoryUploadClient : public UploadClient
{
  public:
    struct Call
    {
        RemoteOperation operation;
        ObjectAddress address;
        std::string upload_id;
        unsigned int part_number{ 0 };
        size_t size{ 0 };                       /* UploadPart */
        std::vector<unsigned int> part_numbers; /* CompleteUpload */
    };

    explicit MemoryUploadClient(size_t min_part_size = protocol_min_part_size);

    std::future<std::string> create_upload(
      const ObjectAddress& address) override;
    std::future<std::string> upload_part(const ObjectAddress& address,
                                         const std::string& upload_id,
                                         unsigned int part_number,
                                         std::span<const std::byte> data) override;
    std::future<std::string> complete_upload(
      const ObjectAddress& address,
      const std::string& upload_id,
      const std::vector<CompletedPart>& parts) override;
    std::future<void> abort_upload(const ObjectAddress& address,
                                   const std::string& upload_id) override;

    /** @brief Make the next call of @p operation fail with @p message. */
    void fail_next(RemoteOperation operation, std::string message);

    /**
     * @brief Hold back results until release_pending() is called. Turning
     * deferral off releases every held result. Abort results are never held.
     * @note Tearing down a session waits for its operation in flight. A
     * session destroyed while its result is held blocks until another thread
     * calls release_pending() or set_deferred(false).
     */
    void set_deferred(bool deferred);

    /** @brief Deliver every held result. @return The number delivered. */
    size_t release_pending();

    std::vector<Call> calls() const;
    size_t count(RemoteOperation operation) const;

    /** @brief The contents of a completed object, if it exists. */
    std::optional<std::string> object(const ObjectAddress& address) const;
    size_t n_objects() const;

    /** @brief Uploads created but neither completed nor aborted. */
    size_t n_active_uploads() const;

  private:
    struct ActiveUpload
    {
        ObjectAddress address;
        std::map<unsigned int, std::vector<std::byte>> parts;
    };

    size_t min_part_size_;

    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::map<RemoteOperation, std::string> failures_;
    std::map<std::string, ActiveUpload> uploads_;
    std::map<std::string, std::string> objects_; /* s3 uri -> contents */
    unsigned int n_created_;

    bool deferred_;
    std::vector<std::function<void()>> held_;

    std::exception_ptr take_failure_(RemoteOperation operation);
    std::future<std::string> settle_(std::string value,
                                     std::exception_ptr error);
    void hold_or_run_(std::function<void()>&& deliver);
};
} // namespace partsink
