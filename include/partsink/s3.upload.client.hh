#pragma once

#include "partsink/settings.hh"
#include "partsink/upload.client.hh"

#include <functional>
#include <memory>
#include <string_view>

namespace partsink {
class S3Connection;
class S3ConnectionPool;
class ThreadPool;

/**
 * @brief Uploads to an S3-compatible endpoint.
 *
 * Requests run on a pool of worker threads, each borrowing a connection from
 * a connection pool for the duration of the request.
 */
class S3UploadClient : public UploadClient
{
  public:
    /**
     * @throws InvalidSettings if @p settings fail validation.
     * @throws std::runtime_error if no connection to the endpoint succeeds.
     */
    explicit S3UploadClient(const S3Settings& settings);
    ~S3UploadClient() noexcept override;

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

    /** @brief Check whether @p bucket exists, blocking. */
    bool bucket_exists(std::string_view bucket);

    /** @brief Check whether the object at @p address exists, blocking. */
    bool object_exists(const ObjectAddress& address);

    /** @brief Delete the object at @p address, blocking. */
    bool delete_object(const ObjectAddress& address);

  private:
    std::unique_ptr<S3ConnectionPool> connections_;
    std::unique_ptr<ThreadPool> thread_pool_;

    template<typename T>
    std::future<T> run_(std::function<T(S3Connection&)> request);
};
} // namespace partsink
