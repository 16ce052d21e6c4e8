#pragma once

#include "partsink/settings.hh"
#include "partsink/upload.client.hh"

#include <miniocpp/client.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace partsink {
class S3Connection
{
  public:
    explicit S3Connection(const S3Settings& settings);

    /**
     * @brief Test a connection by listing all buckets at this connection's
     * endpoint.
     * @returns True if the connection is valid, otherwise false.
     */
    bool check_connection();

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty.
     */
    bool bucket_exists(std::string_view bucket_name);

    /* Object operations */

    /**
     * @brief Check whether an object exists.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns True if the object exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty or the object
     * name is empty.
     */
    bool object_exists(std::string_view bucket_name,
                       std::string_view object_name);

    /**
     * @brief Delete an object.
     * @returns True if the object was successfully deleted, otherwise false.
     * @throws std::runtime_error if the bucket name is empty or the object
     * name is empty.
     */
    [[nodiscard]] bool delete_object(std::string_view bucket_name,
                                     std::string_view object_name);

    /* Multipart object operations */

    /// @brief Create a multipart upload.
    /// @returns The upload id.
    /// @throws std::runtime_error if the request fails.
    [[nodiscard]] std::string create_multipart_upload(
      std::string_view bucket_name,
      std::string_view object_name);

    /// @brief Upload a part of a multipart upload.
    /// @returns The etag of the uploaded part.
    /// @throws std::runtime_error if @p data is empty, @p part_number is 0, or
    ///         the request fails.
    [[nodiscard]] std::string upload_part(std::string_view bucket_name,
                                          std::string_view object_name,
                                          std::string_view upload_id,
                                          unsigned int part_number,
                                          std::span<const std::byte> data);

    /// @brief Complete a multipart upload.
    /// @param parts List of the parts making up the object, sorted by part
    ///        number.
    /// @returns The etag of the object.
    /// @throws std::runtime_error if @p parts is empty or the request fails.
    [[nodiscard]] std::string complete_multipart_upload(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      const std::vector<CompletedPart>& parts);

    /// @brief Abort a multipart upload, discarding its parts.
    /// @throws std::runtime_error if the request fails.
    void abort_multipart_upload(std::string_view bucket_name,
                                std::string_view object_name,
                                std::string_view upload_id);

  private:
    std::unique_ptr<minio::creds::StaticProvider> provider_;
    std::unique_ptr<minio::s3::Client> client_;
};

class S3ConnectionPool
{
  public:
    explicit S3ConnectionPool(const S3Settings& settings);
    ~S3ConnectionPool() noexcept;

    std::unique_ptr<S3Connection> get_connection();
    void return_connection(std::unique_ptr<S3Connection>&& conn);

  private:
    std::vector<std::unique_ptr<S3Connection>> connections_;
    mutable std::mutex connections_mutex_;
    std::condition_variable cv_;

    std::atomic<bool> is_accepting_connections_{ true };
};
} // namespace partsink
