#include "macros.hh"
#include "partsink/s3.upload.client.hh"
#include "s3.connection.hh"
#include "thread.pool.hh"

namespace {
// Returns a borrowed connection to its pool when the request is done.
struct ConnectionLease
{
    partsink::S3ConnectionPool& pool;
    std::unique_ptr<partsink::S3Connection> connection;

    ~ConnectionLease() { pool.return_connection(std::move(connection)); }
};
} // namespace

partsink::S3UploadClient::S3UploadClient(const S3Settings& settings)
{
    EXPECT_VALID_SETTINGS(validate_s3_settings(settings),
                          "Invalid S3 settings");

    connections_ = std::make_unique<S3ConnectionPool>(settings);
    thread_pool_ = std::make_unique<ThreadPool>(settings.n_connections);
}

partsink::S3UploadClient::~S3UploadClient() noexcept
{
    // requests in flight still hold connections
    if (thread_pool_) {
        thread_pool_->shutdown();
    }
}

template<typename T>
std::future<T>
partsink::S3UploadClient::run_(std::function<T(S3Connection&)> request)
{
    return thread_pool_->submit([this, request = std::move(request)]() -> T {
        auto connection = connections_->get_connection();
        EXPECT(connection, "No S3 connection available");

        ConnectionLease lease{ *connections_, std::move(connection) };
        return request(*lease.connection);
    });
}

std::future<std::string>
partsink::S3UploadClient::create_upload(const ObjectAddress& address)
{
    return run_<std::string>([address](S3Connection& conn) {
        return conn.create_multipart_upload(address.bucket, address.key);
    });
}

std::future<std::string>
partsink::S3UploadClient::upload_part(const ObjectAddress& address,
                                      const std::string& upload_id,
                                      unsigned int part_number,
                                      std::span<const std::byte> data)
{
    return run_<std::string>(
      [address, upload_id, part_number, data](S3Connection& conn) {
          return conn.upload_part(
            address.bucket, address.key, upload_id, part_number, data);
      });
}

std::future<std::string>
partsink::S3UploadClient::complete_upload(
  const ObjectAddress& address,
  const std::string& upload_id,
  const std::vector<CompletedPart>& parts)
{
    return run_<std::string>([address, upload_id, parts](S3Connection& conn) {
        return conn.complete_multipart_upload(
          address.bucket, address.key, upload_id, parts);
    });
}

std::future<void>
partsink::S3UploadClient::abort_upload(const ObjectAddress& address,
                                       const std::string& upload_id)
{
    return run_<void>([address, upload_id](S3Connection& conn) {
        conn.abort_multipart_upload(address.bucket, address.key, upload_id);
    });
}

bool
partsink::S3UploadClient::bucket_exists(std::string_view bucket)
{
    return run_<bool>([name = std::string(bucket)](S3Connection& conn) {
               return conn.bucket_exists(name);
           })
      .get();
}

bool
partsink::S3UploadClient::object_exists(const ObjectAddress& address)
{
    return run_<bool>([address](S3Connection& conn) {
               return conn.object_exists(address.bucket, address.key);
           })
      .get();
}

bool
partsink::S3UploadClient::delete_object(const ObjectAddress& address)
{
    return run_<bool>([address](S3Connection& conn) {
               return conn.delete_object(address.bucket, address.key);
           })
      .get();
}
