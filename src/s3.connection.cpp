#include "macros.hh"
#include "s3.connection.hh"

#include <list>

partsink::S3Connection::S3Connection(const S3Settings& settings)
{
    minio::s3::BaseUrl url(settings.endpoint);
    url.https = settings.endpoint.starts_with("https");
    if (!settings.region.empty()) {
        url.region = settings.region;
    }

    provider_ = std::make_unique<minio::creds::StaticProvider>(
      settings.access_key_id, settings.secret_access_key);
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());

    CHECK(client_);
}

bool
partsink::S3Connection::check_connection()
{
    return static_cast<bool>(client_->ListBuckets());
}

bool
partsink::S3Connection::bucket_exists(std::string_view bucket_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");

    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;

    auto response = client_->BucketExists(args);
    return response.exist;
}

bool
partsink::S3Connection::object_exists(std::string_view bucket_name,
                                      std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    minio::s3::StatObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->StatObject(args);
    // casts to true if response code in 200 range and error message is empty
    return static_cast<bool>(response);
}

bool
partsink::S3Connection::delete_object(std::string_view bucket_name,
                                      std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    LOG_DEBUG("Deleting object ", object_name, " from bucket ", bucket_name);
    minio::s3::RemoveObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->RemoveObject(args);
    if (!response) {
        LOG_ERROR("Failed to delete object ",
                  object_name,
                  " from bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

std::string
partsink::S3Connection::create_multipart_upload(std::string_view bucket_name,
                                                std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    minio::s3::CreateMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->CreateMultipartUpload(args);
    EXPECT(response,
           "Failed to create multipart upload for object ",
           object_name,
           " in bucket ",
           bucket_name,
           ": ",
           response.Error().String());
    EXPECT(!response.upload_id.empty(), "Upload id returned empty.");

    return response.upload_id;
}

std::string
partsink::S3Connection::upload_part(std::string_view bucket_name,
                                    std::string_view object_name,
                                    std::string_view upload_id,
                                    unsigned int part_number,
                                    std::span<const std::byte> data)
{
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");
    EXPECT(!data.empty(), "Number of bytes must be positive.");
    EXPECT(part_number, "Part number must be positive.");

    std::string_view data_buffer(reinterpret_cast<const char*>(data.data()),
                                 data.size());

    minio::s3::UploadPartArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.part_number = part_number;
    args.upload_id = upload_id;
    args.data = data_buffer;

    auto response = client_->UploadPart(args);
    EXPECT(response,
           "Failed to upload part ",
           part_number,
           " for object ",
           object_name,
           " in bucket ",
           bucket_name,
           ": ",
           response.Error().String());

    return response.etag;
}

std::string
partsink::S3Connection::complete_multipart_upload(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  const std::vector<CompletedPart>& parts)
{
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");
    EXPECT(!parts.empty(), "Parts list must not be empty.");

    std::list<minio::s3::Part> s3_parts;
    for (const auto& part : parts) {
        minio::s3::Part s3_part;
        s3_part.number = part.number;
        s3_part.etag = part.etag;
        s3_part.size = part.size;
        s3_parts.push_back(s3_part);
    }

    minio::s3::CompleteMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;
    args.parts = s3_parts;

    auto response = client_->CompleteMultipartUpload(args);
    EXPECT(response,
           "Failed to complete multipart upload for object ",
           object_name,
           " in bucket ",
           bucket_name,
           ": ",
           response.Error().String());

    return response.etag;
}

void
partsink::S3Connection::abort_multipart_upload(std::string_view bucket_name,
                                               std::string_view object_name,
                                               std::string_view upload_id)
{
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");

    minio::s3::AbortMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;

    auto response = client_->AbortMultipartUpload(args);
    EXPECT(response,
           "Failed to abort multipart upload for object ",
           object_name,
           " in bucket ",
           bucket_name,
           ": ",
           response.Error().String());
}

partsink::S3ConnectionPool::S3ConnectionPool(const S3Settings& settings)
{
    for (auto i = 0u; i < settings.n_connections; ++i) {
        auto connection = std::make_unique<S3Connection>(settings);

        if (connection->check_connection()) {
            connections_.push_back(std::move(connection));
        }
    }

    EXPECT(!connections_.empty(),
           "Failed to connect to S3 endpoint ",
           settings.endpoint);
}

partsink::S3ConnectionPool::~S3ConnectionPool() noexcept
{
    is_accepting_connections_ = false;
    cv_.notify_all();
}

std::unique_ptr<partsink::S3Connection>
partsink::S3ConnectionPool::get_connection()
{
    std::unique_lock lock(connections_mutex_);
    cv_.wait(lock, [this] {
        return !is_accepting_connections_ || !connections_.empty();
    });

    if (!is_accepting_connections_ || connections_.empty()) {
        return nullptr;
    }

    auto conn = std::move(connections_.back());
    connections_.pop_back();
    return conn;
}

void
partsink::S3ConnectionPool::return_connection(
  std::unique_ptr<S3Connection>&& conn)
{
    std::unique_lock lock(connections_mutex_);
    connections_.push_back(std::move(conn));
    cv_.notify_one();
}
