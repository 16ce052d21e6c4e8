/// @file jsonlines-to-s3.cpp
/// @brief Example of streaming JSON lines into a rotating sequence of S3
/// objects.

#include "partsink/partsink.hh"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>

/// Reads the following environment variables:
/// - PARTSINK_S3_ENDPOINT ("http://...") - the URI of the S3 server
/// - PARTSINK_S3_ACCESS_KEY_ID - the access key ID for the S3 server
/// - PARTSINK_S3_SECRET_ACCESS_KEY - the secret access key for the S3 server
/// - PARTSINK_S3_BUCKET_NAME ("partsink-test") - the name of the bucket
int
main()
{
    const auto settings = partsink::s3_settings_from_env();
    const char* bucket_name = std::getenv("PARTSINK_S3_BUCKET_NAME");
    if (!settings || !bucket_name) {
        fprintf(stderr, "S3 credentials not set\n");
        return 1;
    }

    try {
        partsink::set_log_level(PartsinkLogLevel_Info);

        auto client = std::make_shared<partsink::S3UploadClient>(*settings);

        auto addresses = std::make_unique<partsink::TimestampedAddresses>(
          bucket_name, "%Y/%m/%d/%H%M%S.jsonl");
        addresses->with_prefix("events");

        partsink::UploadSettings upload_settings;
        upload_settings.target_size = 16 << 20; // 16 MiB per object

        partsink::UploadForever<partsink::JsonLinesEncoder> upload(
          client, std::move(addresses), upload_settings);

        const auto start = std::chrono::steady_clock::now();
        for (auto i = 0; i < 200000; ++i) {
            const auto elapsed =
              std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start);
            upload.push({ { "sequence", i },
                          { "elapsed_us", elapsed.count() },
                          { "message", "the quick brown fox" } });
        }
        upload.close();

        for (const auto& object : upload.completed_uploads()) {
            printf("%s: %zu bytes in %u parts\n",
                   object.address.to_string().c_str(),
                   object.size,
                   object.n_parts);
        }
    } catch (const std::exception& exc) {
        fprintf(stderr, "Error: %s\n", exc.what());
        return 1;
    }

    return 0;
}
