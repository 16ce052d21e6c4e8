#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef> // size_t
#include <optional>
#include <string>
#include <string_view>

namespace partsink {
// https://docs.aws.amazon.com/AmazonS3/latest/userguide/qfacts.html
inline constexpr size_t protocol_min_part_size = 5ull << 20;   // 5 MiB
inline constexpr size_t protocol_max_part_size = 5ull << 30;   // 5 GiB
inline constexpr size_t protocol_max_object_size = 5ull << 40; // 5 TiB
inline constexpr unsigned int protocol_max_part_count = 10000;

/**
 * @brief Sizing of the parts and objects written by an upload.
 */
struct UploadSettings
{
    /**
     * Committed bytes at which an upload completes its object. Required for
     * unbounded uploads; for finite uploads it acts as a hard ceiling after
     * which the upload accepts no more records.
     */
    std::optional<size_t> target_size;

    size_t min_part_size{ protocol_min_part_size }; /* cut threshold */
    size_t max_part_size{ protocol_max_part_size }; /* never exceeded */
    unsigned int max_part_count{ protocol_max_part_count };
};

/**
 * @brief Check upload settings against the protocol limits.
 * @details Logs every violation found.
 * @return True if the settings are usable, otherwise false.
 */
[[nodiscard]] bool
validate_upload_settings(const UploadSettings& settings);

/**
 * @brief Read upload settings from a JSON object.
 * @details Recognized keys are "target_size", "min_part_size",
 * "max_part_size" and "max_part_count". Sizes are either integers or strings
 * such as "5MiB". Absent keys keep their defaults.
 * @throws InvalidSettings if a value has the wrong type or fails validation.
 */
UploadSettings
upload_settings_from_json(const nlohmann::json& json);

/**
 * @brief Parse a byte size such as "1024", "100KiB", "5MiB", "2GiB" or "1TiB".
 * Decimal units (KB, MB, GB, TB) are also accepted.
 * @throws std::invalid_argument if @p text is not a byte size.
 */
size_t
parse_byte_size(std::string_view text);

/**
 * @brief Connection settings for an S3-compatible endpoint.
 */
struct S3Settings
{
    std::string endpoint;
    std::string access_key_id;
    std::string secret_access_key;
    std::string region;        /* optional */
    unsigned int n_connections{ 4 }; /* connections and worker threads */
};

/**
 * @brief Check S3 settings, logging every problem found.
 * @return True if the settings are usable, otherwise false.
 */
[[nodiscard]] bool
validate_s3_settings(const S3Settings& settings);

/**
 * @brief Read S3 settings from PARTSINK_S3_ENDPOINT,
 * PARTSINK_S3_ACCESS_KEY_ID, PARTSINK_S3_SECRET_ACCESS_KEY and, optionally,
 * PARTSINK_S3_REGION.
 * @return The settings, or nullopt if a required variable is not set.
 */
std::optional<S3Settings>
s3_settings_from_env();
} // namespace partsink
