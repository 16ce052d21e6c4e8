#include "macros.hh"
#include "common.hh"
#include "partsink/settings.hh"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <limits>

namespace {
struct ByteUnit
{
    std::string_view suffix;
    size_t multiplier;
};

constexpr ByteUnit byte_units[] = {
    { "KiB", 1ull << 10 },  { "MiB", 1ull << 20 },  { "GiB", 1ull << 30 },
    { "TiB", 1ull << 40 },  { "KB", 1000ull },      { "MB", 1000ull * 1000 },
    { "GB", 1000ull * 1000 * 1000 }, { "TB", 1000ull * 1000 * 1000 * 1000 },
    { "B", 1ull },
};

size_t
json_byte_size(const nlohmann::json& value, std::string_view key)
{
    if (value.is_number_integer() && value.get<long long>() >= 0) {
        return value.get<size_t>();
    }
    if (value.is_string()) {
        try {
            return partsink::parse_byte_size(value.get<std::string>());
        } catch (const std::exception& exc) {
            EXPECT_VALID_SETTINGS(false, "Invalid value for '", key, "': ",
                                  exc.what());
        }
    }

    EXPECT_VALID_SETTINGS(false,
                          "Invalid value for '",
                          key,
                          "': expected a non-negative integer or a size "
                          "string, got ",
                          value.dump());
    return 0; // unreachable
}

std::string
get_env(const char* name)
{
    const char* env = std::getenv(name);
    return env ? std::string(env) : std::string();
}
} // namespace

bool
partsink::validate_upload_settings(const UploadSettings& settings)
{
    bool valid = true;

    if (settings.min_part_size < protocol_min_part_size) {
        LOG_ERROR("Minimum part size ",
                  settings.min_part_size,
                  " is below the protocol minimum of ",
                  protocol_min_part_size,
                  " bytes");
        valid = false;
    }

    if (settings.max_part_size > protocol_max_part_size) {
        LOG_ERROR("Maximum part size ",
                  settings.max_part_size,
                  " exceeds the protocol maximum of ",
                  protocol_max_part_size,
                  " bytes");
        valid = false;
    }

    if (settings.min_part_size > settings.max_part_size) {
        LOG_ERROR("Minimum part size ",
                  settings.min_part_size,
                  " exceeds maximum part size ",
                  settings.max_part_size);
        valid = false;
    }

    if (settings.max_part_count < 2 ||
        settings.max_part_count > protocol_max_part_count) {
        LOG_ERROR("Invalid maximum part count: ",
                  settings.max_part_count,
                  ". Must be between 2 and ",
                  protocol_max_part_count);
        valid = false;
    }

    if (settings.target_size) {
        if (*settings.target_size < settings.min_part_size) {
            LOG_ERROR("Target size ",
                      *settings.target_size,
                      " is below the minimum part size ",
                      settings.min_part_size);
            valid = false;
        }
        if (*settings.target_size > protocol_max_object_size) {
            LOG_ERROR("Target size ",
                      *settings.target_size,
                      " exceeds the maximum object size of ",
                      protocol_max_object_size,
                      " bytes");
            valid = false;
        }
    }

    return valid;
}

partsink::UploadSettings
partsink::upload_settings_from_json(const nlohmann::json& json)
{
    EXPECT_VALID_SETTINGS(
      json.is_object(), "Upload settings must be a JSON object: ", json.dump());

    UploadSettings settings;
    if (auto it = json.find("target_size");
        it != json.end() && !it->is_null()) {
        settings.target_size = json_byte_size(*it, "target_size");
    }
    if (auto it = json.find("min_part_size"); it != json.end()) {
        settings.min_part_size = json_byte_size(*it, "min_part_size");
    }
    if (auto it = json.find("max_part_size"); it != json.end()) {
        settings.max_part_size = json_byte_size(*it, "max_part_size");
    }
    if (auto it = json.find("max_part_count"); it != json.end()) {
        EXPECT_VALID_SETTINGS(it->is_number_integer() &&
                                it->get<long long>() >= 0 &&
                                it->get<long long>() <= protocol_max_part_count,
                              "Invalid value for 'max_part_count': ",
                              it->dump());
        settings.max_part_count = it->get<unsigned int>();
    }

    EXPECT_VALID_SETTINGS(validate_upload_settings(settings),
                          "Invalid upload settings: ",
                          json.dump());

    return settings;
}

size_t
partsink::parse_byte_size(std::string_view text)
{
    const std::string trimmed = trim(text);
    std::string_view s(trimmed);

    size_t n_digits = 0;
    while (n_digits < s.size() &&
           std::isdigit(static_cast<unsigned char>(s[n_digits]))) {
        ++n_digits;
    }
    if (n_digits == 0) {
        throw std::invalid_argument("Not a byte size: '" + trimmed + "'");
    }

    const std::string digits(s.substr(0, n_digits));
    const std::string suffix = trim(s.substr(n_digits));

    size_t multiplier = 1;
    if (!suffix.empty()) {
        bool found = false;
        for (const auto& unit : byte_units) {
            if (suffix == unit.suffix) {
                multiplier = unit.multiplier;
                found = true;
                break;
            }
        }
        if (!found) {
            throw std::invalid_argument("Unknown byte size unit: '" + suffix +
                                        "'");
        }
    }

    const unsigned long long value = std::stoull(digits);
    if (value > std::numeric_limits<size_t>::max() / multiplier) {
        throw std::out_of_range("Byte size out of range: '" + trimmed + "'");
    }

    return static_cast<size_t>(value) * multiplier;
}

bool
partsink::validate_s3_settings(const S3Settings& settings)
{
    if (is_empty_string(settings.endpoint, "S3 endpoint is empty")) {
        return false;
    }
    if (is_empty_string(settings.access_key_id, "S3 access key ID is empty")) {
        return false;
    }
    if (is_empty_string(settings.secret_access_key,
                        "S3 secret access key is empty")) {
        return false;
    }

    const std::string endpoint = trim(settings.endpoint);
    if (!endpoint.starts_with("http://") && !endpoint.starts_with("https://")) {
        LOG_ERROR("S3 endpoint must start with http:// or https://, got '",
                  endpoint,
                  "'");
        return false;
    }

    if (settings.n_connections == 0) {
        LOG_ERROR("Number of S3 connections must be positive");
        return false;
    }

    return true;
}

std::optional<partsink::S3Settings>
partsink::s3_settings_from_env()
{
    S3Settings settings;

    if ((settings.endpoint = get_env("PARTSINK_S3_ENDPOINT")).empty()) {
        LOG_WARNING("PARTSINK_S3_ENDPOINT not set.");
        return std::nullopt;
    }
    if ((settings.access_key_id = get_env("PARTSINK_S3_ACCESS_KEY_ID"))
          .empty()) {
        LOG_WARNING("PARTSINK_S3_ACCESS_KEY_ID not set.");
        return std::nullopt;
    }
    if ((settings.secret_access_key =
           get_env("PARTSINK_S3_SECRET_ACCESS_KEY"))
          .empty()) {
        LOG_WARNING("PARTSINK_S3_SECRET_ACCESS_KEY not set.");
        return std::nullopt;
    }
    settings.region = get_env("PARTSINK_S3_REGION");

    return settings;
}
