#include "partsink/settings.hh"
#include "partsink/errors.hh"
#include "unit.test.macros.hh"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <stdexcept>

namespace {
void
check_defaults_are_valid()
{
    partsink::UploadSettings settings;
    CHECK(validate_upload_settings(settings));
    CHECK(!settings.target_size.has_value());
    EXPECT_EQ(size_t, settings.min_part_size, 5 << 20);
    EXPECT_EQ(size_t, settings.max_part_size, 5ull << 30);
    EXPECT_EQ(unsigned int, settings.max_part_count, 10000);
}

void
check_invalid_upload_settings()
{
    partsink::UploadSettings settings;

    settings.min_part_size = (5 << 20) - 1;
    CHECK(!validate_upload_settings(settings));

    settings = {};
    settings.max_part_size = (5ull << 30) + 1;
    CHECK(!validate_upload_settings(settings));

    settings = {};
    settings.min_part_size = 8 << 20;
    settings.max_part_size = 6 << 20;
    CHECK(!validate_upload_settings(settings));

    settings = {};
    settings.max_part_count = 1;
    CHECK(!validate_upload_settings(settings));
    settings.max_part_count = 10001;
    CHECK(!validate_upload_settings(settings));

    settings = {};
    settings.target_size = 1 << 20;
    CHECK(!validate_upload_settings(settings));
    settings.target_size = 5 << 20;
    CHECK(validate_upload_settings(settings));
}

void
check_parse_byte_size()
{
    EXPECT_EQ(size_t, partsink::parse_byte_size("1024"), 1024);
    EXPECT_EQ(size_t, partsink::parse_byte_size("100KiB"), 100 << 10);
    EXPECT_EQ(size_t, partsink::parse_byte_size("5MiB"), 5 << 20);
    EXPECT_EQ(size_t, partsink::parse_byte_size(" 2 GiB "), 2ull << 30);
    EXPECT_EQ(size_t, partsink::parse_byte_size("1TiB"), 1ull << 40);
    EXPECT_EQ(size_t, partsink::parse_byte_size("5MB"), 5000000);
    EXPECT_EQ(size_t, partsink::parse_byte_size("7B"), 7);

    EXPECT_THROW(std::invalid_argument, partsink::parse_byte_size(""));
    EXPECT_THROW(std::invalid_argument, partsink::parse_byte_size("MiB"));
    EXPECT_THROW(std::invalid_argument, partsink::parse_byte_size("5 parsecs"));
    EXPECT_THROW(std::invalid_argument, partsink::parse_byte_size("-5MiB"));
    EXPECT_THROW(std::out_of_range,
                 partsink::parse_byte_size("99999999999999TiB"));
}

void
check_upload_settings_from_json()
{
    const auto settings = partsink::upload_settings_from_json(
      nlohmann::json::parse(R"({
          "target_size": "1GiB",
          "min_part_size": 8388608,
          "max_part_size": "64MiB",
          "max_part_count": 500
      })"));
    CHECK(settings.target_size.has_value());
    EXPECT_EQ(size_t, *settings.target_size, 1ull << 30);
    EXPECT_EQ(size_t, settings.min_part_size, 8 << 20);
    EXPECT_EQ(size_t, settings.max_part_size, 64 << 20);
    EXPECT_EQ(unsigned int, settings.max_part_count, 500);

    // absent keys keep their defaults
    const auto defaults =
      partsink::upload_settings_from_json(nlohmann::json::object());
    CHECK(!defaults.target_size.has_value());
    EXPECT_EQ(size_t, defaults.min_part_size, 5 << 20);

    EXPECT_THROW(partsink::InvalidSettings,
                 partsink::upload_settings_from_json(
                   nlohmann::json{ { "min_part_size", "1MiB" } }));
    EXPECT_THROW(partsink::InvalidSettings,
                 partsink::upload_settings_from_json(
                   nlohmann::json{ { "max_part_size", true } }));
    EXPECT_THROW(partsink::InvalidSettings,
                 partsink::upload_settings_from_json(
                   nlohmann::json{ { "target_size", "lots" } }));
    EXPECT_THROW(partsink::InvalidSettings,
                 partsink::upload_settings_from_json(nlohmann::json::array()));

    // invalid settings are protocol violations
    EXPECT_THROW(partsink::ProtocolViolation,
                 partsink::upload_settings_from_json(
                   nlohmann::json{ { "max_part_count", 1 } }));
}

void
check_s3_settings()
{
    partsink::S3Settings settings{ "http://localhost:9000", "key", "secret" };
    CHECK(validate_s3_settings(settings));

    settings.endpoint = "localhost:9000";
    CHECK(!validate_s3_settings(settings));

    settings.endpoint = "https://s3.amazonaws.com";
    settings.access_key_id = "   ";
    CHECK(!validate_s3_settings(settings));

    settings.access_key_id = "key";
    settings.n_connections = 0;
    CHECK(!validate_s3_settings(settings));

    setenv("PARTSINK_S3_ENDPOINT", "http://localhost:9000", 1);
    setenv("PARTSINK_S3_ACCESS_KEY_ID", "id", 1);
    unsetenv("PARTSINK_S3_SECRET_ACCESS_KEY");
    CHECK(!partsink::s3_settings_from_env().has_value());

    setenv("PARTSINK_S3_SECRET_ACCESS_KEY", "secret", 1);
    setenv("PARTSINK_S3_REGION", "us-east-1", 1);
    const auto from_env = partsink::s3_settings_from_env();
    CHECK(from_env.has_value());
    EXPECT_STR_EQ(from_env->endpoint, "http://localhost:9000");
    EXPECT_STR_EQ(from_env->access_key_id, "id");
    EXPECT_STR_EQ(from_env->secret_access_key, "secret");
    EXPECT_STR_EQ(from_env->region, "us-east-1");
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        check_defaults_are_valid();
        check_invalid_upload_settings();
        check_parse_byte_size();
        check_upload_settings_from_json();
        check_s3_settings();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Caught exception: ", exc.what());
    }

    return retval;
}
