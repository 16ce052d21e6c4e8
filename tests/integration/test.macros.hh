#pragma once

#include "logger.hh"

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

/// Check that a==b
/// example: `EXPECT_EQ(int,42,meaning_of_life())`
#define EXPECT_EQ(T, a, b)                                                     \
    do {                                                                       \
        T a_ = (T)(a);                                                         \
        T b_ = (T)(b);                                                         \
        EXPECT(                                                                \
          a_ == b_, "Expected ", #a, " == ", #b, " but ", a_, " != ", b_);     \
    } while (0)

/// The bucket integration tests write to, or nullopt if
/// PARTSINK_S3_BUCKET_NAME is not set.
inline std::optional<std::string>
test_bucket_name()
{
    const char* env = std::getenv("PARTSINK_S3_BUCKET_NAME");
    if (!env) {
        LOG_WARNING("PARTSINK_S3_BUCKET_NAME not set.");
        return std::nullopt;
    }
    return std::string(env);
}
