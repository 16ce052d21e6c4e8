#pragma once

#include "logger.hh"
#include "partsink/errors.hh"

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

#define EXPECT_PROTOCOL(e, ...)                                                \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw partsink::ProtocolViolation(__err);                          \
        }                                                                      \
    } while (0)

#define EXPECT_VALID_SETTINGS(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw partsink::InvalidSettings(__err);                            \
        }                                                                      \
    } while (0)

#define EXPECT_ENCODABLE(e, ...)                                               \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw partsink::EncodingError(__err);                              \
        }                                                                      \
    } while (0)
