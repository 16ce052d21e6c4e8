#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace partsink {
/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Append the characters of @p s to a byte buffer.
 */
void
append_bytes(std::vector<std::byte>& out, std::string_view s);

/**
 * @brief Hex digest (FNV-1a, 64 bit) of a byte range. Used where an opaque,
 * content-derived entity tag is needed.
 */
std::string
content_digest(std::span<const std::byte> data);
} // namespace partsink
