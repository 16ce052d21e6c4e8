#pragma once

#include <nlohmann/json.hpp>

#include <vector>

namespace partsink {
/**
 * @brief Writes each record as one line of compact JSON.
 */
class JsonLinesEncoder
{
  public:
    using record_type = nlohmann::json;

    void begin_object(std::vector<std::byte>&) const {}

    /**
     * @throws EncodingError if @p record contains a string that is not valid
     * UTF-8.
     */
    void encode(const nlohmann::json& record, std::vector<std::byte>& out) const;

    void finalize(std::vector<std::byte>&) const {}
};
} // namespace partsink
