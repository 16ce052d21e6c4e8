#pragma once

#include "partsink/part.encoder.hh"

#include <optional>
#include <string>
#include <vector>

namespace partsink {
/**
 * @brief Writes each record as one line terminated by '\n'.
 */
class LinesEncoder
{
  public:
    using record_type = std::string;

    LinesEncoder() = default;
    explicit LinesEncoder(std::string header,
                          HeaderPolicy policy = HeaderPolicy::EveryObject);

    void begin_object(std::vector<std::byte>& out);
    void encode(const std::string& line, std::vector<std::byte>& out) const;
    void finalize(std::vector<std::byte>& out) const;

  private:
    std::optional<std::string> header_;
    HeaderPolicy policy_{ HeaderPolicy::EveryObject };
    bool header_written_{ false };
};
} // namespace partsink
