#pragma once

#include "partsink/part.encoder.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace partsink {
/**
 * @brief Writes each record as one row of delimited text.
 *
 * Fields containing the delimiter, a double quote, a carriage return or a
 * newline are quoted, with embedded double quotes doubled (RFC 4180). Every
 * row must have as many fields as the header, or as the first row if there is
 * no header.
 */
class CsvEncoder
{
  public:
    using record_type = std::vector<std::string>;

    enum class Terminator
    {
        LF,
        CRLF,
    };

    CsvEncoder() = default;

    /** @brief Write @p header as the first row of each object. */
    CsvEncoder& with_header(std::vector<std::string> header,
                            HeaderPolicy policy = HeaderPolicy::EveryObject);
    CsvEncoder& with_delimiter(char delimiter);
    CsvEncoder& with_terminator(Terminator terminator);

    void begin_object(std::vector<std::byte>& out);

    /** @throws EncodingError if @p row has the wrong number of fields. */
    void encode(const std::vector<std::string>& row,
                std::vector<std::byte>& out);

    void finalize(std::vector<std::byte>&) const {}

  private:
    std::optional<std::vector<std::string>> header_;
    HeaderPolicy policy_{ HeaderPolicy::EveryObject };
    bool header_written_{ false };

    char delimiter_{ ',' };
    Terminator terminator_{ Terminator::LF };

    std::optional<size_t> n_fields_;

    void write_row_(const std::vector<std::string>& row,
                    std::vector<std::byte>& out) const;
    void write_field_(std::string_view field,
                      std::vector<std::byte>& out) const;
};
} // namespace partsink
