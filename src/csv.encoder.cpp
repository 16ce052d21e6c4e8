#include "common.hh"
#include "macros.hh"
#include "partsink/csv.encoder.hh"

partsink::CsvEncoder&
partsink::CsvEncoder::with_header(std::vector<std::string> header,
                                  HeaderPolicy policy)
{
    EXPECT_ENCODABLE(!header.empty(), "CSV header must have at least 1 field");

    n_fields_ = header.size();
    header_ = std::move(header);
    policy_ = policy;
    return *this;
}

partsink::CsvEncoder&
partsink::CsvEncoder::with_delimiter(char delimiter)
{
    EXPECT_ENCODABLE(delimiter != '"' && delimiter != '\r' && delimiter != '\n',
                     "Invalid CSV delimiter: '",
                     delimiter,
                     "'");
    delimiter_ = delimiter;
    return *this;
}

partsink::CsvEncoder&
partsink::CsvEncoder::with_terminator(Terminator terminator)
{
    terminator_ = terminator;
    return *this;
}

void
partsink::CsvEncoder::begin_object(std::vector<std::byte>& out)
{
    if (!header_ ||
        (header_written_ && policy_ == HeaderPolicy::FirstObjectOnly)) {
        return;
    }

    write_row_(*header_, out);
    header_written_ = true;
}

void
partsink::CsvEncoder::encode(const std::vector<std::string>& row,
                             std::vector<std::byte>& out)
{
    EXPECT_ENCODABLE(!row.empty(), "CSV row must have at least 1 field");
    if (!n_fields_) {
        n_fields_ = row.size();
    }
    EXPECT_ENCODABLE(row.size() == *n_fields_,
                     "Expected ",
                     *n_fields_,
                     " fields in CSV row, got ",
                     row.size());

    write_row_(row, out);
}

void
partsink::CsvEncoder::write_row_(const std::vector<std::string>& row,
                                 std::vector<std::byte>& out) const
{
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            out.push_back(static_cast<std::byte>(delimiter_));
        }
        write_field_(row[i], out);
    }

    append_bytes(out, terminator_ == Terminator::CRLF ? "\r\n" : "\n");
}

void
partsink::CsvEncoder::write_field_(std::string_view field,
                                   std::vector<std::byte>& out) const
{
    const bool needs_quotes =
      field.find_first_of(std::string{ delimiter_, '"', '\r', '\n' }) !=
      std::string_view::npos;

    if (!needs_quotes) {
        append_bytes(out, field);
        return;
    }

    out.push_back(std::byte{ '"' });
    for (const char c : field) {
        if (c == '"') {
            out.push_back(std::byte{ '"' });
        }
        out.push_back(static_cast<std::byte>(c));
    }
    out.push_back(std::byte{ '"' });
}
