#include "tagstore/exporter/json_row_writer.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <exception>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace tagstore::exporter {

using schema::SchemaErrc;

namespace {

constexpr std::string_view kJsonHeader = "{\"rows\": [";
constexpr std::string_view kJsonFooter = "]}";

constexpr std::string_view kReplacementCharacter = "\\ufffd";

// Length of the well-formed UTF-8 sequence starting at offset, or zero when the bytes there are not one.
[[nodiscard]] std::size_t utf8_sequence_length(const std::string& text, std::size_t offset) noexcept
{
    const auto lead = static_cast<unsigned char>(text[offset]);
    std::size_t length = 0U;
    unsigned char lower = 0x80U;
    unsigned char upper = 0xBFU;
    if (lead >= 0xC2U && lead <= 0xDFU) {
        length = 2U;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
        length = 3U;
        if (lead == 0xE0U) {
            lower = 0xA0U;
        } else if (lead == 0xEDU) {
            upper = 0x9FU;
        }
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
        length = 4U;
        if (lead == 0xF0U) {
            lower = 0x90U;
        } else if (lead == 0xF4U) {
            upper = 0x8FU;
        }
    } else {
        return 0U;
    }

    if (text.size() - offset < length) {
        return 0U;
    }
    const auto second = static_cast<unsigned char>(text[offset + 1U]);
    if (second < lower || second > upper) {
        return 0U;
    }
    for (std::size_t index = 2U; index < length; ++index) {
        const auto next = static_cast<unsigned char>(text[offset + index]);
        if (next < 0x80U || next > 0xBFU) {
            return 0U;
        }
    }
    return length;
}

// Invalid UTF-8 is written as one U+FFFD per offending byte.
void append_json_string(std::string& out, const std::string& text)
{
    out.push_back('"');
    for (std::size_t offset = 0; offset < text.size(); ++offset) {
        const auto ch = static_cast<unsigned char>(text[offset]);
        if (ch >= 0x80U) {
            const auto length = utf8_sequence_length(text, offset);
            if (length == 0U) {
                out.append(kReplacementCharacter);
                continue;
            }
            out.append(text, offset, length);
            offset += length - 1U;
            continue;
        }
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

template <typename T>
[[nodiscard]] bool append_number(std::string& out, T value)
{
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return false;
    }
    out.append(buffer.data(), ptr);
    return true;
}

}  // namespace

JsonRowWriter::JsonRowWriter(sql::ExternalSchema schema, Config config)
    : schema_{std::move(schema)}
    , config_{std::move(config)}
{
    if (config_.output == nullptr) {
        throw std::invalid_argument{"JsonRowWriter requires an output stream"};
    }
    if (config_.buffer_size == 0U) {
        config_.buffer_size = 1U;
    }
    buffer_.reserve(config_.buffer_size);
    buffer_.append(kJsonHeader);
}

JsonRowWriter::~JsonRowWriter()
{
    if (closed_) {
        return;
    }
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_json_incomplete();
    }
    // Nothing may escape the destructor; the telemetry counter above still records the abandoned stream.
    try {
        report(ExportSeverity::Error,
               make_error_code(SchemaErrc::IncompleteWrite),
               "json export abandoned after " + std::to_string(rows_written_) + " rows without a closing token");
    } catch (const std::exception&) {
    }
}

std::error_code JsonRowWriter::write_row(const sql::ExternalRow& row)
{
    if (closed_) {
        return make_error_code(SchemaErrc::WriterClosed);
    }
    if (failed_) {
        return make_error_code(SchemaErrc::IncompleteWrite);
    }

    std::string object;
    if (auto ec = render_row(row, object); ec) {
        return ec;
    }

    if (rows_written_ != 0U) {
        buffer_.push_back(',');
    }
    buffer_.append(object);
    ++rows_written_;
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_json_row();
    }

    if (buffer_.size() >= config_.buffer_size) {
        return flush_buffer();
    }
    return {};
}

std::error_code JsonRowWriter::close()
{
    if (closed_) {
        return make_error_code(SchemaErrc::WriterClosed);
    }
    closed_ = true;

    if (failed_) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_json_incomplete();
        }
        const auto error = make_error_code(SchemaErrc::IncompleteWrite);
        report(ExportSeverity::Error, error, "json export closed after a failed write; output is not terminated");
        return error;
    }

    buffer_.append(kJsonFooter);
    if (auto ec = flush_buffer(); ec) {
        return make_error_code(SchemaErrc::IncompleteWrite);
    }
    config_.output->flush();
    if (!*config_.output) {
        failed_ = true;
        const auto error = make_error_code(SchemaErrc::IncompleteWrite);
        report(ExportSeverity::Error, error, "json export failed to flush the output stream");
        return error;
    }
    return {};
}

std::error_code JsonRowWriter::flush_buffer()
{
    if (buffer_.empty()) {
        return {};
    }
    config_.output->write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    if (!*config_.output) {
        failed_ = true;
        buffer_.clear();
        const auto error = make_error_code(SchemaErrc::StreamWriteFailed);
        report(ExportSeverity::Error, error, "json export write failed after " + std::to_string(rows_written_) + " rows");
        return error;
    }
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_json_flush(buffer_.size());
    }
    buffer_.clear();
    return {};
}

std::error_code JsonRowWriter::render_row(const sql::ExternalRow& row, std::string& out) const
{
    if (row.size() != schema_.size()) {
        return make_error_code(SchemaErrc::RowLengthMismatch);
    }

    out.push_back('{');
    bool first = true;
    for (std::size_t index = 0; index < row.size(); ++index) {
        const auto& value = row[index];
        if (schema::is_null(value)) {
            continue;
        }
        if (!first) {
            out.push_back(',');
        }
        first = false;
        append_json_string(out, schema_[index].name);
        out.push_back(':');

        bool rendered = true;
        if (const auto* number = std::get_if<std::int64_t>(&value)) {
            rendered = append_number(out, *number);
        } else if (const auto* unsigned_number = std::get_if<std::uint64_t>(&value)) {
            rendered = append_number(out, *unsigned_number);
        } else if (const auto* real = std::get_if<double>(&value)) {
            rendered = std::isfinite(*real) && append_number(out, *real);
        } else if (const auto* text = std::get_if<std::string>(&value)) {
            append_json_string(out, *text);
        } else if (const auto* flag = std::get_if<bool>(&value)) {
            out.append(*flag ? "true" : "false");
        }
        if (!rendered) {
            return make_error_code(SchemaErrc::ValueConversionFailed);
        }
    }
    out.push_back('}');
    return {};
}

void JsonRowWriter::report(ExportSeverity severity, std::error_code error, std::string message) const
{
    if (!config_.logger) {
        return;
    }
    ExportDiagnostic diagnostic{};
    diagnostic.severity = severity;
    diagnostic.error = error;
    diagnostic.message = std::move(message);
    diagnostic.rows_written = rows_written_;
    config_.logger(diagnostic);
}

}  // namespace tagstore::exporter
