#pragma once

#include "tagstore/schema/conversion_telemetry.hpp"
#include "tagstore/sql/sql_types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <system_error>

namespace tagstore::exporter {

enum class ExportSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ExportDiagnostic final {
    ExportSeverity severity = ExportSeverity::Error;
    std::error_code error{};
    std::string message{};
    std::size_t rows_written = 0U;
};

// Streams rows as {"rows": [ {...}, {...} ]}. Rows are buffered and flushed in chunks; the document is never held
// in memory. NULL columns are omitted from each row object.
class JsonRowWriter final {
public:
    struct Config final {
        std::ostream* output = nullptr;
        std::size_t buffer_size = 256U * 1024U;
        // Invoked for write failures and for streams destroyed before close(); must not throw.
        std::function<void(const ExportDiagnostic&)> logger{};
        schema::ConversionTelemetry* telemetry = nullptr;
    };

    JsonRowWriter(sql::ExternalSchema schema, Config config);
    ~JsonRowWriter();

    JsonRowWriter(const JsonRowWriter&) = delete;
    JsonRowWriter& operator=(const JsonRowWriter&) = delete;
    JsonRowWriter(JsonRowWriter&&) = delete;
    JsonRowWriter& operator=(JsonRowWriter&&) = delete;

    [[nodiscard]] std::error_code write_row(const sql::ExternalRow& row);

    // Writes the closing token and flushes. After any failed write this reports IncompleteWrite and leaves the
    // output unterminated.
    [[nodiscard]] std::error_code close();

    [[nodiscard]] const sql::ExternalSchema& schema() const noexcept { return schema_; }
    [[nodiscard]] std::size_t rows_written() const noexcept { return rows_written_; }
    [[nodiscard]] bool failed() const noexcept { return failed_; }
    [[nodiscard]] bool closed() const noexcept { return closed_; }

private:
    [[nodiscard]] std::error_code flush_buffer();
    [[nodiscard]] std::error_code render_row(const sql::ExternalRow& row, std::string& out) const;
    void report(ExportSeverity severity, std::error_code error, std::string message) const;

    sql::ExternalSchema schema_{};
    Config config_{};
    std::string buffer_{};
    std::size_t rows_written_ = 0U;
    bool failed_ = false;
    bool closed_ = false;
};

}  // namespace tagstore::exporter
