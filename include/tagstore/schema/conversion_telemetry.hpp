#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace tagstore::schema {

struct ConversionTelemetrySnapshot final {
    std::uint64_t rows_mapped = 0U;
    std::uint64_t row_mapping_failures = 0U;
    std::uint64_t rows_imported = 0U;
    std::uint64_t import_failures = 0U;
    std::uint64_t rows_exported = 0U;
    std::uint64_t export_failures = 0U;
    std::uint64_t values_copied = 0U;
    std::uint64_t nulls_omitted = 0U;
    std::uint64_t defaults_applied = 0U;
    std::uint64_t tags_allocated = 0U;
    std::uint64_t json_rows_written = 0U;
    std::uint64_t json_bytes_flushed = 0U;
    std::uint64_t json_incomplete_streams = 0U;
};

class ConversionTelemetry final {
public:
    void record_row_mapped(std::size_t values_copied, std::size_t nulls_omitted, std::size_t defaults_applied) noexcept;
    void record_row_mapping_failure() noexcept;
    void record_row_imported(std::size_t nulls_omitted) noexcept;
    void record_import_failure() noexcept;
    void record_row_exported() noexcept;
    void record_export_failure() noexcept;
    void record_tags_allocated(std::size_t count) noexcept;
    void record_json_row() noexcept;
    void record_json_flush(std::size_t bytes) noexcept;
    void record_json_incomplete() noexcept;

    [[nodiscard]] ConversionTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    std::atomic<std::uint64_t> rows_mapped_{0U};
    std::atomic<std::uint64_t> row_mapping_failures_{0U};
    std::atomic<std::uint64_t> rows_imported_{0U};
    std::atomic<std::uint64_t> import_failures_{0U};
    std::atomic<std::uint64_t> rows_exported_{0U};
    std::atomic<std::uint64_t> export_failures_{0U};
    std::atomic<std::uint64_t> values_copied_{0U};
    std::atomic<std::uint64_t> nulls_omitted_{0U};
    std::atomic<std::uint64_t> defaults_applied_{0U};
    std::atomic<std::uint64_t> tags_allocated_{0U};
    std::atomic<std::uint64_t> json_rows_written_{0U};
    std::atomic<std::uint64_t> json_bytes_flushed_{0U};
    std::atomic<std::uint64_t> json_incomplete_streams_{0U};
};

}  // namespace tagstore::schema
