#include "tagstore/schema/conversion_telemetry.hpp"

namespace tagstore::schema {

void ConversionTelemetry::record_row_mapped(std::size_t values_copied,
                                            std::size_t nulls_omitted,
                                            std::size_t defaults_applied) noexcept
{
    rows_mapped_.fetch_add(1U, std::memory_order_relaxed);
    if (values_copied != 0U) {
        values_copied_.fetch_add(values_copied, std::memory_order_relaxed);
    }
    if (nulls_omitted != 0U) {
        nulls_omitted_.fetch_add(nulls_omitted, std::memory_order_relaxed);
    }
    if (defaults_applied != 0U) {
        defaults_applied_.fetch_add(defaults_applied, std::memory_order_relaxed);
    }
}

void ConversionTelemetry::record_row_mapping_failure() noexcept
{
    row_mapping_failures_.fetch_add(1U, std::memory_order_relaxed);
}

void ConversionTelemetry::record_row_imported(std::size_t nulls_omitted) noexcept
{
    rows_imported_.fetch_add(1U, std::memory_order_relaxed);
    if (nulls_omitted != 0U) {
        nulls_omitted_.fetch_add(nulls_omitted, std::memory_order_relaxed);
    }
}

void ConversionTelemetry::record_import_failure() noexcept
{
    import_failures_.fetch_add(1U, std::memory_order_relaxed);
}

void ConversionTelemetry::record_row_exported() noexcept
{
    rows_exported_.fetch_add(1U, std::memory_order_relaxed);
}

void ConversionTelemetry::record_export_failure() noexcept
{
    export_failures_.fetch_add(1U, std::memory_order_relaxed);
}

void ConversionTelemetry::record_tags_allocated(std::size_t count) noexcept
{
    tags_allocated_.fetch_add(count, std::memory_order_relaxed);
}

void ConversionTelemetry::record_json_row() noexcept
{
    json_rows_written_.fetch_add(1U, std::memory_order_relaxed);
}

void ConversionTelemetry::record_json_flush(std::size_t bytes) noexcept
{
    json_bytes_flushed_.fetch_add(bytes, std::memory_order_relaxed);
}

void ConversionTelemetry::record_json_incomplete() noexcept
{
    json_incomplete_streams_.fetch_add(1U, std::memory_order_relaxed);
}

ConversionTelemetrySnapshot ConversionTelemetry::snapshot() const noexcept
{
    ConversionTelemetrySnapshot snapshot{};
    snapshot.rows_mapped = rows_mapped_.load(std::memory_order_relaxed);
    snapshot.row_mapping_failures = row_mapping_failures_.load(std::memory_order_relaxed);
    snapshot.rows_imported = rows_imported_.load(std::memory_order_relaxed);
    snapshot.import_failures = import_failures_.load(std::memory_order_relaxed);
    snapshot.rows_exported = rows_exported_.load(std::memory_order_relaxed);
    snapshot.export_failures = export_failures_.load(std::memory_order_relaxed);
    snapshot.values_copied = values_copied_.load(std::memory_order_relaxed);
    snapshot.nulls_omitted = nulls_omitted_.load(std::memory_order_relaxed);
    snapshot.defaults_applied = defaults_applied_.load(std::memory_order_relaxed);
    snapshot.tags_allocated = tags_allocated_.load(std::memory_order_relaxed);
    snapshot.json_rows_written = json_rows_written_.load(std::memory_order_relaxed);
    snapshot.json_bytes_flushed = json_bytes_flushed_.load(std::memory_order_relaxed);
    snapshot.json_incomplete_streams = json_incomplete_streams_.load(std::memory_order_relaxed);
    return snapshot;
}

void ConversionTelemetry::reset() noexcept
{
    rows_mapped_.store(0U, std::memory_order_relaxed);
    row_mapping_failures_.store(0U, std::memory_order_relaxed);
    rows_imported_.store(0U, std::memory_order_relaxed);
    import_failures_.store(0U, std::memory_order_relaxed);
    rows_exported_.store(0U, std::memory_order_relaxed);
    export_failures_.store(0U, std::memory_order_relaxed);
    values_copied_.store(0U, std::memory_order_relaxed);
    nulls_omitted_.store(0U, std::memory_order_relaxed);
    defaults_applied_.store(0U, std::memory_order_relaxed);
    tags_allocated_.store(0U, std::memory_order_relaxed);
    json_rows_written_.store(0U, std::memory_order_relaxed);
    json_bytes_flushed_.store(0U, std::memory_order_relaxed);
    json_incomplete_streams_.store(0U, std::memory_order_relaxed);
}

}  // namespace tagstore::schema
