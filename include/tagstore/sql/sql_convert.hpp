#pragma once

#include "tagstore/row/tagged_row.hpp"
#include "tagstore/schema/conversion_telemetry.hpp"
#include "tagstore/schema/schema.hpp"
#include "tagstore/schema/schema_alteration.hpp"
#include "tagstore/schema/tag_allocator.hpp"
#include "tagstore/sql/sql_types.hpp"

#include <memory>
#include <string_view>

namespace tagstore::sql {

// Storage-side view of a table's tag history. Implemented by the versioned store, which also serialises schema
// changes per table so that two concurrent alterations never see the same history.
class TableTagHistorySource {
public:
    virtual ~TableTagHistorySource() = default;
    [[nodiscard]] virtual schema::TagHistory tag_history(std::string_view table_name) const = 0;
};

// One slot per column in declared order; absent tags become NULL.
[[nodiscard]] ExternalRow to_external_row(const row::TaggedRow& row, schema::ConversionTelemetry* telemetry = nullptr);

// The external row must be positionally aligned with the schema's declared column order.
[[nodiscard]] row::TaggedRow to_tagged_row(const ExternalRow& external,
                                           std::shared_ptr<const schema::Schema> row_schema,
                                           schema::ConversionTelemetry* telemetry = nullptr);

[[nodiscard]] schema::ColumnDefinition to_column_definition(const ExternalColumn& column);
[[nodiscard]] ExternalColumn to_external_column(std::string_view table_name, const schema::Column& column);

// Schema for a storable table. Annotated tags are kept, the remaining columns are tagged against the history.
[[nodiscard]] std::shared_ptr<const schema::Schema> to_table_schema(const ExternalSchema& columns,
                                                                    const schema::TagHistory& history,
                                                                    const schema::TagAllocator& allocator);

[[nodiscard]] std::shared_ptr<const schema::Schema> to_table_schema(const TableTagHistorySource& source,
                                                                    std::string_view table_name,
                                                                    const ExternalSchema& columns,
                                                                    const schema::TagAllocator& allocator);

// Unkeyed schema for a result set. An annotated tag is kept by the first column claiming it. Every other column is
// tagged by its ordinal position, or by the next free value past the column count when that position is taken.
[[nodiscard]] std::shared_ptr<const schema::Schema> to_result_schema(const ExternalSchema& columns);

[[nodiscard]] ExternalSchema from_schema(std::string_view table_name, const schema::Schema& table_schema);

// Adds externally described columns to an existing table schema.
[[nodiscard]] schema::AlterSchemaResult add_columns(const schema::Schema& table_schema,
                                                    const schema::TagHistory& history,
                                                    const ExternalSchema& new_columns,
                                                    const schema::TagAllocator& allocator);

}  // namespace tagstore::sql
