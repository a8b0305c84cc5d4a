#include "tagstore/sql/sql_convert.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tagstore::sql {

using schema::Column;
using schema::ColumnCollection;
using schema::SchemaErrc;
using schema::SchemaError;

namespace {

ExternalRow convert_to_external(const row::TaggedRow& row)
{
    const auto& columns = row.schema().all_columns();
    ExternalRow external;
    external.reserve(columns.size());

    for (const auto& column : columns) {
        const auto* value = row.value(column.tag());
        if (value == nullptr) {
            external.emplace_back(std::monostate{});
            continue;
        }
        auto scalar = column.type().to_scalar(*value);
        if (!scalar) {
            throw SchemaError{SchemaErrc::ValueConversionFailed,
                              column.name(),
                              "stored " + std::string{schema::storage_kind_name(value->kind())} + " value of column '"
                                  + column.name() + "' cannot be rendered as " + column.type().name()};
        }
        external.push_back(std::move(*scalar));
    }
    return external;
}

row::TaggedRow convert_to_tagged(const ExternalRow& external,
                                 std::shared_ptr<const schema::Schema> row_schema,
                                 std::size_t& nulls)
{
    const auto& columns = row_schema->all_columns();
    if (external.size() != columns.size()) {
        throw SchemaError{SchemaErrc::RowLengthMismatch,
                          "row has " + std::to_string(external.size()) + " values but the schema has "
                              + std::to_string(columns.size()) + " columns"};
    }

    row::TaggedValues values;
    for (std::size_t index = 0; index < external.size(); ++index) {
        const auto& column = columns.at(index);
        const auto& value = external[index];
        if (schema::is_null(value)) {
            if (!column.nullable()) {
                throw SchemaError{SchemaErrc::NonNullableColumnMissing,
                                  column.name(),
                                  "column '" + column.name() + "' received NULL but is non-nullable"};
            }
            ++nulls;
            continue;
        }
        auto stored = column.type().from_scalar(value);
        if (!stored) {
            throw SchemaError{SchemaErrc::ValueConversionFailed,
                              column.name(),
                              "column '" + column.name() + "' of type " + column.type().name() + " cannot store "
                                  + schema::describe_scalar(value)};
        }
        values.emplace(column.tag(), std::move(*stored));
    }
    return row::TaggedRow::create(std::move(row_schema), std::move(values));
}

}  // namespace

ExternalRow to_external_row(const row::TaggedRow& row, schema::ConversionTelemetry* telemetry)
{
    try {
        auto external = convert_to_external(row);
        if (telemetry != nullptr) {
            telemetry->record_row_exported();
        }
        return external;
    } catch (const SchemaError&) {
        if (telemetry != nullptr) {
            telemetry->record_export_failure();
        }
        throw;
    }
}

row::TaggedRow to_tagged_row(const ExternalRow& external,
                             std::shared_ptr<const schema::Schema> row_schema,
                             schema::ConversionTelemetry* telemetry)
{
    if (!row_schema) {
        throw std::invalid_argument{"to_tagged_row requires a schema"};
    }
    try {
        std::size_t nulls = 0U;
        auto row = convert_to_tagged(external, std::move(row_schema), nulls);
        if (telemetry != nullptr) {
            telemetry->record_row_imported(nulls);
        }
        return row;
    } catch (const SchemaError&) {
        if (telemetry != nullptr) {
            telemetry->record_import_failure();
        }
        throw;
    }
}

schema::ColumnDefinition to_column_definition(const ExternalColumn& column)
{
    schema::ColumnDefinition definition{};
    definition.name = column.name;
    definition.type = type_info_from_external(column.type);
    definition.primary_key = column.primary_key;
    definition.options.default_value = column.default_value;
    definition.options.auto_increment = column.auto_increment;
    definition.options.comment = column.comment;
    if (!column.nullable) {
        definition.options.constraints.push_back(schema::ColumnConstraint::NotNull);
    }
    definition.tag = parse_tag_annotation(column.extra);
    return definition;
}

ExternalColumn to_external_column(std::string_view table_name, const schema::Column& column)
{
    ExternalColumn external{};
    external.name = column.name();
    external.type = external_type_from(column.type());
    external.nullable = column.nullable();
    external.primary_key = column.is_part_of_primary_key();
    external.default_value = column.default_value();
    external.auto_increment = column.auto_increment();
    external.comment = column.comment();
    external.source = std::string{table_name};
    external.extra = format_tag_annotation(column.tag());
    return external;
}

std::shared_ptr<const schema::Schema> to_table_schema(const ExternalSchema& columns,
                                                      const schema::TagHistory& history,
                                                      const schema::TagAllocator& allocator)
{
    std::vector<schema::ColumnDefinition> definitions;
    definitions.reserve(columns.size());
    for (const auto& column : columns) {
        definitions.push_back(to_column_definition(column));
    }

    auto resolved = schema::resolve_column_tags(definitions, history, allocator);
    if (resolved.size() != columns.size()) {
        throw SchemaError{SchemaErrc::TagCountMismatch, "number of tags should equal number of columns"};
    }

    auto table_schema = schema::Schema::make_keyed(ColumnCollection{std::move(resolved)});
    table_schema->validate_for_insert();
    return table_schema;
}

std::shared_ptr<const schema::Schema> to_table_schema(const TableTagHistorySource& source,
                                                      std::string_view table_name,
                                                      const ExternalSchema& columns,
                                                      const schema::TagAllocator& allocator)
{
    return to_table_schema(columns, source.tag_history(table_name), allocator);
}

std::shared_ptr<const schema::Schema> to_result_schema(const ExternalSchema& columns)
{
    std::vector<schema::ColumnDefinition> definitions;
    definitions.reserve(columns.size());
    for (const auto& column : columns) {
        definitions.push_back(to_column_definition(column));
    }

    // First claim on an annotated tag wins. Joins repeat tags across source tables.
    std::vector<std::optional<schema::ColumnTag>> tags(definitions.size());
    std::unordered_set<std::uint64_t> used;
    for (std::size_t index = 0; index < definitions.size(); ++index) {
        const auto& annotated = definitions[index].tag;
        if (annotated && used.insert(annotated->value).second) {
            tags[index] = annotated;
        }
    }

    std::uint64_t overflow = definitions.size();
    for (std::size_t index = 0; index < definitions.size(); ++index) {
        if (tags[index]) {
            continue;
        }
        std::uint64_t candidate = index;
        if (used.count(candidate) != 0U) {
            while (used.count(overflow) != 0U) {
                ++overflow;
            }
            candidate = overflow;
        }
        used.insert(candidate);
        tags[index] = schema::ColumnTag{candidate};
    }

    std::vector<Column> converted;
    converted.reserve(definitions.size());
    for (std::size_t index = 0; index < definitions.size(); ++index) {
        auto& definition = definitions[index];
        converted.emplace_back(definition.name, *tags[index], definition.type, false, std::move(definition.options));
    }
    return schema::Schema::make_unkeyed(ColumnCollection{std::move(converted)});
}

ExternalSchema from_schema(std::string_view table_name, const schema::Schema& table_schema)
{
    ExternalSchema external;
    external.reserve(table_schema.all_columns().size());
    table_schema.all_columns().iterate([&](schema::ColumnTag, const Column& column) {
        external.push_back(to_external_column(table_name, column));
        return false;
    });
    return external;
}

schema::AlterSchemaResult add_columns(const schema::Schema& table_schema,
                                      const schema::TagHistory& history,
                                      const ExternalSchema& new_columns,
                                      const schema::TagAllocator& allocator)
{
    schema::AddColumnsAction action{};
    action.columns.reserve(new_columns.size());
    for (const auto& column : new_columns) {
        action.columns.push_back(to_column_definition(column));
    }
    return schema::alter_schema(table_schema, history, {schema::AlterSchemaAction{std::move(action)}}, allocator);
}

}  // namespace tagstore::sql
