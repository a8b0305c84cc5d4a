#include "tagstore/row/projection.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <stdexcept>
#include <utility>

namespace tagstore::row {

using schema::Column;
using schema::ColumnCollection;
using schema::SchemaErrc;
using schema::SchemaError;

std::shared_ptr<const schema::Schema> subset_schema(const schema::Schema& schema,
                                                    const std::vector<std::string>& column_names)
{
    if (column_names.empty()) {
        return schema::Schema::make_unkeyed(schema.all_columns());
    }

    std::vector<Column> columns;
    columns.reserve(column_names.size());
    for (const auto& name : column_names) {
        const auto* column = schema.all_columns().find(name);
        if (column == nullptr) {
            throw SchemaError{SchemaErrc::UnknownColumn, name, "unknown column '" + name + "'"};
        }
        columns.push_back(*column);
    }
    return schema::Schema::make_unkeyed(ColumnCollection{std::move(columns)});
}

std::shared_ptr<const schema::Schema> untype_schema(const schema::Schema& schema)
{
    std::vector<Column> columns;
    columns.reserve(schema.all_columns().size());
    for (const auto& column : schema.all_columns()) {
        schema::ColumnOptions options{};
        options.comment = column.comment();
        columns.emplace_back(column.name(), column.tag(), schema::TypeInfo::string_type(), false, std::move(options));
    }
    return schema::Schema::make_unkeyed(ColumnCollection{std::move(columns)});
}

TaggedRow untype_row(const TaggedRow& row, std::shared_ptr<const schema::Schema> untyped_schema)
{
    if (!untyped_schema) {
        throw std::invalid_argument{"untype_row requires a destination schema"};
    }

    const auto& source_columns = row.schema().all_columns();
    TaggedValues values;
    for (const auto& column : untyped_schema->all_columns()) {
        const auto* source = source_columns.find(column.name());
        if (source == nullptr) {
            continue;
        }
        const auto* value = row.value(source->tag());
        if (value == nullptr) {
            continue;
        }
        auto text = source->type().format_value(*value);
        if (!text) {
            throw SchemaError{SchemaErrc::ValueConversionFailed,
                              source->name(),
                              "value of column '" + source->name() + "' cannot be rendered as text"};
        }
        values.emplace(column.tag(), schema::StoredValue::from_string(*text));
    }
    return TaggedRow::create(std::move(untyped_schema), std::move(values));
}

}  // namespace tagstore::row
