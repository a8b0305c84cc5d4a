#include "tagstore/row/tagged_row.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <stdexcept>
#include <utility>

namespace tagstore::row {

using schema::SchemaErrc;
using schema::SchemaError;

TaggedRow::TaggedRow(std::shared_ptr<const schema::Schema> schema, TaggedValues values) noexcept
    : schema_{std::move(schema)}
    , values_{std::move(values)}
{}

TaggedRow TaggedRow::create(std::shared_ptr<const schema::Schema> schema, TaggedValues values)
{
    if (!schema) {
        throw std::invalid_argument{"TaggedRow requires a schema"};
    }

    const auto& columns = schema->all_columns();
    for (const auto& [tag, value] : values) {
        const auto* column = columns.find(tag);
        if (column == nullptr) {
            throw SchemaError{SchemaErrc::UnknownTag, "tag " + std::to_string(tag.value) + " is not part of the row schema"};
        }
        if (!column->type().accepts(value)) {
            throw SchemaError{SchemaErrc::ValueConversionFailed,
                              column->name(),
                              "column '" + column->name() + "' of type " + column->type().name()
                                  + " cannot hold a stored " + std::string{schema::storage_kind_name(value.kind())}
                                  + " value"};
        }
    }

    for (const auto& column : columns) {
        if (!column.nullable() && values.count(column.tag()) == 0U) {
            throw SchemaError{SchemaErrc::NonNullableColumnMissing,
                              column.name(),
                              "column '" + column.name() + "' is non-nullable but has no value"};
        }
    }

    return TaggedRow{std::move(schema), std::move(values)};
}

const schema::StoredValue* TaggedRow::value(schema::ColumnTag tag) const noexcept
{
    auto it = values_.find(tag);
    if (it == values_.end()) {
        return nullptr;
    }
    return &it->second;
}

const schema::StoredValue* TaggedRow::value(std::string_view column_name) const
{
    const auto* column = schema_->all_columns().find(column_name);
    if (column == nullptr) {
        return nullptr;
    }
    return value(column->tag());
}

std::vector<schema::StoredValue> TaggedRow::key_values() const
{
    std::vector<schema::StoredValue> key;
    key.reserve(schema_->primary_key_columns().size());
    for (const auto& column : schema_->primary_key_columns()) {
        // Key columns are non-nullable, so create() guarantees presence.
        key.push_back(values_.at(column.tag()));
    }
    return key;
}

bool operator==(const TaggedRow& lhs, const TaggedRow& rhs)
{
    if (lhs.values_ != rhs.values_) {
        return false;
    }
    return lhs.schema_ == rhs.schema_ || *lhs.schema_ == *rhs.schema_;
}

}  // namespace tagstore::row
