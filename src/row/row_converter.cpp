#include "tagstore/row/row_converter.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <utility>

namespace tagstore::row {

using schema::SchemaErrc;
using schema::SchemaError;

RowConverter::RowConverter(TagMapping mapping)
    : RowConverter(std::move(mapping), Config{})
{}

RowConverter::RowConverter(TagMapping mapping, Config config)
    : mapping_{std::move(mapping)}
    , config_{config}
{
    const auto& source_columns = mapping_.source_schema().all_columns();
    const auto& destination_columns = mapping_.destination_schema().all_columns();

    for (const auto& pair : mapping_.pairs()) {
        const auto* source = source_columns.find(pair.source);
        const auto* destination = destination_columns.find(pair.destination);
        if (source->type().kind() != destination->type().kind()) {
            throw SchemaError{SchemaErrc::TypeMismatch,
                              destination->name(),
                              "column '" + source->name() + "' of type " + source->type().name()
                                  + " cannot be copied into column '" + destination->name() + "' of type "
                                  + destination->type().name()};
        }
    }

    if (config_.missing_policy != MissingColumnPolicy::Default) {
        return;
    }
    for (const auto& column : destination_columns) {
        if (mapping_.source_of(column.tag()) || !column.default_value()) {
            continue;
        }
        // Non-literal defaults such as function calls are left to the caller.
        if (auto value = column.type().parse_literal(*column.default_value())) {
            defaults_.push_back({column.tag(), std::move(*value)});
        }
    }
}

TaggedRow RowConverter::convert(const TaggedRow& source) const
{
    try {
        return convert_impl(source);
    } catch (const SchemaError&) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_row_mapping_failure();
        }
        throw;
    }
}

TaggedRow RowConverter::convert_impl(const TaggedRow& source) const
{
    const auto& source_columns = mapping_.source_schema().all_columns();

    TaggedValues converted;
    std::size_t copied = 0U;
    for (const auto& [tag, value] : source.values()) {
        if (source_columns.find(tag) == nullptr) {
            throw SchemaError{SchemaErrc::UnknownTag,
                              "row tag " + std::to_string(tag.value) + " is not part of the mapping source schema"};
        }
        auto destination = mapping_.destination_of(tag);
        if (!destination) {
            continue;
        }
        converted.emplace(*destination, value);
        ++copied;
    }

    std::size_t defaults_applied = 0U;
    for (const auto& entry : defaults_) {
        if (converted.emplace(entry.tag, entry.value).second) {
            ++defaults_applied;
        }
    }

    const auto destination_count = mapping_.destination_schema().all_columns().size();
    const std::size_t nulls = destination_count - converted.size();

    auto row = TaggedRow::create(mapping_.shared_destination(), std::move(converted));
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_row_mapped(copied, nulls, defaults_applied);
    }
    return row;
}

}  // namespace tagstore::row
