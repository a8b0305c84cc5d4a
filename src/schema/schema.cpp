#include "tagstore/schema/schema.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace tagstore::schema {

namespace {

[[nodiscard]] std::string lowercase(const std::string& text)
{
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

void validate_auto_increment(const ColumnCollection& columns)
{
    const Column* first = nullptr;
    for (const auto& column : columns) {
        if (!column.auto_increment()) {
            continue;
        }
        if (first != nullptr) {
            throw SchemaError{SchemaErrc::MultipleAutoIncrement,
                              column.name(),
                              "columns '" + first->name() + "' and '" + column.name() + "' are both auto increment"};
        }
        first = &column;
    }
}

}  // namespace

Schema::Schema(ColumnCollection columns)
    : all_{std::move(columns)}
{
    std::vector<Column> key_columns;
    std::vector<Column> other_columns;
    for (const auto& column : all_) {
        if (column.is_part_of_primary_key()) {
            key_columns.push_back(column);
        } else {
            other_columns.push_back(column);
        }
    }
    primary_key_ = ColumnCollection{std::move(key_columns)};
    non_key_ = ColumnCollection{std::move(other_columns)};
}

Schema Schema::keyed(ColumnCollection columns)
{
    for (const auto& column : columns) {
        if (column.is_part_of_primary_key() && column.nullable()) {
            throw SchemaError{SchemaErrc::NullablePrimaryKey,
                              column.name(),
                              "primary key column '" + column.name() + "' must not be nullable"};
        }
    }
    validate_auto_increment(columns);
    return Schema{std::move(columns)};
}

Schema Schema::unkeyed(ColumnCollection columns)
{
    validate_auto_increment(columns);

    std::vector<Column> stripped;
    stripped.reserve(columns.size());
    for (const auto& column : columns) {
        stripped.push_back(column.with_primary_key(false));
    }
    return Schema{ColumnCollection{std::move(stripped)}};
}

std::shared_ptr<const Schema> Schema::make_keyed(ColumnCollection columns)
{
    return std::make_shared<const Schema>(keyed(std::move(columns)));
}

std::shared_ptr<const Schema> Schema::make_unkeyed(ColumnCollection columns)
{
    return std::make_shared<const Schema>(unkeyed(std::move(columns)));
}

void Schema::validate_for_insert() const
{
    if (primary_key_.empty()) {
        throw SchemaError{SchemaErrc::MissingPrimaryKey, "table schema requires at least one primary key column"};
    }

    std::unordered_map<std::string, const Column*> seen;
    seen.reserve(all_.size());
    for (const auto& column : all_) {
        auto [it, inserted] = seen.emplace(lowercase(column.name()), &column);
        if (!inserted) {
            throw SchemaError{SchemaErrc::CaseInsensitiveNameCollision,
                              column.name(),
                              "column '" + column.name() + "' collides with column '" + it->second->name() + "'"};
        }
    }
}

}  // namespace tagstore::schema
