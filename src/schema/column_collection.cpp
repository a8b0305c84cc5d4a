#include "tagstore/schema/column_collection.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <utility>

namespace tagstore::schema {

ColumnCollection::ColumnCollection(std::vector<Column> columns)
    : columns_{std::move(columns)}
{
    tag_index_.reserve(columns_.size());
    name_index_.reserve(columns_.size());

    for (std::size_t index = 0; index < columns_.size(); ++index) {
        const auto& column = columns_[index];
        if (!tag_index_.emplace(column.tag().value, index).second) {
            throw SchemaError{SchemaErrc::DuplicateTag,
                              column.name(),
                              "tag " + std::to_string(column.tag().value) + " of column '" + column.name()
                                  + "' is already used by column '" + columns_[tag_index_.at(column.tag().value)].name()
                                  + "'"};
        }
        if (!name_index_.emplace(column.name(), index).second) {
            throw SchemaError{SchemaErrc::DuplicateName, column.name(), "duplicate column name '" + column.name() + "'"};
        }
    }
}

std::vector<ColumnTag> ColumnCollection::tags() const
{
    std::vector<ColumnTag> tags;
    tags.reserve(columns_.size());
    for (const auto& column : columns_) {
        tags.push_back(column.tag());
    }
    return tags;
}

const Column* ColumnCollection::find(ColumnTag tag) const noexcept
{
    auto it = tag_index_.find(tag.value);
    if (it == tag_index_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

const Column* ColumnCollection::find(std::string_view name) const noexcept
{
    auto it = name_index_.find(name);
    if (it == name_index_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

std::optional<std::size_t> ColumnCollection::index_of(ColumnTag tag) const noexcept
{
    auto it = tag_index_.find(tag.value);
    if (it == tag_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ColumnCollection::iterate(const ColumnCallback& callback) const
{
    for (const auto& column : columns_) {
        if (callback(column.tag(), column)) {
            return true;
        }
    }
    return false;
}

}  // namespace tagstore::schema
