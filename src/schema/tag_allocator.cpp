#include "tagstore/schema/tag_allocator.hpp"

#include "tagstore/schema/schema.hpp"
#include "tagstore/schema/schema_errors.hpp"

#include <iterator>
#include <utility>

namespace tagstore::schema {

TagHistory::TagHistory(std::set<ColumnTag> tags)
    : tags_{std::move(tags)}
{}

TagHistory TagHistory::from_schema(const Schema& schema)
{
    TagHistory history;
    history.record(schema);
    return history;
}

void TagHistory::record(const Schema& schema)
{
    for (const auto& column : schema.all_columns()) {
        tags_.insert(column.tag());
    }
}

void TagHistory::reserve(ColumnTag tag)
{
    tags_.insert(tag);
}

std::optional<ColumnTag> TagHistory::max_below(std::uint64_t ceiling) const noexcept
{
    auto it = tags_.lower_bound(ColumnTag{ceiling});
    if (it == tags_.begin()) {
        return std::nullopt;
    }
    return *std::prev(it);
}

TagAllocator::TagAllocator()
    : TagAllocator(Config{})
{}

TagAllocator::TagAllocator(Config config)
    : config_{config}
{}

std::vector<ColumnTag> TagAllocator::allocate(const TagHistory& history,
                                              const std::vector<std::string>& column_names) const
{
    std::vector<ColumnTag> tags;
    tags.reserve(column_names.size());

    const auto current_max = history.max_below(config_.reserved_tag_min);
    std::uint64_t next = current_max ? current_max->value + 1U : 0U;

    for (const auto& name : column_names) {
        while (next < config_.reserved_tag_min && history.contains(ColumnTag{next})) {
            ++next;
        }
        if (next >= config_.reserved_tag_min) {
            throw SchemaError{SchemaErrc::TagSpaceExhausted,
                              name,
                              "no free tag below " + std::to_string(config_.reserved_tag_min) + " for column '" + name
                                  + "'"};
        }
        tags.push_back(ColumnTag{next});
        ++next;
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_tags_allocated(tags.size());
    }
    return tags;
}

std::vector<Column> resolve_column_tags(const std::vector<ColumnDefinition>& definitions,
                                        const TagHistory& history,
                                        const TagAllocator& allocator)
{
    TagHistory reserved = history;
    std::vector<std::string> untagged_names;
    for (const auto& definition : definitions) {
        if (definition.tag) {
            reserved.reserve(*definition.tag);
        } else {
            untagged_names.push_back(definition.name);
        }
    }

    const auto allocated = allocator.allocate(reserved, untagged_names);
    if (allocated.size() != untagged_names.size()) {
        throw SchemaError{SchemaErrc::TagCountMismatch,
                          "allocated " + std::to_string(allocated.size()) + " tags for "
                              + std::to_string(untagged_names.size()) + " columns"};
    }

    std::vector<Column> columns;
    columns.reserve(definitions.size());
    std::size_t next_allocated = 0U;
    for (const auto& definition : definitions) {
        const ColumnTag tag = definition.tag ? *definition.tag : allocated[next_allocated++];
        columns.emplace_back(definition.name, tag, definition.type, definition.primary_key, definition.options);
    }
    return columns;
}

}  // namespace tagstore::schema
