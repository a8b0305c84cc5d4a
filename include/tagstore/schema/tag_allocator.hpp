#pragma once

#include "tagstore/schema/column.hpp"
#include "tagstore/schema/column_tag.hpp"
#include "tagstore/schema/conversion_telemetry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tagstore::schema {

class Schema;

// Every tag a table has ever used: tags of its current columns plus tags retired by dropped columns.
class TagHistory final {
public:
    TagHistory() = default;
    explicit TagHistory(std::set<ColumnTag> tags);

    [[nodiscard]] static TagHistory from_schema(const Schema& schema);

    void record(const Schema& schema);
    void reserve(ColumnTag tag);

    [[nodiscard]] bool contains(ColumnTag tag) const noexcept { return tags_.count(tag) != 0U; }
    [[nodiscard]] std::size_t size() const noexcept { return tags_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tags_.empty(); }
    [[nodiscard]] const std::set<ColumnTag>& tags() const noexcept { return tags_; }

    // Largest tag strictly below the given ceiling.
    [[nodiscard]] std::optional<ColumnTag> max_below(std::uint64_t ceiling) const noexcept;

    friend bool operator==(const TagHistory& lhs, const TagHistory& rhs) { return lhs.tags_ == rhs.tags_; }
    friend bool operator!=(const TagHistory& lhs, const TagHistory& rhs) { return !(lhs == rhs); }

private:
    std::set<ColumnTag> tags_{};
};

// Column declaration whose tag may not have been assigned yet.
struct ColumnDefinition final {
    std::string name{};
    TypeInfo type = TypeInfo::string_type();
    bool primary_key = false;
    ColumnOptions options{};
    std::optional<ColumnTag> tag{};
};

class TagAllocator final {
public:
    struct Config final {
        std::uint64_t reserved_tag_min = kReservedTagMin;
        ConversionTelemetry* telemetry = nullptr;
    };

    TagAllocator();
    explicit TagAllocator(Config config);

    // One tag per name, increasing from the history's current maximum and skipping every tag in the history.
    // Pure: the same inputs always produce the same tags.
    [[nodiscard]] std::vector<ColumnTag> allocate(const TagHistory& history,
                                                  const std::vector<std::string>& column_names) const;

    [[nodiscard]] std::uint64_t reserved_tag_min() const noexcept { return config_.reserved_tag_min; }

private:
    Config config_{};
};

// Builds columns from definitions, keeping explicit tags and allocating the rest against history plus the explicit
// tags of the same request.
[[nodiscard]] std::vector<Column> resolve_column_tags(const std::vector<ColumnDefinition>& definitions,
                                                      const TagHistory& history,
                                                      const TagAllocator& allocator);

}  // namespace tagstore::schema
