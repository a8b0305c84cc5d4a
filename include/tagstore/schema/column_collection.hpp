#pragma once

#include "tagstore/schema/column.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tagstore::schema {

// Ordered set of columns indexed by tag and by name. Declared order is the positional order used by external rows.
class ColumnCollection final {
public:
    // Return true to stop the iteration.
    using ColumnCallback = std::function<bool(ColumnTag tag, const Column& column)>;
    using const_iterator = std::vector<Column>::const_iterator;

    ColumnCollection() = default;
    explicit ColumnCollection(std::vector<Column> columns);

    [[nodiscard]] std::size_t size() const noexcept { return columns_.size(); }
    [[nodiscard]] bool empty() const noexcept { return columns_.empty(); }
    [[nodiscard]] const std::vector<Column>& columns() const noexcept { return columns_; }
    [[nodiscard]] const Column& at(std::size_t index) const { return columns_.at(index); }
    [[nodiscard]] std::vector<ColumnTag> tags() const;

    [[nodiscard]] const Column* find(ColumnTag tag) const noexcept;
    [[nodiscard]] const Column* find(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<std::size_t> index_of(ColumnTag tag) const noexcept;

    // Returns true when the callback stopped the iteration early.
    bool iterate(const ColumnCallback& callback) const;

    [[nodiscard]] const_iterator begin() const noexcept { return columns_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return columns_.end(); }

    friend bool operator==(const ColumnCollection& lhs, const ColumnCollection& rhs) noexcept
    {
        return lhs.columns_ == rhs.columns_;
    }
    friend bool operator!=(const ColumnCollection& lhs, const ColumnCollection& rhs) noexcept { return !(lhs == rhs); }

private:
    // Lets name lookups take a string_view without building a std::string.
    struct NameHash final {
        using is_transparent = void;
        [[nodiscard]] std::size_t operator()(std::string_view name) const noexcept
        {
            return std::hash<std::string_view>{}(name);
        }
    };

    std::vector<Column> columns_{};
    std::unordered_map<std::uint64_t, std::size_t> tag_index_{};
    std::unordered_map<std::string, std::size_t, NameHash, std::equal_to<>> name_index_{};
};

}  // namespace tagstore::schema
