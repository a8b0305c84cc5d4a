#pragma once

#include "tagstore/schema/column_collection.hpp"

#include <memory>

namespace tagstore::schema {

// A column collection with its primary key and non-key partitions derived once at construction.
class Schema final {
public:
    // Rejects nullable primary key columns and more than one auto increment column.
    [[nodiscard]] static Schema keyed(ColumnCollection columns);

    // Result sets and projections. Primary key flags are cleared and no key validation is applied.
    [[nodiscard]] static Schema unkeyed(ColumnCollection columns);

    [[nodiscard]] static std::shared_ptr<const Schema> make_keyed(ColumnCollection columns);
    [[nodiscard]] static std::shared_ptr<const Schema> make_unkeyed(ColumnCollection columns);

    [[nodiscard]] const ColumnCollection& all_columns() const noexcept { return all_; }
    [[nodiscard]] const ColumnCollection& primary_key_columns() const noexcept { return primary_key_; }
    [[nodiscard]] const ColumnCollection& non_key_columns() const noexcept { return non_key_; }
    [[nodiscard]] bool is_keyless() const noexcept { return primary_key_.empty(); }

    // Stricter validation applied when a schema backs a storable table.
    void validate_for_insert() const;

    friend bool operator==(const Schema& lhs, const Schema& rhs) noexcept { return lhs.all_ == rhs.all_; }
    friend bool operator!=(const Schema& lhs, const Schema& rhs) noexcept { return !(lhs == rhs); }

private:
    explicit Schema(ColumnCollection columns);

    ColumnCollection all_{};
    ColumnCollection primary_key_{};
    ColumnCollection non_key_{};
};

}  // namespace tagstore::schema
