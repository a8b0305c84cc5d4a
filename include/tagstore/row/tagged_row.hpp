#pragma once

#include "tagstore/schema/column_tag.hpp"
#include "tagstore/schema/schema.hpp"
#include "tagstore/schema/stored_value.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string_view>
#include <vector>

namespace tagstore::row {

// Bare tag to value map. A missing tag is SQL NULL; partial maps are legal while a row is being assembled.
using TaggedValues = std::map<schema::ColumnTag, schema::StoredValue>;

class TaggedRow final {
public:
    // Validates that every tag belongs to the schema, that each value is storable in its column and that every
    // non-nullable column has a value.
    [[nodiscard]] static TaggedRow create(std::shared_ptr<const schema::Schema> schema, TaggedValues values);

    [[nodiscard]] const schema::Schema& schema() const noexcept { return *schema_; }
    [[nodiscard]] const std::shared_ptr<const schema::Schema>& shared_schema() const noexcept { return schema_; }
    [[nodiscard]] const TaggedValues& values() const noexcept { return values_; }
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    [[nodiscard]] const schema::StoredValue* value(schema::ColumnTag tag) const noexcept;
    [[nodiscard]] const schema::StoredValue* value(std::string_view column_name) const;
    [[nodiscard]] bool is_null(schema::ColumnTag tag) const noexcept { return value(tag) == nullptr; }

    // Primary key values in key order; this is the row identity used by diff and merge.
    [[nodiscard]] std::vector<schema::StoredValue> key_values() const;

    friend bool operator==(const TaggedRow& lhs, const TaggedRow& rhs);
    friend bool operator!=(const TaggedRow& lhs, const TaggedRow& rhs) { return !(lhs == rhs); }

private:
    TaggedRow(std::shared_ptr<const schema::Schema> schema, TaggedValues values) noexcept;

    std::shared_ptr<const schema::Schema> schema_{};
    TaggedValues values_{};
};

}  // namespace tagstore::row
