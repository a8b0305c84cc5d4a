#pragma once

#include "tagstore/row/tagged_row.hpp"
#include "tagstore/schema/schema.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tagstore::row {

// Unkeyed schema holding the named columns in the order given. An empty list keeps every column.
// Throws SchemaError(UnknownColumn) for a name the schema does not have.
[[nodiscard]] std::shared_ptr<const schema::Schema> subset_schema(const schema::Schema& schema,
                                                                  const std::vector<std::string>& column_names);

// Unkeyed schema with the same tags and names where every column is a nullable unbounded string.
[[nodiscard]] std::shared_ptr<const schema::Schema> untype_schema(const schema::Schema& schema);

// Renders each value of the row as text under the untyped schema. Columns missing from the untyped schema are
// dropped.
[[nodiscard]] TaggedRow untype_row(const TaggedRow& row, std::shared_ptr<const schema::Schema> untyped_schema);

}  // namespace tagstore::row
