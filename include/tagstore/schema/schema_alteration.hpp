#pragma once

#include "tagstore/schema/schema.hpp"
#include "tagstore/schema/tag_allocator.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tagstore::schema {

struct AddColumnsAction final {
    std::vector<ColumnDefinition> columns{};
    bool if_not_exists = false;
};

struct DropColumnAction final {
    std::string column_name{};
    bool if_exists = false;
};

struct RenameColumnAction final {
    std::string column_name{};
    std::string new_column_name{};
};

using AlterSchemaAction = std::variant<AddColumnsAction, DropColumnAction, RenameColumnAction>;

struct AlterSchemaResult final {
    std::shared_ptr<const Schema> schema{};
    TagHistory history{};
    std::vector<ColumnTag> added_tags{};
    std::vector<ColumnTag> retired_tags{};
};

// Applies the actions in order and returns the new schema version. Added columns get fresh tags, dropped columns
// keep their tags reserved in the returned history, and renamed columns keep their tags. A keyed result must pass
// Schema::validate_for_insert.
[[nodiscard]] AlterSchemaResult alter_schema(const Schema& schema,
                                             const TagHistory& history,
                                             const std::vector<AlterSchemaAction>& actions,
                                             const TagAllocator& allocator);

}  // namespace tagstore::schema
