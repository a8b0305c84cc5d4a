#include "tagstore/schema/schema_alteration.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <algorithm>
#include <utility>

namespace tagstore::schema {

namespace {

struct AlterState final {
    std::vector<Column> columns{};
    TagHistory history{};
    std::vector<ColumnTag> added_tags{};
    std::vector<ColumnTag> retired_tags{};
};

[[nodiscard]] std::vector<Column>::iterator find_column(std::vector<Column>& columns, const std::string& name)
{
    return std::find_if(columns.begin(), columns.end(), [&](const Column& column) {
        return column.name() == name;
    });
}

void apply_add(AlterState& state, const AddColumnsAction& action, const TagAllocator& allocator)
{
    std::vector<ColumnDefinition> pending;
    for (const auto& definition : action.columns) {
        if (find_column(state.columns, definition.name) != state.columns.end()) {
            if (action.if_not_exists) {
                continue;
            }
            throw SchemaError{SchemaErrc::DuplicateName,
                              definition.name,
                              "column '" + definition.name + "' already exists"};
        }
        if (definition.tag && state.history.contains(*definition.tag)) {
            throw SchemaError{SchemaErrc::DuplicateTag,
                              definition.name,
                              "tag " + std::to_string(definition.tag->value) + " of column '" + definition.name
                                  + "' is already part of the table history"};
        }
        pending.push_back(definition);
    }

    auto added = resolve_column_tags(pending, state.history, allocator);
    for (auto& column : added) {
        state.history.reserve(column.tag());
        state.added_tags.push_back(column.tag());
        state.columns.push_back(std::move(column));
    }
}

void apply_drop(AlterState& state, const DropColumnAction& action)
{
    auto it = find_column(state.columns, action.column_name);
    if (it == state.columns.end()) {
        if (action.if_exists) {
            return;
        }
        throw SchemaError{SchemaErrc::UnknownColumn,
                          action.column_name,
                          "cannot drop unknown column '" + action.column_name + "'"};
    }
    state.retired_tags.push_back(it->tag());
    state.columns.erase(it);
}

void apply_rename(AlterState& state, const RenameColumnAction& action)
{
    if (action.column_name == action.new_column_name) {
        return;
    }
    auto it = find_column(state.columns, action.column_name);
    if (it == state.columns.end()) {
        throw SchemaError{SchemaErrc::UnknownColumn,
                          action.column_name,
                          "cannot rename unknown column '" + action.column_name + "'"};
    }
    if (find_column(state.columns, action.new_column_name) != state.columns.end()) {
        throw SchemaError{SchemaErrc::DuplicateName,
                          action.new_column_name,
                          "column '" + action.new_column_name + "' already exists"};
    }
    *it = it->with_name(action.new_column_name);
}

}  // namespace

AlterSchemaResult alter_schema(const Schema& schema,
                               const TagHistory& history,
                               const std::vector<AlterSchemaAction>& actions,
                               const TagAllocator& allocator)
{
    AlterState state{};
    state.columns = schema.all_columns().columns();
    state.history = history;
    state.history.record(schema);

    for (const auto& action : actions) {
        if (const auto* add = std::get_if<AddColumnsAction>(&action)) {
            apply_add(state, *add, allocator);
            continue;
        }
        if (const auto* drop = std::get_if<DropColumnAction>(&action)) {
            apply_drop(state, *drop);
            continue;
        }
        if (const auto* rename = std::get_if<RenameColumnAction>(&action)) {
            apply_rename(state, *rename);
            continue;
        }
    }

    AlterSchemaResult result{};
    if (schema.is_keyless()) {
        result.schema = Schema::make_unkeyed(ColumnCollection{std::move(state.columns)});
    } else {
        // A keyed table must stay storable: it keeps a key and its names stay distinct ignoring case.
        result.schema = Schema::make_keyed(ColumnCollection{std::move(state.columns)});
        result.schema->validate_for_insert();
    }
    result.history = std::move(state.history);
    result.added_tags = std::move(state.added_tags);
    result.retired_tags = std::move(state.retired_tags);
    return result;
}

}  // namespace tagstore::schema
