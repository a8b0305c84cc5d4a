#pragma once

#include "tagstore/schema/column_tag.hpp"
#include "tagstore/schema/type_info.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tagstore::schema {

enum class ColumnConstraint : std::uint8_t {
    NotNull = 1
};

struct ColumnOptions final {
    std::optional<std::string> default_value{};
    bool auto_increment = false;
    std::string comment{};
    std::vector<ColumnConstraint> constraints{};
};

// Immutable field definition. The tag is fixed for the life of the column; altering a column produces a new
// Column carrying the same tag.
class Column final {
public:
    Column(std::string name, ColumnTag tag, TypeInfo type, bool part_of_primary_key, ColumnOptions options = {});

    [[nodiscard]] ColumnTag tag() const noexcept { return tag_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const TypeInfo& type() const noexcept { return type_; }
    [[nodiscard]] bool is_part_of_primary_key() const noexcept { return part_of_primary_key_; }
    [[nodiscard]] bool nullable() const noexcept;
    [[nodiscard]] const std::optional<std::string>& default_value() const noexcept { return default_value_; }
    [[nodiscard]] bool auto_increment() const noexcept { return auto_increment_; }
    [[nodiscard]] const std::string& comment() const noexcept { return comment_; }
    [[nodiscard]] const std::vector<ColumnConstraint>& constraints() const noexcept { return constraints_; }

    [[nodiscard]] Column with_name(std::string name) const;
    [[nodiscard]] Column with_type(TypeInfo type) const;
    [[nodiscard]] Column with_nullable(bool nullable) const;
    [[nodiscard]] Column with_primary_key(bool part_of_primary_key) const;

    friend bool operator==(const Column& lhs, const Column& rhs) noexcept;
    friend bool operator!=(const Column& lhs, const Column& rhs) noexcept { return !(lhs == rhs); }

private:
    std::string name_{};
    ColumnTag tag_{};
    TypeInfo type_;
    bool part_of_primary_key_ = false;
    std::optional<std::string> default_value_{};
    bool auto_increment_ = false;
    std::string comment_{};
    std::vector<ColumnConstraint> constraints_{};
};

}  // namespace tagstore::schema
