#include "tagstore/schema/column.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tagstore::schema {

namespace {

void normalize_constraints(std::vector<ColumnConstraint>& constraints)
{
    std::sort(constraints.begin(), constraints.end());
    constraints.erase(std::unique(constraints.begin(), constraints.end()), constraints.end());
}

}  // namespace

Column::Column(std::string name, ColumnTag tag, TypeInfo type, bool part_of_primary_key, ColumnOptions options)
    : name_{std::move(name)}
    , tag_{tag}
    , type_{type}
    , part_of_primary_key_{part_of_primary_key}
    , default_value_{std::move(options.default_value)}
    , auto_increment_{options.auto_increment}
    , comment_{std::move(options.comment)}
    , constraints_{std::move(options.constraints)}
{
    if (name_.empty()) {
        throw std::invalid_argument{"Column requires a non-empty name"};
    }
    normalize_constraints(constraints_);
}

bool Column::nullable() const noexcept
{
    return std::find(constraints_.begin(), constraints_.end(), ColumnConstraint::NotNull) == constraints_.end();
}

Column Column::with_name(std::string name) const
{
    Column copy = *this;
    if (name.empty()) {
        throw std::invalid_argument{"Column requires a non-empty name"};
    }
    copy.name_ = std::move(name);
    return copy;
}

Column Column::with_type(TypeInfo type) const
{
    Column copy = *this;
    copy.type_ = type;
    return copy;
}

Column Column::with_nullable(bool nullable) const
{
    Column copy = *this;
    auto& constraints = copy.constraints_;
    constraints.erase(std::remove(constraints.begin(), constraints.end(), ColumnConstraint::NotNull), constraints.end());
    if (!nullable) {
        constraints.push_back(ColumnConstraint::NotNull);
        normalize_constraints(constraints);
    }
    return copy;
}

Column Column::with_primary_key(bool part_of_primary_key) const
{
    Column copy = *this;
    copy.part_of_primary_key_ = part_of_primary_key;
    return copy;
}

bool operator==(const Column& lhs, const Column& rhs) noexcept
{
    return lhs.tag_ == rhs.tag_
        && lhs.name_ == rhs.name_
        && lhs.type_ == rhs.type_
        && lhs.part_of_primary_key_ == rhs.part_of_primary_key_
        && lhs.default_value_ == rhs.default_value_
        && lhs.auto_increment_ == rhs.auto_increment_
        && lhs.comment_ == rhs.comment_
        && lhs.constraints_ == rhs.constraints_;
}

}  // namespace tagstore::schema
