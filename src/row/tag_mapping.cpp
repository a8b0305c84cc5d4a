#include "tagstore/row/tag_mapping.hpp"

#include "tagstore/schema/schema_errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace tagstore::row {

using schema::ColumnTag;
using schema::SchemaErrc;
using schema::SchemaError;

namespace {

void require_schemas(const std::shared_ptr<const schema::Schema>& source,
                     const std::shared_ptr<const schema::Schema>& destination)
{
    if (!source || !destination) {
        throw std::invalid_argument{"TagMapping requires source and destination schemas"};
    }
}

void validate_explicit_pair(const schema::Schema& source, const schema::Schema& destination, const TagPair& pair)
{
    if (source.all_columns().find(pair.source) == nullptr) {
        throw SchemaError{SchemaErrc::UnknownTag,
                          "explicit mapping source tag " + std::to_string(pair.source.value)
                              + " is not part of the source schema"};
    }
    if (destination.all_columns().find(pair.destination) == nullptr) {
        throw SchemaError{SchemaErrc::UnknownTag,
                          "explicit mapping destination tag " + std::to_string(pair.destination.value)
                              + " is not part of the destination schema"};
    }
}

}  // namespace

TagMapping::TagMapping(std::shared_ptr<const schema::Schema> source,
                       std::shared_ptr<const schema::Schema> destination,
                       std::vector<TagPair> pairs)
    : source_{std::move(source)}
    , destination_{std::move(destination)}
    , pairs_{std::move(pairs)}
{
    forward_.reserve(pairs_.size());
    reverse_.reserve(pairs_.size());
    for (const auto& pair : pairs_) {
        if (!forward_.emplace(pair.source.value, pair.destination.value).second) {
            throw SchemaError{SchemaErrc::DuplicateMappingTarget,
                              "source tag " + std::to_string(pair.source.value) + " is mapped more than once"};
        }
        if (!reverse_.emplace(pair.destination.value, pair.source.value).second) {
            const auto* column = destination_->all_columns().find(pair.destination);
            throw SchemaError{SchemaErrc::DuplicateMappingTarget,
                              column != nullptr ? column->name() : std::string{},
                              "destination tag " + std::to_string(pair.destination.value)
                                  + " is the target of more than one source tag"};
        }
    }
}

TagMapping TagMapping::build(std::shared_ptr<const schema::Schema> source,
                             std::shared_ptr<const schema::Schema> destination,
                             const Options& options)
{
    require_schemas(source, destination);

    std::unordered_map<std::uint64_t, ColumnTag> overrides;
    std::unordered_map<std::uint64_t, ColumnTag> overridden_destinations;
    for (const auto& pair : options.explicit_pairs) {
        validate_explicit_pair(*source, *destination, pair);
        if (!overrides.emplace(pair.source.value, pair.destination).second) {
            throw SchemaError{SchemaErrc::DuplicateMappingTarget,
                              "source tag " + std::to_string(pair.source.value)
                                  + " appears in more than one explicit mapping"};
        }
        overridden_destinations.emplace(pair.destination.value, pair.source);
    }

    std::vector<TagPair> pairs;
    for (const auto& column : source->all_columns()) {
        if (auto it = overrides.find(column.tag().value); it != overrides.end()) {
            pairs.push_back({column.tag(), it->second});
            continue;
        }
        if (!options.match_names) {
            continue;
        }
        const auto* match = destination->all_columns().find(column.name());
        if (match == nullptr || overridden_destinations.count(match->tag().value) != 0U) {
            continue;
        }
        pairs.push_back({column.tag(), match->tag()});
    }

    TagMapping mapping{std::move(source), std::move(destination), std::move(pairs)};

    switch (options.coverage) {
    case Coverage::NonEmpty:
        if (mapping.empty()) {
            throw SchemaError{SchemaErrc::EmptyMapping, "no source column matches a destination column"};
        }
        break;
    case Coverage::AllDestination:
        for (const auto& column : mapping.destination_schema().all_columns()) {
            if (!mapping.source_of(column.tag())) {
                throw SchemaError{SchemaErrc::IncompleteMapping,
                                  column.name(),
                                  "destination column '" + column.name() + "' has no source column"};
            }
        }
        break;
    case Coverage::Partial:
    default:
        break;
    }

    return mapping;
}

TagMapping TagMapping::by_name(std::shared_ptr<const schema::Schema> source,
                               std::shared_ptr<const schema::Schema> destination)
{
    return build(std::move(source), std::move(destination), Options{});
}

TagMapping TagMapping::from_pairs(std::shared_ptr<const schema::Schema> source,
                                  std::shared_ptr<const schema::Schema> destination,
                                  std::vector<TagPair> pairs)
{
    Options options{};
    options.explicit_pairs = std::move(pairs);
    options.match_names = false;
    return build(std::move(source), std::move(destination), options);
}

TagMapping TagMapping::identity(std::shared_ptr<const schema::Schema> schema)
{
    if (!schema) {
        throw std::invalid_argument{"TagMapping requires a schema"};
    }
    std::vector<TagPair> pairs;
    pairs.reserve(schema->all_columns().size());
    for (const auto& column : schema->all_columns()) {
        pairs.push_back({column.tag(), column.tag()});
    }
    auto destination = schema;
    return TagMapping{std::move(schema), std::move(destination), std::move(pairs)};
}

bool TagMapping::is_identity() const noexcept
{
    if (pairs_.size() != source_->all_columns().size() || pairs_.size() != destination_->all_columns().size()) {
        return false;
    }
    return std::all_of(pairs_.begin(), pairs_.end(), [](const TagPair& pair) {
        return pair.source == pair.destination;
    });
}

std::optional<ColumnTag> TagMapping::destination_of(ColumnTag source) const noexcept
{
    auto it = forward_.find(source.value);
    if (it == forward_.end()) {
        return std::nullopt;
    }
    return ColumnTag{it->second};
}

std::optional<ColumnTag> TagMapping::source_of(ColumnTag destination) const noexcept
{
    auto it = reverse_.find(destination.value);
    if (it == reverse_.end()) {
        return std::nullopt;
    }
    return ColumnTag{it->second};
}

}  // namespace tagstore::row
