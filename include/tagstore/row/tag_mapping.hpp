#pragma once

#include "tagstore/schema/column_tag.hpp"
#include "tagstore/schema/schema.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tagstore::row {

struct TagPair final {
    schema::ColumnTag source{};
    schema::ColumnTag destination{};
};

inline bool operator==(const TagPair& lhs, const TagPair& rhs) noexcept
{
    return lhs.source == rhs.source && lhs.destination == rhs.destination;
}

// Partial function from source schema tags to destination schema tags. Immutable and shareable once built.
class TagMapping final {
public:
    enum class Coverage : std::uint8_t {
        Partial = 0,
        NonEmpty,
        AllDestination
    };

    struct Options final {
        // Strictly override name matches for the source and destination tags they mention.
        std::vector<TagPair> explicit_pairs{};
        bool match_names = true;
        Coverage coverage = Coverage::Partial;
    };

    [[nodiscard]] static TagMapping build(std::shared_ptr<const schema::Schema> source,
                                          std::shared_ptr<const schema::Schema> destination,
                                          const Options& options);

    // Matches column names case-sensitively.
    [[nodiscard]] static TagMapping by_name(std::shared_ptr<const schema::Schema> source,
                                            std::shared_ptr<const schema::Schema> destination);

    [[nodiscard]] static TagMapping from_pairs(std::shared_ptr<const schema::Schema> source,
                                               std::shared_ptr<const schema::Schema> destination,
                                               std::vector<TagPair> pairs);

    [[nodiscard]] static TagMapping identity(std::shared_ptr<const schema::Schema> schema);

    [[nodiscard]] const schema::Schema& source_schema() const noexcept { return *source_; }
    [[nodiscard]] const schema::Schema& destination_schema() const noexcept { return *destination_; }
    [[nodiscard]] const std::shared_ptr<const schema::Schema>& shared_destination() const noexcept
    {
        return destination_;
    }

    // Pairs in source declared order.
    [[nodiscard]] const std::vector<TagPair>& pairs() const noexcept { return pairs_; }
    [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pairs_.empty(); }
    [[nodiscard]] bool is_identity() const noexcept;

    [[nodiscard]] std::optional<schema::ColumnTag> destination_of(schema::ColumnTag source) const noexcept;
    [[nodiscard]] std::optional<schema::ColumnTag> source_of(schema::ColumnTag destination) const noexcept;

private:
    TagMapping(std::shared_ptr<const schema::Schema> source,
               std::shared_ptr<const schema::Schema> destination,
               std::vector<TagPair> pairs);

    std::shared_ptr<const schema::Schema> source_{};
    std::shared_ptr<const schema::Schema> destination_{};
    std::vector<TagPair> pairs_{};
    std::unordered_map<std::uint64_t, std::uint64_t> forward_{};
    std::unordered_map<std::uint64_t, std::uint64_t> reverse_{};
};

}  // namespace tagstore::row
