#pragma once

#include "tagstore/row/tag_mapping.hpp"
#include "tagstore/row/tagged_row.hpp"
#include "tagstore/schema/conversion_telemetry.hpp"

#include <cstdint>
#include <vector>

namespace tagstore::row {

class RowConverter final {
public:
    enum class MissingColumnPolicy : std::uint8_t {
        // Unmapped destination columns become NULL; a non-nullable one fails the row.
        Null = 0,
        // Unmapped destination columns take their literal default when it parses as the column type.
        Default
    };

    struct Config final {
        MissingColumnPolicy missing_policy = MissingColumnPolicy::Null;
        schema::ConversionTelemetry* telemetry = nullptr;
    };

    // Fails with TypeMismatch when a mapped pair joins columns of different type kinds.
    explicit RowConverter(TagMapping mapping);
    RowConverter(TagMapping mapping, Config config);

    [[nodiscard]] const TagMapping& mapping() const noexcept { return mapping_; }

    // Values are copied verbatim; no coercion between type descriptors happens here.
    [[nodiscard]] TaggedRow convert(const TaggedRow& source) const;

private:
    struct DefaultValue final {
        schema::ColumnTag tag{};
        schema::StoredValue value;
    };

    [[nodiscard]] TaggedRow convert_impl(const TaggedRow& source) const;

    TagMapping mapping_;
    Config config_{};
    std::vector<DefaultValue> defaults_{};
};

}  // namespace tagstore::row
