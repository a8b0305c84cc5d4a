#pragma once

#include "tagstore/schema/column_tag.hpp"
#include "tagstore/schema/scalar_value.hpp"
#include "tagstore/schema/type_info.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tagstore::sql {

enum class SqlTypeId : std::uint8_t {
    TinyInt = 1,
    SmallInt,
    Int,
    BigInt,
    TinyIntUnsigned,
    SmallIntUnsigned,
    IntUnsigned,
    BigIntUnsigned,
    Float,
    Double,
    Varchar,
    Text,
    Boolean
};

struct ExternalType final {
    SqlTypeId id = SqlTypeId::Text;
    // Only meaningful for VARCHAR.
    std::uint32_t length = 0U;
};

inline bool operator==(const ExternalType& lhs, const ExternalType& rhs) noexcept
{
    return lhs.id == rhs.id && lhs.length == rhs.length;
}

using ExternalValue = schema::ScalarValue;
using ExternalRow = std::vector<ExternalValue>;

struct ExternalColumn final {
    std::string name{};
    ExternalType type{};
    bool nullable = true;
    bool primary_key = false;
    std::optional<std::string> default_value{};
    bool auto_increment = false;
    std::string comment{};
    std::string source{};
    // Auxiliary annotation carrying the column tag as "tag:<uint64>". Empty when the column has no tag yet.
    std::string extra{};
};

using ExternalSchema = std::vector<ExternalColumn>;

[[nodiscard]] schema::TypeInfo type_info_from_external(const ExternalType& type);
[[nodiscard]] ExternalType external_type_from(const schema::TypeInfo& type);
[[nodiscard]] std::string external_type_name(const ExternalType& type);

constexpr std::string_view kTagAnnotationPrefix = "tag:";

[[nodiscard]] std::string format_tag_annotation(schema::ColumnTag tag);

// std::nullopt for an empty annotation. Anything else that is not "tag:<uint64>" throws
// SchemaError(MalformedTagAnnotation).
[[nodiscard]] std::optional<schema::ColumnTag> parse_tag_annotation(std::string_view annotation);

}  // namespace tagstore::sql
