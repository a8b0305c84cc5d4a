#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace tagstore::schema {

// External scalar as produced and consumed by the query engine. std::monostate is SQL NULL.
using ScalarValue = std::variant<std::monostate, std::int64_t, std::uint64_t, double, std::string, bool>;

[[nodiscard]] inline bool is_null(const ScalarValue& value) noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] std::string describe_scalar(const ScalarValue& value);

}  // namespace tagstore::schema
