#pragma once

#include <cstdint>

namespace tagstore::schema {

struct ColumnTag final {
    std::uint64_t value = 0U;
};

constexpr bool operator==(ColumnTag lhs, ColumnTag rhs) noexcept { return lhs.value == rhs.value; }
constexpr bool operator!=(ColumnTag lhs, ColumnTag rhs) noexcept { return !(lhs == rhs); }
constexpr bool operator<(ColumnTag lhs, ColumnTag rhs) noexcept { return lhs.value < rhs.value; }

// Tags at or above this value belong to system tables and are never handed out for user columns.
constexpr std::uint64_t kReservedTagMin = std::uint64_t{1} << 50U;

}  // namespace tagstore::schema
