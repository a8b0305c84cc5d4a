#pragma once

#include "tagstore/schema/scalar_value.hpp"
#include "tagstore/schema/stored_value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tagstore::schema {

enum class TypeKind : std::uint8_t {
    Int = 1,
    Uint = 2,
    Float = 3,
    String = 4,
    Bool = 5
};

// Logical column type. Converts external scalars into StoredValue payloads and back, enforcing the width of
// integer and float types and the maximum byte length of bounded strings.
class TypeInfo final {
public:
    [[nodiscard]] static TypeInfo int_type(std::uint8_t bits = 64U);
    [[nodiscard]] static TypeInfo uint_type(std::uint8_t bits = 64U);
    [[nodiscard]] static TypeInfo float_type(std::uint8_t bits = 64U);
    [[nodiscard]] static TypeInfo string_type(std::uint32_t max_length = 0U);
    [[nodiscard]] static TypeInfo bool_type();

    [[nodiscard]] TypeKind kind() const noexcept { return kind_; }
    [[nodiscard]] std::uint8_t bits() const noexcept { return bits_; }
    [[nodiscard]] std::uint32_t max_length() const noexcept { return max_length_; }
    [[nodiscard]] StorageKind storage_kind() const noexcept;
    [[nodiscard]] std::string name() const;

    // Returns std::nullopt for NULL, for a scalar of another kind, and for values outside the type's range.
    [[nodiscard]] std::optional<StoredValue> from_scalar(const ScalarValue& value) const;
    [[nodiscard]] std::optional<ScalarValue> to_scalar(const StoredValue& value) const;

    [[nodiscard]] bool accepts(const StoredValue& value) const;

    [[nodiscard]] std::optional<StoredValue> parse_literal(std::string_view text) const;
    [[nodiscard]] std::optional<std::string> format_value(const StoredValue& value) const;

    friend bool operator==(const TypeInfo& lhs, const TypeInfo& rhs) noexcept
    {
        return lhs.kind_ == rhs.kind_ && lhs.bits_ == rhs.bits_ && lhs.max_length_ == rhs.max_length_;
    }
    friend bool operator!=(const TypeInfo& lhs, const TypeInfo& rhs) noexcept { return !(lhs == rhs); }

private:
    TypeInfo(TypeKind kind, std::uint8_t bits, std::uint32_t max_length) noexcept;

    [[nodiscard]] bool int_in_range(std::int64_t value) const noexcept;
    [[nodiscard]] bool uint_in_range(std::uint64_t value) const noexcept;
    [[nodiscard]] bool float_in_range(double value) const noexcept;
    [[nodiscard]] bool string_in_range(std::string_view value) const noexcept;

    TypeKind kind_ = TypeKind::Int;
    std::uint8_t bits_ = 64U;
    std::uint32_t max_length_ = 0U;
};

}  // namespace tagstore::schema
