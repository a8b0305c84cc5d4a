#include "tagstore/schema/type_info.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace tagstore::schema {

namespace {

[[nodiscard]] bool is_supported_width(std::uint8_t bits) noexcept
{
    return bits == 8U || bits == 16U || bits == 32U || bits == 64U;
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1U);
    }
    return text;
}

[[nodiscard]] bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

template <typename T>
[[nodiscard]] std::optional<T> parse_number(std::string_view text) noexcept
{
    T value{};
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

template <typename T>
[[nodiscard]] std::string format_number(T value)
{
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        throw std::system_error(std::make_error_code(ec), "Failed to format numeric value");
    }
    return std::string(buffer.data(), ptr);
}

}  // namespace

TypeInfo::TypeInfo(TypeKind kind, std::uint8_t bits, std::uint32_t max_length) noexcept
    : kind_{kind}
    , bits_{bits}
    , max_length_{max_length}
{}

TypeInfo TypeInfo::int_type(std::uint8_t bits)
{
    if (!is_supported_width(bits)) {
        throw std::invalid_argument{"Integer width must be 8, 16, 32 or 64 bits"};
    }
    return TypeInfo{TypeKind::Int, bits, 0U};
}

TypeInfo TypeInfo::uint_type(std::uint8_t bits)
{
    if (!is_supported_width(bits)) {
        throw std::invalid_argument{"Unsigned integer width must be 8, 16, 32 or 64 bits"};
    }
    return TypeInfo{TypeKind::Uint, bits, 0U};
}

TypeInfo TypeInfo::float_type(std::uint8_t bits)
{
    if (bits != 32U && bits != 64U) {
        throw std::invalid_argument{"Float width must be 32 or 64 bits"};
    }
    return TypeInfo{TypeKind::Float, bits, 0U};
}

TypeInfo TypeInfo::string_type(std::uint32_t max_length)
{
    return TypeInfo{TypeKind::String, 0U, max_length};
}

TypeInfo TypeInfo::bool_type()
{
    return TypeInfo{TypeKind::Bool, 0U, 0U};
}

StorageKind TypeInfo::storage_kind() const noexcept
{
    switch (kind_) {
    case TypeKind::Int:
        return StorageKind::Int;
    case TypeKind::Uint:
        return StorageKind::Uint;
    case TypeKind::Float:
        return StorageKind::Float;
    case TypeKind::String:
        return StorageKind::String;
    case TypeKind::Bool:
    default:
        return StorageKind::Bool;
    }
}

std::string TypeInfo::name() const
{
    switch (kind_) {
    case TypeKind::Int:
        return "int" + std::to_string(bits_);
    case TypeKind::Uint:
        return "uint" + std::to_string(bits_);
    case TypeKind::Float:
        return "float" + std::to_string(bits_);
    case TypeKind::String:
        return max_length_ == 0U ? std::string{"string"} : "string(" + std::to_string(max_length_) + ")";
    case TypeKind::Bool:
        return "bool";
    default:
        return "unknown";
    }
}

bool TypeInfo::int_in_range(std::int64_t value) const noexcept
{
    if (bits_ == 64U) {
        return true;
    }
    const auto limit = std::int64_t{1} << (bits_ - 1U);
    return value >= -limit && value < limit;
}

bool TypeInfo::uint_in_range(std::uint64_t value) const noexcept
{
    if (bits_ == 64U) {
        return true;
    }
    return value < (std::uint64_t{1} << bits_);
}

bool TypeInfo::float_in_range(double value) const noexcept
{
    if (bits_ == 64U || !std::isfinite(value)) {
        return true;
    }
    return std::fabs(value) <= static_cast<double>(std::numeric_limits<float>::max());
}

bool TypeInfo::string_in_range(std::string_view value) const noexcept
{
    return max_length_ == 0U || value.size() <= max_length_;
}

std::optional<StoredValue> TypeInfo::from_scalar(const ScalarValue& value) const
{
    switch (kind_) {
    case TypeKind::Int:
        if (const auto* number = std::get_if<std::int64_t>(&value); number != nullptr && int_in_range(*number)) {
            return StoredValue::from_int(*number);
        }
        return std::nullopt;
    case TypeKind::Uint:
        if (const auto* number = std::get_if<std::uint64_t>(&value); number != nullptr && uint_in_range(*number)) {
            return StoredValue::from_uint(*number);
        }
        return std::nullopt;
    case TypeKind::Float:
        if (const auto* number = std::get_if<double>(&value); number != nullptr && float_in_range(*number)) {
            const double stored = bits_ == 32U ? static_cast<double>(static_cast<float>(*number)) : *number;
            return StoredValue::from_float(stored);
        }
        return std::nullopt;
    case TypeKind::String:
        if (const auto* text = std::get_if<std::string>(&value); text != nullptr && string_in_range(*text)) {
            return StoredValue::from_string(*text);
        }
        return std::nullopt;
    case TypeKind::Bool:
        if (const auto* flag = std::get_if<bool>(&value); flag != nullptr) {
            return StoredValue::from_bool(*flag);
        }
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

std::optional<ScalarValue> TypeInfo::to_scalar(const StoredValue& value) const
{
    if (!accepts(value)) {
        return std::nullopt;
    }

    switch (kind_) {
    case TypeKind::Int:
        return ScalarValue{*value.as_int()};
    case TypeKind::Uint:
        return ScalarValue{*value.as_uint()};
    case TypeKind::Float:
        return ScalarValue{*value.as_float()};
    case TypeKind::String:
        return ScalarValue{*value.as_string()};
    case TypeKind::Bool:
        return ScalarValue{*value.as_bool()};
    default:
        return std::nullopt;
    }
}

bool TypeInfo::accepts(const StoredValue& value) const
{
    if (value.kind() != storage_kind()) {
        return false;
    }

    switch (kind_) {
    case TypeKind::Int: {
        auto number = value.as_int();
        return number && int_in_range(*number);
    }
    case TypeKind::Uint: {
        auto number = value.as_uint();
        return number && uint_in_range(*number);
    }
    case TypeKind::Float: {
        auto number = value.as_float();
        return number && float_in_range(*number);
    }
    case TypeKind::String:
        return max_length_ == 0U || value.payload().size() <= max_length_;
    case TypeKind::Bool:
        return value.as_bool().has_value();
    default:
        return false;
    }
}

std::optional<StoredValue> TypeInfo::parse_literal(std::string_view text) const
{
    text = trim(text);

    switch (kind_) {
    case TypeKind::Int:
        if (auto number = parse_number<std::int64_t>(text)) {
            return from_scalar(ScalarValue{*number});
        }
        return std::nullopt;
    case TypeKind::Uint:
        if (auto number = parse_number<std::uint64_t>(text)) {
            return from_scalar(ScalarValue{*number});
        }
        return std::nullopt;
    case TypeKind::Float:
        if (auto number = parse_number<double>(text)) {
            return from_scalar(ScalarValue{*number});
        }
        return std::nullopt;
    case TypeKind::String:
        if (text.size() >= 2U && (text.front() == '\'' || text.front() == '"') && text.back() == text.front()) {
            text = text.substr(1U, text.size() - 2U);
        }
        return from_scalar(ScalarValue{std::string{text}});
    case TypeKind::Bool:
        if (equals_ignore_case(text, "true") || text == "1") {
            return StoredValue::from_bool(true);
        }
        if (equals_ignore_case(text, "false") || text == "0") {
            return StoredValue::from_bool(false);
        }
        return std::nullopt;
    default:
        return std::nullopt;
    }
}

std::optional<std::string> TypeInfo::format_value(const StoredValue& value) const
{
    if (!accepts(value)) {
        return std::nullopt;
    }

    switch (kind_) {
    case TypeKind::Int:
        return format_number(*value.as_int());
    case TypeKind::Uint:
        return format_number(*value.as_uint());
    case TypeKind::Float:
        return format_number(*value.as_float());
    case TypeKind::String:
        return value.as_string();
    case TypeKind::Bool:
        return *value.as_bool() ? std::string{"true"} : std::string{"false"};
    default:
        return std::nullopt;
    }
}

}  // namespace tagstore::schema
