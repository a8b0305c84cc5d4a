#include "tagstore/schema/stored_value.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace tagstore::schema {

namespace {

constexpr std::size_t kWordSize = sizeof(std::uint64_t);

[[nodiscard]] std::vector<std::byte> encode_word(std::uint64_t word)
{
    std::vector<std::byte> payload(kWordSize);
    for (std::size_t index = 0; index < kWordSize; ++index) {
        payload[index] = static_cast<std::byte>((word >> (index * 8U)) & 0xFFU);
    }
    return payload;
}

}  // namespace

StoredValue::StoredValue(StorageKind kind, std::vector<std::byte> payload) noexcept
    : kind_{kind}
    , payload_{std::move(payload)}
{}

StoredValue StoredValue::from_int(std::int64_t value)
{
    return StoredValue{StorageKind::Int, encode_word(static_cast<std::uint64_t>(value))};
}

StoredValue StoredValue::from_uint(std::uint64_t value)
{
    return StoredValue{StorageKind::Uint, encode_word(value)};
}

StoredValue StoredValue::from_float(double value)
{
    std::uint64_t bits = 0U;
    static_assert(sizeof(bits) == sizeof(value), "double must be 64 bits");
    std::memcpy(&bits, &value, sizeof(bits));
    return StoredValue{StorageKind::Float, encode_word(bits)};
}

StoredValue StoredValue::from_string(std::string_view value)
{
    std::vector<std::byte> payload(value.size());
    std::transform(value.begin(), value.end(), payload.begin(), [](char ch) {
        return static_cast<std::byte>(ch);
    });
    return StoredValue{StorageKind::String, std::move(payload)};
}

StoredValue StoredValue::from_bool(bool value)
{
    return StoredValue{StorageKind::Bool, std::vector<std::byte>{value ? std::byte{1} : std::byte{0}}};
}

StoredValue StoredValue::from_payload(StorageKind kind, std::vector<std::byte> payload)
{
    return StoredValue{kind, std::move(payload)};
}

std::optional<std::uint64_t> StoredValue::read_word() const noexcept
{
    if (payload_.size() != kWordSize) {
        return std::nullopt;
    }
    std::uint64_t word = 0U;
    for (std::size_t index = 0; index < kWordSize; ++index) {
        word |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(payload_[index])) << (index * 8U);
    }
    return word;
}

std::optional<std::int64_t> StoredValue::as_int() const noexcept
{
    if (kind_ != StorageKind::Int) {
        return std::nullopt;
    }
    auto word = read_word();
    if (!word) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*word);
}

std::optional<std::uint64_t> StoredValue::as_uint() const noexcept
{
    if (kind_ != StorageKind::Uint) {
        return std::nullopt;
    }
    return read_word();
}

std::optional<double> StoredValue::as_float() const noexcept
{
    if (kind_ != StorageKind::Float) {
        return std::nullopt;
    }
    auto word = read_word();
    if (!word) {
        return std::nullopt;
    }
    double value = 0.0;
    const std::uint64_t bits = *word;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::optional<std::string> StoredValue::as_string() const
{
    if (kind_ != StorageKind::String) {
        return std::nullopt;
    }
    std::string text(payload_.size(), '\0');
    std::transform(payload_.begin(), payload_.end(), text.begin(), [](std::byte value) {
        return static_cast<char>(value);
    });
    return text;
}

std::optional<bool> StoredValue::as_bool() const noexcept
{
    if (kind_ != StorageKind::Bool || payload_.size() != 1U) {
        return std::nullopt;
    }
    const auto raw = std::to_integer<std::uint8_t>(payload_.front());
    if (raw > 1U) {
        return std::nullopt;
    }
    return raw == 1U;
}

bool operator==(const StoredValue& lhs, const StoredValue& rhs) noexcept
{
    return lhs.kind_ == rhs.kind_ && lhs.payload_ == rhs.payload_;
}

std::string_view storage_kind_name(StorageKind kind) noexcept
{
    switch (kind) {
    case StorageKind::Int:
        return "int";
    case StorageKind::Uint:
        return "uint";
    case StorageKind::Float:
        return "float";
    case StorageKind::String:
        return "string";
    case StorageKind::Bool:
        return "bool";
    default:
        return "unknown";
    }
}

}  // namespace tagstore::schema
