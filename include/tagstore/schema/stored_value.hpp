#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tagstore::schema {

enum class StorageKind : std::uint8_t {
    Int = 1,
    Uint = 2,
    Float = 3,
    String = 4,
    Bool = 5
};

// Encoded value as handed to the chunk store. Integers and floats are 8 byte little endian, strings are raw
// UTF-8, booleans are a single byte.
class StoredValue final {
public:
    [[nodiscard]] static StoredValue from_int(std::int64_t value);
    [[nodiscard]] static StoredValue from_uint(std::uint64_t value);
    [[nodiscard]] static StoredValue from_float(double value);
    [[nodiscard]] static StoredValue from_string(std::string_view value);
    [[nodiscard]] static StoredValue from_bool(bool value);

    // Rehydrates a value read back from storage. The payload is not validated until it is decoded.
    [[nodiscard]] static StoredValue from_payload(StorageKind kind, std::vector<std::byte> payload);

    [[nodiscard]] StorageKind kind() const noexcept { return kind_; }
    [[nodiscard]] std::span<const std::byte> payload() const noexcept { return payload_; }

    [[nodiscard]] std::optional<std::int64_t> as_int() const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> as_uint() const noexcept;
    [[nodiscard]] std::optional<double> as_float() const noexcept;
    [[nodiscard]] std::optional<std::string> as_string() const;
    [[nodiscard]] std::optional<bool> as_bool() const noexcept;

    friend bool operator==(const StoredValue& lhs, const StoredValue& rhs) noexcept;
    friend bool operator!=(const StoredValue& lhs, const StoredValue& rhs) noexcept { return !(lhs == rhs); }

private:
    StoredValue(StorageKind kind, std::vector<std::byte> payload) noexcept;

    [[nodiscard]] std::optional<std::uint64_t> read_word() const noexcept;

    StorageKind kind_ = StorageKind::Int;
    std::vector<std::byte> payload_{};
};

[[nodiscard]] std::string_view storage_kind_name(StorageKind kind) noexcept;

}  // namespace tagstore::schema
