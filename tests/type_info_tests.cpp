#include "tagstore/schema/scalar_value.hpp"
#include "tagstore/schema/stored_value.hpp"
#include "tagstore/schema/type_info.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using tagstore::schema::ScalarValue;
using tagstore::schema::StorageKind;
using tagstore::schema::StoredValue;
using tagstore::schema::TypeInfo;
using tagstore::schema::TypeKind;

TEST_CASE("StoredValue encodes numbers as little endian words")
{
    const auto value = StoredValue::from_int(0x0102);
    REQUIRE(value.payload().size() == 8U);
    CHECK(value.payload()[0] == std::byte{0x02});
    CHECK(value.payload()[1] == std::byte{0x01});
    CHECK(value.payload()[7] == std::byte{0x00});
    CHECK(value.as_int() == 0x0102);
    CHECK_FALSE(value.as_uint().has_value());

    const auto negative = StoredValue::from_int(-5);
    CHECK(negative.as_int() == -5);

    const auto real = StoredValue::from_float(2.5);
    CHECK(real.kind() == StorageKind::Float);
    CHECK(real.as_float() == 2.5);

    const auto flag = StoredValue::from_bool(true);
    REQUIRE(flag.payload().size() == 1U);
    CHECK(flag.as_bool() == true);

    const auto text = StoredValue::from_string("hello");
    CHECK(text.payload().size() == 5U);
    CHECK(text.as_string() == std::string{"hello"});
}

TEST_CASE("StoredValue rejects truncated payloads on decode")
{
    const auto broken = StoredValue::from_payload(StorageKind::Int, std::vector<std::byte>(3U));
    CHECK_FALSE(broken.as_int().has_value());

    const auto bad_flag = StoredValue::from_payload(StorageKind::Bool, std::vector<std::byte>{std::byte{7}});
    CHECK_FALSE(bad_flag.as_bool().has_value());
    CHECK_FALSE(TypeInfo::bool_type().accepts(bad_flag));
}

TEST_CASE("StoredValue equality compares kind and payload")
{
    CHECK(StoredValue::from_int(1) == StoredValue::from_int(1));
    CHECK(StoredValue::from_int(1) != StoredValue::from_uint(1U));
    CHECK(StoredValue::from_string("a") != StoredValue::from_string("b"));
}

TEST_CASE("TypeInfo factories validate widths")
{
    CHECK(TypeInfo::int_type(32U).bits() == 32U);
    CHECK_THROWS_AS(TypeInfo::int_type(12U), std::invalid_argument);
    CHECK_THROWS_AS(TypeInfo::uint_type(0U), std::invalid_argument);
    CHECK_THROWS_AS(TypeInfo::float_type(16U), std::invalid_argument);

    CHECK(TypeInfo::int_type().name() == "int64");
    CHECK(TypeInfo::uint_type(8U).name() == "uint8");
    CHECK(TypeInfo::float_type(32U).name() == "float32");
    CHECK(TypeInfo::string_type().name() == "string");
    CHECK(TypeInfo::string_type(3U).name() == "string(3)");
    CHECK(TypeInfo::bool_type().name() == "bool");
    CHECK(TypeInfo::string_type(3U).kind() == TypeKind::String);
    CHECK(TypeInfo::string_type(3U) != TypeInfo::string_type(4U));
}

TEST_CASE("TypeInfo from_scalar enforces kind and range")
{
    const auto tiny = TypeInfo::int_type(8U);
    CHECK(tiny.from_scalar(ScalarValue{std::int64_t{127}}).has_value());
    CHECK(tiny.from_scalar(ScalarValue{std::int64_t{-128}}).has_value());
    CHECK_FALSE(tiny.from_scalar(ScalarValue{std::int64_t{128}}).has_value());
    CHECK_FALSE(tiny.from_scalar(ScalarValue{std::string{"1"}}).has_value());
    CHECK_FALSE(tiny.from_scalar(ScalarValue{}).has_value());

    const auto small_unsigned = TypeInfo::uint_type(16U);
    CHECK(small_unsigned.from_scalar(ScalarValue{std::uint64_t{65535U}}).has_value());
    CHECK_FALSE(small_unsigned.from_scalar(ScalarValue{std::uint64_t{65536U}}).has_value());
    CHECK_FALSE(small_unsigned.from_scalar(ScalarValue{std::int64_t{1}}).has_value());

    const auto bounded = TypeInfo::string_type(3U);
    CHECK(bounded.from_scalar(ScalarValue{std::string{"abc"}}).has_value());
    CHECK_FALSE(bounded.from_scalar(ScalarValue{std::string{"abcd"}}).has_value());

    const auto single = TypeInfo::float_type(32U);
    CHECK_FALSE(single.from_scalar(ScalarValue{std::numeric_limits<double>::max()}).has_value());
    auto rounded = single.from_scalar(ScalarValue{0.1});
    REQUIRE(rounded.has_value());
    CHECK(rounded->as_float() == static_cast<double>(0.1F));

    CHECK(TypeInfo::bool_type().from_scalar(ScalarValue{false})->as_bool() == false);
}

TEST_CASE("TypeInfo to_scalar returns the stored value in external form")
{
    const auto type = TypeInfo::int_type();
    auto scalar = type.to_scalar(StoredValue::from_int(42));
    REQUIRE(scalar.has_value());
    CHECK(std::get<std::int64_t>(*scalar) == 42);

    CHECK_FALSE(type.to_scalar(StoredValue::from_string("42")).has_value());
    CHECK_FALSE(TypeInfo::int_type(8U).to_scalar(StoredValue::from_int(1000)).has_value());
}

TEST_CASE("TypeInfo parses and formats literals")
{
    CHECK(TypeInfo::int_type().parse_literal(" 17 ") == StoredValue::from_int(17));
    CHECK_FALSE(TypeInfo::int_type().parse_literal("17x").has_value());
    CHECK_FALSE(TypeInfo::int_type(8U).parse_literal("300").has_value());
    CHECK(TypeInfo::uint_type().parse_literal("9") == StoredValue::from_uint(9U));
    CHECK(TypeInfo::float_type().parse_literal("1.5") == StoredValue::from_float(1.5));
    CHECK(TypeInfo::string_type().parse_literal("'unknown'") == StoredValue::from_string("unknown"));
    CHECK(TypeInfo::string_type().parse_literal("plain") == StoredValue::from_string("plain"));
    CHECK(TypeInfo::bool_type().parse_literal("TRUE") == StoredValue::from_bool(true));
    CHECK(TypeInfo::bool_type().parse_literal("0") == StoredValue::from_bool(false));
    CHECK_FALSE(TypeInfo::bool_type().parse_literal("maybe").has_value());

    CHECK(TypeInfo::int_type().format_value(StoredValue::from_int(-3)) == std::string{"-3"});
    CHECK(TypeInfo::float_type().format_value(StoredValue::from_float(4.5)) == std::string{"4.5"});
    CHECK(TypeInfo::bool_type().format_value(StoredValue::from_bool(true)) == std::string{"true"});
    CHECK_FALSE(TypeInfo::bool_type().format_value(StoredValue::from_int(1)).has_value());
}

TEST_CASE("describe_scalar names the value and its kind")
{
    using tagstore::schema::describe_scalar;
    CHECK(describe_scalar(ScalarValue{}) == "NULL");
    CHECK(describe_scalar(ScalarValue{std::int64_t{7}}) == "int 7");
    CHECK(describe_scalar(ScalarValue{std::string{"x"}}) == "string 'x'");
}
