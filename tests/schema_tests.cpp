#include "tagstore/schema/schema.hpp"
#include "tagstore/schema/schema_errors.hpp"

#include "test_schemas.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tagstore::schema;
using tagstore::testing::capture_error_column;
using tagstore::testing::capture_schema_error;
using tagstore::testing::key_column;
using tagstore::testing::make_people_schema;
using tagstore::testing::value_column;

TEST_CASE("Keyed schema partitions key and non-key columns")
{
    const auto people = make_people_schema();

    CHECK(people->all_columns().size() == 6U);
    REQUIRE(people->primary_key_columns().size() == 1U);
    CHECK(people->primary_key_columns().at(0U).name() == "id");
    CHECK(people->non_key_columns().size() == 5U);
    CHECK(people->non_key_columns().find(ColumnTag{0U}) == nullptr);
    CHECK_FALSE(people->is_keyless());
    CHECK_NOTHROW(people->validate_for_insert());
}

TEST_CASE("Keyed schema rejects a nullable primary key column")
{
    const auto build = [] {
        (void)Schema::keyed(ColumnCollection{{
            Column{"id", ColumnTag{0U}, TypeInfo::int_type(), true},
            value_column("name", 1U, TypeInfo::string_type()),
        }});
    };

    CHECK(capture_schema_error(build) == SchemaErrc::NullablePrimaryKey);
    CHECK(capture_schema_error(build) == SchemaErrorKind::SchemaInvariantViolation);
    CHECK(capture_error_column(build) == "id");
}

TEST_CASE("Schemas allow at most one auto increment column")
{
    ColumnOptions auto_increment = tagstore::testing::not_null();
    auto_increment.auto_increment = true;

    ColumnCollection columns{{
        Column{"id", ColumnTag{0U}, TypeInfo::int_type(), true, auto_increment},
        Column{"seq", ColumnTag{1U}, TypeInfo::int_type(), false, auto_increment},
    }};

    CHECK(capture_schema_error([&] { (void)Schema::keyed(columns); }) == SchemaErrc::MultipleAutoIncrement);
    CHECK(capture_schema_error([&] { (void)Schema::unkeyed(columns); }) == SchemaErrc::MultipleAutoIncrement);
}

TEST_CASE("Unkeyed schema clears primary key flags")
{
    const auto people = make_people_schema();
    const auto result = Schema::make_unkeyed(people->all_columns());

    CHECK(result->is_keyless());
    CHECK(result->primary_key_columns().empty());
    CHECK(result->non_key_columns().size() == 6U);
    CHECK_FALSE(result->all_columns().at(0U).is_part_of_primary_key());
    CHECK(result->all_columns().at(0U).tag() == ColumnTag{0U});
}

TEST_CASE("Insert validation requires a primary key")
{
    const auto keyless = Schema::keyed(ColumnCollection{{value_column("name", 1U, TypeInfo::string_type())}});
    CHECK(keyless.is_keyless());
    CHECK(capture_schema_error([&] { keyless.validate_for_insert(); }) == SchemaErrc::MissingPrimaryKey);
}

TEST_CASE("Insert validation rejects names that differ only by case")
{
    const auto schema = Schema::keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("Name", 1U, TypeInfo::string_type()),
        value_column("name", 2U, TypeInfo::string_type()),
    }});

    const auto validate = [&] { schema.validate_for_insert(); };
    CHECK(capture_schema_error(validate) == SchemaErrc::CaseInsensitiveNameCollision);
    CHECK(capture_schema_error(validate) == SchemaErrorKind::DuplicateIdentity);
    CHECK(capture_error_column(validate) == "name");
}

TEST_CASE("Schema equality compares every column")
{
    const auto lhs = make_people_schema();
    const auto rhs = make_people_schema();
    CHECK(*lhs == *rhs);

    const auto renamed = Schema::keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("first_name", 1U, TypeInfo::string_type(), false),
    }});
    CHECK(*lhs != renamed);
}
