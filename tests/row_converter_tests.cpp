#include "tagstore/row/row_converter.hpp"
#include "tagstore/row/tag_mapping.hpp"
#include "tagstore/schema/conversion_telemetry.hpp"
#include "tagstore/schema/schema_errors.hpp"

#include "test_schemas.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <utility>

using namespace tagstore::schema;
using tagstore::row::RowConverter;
using tagstore::row::TaggedRow;
using tagstore::row::TaggedValues;
using tagstore::row::TagMapping;
using tagstore::testing::capture_error_column;
using tagstore::testing::capture_schema_error;
using tagstore::testing::key_column;
using tagstore::testing::make_people_schema;
using tagstore::testing::make_person;
using tagstore::testing::value_column;

namespace {

[[nodiscard]] std::shared_ptr<const Schema> make_versioned_source()
{
    return Schema::make_keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("age", 4U, TypeInfo::int_type()),
    }});
}

[[nodiscard]] std::shared_ptr<const Schema> make_versioned_destination()
{
    return Schema::make_keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("age", 4U, TypeInfo::int_type()),
        value_column("rating", 6U, TypeInfo::float_type()),
    }});
}

[[nodiscard]] TaggedRow make_versioned_row(const std::shared_ptr<const Schema>& schema)
{
    TaggedValues values;
    values.emplace(ColumnTag{0U}, StoredValue::from_int(5));
    values.emplace(ColumnTag{4U}, StoredValue::from_int(40));
    return TaggedRow::create(schema, std::move(values));
}

}  // namespace

TEST_CASE("Row converter carries values across schema versions by name")
{
    const auto source = make_versioned_source();
    const auto destination = make_versioned_destination();
    const RowConverter converter{TagMapping::by_name(source, destination)};

    const auto converted = converter.convert(make_versioned_row(source));

    CHECK(&converted.schema() == destination.get());
    CHECK(converted.size() == 2U);
    CHECK(converted.value(ColumnTag{0U})->as_int() == 5);
    CHECK(converted.value(ColumnTag{4U})->as_int() == 40);
    CHECK(converted.is_null(ColumnTag{6U}));
}

TEST_CASE("Row converter with an identity mapping reproduces the row")
{
    const auto people = make_people_schema();
    const RowConverter converter{TagMapping::identity(people)};

    const auto original = make_person(people, 3, "Bart", "Simpson", false, 10, 1.5);
    CHECK(converter.convert(original) == original);
}

TEST_CASE("Row converter moves values between differently tagged schemas")
{
    const auto people = make_people_schema();
    const auto renumbered = Schema::make_keyed(ColumnCollection{{
        key_column("id", 20U, TypeInfo::int_type()),
        value_column("age", 21U, TypeInfo::int_type()),
    }});

    const RowConverter converter{TagMapping::by_name(people, renumbered)};
    const auto converted = converter.convert(make_person(people, 9, "Lisa", "Simpson", false, 8, 9.5));

    CHECK(converted.size() == 2U);
    CHECK(converted.value(ColumnTag{20U})->as_int() == 9);
    CHECK(converted.value(ColumnTag{21U})->as_int() == 8);
}

TEST_CASE("Row converter fails when a non-nullable destination column has no source")
{
    const auto source = make_versioned_source();
    const auto destination = Schema::make_keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("age", 4U, TypeInfo::int_type()),
        value_column("rating", 6U, TypeInfo::float_type(), false),
    }});

    ConversionTelemetry telemetry;
    const RowConverter converter{TagMapping::by_name(source, destination),
                                 {RowConverter::MissingColumnPolicy::Null, &telemetry}};
    const auto row = make_versioned_row(source);
    const auto convert = [&] { (void)converter.convert(row); };

    CHECK(capture_schema_error(convert) == SchemaErrc::NonNullableColumnMissing);
    CHECK(capture_schema_error(convert) == SchemaErrorKind::NonNullableViolation);
    CHECK(capture_error_column(convert) == "rating");
    CHECK(telemetry.snapshot().row_mapping_failures == 3U);
    CHECK(telemetry.snapshot().rows_mapped == 0U);
}

TEST_CASE("Row converter succeeds once the non-nullable value is present")
{
    const auto source = make_versioned_destination();
    const auto destination = Schema::make_keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("rating", 6U, TypeInfo::float_type(), false),
    }});

    TaggedValues values;
    values.emplace(ColumnTag{0U}, StoredValue::from_int(5));
    values.emplace(ColumnTag{6U}, StoredValue::from_float(4.0));
    const auto row = TaggedRow::create(source, std::move(values));

    const RowConverter converter{TagMapping::by_name(source, destination)};
    const auto converted = converter.convert(row);
    CHECK(converted.value(ColumnTag{6U})->as_float() == 4.0);
}

TEST_CASE("Row converter fills unmapped columns from literal defaults")
{
    const auto source = make_versioned_source();

    ColumnOptions rating_options = tagstore::testing::not_null();
    rating_options.default_value = "2.5";
    ColumnOptions status_options{};
    status_options.default_value = "now()";

    const auto destination = Schema::make_keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("age", 4U, TypeInfo::int_type()),
        Column{"rating", ColumnTag{6U}, TypeInfo::float_type(), false, rating_options},
        Column{"status", ColumnTag{7U}, TypeInfo::int_type(), false, status_options},
    }});

    ConversionTelemetry telemetry;
    RowConverter::Config config{};
    config.missing_policy = RowConverter::MissingColumnPolicy::Default;
    config.telemetry = &telemetry;
    const RowConverter converter{TagMapping::by_name(source, destination), config};

    const auto converted = converter.convert(make_versioned_row(source));
    CHECK(converted.value(ColumnTag{6U})->as_float() == 2.5);
    CHECK(converted.is_null(ColumnTag{7U}));

    const auto snapshot = telemetry.snapshot();
    CHECK(snapshot.rows_mapped == 1U);
    CHECK(snapshot.values_copied == 2U);
    CHECK(snapshot.defaults_applied == 1U);
    CHECK(snapshot.nulls_omitted == 1U);

    // Without the default policy the same destination rejects the row.
    const RowConverter strict{TagMapping::by_name(source, destination)};
    CHECK(capture_schema_error([&] { (void)strict.convert(make_versioned_row(source)); })
          == SchemaErrc::NonNullableColumnMissing);
}

TEST_CASE("Row converter rejects mappings between incompatible types")
{
    const auto source = make_versioned_source();
    const auto destination = Schema::make_keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("age", 4U, TypeInfo::string_type()),
    }});

    const auto build = [&] { (void)RowConverter{TagMapping::by_name(source, destination)}; };
    CHECK(capture_schema_error(build) == SchemaErrc::TypeMismatch);
    CHECK(capture_schema_error(build) == SchemaErrorKind::ValueConversionFailure);
    CHECK(capture_error_column(build) == "age");
}

TEST_CASE("Row converter rejects rows built against another schema")
{
    const auto source = make_versioned_source();
    const RowConverter converter{TagMapping::by_name(source, make_versioned_destination())};

    const auto people = make_people_schema();
    const auto stranger = make_person(people, 1, "Ned", "Flanders", true, 60, 7.0);
    CHECK(capture_schema_error([&] { (void)converter.convert(stranger); }) == SchemaErrc::UnknownTag);
}

TEST_CASE("Row converter rejects values that overflow the destination width")
{
    const auto source = make_versioned_source();
    const auto destination = Schema::make_keyed(ColumnCollection{{
        key_column("id", 0U, TypeInfo::int_type()),
        value_column("age", 4U, TypeInfo::int_type(8U)),
    }});
    const RowConverter converter{TagMapping::by_name(source, destination)};

    TaggedValues values;
    values.emplace(ColumnTag{0U}, StoredValue::from_int(1));
    values.emplace(ColumnTag{4U}, StoredValue::from_int(300));
    const auto row = TaggedRow::create(source, std::move(values));

    const auto convert = [&] { (void)converter.convert(row); };
    CHECK(capture_schema_error(convert) == SchemaErrc::ValueConversionFailed);
    CHECK(capture_error_column(convert) == "age");

    CHECK(converter.convert(make_versioned_row(source)).value(ColumnTag{4U})->as_int() == 40);
}
