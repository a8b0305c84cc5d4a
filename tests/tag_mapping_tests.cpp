#include "tagstore/row/tag_mapping.hpp"
#include "tagstore/schema/schema_errors.hpp"

#include "test_schemas.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>
#include <vector>

using namespace tagstore::schema;
using tagstore::row::TagMapping;
using tagstore::row::TagPair;
using tagstore::testing::capture_error_column;
using tagstore::testing::capture_schema_error;
using tagstore::testing::key_column;
using tagstore::testing::make_people_schema;
using tagstore::testing::value_column;

namespace {

// Same column names as people, but retagged and reordered as an independently created table would be.
[[nodiscard]] std::shared_ptr<const Schema> make_imported_people_schema()
{
    return Schema::make_keyed(ColumnCollection{{
        key_column("id", 10U, TypeInfo::int_type()),
        value_column("age", 11U, TypeInfo::int_type()),
        value_column("first", 12U, TypeInfo::string_type(), false),
        value_column("nickname", 13U, TypeInfo::string_type()),
    }});
}

}  // namespace

TEST_CASE("Identity mapping pairs every tag with itself")
{
    const auto people = make_people_schema();
    const auto mapping = TagMapping::identity(people);

    CHECK(mapping.size() == 6U);
    CHECK(mapping.is_identity());
    CHECK(mapping.destination_of(ColumnTag{6U}) == ColumnTag{6U});
    CHECK(&mapping.destination_schema() == people.get());
    CHECK_THROWS_AS(TagMapping::identity(nullptr), std::invalid_argument);
}

TEST_CASE("Name mapping matches columns case-sensitively in source order")
{
    const auto mapping = TagMapping::by_name(make_people_schema(), make_imported_people_schema());

    const std::vector<TagPair> expected{
        {ColumnTag{0U}, ColumnTag{10U}},
        {ColumnTag{1U}, ColumnTag{12U}},
        {ColumnTag{4U}, ColumnTag{11U}},
    };
    CHECK(mapping.pairs() == expected);
    CHECK_FALSE(mapping.is_identity());
    CHECK(mapping.source_of(ColumnTag{12U}) == ColumnTag{1U});
    CHECK_FALSE(mapping.source_of(ColumnTag{13U}).has_value());
    CHECK_FALSE(mapping.destination_of(ColumnTag{2U}).has_value());
}

TEST_CASE("Explicit pairs override name matches")
{
    TagMapping::Options options{};
    // Map source "first" onto destination "nickname"; destination "first" is then left unmatched.
    options.explicit_pairs = {{ColumnTag{1U}, ColumnTag{13U}}};

    const auto mapping = TagMapping::build(make_people_schema(), make_imported_people_schema(), options);

    CHECK(mapping.destination_of(ColumnTag{1U}) == ColumnTag{13U});
    CHECK_FALSE(mapping.source_of(ColumnTag{12U}).has_value());
    CHECK(mapping.destination_of(ColumnTag{0U}) == ColumnTag{10U});
    CHECK(mapping.size() == 3U);
}

TEST_CASE("Explicit pairs that claim a name-matched destination take precedence")
{
    TagMapping::Options options{};
    // Source "last" claims destination "first", so source "first" must not also map onto it.
    options.explicit_pairs = {{ColumnTag{2U}, ColumnTag{12U}}};

    const auto mapping = TagMapping::build(make_people_schema(), make_imported_people_schema(), options);
    CHECK(mapping.source_of(ColumnTag{12U}) == ColumnTag{2U});
    CHECK_FALSE(mapping.destination_of(ColumnTag{1U}).has_value());
}

TEST_CASE("Explicit pairs must reference existing tags")
{
    const auto source = make_people_schema();
    const auto destination = make_imported_people_schema();

    const auto unknown_source = [&] {
        (void)TagMapping::from_pairs(source, destination, {{ColumnTag{5U}, ColumnTag{10U}}});
    };
    CHECK(capture_schema_error(unknown_source) == SchemaErrc::UnknownTag);
    CHECK(capture_schema_error(unknown_source) == SchemaErrorKind::UnmappableColumn);

    CHECK(capture_schema_error([&] {
              (void)TagMapping::from_pairs(source, destination, {{ColumnTag{0U}, ColumnTag{99U}}});
          })
          == SchemaErrc::UnknownTag);
}

TEST_CASE("Two source tags may not share a destination")
{
    const auto source = make_people_schema();
    const auto destination = make_imported_people_schema();

    const auto build = [&] {
        (void)TagMapping::from_pairs(source,
                                     destination,
                                     {{ColumnTag{1U}, ColumnTag{12U}}, {ColumnTag{2U}, ColumnTag{12U}}});
    };
    CHECK(capture_schema_error(build) == SchemaErrc::DuplicateMappingTarget);
    CHECK(capture_error_column(build) == "first");
}

TEST_CASE("Mapping coverage requirements")
{
    const auto source = make_people_schema();
    const auto unrelated = Schema::make_keyed(ColumnCollection{{key_column("pk", 0U, TypeInfo::int_type())}});

    TagMapping::Options non_empty{};
    non_empty.coverage = TagMapping::Coverage::NonEmpty;
    const auto empty = [&] { (void)TagMapping::build(source, unrelated, non_empty); };
    CHECK(capture_schema_error(empty) == SchemaErrc::EmptyMapping);
    CHECK(capture_schema_error(empty) == SchemaErrorKind::UnmappableColumn);

    const auto partial = TagMapping::build(source, unrelated, TagMapping::Options{});
    CHECK(partial.empty());

    TagMapping::Options full{};
    full.coverage = TagMapping::Coverage::AllDestination;
    const auto incomplete = [&] { (void)TagMapping::build(source, make_imported_people_schema(), full); };
    CHECK(capture_schema_error(incomplete) == SchemaErrc::IncompleteMapping);
    CHECK(capture_error_column(incomplete) == "nickname");

    CHECK_NOTHROW(TagMapping::build(source, source, full));
}
