#include "tagstore/exporter/json_row_writer.hpp"
#include "tagstore/row/row_converter.hpp"
#include "tagstore/row/tag_mapping.hpp"
#include "tagstore/row/tagged_row.hpp"
#include "tagstore/schema/column.hpp"
#include "tagstore/schema/conversion_telemetry.hpp"
#include "tagstore/schema/schema.hpp"
#include "tagstore/sql/sql_convert.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;
using ColumnTag = tagstore::schema::ColumnTag;
using ConversionTelemetry = tagstore::schema::ConversionTelemetry;
using ExternalRow = tagstore::sql::ExternalRow;
using Schema = tagstore::schema::Schema;
using SchemaPtr = std::shared_ptr<const Schema>;
using TaggedRow = tagstore::row::TaggedRow;
using TypeInfo = tagstore::schema::TypeInfo;

struct BenchmarkOptions final {
    std::string scenario = "all";
    std::size_t samples = 5U;
    std::size_t warmups = 1U;
    std::size_t rows = 50000U;
    double null_fraction = 0.25;
    bool json_output = false;
};

[[noreturn]] void usage()
{
    std::cerr << "Usage: tagstore_row_benchmarks [options]\n"
              << "  --scenario=name           Scenario to run (all, import, export, convert, json_export)\n"
              << "  --samples=N              Measured iterations per scenario (default 5)\n"
              << "  --warmups=N              Warm-up iterations before measuring (default 1)\n"
              << "  --rows=N                 Rows converted per iteration (default 50000)\n"
              << "  --null-fraction=X        Fraction [0,1] of nullable values left NULL (default 0.25)\n"
              << "  --json                   Emit JSON instead of table output\n"
              << "  --help                   Show this message\n";
    std::exit(1);
}

std::size_t parse_size(std::string_view value, std::string_view option)
{
    std::size_t result = 0U;
    const auto* begin = value.data();
    const auto* end = value.data() + value.size();
    if (auto [ptr, ec] = std::from_chars(begin, end, result); ec != std::errc{} || ptr != end) {
        throw std::invalid_argument(std::string{"Invalid value for "} + std::string(option));
    }
    return result;
}

double parse_double(std::string_view value, std::string_view option)
{
    std::string buffer(value);
    std::size_t processed = 0U;
    double result = 0.0;
    try {
        result = std::stod(buffer, &processed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string{"Invalid value for "} + std::string(option));
    }

    if (processed != buffer.size()) {
        throw std::invalid_argument(std::string{"Invalid value for "} + std::string(option));
    }

    return result;
}

BenchmarkOptions parse_options(int argc, char** argv)
{
    BenchmarkOptions options{};
    for (int index = 1; index < argc; ++index) {
        std::string_view argument{argv[index]};
        if (argument == "--json") {
            options.json_output = true;
        } else if (argument == "--help") {
            usage();
        } else if (argument.rfind("--scenario=", 0) == 0) {
            options.scenario = std::string(argument.substr(11));
        } else if (argument.rfind("--samples=", 0) == 0) {
            options.samples = parse_size(argument.substr(10), "--samples");
        } else if (argument.rfind("--warmups=", 0) == 0) {
            options.warmups = parse_size(argument.substr(10), "--warmups");
        } else if (argument.rfind("--rows=", 0) == 0) {
            options.rows = parse_size(argument.substr(7), "--rows");
        } else if (argument.rfind("--null-fraction=", 0) == 0) {
            options.null_fraction = parse_double(argument.substr(16), "--null-fraction");
        } else {
            usage();
        }
    }

    options.samples = std::max<std::size_t>(options.samples, 1U);
    options.rows = std::max<std::size_t>(options.rows, 1U);
    options.null_fraction = std::clamp(options.null_fraction, 0.0, 1.0);

    return options;
}

tagstore::schema::Column make_column(std::string name, std::uint64_t tag, TypeInfo type, bool key)
{
    tagstore::schema::ColumnOptions options{};
    if (key) {
        options.constraints.push_back(tagstore::schema::ColumnConstraint::NotNull);
    }
    return tagstore::schema::Column{std::move(name), ColumnTag{tag}, type, key, std::move(options)};
}

// Table as it was before an ALTER added the rating column.
SchemaPtr make_source_schema()
{
    return Schema::make_keyed(tagstore::schema::ColumnCollection{{
        make_column("id", 0U, TypeInfo::int_type(), true),
        make_column("first", 1U, TypeInfo::string_type(), false),
        make_column("last", 2U, TypeInfo::string_type(), false),
        make_column("is_married", 3U, TypeInfo::bool_type(), false),
        make_column("age", 4U, TypeInfo::int_type(), false),
    }});
}

SchemaPtr make_destination_schema()
{
    return Schema::make_keyed(tagstore::schema::ColumnCollection{{
        make_column("id", 0U, TypeInfo::int_type(), true),
        make_column("first", 1U, TypeInfo::string_type(), false),
        make_column("last", 2U, TypeInfo::string_type(), false),
        make_column("is_married", 3U, TypeInfo::bool_type(), false),
        make_column("age", 4U, TypeInfo::int_type(), false),
        make_column("rating", 6U, TypeInfo::float_type(), false),
    }});
}

std::vector<ExternalRow> make_external_rows(const BenchmarkOptions& options)
{
    const auto null_every = options.null_fraction > 0.0
                                ? std::max<std::size_t>(static_cast<std::size_t>(std::lround(1.0 / options.null_fraction)), 1U)
                                : 0U;

    std::vector<ExternalRow> rows;
    rows.reserve(options.rows);
    for (std::size_t index = 0; index < options.rows; ++index) {
        const bool leave_null = null_every != 0U && index % null_every == 0U;
        ExternalRow row;
        row.reserve(5U);
        row.emplace_back(static_cast<std::int64_t>(index));
        row.emplace_back("first_" + std::to_string(index % 1024U));
        if (leave_null) {
            row.emplace_back(std::monostate{});
            row.emplace_back(std::monostate{});
            row.emplace_back(std::monostate{});
        } else {
            row.emplace_back("last_" + std::to_string(index % 4096U));
            row.emplace_back(index % 2U == 0U);
            row.emplace_back(static_cast<std::int64_t>(index % 100U));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

struct ConversionFixture final {
    SchemaPtr source;
    SchemaPtr destination;
    std::vector<ExternalRow> external_rows;
    std::vector<TaggedRow> source_rows;
    std::vector<TaggedRow> destination_rows;
    ConversionTelemetry telemetry;
};

using FixturePtr = std::unique_ptr<ConversionFixture>;

FixturePtr make_fixture(const BenchmarkOptions& options)
{
    auto fixture = std::make_unique<ConversionFixture>();
    fixture->source = make_source_schema();
    fixture->destination = make_destination_schema();
    fixture->external_rows = make_external_rows(options);

    const tagstore::row::RowConverter converter{tagstore::row::TagMapping::by_name(fixture->source, fixture->destination)};
    fixture->source_rows.reserve(fixture->external_rows.size());
    fixture->destination_rows.reserve(fixture->external_rows.size());
    for (const auto& external : fixture->external_rows) {
        fixture->source_rows.push_back(tagstore::sql::to_tagged_row(external, fixture->source));
        fixture->destination_rows.push_back(converter.convert(fixture->source_rows.back()));
    }
    return fixture;
}

using ScenarioRunner = std::uint64_t (*)(ConversionFixture&);

std::uint64_t run_import(ConversionFixture& fixture)
{
    std::uint64_t produced = 0U;
    for (const auto& external : fixture.external_rows) {
        auto row = tagstore::sql::to_tagged_row(external, fixture.source, &fixture.telemetry);
        produced += row.size() != 0U ? 1U : 0U;
    }
    return produced;
}

std::uint64_t run_export(ConversionFixture& fixture)
{
    std::uint64_t produced = 0U;
    for (const auto& row : fixture.destination_rows) {
        auto external = tagstore::sql::to_external_row(row, &fixture.telemetry);
        produced += external.empty() ? 0U : 1U;
    }
    return produced;
}

std::uint64_t run_convert(ConversionFixture& fixture)
{
    tagstore::row::RowConverter::Config config{};
    config.telemetry = &fixture.telemetry;
    const tagstore::row::RowConverter converter{
        tagstore::row::TagMapping::by_name(fixture.source, fixture.destination), config};

    std::uint64_t produced = 0U;
    for (const auto& row : fixture.source_rows) {
        auto converted = converter.convert(row);
        produced += converted.size() != 0U ? 1U : 0U;
    }
    return produced;
}

std::uint64_t run_json_export(ConversionFixture& fixture)
{
    std::ostringstream output;
    tagstore::exporter::JsonRowWriter::Config config{};
    config.output = &output;
    config.telemetry = &fixture.telemetry;
    tagstore::exporter::JsonRowWriter writer{tagstore::sql::from_schema("people", *fixture.destination), config};

    for (const auto& row : fixture.destination_rows) {
        if (auto ec = writer.write_row(tagstore::sql::to_external_row(row)); ec) {
            throw std::system_error(ec, "json export failed");
        }
    }
    if (auto ec = writer.close(); ec) {
        throw std::system_error(ec, "json export failed to close");
    }
    return writer.rows_written();
}

struct ScenarioDefinition final {
    std::string name;
    ScenarioRunner runner;
};

const std::vector<ScenarioDefinition> kScenarios = {
    {"import", &run_import},
    {"export", &run_export},
    {"convert", &run_convert},
    {"json_export", &run_json_export},
};

struct SampleResult final {
    double elapsed_ms = 0.0;
    std::uint64_t rows = 0U;
};

struct BenchmarkResult final {
    std::string name;
    std::vector<double> samples_ms;
    std::uint64_t rows_per_iteration = 0U;
};

SampleResult run_iteration(const ScenarioDefinition& scenario, ConversionFixture& fixture)
{
    fixture.telemetry.reset();

    const auto start = Clock::now();
    const auto produced = scenario.runner(fixture);
    const auto end = Clock::now();

    SampleResult sample{};
    sample.rows = produced;
    sample.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return sample;
}

BenchmarkResult run_benchmark(const ScenarioDefinition& scenario, ConversionFixture& fixture, const BenchmarkOptions& options)
{
    const std::size_t total_iterations = options.samples + options.warmups;
    BenchmarkResult result{};
    result.name = scenario.name;
    result.samples_ms.reserve(options.samples);

    for (std::size_t iteration = 0; iteration < total_iterations; ++iteration) {
        auto sample = run_iteration(scenario, fixture);
        if (iteration < options.warmups) {
            continue;
        }
        if (result.rows_per_iteration == 0U) {
            result.rows_per_iteration = sample.rows;
        } else if (result.rows_per_iteration != sample.rows) {
            throw std::runtime_error("Row count varied between iterations for scenario " + scenario.name);
        }
        result.samples_ms.push_back(sample.elapsed_ms);
    }

    return result;
}

struct Summary final {
    double mean_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
    double p95_ms = 0.0;
};

Summary summarise(const std::vector<double>& samples)
{
    if (samples.empty()) {
        return {};
    }

    Summary summary{};
    summary.min_ms = *std::min_element(samples.begin(), samples.end());
    summary.max_ms = *std::max_element(samples.begin(), samples.end());
    summary.mean_ms = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());

    auto sorted = samples;
    std::sort(sorted.begin(), sorted.end());
    const auto index = static_cast<std::size_t>(std::ceil(0.95 * static_cast<double>(sorted.size()))) - 1U;
    summary.p95_ms = sorted[std::min(index, sorted.size() - 1U)];
    return summary;
}

double rows_per_second(const BenchmarkResult& result, const Summary& summary)
{
    return summary.mean_ms > 0.0 ? static_cast<double>(result.rows_per_iteration) / (summary.mean_ms / 1000.0) : 0.0;
}

void print_table(const std::vector<BenchmarkResult>& results)
{
    std::cout << std::left << std::setw(16) << "Scenario"
              << std::right << std::setw(10) << "Samples"
              << std::setw(14) << "Rows"
              << std::setw(14) << "Mean (ms)"
              << std::setw(14) << "Rows/s"
              << std::setw(14) << "Min (ms)"
              << std::setw(14) << "Max (ms)"
              << std::setw(14) << "P95 (ms)" << '\n';

    for (const auto& result : results) {
        auto summary = summarise(result.samples_ms);
        std::cout << std::left << std::setw(16) << result.name
                  << std::right << std::setw(10) << result.samples_ms.size()
                  << std::setw(14) << result.rows_per_iteration
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.mean_ms
                  << std::setw(14) << std::fixed << std::setprecision(0) << rows_per_second(result, summary)
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.min_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.max_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.p95_ms
                  << '\n';
        std::cout << std::defaultfloat;
    }
}

void print_json(const std::vector<BenchmarkResult>& results)
{
    std::cout << "{\"benchmarks\":[";
    for (std::size_t index = 0; index < results.size(); ++index) {
        const auto& result = results[index];
        auto summary = summarise(result.samples_ms);
        if (index > 0) {
            std::cout << ',';
        }
        std::cout << "{\"name\":\"" << result.name << "\""
                  << ",\"samples\":" << result.samples_ms.size()
                  << ",\"rows\":" << result.rows_per_iteration
                  << ",\"mean_ms\":" << std::fixed << std::setprecision(3) << summary.mean_ms
                  << ",\"min_ms\":" << std::fixed << std::setprecision(3) << summary.min_ms
                  << ",\"max_ms\":" << std::fixed << std::setprecision(3) << summary.max_ms
                  << ",\"p95_ms\":" << std::fixed << std::setprecision(3) << summary.p95_ms
                  << ",\"rows_per_second\":" << std::fixed << std::setprecision(0) << rows_per_second(result, summary)
                  << '}';
        std::cout << std::defaultfloat;
    }
    std::cout << "]}" << std::endl;
}

std::vector<const ScenarioDefinition*> select_scenarios(const BenchmarkOptions& options)
{
    std::vector<const ScenarioDefinition*> selected;
    for (const auto& scenario : kScenarios) {
        if (options.scenario == "all" || scenario.name == options.scenario) {
            selected.push_back(&scenario);
        }
    }
    if (selected.empty()) {
        throw std::runtime_error("Unknown scenario: " + options.scenario);
    }
    return selected;
}

}  // namespace

int main(int argc, char** argv)
{
    try {
        const auto options = parse_options(argc, argv);
        const auto scenarios = select_scenarios(options);
        auto fixture = make_fixture(options);

        std::vector<BenchmarkResult> results;
        results.reserve(scenarios.size());

        for (const auto* scenario : scenarios) {
            results.push_back(run_benchmark(*scenario, *fixture, options));
        }

        if (options.json_output) {
            print_json(results);
        } else {
            print_table(results);
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Row conversion benchmark failed: " << ex.what() << '\n';
        return 1;
    }
}
