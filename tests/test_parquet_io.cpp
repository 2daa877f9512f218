#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "statement.hpp"
#include "io/parquet_reader.hpp"
#include <filesystem>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

using namespace fairvalue;

#ifdef HAVE_ARROW

namespace {

// Two quarterly income rows with a numeric, an integer and a text column
void write_income_parquet(const std::string& path) {
    arrow::Int64Builder year_builder;
    arrow::DoubleBuilder revenue_builder;
    arrow::StringBuilder profit_builder;

    REQUIRE(year_builder.Append(2024).ok());
    REQUIRE(year_builder.Append(2024).ok());
    REQUIRE(revenue_builder.Append(300.0).ok());
    REQUIRE(revenue_builder.AppendNull().ok());
    REQUIRE(profit_builder.Append("45").ok());
    REQUIRE(profit_builder.Append("n/a").ok());

    std::shared_ptr<arrow::Array> years;
    std::shared_ptr<arrow::Array> revenues;
    std::shared_ptr<arrow::Array> profits;
    REQUIRE(year_builder.Finish(&years).ok());
    REQUIRE(revenue_builder.Finish(&revenues).ok());
    REQUIRE(profit_builder.Finish(&profits).ok());

    auto schema = arrow::schema({
        arrow::field("Meta::yearReport", arrow::int64()),
        arrow::field("Revenue (Bn. VND)", arrow::float64()),
        arrow::field("Net Profit For the Year", arrow::utf8())
    });
    auto table = arrow::Table::Make(schema, {years, revenues, profits});

    auto outfile = arrow::io::FileOutputStream::Open(path);
    REQUIRE(outfile.ok());
    REQUIRE(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *outfile, 1024).ok());
    REQUIRE((*outfile)->Close().ok());
}

} // anonymous namespace

TEST_CASE("Parquet I/O - statement table load", "[parquet][io]") {
    const std::string path = "test_income_statement.parquet";
    std::filesystem::remove(path);
    write_income_parquet(path);

    StatementTable table = StatementTable::load(path);

    REQUIRE(table.column_count() == 3);
    REQUIRE(table.period_count() == 2);

    SECTION("Nested labels are split on the separator") {
        REQUIRE(table.column(0).category == "Meta");
        REQUIRE(table.column(0).name == "yearReport");
        REQUIRE_FALSE(table.column(1).is_nested());
    }

    SECTION("Cells keep their type") {
        REQUIRE(std::get<double>(table.cell(0, 0)) == 2024.0);
        REQUIRE(std::get<double>(table.cell(0, 1)) == 300.0);
        REQUIRE(is_missing(table.cell(1, 1)));
        REQUIRE(std::get<double>(table.cell(0, 2)) == 45.0);
        REQUIRE(std::get<std::string>(table.cell(1, 2)) == "n/a");
    }

    std::filesystem::remove(path);
}

TEST_CASE("Parquet I/O - missing file", "[parquet][io]") {
    REQUIRE_THROWS_AS(StatementTable::load_from_parquet("nonexistent.parquet"), std::runtime_error);
}

#else // !HAVE_ARROW

TEST_CASE("Parquet I/O - unavailable without Arrow", "[parquet][io]") {
    REQUIRE_THROWS_WITH(StatementTable::load("statements.parquet"),
                        Catch::Matchers::ContainsSubstring("Arrow not available"));
}

#endif // HAVE_ARROW
