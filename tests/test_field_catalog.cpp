#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "config_parser.hpp"
#include "field_catalog.hpp"
#include <sstream>

using namespace fairvalue;
using Catch::Matchers::WithinRel;

namespace {

std::string data_path(const std::string& name) {
    return std::string(FAIRVALUE_TEST_DATA_DIR) + "/" + name;
}

StatementSet quarterly_statements() {
    StatementSet set;
    set.frequency = ReportingFrequency::Quarterly;

    set.income_statement = StatementTable::load_from_json(data_path("quarterly_income.json"));
    set.balance_sheet = StatementTable::load_from_json(data_path("quarterly_balance.json"));
    return set;
}

} // anonymous namespace

// ============================================================================
// Catalog contents
// ============================================================================

TEST_CASE("Default catalog covers the metrics the models need", "[catalog]") {
    FieldCatalog catalog = FieldCatalog::default_catalog();

    for (const char* name : {metric::NET_INCOME, metric::REVENUE, metric::EBIT,
                             metric::TOTAL_ASSETS, metric::TOTAL_LIABILITIES,
                             metric::DEPRECIATION, metric::CAPITAL_EXPENDITURE,
                             metric::EPS, metric::BOOK_VALUE_PER_SHARE, metric::ROE}) {
        INFO(name);
        REQUIRE(catalog.find(name) != nullptr);
    }

    const FieldSpec* revenue = catalog.find(metric::REVENUE);
    REQUIRE(revenue->statement == StatementKind::IncomeStatement);
    REQUIRE(revenue->kind == MetricKind::Flow);

    const FieldSpec* assets = catalog.find(metric::TOTAL_ASSETS);
    REQUIRE(assets->statement == StatementKind::BalanceSheet);
    REQUIRE(assets->kind == MetricKind::Stock);

    const FieldSpec* roe = catalog.find(metric::ROE);
    REQUIRE(roe->percent_scaled);
}

TEST_CASE("Default catalog tries EBITDA in the income statement first", "[catalog]") {
    FieldCatalog catalog = FieldCatalog::default_catalog();
    auto specs = catalog.find_all(metric::EBITDA);

    REQUIRE(specs.size() == 2);
    REQUIRE(specs[0]->statement == StatementKind::IncomeStatement);
    REQUIRE(specs[1]->statement == StatementKind::Ratios);
}

TEST_CASE("Default EBIT candidates do not pick up EBITDA", "[catalog]") {
    FieldCatalog catalog = FieldCatalog::default_catalog();

    StatementTable income({FieldLabel("EBITDA"), FieldLabel("Operating profit")});
    income.add_row({300.0, 250.0});

    REQUIRE(resolve(income, catalog.find(metric::EBIT)->candidates) == 250.0);
}

TEST_CASE("Default net income candidates ignore a bare year column", "[catalog]") {
    std::istringstream csv("Year,Revenue,Net income\n2024,1000,150\n");
    StatementSet set;
    set.income_statement = StatementTable::load_from_csv(csv);

    NormalizedMetrics metrics = extract_primitives(set, MarketData(), FieldCatalog::default_catalog());

    REQUIRE(metrics.get(metric::NET_INCOME) == 150.0);
    REQUIRE(metrics.get(metric::REVENUE) == 1000.0);
}

TEST_CASE("Default net income candidates do not pick up gross profit", "[catalog]") {
    std::istringstream csv("Revenue,Gross Profit,Net profit after tax\n1000,400,150\n");
    StatementSet set;
    set.income_statement = StatementTable::load_from_csv(csv);

    NormalizedMetrics metrics = extract_primitives(set, MarketData(), FieldCatalog::default_catalog());

    REQUIRE(metrics.get(metric::NET_INCOME) == 150.0);
    REQUIRE(metrics.get(metric::GROSS_PROFIT) == 400.0);
}

TEST_CASE("Default short candidates need an exact column name", "[catalog]") {
    FieldCatalog catalog = FieldCatalog::default_catalog();

    StatementTable balance({FieldLabel("Cash flow hedges"), FieldLabel("Cash")});
    balance.add_row({75.0, 120.0});
    REQUIRE(resolve(balance, catalog.find(metric::CASH)->candidates) == 120.0);

    StatementTable income({FieldLabel("EBITDA")});
    income.add_row({300.0});
    REQUIRE_FALSE(resolve(income, catalog.find(metric::EBIT)->candidates).has_value());
}

TEST_CASE("FieldCatalog add and remove", "[catalog]") {
    FieldCatalog catalog;

    catalog.add({"dividend_yield", StatementKind::Ratios, MetricKind::Stock, {"Dividend yield"}});
    catalog.add({"dividend_yield", StatementKind::CashFlow, MetricKind::Flow, {"Yield"}});
    REQUIRE(catalog.size() == 2);

    REQUIRE_THROWS_AS(catalog.add({"", StatementKind::Ratios, MetricKind::Stock, {"x"}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(catalog.add({"empty", StatementKind::Ratios, MetricKind::Stock, {}}),
                      std::invalid_argument);

    REQUIRE(catalog.remove("dividend_yield") == 2);
    REQUIRE(catalog.find("dividend_yield") == nullptr);
}

TEST_CASE("Metric kind names", "[catalog]") {
    REQUIRE(metric_kind_to_string(MetricKind::Flow) == "flow");
    REQUIRE(metric_kind_from_string("stock") == MetricKind::Stock);
    REQUIRE_THROWS_AS(metric_kind_from_string("balance"), std::invalid_argument);
}

// ============================================================================
// JSON overlay
// ============================================================================

TEST_CASE("FieldCatalog JSON overlay replaces named metrics only", "[catalog][config]") {
    FieldCatalog base = FieldCatalog::default_catalog();
    FieldCatalog catalog = FieldCatalog::load_from_json(data_path("field_catalog.json"));

    auto net_income = catalog.find_all(metric::NET_INCOME);
    REQUIRE(net_income.size() == 1);
    REQUIRE(net_income[0]->candidates == FieldCandidateList{"Profit after tax"});

    const FieldSpec* yield = catalog.find("dividend_yield");
    REQUIRE(yield != nullptr);
    REQUIRE(yield->statement == StatementKind::Ratios);
    REQUIRE(yield->percent_scaled);

    // Untouched metrics keep their built-in specs
    REQUIRE(catalog.find(metric::REVENUE)->candidates == base.find(metric::REVENUE)->candidates);
    REQUIRE(catalog.size() == base.size() + 1);
}

TEST_CASE("FieldCatalog JSON errors", "[catalog][config][error]") {
    FieldCatalog base;

    SECTION("Missing metrics object") {
        REQUIRE_THROWS_AS(FieldCatalog::parse_json(R"({"fields": {}})", base), ConfigParseError);
    }

    SECTION("Empty candidate list") {
        REQUIRE_THROWS_AS(FieldCatalog::parse_json(
            R"({"metrics": {"eps": {"statement": "ratios", "candidates": []}}})", base),
            ConfigParseError);
    }

    SECTION("Unknown statement") {
        REQUIRE_THROWS_WITH(FieldCatalog::parse_json(
            R"({"metrics": {"eps": {"statement": "notes", "candidates": ["EPS"]}}})", base),
            Catch::Matchers::ContainsSubstring("notes"));
    }

    SECTION("Unknown kind") {
        REQUIRE_THROWS_AS(FieldCatalog::parse_json(
            R"({"metrics": {"eps": {"statement": "ratios", "kind": "rate", "candidates": ["EPS"]}}})",
            base), ConfigParseError);
    }

    SECTION("Empty spec array") {
        REQUIRE_THROWS_AS(FieldCatalog::parse_json(R"({"metrics": {"eps": []}})", base),
                          ConfigParseError);
    }

    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(FieldCatalog::parse_json("{metrics", base), ConfigParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(FieldCatalog::load_from_json("no_such_catalog.json"), ConfigParseError);
    }
}

// ============================================================================
// Extraction
// ============================================================================

TEST_CASE("aggregation_for sums flows on quarterly data only", "[catalog][ttm]") {
    FieldSpec flow("revenue_ttm", StatementKind::IncomeStatement, MetricKind::Flow, {"Revenue"});
    FieldSpec stock("total_assets", StatementKind::BalanceSheet, MetricKind::Stock, {"Total assets"});

    REQUIRE(aggregation_for(flow, ReportingFrequency::Quarterly) == AggregationMode::TrailingSum);
    REQUIRE(aggregation_for(flow, ReportingFrequency::Annual) == AggregationMode::Latest);
    REQUIRE(aggregation_for(stock, ReportingFrequency::Quarterly) == AggregationMode::Latest);
    REQUIRE(aggregation_for(stock, ReportingFrequency::Annual) == AggregationMode::Latest);
}

TEST_CASE("percent_to_fraction converts percentages only", "[catalog]") {
    REQUIRE_THAT(percent_to_fraction(18.75), WithinRel(0.1875, 1e-12));
    REQUIRE_THAT(percent_to_fraction(-25.0), WithinRel(-0.25, 1e-12));
    REQUIRE_THAT(percent_to_fraction(1.0), WithinRel(0.01, 1e-12));
    REQUIRE(percent_to_fraction(0.18) == 0.18);
    REQUIRE(percent_to_fraction(0.0) == 0.0);
}

TEST_CASE("extract_primitives sums flows and takes latest stocks on quarterly data", "[catalog][ttm]") {
    MarketData market;
    market.symbol = "QQQ";

    NormalizedMetrics metrics = extract_primitives(quarterly_statements(), market,
                                                   FieldCatalog::default_catalog());

    REQUIRE_THAT(*metrics.get(metric::NET_INCOME), WithinRel(150.0, 1e-12));
    REQUIRE_THAT(*metrics.get(metric::REVENUE), WithinRel(2000.0, 1e-12));
    REQUIRE_THAT(*metrics.get(metric::GROSS_PROFIT), WithinRel(400.0, 1e-12));
    REQUIRE(metrics.get(metric::TOTAL_ASSETS) == 2000.0);
    REQUIRE(metrics.get(metric::TOTAL_LIABILITIES) == 1200.0);
    REQUIRE(metrics.source(metric::NET_INCOME) == MetricSource::Extracted);

    // Nothing in the statements for these
    REQUIRE_FALSE(metrics.has(metric::DEPRECIATION));
    REQUIRE_FALSE(metrics.has(metric::TOTAL_EQUITY));
    REQUIRE_FALSE(metrics.has(metric::SHARES_OUTSTANDING));
}

TEST_CASE("extract_primitives on annual data reads the latest period", "[catalog]") {
    StatementSet set;
    set.income_statement = StatementTable::load_from_csv(data_path("annual_income.csv"));
    set.income_statement.order_by_period(FieldLabel("yearReport"));

    NormalizedMetrics metrics = extract_primitives(set, MarketData(), FieldCatalog::default_catalog());

    REQUIRE(metrics.get(metric::NET_INCOME) == 150.0);
    REQUIRE(metrics.get(metric::REVENUE) == 1000.0);
    REQUIRE(metrics.get(metric::EBIT) == 250.0);
    REQUIRE(metrics.get(metric::INTEREST_EXPENSE) == -20.0);
    REQUIRE(metrics.get(metric::INCOME_TAX) == -40.0);
    REQUIRE_FALSE(metrics.has(metric::EBITDA));
}

TEST_CASE("extract_primitives converts percentage ratios", "[catalog]") {
    StatementSet set;
    set.ratios = StatementTable::load_from_csv(data_path("ratios.csv"));

    NormalizedMetrics metrics = extract_primitives(set, MarketData(), FieldCatalog::default_catalog());

    REQUIRE_THAT(*metrics.get(metric::ROE), WithinRel(0.1875, 1e-12));
    REQUIRE_THAT(*metrics.get(metric::ROA), WithinRel(0.075, 1e-12));
    REQUIRE_THAT(*metrics.get(metric::NET_PROFIT_MARGIN), WithinRel(0.15, 1e-12));
    REQUIRE(metrics.get(metric::EPS) == 1.5);
    REQUIRE(metrics.get(metric::BOOK_VALUE_PER_SHARE) == 8.0);
    REQUIRE(metrics.get(metric::MARKET_CAP) == 2000.0);
}

TEST_CASE("extract_primitives prefers market data for price and shares", "[catalog]") {
    StatementSet set;
    set.ratios = StatementTable({FieldLabel("Meta", "Outstanding Share (Mil. Shares)")});
    set.ratios.add_row({500.0});

    FieldCatalog catalog = FieldCatalog::default_catalog();
    catalog.add({metric::SHARES_OUTSTANDING, StatementKind::Ratios, MetricKind::Stock,
                 {"Outstanding Share"}});

    SECTION("Market value wins") {
        MarketData market;
        market.symbol = "AAA";
        market.current_price = 20.0;
        market.shares_outstanding = 100.0;

        NormalizedMetrics metrics = extract_primitives(set, market, catalog);
        REQUIRE(metrics.get(metric::SHARES_OUTSTANDING) == 100.0);
        REQUIRE(metrics.get(metric::CURRENT_PRICE) == 20.0);
    }

    SECTION("Non-positive market values are ignored") {
        MarketData market;
        market.current_price = 0.0;
        market.shares_outstanding = -1.0;

        NormalizedMetrics metrics = extract_primitives(set, market, catalog);
        REQUIRE(metrics.get(metric::SHARES_OUTSTANDING) == 500.0);
        REQUIRE_FALSE(metrics.has(metric::CURRENT_PRICE));
    }
}
