#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "models.hpp"

using namespace fairvalue;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

NormalizedMetrics metrics_with(std::initializer_list<std::pair<const char*, double>> values) {
    NormalizedMetrics m;
    for (const auto& [name, value] : values) {
        m.set_if_missing(name, value, MetricSource::Extracted);
    }
    return m;
}

// Annual statements of a small manufacturer after normalization
NormalizedMetrics sample_company() {
    return metrics_with({
        {metric::NET_INCOME, 150.0},
        {metric::NON_CASH_CHARGES, 55.0},
        {metric::NET_BORROWING, 20.0},
        {metric::WORKING_CAPITAL_CHANGE, 15.0},
        {metric::FIXED_CAPITAL_INVESTMENT, -70.0},
        {metric::INTEREST_EXPENSE, -20.0},
        {metric::SHARES_OUTSTANDING, 100.0},
        {metric::EPS, 1.5},
        {metric::BOOK_VALUE_PER_SHARE, 8.0},
        {metric::ROE, 0.1875}
    });
}

} // anonymous namespace

// ============================================================================
// Names
// ============================================================================

TEST_CASE("Model names round-trip", "[models]") {
    for (ValuationModel model : ALL_MODELS) {
        REQUIRE(model_from_name(model_name(model)) == model);
    }
    REQUIRE(model_name(ValuationModel::JustifiedPb) == "justified_pb");
    REQUIRE_THROWS_AS(model_from_name("ddm"), std::invalid_argument);
    REQUIRE(model_status_to_string(ModelStatus::Fallback) == "fallback");
}

// ============================================================================
// Discounting
// ============================================================================

TEST_CASE("present_value_of_growing_cash_flows", "[models][dcf]") {
    SECTION("Zero growth is a perpetuity whatever the horizon") {
        for (int years : {1, 5, 20}) {
            auto pv = present_value_of_growing_cash_flows(100.0, 0.0, 0.0, 0.10, years);
            REQUIRE(pv.has_value());
            REQUIRE_THAT(*pv, WithinRel(1000.0, 1e-9));
        }
    }

    SECTION("Two-year horizon by hand") {
        // 110/1.1 + 121/1.21 + (121/0.1)/1.21
        auto pv = present_value_of_growing_cash_flows(100.0, 0.10, 0.0, 0.10, 2);
        REQUIRE_THAT(*pv, WithinRel(1200.0, 1e-9));
    }

    SECTION("Terminal growth must be below the discount rate") {
        REQUIRE_FALSE(present_value_of_growing_cash_flows(100.0, 0.05, 0.10, 0.10, 5).has_value());
        REQUIRE_FALSE(present_value_of_growing_cash_flows(100.0, 0.05, 0.12, 0.10, 5).has_value());
    }

    SECTION("Horizon must be positive") {
        REQUIRE_THROWS_AS(present_value_of_growing_cash_flows(100.0, 0.05, 0.02, 0.10, 0),
                          std::invalid_argument);
    }
}

TEST_CASE("Free cash flows from normalized metrics", "[models][dcf]") {
    NormalizedMetrics m = sample_company();

    REQUIRE_THAT(*free_cash_flow_to_equity(m), WithinRel(140.0, 1e-12));
    REQUIRE_THAT(*free_cash_flow_to_firm(m, 0.2), WithinRel(136.0, 1e-12));

    SECTION("Absent components count as zero") {
        NormalizedMetrics bare = metrics_with({{metric::NET_INCOME, 150.0}});
        REQUIRE(free_cash_flow_to_equity(bare) == 150.0);
        REQUIRE(free_cash_flow_to_firm(bare, 0.2) == 150.0);
    }

    SECTION("Net income is required") {
        REQUIRE_FALSE(free_cash_flow_to_equity(NormalizedMetrics()).has_value());
        REQUIRE_FALSE(free_cash_flow_to_firm(NormalizedMetrics(), 0.2).has_value());
    }
}

// ============================================================================
// FCFE / FCFF
// ============================================================================

TEST_CASE("FCFE discounts at the cost of equity", "[models][fcfe]") {
    ValuationAssumptions a;
    ModelOutcome outcome = calculate_fcfe(sample_company(), a);

    auto expected = present_value_of_growing_cash_flows(140.0, a.short_term_growth,
                                                        a.terminal_growth, a.cost_of_equity,
                                                        a.forecast_years);
    REQUIRE(outcome.status == ModelStatus::Computed);
    REQUIRE(outcome.model == ValuationModel::Fcfe);
    REQUIRE_THAT(outcome.value_per_share, WithinRel(*expected / 100.0, 1e-12));
    REQUIRE(outcome.has_positive_value());
}

TEST_CASE("FCFF discounts at WACC", "[models][fcff]") {
    ValuationAssumptions a;
    ModelOutcome outcome = calculate_fcff(sample_company(), a);

    auto expected = present_value_of_growing_cash_flows(136.0, a.short_term_growth,
                                                        a.terminal_growth, a.wacc,
                                                        a.forecast_years);
    REQUIRE(outcome.status == ModelStatus::Computed);
    REQUIRE_THAT(outcome.value_per_share, WithinRel(*expected / 100.0, 1e-12));
}

TEST_CASE("DCF models fail when the discount rate does not exceed terminal growth", "[models][dcf]") {
    ValuationAssumptions a;
    a.terminal_growth = 0.12;   // Equal to the cost of equity
    a.wacc = 0.08;

    ModelOutcome fcfe = calculate_fcfe(sample_company(), a);
    ModelOutcome fcff = calculate_fcff(sample_company(), a);

    REQUIRE(fcfe.status == ModelStatus::Failed);
    REQUIRE(fcfe.value_per_share == 0.0);
    REQUIRE(fcff.status == ModelStatus::Failed);
    REQUIRE(fcff.value_per_share == 0.0);
    REQUIRE_FALSE(fcfe.detail.empty());
}

TEST_CASE("DCF models fail without shares or net income", "[models][dcf]") {
    ValuationAssumptions a;

    NormalizedMetrics no_shares = metrics_with({{metric::NET_INCOME, 150.0}});
    REQUIRE(calculate_fcfe(no_shares, a).status == ModelStatus::Failed);
    REQUIRE(calculate_fcff(no_shares, a).status == ModelStatus::Failed);

    NormalizedMetrics no_income = metrics_with({{metric::SHARES_OUTSTANDING, 100.0}});
    REQUIRE(calculate_fcfe(no_income, a).status == ModelStatus::Failed);
    REQUIRE(calculate_fcff(no_income, a).status == ModelStatus::Failed);
}

TEST_CASE("DCF model with negative cash flow is computed but not positive", "[models][dcf]") {
    ValuationAssumptions a;
    NormalizedMetrics m = metrics_with({
        {metric::NET_INCOME, -50.0},
        {metric::SHARES_OUTSTANDING, 100.0}
    });

    ModelOutcome outcome = calculate_fcfe(m, a);
    REQUIRE(outcome.status == ModelStatus::Computed);
    REQUIRE(outcome.value_per_share < 0.0);
    REQUIRE_FALSE(outcome.has_positive_value());
}

// ============================================================================
// Justified P/E
// ============================================================================

TEST_CASE("Justified P/E multiple", "[models][pe]") {
    // g = 0.15 * 0.5 = 0.075; 0.5 * 1.075 / 0.025 = 21.5
    auto multiple = justified_pe_multiple(0.15, 0.5, 0.10);
    REQUIRE_THAT(*multiple, WithinRel(21.5, 1e-12));
    REQUIRE_THAT(sustainable_growth(0.15, 0.5), WithinRel(0.075, 1e-12));
}

TEST_CASE("Justified P/E value", "[models][pe]") {
    ValuationAssumptions a;
    a.cost_of_equity = 0.10;
    a.payout_ratio = 0.5;

    SECTION("Computed from fundamentals") {
        NormalizedMetrics m = metrics_with({{metric::EPS, 2.0}, {metric::ROE, 0.15}});
        ModelOutcome outcome = calculate_justified_pe(m, a);

        REQUIRE(outcome.status == ModelStatus::Computed);
        REQUIRE_THAT(outcome.value_per_share, WithinRel(43.0, 1e-12));
    }

    SECTION("Growth above the required return falls back to 15x") {
        NormalizedMetrics m = metrics_with({{metric::EPS, 2.0}, {metric::ROE, 0.30}});
        ModelOutcome outcome = calculate_justified_pe(m, a);

        REQUIRE(outcome.status == ModelStatus::Fallback);
        REQUIRE_THAT(outcome.value_per_share, WithinRel(JUSTIFIED_PE_FALLBACK * 2.0, 1e-12));
    }

    SECTION("Growth equal to the required return falls back") {
        NormalizedMetrics m = metrics_with({{metric::EPS, 2.0}, {metric::ROE, 0.20}});
        ModelOutcome outcome = calculate_justified_pe(m, a);
        REQUIRE(outcome.status == ModelStatus::Fallback);
        REQUIRE_THAT(outcome.value_per_share, WithinRel(30.0, 1e-12));
    }

    SECTION("Target ROE overrides the observed ROE") {
        a.target_roe = 0.15;
        NormalizedMetrics m = metrics_with({{metric::EPS, 2.0}, {metric::ROE, 0.60}});
        ModelOutcome outcome = calculate_justified_pe(m, a);
        REQUIRE(outcome.status == ModelStatus::Computed);
        REQUIRE_THAT(outcome.value_per_share, WithinRel(43.0, 1e-12));
    }

    SECTION("Missing EPS or ROE fails") {
        REQUIRE(calculate_justified_pe(metrics_with({{metric::ROE, 0.15}}), a).status ==
                ModelStatus::Failed);
        REQUIRE(calculate_justified_pe(metrics_with({{metric::EPS, 2.0}}), a).status ==
                ModelStatus::Failed);
    }
}

// ============================================================================
// Justified P/B
// ============================================================================

TEST_CASE("Justified P/B value", "[models][pb]") {
    ValuationAssumptions a;   // r = 0.12, payout = 0.4

    SECTION("Computed from fundamentals") {
        // g = 0.1875 * 0.6 = 0.1125; (0.1875 - 0.1125) / (0.12 - 0.1125) = 10
        ModelOutcome outcome = calculate_justified_pb(sample_company(), a);

        REQUIRE(outcome.status == ModelStatus::Computed);
        REQUIRE_THAT(outcome.value_per_share, WithinRel(80.0, 1e-9));
    }

    SECTION("Required return not above growth falls back to 1x book") {
        a.cost_of_equity = 0.10;
        ModelOutcome outcome = calculate_justified_pb(sample_company(), a);

        REQUIRE(outcome.status == ModelStatus::Fallback);
        REQUIRE_THAT(outcome.value_per_share, WithinRel(8.0, 1e-12));
    }

    SECTION("ROE not above growth falls back") {
        // Negative ROE with full retention: g == roe
        a.payout_ratio = 0.0;
        NormalizedMetrics m = metrics_with({{metric::BOOK_VALUE_PER_SHARE, 8.0}, {metric::ROE, -0.05}});
        ModelOutcome outcome = calculate_justified_pb(m, a);

        REQUIRE(outcome.status == ModelStatus::Fallback);
        REQUIRE_THAT(outcome.value_per_share, WithinRel(8.0, 1e-12));
    }

    SECTION("Book value derived from the balance sheet") {
        NormalizedMetrics m = metrics_with({
            {metric::TOTAL_ASSETS, 2000.0},
            {metric::TOTAL_LIABILITIES, 1200.0},
            {metric::SHARES_OUTSTANDING, 100.0},
            {metric::ROE, 0.1875}
        });
        ModelOutcome outcome = calculate_justified_pb(m, a);
        REQUIRE_THAT(outcome.value_per_share, WithinRel(80.0, 1e-9));
    }

    SECTION("No book value fails") {
        ModelOutcome outcome = calculate_justified_pb(metrics_with({{metric::ROE, 0.1875}}), a);
        REQUIRE(outcome.status == ModelStatus::Failed);
        REQUIRE(outcome.value_per_share == 0.0);
    }
}

TEST_CASE("calculate_all_models returns one outcome per model in order", "[models]") {
    auto outcomes = calculate_all_models(sample_company(), ValuationAssumptions());

    REQUIRE(outcomes.size() == ALL_MODELS.size());
    for (size_t i = 0; i < ALL_MODELS.size(); ++i) {
        REQUIRE(outcomes[i].model == ALL_MODELS[i]);
        REQUIRE(outcomes[i].has_positive_value());
    }
}

TEST_CASE("ModelOutcome failed sentinel", "[models]") {
    ModelOutcome outcome = ModelOutcome::failed(ValuationModel::Fcff, "no data");

    REQUIRE(outcome.status == ModelStatus::Failed);
    REQUIRE(outcome.value_per_share == 0.0);
    REQUIRE(outcome.detail == "no data");
    REQUIRE_FALSE(outcome.has_positive_value());
    REQUIRE_THAT(outcome.value_per_share, WithinAbs(0.0, 1e-15));
}
