#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <limits>
#include "aggregator.hpp"

using namespace fairvalue;
using Catch::Matchers::WithinRel;

namespace {

std::vector<ModelOutcome> outcomes_of(double fcfe, double fcff, double pe, double pb) {
    auto make = [](ValuationModel model, double value) {
        return value > 0.0 ? ModelOutcome(model, value, ModelStatus::Computed)
                           : ModelOutcome::failed(model, "no value");
    };
    return {
        make(ValuationModel::Fcfe, fcfe),
        make(ValuationModel::Fcff, fcff),
        make(ValuationModel::JustifiedPe, pe),
        make(ValuationModel::JustifiedPb, pb)
    };
}

} // anonymous namespace

TEST_CASE("aggregate excludes failed models and renormalizes", "[aggregator]") {
    ValuationResult result = aggregate(outcomes_of(20.0, 0.0, 30.0, 25.0), ModelWeights());

    REQUIRE(result.has_valuation());
    REQUIRE_THAT(result.weighted_average, WithinRel(25.0, 1e-12));
    REQUIRE(result.summary->models_used == 3);
    REQUIRE(result.summary->total_models == 4);
    REQUIRE(result.summary->min == 20.0);
    REQUIRE(result.summary->max == 30.0);
    REQUIRE_THAT(result.summary->mean, WithinRel(25.0, 1e-12));
    REQUIRE(result.outcomes.size() == 4);
}

TEST_CASE("aggregate with no qualifying model returns the sentinel", "[aggregator]") {
    ValuationResult result = aggregate(outcomes_of(0.0, 0.0, 0.0, 0.0), ModelWeights());

    REQUIRE_FALSE(result.has_valuation());
    REQUIRE(result.weighted_average == 0.0);
    REQUIRE(result.outcomes.size() == 4);
}

TEST_CASE("aggregate leaves zero-weight models out of the weighted average only", "[aggregator]") {
    ModelWeights weights(1.0, 3.0, 0.0, 0.0);
    ValuationResult result = aggregate(outcomes_of(10.0, 20.0, 30.0, 40.0), weights);

    REQUIRE_THAT(result.weighted_average, WithinRel(17.5, 1e-12));

    // Summary statistics still describe every usable value
    REQUIRE(result.summary->models_used == 4);
    REQUIRE(result.summary->min == 10.0);
    REQUIRE(result.summary->max == 40.0);
    REQUIRE_THAT(result.summary->mean, WithinRel(25.0, 1e-12));

    SECTION("Single weighted model among two usable values") {
        ValuationResult single = aggregate(outcomes_of(20.0, 30.0, 0.0, 0.0),
                                           ModelWeights(1.0, 0.0, 0.0, 0.0));
        REQUIRE_THAT(single.weighted_average, WithinRel(20.0, 1e-12));
        REQUIRE(single.summary->models_used == 2);
        REQUIRE_THAT(single.summary->mean, WithinRel(25.0, 1e-12));
        REQUIRE(single.summary->max == 30.0);
    }

    SECTION("All positive values carry zero weight") {
        ValuationResult none = aggregate(outcomes_of(0.0, 0.0, 30.0, 40.0), weights);
        REQUIRE_FALSE(none.has_valuation());
        REQUIRE(none.weighted_average == 0.0);
        REQUIRE(none.summary.has_value());
        REQUIRE(none.summary->models_used == 2);
    }
}

TEST_CASE("aggregate preserves contribution proportions over a subset", "[aggregator]") {
    ModelWeights weights(0.2, 0.2, 0.4, 0.2);

    // FCFF failed: the others are reweighted 0.25 / 0.5 / 0.25
    ValuationResult result = aggregate(outcomes_of(10.0, 0.0, 20.0, 40.0), weights);
    REQUIRE_THAT(result.weighted_average, WithinRel(0.25 * 10.0 + 0.5 * 20.0 + 0.25 * 40.0, 1e-12));

    // Unnormalized weights in the same proportion give the same answer
    ValuationResult scaled = aggregate(outcomes_of(10.0, 0.0, 20.0, 40.0), ModelWeights(1, 1, 2, 1));
    REQUIRE_THAT(scaled.weighted_average, WithinRel(result.weighted_average, 1e-12));
}

TEST_CASE("aggregate keeps the weighted average within the value range", "[aggregator]") {
    ModelWeights weights(0.7, 0.1, 0.15, 0.05);
    ValuationResult result = aggregate(outcomes_of(12.5, 97.0, 33.3, 41.0), weights);

    REQUIRE(result.weighted_average >= result.summary->min);
    REQUIRE(result.weighted_average <= result.summary->max);
}

TEST_CASE("aggregate counts fallback values and skips non-finite ones", "[aggregator]") {
    std::vector<ModelOutcome> outcomes = {
        ModelOutcome(ValuationModel::Fcfe, std::numeric_limits<double>::infinity(), ModelStatus::Computed),
        ModelOutcome(ValuationModel::Fcff, -5.0, ModelStatus::Computed),
        ModelOutcome(ValuationModel::JustifiedPe, 30.0, ModelStatus::Fallback),
        ModelOutcome(ValuationModel::JustifiedPb, 10.0, ModelStatus::Computed)
    };

    ValuationResult result = aggregate(outcomes, ModelWeights());

    REQUIRE(result.summary->models_used == 2);
    REQUIRE_THAT(result.weighted_average, WithinRel(20.0, 1e-12));
    REQUIRE(result.outcome(ValuationModel::Fcfe) != nullptr);
}

TEST_CASE("qualifies requires a positive value and weight", "[aggregator]") {
    ModelWeights weights(1.0, 0.0, 1.0, 1.0);

    REQUIRE(qualifies(ModelOutcome(ValuationModel::Fcfe, 5.0, ModelStatus::Computed), weights));
    REQUIRE_FALSE(qualifies(ModelOutcome(ValuationModel::Fcff, 5.0, ModelStatus::Computed), weights));
    REQUIRE_FALSE(qualifies(ModelOutcome(ValuationModel::JustifiedPe, 0.0, ModelStatus::Computed), weights));
    REQUIRE_FALSE(qualifies(ModelOutcome::failed(ValuationModel::JustifiedPb, "x"), weights));
}

TEST_CASE("ValuationResult outcome lookup", "[aggregator]") {
    ValuationResult result;
    REQUIRE(result.outcome(ValuationModel::Fcfe) == nullptr);

    result = aggregate(outcomes_of(20.0, 0.0, 30.0, 25.0), ModelWeights());
    const ModelOutcome* fcff = result.outcome(ValuationModel::Fcff);
    REQUIRE(fcff != nullptr);
    REQUIRE(fcff->status == ModelStatus::Failed);
}
