#include "aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace fairvalue {

// ============================================================================
// ValuationSummary / ValuationResult Implementation
// ============================================================================

ValuationSummary::ValuationSummary()
    : mean(0.0),
      min(0.0),
      max(0.0),
      models_used(0),
      total_models(ALL_MODELS.size()) {}

ValuationResult::ValuationResult()
    : outcomes(),
      weighted_average(0.0),
      summary(std::nullopt) {}

const ModelOutcome* ValuationResult::outcome(ValuationModel model) const {
    for (const auto& o : outcomes) {
        if (o.model == model) {
            return &o;
        }
    }
    return nullptr;
}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

namespace {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

} // anonymous namespace

// ============================================================================
// Aggregation
// ============================================================================

bool qualifies(const ModelOutcome& outcome, const ModelWeights& weights) {
    double weight = weights.weight_for(outcome.model);
    return outcome.has_positive_value() && std::isfinite(weight) && weight > 0.0;
}

ValuationResult aggregate(const std::vector<ModelOutcome>& outcomes, const ModelWeights& weights) {
    ValuationResult result;
    result.outcomes = outcomes;

    std::vector<double> values;
    double weight_sum = 0.0;
    double weighted_sum = 0.0;
    for (const auto& outcome : outcomes) {
        if (!outcome.has_positive_value()) {
            continue;
        }
        values.push_back(outcome.value_per_share);
        if (qualifies(outcome, weights)) {
            double weight = weights.weight_for(outcome.model);
            weight_sum += weight;
            weighted_sum += outcome.value_per_share * weight;
        }
    }

    if (values.empty()) {
        return result;
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());

    ValuationSummary summary;
    summary.mean = calculate_mean(values);
    summary.min = *min_it;
    summary.max = *max_it;
    summary.models_used = values.size();
    result.summary = summary;

    // Usable values whose weights are all zero leave the sentinel in place
    if (weight_sum > 0.0) {
        // Rounding can push a renormalized average a hair outside the range
        result.weighted_average = std::clamp(weighted_sum / weight_sum, *min_it, *max_it);
    }

    return result;
}

} // namespace fairvalue
