#ifndef FAIRVALUE_AGGREGATOR_HPP
#define FAIRVALUE_AGGREGATOR_HPP

#include "assumptions.hpp"
#include "models.hpp"
#include <optional>
#include <vector>

namespace fairvalue {

// Statistics over the models that qualified for the weighted average
struct ValuationSummary {
    double mean;
    double min;
    double max;
    size_t models_used;
    size_t total_models;

    ValuationSummary();
};

// Combined result of the four valuation models for one symbol
struct ValuationResult {
    std::vector<ModelOutcome> outcomes;    // One per model evaluated
    double weighted_average;               // 0 sentinel when no weighted model is usable
    std::optional<ValuationSummary> summary;  // Empty when no model has a usable value

    ValuationResult();

    bool has_valuation() const { return weighted_average > 0.0; }

    // Outcome for `model`, or nullptr if it was not evaluated
    const ModelOutcome* outcome(ValuationModel model) const;
};

// An outcome takes part in the weighted average when its value is finite and
// strictly positive and its model's weight is strictly positive
bool qualifies(const ModelOutcome& outcome, const ModelWeights& weights);

// Weighted average over qualifying outcomes with weights renormalized to sum
// to 1 over that subset. mean/min/max/count cover every outcome with a finite,
// strictly positive value, whatever its weight. Outcomes without a usable
// value are kept in the result but contribute nothing.
ValuationResult aggregate(const std::vector<ModelOutcome>& outcomes, const ModelWeights& weights);

} // namespace fairvalue

#endif // FAIRVALUE_AGGREGATOR_HPP
