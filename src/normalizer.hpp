#ifndef FAIRVALUE_NORMALIZER_HPP
#define FAIRVALUE_NORMALIZER_HPP

#include "metrics.hpp"
#include <string>

namespace fairvalue {

// Share counts above this are taken to be reported in the wrong unit
// (thousandths) and are divided by 1000 until they fall to or below it.
constexpr double SHARES_IMPLAUSIBILITY_THRESHOLD = 1e11;
constexpr double SHARES_RESCALE_FACTOR = 1000.0;

// Fill every missing ratio, margin and composite from the primitives present
// in `metrics`, and reconcile share-count units.
//
// Rules run once, in dependency order, and each one fires only when its
// target is absent and all of its inputs are present (divisors non-zero), so
// values already present are never overwritten and
// normalize(normalize(m)) == normalize(m).
//
// `symbol` is only used to label log events.
NormalizedMetrics normalize(const NormalizedMetrics& metrics, const std::string& symbol = "");

} // namespace fairvalue

#endif // FAIRVALUE_NORMALIZER_HPP
