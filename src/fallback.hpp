#ifndef FAIRVALUE_FALLBACK_HPP
#define FAIRVALUE_FALLBACK_HPP

#include <cmath>
#include <functional>
#include <initializer_list>
#include <optional>

namespace fairvalue {

// One way of obtaining a value; nullopt when its inputs are unavailable
using Derivation = std::function<std::optional<double>()>;

// Ordered-fallback combinator: evaluate derivations in priority order and
// return the first finite result. Later derivations are not evaluated once
// one succeeds.
inline std::optional<double> first_available(std::initializer_list<Derivation> derivations) {
    for (const auto& derive : derivations) {
        std::optional<double> value = derive();
        if (value && std::isfinite(*value)) {
            return value;
        }
    }
    return std::nullopt;
}

// Presence-guarded arithmetic building blocks for derivations

inline std::optional<double> safe_divide(std::optional<double> numerator,
                                         std::optional<double> denominator) {
    if (!numerator || !denominator || *denominator == 0.0) {
        return std::nullopt;
    }
    return *numerator / *denominator;
}

inline std::optional<double> add(std::optional<double> a, std::optional<double> b) {
    if (!a || !b) {
        return std::nullopt;
    }
    return *a + *b;
}

inline std::optional<double> subtract(std::optional<double> a, std::optional<double> b) {
    if (!a || !b) {
        return std::nullopt;
    }
    return *a - *b;
}

inline std::optional<double> multiply(std::optional<double> a, std::optional<double> b) {
    if (!a || !b) {
        return std::nullopt;
    }
    return *a * *b;
}

// Sum of whichever terms are present; nullopt only when none is
inline std::optional<double> sum_present(std::initializer_list<std::optional<double>> terms) {
    std::optional<double> total;
    for (const auto& term : terms) {
        if (term) {
            total = total.value_or(0.0) + *term;
        }
    }
    return total;
}

// Keep a value only when it is strictly positive
inline std::optional<double> positive(std::optional<double> value) {
    if (!value || *value <= 0.0) {
        return std::nullopt;
    }
    return value;
}

} // namespace fairvalue

#endif // FAIRVALUE_FALLBACK_HPP
