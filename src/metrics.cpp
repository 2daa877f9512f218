#include "metrics.hpp"
#include <cmath>
#include <stdexcept>

namespace fairvalue {

std::string metric_source_to_string(MetricSource source) {
    switch (source) {
        case MetricSource::Extracted: return "extracted";
        case MetricSource::Derived: return "derived";
        case MetricSource::Default: return "default";
    }
    return "unknown";
}

std::optional<double> NormalizedMetrics::get(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

bool NormalizedMetrics::has(const std::string& name) const {
    return entries_.count(name) > 0;
}

double NormalizedMetrics::value_or(const std::string& name, double fallback) const {
    return get(name).value_or(fallback);
}

std::optional<MetricSource> NormalizedMetrics::source(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.source;
}

bool NormalizedMetrics::set_if_missing(const std::string& name, std::optional<double> value,
                                       MetricSource source) {
    if (!value || !std::isfinite(*value) || has(name)) {
        return false;
    }
    entries_.emplace(name, Entry{*value, source});
    return true;
}

void NormalizedMetrics::rescale(const std::string& name, double value) {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw std::out_of_range("Metric not present: " + name);
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Rescaled value for " + name + " must be finite");
    }
    it->second.value = value;
}

void NormalizedMetrics::erase(const std::string& name) {
    entries_.erase(name);
}

std::vector<std::string> NormalizedMetrics::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        out.push_back(name);
    }
    return out;
}

} // namespace fairvalue
