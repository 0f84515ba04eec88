#include "deterministic_math.hpp"

#include <cmath>
#include <stdexcept>

namespace gpi {
namespace {

constexpr double kEpsilon = 1e-12;

} // namespace

DeterministicMath::HighPrecision DeterministicMath::clampUnitInterval(HighPrecision value) {
    HighPrecision min = HighPrecision(0);
    HighPrecision max = HighPrecision(1);
    if (value < min) {
        return min;
    }
    if (value > max) {
        return max;
    }
    return value;
}

double DeterministicMath::kellyFraction(double probability, double decimalOdds) {
    if (!std::isfinite(probability) || probability <= 0.0 || probability >= 1.0) {
        throw std::domain_error("Kelly fraction requires a probability in (0, 1)");
    }
    if (!std::isfinite(decimalOdds) || decimalOdds <= 1.0) {
        throw std::domain_error("Kelly fraction requires decimal odds above 1.0");
    }
    HighPrecision p(probability);
    HighPrecision b = HighPrecision(decimalOdds) - HighPrecision(1);
    HighPrecision edge = p * b - (HighPrecision(1) - p);
    if (edge <= HighPrecision(0)) {
        return 0.0;
    }
    return static_cast<double>(clampUnitInterval(edge / b));
}

double DeterministicMath::orderedFinishProbability(const std::vector<double>& probs,
                                                   const std::vector<std::size_t>& order) {
    HighPrecision result(1);
    HighPrecision consumed(0);
    for (std::size_t idx : order) {
        if (idx >= probs.size()) {
            throw std::out_of_range("finish order references a runner outside the field");
        }
        HighPrecision remaining = HighPrecision(1) - consumed;
        if (remaining <= HighPrecision(kEpsilon)) {
            return 0.0;
        }
        HighPrecision p(probs[idx]);
        result *= p / remaining;
        consumed += p;
    }
    return static_cast<double>(clampUnitInterval(result));
}

double DeterministicMath::sum(const std::vector<double>& values) {
    HighPrecision total(0);
    for (double v : values) {
        total += HighPrecision(v);
    }
    return static_cast<double>(total);
}

} // namespace gpi
