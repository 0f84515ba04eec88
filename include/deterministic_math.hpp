#pragma once

#include <cstddef>
#include <vector>

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace gpi {

// High-precision helpers so staking and combinatorics reproduce bit-for-bit across platforms.
class DeterministicMath {
public:
    using HighPrecision = boost::multiprecision::cpp_dec_float_50;

    // Full-Kelly fraction for a binary bet at decimal odds: f* = (p*b - (1-p)) / b, b = odds - 1.
    // Returns 0 when there is no edge. Throws std::domain_error on p outside (0,1) or odds <= 1.
    static double kellyFraction(double probability, double decimalOdds);

    // Harville probability that runners finish in the first order.size() places in exactly
    // that order. probs must be normalised over the active field.
    static double orderedFinishProbability(const std::vector<double>& probs,
                                           const std::vector<std::size_t>& order);

    static double sum(const std::vector<double>& values);

private:
    static HighPrecision clampUnitInterval(HighPrecision value);
};

} // namespace gpi
