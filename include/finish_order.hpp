#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "bet_types.hpp"

namespace gpi {

class RandomSource;

struct FinishModelSettings {
    std::size_t monteCarloSamples = 20'000;
    std::uint64_t seed = 51;
};

struct HitProbability {
    double value = 0.0;
    bool simulated = false;
};

// Rescales strictly positive weights to sum to 1. Throws std::invalid_argument otherwise.
std::vector<double> normalizeProbabilities(const std::vector<double>& weights);

// Probability that the basket (indices into probs) covers the first placesCovered(type)
// finishing positions in any order, under the Harville finish model.
//   2-3 leg types: exact enumeration of ordered finishes.
//   QUARTET: Plackett-Luce simulation with a fresh SeededRng(settings.seed).
HitProbability basketHitProbability(ComboType type,
                                    const std::vector<double>& probs,
                                    const std::vector<std::size_t>& legs,
                                    const FinishModelSettings& settings);

double closedFormHitProbability(ComboType type,
                                const std::vector<double>& probs,
                                const std::vector<std::size_t>& legs);

double simulatedHitProbability(ComboType type,
                               const std::vector<double>& probs,
                               const std::vector<std::size_t>& legs,
                               std::size_t samples,
                               RandomSource& rng);

} // namespace gpi
