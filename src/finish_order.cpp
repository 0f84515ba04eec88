#include "finish_order.hpp"

#include "deterministic_math.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gpi {

namespace {

void checkBasket(ComboType type, const std::vector<double>& probs, const std::vector<std::size_t>& legs) {
    if (legs.size() != legCount(type)) {
        throw std::invalid_argument(std::string("basket size does not match ") + toString(type));
    }
    std::vector<std::size_t> sorted = legs;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        throw std::invalid_argument("basket repeats a runner");
    }
    if (!sorted.empty() && sorted.back() >= probs.size()) {
        throw std::out_of_range("basket references a runner outside the field");
    }
}

bool coversAll(const std::vector<std::size_t>& finish, const std::vector<std::size_t>& legs) {
    for (std::size_t leg : legs) {
        if (std::find(finish.begin(), finish.end(), leg) == finish.end()) {
            return false;
        }
    }
    return true;
}

// Walks every ordered finish of length `depth` that can still include all legs.
void enumerateFinishes(const std::vector<double>& probs,
                       const std::vector<std::size_t>& legs,
                       std::size_t depth,
                       std::vector<std::size_t>& prefix,
                       std::vector<bool>& used,
                       std::vector<double>& terms) {
    std::size_t missing = 0;
    for (std::size_t leg : legs) {
        if (!used[leg]) {
            ++missing;
        }
    }
    if (depth - prefix.size() < missing) {
        return;
    }
    if (prefix.size() == depth) {
        if (coversAll(prefix, legs)) {
            terms.push_back(DeterministicMath::orderedFinishProbability(probs, prefix));
        }
        return;
    }
    for (std::size_t i = 0; i < probs.size(); ++i) {
        if (used[i]) {
            continue;
        }
        used[i] = true;
        prefix.push_back(i);
        enumerateFinishes(probs, legs, depth, prefix, used, terms);
        prefix.pop_back();
        used[i] = false;
    }
}

} // namespace

std::vector<double> normalizeProbabilities(const std::vector<double>& weights) {
    if (weights.empty()) {
        throw std::invalid_argument("cannot normalise an empty field");
    }
    for (double w : weights) {
        if (!std::isfinite(w) || w <= 0.0) {
            throw std::invalid_argument("probabilities must be finite and positive");
        }
    }
    double total = DeterministicMath::sum(weights);
    std::vector<double> out;
    out.reserve(weights.size());
    for (double w : weights) {
        out.push_back(w / total);
    }
    return out;
}

double closedFormHitProbability(ComboType type,
                                const std::vector<double>& probs,
                                const std::vector<std::size_t>& legs) {
    checkBasket(type, probs, legs);
    if (type == ComboType::Quartet) {
        throw std::invalid_argument("QUARTET is evaluated by simulation");
    }
    const std::size_t depth = std::min(placesCovered(type), probs.size());
    std::vector<std::size_t> prefix;
    prefix.reserve(depth);
    std::vector<bool> used(probs.size(), false);
    std::vector<double> terms;
    enumerateFinishes(probs, legs, depth, prefix, used, terms);
    double total = DeterministicMath::sum(terms);
    return std::clamp(total, 0.0, 1.0);
}

double simulatedHitProbability(ComboType type,
                               const std::vector<double>& probs,
                               const std::vector<std::size_t>& legs,
                               std::size_t samples,
                               RandomSource& rng) {
    checkBasket(type, probs, legs);
    if (samples == 0) {
        throw std::invalid_argument("simulation requires at least one sample");
    }
    const std::size_t depth = std::min(placesCovered(type), probs.size());
    std::size_t hits = 0;
    std::vector<bool> taken(probs.size(), false);
    std::vector<std::size_t> finish;
    finish.reserve(depth);

    for (std::size_t s = 0; s < samples; ++s) {
        std::fill(taken.begin(), taken.end(), false);
        finish.clear();
        double remaining = 1.0;
        for (std::size_t pos = 0; pos < depth; ++pos) {
            double r = rng.uniform01() * remaining;
            double cumulative = 0.0;
            std::size_t pick = probs.size();
            std::size_t lastFree = probs.size();
            for (std::size_t i = 0; i < probs.size(); ++i) {
                if (taken[i]) {
                    continue;
                }
                lastFree = i;
                cumulative += probs[i];
                if (r < cumulative) {
                    pick = i;
                    break;
                }
            }
            if (pick == probs.size()) {
                pick = lastFree;
            }
            taken[pick] = true;
            remaining -= probs[pick];
            finish.push_back(pick);
        }
        if (coversAll(finish, legs)) {
            ++hits;
        }
    }
    return static_cast<double>(hits) / static_cast<double>(samples);
}

HitProbability basketHitProbability(ComboType type,
                                    const std::vector<double>& probs,
                                    const std::vector<std::size_t>& legs,
                                    const FinishModelSettings& settings) {
    if (type == ComboType::Quartet) {
        SeededRng rng(settings.seed);
        return HitProbability{ simulatedHitProbability(type, probs, legs, settings.monteCarloSamples, rng),
                               true };
    }
    return HitProbability{ closedFormHitProbability(type, probs, legs), false };
}

} // namespace gpi
