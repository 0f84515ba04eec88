#include "estimator.hpp"

#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace gpi {

namespace {

bool validProbability(double p) {
    return std::isfinite(p) && p > 0.0 && p < 1.0;
}

bool validOdds(double odds) {
    return std::isfinite(odds) && odds > 1.0;
}

} // namespace

std::string Estimate::label() const {
    std::ostringstream oss;
    if (kind == BetKind::Single) {
        oss << "SP_" << toString(market);
    } else {
        oss << (comboType ? toString(*comboType) : "COMBO");
    }
    oss << ':';
    for (std::size_t i = 0; i < involvedRunners.size(); ++i) {
        if (i != 0) {
            oss << '-';
        }
        oss << involvedRunners[i];
    }
    return oss.str();
}

EstimatorSettings estimatorSettingsFrom(const GpiConfig& cfg) {
    EstimatorSettings settings;
    settings.spMarket = cfg.spMarket;
    settings.roiPayoutHaircut = cfg.roiPayoutHaircut;
    settings.finish.monteCarloSamples = cfg.monteCarloSamples;
    settings.finish.seed = cfg.monteCarloSeed;
    return settings;
}

Estimate CalibratedEstimator::estimateSingle(const RaceSnapshot& snapshot,
                                             const RunnerId& runnerId,
                                             const PayoutModel& model,
                                             const EstimatorSettings& settings) const {
    const Runner* runner = snapshot.findRunner(runnerId);
    if (runner == nullptr) {
        throw EstimationFailure("runner " + runnerId + " not in snapshot " + snapshot.raceId);
    }
    if (runner->scratched) {
        throw EstimationFailure("runner " + runnerId + " is scratched");
    }

    double odds = 0.0;
    if (settings.spMarket == Market::Win) {
        odds = runner->winOdds;
    } else if (runner->placeOdds) {
        odds = *runner->placeOdds;
    } else {
        throw EstimationFailure("runner " + runnerId + " has no place odds");
    }
    if (!validOdds(odds)) {
        throw EstimationFailure("runner " + runnerId + " has non-positive odds");
    }

    auto p = model.probability(runnerId, settings.spMarket);
    if (!p || !validProbability(*p)) {
        throw EstimationFailure("runner " + runnerId + " has no calibrated " +
                                toString(settings.spMarket) + " probability");
    }

    Estimate est;
    est.kind = BetKind::Single;
    est.market = settings.spMarket;
    est.involvedRunners = { runnerId };
    est.probability = *p;
    est.decimalOdds = odds;
    est.evRatio = (*p) * (odds - 1.0) - (1.0 - *p);
    est.roiRatio = (*p) * odds * (1.0 - settings.roiPayoutHaircut) - 1.0;
    est.expectedPayout = odds;
    est.runnerWinOdds = runner->winOdds;
    if (settings.spMarket == Market::Win) {
        est.winProbability = *p;
    } else {
        auto win = model.probability(runnerId, Market::Win);
        if (win && validProbability(*win)) {
            est.winProbability = *win;
        }
    }
    return est;
}

Estimate CalibratedEstimator::estimateCombo(const RaceSnapshot& snapshot,
                                            ComboType type,
                                            const std::vector<RunnerId>& legs,
                                            const PayoutModel& model,
                                            const EstimatorSettings& settings) const {
    if (legs.size() != legCount(type)) {
        throw EstimationFailure(std::string(toString(type)) + " needs " +
                                std::to_string(legCount(type)) + " legs");
    }
    std::vector<RunnerId> basket = legs;
    std::sort(basket.begin(), basket.end());
    if (std::adjacent_find(basket.begin(), basket.end()) != basket.end()) {
        throw EstimationFailure("basket repeats a runner");
    }

    std::vector<RunnerId> field;
    std::vector<double> weights;
    for (const Runner* runner : snapshot.activeRunners()) {
        auto p = model.probability(runner->id, Market::Win);
        if (!p || !std::isfinite(*p) || *p <= 0.0) {
            throw EstimationFailure("runner " + runner->id + " has no calibrated win probability");
        }
        field.push_back(runner->id);
        weights.push_back(*p);
    }

    std::vector<std::size_t> indices;
    for (const auto& leg : basket) {
        auto pos = std::find(field.begin(), field.end(), leg);
        if (pos == field.end()) {
            throw EstimationFailure("basket runner " + leg + " is not an active runner");
        }
        indices.push_back(static_cast<std::size_t>(std::distance(field.begin(), pos)));
    }

    auto dividend = model.comboDividend(type, basket);
    if (!dividend || !validOdds(*dividend)) {
        throw EstimationFailure(std::string("no expected dividend for ") + toString(type));
    }

    std::vector<double> probs = normalizeProbabilities(weights);
    HitProbability hit = basketHitProbability(type, probs, indices, settings.finish);
    if (!validProbability(hit.value)) {
        throw EstimationFailure(std::string("degenerate hit probability for ") + toString(type));
    }

    Estimate est;
    est.kind = BetKind::Combo;
    est.comboType = type;
    est.market = Market::Win;
    est.involvedRunners = basket;
    est.probability = hit.value;
    est.decimalOdds = *dividend;
    est.evRatio = hit.value * (*dividend) - 1.0;
    est.roiRatio = hit.value * (*dividend) * (1.0 - settings.roiPayoutHaircut) - 1.0;
    est.expectedPayout = *dividend;
    est.simulated = hit.simulated;
    return est;
}

const Estimate* selectBest(const std::vector<Estimate>& candidates) {
    const Estimate* best = nullptr;
    for (const auto& candidate : candidates) {
        if (best == nullptr) {
            best = &candidate;
            continue;
        }
        if (candidate.evRatio > best->evRatio) {
            best = &candidate;
        } else if (candidate.evRatio == best->evRatio) {
            if (candidate.expectedPayout > best->expectedPayout) {
                best = &candidate;
            } else if (candidate.expectedPayout == best->expectedPayout &&
                       candidate.label() < best->label()) {
                best = &candidate;
            }
        }
    }
    return best;
}

} // namespace gpi
