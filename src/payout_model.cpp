#include "payout_model.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gpi {

CalibratedPayoutModel::CalibratedPayoutModel(const RaceSnapshot& market,
                                             std::map<RunnerId, RunnerCalibration> calibration,
                                             Timestamp calibratedAt,
                                             std::map<ComboType, double> takeout,
                                             FinishModelSettings finish)
    : calibration_(std::move(calibration))
    , calibratedAt_(calibratedAt)
    , takeout_(std::move(takeout))
    , finish_(finish) {
    std::vector<double> implied;
    marketUsable_ = true;
    for (const Runner* runner : market.activeRunners()) {
        field_.push_back(runner->id);
        if (!std::isfinite(runner->winOdds) || runner->winOdds <= 1.0) {
            marketUsable_ = false;
            continue;
        }
        implied.push_back(1.0 / runner->winOdds);
    }
    if (marketUsable_ && !implied.empty()) {
        marketProbabilities_ = normalizeProbabilities(implied);
    } else {
        marketUsable_ = false;
    }
}

std::optional<double> CalibratedPayoutModel::probability(const RunnerId& id, Market market) const {
    auto it = calibration_.find(id);
    if (it == calibration_.end()) {
        return std::nullopt;
    }
    return market == Market::Win ? it->second.win : it->second.place;
}

std::optional<double> CalibratedPayoutModel::comboDividend(ComboType type,
                                                           const std::vector<RunnerId>& legs) const {
    if (!marketUsable_) {
        return std::nullopt;
    }
    auto rate = takeout_.find(type);
    if (rate == takeout_.end()) {
        return std::nullopt;
    }
    std::vector<std::size_t> indices;
    indices.reserve(legs.size());
    for (const auto& leg : legs) {
        auto pos = std::find(field_.begin(), field_.end(), leg);
        if (pos == field_.end()) {
            return std::nullopt;
        }
        indices.push_back(static_cast<std::size_t>(std::distance(field_.begin(), pos)));
    }
    HitProbability hit = basketHitProbability(type, marketProbabilities_, indices, finish_);
    if (hit.value <= 0.0) {
        return std::nullopt;
    }
    return (1.0 - rate->second) / hit.value;
}

} // namespace gpi
