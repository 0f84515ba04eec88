#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "bet_types.hpp"
#include "finish_order.hpp"
#include "snapshot.hpp"

namespace gpi {

// Calibration collaborator: calibrated probabilities and expected combination dividends.
class PayoutModel {
public:
    virtual ~PayoutModel() = default;

    virtual Timestamp calibratedAt() const = 0;

    // Calibrated probability that the runner wins (Win) or finishes placed (Place).
    virtual std::optional<double> probability(const RunnerId& id, Market market) const = 0;

    // Expected gross dividend per unit staked when the basket hits.
    virtual std::optional<double> comboDividend(ComboType type,
                                                const std::vector<RunnerId>& legs) const = 0;
};

using PayoutModelPtr = std::shared_ptr<const PayoutModel>;

struct RunnerCalibration {
    std::optional<double> win;
    std::optional<double> place;
};

// Dividends priced from the market itself: (1 - takeout) / P_market(basket), where P_market
// applies the finish model to overround-free win probabilities.
class CalibratedPayoutModel : public PayoutModel {
public:
    CalibratedPayoutModel(const RaceSnapshot& market,
                          std::map<RunnerId, RunnerCalibration> calibration,
                          Timestamp calibratedAt,
                          std::map<ComboType, double> takeout,
                          FinishModelSettings finish);

    Timestamp calibratedAt() const override { return calibratedAt_; }
    std::optional<double> probability(const RunnerId& id, Market market) const override;
    std::optional<double> comboDividend(ComboType type,
                                        const std::vector<RunnerId>& legs) const override;

private:
    std::vector<RunnerId> field_;
    std::vector<double> marketProbabilities_;
    bool marketUsable_ = false;
    std::map<RunnerId, RunnerCalibration> calibration_;
    Timestamp calibratedAt_;
    std::map<ComboType, double> takeout_;
    FinishModelSettings finish_;
};

} // namespace gpi
