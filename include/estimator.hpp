#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bet_types.hpp"
#include "finish_order.hpp"
#include "payout_model.hpp"
#include "snapshot.hpp"

namespace gpi {

struct GpiConfig;

// Derived per invocation from the current snapshot and payout model; never carried over.
struct Estimate {
    BetKind kind = BetKind::Single;
    std::optional<ComboType> comboType;
    Market market = Market::Win;
    std::vector<RunnerId> involvedRunners;
    double probability = 0.0;
    double decimalOdds = 0.0;
    double evRatio = 0.0;
    double roiRatio = 0.0;
    double expectedPayout = 0.0;
    bool simulated = false;

    // Singles only: the runner's win odds and calibrated win probability, set whatever
    // market the ticket is placed on.
    std::optional<double> runnerWinOdds;
    std::optional<double> winProbability;

    std::string label() const;
};

struct EstimatorSettings {
    Market spMarket = Market::Place;
    double roiPayoutHaircut = 0.0;
    FinishModelSettings finish;
};

EstimatorSettings estimatorSettingsFrom(const GpiConfig& cfg);

class EvEstimator {
public:
    virtual ~EvEstimator() = default;

    // Throws EstimationFailure when the runner's odds or probability are missing or
    // non-positive; never substitutes a default.
    virtual Estimate estimateSingle(const RaceSnapshot& snapshot,
                                    const RunnerId& runner,
                                    const PayoutModel& model,
                                    const EstimatorSettings& settings) const = 0;

    virtual Estimate estimateCombo(const RaceSnapshot& snapshot,
                                   ComboType type,
                                   const std::vector<RunnerId>& legs,
                                   const PayoutModel& model,
                                   const EstimatorSettings& settings) const = 0;
};

// evRatio = p * (odds - 1) - (1 - p) with calibrated p.
// roiRatio = p * odds * (1 - roiPayoutHaircut) - 1, the return after late-money dilution.
// Combination hit probabilities come from finish_order.hpp over calibrated win probabilities.
class CalibratedEstimator : public EvEstimator {
public:
    Estimate estimateSingle(const RaceSnapshot& snapshot,
                            const RunnerId& runner,
                            const PayoutModel& model,
                            const EstimatorSettings& settings) const override;

    Estimate estimateCombo(const RaceSnapshot& snapshot,
                           ComboType type,
                           const std::vector<RunnerId>& legs,
                           const PayoutModel& model,
                           const EstimatorSettings& settings) const override;
};

// Highest evRatio; ties go to the higher expectedPayout, then the lexicographically smaller
// label so the choice never depends on input order. nullptr for an empty set.
const Estimate* selectBest(const std::vector<Estimate>& candidates);

} // namespace gpi
