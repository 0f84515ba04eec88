#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "estimator.hpp"
#include "snapshot.hpp"

namespace gpi {

struct GpiConfig;

enum class GuardrailStage { Market, Single, Combo, Global };

const char* toString(GuardrailStage stage);

struct GuardrailReason {
    ReasonCode code = ReasonCode::None;
    std::string note;
};

// Pure outcome of one check stage. Never mutates the snapshot or estimate it judged.
struct GuardrailVerdict {
    GuardrailStage stage = GuardrailStage::Market;
    bool passed = true;
    std::vector<GuardrailReason> reasons;
    std::string subject;

    void reject(ReasonCode code, std::string note);
    ReasonCode firstReason() const;
};

// Overround ceiling family chosen from race type and starter count.
enum class OverroundBand { Standard, LargeHandicap, TrotSmallField };

const char* toString(OverroundBand band);

OverroundBand overroundBandFor(const RaceSnapshot& snapshot, const GpiConfig& cfg);
double overroundCeilingFor(const RaceSnapshot& snapshot, const GpiConfig& cfg);

// True when the capture time is unset, older than maxAgeSeconds, or later than now.
bool isStale(Timestamp captured, Timestamp now, std::int64_t maxAgeSeconds);

// Freshness of odds, runners, scratches and calibration against now, then the overround
// ceiling. Overround is recomputed from the snapshot; a stale snapshot short-circuits.
// H30 passes no calibration time and skips that field.
GuardrailVerdict evaluateMarket(const RaceSnapshot& snapshot,
                                std::optional<Timestamp> calibratedAt,
                                Timestamp now,
                                const GpiConfig& cfg);

// EV and ROI minimums, the win-odds band and the cap on the calibrated win probability.
GuardrailVerdict evaluateSingle(const Estimate& estimate, const GpiConfig& cfg);

// A missing or non-finite metric fails the check with ComboMetricMissing.
GuardrailVerdict evaluateCombo(const Estimate& estimate, const GpiConfig& cfg);

GuardrailVerdict evaluateCandidate(const Estimate& estimate, const GpiConfig& cfg);

struct StakedEstimate {
    const Estimate* estimate = nullptr;
    double stake = 0.0;
};

// Stake-weighted EV over the retained tickets; std::nullopt when nothing is staked.
std::optional<double> stakeWeightedEv(const std::vector<StakedEstimate>& tickets);
std::optional<double> stakeWeightedRoi(const std::vector<StakedEstimate>& tickets);

// Only applied when a combination ticket is retained. A failure costs the combination
// leg only; an SP ticket alone is never gated here.
GuardrailVerdict evaluateGlobal(const std::vector<StakedEstimate>& tickets, const GpiConfig& cfg);

} // namespace gpi
