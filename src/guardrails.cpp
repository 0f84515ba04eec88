#include "guardrails.hpp"

#include "config.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace gpi {

namespace {

std::string formatRatio(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

std::string below(const char* metric, double value, double threshold) {
    return std::string(metric) + " " + formatRatio(value) + " below " + formatRatio(threshold);
}

void checkFresh(GuardrailVerdict& verdict,
                const char* field,
                Timestamp captured,
                Timestamp now,
                std::int64_t maxAge) {
    if (!isStale(captured, now, maxAge)) {
        return;
    }
    std::string note = std::string("stale input: ") + field;
    if (captured != Timestamp{} && captured > now) {
        note += " captured after now";
    }
    verdict.reject(ReasonCode::StaleInput, std::move(note));
}

std::optional<double> weighted(const std::vector<StakedEstimate>& tickets, bool roi) {
    double total = 0.0;
    double acc = 0.0;
    for (const auto& t : tickets) {
        if (t.estimate == nullptr || t.stake <= 0.0) {
            continue;
        }
        total += t.stake;
        acc += t.stake * (roi ? t.estimate->roiRatio : t.estimate->evRatio);
    }
    if (total <= 0.0) {
        return std::nullopt;
    }
    return acc / total;
}

} // namespace

const char* toString(GuardrailStage stage) {
    switch (stage) {
    case GuardrailStage::Market:
        return "market";
    case GuardrailStage::Single:
        return "single";
    case GuardrailStage::Combo:
        return "combo";
    case GuardrailStage::Global:
        return "global";
    }
    return "unknown";
}

void GuardrailVerdict::reject(ReasonCode code, std::string note) {
    passed = false;
    reasons.push_back(GuardrailReason{ code, std::move(note) });
}

ReasonCode GuardrailVerdict::firstReason() const {
    return reasons.empty() ? ReasonCode::None : reasons.front().code;
}

const char* toString(OverroundBand band) {
    switch (band) {
    case OverroundBand::Standard:
        return "standard";
    case OverroundBand::LargeHandicap:
        return "handicap";
    case OverroundBand::TrotSmallField:
        return "trot small field";
    }
    return "unknown";
}

bool isStale(Timestamp captured, Timestamp now, std::int64_t maxAgeSeconds) {
    if (captured == Timestamp{} || captured > now) {
        return true;
    }
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - captured).count();
    return age > maxAgeSeconds;
}

OverroundBand overroundBandFor(const RaceSnapshot& snapshot, const GpiConfig& cfg) {
    const std::size_t starters = snapshot.starterCount();
    if (snapshot.discipline == Discipline::Trot && starters <= cfg.trotSmallFieldMaxStarters) {
        return OverroundBand::TrotSmallField;
    }
    if (snapshot.handicap && starters >= cfg.handicapMinStarters) {
        return OverroundBand::LargeHandicap;
    }
    return OverroundBand::Standard;
}

double overroundCeilingFor(const RaceSnapshot& snapshot, const GpiConfig& cfg) {
    switch (overroundBandFor(snapshot, cfg)) {
    case OverroundBand::LargeHandicap:
        return cfg.overroundCeilingHandicap;
    case OverroundBand::TrotSmallField:
        return cfg.overroundCeilingTrotSmallField;
    case OverroundBand::Standard:
        break;
    }
    return cfg.overroundCeiling;
}

GuardrailVerdict evaluateMarket(const RaceSnapshot& snapshot,
                                std::optional<Timestamp> calibratedAt,
                                Timestamp now,
                                const GpiConfig& cfg) {
    GuardrailVerdict verdict;
    verdict.stage = GuardrailStage::Market;
    verdict.subject = snapshot.raceId;

    const std::int64_t maxAge = cfg.freshnessMaxAgeSeconds;
    checkFresh(verdict, "odds", snapshot.inputs.odds, now, maxAge);
    checkFresh(verdict, "runners", snapshot.inputs.runners, now, maxAge);
    checkFresh(verdict, "scratches", snapshot.inputs.scratches, now, maxAge);
    if (calibratedAt) {
        checkFresh(verdict, "calibration", *calibratedAt, now, maxAge);
    }
    if (!verdict.passed) {
        return verdict;
    }

    auto overround = snapshot.overround();
    if (!overround) {
        verdict.reject(ReasonCode::OverroundUnavailable, "overround cannot be computed");
        return verdict;
    }
    const OverroundBand band = overroundBandFor(snapshot, cfg);
    double ceiling = overroundCeilingFor(snapshot, cfg);
    if (*overround > ceiling) {
        std::string note = "overround " + formatRatio(*overround) + " above " + formatRatio(ceiling);
        if (band != OverroundBand::Standard) {
            note += std::string(" (") + toString(band) + ")";
        }
        verdict.reject(ReasonCode::OverroundTooHigh, std::move(note));
    }
    return verdict;
}

GuardrailVerdict evaluateSingle(const Estimate& estimate, const GpiConfig& cfg) {
    GuardrailVerdict verdict;
    verdict.stage = GuardrailStage::Single;
    verdict.subject = estimate.label();

    if (!std::isfinite(estimate.evRatio) || estimate.evRatio < cfg.evMinSp) {
        verdict.reject(ReasonCode::SpEvTooLow, below("ev", estimate.evRatio, cfg.evMinSp));
    }
    if (!std::isfinite(estimate.roiRatio) || estimate.roiRatio < cfg.roiMinSp) {
        verdict.reject(ReasonCode::SpRoiTooLow, below("roi", estimate.roiRatio, cfg.roiMinSp));
    }
    if (!estimate.runnerWinOdds || !std::isfinite(*estimate.runnerWinOdds)) {
        verdict.reject(ReasonCode::SpOddsOutOfBand, "win odds missing");
    } else if (*estimate.runnerWinOdds < cfg.spMinOdds || *estimate.runnerWinOdds > cfg.spMaxOdds) {
        verdict.reject(ReasonCode::SpOddsOutOfBand,
                       "win odds " + formatRatio(*estimate.runnerWinOdds) + " outside " +
                           formatRatio(cfg.spMinOdds) + "-" + formatRatio(cfg.spMaxOdds));
    }
    if (!estimate.winProbability || !std::isfinite(*estimate.winProbability)) {
        verdict.reject(ReasonCode::SpProbabilityTooHigh, "win probability missing");
    } else if (*estimate.winProbability > cfg.spMaxProbability) {
        verdict.reject(ReasonCode::SpProbabilityTooHigh,
                       "win probability " + formatRatio(*estimate.winProbability) + " above " +
                           formatRatio(cfg.spMaxProbability));
    }
    return verdict;
}

GuardrailVerdict evaluateCombo(const Estimate& estimate, const GpiConfig& cfg) {
    GuardrailVerdict verdict;
    verdict.stage = GuardrailStage::Combo;
    verdict.subject = estimate.label();

    if (!std::isfinite(estimate.evRatio) || !std::isfinite(estimate.roiRatio) ||
        !std::isfinite(estimate.expectedPayout)) {
        verdict.reject(ReasonCode::ComboMetricMissing, "combination metric missing");
        return verdict;
    }
    if (estimate.evRatio < cfg.evMinCombo) {
        verdict.reject(ReasonCode::ComboEvTooLow, below("ev", estimate.evRatio, cfg.evMinCombo));
    }
    if (estimate.roiRatio < cfg.roiMinCombo) {
        verdict.reject(ReasonCode::ComboRoiTooLow, below("roi", estimate.roiRatio, cfg.roiMinCombo));
    }
    if (estimate.expectedPayout < cfg.minPayoutCombo) {
        verdict.reject(ReasonCode::ComboPayoutTooLow,
                       below("payout", estimate.expectedPayout, cfg.minPayoutCombo));
    }
    return verdict;
}

GuardrailVerdict evaluateCandidate(const Estimate& estimate, const GpiConfig& cfg) {
    return estimate.kind == BetKind::Single ? evaluateSingle(estimate, cfg)
                                            : evaluateCombo(estimate, cfg);
}

std::optional<double> stakeWeightedEv(const std::vector<StakedEstimate>& tickets) {
    return weighted(tickets, false);
}

std::optional<double> stakeWeightedRoi(const std::vector<StakedEstimate>& tickets) {
    return weighted(tickets, true);
}

GuardrailVerdict evaluateGlobal(const std::vector<StakedEstimate>& tickets, const GpiConfig& cfg) {
    GuardrailVerdict verdict;
    verdict.stage = GuardrailStage::Global;
    verdict.subject = "race";

    bool hasCombo = false;
    for (const auto& t : tickets) {
        if (t.estimate != nullptr && t.estimate->kind == BetKind::Combo && t.stake > 0.0) {
            hasCombo = true;
        }
    }
    if (!hasCombo) {
        return verdict;
    }

    auto ev = stakeWeightedEv(tickets);
    if (!ev || *ev < cfg.evMinGlobal) {
        verdict.reject(ReasonCode::GlobalEvTooLow, below("global ev", ev.value_or(0.0), cfg.evMinGlobal));
    }
    return verdict;
}

} // namespace gpi
