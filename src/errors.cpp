#include "errors.hpp"

namespace gpi {

const char* toString(ReasonCode code) {
    switch (code) {
    case ReasonCode::None:
        return "NONE";
    case ReasonCode::StaleInput:
        return "STALE_INPUT";
    case ReasonCode::OverroundUnavailable:
        return "OVERROUND_UNAVAILABLE";
    case ReasonCode::OverroundTooHigh:
        return "OVERROUND_TOO_HIGH";
    case ReasonCode::SpEvTooLow:
        return "SP_EV_TOO_LOW";
    case ReasonCode::SpRoiTooLow:
        return "SP_ROI_TOO_LOW";
    case ReasonCode::SpProbabilityTooHigh:
        return "SP_PROBABILITY_TOO_HIGH";
    case ReasonCode::SpOddsOutOfBand:
        return "SP_ODDS_OUT_OF_BAND";
    case ReasonCode::ComboEvTooLow:
        return "COMBO_EV_TOO_LOW";
    case ReasonCode::ComboRoiTooLow:
        return "COMBO_ROI_TOO_LOW";
    case ReasonCode::ComboPayoutTooLow:
        return "COMBO_PAYOUT_TOO_LOW";
    case ReasonCode::ComboMetricMissing:
        return "COMBO_METRIC_MISSING";
    case ReasonCode::GlobalEvTooLow:
        return "GLOBAL_EV_TOO_LOW";
    case ReasonCode::EnrichmentMissing:
        return "ENRICHMENT_MISSING";
    case ReasonCode::DataUnavailable:
        return "DATA_UNAVAILABLE";
    case ReasonCode::EstimationFailed:
        return "ESTIMATION_FAILED";
    case ReasonCode::NoEdge:
        return "NO_EDGE";
    case ReasonCode::ExposureCapped:
        return "EXPOSURE_CAPPED";
    case ReasonCode::BudgetScaled:
        return "BUDGET_SCALED";
    case ReasonCode::StakeBelowIncrement:
        return "STAKE_BELOW_INCREMENT";
    case ReasonCode::TicketLimit:
        return "TICKET_LIMIT";
    case ReasonCode::NoQualifyingLeg:
        return "NO_QUALIFYING_LEG";
    case ReasonCode::StaleReversal:
        return "STALE_REVERSAL";
    case ReasonCode::Preliminary:
        return "PRELIMINARY";
    case ReasonCode::ResultOnly:
        return "RESULT_ONLY";
    }
    return "UNKNOWN";
}

} // namespace gpi
