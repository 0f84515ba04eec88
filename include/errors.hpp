#pragma once

#include <stdexcept>
#include <string>

namespace gpi {

// Machine-readable codes attached to every rejection and abstention.
enum class ReasonCode {
    None,
    StaleInput,
    OverroundUnavailable,
    OverroundTooHigh,
    SpEvTooLow,
    SpRoiTooLow,
    SpProbabilityTooHigh,
    SpOddsOutOfBand,
    ComboEvTooLow,
    ComboRoiTooLow,
    ComboPayoutTooLow,
    ComboMetricMissing,
    GlobalEvTooLow,
    EnrichmentMissing,
    DataUnavailable,
    EstimationFailed,
    NoEdge,
    ExposureCapped,
    BudgetScaled,
    StakeBelowIncrement,
    TicketLimit,
    NoQualifyingLeg,
    StaleReversal,
    Preliminary,
    ResultOnly,
};

const char* toString(ReasonCode code);

// Malformed or missing configuration. Fatal for the invocation.
class ConfigInvalid : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Arithmetic configuration that cannot be allocated against (negative budget, zero increment).
class AllocationFailure : public ConfigInvalid {
public:
    using ConfigInvalid::ConfigInvalid;
};

// Snapshot, enrichment, calibration or result data missing or unusable.
class DataUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Probability/odds inconsistency for a single candidate; degrades that candidate only.
class EstimationFailure : public DataUnavailable {
public:
    using DataUnavailable::DataUnavailable;
};

class UnknownPhase : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class InvocationCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConcurrentInvocation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace gpi
