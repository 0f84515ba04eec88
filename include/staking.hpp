#pragma once

#include <string>
#include <vector>

#include "errors.hpp"
#include "estimator.hpp"
#include "money.hpp"

namespace gpi {

struct GpiConfig;

struct Ticket {
    std::string id;
    BetKind kind = BetKind::Single;
    Money stake;
    std::vector<RunnerId> runners;
    Estimate estimate;
};

// Why a stake was reduced or a leg dropped during allocation.
struct AllocationNote {
    ReasonCode code = ReasonCode::None;
    std::string leg;
    std::string note;
};

struct Allocation {
    std::vector<Ticket> tickets;
    std::vector<AllocationNote> notes;

    Money totalStake() const;
    // Stake on tickets naming the runner.
    Money exposure(const RunnerId& runner) const;
};

struct StakingPolicy {
    Money budget;
    double kellyFraction = 0.0;
    double exposureCapFraction = 0.0;
    Money minStakeIncrement;
    std::size_t maxTickets = 0;
};

StakingPolicy stakingPolicyFrom(const GpiConfig& cfg);

// Fractional Kelly over the best qualifying candidate of each kind, then the exposure cap,
// the race budget, the stake increment and the ticket limit, in that order. Singles keep
// priority over combinations at every step. Throws AllocationFailure for a policy that
// cannot be allocated against.
//   - sum of stakes <= budget
//   - per-runner exposure <= exposureCapFraction * budget
//   - every stake is a positive multiple of minStakeIncrement
Allocation allocate(const std::vector<Estimate>& qualifying, const StakingPolicy& policy);

// Stake before caps: budget * kellyFraction * f*, clamped to [0, budget].
Money kellyStake(const Estimate& estimate, const StakingPolicy& policy);

} // namespace gpi
