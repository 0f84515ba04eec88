#include "staking.hpp"

#include "config.hpp"
#include "deterministic_math.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace gpi {

namespace {

void checkPolicy(const StakingPolicy& policy) {
    if (!policy.budget.isPositive()) {
        throw AllocationFailure("budget must be positive");
    }
    if (!policy.minStakeIncrement.isPositive()) {
        throw AllocationFailure("minimum stake increment must be positive");
    }
    if (policy.minStakeIncrement > policy.budget) {
        throw AllocationFailure("minimum stake increment exceeds budget");
    }
    if (!(policy.kellyFraction > 0.0 && policy.kellyFraction <= 1.0)) {
        throw AllocationFailure("kelly fraction must be in (0, 1]");
    }
    if (!(policy.exposureCapFraction > 0.0 && policy.exposureCapFraction <= 1.0)) {
        throw AllocationFailure("exposure cap fraction must be in (0, 1]");
    }
}

struct Leg {
    Estimate estimate;
    Money stake;
};

} // namespace

Money Allocation::totalStake() const {
    Money total;
    for (const auto& t : tickets) {
        total += t.stake;
    }
    return total;
}

Money Allocation::exposure(const RunnerId& runner) const {
    Money total;
    for (const auto& t : tickets) {
        if (std::find(t.runners.begin(), t.runners.end(), runner) != t.runners.end()) {
            total += t.stake;
        }
    }
    return total;
}

StakingPolicy stakingPolicyFrom(const GpiConfig& cfg) {
    StakingPolicy policy;
    policy.budget = cfg.budget;
    policy.kellyFraction = cfg.kellyFraction;
    policy.exposureCapFraction = cfg.exposureCapFraction;
    policy.minStakeIncrement = cfg.minStakeIncrement;
    policy.maxTickets = cfg.maxTicketsPerRace;
    return policy;
}

Money kellyStake(const Estimate& estimate, const StakingPolicy& policy) {
    double fStar = 0.0;
    try {
        fStar = DeterministicMath::kellyFraction(estimate.probability, estimate.decimalOdds);
    } catch (const std::domain_error& ex) {
        throw EstimationFailure(estimate.label() + ": " + ex.what());
    }
    Money stake = policy.budget.scaledDown(policy.kellyFraction * fStar);
    if (stake < Money()) {
        return Money();
    }
    return minMoney(stake, policy.budget);
}

Allocation allocate(const std::vector<Estimate>& qualifying, const StakingPolicy& policy) {
    checkPolicy(policy);

    Allocation allocation;

    std::vector<Estimate> singles;
    std::vector<Estimate> combos;
    for (const auto& est : qualifying) {
        (est.kind == BetKind::Single ? singles : combos).push_back(est);
    }

    std::vector<Leg> legs;
    if (const Estimate* best = selectBest(singles)) {
        legs.push_back(Leg{ *best, Money() });
    }
    if (const Estimate* best = selectBest(combos)) {
        legs.push_back(Leg{ *best, Money() });
    }

    for (auto& leg : legs) {
        leg.stake = kellyStake(leg.estimate, policy);
        if (leg.stake.isZero()) {
            allocation.notes.push_back(
                AllocationNote{ ReasonCode::NoEdge, leg.estimate.label(), "kelly fraction is zero" });
        }
    }

    const Money cap = policy.budget.scaledDown(policy.exposureCapFraction);
    std::map<RunnerId, Money> exposure;
    for (auto& leg : legs) {
        Money room = cap;
        for (const auto& runner : leg.estimate.involvedRunners) {
            Money used = exposure[runner];
            room = minMoney(room, used < cap ? cap - used : Money());
        }
        if (leg.stake > room) {
            allocation.notes.push_back(AllocationNote{ ReasonCode::ExposureCapped, leg.estimate.label(),
                                                       "stake " + leg.stake.format() + " capped to " +
                                                           room.format() });
            leg.stake = room;
        }
        for (const auto& runner : leg.estimate.involvedRunners) {
            exposure[runner] += leg.stake;
        }
    }

    Money committed;
    for (auto& leg : legs) {
        Money room = committed < policy.budget ? policy.budget - committed : Money();
        if (leg.stake > room) {
            allocation.notes.push_back(AllocationNote{ ReasonCode::BudgetScaled, leg.estimate.label(),
                                                       "stake " + leg.stake.format() + " scaled to " +
                                                           room.format() });
            leg.stake = room;
        }
        committed += leg.stake;
    }

    for (auto& leg : legs) {
        if (leg.stake.isZero()) {
            continue;
        }
        Money rounded = leg.stake.floorTo(policy.minStakeIncrement);
        if (rounded.isZero()) {
            allocation.notes.push_back(AllocationNote{ ReasonCode::StakeBelowIncrement, leg.estimate.label(),
                                                       "stake " + leg.stake.format() + " below increment " +
                                                           policy.minStakeIncrement.format() });
        }
        leg.stake = rounded;
    }

    for (const auto& leg : legs) {
        if (leg.stake.isZero()) {
            continue;
        }
        if (allocation.tickets.size() >= policy.maxTickets) {
            allocation.notes.push_back(
                AllocationNote{ ReasonCode::TicketLimit, leg.estimate.label(), "ticket limit reached" });
            continue;
        }
        Ticket ticket;
        ticket.kind = leg.estimate.kind;
        ticket.stake = leg.stake;
        ticket.runners = leg.estimate.involvedRunners;
        ticket.estimate = leg.estimate;
        allocation.tickets.push_back(std::move(ticket));
    }
    return allocation;
}

} // namespace gpi
