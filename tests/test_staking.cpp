#include "config.hpp"
#include "errors.hpp"
#include "staking.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "staking_test failure: " << msg << std::endl;
    std::exit(1);
}

gpi::Estimate single(const std::string& runner, double p, double odds) {
    gpi::Estimate est;
    est.kind = gpi::BetKind::Single;
    est.market = gpi::Market::Win;
    est.involvedRunners = { runner };
    est.probability = p;
    est.decimalOdds = odds;
    est.evRatio = p * (odds - 1.0) - (1.0 - p);
    est.roiRatio = est.evRatio;
    est.expectedPayout = odds;
    return est;
}

gpi::Estimate combo(std::vector<gpi::RunnerId> runners, double p, double dividend) {
    gpi::Estimate est;
    est.kind = gpi::BetKind::Combo;
    est.comboType = runners.size() == 3 ? gpi::ComboType::Trio : gpi::ComboType::CouplePlace;
    est.involvedRunners = std::move(runners);
    est.probability = p;
    est.decimalOdds = dividend;
    est.evRatio = p * dividend - 1.0;
    est.roiRatio = est.evRatio;
    est.expectedPayout = dividend;
    return est;
}

bool hasNote(const gpi::Allocation& allocation, gpi::ReasonCode code) {
    for (const auto& note : allocation.notes) {
        if (note.code == code) {
            return true;
        }
    }
    return false;
}

void checkInvariants(const gpi::Allocation& allocation, const gpi::StakingPolicy& policy, const std::string& where) {
    if (allocation.totalStake() > policy.budget) {
        fail(where + ": total stake exceeds budget");
    }
    gpi::Money cap = policy.budget.scaledDown(policy.exposureCapFraction);
    int singles = 0;
    int combos = 0;
    for (const auto& ticket : allocation.tickets) {
        if (!ticket.stake.isPositive() || ticket.stake.floorTo(policy.minStakeIncrement) != ticket.stake) {
            fail(where + ": stake " + ticket.stake.format() + " is not a positive increment multiple");
        }
        for (const auto& runner : ticket.runners) {
            if (allocation.exposure(runner) > cap) {
                fail(where + ": exposure on runner " + runner + " above cap");
            }
        }
        (ticket.kind == gpi::BetKind::Single ? singles : combos) += 1;
    }
    if (singles > 1 || combos > 1 || allocation.tickets.size() > policy.maxTickets) {
        fail(where + ": ticket cap violated");
    }
}

} // namespace

int main() {
    using namespace gpi;

    const StakingPolicy policy = stakingPolicyFrom(defaultGpiConfig());

    // Scenario A: ev 0.50 at odds 5.0, budget 5.00, half Kelly.
    {
        Allocation allocation = allocate({ single("1", 0.30, 5.0) }, policy);
        if (allocation.tickets.size() != 1) {
            fail("scenario A should produce one SP ticket");
        }
        const Ticket& ticket = allocation.tickets.front();
        if (!ticket.stake.isPositive() || ticket.stake > Money::fromDouble(3.00)) {
            fail("scenario A stake out of (0, 3.00]");
        }
        if (ticket.stake != Money::fromDouble(0.30)) {
            fail("half Kelly of f*=0.125 on 5.00 should floor to 0.30, got " + ticket.stake.format());
        }
        std::int64_t raw = kellyStake(single("1", 0.30, 5.0), policy).micros();
        if (raw < 312'499 || raw > 312'500) {
            fail("raw Kelly stake should be 0.3125 before rounding");
        }
        checkInvariants(allocation, policy, "scenario A");
    }

    // Exposure cap clamps the SP leg to 0.60 x budget.
    StakingPolicy fullKelly = policy;
    fullKelly.kellyFraction = 1.0;
    {
        Allocation allocation = allocate({ single("1", 0.90, 10.0) }, fullKelly);
        if (allocation.tickets.size() != 1 || allocation.tickets.front().stake != Money::fromDouble(3.00)) {
            fail("exposure cap did not clamp to 3.00");
        }
        if (!hasNote(allocation, ReasonCode::ExposureCapped)) {
            fail("exposure clamp not recorded");
        }
    }

    // A combination sharing the capped runner has no room left and is dropped.
    {
        Allocation allocation =
            allocate({ single("1", 0.90, 10.0), combo({ "1", "2" }, 0.50, 20.0) }, fullKelly);
        if (allocation.tickets.size() != 1 || allocation.tickets.front().kind != BetKind::Single) {
            fail("combo on an exhausted runner survived");
        }
        checkInvariants(allocation, fullKelly, "shared runner");
    }

    // SP has priority: the combination is scaled down to fit the budget.
    {
        Allocation allocation =
            allocate({ combo({ "2", "3", "4" }, 0.50, 20.0), single("1", 0.90, 10.0) }, fullKelly);
        if (allocation.tickets.size() != 2) {
            fail("both legs should survive budget scaling");
        }
        if (allocation.tickets[0].kind != BetKind::Single || allocation.tickets[0].stake != Money::fromDouble(3.00)) {
            fail("SP leg was reduced instead of the combination");
        }
        if (allocation.tickets[1].stake != Money::fromDouble(2.00) || !hasNote(allocation, ReasonCode::BudgetScaled)) {
            fail("combination not scaled to the remaining 2.00");
        }
        checkInvariants(allocation, fullKelly, "budget scaling");
    }

    // Stakes that round to zero abstain that leg; no edge means no stake.
    {
        Allocation tiny = allocate({ single("1", 0.21, 5.0) }, policy);
        if (!tiny.tickets.empty() || !hasNote(tiny, ReasonCode::StakeBelowIncrement)) {
            fail("stake below increment not dropped with a note");
        }
        Allocation none = allocate({ single("1", 0.10, 5.0) }, policy);
        if (!none.tickets.empty() || !hasNote(none, ReasonCode::NoEdge)) {
            fail("negative edge staked");
        }
        if (!allocate({}, policy).tickets.empty()) {
            fail("empty candidate set produced tickets");
        }
    }

    // Best candidate per kind only; the ticket limit keeps the SP leg.
    {
        Allocation allocation = allocate({ single("1", 0.30, 5.0), single("2", 0.40, 5.0) }, policy);
        if (allocation.tickets.size() != 1 || allocation.tickets.front().runners.front() != "2") {
            fail("best single not selected");
        }
        StakingPolicy oneTicket = policy;
        oneTicket.maxTickets = 1;
        Allocation limited =
            allocate({ combo({ "2", "3", "4" }, 0.10, 20.0), single("1", 0.40, 5.0) }, oneTicket);
        if (limited.tickets.size() != 1 || limited.tickets.front().kind != BetKind::Single ||
            !hasNote(limited, ReasonCode::TicketLimit)) {
            fail("ticket limit did not favour the SP leg");
        }
    }

    // Invariants across a grid of candidate pairs.
    for (double p = 0.05; p < 0.95; p += 0.05) {
        for (double odds : { 1.2, 2.0, 3.5, 6.0, 15.0, 40.0 }) {
            for (double kf : { 0.25, 0.5, 1.0 }) {
                StakingPolicy grid = policy;
                grid.kellyFraction = kf;
                Allocation allocation =
                    allocate({ single("1", p, odds), combo({ "1", "2" }, p / 2.0, odds * 3.0) }, grid);
                checkInvariants(allocation, grid, "grid p=" + std::to_string(p) + " odds=" + std::to_string(odds));
            }
        }
    }

    // Arithmetic policy errors are fatal.
    {
        StakingPolicy broken = policy;
        broken.budget = Money();
        bool threw = false;
        try {
            (void)allocate({ single("1", 0.30, 5.0) }, broken);
        } catch (const AllocationFailure&) {
            threw = true;
        }
        if (!threw) {
            fail("zero budget accepted");
        }
        broken = policy;
        broken.minStakeIncrement = Money();
        threw = false;
        try {
            (void)allocate({ single("1", 0.30, 5.0) }, broken);
        } catch (const AllocationFailure&) {
            threw = true;
        }
        if (!threw) {
            fail("zero increment accepted");
        }
    }

    std::cout << "Staking checks passed.\n";
    return 0;
}
