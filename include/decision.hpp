#pragma once

#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "estimator.hpp"
#include "guardrails.hpp"
#include "money.hpp"
#include "phase.hpp"
#include "snapshot.hpp"
#include "staking.hpp"

namespace gpi {

enum class DriftClass { Steam, Drift, Stable };

const char* toString(DriftClass drift);

// Odds move of one runner between the H30 and H5 snapshots.
struct RunnerDrift {
    RunnerId runner;
    double h30Odds = 0.0;
    double h5Odds = 0.0;
    double change = 0.0;
    DriftClass drift = DriftClass::Stable;
};

// change = h5 / h30 - 1. Runners scratched or absent at either checkpoint are skipped.
std::vector<RunnerDrift> computeDrift(const RaceSnapshot& h30,
                                      const RaceSnapshot& h5,
                                      double threshold);

struct TicketSettlement {
    std::string ticketId;
    Money stake;
    bool hit = false;
    // Unset when the ticket hit but the official dividend is not published yet.
    std::optional<Money> grossReturn;
};

struct Reconciliation {
    std::vector<RunnerId> arrival;
    std::vector<TicketSettlement> settlements;
    Money totalStake;
    std::optional<Money> totalReturn;
    std::optional<Money> net;
};

// Emitted once per phase invocation and never mutated afterwards. Carries no invocation
// clock: retries over unchanged inputs render identically.
struct Decision {
    Phase phase = Phase::H30;
    std::string meetingId;
    std::string raceId;
    bool abstain = true;
    ReasonCode reason = ReasonCode::None;
    std::string message;
    std::vector<Ticket> tickets;

    std::optional<double> evGlobalEstimate;
    std::optional<double> roiGlobalEstimate;
    std::optional<double> overround;
    std::optional<bool> marketGuardrailPassed;

    std::optional<Timestamp> snapshotCapturedAt;
    std::optional<Timestamp> calibratedAt;

    std::vector<RunnerDrift> drift;
    std::optional<Reconciliation> reconciliation;
};

// Everything the sink needs to audit how the decision was reached.
struct AuditTrail {
    std::vector<GuardrailVerdict> verdicts;
    std::vector<Estimate> estimates;
    std::vector<AllocationNote> allocationNotes;
    std::vector<std::string> estimationFailures;
    std::vector<std::string> warnings;
};

struct PhaseOutcome {
    Decision decision;
    AuditTrail trail;
    std::optional<RaceSnapshot> snapshot;
};

} // namespace gpi
