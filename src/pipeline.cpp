#include "pipeline.hpp"

#include "errors.hpp"
#include "guardrails.hpp"
#include "staking.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gpi {

namespace {

Decision baseDecision(const PhaseRequest& request) {
    Decision decision;
    decision.phase = request.phase;
    decision.meetingId = request.meetingId;
    decision.raceId = request.raceId;
    decision.abstain = true;
    return decision;
}

void abstainWith(Decision& decision, ReasonCode code, std::string message) {
    decision.abstain = true;
    decision.tickets.clear();
    decision.reason = code;
    decision.message = std::move(message);
}

std::string joinNotes(const GuardrailVerdict& verdict) {
    std::string out;
    for (const auto& reason : verdict.reasons) {
        if (!out.empty()) {
            out += "; ";
        }
        out += reason.note;
    }
    return out;
}

RaceSnapshot fetchChecked(SnapshotSource& source, const PhaseRequest& request) {
    RaceSnapshot snapshot = source.fetchSnapshot(request.raceId, request.phase);
    if (snapshot.raceId != request.raceId) {
        throw DataUnavailable("snapshot is for race " + snapshot.raceId + ", expected " + request.raceId);
    }
    if (snapshot.phase != request.phase) {
        throw DataUnavailable(std::string("snapshot captured for ") + toString(snapshot.phase) +
                              ", expected " + toString(request.phase));
    }
    validateSnapshot(snapshot);
    return snapshot;
}

void adoptSnapshot(Decision& decision, const RaceSnapshot& snapshot) {
    if (decision.meetingId.empty()) {
        decision.meetingId = snapshot.meetingId;
    }
    decision.snapshotCapturedAt = snapshot.capturedAt;
    decision.overround = snapshot.overround();
}

std::string formatFixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

// Candidate pool for combinations: strongest calibrated win probabilities, ties by id.
std::vector<RunnerId> comboPool(const RaceSnapshot& snapshot, const PayoutModel& model, std::size_t size) {
    std::vector<std::pair<double, RunnerId>> ranked;
    for (const Runner* runner : snapshot.activeRunners()) {
        auto p = model.probability(runner->id, Market::Win);
        ranked.emplace_back(p.value_or(0.0), runner->id);
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second < b.second;
    });
    std::vector<RunnerId> pool;
    for (std::size_t i = 0; i < ranked.size() && i < size; ++i) {
        pool.push_back(ranked[i].second);
    }
    return pool;
}

// Every k-subset of pool, in lexicographic index order.
std::vector<std::vector<RunnerId>> combinations(const std::vector<RunnerId>& pool, std::size_t k) {
    std::vector<std::vector<RunnerId>> out;
    if (k == 0 || k > pool.size()) {
        return out;
    }
    std::vector<std::size_t> idx(k);
    for (std::size_t i = 0; i < k; ++i) {
        idx[i] = i;
    }
    while (true) {
        std::vector<RunnerId> basket;
        for (auto i : idx) {
            basket.push_back(pool[i]);
        }
        out.push_back(std::move(basket));

        std::size_t pos = k;
        while (pos > 0 && idx[pos - 1] == pool.size() - k + (pos - 1)) {
            --pos;
        }
        if (pos == 0) {
            break;
        }
        ++idx[pos - 1];
        for (std::size_t j = pos; j < k; ++j) {
            idx[j] = idx[j - 1] + 1;
        }
    }
    return out;
}

std::vector<StakedEstimate> stakedOf(const std::vector<Ticket>& tickets) {
    std::vector<StakedEstimate> staked;
    for (const auto& ticket : tickets) {
        staked.push_back(StakedEstimate{ &ticket.estimate, ticket.stake.toDouble() });
    }
    return staked;
}

bool ticketHit(const Ticket& ticket, const OfficialResult& result) {
    std::size_t depth = 0;
    if (ticket.kind == BetKind::Single) {
        depth = ticket.estimate.market == Market::Win ? 1 : result.placesPaid;
    } else if (ticket.estimate.comboType) {
        depth = placesCovered(*ticket.estimate.comboType);
    }
    depth = std::min(depth, result.arrival.size());
    if (ticket.runners.empty()) {
        return false;
    }
    for (const auto& runner : ticket.runners) {
        auto end = result.arrival.begin() + static_cast<std::ptrdiff_t>(depth);
        if (std::find(result.arrival.begin(), end, runner) == end) {
            return false;
        }
    }
    return true;
}

} // namespace

void CancellationToken::throwIfCancelled(const char* stage) const {
    if (cancelled()) {
        throw InvocationCancelled(std::string("invocation cancelled before ") + stage);
    }
}

InFlightRegistry::Guard::Guard(InFlightRegistry& registry, std::pair<std::string, Phase> key)
    : registry_(registry), key_(std::move(key)) {}

InFlightRegistry::Guard::~Guard() {
    registry_.release(key_);
}

InFlightRegistry::Guard InFlightRegistry::acquire(const std::string& raceId, Phase phase) {
    std::pair<std::string, Phase> key{ raceId, phase };
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.insert(key).second) {
            throw ConcurrentInvocation(std::string(toString(phase)) + " already running for race " + raceId);
        }
    }
    return Guard(*this, std::move(key));
}

bool InFlightRegistry::isRunning(const std::string& raceId, Phase phase) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.count({ raceId, phase }) != 0;
}

void InFlightRegistry::release(const std::pair<std::string, Phase>& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(key);
}

std::string ticketId(const std::string& raceId, Phase phase, const Estimate& estimate) {
    return raceId + ":" + toString(phase) + ":" + estimate.label();
}

Reconciliation reconcile(const std::vector<Ticket>& tickets, const OfficialResult& result) {
    Reconciliation rec;
    rec.arrival = result.arrival;
    Money totalReturn;
    bool returnsKnown = true;
    for (const auto& ticket : tickets) {
        TicketSettlement settlement;
        settlement.ticketId = ticket.id;
        settlement.stake = ticket.stake;
        settlement.hit = ticketHit(ticket, result);
        if (!settlement.hit) {
            settlement.grossReturn = Money();
        } else {
            auto dividend = result.dividends.find(ticket.estimate.label());
            if (dividend != result.dividends.end()) {
                settlement.grossReturn = ticket.stake.scaledDown(dividend->second);
            }
        }
        rec.totalStake += ticket.stake;
        if (settlement.grossReturn) {
            totalReturn += *settlement.grossReturn;
        } else {
            returnsKnown = false;
        }
        rec.settlements.push_back(std::move(settlement));
    }
    if (returnsKnown) {
        rec.totalReturn = totalReturn;
        rec.net = totalReturn - rec.totalStake;
    }
    return rec;
}

DecisionPipeline::DecisionPipeline(PipelineCollaborators collaborators,
                                   std::shared_ptr<InFlightRegistry> registry)
    : collaborators_(std::move(collaborators)), registry_(std::move(registry)) {
    if (!collaborators_.snapshots || !collaborators_.calibration || !collaborators_.estimator) {
        throw std::invalid_argument("DecisionPipeline requires snapshot, calibration and estimator collaborators");
    }
    if (!registry_) {
        throw std::invalid_argument("DecisionPipeline requires an in-flight registry");
    }
}

PhaseOutcome DecisionPipeline::run(const PhaseRequest& request, const CancellationToken* token) const {
    validateGpiConfig(request.config);
    if (request.raceId.empty()) {
        throw std::invalid_argument("raceId must not be empty");
    }
    if (request.now == Timestamp{}) {
        throw std::invalid_argument("request time must be set");
    }

    auto guard = registry_->acquire(request.raceId, request.phase);
    switch (request.phase) {
    case Phase::H30:
        return runH30(request, token);
    case Phase::H5:
        return runH5(request, token);
    case Phase::Result:
        return runResult(request, token);
    }
    throw UnknownPhase("unrecognized phase value " + std::to_string(static_cast<int>(request.phase)));
}

DecisionArtifact DecisionPipeline::runAndPublish(const PhaseRequest& request,
                                                 ArtifactSink& sink,
                                                 const ArtifactSigner* signer,
                                                 const CancellationToken* token) const {
    PhaseOutcome outcome = run(request, token);
    DecisionArtifact artifact = buildArtifact(outcome, signer);
    if (token != nullptr) {
        token->throwIfCancelled("publish");
    }
    sink.publish(artifact);
    return artifact;
}

PhaseOutcome DecisionPipeline::runH30(const PhaseRequest& request, const CancellationToken* token) const {
    PhaseOutcome out;
    out.decision = baseDecision(request);
    Decision& decision = out.decision;
    const GpiConfig& cfg = request.config;

    if (token != nullptr) {
        token->throwIfCancelled("snapshot");
    }
    RaceSnapshot snapshot;
    try {
        snapshot = fetchChecked(*collaborators_.snapshots, request);
    } catch (const DataUnavailable& ex) {
        out.trail.warnings.push_back(std::string("H30 snapshot unavailable: ") + ex.what());
        abstainWith(decision, ReasonCode::DataUnavailable, std::string("H30 snapshot unavailable: ") + ex.what());
        return out;
    }
    adoptSnapshot(decision, snapshot);

    if (token != nullptr) {
        token->throwIfCancelled("market guardrail");
    }
    GuardrailVerdict market = evaluateMarket(snapshot, std::nullopt, request.now, cfg);
    decision.marketGuardrailPassed = market.passed;
    if (market.passed) {
        abstainWith(decision, ReasonCode::Preliminary, "preliminary: market guardrails passed");
    } else {
        abstainWith(decision, market.firstReason(), "preliminary: " + joinNotes(market));
    }
    out.trail.verdicts.push_back(std::move(market));
    out.snapshot = std::move(snapshot);

    if (token != nullptr) {
        token->throwIfCancelled("emit");
    }
    return out;
}

PhaseOutcome DecisionPipeline::runH5(const PhaseRequest& request, const CancellationToken* token) const {
    PhaseOutcome out;
    out.decision = baseDecision(request);
    Decision& decision = out.decision;
    AuditTrail& trail = out.trail;
    const GpiConfig& cfg = request.config;

    if (token != nullptr) {
        token->throwIfCancelled("snapshot");
    }
    RaceSnapshot snapshot;
    try {
        snapshot = fetchChecked(*collaborators_.snapshots, request);
    } catch (const DataUnavailable& ex) {
        abstainWith(decision, ReasonCode::DataUnavailable, std::string("H5 snapshot unavailable: ") + ex.what());
        return out;
    }
    adoptSnapshot(decision, snapshot);
    out.snapshot = snapshot;

    if (!snapshot.enrichment) {
        abstainWith(decision, ReasonCode::EnrichmentMissing, "enrichment missing");
        return out;
    }
    if (isStale(snapshot.enrichment->capturedAt, request.now, cfg.freshnessMaxAgeSeconds)) {
        abstainWith(decision, ReasonCode::StaleInput, "stale input: enrichment");
        return out;
    }
    double coverage = enrichmentCoverage(snapshot);
    if (coverage < cfg.enrichmentMinCoverage) {
        abstainWith(decision,
                    ReasonCode::EnrichmentMissing,
                    "enrichment missing: coverage " + formatFixed(coverage, 2) + " below " +
                        formatFixed(cfg.enrichmentMinCoverage, 2));
        return out;
    }

    if (token != nullptr) {
        token->throwIfCancelled("calibration");
    }
    PayoutModelPtr model;
    try {
        model = collaborators_.calibration->fetchModel(snapshot);
    } catch (const DataUnavailable& ex) {
        abstainWith(decision, ReasonCode::DataUnavailable, std::string("calibration unavailable: ") + ex.what());
        return out;
    }
    if (!model) {
        abstainWith(decision, ReasonCode::DataUnavailable, "calibration unavailable");
        return out;
    }
    decision.calibratedAt = model->calibratedAt();

    GuardrailVerdict market = evaluateMarket(snapshot, model->calibratedAt(), request.now, cfg);
    decision.marketGuardrailPassed = market.passed;
    bool marketPassed = market.passed;
    ReasonCode marketReason = market.firstReason();
    std::string marketNotes = joinNotes(market);
    trail.verdicts.push_back(std::move(market));
    if (!marketPassed) {
        abstainWith(decision, marketReason, marketNotes);
        return out;
    }

    if (request.h30) {
        if (!request.h30->marketPassed && !(snapshot.capturedAt > request.h30->snapshot.capturedAt)) {
            abstainWith(decision,
                        ReasonCode::StaleReversal,
                        "H30 rejection stands: H5 snapshot is not newer than the H30 snapshot");
            return out;
        }
        decision.drift = computeDrift(request.h30->snapshot, snapshot, cfg.driftThreshold);
    }

    const EvEstimator& estimator = *collaborators_.estimator;
    const EstimatorSettings settings = estimatorSettingsFrom(cfg);
    std::vector<Estimate> qualifying;
    std::size_t rejected = 0;

    auto consider = [&](Estimate est) {
        GuardrailVerdict verdict = evaluateCandidate(est, cfg);
        bool passed = verdict.passed;
        trail.verdicts.push_back(std::move(verdict));
        trail.estimates.push_back(est);
        if (passed) {
            qualifying.push_back(std::move(est));
        } else {
            ++rejected;
        }
    };

    if (token != nullptr) {
        token->throwIfCancelled("single estimates");
    }
    for (const Runner* runner : snapshot.activeRunners()) {
        try {
            consider(estimator.estimateSingle(snapshot, runner->id, *model, settings));
        } catch (const EstimationFailure& ex) {
            trail.estimationFailures.push_back(std::string("SP ") + runner->id + ": " + ex.what());
        }
    }

    if (token != nullptr) {
        token->throwIfCancelled("combination estimates");
    }
    std::vector<RunnerId> pool = comboPool(snapshot, *model, cfg.comboCandidatePool);
    for (ComboType type : cfg.comboTypes) {
        if (pool.size() < legCount(type)) {
            trail.warnings.push_back(std::string(toString(type)) + " skipped: only " +
                                     std::to_string(pool.size()) + " active runners");
            continue;
        }
        for (const auto& legs : combinations(pool, legCount(type))) {
            try {
                consider(estimator.estimateCombo(snapshot, type, legs, *model, settings));
            } catch (const EstimationFailure& ex) {
                trail.estimationFailures.push_back(std::string(toString(type)) + ": " + ex.what());
            }
        }
    }

    if (qualifying.empty()) {
        ReasonCode code = (rejected == 0 && !trail.estimationFailures.empty()) ? ReasonCode::EstimationFailed
                                                                              : ReasonCode::NoQualifyingLeg;
        abstainWith(decision,
                    code,
                    "no qualifying leg: " + std::to_string(rejected) + " candidate(s) rejected, " +
                        std::to_string(trail.estimationFailures.size()) + " estimation failure(s)");
        return out;
    }

    if (token != nullptr) {
        token->throwIfCancelled("allocation");
    }
    Allocation allocation = allocate(qualifying, stakingPolicyFrom(cfg));
    trail.allocationNotes = allocation.notes;
    if (allocation.tickets.empty()) {
        ReasonCode code = allocation.notes.empty() ? ReasonCode::NoEdge : allocation.notes.front().code;
        abstainWith(decision, code, "all legs abstained after staking");
        return out;
    }

    GuardrailVerdict global = evaluateGlobal(stakedOf(allocation.tickets), cfg);
    bool globalPassed = global.passed;
    std::string globalNotes = joinNotes(global);
    trail.verdicts.push_back(std::move(global));
    if (!globalPassed) {
        // The combination leg carries the failure; the SP ticket keeps its own stake.
        auto isCombo = [](const Ticket& t) { return t.kind == BetKind::Combo; };
        for (const auto& ticket : allocation.tickets) {
            if (isCombo(ticket)) {
                trail.allocationNotes.push_back(AllocationNote{
                    ReasonCode::GlobalEvTooLow, ticket.estimate.label(), "dropped: " + globalNotes });
            }
        }
        allocation.tickets.erase(std::remove_if(allocation.tickets.begin(), allocation.tickets.end(), isCombo),
                                 allocation.tickets.end());
        if (allocation.tickets.empty()) {
            abstainWith(decision, ReasonCode::GlobalEvTooLow, globalNotes);
            return out;
        }
    }
    std::vector<StakedEstimate> staked = stakedOf(allocation.tickets);
    decision.evGlobalEstimate = stakeWeightedEv(staked);
    decision.roiGlobalEstimate = stakeWeightedRoi(staked);

    if (token != nullptr) {
        token->throwIfCancelled("emit");
    }
    for (auto& ticket : allocation.tickets) {
        ticket.id = ticketId(request.raceId, request.phase, ticket.estimate);
    }
    decision.abstain = false;
    decision.reason = ReasonCode::None;
    decision.message = "bet: " + std::to_string(allocation.tickets.size()) + " ticket(s), total stake " +
                       allocation.totalStake().format();
    decision.tickets = std::move(allocation.tickets);
    return out;
}

PhaseOutcome DecisionPipeline::runResult(const PhaseRequest& request, const CancellationToken* token) const {
    PhaseOutcome out;
    out.decision = baseDecision(request);
    Decision& decision = out.decision;
    abstainWith(decision, ReasonCode::ResultOnly, "result phase never bets");

    if (token != nullptr) {
        token->throwIfCancelled("result");
    }
    if (!collaborators_.results) {
        out.trail.warnings.push_back("no result source configured");
        abstainWith(decision, ReasonCode::DataUnavailable, "official result unavailable: no result source");
        return out;
    }

    OfficialResult result;
    try {
        result = collaborators_.results->fetchResult(request.raceId);
    } catch (const DataUnavailable& ex) {
        out.trail.warnings.push_back(std::string("official result unavailable: ") + ex.what());
        abstainWith(decision, ReasonCode::DataUnavailable, std::string("official result unavailable: ") + ex.what());
        return out;
    }

    std::vector<Ticket> tickets;
    if (request.h5Decision) {
        if (request.h5Decision->raceId != request.raceId) {
            out.trail.warnings.push_back("H5 decision is for race " + request.h5Decision->raceId);
        } else {
            tickets = request.h5Decision->tickets;
            if (decision.meetingId.empty()) {
                decision.meetingId = request.h5Decision->meetingId;
            }
        }
    }
    decision.reconciliation = reconcile(tickets, result);
    decision.message = "reconciled " + std::to_string(tickets.size()) + " ticket(s)";

    if (token != nullptr) {
        token->throwIfCancelled("emit");
    }
    return out;
}

} // namespace gpi
