#include "artifact.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "finish_order.hpp"
#include "pipeline.hpp"
#include "test_support.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

using namespace gpi;
using namespace gpi::testing;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "pipeline_test failure: " << msg << std::endl;
    std::exit(1);
}

class RecordingSink : public ArtifactSink {
public:
    void publish(const DecisionArtifact& artifact) override {
        ++published;
        last = artifact.envelope();
    }

    int published = 0;
    nlohmann::json last;
};

GpiConfig scenarioConfig() {
    GpiConfig cfg = defaultGpiConfig();
    cfg.spMarket = Market::Win;
    cfg.roiPayoutHaircut = 1.0 / 6.0;
    cfg.comboTypes = {};
    return cfg;
}

PhaseRequest makeRequest(Phase phase, const GpiConfig& cfg) {
    PhaseRequest request;
    request.phase = phase;
    request.meetingId = "R1";
    request.raceId = "R1C3";
    request.now = now();
    request.config = cfg;
    return request;
}

struct Harness {
    std::shared_ptr<StaticSnapshotSource> snapshots;
    std::shared_ptr<CountingEstimator> estimator;
    std::shared_ptr<InFlightRegistry> registry;
    std::unique_ptr<DecisionPipeline> pipeline;
};

Harness makeHarness(std::map<Phase, RaceSnapshot> snapshots,
                    PayoutModelPtr model,
                    std::optional<OfficialResult> result = std::nullopt) {
    Harness h;
    h.snapshots = std::make_shared<StaticSnapshotSource>(std::move(snapshots));
    h.estimator = std::make_shared<CountingEstimator>();
    h.registry = std::make_shared<InFlightRegistry>();
    PipelineCollaborators collaborators;
    collaborators.snapshots = h.snapshots;
    collaborators.calibration = std::make_shared<StaticCalibrationSource>(std::move(model));
    collaborators.results = std::make_shared<StaticResultSource>(std::move(result));
    collaborators.estimator = h.estimator;
    h.pipeline = std::make_unique<DecisionPipeline>(std::move(collaborators), h.registry);
    return h;
}

bool trailHas(const AuditTrail& trail, ReasonCode code) {
    for (const auto& verdict : trail.verdicts) {
        for (const auto& reason : verdict.reasons) {
            if (reason.code == code) {
                return true;
            }
        }
    }
    return false;
}

void expectAbstain(const Decision& decision, ReasonCode code, const std::string& where) {
    if (!decision.abstain || !decision.tickets.empty()) {
        fail(where + ": expected an abstention without tickets");
    }
    if (decision.reason != code) {
        fail(where + ": expected reason " + toString(code) + ", got " + toString(decision.reason) + " (" +
             decision.message + ")");
    }
}

} // namespace

int main() {
    const GpiConfig cfg = scenarioConfig();

    // Scenario A: one SP ticket with 0 < stake <= 3.00.
    Decision scenarioA;
    {
        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, scenarioModel());
        PhaseOutcome outcome = h.pipeline->run(makeRequest(Phase::H5, cfg));
        const Decision& d = outcome.decision;
        if (d.abstain || d.tickets.size() != 1 || d.tickets.front().kind != BetKind::Single) {
            fail("scenario A should bet one SP ticket: " + d.message);
        }
        const Ticket& ticket = d.tickets.front();
        if (!ticket.stake.isPositive() || ticket.stake > Money::fromDouble(3.00)) {
            fail("scenario A stake out of range");
        }
        if (ticket.id != "R1C3:H5:SP_WIN:1" || ticket.runners != std::vector<RunnerId>{ "1" }) {
            fail("scenario A ticket identity wrong: " + ticket.id);
        }
        if (!d.evGlobalEstimate || std::abs(*d.evGlobalEstimate - 0.50) > 1e-9) {
            fail("scenario A global ev should be the SP ev");
        }
        if (!d.overround || std::abs(*d.overround - 1.10) > 1e-9 || d.meetingId != "R1") {
            fail("scenario A decision is missing audit fields");
        }
        if (h.estimator->calls.load() != 4) {
            fail("scenario A should estimate each of the four runners once");
        }
        scenarioA = d;

        // Idempotence: the same inputs render byte-identically.
        PhaseOutcome again = h.pipeline->run(makeRequest(Phase::H5, cfg));
        if (decisionToJson(again.decision).dump() != decisionToJson(d).dump()) {
            fail("H5 re-run is not byte-identical");
        }
        if (buildArtifact(again, nullptr).fingerprint != buildArtifact(outcome, nullptr).fingerprint) {
            fail("artifact fingerprint changed across identical runs");
        }
    }

    // Scenario B: overround 1.35 abstains on the overround gate before any estimate.
    {
        std::vector<Runner> field = scenarioField();
        field[1].winOdds = 1.0 / 0.65;
        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, field) } }, scenarioModel());
        Decision d = h.pipeline->run(makeRequest(Phase::H5, cfg)).decision;
        expectAbstain(d, ReasonCode::OverroundTooHigh, "scenario B");
        if (d.message.find("overround") == std::string::npos) {
            fail("scenario B message does not mention overround");
        }
        if (h.estimator->calls.load() != 0) {
            fail("scenario B estimated after a failed market gate");
        }
    }

    // Scenario C: combo ev 0.38 is dropped, the SP leg proceeds on its own.
    {
        GpiConfig c = cfg;
        c.roiPayoutHaircut = 0.10;
        c.comboTypes = { ComboType::CoupleWinner };
        auto model = scenarioModel();
        double p = closedFormHitProbability(ComboType::CoupleWinner, { 0.30, 0.35, 0.175, 0.175 }, { 2, 3 });
        model->dividends["COUPLE_WINNER:3-4"] = 1.38 / p;

        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, model);
        PhaseOutcome outcome = h.pipeline->run(makeRequest(Phase::H5, c));
        const Decision& d = outcome.decision;
        if (d.abstain || d.tickets.size() != 1 || d.tickets.front().kind != BetKind::Single) {
            fail("scenario C should keep only the SP leg: " + d.message);
        }
        if (!trailHas(outcome.trail, ReasonCode::ComboEvTooLow)) {
            fail("scenario C combo rejection not recorded");
        }
        if (outcome.trail.estimationFailures.size() != 5) {
            fail("couples without a dividend should fail closed individually");
        }
    }

    // Both legs, the ticket cap, and the global gate.
    {
        GpiConfig c = cfg;
        c.roiPayoutHaircut = 0.10;
        c.comboTypes = { ComboType::CoupleWinner };
        auto model = scenarioModel();
        model->dividends["COUPLE_WINNER:3-4"] = 40.0;

        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, model);
        Decision d = h.pipeline->run(makeRequest(Phase::H5, c)).decision;
        if (d.abstain || d.tickets.size() != 2 || d.tickets[0].kind != BetKind::Single ||
            d.tickets[1].kind != BetKind::Combo) {
            fail("expected one SP and one combination ticket: " + d.message);
        }
        if (d.tickets[1].id != "R1C3:H5:COUPLE_WINNER:3-4") {
            fail("combination ticket id wrong: " + d.tickets[1].id);
        }
        Money total;
        for (const auto& t : d.tickets) {
            total += t.stake;
        }
        if (total > c.budget) {
            fail("budget invariant violated");
        }

        // Global ev 0.87 under a 0.90 gate costs the combination leg only.
        c.evMinGlobal = 0.90;
        Harness strict = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, model);
        PhaseOutcome gated = strict.pipeline->run(makeRequest(Phase::H5, c));
        const Decision& spOnly = gated.decision;
        if (spOnly.abstain || spOnly.tickets.size() != 1 || spOnly.tickets[0].kind != BetKind::Single ||
            spOnly.tickets[0].stake != d.tickets[0].stake) {
            fail("global gate failure should keep the SP ticket at its stake: " + spOnly.message);
        }
        if (!trailHas(gated.trail, ReasonCode::GlobalEvTooLow)) {
            fail("global gate verdict missing from the trail");
        }
        bool comboNoted = false;
        for (const auto& note : gated.trail.allocationNotes) {
            if (note.code == ReasonCode::GlobalEvTooLow && note.leg == "COUPLE_WINNER:3-4") {
                comboNoted = true;
            }
        }
        if (!comboNoted) {
            fail("dropped combination leg not noted");
        }
        if (!spOnly.evGlobalEstimate || std::abs(*spOnly.evGlobalEstimate - 0.50) > 1e-9) {
            fail("global ev should be recomputed over the SP ticket alone");
        }

        // With no SP leg qualifying, a failed global gate leaves nothing to bet.
        c.evMinSp = 0.60;
        c.evMinGlobal = 2.50;
        Harness comboOnly = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, model);
        expectAbstain(comboOnly.pipeline->run(makeRequest(Phase::H5, c)).decision, ReasonCode::GlobalEvTooLow,
                      "global gate without an SP leg");
    }

    // A long shot outside the SP odds band is not bet despite its edge.
    {
        std::vector<Runner> field = scenarioField();
        field[0].winOdds = 8.0;
        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, field) } }, scenarioModel());
        PhaseOutcome outcome = h.pipeline->run(makeRequest(Phase::H5, cfg));
        if (!outcome.decision.abstain || !trailHas(outcome.trail, ReasonCode::SpOddsOutOfBand)) {
            fail("runner at 8.0 should be rejected by the SP odds band");
        }
    }

    // Scenario D: enrichment absent, the estimator is never invoked.
    {
        RaceSnapshot snapshot = makeSnapshot(Phase::H5, scenarioField());
        snapshot.enrichment.reset();
        Harness h = makeHarness({ { Phase::H5, snapshot } }, scenarioModel());
        Decision d = h.pipeline->run(makeRequest(Phase::H5, cfg)).decision;
        expectAbstain(d, ReasonCode::EnrichmentMissing, "scenario D");
        if (d.message != "enrichment missing" || h.estimator->calls.load() != 0) {
            fail("scenario D must abstain before estimation");
        }

        RaceSnapshot partial = makeSnapshot(Phase::H5, scenarioField());
        partial.enrichment->withChrono = { "1" };
        Harness low = makeHarness({ { Phase::H5, partial } }, scenarioModel());
        expectAbstain(low.pipeline->run(makeRequest(Phase::H5, cfg)).decision, ReasonCode::EnrichmentMissing,
                      "low enrichment coverage");
    }

    // Scenario E: RESULT never bets and reconciles the H5 tickets.
    {
        OfficialResult result;
        result.raceId = "R1C3";
        result.arrival = { "1", "3", "2", "4" };
        result.dividends = { { "SP_WIN:1", 5.2 } };
        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, scenarioModel(), result);

        PhaseRequest request = makeRequest(Phase::Result, cfg);
        request.h5Decision = scenarioA;
        Decision d = h.pipeline->run(request).decision;
        expectAbstain(d, ReasonCode::ResultOnly, "scenario E");
        if (h.snapshots->calls.load() != 0 || h.estimator->calls.load() != 0) {
            fail("RESULT must not read snapshots or estimate");
        }
        if (!d.reconciliation || d.reconciliation->settlements.size() != 1 ||
            !d.reconciliation->settlements.front().hit) {
            fail("RESULT did not reconcile the SP ticket as a hit");
        }
        if (!d.reconciliation->net || d.reconciliation->net->format() != "1.26") {
            fail("RESULT net should be 0.30 x 5.2 - 0.30 = 1.26");
        }
        if (scenarioA.abstain || scenarioA.tickets.size() != 1) {
            fail("RESULT mutated the H5 decision");
        }

        Harness missing = makeHarness({}, scenarioModel());
        Decision noResult = missing.pipeline->run(makeRequest(Phase::Result, cfg)).decision;
        expectAbstain(noResult, ReasonCode::DataUnavailable, "missing result");
        if (noResult.reconciliation) {
            fail("missing result produced a reconciliation");
        }
    }

    // Fail closed on stale inputs regardless of edge.
    {
        RaceSnapshot staleEnrichment = makeSnapshot(Phase::H5, scenarioField());
        staleEnrichment.enrichment->capturedAt = secondsAgo(1000);
        Harness enrich = makeHarness({ { Phase::H5, staleEnrichment } }, scenarioModel());
        Decision e = enrich.pipeline->run(makeRequest(Phase::H5, cfg)).decision;
        expectAbstain(e, ReasonCode::StaleInput, "stale enrichment");
        if (e.message != "stale input: enrichment" || enrich.estimator->calls.load() != 0) {
            fail("stale enrichment must abstain before estimation");
        }

        // A clock an hour behind the capture times fails closed.
        Harness early = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, scenarioModel());
        PhaseRequest behind = makeRequest(Phase::H5, cfg);
        behind.now = secondsAgo(3600);
        expectAbstain(early.pipeline->run(behind).decision, ReasonCode::StaleInput, "clock behind the inputs");
        if (early.estimator->calls.load() != 0) {
            fail("estimated against a clock behind the inputs");
        }

        PhaseRequest unset = makeRequest(Phase::H5, cfg);
        unset.now = Timestamp{};
        bool rejected = false;
        try {
            (void)early.pipeline->run(unset);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        if (!rejected || early.snapshots->calls.load() != 1) {
            fail("unset request clock not rejected before fetching");
        }

        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField(), 500) } }, scenarioModel());
        expectAbstain(h.pipeline->run(makeRequest(Phase::H5, cfg)).decision, ReasonCode::StaleInput, "stale snapshot");

        auto staleModel = scenarioModel();
        staleModel->at = secondsAgo(3600);
        Harness cal = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, staleModel);
        Decision d = cal.pipeline->run(makeRequest(Phase::H5, cfg)).decision;
        expectAbstain(d, ReasonCode::StaleInput, "stale calibration");
        if (d.message.find("calibration") == std::string::npos) {
            fail("stale calibration note does not name the field");
        }

        Harness none = makeHarness({}, scenarioModel());
        expectAbstain(none.pipeline->run(makeRequest(Phase::H5, cfg)).decision, ReasonCode::DataUnavailable,
                      "missing H5 snapshot");

        Harness noModel = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, nullptr);
        expectAbstain(noModel.pipeline->run(makeRequest(Phase::H5, cfg)).decision, ReasonCode::DataUnavailable,
                      "missing calibration");
    }

    // H30 annotates only: never estimates, never emits tickets, never throws on missing data.
    RaceSnapshot h30Snapshot = makeSnapshot(Phase::H30, scenarioField(), 1500);
    h30Snapshot.inputs.odds = secondsAgo(60);
    h30Snapshot.inputs.runners = secondsAgo(60);
    h30Snapshot.inputs.scratches = secondsAgo(60);
    {
        Harness h = makeHarness({ { Phase::H30, h30Snapshot } }, scenarioModel());
        PhaseOutcome outcome = h.pipeline->run(makeRequest(Phase::H30, cfg));
        expectAbstain(outcome.decision, ReasonCode::Preliminary, "H30");
        if (h.estimator->calls.load() != 0 || !outcome.snapshot || !outcome.decision.marketGuardrailPassed ||
            !*outcome.decision.marketGuardrailPassed) {
            fail("H30 should only run the market guardrail");
        }

        Harness missing = makeHarness({}, scenarioModel());
        PhaseOutcome warned = missing.pipeline->run(makeRequest(Phase::H30, cfg));
        expectAbstain(warned.decision, ReasonCode::DataUnavailable, "H30 without snapshot");
        if (warned.trail.warnings.empty()) {
            fail("H30 missing snapshot not annotated");
        }
    }

    // No-regression: a rejected H30 stands unless H5 data is strictly newer.
    {
        RaceSnapshot h5 = makeSnapshot(Phase::H5, scenarioField());
        PhaseRequest request = makeRequest(Phase::H5, cfg);
        PriorPhase prior;
        prior.snapshot = h30Snapshot;
        prior.snapshot.capturedAt = h5.capturedAt;
        prior.marketPassed = false;
        request.h30 = prior;

        Harness h = makeHarness({ { Phase::H5, h5 } }, scenarioModel());
        expectAbstain(h.pipeline->run(request).decision, ReasonCode::StaleReversal, "stale reversal");

        request.h30->snapshot.capturedAt = secondsAgo(1500);
        request.h30->snapshot.runners[0].winOdds = 6.0;
        Decision d = h.pipeline->run(request).decision;
        if (d.abstain) {
            fail("fresh H5 data should be allowed to overturn H30: " + d.message);
        }
        bool steam = false;
        for (const auto& drift : d.drift) {
            if (drift.runner == "1" && drift.drift == DriftClass::Steam) {
                steam = true;
            }
        }
        if (d.drift.size() != 4 || !steam) {
            fail("odds shortening 6.0 -> 5.0 not annotated as STEAM");
        }
    }

    // Typed errors: unknown phase and invalid configuration are not silent.
    {
        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, scenarioModel());
        PhaseRequest bogus = makeRequest(Phase::H5, cfg);
        bogus.phase = static_cast<Phase>(7);
        bool threw = false;
        try {
            (void)h.pipeline->run(bogus);
        } catch (const UnknownPhase&) {
            threw = true;
        }
        if (!threw || h.registry->isRunning("R1C3", static_cast<Phase>(7))) {
            fail("unknown phase not rejected cleanly");
        }

        PhaseRequest broken = makeRequest(Phase::H5, cfg);
        broken.config.budget = Money();
        threw = false;
        try {
            (void)h.pipeline->run(broken);
        } catch (const AllocationFailure&) {
            threw = true;
        }
        if (!threw) {
            fail("zero budget did not abort the invocation");
        }
    }

    // Cancellation: nothing reaches the sink.
    {
        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, scenarioModel());
        RecordingSink sink;
        CancellationToken token;
        h.estimator->onCall = [&token] { token.cancel(); };
        bool threw = false;
        try {
            (void)h.pipeline->runAndPublish(makeRequest(Phase::H5, cfg), sink, nullptr, &token);
        } catch (const InvocationCancelled&) {
            threw = true;
        }
        if (!threw || sink.published != 0) {
            fail("cancelled invocation published an artifact");
        }

        h.estimator->onCall = nullptr;
        CancellationToken fresh;
        DecisionArtifact artifact = h.pipeline->runAndPublish(makeRequest(Phase::H5, cfg), sink, nullptr, &fresh);
        if (sink.published != 1 || sink.last.at("fingerprint") != artifact.fingerprint) {
            fail("completed invocation did not publish exactly once");
        }
    }

    // At most one invocation per (race, phase); other keys are unaffected.
    {
        Harness h = makeHarness({ { Phase::H5, makeSnapshot(Phase::H5, scenarioField()) } }, scenarioModel());
        bool sameRejected = false;
        bool otherRan = false;
        bool nested = false;
        h.estimator->onCall = [&] {
            if (nested) {
                return;
            }
            nested = true;
            try {
                (void)h.pipeline->run(makeRequest(Phase::H5, cfg));
            } catch (const ConcurrentInvocation&) {
                sameRejected = true;
            }
            PhaseRequest other = makeRequest(Phase::H5, cfg);
            other.raceId = "R1C4";
            Decision d = h.pipeline->run(other).decision;
            otherRan = d.abstain && d.reason == ReasonCode::DataUnavailable;
            if (!h.registry->isRunning("R1C3", Phase::H5)) {
                sameRejected = false;
            }
        };
        Decision d = h.pipeline->run(makeRequest(Phase::H5, cfg)).decision;
        if (!sameRejected || !otherRan) {
            fail("in-flight guard did not serialise the same race and phase only");
        }
        if (d.abstain || h.registry->isRunning("R1C3", Phase::H5)) {
            fail("guard not released after the invocation");
        }
    }

    std::cout << "Pipeline checks passed.\n";
    return 0;
}
