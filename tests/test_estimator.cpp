#include "config.hpp"
#include "deterministic_math.hpp"
#include "errors.hpp"
#include "estimator.hpp"
#include "finish_order.hpp"
#include "payout_model.hpp"
#include "rng.hpp"
#include "test_support.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "estimator_test failure: " << msg << std::endl;
    std::exit(1);
}

void expectNear(double actual, double expected, double tol, const std::string& what) {
    if (!(std::abs(actual - expected) <= tol)) {
        fail(what + ": expected " + std::to_string(expected) + ", got " + std::to_string(actual));
    }
}

} // namespace

int main() {
    using namespace gpi;
    using namespace gpi::testing;

    const std::vector<double> probs = { 0.4, 0.3, 0.2, 0.1 };

    // Harville closed form against hand-computed values.
    {
        // 0 then 1 or 1 then 0.
        double coupleWinner = 0.4 * (0.3 / 0.6) + 0.3 * (0.4 / 0.7);
        expectNear(closedFormHitProbability(ComboType::CoupleWinner, probs, { 0, 1 }), coupleWinner, 1e-12,
                   "COUPLE_WINNER {0,1}");

        double trio = 0.0;
        const std::size_t perms[6][3] = { { 0, 1, 2 }, { 0, 2, 1 }, { 1, 0, 2 }, { 1, 2, 0 }, { 2, 0, 1 }, { 2, 1, 0 } };
        for (const auto& order : perms) {
            trio += DeterministicMath::orderedFinishProbability(probs, { order[0], order[1], order[2] });
        }
        expectNear(closedFormHitProbability(ComboType::Trio, probs, { 0, 1, 2 }), trio, 1e-12, "TRIO {0,1,2}");

        // Both legs in the first three == 1 - P(a leg finishes fourth) for a 4-runner field.
        double placeBoth = 1.0 - DeterministicMath::orderedFinishProbability(probs, { 1, 2, 3, 0 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 2, 1, 3, 0 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 1, 3, 2, 0 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 3, 1, 2, 0 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 2, 3, 1, 0 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 3, 2, 1, 0 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 0, 2, 3, 1 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 2, 0, 3, 1 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 0, 3, 2, 1 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 3, 0, 2, 1 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 2, 3, 0, 1 }) -
                           DeterministicMath::orderedFinishProbability(probs, { 3, 2, 0, 1 });
        expectNear(closedFormHitProbability(ComboType::CouplePlace, probs, { 0, 1 }), placeBoth, 1e-9,
                   "COUPLE_PLACE {0,1}");

        bool threw = false;
        try {
            (void)closedFormHitProbability(ComboType::Trio, probs, { 0, 0, 1 });
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            fail("duplicate basket legs accepted");
        }
    }

    // Seeded Monte Carlo is reproducible and converges on the closed form.
    {
        SeededRng a(51);
        SeededRng b(51);
        double first = simulatedHitProbability(ComboType::Trio, probs, { 0, 1, 2 }, 20'000, a);
        double second = simulatedHitProbability(ComboType::Trio, probs, { 0, 1, 2 }, 20'000, b);
        if (first != second) {
            fail("simulation with a fixed seed is not reproducible");
        }
        expectNear(first, closedFormHitProbability(ComboType::Trio, probs, { 0, 1, 2 }), 0.02,
                   "simulated TRIO vs closed form");

        std::vector<double> field = { 0.25, 0.2, 0.15, 0.15, 0.1, 0.1, 0.05 };
        FinishModelSettings settings;
        HitProbability q1 = basketHitProbability(ComboType::Quartet, field, { 0, 1, 2, 3 }, settings);
        HitProbability q2 = basketHitProbability(ComboType::Quartet, field, { 0, 1, 2, 3 }, settings);
        if (!q1.simulated || q1.value != q2.value || !(q1.value > 0.0 && q1.value < 1.0)) {
            fail("QUARTET probability not a reproducible simulation");
        }
    }

    // SP estimate uses calibrated probability, never the implied odds probability.
    const GpiConfig cfg = [] {
        GpiConfig c = defaultGpiConfig();
        c.spMarket = Market::Win;
        c.roiPayoutHaircut = 1.0 / 6.0;
        return c;
    }();
    const EstimatorSettings settings = estimatorSettingsFrom(cfg);
    const CalibratedEstimator estimator;
    RaceSnapshot snapshot = makeSnapshot(Phase::H5, scenarioField());
    auto model = scenarioModel();
    {
        Estimate est = estimator.estimateSingle(snapshot, "1", *model, settings);
        expectNear(est.evRatio, 0.50, 1e-12, "scenario A ev");
        expectNear(est.roiRatio, 0.25, 1e-12, "scenario A roi");
        expectNear(est.expectedPayout, 5.0, 0.0, "scenario A payout per unit");
        if (est.kind != BetKind::Single || est.involvedRunners != std::vector<RunnerId>{ "1" }) {
            fail("single estimate shape wrong");
        }
        if (est.label() != "SP_WIN:1") {
            fail("single label wrong: " + est.label());
        }

        EstimatorSettings place = settings;
        place.spMarket = Market::Place;
        Estimate placed = estimator.estimateSingle(snapshot, "1", *model, place);
        expectNear(placed.evRatio, 0.55 * 0.8 - 0.45, 1e-12, "place ev");
        if (!placed.runnerWinOdds || *placed.runnerWinOdds != 5.0 || !placed.winProbability ||
            *placed.winProbability != 0.30) {
            fail("place estimate does not carry the runner's win odds and win probability");
        }
    }

    // Fail closed on missing or non-positive inputs.
    {
        auto expectFailure = [&](const RaceSnapshot& snap, const PayoutModel& m, const std::string& what) {
            try {
                (void)estimator.estimateSingle(snap, "1", m, settings);
            } catch (const EstimationFailure&) {
                return;
            }
            fail(what + " did not fail closed");
        };
        RaceSnapshot badOdds = snapshot;
        badOdds.runners[0].winOdds = 0.0;
        expectFailure(badOdds, *model, "zero odds");

        FixedModel noProb = *model;
        noProb.win.erase("1");
        expectFailure(snapshot, noProb, "missing calibrated probability");

        RaceSnapshot scratched = snapshot;
        scratched.runners[0].scratched = true;
        expectFailure(scratched, *model, "scratched runner");
    }

    // Combination estimate: calibrated hit probability against the model's dividend.
    {
        model->dividends["COUPLE_WINNER:1-3"] = 14.0;
        Estimate est = estimator.estimateCombo(snapshot, ComboType::CoupleWinner, { "3", "1" }, *model, settings);
        std::vector<double> cal = { 0.30, 0.35, 0.175, 0.175 };
        double p = closedFormHitProbability(ComboType::CoupleWinner, cal, { 0, 2 });
        expectNear(est.probability, p, 1e-12, "combo hit probability");
        expectNear(est.evRatio, p * 14.0 - 1.0, 1e-12, "combo ev");
        expectNear(est.roiRatio, p * 14.0 * (1.0 - 1.0 / 6.0) - 1.0, 1e-12, "combo roi");
        if (est.involvedRunners != std::vector<RunnerId>{ "1", "3" } || est.label() != "COUPLE_WINNER:1-3") {
            fail("combo basket not normalised");
        }

        bool threw = false;
        try {
            (void)estimator.estimateCombo(snapshot, ComboType::CoupleWinner, { "1", "2" }, *model, settings);
        } catch (const EstimationFailure&) {
            threw = true;
        }
        if (!threw) {
            fail("combo without a dividend did not fail closed");
        }
    }

    // Calibrated payout model prices from the market: dividend * P_market == 1 - takeout.
    {
        std::map<RunnerId, RunnerCalibration> cal;
        for (const auto& [id, p] : model->win) {
            cal[id].win = p;
        }
        CalibratedPayoutModel market(snapshot, cal, secondsAgo(30), cfg.takeout, settings.finish);
        auto dividend = market.comboDividend(ComboType::Trio, { "1", "2", "3" });
        if (!dividend) {
            fail("calibrated model gave no TRIO dividend");
        }
        std::vector<double> implied = normalizeProbabilities({ 0.2, 0.4, 0.25, 0.25 });
        double pMarket = closedFormHitProbability(ComboType::Trio, implied, { 0, 1, 2 });
        expectNear(*dividend * pMarket, 0.75, 1e-9, "market-priced dividend");
        if (market.comboDividend(ComboType::Trio, { "1", "2", "9" })) {
            fail("dividend priced for a runner outside the field");
        }
    }

    // Selection: highest ev, ties by payout.
    {
        Estimate a;
        a.evRatio = 0.5;
        a.expectedPayout = 4.0;
        a.involvedRunners = { "1" };
        Estimate b = a;
        b.expectedPayout = 6.0;
        b.involvedRunners = { "2" };
        Estimate c = a;
        c.evRatio = 0.4;
        c.expectedPayout = 50.0;
        std::vector<Estimate> candidates = { a, b, c };
        const Estimate* best = selectBest(candidates);
        if (best == nullptr || best->involvedRunners.front() != "2") {
            fail("tie on ev not broken by payout");
        }
        if (selectBest({}) != nullptr) {
            fail("empty selection returned a candidate");
        }
    }

    std::cout << "Estimator checks passed.\n";
    return 0;
}
