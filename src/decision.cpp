#include "decision.hpp"

namespace gpi {

const char* toString(DriftClass drift) {
    switch (drift) {
    case DriftClass::Steam:
        return "STEAM";
    case DriftClass::Drift:
        return "DRIFT";
    case DriftClass::Stable:
        return "STABLE";
    }
    return "STABLE";
}

std::vector<RunnerDrift> computeDrift(const RaceSnapshot& h30,
                                      const RaceSnapshot& h5,
                                      double threshold) {
    std::vector<RunnerDrift> out;
    for (const Runner* later : h5.activeRunners()) {
        const Runner* earlier = h30.findRunner(later->id);
        if (earlier == nullptr || earlier->scratched) {
            continue;
        }
        if (!(earlier->winOdds > 1.0) || !(later->winOdds > 1.0)) {
            continue;
        }
        RunnerDrift entry;
        entry.runner = later->id;
        entry.h30Odds = earlier->winOdds;
        entry.h5Odds = later->winOdds;
        entry.change = later->winOdds / earlier->winOdds - 1.0;
        if (entry.change < -threshold) {
            entry.drift = DriftClass::Steam;
        } else if (entry.change > threshold) {
            entry.drift = DriftClass::Drift;
        }
        out.push_back(entry);
    }
    return out;
}

} // namespace gpi
