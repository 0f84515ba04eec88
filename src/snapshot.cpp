#include "snapshot.hpp"

#include "errors.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace gpi {

Timestamp timestampFromEpochSeconds(std::int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

std::int64_t toEpochSeconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

std::string formatTimestamp(Timestamp ts) {
    std::time_t raw = static_cast<std::time_t>(toEpochSeconds(ts));
    std::tm utc{};
    gmtime_r(&raw, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

const Runner* RaceSnapshot::findRunner(const RunnerId& id) const {
    for (const auto& runner : runners) {
        if (runner.id == id) {
            return &runner;
        }
    }
    return nullptr;
}

std::vector<const Runner*> RaceSnapshot::activeRunners() const {
    std::vector<const Runner*> out;
    out.reserve(runners.size());
    for (const auto& runner : runners) {
        if (!runner.scratched) {
            out.push_back(&runner);
        }
    }
    return out;
}

std::size_t RaceSnapshot::starterCount() const {
    std::size_t count = 0;
    for (const auto& runner : runners) {
        if (!runner.scratched) {
            ++count;
        }
    }
    return count;
}

std::optional<double> RaceSnapshot::overround() const {
    return computeOverround(runners, Market::Win);
}

std::optional<double> computeOverround(const std::vector<Runner>& runners, Market market) {
    double total = 0.0;
    std::size_t counted = 0;
    for (const auto& runner : runners) {
        if (runner.scratched) {
            continue;
        }
        double odds = 0.0;
        if (market == Market::Win) {
            odds = runner.winOdds;
        } else if (runner.placeOdds) {
            odds = *runner.placeOdds;
        } else {
            return std::nullopt;
        }
        if (!std::isfinite(odds) || odds <= 1.0) {
            return std::nullopt;
        }
        total += 1.0 / odds;
        ++counted;
    }
    if (counted == 0) {
        return std::nullopt;
    }
    return total;
}

void validateSnapshot(const RaceSnapshot& snapshot) {
    if (snapshot.raceId.empty()) {
        throw DataUnavailable("snapshot has no raceId");
    }
    if (snapshot.meetingId.empty()) {
        throw DataUnavailable("snapshot " + snapshot.raceId + " has no meetingId");
    }
    if (snapshot.phase == Phase::Result) {
        throw DataUnavailable("snapshot " + snapshot.raceId + " tagged RESULT; only H30/H5 are captured");
    }
    std::unordered_set<std::string> seen;
    for (const auto& runner : snapshot.runners) {
        if (runner.id.empty()) {
            throw DataUnavailable("snapshot " + snapshot.raceId + " has a runner without id");
        }
        if (!seen.insert(runner.id).second) {
            throw DataUnavailable("snapshot " + snapshot.raceId + " repeats runner id " + runner.id);
        }
    }
    if (snapshot.starterCount() == 0) {
        throw DataUnavailable("snapshot " + snapshot.raceId + " has no active runners");
    }
}

double enrichmentCoverage(const RaceSnapshot& snapshot) {
    if (!snapshot.enrichment) {
        return 0.0;
    }
    std::size_t active = 0;
    std::size_t covered = 0;
    for (const auto& runner : snapshot.runners) {
        if (runner.scratched) {
            continue;
        }
        ++active;
        if (snapshot.enrichment->withJockeyTrainerStats.count(runner.id) != 0 &&
            snapshot.enrichment->withChrono.count(runner.id) != 0) {
            ++covered;
        }
    }
    if (active == 0) {
        return 0.0;
    }
    return static_cast<double>(covered) / static_cast<double>(active);
}

} // namespace gpi
