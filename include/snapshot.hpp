#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "bet_types.hpp"
#include "phase.hpp"

namespace gpi {

using Timestamp = std::chrono::system_clock::time_point;
using RunnerId = std::string;

Timestamp timestampFromEpochSeconds(std::int64_t seconds);
std::int64_t toEpochSeconds(Timestamp ts);
// UTC, second precision: "2026-10-18T13:55:00Z".
std::string formatTimestamp(Timestamp ts);

struct Runner {
    RunnerId id;
    std::uint32_t number = 0;
    std::string name;
    double winOdds = 0.0;
    std::optional<double> placeOdds;
    bool scratched = false;
};

// Jockey/trainer statistics and chrono coverage collected for H5.
struct EnrichmentInfo {
    Timestamp capturedAt{};
    std::set<RunnerId> withJockeyTrainerStats;
    std::set<RunnerId> withChrono;
};

// Capture times of the mandatory snapshot inputs, checked by the freshness guardrail.
struct InputTimes {
    Timestamp odds{};
    Timestamp runners{};
    Timestamp scratches{};
};

struct RaceSnapshot {
    std::string meetingId;
    std::string raceId;
    Phase phase = Phase::H30;
    Timestamp capturedAt{};
    InputTimes inputs;
    std::vector<Runner> runners;
    Discipline discipline = Discipline::Flat;
    bool handicap = false;
    std::optional<EnrichmentInfo> enrichment;

    const Runner* findRunner(const RunnerId& id) const;
    std::vector<const Runner*> activeRunners() const;
    std::size_t starterCount() const;

    // Sum of implied win probabilities over non-scratched runners. Always recomputed;
    // std::nullopt when any active runner lacks usable odds.
    std::optional<double> overround() const;
};

std::optional<double> computeOverround(const std::vector<Runner>& runners, Market market);

// Structural checks: identifiers present, unique runner ids, at least one active runner,
// snapshot phase H30 or H5. Throws DataUnavailable.
void validateSnapshot(const RaceSnapshot& snapshot);

// Share of active runners carrying both jockey/trainer stats and chrono.
double enrichmentCoverage(const RaceSnapshot& snapshot);

} // namespace gpi
