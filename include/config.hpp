#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "bet_types.hpp"
#include "money.hpp"

namespace gpi {

// GPI v5.1 thresholds. Passed by value into every invocation; nothing here is global.
struct GpiConfig {
    Money budget;
    double kellyFraction = 0.0;
    double exposureCapFraction = 0.0;

    double overroundCeiling = 0.0;
    double overroundCeilingHandicap = 0.0;
    std::size_t handicapMinStarters = 0;
    double overroundCeilingTrotSmallField = 0.0;
    std::size_t trotSmallFieldMaxStarters = 0;

    double evMinSp = 0.0;
    double roiMinSp = 0.0;
    double spMaxProbability = 0.0;
    // Band on the runner's win odds, whichever market the SP ticket is placed on.
    double spMinOdds = 0.0;
    double spMaxOdds = 0.0;

    double evMinCombo = 0.0;
    double roiMinCombo = 0.0;
    double minPayoutCombo = 0.0;

    double evMinGlobal = 0.0;

    Money minStakeIncrement;
    std::size_t maxTicketsPerRace = 0;
    std::int64_t freshnessMaxAgeSeconds = 0;

    Market spMarket = Market::Place;
    double roiPayoutHaircut = 0.0;
    std::vector<ComboType> comboTypes;
    std::size_t comboCandidatePool = 0;
    std::size_t monteCarloSamples = 0;
    std::uint64_t monteCarloSeed = 0;
    double enrichmentMinCoverage = 0.0;
    double driftThreshold = 0.0;
    std::map<ComboType, double> takeout;
};

GpiConfig defaultGpiConfig();

// Every field is required; missing or mistyped fields throw ConfigInvalid naming the field.
GpiConfig loadGpiConfig(const nlohmann::json& document);
GpiConfig loadGpiConfigFile(const std::string& path);

nlohmann::json toJson(const GpiConfig& cfg);

// Throws ConfigInvalid for out-of-range thresholds and AllocationFailure for a budget or
// stake increment that cannot be allocated against.
void validateGpiConfig(const GpiConfig& cfg);

// Explicit path wins; otherwise GPI_CONFIG. Empty when neither is set.
std::string resolveConfigPath(const std::string& explicitPath);

} // namespace gpi
