#include "config.hpp"

#include "errors.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace gpi {

namespace {

using nlohmann::json;

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

const json& requireField(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        throw ConfigInvalid(std::string("config field missing: ") + key);
    }
    return *it;
}

double requireNumber(const json& doc, const char* key) {
    const json& value = requireField(doc, key);
    if (!value.is_number()) {
        throw ConfigInvalid(std::string("config field ") + key + " must be a number");
    }
    double out = value.get<double>();
    if (!std::isfinite(out)) {
        throw ConfigInvalid(std::string("config field ") + key + " must be finite");
    }
    return out;
}

std::uint64_t requireCount(const json& doc, const char* key) {
    const json& value = requireField(doc, key);
    if (!value.is_number_unsigned()) {
        throw ConfigInvalid(std::string("config field ") + key + " must be a non-negative integer");
    }
    return value.get<std::uint64_t>();
}

std::string requireString(const json& doc, const char* key) {
    const json& value = requireField(doc, key);
    if (!value.is_string()) {
        throw ConfigInvalid(std::string("config field ") + key + " must be a string");
    }
    return value.get<std::string>();
}

void requireFraction(double value, const char* name, bool allowZero) {
    bool low = allowZero ? value < 0.0 : value <= 0.0;
    if (low || value > 1.0) {
        std::ostringstream oss;
        oss << name << " must be in " << (allowZero ? "[0, 1]" : "(0, 1]") << ", got " << value;
        throw ConfigInvalid(oss.str());
    }
}

void requireFinite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw ConfigInvalid(std::string(name) + " must be finite");
    }
}

} // namespace

GpiConfig defaultGpiConfig() {
    GpiConfig cfg;
    cfg.budget = Money::fromDouble(5.00);
    cfg.kellyFraction = 0.5;
    cfg.exposureCapFraction = 0.60;
    cfg.overroundCeiling = 1.30;
    cfg.overroundCeilingHandicap = 1.25;
    cfg.handicapMinStarters = 14;
    cfg.overroundCeilingTrotSmallField = 1.25;
    cfg.trotSmallFieldMaxStarters = 9;
    cfg.evMinSp = 0.15;
    cfg.roiMinSp = 0.10;
    cfg.spMaxProbability = 0.60;
    cfg.spMinOdds = 2.5;
    cfg.spMaxOdds = 7.0;
    cfg.evMinCombo = 0.40;
    cfg.roiMinCombo = 0.20;
    cfg.minPayoutCombo = 10.0;
    cfg.evMinGlobal = 0.35;
    cfg.minStakeIncrement = Money::fromDouble(0.10);
    cfg.maxTicketsPerRace = 2;
    cfg.freshnessMaxAgeSeconds = 420;
    cfg.spMarket = Market::Place;
    cfg.roiPayoutHaircut = 0.10;
    cfg.comboTypes = { ComboType::CouplePlace, ComboType::Trio };
    cfg.comboCandidatePool = 5;
    cfg.monteCarloSamples = 20'000;
    cfg.monteCarloSeed = 51;
    cfg.enrichmentMinCoverage = 0.5;
    cfg.driftThreshold = 0.07;
    cfg.takeout = {
        { ComboType::CoupleWinner, 0.25 },
        { ComboType::CouplePlace, 0.25 },
        { ComboType::Trio, 0.25 },
        { ComboType::Quartet, 0.25 },
    };
    return cfg;
}

GpiConfig loadGpiConfig(const json& document) {
    if (!document.is_object()) {
        throw ConfigInvalid("config document must be a JSON object");
    }

    GpiConfig cfg;
    cfg.budget = Money::fromDouble(requireNumber(document, "budget"));
    cfg.kellyFraction = requireNumber(document, "kellyFraction");
    cfg.exposureCapFraction = requireNumber(document, "exposureCapFraction");
    cfg.overroundCeiling = requireNumber(document, "overroundCeiling");
    cfg.overroundCeilingHandicap = requireNumber(document, "overroundCeilingHandicap");
    cfg.handicapMinStarters = static_cast<std::size_t>(requireCount(document, "handicapMinStarters"));
    cfg.overroundCeilingTrotSmallField = requireNumber(document, "overroundCeilingTrotSmallField");
    cfg.trotSmallFieldMaxStarters =
        static_cast<std::size_t>(requireCount(document, "trotSmallFieldMaxStarters"));
    cfg.evMinSp = requireNumber(document, "evMinSp");
    cfg.roiMinSp = requireNumber(document, "roiMinSp");
    cfg.spMaxProbability = requireNumber(document, "spMaxProbability");
    cfg.spMinOdds = requireNumber(document, "spMinOdds");
    cfg.spMaxOdds = requireNumber(document, "spMaxOdds");
    cfg.evMinCombo = requireNumber(document, "evMinCombo");
    cfg.roiMinCombo = requireNumber(document, "roiMinCombo");
    cfg.minPayoutCombo = requireNumber(document, "minPayout");
    cfg.evMinGlobal = requireNumber(document, "evMinGlobal");
    cfg.minStakeIncrement = Money::fromDouble(requireNumber(document, "minStakeIncrement"));
    cfg.maxTicketsPerRace = static_cast<std::size_t>(requireCount(document, "maxTicketsPerRace"));
    cfg.freshnessMaxAgeSeconds =
        static_cast<std::int64_t>(requireCount(document, "freshnessMaxAgeSeconds"));
    cfg.spMarket = parseMarket(requireString(document, "spMarket"));
    cfg.roiPayoutHaircut = requireNumber(document, "roiPayoutHaircut");

    const json& types = requireField(document, "comboTypes");
    if (!types.is_array()) {
        throw ConfigInvalid("config field comboTypes must be an array");
    }
    for (const auto& entry : types) {
        if (!entry.is_string()) {
            throw ConfigInvalid("config field comboTypes must contain strings");
        }
        cfg.comboTypes.push_back(parseComboType(entry.get<std::string>()));
    }

    cfg.comboCandidatePool = static_cast<std::size_t>(requireCount(document, "comboCandidatePool"));
    cfg.monteCarloSamples = static_cast<std::size_t>(requireCount(document, "monteCarloSamples"));
    cfg.monteCarloSeed = requireCount(document, "monteCarloSeed");
    cfg.enrichmentMinCoverage = requireNumber(document, "enrichmentMinCoverage");
    cfg.driftThreshold = requireNumber(document, "driftThreshold");

    const json& takeout = requireField(document, "takeout");
    if (!takeout.is_object()) {
        throw ConfigInvalid("config field takeout must be an object keyed by combo type");
    }
    for (auto it = takeout.begin(); it != takeout.end(); ++it) {
        if (!it.value().is_number()) {
            throw ConfigInvalid("config field takeout." + it.key() + " must be a number");
        }
        cfg.takeout[parseComboType(it.key())] = it.value().get<double>();
    }

    validateGpiConfig(cfg);
    return cfg;
}

GpiConfig loadGpiConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigInvalid("cannot open config file " + path);
    }
    json document;
    try {
        in >> document;
    } catch (const json::parse_error& ex) {
        throw ConfigInvalid("config file " + path + " is not valid JSON: " + ex.what());
    }
    return loadGpiConfig(document);
}

json toJson(const GpiConfig& cfg) {
    json out;
    out["budget"] = cfg.budget.toDouble();
    out["kellyFraction"] = cfg.kellyFraction;
    out["exposureCapFraction"] = cfg.exposureCapFraction;
    out["overroundCeiling"] = cfg.overroundCeiling;
    out["overroundCeilingHandicap"] = cfg.overroundCeilingHandicap;
    out["handicapMinStarters"] = cfg.handicapMinStarters;
    out["overroundCeilingTrotSmallField"] = cfg.overroundCeilingTrotSmallField;
    out["trotSmallFieldMaxStarters"] = cfg.trotSmallFieldMaxStarters;
    out["evMinSp"] = cfg.evMinSp;
    out["roiMinSp"] = cfg.roiMinSp;
    out["spMaxProbability"] = cfg.spMaxProbability;
    out["spMinOdds"] = cfg.spMinOdds;
    out["spMaxOdds"] = cfg.spMaxOdds;
    out["evMinCombo"] = cfg.evMinCombo;
    out["roiMinCombo"] = cfg.roiMinCombo;
    out["minPayout"] = cfg.minPayoutCombo;
    out["evMinGlobal"] = cfg.evMinGlobal;
    out["minStakeIncrement"] = cfg.minStakeIncrement.toDouble();
    out["maxTicketsPerRace"] = cfg.maxTicketsPerRace;
    out["freshnessMaxAgeSeconds"] = static_cast<std::uint64_t>(cfg.freshnessMaxAgeSeconds);
    out["spMarket"] = toString(cfg.spMarket);
    out["roiPayoutHaircut"] = cfg.roiPayoutHaircut;
    json types = json::array();
    for (auto type : cfg.comboTypes) {
        types.push_back(toString(type));
    }
    out["comboTypes"] = types;
    out["comboCandidatePool"] = cfg.comboCandidatePool;
    out["monteCarloSamples"] = cfg.monteCarloSamples;
    out["monteCarloSeed"] = cfg.monteCarloSeed;
    out["enrichmentMinCoverage"] = cfg.enrichmentMinCoverage;
    out["driftThreshold"] = cfg.driftThreshold;
    json takeout = json::object();
    for (const auto& [type, rate] : cfg.takeout) {
        takeout[toString(type)] = rate;
    }
    out["takeout"] = takeout;
    return out;
}

void validateGpiConfig(const GpiConfig& cfg) {
    if (!cfg.budget.isPositive()) {
        throw AllocationFailure("budget must be positive, got " + cfg.budget.format());
    }
    if (!cfg.minStakeIncrement.isPositive()) {
        throw AllocationFailure("minStakeIncrement must be positive");
    }
    if (cfg.minStakeIncrement > cfg.budget) {
        throw AllocationFailure("minStakeIncrement " + cfg.minStakeIncrement.format() +
                                " exceeds budget " + cfg.budget.format());
    }

    requireFraction(cfg.kellyFraction, "kellyFraction", false);
    requireFraction(cfg.exposureCapFraction, "exposureCapFraction", false);
    requireFraction(cfg.spMaxProbability, "spMaxProbability", false);
    requireFraction(cfg.enrichmentMinCoverage, "enrichmentMinCoverage", true);

    if (!(cfg.overroundCeiling >= 1.0) || !std::isfinite(cfg.overroundCeiling)) {
        throw ConfigInvalid("overroundCeiling must be a finite value >= 1.0");
    }
    if (!(cfg.overroundCeilingHandicap >= 1.0) ||
        cfg.overroundCeilingHandicap > cfg.overroundCeiling) {
        throw ConfigInvalid("overroundCeilingHandicap must be in [1.0, overroundCeiling]");
    }
    if (cfg.handicapMinStarters == 0) {
        throw ConfigInvalid("handicapMinStarters must be positive");
    }
    if (!(cfg.overroundCeilingTrotSmallField >= 1.0) ||
        cfg.overroundCeilingTrotSmallField > cfg.overroundCeiling) {
        throw ConfigInvalid("overroundCeilingTrotSmallField must be in [1.0, overroundCeiling]");
    }
    if (!(cfg.spMinOdds > 1.0) || !std::isfinite(cfg.spMaxOdds) || cfg.spMaxOdds < cfg.spMinOdds) {
        throw ConfigInvalid("SP odds band must satisfy 1.0 < spMinOdds <= spMaxOdds");
    }

    requireFinite(cfg.evMinSp, "evMinSp");
    requireFinite(cfg.roiMinSp, "roiMinSp");
    requireFinite(cfg.evMinCombo, "evMinCombo");
    requireFinite(cfg.roiMinCombo, "roiMinCombo");
    requireFinite(cfg.evMinGlobal, "evMinGlobal");
    requireFinite(cfg.minPayoutCombo, "minPayout");
    if (cfg.minPayoutCombo < 0.0) {
        throw ConfigInvalid("minPayout must not be negative");
    }

    if (cfg.maxTicketsPerRace < 1 || cfg.maxTicketsPerRace > 2) {
        throw ConfigInvalid("maxTicketsPerRace must be 1 or 2");
    }
    if (cfg.freshnessMaxAgeSeconds <= 0) {
        throw ConfigInvalid("freshnessMaxAgeSeconds must be positive");
    }
    if (!(cfg.roiPayoutHaircut >= 0.0) || cfg.roiPayoutHaircut >= 1.0) {
        throw ConfigInvalid("roiPayoutHaircut must be in [0, 1)");
    }
    if (!(cfg.driftThreshold > 0.0) || !std::isfinite(cfg.driftThreshold)) {
        throw ConfigInvalid("driftThreshold must be positive");
    }

    for (auto type : cfg.comboTypes) {
        if (cfg.comboCandidatePool < legCount(type)) {
            throw ConfigInvalid(std::string("comboCandidatePool too small for ") + toString(type));
        }
        auto it = cfg.takeout.find(type);
        if (it == cfg.takeout.end()) {
            throw ConfigInvalid(std::string("takeout missing for ") + toString(type));
        }
        if (!(it->second >= 0.0) || it->second >= 1.0) {
            throw ConfigInvalid(std::string("takeout for ") + toString(type) + " must be in [0, 1)");
        }
        if (type == ComboType::Quartet && cfg.monteCarloSamples == 0) {
            throw ConfigInvalid("monteCarloSamples must be positive when QUARTET is enabled");
        }
    }
}

std::string resolveConfigPath(const std::string& explicitPath) {
    if (!explicitPath.empty()) {
        return explicitPath;
    }
    const char* env = std::getenv("GPI_CONFIG");
    if (env == nullptr) {
        return "";
    }
    return trim(env);
}

} // namespace gpi
