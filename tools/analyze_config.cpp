#include "config.hpp"
#include "deterministic_math.hpp"
#include "errors.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace gpi;

namespace {

void printThresholds(const GpiConfig& cfg) {
    std::cout << "=== GPI THRESHOLDS ===\n";
    std::cout << toJson(cfg).dump(2) << "\n\n";
    std::cout << "Race budget: " << cfg.budget.format() << "  increment: " << cfg.minStakeIncrement.format()
              << "  exposure cap per runner: " << cfg.budget.scaledDown(cfg.exposureCapFraction).format() << '\n';
    std::cout << "Overround ceiling: " << cfg.overroundCeiling << " (handicap with >= " << cfg.handicapMinStarters
              << " starters: " << cfg.overroundCeilingHandicap << ", trot with <= " << cfg.trotSmallFieldMaxStarters
              << " starters: " << cfg.overroundCeilingTrotSmallField << ")\n";
    std::cout << "SP win odds band: " << cfg.spMinOdds << " - " << cfg.spMaxOdds << '\n';
}

void printKellyTable(const GpiConfig& cfg) {
    const std::vector<double> odds = { 1.5, 2.0, 3.0, 5.0, 8.0, 12.0, 20.0 };
    const std::vector<double> probs = { 0.05, 0.10, 0.20, 0.30, 0.45, 0.60 };

    std::cout << "\n=== FRACTIONAL KELLY STAKE (kelly fraction " << cfg.kellyFraction << ") ===\n";
    std::cout << std::setw(8) << "p \\ odds";
    for (double o : odds) {
        std::cout << std::setw(8) << std::fixed << std::setprecision(1) << o;
    }
    std::cout << '\n';

    for (double p : probs) {
        std::cout << std::setw(8) << std::fixed << std::setprecision(2) << p;
        for (double o : odds) {
            double f = DeterministicMath::kellyFraction(p, o);
            Money stake = cfg.budget.scaledDown(cfg.kellyFraction * f);
            Money cap = cfg.budget.scaledDown(cfg.exposureCapFraction);
            if (stake > cap) {
                stake = cap;
            }
            stake = stake.floorTo(cfg.minStakeIncrement);
            std::cout << std::setw(8) << stake.format();
        }
        std::cout << '\n';
    }

    std::cout << "\n=== BREAK-EVEN SINGLE EV ===\n";
    for (double o : odds) {
        double pMin = (1.0 + cfg.evMinSp) / o;
        std::cout << "  odds " << std::setw(5) << std::setprecision(1) << o << " needs p >= " << std::setprecision(3)
                  << pMin << (pMin > cfg.spMaxProbability ? "  (above max probability)" : "")
                  << (o < cfg.spMinOdds || o > cfg.spMaxOdds ? "  (outside odds band)" : "") << '\n';
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string explicitPath;
    for (int i = 1; i < argc; ++i) {
        std::string key = argv[i];
        if (key == "--config" && i + 1 < argc) {
            explicitPath = argv[++i];
        } else {
            std::cerr << "Usage: gpi_analyze_config [--config FILE]\n";
            return 1;
        }
    }

    try {
        std::string path = resolveConfigPath(explicitPath);
        GpiConfig cfg = path.empty() ? defaultGpiConfig() : loadGpiConfigFile(path);
        validateGpiConfig(cfg);
        std::cout << "Config source: " << (path.empty() ? "built-in GPI v5.1 defaults" : path) << "\n\n";
        printThresholds(cfg);
        printKellyTable(cfg);
    } catch (const ConfigInvalid& ex) {
        std::cerr << "Configuration error: " << ex.what() << '\n';
        return 2;
    }
    return 0;
}
