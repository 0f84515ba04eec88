#include "artifact.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "json_io.hpp"
#include "payout_model.hpp"
#include "pipeline.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

using namespace gpi;

namespace {

constexpr const char* kTool = "[gpi_decide] ";

void usage() {
    std::cerr << "Usage: gpi_decide --phase H30|H5|RESULT [--race ID] [--snapshot FILE] [--calibration FILE]\n"
              << "                  [--h30 ARTIFACT] [--h5 ARTIFACT] [--result FILE] [--config FILE]\n"
              << "                  [--now EPOCH] [--out FILE]\n"
              << "Config falls back to GPI_CONFIG; artifacts are signed when GPI_SIGNING_SEED is set.\n";
}

bool verbose() {
    const char* env = std::getenv("GPI_VERBOSE");
    return env != nullptr && std::string(env) == "1";
}

class FileSnapshotSource : public SnapshotSource {
public:
    explicit FileSnapshotSource(std::string path) : path_(std::move(path)) {}

    RaceSnapshot fetchSnapshot(const std::string&, Phase) override {
        if (path_.empty()) {
            throw DataUnavailable("no snapshot file given");
        }
        return snapshotFromJson(readJsonFile(path_));
    }

private:
    std::string path_;
};

class FileCalibrationSource : public CalibrationSource {
public:
    FileCalibrationSource(std::string path, const GpiConfig& cfg) : path_(std::move(path)), cfg_(cfg) {}

    PayoutModelPtr fetchModel(const RaceSnapshot& snapshot) override {
        if (path_.empty()) {
            throw DataUnavailable("no calibration file given");
        }
        CalibrationInput input = calibrationFromJson(readJsonFile(path_));
        FinishModelSettings finish;
        finish.monteCarloSamples = cfg_.monteCarloSamples;
        finish.seed = cfg_.monteCarloSeed;
        return std::make_shared<CalibratedPayoutModel>(
            snapshot, std::move(input.runners), input.calibratedAt, cfg_.takeout, finish);
    }

private:
    std::string path_;
    GpiConfig cfg_;
};

class FileResultSource : public ResultSource {
public:
    explicit FileResultSource(std::string path) : path_(std::move(path)) {}

    OfficialResult fetchResult(const std::string& raceId) override {
        if (path_.empty()) {
            throw DataUnavailable("no result file given");
        }
        OfficialResult result = resultFromJson(readJsonFile(path_));
        if (result.raceId != raceId) {
            throw DataUnavailable("result file is for race " + result.raceId);
        }
        return result;
    }

private:
    std::string path_;
};

class StreamSink : public ArtifactSink {
public:
    explicit StreamSink(std::string path) : path_(std::move(path)) {}

    void publish(const DecisionArtifact& artifact) override {
        std::string text = artifact.envelope().dump(2);
        if (path_.empty()) {
            std::cout << text << '\n';
            return;
        }
        std::ofstream out(path_);
        if (!out) {
            throw std::runtime_error("Failed to open output file: " + path_);
        }
        out << text << '\n';
    }

private:
    std::string path_;
};

void logTrail(const PhaseOutcome& outcome) {
    for (const auto& verdict : outcome.trail.verdicts) {
        std::cerr << kTool << toString(verdict.stage) << ' ' << verdict.subject << ": "
                  << (verdict.passed ? "pass" : "reject");
        for (const auto& reason : verdict.reasons) {
            std::cerr << " [" << toString(reason.code) << "] " << reason.note;
        }
        std::cerr << '\n';
    }
    for (const auto& failure : outcome.trail.estimationFailures) {
        std::cerr << kTool << "estimation failure: " << failure << '\n';
    }
    for (const auto& note : outcome.trail.allocationNotes) {
        std::cerr << kTool << "allocation " << note.leg << ": [" << toString(note.code) << "] " << note.note << '\n';
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::map<std::string, std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string key = argv[i];
        if (key == "--help" || key == "-h") {
            usage();
            return 0;
        }
        if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
            usage();
            return 1;
        }
        args[key.substr(2)] = argv[++i];
    }
    auto arg = [&](const char* name) {
        auto it = args.find(name);
        return it == args.end() ? std::string() : it->second;
    };

    if (arg("phase").empty()) {
        usage();
        return 1;
    }

    try {
        PhaseRequest request;
        request.phase = parsePhase(arg("phase"));

        std::string configPath = resolveConfigPath(arg("config"));
        if (configPath.empty()) {
            std::cerr << kTool << "no config given; using GPI v5.1 defaults\n";
            request.config = defaultGpiConfig();
            validateGpiConfig(request.config);
        } else {
            request.config = loadGpiConfigFile(configPath);
        }

        request.now = arg("now").empty() ? std::chrono::system_clock::now()
                                         : timestampFromEpochSeconds(std::stoll(arg("now")));

        request.raceId = arg("race");
        if (request.raceId.empty() && !arg("snapshot").empty()) {
            request.raceId = snapshotFromJson(readJsonFile(arg("snapshot"))).raceId;
        }
        if (request.raceId.empty() && !arg("result").empty()) {
            request.raceId = resultFromJson(readJsonFile(arg("result"))).raceId;
        }
        if (request.raceId.empty()) {
            std::cerr << kTool << "cannot determine the race: pass --race, --snapshot or --result\n";
            return 1;
        }

        if (!arg("h30").empty()) {
            nlohmann::json h30 = readJsonFile(arg("h30")).at("document");
            PriorPhase prior;
            prior.snapshot = snapshotFromJson(h30.at("snapshot"));
            const nlohmann::json& passed = h30.at("decision").at("marketGuardrailPassed");
            prior.marketPassed = passed.is_boolean() && passed.get<bool>();
            request.h30 = std::move(prior);
        }
        if (!arg("h5").empty()) {
            nlohmann::json h5 = readJsonFile(arg("h5")).at("document").at("decision");
            Decision prior;
            prior.phase = Phase::H5;
            prior.raceId = h5.at("raceId").get<std::string>();
            prior.meetingId = h5.at("meetingId").get<std::string>();
            prior.tickets = ticketsFromJson(h5);
            request.h5Decision = std::move(prior);
        }

        PipelineCollaborators collaborators;
        collaborators.snapshots = std::make_shared<FileSnapshotSource>(arg("snapshot"));
        collaborators.calibration = std::make_shared<FileCalibrationSource>(arg("calibration"), request.config);
        collaborators.results = std::make_shared<FileResultSource>(arg("result"));
        collaborators.estimator = std::make_shared<CalibratedEstimator>();
        DecisionPipeline pipeline(std::move(collaborators));

        std::unique_ptr<ArtifactSigner> signer = ArtifactSigner::fromEnvironment();
        if (!signer) {
            std::cerr << kTool << "GPI_SIGNING_SEED not set; artifact will be unsigned\n";
        }

        StreamSink sink(arg("out"));
        PhaseOutcome outcome = pipeline.run(request);
        if (verbose()) {
            logTrail(outcome);
        }
        DecisionArtifact artifact = buildArtifact(outcome, signer.get());
        sink.publish(artifact);

        const Decision& decision = outcome.decision;
        std::cerr << kTool << toString(decision.phase) << ' ' << decision.raceId << ": "
                  << (decision.abstain ? "ABSTAIN" : "BET") << " [" << toString(decision.reason) << "] "
                  << decision.message << '\n';
        std::cerr << kTool << "fingerprint " << artifact.fingerprint << '\n';
        return 0;
    } catch (const UnknownPhase& ex) {
        std::cerr << kTool << ex.what() << '\n';
        return 1;
    } catch (const ConfigInvalid& ex) {
        std::cerr << kTool << "configuration error: " << ex.what() << '\n';
        return 2;
    } catch (const DataUnavailable& ex) {
        std::cerr << kTool << "input error: " << ex.what() << '\n';
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << kTool << ex.what() << '\n';
        return 2;
    }
}
