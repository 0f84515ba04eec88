#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "payout_model.hpp"
#include "phase.hpp"
#include "snapshot.hpp"

namespace gpi {

struct DecisionArtifact;

// Acquisition collaborator. Throws DataUnavailable when no usable snapshot exists.
class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;
    virtual RaceSnapshot fetchSnapshot(const std::string& raceId, Phase phase) = 0;
};

class CalibrationSource {
public:
    virtual ~CalibrationSource() = default;
    virtual PayoutModelPtr fetchModel(const RaceSnapshot& snapshot) = 0;
};

struct OfficialResult {
    std::string raceId;
    std::vector<RunnerId> arrival;
    // Leading positions paid on the PLACE market.
    std::size_t placesPaid = 3;
    // Gross return per unit stake, keyed by ticket label ("TRIO:1-4-7", "SP_PLACE:7").
    std::map<std::string, double> dividends;
};

class ResultSource {
public:
    virtual ~ResultSource() = default;
    virtual OfficialResult fetchResult(const std::string& raceId) = 0;
};

// Receives complete artifacts only.
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;
    virtual void publish(const DecisionArtifact& artifact) = 0;
};

} // namespace gpi
