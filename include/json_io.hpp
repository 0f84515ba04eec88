#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "payout_model.hpp"
#include "snapshot.hpp"
#include "sources.hpp"
#include "staking.hpp"

namespace gpi {

// Input documents for the tools. Malformed or missing fields throw DataUnavailable naming
// the field; timestamps are epoch seconds.

nlohmann::json readJsonFile(const std::string& path);

RaceSnapshot snapshotFromJson(const nlohmann::json& doc);
nlohmann::json snapshotToJson(const RaceSnapshot& snapshot);

struct CalibrationInput {
    Timestamp calibratedAt{};
    std::map<RunnerId, RunnerCalibration> runners;
};

CalibrationInput calibrationFromJson(const nlohmann::json& doc);

OfficialResult resultFromJson(const nlohmann::json& doc);

// Tickets of a previously emitted decision document, enough to reconcile them.
std::vector<Ticket> ticketsFromJson(const nlohmann::json& decision);

} // namespace gpi
