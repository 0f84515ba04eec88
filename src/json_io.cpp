#include "json_io.hpp"

#include "errors.hpp"

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

namespace gpi {

namespace {

using nlohmann::json;

const json& requireField(const json& doc, const char* key) {
    if (!doc.is_object()) {
        throw DataUnavailable(std::string("expected an object holding ") + key);
    }
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        throw DataUnavailable(std::string("input field missing: ") + key);
    }
    return *it;
}

template <typename T>
T requireAs(const json& doc, const char* key) {
    const json& value = requireField(doc, key);
    try {
        return value.get<T>();
    } catch (const json::exception& ex) {
        throw DataUnavailable(std::string("input field ") + key + ": " + ex.what());
    }
}

Timestamp requireTimestamp(const json& doc, const char* key) {
    return timestampFromEpochSeconds(requireAs<std::int64_t>(doc, key));
}

Runner runnerFromJson(const json& doc) {
    Runner runner;
    runner.id = requireAs<std::string>(doc, "id");
    runner.number = requireAs<std::uint32_t>(doc, "number");
    runner.name = doc.value("name", std::string());
    runner.winOdds = requireAs<double>(doc, "winOdds");
    auto place = doc.find("placeOdds");
    if (place != doc.end() && !place->is_null()) {
        runner.placeOdds = requireAs<double>(doc, "placeOdds");
    }
    runner.scratched = doc.value("scratched", false);
    return runner;
}

std::set<RunnerId> idSet(const json& doc, const char* key) {
    std::vector<RunnerId> ids = requireAs<std::vector<RunnerId>>(doc, key);
    return std::set<RunnerId>(ids.begin(), ids.end());
}

} // namespace

json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw DataUnavailable("cannot open " + path);
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& ex) {
        throw DataUnavailable(path + ": " + ex.what());
    }
}

RaceSnapshot snapshotFromJson(const json& doc) {
    RaceSnapshot snapshot;
    snapshot.meetingId = requireAs<std::string>(doc, "meetingId");
    snapshot.raceId = requireAs<std::string>(doc, "raceId");
    try {
        snapshot.phase = parsePhase(requireAs<std::string>(doc, "phase"));
    } catch (const UnknownPhase& ex) {
        throw DataUnavailable(std::string("snapshot phase: ") + ex.what());
    }
    snapshot.capturedAt = requireTimestamp(doc, "capturedAt");
    const json& inputs = requireField(doc, "inputs");
    snapshot.inputs.odds = requireTimestamp(inputs, "odds");
    snapshot.inputs.runners = requireTimestamp(inputs, "runners");
    snapshot.inputs.scratches = requireTimestamp(inputs, "scratches");
    snapshot.handicap = doc.value("handicap", false);
    auto discipline = doc.find("discipline");
    if (discipline != doc.end() && !discipline->is_null()) {
        if (!discipline->is_string()) {
            throw DataUnavailable("input field discipline must be a string");
        }
        try {
            snapshot.discipline = parseDiscipline(discipline->get<std::string>());
        } catch (const ConfigInvalid& ex) {
            throw DataUnavailable(std::string("snapshot discipline: ") + ex.what());
        }
    }

    const json& runners = requireField(doc, "runners");
    if (!runners.is_array()) {
        throw DataUnavailable("input field runners must be an array");
    }
    for (const auto& entry : runners) {
        snapshot.runners.push_back(runnerFromJson(entry));
    }

    auto enrichment = doc.find("enrichment");
    if (enrichment != doc.end() && !enrichment->is_null()) {
        EnrichmentInfo info;
        info.capturedAt = requireTimestamp(*enrichment, "capturedAt");
        info.withJockeyTrainerStats = idSet(*enrichment, "jockeyTrainerStats");
        info.withChrono = idSet(*enrichment, "chrono");
        snapshot.enrichment = std::move(info);
    }
    return snapshot;
}

json snapshotToJson(const RaceSnapshot& snapshot) {
    json doc;
    doc["meetingId"] = snapshot.meetingId;
    doc["raceId"] = snapshot.raceId;
    doc["phase"] = toString(snapshot.phase);
    doc["capturedAt"] = toEpochSeconds(snapshot.capturedAt);
    doc["inputs"] = {
        { "odds", toEpochSeconds(snapshot.inputs.odds) },
        { "runners", toEpochSeconds(snapshot.inputs.runners) },
        { "scratches", toEpochSeconds(snapshot.inputs.scratches) },
    };
    doc["discipline"] = toString(snapshot.discipline);
    doc["handicap"] = snapshot.handicap;

    json runners = json::array();
    for (const auto& runner : snapshot.runners) {
        json entry = {
            { "id", runner.id },
            { "number", runner.number },
            { "name", runner.name },
            { "winOdds", runner.winOdds },
            { "scratched", runner.scratched },
        };
        if (runner.placeOdds) {
            entry["placeOdds"] = *runner.placeOdds;
        }
        runners.push_back(std::move(entry));
    }
    doc["runners"] = std::move(runners);

    if (snapshot.enrichment) {
        doc["enrichment"] = {
            { "capturedAt", toEpochSeconds(snapshot.enrichment->capturedAt) },
            { "jockeyTrainerStats", snapshot.enrichment->withJockeyTrainerStats },
            { "chrono", snapshot.enrichment->withChrono },
        };
    }
    return doc;
}

CalibrationInput calibrationFromJson(const json& doc) {
    CalibrationInput input;
    input.calibratedAt = requireTimestamp(doc, "calibratedAt");
    const json& runners = requireField(doc, "runners");
    if (!runners.is_object()) {
        throw DataUnavailable("calibration runners must be an object keyed by runner id");
    }
    for (auto it = runners.begin(); it != runners.end(); ++it) {
        RunnerCalibration cal;
        if (it->contains("win")) {
            cal.win = requireAs<double>(*it, "win");
        }
        if (it->contains("place")) {
            cal.place = requireAs<double>(*it, "place");
        }
        input.runners.emplace(it.key(), cal);
    }
    return input;
}

OfficialResult resultFromJson(const json& doc) {
    OfficialResult result;
    result.raceId = requireAs<std::string>(doc, "raceId");
    result.arrival = requireAs<std::vector<RunnerId>>(doc, "arrival");
    if (result.arrival.empty()) {
        throw DataUnavailable("official arrival is empty");
    }
    result.placesPaid = doc.value("placesPaid", std::size_t{ 3 });
    if (result.placesPaid == 0) {
        throw DataUnavailable("placesPaid must be positive");
    }
    auto dividends = doc.find("dividends");
    if (dividends != doc.end() && dividends->is_object()) {
        for (auto it = dividends->begin(); it != dividends->end(); ++it) {
            if (!it->is_number()) {
                throw DataUnavailable("dividend for " + it.key() + " must be a number");
            }
            result.dividends.emplace(it.key(), it->get<double>());
        }
    }
    return result;
}

std::vector<Ticket> ticketsFromJson(const json& decision) {
    std::vector<Ticket> tickets;
    const json& entries = requireField(decision, "tickets");
    for (const auto& entry : entries) {
        Ticket ticket;
        ticket.id = requireAs<std::string>(entry, "id");
        std::string kind = requireAs<std::string>(entry, "kind");
        ticket.kind = (kind == toString(BetKind::Combo)) ? BetKind::Combo : BetKind::Single;
        try {
            ticket.stake = Money::fromDouble(std::stod(requireAs<std::string>(entry, "stake")));
        } catch (const std::logic_error& ex) {
            throw DataUnavailable(std::string("ticket stake: ") + ex.what());
        }
        ticket.runners = requireAs<std::vector<RunnerId>>(entry, "runners");

        Estimate& est = ticket.estimate;
        est.kind = ticket.kind;
        est.involvedRunners = ticket.runners;
        try {
            if (ticket.kind == BetKind::Combo) {
                est.comboType = parseComboType(requireAs<std::string>(entry, "comboType"));
            } else {
                est.market = parseMarket(requireAs<std::string>(entry, "market"));
            }
        } catch (const ConfigInvalid& ex) {
            throw DataUnavailable(std::string("ticket ") + ticket.id + ": " + ex.what());
        }
        est.evRatio = entry.value("ev", 0.0);
        est.roiRatio = entry.value("roi", 0.0);
        est.probability = entry.value("probability", 0.0);
        est.expectedPayout = entry.value("expectedPayout", 0.0);
        est.decimalOdds = est.expectedPayout;
        tickets.push_back(std::move(ticket));
    }
    return tickets;
}

} // namespace gpi
