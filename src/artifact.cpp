#include "artifact.hpp"

#include "audit_log.hpp"
#include "errors.hpp"
#include "json_io.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace gpi {

namespace {

using nlohmann::json;

json rounded(double value, double scale) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return std::round(value * scale) / scale;
}

json ratio(double value) {
    return rounded(value, 100.0);
}

json ratio(const std::optional<double>& value) {
    return value ? ratio(*value) : json(nullptr);
}

json timestamp(const std::optional<Timestamp>& value) {
    return value ? json(formatTimestamp(*value)) : json(nullptr);
}

json money(const std::optional<Money>& value) {
    return value ? json(value->format()) : json(nullptr);
}

json ticketToJson(const Ticket& ticket) {
    json doc = {
        { "id", ticket.id },
        { "kind", toString(ticket.kind) },
        { "stake", ticket.stake.format() },
        { "runners", ticket.runners },
        { "label", ticket.estimate.label() },
        { "ev", ratio(ticket.estimate.evRatio) },
        { "roi", ratio(ticket.estimate.roiRatio) },
        { "probability", rounded(ticket.estimate.probability, 10000.0) },
        { "expectedPayout", ratio(ticket.estimate.expectedPayout) },
    };
    if (ticket.kind == BetKind::Combo && ticket.estimate.comboType) {
        doc["comboType"] = toString(*ticket.estimate.comboType);
    } else {
        doc["market"] = toString(ticket.estimate.market);
    }
    return doc;
}

json reconciliationToJson(const Reconciliation& rec) {
    json settlements = json::array();
    for (const auto& s : rec.settlements) {
        settlements.push_back({
            { "ticketId", s.ticketId },
            { "stake", s.stake.format() },
            { "hit", s.hit },
            { "grossReturn", money(s.grossReturn) },
        });
    }
    return {
        { "arrival", rec.arrival },
        { "settlements", std::move(settlements) },
        { "totalStake", rec.totalStake.format() },
        { "totalReturn", money(rec.totalReturn) },
        { "net", money(rec.net) },
    };
}

json noteToJson(const AllocationNote& note) {
    return { { "code", toString(note.code) }, { "leg", note.leg }, { "note", note.note } };
}

std::string auditRootFromTrail(const json& trail) {
    AuditLog log;
    for (const char* key : { "verdicts", "estimates", "allocationNotes", "estimationFailures", "warnings" }) {
        auto it = trail.find(key);
        if (it == trail.end()) {
            continue;
        }
        for (const auto& entry : *it) {
            log.append(entry.dump());
        }
    }
    return log.merkleRoot();
}

} // namespace

json estimateToJson(const Estimate& estimate) {
    json doc = {
        { "label", estimate.label() },
        { "kind", toString(estimate.kind) },
        { "runners", estimate.involvedRunners },
        { "ev", ratio(estimate.evRatio) },
        { "roi", ratio(estimate.roiRatio) },
        { "probability", rounded(estimate.probability, 10000.0) },
        { "odds", ratio(estimate.decimalOdds) },
        { "expectedPayout", ratio(estimate.expectedPayout) },
        { "simulated", estimate.simulated },
    };
    return doc;
}

json verdictToJson(const GuardrailVerdict& verdict) {
    json reasons = json::array();
    for (const auto& reason : verdict.reasons) {
        reasons.push_back({ { "code", toString(reason.code) }, { "note", reason.note } });
    }
    return {
        { "stage", toString(verdict.stage) },
        { "subject", verdict.subject },
        { "passed", verdict.passed },
        { "reasons", std::move(reasons) },
    };
}

json decisionToJson(const Decision& decision) {
    json tickets = json::array();
    for (const auto& ticket : decision.tickets) {
        tickets.push_back(ticketToJson(ticket));
    }
    json drift = json::array();
    for (const auto& d : decision.drift) {
        drift.push_back({
            { "runner", d.runner },
            { "h30Odds", ratio(d.h30Odds) },
            { "h5Odds", ratio(d.h5Odds) },
            { "change", ratio(d.change) },
            { "class", toString(d.drift) },
        });
    }

    json doc;
    doc["phase"] = toString(decision.phase);
    doc["meetingId"] = decision.meetingId;
    doc["raceId"] = decision.raceId;
    doc["abstain"] = decision.abstain;
    doc["reason"] = toString(decision.reason);
    doc["message"] = decision.message;
    doc["tickets"] = std::move(tickets);
    doc["evGlobal"] = ratio(decision.evGlobalEstimate);
    doc["roiGlobal"] = ratio(decision.roiGlobalEstimate);
    doc["overround"] = ratio(decision.overround);
    doc["marketGuardrailPassed"] =
        decision.marketGuardrailPassed ? json(*decision.marketGuardrailPassed) : json(nullptr);
    doc["snapshotCapturedAt"] = timestamp(decision.snapshotCapturedAt);
    doc["calibratedAt"] = timestamp(decision.calibratedAt);
    doc["drift"] = std::move(drift);
    doc["reconciliation"] =
        decision.reconciliation ? reconciliationToJson(*decision.reconciliation) : json(nullptr);
    return doc;
}

json trailToJson(const AuditTrail& trail) {
    json verdicts = json::array();
    for (const auto& v : trail.verdicts) {
        verdicts.push_back(verdictToJson(v));
    }
    json estimates = json::array();
    for (const auto& e : trail.estimates) {
        estimates.push_back(estimateToJson(e));
    }
    json notes = json::array();
    for (const auto& n : trail.allocationNotes) {
        notes.push_back(noteToJson(n));
    }
    return {
        { "verdicts", std::move(verdicts) },
        { "estimates", std::move(estimates) },
        { "allocationNotes", std::move(notes) },
        { "estimationFailures", trail.estimationFailures },
        { "warnings", trail.warnings },
    };
}

std::string auditRoot(const AuditTrail& trail) {
    return auditRootFromTrail(trailToJson(trail));
}

ArtifactSigner::ArtifactSigner(const std::string& seedHex) {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    SecureBytes seed = SecureBytes::fromHex(seedHex);
    if (seed.size() != crypto_sign_SEEDBYTES) {
        throw ConfigInvalid("signing seed must be " + std::to_string(crypto_sign_SEEDBYTES) +
                            " bytes (hex encoded)");
    }
    secretKey_ = SecureBytes(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_seed_keypair(publicKey_.data(), secretKey_.data(), seed.data()) != 0) {
        throw std::runtime_error("Unable to derive signing key pair");
    }
}

std::unique_ptr<ArtifactSigner> ArtifactSigner::fromEnvironment() {
    const char* seed = std::getenv("GPI_SIGNING_SEED");
    if (seed == nullptr || *seed == '\0') {
        return nullptr;
    }
    return std::make_unique<ArtifactSigner>(seed);
}

std::string ArtifactSigner::publicKeyHex() const {
    return bytesToHex(publicKey_.data(), publicKey_.size());
}

std::string ArtifactSigner::signHex(const std::string& message) const {
    std::array<unsigned char, crypto_sign_BYTES> signature{};
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(signature.data(),
                             &sigLen,
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size(),
                             secretKey_.data()) != 0) {
        throw std::runtime_error("Signing failed");
    }
    return bytesToHex(signature.data(), static_cast<std::size_t>(sigLen));
}

bool ArtifactSigner::verifyHex(const std::string& publicKeyHex,
                               const std::string& message,
                               const std::string& signatureHex) {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    std::vector<unsigned char> publicKey;
    std::vector<unsigned char> signature;
    try {
        publicKey = hexToBytes(publicKeyHex);
        signature = hexToBytes(signatureHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (publicKey.size() != crypto_sign_PUBLICKEYBYTES || signature.size() != crypto_sign_BYTES) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       publicKey.data()) == 0;
}

json DecisionArtifact::envelope() const {
    json doc = {
        { "document", document },
        { "fingerprint", fingerprint },
        { "auditRoot", auditRoot },
    };
    if (!signatureHex.empty()) {
        doc["signature"] = signatureHex;
        doc["publicKey"] = publicKeyHex;
    }
    return doc;
}

std::string DecisionArtifact::signedMessage() const {
    return fingerprint + ":" + auditRoot;
}

DecisionArtifact buildArtifact(const PhaseOutcome& outcome, const ArtifactSigner* signer) {
    DecisionArtifact artifact;
    artifact.document["decision"] = decisionToJson(outcome.decision);
    artifact.document["trail"] = trailToJson(outcome.trail);
    artifact.document["snapshot"] = outcome.snapshot ? snapshotToJson(*outcome.snapshot) : json(nullptr);

    artifact.fingerprint = sha256Hex(artifact.document.dump());
    artifact.auditRoot = auditRootFromTrail(artifact.document["trail"]);
    if (signer != nullptr) {
        artifact.signatureHex = signer->signHex(artifact.signedMessage());
        artifact.publicKeyHex = signer->publicKeyHex();
    }
    return artifact;
}

ArtifactCheck verifyArtifact(const json& envelope, const std::string& trustedPublicKeyHex) {
    ArtifactCheck check;
    if (!envelope.is_object() || !envelope.contains("document") || !envelope.contains("fingerprint")) {
        check.detail = "artifact is missing document or fingerprint";
        return check;
    }
    const json& document = envelope.at("document");
    std::string fingerprint = envelope.at("fingerprint").get<std::string>();
    check.fingerprintMatches = sha256Hex(document.dump()) == fingerprint;
    if (!check.fingerprintMatches) {
        check.detail = "fingerprint mismatch";
        return check;
    }

    std::string root = document.contains("trail") ? auditRootFromTrail(document.at("trail")) : std::string();
    if (envelope.value("auditRoot", std::string()) != root) {
        check.fingerprintMatches = false;
        check.detail = "audit root mismatch";
        return check;
    }

    auto sig = envelope.find("signature");
    if (sig == envelope.end()) {
        check.detail = trustedPublicKeyHex.empty() ? "unsigned" : "unsigned but a public key was supplied";
        if (!trustedPublicKeyHex.empty()) {
            check.isSigned = true;
        }
        return check;
    }
    check.isSigned = true;
    std::string publicKey = trustedPublicKeyHex.empty() ? envelope.value("publicKey", std::string())
                                                        : trustedPublicKeyHex;
    check.signatureValid = ArtifactSigner::verifyHex(publicKey, fingerprint + ":" + root, sig->get<std::string>());
    check.detail = check.signatureValid ? "signature valid" : "signature invalid";
    return check;
}

} // namespace gpi
