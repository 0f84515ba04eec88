#pragma once

#include <array>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <sodium.h>

#include "decision.hpp"
#include "secure_memory.hpp"

namespace gpi {

// Canonical encodings. Keys are sorted; ratios are rounded to two decimals and money is
// rendered as fixed two-decimal strings here and nowhere earlier.
nlohmann::json decisionToJson(const Decision& decision);
nlohmann::json estimateToJson(const Estimate& estimate);
nlohmann::json verdictToJson(const GuardrailVerdict& verdict);
nlohmann::json trailToJson(const AuditTrail& trail);

// Root over every verdict, estimate, allocation note and failure, in that order.
std::string auditRoot(const AuditTrail& trail);

// Deterministic Ed25519 signer seeded from GPI_SIGNING_SEED or an explicit hex seed.
class ArtifactSigner {
public:
    explicit ArtifactSigner(const std::string& seedHex);

    // Reads GPI_SIGNING_SEED; nullptr when unset.
    static std::unique_ptr<ArtifactSigner> fromEnvironment();

    std::string publicKeyHex() const;
    std::string signHex(const std::string& message) const;

    static bool verifyHex(const std::string& publicKeyHex,
                          const std::string& message,
                          const std::string& signatureHex);

private:
    SecureBytes secretKey_;
    std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> publicKey_{};
};

struct DecisionArtifact {
    nlohmann::json document;
    std::string fingerprint;
    std::string auditRoot;
    std::string signatureHex;
    std::string publicKeyHex;

    // {"document", "fingerprint", "auditRoot", "signature"?, "publicKey"?}
    nlohmann::json envelope() const;
    std::string signedMessage() const;
};

DecisionArtifact buildArtifact(const PhaseOutcome& outcome, const ArtifactSigner* signer);

struct ArtifactCheck {
    bool fingerprintMatches = false;
    bool isSigned = false;
    bool signatureValid = false;
    std::string detail;

    bool ok() const { return fingerprintMatches && (!isSigned || signatureValid); }
};

// Recomputes the fingerprint of the embedded document and checks the signature against
// trustedPublicKeyHex, or the embedded key when none is given.
ArtifactCheck verifyArtifact(const nlohmann::json& envelope, const std::string& trustedPublicKeyHex = {});

} // namespace gpi
