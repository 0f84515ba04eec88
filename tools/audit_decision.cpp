#include "artifact.hpp"
#include "errors.hpp"
#include "json_io.hpp"

#include <exception>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: gpi_audit_decision <artifact.json> [publicKeyHex]\n";
        return 1;
    }

    std::string trustedKey = (argc == 3) ? argv[2] : "";
    nlohmann::json envelope;
    try {
        envelope = gpi::readJsonFile(argv[1]);
    } catch (const gpi::DataUnavailable& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    gpi::ArtifactCheck check;
    try {
        check = gpi::verifyArtifact(envelope, trustedKey);
    } catch (const std::exception& ex) {
        std::cerr << "Malformed artifact: " << ex.what() << '\n';
        return 1;
    }

    std::cout << "Fingerprint: " << (check.fingerprintMatches ? "valid" : "INVALID") << '\n';
    std::cout << "Signature: "
              << (!check.isSigned ? "absent" : (check.signatureValid ? "valid" : "INVALID")) << '\n';
    std::cout << "Detail: " << check.detail << '\n';

    if (check.fingerprintMatches && envelope.at("document").contains("decision")) {
        const auto& decision = envelope.at("document").at("decision");
        std::cout << "Decision: " << decision.value("phase", "") << ' ' << decision.value("raceId", "") << ' '
                  << (decision.value("abstain", true) ? "ABSTAIN" : "BET") << " ["
                  << decision.value("reason", "") << "]\n";
        for (const auto& ticket : decision.at("tickets")) {
            std::cout << "  " << ticket.value("id", "") << " stake " << ticket.value("stake", "") << '\n';
        }
    }
    return check.ok() ? 0 : 3;
}
