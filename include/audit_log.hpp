#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gpi {

struct MerkleProofStep {
    std::string sibling;
    bool siblingIsLeft = false;
};

// Append-only log of audit events. Each event is hashed into a leaf; the root commits to
// every event in order. Odd layers pair the last node with itself.
class AuditLog {
public:
    void append(const std::string& event);

    std::size_t size() const { return leaves_.size(); }
    const std::vector<std::string>& leaves() const { return leaves_; }

    // Hex SHA-256 root; the hash of the empty string for an empty log.
    std::string merkleRoot() const;
    std::vector<MerkleProofStep> merkleProof(std::size_t leafIndex) const;

    static std::string hashEvent(const std::string& event);
    static bool verifyProof(const std::string& leafHash,
                            const std::vector<MerkleProofStep>& proof,
                            const std::string& root);

private:
    std::vector<std::string> leaves_;
};

std::string sha256Hex(const std::string& data);

} // namespace gpi
