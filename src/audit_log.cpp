#include "audit_log.hpp"

#include "picosha2.h"

#include <stdexcept>
#include <utility>

namespace gpi {

namespace {

std::string hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

} // namespace

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string AuditLog::hashEvent(const std::string& event) {
    return sha256Hex(event);
}

void AuditLog::append(const std::string& event) {
    leaves_.push_back(hashEvent(event));
}

std::string AuditLog::merkleRoot() const {
    if (leaves_.empty()) {
        return sha256Hex("");
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<MerkleProofStep> AuditLog::merkleProof(std::size_t leafIndex) const {
    if (leafIndex >= leaves_.size()) {
        throw std::out_of_range("audit log has no leaf " + std::to_string(leafIndex));
    }

    std::vector<MerkleProofStep> proof;
    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        bool isRight = (index % 2) == 1;
        std::size_t siblingIndex = isRight ? index - 1 : index + 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index;
        }
        proof.push_back(MerkleProofStep{ layer[siblingIndex], isRight });

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }
    return proof;
}

bool AuditLog::verifyProof(const std::string& leafHash,
                           const std::vector<MerkleProofStep>& proof,
                           const std::string& root) {
    std::string current = leafHash;
    for (const auto& step : proof) {
        current = step.siblingIsLeft ? hashPair(step.sibling, current) : hashPair(current, step.sibling);
    }
    return current == root;
}

} // namespace gpi
