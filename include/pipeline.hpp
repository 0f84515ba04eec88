#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "artifact.hpp"
#include "config.hpp"
#include "decision.hpp"
#include "estimator.hpp"
#include "sources.hpp"

namespace gpi {

// Polled between pipeline stages.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    void throwIfCancelled(const char* stage) const;

private:
    std::atomic<bool> cancelled_{ false };
};

// At most one running invocation per (raceId, phase) in this process.
class InFlightRegistry {
public:
    class Guard {
    public:
        Guard(InFlightRegistry& registry, std::pair<std::string, Phase> key);
        ~Guard();
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        InFlightRegistry& registry_;
        std::pair<std::string, Phase> key_;
    };

    // Throws ConcurrentInvocation when the key is already held.
    Guard acquire(const std::string& raceId, Phase phase);
    bool isRunning(const std::string& raceId, Phase phase) const;

private:
    void release(const std::pair<std::string, Phase>& key);

    mutable std::mutex mutex_;
    std::set<std::pair<std::string, Phase>> running_;
};

// Outcome of the H30 invocation for the same race, supplied back by the caller.
struct PriorPhase {
    RaceSnapshot snapshot;
    bool marketPassed = false;
};

struct PhaseRequest {
    Phase phase = Phase::H30;
    std::string meetingId;
    std::string raceId;
    // Reference clock for freshness. Required: run() rejects the default value.
    Timestamp now{};
    GpiConfig config;
    std::optional<PriorPhase> h30;
    std::optional<Decision> h5Decision;
};

struct PipelineCollaborators {
    std::shared_ptr<SnapshotSource> snapshots;
    std::shared_ptr<CalibrationSource> calibration;
    std::shared_ptr<ResultSource> results;
    std::shared_ptr<const EvEstimator> estimator;
};

// Deterministic per-phase state machine. Holds no per-race state between calls; the
// registry is the only thing shared across invocations.
class DecisionPipeline {
public:
    explicit DecisionPipeline(PipelineCollaborators collaborators,
                              std::shared_ptr<InFlightRegistry> registry = std::make_shared<InFlightRegistry>());

    // ConfigInvalid/AllocationFailure, UnknownPhase, InvocationCancelled and
    // ConcurrentInvocation propagate, as does std::invalid_argument for an empty race id
    // or an unset clock. Data problems become abstaining decisions.
    PhaseOutcome run(const PhaseRequest& request, const CancellationToken* token = nullptr) const;

    // Builds the artifact and hands it to the sink only once it is complete.
    DecisionArtifact runAndPublish(const PhaseRequest& request,
                                   ArtifactSink& sink,
                                   const ArtifactSigner* signer = nullptr,
                                   const CancellationToken* token = nullptr) const;

private:
    PhaseOutcome runH30(const PhaseRequest& request, const CancellationToken* token) const;
    PhaseOutcome runH5(const PhaseRequest& request, const CancellationToken* token) const;
    PhaseOutcome runResult(const PhaseRequest& request, const CancellationToken* token) const;

    PipelineCollaborators collaborators_;
    std::shared_ptr<InFlightRegistry> registry_;
};

// Per-ticket hit/miss and returns against the official arrival. Never mutates the tickets.
Reconciliation reconcile(const std::vector<Ticket>& tickets, const OfficialResult& result);

// "<raceId>:<phase>:<estimate label>", e.g. "R1C3:H5:TRIO:1-4-7".
std::string ticketId(const std::string& raceId, Phase phase, const Estimate& estimate);

} // namespace gpi
