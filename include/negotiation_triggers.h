#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "actor.h"
#include "negotiation.h"
#include "negotiation_config.h"

// Purpose-specific details an evaluator attaches to its result.
struct TriggerContext {
    std::string reason;
    std::string threatActorId;
    double threatLevel = 0.0;
    std::string grievanceId;
    int grievanceCount = 0;
    int totalSeverity = 0;
    ResourceKind resourceType = ResourceKind::None;
    std::vector<std::string> commonThreats;
    std::string agendaId;
};

struct TriggerResult {
    bool shouldTrigger = false;
    NegotiationPurpose purpose = NegotiationPurpose::RequestHelp;
    NegotiationUrgency urgency = NegotiationUrgency::Low;
    int priority = 0;   // 0..100, ranking only
    TriggerContext context;
};

// Severity weight used when summing grievances for trigger thresholds.
int triggerSeverityWeight(GrievanceSeverity severity, const NegotiationConfig& config = defaultNegotiationConfig());

// Independent condition evaluators. All are total: a missing condition or an
// unresolved actor yields shouldTrigger == false and priority 0.
TriggerResult evaluateThreatTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                    const NegotiationConfig& config = defaultNegotiationConfig());
TriggerResult evaluateResourceSurplusTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                             const NegotiationConfig& config = defaultNegotiationConfig());
TriggerResult evaluateReconciliationTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                            const NegotiationConfig& config = defaultNegotiationConfig());
TriggerResult evaluateCompensationTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                          const NegotiationConfig& config = defaultNegotiationConfig());
TriggerResult evaluateMutualBenefitTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                           const NegotiationConfig& config = defaultNegotiationConfig());
TriggerResult evaluateWarningTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                     const NegotiationConfig& config = defaultNegotiationConfig());

// Per-simulation throttle state. Every call holds the lock, and tryClaim
// checks and records in one step, so a single actor can win at most one
// claim per spacing window even when actors are evaluated in parallel.
class TriggerTracker {
public:
    // Actors that never negotiated count as having done so on this turn.
    static constexpr int kUnrecordedTurn = 0;

    // Returns false when the actor has never been recorded.
    bool lastNegotiationTurn(const std::string& actorId, int& outTurn) const;
    void recordNegotiation(const std::string& actorId, int turn);
    // True while `currentTurn` is within the minimum spacing of the last recorded turn.
    bool isThrottled(const std::string& actorId, int currentTurn, int minTurnsBetween) const;
    // Records `currentTurn` unless the actor is throttled; returns whether it did.
    bool tryClaim(const std::string& actorId, int currentTurn, int minTurnsBetween);
    void reset();
    size_t trackedActorCount() const;

    static void setDebugMode(bool enabled) { s_debugMode = enabled; }
    static bool getDebugMode() { return s_debugMode; }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, int> m_lastTurn;
    static bool s_debugMode;
};

// Arbitrates one (actor, counterpart) pair: throttle, global cap, all six
// evaluators, highest priority wins (ties keep registration order). On
// success records the actor's negotiation turn and fills `out`.
bool checkAllTriggers(const Actor& actor,
                      const Actor& counterpart,
                      const WorldSnapshot& world,
                      int globalCountThisTurn,
                      TriggerTracker& tracker,
                      TriggerResult& out,
                      const NegotiationConfig& config = defaultNegotiationConfig());

// Runs every evaluator without throttling; results are in registration order.
std::vector<TriggerResult> collectTriggerCandidates(const Actor& actor,
                                                    const Actor& counterpart,
                                                    const WorldSnapshot& world,
                                                    const NegotiationConfig& config = defaultNegotiationConfig());

void resetTriggerTracking(TriggerTracker& tracker);
