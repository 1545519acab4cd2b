#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "actor.h"
#include "diplomatic_messages.h"
#include "negotiation.h"
#include "negotiation_config.h"
#include "negotiation_triggers.h"

struct TurnReport {
    int turn = 0;
    int proposed = 0;
    int expired = 0;
    int accepted = 0;
    int rejected = 0;
    int countered = 0;
    std::vector<std::string> events;
};

// Owns the per-simulation negotiation state: throttle tracker, session queue
// and the RNG streams used for messages and responses.
class NegotiationDirector {
public:
    NegotiationDirector(const NegotiationContext& context, const DiplomaticMessages& messages);

    // Expires due sessions, then lets every AI actor (in id order) try each
    // counterpart (in id order) until the per-turn cap is reached.
    TurnReport runTurn(const WorldSnapshot& world);

    // AI counterparts answer every pending session addressed to them.
    // Counter-offers are queued and answered on a later call.
    void resolveAiResponses(const WorldSnapshot& world, TurnReport& report);

    // Player (or host) decision on a pending session. The session leaves
    // sessions() on the next runTurn or resolveAiResponses.
    bool respond(int sessionId, bool accept);

    // Live sessions. Resolved and expired ones move to resolvedHistory(),
    // which keeps the most recent kHistoryLimit entries.
    const std::vector<NegotiationSession>& sessions() const { return m_sessions; }
    const std::vector<NegotiationSession>& resolvedHistory() const { return m_history; }
    // Searches live sessions, then the history.
    const NegotiationSession* findSession(int sessionId) const;
    std::vector<const NegotiationSession*> pendingFor(const std::string& actorId) const;

    TriggerTracker& tracker() { return m_tracker; }
    std::uint64_t computeStateHash() const;
    void reset();

    static void setDebugMode(bool enabled) { s_debugMode = enabled; }
    static bool getDebugMode() { return s_debugMode; }

    static constexpr size_t kHistoryLimit = 64;

private:
    void pruneResolved();

    const NegotiationContext& m_context;
    const DiplomaticMessages& m_messages;
    TriggerTracker m_tracker;
    std::vector<NegotiationSession> m_sessions;
    std::vector<NegotiationSession> m_history;
    int m_nextSessionId = 1;
    std::mt19937_64 m_messageRng;
    std::mt19937_64 m_responseRng;

    static bool s_debugMode;
};
