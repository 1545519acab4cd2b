#include "negotiation_runner.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include "deal_composer.h"
#include "item_valuation.h"
#include "negotiation_evaluator.h"

bool NegotiationDirector::s_debugMode = false;

namespace {

constexpr std::uint64_t kMessageSalt = 0x4D455353414745ull;
constexpr std::uint64_t kResponseSalt = 0x524553504F4E53ull;

std::uint64_t mixHash(std::uint64_t h, std::uint64_t v) {
    h ^= v + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    return h;
}

std::uint64_t hashDouble(double v, double scale = 1.0e3) {
    if (!std::isfinite(v)) {
        return 0xFFFFFFFFFFFFFFFFull;
    }
    const double q = std::round(v * scale) / scale;
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(q * scale));
}

std::uint64_t hashItems(std::uint64_t h, const std::vector<NegotiableItem>& items) {
    h = mixHash(h, static_cast<std::uint64_t>(items.size()));
    for (const NegotiableItem& item : items) {
        h = mixHash(h, static_cast<std::uint64_t>(item.kind));
        h = mixHash(h, hashDouble(item.amount));
        h = mixHash(h, static_cast<std::uint64_t>(std::max(0, item.duration)));
        h = mixHash(h, NegotiationContext::hashString(item.targetId + "|" + item.grievanceId + "|" + item.subtype));
    }
    return h;
}

// Stable id-ordered view of the snapshot's actors.
std::vector<const Actor*> sortedActors(const std::vector<Actor>& actors) {
    std::vector<const Actor*> out;
    out.reserve(actors.size());
    for (const Actor& a : actors) {
        out.push_back(&a);
    }
    std::sort(out.begin(), out.end(), [](const Actor* a, const Actor* b) { return a->id < b->id; });
    return out;
}

std::string firstLine(const std::string& text) {
    const size_t nl = text.find('\n');
    return (nl == std::string::npos) ? text : text.substr(0, nl);
}

} // namespace

NegotiationDirector::NegotiationDirector(const NegotiationContext& context, const DiplomaticMessages& messages)
    : m_context(context),
      m_messages(messages),
      m_messageRng(context.makeRng(kMessageSalt)),
      m_responseRng(context.makeRng(kResponseSalt)) {}

TurnReport NegotiationDirector::runTurn(const WorldSnapshot& world) {
    const NegotiationConfig& cfg = m_context.config;
    TurnReport report;
    report.turn = world.currentTurn;

    for (NegotiationSession& s : m_sessions) {
        if (s.expireIfDue(world.currentTurn)) {
            ++report.expired;
            report.events.push_back("Turn " + std::to_string(world.currentTurn) + ": proposal #" +
                                    std::to_string(s.getId()) + " from " + s.getProposerId() + " expired");
        }
    }

    pruneResolved();

    const std::vector<const Actor*> ordered = sortedActors(world.actors);
    int globalCount = 0;
    for (const Actor* actor : ordered) {
        if (globalCount >= cfg.throttle.maxPerTurn) break;
        if (actor->playerControlled) continue;

        for (const Actor* counterpart : ordered) {
            if (counterpart == actor) continue;

            TriggerResult trigger;
            if (!checkAllTriggers(*actor, *counterpart, world, globalCount, m_tracker, trigger, cfg)) {
                continue;
            }

            NegotiationSession session =
                generateNegotiationDeal(*actor, *counterpart, world, trigger, m_nextSessionId++, cfg);
            session.setMessage(m_messages.composeMessage(trigger.purpose, trigger.context.reason, m_messageRng));

            const ValidationResult validation = validateNegotiation(session, *actor, *counterpart);
            if (s_debugMode && !validation.issues.empty()) {
                std::cout << "[Diplomacy] Proposal #" << session.getId() << " advisory: " << validation.reason
                          << std::endl;
            }

            report.events.push_back("Turn " + std::to_string(world.currentTurn) + ": " + actor->name + " -> " +
                                    counterpart->name + " [" + purposeName(trigger.purpose) + "] " +
                                    firstLine(session.getMessage()));
            m_sessions.push_back(std::move(session));
            ++report.proposed;
            ++globalCount;
            break;
        }
    }

    if (s_debugMode) {
        std::cout << "[Diplomacy] Turn " << world.currentTurn << ": " << report.proposed << " proposed, "
                  << report.expired << " expired" << std::endl;
    }
    return report;
}

void NegotiationDirector::resolveAiResponses(const WorldSnapshot& world, TurnReport& report) {
    const NegotiationConfig& cfg = m_context.config;
    std::vector<NegotiationSession> replies;

    for (NegotiationSession& s : m_sessions) {
        if (!s.isPending()) continue;
        const Actor* responder = findActor(world.actors, s.getCounterpartId());
        const Actor* proposer = findActor(world.actors, s.getProposerId());
        if (!responder || !proposer || responder->playerControlled) continue;

        const DealEvaluation ev = evaluateDeal(s, *responder, *proposer, world, m_responseRng, cfg);
        std::ostringstream line;
        line << "Turn " << world.currentTurn << ": " << responder->name << " " << verdictName(ev.verdict)
             << "s #" << s.getId() << " (score " << std::lround(ev.finalScore) << ") "
             << m_messages.feedbackLine(ev.feedbackKey, m_messageRng);

        switch (ev.verdict) {
            case DealVerdict::Accept:
                s.accept();
                ++report.accepted;
                break;
            case DealVerdict::Counter: {
                NegotiationSession reply;
                if (applyCounterOffer(s, ev.counterOffer, m_nextSessionId, world.currentTurn, cfg.expiration, reply)) {
                    ++m_nextSessionId;
                    reply.setMessage(ev.counterOffer.explanation);
                    line << " -> counter #" << reply.getId() << ": " << ev.counterOffer.explanation;
                    replies.push_back(std::move(reply));
                    ++report.countered;
                }
                break;
            }
            case DealVerdict::Reject:
            default:
                s.reject();
                ++report.rejected;
                if (!ev.rejectionReasons.empty()) {
                    line << " [" << ev.rejectionReasons.front() << "]";
                }
                break;
        }
        report.events.push_back(line.str());
    }

    for (NegotiationSession& r : replies) {
        m_sessions.push_back(std::move(r));
    }
    pruneResolved();
}

void NegotiationDirector::pruneResolved() {
    const auto firstResolved = std::stable_partition(m_sessions.begin(), m_sessions.end(),
                                                     [](const NegotiationSession& s) { return s.isPending(); });
    for (auto it = firstResolved; it != m_sessions.end(); ++it) {
        m_history.push_back(std::move(*it));
    }
    m_sessions.erase(firstResolved, m_sessions.end());

    if (m_history.size() > kHistoryLimit) {
        m_history.erase(m_history.begin(), m_history.begin() + static_cast<std::ptrdiff_t>(m_history.size() - kHistoryLimit));
    }
}

bool NegotiationDirector::respond(int sessionId, bool accept) {
    for (NegotiationSession& s : m_sessions) {
        if (s.getId() == sessionId) {
            return accept ? s.accept() : s.reject();
        }
    }
    return false;
}

const NegotiationSession* NegotiationDirector::findSession(int sessionId) const {
    for (const NegotiationSession& s : m_sessions) {
        if (s.getId() == sessionId) return &s;
    }
    for (const NegotiationSession& s : m_history) {
        if (s.getId() == sessionId) return &s;
    }
    return nullptr;
}

std::vector<const NegotiationSession*> NegotiationDirector::pendingFor(const std::string& actorId) const {
    std::vector<const NegotiationSession*> out;
    for (const NegotiationSession& s : m_sessions) {
        if (s.isPending() && s.getCounterpartId() == actorId) {
            out.push_back(&s);
        }
    }
    return out;
}

std::uint64_t NegotiationDirector::computeStateHash() const {
    std::uint64_t h = 0xC0DEC0DE12345678ull;
    h = mixHash(h, static_cast<std::uint64_t>(m_sessions.size()));
    for (const NegotiationSession& s : m_sessions) {
        h = mixHash(h, static_cast<std::uint64_t>(std::max(0, s.getId())));
        h = mixHash(h, NegotiationContext::hashString(s.getProposerId()));
        h = mixHash(h, NegotiationContext::hashString(s.getCounterpartId()));
        h = mixHash(h, static_cast<std::uint64_t>(s.getPurpose()));
        h = mixHash(h, static_cast<std::uint64_t>(s.getUrgency()));
        h = mixHash(h, static_cast<std::uint64_t>(s.getStatus()));
        h = mixHash(h, static_cast<std::uint64_t>(std::max(0, s.getExpiresAtTurn())));
        h = hashItems(h, s.getOfferItems());
        h = hashItems(h, s.getRequestItems());
        h = mixHash(h, NegotiationContext::hashString(s.getMessage()));
    }
    return h;
}

void NegotiationDirector::reset() {
    resetTriggerTracking(m_tracker);
    m_sessions.clear();
    m_history.clear();
    m_nextSessionId = 1;
    m_messageRng = m_context.makeRng(kMessageSalt);
    m_responseRng = m_context.makeRng(kResponseSalt);
}
