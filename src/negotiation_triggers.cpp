#include "negotiation_triggers.h"

#include <algorithm>
#include <cmath>
#include <iostream>

bool TriggerTracker::s_debugMode = false;

namespace {

int clampPriority(double value) {
    return static_cast<int>(std::lround(std::clamp(value, 0.0, 100.0)));
}

TriggerResult emptyResult(NegotiationPurpose purpose, NegotiationUrgency urgency) {
    TriggerResult r;
    r.purpose = purpose;
    r.urgency = urgency;
    return r;
}

const char* surplusLabel(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Gold: return "production";
        case ResourceKind::Intel: return "intelligence";
        case ResourceKind::Uranium: return "uranium";
        default: return "resources";
    }
}

} // namespace

int triggerSeverityWeight(GrievanceSeverity severity, const NegotiationConfig& config) {
    switch (severity) {
        case GrievanceSeverity::Minor: return config.triggers.severityMinor;
        case GrievanceSeverity::Moderate: return config.triggers.severityModerate;
        case GrievanceSeverity::Major: return config.triggers.severityMajor;
        case GrievanceSeverity::Severe: return config.triggers.severitySevere;
        default: return 0;
    }
}

TriggerResult evaluateThreatTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                    const NegotiationConfig& config) {
    TriggerResult result = emptyResult(NegotiationPurpose::RequestHelp, NegotiationUrgency::Low);
    const auto& t = config.triggers;
    const PersonalityProfile& profile = config.profileFor(actor.personality);

    const double maxThreat = actor.maxThreat();
    if (maxThreat < profile.threatThreshold) {
        return result;
    }

    const std::string threatId = actor.biggestThreatId();
    const Actor* threat = findActor(world.actors, threatId);
    if (!threat) {
        return result;
    }
    if (counterpart.id == threatId) {
        return result;
    }
    if (world.relations.getRelationship(actor.id, counterpart.id) < t.threatHostilityFloor) {
        return result;
    }
    if (counterpart.militaryPower() < threat->militaryPower() * t.threatPowerRatio) {
        return result;
    }

    NegotiationUrgency urgency = NegotiationUrgency::Medium;
    if (maxThreat > t.threatCriticalAbove) urgency = NegotiationUrgency::Critical;
    else if (maxThreat > t.threatHighAbove) urgency = NegotiationUrgency::High;

    result.shouldTrigger = true;
    result.urgency = urgency;
    result.priority = clampPriority(std::min(100.0, maxThreat + t.threatPriorityBonus));
    result.context.reason = "We face a serious threat from " + threat->name + ". Your help would be invaluable.";
    result.context.threatActorId = threat->id;
    result.context.threatLevel = maxThreat;
    return result;
}

TriggerResult evaluateResourceSurplusTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                             const NegotiationConfig& config) {
    TriggerResult result = emptyResult(NegotiationPurpose::TradeOpportunity, NegotiationUrgency::Low);
    const auto& t = config.triggers;

    const double relationship = world.relations.getRelationship(actor.id, counterpart.id);
    if (relationship < 0.0) {
        return result;
    }

    ResourceKind kind = ResourceKind::None;
    if (actor.production > t.surplusProduction && counterpart.production < t.deficitProduction) {
        kind = ResourceKind::Gold;
    } else if (actor.intel > t.surplusIntel && counterpart.intel < t.deficitIntel) {
        kind = ResourceKind::Intel;
    } else if (actor.uranium > t.surplusUranium && counterpart.uranium < t.deficitUranium) {
        kind = ResourceKind::Uranium;
    }
    if (kind == ResourceKind::None) {
        return result;
    }

    result.shouldTrigger = true;
    result.priority = clampPriority(t.tradeBasePriority + relationship * t.tradeRelationshipWeight);
    result.context.reason = std::string("We have surplus ") + surplusLabel(kind) +
                            " and thought you might be interested in a trade.";
    result.context.resourceType = kind;
    return result;
}

TriggerResult evaluateReconciliationTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                            const NegotiationConfig& config) {
    TriggerResult result = emptyResult(NegotiationPurpose::Reconciliation, NegotiationUrgency::Low);
    const auto& t = config.triggers;
    const PersonalityProfile& profile = config.profileFor(actor.personality);

    const double relationship = world.relations.getRelationship(actor.id, counterpart.id);
    const double trust = world.relations.getTrust(actor.id, counterpart.id);
    if (relationship <= t.reconciliationRelationshipMin || relationship >= t.reconciliationRelationshipMax) {
        return result;
    }
    if (trust < t.reconciliationTrustMin) {
        return result;
    }

    const std::vector<const Grievance*> held = actor.grievancesAgainst(counterpart.id);
    const std::vector<const Grievance*> against = counterpart.grievancesAgainst(actor.id);
    if (held.empty() && against.empty()) {
        return result;
    }
    if (relationship <= profile.reconciliationVetoBelow) {
        return result;
    }

    result.shouldTrigger = true;
    result.urgency = NegotiationUrgency::Medium;
    result.priority = clampPriority(t.reconciliationBasePriority + profile.reconciliationBonus +
                                    trust * t.reconciliationTrustWeight);
    result.context.reason = "Our recent conflicts have damaged our relationship. Perhaps we can find common ground.";
    result.context.grievanceCount = static_cast<int>(held.size() + against.size());
    if (!held.empty()) {
        result.context.grievanceId = held.front()->id;
    }
    return result;
}

TriggerResult evaluateCompensationTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                          const NegotiationConfig& config) {
    TriggerResult result = emptyResult(NegotiationPurpose::DemandCompensation, NegotiationUrgency::Medium);
    const auto& t = config.triggers;
    const PersonalityProfile& profile = config.profileFor(actor.personality);

    int totalSeverity = 0;
    int count = 0;
    const Grievance* worst = nullptr;
    for (const Grievance* g : actor.grievancesAgainst(counterpart.id)) {
        if (world.currentTurn - g->createdTurn > t.compensationWindowTurns) {
            continue;
        }
        totalSeverity += triggerSeverityWeight(g->severity, config);
        ++count;
        if (!worst || g->severity > worst->severity) {
            worst = g;
        }
    }
    if (count == 0 || totalSeverity < profile.compensationSeverityFloor) {
        return result;
    }

    result.shouldTrigger = true;
    result.urgency = (totalSeverity > t.compensationHighAbove) ? NegotiationUrgency::High : NegotiationUrgency::Medium;
    result.priority = clampPriority(t.compensationBasePriority + profile.compensationBonus +
                                    totalSeverity * t.compensationSeverityWeight);
    result.context.reason = "Your recent actions against us demand compensation.";
    result.context.grievanceId = worst->id;
    result.context.grievanceCount = count;
    result.context.totalSeverity = totalSeverity;
    return result;
}

TriggerResult evaluateMutualBenefitTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                           const NegotiationConfig& config) {
    TriggerResult result = emptyResult(NegotiationPurpose::OfferAlliance, NegotiationUrgency::Medium);
    const auto& t = config.triggers;
    const PersonalityProfile& profile = config.profileFor(actor.personality);

    const double relationship = world.relations.getRelationship(actor.id, counterpart.id);
    const double trust = world.relations.getTrust(actor.id, counterpart.id);
    if (relationship < t.allianceRelationshipMin || trust < t.allianceTrustMin) {
        return result;
    }
    if (actor.isAlliedWith(counterpart.id)) {
        return result;
    }

    std::vector<std::string> common;
    for (const auto& kv : actor.threats) {
        if (kv.first == counterpart.id || kv.first == actor.id) continue;
        if (kv.second > t.sharedThreatMin && counterpart.threatFrom(kv.first) > t.sharedThreatMin) {
            common.push_back(kv.first);
        }
    }
    if (common.empty()) {
        return result;
    }

    result.shouldTrigger = true;
    result.priority = clampPriority(t.allianceBasePriority + profile.allianceOfferBonus +
                                    relationship * t.allianceRelationshipWeight);
    result.context.reason = "We share common interests and threats. An alliance would benefit us both.";
    result.context.commonThreats = std::move(common);
    return result;
}

TriggerResult evaluateWarningTrigger(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                     const NegotiationConfig& config) {
    TriggerResult result = emptyResult(NegotiationPurpose::Warning, NegotiationUrgency::High);
    const auto& t = config.triggers;
    const PersonalityProfile& profile = config.profileFor(actor.personality);

    const Grievance* serious = nullptr;
    for (const Grievance* g : actor.grievancesAgainst(counterpart.id)) {
        if (world.currentTurn - g->createdTurn > t.warningWindowTurns) continue;
        if (g->severity == GrievanceSeverity::Major || g->severity == GrievanceSeverity::Severe) {
            serious = g;
            break;
        }
    }
    const std::vector<const AgendaViolation*> violations = violationsObservedBy(world, actor.id, counterpart.id);
    if (!serious && violations.empty()) {
        return result;
    }
    if (world.relations.getRelationship(actor.id, counterpart.id) < t.warningRelationshipFloor) {
        return result;
    }

    result.shouldTrigger = true;
    result.priority = clampPriority(t.warningBasePriority + profile.warningBonus);
    if (!violations.empty()) {
        result.context.reason = "Your actions violate my " + violations.front()->agendaName +
                                " values. Change your behavior or face consequences.";
        result.context.agendaId = violations.front()->agendaId;
    } else {
        result.context.reason = "Your recent actions are unacceptable. Change your behavior or face consequences.";
        result.context.grievanceId = serious->id;
    }
    return result;
}

bool TriggerTracker::lastNegotiationTurn(const std::string& actorId, int& outTurn) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_lastTurn.find(actorId);
    if (it == m_lastTurn.end()) {
        return false;
    }
    outTurn = it->second;
    return true;
}

void TriggerTracker::recordNegotiation(const std::string& actorId, int turn) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastTurn[actorId] = turn;
}

bool TriggerTracker::isThrottled(const std::string& actorId, int currentTurn, int minTurnsBetween) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_lastTurn.find(actorId);
    const int last = (it == m_lastTurn.end()) ? kUnrecordedTurn : it->second;
    return currentTurn - last < minTurnsBetween;
}

bool TriggerTracker::tryClaim(const std::string& actorId, int currentTurn, int minTurnsBetween) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_lastTurn.find(actorId);
    const int last = (it == m_lastTurn.end()) ? kUnrecordedTurn : it->second;
    if (currentTurn - last < minTurnsBetween) {
        return false;
    }
    m_lastTurn[actorId] = currentTurn;
    return true;
}

void TriggerTracker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastTurn.clear();
}

size_t TriggerTracker::trackedActorCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastTurn.size();
}

std::vector<TriggerResult> collectTriggerCandidates(const Actor& actor,
                                                    const Actor& counterpart,
                                                    const WorldSnapshot& world,
                                                    const NegotiationConfig& config) {
    // Registration order doubles as the tie-break order.
    return {
        evaluateWarningTrigger(actor, counterpart, world, config),
        evaluateThreatTrigger(actor, counterpart, world, config),
        evaluateCompensationTrigger(actor, counterpart, world, config),
        evaluateMutualBenefitTrigger(actor, counterpart, world, config),
        evaluateReconciliationTrigger(actor, counterpart, world, config),
        evaluateResourceSurplusTrigger(actor, counterpart, world, config),
    };
}

bool checkAllTriggers(const Actor& actor,
                      const Actor& counterpart,
                      const WorldSnapshot& world,
                      int globalCountThisTurn,
                      TriggerTracker& tracker,
                      TriggerResult& out,
                      const NegotiationConfig& config) {
    if (actor.id == counterpart.id) {
        return false;
    }
    if (tracker.isThrottled(actor.id, world.currentTurn, config.throttle.minTurnsBetween)) {
        return false;
    }
    if (globalCountThisTurn >= config.throttle.maxPerTurn) {
        return false;
    }

    std::vector<TriggerResult> active;
    for (TriggerResult& r : collectTriggerCandidates(actor, counterpart, world, config)) {
        if (r.shouldTrigger) {
            active.push_back(std::move(r));
        }
    }
    if (active.empty()) {
        return false;
    }

    std::stable_sort(active.begin(), active.end(), [](const TriggerResult& a, const TriggerResult& b) {
        return a.priority > b.priority;
    });

    // Another caller may have claimed this actor while the evaluators ran.
    if (!tracker.tryClaim(actor.id, world.currentTurn, config.throttle.minTurnsBetween)) {
        return false;
    }
    out = std::move(active.front());

    if (TriggerTracker::getDebugMode()) {
        std::cout << "[Diplomacy] Turn " << world.currentTurn << ": " << actor.id << " -> " << counterpart.id
                  << " selected " << purposeName(out.purpose) << " (priority " << out.priority
                  << ", " << active.size() << " candidate(s))" << std::endl;
    }
    return true;
}

void resetTriggerTracking(TriggerTracker& tracker) {
    tracker.reset();
}
