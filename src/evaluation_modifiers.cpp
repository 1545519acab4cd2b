#include "evaluation_modifiers.h"

double relationshipModifier(double relationship, const NegotiationConfig& config) {
    return relationship * config.modifiers.relationshipMultiplier;
}

double trustModifier(double trust, const NegotiationConfig& config) {
    return (trust - config.modifiers.trustBase) * config.modifiers.trustMultiplier;
}

double favorModifier(double favorBalance, const NegotiationConfig& config) {
    return favorBalance * config.modifiers.favorMultiplier;
}

double personalityBonus(const NegotiationSession& session, const Actor& actor, const NegotiationConfig& config) {
    const PersonalityProfile& profile = config.profileFor(actor.personality);
    const double scale = config.modifiers.personalityMultiplier;

    double bonus = 0.0;
    if (session.involves(NegotiableItem::Kind::Alliance)) {
        bonus += profile.allianceWeight * scale;
    }
    if (session.involves(NegotiableItem::Kind::Treaty)) {
        bonus += profile.treatyWeight * scale;
    }
    if (session.involves(NegotiableItem::Kind::JoinWar)) {
        bonus += profile.warlikeWeight * scale;
    }
    return bonus;
}

double strategicValue(const NegotiationSession& session,
                      const Actor& actor,
                      const Actor& counterpart,
                      const NegotiationConfig& config) {
    (void)counterpart;
    const auto& m = config.modifiers;
    const std::vector<NegotiableItem>& offered = session.getOfferItems();

    double value = 0.0;
    if (hasItemKind(offered, NegotiableItem::Kind::Alliance)) {
        const double maxThreat = actor.maxThreat();
        if (maxThreat > m.strategicThreatHigh) {
            value += m.strategicAllianceHigh;
        } else if (maxThreat > m.strategicThreatMid) {
            value += m.strategicAllianceMid;
        }
    }
    for (const NegotiableItem& item : offered) {
        if (item.kind == NegotiableItem::Kind::JoinWar &&
            actor.threatFrom(item.targetId) > m.strategicJoinWarThreat) {
            value += m.strategicJoinWar;
        }
    }
    return value;
}

double grievancePenaltyWeight(GrievanceSeverity severity, const NegotiationConfig& config) {
    switch (severity) {
        case GrievanceSeverity::Minor: return config.modifiers.grievanceMinor;
        case GrievanceSeverity::Moderate: return config.modifiers.grievanceModerate;
        case GrievanceSeverity::Major: return config.modifiers.grievanceMajor;
        case GrievanceSeverity::Severe: return config.modifiers.grievanceSevere;
        default: return 0.0;
    }
}

double grievancePenalty(const Actor& actor, const Actor& counterpart, const NegotiationConfig& config) {
    double penalty = 0.0;
    for (const Grievance* g : actor.grievancesAgainst(counterpart.id)) {
        penalty -= grievancePenaltyWeight(g->severity, config);
    }
    return penalty;
}

UtilityBreakdown computeUtilityBreakdown(const NegotiationSession& session,
                                         const Actor& evaluator,
                                         const Actor& counterpart,
                                         double relationship,
                                         double trust,
                                         double favor,
                                         const NegotiationConfig& config) {
    UtilityBreakdown b;
    b.relationship = relationshipModifier(relationship, config);
    b.trust = trustModifier(trust, config);
    b.favor = favorModifier(favor, config);
    b.personality = personalityBonus(session, evaluator, config);
    b.strategic = strategicValue(session, evaluator, counterpart, config);
    b.grievance = grievancePenalty(evaluator, counterpart, config);
    return b;
}

double evaluateNegotiationUtility(const NegotiationSession& session,
                                  const Actor& evaluator,
                                  const Actor& counterpart,
                                  double relationship,
                                  double trust,
                                  double favor,
                                  const NegotiationConfig& config) {
    return computeUtilityBreakdown(session, evaluator, counterpart, relationship, trust, favor, config).total();
}
