#pragma once

#include "actor.h"
#include "negotiation.h"
#include "negotiation_config.h"

// Additive utility contributions. Each is a pure function of its inputs.
double relationshipModifier(double relationship, const NegotiationConfig& config = defaultNegotiationConfig());
double trustModifier(double trust, const NegotiationConfig& config = defaultNegotiationConfig());
double favorModifier(double favorBalance, const NegotiationConfig& config = defaultNegotiationConfig());

// One contribution per category (alliance, treaty, warlike) present anywhere in the session.
double personalityBonus(const NegotiationSession& session,
                        const Actor& actor,
                        const NegotiationConfig& config = defaultNegotiationConfig());

// Threat-driven value of what the session offers to `actor`.
double strategicValue(const NegotiationSession& session,
                      const Actor& actor,
                      const Actor& counterpart,
                      const NegotiationConfig& config = defaultNegotiationConfig());

// Zero or negative: unresolved grievances `actor` holds against `counterpart`.
double grievancePenalty(const Actor& actor,
                        const Actor& counterpart,
                        const NegotiationConfig& config = defaultNegotiationConfig());

double grievancePenaltyWeight(GrievanceSeverity severity, const NegotiationConfig& config = defaultNegotiationConfig());

struct UtilityBreakdown {
    double relationship = 0.0;
    double trust = 0.0;
    double favor = 0.0;
    double personality = 0.0;
    double strategic = 0.0;
    double grievance = 0.0;

    double total() const { return relationship + trust + favor + personality + strategic + grievance; }
};

UtilityBreakdown computeUtilityBreakdown(const NegotiationSession& session,
                                         const Actor& evaluator,
                                         const Actor& counterpart,
                                         double relationship,
                                         double trust,
                                         double favor,
                                         const NegotiationConfig& config = defaultNegotiationConfig());

// Sum of every modifier above for `evaluator` receiving `session` from `counterpart`.
double evaluateNegotiationUtility(const NegotiationSession& session,
                                  const Actor& evaluator,
                                  const Actor& counterpart,
                                  double relationship,
                                  double trust,
                                  double favor,
                                  const NegotiationConfig& config = defaultNegotiationConfig());
