#pragma once

#include <random>
#include <string>
#include <vector>

#include "actor.h"
#include "evaluation_modifiers.h"
#include "item_valuation.h"
#include "negotiation.h"
#include "negotiation_config.h"

enum class DealVerdict {
    Accept,
    Reject,
    Counter
};

const char* verdictName(DealVerdict verdict);

struct CounterOfferChange {
    bool added = true;          // false: removed
    bool requestSide = true;    // side of the reply session the change applies to
    NegotiableItem item;
    std::string reason;
};

// Item lists expressed from the responder's side: `offerItems` is what the
// responder gives, `requestItems` what it asks of the original proposer.
struct CounterOffer {
    std::vector<NegotiableItem> offerItems;
    std::vector<NegotiableItem> requestItems;
    std::vector<CounterOfferChange> changes;
    std::string explanation;
};

struct DealEvaluation {
    double offerValue = 0.0;      // what the evaluator receives
    double requestValue = 0.0;    // what the evaluator gives up
    double netValue = 0.0;
    UtilityBreakdown modifiers;
    double randomFactor = 0.0;
    double finalScore = 0.0;
    int acceptanceProbability = 0;
    std::string feedbackKey;
    std::vector<std::string> rejectionReasons;
    DealVerdict verdict = DealVerdict::Reject;
    bool hasCounterOffer = false;
    CounterOffer counterOffer;
};

int acceptanceProbability(double finalScore, const NegotiationConfig& config = defaultNegotiationConfig());

// Stable key for the presentation layer (see DiplomaticMessages::feedbackLine).
std::string feedbackKeyFor(double finalScore, double relationship, double trust, double grievancePenalty,
                           const NegotiationConfig& config = defaultNegotiationConfig());

// Consumes one draw from `rng` only when the score is inside the counter band
// and the relationship/trust floors are met.
bool shouldMakeCounterOffer(double finalScore,
                            Personality personality,
                            double relationship,
                            double trust,
                            std::mt19937_64& rng,
                            const NegotiationConfig& config = defaultNegotiationConfig());

// Items `evaluator` would like from `counterpart`, most wanted first.
std::vector<NegotiableItem> desiredItems(const Actor& evaluator,
                                         const Actor& counterpart,
                                         const NegotiationConfig& config = defaultNegotiationConfig());

bool generateCounterOffer(const NegotiationSession& session,
                          const Actor& evaluator,
                          const Actor& counterpart,
                          double finalScore,
                          const ItemValueContext& context,
                          CounterOffer& out,
                          const NegotiationConfig& config = defaultNegotiationConfig());

// Scores `session` for its counterpart (`evaluator`) proposed by `proposer`.
DealEvaluation evaluateDeal(const NegotiationSession& session,
                            const Actor& evaluator,
                            const Actor& proposer,
                            const WorldSnapshot& world,
                            std::mt19937_64& rng,
                            const NegotiationConfig& config = defaultNegotiationConfig());

// Seals `counterOffer` as a new session (parties swapped) and marks `original` countered.
bool applyCounterOffer(NegotiationSession& original,
                       const CounterOffer& counterOffer,
                       int newId,
                       int currentTurn,
                       const ExpirationWindows& windows,
                       NegotiationSession& out);
