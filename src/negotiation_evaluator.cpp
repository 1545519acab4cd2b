#include "negotiation_evaluator.h"

#include <cmath>

namespace {

double uniform01(std::mt19937_64& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

} // namespace

const char* verdictName(DealVerdict verdict) {
    switch (verdict) {
        case DealVerdict::Accept: return "accept";
        case DealVerdict::Reject: return "reject";
        case DealVerdict::Counter: return "counter";
        default: return "reject";
    }
}

int acceptanceProbability(double finalScore, const NegotiationConfig& config) {
    const auto& e = config.evaluation;
    if (finalScore >= e.autoAccept) return 95;
    if (finalScore >= e.veryLikely) return 80;
    if (finalScore >= e.likely) return 60;
    if (finalScore >= e.possible) return 40;
    if (finalScore >= e.counterOffer) return 20;
    if (finalScore >= e.unlikely) return 5;
    return 0;
}

std::string feedbackKeyFor(double finalScore, double relationship, double trust, double grievancePenalty,
                           const NegotiationConfig& config) {
    const auto& e = config.evaluation;
    if (finalScore >= e.autoAccept) return "excellent";
    if (finalScore >= e.likely) return "fair";
    if (finalScore >= e.possible) return "close";
    if (finalScore >= e.counterOffer) return "needs-changes";
    if (trust < 30.0) return "distrust";
    if (relationship < -30.0) return "hostile";
    if (grievancePenalty < -20.0) return "grievances";
    return "unacceptable";
}

bool shouldMakeCounterOffer(double finalScore,
                            Personality personality,
                            double relationship,
                            double trust,
                            std::mt19937_64& rng,
                            const NegotiationConfig& config) {
    const auto& e = config.evaluation;
    if (relationship < e.counterHostilityFloor) return false;
    if (trust < e.counterTrustFloor) return false;
    if (finalScore >= e.likely || finalScore <= e.unlikely) return false;
    return uniform01(rng) < config.profileFor(personality).counterOfferChance;
}

std::vector<NegotiableItem> desiredItems(const Actor& evaluator,
                                         const Actor& counterpart,
                                         const NegotiationConfig& config) {
    std::vector<NegotiableItem> desired;

    if (evaluator.production < 100.0) {
        desired.push_back(NegotiableItem::gold(200.0, "Gold to boost economy"));
    }
    if (evaluator.intel < 30.0) {
        desired.push_back(NegotiableItem::intel(15.0, "Intelligence points"));
    }

    double threatSum = 0.0;
    for (const auto& kv : evaluator.threats) {
        threatSum += kv.second;
    }
    if (threatSum > 12.0 && !evaluator.isAlliedWith(counterpart.id)) {
        desired.push_back(NegotiableItem::alliance("defensive", config.compose.helpAllianceDuration));
    }

    for (const auto& kv : evaluator.threats) {
        if (kv.first != counterpart.id && kv.second > 15.0) {
            NegotiableItem help = NegotiableItem::joinWar(kv.first, std::string());
            help.description = "Help against common enemy";
            desired.push_back(help);
            break;
        }
    }

    const std::vector<const Grievance*> grievances = evaluator.grievancesAgainst(counterpart.id);
    if (!grievances.empty() && grievances.front()->severity != GrievanceSeverity::Minor) {
        desired.push_back(NegotiableItem::grievanceApology(grievances.front()->id, "Apology for past actions"));
    }
    return desired;
}

bool generateCounterOffer(const NegotiationSession& session,
                          const Actor& evaluator,
                          const Actor& counterpart,
                          double finalScore,
                          const ItemValueContext& context,
                          CounterOffer& out,
                          const NegotiationConfig& config) {
    CounterOffer counter;
    counter.offerItems = session.getRequestItems();
    counter.requestItems = session.getOfferItems();

    const double needed = std::abs(finalScore) + config.evaluation.counterValueBuffer;

    for (const NegotiableItem& item : desiredItems(evaluator, counterpart, config)) {
        const double value = calculateItemValue(item, context);
        if (value > 0.0 && value <= needed * 1.5) {
            counter.requestItems.push_back(item);
            counter.changes.push_back({true, true, item, std::string("I need ") + itemKindName(item.kind) +
                                                             " to make this work"});
            break;
        }
    }

    if (counter.changes.empty() && !counter.offerItems.empty()) {
        size_t cheapest = 0;
        double cheapestValue = calculateItemValue(counter.offerItems.front(), context);
        for (size_t i = 1; i < counter.offerItems.size(); ++i) {
            const double v = calculateItemValue(counter.offerItems[i], context);
            if (v < cheapestValue) {
                cheapest = i;
                cheapestValue = v;
            }
        }
        const NegotiableItem removed = counter.offerItems[cheapest];
        counter.offerItems.erase(counter.offerItems.begin() + static_cast<std::ptrdiff_t>(cheapest));
        counter.changes.push_back({false, false, removed, std::string("I cannot offer ") + itemKindName(removed.kind) +
                                                              " in this deal"});
    }

    if (counter.changes.empty()) {
        return false;
    }

    for (size_t i = 0; i < counter.changes.size(); ++i) {
        if (i > 0) counter.explanation += ". ";
        counter.explanation += counter.changes[i].reason;
    }
    out = std::move(counter);
    return true;
}

DealEvaluation evaluateDeal(const NegotiationSession& session,
                            const Actor& evaluator,
                            const Actor& proposer,
                            const WorldSnapshot& world,
                            std::mt19937_64& rng,
                            const NegotiationConfig& config) {
    DealEvaluation ev;

    const double relationship = world.relations.getRelationship(evaluator.id, proposer.id);
    const double trust = world.relations.getTrust(evaluator.id, proposer.id);
    const double favor = world.relations.getFavorBalance(evaluator.id, proposer.id);
    const ItemValueContext context{evaluator, world, relationship, trust};

    ev.offerValue = calculateTotalValue(session.getOfferItems(), context);
    ev.requestValue = calculateTotalValue(session.getRequestItems(), context);
    ev.netValue = ev.offerValue - ev.requestValue;
    ev.modifiers = computeUtilityBreakdown(session, evaluator, proposer, relationship, trust, favor, config);
    ev.randomFactor = (uniform01(rng) - 0.5) * config.evaluation.randomSpread;
    ev.finalScore = ev.netValue + ev.modifiers.total() + ev.randomFactor;
    ev.acceptanceProbability = acceptanceProbability(ev.finalScore, config);
    ev.feedbackKey = feedbackKeyFor(ev.finalScore, relationship, trust, ev.modifiers.grievance, config);

    if (shouldMakeCounterOffer(ev.finalScore, evaluator.personality, relationship, trust, rng, config)) {
        ev.hasCounterOffer = generateCounterOffer(session, evaluator, proposer, ev.finalScore, context,
                                                  ev.counterOffer, config);
    }

    if (ev.finalScore < 0.0) {
        if (ev.netValue < -50.0) ev.rejectionReasons.push_back("Deal heavily favors you");
        if (trust < 30.0) ev.rejectionReasons.push_back("I don't trust you enough");
        if (relationship < -30.0) ev.rejectionReasons.push_back("Our relationship is too poor");
        if (ev.modifiers.grievance < -20.0) ev.rejectionReasons.push_back("We have unresolved grievances");
        const std::vector<const AgendaViolation*> violations = violationsObservedBy(world, evaluator.id, proposer.id);
        if (!violations.empty()) {
            ev.rejectionReasons.push_back("Your actions violate my " + violations.front()->agendaName + " values");
        }
    }

    if (ev.finalScore >= config.evaluation.acceptThreshold) {
        ev.verdict = DealVerdict::Accept;
    } else if (ev.hasCounterOffer) {
        ev.verdict = DealVerdict::Counter;
    } else {
        ev.verdict = DealVerdict::Reject;
    }
    return ev;
}

bool applyCounterOffer(NegotiationSession& original,
                       const CounterOffer& counterOffer,
                       int newId,
                       int currentTurn,
                       const ExpirationWindows& windows,
                       NegotiationSession& out) {
    return original.counter(newId, currentTurn, windows, counterOffer.offerItems, counterOffer.requestItems, out);
}
