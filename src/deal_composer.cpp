#include "deal_composer.h"

#include <cmath>
#include <string>

namespace {

std::string amountLabel(double amount) {
    return std::to_string(static_cast<long long>(std::llround(amount)));
}

std::string apologyLabel(const Grievance& g) {
    return "Apology for: " + (g.description.empty() ? std::string(grievanceSeverityName(g.severity)) + " grievance"
                                                    : g.description);
}

} // namespace

DealBuilder composeHelpRequest(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                               const TriggerContext& context, const NegotiationConfig& config) {
    const auto& c = config.compose;
    DealBuilder deal(actor.id, counterpart.id);

    if (!context.threatActorId.empty()) {
        const Actor* threat = findActor(world.actors, context.threatActorId);
        deal.addItemToRequest(NegotiableItem::joinWar(context.threatActorId, threat ? threat->name : std::string()));
    } else {
        deal.addItemToRequest(NegotiableItem::alliance("military", c.helpAllianceDuration));
    }

    const double gold = std::floor(actor.production * c.helpGoldShare);
    if (gold > 0.0) {
        deal.addItemToOffer(NegotiableItem::gold(gold));
    }
    const double intel = std::floor(actor.intel * c.helpIntelShare);
    if (intel > c.helpIntelMinimum) {
        deal.addItemToOffer(NegotiableItem::intel(intel));
    }
    if (c.helpFavors > 0) {
        deal.addItemToOffer(NegotiableItem::favorExchange(c.helpFavors,
                                                          "Owe you " + std::to_string(c.helpFavors) + " favors"));
    }
    return deal;
}

DealBuilder composeAllianceOffer(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                 const TriggerContext& context, const NegotiationConfig& config) {
    (void)context;
    const auto& c = config.compose;
    DealBuilder deal(actor.id, counterpart.id);

    const NegotiableItem alliance = NegotiableItem::alliance("military", c.allianceDuration);
    const NegotiableItem borders = NegotiableItem::openBorders(c.allianceDuration);
    deal.addItemToOffer(alliance);
    deal.addItemToOffer(borders);
    deal.addItemToRequest(alliance);
    deal.addItemToRequest(borders);

    if (world.relations.getRelationship(actor.id, counterpart.id) > c.allianceTreatyRelationship) {
        const NegotiableItem pact = NegotiableItem::treaty("non-aggression", c.allianceTreatyDuration);
        deal.addItemToOffer(pact);
        deal.addItemToRequest(pact);
    }
    return deal;
}

DealBuilder composeReconciliation(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                  const TriggerContext& context, const NegotiationConfig& config) {
    (void)world;
    (void)context;
    const auto& c = config.compose;
    DealBuilder deal(actor.id, counterpart.id);

    const std::vector<const Grievance*> theirs = counterpart.grievancesAgainst(actor.id);
    if (!theirs.empty()) {
        deal.addItemToOffer(NegotiableItem::grievanceApology(theirs.front()->id, apologyLabel(*theirs.front())));
    }
    const double goodwill = std::floor(actor.production * c.goodwillGoldShare);
    if (goodwill > 0.0) {
        deal.addItemToOffer(NegotiableItem::gold(goodwill, amountLabel(goodwill) + " production as goodwill"));
    }

    const std::vector<const Grievance*> ours = actor.grievancesAgainst(counterpart.id);
    if (!ours.empty()) {
        deal.addItemToRequest(NegotiableItem::grievanceApology(ours.front()->id, apologyLabel(*ours.front())));
    }
    deal.addItemToRequest(NegotiableItem::treaty("non-aggression", c.reconciliationTreatyDuration));
    return deal;
}

DealBuilder composeCompensationDemand(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                      const TriggerContext& context, const NegotiationConfig& config) {
    (void)world;
    const auto& c = config.compose;
    DealBuilder deal(actor.id, counterpart.id);

    const int severity = (context.totalSeverity > 0) ? context.totalSeverity : c.defaultCompensationSeverity;
    const double reparations = severity * c.compensationGoldPerSeverity;
    if (reparations > 0.0) {
        deal.addItemToRequest(NegotiableItem::gold(reparations, amountLabel(reparations) + " production as reparations"));
    }
    if (!context.grievanceId.empty()) {
        deal.addItemToRequest(NegotiableItem::grievanceApology(context.grievanceId, "Formal apology"));
    }

    deal.addItemToOffer(NegotiableItem::promise("drop-grievances", 0, "Drop all grievances against you"));
    deal.addItemToOffer(NegotiableItem::treaty("non-aggression", c.compensationTreatyDuration));
    return deal;
}

DealBuilder composeWarning(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                           const TriggerContext& context, const NegotiationConfig& config) {
    (void)world;
    (void)context;
    const auto& c = config.compose;
    DealBuilder deal(actor.id, counterpart.id);

    deal.addItemToRequest(NegotiableItem::promise(
        "cease-aggression", c.warningPromiseDuration,
        "Promise to cease aggressive actions (" + std::to_string(c.warningPromiseDuration) + " turns)"));
    if (c.warningGold > 0.0) {
        deal.addItemToRequest(NegotiableItem::gold(c.warningGold, amountLabel(c.warningGold) + " production as compensation"));
    }
    deal.addItemToOffer(NegotiableItem::promise(
        "no-retaliation", c.warningNoRetaliationDuration,
        "Promise not to retaliate (" + std::to_string(c.warningNoRetaliationDuration) + " turns)"));
    return deal;
}

DealBuilder composeTradeOffer(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                              const TriggerContext& context, const NegotiationConfig& config) {
    (void)world;
    const auto& c = config.compose;
    DealBuilder deal(actor.id, counterpart.id);

    switch (context.resourceType) {
        case ResourceKind::Intel:
            deal.addItemToOffer(NegotiableItem::intel(c.tradeOfferIntel));
            break;
        case ResourceKind::Uranium:
            deal.addItemToOffer(NegotiableItem::production(c.tradeOfferUranium));
            break;
        case ResourceKind::Gold:
        case ResourceKind::None:
        default:
            deal.addItemToOffer(NegotiableItem::gold(c.tradeOfferGold));
            break;
    }

    if (counterpart.production > c.tradeRequestProductionFloor) {
        deal.addItemToRequest(NegotiableItem::gold(c.tradeRequestGold));
    } else if (counterpart.intel > c.tradeRequestIntelFloor) {
        deal.addItemToRequest(NegotiableItem::intel(c.tradeRequestIntel));
    } else {
        deal.addItemToRequest(NegotiableItem::favorExchange(
            c.tradeFallbackFavors, "Owe me " + std::to_string(c.tradeFallbackFavors) + " favor"));
    }
    return deal;
}

NegotiationSession generateNegotiationDeal(const Actor& actor,
                                           const Actor& counterpart,
                                           const WorldSnapshot& world,
                                           const TriggerResult& trigger,
                                           int sessionId,
                                           const NegotiationConfig& config) {
    const TriggerContext& ctx = trigger.context;
    DealBuilder deal(actor.id, counterpart.id);

    switch (trigger.purpose) {
        case NegotiationPurpose::RequestHelp:
            deal = composeHelpRequest(actor, counterpart, world, ctx, config);
            break;
        case NegotiationPurpose::OfferAlliance:
        case NegotiationPurpose::MutualDefense:
            deal = composeAllianceOffer(actor, counterpart, world, ctx, config);
            break;
        case NegotiationPurpose::Reconciliation:
        case NegotiationPurpose::PeaceOffer:
            deal = composeReconciliation(actor, counterpart, world, ctx, config);
            break;
        case NegotiationPurpose::DemandCompensation:
            deal = composeCompensationDemand(actor, counterpart, world, ctx, config);
            break;
        case NegotiationPurpose::Warning:
            deal = composeWarning(actor, counterpart, world, ctx, config);
            break;
        case NegotiationPurpose::TradeOpportunity:
        case NegotiationPurpose::JointVenture:
            deal = composeTradeOffer(actor, counterpart, world, ctx, config);
            break;
        default:
            break;
    }

    return deal.build(sessionId, trigger.purpose, trigger.urgency, world.currentTurn, config.expiration);
}
