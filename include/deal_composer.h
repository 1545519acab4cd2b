#pragma once

#include "actor.h"
#include "negotiation.h"
#include "negotiation_config.h"
#include "negotiation_triggers.h"

// Purpose-specific builders. Items whose inputs are zero or missing are
// omitted; a builder never fails.
DealBuilder composeHelpRequest(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                               const TriggerContext& context, const NegotiationConfig& config);
DealBuilder composeAllianceOffer(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                 const TriggerContext& context, const NegotiationConfig& config);
DealBuilder composeReconciliation(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                  const TriggerContext& context, const NegotiationConfig& config);
DealBuilder composeCompensationDemand(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                                      const TriggerContext& context, const NegotiationConfig& config);
DealBuilder composeWarning(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                           const TriggerContext& context, const NegotiationConfig& config);
DealBuilder composeTradeOffer(const Actor& actor, const Actor& counterpart, const WorldSnapshot& world,
                              const TriggerContext& context, const NegotiationConfig& config);

// Dispatches on trigger.purpose and seals the session at world.currentTurn.
NegotiationSession generateNegotiationDeal(const Actor& actor,
                                           const Actor& counterpart,
                                           const WorldSnapshot& world,
                                           const TriggerResult& trigger,
                                           int sessionId,
                                           const NegotiationConfig& config = defaultNegotiationConfig());
