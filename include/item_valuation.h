#pragma once

#include <string>
#include <vector>

#include "actor.h"
#include "negotiation.h"

// Perspective an item is valued from.
struct ItemValueContext {
    const Actor& evaluator;
    const WorldSnapshot& world;
    double relationship = 0.0;   // evaluator -> other party
    double trust = 50.0;
};

// Rounded, never negative.
double calculateItemValue(const NegotiableItem& item, const ItemValueContext& context);
double calculateTotalValue(const std::vector<NegotiableItem>& items, const ItemValueContext& context);

struct ValidationIssue {
    std::string field;
    std::string message;
    bool isError = true;
};

struct ValidationResult {
    bool valid = true;
    std::vector<ValidationIssue> issues;
    std::string reason;   // First issue, empty when none.
};

// Resource items only; other kinds carry no affordability constraint.
ValidationResult canAffordItems(const Actor& actor, const std::vector<NegotiableItem>& items);

// Advisory check made at proposal time.
ValidationResult validateNegotiation(const NegotiationSession& session, const Actor& proposer, const Actor& counterpart);
