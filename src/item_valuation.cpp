#include "item_valuation.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

constexpr double kGoldUnitValue = 1.0;
constexpr double kIntelUnitValue = 3.0;
constexpr double kProductionUnitValue = 2.0;
constexpr double kAllianceValue = 1000.0;
constexpr double kPromiseValue = 300.0;
constexpr double kFavorValue = 10.0;
constexpr double kJoinWarValue = 1000.0;
constexpr double kOpenBordersPerTurn = 200.0;
constexpr double kApologyValue = 400.0;

double totalThreat(const Actor& actor) {
    double sum = 0.0;
    for (const auto& kv : actor.threats) {
        sum += kv.second;
    }
    return sum;
}

double allianceValue(const ItemValueContext& ctx) {
    double value = kAllianceValue;

    if (ctx.relationship > 50.0) value *= 1.3;
    else if (ctx.relationship > 0.0) value *= 1.1;
    else if (ctx.relationship < -25.0) value *= 0.6;

    if (ctx.trust > 70.0) value *= 1.2;
    else if (ctx.trust < 30.0) value *= 0.7;

    if (ctx.evaluator.personality == Personality::Defensive) {
        value *= 1.3;
    }

    const double threat = totalThreat(ctx.evaluator);
    if (threat > 20.0) value *= 1.5;
    else if (threat > 10.0) value *= 1.2;
    return value;
}

double treatyValue(const NegotiableItem& item, const ItemValueContext& ctx) {
    const int duration = (item.duration > 0) ? item.duration : 10;
    const std::string subtype = item.subtype.empty() ? std::string("non-aggression") : item.subtype;

    double value = 400.0;
    if (subtype == "truce") value = 300.0;
    else if (subtype == "non-aggression") value = 500.0;
    else if (subtype == "mutual-defense") value = 800.0;

    value *= std::min(duration / 10.0, 2.0);
    if (ctx.relationship < -30.0) {
        value *= 1.3;
    }
    return value;
}

double promiseValue(const NegotiableItem& item, const ItemValueContext& ctx) {
    const int duration = (item.duration > 0) ? item.duration : 10;

    double value = kPromiseValue;
    if (item.subtype == "help-if-attacked") value = 500.0;
    else if (item.subtype == "no-ally-with") value = 400.0;
    else if (item.subtype == "no-nukes") value = 600.0;

    value *= std::min(duration / 10.0, 1.5);
    if (ctx.trust < 40.0) {
        value *= 0.6;
    }
    return value;
}

double strikeStrength(const Actor& actor) {
    return actor.military.missiles + actor.military.bombers * 5.0;
}

double joinWarValue(const NegotiableItem& item, const ItemValueContext& ctx) {
    const Actor* target = findActor(ctx.world.actors, item.targetId);
    if (!target) {
        return 0.0;
    }

    double value = kJoinWarValue;
    const double ratio = strikeStrength(*target) / std::max(strikeStrength(ctx.evaluator), 1.0);
    if (ratio > 1.5) value *= 0.6;
    else if (ratio < 0.5) value *= 1.2;

    const double towardTarget = ctx.world.relations.getRelationship(ctx.evaluator.id, target->id);
    if (towardTarget > 25.0) value *= 0.3;
    else if (towardTarget < -25.0) value *= 1.4;
    return value;
}

double apologyValue(const NegotiableItem& item, const ItemValueContext& ctx) {
    const Grievance* g = ctx.evaluator.findGrievance(item.grievanceId);
    if (!g) {
        return 0.0;
    }
    switch (g->severity) {
        case GrievanceSeverity::Minor: return kApologyValue * 0.5;
        case GrievanceSeverity::Moderate: return kApologyValue;
        case GrievanceSeverity::Major: return kApologyValue * 1.5;
        case GrievanceSeverity::Severe: return kApologyValue * 2.0;
        default: return kApologyValue;
    }
}

double applyContextModifiers(double value, const NegotiableItem& item, const ItemValueContext& ctx) {
    double modified = value * (1.0 + ctx.relationship / 200.0);

    if (item.kind == NegotiableItem::Kind::Gold && ctx.evaluator.production < 50.0) {
        modified *= 1.3;
    }
    if (item.kind == NegotiableItem::Kind::Intel && ctx.evaluator.intel < 20.0) {
        modified *= 1.4;
    }

    const bool diplomatic = item.kind == NegotiableItem::Kind::Alliance || item.kind == NegotiableItem::Kind::Treaty;
    if (diplomatic && ctx.evaluator.personality == Personality::Aggressive) {
        modified *= 0.8;
    }
    if (diplomatic && ctx.evaluator.personality == Personality::Defensive) {
        modified *= 1.3;
    }
    return modified;
}

std::string shortfall(const char* what, double need, double have) {
    std::ostringstream oss;
    oss << "Not enough " << what << " (need " << std::llround(need) << ", have " << std::llround(have) << ")";
    return oss.str();
}

} // namespace

double calculateItemValue(const NegotiableItem& item, const ItemValueContext& context) {
    double value = 0.0;
    switch (item.kind) {
        case NegotiableItem::Kind::Gold: value = kGoldUnitValue * item.amount; break;
        case NegotiableItem::Kind::Intel: value = kIntelUnitValue * item.amount; break;
        case NegotiableItem::Kind::Production: value = kProductionUnitValue * item.amount; break;
        case NegotiableItem::Kind::Alliance: value = allianceValue(context); break;
        case NegotiableItem::Kind::Treaty: value = treatyValue(item, context); break;
        case NegotiableItem::Kind::Promise: value = promiseValue(item, context); break;
        case NegotiableItem::Kind::FavorExchange: value = kFavorValue * item.amount; break;
        case NegotiableItem::Kind::JoinWar: value = joinWarValue(item, context); break;
        case NegotiableItem::Kind::OpenBorders:
            value = kOpenBordersPerTurn * std::max(item.duration, 1);
            break;
        case NegotiableItem::Kind::GrievanceApology: value = apologyValue(item, context); break;
        default: break;
    }

    value = applyContextModifiers(value, item, context);
    return std::max(0.0, std::round(value));
}

double calculateTotalValue(const std::vector<NegotiableItem>& items, const ItemValueContext& context) {
    double total = 0.0;
    for (const NegotiableItem& item : items) {
        total += calculateItemValue(item, context);
    }
    return total;
}

ValidationResult canAffordItems(const Actor& actor, const std::vector<NegotiableItem>& items) {
    ValidationResult result;
    for (const NegotiableItem& item : items) {
        std::string problem;
        if (item.kind == NegotiableItem::Kind::Gold && actor.production < item.amount) {
            problem = shortfall("gold", item.amount, actor.production);
        } else if (item.kind == NegotiableItem::Kind::Intel && actor.intel < item.amount) {
            problem = shortfall("intel", item.amount, actor.intel);
        } else if (item.kind == NegotiableItem::Kind::Production && actor.uranium < item.amount) {
            problem = shortfall("uranium", item.amount, actor.uranium);
        }
        if (!problem.empty()) {
            result.valid = false;
            result.reason = problem;
            result.issues.push_back({"items", problem, true});
            return result;
        }
    }
    return result;
}

ValidationResult validateNegotiation(const NegotiationSession& session, const Actor& proposer, const Actor& counterpart) {
    ValidationResult result;

    if (session.getOfferItems().empty() && session.getRequestItems().empty()) {
        result.issues.push_back({"items", "Negotiation must have at least one item offered or requested", true});
    }

    const ValidationResult proposerCan = canAffordItems(proposer, session.getOfferItems());
    if (!proposerCan.valid) {
        result.issues.push_back({"offerItems", "Proposer cannot afford: " + proposerCan.reason, true});
    }
    const ValidationResult counterpartCan = canAffordItems(counterpart, session.getRequestItems());
    if (!counterpartCan.valid) {
        result.issues.push_back({"requestItems", "Counterpart cannot afford: " + counterpartCan.reason, true});
    }

    const auto countAlliances = [](const std::vector<NegotiableItem>& items) {
        return std::count_if(items.begin(), items.end(), [](const NegotiableItem& i) {
            return i.kind == NegotiableItem::Kind::Alliance;
        });
    };
    // A mutual alliance lists one alliance on each side.
    if (countAlliances(session.getOfferItems()) > 1 || countAlliances(session.getRequestItems()) > 1) {
        result.issues.push_back({"items", "Cannot have multiple alliances in one deal", false});
    }

    result.valid = std::none_of(result.issues.begin(), result.issues.end(), [](const ValidationIssue& i) {
        return i.isError;
    });
    if (!result.issues.empty()) {
        result.reason = result.issues.front().message;
    }
    return result;
}
