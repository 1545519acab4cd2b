#include "negotiation.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

namespace {

std::string formatAmount(double amount) {
    std::ostringstream oss;
    oss << static_cast<long long>(std::llround(amount));
    return oss.str();
}

void appendItems(std::ostringstream& oss, const std::vector<NegotiableItem>& items) {
    if (items.empty()) {
        oss << " (nothing)";
        return;
    }
    for (const NegotiableItem& item : items) {
        oss << "\n    - " << (item.description.empty() ? itemKindName(item.kind) : item.description);
    }
}

} // namespace

const char* purposeName(NegotiationPurpose purpose) {
    switch (purpose) {
        case NegotiationPurpose::RequestHelp: return "request-help";
        case NegotiationPurpose::OfferAlliance: return "offer-alliance";
        case NegotiationPurpose::Reconciliation: return "reconciliation";
        case NegotiationPurpose::DemandCompensation: return "demand-compensation";
        case NegotiationPurpose::Warning: return "warning";
        case NegotiationPurpose::TradeOpportunity: return "trade-opportunity";
        case NegotiationPurpose::MutualDefense: return "mutual-defense";
        case NegotiationPurpose::PeaceOffer: return "peace-offer";
        case NegotiationPurpose::JointVenture: return "joint-venture";
        default: return "request-help";
    }
}

bool parsePurpose(const std::string& name, NegotiationPurpose& out) {
    for (int i = 0; i < kNegotiationPurposeCount; ++i) {
        const NegotiationPurpose p = static_cast<NegotiationPurpose>(i);
        if (name == purposeName(p)) {
            out = p;
            return true;
        }
    }
    return false;
}

const char* urgencyName(NegotiationUrgency urgency) {
    switch (urgency) {
        case NegotiationUrgency::Low: return "low";
        case NegotiationUrgency::Medium: return "medium";
        case NegotiationUrgency::High: return "high";
        case NegotiationUrgency::Critical: return "critical";
        default: return "low";
    }
}

const char* statusName(NegotiationStatus status) {
    switch (status) {
        case NegotiationStatus::Proposed: return "proposed";
        case NegotiationStatus::Accepted: return "accepted";
        case NegotiationStatus::Rejected: return "rejected";
        case NegotiationStatus::Countered: return "countered";
        case NegotiationStatus::Expired: return "expired";
        default: return "proposed";
    }
}

const char* resourceKindName(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Gold: return "gold";
        case ResourceKind::Intel: return "intel";
        case ResourceKind::Uranium: return "uranium";
        default: return "none";
    }
}

const char* itemKindName(NegotiableItem::Kind kind) {
    switch (kind) {
        case NegotiableItem::Kind::Gold: return "gold";
        case NegotiableItem::Kind::Intel: return "intel";
        case NegotiableItem::Kind::Production: return "production";
        case NegotiableItem::Kind::Alliance: return "alliance";
        case NegotiableItem::Kind::Treaty: return "treaty";
        case NegotiableItem::Kind::OpenBorders: return "open-borders";
        case NegotiableItem::Kind::FavorExchange: return "favor-exchange";
        case NegotiableItem::Kind::JoinWar: return "join-war";
        case NegotiableItem::Kind::Promise: return "promise";
        case NegotiableItem::Kind::GrievanceApology: return "grievance-apology";
        default: return "item";
    }
}

bool hasItemKind(const std::vector<NegotiableItem>& items, NegotiableItem::Kind kind) {
    return std::any_of(items.begin(), items.end(), [kind](const NegotiableItem& i) {
        return i.kind == kind;
    });
}

NegotiableItem NegotiableItem::gold(double amount, const std::string& description) {
    NegotiableItem item;
    item.kind = Kind::Gold;
    item.amount = amount;
    item.description = description.empty() ? formatAmount(amount) + " production points" : description;
    return item;
}

NegotiableItem NegotiableItem::intel(double amount, const std::string& description) {
    NegotiableItem item;
    item.kind = Kind::Intel;
    item.amount = amount;
    item.description = description.empty() ? formatAmount(amount) + " intelligence points" : description;
    return item;
}

NegotiableItem NegotiableItem::production(double amount, const std::string& description) {
    NegotiableItem item;
    item.kind = Kind::Production;
    item.amount = amount;
    item.description = description.empty() ? formatAmount(amount) + " uranium" : description;
    return item;
}

NegotiableItem NegotiableItem::alliance(const std::string& subtype, int duration) {
    NegotiableItem item;
    item.kind = Kind::Alliance;
    item.subtype = subtype;
    item.duration = duration;
    std::string label = subtype.empty() ? std::string("Alliance") : subtype + " alliance";
    label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    item.description = label + " (" + std::to_string(duration) + " turns)";
    return item;
}

NegotiableItem NegotiableItem::treaty(const std::string& subtype, int duration) {
    NegotiableItem item;
    item.kind = Kind::Treaty;
    item.subtype = subtype;
    item.duration = duration;
    if (subtype == "non-aggression") {
        item.description = "Non-aggression pact (" + std::to_string(duration) + " turns)";
    } else {
        item.description = "Treaty: " + subtype + " (" + std::to_string(duration) + " turns)";
    }
    return item;
}

NegotiableItem NegotiableItem::openBorders(int duration) {
    NegotiableItem item;
    item.kind = Kind::OpenBorders;
    item.duration = duration;
    item.description = "Open borders (" + std::to_string(duration) + " turns)";
    return item;
}

NegotiableItem NegotiableItem::favorExchange(int favors, const std::string& description) {
    NegotiableItem item;
    item.kind = Kind::FavorExchange;
    item.amount = favors;
    item.description = description.empty() ? std::to_string(favors) + " favors" : description;
    return item;
}

NegotiableItem NegotiableItem::joinWar(const std::string& targetId, const std::string& targetName) {
    NegotiableItem item;
    item.kind = Kind::JoinWar;
    item.targetId = targetId;
    item.description = "Join war against " + (targetName.empty() ? targetId : targetName);
    return item;
}

NegotiableItem NegotiableItem::promise(const std::string& subtype, int duration, const std::string& description) {
    NegotiableItem item;
    item.kind = Kind::Promise;
    item.subtype = subtype;
    item.duration = duration;
    item.description = description;
    return item;
}

NegotiableItem NegotiableItem::grievanceApology(const std::string& grievanceId, const std::string& description) {
    NegotiableItem item;
    item.kind = Kind::GrievanceApology;
    item.grievanceId = grievanceId;
    item.description = description;
    return item;
}

int ExpirationWindows::turnsFor(NegotiationUrgency urgency) const {
    switch (urgency) {
        case NegotiationUrgency::Critical: return critical;
        case NegotiationUrgency::High: return high;
        case NegotiationUrgency::Medium: return medium;
        case NegotiationUrgency::Low: return low;
        default: return low;
    }
}

NegotiationSession::NegotiationSession(int id,
                                       const std::string& proposerId,
                                       const std::string& counterpartId,
                                       NegotiationPurpose purpose,
                                       NegotiationUrgency urgency,
                                       std::vector<NegotiableItem> offerItems,
                                       std::vector<NegotiableItem> requestItems,
                                       int createdTurn,
                                       int expiresAtTurn)
    : m_id(id),
      m_proposerId(proposerId),
      m_counterpartId(counterpartId),
      m_purpose(purpose),
      m_urgency(urgency),
      m_offerItems(std::move(offerItems)),
      m_requestItems(std::move(requestItems)),
      m_createdTurn(createdTurn),
      m_expiresAtTurn(expiresAtTurn) {}

bool NegotiationSession::involves(NegotiableItem::Kind kind) const {
    return hasItemKind(m_offerItems, kind) || hasItemKind(m_requestItems, kind);
}

bool NegotiationSession::accept() {
    if (!isPending()) return false;
    m_status = NegotiationStatus::Accepted;
    return true;
}

bool NegotiationSession::reject() {
    if (!isPending()) return false;
    m_status = NegotiationStatus::Rejected;
    return true;
}

bool NegotiationSession::expireIfDue(int currentTurn) {
    if (!isPending() || currentTurn <= m_expiresAtTurn) {
        return false;
    }
    m_status = NegotiationStatus::Expired;
    return true;
}

bool NegotiationSession::counter(int newId,
                                 int currentTurn,
                                 const ExpirationWindows& windows,
                                 std::vector<NegotiableItem> replyOffer,
                                 std::vector<NegotiableItem> replyRequest,
                                 NegotiationSession& out) {
    if (!isPending()) {
        return false;
    }
    NegotiationSession reply(newId,
                             m_counterpartId,
                             m_proposerId,
                             m_purpose,
                             m_urgency,
                             std::move(replyOffer),
                             std::move(replyRequest),
                             currentTurn,
                             currentTurn + windows.turnsFor(m_urgency));
    m_status = NegotiationStatus::Countered;
    m_counteredById = newId;
    out = std::move(reply);
    return true;
}

NegotiationSession DealBuilder::build(int id,
                                      NegotiationPurpose purpose,
                                      NegotiationUrgency urgency,
                                      int createdTurn,
                                      const ExpirationWindows& windows) const {
    return NegotiationSession(id,
                              m_proposerId,
                              m_counterpartId,
                              purpose,
                              urgency,
                              m_offer,
                              m_request,
                              createdTurn,
                              createdTurn + windows.turnsFor(urgency));
}

std::string describeSession(const NegotiationSession& session) {
    std::ostringstream oss;
    oss << "#" << session.getId() << " " << session.getProposerId() << " -> " << session.getCounterpartId()
        << " [" << purposeName(session.getPurpose()) << ", " << urgencyName(session.getUrgency())
        << ", expires turn " << session.getExpiresAtTurn() << ", " << statusName(session.getStatus()) << "]";
    oss << "\n  offers:";
    appendItems(oss, session.getOfferItems());
    oss << "\n  requests:";
    appendItems(oss, session.getRequestItems());
    return oss.str();
}
