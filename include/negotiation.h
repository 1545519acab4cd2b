#pragma once

#include <string>
#include <vector>

enum class NegotiationPurpose {
    RequestHelp,
    OfferAlliance,
    Reconciliation,
    DemandCompensation,
    Warning,
    TradeOpportunity,
    MutualDefense,
    PeaceOffer,
    JointVenture
};

constexpr int kNegotiationPurposeCount = 9;

enum class NegotiationUrgency {
    Low,
    Medium,
    High,
    Critical
};

enum class NegotiationStatus {
    Proposed,
    Accepted,
    Rejected,
    Countered,
    Expired
};

// Resource a trade trigger refers to. Uranium is settled as a production transfer.
enum class ResourceKind {
    None,
    Gold,
    Intel,
    Uranium
};

const char* purposeName(NegotiationPurpose purpose);
bool parsePurpose(const std::string& name, NegotiationPurpose& out);
const char* urgencyName(NegotiationUrgency urgency);
const char* statusName(NegotiationStatus status);
const char* resourceKindName(ResourceKind kind);

// One unit of exchange inside a deal. Only the fields relevant to `kind` are meaningful.
struct NegotiableItem {
    enum class Kind {
        Gold,
        Intel,
        Production,       // uranium-equivalent transfer
        Alliance,
        Treaty,
        OpenBorders,
        FavorExchange,
        JoinWar,
        Promise,
        GrievanceApology
    };

    Kind kind = Kind::Gold;
    double amount = 0.0;
    int duration = 0;
    std::string subtype;
    std::string targetId;
    std::string grievanceId;
    std::string description;

    static NegotiableItem gold(double amount, const std::string& description = std::string());
    static NegotiableItem intel(double amount, const std::string& description = std::string());
    static NegotiableItem production(double amount, const std::string& description = std::string());
    static NegotiableItem alliance(const std::string& subtype, int duration);
    static NegotiableItem treaty(const std::string& subtype, int duration);
    static NegotiableItem openBorders(int duration);
    static NegotiableItem favorExchange(int favors, const std::string& description = std::string());
    static NegotiableItem joinWar(const std::string& targetId, const std::string& targetName);
    static NegotiableItem promise(const std::string& subtype, int duration, const std::string& description);
    static NegotiableItem grievanceApology(const std::string& grievanceId, const std::string& description);
};

const char* itemKindName(NegotiableItem::Kind kind);
bool hasItemKind(const std::vector<NegotiableItem>& items, NegotiableItem::Kind kind);

// Expiration window in turns for an urgency level.
struct ExpirationWindows {
    int critical = 2;
    int high = 3;
    int medium = 5;
    int low = 10;

    int turnsFor(NegotiationUrgency urgency) const;
};

// A proposed deal between two actors. Items are fixed at construction;
// counter-offers are new sessions.
class NegotiationSession {
public:
    NegotiationSession() = default;
    NegotiationSession(int id,
                       const std::string& proposerId,
                       const std::string& counterpartId,
                       NegotiationPurpose purpose,
                       NegotiationUrgency urgency,
                       std::vector<NegotiableItem> offerItems,
                       std::vector<NegotiableItem> requestItems,
                       int createdTurn,
                       int expiresAtTurn);

    int getId() const { return m_id; }
    const std::string& getProposerId() const { return m_proposerId; }
    const std::string& getCounterpartId() const { return m_counterpartId; }
    NegotiationPurpose getPurpose() const { return m_purpose; }
    NegotiationUrgency getUrgency() const { return m_urgency; }
    const std::vector<NegotiableItem>& getOfferItems() const { return m_offerItems; }
    const std::vector<NegotiableItem>& getRequestItems() const { return m_requestItems; }
    int getCreatedTurn() const { return m_createdTurn; }
    int getExpiresAtTurn() const { return m_expiresAtTurn; }
    NegotiationStatus getStatus() const { return m_status; }
    int getCounteredById() const { return m_counteredById; }

    bool isPending() const { return m_status == NegotiationStatus::Proposed; }
    bool involves(NegotiableItem::Kind kind) const;

    // Transitions succeed only from Proposed.
    bool accept();
    bool reject();
    // Marks Expired when currentTurn > expiresAtTurn.
    bool expireIfDue(int currentTurn);

    // Builds the reply session (parties swapped) and marks this one Countered.
    // Returns false and leaves `out` untouched when this session is no longer pending.
    bool counter(int newId,
                 int currentTurn,
                 const ExpirationWindows& windows,
                 std::vector<NegotiableItem> replyOffer,
                 std::vector<NegotiableItem> replyRequest,
                 NegotiationSession& out);

    // Presentation text attached after composition.
    const std::string& getMessage() const { return m_message; }
    void setMessage(const std::string& message) { m_message = message; }

private:
    int m_id = -1;
    std::string m_proposerId;
    std::string m_counterpartId;
    NegotiationPurpose m_purpose = NegotiationPurpose::RequestHelp;
    NegotiationUrgency m_urgency = NegotiationUrgency::Low;
    std::vector<NegotiableItem> m_offerItems;
    std::vector<NegotiableItem> m_requestItems;
    int m_createdTurn = 0;
    int m_expiresAtTurn = 0;
    NegotiationStatus m_status = NegotiationStatus::Proposed;
    int m_counteredById = -1;
    std::string m_message;
};

// Accumulates items before a session is sealed.
class DealBuilder {
public:
    DealBuilder(const std::string& proposerId, const std::string& counterpartId)
        : m_proposerId(proposerId), m_counterpartId(counterpartId) {}

    void addItemToOffer(const NegotiableItem& item) { m_offer.push_back(item); }
    void addItemToRequest(const NegotiableItem& item) { m_request.push_back(item); }

    const std::vector<NegotiableItem>& offerItems() const { return m_offer; }
    const std::vector<NegotiableItem>& requestItems() const { return m_request; }

    NegotiationSession build(int id,
                             NegotiationPurpose purpose,
                             NegotiationUrgency urgency,
                             int createdTurn,
                             const ExpirationWindows& windows) const;

private:
    std::string m_proposerId;
    std::string m_counterpartId;
    std::vector<NegotiableItem> m_offer;
    std::vector<NegotiableItem> m_request;
};

std::string describeSession(const NegotiationSession& session);
