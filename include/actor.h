#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

// Personality tag carried by every AI-controlled actor.
enum class Personality {
    Balanced,
    Aggressive,
    Defensive,
    Isolationist,
    Trickster,
    Chaotic
};

constexpr int kPersonalityCount = 6;

const char* personalityName(Personality personality);
// Unknown names map to Balanced and return false.
bool parsePersonality(const std::string& name, Personality& out);

enum class GrievanceSeverity {
    Minor,
    Moderate,
    Major,
    Severe
};

const char* grievanceSeverityName(GrievanceSeverity severity);
bool parseGrievanceSeverity(const std::string& name, GrievanceSeverity& out);

// A recorded wrong held by one actor against another.
struct Grievance {
    std::string id;
    std::string againstId;          // Actor who committed the wrong.
    GrievanceSeverity severity = GrievanceSeverity::Minor;
    int createdTurn = 0;
    bool resolved = false;
    std::string description;
};

// Unit counts used as the military proxy score.
struct MilitaryForces {
    int missiles = 0;
    int bombers = 0;
    int submarines = 0;
};

struct Actor {
    std::string id;
    std::string name;
    bool playerControlled = false;
    Personality personality = Personality::Balanced;

    double production = 0.0;        // Also the gold-equivalent treasury.
    double intel = 0.0;
    double uranium = 0.0;

    MilitaryForces military;

    std::map<std::string, double> threats;      // other actor id -> 0..100
    std::vector<Grievance> grievances;          // Held by this actor.
    std::vector<std::string> alliances;

    double maxThreat() const;
    // Id of the highest threat; ties resolve to the smallest id. Empty when no threats.
    std::string biggestThreatId() const;
    double threatFrom(const std::string& otherId) const;
    bool isAlliedWith(const std::string& otherId) const;
    int militaryPower() const;

    // Unresolved grievances this actor holds against otherId, in recorded order.
    std::vector<const Grievance*> grievancesAgainst(const std::string& otherId) const;
    const Grievance* findGrievance(const std::string& grievanceId) const;
};

const Actor* findActor(const std::vector<Actor>& actors, const std::string& id);

// Read-only relationship/trust/favor accessors owned by the surrounding simulation.
class RelationshipLedger {
public:
    virtual ~RelationshipLedger() = default;

    virtual double getRelationship(const std::string& from, const std::string& to) const = 0;  // -100..100
    virtual double getTrust(const std::string& from, const std::string& to) const = 0;         // 0..100
    virtual double getFavorBalance(const std::string& from, const std::string& to) const = 0;  // + means owed to `from`
};

// Directed-pair table used by the CLI, the viewer and tests.
class RelationshipTable : public RelationshipLedger {
public:
    static constexpr double kDefaultRelationship = 0.0;
    static constexpr double kDefaultTrust = 50.0;
    static constexpr double kDefaultFavor = 0.0;

    double getRelationship(const std::string& from, const std::string& to) const override;
    double getTrust(const std::string& from, const std::string& to) const override;
    double getFavorBalance(const std::string& from, const std::string& to) const override;

    void setRelationship(const std::string& from, const std::string& to, double value);
    void setTrust(const std::string& from, const std::string& to, double value);
    void setFavorBalance(const std::string& from, const std::string& to, double value);
    // Writes both directions.
    void setMutual(const std::string& a, const std::string& b, double relationship, double trust);

    void clear() { m_entries.clear(); }
    size_t size() const { return m_entries.size(); }

private:
    struct Entry {
        double relationship = kDefaultRelationship;
        double trust = kDefaultTrust;
        double favor = kDefaultFavor;
    };

    const Entry* find(const std::string& from, const std::string& to) const;
    Entry& entry(const std::string& from, const std::string& to);

    std::map<std::pair<std::string, std::string>, Entry> m_entries;
};

// Externally detected breach of an actor's agenda by another actor.
struct AgendaViolation {
    std::string observerId;
    std::string offenderId;
    std::string agendaId;
    std::string agendaName;
};

// Everything an evaluator may read about the world for one turn.
struct WorldSnapshot {
    const std::vector<Actor>& actors;
    const RelationshipLedger& relations;
    int currentTurn = 0;
    const std::vector<AgendaViolation>* agendaViolations = nullptr;
};

std::vector<const AgendaViolation*> violationsObservedBy(const WorldSnapshot& world,
                                                         const std::string& observerId,
                                                         const std::string& offenderId);
