#include "actor.h"

#include <algorithm>
#include <cctype>

namespace {

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

} // namespace

const char* personalityName(Personality personality) {
    switch (personality) {
        case Personality::Balanced: return "balanced";
        case Personality::Aggressive: return "aggressive";
        case Personality::Defensive: return "defensive";
        case Personality::Isolationist: return "isolationist";
        case Personality::Trickster: return "trickster";
        case Personality::Chaotic: return "chaotic";
        default: return "balanced";
    }
}

bool parsePersonality(const std::string& name, Personality& out) {
    const std::string value = toLowerAscii(name);
    if (value == "balanced") { out = Personality::Balanced; return true; }
    if (value == "aggressive") { out = Personality::Aggressive; return true; }
    if (value == "defensive") { out = Personality::Defensive; return true; }
    if (value == "isolationist") { out = Personality::Isolationist; return true; }
    if (value == "trickster") { out = Personality::Trickster; return true; }
    if (value == "chaotic") { out = Personality::Chaotic; return true; }
    out = Personality::Balanced;
    return false;
}

const char* grievanceSeverityName(GrievanceSeverity severity) {
    switch (severity) {
        case GrievanceSeverity::Minor: return "minor";
        case GrievanceSeverity::Moderate: return "moderate";
        case GrievanceSeverity::Major: return "major";
        case GrievanceSeverity::Severe: return "severe";
        default: return "minor";
    }
}

bool parseGrievanceSeverity(const std::string& name, GrievanceSeverity& out) {
    const std::string value = toLowerAscii(name);
    if (value == "minor") { out = GrievanceSeverity::Minor; return true; }
    if (value == "moderate") { out = GrievanceSeverity::Moderate; return true; }
    if (value == "major") { out = GrievanceSeverity::Major; return true; }
    if (value == "severe") { out = GrievanceSeverity::Severe; return true; }
    out = GrievanceSeverity::Minor;
    return false;
}

double Actor::maxThreat() const {
    double best = 0.0;
    for (const auto& kv : threats) {
        best = std::max(best, kv.second);
    }
    return best;
}

std::string Actor::biggestThreatId() const {
    std::string bestId;
    double best = 0.0;
    // std::map iterates in id order, so strict > keeps the smallest id on ties.
    for (const auto& kv : threats) {
        if (bestId.empty() || kv.second > best) {
            bestId = kv.first;
            best = kv.second;
        }
    }
    return bestId;
}

double Actor::threatFrom(const std::string& otherId) const {
    const auto it = threats.find(otherId);
    return (it != threats.end()) ? it->second : 0.0;
}

bool Actor::isAlliedWith(const std::string& otherId) const {
    return std::find(alliances.begin(), alliances.end(), otherId) != alliances.end();
}

int Actor::militaryPower() const {
    return military.missiles + military.bombers + military.submarines;
}

std::vector<const Grievance*> Actor::grievancesAgainst(const std::string& otherId) const {
    std::vector<const Grievance*> out;
    for (const Grievance& g : grievances) {
        if (!g.resolved && g.againstId == otherId) {
            out.push_back(&g);
        }
    }
    return out;
}

const Grievance* Actor::findGrievance(const std::string& grievanceId) const {
    for (const Grievance& g : grievances) {
        if (g.id == grievanceId) {
            return &g;
        }
    }
    return nullptr;
}

const Actor* findActor(const std::vector<Actor>& actors, const std::string& id) {
    if (id.empty()) {
        return nullptr;
    }
    for (const Actor& a : actors) {
        if (a.id == id) {
            return &a;
        }
    }
    return nullptr;
}

const RelationshipTable::Entry* RelationshipTable::find(const std::string& from, const std::string& to) const {
    const auto it = m_entries.find(std::make_pair(from, to));
    return (it != m_entries.end()) ? &it->second : nullptr;
}

RelationshipTable::Entry& RelationshipTable::entry(const std::string& from, const std::string& to) {
    return m_entries[std::make_pair(from, to)];
}

double RelationshipTable::getRelationship(const std::string& from, const std::string& to) const {
    const Entry* e = find(from, to);
    return e ? e->relationship : kDefaultRelationship;
}

double RelationshipTable::getTrust(const std::string& from, const std::string& to) const {
    const Entry* e = find(from, to);
    return e ? e->trust : kDefaultTrust;
}

double RelationshipTable::getFavorBalance(const std::string& from, const std::string& to) const {
    const Entry* e = find(from, to);
    return e ? e->favor : kDefaultFavor;
}

void RelationshipTable::setRelationship(const std::string& from, const std::string& to, double value) {
    entry(from, to).relationship = std::clamp(value, -100.0, 100.0);
}

void RelationshipTable::setTrust(const std::string& from, const std::string& to, double value) {
    entry(from, to).trust = std::clamp(value, 0.0, 100.0);
}

void RelationshipTable::setFavorBalance(const std::string& from, const std::string& to, double value) {
    entry(from, to).favor = value;
}

void RelationshipTable::setMutual(const std::string& a, const std::string& b, double relationship, double trust) {
    setRelationship(a, b, relationship);
    setRelationship(b, a, relationship);
    setTrust(a, b, trust);
    setTrust(b, a, trust);
}

std::vector<const AgendaViolation*> violationsObservedBy(const WorldSnapshot& world,
                                                         const std::string& observerId,
                                                         const std::string& offenderId) {
    std::vector<const AgendaViolation*> out;
    if (!world.agendaViolations) {
        return out;
    }
    for (const AgendaViolation& v : *world.agendaViolations) {
        if (v.observerId == observerId && v.offenderId == offenderId) {
            out.push_back(&v);
        }
    }
    return out;
}
