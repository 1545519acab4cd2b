#include "scenario.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>

#include <toml++/toml.hpp>

namespace {

double readNumber(const toml::table& t, std::string_view key, double fallback) {
    if (const auto v = t[key].value<double>()) return *v;
    if (const auto vi = t[key].value<std::int64_t>()) return static_cast<double>(*vi);
    return fallback;
}

// Leaves `out` untouched when the key is absent; rejects values outside int.
bool readInt(const toml::table& t, std::string_view key, int& out, std::string& problem) {
    const auto v = t[key].value<std::int64_t>();
    if (!v) return true;
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
        problem = "'" + std::string(key) + "' is out of range (" + std::to_string(*v) + ")";
        return false;
    }
    out = static_cast<int>(*v);
    return true;
}

std::string readString(const toml::table& t, std::string_view key) {
    if (const auto v = t[key].value<std::string>()) return *v;
    return std::string();
}

bool readActor(const toml::table& t, Actor& actor, std::string& problem) {
    actor.id = readString(t, "id");
    if (actor.id.empty()) {
        problem = "actor without id";
        return false;
    }
    actor.name = readString(t, "name");
    if (actor.name.empty()) actor.name = actor.id;
    actor.playerControlled = t["player"].value_or(false);

    const std::string personality = readString(t, "personality");
    if (!personality.empty() && !parsePersonality(personality, actor.personality)) {
        std::cerr << "[Scenario] Unknown personality '" << personality << "' for " << actor.id
                  << ", using balanced" << std::endl;
    }

    actor.production = readNumber(t, "production", 0.0);
    actor.intel = readNumber(t, "intel", 0.0);
    actor.uranium = readNumber(t, "uranium", 0.0);
    if (!readInt(t, "missiles", actor.military.missiles, problem) ||
        !readInt(t, "bombers", actor.military.bombers, problem) ||
        !readInt(t, "submarines", actor.military.submarines, problem)) {
        problem = "actor '" + actor.id + "': " + problem;
        return false;
    }

    if (const toml::table* threats = t["threats"].as_table()) {
        for (const auto& [key, node] : *threats) {
            double level = 0.0;
            if (const auto v = node.value<double>()) level = *v;
            else if (const auto vi = node.value<std::int64_t>()) level = static_cast<double>(*vi);
            actor.threats[std::string(key.str())] = std::clamp(level, 0.0, 100.0);
        }
    }
    if (const toml::array* alliances = t["alliances"].as_array()) {
        for (const auto& node : *alliances) {
            if (const auto v = node.value<std::string>()) actor.alliances.push_back(*v);
        }
    }
    return true;
}

} // namespace

Actor* Scenario::findActorMutable(const std::string& id) {
    for (Actor& a : actors) {
        if (a.id == id) return &a;
    }
    return nullptr;
}

WorldSnapshot Scenario::snapshot(int currentTurn) const {
    return WorldSnapshot{actors, relations, currentTurn, &agendaViolations};
}

bool loadScenario(const std::string& path, Scenario& scenario, std::string* errorMessage) {
    scenario = Scenario{};
    std::string problem;

    try {
        toml::table root = toml::parse_file(path);
        Scenario loaded;

        if (const auto v = root["scenario"]["name"].value<std::string>()) loaded.name = *v;
        if (const toml::table* header = root["scenario"].as_table()) {
            if (!readInt(*header, "startTurn", loaded.startTurn, problem)) {
                problem = "[scenario] " + problem;
            }
        }

        std::set<std::string> ids;
        const toml::array* actors = problem.empty() ? root["actors"].as_array() : nullptr;
        if (actors) {
            for (const auto& node : *actors) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                Actor actor;
                if (!readActor(*t, actor, problem)) break;
                if (!ids.insert(actor.id).second) {
                    problem = "duplicate actor id '" + actor.id + "'";
                    break;
                }
                loaded.actors.push_back(std::move(actor));
            }
        }
        if (problem.empty() && loaded.actors.size() < 2) {
            problem = "a scenario needs at least two actors";
        }

        if (problem.empty()) {
            if (const toml::array* grievances = root["grievances"].as_array()) {
                int autoId = 0;
                for (const auto& node : *grievances) {
                    const toml::table* t = node.as_table();
                    if (!t) continue;
                    Actor* holder = loaded.findActorMutable(readString(*t, "holder"));
                    Grievance g;
                    g.againstId = readString(*t, "against");
                    if (!holder || ids.count(g.againstId) == 0) {
                        problem = "grievance refers to an unknown actor";
                        break;
                    }
                    g.id = readString(*t, "id");
                    if (g.id.empty()) g.id = "g" + std::to_string(++autoId);
                    const std::string severity = readString(*t, "severity");
                    if (!parseGrievanceSeverity(severity, g.severity)) {
                        std::cerr << "[Scenario] Unknown severity '" << severity << "' for grievance " << g.id
                                  << ", using minor" << std::endl;
                    }
                    g.createdTurn = loaded.startTurn;
                    if (!readInt(*t, "turn", g.createdTurn, problem)) {
                        problem = "grievance " + g.id + ": " + problem;
                        break;
                    }
                    g.resolved = (*t)["resolved"].value_or(false);
                    g.description = readString(*t, "description");
                    holder->grievances.push_back(std::move(g));
                }
            }
        }

        if (problem.empty()) {
            if (const toml::array* relations = root["relations"].as_array()) {
                for (const auto& node : *relations) {
                    const toml::table* t = node.as_table();
                    if (!t) continue;
                    const std::string from = readString(*t, "from");
                    const std::string to = readString(*t, "to");
                    if (ids.count(from) == 0 || ids.count(to) == 0) {
                        problem = "relation refers to an unknown actor";
                        break;
                    }
                    const double relationship = readNumber(*t, "relationship", RelationshipTable::kDefaultRelationship);
                    const double trust = readNumber(*t, "trust", RelationshipTable::kDefaultTrust);
                    const double favor = readNumber(*t, "favor", RelationshipTable::kDefaultFavor);
                    const bool mutual = (*t)["mutual"].value_or(true);
                    loaded.relations.setRelationship(from, to, relationship);
                    loaded.relations.setTrust(from, to, trust);
                    loaded.relations.setFavorBalance(from, to, favor);
                    if (mutual) {
                        loaded.relations.setRelationship(to, from, relationship);
                        loaded.relations.setTrust(to, from, trust);
                        loaded.relations.setFavorBalance(to, from, -favor);
                    }
                }
            }
        }

        if (problem.empty()) {
            if (const toml::array* violations = root["violations"].as_array()) {
                for (const auto& node : *violations) {
                    const toml::table* t = node.as_table();
                    if (!t) continue;
                    AgendaViolation v;
                    v.observerId = readString(*t, "observer");
                    v.offenderId = readString(*t, "offender");
                    v.agendaId = readString(*t, "agendaId");
                    v.agendaName = readString(*t, "agendaName");
                    if (v.agendaName.empty()) v.agendaName = v.agendaId;
                    if (ids.count(v.observerId) == 0 || ids.count(v.offenderId) == 0) {
                        problem = "violation refers to an unknown actor";
                        break;
                    }
                    loaded.agendaViolations.push_back(std::move(v));
                }
            }
        }

        if (!problem.empty()) {
            if (errorMessage) {
                *errorMessage = "Invalid scenario '" + path + "': " + problem;
            }
            return false;
        }

        std::sort(loaded.actors.begin(), loaded.actors.end(), [](const Actor& a, const Actor& b) {
            return a.id < b.id;
        });
        scenario = std::move(loaded);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse scenario '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load scenario '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }
    return false;
}
