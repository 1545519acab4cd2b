#pragma once

#include <string>
#include <vector>

#include "actor.h"

// A world to run negotiations in, loaded from TOML.
struct Scenario {
    std::string name = "unnamed";
    int startTurn = 1;
    std::vector<Actor> actors;          // sorted by id after loading
    RelationshipTable relations;
    std::vector<AgendaViolation> agendaViolations;

    Actor* findActorMutable(const std::string& id);
    WorldSnapshot snapshot(int currentTurn) const;
};

// On failure `scenario` is left empty and `errorMessage` explains why.
bool loadScenario(const std::string& path, Scenario& scenario, std::string* errorMessage = nullptr);
