#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "diplomatic_messages.h"
#include "negotiation.h"
#include "negotiation_config.h"
#include "negotiation_runner.h"
#include "negotiation_triggers.h"
#include "scenario.h"

namespace {

constexpr int kDefaultTurns = 20;

struct RunOptions {
    std::uint64_t seed = 1;
    std::string scenarioPath;
    std::string configPath = "data/negotiation_config.toml";
    std::string messagesPath; // optional message template overrides
    int turns = kDefaultTurns;
    bool debug = false;
    bool quiet = false;       // only print the summary and the final hash
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool01(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "diplomacy_cli")
              << " --scenario path [--config path] [--messages path]\n"
              << "       [--turns N] [--seed N] [--debug 0|1] [--quiet 0|1]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--scenario") {
            if (!requireValue(opt.scenarioPath)) return false;
        } else if (arg.rfind("--scenario=", 0) == 0) {
            opt.scenarioPath = arg.substr(11);
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--messages") {
            if (!requireValue(opt.messagesPath)) return false;
        } else if (arg.rfind("--messages=", 0) == 0) {
            opt.messagesPath = arg.substr(11);
        } else if (arg == "--turns") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.turns)) return false;
        } else if (arg.rfind("--turns=", 0) == 0) {
            if (!parseInt(arg.substr(8), opt.turns)) return false;
        } else if (arg == "--debug") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.debug)) return false;
        } else if (arg.rfind("--debug=", 0) == 0) {
            if (!parseBool01(arg.substr(8), opt.debug)) return false;
        } else if (arg == "--quiet") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.quiet)) return false;
        } else if (arg.rfind("--quiet=", 0) == 0) {
            if (!parseBool01(arg.substr(8), opt.quiet)) return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return !opt.scenarioPath.empty() && opt.turns >= 0;
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

    TriggerTracker::setDebugMode(opt.debug);
    NegotiationDirector::setDebugMode(opt.debug);

    NegotiationContext ctx(opt.seed);
    std::string error;
    if (!ctx.loadConfig(opt.configPath, &error)) {
        std::cerr << "[Config] " << error << " (using defaults)\n";
    }
    std::cout << "[Config] " << (opt.configPath.empty() ? "defaults" : opt.configPath)
              << " hash=" << ctx.configHash << " seed=" << ctx.seed << "\n";

    DiplomaticMessages messages;
    if (!opt.messagesPath.empty() && !messages.loadFromFile(opt.messagesPath, &error)) {
        std::cerr << "[Config] " << error << "\n";
        return 1;
    }

    Scenario scenario;
    if (!loadScenario(opt.scenarioPath, scenario, &error)) {
        std::cerr << "[Scenario] " << error << "\n";
        return 1;
    }
    std::cout << "[Scenario] '" << scenario.name << "': " << scenario.actors.size() << " actors, start turn "
              << scenario.startTurn << ", " << opt.turns << " turn(s)\n";

    NegotiationDirector director(ctx, messages);
    TurnReport totals;
    const int endTurn = scenario.startTurn + opt.turns;
    for (int turn = scenario.startTurn; turn < endTurn; ++turn) {
        const WorldSnapshot world = scenario.snapshot(turn);
        TurnReport report = director.runTurn(world);
        director.resolveAiResponses(world, report);

        if (!opt.quiet) {
            for (const auto& line : report.events) {
                std::cout << "[Diplomacy] " << line << "\n";
            }
        }
        totals.proposed += report.proposed;
        totals.expired += report.expired;
        totals.accepted += report.accepted;
        totals.rejected += report.rejected;
        totals.countered += report.countered;
    }

    if (!opt.quiet) {
        std::cout << "\n[Diplomacy] Recently resolved:\n";
        for (const NegotiationSession& s : director.resolvedHistory()) {
            std::cout << describeSession(s) << "\n";
        }
        std::cout << "[Diplomacy] Pending:\n";
        for (const NegotiationSession& s : director.sessions()) {
            std::cout << describeSession(s) << "\n";
        }
    }
    std::cout << "[Diplomacy] proposed=" << totals.proposed << " accepted=" << totals.accepted
              << " rejected=" << totals.rejected << " countered=" << totals.countered
              << " expired=" << totals.expired << "\n";
    std::cout << "[Diplomacy] state hash=" << director.computeStateHash() << std::endl;
    return 0;
}
