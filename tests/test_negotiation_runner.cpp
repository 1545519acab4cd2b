// tests/test_negotiation_runner.cpp
//
// Coverage for the turn director: ordering, caps, expiry, AI responses and
// reproducibility of the state hash.

#include <doctest/doctest.h>

#include "negotiation_runner.h"
#include "test_world.h"

using testworld::TestWorld;
using testworld::makeActor;

namespace {

// Three rich AI actors and one poor player: every rich actor wants to trade
// with the player, nobody else has a reason to talk.
TestWorld tradingWorld() {
    TestWorld w;
    for (const char* id : {"a", "b", "c"}) {
        Actor rich = makeActor(id);
        rich.production = 300.0;
        rich.intel = 50.0;
        rich.uranium = 60.0;
        w.add(rich);
    }
    Actor poor = makeActor("p");
    poor.playerControlled = true;
    poor.production = 10.0;
    w.add(poor);
    return w;
}

} // namespace

TEST_CASE("Proposals respect the per-turn cap and actor id order") {
    const TestWorld w = tradingWorld();
    const NegotiationContext ctx(1);
    const DiplomaticMessages messages;
    NegotiationDirector director(ctx, messages);

    // Nobody has waited out the spacing window yet.
    for (int turn = 1; turn < 5; ++turn) {
        CHECK(director.runTurn(w.snapshot(turn)).proposed == 0);
    }

    TurnReport first = director.runTurn(w.snapshot(5));
    CHECK(first.proposed == 2);
    REQUIRE(director.sessions().size() == 2);
    CHECK(director.sessions()[0].getProposerId() == "a");
    CHECK(director.sessions()[1].getProposerId() == "b");
    CHECK(director.sessions()[0].getCounterpartId() == "p");
    CHECK(director.sessions()[0].getId() == 1);
    CHECK(director.sessions()[1].getId() == 2);
    CHECK_FALSE(director.sessions()[0].getMessage().empty());
    CHECK(first.events.size() == 2);

    // "a" and "b" are throttled; "c" gets its turn.
    TurnReport second = director.runTurn(w.snapshot(6));
    CHECK(second.proposed == 1);
    CHECK(director.sessions().back().getProposerId() == "c");

    CHECK(director.runTurn(w.snapshot(7)).proposed == 0);
    CHECK(director.pendingFor("p").size() == 3);
}

TEST_CASE("Player-controlled sessions wait for a response and then expire") {
    const TestWorld w = tradingWorld();
    const NegotiationContext ctx(1);
    const DiplomaticMessages messages;
    NegotiationDirector director(ctx, messages);

    TurnReport report = director.runTurn(w.snapshot(5));
    director.resolveAiResponses(w.snapshot(5), report);
    CHECK(report.accepted + report.rejected + report.countered == 0);

    CHECK(director.respond(1, true));
    CHECK_FALSE(director.respond(1, false));
    CHECK_FALSE(director.respond(99, true));
    REQUIRE(director.findSession(1) != nullptr);
    CHECK(director.findSession(1)->getStatus() == NegotiationStatus::Accepted);
    CHECK(director.findSession(99) == nullptr);

    // Low urgency trade: created turn 5, expires after turn 15.
    CHECK(director.runTurn(w.snapshot(15)).expired == 0);
    TurnReport late = director.runTurn(w.snapshot(16));
    CHECK(late.expired == 1);
    REQUIRE(director.findSession(2) != nullptr);
    CHECK(director.findSession(2)->getStatus() == NegotiationStatus::Expired);
    CHECK(director.findSession(1)->getStatus() == NegotiationStatus::Accepted);

    for (const NegotiationSession& s : director.sessions()) {
        CHECK(s.isPending());
    }
    REQUIRE(director.resolvedHistory().size() == 2);
    CHECK(director.resolvedHistory()[0].getId() == 1);
    CHECK(director.resolvedHistory()[1].getId() == 2);
}

TEST_CASE("AI counterparts answer proposals addressed to them") {
    TestWorld w;
    Actor a = makeActor("a");
    a.production = 300.0;
    w.add(a);
    Actor e = makeActor("e");
    e.production = 50.0;
    e.intel = 50.0;
    w.add(e);

    const NegotiationContext ctx(5);
    const DiplomaticMessages messages;
    NegotiationDirector director(ctx, messages);

    TurnReport report = director.runTurn(w.snapshot(5));
    REQUIRE(report.proposed == 1);
    director.resolveAiResponses(w.snapshot(5), report);

    // Gold 80 for gold 60 with a neutral relationship scores about +20.
    CHECK(report.accepted == 1);
    REQUIRE(director.findSession(1) != nullptr);
    CHECK(director.findSession(1)->getStatus() == NegotiationStatus::Accepted);
    CHECK(report.events.size() == 2);
    CHECK(report.events.back().find("accepts #1") != std::string::npos);

    // Answered sessions leave the live list.
    CHECK(director.sessions().empty());
    REQUIRE(director.resolvedHistory().size() == 1);
    CHECK(director.resolvedHistory()[0].getId() == 1);
}

TEST_CASE("Long runs keep only live sessions and a bounded history") {
    const TestWorld w = tradingWorld();
    const NegotiationContext ctx(11);
    const DiplomaticMessages messages;
    NegotiationDirector director(ctx, messages);

    int proposed = 0;
    for (int turn = 1; turn <= 400; ++turn) {
        TurnReport report = director.runTurn(w.snapshot(turn));
        director.resolveAiResponses(w.snapshot(turn), report);
        proposed += report.proposed;
        for (const NegotiationSession& s : director.sessions()) {
            CHECK(s.isPending());
        }
    }

    REQUIRE(proposed > static_cast<int>(NegotiationDirector::kHistoryLimit));
    CHECK(director.sessions().size() < static_cast<size_t>(proposed));
    CHECK(director.resolvedHistory().size() == NegotiationDirector::kHistoryLimit);
    for (const NegotiationSession& s : director.resolvedHistory()) {
        CHECK_FALSE(s.isPending());
    }
    CHECK(director.findSession(1) == nullptr);
}

TEST_CASE("Identical seeds give identical runs") {
    const TestWorld w = tradingWorld();
    const DiplomaticMessages messages;

    auto run = [&](std::uint64_t seed) {
        const NegotiationContext ctx(seed);
        NegotiationDirector director(ctx, messages);
        for (int turn = 1; turn <= 15; ++turn) {
            TurnReport report = director.runTurn(w.snapshot(turn));
            director.resolveAiResponses(w.snapshot(turn), report);
        }
        return director.computeStateHash();
    };

    CHECK(run(17) == run(17));
    CHECK(run(99) == run(99));
}

TEST_CASE("Reset returns the director to a fresh state") {
    const TestWorld w = tradingWorld();
    const NegotiationContext ctx(3);
    const DiplomaticMessages messages;
    NegotiationDirector director(ctx, messages);
    const std::uint64_t empty = director.computeStateHash();

    const TurnReport first = director.runTurn(w.snapshot(5));
    CHECK(director.computeStateHash() != empty);
    const std::uint64_t afterFirst = director.computeStateHash();

    director.reset();
    CHECK(director.sessions().empty());
    CHECK(director.resolvedHistory().empty());
    CHECK(director.tracker().trackedActorCount() == 0);
    CHECK(director.computeStateHash() == empty);

    const TurnReport replay = director.runTurn(w.snapshot(5));
    CHECK(replay.proposed == first.proposed);
    CHECK(director.computeStateHash() == afterFirst);
}
