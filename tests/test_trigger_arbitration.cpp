// tests/test_trigger_arbitration.cpp
//
// Coverage for checkAllTriggers and the throttle tracker.

#include <doctest/doctest.h>

#include "negotiation_triggers.h"
#include "test_world.h"

#include <atomic>
#include <thread>
#include <vector>

using testworld::TestWorld;
using testworld::makeActor;
using testworld::makeGrievance;

namespace {

// "a" is threatened by "x" (help request from "c") and has a production
// surplus that "c" lacks (trade with "c").
TestWorld crowdedWorld() {
    TestWorld w;
    Actor a = makeActor("a");
    a.threats["x"] = 85.0;
    a.production = 300.0;
    w.add(a);

    Actor c = makeActor("c");
    c.military.missiles = 10;
    c.production = 40.0;
    w.add(c);

    Actor x = makeActor("x");
    x.military.missiles = 10;
    w.add(x);

    w.relations.setMutual("a", "c", 10.0, 50.0);
    return w;
}

} // namespace

TEST_CASE("Arbitration returns exactly one result, the highest priority") {
    const TestWorld w = crowdedWorld();
    TriggerTracker tracker;

    const std::vector<TriggerResult> all = collectTriggerCandidates(w.get("a"), w.get("c"), w.snapshot(5));
    REQUIRE(all.size() == 6);
    int firing = 0;
    for (const TriggerResult& r : all) {
        if (r.shouldTrigger) ++firing;
    }
    CHECK(firing == 2);

    TriggerResult out;
    REQUIRE(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 0, tracker, out));
    CHECK(out.shouldTrigger);
    CHECK(out.purpose == NegotiationPurpose::RequestHelp);
    CHECK(out.priority == 100);
}

TEST_CASE("Candidates are reported in registration order") {
    const TestWorld w = crowdedWorld();
    const std::vector<TriggerResult> all = collectTriggerCandidates(w.get("a"), w.get("c"), w.snapshot(5));
    REQUIRE(all.size() == 6);
    CHECK(all[0].purpose == NegotiationPurpose::Warning);
    CHECK(all[1].purpose == NegotiationPurpose::RequestHelp);
    CHECK(all[2].purpose == NegotiationPurpose::DemandCompensation);
    CHECK(all[3].purpose == NegotiationPurpose::OfferAlliance);
    CHECK(all[4].purpose == NegotiationPurpose::Reconciliation);
    CHECK(all[5].purpose == NegotiationPurpose::TradeOpportunity);
}

TEST_CASE("Equal priorities keep registration order") {
    // Warning (70) and compensation (50 + 4*5 = 70) tie; warning is registered first.
    TestWorld w;
    Actor a = makeActor("a");
    a.grievances.push_back(makeGrievance("g1", "b", GrievanceSeverity::Major, 9));
    a.grievances.push_back(makeGrievance("g2", "b", GrievanceSeverity::Minor, 9));
    w.add(a);
    w.add(makeActor("b"));

    TriggerTracker tracker;
    TriggerResult out;
    REQUIRE(checkAllTriggers(w.get("a"), w.get("b"), w.snapshot(10), 0, tracker, out));
    CHECK(out.purpose == NegotiationPurpose::Warning);
    CHECK(out.priority == 70);
}

TEST_CASE("An actor is throttled for the minimum spacing after a negotiation") {
    const TestWorld w = crowdedWorld();
    TriggerTracker tracker;
    TriggerResult out;

    CHECK(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(10), 0, tracker, out));
    int last = -1;
    REQUIRE(tracker.lastNegotiationTurn("a", last));
    CHECK(last == 10);

    for (int turn = 10; turn < 15; ++turn) {
        CHECK_FALSE(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(turn), 0, tracker, out));
    }
    CHECK(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(15), 0, tracker, out));
}

TEST_CASE("Unrecorded actors count as having negotiated on turn zero") {
    TriggerTracker tracker;
    int last = 0;
    CHECK_FALSE(tracker.lastNegotiationTurn("a", last));
    CHECK(tracker.isThrottled("a", 0, 5));
    CHECK(tracker.isThrottled("a", 4, 5));
    CHECK_FALSE(tracker.isThrottled("a", 5, 5));
    CHECK_FALSE(tracker.isThrottled("a", 1, 0));

    tracker.recordNegotiation("a", 8);
    CHECK(tracker.isThrottled("a", 12, 5));
    CHECK_FALSE(tracker.isThrottled("a", 13, 5));
    CHECK_FALSE(tracker.isThrottled("b", 8, 5));
    CHECK(tracker.trackedActorCount() == 1);
}

TEST_CASE("No actor negotiates before the first spacing window has passed") {
    const TestWorld w = crowdedWorld();
    TriggerTracker tracker;
    TriggerResult out;

    for (int turn = 1; turn < 5; ++turn) {
        CHECK_FALSE(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(turn), 0, tracker, out));
    }
    CHECK(tracker.trackedActorCount() == 0);
    CHECK(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 0, tracker, out));
}

TEST_CASE("tryClaim checks and records in one step") {
    TriggerTracker tracker;
    CHECK_FALSE(tracker.tryClaim("a", 3, 5));
    CHECK(tracker.trackedActorCount() == 0);

    CHECK(tracker.tryClaim("a", 6, 5));
    CHECK_FALSE(tracker.tryClaim("a", 6, 5));
    CHECK_FALSE(tracker.tryClaim("a", 10, 5));
    CHECK(tracker.tryClaim("a", 11, 5));

    int last = 0;
    REQUIRE(tracker.lastNegotiationTurn("a", last));
    CHECK(last == 11);
}

TEST_CASE("Parallel arbitration for one actor selects at most one negotiation") {
    const TestWorld w = crowdedWorld();
    const WorldSnapshot world = w.snapshot(10);
    TriggerTracker tracker;
    std::atomic<int> selected{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&]() {
            TriggerResult out;
            if (checkAllTriggers(w.get("a"), w.get("c"), world, 0, tracker, out)) {
                ++selected;
            }
        });
    }
    for (std::thread& t : workers) {
        t.join();
    }

    CHECK(selected.load() == 1);
    int last = 0;
    REQUIRE(tracker.lastNegotiationTurn("a", last));
    CHECK(last == 10);
}

TEST_CASE("The global per-turn cap suppresses arbitration") {
    const TestWorld w = crowdedWorld();
    TriggerTracker tracker;
    TriggerResult out;

    CHECK_FALSE(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 2, tracker, out));
    CHECK_FALSE(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 7, tracker, out));
    CHECK(tracker.trackedActorCount() == 0);

    CHECK(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 1, tracker, out));

    NegotiationConfig relaxed;
    relaxed.throttle.maxPerTurn = 10;
    relaxed.throttle.minTurnsBetween = 0;
    CHECK(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 7, tracker, out, relaxed));
}

TEST_CASE("No firing evaluator means no result and no throttle record") {
    TestWorld w;
    w.add(makeActor("a"));
    w.add(makeActor("b"));
    TriggerTracker tracker;
    TriggerResult out;

    CHECK_FALSE(checkAllTriggers(w.get("a"), w.get("b"), w.snapshot(5), 0, tracker, out));
    CHECK(tracker.trackedActorCount() == 0);
}

TEST_CASE("An actor never negotiates with itself") {
    const TestWorld w = crowdedWorld();
    TriggerTracker tracker;
    TriggerResult out;
    CHECK_FALSE(checkAllTriggers(w.get("a"), w.get("a"), w.snapshot(5), 0, tracker, out));
}

TEST_CASE("Resetting the tracker clears throttle state") {
    const TestWorld w = crowdedWorld();
    TriggerTracker tracker;
    TriggerResult out;

    REQUIRE(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 0, tracker, out));
    CHECK_FALSE(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(6), 0, tracker, out));

    resetTriggerTracking(tracker);
    CHECK(tracker.trackedActorCount() == 0);
    CHECK(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(6), 0, tracker, out));
}

TEST_CASE("Separate trackers do not share state") {
    const TestWorld w = crowdedWorld();
    TriggerTracker first;
    TriggerTracker second;
    TriggerResult out;

    REQUIRE(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 0, first, out));
    CHECK(checkAllTriggers(w.get("a"), w.get("c"), w.snapshot(5), 0, second, out));
}
