// tests/test_negotiation_triggers.cpp
//
// Coverage for the six independent condition evaluators.

#include <doctest/doctest.h>

#include "negotiation_triggers.h"
#include "test_world.h"

using testworld::TestWorld;
using testworld::makeActor;
using testworld::makeGrievance;

namespace {

// Actor "a" threatened by "x" at `threat`, helper candidate "c" as strong as "x".
TestWorld threatWorld(Personality personality, double threat) {
    TestWorld w;
    Actor a = makeActor("a", personality);
    a.threats["x"] = threat;
    w.add(a);

    Actor c = makeActor("c");
    c.military.missiles = 10;
    w.add(c);

    Actor x = makeActor("x");
    x.name = "Xandar";
    x.military.missiles = 10;
    w.add(x);

    w.relations.setMutual("a", "c", 10.0, 50.0);
    return w;
}

} // namespace

TEST_CASE("Threat trigger fires critical for a balanced actor under heavy threat") {
    const TestWorld w = threatWorld(Personality::Balanced, 85.0);
    const TriggerResult r = evaluateThreatTrigger(w.get("a"), w.get("c"), w.snapshot(5));

    CHECK(r.shouldTrigger);
    CHECK(r.purpose == NegotiationPurpose::RequestHelp);
    CHECK(r.urgency == NegotiationUrgency::Critical);
    CHECK(r.priority == 100);
    CHECK(r.context.threatActorId == "x");
    CHECK(r.context.threatLevel == doctest::Approx(85.0));
    CHECK(r.context.reason.find("Xandar") != std::string::npos);
}

TEST_CASE("Threat trigger respects the personality threshold") {
    const TestWorld isolationist = threatWorld(Personality::Isolationist, 85.0);
    const TriggerResult r = evaluateThreatTrigger(isolationist.get("a"), isolationist.get("c"), isolationist.snapshot(5));
    CHECK_FALSE(r.shouldTrigger);
    CHECK(r.priority == 0);

    const TestWorld defensive = threatWorld(Personality::Defensive, 42.0);
    const TriggerResult d = evaluateThreatTrigger(defensive.get("a"), defensive.get("c"), defensive.snapshot(5));
    CHECK(d.shouldTrigger);
    CHECK(d.urgency == NegotiationUrgency::Medium);
    CHECK(d.priority == 62);

    const TestWorld balanced = threatWorld(Personality::Balanced, 42.0);
    CHECK_FALSE(evaluateThreatTrigger(balanced.get("a"), balanced.get("c"), balanced.snapshot(5)).shouldTrigger);
}

TEST_CASE("Threat trigger escalates urgency with the threat level") {
    const TestWorld high = threatWorld(Personality::Balanced, 70.0);
    const TriggerResult h = evaluateThreatTrigger(high.get("a"), high.get("c"), high.snapshot(5));
    CHECK(h.urgency == NegotiationUrgency::High);
    CHECK(h.priority == 90);

    const TestWorld medium = threatWorld(Personality::Balanced, 65.0);
    CHECK(evaluateThreatTrigger(medium.get("a"), medium.get("c"), medium.snapshot(5)).urgency ==
          NegotiationUrgency::Medium);
}

TEST_CASE("Threat trigger vetoes unsuitable helpers") {
    TestWorld w = threatWorld(Personality::Balanced, 85.0);

    SUBCASE("the threat itself") {
        CHECK_FALSE(evaluateThreatTrigger(w.get("a"), w.get("x"), w.snapshot(5)).shouldTrigger);
    }
    SUBCASE("a hostile counterpart") {
        w.relations.setRelationship("a", "c", -25.0);
        CHECK_FALSE(evaluateThreatTrigger(w.get("a"), w.get("c"), w.snapshot(5)).shouldTrigger);
    }
    SUBCASE("a counterpart weaker than half the threat") {
        w.edit("c").military.missiles = 4;
        CHECK_FALSE(evaluateThreatTrigger(w.get("a"), w.get("c"), w.snapshot(5)).shouldTrigger);
        w.edit("c").military.missiles = 5;
        CHECK(evaluateThreatTrigger(w.get("a"), w.get("c"), w.snapshot(5)).shouldTrigger);
    }
    SUBCASE("a threat that does not resolve to an actor") {
        w.edit("a").threats.clear();
        w.edit("a").threats["ghost"] = 90.0;
        CHECK_FALSE(evaluateThreatTrigger(w.get("a"), w.get("c"), w.snapshot(5)).shouldTrigger);
    }
}

TEST_CASE("Trade trigger picks gold for a production surplus") {
    TestWorld w;
    Actor a = makeActor("a");
    a.production = 300.0;
    w.add(a);
    Actor b = makeActor("b");
    b.production = 50.0;
    w.add(b);
    w.relations.setMutual("a", "b", 10.0, 50.0);

    const TriggerResult r = evaluateResourceSurplusTrigger(w.get("a"), w.get("b"), w.snapshot(3));
    CHECK(r.shouldTrigger);
    CHECK(r.purpose == NegotiationPurpose::TradeOpportunity);
    CHECK(r.urgency == NegotiationUrgency::Low);
    CHECK(r.context.resourceType == ResourceKind::Gold);
    CHECK(r.priority == 33);

    w.relations.setRelationship("a", "b", -1.0);
    CHECK_FALSE(evaluateResourceSurplusTrigger(w.get("a"), w.get("b"), w.snapshot(3)).shouldTrigger);
}

TEST_CASE("Trade trigger falls through to intel and uranium in order") {
    TestWorld w;
    Actor a = makeActor("a");
    a.production = 120.0;
    a.intel = 90.0;
    a.uranium = 150.0;
    w.add(a);
    Actor b = makeActor("b");
    b.production = 50.0;
    b.intel = 40.0;
    b.uranium = 10.0;
    w.add(b);

    CHECK(evaluateResourceSurplusTrigger(w.get("a"), w.get("b"), w.snapshot(3)).context.resourceType ==
          ResourceKind::Intel);

    w.edit("b").intel = 60.0;
    CHECK(evaluateResourceSurplusTrigger(w.get("a"), w.get("b"), w.snapshot(3)).context.resourceType ==
          ResourceKind::Uranium);

    w.edit("b").uranium = 60.0;
    CHECK_FALSE(evaluateResourceSurplusTrigger(w.get("a"), w.get("b"), w.snapshot(3)).shouldTrigger);
}

TEST_CASE("Reconciliation fires for a strained pair with grievances on both sides") {
    TestWorld w;
    Actor a = makeActor("a");
    a.production = 200.0;
    a.grievances.push_back(makeGrievance("ga", "b", GrievanceSeverity::Severe, 10));
    w.add(a);
    Actor b = makeActor("b");
    b.grievances.push_back(makeGrievance("gb", "a", GrievanceSeverity::Severe, 10));
    w.add(b);
    w.relations.setMutual("a", "b", -30.0, 40.0);

    const TriggerResult r = evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12));
    CHECK(r.shouldTrigger);
    CHECK(r.purpose == NegotiationPurpose::Reconciliation);
    CHECK(r.urgency == NegotiationUrgency::Medium);
    // 40 + 0 (balanced) + 40 * 0.3
    CHECK(r.priority == 52);
    CHECK(r.context.grievanceCount == 2);
    CHECK(r.context.grievanceId == "ga");

    SUBCASE("relationship bounds are exclusive") {
        w.relations.setRelationship("a", "b", 0.0);
        CHECK_FALSE(evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12)).shouldTrigger);
        w.relations.setRelationship("a", "b", -60.0);
        CHECK_FALSE(evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12)).shouldTrigger);
    }
    SUBCASE("low trust blocks it") {
        w.relations.setTrust("a", "b", 29.0);
        CHECK_FALSE(evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12)).shouldTrigger);
    }
    SUBCASE("no grievances between the pair") {
        w.edit("a").grievances.clear();
        w.edit("b").grievances.clear();
        CHECK_FALSE(evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12)).shouldTrigger);
    }
    SUBCASE("aggressive actors only reconcile above -40") {
        w.edit("a").personality = Personality::Aggressive;
        w.relations.setRelationship("a", "b", -45.0);
        CHECK_FALSE(evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12)).shouldTrigger);
        w.relations.setRelationship("a", "b", -30.0);
        const TriggerResult agg = evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12));
        CHECK(agg.shouldTrigger);
        CHECK(agg.priority == 52);
    }
    SUBCASE("only defensive actors get a reconciliation bonus") {
        w.edit("a").personality = Personality::Defensive;
        CHECK(evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12)).priority == 72);
        for (Personality p : {Personality::Trickster, Personality::Isolationist, Personality::Chaotic}) {
            w.edit("a").personality = p;
            CHECK(evaluateReconciliationTrigger(w.get("a"), w.get("b"), w.snapshot(12)).priority == 52);
        }
    }
}

TEST_CASE("Compensation demand sums recent grievances") {
    TestWorld w;
    Actor a = makeActor("a");
    a.grievances.push_back(makeGrievance("g1", "b", GrievanceSeverity::Major, 8));
    w.add(a);
    w.add(makeActor("b"));

    const TriggerResult r = evaluateCompensationTrigger(w.get("a"), w.get("b"), w.snapshot(10));
    CHECK(r.shouldTrigger);
    CHECK(r.purpose == NegotiationPurpose::DemandCompensation);
    CHECK(r.urgency == NegotiationUrgency::Medium);
    CHECK(r.priority == 65);
    CHECK(r.context.totalSeverity == 3);
    CHECK(r.context.grievanceId == "g1");

    SUBCASE("below the severity floor") {
        w.edit("a").grievances.front().severity = GrievanceSeverity::Moderate;
        CHECK_FALSE(evaluateCompensationTrigger(w.get("a"), w.get("b"), w.snapshot(10)).shouldTrigger);
    }
    SUBCASE("outside the ten turn window") {
        CHECK_FALSE(evaluateCompensationTrigger(w.get("a"), w.get("b"), w.snapshot(19)).shouldTrigger);
        CHECK(evaluateCompensationTrigger(w.get("a"), w.get("b"), w.snapshot(18)).shouldTrigger);
    }
    SUBCASE("defensive actors need more") {
        w.edit("a").personality = Personality::Defensive;
        CHECK_FALSE(evaluateCompensationTrigger(w.get("a"), w.get("b"), w.snapshot(10)).shouldTrigger);
        w.edit("a").grievances.push_back(makeGrievance("g2", "b", GrievanceSeverity::Moderate, 9));
        CHECK(evaluateCompensationTrigger(w.get("a"), w.get("b"), w.snapshot(10)).shouldTrigger);
    }
    SUBCASE("aggressive bonus and high urgency above ten") {
        w.edit("a").personality = Personality::Aggressive;
        w.edit("a").grievances.push_back(makeGrievance("g2", "b", GrievanceSeverity::Severe, 9));
        w.edit("a").grievances.push_back(makeGrievance("g3", "b", GrievanceSeverity::Severe, 9));
        const TriggerResult agg = evaluateCompensationTrigger(w.get("a"), w.get("b"), w.snapshot(10));
        CHECK(agg.shouldTrigger);
        CHECK(agg.context.totalSeverity == 13);
        CHECK(agg.urgency == NegotiationUrgency::High);
        CHECK(agg.priority == 100);
        CHECK(agg.context.grievanceId == "g2");
    }
}

TEST_CASE("Mutual benefit needs a shared threat and a warm relationship") {
    TestWorld w;
    Actor a = makeActor("a");
    a.threats["x"] = 40.0;
    w.add(a);
    Actor b = makeActor("b");
    b.threats["x"] = 35.0;
    w.add(b);
    w.add(makeActor("x"));
    w.relations.setMutual("a", "b", 30.0, 60.0);

    const TriggerResult r = evaluateMutualBenefitTrigger(w.get("a"), w.get("b"), w.snapshot(4));
    CHECK(r.shouldTrigger);
    CHECK(r.purpose == NegotiationPurpose::OfferAlliance);
    CHECK(r.priority == 75);
    REQUIRE(r.context.commonThreats.size() == 1);
    CHECK(r.context.commonThreats.front() == "x");

    SUBCASE("defensive actors add a bonus") {
        w.edit("a").personality = Personality::Defensive;
        CHECK(evaluateMutualBenefitTrigger(w.get("a"), w.get("b"), w.snapshot(4)).priority == 100);
    }
    SUBCASE("already allied") {
        w.edit("a").alliances.push_back("b");
        CHECK_FALSE(evaluateMutualBenefitTrigger(w.get("a"), w.get("b"), w.snapshot(4)).shouldTrigger);
    }
    SUBCASE("threat not shared above thirty") {
        w.edit("b").threats["x"] = 30.0;
        CHECK_FALSE(evaluateMutualBenefitTrigger(w.get("a"), w.get("b"), w.snapshot(4)).shouldTrigger);
    }
    SUBCASE("trust too low") {
        w.relations.setTrust("a", "b", 49.0);
        CHECK_FALSE(evaluateMutualBenefitTrigger(w.get("a"), w.get("b"), w.snapshot(4)).shouldTrigger);
    }
}

TEST_CASE("Warning fires on recent serious grievances") {
    TestWorld w;
    Actor a = makeActor("a");
    a.grievances.push_back(makeGrievance("g1", "b", GrievanceSeverity::Severe, 8));
    w.add(a);
    w.add(makeActor("b"));
    w.relations.setMutual("a", "b", -20.0, 40.0);

    const TriggerResult r = evaluateWarningTrigger(w.get("a"), w.get("b"), w.snapshot(10));
    CHECK(r.shouldTrigger);
    CHECK(r.purpose == NegotiationPurpose::Warning);
    CHECK(r.urgency == NegotiationUrgency::High);
    CHECK(r.priority == 70);
    CHECK(r.context.grievanceId == "g1");

    CHECK_FALSE(evaluateWarningTrigger(w.get("a"), w.get("b"), w.snapshot(12)).shouldTrigger);

    w.edit("a").personality = Personality::Aggressive;
    CHECK(evaluateWarningTrigger(w.get("a"), w.get("b"), w.snapshot(10)).priority == 90);

    w.relations.setRelationship("a", "b", -80.0);
    CHECK_FALSE(evaluateWarningTrigger(w.get("a"), w.get("b"), w.snapshot(10)).shouldTrigger);
}

TEST_CASE("Warning fires on agenda violations and names the agenda") {
    TestWorld w;
    w.add(makeActor("a"));
    w.add(makeActor("b"));
    w.violations.push_back({"a", "b", "no-nukes", "Nuclear Restraint"});

    const TriggerResult r = evaluateWarningTrigger(w.get("a"), w.get("b"), w.snapshot(10));
    CHECK(r.shouldTrigger);
    CHECK(r.context.agendaId == "no-nukes");
    CHECK(r.context.reason.find("Nuclear Restraint") != std::string::npos);

    // Observed by someone else: no warning from "b" to "a".
    CHECK_FALSE(evaluateWarningTrigger(w.get("b"), w.get("a"), w.snapshot(10)).shouldTrigger);
}

TEST_CASE("Trigger severity weights come from the config") {
    CHECK(triggerSeverityWeight(GrievanceSeverity::Minor) == 1);
    CHECK(triggerSeverityWeight(GrievanceSeverity::Moderate) == 2);
    CHECK(triggerSeverityWeight(GrievanceSeverity::Major) == 3);
    CHECK(triggerSeverityWeight(GrievanceSeverity::Severe) == 5);

    NegotiationConfig cfg;
    cfg.triggers.severityMajor = 7;
    CHECK(triggerSeverityWeight(GrievanceSeverity::Major, cfg) == 7);
}
