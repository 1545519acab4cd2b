// tests/test_negotiation_session.cpp
//
// Coverage for the session state machine and DealBuilder.

#include <doctest/doctest.h>

#include "negotiation.h"

namespace {

NegotiationSession makeSession(NegotiationUrgency urgency = NegotiationUrgency::Medium) {
    DealBuilder deal("a", "b");
    deal.addItemToOffer(NegotiableItem::gold(80));
    deal.addItemToRequest(NegotiableItem::intel(30));
    return deal.build(1, NegotiationPurpose::TradeOpportunity, urgency, 10, ExpirationWindows{});
}

} // namespace

TEST_CASE("Expiration windows follow urgency") {
    const ExpirationWindows w;
    CHECK(w.turnsFor(NegotiationUrgency::Critical) == 2);
    CHECK(w.turnsFor(NegotiationUrgency::High) == 3);
    CHECK(w.turnsFor(NegotiationUrgency::Medium) == 5);
    CHECK(w.turnsFor(NegotiationUrgency::Low) == 10);

    CHECK(makeSession(NegotiationUrgency::Critical).getExpiresAtTurn() == 12);
    CHECK(makeSession(NegotiationUrgency::Low).getExpiresAtTurn() == 20);
}

TEST_CASE("A new session is pending with its items") {
    const NegotiationSession s = makeSession();
    CHECK(s.getStatus() == NegotiationStatus::Proposed);
    CHECK(s.isPending());
    CHECK(s.getCreatedTurn() == 10);
    CHECK(s.getExpiresAtTurn() == 15);
    CHECK(s.involves(NegotiableItem::Kind::Gold));
    CHECK(s.involves(NegotiableItem::Kind::Intel));
    CHECK_FALSE(s.involves(NegotiableItem::Kind::Alliance));
    CHECK(s.getCounteredById() == -1);
}

TEST_CASE("Terminal states cannot be left") {
    NegotiationSession s = makeSession();
    CHECK(s.accept());
    CHECK(s.getStatus() == NegotiationStatus::Accepted);
    CHECK_FALSE(s.reject());
    CHECK_FALSE(s.accept());
    CHECK_FALSE(s.expireIfDue(100));
    CHECK(s.getStatus() == NegotiationStatus::Accepted);

    NegotiationSession r = makeSession();
    CHECK(r.reject());
    CHECK(r.getStatus() == NegotiationStatus::Rejected);
    CHECK_FALSE(r.accept());
}

TEST_CASE("Expiry happens strictly after the expiration turn") {
    NegotiationSession s = makeSession();
    CHECK_FALSE(s.expireIfDue(14));
    CHECK_FALSE(s.expireIfDue(15));
    CHECK(s.isPending());
    CHECK(s.expireIfDue(16));
    CHECK(s.getStatus() == NegotiationStatus::Expired);
    CHECK_FALSE(s.expireIfDue(17));
    CHECK_FALSE(s.accept());
}

TEST_CASE("Countering creates a new swapped session and leaves the original items alone") {
    NegotiationSession original = makeSession(NegotiationUrgency::High);
    NegotiationSession reply;

    std::vector<NegotiableItem> replyOffer = {NegotiableItem::intel(20)};
    std::vector<NegotiableItem> replyRequest = {NegotiableItem::gold(80), NegotiableItem::gold(40)};
    REQUIRE(original.counter(2, 11, ExpirationWindows{}, replyOffer, replyRequest, reply));

    CHECK(original.getStatus() == NegotiationStatus::Countered);
    CHECK(original.getCounteredById() == 2);
    CHECK(original.getOfferItems().size() == 1);
    CHECK(original.getRequestItems().size() == 1);

    CHECK(reply.getId() == 2);
    CHECK(reply.getProposerId() == "b");
    CHECK(reply.getCounterpartId() == "a");
    CHECK(reply.getPurpose() == NegotiationPurpose::TradeOpportunity);
    CHECK(reply.getUrgency() == NegotiationUrgency::High);
    CHECK(reply.getCreatedTurn() == 11);
    CHECK(reply.getExpiresAtTurn() == 14);
    CHECK(reply.isPending());
    CHECK(reply.getOfferItems().size() == 1);
    CHECK(reply.getRequestItems().size() == 2);

    NegotiationSession again;
    CHECK_FALSE(original.counter(3, 11, ExpirationWindows{}, {}, {}, again));
    CHECK(again.getId() == -1);
}

TEST_CASE("describeSession lists both sides") {
    DealBuilder deal("a", "b");
    deal.addItemToRequest(NegotiableItem::treaty("non-aggression", 20));
    const NegotiationSession s = deal.build(4, NegotiationPurpose::Reconciliation, NegotiationUrgency::Medium, 1,
                                            ExpirationWindows{});
    const std::string text = describeSession(s);
    CHECK(text.find("#4 a -> b") != std::string::npos);
    CHECK(text.find("reconciliation") != std::string::npos);
    CHECK(text.find("offers: (nothing)") != std::string::npos);
    CHECK(text.find("Non-aggression pact (20 turns)") != std::string::npos);
}

TEST_CASE("Enum names parse back") {
    for (int i = 0; i < kNegotiationPurposeCount; ++i) {
        const NegotiationPurpose p = static_cast<NegotiationPurpose>(i);
        NegotiationPurpose parsed = NegotiationPurpose::RequestHelp;
        CHECK(parsePurpose(purposeName(p), parsed));
        CHECK(parsed == p);
    }
    NegotiationPurpose unused;
    CHECK_FALSE(parsePurpose("bribe", unused));
}
