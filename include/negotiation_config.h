#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

#include "actor.h"
#include "negotiation.h"

// Everything that differs between personalities, in one place.
struct PersonalityProfile {
    // Trigger tuning.
    double threatThreshold = 50.0;          // maxThreat needed before asking for help
    double reconciliationBonus = 0.0;
    double reconciliationVetoBelow = -100.0; // relationship must exceed this to reconcile
    double compensationBonus = 0.0;
    int compensationSeverityFloor = 3;
    double allianceOfferBonus = 0.0;
    double warningBonus = 0.0;

    // Evaluation weights (fractions, scaled by modifiers.personalityMultiplier).
    double allianceWeight = 0.0;
    double treatyWeight = 0.0;
    double warlikeWeight = 0.0;

    // Response behaviour.
    double counterOfferChance = 0.6;
};

struct NegotiationConfig {
    struct Throttle {
        int minTurnsBetween = 5;
        int maxPerTurn = 2;
    } throttle{};

    ExpirationWindows expiration{};

    struct Modifiers {
        double relationshipMultiplier = 0.5;
        double trustBase = 50.0;
        double trustMultiplier = 0.6;
        double favorMultiplier = 0.5;
        double personalityMultiplier = 100.0;
        double strategicThreatHigh = 15.0;
        double strategicThreatMid = 8.0;
        double strategicAllianceHigh = 50.0;
        double strategicAllianceMid = 25.0;
        double strategicJoinWarThreat = 10.0;
        double strategicJoinWar = 30.0;
        double grievanceMinor = 5.0;
        double grievanceModerate = 10.0;
        double grievanceMajor = 20.0;
        double grievanceSevere = 30.0;
    } modifiers{};

    struct Triggers {
        // Threat / help request.
        double threatHostilityFloor = -20.0;
        double threatPowerRatio = 0.5;
        double threatCriticalAbove = 80.0;
        double threatHighAbove = 65.0;
        double threatPriorityBonus = 20.0;

        // Resource surplus / trade.
        double surplusProduction = 150.0;
        double surplusIntel = 80.0;
        double surplusUranium = 100.0;
        double deficitProduction = 100.0;
        double deficitIntel = 50.0;
        double deficitUranium = 50.0;
        double tradeBasePriority = 30.0;
        double tradeRelationshipWeight = 0.3;

        // Reconciliation.
        double reconciliationRelationshipMin = -60.0;   // exclusive
        double reconciliationRelationshipMax = 0.0;     // exclusive
        double reconciliationTrustMin = 30.0;
        double reconciliationBasePriority = 40.0;
        double reconciliationTrustWeight = 0.3;

        // Compensation demand.
        int compensationWindowTurns = 10;
        int compensationHighAbove = 10;
        double compensationBasePriority = 50.0;
        double compensationSeverityWeight = 5.0;

        // Mutual benefit / alliance offer.
        double allianceRelationshipMin = 25.0;
        double allianceTrustMin = 50.0;
        double sharedThreatMin = 30.0;
        double allianceBasePriority = 60.0;
        double allianceRelationshipWeight = 0.5;

        // Warning / ultimatum.
        int warningWindowTurns = 3;
        double warningRelationshipFloor = -70.0;
        double warningBasePriority = 70.0;

        // Severity weights used when summing grievances for triggers.
        int severityMinor = 1;
        int severityModerate = 2;
        int severityMajor = 3;
        int severitySevere = 5;
    } triggers{};

    struct Compose {
        int helpAllianceDuration = 20;
        double helpGoldShare = 0.3;
        double helpIntelShare = 0.2;
        double helpIntelMinimum = 10.0;
        int helpFavors = 2;

        int allianceDuration = 30;
        double allianceTreatyRelationship = 40.0;
        int allianceTreatyDuration = 50;

        double goodwillGoldShare = 0.15;
        int reconciliationTreatyDuration = 20;

        int defaultCompensationSeverity = 3;
        double compensationGoldPerSeverity = 30.0;
        int compensationTreatyDuration = 15;

        int warningPromiseDuration = 20;
        double warningGold = 50.0;
        int warningNoRetaliationDuration = 10;

        double tradeOfferGold = 80.0;
        double tradeOfferIntel = 40.0;
        double tradeOfferUranium = 50.0;
        double tradeRequestGold = 60.0;
        double tradeRequestIntel = 30.0;
        double tradeRequestProductionFloor = 0.0;   // counterpart must hold more than this
        double tradeRequestIntelFloor = 0.0;
        int tradeFallbackFavors = 1;
    } compose{};

    struct Evaluation {
        double autoAccept = 300.0;
        double veryLikely = 200.0;
        double likely = 100.0;
        double possible = 0.0;
        double counterOffer = -100.0;
        double unlikely = -200.0;
        double acceptThreshold = 0.0;   // caller policy: accept at or above
        double randomSpread = 20.0;     // total width of the random factor
        double counterHostilityFloor = -50.0;
        double counterTrustFloor = 20.0;
        double counterValueBuffer = 50.0;
    } evaluation{};

    std::array<PersonalityProfile, kPersonalityCount> personalities = defaultPersonalityProfiles();

    const PersonalityProfile& profileFor(Personality personality) const;

    static std::array<PersonalityProfile, kPersonalityCount> defaultPersonalityProfiles();
};

// Built-in defaults shared by callers that do not load a file.
const NegotiationConfig& defaultNegotiationConfig();

// Overlays a TOML file onto the defaults. On failure `config` holds defaults.
bool loadNegotiationConfig(const std::string& path, NegotiationConfig& config, std::string* errorMessage = nullptr);

// Seed, loaded config and deterministic RNG plumbing for one run.
struct NegotiationContext {
    std::uint64_t seed = 0;
    NegotiationConfig config;
    std::string configPath;
    std::string configHash = "defaults";

    explicit NegotiationContext(std::uint64_t seed);

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    std::mt19937_64 makeRng(std::uint64_t salt) const;
    static std::uint64_t mix64(std::uint64_t x);
    static std::uint64_t hashString(const std::string& value);
};
