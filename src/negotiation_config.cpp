#include "negotiation_config.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void assignFromNode(const toml::node_view<const toml::node>& view, T& target) {
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    }
}

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    assignFromNode(root[section][key], target);
}

void readProfile(const toml::table& t, PersonalityProfile& profile) {
    assignFromNode(t["threatThreshold"], profile.threatThreshold);
    assignFromNode(t["reconciliationBonus"], profile.reconciliationBonus);
    assignFromNode(t["reconciliationVetoBelow"], profile.reconciliationVetoBelow);
    assignFromNode(t["compensationBonus"], profile.compensationBonus);
    assignFromNode(t["compensationSeverityFloor"], profile.compensationSeverityFloor);
    assignFromNode(t["allianceOfferBonus"], profile.allianceOfferBonus);
    assignFromNode(t["warningBonus"], profile.warningBonus);
    assignFromNode(t["allianceWeight"], profile.allianceWeight);
    assignFromNode(t["treatyWeight"], profile.treatyWeight);
    assignFromNode(t["warlikeWeight"], profile.warlikeWeight);
    assignFromNode(t["counterOfferChance"], profile.counterOfferChance);
}

PersonalityProfile makeProfile(double threatThreshold,
                               double reconciliationBonus,
                               double compensationBonus,
                               int compensationSeverityFloor,
                               double allianceWeight,
                               double treatyWeight,
                               double warlikeWeight,
                               double counterOfferChance) {
    PersonalityProfile p;
    p.threatThreshold = threatThreshold;
    p.reconciliationBonus = reconciliationBonus;
    p.compensationBonus = compensationBonus;
    p.compensationSeverityFloor = compensationSeverityFloor;
    p.allianceWeight = allianceWeight;
    p.treatyWeight = treatyWeight;
    p.warlikeWeight = warlikeWeight;
    p.counterOfferChance = counterOfferChance;
    return p;
}

} // namespace

std::array<PersonalityProfile, kPersonalityCount> NegotiationConfig::defaultPersonalityProfiles() {
    std::array<PersonalityProfile, kPersonalityCount> table{};

    table[static_cast<int>(Personality::Balanced)] =
        makeProfile(50.0, 0.0, 0.0, 3, 0.1, 0.1, 0.0, 0.6);

    PersonalityProfile aggressive = makeProfile(70.0, 0.0, 30.0, 3, -0.3, -0.2, 0.3, 0.6);
    aggressive.reconciliationVetoBelow = -40.0;
    aggressive.warningBonus = 20.0;
    table[static_cast<int>(Personality::Aggressive)] = aggressive;

    PersonalityProfile defensive = makeProfile(40.0, 20.0, 0.0, 5, 0.4, 0.3, -0.4, 0.8);
    defensive.allianceOfferBonus = 25.0;
    table[static_cast<int>(Personality::Defensive)] = defensive;

    table[static_cast<int>(Personality::Isolationist)] =
        makeProfile(90.0, 0.0, 0.0, 8, -0.5, -0.3, -0.2, 0.4);
    table[static_cast<int>(Personality::Trickster)] =
        makeProfile(45.0, 0.0, 0.0, 3, 0.0, -0.1, 0.2, 0.6);
    table[static_cast<int>(Personality::Chaotic)] =
        makeProfile(60.0, 0.0, 0.0, 3, 0.0, 0.0, 0.0, 0.6);
    return table;
}

const PersonalityProfile& NegotiationConfig::profileFor(Personality personality) const {
    const int idx = std::clamp(static_cast<int>(personality), 0, kPersonalityCount - 1);
    return personalities[static_cast<size_t>(idx)];
}

const NegotiationConfig& defaultNegotiationConfig() {
    static const NegotiationConfig config{};
    return config;
}

bool loadNegotiationConfig(const std::string& path, NegotiationConfig& config, std::string* errorMessage) {
    config = NegotiationConfig{};
    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);
        NegotiationConfig loaded{};

        readTomlValue(root, "throttle", "minTurnsBetween", loaded.throttle.minTurnsBetween);
        readTomlValue(root, "throttle", "maxPerTurn", loaded.throttle.maxPerTurn);

        readTomlValue(root, "expiration", "critical", loaded.expiration.critical);
        readTomlValue(root, "expiration", "high", loaded.expiration.high);
        readTomlValue(root, "expiration", "medium", loaded.expiration.medium);
        readTomlValue(root, "expiration", "low", loaded.expiration.low);

        readTomlValue(root, "modifiers", "relationshipMultiplier", loaded.modifiers.relationshipMultiplier);
        readTomlValue(root, "modifiers", "trustBase", loaded.modifiers.trustBase);
        readTomlValue(root, "modifiers", "trustMultiplier", loaded.modifiers.trustMultiplier);
        readTomlValue(root, "modifiers", "favorMultiplier", loaded.modifiers.favorMultiplier);
        readTomlValue(root, "modifiers", "personalityMultiplier", loaded.modifiers.personalityMultiplier);
        readTomlValue(root, "modifiers", "strategicThreatHigh", loaded.modifiers.strategicThreatHigh);
        readTomlValue(root, "modifiers", "strategicThreatMid", loaded.modifiers.strategicThreatMid);
        readTomlValue(root, "modifiers", "strategicAllianceHigh", loaded.modifiers.strategicAllianceHigh);
        readTomlValue(root, "modifiers", "strategicAllianceMid", loaded.modifiers.strategicAllianceMid);
        readTomlValue(root, "modifiers", "strategicJoinWarThreat", loaded.modifiers.strategicJoinWarThreat);
        readTomlValue(root, "modifiers", "strategicJoinWar", loaded.modifiers.strategicJoinWar);
        readTomlValue(root, "modifiers", "grievanceMinor", loaded.modifiers.grievanceMinor);
        readTomlValue(root, "modifiers", "grievanceModerate", loaded.modifiers.grievanceModerate);
        readTomlValue(root, "modifiers", "grievanceMajor", loaded.modifiers.grievanceMajor);
        readTomlValue(root, "modifiers", "grievanceSevere", loaded.modifiers.grievanceSevere);

        auto& tr = loaded.triggers;
        readTomlValue(root, "triggers", "threatHostilityFloor", tr.threatHostilityFloor);
        readTomlValue(root, "triggers", "threatPowerRatio", tr.threatPowerRatio);
        readTomlValue(root, "triggers", "threatCriticalAbove", tr.threatCriticalAbove);
        readTomlValue(root, "triggers", "threatHighAbove", tr.threatHighAbove);
        readTomlValue(root, "triggers", "threatPriorityBonus", tr.threatPriorityBonus);
        readTomlValue(root, "triggers", "surplusProduction", tr.surplusProduction);
        readTomlValue(root, "triggers", "surplusIntel", tr.surplusIntel);
        readTomlValue(root, "triggers", "surplusUranium", tr.surplusUranium);
        readTomlValue(root, "triggers", "deficitProduction", tr.deficitProduction);
        readTomlValue(root, "triggers", "deficitIntel", tr.deficitIntel);
        readTomlValue(root, "triggers", "deficitUranium", tr.deficitUranium);
        readTomlValue(root, "triggers", "tradeBasePriority", tr.tradeBasePriority);
        readTomlValue(root, "triggers", "tradeRelationshipWeight", tr.tradeRelationshipWeight);
        readTomlValue(root, "triggers", "reconciliationRelationshipMin", tr.reconciliationRelationshipMin);
        readTomlValue(root, "triggers", "reconciliationRelationshipMax", tr.reconciliationRelationshipMax);
        readTomlValue(root, "triggers", "reconciliationTrustMin", tr.reconciliationTrustMin);
        readTomlValue(root, "triggers", "reconciliationBasePriority", tr.reconciliationBasePriority);
        readTomlValue(root, "triggers", "reconciliationTrustWeight", tr.reconciliationTrustWeight);
        readTomlValue(root, "triggers", "compensationWindowTurns", tr.compensationWindowTurns);
        readTomlValue(root, "triggers", "compensationHighAbove", tr.compensationHighAbove);
        readTomlValue(root, "triggers", "compensationBasePriority", tr.compensationBasePriority);
        readTomlValue(root, "triggers", "compensationSeverityWeight", tr.compensationSeverityWeight);
        readTomlValue(root, "triggers", "allianceRelationshipMin", tr.allianceRelationshipMin);
        readTomlValue(root, "triggers", "allianceTrustMin", tr.allianceTrustMin);
        readTomlValue(root, "triggers", "sharedThreatMin", tr.sharedThreatMin);
        readTomlValue(root, "triggers", "allianceBasePriority", tr.allianceBasePriority);
        readTomlValue(root, "triggers", "allianceRelationshipWeight", tr.allianceRelationshipWeight);
        readTomlValue(root, "triggers", "warningWindowTurns", tr.warningWindowTurns);
        readTomlValue(root, "triggers", "warningRelationshipFloor", tr.warningRelationshipFloor);
        readTomlValue(root, "triggers", "warningBasePriority", tr.warningBasePriority);
        readTomlValue(root, "triggers", "severityMinor", tr.severityMinor);
        readTomlValue(root, "triggers", "severityModerate", tr.severityModerate);
        readTomlValue(root, "triggers", "severityMajor", tr.severityMajor);
        readTomlValue(root, "triggers", "severitySevere", tr.severitySevere);

        auto& cp = loaded.compose;
        readTomlValue(root, "compose", "helpAllianceDuration", cp.helpAllianceDuration);
        readTomlValue(root, "compose", "helpGoldShare", cp.helpGoldShare);
        readTomlValue(root, "compose", "helpIntelShare", cp.helpIntelShare);
        readTomlValue(root, "compose", "helpIntelMinimum", cp.helpIntelMinimum);
        readTomlValue(root, "compose", "helpFavors", cp.helpFavors);
        readTomlValue(root, "compose", "allianceDuration", cp.allianceDuration);
        readTomlValue(root, "compose", "allianceTreatyRelationship", cp.allianceTreatyRelationship);
        readTomlValue(root, "compose", "allianceTreatyDuration", cp.allianceTreatyDuration);
        readTomlValue(root, "compose", "goodwillGoldShare", cp.goodwillGoldShare);
        readTomlValue(root, "compose", "reconciliationTreatyDuration", cp.reconciliationTreatyDuration);
        readTomlValue(root, "compose", "defaultCompensationSeverity", cp.defaultCompensationSeverity);
        readTomlValue(root, "compose", "compensationGoldPerSeverity", cp.compensationGoldPerSeverity);
        readTomlValue(root, "compose", "compensationTreatyDuration", cp.compensationTreatyDuration);
        readTomlValue(root, "compose", "warningPromiseDuration", cp.warningPromiseDuration);
        readTomlValue(root, "compose", "warningGold", cp.warningGold);
        readTomlValue(root, "compose", "warningNoRetaliationDuration", cp.warningNoRetaliationDuration);
        readTomlValue(root, "compose", "tradeOfferGold", cp.tradeOfferGold);
        readTomlValue(root, "compose", "tradeOfferIntel", cp.tradeOfferIntel);
        readTomlValue(root, "compose", "tradeOfferUranium", cp.tradeOfferUranium);
        readTomlValue(root, "compose", "tradeRequestGold", cp.tradeRequestGold);
        readTomlValue(root, "compose", "tradeRequestIntel", cp.tradeRequestIntel);
        readTomlValue(root, "compose", "tradeRequestProductionFloor", cp.tradeRequestProductionFloor);
        readTomlValue(root, "compose", "tradeRequestIntelFloor", cp.tradeRequestIntelFloor);
        readTomlValue(root, "compose", "tradeFallbackFavors", cp.tradeFallbackFavors);

        auto& ev = loaded.evaluation;
        readTomlValue(root, "evaluation", "autoAccept", ev.autoAccept);
        readTomlValue(root, "evaluation", "veryLikely", ev.veryLikely);
        readTomlValue(root, "evaluation", "likely", ev.likely);
        readTomlValue(root, "evaluation", "possible", ev.possible);
        readTomlValue(root, "evaluation", "counterOffer", ev.counterOffer);
        readTomlValue(root, "evaluation", "unlikely", ev.unlikely);
        readTomlValue(root, "evaluation", "acceptThreshold", ev.acceptThreshold);
        readTomlValue(root, "evaluation", "randomSpread", ev.randomSpread);
        readTomlValue(root, "evaluation", "counterHostilityFloor", ev.counterHostilityFloor);
        readTomlValue(root, "evaluation", "counterTrustFloor", ev.counterTrustFloor);
        readTomlValue(root, "evaluation", "counterValueBuffer", ev.counterValueBuffer);

        if (const toml::table* personalities = root["personality"].as_table()) {
            for (const auto& [key, node] : *personalities) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                Personality personality = Personality::Balanced;
                if (!parsePersonality(std::string(key.str()), personality)) {
                    std::cerr << "[Config] Ignoring unknown personality '" << key.str() << "' in " << path << "\n";
                    continue;
                }
                readProfile(*t, loaded.personalities[static_cast<size_t>(personality)]);
            }
        }

        loaded.throttle.minTurnsBetween = std::max(0, loaded.throttle.minTurnsBetween);
        loaded.throttle.maxPerTurn = std::max(0, loaded.throttle.maxPerTurn);
        loaded.expiration.critical = std::max(0, loaded.expiration.critical);
        loaded.expiration.high = std::max(0, loaded.expiration.high);
        loaded.expiration.medium = std::max(0, loaded.expiration.medium);
        loaded.expiration.low = std::max(0, loaded.expiration.low);
        loaded.evaluation.randomSpread = std::max(0.0, loaded.evaluation.randomSpread);
        for (PersonalityProfile& p : loaded.personalities) {
            p.counterOfferChance = std::clamp(p.counterOfferChance, 0.0, 1.0);
        }

        config = loaded;
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    return false;
}

NegotiationContext::NegotiationContext(std::uint64_t seed)
    : seed(seed) {}

bool NegotiationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    configPath = path;
    configHash = "defaults";
    if (!loadNegotiationConfig(path, config, errorMessage)) {
        return false;
    }
    if (!path.empty()) {
        configHash = hashFileFNV1a(path);
    }
    return true;
}

std::string NegotiationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::mt19937_64 NegotiationContext::makeRng(std::uint64_t salt) const {
    return std::mt19937_64(mix64(seed ^ salt));
}

std::uint64_t NegotiationContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer.
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

std::uint64_t NegotiationContext::hashString(const std::string& value) {
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char ch : value) {
        h ^= ch;
        h *= 1099511628211ull;
    }
    return h;
}
