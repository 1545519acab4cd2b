#pragma once

#include <array>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "negotiation.h"

// Flavor text for proposals and responses. Selection draws from an injected RNG.
class DiplomaticMessages {
public:
    DiplomaticMessages();

    // Replaces the templates named in the file; others keep their defaults.
    bool loadFromFile(const std::string& path, std::string* errorMessage = nullptr);

    // template + blank line + reason (reason omitted when empty).
    std::string composeMessage(NegotiationPurpose purpose, const std::string& reason, std::mt19937_64& rng) const;
    std::string feedbackLine(const std::string& feedbackKey, std::mt19937_64& rng) const;

    const std::vector<std::string>& templatesFor(NegotiationPurpose purpose) const;

private:
    static const std::string& pick(const std::vector<std::string>& options, std::mt19937_64& rng);

    std::array<std::vector<std::string>, kNegotiationPurposeCount> m_templates;
    std::map<std::string, std::vector<std::string>> m_feedback;
};
