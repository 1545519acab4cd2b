#include "diplomatic_messages.h"

#include <sstream>

#include <toml++/toml.hpp>

namespace {

const std::string kFallbackTemplate = "I wish to negotiate with you.";

std::vector<std::string> readStringArray(const toml::array& arr) {
    std::vector<std::string> out;
    for (const auto& node : arr) {
        if (const auto v = node.value<std::string>()) {
            if (!v->empty()) out.push_back(*v);
        }
    }
    return out;
}

} // namespace

DiplomaticMessages::DiplomaticMessages() {
    auto set = [this](NegotiationPurpose p, std::vector<std::string> lines) {
        m_templates[static_cast<size_t>(p)] = std::move(lines);
    };
    set(NegotiationPurpose::RequestHelp, {
        "We face a dire threat and request your assistance in our defense.",
        "Our intelligence indicates a serious threat to our security. We need your help.",
        "A powerful enemy threatens our sovereignty. Will you stand with us?",
    });
    set(NegotiationPurpose::OfferAlliance, {
        "We believe our nations share common interests. Let us formalize our cooperation.",
        "Together we are stronger. I propose an alliance between our peoples.",
        "Our shared values and mutual threats make us natural allies.",
    });
    set(NegotiationPurpose::Reconciliation, {
        "Recent events have strained our relationship. Perhaps we can find common ground.",
        "Our past conflicts benefit neither of us. Let us work towards peace.",
        "I wish to repair the damage between our nations and move forward.",
    });
    set(NegotiationPurpose::DemandCompensation, {
        "Your recent actions have caused significant harm to our nation. Compensation is required.",
        "We demand reparations for the damages you have inflicted upon us.",
        "You must make amends for your transgressions against our people.",
    });
    set(NegotiationPurpose::Warning, {
        "Your recent behavior is unacceptable. Change course or face the consequences.",
        "This is a warning: continue your current actions and we will respond with force.",
        "Your provocations will not be tolerated much longer. Consider this your final warning.",
    });
    set(NegotiationPurpose::TradeOpportunity, {
        "We have resources in surplus and thought you might be interested in trade.",
        "A mutually beneficial trade arrangement could serve both our interests.",
        "I have a proposal for economic cooperation that would benefit both our nations.",
    });
    set(NegotiationPurpose::MutualDefense, {
        "The world grows more dangerous. Let us pledge to defend each other.",
        "A mutual defense pact would ensure our security in these uncertain times.",
        "Together we can deter aggression. I propose a defensive alliance.",
    });
    set(NegotiationPurpose::PeaceOffer, {
        "This war serves neither of us. Let us negotiate a peaceful resolution.",
        "Too much blood has been spilled. I offer you terms for peace.",
        "The time has come to end this conflict. Here are my peace terms.",
    });
    set(NegotiationPurpose::JointVenture, {
        "I have identified an opportunity for our nations to cooperate.",
        "By pooling our resources, we can achieve what neither could alone.",
        "I propose a joint initiative that would benefit both our peoples.",
    });

    m_feedback["excellent"] = {
        "This is an excellent proposal. I accept!",
        "You are most generous. We have a deal.",
        "I appreciate this offer and gladly accept.",
    };
    m_feedback["fair"] = {
        "This seems fair. I accept your terms.",
        "I find this acceptable.",
        "We have ourselves a deal.",
    };
    m_feedback["close"] = {
        "This could work, but I'd like a bit more.",
        "We're close. Add a little more and we have a deal.",
        "Almost there. What else can you offer?",
    };
    m_feedback["needs-changes"] = {
        "This doesn't quite work for me. Let me suggest some changes.",
        "I'm afraid I need more than this.",
        "This is unbalanced. Let me propose adjustments.",
    };
    m_feedback["distrust"] = {"I don't trust you enough for this deal."};
    m_feedback["hostile"] = {"Our relationship is too poor for such an arrangement."};
    m_feedback["grievances"] = {"We have too many unresolved grievances."};
    m_feedback["unacceptable"] = {"This is completely unacceptable."};
}

bool DiplomaticMessages::loadFromFile(const std::string& path, std::string* errorMessage) {
    try {
        toml::table root = toml::parse_file(path);

        if (const toml::table* templates = root["templates"].as_table()) {
            for (int i = 0; i < kNegotiationPurposeCount; ++i) {
                const NegotiationPurpose p = static_cast<NegotiationPurpose>(i);
                if (const toml::array* arr = (*templates)[purposeName(p)].as_array()) {
                    std::vector<std::string> lines = readStringArray(*arr);
                    if (!lines.empty()) {
                        m_templates[static_cast<size_t>(i)] = std::move(lines);
                    }
                }
            }
        }
        if (const toml::table* feedback = root["feedback"].as_table()) {
            for (const auto& [key, node] : *feedback) {
                if (const toml::array* arr = node.as_array()) {
                    std::vector<std::string> lines = readStringArray(*arr);
                    if (!lines.empty()) {
                        m_feedback[std::string(key.str())] = std::move(lines);
                    }
                }
            }
        }
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse messages '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load messages '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }
    return false;
}

const std::string& DiplomaticMessages::pick(const std::vector<std::string>& options, std::mt19937_64& rng) {
    if (options.empty()) {
        return kFallbackTemplate;
    }
    std::uniform_int_distribution<size_t> dist(0, options.size() - 1);
    return options[dist(rng)];
}

const std::vector<std::string>& DiplomaticMessages::templatesFor(NegotiationPurpose purpose) const {
    return m_templates[static_cast<size_t>(purpose)];
}

std::string DiplomaticMessages::composeMessage(NegotiationPurpose purpose,
                                               const std::string& reason,
                                               std::mt19937_64& rng) const {
    std::string message = pick(templatesFor(purpose), rng);
    if (!reason.empty()) {
        message += "\n\n" + reason;
    }
    return message;
}

std::string DiplomaticMessages::feedbackLine(const std::string& feedbackKey, std::mt19937_64& rng) const {
    const auto it = m_feedback.find(feedbackKey);
    if (it == m_feedback.end()) {
        return pick(m_feedback.at("unacceptable"), rng);
    }
    return pick(it->second, rng);
}
