#include "diplomatic_inbox.h"

#include "negotiation.h"

namespace {

constexpr size_t kMaxEntries = 24;

} // namespace

DiplomaticInbox::DiplomaticInbox() : m_showWindow(true) {
    m_background.setFillColor(sf::Color(0, 0, 0, 175)); // Semi-transparent black
    m_background.setSize(sf::Vector2f(760, 680));
    m_background.setPosition(10, 50);

    m_inboxText.setCharacterSize(14);
    m_inboxText.setFillColor(sf::Color::White);
}

void DiplomaticInbox::addEntry(const std::string& entry) {
    m_entries.push_back(entry);
    if (m_entries.size() > kMaxEntries) {
        m_entries.erase(m_entries.begin());
    }
}

void DiplomaticInbox::addSession(const NegotiationSession& session) {
    std::string entry = "#" + std::to_string(session.getId()) + " " + session.getProposerId() + " -> " +
                        session.getCounterpartId() + " [" + purposeName(session.getPurpose()) + ", " +
                        statusName(session.getStatus()) + "]";
    for (const NegotiableItem& item : session.getOfferItems()) {
        entry += "\n   + " + item.description;
    }
    for (const NegotiableItem& item : session.getRequestItems()) {
        entry += "\n   - " + item.description;
    }
    addEntry(entry);
}

void DiplomaticInbox::toggleWindow() {
    m_showWindow = !m_showWindow;
}

void DiplomaticInbox::setWindowVisible(bool visible) {
    m_showWindow = visible;
}

void DiplomaticInbox::clearEntries() {
    m_entries.clear();
}

void DiplomaticInbox::render(sf::RenderWindow& window, const sf::Font& font) {
    if (!m_showWindow) return;

    m_inboxText.setFont(font);
    window.draw(m_background);

    // Newest last; drop the oldest lines that would overflow the panel.
    std::vector<std::string> lines;
    for (const auto& entry : m_entries) {
        size_t start = 0;
        while (start <= entry.size()) {
            const size_t nl = entry.find('\n', start);
            lines.push_back(entry.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
            if (nl == std::string::npos) break;
            start = nl + 1;
        }
    }
    const size_t maxLines = static_cast<size_t>(m_background.getSize().y / 18.0f);
    const size_t first = (lines.size() > maxLines) ? lines.size() - maxLines : 0;

    std::string inboxString;
    for (size_t i = first; i < lines.size(); ++i) {
        inboxString += lines[i] + "\n";
    }

    m_inboxText.setString(inboxString);
    m_inboxText.setPosition(20, 60);
    window.draw(m_inboxText);
}

bool DiplomaticInbox::isWindowVisible() const {
    return m_showWindow;
}
