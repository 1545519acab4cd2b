#pragma once

#include <SFML/Graphics.hpp>
#include <string>
#include <vector>

class NegotiationSession;

// Scrolling panel of recent proposals and responses.
class DiplomaticInbox {
public:
    DiplomaticInbox();

    void addEntry(const std::string& entry);
    void addSession(const NegotiationSession& session);
    void toggleWindow();
    void setWindowVisible(bool visible);
    void clearEntries();
    const std::vector<std::string>& getEntries() const { return m_entries; }
    void render(sf::RenderWindow& window, const sf::Font& font);
    bool isWindowVisible() const;

private:
    std::vector<std::string> m_entries;
    bool m_showWindow;
    sf::RectangleShape m_background;
    sf::Text m_inboxText;
};
