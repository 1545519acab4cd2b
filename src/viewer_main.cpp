#include <SFML/Graphics.hpp>
#include <iostream>
#include <string>

#include "diplomatic_inbox.h"
#include "diplomatic_messages.h"
#include "negotiation_config.h"
#include "negotiation_runner.h"
#include "scenario.h"

int main(int argc, char** argv) {
    const std::string scenarioPath = (argc > 1) ? argv[1] : "data/scenario_example.toml";
    const std::string configPath = (argc > 2) ? argv[2] : "data/negotiation_config.toml";

    NegotiationContext ctx(1);
    std::string error;
    if (!ctx.loadConfig(configPath, &error)) {
        std::cerr << "[Config] " << error << " (using defaults)" << std::endl;
    }

    Scenario scenario;
    if (!loadScenario(scenarioPath, scenario, &error)) {
        std::cerr << "[Scenario] " << error << std::endl;
        return 1;
    }

    DiplomaticMessages messages;
    NegotiationDirector director(ctx, messages);
    DiplomaticInbox inbox;

    sf::RenderWindow window(sf::VideoMode(1280, 800), "Diplomatic Inbox - " + scenario.name);
    window.setFramerateLimit(30);

    sf::Font font;
    if (!font.loadFromFile("arial.ttf")) {
        std::cerr << "Error: Could not load font file." << std::endl;
        return -1;
    }
    sf::Text statusText;
    statusText.setFont(font);
    statusText.setCharacterSize(20);
    statusText.setFillColor(sf::Color::White);
    statusText.setPosition(10, 10);

    int currentTurn = scenario.startTurn;
    inbox.addEntry("Scenario '" + scenario.name + "' loaded. Space: next turn, 5: toggle inbox, Esc: quit.");

    while (window.isOpen()) {
        sf::Event event;
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                window.close();
            }
            else if (event.type == sf::Event::KeyPressed) {
                if (event.key.code == sf::Keyboard::Escape) {
                    window.close();
                }
                else if (event.key.code == sf::Keyboard::Num5) {
                    inbox.toggleWindow();
                }
                else if (event.key.code == sf::Keyboard::Space) {
                    const WorldSnapshot world = scenario.snapshot(currentTurn);
                    TurnReport report = director.runTurn(world);
                    // New proposals sit at the end of the live list until responses are resolved.
                    const size_t firstNew = director.sessions().size() - static_cast<size_t>(report.proposed);
                    for (size_t i = firstNew; i < director.sessions().size(); ++i) {
                        inbox.addSession(director.sessions()[i]);
                    }
                    director.resolveAiResponses(world, report);
                    for (const auto& line : report.events) {
                        inbox.addEntry(line);
                    }
                    ++currentTurn;
                }
            }
        }

        statusText.setString("Turn " + std::to_string(currentTurn) + "   live sessions: " +
                             std::to_string(director.sessions().size()) + "   state hash: " +
                             std::to_string(director.computeStateHash()));

        window.clear(sf::Color(20, 30, 45));
        window.draw(statusText);
        inbox.render(window, font);
        window.display();
    }

    return 0;
}
