#include <SFML/Graphics.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "net/EventQueue.hpp"
#include "net/GnsTransport.hpp"
#include "net/NetCommon.hpp"
#include "session/ChatSession.hpp"

static std::string toUtf8(const sf::String& s) {
    const auto u8 = s.toUtf8();
    return std::string(u8.begin(), u8.end());
}

static sf::String fromUtf8(const std::string& s) {
    return sf::String::fromUtf8(s.begin(), s.end());
}

int main(int argc, char** argv) {
    SessionConfig cfg;
    std::vector<std::string> rest;
    if (!parseSessionArgs(argc, argv, cfg, rest)) return 2;

    std::string fontArg;
    for (size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] == "--font" && i + 1 < rest.size()) fontArg = rest[++i];
        else std::cerr << "Ignoring unknown argument: " << rest[i] << "\n";
    }

    NetRuntime rt;
    if (!rt.init()) return 1;

    EventQueue events;
    GnsTransport transport(rt.iface(), events);
    rt.setSink(&transport);

    ChatSession session(transport, events, cfg);

    sf::RenderWindow window(sf::VideoMode({ 1280U, 720U }, 32U), "LanChat");
    window.setFramerateLimit(60);

    sf::Font font;
    auto tryFont = [&](const std::string& p) -> bool {
        if (!p.empty() && font.openFromFile(p)) { std::cout << "[UI] Loaded font: " << p << "\n"; return true; }
        return false;
        };
    const bool hasFont =
        tryFont(fontArg) ||
        tryFont("assets/fonts/DejaVuSans.ttf") ||
        tryFont("../assets/fonts/DejaVuSans.ttf") ||
        tryFont("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf") ||
        tryFont("DejaVuSans.ttf");
    if (!hasFont) std::cerr << "[UI] No font found; pass --font <file.ttf>\n";

    auto mkText = [&](const sf::String& s, unsigned size, sf::Vector2f pos, sf::Color c = sf::Color(230, 230, 240)) {
        sf::Text t(font);
        t.setString(s);
        t.setCharacterSize(size);
        t.setPosition(pos);
        t.setFillColor(c);
        return t;
        };

    auto hit = [](sf::Vector2f p, const sf::RectangleShape& r) {
        return r.getGlobalBounds().contains(p);
        };

    // Connection panel
    sf::RectangleShape hostBtn({ 220.f, 56.f });
    hostBtn.setPosition({ 530.f, 260.f });
    hostBtn.setOutlineThickness(2.f);
    hostBtn.setOutlineColor(sf::Color(220, 220, 255));

    sf::RectangleShape joinBtn({ 220.f, 56.f });
    joinBtn.setPosition({ 530.f, 340.f });
    joinBtn.setOutlineThickness(2.f);
    joinBtn.setOutlineColor(sf::Color(220, 220, 255));

    // Chat panel
    sf::RectangleShape rosterBox({ 260.f, 600.f });
    rosterBox.setPosition({ 20.f, 60.f });
    rosterBox.setFillColor(sf::Color(32, 32, 42));

    sf::RectangleShape chatBox({ 960.f, 540.f });
    chatBox.setPosition({ 300.f, 60.f });
    chatBox.setFillColor(sf::Color(32, 32, 42));

    sf::RectangleShape inputBox({ 960.f, 44.f });
    inputBox.setPosition({ 300.f, 616.f });
    inputBox.setOutlineThickness(2.f);

    sf::String input;

    while (window.isOpen())
    {
        const bool inSession = !session.isReady();

        while (const std::optional ev = window.pollEvent())
        {
            if (ev->is<sf::Event::Closed>()) window.close();

            if (const auto* mb = ev->getIf<sf::Event::MouseButtonPressed>()) {
                if (mb->button == sf::Mouse::Button::Left && !inSession) {
                    const sf::Vector2f mp = window.mapPixelToCoords(mb->position);
                    if (hit(mp, hostBtn)) session.startHosting();
                    else if (hit(mp, joinBtn)) session.startDiscovery();
                }
            }

            if (const auto* kp = ev->getIf<sf::Event::KeyPressed>()) {
                if (kp->code == sf::Keyboard::Key::Escape) {
                    if (inSession || session.isSearching()) session.stop("user left");
                    else window.close();
                }
                else if (kp->code == sf::Keyboard::Key::Enter && session.canChat()) {
                    if (session.sendMessage(toUtf8(input))) input.clear();
                }
                else if (kp->code == sf::Keyboard::Key::Backspace && !input.isEmpty()) {
                    input.erase(input.getSize() - 1);
                }
            }

            if (const auto* te = ev->getIf<sf::Event::TextEntered>()) {
                // control characters arrive here too; Enter/Backspace are handled above
                if (session.canChat() && te->unicode >= 0x20 && te->unicode != 0x7F) {
                    // the frame limit is in bytes, and one character can take up to four
                    sf::String next = input;
                    next += te->unicode;
                    if (toUtf8(next).size() < relay::kMaxTextLen) input = next;
                }
            }
        }

        rt.pumpCallbacks();
        session.pump();

        SessionNotice notice;
        while (session.popNotice(notice)) {
            if (notice.kind == SessionNotice::Kind::Disconnected ||
                notice.kind == SessionNotice::Kind::ConnectFailed) {
                input.clear();
            }
        }

        window.clear(sf::Color(20, 20, 26));

        if (hasFont) {
            window.draw(mkText("Status: " + session.statusText(), 18, { 20.f, 20.f }));

            if (session.isReady()) {
                hostBtn.setFillColor(sf::Color(35, 90, 55));
                joinBtn.setFillColor(session.isSearching() ? sf::Color(70, 70, 75) : sf::Color(35, 60, 110));
                window.draw(hostBtn);
                window.draw(joinBtn);
                window.draw(mkText("Host", 22, { 610.f, 273.f }));
                window.draw(mkText(session.isSearching() ? "Searching..." : "Join", 22, { 580.f, 353.f }));
                window.draw(mkText("Esc=Quit", 16, { 20.f, 690.f }, sf::Color(150, 150, 170)));
            }
            else {
                window.draw(rosterBox);
                window.draw(chatBox);

                float y = 70.f;
                window.draw(mkText("Players (" + std::to_string(session.roster().size()) + ")", 18, { 30.f, y }));
                y += 32.f;
                for (const auto& [id, peer] : session.roster()) {
                    const bool me = (id == session.localId());
                    window.draw(mkText(fromUtf8(peer.displayName + (me ? " (you)" : "")), 16, { 30.f, y },
                        me ? sf::Color(140, 220, 160) : sf::Color(230, 230, 240)));
                    y += 22.f;
                }

                // newest at the bottom; the log already holds only the last maxMessages lines
                const auto& entries = session.messages().entries();
                const float lineH = 21.f;
                float cy = 600.f - 10.f - lineH * (float)entries.size();
                for (const auto& m : entries) {
                    if (cy >= 66.f)
                        window.draw(mkText(fromUtf8(ChatLog::formatLine(m)), 16, { 312.f, cy }));
                    cy += lineH;
                }

                inputBox.setFillColor(session.canChat() ? sf::Color(45, 45, 60) : sf::Color(30, 30, 34));
                inputBox.setOutlineColor(session.canChat() ? sf::Color(120, 120, 200) : sf::Color(70, 70, 80));
                window.draw(inputBox);
                window.draw(mkText(input + (session.canChat() ? "_" : ""), 18, { 310.f, 626.f }));
                window.draw(mkText("Enter=Send   Esc=Leave", 14, { 20.f, 690.f }, sf::Color(150, 150, 170)));
            }
        }

        window.display();
    }

    session.stop("window closed");
    rt.setSink(nullptr);
    return 0;
}
