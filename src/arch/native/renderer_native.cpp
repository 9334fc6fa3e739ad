/**
 * @file renderer_native.cpp
 * @brief Implementation of the SFML snapshot renderer
 */

#include "tiltbox/arch/native/renderer_native.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

Renderer::Renderer(unsigned int width, unsigned int height)
    : screenWidth(width)
    , screenHeight(height)
{
}

bool Renderer::init(const std::string& fontPath) {
    window.create(sf::VideoMode(screenWidth, screenHeight), "tiltbox");
    if (!window.isOpen()) {
        std::cerr << "Failed to open the render window\n";
        return false;
    }
    window.setVerticalSyncEnabled(true);

    hasFont = font.loadFromFile(fontPath);
    if (!hasFont) {
        std::cerr << "Failed to load font " << fontPath << ", HUD disabled\n";
    }
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color(20, 20, 28));
}

void Renderer::present() {
    window.display();
}

sf::Vector2f Renderer::toPixels(const Point& p) const {
    float const half = static_cast<float>(std::min(screenWidth, screenHeight)) * 0.5F;
    return sf::Vector2f(static_cast<float>(screenWidth) * 0.5F + static_cast<float>(p.x) * half,
                        static_cast<float>(screenHeight) * 0.5F - static_cast<float>(p.y) * half);
}

float Renderer::toPixelLength(double length) const {
    return static_cast<float>(length) * static_cast<float>(std::min(screenWidth, screenHeight)) * 0.5F;
}

Point Renderer::toView(int pixelX, int pixelY) const {
    double const half = static_cast<double>(std::min(screenWidth, screenHeight)) * 0.5;
    return Point((pixelX - static_cast<double>(screenWidth) * 0.5) / half,
                 (static_cast<double>(screenHeight) * 0.5 - pixelY) / half);
}

void Renderer::renderMarker(const Point& at, sf::Color color, float radius) {
    sf::CircleShape marker(radius);
    marker.setOrigin(radius, radius);
    marker.setPosition(toPixels(at));
    marker.setFillColor(sf::Color::Transparent);
    marker.setOutlineColor(color);
    marker.setOutlineThickness(2.F);
    window.draw(marker);
}

void Renderer::renderSnapshot(const Snapshot& snapshot, const std::string& hud) {
    auto drawRing = [this](const std::vector<Point>& ring, sf::Color fill, sf::Color outline) {
        sf::ConvexShape convex;
        convex.setPointCount(ring.size());
        for (size_t i = 0; i < ring.size(); ++i) {
            convex.setPoint(i, toPixels(ring[i]));
        }
        convex.setFillColor(fill);
        convex.setOutlineColor(outline);
        convex.setOutlineThickness(outline == sf::Color::Transparent ? 0.F : 1.F);
        window.draw(convex);
    };

    for (auto const& door : snapshot.doors) {
        drawRing(door, sf::Color(60, 40, 90), sf::Color(160, 120, 220));
    }

    for (auto const& polygon : snapshot.polygons) {
        drawRing(polygon.vertices, sf::Color(polygon.color.r, polygon.color.g, polygon.color.b),
                 sf::Color::Transparent);
    }

    for (auto const& circle : snapshot.circles) {
        float const radius = std::max(1.F, toPixelLength(circle.radius));
        sf::Color const fill(circle.color.r, circle.color.g, circle.color.b);

        sf::CircleShape shape(radius);
        shape.setOrigin(radius, radius);
        shape.setPosition(toPixels(circle.center));
        shape.setFillColor(fill);
        window.draw(shape);

        // Spoke showing the accumulated rotation
        Point const rim = circle.center + Vector(circle.radius, 0.0).rotateByAngle(circle.angle);
        sf::Color const spokeColor(std::max(0, fill.r - 80), std::max(0, fill.g - 80), std::max(0, fill.b - 80));
        sf::Vertex spoke[2] = {sf::Vertex(toPixels(circle.center), spokeColor),
                               sf::Vertex(toPixels(rim), spokeColor)};
        window.draw(spoke, 2, sf::Lines);
    }

    for (auto const& flag : snapshot.flags) {
        drawRing(flag, sf::Color(40, 200, 80), sf::Color::White);
    }

    for (auto const& p : snapshot.hinges) {
        renderMarker(p, sf::Color::White, 4.F);
    }
    for (auto const& p : snapshot.rigidBindings) {
        renderMarker(p, sf::Color(255, 170, 0), 5.F);
    }
    for (auto const& p : snapshot.pendingHinges) {
        renderMarker(p, sf::Color(150, 150, 150), 4.F);
    }
    for (auto const& p : snapshot.pendingRigidBindings) {
        renderMarker(p, sf::Color(150, 110, 40), 5.F);
    }

    renderText(hud, 10, 10, sf::Color::White);
    if (snapshot.gameComplete) {
        renderText("All flags collected!", 10, 34, sf::Color(40, 220, 90));
    }
}

void Renderer::renderEditPreview(const Point& corner1, const Point& corner2) {
    sf::Vector2f const a = toPixels(corner1);
    sf::Vector2f const b = toPixels(corner2);
    sf::RectangleShape rect(sf::Vector2f(std::abs(b.x - a.x), std::abs(b.y - a.y)));
    rect.setPosition(std::min(a.x, b.x), std::min(a.y, b.y));
    rect.setFillColor(sf::Color::Transparent);
    rect.setOutlineColor(sf::Color(200, 200, 0));
    rect.setOutlineThickness(1.F);
    window.draw(rect);
}

void Renderer::renderText(const std::string& text, int x, int y, sf::Color color) {
    if (!hasFont) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(16);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
