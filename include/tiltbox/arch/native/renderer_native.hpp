/**
 * @file renderer_native.hpp
 * @brief Draws simulation snapshots with SFML
 *
 * The snapshot is in view space, where the visible play area spans [-1, 1]
 * on both axes with y pointing up. The renderer maps that square onto the
 * window and converts mouse positions back.
 */

#pragma once

#include <string>

#include <SFML/Graphics.hpp>

#include "tiltbox/core/snapshot.hpp"
#include "tiltbox/math/vector_math.hpp"

class Renderer {
public:
    Renderer(unsigned int width, unsigned int height);

    /**
     * @brief Opens the window and loads the HUD font
     * @return false if the window could not be created; a missing font only
     *         disables the HUD
     */
    bool init(const std::string& fontPath);

    void clear();
    void present();

    /**
     * @brief Draws a snapshot plus a HUD line
     */
    void renderSnapshot(const Snapshot& snapshot, const std::string& hud);

    /**
     * @brief Draws the rectangle currently being dragged in edit mode
     */
    void renderEditPreview(const Point& corner1, const Point& corner2);

    /**
     * @brief Window pixel to view space
     */
    Point toView(int pixelX, int pixelY) const;

    sf::RenderWindow& getWindow() { return window; }

private:
    sf::Vector2f toPixels(const Point& p) const;
    float toPixelLength(double length) const;
    void renderMarker(const Point& at, sf::Color color, float radius);
    void renderText(const std::string& text, int x, int y, sf::Color color);

    unsigned int screenWidth;
    unsigned int screenHeight;
    sf::RenderWindow window;
    sf::Font font;
    bool hasFont = false;
};
