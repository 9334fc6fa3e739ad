/**
 * @file main_native.cpp
 * @brief Main entry point for the native platform.
 *
 * Starts the simulation thread, then runs the SFML event loop on the main
 * thread: input becomes commands, snapshots are drawn as they arrive.
 *
 * Controls:
 *   left drag       draw a polygon (edit mode: a static rectangle)
 *   right click     erase
 *   H / R           hinge / rigid anchor under the cursor
 *   C               circle under the cursor
 *   Left / Right    tilt the world
 *   Space           jump
 *   E               toggle edit mode
 *   D / F           edit mode: toggle deadly / fragile
 *   Backspace       edit mode: remove the last rectangle
 *
 * The only argument is an optional path to a TTF font for the HUD.
 */

#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <SFML/Graphics.hpp>

#include "tiltbox/arch/native/renderer_native.hpp"
#include "tiltbox/core/channel.hpp"
#include "tiltbox/core/commands.hpp"
#include "tiltbox/core/engine.hpp"
#include "tiltbox/core/profile.hpp"
#include "tiltbox/core/sim_runner.hpp"
#include "tiltbox/core/snapshot.hpp"
#include "tiltbox/scenes/scene_catalog.hpp"

namespace {

constexpr unsigned int WindowSize = 800;
constexpr double TiltStep = 0.05;
constexpr double DrawnCircleRadius = 0.05;

struct InputState {
    bool editMode = false;
    Commands::EditFlags editFlags;
    double angle = 0.0;
    bool dragging = false;
    std::vector<Point> stroke;
};

std::string hudLine(const Snapshot& snapshot, const InputState& input, const std::vector<std::string>& names) {
    std::ostringstream out;
    out << (snapshot.levelIndex < names.size() ? names[snapshot.levelIndex] : std::string("?"))
        << "  jumps: " << snapshot.remainingJumps
        << "  flags: " << snapshot.flags.size();
    if (input.editMode) {
        out << "  [edit" << (input.editFlags.deadly ? " deadly" : "")
            << (input.editFlags.fragile ? " fragile" : "") << "]";
    }
    return out.str();
}

} // namespace

namespace {

int run(const std::string& fontPath) {
    PROFILE_SCOPE("main");

    SceneCatalog catalog;
    std::vector<std::string> const names = catalog.getSceneNames();

    auto snapshotChannel = Channel::bounded<Snapshot>(1);
    auto commandChannel = Channel::unbounded<Command>();
    Channel::Sender<Command> commands = std::move(commandChannel.first);
    Channel::Receiver<Snapshot> snapshots = std::move(snapshotChannel.second);

    std::unique_ptr<PhysicsEngine> engine;
    try {
        engine = std::make_unique<PhysicsEngine>(std::move(snapshotChannel.first), catalog.buildLibrary(),
                                                 static_cast<std::size_t>(BuiltinLevel::TiltYard));
    } catch (const std::exception& e) {
        std::cerr << "Failed to load levels: " << e.what() << std::endl;
        return 1;
    }

    Renderer renderer(WindowSize, WindowSize);
    if (!renderer.init(fontPath)) {
        return 1;
    }

    SimulationRunner runner(std::move(engine), std::move(commandChannel.second));
    runner.start();

    InputState input;
    Snapshot latest;
    sf::RenderWindow& window = renderer.getWindow();

    auto send = [&commands](Command command) {
        if (commands.trySend(std::move(command)) == Channel::TrySendResult::Disconnected) {
            std::cerr << "Simulation stopped, command dropped" << std::endl;
        }
    };
    auto cursor = [&renderer, &window]() {
        sf::Vector2i const pixel = sf::Mouse::getPosition(window);
        return renderer.toView(pixel.x, pixel.y);
    };

    while (window.isOpen()) {
        sf::Event event;
        while (window.pollEvent(event)) {
            switch (event.type) {
                case sf::Event::Closed:
                    window.close();
                    break;

                case sf::Event::KeyPressed:
                    switch (event.key.code) {
                        case sf::Keyboard::Escape: window.close(); break;
                        case sf::Keyboard::Space: send(Commands::Jump{}); break;
                        case sf::Keyboard::H: send(Commands::AddHingeAnchor{cursor()}); break;
                        case sf::Keyboard::R: send(Commands::AddRigidAnchor{cursor()}); break;
                        case sf::Keyboard::C: send(Commands::AddCircle{cursor(), DrawnCircleRadius}); break;
                        case sf::Keyboard::Left:
                            input.angle -= TiltStep;
                            send(Commands::SetAimAngle{input.angle});
                            break;
                        case sf::Keyboard::Right:
                            input.angle += TiltStep;
                            send(Commands::SetAimAngle{input.angle});
                            break;
                        case sf::Keyboard::E: input.editMode = !input.editMode; break;
                        case sf::Keyboard::D: input.editFlags.deadly = !input.editFlags.deadly; break;
                        case sf::Keyboard::F: input.editFlags.fragile = !input.editFlags.fragile; break;
                        case sf::Keyboard::BackSpace:
                            if (input.editMode) {
                                send(Commands::RemoveLastLevelShape{});
                            }
                            break;
                        default: break;
                    }
                    break;

                case sf::Event::MouseButtonPressed: {
                    Point const at = renderer.toView(event.mouseButton.x, event.mouseButton.y);
                    if (event.mouseButton.button == sf::Mouse::Left) {
                        input.dragging = true;
                        input.stroke.assign(1, at);
                    } else if (event.mouseButton.button == sf::Mouse::Right) {
                        send(Commands::EraseAt{at});
                    }
                    break;
                }

                case sf::Event::MouseMoved:
                    if (input.dragging && !input.editMode) {
                        input.stroke.push_back(renderer.toView(event.mouseMove.x, event.mouseMove.y));
                    }
                    break;

                case sf::Event::MouseButtonReleased:
                    if (event.mouseButton.button == sf::Mouse::Left && input.dragging) {
                        Point const at = renderer.toView(event.mouseButton.x, event.mouseButton.y);
                        if (input.editMode) {
                            send(Commands::CreateLevelShape{input.stroke.front(), at, input.editFlags});
                        } else {
                            input.stroke.push_back(at);
                            send(Commands::AddPolygon{input.stroke});
                        }
                        input.dragging = false;
                        input.stroke.clear();
                    }
                    break;

                default:
                    break;
            }
        }

        // Keep only the newest snapshot
        for (;;) {
            auto received = snapshots.tryReceive();
            if (received.status == Channel::TryReceiveStatus::Received) {
                latest = std::move(*received.value);
                continue;
            }
            if (received.status == Channel::TryReceiveStatus::Disconnected) {
                std::cerr << "Simulation thread ended" << std::endl;
                window.close();
            }
            break;
        }
        if (window.isOpen() && !runner.isRunning()) {
            std::cerr << "Simulation thread ended" << std::endl;
            window.close();
        }

        renderer.clear();
        renderer.renderSnapshot(latest, hudLine(latest, input, names));
        if (input.dragging && input.editMode) {
            renderer.renderEditPreview(input.stroke.front(), cursor());
        }
        renderer.present();
    }

    runner.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    int const status = run(argc > 1 ? argv[1] : "assets/fonts/arial.ttf");
    Profiling::Profiler::printStats();
    return status;
}
