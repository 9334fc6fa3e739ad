#include "tiltbox/core/sim_runner.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "tiltbox/core/debug.hpp"

SimulationRunner::SimulationRunner(std::unique_ptr<PhysicsEngine> engine, Channel::Receiver<Command> commands)
    : m_engine(std::move(engine))
    , m_commands(std::move(commands))
{
    if (!m_engine) {
        throw std::invalid_argument("SimulationRunner needs an engine");
    }
}

SimulationRunner::~SimulationRunner() {
    stop();
}

void SimulationRunner::start() {
    if (m_thread.joinable() || !m_engine) {
        return;
    }
    m_stopRequested = false;
    m_running = true;
    m_thread = std::thread([this]() { loop(); });
}

void SimulationRunner::stop() {
    m_stopRequested = true;
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void SimulationRunner::loop() {
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Runner] simulation thread started\n");

    StopReason reason = StopReason::Requested;
    while (!m_stopRequested) {
        bool drained = false;
        while (!drained) {
            auto received = m_commands.tryReceive();
            switch (received.status) {
                case Channel::TryReceiveStatus::Received:
                    m_engine->handleCommand(*received.value);
                    break;
                case Channel::TryReceiveStatus::Empty:
                    drained = true;
                    break;
                case Channel::TryReceiveStatus::Disconnected:
                    reason = StopReason::CommandsDisconnected;
                    drained = true;
                    break;
            }
        }
        if (reason == StopReason::CommandsDisconnected) {
            std::cerr << "Simulation stopped: command channel disconnected." << std::endl;
            break;
        }

        if (m_engine->runIteration() == TickResult::Disconnected) {
            reason = StopReason::SnapshotsDisconnected;
            std::cerr << "Simulation stopped: snapshot channel disconnected." << std::endl;
            break;
        }
    }

    // a dead channel ends the session: drop the engine so the snapshot
    // receiver sees the disconnect too
    if (reason != StopReason::Requested) {
        m_engine.reset();
    }

    m_stopReason = reason;
    m_running = false;
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Runner] simulation thread finished\n");
}
