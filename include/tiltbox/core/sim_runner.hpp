/**
 * @file sim_runner.hpp
 * @brief Drives a PhysicsEngine on its own thread
 *
 * Each loop drains pending commands oldest first, then runs one iteration.
 * The loop is uncapped; the elapsed time is measured every tick. It ends when
 * stop() is called, when every command sender is gone, or when the snapshot
 * receiver is gone. In the last two cases the engine is released, closing
 * its snapshot channel, and the runner cannot be started again.
 */

#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "tiltbox/core/channel.hpp"
#include "tiltbox/core/commands.hpp"
#include "tiltbox/core/engine.hpp"

class SimulationRunner {
public:
    enum class StopReason {
        None,
        Requested,
        CommandsDisconnected,
        SnapshotsDisconnected
    };

    SimulationRunner(std::unique_ptr<PhysicsEngine> engine, Channel::Receiver<Command> commands);

    /**
     * @brief Requests a stop and joins the thread
     */
    ~SimulationRunner();

    SimulationRunner(const SimulationRunner&) = delete;
    SimulationRunner& operator=(const SimulationRunner&) = delete;

    /**
     * @brief Starts the simulation thread; does nothing if already started
     *        or if the engine was released after a disconnect
     */
    void start();

    /**
     * @brief Asks the loop to finish after the current tick and waits for it
     */
    void stop();

    bool isRunning() const { return m_running.load(); }
    StopReason stopReason() const { return m_stopReason.load(); }

private:
    void loop();

    std::unique_ptr<PhysicsEngine> m_engine;
    Channel::Receiver<Command> m_commands;
    std::thread m_thread;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_running{false};
    std::atomic<StopReason> m_stopReason{StopReason::None};
};
