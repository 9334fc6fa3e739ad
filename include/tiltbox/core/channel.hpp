/**
 * @file channel.hpp
 * @brief Thread-safe message channels between the simulation and its clients
 *
 * A channel is a FIFO queue shared by any number of Sender copies and exactly
 * one Receiver. Either side can observe that the other side is gone:
 * - trySend() reports Disconnected once the Receiver was destroyed
 * - tryReceive() reports Disconnected once the queue is drained and every
 *   Sender was destroyed
 *
 * Bounded channels reject messages with Full instead of blocking the sender,
 * which is how the engine applies backpressure to snapshot publishing.
 */

#ifndef TILTBOX_CHANNEL_HPP
#define TILTBOX_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace Channel {

enum class TrySendResult {
    Sent,
    Full,
    Disconnected
};

enum class TryReceiveStatus {
    Received,
    Empty,
    Disconnected
};

template <typename T>
struct ReceiveResult {
    TryReceiveStatus status;
    std::optional<T> value;
};

namespace detail {

template <typename T>
struct SharedState {
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<T> queue;
    std::optional<std::size_t> capacity;
    std::size_t senders = 1;
    bool receiverAlive = true;
};

} // namespace detail

template <typename T>
class Sender {
public:
    explicit Sender(std::shared_ptr<detail::SharedState<T>> state) : m_state(std::move(state)) {}

    Sender(const Sender& other) : m_state(other.m_state) {
        if (m_state) {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            ++m_state->senders;
        }
    }

    Sender(Sender&& other) noexcept : m_state(std::move(other.m_state)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(m_state, other.m_state);
        return *this;
    }

    ~Sender() { release(); }

    /**
     * @brief Enqueues a message without blocking
     * @return Sent, Full (bounded channel at capacity, message dropped) or
     *         Disconnected (receiver gone, message dropped)
     */
    TrySendResult trySend(T message) {
        if (!m_state) {
            return TrySendResult::Disconnected;
        }
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (!m_state->receiverAlive) {
                return TrySendResult::Disconnected;
            }
            if (m_state->capacity && m_state->queue.size() >= *m_state->capacity) {
                return TrySendResult::Full;
            }
            m_state->queue.push_back(std::move(message));
        }
        m_state->ready.notify_one();
        return TrySendResult::Sent;
    }

    bool isEmpty() const {
        if (!m_state) {
            return true;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->queue.empty();
    }

    bool isConnected() const {
        if (!m_state) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->receiverAlive;
    }

private:
    void release() {
        if (!m_state) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            --m_state->senders;
        }
        m_state->ready.notify_all();
        m_state.reset();
    }

    std::shared_ptr<detail::SharedState<T>> m_state;
};

template <typename T>
class Receiver {
public:
    explicit Receiver(std::shared_ptr<detail::SharedState<T>> state) : m_state(std::move(state)) {}

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& other) noexcept : m_state(std::move(other.m_state)) {}

    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            release();
            m_state = std::move(other.m_state);
        }
        return *this;
    }

    ~Receiver() { release(); }

    /**
     * @brief Dequeues the oldest message without blocking
     */
    ReceiveResult<T> tryReceive() {
        if (!m_state) {
            return {TryReceiveStatus::Disconnected, std::nullopt};
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return popLocked();
    }

    /**
     * @brief Waits up to timeout for a message
     *
     * Returns early with Disconnected when the last sender goes away.
     */
    template <typename Rep, typename Period>
    ReceiveResult<T> receiveFor(std::chrono::duration<Rep, Period> timeout) {
        if (!m_state) {
            return {TryReceiveStatus::Disconnected, std::nullopt};
        }
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->ready.wait_for(lock, timeout, [this]() {
            return !m_state->queue.empty() || m_state->senders == 0;
        });
        return popLocked();
    }

    bool isEmpty() const {
        if (!m_state) {
            return true;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->queue.empty();
    }

private:
    ReceiveResult<T> popLocked() {
        if (m_state->queue.empty()) {
            return {m_state->senders == 0 ? TryReceiveStatus::Disconnected : TryReceiveStatus::Empty,
                    std::nullopt};
        }
        ReceiveResult<T> result{TryReceiveStatus::Received, std::move(m_state->queue.front())};
        m_state->queue.pop_front();
        return result;
    }

    void release() {
        if (!m_state) {
            return;
        }
        auto state = std::move(m_state);
        std::lock_guard<std::mutex> lock(state->mutex);
        state->receiverAlive = false;
        state->queue.clear();
    }

    std::shared_ptr<detail::SharedState<T>> m_state;
};

/**
 * @brief Creates a channel holding at most capacity undelivered messages
 * @throws std::invalid_argument for a zero capacity
 */
template <typename T>
std::pair<Sender<T>, Receiver<T>> bounded(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("channel capacity must be positive");
    }
    auto state = std::make_shared<detail::SharedState<T>>();
    state->capacity = capacity;
    return {Sender<T>(state), Receiver<T>(state)};
}

template <typename T>
std::pair<Sender<T>, Receiver<T>> unbounded() {
    auto state = std::make_shared<detail::SharedState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace Channel

#endif // TILTBOX_CHANNEL_HPP
