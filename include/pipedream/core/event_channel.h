/**
 * @file event_channel.h
 * @brief One-way event delivery from an upload task to its caller
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_EVENT_CHANNEL_H
#define PIPEDREAM_CORE_EVENT_CHANNEL_H

#include "upload_events.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace pipedream {

/**
 * @brief Bounded single-producer/single-consumer event queue
 *
 * The producer blocks while the queue is full. Once a terminal event has
 * been accepted the channel is closed: later sends are rejected, and
 * receive() returns std::nullopt after the terminal event was consumed.
 *
 * When the consumer detaches, queued events are dropped and later sends
 * return immediately, so the producer can run to completion unobserved.
 */
class event_channel {
public:
    static constexpr std::size_t default_capacity = 16;

    explicit event_channel(std::size_t capacity = default_capacity);

    event_channel(const event_channel&) = delete;
    auto operator=(const event_channel&) -> event_channel& = delete;

    /**
     * @brief Deliver an event to the consumer
     * @return false if the channel is already closed or the consumer detached
     */
    auto send(upload_event event) -> bool;

    /**
     * @brief Wait for the next event
     * @return The event, or std::nullopt once the stream has ended
     */
    [[nodiscard]] auto receive() -> std::optional<upload_event>;

    /**
     * @brief Take the next event if one is queued
     */
    [[nodiscard]] auto try_receive() -> std::optional<upload_event>;

    /**
     * @brief Wait up to @p timeout for the next event
     */
    [[nodiscard]] auto receive_for(std::chrono::milliseconds timeout)
        -> std::optional<upload_event>;

    /**
     * @brief Consumer side gives up on the stream
     */
    void detach();

    /**
     * @brief Whether a terminal event has been sent
     */
    [[nodiscard]] auto is_closed() const -> bool;

    /**
     * @brief Whether the terminal event has been sent and consumed
     */
    [[nodiscard]] auto is_finished() const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
    auto pop_locked() -> upload_event;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<upload_event> queue_;
    bool closed_ = false;
    bool detached_ = false;
};

/**
 * @brief Caller-side handle of a running upload
 *
 * Returned by multipart_upload::send(). Destroying the handle detaches
 * from the channel and waits for the background task to finish.
 *
 * @code
 * auto events = upload.send(std::move(source), "backups/dump.rdb");
 * while (auto event = events.next()) {
 *     std::visit(handler, *event);
 * }
 * @endcode
 */
class event_stream {
public:
    event_stream(std::shared_ptr<event_channel> channel, std::future<void> task);
    ~event_stream();

    event_stream(const event_stream&) = delete;
    auto operator=(const event_stream&) -> event_stream& = delete;
    event_stream(event_stream&&) noexcept = default;
    auto operator=(event_stream&& other) noexcept -> event_stream&;

    /**
     * @brief Wait for the next event; std::nullopt after the terminal one
     */
    [[nodiscard]] auto next() -> std::optional<upload_event>;

    [[nodiscard]] auto try_next() -> std::optional<upload_event>;

    [[nodiscard]] auto next_for(std::chrono::milliseconds timeout)
        -> std::optional<upload_event>;

    /**
     * @brief Receive every remaining event, ending with the terminal one
     */
    [[nodiscard]] auto drain() -> std::vector<upload_event>;

    /**
     * @brief Whether the terminal event has been received
     */
    [[nodiscard]] auto finished() const -> bool;

private:
    void release();

    std::shared_ptr<event_channel> channel_;
    std::future<void> task_;
};

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_EVENT_CHANNEL_H
