/**
 * @file event_channel.cpp
 * @brief Implementation of event_channel and event_stream
 */

#include "pipedream/core/event_channel.h"

#include <utility>

namespace pipedream {

// ============================================================================
// event_channel
// ============================================================================

event_channel::event_channel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

auto event_channel::send(upload_event event) -> bool {
    const bool terminal = is_terminal(event);

    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
        return closed_ || detached_ || queue_.size() < capacity_;
    });

    if (closed_) {
        return false;
    }
    if (detached_) {
        closed_ = closed_ || terminal;
        return false;
    }

    queue_.push_back(std::move(event));
    if (terminal) {
        closed_ = true;
    }
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

auto event_channel::pop_locked() -> upload_event {
    upload_event event = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return event;
}

auto event_channel::receive() -> std::optional<upload_event> {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] {
        return !queue_.empty() || closed_ || detached_;
    });

    if (queue_.empty()) {
        return std::nullopt;
    }
    return pop_locked();
}

auto event_channel::try_receive() -> std::optional<upload_event> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    return pop_locked();
}

auto event_channel::receive_for(std::chrono::milliseconds timeout)
    -> std::optional<upload_event> {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] {
        return !queue_.empty() || closed_ || detached_;
    });

    if (queue_.empty()) {
        return std::nullopt;
    }
    return pop_locked();
}

void event_channel::detach() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        detached_ = true;
        queue_.clear();
    }
    not_full_.notify_all();
    not_empty_.notify_all();
}

auto event_channel::is_closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto event_channel::is_finished() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && queue_.empty();
}

auto event_channel::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// event_stream
// ============================================================================

event_stream::event_stream(std::shared_ptr<event_channel> channel, std::future<void> task)
    : channel_(std::move(channel)), task_(std::move(task)) {}

event_stream::~event_stream() {
    release();
}

auto event_stream::operator=(event_stream&& other) noexcept -> event_stream& {
    if (this != &other) {
        release();
        channel_ = std::move(other.channel_);
        task_ = std::move(other.task_);
    }
    return *this;
}

void event_stream::release() {
    if (channel_) {
        channel_->detach();
        channel_.reset();
    }
    if (task_.valid()) {
        task_.wait();
    }
}

auto event_stream::next() -> std::optional<upload_event> {
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->receive();
}

auto event_stream::try_next() -> std::optional<upload_event> {
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->try_receive();
}

auto event_stream::next_for(std::chrono::milliseconds timeout)
    -> std::optional<upload_event> {
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->receive_for(timeout);
}

auto event_stream::drain() -> std::vector<upload_event> {
    std::vector<upload_event> events;
    while (auto event = next()) {
        events.push_back(std::move(*event));
    }
    return events;
}

auto event_stream::finished() const -> bool {
    return !channel_ || channel_->is_finished();
}

}  // namespace pipedream
