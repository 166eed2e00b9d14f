// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file push_event_router.cpp
 * @brief Bounded per-device push queues with drop-oldest backpressure
 *
 * @threading One consumer thread per device queue; dispatch() only takes
 *            short locks. Lock order is mutex_ before a queue's mutex.
 * @gotchas Consumers are launched lazily, so a device that has never pushed
 *          costs nothing. A consumer idle for push_idle_timeout removes its
 *          queue and exits; its thread is joined by a later dispatch() or
 *          stop(), never by itself.
 */

#include "push_event_router.h"

#include "device_state_json.h"
#include "state_merger.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace printwatch {

PushEventRouter::PushEventRouter(SnapshotPublisher& publisher, const MonitoringConfig& config,
                                 WallClock clock)
    : publisher_(publisher),
      capacity_(std::clamp(config.push_queue_capacity, MonitoringConfig::MIN_QUEUE_CAPACITY,
                           MonitoringConfig::MAX_QUEUE_CAPACITY)),
      idle_timeout_(config.push_idle_timeout > std::chrono::milliseconds(0)
                        ? config.push_idle_timeout
                        : std::chrono::milliseconds(60000)),
      limits_(config.limits), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = system_now;
    }
}

PushEventRouter::~PushEventRouter() {
    stop();
}

void PushEventRouter::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load()) {
        return;
    }

    spdlog::info("[PushEventRouter] Starting (queue capacity {})", capacity_);
    running_.store(true);
    for (auto& [device_id, queue] : queues_) {
        launch_consumer_locked(device_id, queue);
    }
}

void PushEventRouter::stop() {
    std::map<std::string, std::shared_ptr<DeviceQueue>> queues;
    QueueList finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        queues.swap(queues_);
        finished.swap(retired_);
    }
    join_consumers(finished);

    if (queues.empty()) {
        return;
    }

    for (auto& [device_id, queue] : queues) {
        {
            std::lock_guard<std::mutex> lock(queue->mutex);
            queue->stop = true;
            if (!queue->events.empty()) {
                spdlog::debug("[PushEventRouter] Discarding {} pending event(s) for {}",
                              queue->events.size(), device_id);
            }
            queue->events.clear();
        }
        queue->cv.notify_all();
    }

    for (auto& [device_id, queue] : queues) {
        if (queue->consumer.joinable()) {
            queue->consumer.join();
        }
    }
    spdlog::info("[PushEventRouter] Stopped");
}

std::shared_ptr<PushEventRouter::DeviceQueue>
PushEventRouter::queue_for_locked(const std::string& device_id) {
    auto& queue = queues_[device_id];
    if (!queue) {
        queue = std::make_shared<DeviceQueue>();
        spdlog::debug("[PushEventRouter] Created queue for {}", device_id);
        if (running_.load()) {
            launch_consumer_locked(device_id, queue);
        }
    }
    return queue;
}

void PushEventRouter::launch_consumer_locked(const std::string& device_id,
                                             const std::shared_ptr<DeviceQueue>& queue) {
    if (queue->consumer.joinable()) {
        return;
    }
    queue->consumer = std::thread(&PushEventRouter::consume, this, device_id, queue);
}

void PushEventRouter::dispatch(PushEvent event) {
    received_++;

    if (event.device_id.empty()) {
        dropped_invalid_++;
        spdlog::warn("[PushEventRouter] Dropping event without device_id");
        return;
    }

    Timestamp stamp = event.updated_at == Timestamp{} ? clock_() : event.updated_at;
    event.fragment.stamp_unset(stamp);
    event.fragment.from_device = true;

    QueueList finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished.swap(retired_);

        // Held together with mutex_ so an idle consumer cannot retire the queue mid-push
        std::shared_ptr<DeviceQueue> queue = queue_for_locked(event.device_id);
        std::lock_guard<std::mutex> queue_lock(queue->mutex);
        if (queue->events.size() >= capacity_) {
            queue->events.pop_front();
            dropped_overflow_++;
            spdlog::debug("[PushEventRouter] Queue for {} full, dropped oldest event",
                          event.device_id);
        }
        queue->events.push_back(std::move(event));
        queue->cv.notify_one();
    }

    join_consumers(finished);
}

bool PushEventRouter::dispatch_json(const std::string& payload) {
    PushEvent event;
    MonitorError error;
    if (!parse_push_event(payload, event, error)) {
        received_++;
        dropped_invalid_++;
        spdlog::warn("[PushEventRouter] Dropping malformed push payload: {}", error.message);
        return false;
    }
    dispatch(std::move(event));
    return true;
}

void PushEventRouter::consume(std::string device_id, std::shared_ptr<DeviceQueue> queue) {
    spdlog::debug("[PushEventRouter] Consumer for {} started", device_id);

    while (true) {
        PushEvent event;
        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            bool ready = queue->cv.wait_for(lock, idle_timeout_, [&queue] {
                return queue->stop || !queue->events.empty();
            });
            if (queue->stop) {
                break;
            }
            if (!ready) {
                lock.unlock();
                if (retire_if_idle(device_id, queue)) {
                    break;
                }
                continue;
            }
            event = std::move(queue->events.front());
            queue->events.pop_front();
        }
        deliver(event);
    }

    spdlog::debug("[PushEventRouter] Consumer for {} exiting", device_id);
}

bool PushEventRouter::retire_if_idle(const std::string& device_id,
                                     const std::shared_ptr<DeviceQueue>& queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::lock_guard<std::mutex> queue_lock(queue->mutex);
    if (queue->stop) {
        return true; // stop() owns the join
    }
    if (!queue->events.empty()) {
        return false;
    }

    auto it = queues_.find(device_id);
    if (it != queues_.end() && it->second == queue) {
        queues_.erase(it);
    }
    retired_.push_back(queue);
    spdlog::debug("[PushEventRouter] Queue for {} idle for {}ms, retiring", device_id,
                  idle_timeout_.count());
    return true;
}

void PushEventRouter::join_consumers(QueueList& queues) {
    QueueList own;
    for (auto& queue : queues) {
        if (!queue->consumer.joinable()) {
            continue;
        }
        if (queue->consumer.get_id() == std::this_thread::get_id()) {
            own.push_back(queue); // Cannot join ourselves
            continue;
        }
        queue->consumer.join();
    }
    queues.clear();

    if (!own.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        retired_.insert(retired_.end(), own.begin(), own.end());
    }
}

void PushEventRouter::deliver(const PushEvent& event) {
    MonitorError invalid = validate_fragment(event.device_id, event.fragment, clock_(), limits_);
    if (invalid.has_error()) {
        dropped_invalid_++;
        spdlog::warn("[PushEventRouter] Dropping invalid event for {}: {}", event.device_id,
                     invalid.message);
        return;
    }

    publisher_.apply_fragment(event.device_id, event.fragment);
    delivered_++;
}

RouterStats PushEventRouter::stats() const {
    RouterStats s;
    s.received = received_.load();
    s.delivered = delivered_.load();
    s.dropped_overflow = dropped_overflow_.load();
    s.dropped_invalid = dropped_invalid_.load();
    return s;
}

size_t PushEventRouter::queue_depth(const std::string& device_id) const {
    std::shared_ptr<DeviceQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queues_.find(device_id);
        if (it == queues_.end()) {
            return 0;
        }
        queue = it->second;
    }
    std::lock_guard<std::mutex> lock(queue->mutex);
    return queue->events.size();
}

size_t PushEventRouter::queue_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_.size();
}

} // namespace printwatch
