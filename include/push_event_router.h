// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_state.h"
#include "monitoring_config.h"
#include "snapshot_publisher.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace printwatch {

/**
 * @brief Counters for the push path
 */
struct RouterStats {
    uint64_t received = 0;         ///< Events handed to dispatch()
    uint64_t delivered = 0;        ///< Events applied to the publisher
    uint64_t dropped_overflow = 0; ///< Oldest events evicted from a full queue
    uint64_t dropped_invalid = 0;  ///< Events rejected by parsing or validation
};

/**
 * @brief Fans a single inbound push stream out to bounded per-device queues
 *
 * Each device gets a small FIFO (capacity 1..4) drained by its own consumer
 * thread, so a slow or flooding device never delays the others. When a
 * queue is full the oldest pending event is dropped; dispatch() never
 * blocks on a consumer. A consumer that sees no event for push_idle_timeout
 * removes its queue and exits, so queues and threads only exist for
 * devices that pushed recently.
 *
 * Push events are applied whether or not the device has a monitoring
 * session. They never start one.
 *
 * Threading: dispatch() may be called from any thread. Events dispatched
 * before start() are queued (and subject to overflow) until consumers run.
 */
class PushEventRouter {
  public:
    PushEventRouter(SnapshotPublisher& publisher, const MonitoringConfig& config,
                    WallClock clock = system_now);
    ~PushEventRouter();

    PushEventRouter(const PushEventRouter&) = delete;
    PushEventRouter& operator=(const PushEventRouter&) = delete;

    /// Start consumer threads for existing and future device queues
    void start();

    /**
     * @brief Stop and join every consumer
     *
     * Pending events are discarded. Safe to call more than once.
     */
    void stop();

    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief Enqueue one event for its device
     *
     * Fields without a stamp inherit event.updated_at (or the receive time
     * when the event has none).
     */
    void dispatch(PushEvent event);

    /**
     * @brief Decode a JSON push payload and dispatch it
     * @return false if the payload was malformed (logged and counted)
     */
    bool dispatch_json(const std::string& payload);

    RouterStats stats() const;

    /// Events currently waiting for a device
    size_t queue_depth(const std::string& device_id) const;

    /// Device queues currently held
    size_t queue_count() const;

    size_t capacity() const {
        return capacity_;
    }

  private:
    struct DeviceQueue {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<PushEvent> events;
        bool stop = false;
        std::thread consumer;
    };

    /// Caller holds mutex_
    std::shared_ptr<DeviceQueue> queue_for_locked(const std::string& device_id);
    /// Caller holds mutex_
    void launch_consumer_locked(const std::string& device_id,
                                const std::shared_ptr<DeviceQueue>& queue);

    using QueueList = std::vector<std::shared_ptr<DeviceQueue>>;

    void consume(std::string device_id, std::shared_ptr<DeviceQueue> queue);

    /// Remove an idle queue; false if an event arrived meanwhile
    bool retire_if_idle(const std::string& device_id, const std::shared_ptr<DeviceQueue>& queue);

    /// Join retired consumers. Caller must not hold mutex_.
    void join_consumers(QueueList& queues);

    void deliver(const PushEvent& event);

    SnapshotPublisher& publisher_;
    const size_t capacity_;
    const std::chrono::milliseconds idle_timeout_;
    const FragmentLimits limits_;
    WallClock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DeviceQueue>> queues_;
    QueueList retired_; ///< Idle queues whose consumer thread still needs a join
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_overflow_{0};
    std::atomic<uint64_t> dropped_invalid_{0};
};

} // namespace printwatch
