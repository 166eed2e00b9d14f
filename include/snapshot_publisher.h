// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_state.h"
#include "state_merger.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace printwatch {

/// Identifies a subscription for later removal (valid IDs are > 0)
using SubscriptionId = uint64_t;

constexpr SubscriptionId INVALID_SUBSCRIPTION_ID = 0;

/**
 * @brief Change notification callback
 *
 * @param state New immutable snapshot
 * @param changed_fields Field paths whose values changed (see state_merger.h)
 */
using ChangeCallback =
    std::function<void(const DeviceStatePtr& state, const std::vector<std::string>& changed_fields)>;

/**
 * @brief Single owner of canonical per-device snapshots
 *
 * Holds the last-known DeviceState of every device, diffs each new value
 * against it, and notifies subscribers with the changed field paths so views
 * can patch instead of redraw.
 *
 * Threading: all methods are thread-safe. Per device, updates are serialized
 * and notifications are delivered in the order the values were stored.
 * Callbacks run on the publishing thread (poll thread, push consumer or
 * watchdog) and must not publish to the same device re-entrantly.
 *
 * Subscribers own their subscriptions: nothing is removed automatically.
 */
class SnapshotPublisher {
  public:
    /// Transform used by update(); receives the current state (never null)
    using Transform = std::function<DeviceState(const DeviceState&)>;

    SnapshotPublisher() = default;

    // Non-copyable (has mutex)
    SnapshotPublisher(const SnapshotPublisher&) = delete;
    SnapshotPublisher& operator=(const SnapshotPublisher&) = delete;

    /**
     * @brief Store a new state for a device and notify on value changes
     *
     * Timestamp-only advances are stored silently so admissibility checks and
     * the staleness watchdog see the newest stamps.
     *
     * @return true if subscribers were notified
     */
    bool publish(const std::string& device_id, DeviceState new_state);

    /**
     * @brief Atomically merge a fragment into the stored state and publish
     *
     * Equivalent to publish(merge(get_snapshot(id), fragment)) without the
     * window in which a concurrent update could be lost.
     *
     * @return true if subscribers were notified
     */
    bool apply_fragment(const std::string& device_id, const DeviceStateFragment& fragment);

    /**
     * @brief Atomically transform the stored state and publish the result
     *
     * A device that was never observed is presented as a default DeviceState
     * carrying only its id.
     *
     * @return true if subscribers were notified
     */
    bool update(const std::string& device_id, const Transform& transform);

    /**
     * @brief Register a change callback for one device
     * @return Subscription ID, or INVALID_SUBSCRIPTION_ID for a null callback
     */
    SubscriptionId subscribe(const std::string& device_id, ChangeCallback callback);

    /**
     * @brief Remove a subscription
     * @return true if the subscription existed
     */
    bool unsubscribe(const std::string& device_id, SubscriptionId id);

    /**
     * @brief Point-in-time read
     * @return Current immutable snapshot, or nullptr if never observed
     */
    DeviceStatePtr get_snapshot(const std::string& device_id) const;

    /// Devices with a stored snapshot
    std::vector<std::string> tracked_devices() const;

    /// Number of live subscriptions for a device
    size_t subscriber_count(const std::string& device_id) const;

  private:
    struct Subscriber {
        SubscriptionId id;
        ChangeCallback callback;
    };

    struct Channel {
        std::mutex dispatch_mutex; ///< Serializes read-modify-notify for this device
        DeviceStatePtr state;      ///< Guarded by SnapshotPublisher::mutex_
        std::vector<Subscriber> subscribers; ///< Guarded by SnapshotPublisher::mutex_
    };

    std::shared_ptr<Channel> channel_for(const std::string& device_id);

    /// Caller holds channel->dispatch_mutex
    bool commit(const std::string& device_id, Channel& channel, DeviceState next);

    std::map<std::string, std::shared_ptr<Channel>> channels_;
    mutable std::mutex mutex_;
    std::atomic<SubscriptionId> next_subscription_id_{1};
};

} // namespace printwatch
