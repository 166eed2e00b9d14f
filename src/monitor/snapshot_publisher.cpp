// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file snapshot_publisher.cpp
 * @brief Canonical snapshot store with field-level change notification
 *
 * @pattern Two-phase: mutate under mutex_, invoke callbacks outside it
 * @threading Per-device dispatch_mutex orders store+notify across sources
 * @gotchas Callbacks may subscribe/unsubscribe/get_snapshot freely, but must
 *          not publish to their own device (dispatch_mutex is held)
 */

#include "snapshot_publisher.h"

#include <spdlog/spdlog.h>

#include <exception>

namespace printwatch {

std::shared_ptr<SnapshotPublisher::Channel>
SnapshotPublisher::channel_for(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& channel = channels_[device_id];
    if (!channel) {
        channel = std::make_shared<Channel>();
    }
    return channel;
}

bool SnapshotPublisher::publish(const std::string& device_id, DeviceState new_state) {
    auto channel = channel_for(device_id);
    std::lock_guard<std::mutex> dispatch(channel->dispatch_mutex);
    new_state.id = device_id;
    return commit(device_id, *channel, std::move(new_state));
}

bool SnapshotPublisher::apply_fragment(const std::string& device_id,
                                       const DeviceStateFragment& fragment) {
    return update(device_id,
                  [&fragment](const DeviceState& current) { return merge(current, fragment); });
}

bool SnapshotPublisher::update(const std::string& device_id, const Transform& transform) {
    auto channel = channel_for(device_id);
    std::lock_guard<std::mutex> dispatch(channel->dispatch_mutex);

    DeviceStatePtr current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = channel->state;
    }

    DeviceState base;
    if (current) {
        base = *current;
    } else {
        base.id = device_id;
    }

    DeviceState next = transform(base);
    next.id = device_id;
    return commit(device_id, *channel, std::move(next));
}

bool SnapshotPublisher::commit(const std::string& device_id, Channel& channel, DeviceState next) {
    std::vector<std::string> changed;
    std::vector<Subscriber> subscribers;
    DeviceStatePtr stored;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const DeviceStatePtr& previous = channel.state;

        if (previous) {
            if (!differs_at_all(*previous, next)) {
                return false;
            }
            changed = diff_states(*previous, next);
        } else {
            // First observation: every field is news
            changed = {field::CONNECTION_STATUS, field::PRINT_STATUS};
            for (const auto& [sensor, reading] : next.temperatures) {
                changed.push_back(field::TEMPERATURES_PREFIX + sensor);
            }
            changed.emplace_back(field::CURRENT_JOB);
            changed.emplace_back(field::ERROR);
        }

        stored = std::make_shared<const DeviceState>(std::move(next));
        channel.state = stored;

        if (changed.empty()) {
            spdlog::trace("[SnapshotPublisher] {}: stamps advanced, no value change", device_id);
            return false;
        }
        subscribers = channel.subscribers;
    }

    spdlog::debug("[SnapshotPublisher] {}: {} field(s) changed, notifying {} subscriber(s)",
                  device_id, changed.size(), subscribers.size());

    for (const auto& sub : subscribers) {
        try {
            sub.callback(stored, changed);
        } catch (const std::exception& e) {
            spdlog::error("[SnapshotPublisher] Subscriber {} for {} threw: {}", sub.id, device_id,
                          e.what());
        }
    }
    return true;
}

SubscriptionId SnapshotPublisher::subscribe(const std::string& device_id, ChangeCallback callback) {
    if (!callback) {
        spdlog::warn("[SnapshotPublisher] subscribe called with null callback for {}", device_id);
        return INVALID_SUBSCRIPTION_ID;
    }

    auto channel = channel_for(device_id);
    SubscriptionId id = next_subscription_id_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel->subscribers.push_back({id, std::move(callback)});
    }
    spdlog::trace("[SnapshotPublisher] Subscription {} registered for {}", id, device_id);
    return id;
}

bool SnapshotPublisher::unsubscribe(const std::string& device_id, SubscriptionId id) {
    if (id == INVALID_SUBSCRIPTION_ID) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(device_id);
    if (it == channels_.end()) {
        return false;
    }

    auto& subs = it->second->subscribers;
    for (auto sub = subs.begin(); sub != subs.end(); ++sub) {
        if (sub->id == id) {
            subs.erase(sub);
            spdlog::trace("[SnapshotPublisher] Subscription {} removed for {}", id, device_id);
            return true;
        }
    }
    spdlog::debug("[SnapshotPublisher] Unsubscribe failed: {} not found for {}", id, device_id);
    return false;
}

DeviceStatePtr SnapshotPublisher::get_snapshot(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(device_id);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second->state;
}

std::vector<std::string> SnapshotPublisher::tracked_devices() const {
    std::vector<std::string> devices;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, channel] : channels_) {
        if (channel->state) {
            devices.push_back(id);
        }
    }
    return devices;
}

size_t SnapshotPublisher::subscriber_count(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(device_id);
    return it == channels_.end() ? 0 : it->second->subscribers.size();
}

} // namespace printwatch
