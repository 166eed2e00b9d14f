// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_registry.h"

#include <spdlog/spdlog.h>

namespace printwatch {

SessionRegistry::SessionRegistry(DeviceStatusFetcher& fetcher, SnapshotPublisher& publisher,
                                 const MonitoringConfig& config, WallClock clock)
    : fetcher_(fetcher), publisher_(publisher), config_(config), clock_(std::move(clock)) {}

SessionRegistry::~SessionRegistry() {
    stop_all();
}

SessionRegistry::SessionList SessionRegistry::take_stopped_locked() {
    SessionList stopped;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        MonitoringSession& session = *it->second;
        // A queued restart is launched by the exit hook, which needs the entry
        if (session.state() == SessionState::STOPPED && !session.has_error() &&
            !session.on_loop_thread() && restart_pending_.count(it->first) == 0) {
            spdlog::trace("[SessionRegistry] Reaping stopped session for {}", it->first);
            stopped.push_back(std::move(it->second));
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = retired_.begin(); it != retired_.end();) {
        if ((*it)->state() == SessionState::STOPPED && !(*it)->on_loop_thread()) {
            stopped.push_back(std::move(*it));
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
    return stopped;
}

std::unique_ptr<MonitoringSession> SessionRegistry::launch_locked(const std::string& device_id) {
    auto session =
        std::make_unique<MonitoringSession>(device_id, fetcher_, publisher_, config_, clock_);
    const MonitoringSession* raw = session.get();
    session->set_exit_callback([this, device_id, raw] { on_session_exit(device_id, raw); });
    session->start();
    return session;
}

void SessionRegistry::retire_locked(
    std::map<std::string, std::unique_ptr<MonitoringSession>>::iterator it) {
    retired_.push_back(std::move(it->second));
    sessions_.erase(it);
}

bool SessionRegistry::is_live_locked(const std::string& device_id) const {
    if (restart_pending_.count(device_id) > 0) {
        return true;
    }
    auto it = sessions_.find(device_id);
    if (it == sessions_.end()) {
        return false;
    }
    SessionState state = it->second->state();
    return state == SessionState::STARTING || state == SessionState::ACTIVE;
}

void SessionRegistry::on_session_exit(const std::string& device_id,
                                      const MonitoringSession* session) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(device_id);
    if (it == sessions_.end() || it->second.get() != session) {
        return; // Already replaced or removed
    }
    if (restart_pending_.erase(device_id) == 0) {
        return;
    }

    spdlog::info("[SessionRegistry] Previous session of {} exited, launching queued restart",
                 device_id);
    retire_locked(it);
    sessions_[device_id] = launch_locked(device_id);
}

bool SessionRegistry::start_monitoring(const std::string& device_id) {
    SessionList finished;
    std::lock_guard<std::mutex> lock(mutex_);
    finished = take_stopped_locked();

    auto it = sessions_.find(device_id);
    if (it != sessions_.end()) {
        SessionState state = it->second->state();
        if (state == SessionState::STARTING || state == SessionState::ACTIVE) {
            spdlog::debug("[SessionRegistry] {} already {}, start ignored", device_id,
                          session_state_to_string(state));
            return false;
        }
        if (state == SessionState::STOPPING) {
            if (!restart_pending_.insert(device_id).second) {
                spdlog::debug("[SessionRegistry] Restart of {} already queued", device_id);
                return false;
            }
            spdlog::info("[SessionRegistry] {} still stopping, restart queued", device_id);
            return true;
        }
        // STOPPED, its loop thread may still be unwinding. This start also
        // satisfies a restart queued before the exit hook ran.
        restart_pending_.erase(device_id);
        retire_locked(it);
    }

    sessions_[device_id] = launch_locked(device_id);
    spdlog::info("[SessionRegistry] Monitoring started for {} ({} session(s))", device_id,
                 sessions_.size());
    return true;
}

bool SessionRegistry::stop_monitoring(const std::string& device_id) {
    SessionList finished;
    std::lock_guard<std::mutex> lock(mutex_);
    finished = take_stopped_locked();

    bool cancelled_restart = restart_pending_.erase(device_id) > 0;
    if (cancelled_restart) {
        spdlog::info("[SessionRegistry] Queued restart of {} cancelled", device_id);
    }

    auto it = sessions_.find(device_id);
    if (it == sessions_.end()) {
        if (!cancelled_restart) {
            spdlog::debug("[SessionRegistry] {} not monitored, stop ignored", device_id);
        }
        return cancelled_restart;
    }

    if (!it->second->request_stop()) {
        if (!cancelled_restart) {
            spdlog::debug("[SessionRegistry] {} already {}, stop ignored", device_id,
                          session_state_to_string(it->second->state()));
        }
        return cancelled_restart;
    }
    return true;
}

SessionState SessionRegistry::session_state(const std::string& device_id) {
    SessionList finished;
    std::lock_guard<std::mutex> lock(mutex_);
    finished = take_stopped_locked();

    auto it = sessions_.find(device_id);
    return it == sessions_.end() ? SessionState::STOPPED : it->second->state();
}

bool SessionRegistry::is_monitoring(const std::string& device_id) {
    SessionList finished;
    std::lock_guard<std::mutex> lock(mutex_);
    finished = take_stopped_locked();
    return is_live_locked(device_id);
}

std::vector<std::string> SessionRegistry::monitored_devices() {
    SessionList finished;
    std::vector<std::string> devices;
    std::lock_guard<std::mutex> lock(mutex_);
    finished = take_stopped_locked();

    for (const auto& [id, session] : sessions_) {
        if (is_live_locked(id)) {
            devices.push_back(id);
        }
    }
    return devices;
}

std::optional<SessionMetrics> SessionRegistry::metrics(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(device_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->metrics();
}

bool SessionRegistry::has_error(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(device_id);
    return it != sessions_.end() && it->second->has_error();
}

void SessionRegistry::stop_all() {
    SessionList all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        restart_pending_.clear();
        if (sessions_.empty() && retired_.empty()) {
            return;
        }
        spdlog::info("[SessionRegistry] Stopping {} session(s)", sessions_.size());
        for (auto& [id, session] : sessions_) {
            session->request_stop();
            all.push_back(std::move(session));
        }
        sessions_.clear();
        for (auto& session : retired_) {
            all.push_back(std::move(session));
        }
        retired_.clear();
    }

    SessionList own;
    for (auto& session : all) {
        if (session->on_loop_thread()) {
            own.push_back(std::move(session)); // Cannot join ourselves
            continue;
        }
        session->join();
    }
    all.clear();

    if (!own.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& session : own) {
            retired_.push_back(std::move(session));
        }
        spdlog::debug("[SessionRegistry] stop_all() called from a session thread, "
                      "its own session is destroyed later");
        return;
    }
    spdlog::debug("[SessionRegistry] All sessions stopped");
}

size_t SessionRegistry::retired_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_.size();
}

} // namespace printwatch
