// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_status_fetcher.h"

#include <atomic>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class Config;

namespace printwatch {

/**
 * @brief Where a printer's Moonraker HTTP API lives
 */
struct MoonrakerEndpoint {
    std::string host;
    int port = 7125;

    bool is_valid() const;
    std::string base_url() const;
};

/**
 * @brief DeviceStatusFetcher backed by Moonraker's objects query
 *
 * Issues GET /printer/objects/query for print_stats, display_status,
 * extruder, heater_bed and webhooks, and decodes the answer into a fragment.
 * Each request runs on its own tracked worker thread with the HTTP timeout
 * taken from the fetch timeout; callbacks are invoked from that thread.
 *
 * Destruction joins outstanding workers, so callbacks complete before the
 * fetcher goes away.
 */
class MoonrakerStatusFetcher : public DeviceStatusFetcher {
  public:
    explicit MoonrakerStatusFetcher(WallClock clock = system_now);
    ~MoonrakerStatusFetcher() override;

    MoonrakerStatusFetcher(const MoonrakerStatusFetcher&) = delete;
    MoonrakerStatusFetcher& operator=(const MoonrakerStatusFetcher&) = delete;

    /**
     * @brief Register or replace a printer's endpoint
     * @return false (and nothing stored) if host or port is invalid
     */
    bool set_endpoint(const std::string& device_id, const MoonrakerEndpoint& endpoint);

    /**
     * @brief Register every printer under /printers in the config
     * @return Number of endpoints registered
     */
    size_t load_from_config(Config& config);

    bool has_endpoint(const std::string& device_id) const;

    void fetch_status(const std::string& device_id, std::chrono::milliseconds timeout,
                      FetchCallback on_complete) override;

    /// Full objects query URL for an endpoint
    static std::string status_query_url(const MoonrakerEndpoint& endpoint);

  private:
    struct HttpWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void launch_http_thread(std::function<void()> func);

    WallClock clock_;

    mutable std::mutex endpoints_mutex_;
    std::map<std::string, MoonrakerEndpoint> endpoints_;

    std::mutex http_threads_mutex_;
    std::list<HttpWorker> http_threads_;
    std::atomic<bool> shutting_down_{false};
};

} // namespace printwatch
