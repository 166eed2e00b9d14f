// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_state.h"
#include "monitor_error.h"

#include <chrono>
#include <functional>
#include <string>

namespace printwatch {

/**
 * @brief Outcome of one status fetch
 */
struct FetchResult {
    bool success = false;
    DeviceStateFragment fragment; ///< Valid when success
    MonitorError error;           ///< Set when !success

    static FetchResult ok(DeviceStateFragment fragment) {
        FetchResult r;
        r.success = true;
        r.fragment = std::move(fragment);
        return r;
    }

    static FetchResult failed(MonitorError error) {
        FetchResult r;
        r.success = false;
        r.error = std::move(error);
        return r;
    }
};

using FetchCallback = std::function<void(FetchResult)>;

/**
 * @brief Source of polled device status
 *
 * Implementations run the request off the caller's thread and invoke
 * on_complete exactly once, from any thread. The caller enforces its own hard
 * timeout and may abandon the request; a late on_complete must therefore be
 * safe to call after the caller stopped waiting (capture nothing by
 * reference).
 */
class DeviceStatusFetcher {
  public:
    virtual ~DeviceStatusFetcher() = default;

    /**
     * @brief Start an asynchronous status fetch
     *
     * @param device_id Device to query
     * @param timeout Hard timeout the caller will apply; implementations
     *                should bound their own I/O by it
     * @param on_complete Completion callback
     */
    virtual void fetch_status(const std::string& device_id, std::chrono::milliseconds timeout,
                              FetchCallback on_complete) = 0;
};

} // namespace printwatch
