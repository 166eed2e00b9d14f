// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file moonraker_status_fetcher.cpp
 * @brief Polled printer status over Moonraker's HTTP API
 *
 * Thread safety: Callbacks are invoked from background HTTP threads. During
 * destruction, pending threads are joined, so callbacks complete before the
 * fetcher is destroyed. Each thread is bounded by its request timeout.
 */

#include "moonraker_status_fetcher.h"

#include "config.h"
#include "device_state_json.h"
#include "hv/requests.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace printwatch {

namespace {

constexpr const char* STATUS_QUERY_PATH =
    "/printer/objects/query?print_stats&display_status&extruder&heater_bed&webhooks";

/**
 * @brief Reject hosts that could smuggle a path or header into the URL
 */
bool is_safe_host(const std::string& host) {
    if (host.empty()) {
        return false;
    }
    for (char c : host) {
        if (c == '/' || c == '\n' || c == '\r' || c == '\0' || c == ' ' || c == '?' ||
            c == '#' || c == '@') {
            return false;
        }
    }
    return true;
}

} // namespace

bool MoonrakerEndpoint::is_valid() const {
    return is_safe_host(host) && port > 0 && port <= 65535;
}

std::string MoonrakerEndpoint::base_url() const {
    return "http://" + host + ":" + std::to_string(port);
}

// ============================================================================
// MoonrakerStatusFetcher Implementation
// ============================================================================

MoonrakerStatusFetcher::MoonrakerStatusFetcher(WallClock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = system_now;
    }
}

MoonrakerStatusFetcher::~MoonrakerStatusFetcher() {
    shutting_down_.store(true);

    std::list<HttpWorker> threads_to_join;
    {
        std::lock_guard<std::mutex> lock(http_threads_mutex_);
        threads_to_join = std::move(http_threads_);
    }

    if (threads_to_join.empty()) {
        return;
    }

    spdlog::debug("[MoonrakerStatusFetcher] Waiting for {} HTTP thread(s) to finish...",
                  threads_to_join.size());
    for (auto& worker : threads_to_join) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

bool MoonrakerStatusFetcher::set_endpoint(const std::string& device_id,
                                          const MoonrakerEndpoint& endpoint) {
    if (!endpoint.is_valid()) {
        spdlog::error("[MoonrakerStatusFetcher] Invalid endpoint for {}: host='{}' port={}",
                      device_id, endpoint.host, endpoint.port);
        return false;
    }

    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    endpoints_[device_id] = endpoint;
    spdlog::debug("[MoonrakerStatusFetcher] {} -> {}", device_id, endpoint.base_url());
    return true;
}

size_t MoonrakerStatusFetcher::load_from_config(Config& config) {
    size_t loaded = 0;
    for (const auto& id : config.printer_ids()) {
        std::string prefix = Config::printer_path(id);
        MoonrakerEndpoint endpoint;
        endpoint.host = config.get<std::string>(prefix + "moonraker_host", "");
        endpoint.port = config.get<int>(prefix + "moonraker_port", 7125);
        if (set_endpoint(id, endpoint)) {
            loaded++;
        }
    }
    spdlog::info("[MoonrakerStatusFetcher] {} printer endpoint(s) configured", loaded);
    return loaded;
}

bool MoonrakerStatusFetcher::has_endpoint(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    return endpoints_.count(device_id) > 0;
}

std::string MoonrakerStatusFetcher::status_query_url(const MoonrakerEndpoint& endpoint) {
    return endpoint.base_url() + STATUS_QUERY_PATH;
}

void MoonrakerStatusFetcher::launch_http_thread(std::function<void()> func) {
    std::lock_guard<std::mutex> lock(http_threads_mutex_);

    // Clean up finished threads
    for (auto it = http_threads_.begin(); it != http_threads_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = http_threads_.erase(it);
        } else {
            ++it;
        }
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    HttpWorker worker;
    worker.done = done;
    worker.thread = std::thread([func = std::move(func), done]() {
        func();
        done->store(true);
    });
    http_threads_.push_back(std::move(worker));
}

void MoonrakerStatusFetcher::fetch_status(const std::string& device_id,
                                          std::chrono::milliseconds timeout,
                                          FetchCallback on_complete) {
    if (!on_complete) {
        spdlog::warn("[MoonrakerStatusFetcher] fetch_status for {} without callback", device_id);
        return;
    }

    MoonrakerEndpoint endpoint;
    {
        std::lock_guard<std::mutex> lock(endpoints_mutex_);
        auto it = endpoints_.find(device_id);
        if (it == endpoints_.end()) {
            on_complete(FetchResult::failed(
                MonitorError::transient(device_id, "No Moonraker endpoint configured")));
            return;
        }
        endpoint = it->second;
    }

    if (shutting_down_.load()) {
        on_complete(FetchResult::failed(MonitorError::transient(device_id, "Shutting down")));
        return;
    }

    std::string url = status_query_url(endpoint);
    // libhv timeouts are whole seconds
    int timeout_sec = static_cast<int>(std::max<int64_t>(1, (timeout.count() + 999) / 1000));
    WallClock clock = clock_;

    spdlog::trace("[MoonrakerStatusFetcher] GET {}", url);

    launch_http_thread([device_id, url, timeout_sec, clock, on_complete]() {
        auto req = std::make_shared<HttpRequest>();
        req->method = HTTP_GET;
        req->url = url;
        req->timeout = timeout_sec;

        auto resp = requests::request(req);

        if (!resp) {
            spdlog::debug("[MoonrakerStatusFetcher] GET failed (no response): {}", url);
            on_complete(FetchResult::failed(
                MonitorError::transient(device_id, "HTTP request failed - no response")));
            return;
        }

        int status_code = static_cast<int>(resp->status_code);
        if (status_code < 200 || status_code >= 300) {
            spdlog::debug("[MoonrakerStatusFetcher] GET {} returned HTTP {}", url, status_code);
            on_complete(FetchResult::failed(
                MonitorError::transient(device_id, "HTTP " + std::to_string(status_code))));
            return;
        }

        json body;
        try {
            body = json::parse(resp->body);
        } catch (const json::parse_error& e) {
            spdlog::debug("[MoonrakerStatusFetcher] Response from {} is not JSON: {}", url,
                          e.what());
            on_complete(FetchResult::failed(
                MonitorError::parse_error("malformed status response", device_id)));
            return;
        }

        json::json_pointer status_ptr("/result/status");
        if (!body.is_object() || !body.contains(status_ptr) || !body[status_ptr].is_object()) {
            on_complete(FetchResult::failed(
                MonitorError::parse_error("status response missing result.status", device_id)));
            return;
        }

        on_complete(FetchResult::ok(fragment_from_moonraker_status(body[status_ptr], clock())));
    });
}

} // namespace printwatch
