/*
 * ContextFilter - Prompt Context Filter Proxy for Local LLMs
 * Copyright (c) 2025 ParticleSector.com
 *
 * This software is dual-licensed:
 * - GPL-3.0 for open source use
 * - Commercial license for proprietary use
 *
 * SPDX-License-Identifier: GPL-3.0-only OR LicenseRef-ParticleSector-Commercial
 */

#pragma once

#include "request_filter.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <sqlite3.h>
#include <string>
#include <thread>
#include <vector>

namespace contextfilter
{

/**
 * @brief One stored filter event (one proxied chat request).
 */
struct EventEntry
{
    int id = 0;
    std::string timestamp;
    std::string model;
    bool filtered = false;
    long long original_chars = 0;
    long long filtered_chars = 0;
    long long original_tokens = 0;
    long long filtered_tokens = 0;
    double reduction_percent = 0.0;
    std::string sections_removed;
    double filter_time_ms = 0.0;
    std::string records;
};

/**
 * @brief Aggregated figures over the stored events.
 */
struct EventMetrics
{
    int total_requests = 0;
    int filtered_requests = 0;
    double avg_reduction_percent = 0.0;
    long long chars_saved = 0;
};

/**
 * @brief SQLite sink for filter events.
 *
 * Uses WAL mode and an async write queue so that logging never delays the
 * forwarded request.
 */
class EventStore
{
public:
    EventStore();
    ~EventStore();

    EventStore(const EventStore&) = delete;
    EventStore& operator=(const EventStore&) = delete;

    /**
     * @brief Open the database, create tables and start the writer thread.
     * @param db_path Path to the SQLite database file (":memory:" works too).
     * @return std::optional<std::string> std::nullopt on success, error message on failure.
     */
    std::optional<std::string> init(const std::string& db_path = "contextfilter.db");

    /**
     * @brief Queue a request's stats and rendered records for storage.
     * @param stats Stats from RequestFilter::process.
     * @param records Records from EventReporter::render.
     */
    void logRequestAsync(const RequestStats& stats, const std::vector<std::string>& records);

    /**
     * @brief Block until every queued write has been executed.
     */
    void flush();

    /**
     * @brief Retrieve recent events, newest first.
     * @param limit Maximum number of events to retrieve.
     * @return std::optional<std::vector<EventEntry>> Events on success, nullopt on failure.
     */
    [[nodiscard]] std::optional<std::vector<EventEntry>> getEvents(int limit = 50);

    /**
     * @brief Get a specific event by ID.
     * @param id The event ID.
     * @return std::optional<EventEntry> The event if found, nullopt otherwise.
     */
    [[nodiscard]] std::optional<EventEntry> getEvent(int id);

    [[nodiscard]] EventMetrics getMetrics();

    static constexpr int kMaxHistoryEntries = 100;

private:
    /**
     * @brief Internal synchronous insert (called by the writer thread).
     */
    std::optional<std::string> insertEvent(const EventEntry& entry);

    /**
     * @brief Run one queued task, waiting for one if the queue is empty.
     * @return bool False once shutdown was requested and the queue is drained.
     */
    bool processWriteQueue();

    sqlite3* db_ = nullptr;

    // Async write queue
    std::queue<std::function<void()>> write_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    bool task_running_ = false;
    std::jthread write_worker_;
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace contextfilter
