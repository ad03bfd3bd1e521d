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

#include "event_store.hpp"

#include "event_reporter.hpp"

#include <iostream>

namespace contextfilter
{

namespace
{

std::string columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

EventEntry readEntry(sqlite3_stmt* stmt)
{
    EventEntry entry;
    entry.id = sqlite3_column_int(stmt, 0);
    entry.timestamp = columnText(stmt, 1);
    entry.model = columnText(stmt, 2);
    entry.filtered = sqlite3_column_int(stmt, 3) != 0;
    entry.original_chars = sqlite3_column_int64(stmt, 4);
    entry.filtered_chars = sqlite3_column_int64(stmt, 5);
    entry.original_tokens = sqlite3_column_int64(stmt, 6);
    entry.filtered_tokens = sqlite3_column_int64(stmt, 7);
    entry.reduction_percent = sqlite3_column_double(stmt, 8);
    entry.sections_removed = columnText(stmt, 9);
    entry.filter_time_ms = sqlite3_column_double(stmt, 10);
    entry.records = columnText(stmt, 11);
    return entry;
}

constexpr const char* kSelectColumns =
    "SELECT id, timestamp, model, filtered, original_chars, filtered_chars, "
    "original_tokens, filtered_tokens, reduction_percent, sections_removed, "
    "filter_time_ms, records FROM filter_events ";

}  // namespace

EventStore::EventStore()
{
}

EventStore::~EventStore()
{
    // Let the writer drain the queue before the handle goes away
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_ = true;
    }
    queue_cv_.notify_one();

    if (write_worker_.joinable())
    {
        write_worker_.join();
    }

    if (db_)
    {
        sqlite3_close(db_);
    }
}

std::optional<std::string> EventStore::init(const std::string& db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc)
    {
        std::string err = "Can't open database: " + std::string(sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    // Enable WAL mode for concurrent write support
    char* wal_err = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &wal_err);
    if (rc != SQLITE_OK)
    {
        std::cerr << "Warning: Failed to enable WAL mode: "
                  << (wal_err ? wal_err : "unknown error") << std::endl;
        if (wal_err)
        {
            sqlite3_free(wal_err);
        }
    }

    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS filter_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT,
            model TEXT,
            filtered INTEGER DEFAULT 0,
            original_chars INTEGER DEFAULT 0,
            filtered_chars INTEGER DEFAULT 0,
            original_tokens INTEGER DEFAULT 0,
            filtered_tokens INTEGER DEFAULT 0,
            reduction_percent REAL DEFAULT 0,
            sections_removed TEXT,
            filter_time_ms REAL DEFAULT 0,
            records TEXT
        );
    )";

    char* err_msg = nullptr;
    rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string err = "SQL error: " + std::string(err_msg ? err_msg : "unknown error");
        sqlite3_free(err_msg);
        return err;
    }

    // Start the async write worker thread
    write_worker_ = std::jthread([this]
    {
        while (processWriteQueue())
        {
        }
    });

    return std::nullopt;
}

bool EventStore::processWriteQueue()
{
    std::function<void()> task;

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait(lock, [this]
        {
            return !write_queue_.empty() || shutdown_requested_;
        });

        if (write_queue_.empty())
        {
            return false;
        }

        task = std::move(write_queue_.front());
        write_queue_.pop();
        task_running_ = true;
    }

    // Execute the task outside the lock
    if (task)
    {
        task();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_running_ = false;
    }
    idle_cv_.notify_all();
    return true;
}

void EventStore::flush()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]
    {
        return (write_queue_.empty() && !task_running_) || !write_worker_.joinable();
    });
}

void EventStore::logRequestAsync(
    const RequestStats& stats,
    const std::vector<std::string>& records)
{
    EventEntry entry;
    entry.timestamp = formatUtcTime(stats.received_at);
    entry.model = stats.model;
    entry.filtered = stats.filtered;
    entry.original_chars = static_cast<long long>(stats.original_chars);
    entry.filtered_chars = static_cast<long long>(stats.filtered_chars);
    entry.original_tokens = static_cast<long long>(stats.original_tokens);
    entry.filtered_tokens = static_cast<long long>(stats.filtered_tokens);
    entry.reduction_percent = stats.reductionPercent();
    entry.sections_removed = describeRemovedSections(stats);
    entry.filter_time_ms = stats.filterTimeMs();
    for (const auto& record : records)
    {
        entry.records += record;
        entry.records += '\n';
    }

    // Capture the entry by value for the async task
    auto task = [this, entry = std::move(entry)]()
    {
        auto result = insertEvent(entry);
        if (result)
        {
            std::cerr << "Async event log failed: " << *result << std::endl;
        }
    };

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

std::optional<std::string> EventStore::insertEvent(const EventEntry& entry)
{
    if (!db_)
    {
        return "Database not initialized";
    }

    const char* sql =
        "INSERT INTO filter_events (timestamp, model, filtered, original_chars, "
        "filtered_chars, original_tokens, filtered_tokens, reduction_percent, "
        "sections_removed, filter_time_ms, records) VALUES "
        "(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        return "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_));
    }

    sqlite3_bind_text(stmt, 1, entry.timestamp.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, entry.model.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, entry.filtered ? 1 : 0);
    sqlite3_bind_int64(stmt, 4, entry.original_chars);
    sqlite3_bind_int64(stmt, 5, entry.filtered_chars);
    sqlite3_bind_int64(stmt, 6, entry.original_tokens);
    sqlite3_bind_int64(stmt, 7, entry.filtered_tokens);
    sqlite3_bind_double(stmt, 8, entry.reduction_percent);
    sqlite3_bind_text(stmt, 9, entry.sections_removed.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 10, entry.filter_time_ms);
    sqlite3_bind_text(stmt, 11, entry.records.c_str(), -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
    {
        std::string err = "Execution failed: " + std::string(sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return err;
    }
    sqlite3_finalize(stmt);

    // Enforce History Limit (Keep last kMaxHistoryEntries)
    const char* delete_sql =
        "DELETE FROM filter_events WHERE id NOT IN ("
        "SELECT id FROM filter_events ORDER BY id DESC LIMIT ?)";

    sqlite3_stmt* delete_stmt;
    rc = sqlite3_prepare_v2(db_, delete_sql, -1, &delete_stmt, nullptr);
    if (rc == SQLITE_OK)
    {
        sqlite3_bind_int(delete_stmt, 1, kMaxHistoryEntries);
        rc = sqlite3_step(delete_stmt);
        if (rc != SQLITE_DONE)
        {
            std::cerr << "Failed to enforce history limit: "
                      << sqlite3_errmsg(db_) << std::endl;
        }
        sqlite3_finalize(delete_stmt);
    }

    return std::nullopt;
}

std::optional<std::vector<EventEntry>> EventStore::getEvents(int limit)
{
    if (!db_)
    {
        return std::nullopt;
    }

    std::string sql = std::string(kSelectColumns) + "ORDER BY id DESC LIMIT ?";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return std::nullopt;
    }

    sqlite3_bind_int(stmt, 1, limit);

    std::vector<EventEntry> events;
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        events.push_back(readEntry(stmt));
    }

    sqlite3_finalize(stmt);
    return events;
}

std::optional<EventEntry> EventStore::getEvent(int id)
{
    if (!db_)
    {
        return std::nullopt;
    }

    std::string sql = std::string(kSelectColumns) + "WHERE id = ?";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        return std::nullopt;
    }

    sqlite3_bind_int(stmt, 1, id);

    std::optional<EventEntry> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = readEntry(stmt);
    }

    sqlite3_finalize(stmt);
    return result;
}

EventMetrics EventStore::getMetrics()
{
    EventMetrics m;
    if (!db_)
    {
        return m;
    }

    // Averages and savings only count filtered requests
    const char* sql =
        "SELECT COUNT(*), "
        "COALESCE(SUM(filtered), 0), "
        "COALESCE(AVG(CASE WHEN filtered = 1 THEN reduction_percent END), 0), "
        "COALESCE(SUM(CASE WHEN filtered = 1 AND original_chars > filtered_chars "
        "THEN original_chars - filtered_chars ELSE 0 END), 0) "
        "FROM filter_events";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK)
    {
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            m.total_requests = sqlite3_column_int(stmt, 0);
            m.filtered_requests = sqlite3_column_int(stmt, 1);
            m.avg_reduction_percent = sqlite3_column_double(stmt, 2);
            m.chars_saved = sqlite3_column_int64(stmt, 3);
        }
        sqlite3_finalize(stmt);
    }

    return m;
}

} // namespace contextfilter
