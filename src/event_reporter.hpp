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

#include <chrono>
#include <string>
#include <vector>

namespace contextfilter
{

/**
 * @brief Output options for filter event records.
 */
struct ReportConfig
{
    bool detailed_logging = true;    ///< Emit per-message ORIGINAL/REMOVED/FILTERED records
    bool show_full_content = false;  ///< Show the whole filtered prompt instead of a preview
    size_t max_preview_chars = 500;
};

/**
 * @brief Turns request stats into ordered, human-readable log records.
 *
 * Rendering only. Writing the records somewhere is up to the caller.
 */
class EventReporter
{
public:
    explicit EventReporter(ReportConfig config = {});

    /**
     * @brief Render the records describing one request.
     *
     * A filtered request yields START, then per system message ORIGINAL,
     * one REMOVED per section and FILTERED (when detailed logging is on),
     * then SUMMARY. A passthrough request yields a single PASSTHROUGH record.
     *
     * @param stats Stats produced by RequestFilter::process.
     * @return std::vector<std::string> Records in emission order.
     */
    [[nodiscard]] std::vector<std::string> render(const RequestStats& stats) const;

    /**
     * @brief Cut a text to the configured preview length.
     * @return std::string The text, or its prefix followed by
     *         "... [N more chars omitted]".
     */
    [[nodiscard]] std::string preview(const std::string& text) const;

    [[nodiscard]] const ReportConfig& config() const
    {
        return config_;
    }

    static constexpr const char* kTag = "[FILTER]";

private:
    [[nodiscard]] std::string renderStart(const RequestStats& stats) const;
    void renderMessage(const FilteredMessage& message, std::vector<std::string>& records) const;
    [[nodiscard]] std::string renderSummary(const RequestStats& stats) const;

    const ReportConfig config_;
};

/**
 * @brief Format a wall-clock time as UTC ISO-8601 ("2025-11-26T10:15:00Z").
 */
[[nodiscard]] std::string formatUtcTime(std::chrono::system_clock::time_point time);

/**
 * @brief Summarize removed sections as "kind:size, kind:size".
 */
[[nodiscard]] std::string describeRemovedSections(const RequestStats& stats);

} // namespace contextfilter
