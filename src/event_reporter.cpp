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

#include "event_reporter.hpp"

#include "token_estimator.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace contextfilter
{

EventReporter::EventReporter(ReportConfig config) : config_(config)
{
}

std::string formatUtcTime(std::chrono::system_clock::time_point time)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::string describeRemovedSections(const RequestStats& stats)
{
    std::ostringstream out;
    bool first = true;
    for (const auto& message : stats.outcomes)
    {
        for (const auto& section : message.outcome.removed)
        {
            if (!first)
            {
                out << ", ";
            }
            out << sectionKindName(section.kind) << ':' << section.size();
            first = false;
        }
    }
    return out.str();
}

std::string EventReporter::preview(const std::string& text) const
{
    if (text.size() <= config_.max_preview_chars)
    {
        return text;
    }
    size_t omitted = text.size() - config_.max_preview_chars;
    return text.substr(0, config_.max_preview_chars) + "... [" + std::to_string(omitted) +
           " more chars omitted]";
}

std::vector<std::string> EventReporter::render(const RequestStats& stats) const
{
    std::vector<std::string> records;

    if (!stats.filtered)
    {
        records.push_back(std::string(kTag) + " PASSTHROUGH model=" + stats.model +
                          " reason=not in allow-list");
        return records;
    }

    records.push_back(renderStart(stats));
    if (config_.detailed_logging)
    {
        for (const auto& message : stats.outcomes)
        {
            renderMessage(message, records);
        }
    }
    records.push_back(renderSummary(stats));
    return records;
}

std::string EventReporter::renderStart(const RequestStats& stats) const
{
    std::ostringstream out;
    out << kTag << " START model=" << stats.model
        << " time=" << formatUtcTime(stats.received_at)
        << " messages=" << stats.message_count
        << " system_messages=" << stats.outcomes.size();
    return out.str();
}

void EventReporter::renderMessage(
    const FilteredMessage& message,
    std::vector<std::string>& records) const
{
    const auto& outcome = message.outcome;

    std::ostringstream original;
    original << kTag << " ORIGINAL message=" << message.index
             << " size=" << outcome.original_chars << " chars"
             << " tokens=~" << outcome.original_tokens << '\n'
             << preview(outcome.original_text);
    records.push_back(original.str());

    for (const auto& section : outcome.removed)
    {
        std::ostringstream removed;
        removed << kTag << " REMOVED message=" << message.index
                << " section=" << sectionKindName(section.kind)
                << " size=" << section.size() << " chars"
                << " tokens=~" << estimateTokens(section.text) << '\n'
                << preview(section.text);
        records.push_back(removed.str());
    }

    std::ostringstream filtered;
    filtered << kTag << " FILTERED message=" << message.index
             << " size=" << outcome.filtered_chars << " chars"
             << " tokens=~" << outcome.filtered_tokens << '\n'
             << (config_.show_full_content ? outcome.filtered_text
                                           : preview(outcome.filtered_text));
    records.push_back(filtered.str());
}

std::string EventReporter::renderSummary(const RequestStats& stats) const
{
    std::ostringstream out;
    out << kTag << " SUMMARY model=" << stats.model
        << " original=" << stats.original_chars << " chars (~" << stats.original_tokens << " tokens)"
        << " filtered=" << stats.filtered_chars << " chars (~" << stats.filtered_tokens << " tokens)"
        << " reduction=" << std::fixed << std::setprecision(1) << stats.reductionPercent() << '%'
        << " removed=[" << describeRemovedSections(stats) << ']'
        << " time=" << std::setprecision(3) << stats.filterTimeMs() << "ms";
    return out.str();
}

} // namespace contextfilter
