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

#include "request_filter.hpp"

#include "token_estimator.hpp"

#include <algorithm>
#include <utility>

namespace contextfilter
{

double reductionPercent(size_t original, size_t filtered)
{
    if (original == 0)
    {
        return 0.0;
    }
    double percent = 100.0 * (1.0 - static_cast<double>(filtered) / static_cast<double>(original));
    return std::clamp(percent, 0.0, 100.0);
}

double RequestStats::reductionPercent() const
{
    return contextfilter::reductionPercent(original_chars, filtered_chars);
}

RequestFilter::RequestFilter(AllowList allow_list) : allow_list_(std::move(allow_list))
{
}

FilterResult RequestFilter::process(const ChatRequest& request) const
{
    if (request.model.empty())
    {
        throw InvalidRequest("request has no model id");
    }

    FilterResult result;
    result.stats.model = request.model;
    result.stats.message_count = request.messages.size();
    result.stats.received_at = std::chrono::system_clock::now();
    result.request.model = request.model;

    if (!shouldFilter(request.model, allow_list_))
    {
        result.stats.filtered = false;
        result.request.messages = request.messages;
        return result;
    }

    result.stats.filtered = true;
    result.request.messages.reserve(request.messages.size());

    for (size_t i = 0; i < request.messages.size(); ++i)
    {
        const auto& message = request.messages[i];
        if (message.role != Role::System)
        {
            result.stats.passthrough.push_back(
                {i, message.role, message.content.size(), estimateTokens(message.content)});
            result.request.messages.push_back(message);
            continue;
        }

        FilterOutcome outcome = filterPrompt(message.content);
        result.request.messages.push_back({message.role, outcome.filtered_text});

        auto& stats = result.stats;
        stats.original_chars += outcome.original_chars;
        stats.filtered_chars += outcome.filtered_chars;
        stats.original_tokens += outcome.original_tokens;
        stats.filtered_tokens += outcome.filtered_tokens;
        stats.filter_time += outcome.elapsed;
        stats.outcomes.push_back({i, std::move(outcome)});
    }

    return result;
}

} // namespace contextfilter
