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

#include "chat_types.hpp"
#include "filter_policy.hpp"
#include "prompt_filter.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace contextfilter
{

/**
 * @brief A system message that went through the prompt filter.
 */
struct FilteredMessage
{
    size_t index = 0;
    FilterOutcome outcome;
};

/**
 * @brief A non-system message of a filtered request, left untouched.
 */
struct PassthroughNote
{
    size_t index = 0;
    Role role = Role::User;
    size_t chars = 0;
    size_t tokens = 0;
};

/**
 * @brief Per-request filtering statistics, handed to the reporter and dropped.
 *
 * Totals cover filtered (system) messages only.
 */
struct RequestStats
{
    std::string model;
    bool filtered = false;
    size_t message_count = 0;
    std::chrono::system_clock::time_point received_at;

    std::vector<FilteredMessage> outcomes;
    std::vector<PassthroughNote> passthrough;

    size_t original_chars = 0;
    size_t filtered_chars = 0;
    size_t original_tokens = 0;
    size_t filtered_tokens = 0;
    std::chrono::nanoseconds filter_time{0};

    [[nodiscard]] double reductionPercent() const;

    [[nodiscard]] double filterTimeMs() const
    {
        return std::chrono::duration<double, std::milli>(filter_time).count();
    }
};

/**
 * @brief Size reduction in percent, clamped to [0, 100].
 *
 * Returns 0 when original is 0, and when filtering made the text grow.
 */
[[nodiscard]] double reductionPercent(size_t original, size_t filtered);

/**
 * @brief Rewritten request together with the stats describing the rewrite.
 */
struct FilterResult
{
    ChatRequest request;
    RequestStats stats;
};

/**
 * @brief Applies the prompt filter to the system messages of allow-listed models.
 *
 * Holds only the read-only allow-list, so one instance can serve any number
 * of callers.
 */
class RequestFilter
{
public:
    explicit RequestFilter(AllowList allow_list);

    /**
     * @brief Filter one chat request.
     *
     * Message count, order and roles are always preserved. Only system
     * message content changes, and only for allow-listed models.
     *
     * @param request The inbound request.
     * @return FilterResult The rewritten request and its stats.
     * @throws InvalidRequest If the request has no model id.
     */
    [[nodiscard]] FilterResult process(const ChatRequest& request) const;

    [[nodiscard]] const AllowList& allowList() const
    {
        return allow_list_;
    }

private:
    const AllowList allow_list_;
};

} // namespace contextfilter
