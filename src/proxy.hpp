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

#include "config.hpp"
#include "event_reporter.hpp"
#include "event_store.hpp"
#include "request_filter.hpp"

#include <crow.h>

#include <string>

namespace contextfilter
{

/**
 * @brief Forwards requests to Ollama, filtering chat prompts on the way.
 *
 * This class manages the core proxy functionality, including:
 * - System prompt filtering for allow-listed models
 * - Emitting filter event records to stderr and the event store
 * - HTTP request forwarding to Ollama for every other path
 */
class ProxyHandler
{
public:
    /**
     * @brief Construct a new Proxy Handler object.
     * @param store Event store receiving one entry per chat request.
     * @param filter The request filter (holds the allow-list).
     * @param reporter Renders filter event records.
     */
    ProxyHandler(EventStore& store, const RequestFilter& filter, const EventReporter& reporter);
    ~ProxyHandler() = default;

    // Delete copy operations
    ProxyHandler(const ProxyHandler&) = delete;
    ProxyHandler& operator=(const ProxyHandler&) = delete;

    /**
     * @brief Filter a chat request and forward it to Ollama.
     *
     * Requests that cannot be decoded are forwarded unmodified.
     *
     * @param req The incoming Crow request.
     * @param res The Crow response object to populate.
     */
    void handleChatRequest(const crow::request& req, crow::response& res);

    /**
     * @brief Forward a request to Ollama verbatim.
     * @param req The incoming Crow request.
     * @param res The Crow response object to populate.
     */
    void handleRequest(const crow::request& req, crow::response& res);

    /**
     * @brief Outcome of running one request body through the filter.
     */
    struct FilteredBody
    {
        std::string body;
        std::string state;  ///< "FILTERED", "PASSTHROUGH" or "SKIPPED"
    };

    /**
     * @brief Decode, filter, report and re-encode a chat request body.
     * @param request_body The raw JSON request body.
     * @return FilteredBody The body to forward and the X-ContextFilter state.
     */
    [[nodiscard]] FilteredBody filterBody(const std::string& request_body);

private:
    void forwardToUpstream(
        const crow::request& req,
        crow::response& res,
        const std::string& body,
        const std::string& filter_state);

    const std::string ollama_host_ = Config::getOllamaHost();
    const int read_timeout_sec_ = Config::getUpstreamTimeout();
    EventStore& store_;
    const RequestFilter& filter_;
    const EventReporter& reporter_;
};

} // namespace contextfilter
