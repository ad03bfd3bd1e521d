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

#include "proxy.hpp"

#include "chat_codec.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>

namespace contextfilter
{

namespace
{

std::string lowercase(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Hop-by-hop or recomputed headers that must not be copied across
bool isSkippedRequestHeader(const std::string& name)
{
    std::string lowered = lowercase(name);
    return lowered == "host" || lowered == "content-length" || lowered == "accept-encoding";
}

bool isSkippedResponseHeader(const std::string& name)
{
    std::string lowered = lowercase(name);
    return lowered == "transfer-encoding" || lowered == "content-encoding" ||
           lowered == "content-length" || lowered == "connection";
}

}  // namespace

ProxyHandler::ProxyHandler(
    EventStore& store,
    const RequestFilter& filter,
    const EventReporter& reporter)
    : store_(store), filter_(filter), reporter_(reporter)
{
}

ProxyHandler::FilteredBody ProxyHandler::filterBody(const std::string& request_body)
{
    try
    {
        ChatRequest request = decodeChatRequest(request_body);
        FilterResult result = filter_.process(request);

        auto records = reporter_.render(result.stats);
        for (const auto& record : records)
        {
            std::cerr << record << std::endl;
        }
        store_.logRequestAsync(result.stats, records);

        if (!result.stats.filtered)
        {
            return {request_body, "PASSTHROUGH"};
        }
        return {encodeChatRequest(request_body, result.request), "FILTERED"};
    }
    catch (const InvalidRequest& e)
    {
        // Filtering is an optimization; never block the request over it
        std::cerr << EventReporter::kTag << " SKIPPED forwarding unmodified request: "
                  << e.what() << std::endl;
        return {request_body, "SKIPPED"};
    }
}

void ProxyHandler::handleChatRequest(const crow::request& req, crow::response& res)
{
    // Capture request body early (before res.end() which may invalidate req)
    std::string request_body_copy = req.body;

    FilteredBody filtered = filterBody(request_body_copy);
    forwardToUpstream(req, res, filtered.body, filtered.state);
}

void ProxyHandler::handleRequest(const crow::request& req, crow::response& res)
{
    std::string request_body_copy = req.body;
    forwardToUpstream(req, res, request_body_copy, "");
}

void ProxyHandler::forwardToUpstream(
    const crow::request& req,
    crow::response& res,
    const std::string& body,
    const std::string& filter_state)
{
    std::string method = crow::method_name(req.method);
    std::cout << "Forwarding " << method << " " << ollama_host_ << req.raw_url << std::endl;

    httplib::Client cli(ollama_host_);
    cli.set_connection_timeout(Config::kConnectionTimeoutSec, 0);
    cli.set_read_timeout(read_timeout_sec_, 0);

    httplib::Request req_http;
    req_http.method = method;
    req_http.path = req.raw_url;
    req_http.body = body;
    for (const auto& [name, value] : req.headers)
    {
        if (!isSkippedRequestHeader(name))
        {
            req_http.set_header(name, value);
        }
    }

    auto* res_ptr = &res;

    // Collect the upstream body; it is returned to the client once complete
    req_http.content_receiver = [res_ptr](const char* data,
                                          size_t data_length,
                                          uint64_t /*offset*/,
                                          uint64_t /*total_length*/)
    {
        res_ptr->body.append(data, data_length);
        return true;  // Continue processing
    };

    auto result = cli.send(req_http);

    if (result)
    {
        res.code = result->status;
        for (const auto& [name, value] : result->headers)
        {
            if (!isSkippedResponseHeader(name))
            {
                res.add_header(name, value);
            }
        }
    }
    else
    {
        res.code = 502;
        res.body = "Error forwarding request to Ollama: " + httplib::to_string(result.error());
        res.set_header("Content-Type", "text/plain");
        std::cerr << res.body << std::endl;
    }

    if (!filter_state.empty())
    {
        res.set_header("X-ContextFilter", filter_state);
    }
    res.end();
}

} // namespace contextfilter
