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

#include "config.hpp"
#include "event_reporter.hpp"
#include "event_store.hpp"
#include "proxy.hpp"
#include "request_filter.hpp"
#include "version.hpp"

#include <crow.h>
#include <crow/middlewares/cors.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace
{

/**
 * @brief Serialize an event entry for the introspection API.
 * @param entry The stored event.
 * @param with_records Include the rendered records.
 */
crow::json::wvalue eventToJson(const contextfilter::EventEntry& entry, bool with_records)
{
    crow::json::wvalue json;
    json["id"] = entry.id;
    json["timestamp"] = entry.timestamp;
    json["model"] = entry.model;
    json["filtered"] = entry.filtered;
    json["original_chars"] = entry.original_chars;
    json["filtered_chars"] = entry.filtered_chars;
    json["original_tokens"] = entry.original_tokens;
    json["filtered_tokens"] = entry.filtered_tokens;
    json["reduction_percent"] = entry.reduction_percent;
    json["sections_removed"] = entry.sections_removed;
    json["filter_time_ms"] = entry.filter_time_ms;
    if (with_records)
    {
        json["records"] = entry.records;
    }
    return json;
}

std::vector<std::string> sortedModels(const contextfilter::AllowList& allow_list)
{
    std::vector<std::string> models(allow_list.begin(), allow_list.end());
    std::sort(models.begin(), models.end());
    return models;
}

}  // namespace

int main()
{
    crow::App<crow::CORSHandler> app;
    app.loglevel(crow::LogLevel::Warning);

    // Answer browser preflights the same way for every path
    auto& cors = app.get_middleware<crow::CORSHandler>();
    cors.global()
        .origin("*")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
        .headers("Content-Type");

    contextfilter::EventStore store;
    if (auto err = store.init(contextfilter::Config::getDatabasePath()))
    {
        std::cerr << "Failed to init event store: " << *err << std::endl;
        return 1;
    }

    const contextfilter::RequestFilter request_filter(contextfilter::Config::getAllowList());
    const contextfilter::EventReporter reporter(contextfilter::Config::getReportConfig());
    contextfilter::ProxyHandler proxy_handler(store, request_filter, reporter);

    // API Routes - Chat requests, filtered for allow-listed models
    CROW_ROUTE(app, "/v1/chat/completions")
        .methods(crow::HTTPMethod::POST)(
            [&proxy_handler](const crow::request& req, crow::response& res)
            {
                proxy_handler.handleChatRequest(req, res);
            });

    CROW_ROUTE(app, "/api/chat")
        .methods(crow::HTTPMethod::POST)(
            [&proxy_handler](const crow::request& req, crow::response& res)
            {
                proxy_handler.handleChatRequest(req, res);
            });

    // Introspection Routes - Events
    CROW_ROUTE(app, "/_contextfilter/events")([&store]()
    {
        auto events_opt = store.getEvents();
        if (!events_opt)
        {
            return crow::response(500);
        }

        std::vector<crow::json::wvalue> event_list;
        for (const auto& entry : *events_opt)
        {
            event_list.push_back(eventToJson(entry, false));
        }

        crow::json::wvalue json_response = std::move(event_list);
        return crow::response(json_response);
    });

    CROW_ROUTE(app, "/_contextfilter/events/<int>")([&store](int id)
    {
        auto event_opt = store.getEvent(id);
        if (!event_opt)
        {
            return crow::response(404, "Event not found");
        }
        crow::json::wvalue json_response = eventToJson(*event_opt, true);
        return crow::response(json_response);
    });

    // Introspection Routes - Metrics
    CROW_ROUTE(app, "/_contextfilter/metrics")([&store]()
    {
        auto metrics = store.getMetrics();
        crow::json::wvalue json_response;
        json_response["total_requests"] = metrics.total_requests;
        json_response["filtered_requests"] = metrics.filtered_requests;
        json_response["avg_reduction_percent"] = metrics.avg_reduction_percent;
        json_response["chars_saved"] = metrics.chars_saved;
        return crow::response(json_response);
    });

    // Introspection Routes - Version
    CROW_ROUTE(app, "/_contextfilter/version")([]()
    {
        crow::json::wvalue json_response;
        json_response["version"] = contextfilter::Version::kString;
        json_response["major"] = contextfilter::Version::kMajor;
        json_response["minor"] = contextfilter::Version::kMinor;
        json_response["patch"] = contextfilter::Version::kPatch;
        return crow::response(json_response);
    });

    // Introspection Routes - Effective configuration
    CROW_ROUTE(app, "/_contextfilter/config")([&request_filter, &reporter]()
    {
        const auto& report_config = reporter.config();
        crow::json::wvalue json_response;
        json_response["models"] = sortedModels(request_filter.allowList());
        json_response["detailed_logging"] = report_config.detailed_logging;
        json_response["show_full_content"] = report_config.show_full_content;
        json_response["max_preview_chars"] = report_config.max_preview_chars;
        json_response["upstream"] = contextfilter::Config::getOllamaHost();
        return crow::response(json_response);
    });

    // Everything else goes to Ollama untouched
    CROW_CATCHALL_ROUTE(app)(
        [&proxy_handler](const crow::request& req, crow::response& res)
        {
            proxy_handler.handleRequest(req, res);
        });

    int port = contextfilter::Config::getPort();
    std::cout << "ContextFilter v" << contextfilter::Version::kString
              << " running on http://" << contextfilter::Config::kBindAddress << ":" << port
              << std::endl;
    std::cout << "Forwarding to " << contextfilter::Config::getOllamaHost() << std::endl;

    std::string model_names;
    for (const auto& model : sortedModels(request_filter.allowList()))
    {
        model_names += model_names.empty() ? model : ", " + model;
    }
    std::cout << "Small models with context filtering: " << model_names << std::endl;
    std::cout << "Configure your client to use: http://localhost:" << port << "/v1" << std::endl;

    app.bindaddr(contextfilter::Config::kBindAddress)
        .port(static_cast<uint16_t>(port))
        .concurrency(1)
        .run();
    return 0;
}
