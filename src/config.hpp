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

#include "event_reporter.hpp"
#include "filter_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace contextfilter
{

namespace detail
{

/**
 * @brief Cross-platform safe getenv wrapper.
 * @param name Environment variable name.
 * @return std::string The value or empty string if not found.
 */
inline std::string safeGetenv(const char* name)
{
#ifdef _MSC_VER
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr)
    {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

inline std::string trim(const std::string& value)
{
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

/**
 * @brief Parse a boolean flag ("1", "true", "yes", "on" and their negatives).
 * @return std::optional<bool> nullopt when the value is not a recognized flag.
 */
inline std::optional<bool> parseBool(const std::string& value)
{
    std::string lowered = trim(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on")
    {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off")
    {
        return false;
    }
    return std::nullopt;
}

/**
 * @brief Split a comma-separated list, dropping blank entries.
 *
 * Entries are trimmed but otherwise kept exactly as written.
 */
inline AllowList parseList(const std::string& value)
{
    AllowList items;
    size_t pos = 0;
    while (pos <= value.size())
    {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos)
        {
            comma = value.size();
        }
        std::string item = trim(value.substr(pos, comma - pos));
        if (!item.empty())
        {
            items.insert(item);
        }
        pos = comma + 1;
    }
    return items;
}

inline bool getBoolEnv(const char* name, bool fallback)
{
    std::string env_value = safeGetenv(name);
    if (env_value.empty())
    {
        return fallback;
    }
    auto parsed = parseBool(env_value);
    if (!parsed)
    {
        std::cerr << "Warning: ignoring invalid " << name << "='" << env_value << "'" << std::endl;
        return fallback;
    }
    return *parsed;
}

inline int getIntEnv(const char* name, int fallback, int min_value, int max_value)
{
    std::string env_value = safeGetenv(name);
    if (env_value.empty())
    {
        return fallback;
    }
    try
    {
        int value = std::stoi(env_value);
        if (value >= min_value && value <= max_value)
        {
            return value;
        }
    }
    catch (const std::exception&)
    {
        // Not a number, reported below
    }
    std::cerr << "Warning: ignoring invalid " << name << "='" << env_value << "'" << std::endl;
    return fallback;
}

}  // namespace detail

/**
 * @brief Configuration management class for ContextFilter.
 *
 * Provides environment-based configuration with sensible defaults. Values
 * are read once at startup and passed into the components that need them.
 */
class Config
{
public:
    /**
     * @brief Get the upstream Ollama host URL.
     * @return std::string The Ollama host URL (default: "http://localhost:11434").
     */
    static std::string getOllamaHost()
    {
        std::string env_host = detail::safeGetenv("OLLAMA_HOST");
        if (!env_host.empty())
        {
            return env_host;
        }
        return "http://localhost:11434";
    }

    /**
     * @brief Get the event database file path.
     * @return std::string The database path (default: "contextfilter.db").
     */
    static std::string getDatabasePath()
    {
        std::string env_db = detail::safeGetenv("CONTEXTFILTER_DB");
        if (!env_db.empty())
        {
            return env_db;
        }
        return "contextfilter.db";
    }

    /**
     * @brief Get the ContextFilter listening port.
     * @return int The port number (default: 11435).
     */
    static int getPort()
    {
        return detail::getIntEnv("CONTEXTFILTER_PORT", kDefaultPort, 1, 65535);
    }

    /**
     * @brief Get the upstream read timeout.
     * @return int Seconds (default: 300).
     */
    static int getUpstreamTimeout()
    {
        return detail::getIntEnv("CONTEXTFILTER_UPSTREAM_TIMEOUT", kDefaultUpstreamTimeout, 1, 86400);
    }

    /**
     * @brief Get the models whose system prompts are filtered.
     *
     * CONTEXTFILTER_MODELS is a comma-separated list of exact model ids.
     *
     * @return AllowList The configured list, or the built-in small models.
     */
    static AllowList getAllowList()
    {
        std::string env_models = detail::safeGetenv("CONTEXTFILTER_MODELS");
        if (!env_models.empty())
        {
            AllowList models = detail::parseList(env_models);
            if (!models.empty())
            {
                return models;
            }
        }
        return {"llama3.2:1b", "llama3.2-1b", "qwen2.5:1.5b", "qwen2.5-1.5b"};
    }

    /**
     * @brief Get the event record options.
     * @return ReportConfig Flags from CONTEXTFILTER_DETAILED_LOGGING,
     *         CONTEXTFILTER_SHOW_FULL_CONTENT and CONTEXTFILTER_PREVIEW_CHARS.
     */
    static ReportConfig getReportConfig()
    {
        ReportConfig config;
        config.detailed_logging =
            detail::getBoolEnv("CONTEXTFILTER_DETAILED_LOGGING", config.detailed_logging);
        config.show_full_content =
            detail::getBoolEnv("CONTEXTFILTER_SHOW_FULL_CONTENT", config.show_full_content);
        config.max_preview_chars = static_cast<size_t>(detail::getIntEnv(
            "CONTEXTFILTER_PREVIEW_CHARS", kDefaultPreviewChars, 0, 1000000));
        return config;
    }

    // Configuration constants
    static constexpr const char* kBindAddress = "127.0.0.1";
    static constexpr int kDefaultPort = 11435;
    static constexpr int kDefaultUpstreamTimeout = 300;
    static constexpr int kDefaultPreviewChars = 500;
    static constexpr int kConnectionTimeoutSec = 5;
};

} // namespace contextfilter
