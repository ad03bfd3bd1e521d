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

#include <string>

namespace contextfilter
{

/**
 * @brief Parse an OpenAI / Ollama chat request body.
 *
 * Non-system messages whose content is not a string (tool-call turns, content
 * part arrays) decode with empty content and are left alone on re-encode.
 *
 * @param body The raw JSON body.
 * @return ChatRequest The model id and messages.
 * @throws InvalidRequest If the body is not a chat request the filter can handle.
 */
[[nodiscard]] ChatRequest decodeChatRequest(const std::string& body);

/**
 * @brief Re-emit a request body with rewritten system-message content.
 *
 * Every other field of the original body is kept as it was.
 *
 * @param original_body The body the request was decoded from.
 * @param rewritten The filtered request.
 * @return std::string The JSON body to forward upstream.
 * @throws InvalidRequest If the rewritten request does not line up with the body.
 */
[[nodiscard]] std::string encodeChatRequest(
    const std::string& original_body,
    const ChatRequest& rewritten);

} // namespace contextfilter
