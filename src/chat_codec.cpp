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

#include "chat_codec.hpp"

#include <crow.h>

namespace contextfilter
{

namespace
{

using crow::json::type;

bool isString(const crow::json::rvalue& value, const char* key)
{
    return value.has(key) && value[key].t() == type::String;
}

crow::json::rvalue loadChatBody(const std::string& body)
{
    auto json = crow::json::load(body);
    if (!json || json.t() != type::Object)
    {
        throw InvalidRequest("request body is not a JSON object");
    }
    if (!json.has("messages") || json["messages"].t() != type::List)
    {
        throw InvalidRequest("request has no 'messages' list");
    }
    return json;
}

}  // namespace

ChatRequest decodeChatRequest(const std::string& body)
{
    auto json = loadChatBody(body);
    if (!isString(json, "model"))
    {
        throw InvalidRequest("request has no 'model' string");
    }

    ChatRequest request;
    request.model = std::string(json["model"].s());

    const auto& messages = json["messages"];
    request.messages.reserve(messages.size());
    for (size_t i = 0; i < messages.size(); ++i)
    {
        const auto& item = messages[i];
        std::string where = "message " + std::to_string(i);

        if (item.t() != type::Object)
        {
            throw InvalidRequest(where + " is not an object");
        }
        if (!isString(item, "role"))
        {
            throw InvalidRequest(where + " has no 'role' string");
        }

        std::string role_name(item["role"].s());
        auto role = parseRole(role_name);
        if (!role)
        {
            throw InvalidRequest(where + " has unknown role '" + role_name + "'");
        }

        ChatMessage message;
        message.role = *role;
        if (isString(item, "content"))
        {
            message.content = std::string(item["content"].s());
        }
        else if (*role == Role::System)
        {
            throw InvalidRequest(where + " is a system message without text content");
        }
        request.messages.push_back(std::move(message));
    }

    return request;
}

std::string encodeChatRequest(const std::string& original_body, const ChatRequest& rewritten)
{
    auto json = loadChatBody(original_body);
    if (json["messages"].size() != rewritten.messages.size())
    {
        throw InvalidRequest("rewritten request has a different message count");
    }

    crow::json::wvalue body(json);
    for (size_t i = 0; i < rewritten.messages.size(); ++i)
    {
        const auto& message = rewritten.messages[i];
        if (message.role == Role::System)
        {
            body["messages"][static_cast<unsigned>(i)]["content"] = message.content;
        }
    }
    return body.dump();
}

} // namespace contextfilter
