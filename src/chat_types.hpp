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

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace contextfilter
{

/**
 * @brief Author of a chat message.
 */
enum class Role
{
    System,
    User,
    Assistant,
    Tool
};

/**
 * @brief Get the wire name of a role ("system", "user", ...).
 */
[[nodiscard]] const char* roleName(Role role);

/**
 * @brief Parse a wire role name.
 * @param name The role string as sent by the client.
 * @return std::optional<Role> The role, or nullopt for an unknown name.
 */
[[nodiscard]] std::optional<Role> parseRole(const std::string& name);

struct ChatMessage
{
    Role role = Role::User;
    std::string content;

    bool operator==(const ChatMessage&) const = default;
};

/**
 * @brief A chat-completion request reduced to what the filter needs.
 */
struct ChatRequest
{
    std::string model;
    std::vector<ChatMessage> messages;

    bool operator==(const ChatRequest&) const = default;
};

/**
 * @brief Raised when a request is not well-formed enough to be filtered.
 *
 * The transport forwards the original request unmodified when it sees this.
 */
class InvalidRequest : public std::runtime_error
{
public:
    explicit InvalidRequest(const std::string& what) : std::runtime_error(what)
    {
    }
};

} // namespace contextfilter
