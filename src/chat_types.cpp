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

#include "chat_types.hpp"

namespace contextfilter
{

const char* roleName(Role role)
{
    switch (role)
    {
        case Role::System:
            return "system";
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
        case Role::Tool:
            return "tool";
    }
    return "unknown";
}

std::optional<Role> parseRole(const std::string& name)
{
    if (name == "system")
    {
        return Role::System;
    }
    if (name == "user")
    {
        return Role::User;
    }
    if (name == "assistant")
    {
        return Role::Assistant;
    }
    if (name == "tool")
    {
        return Role::Tool;
    }
    return std::nullopt;
}

} // namespace contextfilter
