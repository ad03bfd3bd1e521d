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

#include "section_extractor.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace contextfilter
{

/**
 * @brief Minimal environment block injected into every filtered system prompt.
 *
 * The values are literal placeholders. Its <environment> delimiters are not
 * matched by the <env> recognizer, so filtered text contains no removable
 * section.
 */
inline constexpr const char* kEnvironmentStub =
    "\n\n<environment>\n"
    "  Working directory: (current directory)\n"
    "  Platform: (current platform)\n"
    "  Today's date: (current date)\n"
    "</environment>";

/**
 * @brief Result of filtering one system prompt.
 */
struct FilterOutcome
{
    std::string original_text;
    std::string filtered_text;
    std::vector<SectionMatch> removed;  ///< In source order
    size_t original_chars = 0;
    size_t filtered_chars = 0;
    size_t original_tokens = 0;
    size_t filtered_tokens = 0;
    size_t stub_offset = 0;             ///< Where kEnvironmentStub starts in filtered_text
    std::chrono::nanoseconds elapsed{0};

    [[nodiscard]] double elapsedMs() const
    {
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }
};

/**
 * @brief Strip project trees, environment blocks and instruction blocks
 *        from a system prompt and inject the minimal environment stub.
 *
 * The stub takes the place of the first removed environment block, or is
 * appended when no environment block was present. Unmatched text is kept
 * byte for byte.
 *
 * @param text The system prompt.
 * @return FilterOutcome The filtered text with sizes, timings and removed sections.
 */
[[nodiscard]] FilterOutcome filterPrompt(const std::string& text);

} // namespace contextfilter
