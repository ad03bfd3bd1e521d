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

#include <cstddef>
#include <string>
#include <vector>

namespace contextfilter
{

/**
 * @brief Kinds of system-prompt sections the filter knows how to remove.
 */
enum class SectionKind
{
    ProjectTree,        ///< <project> ... </project>
    EnvironmentBlock,   ///< <env> ... </env>
    InstructionsBlock   ///< "Instructions from:" up to the next blank line
};

/**
 * @brief Display name of a section kind ("project-tree", ...).
 */
[[nodiscard]] const char* sectionKindName(SectionKind kind);

/**
 * @brief A section located inside a text, spanning [start, end).
 */
struct SectionMatch
{
    SectionKind kind;
    std::size_t start = 0;
    std::size_t end = 0;
    std::string text;

    [[nodiscard]] std::size_t size() const
    {
        return end - start;
    }
};

/**
 * @brief Locate every removable section in a text.
 *
 * Each kind is searched over the whole text. Delimited kinds take the
 * shortest span from a start marker to the next end marker. Instruction
 * blocks run from their label to the next "\n\n" (exclusive) or end of text.
 * Results are sorted by start offset and never overlap; on a conflict the
 * earlier-starting match is kept.
 *
 * @param text The text to scan.
 * @return std::vector<SectionMatch> Matches in order of appearance.
 */
[[nodiscard]] std::vector<SectionMatch> findSections(const std::string& text);

// Markers, exposed for tests and log output
inline constexpr const char* kProjectOpen = "<project>";
inline constexpr const char* kProjectClose = "</project>";
inline constexpr const char* kEnvOpen = "<env>";
inline constexpr const char* kEnvClose = "</env>";
inline constexpr const char* kInstructionsLabel = "Instructions from:";
inline constexpr const char* kBlankLine = "\n\n";

} // namespace contextfilter
