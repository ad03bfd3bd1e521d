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

#include "section_extractor.hpp"

#include <algorithm>
#include <string_view>

namespace contextfilter
{

namespace
{

/**
 * @brief Collect all non-greedy open ... close spans of one kind.
 */
void findDelimited(
    const std::string& text,
    SectionKind kind,
    std::string_view open,
    std::string_view close,
    std::vector<SectionMatch>& out)
{
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t start = text.find(open, pos);
        if (start == std::string::npos)
        {
            return;
        }

        size_t close_pos = text.find(close, start + open.size());
        if (close_pos == std::string::npos)
        {
            // No end marker after this start, so none after any later start either
            return;
        }

        size_t end = close_pos + close.size();
        out.push_back({kind, start, end, text.substr(start, end - start)});
        pos = end;
    }
}

/**
 * @brief Collect label-anchored blocks terminated by a blank line or end of text.
 */
void findLabeled(
    const std::string& text,
    SectionKind kind,
    std::string_view label,
    std::string_view terminator,
    std::vector<SectionMatch>& out)
{
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t start = text.find(label, pos);
        if (start == std::string::npos)
        {
            return;
        }

        size_t end = text.find(terminator, start + label.size());
        if (end == std::string::npos)
        {
            end = text.size();
        }

        out.push_back({kind, start, end, text.substr(start, end - start)});
        pos = end;
    }
}

}  // namespace

const char* sectionKindName(SectionKind kind)
{
    switch (kind)
    {
        case SectionKind::ProjectTree:
            return "project-tree";
        case SectionKind::EnvironmentBlock:
            return "environment-block";
        case SectionKind::InstructionsBlock:
            return "instructions-block";
    }
    return "unknown";
}

std::vector<SectionMatch> findSections(const std::string& text)
{
    std::vector<SectionMatch> candidates;
    findDelimited(text, SectionKind::ProjectTree, kProjectOpen, kProjectClose, candidates);
    findDelimited(text, SectionKind::EnvironmentBlock, kEnvOpen, kEnvClose, candidates);
    findLabeled(text, SectionKind::InstructionsBlock, kInstructionsLabel, kBlankLine, candidates);

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const SectionMatch& a, const SectionMatch& b)
                     {
                         return a.start < b.start;
                     });

    std::vector<SectionMatch> matches;
    matches.reserve(candidates.size());
    size_t covered_until = 0;
    for (auto& candidate : candidates)
    {
        if (!matches.empty() && candidate.start < covered_until)
        {
            continue;
        }
        covered_until = candidate.end;
        matches.push_back(std::move(candidate));
    }
    return matches;
}

} // namespace contextfilter
