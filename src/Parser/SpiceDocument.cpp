/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file SpiceDocument.cpp
 * @brief Netlist writer.
 */

#include "SpiceDocument.hpp"

#include <string>

bool SpiceDocument::empty() const
{
    return title.empty() && includes.empty() && components.empty() &&
           sources.empty() && simulations.empty() && measures.empty() &&
           subckts.empty() && instances.empty() && models.empty();
}

std::string SpiceDocument::toSpice() const
{
    std::string text;
    if (!title.empty())
        text += ".TITLE " + title + "\n";
    for (const auto& path : includes)
        text += ".INCLUDE \"" + path + "\"\n";
    for (const auto& model : models)
        text += model->toSpice() + "\n";
    for (const auto& subckt : subckts)
        text += subckt->toSpice() + "\n";
    for (const auto& component : components)
        text += component->toSpice() + "\n";
    for (const auto& source : sources)
        text += source->toSpice() + "\n";
    for (const auto& instance : instances)
        text += instance->toSpice() + "\n";
    for (const auto& simulation : simulations)
        text += simulation->toSpice() + "\n";
    for (const auto& measure : measures)
        text += measure->toSpice() + "\n";
    text += ".END\n";
    return text;
}
