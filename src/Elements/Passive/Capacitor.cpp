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
 * @file Capacitor.cpp
 * @brief Parsing and SPICE output of `C` lines.
 */

#include "Capacitor.hpp"

#include <memory>
#include <string>

ParseResult<ComponentPtr> Capacitor::parse(const Cursor& input)
{
    auto fields = parseTwoTerminal(input, 'C', Unit::Farad);
    if (!fields.ok())
        return context(ParseResult<ComponentPtr>::propagate(fields), input,
                       "capacitor");

    const TwoTerminal& f = fields.value();
    ComponentPtr element =
        std::make_shared<Capacitor>(f.name, f.nodePos, f.nodeNeg, f.value);
    return ParseResult<ComponentPtr>::success(fields.rest(), element);
}

std::string Capacitor::toSpice() const
{
    return "C" + name + " " + nodePos + " " + nodeNeg + " " +
           capacitance.toSpice();
}
