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
 * @file Diode.cpp
 * @brief Parsing and SPICE output of `D` lines.
 */

#include "Diode.hpp"

#include <memory>
#include <string>

#include "Lexer.hpp"

ParseResult<ComponentPtr> Diode::parse(const Cursor& input)
{
    auto name = parseDesignator(input, 'D');
    if (!name.ok())
        return context(ParseResult<ComponentPtr>::propagate(name), input,
                       "diode");
    Cursor in = name.rest();

    auto nodePos = commit(SpiceLexer::nodeToken(in), in, "node_pos");
    if (!nodePos.ok())
        return ParseResult<ComponentPtr>::propagate(nodePos);
    in = nodePos.rest();

    auto nodeNeg = commit(SpiceLexer::nodeToken(in), in, "node_neg");
    if (!nodeNeg.ok())
        return ParseResult<ComponentPtr>::propagate(nodeNeg);
    in = nodeNeg.rest();

    auto model = commit(SpiceLexer::identifierToken(in), in, "model");
    if (!model.ok())
        return ParseResult<ComponentPtr>::propagate(model);

    ComponentPtr element = std::make_shared<Diode>(
        name.value(), nodePos.value(), nodeNeg.value(), model.value());
    return ParseResult<ComponentPtr>::success(model.rest(), element);
}

std::string Diode::toSpice() const
{
    return "D" + name + " " + nodePos + " " + nodeNeg + " " + model;
}
