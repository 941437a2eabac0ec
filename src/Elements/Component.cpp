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
 * @file Component.cpp
 * @brief Component dispatcher and the designator/two-terminal helpers shared
 *        by the concrete device parsers.
 */

#include "Component.hpp"

#include <cctype>
#include <string>

#include "Bjt.hpp"
#include "Capacitor.hpp"
#include "Diode.hpp"
#include "Inductor.hpp"
#include "Lexer.hpp"
#include "Mosfet.hpp"
#include "Resistor.hpp"

ParseResult<ComponentPtr> Component::parse(const Cursor& input)
{
    using Production = ParseResult<ComponentPtr> (*)(const Cursor&);
    static const Production productions[] = {
        Resistor::parse, Capacitor::parse, Inductor::parse,
        Diode::parse,    Bjt::parse,       Mosfet::parse};

    ParseResult<ComponentPtr> last =
        ParseResult<ComponentPtr>::reject(input, "component");
    for (Production production : productions) {
        last = production(input);
        // A match or a committed failure ends the search.
        if (!last.isError())
            return last;
    }
    return context(last, input, "component");
}

ParseResult<std::string> Component::parseDesignator(const Cursor& input,
                                                    char letter)
{
    auto id = SpiceLexer::identifierToken(input);
    if (!id.ok())
        return id;

    const std::string& designator = id.value();
    if (std::toupper(static_cast<unsigned char>(designator[0])) != letter)
        return ParseResult<std::string>::reject(
            input, std::string("should begin with ") + letter);

    std::string name = designator.substr(1);
    if (name.empty())
        return ParseResult<std::string>::fail(input, "missing designator");
    return ParseResult<std::string>::success(id.rest(), name);
}

ParseResult<Component::TwoTerminal> Component::parseTwoTerminal(
    const Cursor& input, char letter, Unit unit)
{
    auto name = parseDesignator(input, letter);
    if (!name.ok())
        return ParseResult<TwoTerminal>::propagate(name);
    Cursor in = name.rest();

    auto nodePos = commit(SpiceLexer::nodeToken(in), in, "node_pos");
    if (!nodePos.ok())
        return ParseResult<TwoTerminal>::propagate(nodePos);
    in = nodePos.rest();

    auto nodeNeg = commit(SpiceLexer::nodeToken(in), in, "node_neg");
    if (!nodeNeg.ok())
        return ParseResult<TwoTerminal>::propagate(nodeNeg);
    in = nodeNeg.rest();

    auto value = commit(SpiceLexer::quantityToken(in, unit), in, "value");
    if (!value.ok())
        return ParseResult<TwoTerminal>::propagate(value);

    TwoTerminal fields;
    fields.name = name.value();
    fields.nodePos = nodePos.value();
    fields.nodeNeg = nodeNeg.value();
    fields.value = value.value();
    return ParseResult<TwoTerminal>::success(value.rest(), fields);
}
