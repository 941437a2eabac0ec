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
 * @file Mosfet.cpp
 * @brief Parsing, building and SPICE output of `M` lines.
 *
 * Implementation notes:
 *  - The four terminals and the model name are mandatory once the `M` letter
 *    has matched.
 *  - Parameter pairs are read until the next token is not a `key=value`
 *    pair; whatever follows is left for the caller.
 *  - The builder decides whether the geometry is complete. A missing L or W
 *    is reported as a fatal error at the end of the parameter list.
 */

#include "Mosfet.hpp"

#include <memory>
#include <string>

#include "Lexer.hpp"

void MosfetBuilder::parameter(const std::string& key, const Number& value)
{
    std::string upperKey = Lexer::upper(key);
    if (upperKey == "L")
        length = value;
    else if (upperKey == "W")
        width = value;
    else
        parameters[key] = value;
}

std::shared_ptr<Mosfet> MosfetBuilder::build() const
{
    if (!length || !width)
        return nullptr;
    return std::make_shared<Mosfet>(
        name, drain, gate, source, bulk, model, UnitNumber(*length, Unit::Meter),
        UnitNumber(*width, Unit::Meter), parameters);
}

ParseResult<ComponentPtr> Mosfet::parse(const Cursor& input)
{
    auto name = parseDesignator(input, 'M');
    if (!name.ok())
        return context(ParseResult<ComponentPtr>::propagate(name), input,
                       "mosfet");
    Cursor in = name.rest();

    std::string terminals[4];
    const char* labels[4] = {"drain", "gate", "source", "bulk"};
    for (int i = 0; i < 4; ++i) {
        auto terminal = commit(SpiceLexer::nodeToken(in), in, labels[i]);
        if (!terminal.ok())
            return ParseResult<ComponentPtr>::propagate(terminal);
        terminals[i] = terminal.value();
        in = terminal.rest();
    }

    auto model = commit(SpiceLexer::identifierToken(in), in, "model");
    if (!model.ok())
        return ParseResult<ComponentPtr>::propagate(model);
    in = model.rest();

    MosfetBuilder builder(name.value(), terminals[0], terminals[1],
                          terminals[2], terminals[3], model.value());
    for (auto pair = SpiceLexer::parameterPair(in); pair.ok();
         pair = SpiceLexer::parameterPair(in)) {
        builder.parameter(pair.value().first, pair.value().second);
        in = pair.rest();
    }

    std::shared_ptr<Mosfet> element = builder.build();
    if (!element)
        return ParseResult<ComponentPtr>::fail(in, "no w/l given");
    return ParseResult<ComponentPtr>::success(in, element);
}

std::string Mosfet::toSpice() const
{
    std::string line = "M" + name + " " + drain + " " + gate + " " + source +
                       " " + bulk + " " + model;
    line += " L=" + length.toSpice();
    line += " W=" + width.toSpice();
    for (const auto& param : parameters)
        line += " " + param.first + "=" + param.second.toSpice();
    return line;
}
