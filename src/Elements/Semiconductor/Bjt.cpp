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
 * @file Bjt.cpp
 * @brief Parsing and SPICE output of `Q` lines.
 */

#include "Bjt.hpp"

#include <memory>
#include <string>

#include "Lexer.hpp"

ParseResult<ComponentPtr> Bjt::parse(const Cursor& input)
{
    auto name = parseDesignator(input, 'Q');
    if (!name.ok())
        return context(ParseResult<ComponentPtr>::propagate(name), input,
                       "bjt");
    Cursor in = name.rest();

    std::string terminals[3];
    const char* labels[3] = {"collector", "base", "emitter"};
    for (int i = 0; i < 3; ++i) {
        auto terminal = commit(SpiceLexer::nodeToken(in), in, labels[i]);
        if (!terminal.ok())
            return ParseResult<ComponentPtr>::propagate(terminal);
        terminals[i] = terminal.value();
        in = terminal.rest();
    }

    auto model = commit(SpiceLexer::identifierToken(in), in, "model");
    if (!model.ok())
        return ParseResult<ComponentPtr>::propagate(model);

    ComponentPtr element =
        std::make_shared<Bjt>(name.value(), terminals[0], terminals[1],
                              terminals[2], model.value());
    return ParseResult<ComponentPtr>::success(model.rest(), element);
}

std::string Bjt::toSpice() const
{
    return "Q" + name + " " + collector + " " + base + " " + emitter + " " +
           model;
}
