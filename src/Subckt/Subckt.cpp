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
 * @file Subckt.cpp
 * @brief `.SUBCKT` blocks and `X` instance lines.
 */

#include "Subckt.hpp"

#include <cctype>
#include <memory>
#include <string>
#include <vector>

#include "Lexer.hpp"

ParseResult<InstancePtr> Instance::parse(const Cursor& input)
{
    auto id = SpiceLexer::identifierToken(input);
    if (!id.ok())
        return context(ParseResult<InstancePtr>::propagate(id), input,
                       "instance");
    if (std::toupper(static_cast<unsigned char>(id.value()[0])) != 'X')
        return ParseResult<InstancePtr>::reject(input, "should begin with X");
    Cursor in = id.rest();

    std::vector<std::string> args;
    for (auto arg = SpiceLexer::nodeToken(in); arg.ok();
         arg = SpiceLexer::nodeToken(in)) {
        args.push_back(arg.value());
        in = arg.rest();
    }
    if (args.empty())
        return ParseResult<InstancePtr>::fail(in, "missing subckt name");

    std::string subcktName = args.back();
    args.pop_back();
    InstancePtr instance =
        std::make_shared<Instance>(id.value(), args, subcktName);
    return ParseResult<InstancePtr>::success(in, instance);
}

std::string Instance::toSpice() const
{
    std::string line = name;
    for (const auto& pin : pins)
        line += " " + pin;
    return line + " " + subcktName;
}

/* ---------------------------------- .SUBCKT ------------------------------ */

namespace {
/** Cursor just past the newline ending the current line. */
Cursor nextLine(const Cursor& input)
{
    size_t length = 0;
    while (length < input.remaining() && input.peek(length) != '\n')
        ++length;
    return input.advance(length + 1);
}
}  // namespace

ParseResult<SubcktPtr> Subckt::parse(const Cursor& input)
{
    auto keyword = SpiceLexer::keyword(input, ".SUBCKT");
    if (!keyword.ok())
        return context(ParseResult<SubcktPtr>::propagate(keyword), input,
                       "subckt");
    Cursor in = keyword.rest();

    auto name = commit(SpiceLexer::identifierToken(in), in, "subckt_name");
    if (!name.ok())
        return ParseResult<SubcktPtr>::propagate(name);
    in = name.rest();

    std::vector<std::string> ports;
    for (auto port = SpiceLexer::nodeToken(in); port.ok();
         port = SpiceLexer::nodeToken(in)) {
        ports.push_back(port.value());
        in = port.rest();
    }

    SubcktPtr subckt = std::make_shared<Subckt>(name.value(), ports);
    while (true) {
        in = SpiceLexer::skipLines(in);
        if (in.atEnd())
            return ParseResult<SubcktPtr>::fail(in, "missing .ENDS");
        if (in.startsWithNoCase(".ENDS")) {
            in = nextLine(in);
            break;
        }

        auto component = SpiceLexer::token(in, Component::parse);
        if (component.ok()) {
            subckt->addComponent(component.value());
            in = component.rest();
            continue;
        }
        if (component.isFailure())
            return context(ParseResult<SubcktPtr>::propagate(component), in,
                           "subckt body");

        auto instance = SpiceLexer::token(in, Instance::parse);
        if (instance.ok()) {
            subckt->addInstance(instance.value());
            in = instance.rest();
            continue;
        }
        if (instance.isFailure())
            return context(ParseResult<SubcktPtr>::propagate(instance), in,
                           "subckt body");

        return ParseResult<SubcktPtr>::fail(in, "unknown line in subckt");
    }

    return ParseResult<SubcktPtr>::success(in, subckt);
}

std::string Subckt::toSpice() const
{
    std::string text = ".SUBCKT " + name;
    for (const auto& port : ports)
        text += " " + port;
    text += "\n";
    for (const auto& component : components)
        text += component->toSpice() + "\n";
    for (const auto& instance : instances)
        text += instance->toSpice() + "\n";
    return text + ".ENDS " + name;
}
