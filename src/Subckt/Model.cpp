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
 * @file Model.cpp
 * @brief `.MODEL` parsing and SPICE output.
 */

#include "Model.hpp"

#include <map>
#include <memory>
#include <sstream>
#include <string>

#include "Lexer.hpp"

ParseResult<ModelPtr> Model::parse(const Cursor& input)
{
    auto keyword = SpiceLexer::keyword(input, ".MODEL");
    if (!keyword.ok())
        return context(ParseResult<ModelPtr>::propagate(keyword), input,
                       "model");
    Cursor in = keyword.rest();

    auto name = commit(SpiceLexer::identifierToken(in), in, "model_name");
    if (!name.ok())
        return ParseResult<ModelPtr>::propagate(name);
    in = name.rest();

    auto kindToken = commit(
        SpiceLexer::keywordOf(in, {"NPN", "PNP", "D", "NMOS", "PMOS"},
                              "model kind"),
        in, "model_kind");
    if (!kindToken.ok())
        return ParseResult<ModelPtr>::propagate(kindToken);
    in = kindToken.rest();

    ModelKind kind = ModelKind::Diode;
    if (kindToken.value() == "NPN")
        kind = ModelKind::Npn;
    else if (kindToken.value() == "PNP")
        kind = ModelKind::Pnp;
    else if (kindToken.value() == "NMOS")
        kind = ModelKind::NMos;
    else if (kindToken.value() == "PMOS")
        kind = ModelKind::PMos;

    auto open = commit(SpiceLexer::keyword(in, "("), in, "(");
    if (!open.ok())
        return ParseResult<ModelPtr>::propagate(open);
    in = open.rest();

    std::map<std::string, Number> parameters;
    for (auto pair = SpiceLexer::parameterPair(in); pair.ok();
         pair = SpiceLexer::parameterPair(in)) {
        parameters[pair.value().first] = pair.value().second;
        in = pair.rest();
    }

    auto close = commit(SpiceLexer::keyword(in, ")"), in, ")");
    if (!close.ok())
        return ParseResult<ModelPtr>::propagate(close);

    ModelPtr model = std::make_shared<Model>(name.value(), kind, parameters);
    return ParseResult<ModelPtr>::success(close.rest(), model);
}

std::string Model::toSpice() const
{
    std::ostringstream oss;
    oss << ".MODEL " << name << " " << kind << " (";
    bool first = true;
    for (const auto& parameter : parameters) {
        if (!first)
            oss << " ";
        oss << parameter.first << "=" << parameter.second.toSpice();
        first = false;
    }
    oss << ")";
    return oss.str();
}
