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
#pragma once

/**
 * @file Model.hpp
 * @brief `.MODEL` cards.
 *
 * Syntax:
 *
 *     .MODEL <name> <D|NPN|PNP|NMOS|PMOS> ( <key>=<value> ... )
 *
 * Every step after `.MODEL` is mandatory. Parameters are kept by name; the
 * parser does not know which keys a device kind understands.
 */

#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "Number.hpp"
#include "ParseResult.hpp"

enum class ModelKind
{
    Diode,
    Npn,
    Pnp,
    NMos,
    PMos
};

inline std::ostream& operator<<(std::ostream& os, ModelKind kind)
{
    switch (kind) {
        case ModelKind::Diode:
            os << "D";
            break;
        case ModelKind::Npn:
            os << "NPN";
            break;
        case ModelKind::Pnp:
            os << "PNP";
            break;
        case ModelKind::NMos:
            os << "NMOS";
            break;
        case ModelKind::PMos:
            os << "PMOS";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

class Model;
using ModelPtr = std::shared_ptr<Model>;

class Model
{
   public:
    Model(const std::string& name, ModelKind kind,
          const std::map<std::string, Number>& parameters)
        : name(name), kind(kind), parameters(parameters)
    {
    }

    const std::string& getName() const { return name; }
    ModelKind getKind() const { return kind; }
    const std::map<std::string, Number>& getParameters() const
    {
        return parameters;
    }

    std::string toSpice() const;

    static ParseResult<ModelPtr> parse(const Cursor& input);

   private:
    std::string name;
    ModelKind kind;
    std::map<std::string, Number> parameters;
};
