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
 * @file Mosfet.hpp
 * @brief `M` lines: four-terminal MOSFET with geometry and extra parameters.
 *
 * Syntax:
 *
 *     M<name> <drain> <gate> <source> <bulk> <model> [key=value ...]
 *
 * The trailing `key=value` pairs may appear in any order and may continue on
 * `+` lines. `L` and `W` (any case) set the channel length and width; every
 * other key is kept in the parameter map. A line without both `L` and `W` is
 * rejected as a fatal error.
 *
 * The pairs are collected by a `MosfetBuilder`, whose `build()` is the only
 * way to obtain a `Mosfet` from parsed text, so a transistor without geometry
 * cannot be constructed by the parser.
 *
 * Example usage:
 * @code
 * MosfetBuilder builder("1", "d", "g", "s", "b", "nmos");
 * builder.parameter("L", Number(1, Suffix::Micro));
 * builder.parameter("VTH", Number(0.7));
 * auto m = builder.build();  // nullptr: W missing
 * @endcode
 */

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Component.hpp"

/**
 * @class Mosfet
 * @brief Parsed `M` line.
 */
class Mosfet : public Component
{
   public:
    Mosfet(const std::string& name, const std::string& drain,
           const std::string& gate, const std::string& source,
           const std::string& bulk, const std::string& model,
           const UnitNumber& length, const UnitNumber& width,
           const std::map<std::string, Number>& parameters)
        : Component(name, ComponentType::Mosfet),
          drain(drain),
          gate(gate),
          source(source),
          bulk(bulk),
          model(model),
          length(length),
          width(width),
          parameters(parameters)
    {
    }

    const std::string& getDrain() const { return drain; }
    const std::string& getGate() const { return gate; }
    const std::string& getSource() const { return source; }
    const std::string& getBulk() const { return bulk; }
    const std::string& getModel() const { return model; }

    /** @brief Channel length (`L=`). */
    const UnitNumber& getLength() const { return length; }

    /** @brief Channel width (`W=`). */
    const UnitNumber& getWidth() const { return width; }

    /** @brief Every `key=value` pair other than L and W, keyed as written. */
    const std::map<std::string, Number>& getParameters() const
    {
        return parameters;
    }

    std::vector<std::string> getNodes() const override
    {
        return {drain, gate, source, bulk};
    }

    /** @brief `M<name> d g s b model L=.. W=.. key=value...` */
    std::string toSpice() const override;

    static ParseResult<ComponentPtr> parse(const Cursor& input);

   private:
    std::string drain;
    std::string gate;
    std::string source;
    std::string bulk;
    std::string model;
    UnitNumber length;
    UnitNumber width;
    std::map<std::string, Number> parameters;
};

/**
 * @class MosfetBuilder
 * @brief Accumulates a MOSFET line before its geometry is known.
 */
class MosfetBuilder
{
   public:
    MosfetBuilder(const std::string& name, const std::string& drain,
                  const std::string& gate, const std::string& source,
                  const std::string& bulk, const std::string& model)
        : name(name),
          drain(drain),
          gate(gate),
          source(source),
          bulk(bulk),
          model(model)
    {
    }

    /**
     * @brief Record one `key=value` pair.
     *
     * `L`/`l` and `W`/`w` set the geometry (a later pair overrides an earlier
     * one); any other key goes to the parameter map.
     */
    void parameter(const std::string& key, const Number& value);

    bool hasLength() const { return length.has_value(); }
    bool hasWidth() const { return width.has_value(); }

    /** @brief The transistor, or nullptr when L or W was never given. */
    std::shared_ptr<Mosfet> build() const;

   private:
    std::string name;
    std::string drain;
    std::string gate;
    std::string source;
    std::string bulk;
    std::string model;
    std::optional<Number> length;
    std::optional<Number> width;
    std::map<std::string, Number> parameters;
};
