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
 * @file Resistor.hpp
 * @brief `R` lines: two-terminal ideal resistor.
 *
 * Syntax:
 *
 *     R<name> <node+> <node-> <resistance>
 */

#include <memory>
#include <string>
#include <vector>

#include "Component.hpp"

/**
 * @class Resistor
 * @brief Parsed `R` line.
 */
class Resistor : public Component
{
   public:
    Resistor(const std::string& name, const std::string& nodePos,
             const std::string& nodeNeg, const UnitNumber& resistance)
        : Component(name, ComponentType::Resistor),
          nodePos(nodePos),
          nodeNeg(nodeNeg),
          resistance(resistance)
    {
    }

    const std::string& getNodePos() const { return nodePos; }
    const std::string& getNodeNeg() const { return nodeNeg; }
    const UnitNumber& getResistance() const { return resistance; }

    std::vector<std::string> getNodes() const override
    {
        return {nodePos, nodeNeg};
    }

    std::string toSpice() const override;

    /** @brief Parse a `R` line; Error if the designator is not `R...`. */
    static ParseResult<ComponentPtr> parse(const Cursor& input);

   private:
    std::string nodePos;
    std::string nodeNeg;
    UnitNumber resistance;
};
