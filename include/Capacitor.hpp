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
 * @file Capacitor.hpp
 * @brief `C` lines: two-terminal capacitor.
 *
 * Syntax:
 *
 *     C<name> <node+> <node-> <capacitance>
 */

#include <memory>
#include <string>
#include <vector>

#include "Component.hpp"

/**
 * @class Capacitor
 * @brief Parsed `C` line.
 */
class Capacitor : public Component
{
   public:
    Capacitor(const std::string& name, const std::string& nodePos,
              const std::string& nodeNeg, const UnitNumber& capacitance)
        : Component(name, ComponentType::Capacitor),
          nodePos(nodePos),
          nodeNeg(nodeNeg),
          capacitance(capacitance)
    {
    }

    const std::string& getNodePos() const { return nodePos; }
    const std::string& getNodeNeg() const { return nodeNeg; }
    const UnitNumber& getCapacitance() const { return capacitance; }

    std::vector<std::string> getNodes() const override
    {
        return {nodePos, nodeNeg};
    }

    std::string toSpice() const override;

    /** @brief Parse a `C` line; Error if the designator is not `C...`. */
    static ParseResult<ComponentPtr> parse(const Cursor& input);

   private:
    std::string nodePos;
    std::string nodeNeg;
    UnitNumber capacitance;
};
