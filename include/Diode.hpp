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
 * @file Diode.hpp
 * @brief `D` lines: diode referencing a `.MODEL` by name.
 *
 * Syntax:
 *
 *     D<name> <anode> <cathode> <model>
 *
 * The model name is kept as text; it is not checked against the models of the
 * document.
 */

#include <memory>
#include <string>
#include <vector>

#include "Component.hpp"

class Diode : public Component
{
   public:
    Diode(const std::string& name, const std::string& nodePos,
          const std::string& nodeNeg, const std::string& model)
        : Component(name, ComponentType::Diode),
          nodePos(nodePos),
          nodeNeg(nodeNeg),
          model(model)
    {
    }

    const std::string& getNodePos() const { return nodePos; }
    const std::string& getNodeNeg() const { return nodeNeg; }
    const std::string& getModel() const { return model; }

    std::vector<std::string> getNodes() const override
    {
        return {nodePos, nodeNeg};
    }

    std::string toSpice() const override;

    static ParseResult<ComponentPtr> parse(const Cursor& input);

   private:
    std::string nodePos;
    std::string nodeNeg;
    std::string model;
};
