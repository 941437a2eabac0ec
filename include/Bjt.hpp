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
 * @file Bjt.hpp
 * @brief `Q` lines: bipolar junction transistor.
 *
 * Syntax:
 *
 *     Q<name> <collector> <base> <emitter> <model>
 */

#include <memory>
#include <string>
#include <vector>

#include "Component.hpp"

class Bjt : public Component
{
   public:
    Bjt(const std::string& name, const std::string& collector,
        const std::string& base, const std::string& emitter,
        const std::string& model)
        : Component(name, ComponentType::Bjt),
          collector(collector),
          base(base),
          emitter(emitter),
          model(model)
    {
    }

    const std::string& getCollector() const { return collector; }
    const std::string& getBase() const { return base; }
    const std::string& getEmitter() const { return emitter; }
    const std::string& getModel() const { return model; }

    std::vector<std::string> getNodes() const override
    {
        return {collector, base, emitter};
    }

    std::string toSpice() const override;

    static ParseResult<ComponentPtr> parse(const Cursor& input);

   private:
    std::string collector;
    std::string base;
    std::string emitter;
    std::string model;
};
