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
 * @file Subckt.hpp
 * @brief Subcircuit definitions (`.SUBCKT` ... `.ENDS`) and their instances
 *        (`X` lines).
 *
 * A definition is a header line followed by body lines up to the first line
 * that starts with `.ENDS` (any case); that whole line is consumed. The body
 * may hold component lines and nested instances, with blank and comment lines
 * in between. Any other body line is a fatal error, as is reaching the end of
 * the input before `.ENDS`.
 *
 * An instance line lists its pins and ends with the subcircuit name:
 *
 *     X<name> <pin> ... <subckt>
 *
 * Instances refer to subcircuits by name only; no expansion or lookup takes
 * place here.
 */

#include <memory>
#include <string>
#include <vector>

#include "Component.hpp"
#include "ParseResult.hpp"

class Instance;
using InstancePtr = std::shared_ptr<Instance>;

/**
 * @class Instance
 * @brief Parsed `X` line.
 */
class Instance
{
   public:
    Instance(const std::string& name, const std::vector<std::string>& pins,
             const std::string& subcktName)
        : name(name), pins(pins), subcktName(subcktName)
    {
    }

    /** @brief Full designator, `X` included (e.g. `Xinv`). */
    const std::string& getName() const { return name; }
    const std::vector<std::string>& getPins() const { return pins; }
    const std::string& getSubcktName() const { return subcktName; }

    std::string toSpice() const;

    /**
     * @brief Parse an instance line.
     *
     * @return Error unless the designator starts with X; Failure when no
     *         token follows it.
     */
    static ParseResult<InstancePtr> parse(const Cursor& input);

   private:
    std::string name;
    std::vector<std::string> pins;
    std::string subcktName;
};

class Subckt;
using SubcktPtr = std::shared_ptr<Subckt>;

/**
 * @class Subckt
 * @brief A `.SUBCKT` block.
 */
class Subckt
{
   public:
    Subckt(const std::string& name, const std::vector<std::string>& ports)
        : name(name), ports(ports)
    {
    }

    const std::string& getName() const { return name; }
    const std::vector<std::string>& getPorts() const { return ports; }
    const std::vector<ComponentPtr>& getComponents() const
    {
        return components;
    }
    const std::vector<InstancePtr>& getInstances() const { return instances; }

    void addComponent(const ComponentPtr& component)
    {
        components.push_back(component);
    }
    void addInstance(const InstancePtr& instance)
    {
        instances.push_back(instance);
    }

    /** @brief Header, body lines and `.ENDS <name>`, newline separated. */
    std::string toSpice() const;

    static ParseResult<SubcktPtr> parse(const Cursor& input);

   private:
    std::string name;
    std::vector<std::string> ports;
    std::vector<ComponentPtr> components;
    std::vector<InstancePtr> instances;
};
