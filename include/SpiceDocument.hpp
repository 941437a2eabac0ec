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
 * @file SpiceDocument.hpp
 * @brief In-memory form of a parsed SPICE netlist.
 *
 * The document keeps every statement it was given, grouped by kind and in
 * input order within a kind. Names are not resolved: an instance refers to
 * its subcircuit by name, a device to its model by name, a `.DC` sweep to
 * its source by name.
 */

#include <string>
#include <vector>

#include "Component.hpp"
#include "MeasureCommand.hpp"
#include "Model.hpp"
#include "SimCommand.hpp"
#include "Source.hpp"
#include "Subckt.hpp"

/**
 * @struct SpiceDocument
 * @brief Statements of one netlist, grouped by kind.
 */
struct SpiceDocument
{
    std::string title;                  /**< `.TITLE` text, empty if none */
    std::vector<std::string> includes;  /**< `.INCLUDE` paths, unresolved */
    std::vector<ComponentPtr> components;
    std::vector<SourcePtr> sources;
    std::vector<SimCommandPtr> simulations;
    std::vector<MeasureCommandPtr> measures;
    std::vector<SubcktPtr> subckts;
    std::vector<InstancePtr> instances;
    std::vector<ModelPtr> models;

    /** @brief True when no statement has been stored. */
    bool empty() const;

    /**
     * @brief Write the document back as a netlist.
     *
     * Order: title, includes, models, subckts, components, sources,
     * instances, analyses, measures and a final `.END`. One statement per
     * line.
     */
    std::string toSpice() const;
};
