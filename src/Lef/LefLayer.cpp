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
 * @file LefLayer.cpp
 * @brief LAYER header dispatch and the per-type body grammars.
 *
 * Implementation notes:
 *  - Repeated clauses (`SPACING`, `ENCLOSURE`, `PROPERTY`) are read in a loop
 *    that stops at the first plain Error. A clause commits after its leading
 *    keyword, except implant `SPACING`, which only commits after its distance
 *    because property clauses share the keyword.
 *  - The closing `END <name>` is checked last; whatever clause failed to
 *    match before it shows up as a missing `END` in the trace.
 */

#include "LefLayer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "Lexer.hpp"

ParseResult<LefLayerPtr> LefLayer::parse(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "LAYER");
    if (!keyword.ok())
        return context(ParseResult<LefLayerPtr>::propagate(keyword), input,
                       "layer");
    Cursor in = keyword.rest();

    auto name = commit(LefLexer::identifier(in), in, "layer_name");
    if (!name.ok())
        return ParseResult<LefLayerPtr>::propagate(name);
    in = name.rest();

    auto type = commit(LefLexer::keyword(in, "TYPE"), in, "TYPE");
    if (!type.ok())
        return ParseResult<LefLayerPtr>::propagate(type);
    in = type.rest();

    Cursor typeAt = LefLexer::skipSpace(in);
    auto typeName = commit(LefLexer::identifier(in), in, "layer_type");
    if (!typeName.ok())
        return ParseResult<LefLayerPtr>::propagate(typeName);
    in = typeName.rest();

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<LefLayerPtr>::propagate(semicolon);
    in = semicolon.rest();

    ParseResult<LefLayerPtr> layer =
        ParseResult<LefLayerPtr>::fail(typeAt, "expected layer type");
    if (typeName.value() == "CUT")
        layer = LefCutLayer::parseBody(in, name.value());
    else if (typeName.value() == "IMPLANT")
        layer = LefImplantLayer::parseBody(in, name.value());
    else if (typeName.value() == "ROUTING")
        layer = LefRoutingLayer::parseBody(in, name.value());
    else if (typeName.value() == "MASTERSLICE")
        layer = LefSpecialLayer::parseBody(in, name.value(),
                                           LefSpecialLayerType::MasterSlice);
    else if (typeName.value() == "OVERLAP")
        layer = LefSpecialLayer::parseBody(in, name.value(),
                                           LefSpecialLayerType::Overlap);

    return context(layer, input, "LAYER " + name.value());
}

ParseResult<unsigned> LefLayer::parseMask(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "MASK");
    if (!keyword.ok())
        return ParseResult<unsigned>::propagate(keyword);
    Cursor in = keyword.rest();

    auto mask = commit(LefLexer::unsignedInt(in), in, "mask");
    if (!mask.ok())
        return mask;
    in = mask.rest();

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<unsigned>::propagate(semicolon);
    return ParseResult<unsigned>::success(semicolon.rest(), mask.value());
}

ParseResult<std::string> LefLayer::parseEnd(const Cursor& input,
                                            const std::string& name)
{
    auto end = commit(LefLexer::keyword(input, "END"), input, "END");
    if (!end.ok())
        return end;

    Cursor at = LefLexer::skipSpace(end.rest());
    auto endName = commit(LefLexer::identifier(at), at, "end_name");
    if (!endName.ok())
        return endName;
    if (endName.value() != name)
        return ParseResult<std::string>::fail(at, "un match end name");
    return endName;
}

/* ---------------------------------- CUT ---------------------------------- */

namespace {
ParseResult<LefCutSpacingConstraint> cutConstraint(const Cursor& input)
{
    using Result = ParseResult<LefCutSpacingConstraint>;
    LefCutSpacingConstraint constraint;

    auto layer = LefLexer::keyword(input, "LAYER");
    if (layer.ok()) {
        Cursor in = layer.rest();
        auto second = commit(LefLexer::identifier(in), in, "second_layer");
        if (!second.ok())
            return Result::propagate(second);
        in = second.rest();

        constraint.type = LefCutSpacingConstraintType::Layer;
        constraint.layerName = second.value();
        auto stack = LefLexer::keyword(in, "STACK");
        if (stack.ok()) {
            constraint.stack = true;
            in = stack.rest();
        }
        return Result::success(in, constraint);
    }

    auto adjacent = LefLexer::keyword(input, "ADJACENTCUTS");
    if (adjacent.ok()) {
        Cursor in = adjacent.rest();
        auto count = commit(LefLexer::unsignedInt(in), in, "adjacent_cuts");
        if (!count.ok())
            return Result::propagate(count);
        in = count.rest();

        auto within = commit(LefLexer::keyword(in, "WITHIN"), in, "WITHIN");
        if (!within.ok())
            return Result::propagate(within);
        in = within.rest();

        auto distance = commit(LefLexer::number(in), in, "cut_within");
        if (!distance.ok())
            return Result::propagate(distance);
        in = distance.rest();

        constraint.type = LefCutSpacingConstraintType::AdjacentCuts;
        constraint.count = count.value();
        constraint.within = distance.value();
        auto except = LefLexer::keyword(in, "EXCEPTSAMEPGNET");
        if (except.ok()) {
            constraint.exceptSamePgNet = true;
            in = except.rest();
        }
        return Result::success(in, constraint);
    }

    auto overlap = LefLexer::keyword(input, "PARALLELOVERLAP");
    if (overlap.ok()) {
        constraint.type = LefCutSpacingConstraintType::ParallelOverlap;
        return Result::success(overlap.rest(), constraint);
    }

    auto area = LefLexer::keyword(input, "AREA");
    if (area.ok()) {
        Cursor in = area.rest();
        auto value = commit(LefLexer::number(in), in, "cut_area");
        if (!value.ok())
            return Result::propagate(value);
        constraint.type = LefCutSpacingConstraintType::Area;
        constraint.area = value.value();
        return Result::success(value.rest(), constraint);
    }

    return Result::reject(input, "cut spacing constraint");
}
}  // namespace

ParseResult<LefCutSpacing> LefCutSpacing::parse(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "SPACING");
    if (!keyword.ok())
        return ParseResult<LefCutSpacing>::propagate(keyword);
    Cursor in = keyword.rest();

    auto distance = commit(LefLexer::number(in), in, "cut_spacing");
    if (!distance.ok())
        return ParseResult<LefCutSpacing>::propagate(distance);
    in = distance.rest();

    LefCutSpacing spacing;
    spacing.spacing = distance.value();

    auto centerToCenter = LefLexer::keyword(in, "CENTERTOCENTER");
    if (centerToCenter.ok()) {
        spacing.centerToCenter = true;
        in = centerToCenter.rest();
    }
    auto sameNet = LefLexer::keyword(in, "SAMENET");
    if (sameNet.ok()) {
        spacing.sameNet = true;
        in = sameNet.rest();
    }

    auto constraint = cutConstraint(in);
    if (constraint.isFailure())
        return ParseResult<LefCutSpacing>::propagate(constraint);
    if (constraint.ok()) {
        spacing.constraint = constraint.value();
        in = constraint.rest();
    }

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<LefCutSpacing>::propagate(semicolon);
    return ParseResult<LefCutSpacing>::success(semicolon.rest(), spacing);
}

ParseResult<LefEnclosure> LefEnclosure::parse(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "ENCLOSURE");
    if (!keyword.ok())
        return ParseResult<LefEnclosure>::propagate(keyword);
    Cursor in = keyword.rest();

    LefEnclosure enclosure;
    auto side = LefLexer::keywordOf(in, {"ABOVE", "BELOW"}, "ABOVE or BELOW");
    if (side.ok()) {
        enclosure.above = side.value() == "ABOVE";
        in = side.rest();
    }

    auto overhang1 = commit(LefLexer::number(in), in, "overhang1");
    if (!overhang1.ok())
        return ParseResult<LefEnclosure>::propagate(overhang1);
    in = overhang1.rest();
    auto overhang2 = commit(LefLexer::number(in), in, "overhang2");
    if (!overhang2.ok())
        return ParseResult<LefEnclosure>::propagate(overhang2);
    in = overhang2.rest();
    enclosure.overhang1 = overhang1.value();
    enclosure.overhang2 = overhang2.value();

    auto width = LefLexer::keyword(in, "WIDTH");
    auto length = LefLexer::keyword(in, "LENGTH");
    if (width.ok()) {
        in = width.rest();
        auto minWidth = commit(LefLexer::number(in), in, "min_width");
        if (!minWidth.ok())
            return ParseResult<LefEnclosure>::propagate(minWidth);
        in = minWidth.rest();

        LefEnclosureCondition condition;
        condition.type = LefEnclosureConditionType::Width;
        condition.minWidth = minWidth.value();
        auto except = LefLexer::keyword(in, "EXCEPTEXTRACUT");
        if (except.ok()) {
            in = except.rest();
            auto within = commit(LefLexer::number(in), in, "cut_within");
            if (!within.ok())
                return ParseResult<LefEnclosure>::propagate(within);
            condition.exceptExtraCut = within.value();
            in = within.rest();
        }
        enclosure.condition = condition;
    } else if (length.ok()) {
        in = length.rest();
        auto minLength = commit(LefLexer::number(in), in, "min_length");
        if (!minLength.ok())
            return ParseResult<LefEnclosure>::propagate(minLength);
        in = minLength.rest();

        LefEnclosureCondition condition;
        condition.type = LefEnclosureConditionType::Length;
        condition.minLength = minLength.value();
        enclosure.condition = condition;
    }

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<LefEnclosure>::propagate(semicolon);
    return ParseResult<LefEnclosure>::success(semicolon.rest(), enclosure);
}

ParseResult<LefLayerPtr> LefCutLayer::parseBody(const Cursor& input,
                                                const std::string& name)
{
    auto layer = std::make_shared<LefCutLayer>(name);
    Cursor in = input;

    auto mask = parseMask(in);
    if (mask.isFailure())
        return ParseResult<LefLayerPtr>::propagate(mask);
    if (mask.ok()) {
        layer->setMask(mask.value());
        in = mask.rest();
    }

    while (true) {
        auto spacing = LefCutSpacing::parse(in);
        if (spacing.isError())
            break;
        if (spacing.isFailure())
            return ParseResult<LefLayerPtr>::propagate(spacing);
        layer->spacings.push_back(spacing.value());
        in = spacing.rest();
    }

    auto width = LefLexer::valueStatement(in, "WIDTH");
    if (width.isFailure())
        return ParseResult<LefLayerPtr>::propagate(width);
    if (width.ok()) {
        layer->width = width.value();
        in = width.rest();
    }

    while (true) {
        auto enclosure = LefEnclosure::parse(in);
        if (enclosure.isError())
            break;
        if (enclosure.isFailure())
            return ParseResult<LefLayerPtr>::propagate(enclosure);
        layer->enclosures.push_back(enclosure.value());
        in = enclosure.rest();
    }

    auto end = parseEnd(in, name);
    if (!end.ok())
        return ParseResult<LefLayerPtr>::propagate(end);
    return ParseResult<LefLayerPtr>::success(end.rest(), layer);
}

/* -------------------------------- IMPLANT -------------------------------- */

ParseResult<LefImplantSpacing> LefImplantSpacing::parse(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "SPACING");
    if (!keyword.ok())
        return ParseResult<LefImplantSpacing>::propagate(keyword);

    // A word instead of a distance makes this a property clause.
    auto distance = LefLexer::number(keyword.rest());
    if (!distance.ok())
        return ParseResult<LefImplantSpacing>::propagate(distance);
    Cursor in = distance.rest();

    LefImplantSpacing spacing;
    spacing.minSpacing = distance.value();
    auto layer = LefLexer::keyword(in, "LAYER");
    if (layer.ok()) {
        in = layer.rest();
        auto second = commit(LefLexer::identifier(in), in, "layer_name");
        if (!second.ok())
            return ParseResult<LefImplantSpacing>::propagate(second);
        spacing.layer = second.value();
        in = second.rest();
    }

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<LefImplantSpacing>::propagate(semicolon);
    return ParseResult<LefImplantSpacing>::success(semicolon.rest(), spacing);
}

namespace {
using Property = std::pair<std::string, std::string>;

ParseResult<Property> implantProperty(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "SPACING");
    if (!keyword.ok())
        return ParseResult<Property>::propagate(keyword);
    Cursor in = keyword.rest();

    auto key = commit(LefLexer::identifier(in), in, "property_name");
    if (!key.ok())
        return ParseResult<Property>::propagate(key);
    in = key.rest();

    auto value = commit(LefLexer::identifier(in), in, "property_value");
    if (!value.ok())
        return ParseResult<Property>::propagate(value);
    in = value.rest();

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<Property>::propagate(semicolon);
    return ParseResult<Property>::success(semicolon.rest(),
                                          Property(key.value(), value.value()));
}
}  // namespace

ParseResult<LefLayerPtr> LefImplantLayer::parseBody(const Cursor& input,
                                                    const std::string& name)
{
    auto layer = std::make_shared<LefImplantLayer>(name);
    Cursor in = input;

    auto mask = parseMask(in);
    if (mask.isFailure())
        return ParseResult<LefLayerPtr>::propagate(mask);
    if (mask.ok()) {
        layer->setMask(mask.value());
        in = mask.rest();
    }

    auto width = LefLexer::valueStatement(in, "WIDTH");
    if (width.isFailure())
        return ParseResult<LefLayerPtr>::propagate(width);
    if (width.ok()) {
        layer->width = width.value();
        in = width.rest();
    }

    while (true) {
        auto spacing = LefImplantSpacing::parse(in);
        if (spacing.isError())
            break;
        if (spacing.isFailure())
            return ParseResult<LefLayerPtr>::propagate(spacing);
        layer->spacings.push_back(spacing.value());
        in = spacing.rest();
    }

    while (true) {
        auto property = implantProperty(in);
        if (property.isError())
            break;
        if (property.isFailure())
            return ParseResult<LefLayerPtr>::propagate(property);
        layer->properties.push_back(property.value());
        in = property.rest();
    }

    auto end = parseEnd(in, name);
    if (!end.ok())
        return ParseResult<LefLayerPtr>::propagate(end);
    return ParseResult<LefLayerPtr>::success(end.rest(), layer);
}

/* -------------------------------- ROUTING -------------------------------- */

namespace {
using Range = std::pair<double, double>;

/** `RANGE <a> <b>`: Error without the keyword. */
ParseResult<Range> rangeClause(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "RANGE");
    if (!keyword.ok())
        return ParseResult<Range>::propagate(keyword);
    Cursor in = keyword.rest();

    auto low = commit(LefLexer::number(in), in, "range_min");
    if (!low.ok())
        return ParseResult<Range>::propagate(low);
    in = low.rest();
    auto high = commit(LefLexer::number(in), in, "range_max");
    if (!high.ok())
        return ParseResult<Range>::propagate(high);
    return ParseResult<Range>::success(high.rest(),
                                       Range(low.value(), high.value()));
}

/** `<word> <number>` inside a rule, fatal when either part is missing. */
ParseResult<double> keyedNumber(const Cursor& input, const std::string& word)
{
    auto keyword = commit(LefLexer::keyword(input, word), input, word);
    if (!keyword.ok())
        return ParseResult<double>::propagate(keyword);
    Cursor in = keyword.rest();
    return commit(LefLexer::number(in), in, word);
}

ParseResult<LefRoutingSpacingRule> routingRule(const Cursor& input)
{
    using Result = ParseResult<LefRoutingSpacingRule>;
    LefRoutingSpacingRule rule;

    auto range = rangeClause(input);
    if (range.isFailure())
        return Result::propagate(range);
    if (range.ok()) {
        Cursor in = range.rest();
        rule.type = LefRoutingSpacingRuleType::Range;
        rule.minWidth = range.value().first;
        rule.maxWidth = range.value().second;

        auto useLength = LefLexer::keyword(in, "USELENGTHTHRESHOLD");
        auto influence = LefLexer::keyword(in, "INFLUENCE");
        if (useLength.ok()) {
            rule.useLengthThreshold = true;
            in = useLength.rest();
        } else if (influence.ok()) {
            in = influence.rest();
            auto value = commit(LefLexer::number(in), in, "influence");
            if (!value.ok())
                return Result::propagate(value);
            rule.influence = value.value();
            in = value.rest();
            auto stub = rangeClause(in);
            if (stub.isFailure())
                return Result::propagate(stub);
            if (stub.ok()) {
                rule.range = stub.value();
                in = stub.rest();
            }
        } else {
            auto second = rangeClause(in);
            if (second.isFailure())
                return Result::propagate(second);
            if (second.ok()) {
                rule.range = second.value();
                in = second.rest();
            }
        }
        return Result::success(in, rule);
    }

    auto threshold = LefLexer::keyword(input, "LENGTHTHRESHOLD");
    if (threshold.ok()) {
        Cursor in = threshold.rest();
        auto length = commit(LefLexer::number(in), in, "max_length");
        if (!length.ok())
            return Result::propagate(length);
        in = length.rest();
        rule.type = LefRoutingSpacingRuleType::LengthThreshold;
        rule.length = length.value();
        auto lengthRange = rangeClause(in);
        if (lengthRange.isFailure())
            return Result::propagate(lengthRange);
        if (lengthRange.ok()) {
            rule.range = lengthRange.value();
            in = lengthRange.rest();
        }
        return Result::success(in, rule);
    }

    auto endOfLine = LefLexer::keyword(input, "ENDOFLINE");
    if (endOfLine.ok()) {
        Cursor in = endOfLine.rest();
        auto eolWidth = commit(LefLexer::number(in), in, "eol_width");
        if (!eolWidth.ok())
            return Result::propagate(eolWidth);
        in = eolWidth.rest();
        auto eolWithin = keyedNumber(in, "WITHIN");
        if (!eolWithin.ok())
            return Result::propagate(eolWithin);
        in = eolWithin.rest();
        rule.type = LefRoutingSpacingRuleType::EndOfLine;
        rule.eolWidth = eolWidth.value();
        rule.eolWithin = eolWithin.value();

        auto parallel = LefLexer::keyword(in, "PARALLELEDGE");
        if (parallel.ok()) {
            in = parallel.rest();
            auto space = commit(LefLexer::number(in), in, "par_space");
            if (!space.ok())
                return Result::propagate(space);
            in = space.rest();
            auto within = keyedNumber(in, "WITHIN");
            if (!within.ok())
                return Result::propagate(within);
            in = within.rest();

            LefParallelEdge edge;
            edge.space = space.value();
            edge.within = within.value();
            auto twoEdges = LefLexer::keyword(in, "TWOEDGES");
            if (twoEdges.ok()) {
                edge.twoEdges = true;
                in = twoEdges.rest();
            }
            rule.parallelEdge = edge;
        }
        return Result::success(in, rule);
    }

    auto sameNet = LefLexer::keyword(input, "SAMENET");
    if (sameNet.ok()) {
        Cursor in = sameNet.rest();
        rule.type = LefRoutingSpacingRuleType::SameNet;
        auto pgOnly = LefLexer::keyword(in, "PGONLY");
        if (pgOnly.ok()) {
            rule.pgOnly = true;
            in = pgOnly.rest();
        }
        return Result::success(in, rule);
    }

    auto notchLength = LefLexer::keyword(input, "NOTCHLENGTH");
    if (notchLength.ok()) {
        Cursor in = notchLength.rest();
        auto length = commit(LefLexer::number(in), in, "notch_length");
        if (!length.ok())
            return Result::propagate(length);
        rule.type = LefRoutingSpacingRuleType::NotchLength;
        rule.length = length.value();
        return Result::success(length.rest(), rule);
    }

    auto endOfNotch = LefLexer::keyword(input, "ENDOFNOTCHWIDTH");
    if (endOfNotch.ok()) {
        Cursor in = endOfNotch.rest();
        auto width = commit(LefLexer::number(in), in, "notch_width");
        if (!width.ok())
            return Result::propagate(width);
        in = width.rest();
        auto spacing = keyedNumber(in, "NOTCHSPACING");
        if (!spacing.ok())
            return Result::propagate(spacing);
        in = spacing.rest();
        auto length = keyedNumber(in, "NOTCHLENGTH");
        if (!length.ok())
            return Result::propagate(length);

        rule.type = LefRoutingSpacingRuleType::EndOfNotchWidth;
        rule.notchWidth = width.value();
        rule.notchSpacing = spacing.value();
        rule.length = length.value();
        return Result::success(length.rest(), rule);
    }

    return Result::reject(input, "routing spacing rule");
}
}  // namespace

ParseResult<LefRoutingSpacing> LefRoutingSpacing::parse(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "SPACING");
    if (!keyword.ok())
        return ParseResult<LefRoutingSpacing>::propagate(keyword);
    Cursor in = keyword.rest();

    auto distance = commit(LefLexer::number(in), in, "min_spacing");
    if (!distance.ok())
        return ParseResult<LefRoutingSpacing>::propagate(distance);
    in = distance.rest();

    LefRoutingSpacing spacing;
    spacing.minSpacing = distance.value();

    auto rule = routingRule(in);
    if (rule.isFailure())
        return ParseResult<LefRoutingSpacing>::propagate(rule);
    if (rule.ok()) {
        spacing.rule = rule.value();
        in = rule.rest();
    }

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<LefRoutingSpacing>::propagate(semicolon);
    return ParseResult<LefRoutingSpacing>::success(semicolon.rest(), spacing);
}

LefRoutingLayerBuilder& LefRoutingLayerBuilder::mask(unsigned value)
{
    maskValue = value;
    return *this;
}

LefRoutingLayerBuilder& LefRoutingLayerBuilder::direction(
    LefRoutingDirection value)
{
    directionValue = value;
    return *this;
}

LefRoutingLayerBuilder& LefRoutingLayerBuilder::pitch(const LefPitch& value)
{
    pitchValue = value;
    return *this;
}

LefRoutingLayerBuilder& LefRoutingLayerBuilder::width(double value)
{
    widthValue = value;
    return *this;
}

LefRoutingLayerBuilder& LefRoutingLayerBuilder::area(double value)
{
    areaValue = value;
    return *this;
}

LefRoutingLayerBuilder& LefRoutingLayerBuilder::spacing(
    const LefRoutingSpacing& value)
{
    spacingRules.push_back(value);
    return *this;
}

LefRoutingLayerBuilder& LefRoutingLayerBuilder::maxWidth(double value)
{
    maxWidthValue = value;
    return *this;
}

LefRoutingLayerBuilder& LefRoutingLayerBuilder::minWidth(double value)
{
    minWidthValue = value;
    return *this;
}

std::shared_ptr<LefRoutingLayer> LefRoutingLayerBuilder::build() const
{
    if (!directionValue || !pitchValue || !widthValue)
        return nullptr;

    auto layer = std::make_shared<LefRoutingLayer>(name, *directionValue,
                                                   *pitchValue, *widthValue);
    if (maskValue)
        layer->setMask(*maskValue);
    layer->area = areaValue;
    layer->spacingRules = spacingRules;
    layer->maxWidth = maxWidthValue;
    layer->minWidth = minWidthValue;
    return layer;
}

ParseResult<LefLayerPtr> LefRoutingLayer::parseBody(const Cursor& input,
                                                    const std::string& name)
{
    LefRoutingLayerBuilder builder(name);
    Cursor in = input;

    auto mask = parseMask(in);
    if (mask.isFailure())
        return ParseResult<LefLayerPtr>::propagate(mask);
    if (mask.ok()) {
        builder.mask(mask.value());
        in = mask.rest();
    }

    // DIRECTION {HORIZONTAL | VERTICAL | DIAG45 | DIAG135} ;
    auto direction =
        commit(LefLexer::keyword(in, "DIRECTION"), in, "DIRECTION");
    if (!direction.ok())
        return ParseResult<LefLayerPtr>::propagate(direction);
    in = direction.rest();
    auto directionName = commit(
        LefLexer::keywordOf(in, {"HORIZONTAL", "VERTICAL", "DIAG45", "DIAG135"},
                            "routing direction"),
        in, "direction");
    if (!directionName.ok())
        return ParseResult<LefLayerPtr>::propagate(directionName);
    in = directionName.rest();
    if (directionName.value() == "HORIZONTAL")
        builder.direction(LefRoutingDirection::Horizontal);
    else if (directionName.value() == "VERTICAL")
        builder.direction(LefRoutingDirection::Vertical);
    else if (directionName.value() == "DIAG45")
        builder.direction(LefRoutingDirection::Diag45);
    else
        builder.direction(LefRoutingDirection::Diag135);
    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<LefLayerPtr>::propagate(semicolon);
    in = semicolon.rest();

    // PITCH {distance | xDistance yDistance} ;
    auto pitch = commit(LefLexer::keyword(in, "PITCH"), in, "PITCH");
    if (!pitch.ok())
        return ParseResult<LefLayerPtr>::propagate(pitch);
    in = pitch.rest();
    auto pitchX = commit(LefLexer::number(in), in, "pitch");
    if (!pitchX.ok())
        return ParseResult<LefLayerPtr>::propagate(pitchX);
    in = pitchX.rest();
    auto pitchY = LefLexer::number(in);
    if (pitchY.ok()) {
        builder.pitch(LefPitch::makeXY(pitchX.value(), pitchY.value()));
        in = pitchY.rest();
    } else {
        builder.pitch(LefPitch::makeUniform(pitchX.value()));
    }
    semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return ParseResult<LefLayerPtr>::propagate(semicolon);
    in = semicolon.rest();

    // WIDTH defaultWidth ;
    auto width = commit(LefLexer::valueStatement(in, "WIDTH"), in, "WIDTH");
    if (!width.ok())
        return ParseResult<LefLayerPtr>::propagate(width);
    builder.width(width.value());
    in = width.rest();

    auto area = LefLexer::valueStatement(in, "AREA");
    if (area.isFailure())
        return ParseResult<LefLayerPtr>::propagate(area);
    if (area.ok()) {
        builder.area(area.value());
        in = area.rest();
    }

    while (true) {
        auto spacing = LefRoutingSpacing::parse(in);
        if (spacing.isError())
            break;
        if (spacing.isFailure())
            return ParseResult<LefLayerPtr>::propagate(spacing);
        builder.spacing(spacing.value());
        in = spacing.rest();
    }

    auto maxWidth = LefLexer::valueStatement(in, "MAXWIDTH");
    if (maxWidth.isFailure())
        return ParseResult<LefLayerPtr>::propagate(maxWidth);
    if (maxWidth.ok()) {
        builder.maxWidth(maxWidth.value());
        in = maxWidth.rest();
    }

    auto minWidth = LefLexer::valueStatement(in, "MINWIDTH");
    if (minWidth.isFailure())
        return ParseResult<LefLayerPtr>::propagate(minWidth);
    if (minWidth.ok()) {
        builder.minWidth(minWidth.value());
        in = minWidth.rest();
    }

    auto end = parseEnd(in, name);
    if (!end.ok())
        return ParseResult<LefLayerPtr>::propagate(end);

    std::shared_ptr<LefRoutingLayer> layer = builder.build();
    if (!layer)
        return ParseResult<LefLayerPtr>::fail(input, "incomplete routing layer");
    return ParseResult<LefLayerPtr>::success(end.rest(), layer);
}

/* -------------------------- MASTERSLICE / OVERLAP ------------------------- */

ParseResult<Lef58TrimmedMetal> Lef58TrimmedMetal::parse(const Cursor& input)
{
    auto keyword = LefLexer::keyword(input, "TRIMMEDMETAL");
    if (!keyword.ok())
        return ParseResult<Lef58TrimmedMetal>::propagate(keyword);
    Cursor in = keyword.rest();

    auto metal = commit(LefLexer::identifier(in), in, "metal_layer");
    if (!metal.ok())
        return ParseResult<Lef58TrimmedMetal>::propagate(metal);
    in = metal.rest();

    Lef58TrimmedMetal trimmed;
    trimmed.metalLayer = metal.value();
    auto mask = LefLexer::keyword(in, "MASK");
    if (mask.ok()) {
        in = mask.rest();
        auto number = commit(LefLexer::unsignedInt(in), in, "mask");
        if (!number.ok())
            return ParseResult<Lef58TrimmedMetal>::propagate(number);
        trimmed.mask = number.value();
        in = number.rest();
    }
    return ParseResult<Lef58TrimmedMetal>::success(in, trimmed);
}

std::optional<Lef58Type> LefSpecialLayer::lef58TypeOf(const std::string& value)
{
    static const std::pair<const char*, Lef58Type> types[] = {
        {"TYPE NWELL", Lef58Type::NWell},
        {"TYPE PWELL", Lef58Type::PWell},
        {"TYPE ABOVEDIEEDGE", Lef58Type::AboveDieEdge},
        {"TYPE BELOWDIEEDGE", Lef58Type::BelowDieEdge},
        {"TYPE DIFFUSION", Lef58Type::Diffusion},
        {"TYPE TRIMPOLY", Lef58Type::TrimPoly},
        {"TYPE TRIMMETAL", Lef58Type::TrimMetal},
        {"TYPE REGION", Lef58Type::Region}};

    std::string text = Lexer::upper(value);
    for (const auto& type : types) {
        if (text == type.first)
            return type.second;
    }
    return std::nullopt;
}

ParseResult<LefLayerPtr> LefSpecialLayer::parseBody(
    const Cursor& input, const std::string& name,
    LefSpecialLayerType layerType)
{
    auto layer = std::make_shared<LefSpecialLayer>(name, layerType);
    Cursor in = input;

    auto mask = parseMask(in);
    if (mask.isFailure())
        return ParseResult<LefLayerPtr>::propagate(mask);
    if (mask.ok()) {
        layer->setMask(mask.value());
        in = mask.rest();
    }

    while (true) {
        auto property = LefLexer::keyword(in, "PROPERTY");
        if (!property.ok())
            break;
        Cursor at = LefLexer::skipSpace(in);
        in = property.rest();

        auto key = commit(LefLexer::identifier(in), in, "property_name");
        if (!key.ok())
            return ParseResult<LefLayerPtr>::propagate(key);
        in = key.rest();

        auto value = commit(LefLexer::quotedString(in), in, "property_value");
        if (!value.ok())
            return ParseResult<LefLayerPtr>::propagate(value);
        in = value.rest();

        auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
        if (!semicolon.ok())
            return ParseResult<LefLayerPtr>::propagate(semicolon);
        in = semicolon.rest();

        if (key.value() == "LEF58_TYPE") {
            std::optional<Lef58Type> type = lef58TypeOf(value.value());
            if (type)
                layer->lef58Type = type;
        } else if (key.value() == "LEF58_TRIMMEDMETAL") {
            const std::string& payload = value.value();
            auto trimmed = Lef58TrimmedMetal::parse(Cursor(payload));
            if (!trimmed.ok())
                return ParseResult<LefLayerPtr>::fail(at, "LEF58_TRIMMEDMETAL");
            layer->lef58TrimmedMetal = trimmed.value();
        } else {
            layer->properties.emplace_back(key.value(), value.value());
        }
    }

    auto end = parseEnd(in, name);
    if (!end.ok())
        return ParseResult<LefLayerPtr>::propagate(end);
    return ParseResult<LefLayerPtr>::success(end.rest(), layer);
}
