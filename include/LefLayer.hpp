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
 * @file LefLayer.hpp
 * @brief LEF `LAYER` blocks: cut, implant, routing and special layers.
 *
 * Every layer block has the shape
 *
 *     LAYER <name>
 *         TYPE {CUT | IMPLANT | ROUTING | MASTERSLICE | OVERLAP} ;
 *         [MASK <n> ;]
 *         ... type specific clauses ...
 *     END <name>
 *
 * `LefLayer::parse()` reads the header and hands the body to the
 * `parseBody()` of the matching class. Once `LAYER` has been read the block
 * is committed: any malformation inside it is fatal. The name after `END`
 * must equal the opening name; a mismatch is always fatal.
 *
 * Clauses inside a body are read in the fixed order documented on each
 * class. Repeated clauses are read until their keyword stops matching.
 */

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ParseResult.hpp"

/**
 * @enum LefLayerKind
 * @brief Which body grammar a layer was read with.
 */
enum class LefLayerKind
{
    Cut,
    Implant,
    Routing,
    Special /**< MASTERSLICE or OVERLAP */
};

inline std::ostream& operator<<(std::ostream& os, LefLayerKind kind)
{
    switch (kind) {
        case LefLayerKind::Cut:
            os << "CUT";
            break;
        case LefLayerKind::Implant:
            os << "IMPLANT";
            break;
        case LefLayerKind::Routing:
            os << "ROUTING";
            break;
        case LefLayerKind::Special:
            os << "SPECIAL";
            break;
        default:
            os << "UnknownLayer";
            break;
    }
    return os;
}

class LefLayer;
using LefLayerPtr = std::shared_ptr<LefLayer>;

/**
 * @class LefLayer
 * @brief Base of all layer kinds: name, kind and optional mask number.
 */
class LefLayer
{
   public:
    LefLayer(const std::string& name, LefLayerKind kind)
        : name(name), kind(kind)
    {
    }
    virtual ~LefLayer() = default;

    const std::string& getName() const { return name; }
    LefLayerKind getKind() const { return kind; }
    const std::optional<unsigned>& getMask() const { return mask; }
    void setMask(unsigned value) { mask = value; }

    /**
     * @brief Parse a complete `LAYER ... END <name>` block.
     *
     * @return Error when the input does not start with `LAYER`; Failure for
     *         any problem after it, an unknown `TYPE` included.
     */
    static ParseResult<LefLayerPtr> parse(const Cursor& input);

   protected:
    /** @brief `[MASK <n> ;]`: Error when absent, fatal when malformed. */
    static ParseResult<unsigned> parseMask(const Cursor& input);

    /**
     * @brief `END <name>` closing the block opened as `name`.
     *
     * A missing `END`, a missing name or a different name are all fatal.
     */
    static ParseResult<std::string> parseEnd(const Cursor& input,
                                             const std::string& name);

    std::string name;
    LefLayerKind kind;
    std::optional<unsigned> mask;
};

/* ---------------------------------- CUT ---------------------------------- */

enum class LefCutSpacingConstraintType
{
    Layer,           /**< `LAYER <name> [STACK]` */
    AdjacentCuts,    /**< `ADJACENTCUTS <n> WITHIN <d> [EXCEPTSAMEPGNET]` */
    ParallelOverlap, /**< `PARALLELOVERLAP` */
    Area             /**< `AREA <a>` */
};

/**
 * @struct LefCutSpacingConstraint
 * @brief The single optional constraint of a cut `SPACING` clause.
 *
 * Only the fields of `type` are meaningful.
 */
struct LefCutSpacingConstraint
{
    LefCutSpacingConstraintType type = LefCutSpacingConstraintType::Layer;
    std::string layerName;
    bool stack = false;
    unsigned count = 0;
    double within = 0.0;
    bool exceptSamePgNet = false;
    double area = 0.0;
};

/**
 * @struct LefCutSpacing
 * @brief `SPACING <d> [CENTERTOCENTER] [SAMENET] [constraint] ;`
 */
struct LefCutSpacing
{
    double spacing = 0.0;
    bool centerToCenter = false;
    bool sameNet = false;
    std::optional<LefCutSpacingConstraint> constraint;

    static ParseResult<LefCutSpacing> parse(const Cursor& input);
};

enum class LefEnclosureConditionType
{
    Width, /**< `WIDTH <w> [EXCEPTEXTRACUT <d>]` */
    Length /**< `LENGTH <l>` */
};

struct LefEnclosureCondition
{
    LefEnclosureConditionType type = LefEnclosureConditionType::Width;
    double minWidth = 0.0;
    std::optional<double> exceptExtraCut;
    double minLength = 0.0;
};

/**
 * @struct LefEnclosure
 * @brief `ENCLOSURE [ABOVE | BELOW] <o1> <o2> [condition] ;`
 *
 * Without ABOVE or BELOW the rule applies above.
 */
struct LefEnclosure
{
    bool above = true;
    double overhang1 = 0.0;
    double overhang2 = 0.0;
    std::optional<LefEnclosureCondition> condition;

    static ParseResult<LefEnclosure> parse(const Cursor& input);
};

/**
 * @class LefCutLayer
 * @brief `TYPE CUT` layer.
 *
 * Body order: `[MASK]`, `SPACING` clauses, `[WIDTH <w> ;]`, `ENCLOSURE`
 * clauses, `END`.
 */
class LefCutLayer : public LefLayer
{
   public:
    explicit LefCutLayer(const std::string& name)
        : LefLayer(name, LefLayerKind::Cut)
    {
    }

    const std::optional<double>& getWidth() const { return width; }
    const std::vector<LefCutSpacing>& getSpacings() const { return spacings; }
    const std::vector<LefEnclosure>& getEnclosures() const
    {
        return enclosures;
    }

    /** @brief Body after `TYPE CUT ;`, up to and including `END <name>`. */
    static ParseResult<LefLayerPtr> parseBody(const Cursor& input,
                                              const std::string& name);

   private:
    std::optional<double> width;
    std::vector<LefCutSpacing> spacings;
    std::vector<LefEnclosure> enclosures;
};

/* -------------------------------- IMPLANT -------------------------------- */

/** @brief `SPACING <d> [LAYER <name>] ;` */
struct LefImplantSpacing
{
    double minSpacing = 0.0;
    std::optional<std::string> layer;

    static ParseResult<LefImplantSpacing> parse(const Cursor& input);
};

/**
 * @class LefImplantLayer
 * @brief `TYPE IMPLANT` layer.
 *
 * Body order: `[MASK]`, `[WIDTH <w> ;]`, spacing clauses, property clauses,
 * `END`. Property clauses are written `SPACING <key> <value> ;`; both words
 * are plain identifiers.
 */
class LefImplantLayer : public LefLayer
{
   public:
    explicit LefImplantLayer(const std::string& name)
        : LefLayer(name, LefLayerKind::Implant)
    {
    }

    const std::optional<double>& getWidth() const { return width; }
    const std::vector<LefImplantSpacing>& getSpacings() const
    {
        return spacings;
    }
    const std::vector<std::pair<std::string, std::string>>& getProperties()
        const
    {
        return properties;
    }

    static ParseResult<LefLayerPtr> parseBody(const Cursor& input,
                                              const std::string& name);

   private:
    std::optional<double> width;
    std::vector<LefImplantSpacing> spacings;
    std::vector<std::pair<std::string, std::string>> properties;
};

/* -------------------------------- ROUTING -------------------------------- */

enum class LefRoutingDirection
{
    Horizontal,
    Vertical,
    Diag45,
    Diag135
};

inline std::ostream& operator<<(std::ostream& os, LefRoutingDirection dir)
{
    switch (dir) {
        case LefRoutingDirection::Horizontal:
            os << "HORIZONTAL";
            break;
        case LefRoutingDirection::Vertical:
            os << "VERTICAL";
            break;
        case LefRoutingDirection::Diag45:
            os << "DIAG45";
            break;
        case LefRoutingDirection::Diag135:
            os << "DIAG135";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

/**
 * @struct LefPitch
 * @brief `PITCH <d> ;` (uniform) or `PITCH <x> <y> ;`.
 */
struct LefPitch
{
    bool uniform = true;
    double x = 0.0;
    double y = 0.0; /**< Equal to `x` for a uniform pitch */

    static LefPitch makeUniform(double distance)
    {
        return LefPitch{true, distance, distance};
    }
    static LefPitch makeXY(double x, double y) { return LefPitch{false, x, y}; }
};

enum class LefRoutingSpacingRuleType
{
    Range,           /**< `RANGE <min> <max> [...]` */
    LengthThreshold, /**< `LENGTHTHRESHOLD <len> [RANGE <min> <max>]` */
    EndOfLine,       /**< `ENDOFLINE <w> WITHIN <d> [PARALLELEDGE ...]` */
    SameNet,         /**< `SAMENET [PGONLY]` */
    NotchLength,     /**< `NOTCHLENGTH <len>` */
    EndOfNotchWidth  /**< `ENDOFNOTCHWIDTH <w> NOTCHSPACING <s> NOTCHLENGTH <l>` */
};

/** @brief `PARALLELEDGE <space> WITHIN <within> [TWOEDGES]` */
struct LefParallelEdge
{
    double space = 0.0;
    double within = 0.0;
    bool twoEdges = false;
};

/**
 * @struct LefRoutingSpacingRule
 * @brief Optional qualifier of a routing `SPACING` clause.
 *
 * Field use by type:
 *  - Range: `minWidth`, `maxWidth`, then at most one of
 *    `useLengthThreshold`, `influence` (with an optional stub `range`) or a
 *    second `range`.
 *  - LengthThreshold: `length`, optional `range`.
 *  - EndOfLine: `eolWidth`, `eolWithin`, optional `parallelEdge`.
 *  - SameNet: `pgOnly`.
 *  - NotchLength: `length`.
 *  - EndOfNotchWidth: `notchWidth`, `notchSpacing`, `length`.
 */
struct LefRoutingSpacingRule
{
    LefRoutingSpacingRuleType type = LefRoutingSpacingRuleType::Range;
    double minWidth = 0.0;
    double maxWidth = 0.0;
    bool useLengthThreshold = false;
    std::optional<double> influence;
    std::optional<std::pair<double, double>> range;
    double length = 0.0;
    double eolWidth = 0.0;
    double eolWithin = 0.0;
    std::optional<LefParallelEdge> parallelEdge;
    bool pgOnly = false;
    double notchWidth = 0.0;
    double notchSpacing = 0.0;
};

/** @brief `SPACING <d> [rule] ;` */
struct LefRoutingSpacing
{
    double minSpacing = 0.0;
    std::optional<LefRoutingSpacingRule> rule;

    static ParseResult<LefRoutingSpacing> parse(const Cursor& input);
};

class LefRoutingLayer;

/**
 * @class LefRoutingLayerBuilder
 * @brief Collects routing clauses while the body is read.
 *
 * `build()` returns nullptr unless direction, pitch and width have all been
 * set.
 */
class LefRoutingLayerBuilder
{
   public:
    explicit LefRoutingLayerBuilder(const std::string& name) : name(name) {}

    LefRoutingLayerBuilder& mask(unsigned value);
    LefRoutingLayerBuilder& direction(LefRoutingDirection value);
    LefRoutingLayerBuilder& pitch(const LefPitch& value);
    LefRoutingLayerBuilder& width(double value);
    LefRoutingLayerBuilder& area(double value);
    LefRoutingLayerBuilder& spacing(const LefRoutingSpacing& value);
    LefRoutingLayerBuilder& maxWidth(double value);
    LefRoutingLayerBuilder& minWidth(double value);

    std::shared_ptr<LefRoutingLayer> build() const;

   private:
    std::string name;
    std::optional<unsigned> maskValue;
    std::optional<LefRoutingDirection> directionValue;
    std::optional<LefPitch> pitchValue;
    std::optional<double> widthValue;
    std::optional<double> areaValue;
    std::vector<LefRoutingSpacing> spacingRules;
    std::optional<double> maxWidthValue;
    std::optional<double> minWidthValue;
};

/**
 * @class LefRoutingLayer
 * @brief `TYPE ROUTING` layer.
 *
 * Body order: `[MASK]`, `DIRECTION`, `PITCH`, `WIDTH`, `[AREA]`, `SPACING`
 * clauses, `[MAXWIDTH]`, `[MINWIDTH]`, `END`. DIRECTION, PITCH and WIDTH are
 * mandatory.
 */
class LefRoutingLayer : public LefLayer
{
   public:
    LefRoutingLayer(const std::string& name, LefRoutingDirection direction,
                    const LefPitch& pitch, double width)
        : LefLayer(name, LefLayerKind::Routing),
          direction(direction),
          pitch(pitch),
          width(width)
    {
    }

    LefRoutingDirection getDirection() const { return direction; }
    const LefPitch& getPitch() const { return pitch; }
    double getWidth() const { return width; }
    const std::optional<double>& getArea() const { return area; }
    const std::vector<LefRoutingSpacing>& getSpacingRules() const
    {
        return spacingRules;
    }
    const std::optional<double>& getMaxWidth() const { return maxWidth; }
    const std::optional<double>& getMinWidth() const { return minWidth; }

    static ParseResult<LefLayerPtr> parseBody(const Cursor& input,
                                              const std::string& name);

   private:
    friend class LefRoutingLayerBuilder;

    LefRoutingDirection direction;
    LefPitch pitch;
    double width;
    std::optional<double> area;
    std::vector<LefRoutingSpacing> spacingRules;
    std::optional<double> maxWidth;
    std::optional<double> minWidth;
};

/* -------------------------- MASTERSLICE / OVERLAP ------------------------- */

enum class LefSpecialLayerType
{
    MasterSlice,
    Overlap
};

/**
 * @enum Lef58Type
 * @brief Value of a `LEF58_TYPE` property.
 */
enum class Lef58Type
{
    NWell,
    PWell,
    AboveDieEdge,
    BelowDieEdge,
    Diffusion,
    TrimPoly,
    TrimMetal,
    Region
};

inline std::ostream& operator<<(std::ostream& os, Lef58Type type)
{
    switch (type) {
        case Lef58Type::NWell:
            os << "NWELL";
            break;
        case Lef58Type::PWell:
            os << "PWELL";
            break;
        case Lef58Type::AboveDieEdge:
            os << "ABOVEDIEEDGE";
            break;
        case Lef58Type::BelowDieEdge:
            os << "BELOWDIEEDGE";
            break;
        case Lef58Type::Diffusion:
            os << "DIFFUSION";
            break;
        case Lef58Type::TrimPoly:
            os << "TRIMPOLY";
            break;
        case Lef58Type::TrimMetal:
            os << "TRIMMETAL";
            break;
        case Lef58Type::Region:
            os << "REGION";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

/** @brief Payload of `LEF58_TRIMMEDMETAL`: `TRIMMEDMETAL <layer> [MASK <n>]`. */
struct Lef58TrimmedMetal
{
    std::string metalLayer;
    std::optional<unsigned> mask;

    /** @brief Parse the text inside the property's quotes. */
    static ParseResult<Lef58TrimmedMetal> parse(const Cursor& input);
};

/**
 * @class LefSpecialLayer
 * @brief `TYPE MASTERSLICE` or `TYPE OVERLAP` layer.
 *
 * Body order: `[MASK]`, `PROPERTY <key> "<value>" ;` clauses, `END`.
 *
 * Two keys are interpreted instead of stored:
 *  - `LEF58_TYPE`: the value, uppercased and stripped of a trailing `;`,
 *    must read `TYPE <word>` for one of the `Lef58Type` words. Other values
 *    are dropped silently.
 *  - `LEF58_TRIMMEDMETAL`: the value is parsed as `Lef58TrimmedMetal`; a
 *    malformed value is fatal.
 */
class LefSpecialLayer : public LefLayer
{
   public:
    LefSpecialLayer(const std::string& name, LefSpecialLayerType layerType)
        : LefLayer(name, LefLayerKind::Special), layerType(layerType)
    {
    }

    LefSpecialLayerType getLayerType() const { return layerType; }
    const std::vector<std::pair<std::string, std::string>>& getProperties()
        const
    {
        return properties;
    }
    const std::optional<Lef58Type>& getLef58Type() const { return lef58Type; }
    const std::optional<Lef58TrimmedMetal>& getLef58TrimmedMetal() const
    {
        return lef58TrimmedMetal;
    }

    static ParseResult<LefLayerPtr> parseBody(const Cursor& input,
                                              const std::string& name,
                                              LefSpecialLayerType layerType);

    /** @brief Map a `LEF58_TYPE` value; nullopt when it names no type. */
    static std::optional<Lef58Type> lef58TypeOf(const std::string& value);

   private:
    LefSpecialLayerType layerType;
    std::vector<std::pair<std::string, std::string>> properties;
    std::optional<Lef58Type> lef58Type;
    std::optional<Lef58TrimmedMetal> lef58TrimmedMetal;
};
