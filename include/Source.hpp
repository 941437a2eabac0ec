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
 * @file Source.hpp
 * @brief Independent voltage (`V`) and current (`I`) sources.
 *
 * A source line names two nodes and one value form:
 *
 *     V<name> <node+> <node-> [DC[=]] <value>
 *     V<name> <node+> <node-> [AC[=]] <magnitude> <phase>
 *     V<name> <node+> <node-> SIN(<vo> <va> <freq> [<td> [<theta> [<phase>]]])
 *     V<name> <node+> <node-> PWL(<t1> <v1> [<t2> <v2> ...])
 *     V<name> <node+> <node-> PULSE(<v0> <v1> <td> <tr> <tf> <pw> <per>)
 *
 * `I` lines accept the same forms with amplitudes read as currents. The first
 * letter of the designator selects the kind; any other letter is a plain
 * mismatch. After the letter the two nodes and a value are mandatory.
 *
 * Value forms are modelled as a small class hierarchy rooted at
 * `SourceValue`, tagged with `SourceValueType`, in the same way components
 * are.
 */

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "Number.hpp"
#include "ParseResult.hpp"

/**
 * @enum SourceKind
 * @brief Voltage or current source, from the designator letter.
 */
enum class SourceKind
{
    Voltage, /**< V */
    Current  /**< I */
};

inline std::ostream& operator<<(std::ostream& os, SourceKind kind)
{
    switch (kind) {
        case SourceKind::Voltage:
            os << "V";
            break;
        case SourceKind::Current:
            os << "I";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

/**
 * @enum SourceValueType
 * @brief Value form given on a source line.
 */
enum class SourceValueType
{
    DcVoltage,
    DcCurrent,
    AcVoltage,
    AcCurrent,
    Sin,
    Pwl,
    Pulse
};

inline std::ostream& operator<<(std::ostream& os, SourceValueType type)
{
    switch (type) {
        case SourceValueType::DcVoltage:
            os << "DcVoltage";
            break;
        case SourceValueType::DcCurrent:
            os << "DcCurrent";
            break;
        case SourceValueType::AcVoltage:
            os << "AcVoltage";
            break;
        case SourceValueType::AcCurrent:
            os << "AcCurrent";
            break;
        case SourceValueType::Sin:
            os << "Sin";
            break;
        case SourceValueType::Pwl:
            os << "Pwl";
            break;
        case SourceValueType::Pulse:
            os << "Pulse";
            break;
        default:
            os << "UnknownSourceValueType";
            break;
    }
    return os;
}

/**
 * @class SourceValue
 * @brief Base of the value forms.
 */
class SourceValue
{
   public:
    explicit SourceValue(SourceValueType type) : type(type) {}
    virtual ~SourceValue() = default;

    SourceValueType getType() const { return type; }

    /** @brief The value as it appears after the nodes on a source line. */
    virtual std::string toSpice() const = 0;

   protected:
    SourceValueType type;
};

using SourceValuePtr = std::shared_ptr<SourceValue>;

/** @brief `DC <value>` or a bare value. */
class DcValue : public SourceValue
{
   public:
    DcValue(SourceKind kind, const UnitNumber& value)
        : SourceValue(kind == SourceKind::Voltage ? SourceValueType::DcVoltage
                                                  : SourceValueType::DcCurrent),
          value(value)
    {
    }

    const UnitNumber& getValue() const { return value; }
    std::string toSpice() const override;

    /** @brief Optional `DC`/`DC=` keyword, then the value; commits after the keyword. */
    static ParseResult<SourceValuePtr> parse(const Cursor& input,
                                             SourceKind kind);

   private:
    UnitNumber value;
};

/** @brief `AC <magnitude> <phase>`, phase in degrees. */
class AcValue : public SourceValue
{
   public:
    AcValue(SourceKind kind, const UnitNumber& magnitude,
            const UnitNumber& phase)
        : SourceValue(kind == SourceKind::Voltage ? SourceValueType::AcVoltage
                                                  : SourceValueType::AcCurrent),
          magnitude(magnitude),
          phase(phase)
    {
    }

    const UnitNumber& getMagnitude() const { return magnitude; }
    const UnitNumber& getPhase() const { return phase; }
    std::string toSpice() const override;

    /** @brief Optional `AC`/`AC=` keyword, magnitude and phase. */
    static ParseResult<SourceValuePtr> parse(const Cursor& input,
                                             SourceKind kind);

   private:
    UnitNumber magnitude;
    UnitNumber phase;
};

/**
 * @class SinValue
 * @brief Damped sine `SIN(vo va freq td theta phase)`.
 *
 * `td`, `theta` and `phase` default to zero when omitted.
 */
class SinValue : public SourceValue
{
   public:
    SinValue(const UnitNumber& offset, const UnitNumber& amplitude,
             const UnitNumber& frequency, const UnitNumber& delay,
             const UnitNumber& damping, const UnitNumber& phase)
        : SourceValue(SourceValueType::Sin),
          offset(offset),
          amplitude(amplitude),
          frequency(frequency),
          delay(delay),
          damping(damping),
          phase(phase)
    {
    }

    const UnitNumber& getOffset() const { return offset; }
    const UnitNumber& getAmplitude() const { return amplitude; }
    const UnitNumber& getFrequency() const { return frequency; }
    const UnitNumber& getDelay() const { return delay; }
    const UnitNumber& getDamping() const { return damping; }
    const UnitNumber& getPhase() const { return phase; }

    /**
     * @brief Instantaneous value at `time` seconds, in base units.
     *
     * Before the delay the source holds its offset. Afterwards it is
     * vo + va * exp(-theta * t') * sin(2 pi f t' + phase), t' = time - td.
     */
    double valueAt(double time) const;

    std::string toSpice() const override;

    /** @brief `SIN(...)`; commits after the `SIN` keyword. */
    static ParseResult<SourceValuePtr> parse(const Cursor& input,
                                             SourceKind kind);

   private:
    UnitNumber offset;
    UnitNumber amplitude;
    UnitNumber frequency;
    UnitNumber delay;
    UnitNumber damping;
    UnitNumber phase;
};

/**
 * @class PwlValue
 * @brief Piecewise-linear `PWL(t1 v1 t2 v2 ...)`.
 *
 * Points are kept in the order written, even when the times are not
 * increasing.
 */
class PwlValue : public SourceValue
{
   public:
    using Point = std::pair<UnitNumber, UnitNumber>;

    explicit PwlValue(const std::vector<Point>& points)
        : SourceValue(SourceValueType::Pwl), points(points)
    {
    }

    const std::vector<Point>& getPoints() const { return points; }

    /**
     * @brief Linear interpolation at `time` seconds.
     *
     * Uses the first segment (in written order) that spans `time`. Before the
     * first point the first value is returned; otherwise, when no segment
     * spans `time`, the last value.
     */
    double valueAt(double time) const;

    std::string toSpice() const override;

    /** @brief `PWL(...)` with at least one (time, value) pair. */
    static ParseResult<SourceValuePtr> parse(const Cursor& input,
                                             SourceKind kind);

   private:
    std::vector<Point> points;
};

/**
 * @class PulseValue
 * @brief Trapezoidal pulse train `PULSE(v0 v1 td tr tf pw per)`.
 */
class PulseValue : public SourceValue
{
   public:
    PulseValue(const UnitNumber& initial, const UnitNumber& pulsed,
               const UnitNumber& delay, const UnitNumber& rise,
               const UnitNumber& fall, const UnitNumber& width,
               const UnitNumber& period)
        : SourceValue(SourceValueType::Pulse),
          initial(initial),
          pulsed(pulsed),
          delay(delay),
          rise(rise),
          fall(fall),
          width(width),
          period(period)
    {
    }

    /**
     * @brief 0 to `vdd` clock with equal rise/fall `slew` and 50% duty.
     */
    static std::shared_ptr<PulseValue> clock(const UnitNumber& vdd,
                                             const UnitNumber& period,
                                             const UnitNumber& slew);

    const UnitNumber& getInitial() const { return initial; }
    const UnitNumber& getPulsed() const { return pulsed; }
    const UnitNumber& getDelay() const { return delay; }
    const UnitNumber& getRise() const { return rise; }
    const UnitNumber& getFall() const { return fall; }
    const UnitNumber& getWidth() const { return width; }
    const UnitNumber& getPeriod() const { return period; }

    /** @brief Value at `time` seconds; repeats every period when period > 0. */
    double valueAt(double time) const;

    std::string toSpice() const override;

    /** @brief `PULSE(...)` with exactly seven fields. */
    static ParseResult<SourceValuePtr> parse(const Cursor& input,
                                             SourceKind kind);

   private:
    UnitNumber initial;
    UnitNumber pulsed;
    UnitNumber delay;
    UnitNumber rise;
    UnitNumber fall;
    UnitNumber width;
    UnitNumber period;
};

class Source;
using SourcePtr = std::shared_ptr<Source>;

/**
 * @class Source
 * @brief Parsed `V` or `I` line.
 */
class Source
{
   public:
    Source(const std::string& name, SourceKind kind, const std::string& nodePos,
           const std::string& nodeNeg, const SourceValuePtr& value)
        : name(name),
          kind(kind),
          nodePos(nodePos),
          nodeNeg(nodeNeg),
          value(value)
    {
    }

    /** @brief Designator without the `V`/`I` letter. */
    const std::string& getName() const { return name; }
    SourceKind getKind() const { return kind; }
    const std::string& getNodePos() const { return nodePos; }
    const std::string& getNodeNeg() const { return nodeNeg; }
    const SourceValuePtr& getValue() const { return value; }

    std::string toSpice() const;

    /**
     * @brief Parse a source line.
     *
     * @return Error unless the designator starts with V or I; Failure when
     *         the nodes or the value after it are malformed.
     */
    static ParseResult<SourcePtr> parse(const Cursor& input);

    /**
     * @brief Parse the value part of a source line.
     *
     * Tries DC, AC, SIN, PWL and PULSE in that order. DC and AC without their
     * keyword stay recoverable; SIN, PWL and PULSE commit after the keyword.
     */
    static ParseResult<SourceValuePtr> parseValue(const Cursor& input,
                                                  SourceKind kind);

   private:
    std::string name;
    SourceKind kind;
    std::string nodePos;
    std::string nodeNeg;
    SourceValuePtr value;
};
