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
 * @file Waveforms.cpp
 * @brief SIN, PWL and PULSE source values: parsing, evaluation and output.
 *
 * Each form commits as soon as its keyword has been read; from then on every
 * field inside the parentheses is mandatory (SIN has three optional trailing
 * fields).
 */

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "Lexer.hpp"
#include "Source.hpp"

namespace {
constexpr double kPi = 3.14159265358979323846;

Unit amplitudeUnit(SourceKind kind)
{
    return kind == SourceKind::Voltage ? Unit::Volt : Unit::Ampere;
}

/**
 * @brief Read one mandatory field of a committed waveform.
 */
ParseResult<UnitNumber> field(Cursor& in, Unit unit, const std::string& label)
{
    auto value = commit(SpiceLexer::quantityToken(in, unit), in, label);
    if (value.ok())
        in = value.rest();
    return value;
}

/**
 * @brief Read an optional trailing SIN field, defaulting to zero.
 */
UnitNumber optionalField(Cursor& in, Unit unit)
{
    auto value = SpiceLexer::quantityToken(in, unit);
    if (!value.ok())
        return UnitNumber(0.0, Suffix::None, unit);
    in = value.rest();
    return value.value();
}

ParseResult<std::string> symbol(Cursor& in, const std::string& text)
{
    auto result = commit(SpiceLexer::keyword(in, text), in, text);
    if (result.ok())
        in = result.rest();
    return result;
}
}  // namespace

/* ----------------------------------- SIN --------------------------------- */

ParseResult<SourceValuePtr> SinValue::parse(const Cursor& input,
                                            SourceKind kind)
{
    auto keyword = SpiceLexer::keyword(input, "SIN");
    if (!keyword.ok())
        return ParseResult<SourceValuePtr>::propagate(keyword);
    Cursor in = keyword.rest();

    auto open = symbol(in, "(");
    if (!open.ok())
        return ParseResult<SourceValuePtr>::propagate(open);

    auto offset = field(in, amplitudeUnit(kind), "vo");
    if (!offset.ok())
        return ParseResult<SourceValuePtr>::propagate(offset);
    auto amplitude = field(in, amplitudeUnit(kind), "va");
    if (!amplitude.ok())
        return ParseResult<SourceValuePtr>::propagate(amplitude);
    auto frequency = field(in, Unit::Hertz, "freq");
    if (!frequency.ok())
        return ParseResult<SourceValuePtr>::propagate(frequency);

    UnitNumber delay = optionalField(in, Unit::Second);
    UnitNumber damping = optionalField(in, Unit::Hertz);
    UnitNumber phase = optionalField(in, Unit::Degree);

    auto close = symbol(in, ")");
    if (!close.ok())
        return ParseResult<SourceValuePtr>::propagate(close);

    SourceValuePtr sin = std::make_shared<SinValue>(
        offset.value(), amplitude.value(), frequency.value(), delay, damping,
        phase);
    return ParseResult<SourceValuePtr>::success(in, sin);
}

double SinValue::valueAt(double time) const
{
    double vo = offset.toDouble();
    double td = delay.toDouble();
    if (time < td)
        return vo;

    double t = time - td;
    double envelope = std::exp(-damping.toDouble() * t);
    double omega = 2.0 * kPi * frequency.toDouble();
    double phi = phase.toDouble() * kPi / 180.0;
    return vo + amplitude.toDouble() * envelope * std::sin(omega * t + phi);
}

std::string SinValue::toSpice() const
{
    return "SIN(" + offset.toSpice() + " " + amplitude.toSpice() + " " +
           frequency.toSpice() + " " + delay.toSpice() + " " +
           damping.toSpice() + " " + phase.toSpice() + ")";
}

/* ----------------------------------- PWL --------------------------------- */

ParseResult<SourceValuePtr> PwlValue::parse(const Cursor& input,
                                            SourceKind kind)
{
    auto keyword = SpiceLexer::keyword(input, "PWL");
    if (!keyword.ok())
        return ParseResult<SourceValuePtr>::propagate(keyword);
    Cursor in = keyword.rest();

    auto open = symbol(in, "(");
    if (!open.ok())
        return ParseResult<SourceValuePtr>::propagate(open);

    std::vector<Point> points;
    while (true) {
        if (!points.empty()) {
            auto close = SpiceLexer::keyword(in, ")");
            if (close.ok()) {
                in = close.rest();
                break;
            }
        }
        auto time = field(in, Unit::Second, "pwl_time");
        if (!time.ok())
            return ParseResult<SourceValuePtr>::propagate(time);
        auto value = field(in, amplitudeUnit(kind), "pwl_value");
        if (!value.ok())
            return ParseResult<SourceValuePtr>::propagate(value);
        points.emplace_back(time.value(), value.value());
    }

    SourceValuePtr pwl = std::make_shared<PwlValue>(points);
    return ParseResult<SourceValuePtr>::success(in, pwl);
}

double PwlValue::valueAt(double time) const
{
    if (points.empty())
        return 0.0;
    if (points.size() == 1 || time < points.front().first.toDouble())
        return points.front().second.toDouble();

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        double t0 = points[i].first.toDouble();
        double t1 = points[i + 1].first.toDouble();
        double v0 = points[i].second.toDouble();
        double v1 = points[i + 1].second.toDouble();
        if (t0 <= time && time <= t1) {
            if (t1 == t0)
                return v1;
            return v0 + (v1 - v0) * (time - t0) / (t1 - t0);
        }
    }
    return points.back().second.toDouble();
}

std::string PwlValue::toSpice() const
{
    std::string line = "PWL(";
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0)
            line += " ";
        line += points[i].first.toSpice() + " " + points[i].second.toSpice();
    }
    return line + ")";
}

/* ---------------------------------- PULSE -------------------------------- */

ParseResult<SourceValuePtr> PulseValue::parse(const Cursor& input,
                                              SourceKind kind)
{
    auto keyword = SpiceLexer::keyword(input, "PULSE");
    if (!keyword.ok())
        return ParseResult<SourceValuePtr>::propagate(keyword);
    Cursor in = keyword.rest();

    auto open = symbol(in, "(");
    if (!open.ok())
        return ParseResult<SourceValuePtr>::propagate(open);

    const Unit amp = amplitudeUnit(kind);
    const Unit units[7] = {amp,          amp,          Unit::Second,
                           Unit::Second, Unit::Second, Unit::Second,
                           Unit::Second};
    const char* labels[7] = {"v0", "v1", "td", "tr", "tf", "tw", "to"};
    UnitNumber fields[7];
    for (int i = 0; i < 7; ++i) {
        auto value = field(in, units[i], labels[i]);
        if (!value.ok())
            return ParseResult<SourceValuePtr>::propagate(value);
        fields[i] = value.value();
    }

    auto close = symbol(in, ")");
    if (!close.ok())
        return ParseResult<SourceValuePtr>::propagate(close);

    SourceValuePtr pulse =
        std::make_shared<PulseValue>(fields[0], fields[1], fields[2], fields[3],
                                     fields[4], fields[5], fields[6]);
    return ParseResult<SourceValuePtr>::success(in, pulse);
}

std::shared_ptr<PulseValue> PulseValue::clock(const UnitNumber& vdd,
                                              const UnitNumber& period,
                                              const UnitNumber& slew)
{
    UnitNumber zeroVolt(0.0, Suffix::None, vdd.getUnit());
    UnitNumber zeroTime(0.0, Suffix::None, Unit::Second);
    Number width = (period.getNumber() - slew.getNumber() * 2.0) * 0.5;
    return std::make_shared<PulseValue>(zeroVolt, vdd, zeroTime, slew, slew,
                                        UnitNumber(width, Unit::Second),
                                        period);
}

double PulseValue::valueAt(double time) const
{
    double v0 = initial.toDouble();
    double v1 = pulsed.toDouble();
    double td = delay.toDouble();
    if (time <= td)
        return v0;

    double t = time - td;
    double per = period.toDouble();
    if (per > 0.0)
        t = std::fmod(t, per);

    double tr = rise.toDouble();
    double tf = fall.toDouble();
    double pw = width.toDouble();
    if (t < tr)
        return v0 + (v1 - v0) * t / tr;
    if (t < tr + pw)
        return v1;
    if (t < tr + pw + tf)
        return v1 - (v1 - v0) * (t - tr - pw) / tf;
    return v0;
}

std::string PulseValue::toSpice() const
{
    return "PULSE(" + initial.toSpice() + " " + pulsed.toSpice() + " " +
           delay.toSpice() + " " + rise.toSpice() + " " + fall.toSpice() +
           " " + width.toSpice() + " " + period.toSpice() + ")";
}
