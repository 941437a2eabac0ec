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
 * @file Number.cpp
 * @brief Scaling, formatting and arithmetic for `Number` and `UnitNumber`.
 */

#include "Number.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

double suffixScale(Suffix suffix)
{
    switch (suffix) {
        case Suffix::Mega:
            return 1e6;
        case Suffix::Kilo:
            return 1e3;
        case Suffix::Milli:
            return 1e-3;
        case Suffix::Micro:
            return 1e-6;
        case Suffix::Nano:
            return 1e-9;
        case Suffix::Pico:
            return 1e-12;
        case Suffix::None:
        default:
            return 1.0;
    }
}

double Number::toDouble() const { return value * suffixScale(suffix); }

std::string Number::toSpice() const
{
    std::ostringstream oss;
    oss << std::setprecision(15) << value << suffix;
    return oss.str();
}

Number Number::operator+(const Number& other) const
{
    return Number(toDouble() + other.toDouble());
}

Number Number::operator-(const Number& other) const
{
    return Number(toDouble() - other.toDouble());
}

Number Number::operator*(double factor) const
{
    return Number(value * factor, suffix);
}

bool Number::operator==(const Number& other) const
{
    double a = toDouble();
    double b = other.toDouble();
    if (a == b)
        return true;
    double scale = std::max(std::fabs(a), std::fabs(b));
    return std::fabs(a - b) <= 1e-12 * scale;
}

bool Number::operator<(const Number& other) const
{
    return toDouble() < other.toDouble() && !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const Number& number)
{
    return os << number.toSpice();
}

std::ostream& operator<<(std::ostream& os, const UnitNumber& number)
{
    return os << number.getNumber() << number.getUnit();
}
