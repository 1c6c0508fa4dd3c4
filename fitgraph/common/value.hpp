//  _  _
// |_o|_ _ ._ _.._ |_
// | ||_(_||(_||_)| |
//      _|      |
//
// change-tracked equation graphs for model fitting in C++
//
// Licensed under the MIT License <http://opensource.org/licenses/MIT>.
//
// Copyright © 2025–2026
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

// C++ includes
#include <cmath>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

// Eigen includes
#include <Eigen/Core>

// fmt includes
#include <fmt/format.h>
#include <fmt/ranges.h>

// fitgraph includes
#include <fitgraph/common/errors.hpp>

namespace fitgraph {

using Array = Eigen::ArrayXd;

/**
 * @brief Value held by equation leaves and produced by operators
 *
 * Either a scalar or a one-dimensional homogeneous array of doubles. Binary
 * arithmetic broadcasts a scalar against an array; two arrays must have the
 * same length.
 */
class Value
{
  private:
    std::variant<double, Array> data_;

  public:
    Value()
        : data_(0.0)
    {
    }

    template<typename U, typename = typename std::enable_if<std::is_arithmetic<U>::value>::type>
    Value(const U& scalar)
        : data_(static_cast<double>(scalar))
    {
    }

    Value(Array array)
        : data_(std::move(array))
    {
    }

    Value(std::initializer_list<double> values)
        : data_(Array(static_cast<Eigen::Index>(values.size())))
    {
        auto& array = std::get<Array>(data_);
        Eigen::Index i = 0;
        for(double v : values)
            array[i++] = v;
    }

    bool is_scalar() const { return std::holds_alternative<double>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }

    double scalar() const
    {
        if(!is_scalar())
            throw InvalidArgumentError(fmt::format("Expected a scalar value, got an array of length {}", size()));
        return std::get<double>(data_);
    }

    const Array& array() const
    {
        if(!is_array())
            throw InvalidArgumentError("Expected an array value, got a scalar");
        return std::get<Array>(data_);
    }

    // Number of elements (1 for a scalar)
    Eigen::Index size() const
    {
        return is_scalar() ? 1 : std::get<Array>(data_).size();
    }

    std::string to_string() const
    {
        if(is_scalar())
            return fmt::format("{}", std::get<double>(data_));
        const auto& a = std::get<Array>(data_);
        return fmt::format("[{}]", fmt::join(a.data(), a.data() + a.size(), ", "));
    }

    friend bool operator==(const Value& l, const Value& r)
    {
        if(l.is_scalar() && r.is_scalar())
            return std::get<double>(l.data_) == std::get<double>(r.data_);
        if(l.is_array() && r.is_array()) {
            const auto& a = std::get<Array>(l.data_);
            const auto& b = std::get<Array>(r.data_);
            return a.size() == b.size() && (a == b).all();
        }
        return false;
    }

    friend bool operator!=(const Value& l, const Value& r) { return !(l == r); }
};

/// Apply a scalar function to every element.
template<typename F>
Value map_value(const Value& x, F&& f)
{
    if(x.is_scalar())
        return Value(f(x.scalar()));
    return Value(Array(x.array().unaryExpr([&](double v) { return f(v); })));
}

/// Apply a binary scalar function element-wise with scalar broadcasting.
template<typename F>
Value zip_values(const Value& l, const Value& r, F&& f)
{
    if(l.is_scalar() && r.is_scalar())
        return Value(f(l.scalar(), r.scalar()));
    if(l.is_scalar()) {
        const double a = l.scalar();
        return Value(Array(r.array().unaryExpr([&](double b) { return f(a, b); })));
    }
    if(r.is_scalar()) {
        const double b = r.scalar();
        return Value(Array(l.array().unaryExpr([&](double a) { return f(a, b); })));
    }
    if(l.size() != r.size())
        throw InvalidArgumentError(fmt::format("Array lengths {} and {} do not match", l.size(), r.size()));
    return Value(Array(l.array().binaryExpr(r.array(), [&](double a, double b) { return f(a, b); })));
}

inline Value operator+(const Value& l, const Value& r) { return zip_values(l, r, [](double a, double b) { return a + b; }); }
inline Value operator-(const Value& l, const Value& r) { return zip_values(l, r, [](double a, double b) { return a - b; }); }
inline Value operator*(const Value& l, const Value& r) { return zip_values(l, r, [](double a, double b) { return a * b; }); }
inline Value operator/(const Value& l, const Value& r) { return zip_values(l, r, [](double a, double b) { return a / b; }); }
inline Value operator-(const Value& x) { return map_value(x, [](double a) { return -a; }); }

inline Value pow(const Value& base, const Value& exponent)
{
    return zip_values(base, exponent, [](double a, double b) { return std::pow(a, b); });
}

// Floored remainder: the result takes the sign of the divisor
inline Value remainder(const Value& l, const Value& r)
{
    return zip_values(l, r, [](double a, double b) {
        const double m = std::fmod(a, b);
        return (m != 0.0 && ((m < 0.0) != (b < 0.0))) ? m + b : m;
    });
}

} // namespace fitgraph
