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
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// fitgraph includes
#include <fitgraph/equation/arena.hpp>

namespace fitgraph {
namespace equation {

using FunctionRegistry = std::map<std::string, FunctionPtr>;

inline FunctionPtr make_function(std::string name, size_t min_args, size_t max_args, Function::Body body,
                                 std::vector<std::string> keywords = {})
{
    auto fn = std::make_shared<Function>();
    fn->name = std::move(name);
    fn->min_args = min_args;
    fn->max_args = max_args;
    fn->keywords = std::move(keywords);
    fn->body = std::move(body);
    return fn;
}

namespace detail {

template<typename F>
FunctionPtr unary_function(const std::string& name, F f)
{
    return make_function(name, 1, 1, [f](const std::vector<Value>& args, const KeywordValues&) {
        return map_value(args[0], f);
    });
}

template<typename F>
FunctionPtr binary_function(const std::string& name, F f)
{
    return make_function(name, 2, 2, [f](const std::vector<Value>& args, const KeywordValues&) {
        return zip_values(args[0], args[1], f);
    });
}

inline Value sum_values(const std::vector<Value>& args, const KeywordValues& kwargs)
{
    double total = 0.0;
    for(const auto& kw : kwargs)
        if(kw.first == "initial")
            total = kw.second.scalar();
    const Value& x = args[0];
    total += x.is_scalar() ? x.scalar() : x.array().sum();
    return Value(total);
}

} // namespace detail

/**
 * @brief Functions available by name in every equation factory
 *
 * sin cos tan exp log log10 sqrt abs negative map element-wise over one
 * argument; minimum maximum remainder combine two arguments element-wise;
 * sum reduces an array to a scalar and accepts the keyword `initial`.
 */
inline const FunctionRegistry& builtin_functions()
{
    static const FunctionRegistry registry = [] {
        FunctionRegistry r;
        auto add = [&r](FunctionPtr fn) { r.emplace(fn->name, std::move(fn)); };
        add(detail::unary_function("sin", [](double x) { return std::sin(x); }));
        add(detail::unary_function("cos", [](double x) { return std::cos(x); }));
        add(detail::unary_function("tan", [](double x) { return std::tan(x); }));
        add(detail::unary_function("exp", [](double x) { return std::exp(x); }));
        add(detail::unary_function("log", [](double x) { return std::log(x); }));
        add(detail::unary_function("log10", [](double x) { return std::log10(x); }));
        add(detail::unary_function("sqrt", [](double x) { return std::sqrt(x); }));
        add(detail::unary_function("abs", [](double x) { return std::abs(x); }));
        add(detail::unary_function("negative", [](double x) { return -x; }));
        add(detail::binary_function("minimum", [](double a, double b) { return std::fmin(a, b); }));
        add(detail::binary_function("maximum", [](double a, double b) { return std::fmax(a, b); }));
        add(make_function("remainder", 2, 2, [](const std::vector<Value>& args, const KeywordValues&) {
            return remainder(args[0], args[1]);
        }));
        add(make_function("sum", 1, 1, detail::sum_values, {"initial"}));
        return r;
    }();
    return registry;
}

inline FunctionPtr builtin_function(const std::string& name)
{
    const auto& registry = builtin_functions();
    auto it = registry.find(name);
    if(it == registry.end())
        throw NameResolutionError(name);
    return it->second;
}

} // namespace equation
} // namespace fitgraph
