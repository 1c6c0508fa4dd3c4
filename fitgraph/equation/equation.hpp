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
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// fitgraph includes
#include <fitgraph/equation/arena.hpp>
#include <fitgraph/equation/functions.hpp>

namespace fitgraph {
namespace equation {

/**
 * @brief Handle to a node of an equation arena
 *
 * An Equation is the pair (arena, root node). Copies are cheap and refer to
 * the same node. Arithmetic on handles appends Operator nodes to the arena
 * the operands live in, mirroring what the builder produces from text.
 */
class Equation
{
  private:
    std::shared_ptr<EquationArena> arena_;
    NodeId id_;

  public:
    Equation(std::shared_ptr<EquationArena> arena, NodeId id)
        : arena_(std::move(arena)), id_(id)
    {
        if(!arena_)
            throw InvalidArgumentError("Equation requires an arena");
        if(!arena_->contains(id_))
            throw InvalidArgumentError(fmt::format("Invalid node id {}", id_));
    }

    NodeId id() const { return id_; }

    const std::shared_ptr<EquationArena>& arena() const { return arena_; }

    const NodeData& node() const { return (*arena_)[id_]; }

    NodeKind kind() const { return node().kind; }

    const std::string& name() const { return node().name; }

    // Evaluate, recomputing only stale operators
    Value value() const { return arena_->value(id_); }

    Value operator()() const { return value(); }

    ClockView clock() const { return arena_->clock(id_); }

    // Identity, never value equality
    bool is(const Equation& other) const { return arena_ == other.arena_ && id_ == other.id_; }

    void ensure_same_arena(const Equation& other) const
    {
        if(arena_ != other.arena_)
            throw InvalidArgumentError("Equations must share the same arena");
    }

    /// Append an unnamed constant to the arena of this equation.
    Equation constant(const Value& v) const
    {
        return Equation(arena_, arena_->add_constant(v));
    }
};

inline Equation make_operator(OpType op, const std::vector<Equation>& operands)
{
    if(operands.empty())
        throw InvalidArgumentError("An operator needs at least one operand");
    std::vector<NodeId> ids;
    ids.reserve(operands.size());
    for(const auto& e : operands) {
        operands.front().ensure_same_arena(e);
        ids.push_back(e.id());
    }
    const auto& arena = operands.front().arena();
    return Equation(arena, arena->add_operator(op, std::move(ids)));
}

/**
 * @brief Apply a function to operands and keyword operands
 *
 * The call is checked against the function's signature before any node is
 * created; a mismatch raises StructuralError.
 */
inline Equation apply(const FunctionPtr& function, const std::vector<Equation>& operands,
                      const std::vector<std::pair<std::string, Equation>>& kwoperands = {})
{
    if(!function)
        throw InvalidArgumentError("A function node needs a function");
    if(operands.empty() && kwoperands.empty())
        throw InvalidArgumentError("A function node needs at least one operand");
    std::vector<std::string> problems;
    if(!function->accepts_count(operands.size()))
        problems.push_back(fmt::format("'{}' takes {} positional argument(s), {} given", function->name,
                                       function->describe_arity(), operands.size()));
    for(const auto& kw : kwoperands)
        if(!function->accepts_keyword(kw.first))
            problems.push_back(fmt::format("'{}' does not accept keyword '{}'", function->name, kw.first));
    if(!problems.empty())
        throw StructuralError(fmt::format("{}(...)", function->name), std::move(problems));
    const Equation& first = operands.empty() ? kwoperands.front().second : operands.front();
    std::vector<NodeId> ids;
    for(const auto& e : operands) {
        first.ensure_same_arena(e);
        ids.push_back(e.id());
    }
    std::vector<std::pair<std::string, NodeId>> kwids;
    for(const auto& kw : kwoperands) {
        first.ensure_same_arena(kw.second);
        for(const auto& seen : kwids)
            if(seen.first == kw.first)
                throw InvalidArgumentError(fmt::format("Keyword argument '{}' given twice", kw.first));
        kwids.emplace_back(kw.first, kw.second.id());
    }
    const auto& arena = first.arena();
    return Equation(arena, arena->add_function(function, std::move(ids), std::move(kwids)));
}

inline Equation operator+(const Equation& l, const Equation& r) { return make_operator(OpType::Add, {l, r}); }
inline Equation operator-(const Equation& l, const Equation& r) { return make_operator(OpType::Subtract, {l, r}); }
inline Equation operator*(const Equation& l, const Equation& r) { return make_operator(OpType::Multiply, {l, r}); }
inline Equation operator/(const Equation& l, const Equation& r) { return make_operator(OpType::Divide, {l, r}); }
inline Equation operator%(const Equation& l, const Equation& r) { return make_operator(OpType::Remainder, {l, r}); }
inline Equation operator-(const Equation& x) { return make_operator(OpType::Negate, {x}); }

inline Equation pow(const Equation& base, const Equation& exponent) { return make_operator(OpType::Power, {base, exponent}); }

// Arithmetic with scalars
inline Equation operator+(const Equation& l, double r) { return l + l.constant(Value(r)); }
inline Equation operator-(const Equation& l, double r) { return l - l.constant(Value(r)); }
inline Equation operator*(const Equation& l, double r) { return l * l.constant(Value(r)); }
inline Equation operator/(const Equation& l, double r) { return l / l.constant(Value(r)); }
inline Equation operator+(double l, const Equation& r) { return r.constant(Value(l)) + r; }
inline Equation operator-(double l, const Equation& r) { return r.constant(Value(l)) - r; }
inline Equation operator*(double l, const Equation& r) { return r.constant(Value(l)) * r; }
inline Equation operator/(double l, const Equation& r) { return r.constant(Value(l)) / r; }
inline Equation pow(const Equation& base, double exponent) { return pow(base, base.constant(Value(exponent))); }
inline Equation pow(double base, const Equation& exponent) { return pow(exponent.constant(Value(base)), exponent); }

// Elementary functions
inline Equation sin(const Equation& x) { return apply(builtin_function("sin"), {x}); }
inline Equation cos(const Equation& x) { return apply(builtin_function("cos"), {x}); }
inline Equation tan(const Equation& x) { return apply(builtin_function("tan"), {x}); }
inline Equation exp(const Equation& x) { return apply(builtin_function("exp"), {x}); }
inline Equation log(const Equation& x) { return apply(builtin_function("log"), {x}); }
inline Equation log10(const Equation& x) { return apply(builtin_function("log10"), {x}); }
inline Equation sqrt(const Equation& x) { return apply(builtin_function("sqrt"), {x}); }
inline Equation abs(const Equation& x) { return apply(builtin_function("abs"), {x}); }
inline Equation minimum(const Equation& a, const Equation& b) { return apply(builtin_function("minimum"), {a, b}); }
inline Equation maximum(const Equation& a, const Equation& b) { return apply(builtin_function("maximum"), {a, b}); }
inline Equation sum(const Equation& x) { return apply(builtin_function("sum"), {x}); }

// Output stream operator
inline std::ostream& operator<<(std::ostream& out, const Equation& eq)
{
    out << eq.value().to_string();
    return out;
}

} // namespace equation
} // namespace fitgraph
