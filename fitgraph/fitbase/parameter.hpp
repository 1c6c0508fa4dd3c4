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

/**
 * @file parameter.hpp
 * @brief Named adjustable values of a fit
 *
 * Three flavours share the Parameter handle:
 *
 *   Parameter         an argument node holding its own value, with bounds and
 *                     an optional constraint
 *   ParameterProxy    another name for an existing Parameter; owns nothing
 *   ParameterWrapper  a Parameter whose value lives in an external object and
 *                     is read and written through accessors
 */

#pragma once

// C++ includes
#include <cctype>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

// fmt includes
#include <fmt/format.h>

// fitgraph includes
#include <fitgraph/common/errors.hpp>
#include <fitgraph/equation/arena.hpp>
#include <fitgraph/equation/equation.hpp>

namespace fitgraph {
namespace fitbase {

using equation::Bounds;
using equation::Equation;
using equation::EquationArena;
using equation::INVALID_NODE_ID;
using equation::NodeData;
using equation::NodeId;
using equation::NodeKind;

inline bool is_valid_name(const std::string& name)
{
    if(name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_'))
        return false;
    for(char c : name)
        if(!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
            return false;
    return true;
}

inline void validate_name(const std::string& name)
{
    if(!is_valid_name(name))
        throw InvalidArgumentError(fmt::format("'{}' is not a valid name", name));
}

/**
 * @brief Handle to a parameter node
 *
 * Reading the value of a constrained parameter evaluates its constraint and
 * stores the result. Writing is refused while the parameter is constant or
 * constrained, and clicks the parameter only when the value changes.
 */
class Parameter
{
  protected:
    std::shared_ptr<EquationArena> arena_;
    NodeId id_;

  public:
    Parameter(std::shared_ptr<EquationArena> arena, NodeId id)
        : arena_(std::move(arena)), id_(id)
    {
        if(!arena_)
            throw InvalidArgumentError("Parameter requires an arena");
        const NodeData& node = arena_->at(id_);
        if(node.kind != NodeKind::Argument || !node.is_parameter)
            throw InvalidArgumentError(fmt::format("'{}' is not a parameter", arena_->display_name(id_)));
    }

    static Parameter create(const std::shared_ptr<EquationArena>& arena, const std::string& name,
                            const Value& value = Value(), bool is_const = false)
    {
        validate_name(name);
        if(!arena)
            throw InvalidArgumentError("Parameter requires an arena");
        NodeData data = NodeData::argument(name, value, is_const);
        data.is_parameter = true;
        return Parameter(arena, arena->add_node(std::move(data)));
    }

    NodeId id() const { return id_; }
    const std::shared_ptr<EquationArena>& arena() const { return arena_; }
    const std::string& name() const { return node().name; }

    Value value() const { return arena_->value(id_); }

    void set_value(const Value& value) { arena_->set_value(id_, value); }

    bool is_const() const { return node().is_constant; }

    /// Flag the parameter constant (or not), first assigning `value` when given.
    void set_const(bool is_const = true, const std::optional<Value>& value = std::nullopt)
    {
        if(value) {
            const bool was_const = node().is_constant;
            arena_->set_constant(id_, false);
            try {
                arena_->set_value(id_, *value);
            } catch(const Error&) {
                arena_->set_constant(id_, was_const);
                throw;
            }
        }
        arena_->set_constant(id_, is_const);
    }

    bool is_constrained() const { return node().is_constrained(); }

    std::optional<Equation> constraint() const
    {
        if(!is_constrained())
            return std::nullopt;
        return Equation(arena_, node().constraint);
    }

    Bounds bounds() const { return node().bounds; }

    void set_bounds(double lower, double upper)
    {
        if(lower > upper)
            throw InvalidArgumentError(fmt::format("Lower bound {} of '{}' exceeds upper bound {}", lower, name(), upper));
        auto& node = (*arena_)[id_];
        node.bounds.lower = lower;
        node.bounds.upper = upper;
    }

    ClockView clock() const { return arena_->clock(id_); }

    Equation equation() const { return Equation(arena_, id_); }

    operator Equation() const { return equation(); }

    // Identity, never value equality
    bool is(const Parameter& other) const { return arena_ == other.arena_ && id_ == other.id_; }

  protected:
    const NodeData& node() const { return (*arena_)[id_]; }
};

/**
 * @brief Alias of a Parameter under another name
 *
 * Every read and write goes to the referenced Parameter.
 */
class ParameterProxy
{
  private:
    std::string name_;
    Parameter par_;

  public:
    ParameterProxy(const std::string& name, Parameter par)
        : name_(name), par_(std::move(par))
    {
        validate_name(name_);
    }

    const std::string& name() const { return name_; }
    const Parameter& parameter() const { return par_; }

    NodeId id() const { return par_.id(); }
    const std::shared_ptr<EquationArena>& arena() const { return par_.arena(); }

    Value value() const { return par_.value(); }
    void set_value(const Value& value) { par_.set_value(value); }

    bool is_const() const { return par_.is_const(); }
    void set_const(bool is_const = true, const std::optional<Value>& value = std::nullopt) { par_.set_const(is_const, value); }

    bool is_constrained() const { return par_.is_constrained(); }
    std::optional<Equation> constraint() const { return par_.constraint(); }

    Bounds bounds() const { return par_.bounds(); }
    void set_bounds(double lower, double upper) { par_.set_bounds(lower, upper); }

    ClockView clock() const { return par_.clock(); }

    operator Equation() const { return par_.equation(); }
};

/**
 * @brief An object exposing numeric attributes by key
 *
 * Implemented by external objects (calculators, structure adapters) whose
 * attributes are wrapped as parameters.
 */
class Attributed
{
  public:
    virtual ~Attributed() = default;
    virtual Value get_attribute(const std::string& key) const = 0;
    virtual void set_attribute(const std::string& key, const Value& value) = 0;
};

/**
 * @brief A Parameter stored outside the arena
 *
 * The value is read through the getter on every access. A constrained
 * wrapper pushes the constraint value through the setter each time it is
 * read. Changes made to the external object behind the wrapper's back are
 * not seen by the operators caching it until the wrapper is clicked, for
 * instance by set_value().
 */
class ParameterWrapper : public Parameter
{
  public:
    using KeyedGetter = std::function<Value(const Attributed&, const std::string&)>;
    using KeyedSetter = std::function<void(Attributed&, const std::string&, const Value&)>;

    /// Wrap a getter/setter pair. Both must be given.
    static ParameterWrapper create(const std::shared_ptr<EquationArena>& arena, const std::string& name,
                                   equation::Getter getter, equation::Setter setter)
    {
        if(!getter && !setter)
            throw InvalidArgumentError(fmt::format("Specify attribute access for '{}'", name));
        if(!getter || !setter)
            throw InvalidArgumentError(fmt::format("Specify both getter and setter for '{}'", name));
        return ParameterWrapper(arena, name, std::move(getter), std::move(setter));
    }

    /**
     * @brief Wrap the attribute `key` of `obj`
     *
     * The attribute is accessed with get_attribute()/set_attribute() unless a
     * keyed getter/setter pair is given, in which case both are required.
     */
    static ParameterWrapper create(const std::shared_ptr<EquationArena>& arena, const std::string& name,
                                   std::shared_ptr<Attributed> obj, const std::string& key,
                                   KeyedGetter getter = {}, KeyedSetter setter = {})
    {
        if(!obj)
            throw InvalidArgumentError(fmt::format("No object to wrap for '{}'", name));
        if(key.empty() && !getter && !setter)
            throw InvalidArgumentError(fmt::format("Specify attribute access for '{}'", name));
        if(static_cast<bool>(getter) != static_cast<bool>(setter))
            throw InvalidArgumentError(fmt::format("Specify both getter and setter for '{}'", name));

        equation::Getter get;
        equation::Setter set;
        if(getter) {
            get = [obj, key, getter]() { return getter(*obj, key); };
            set = [obj, key, setter](const Value& v) { setter(*obj, key, v); };
        } else {
            get = [obj, key]() { return obj->get_attribute(key); };
            set = [obj, key](const Value& v) { obj->set_attribute(key, v); };
        }
        return ParameterWrapper(arena, name, std::move(get), std::move(set));
    }

  private:
    ParameterWrapper(const std::shared_ptr<EquationArena>& arena, const std::string& name,
                     equation::Getter getter, equation::Setter setter)
        : Parameter(make_node(arena, name, std::move(getter), std::move(setter)))
    {
    }

    static Parameter make_node(const std::shared_ptr<EquationArena>& arena, const std::string& name,
                               equation::Getter getter, equation::Setter setter)
    {
        validate_name(name);
        if(!arena)
            throw InvalidArgumentError("Parameter requires an arena");
        NodeData data = NodeData::argument(name, getter());
        data.is_parameter = true;
        data.getter = std::move(getter);
        data.setter = std::move(setter);
        return Parameter(arena, arena->add_node(std::move(data)));
    }
};

} // namespace fitbase
} // namespace fitgraph
