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
 * @file organizer.hpp
 * @brief Named collections of parameters, constraints and restraints
 *
 * An Organizer is the unit a fit is assembled from. It holds
 *
 *   - parameters by name (insertion order kept), proxies included
 *   - sub-organizers by name, in the same namespace as the parameters
 *   - the constraints and restraints created through it, which it owns
 *   - an EquationFactory that resolves the names of its own parameters
 *   - a clock observing every parameter and sub-organizer, so that
 *     `organizer.clock() >= x.clock()` tells whether anything below changed
 *
 * Queries over constraints, restraints and free parameters recurse into the
 * sub-organizers.
 */

#pragma once

// C++ includes
#include <algorithm>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

// fmt includes
#include <fmt/format.h>

// fitgraph includes
#include <fitgraph/common/clock.hpp>
#include <fitgraph/common/errors.hpp>
#include <fitgraph/common/logging.hpp>
#include <fitgraph/equation/builder.hpp>
#include <fitgraph/equation/visitors.hpp>
#include <fitgraph/fitbase/constraint.hpp>
#include <fitgraph/fitbase/parameter.hpp>
#include <fitgraph/fitbase/restraint.hpp>

namespace fitgraph {
namespace fitbase {

using equation::EquationFactory;

class Organizer
{
  public:
    using Namespace = EquationFactory::Namespace;
    using OrganizerPtr = std::shared_ptr<Organizer>;
    using RestraintPtr = std::shared_ptr<Restraint>;

  private:
    std::string name_;
    std::shared_ptr<EquationArena> arena_;
    EquationFactory factory_;
    ClockId clock_;
    std::vector<std::pair<std::string, Parameter>> parameters_;
    std::vector<std::pair<std::string, OrganizerPtr>> organizers_;
    std::map<NodeId, Constraint> constraints_;
    std::vector<RestraintPtr> restraints_;

  public:
    explicit Organizer(const std::string& name, std::shared_ptr<EquationArena> arena = std::make_shared<EquationArena>())
        : name_(name), arena_(std::move(arena)), factory_(arena_), clock_(arena_->clocks().create())
    {
    }

    Organizer(const Organizer&) = delete;

    /// Parameters constrained here are released, keeping their current values.
    ~Organizer()
    {
        for(auto& entry : constraints_) {
            try {
                entry.second.unconstrain();
            } catch(const Error& e) {
                logger()->warn("Releasing a constraint of '{}' without a final value: {}", name_, e.what());
                entry.second.release();
            }
        }
    }
    Organizer& operator=(const Organizer&) = delete;

    const std::string& name() const { return name_; }
    const std::shared_ptr<EquationArena>& arena() const { return arena_; }
    EquationFactory& factory() { return factory_; }
    const EquationFactory& factory() const { return factory_; }
    ClockView clock() const { return ClockView(arena_->clocks(), clock_); }

    //--------------------------------------------------------------------------
    // Members
    //--------------------------------------------------------------------------

    /// Add a parameter under its own name. Adding the same parameter again is a no-op.
    void add_parameter(const Parameter& par) { add_named(par.name(), par); }

    /// Add the parameter behind `proxy` under the proxy's name.
    void add_parameter(const ParameterProxy& proxy) { add_named(proxy.name(), proxy.parameter()); }

    /// Create a parameter in this organizer's arena and add it.
    Parameter new_parameter(const std::string& name, const Value& value = Value(), bool is_const = false)
    {
        check_free_name(name);
        Parameter par = Parameter::create(arena_, name, value, is_const);
        add_named(name, par);
        return par;
    }

    /// Remove a parameter binding. Refused while a constraint owned here targets it.
    void remove_parameter(const std::string& name)
    {
        auto it = find_parameter(name);
        if(it == parameters_.end())
            throw NameResolutionError(name);
        const Parameter par = it->second;
        if(constraints_.count(par.id()))
            throw ConstraintConflictError(fmt::format("'{}' is constrained in '{}'; unconstrain it first", name, name_));
        parameters_.erase(it);
        factory_.deregister(name);
        const bool aliased = std::any_of(parameters_.begin(), parameters_.end(),
                                         [&](const auto& entry) { return entry.second.is(par); });
        if(!aliased)
            arena_->clocks().remove_subject(clock_, arena_->at(par.id()).clock);
        logger()->debug("Removed parameter '{}' from '{}'", name, name_);
    }

    /// Add a sub-organizer. It must share this organizer's arena and must not contain it.
    void add_organizer(const OrganizerPtr& sub)
    {
        if(!sub)
            throw InvalidArgumentError(fmt::format("Cannot add a null organizer to '{}'", name_));
        if(sub->arena_ != arena_)
            throw InvalidArgumentError(fmt::format("Organizer '{}' uses a different arena than '{}'", sub->name(), name_));
        if(sub.get() == this || sub->contains_organizer(this))
            throw InvalidArgumentError(fmt::format("Adding '{}' to '{}' would create a cycle", sub->name(), name_));
        if(sub->name().empty())
            throw NameConflictError(fmt::format("Cannot add an unnamed organizer to '{}'", name_));

        auto it = find_organizer(sub->name());
        if(it != organizers_.end()) {
            if(it->second == sub)
                return;
            throw NameConflictError(fmt::format("The name '{}' is already used in '{}'", sub->name(), name_));
        }
        if(find_parameter(sub->name()) != parameters_.end())
            throw NameConflictError(fmt::format("The name '{}' is already used in '{}'", sub->name(), name_));

        organizers_.emplace_back(sub->name(), sub);
        arena_->clocks().add_subject(clock_, sub->clock_);
        logger()->debug("Added organizer '{}' to '{}'", sub->name(), name_);
    }

    bool has_parameter(const std::string& name) const { return find_parameter(name) != parameters_.end(); }

    const Parameter& parameter(const std::string& name) const
    {
        auto it = find_parameter(name);
        if(it == parameters_.end())
            throw NameResolutionError(name);
        return it->second;
    }

    const OrganizerPtr& organizer(const std::string& name) const
    {
        auto it = find_organizer(name);
        if(it == organizers_.end())
            throw NameResolutionError(name);
        return it->second;
    }

    const std::vector<std::pair<std::string, Parameter>>& parameters() const { return parameters_; }
    const std::vector<std::pair<std::string, OrganizerPtr>>& organizers() const { return organizers_; }

    /// True when `other` is a sub-organizer of this one, at any depth.
    bool contains_organizer(const Organizer* other) const
    {
        for(const auto& entry : organizers_)
            if(entry.second.get() == other || entry.second->contains_organizer(other))
                return true;
        return false;
    }

    //--------------------------------------------------------------------------
    // Constraints
    //--------------------------------------------------------------------------

    void constrain(const Parameter& par, const std::string& text, const Namespace& ns = {})
    {
        constrain(par, factory_.build(text, ns));
    }

    void constrain(const Parameter& par, const Equation& eq)
    {
        Constraint constraint;
        constraint.constrain(par, eq);
        constraints_.emplace(par.id(), std::move(constraint));
    }

    void constrain(const ParameterProxy& proxy, const std::string& text, const Namespace& ns = {})
    {
        constrain(proxy.parameter(), text, ns);
    }

    /// Constrain the parameter registered here under `name`.
    void constrain(const std::string& name, const std::string& text, const Namespace& ns = {})
    {
        constrain(parameter(name), text, ns);
    }

    /// Release a constraint owned here. Returns false when there is none.
    bool unconstrain(const Parameter& par)
    {
        auto it = constraints_.find(par.id());
        if(it == constraints_.end() || par.arena() != arena_)
            return false;
        it->second.unconstrain();
        constraints_.erase(it);
        return true;
    }

    bool unconstrain(const ParameterProxy& proxy) { return unconstrain(proxy.parameter()); }

    void unconstrain(const std::vector<Parameter>& pars)
    {
        for(const auto& par : pars)
            unconstrain(par);
    }

    void clear_constraints()
    {
        for(auto& entry : constraints_)
            entry.second.unconstrain();
        constraints_.clear();
    }

    /// Constraints owned here and below, keyed by target parameter.
    std::map<NodeId, const Constraint*> get_constraints() const
    {
        std::map<NodeId, const Constraint*> result;
        collect_constraints(result);
        return result;
    }

    //--------------------------------------------------------------------------
    // Restraints
    //--------------------------------------------------------------------------

    RestraintPtr restrain(const std::string& text, double lb, std::optional<double> ub = std::nullopt,
                          double sigma = 1.0, const Namespace& ns = {})
    {
        return restrain(factory_.build(text, ns), lb, ub, sigma);
    }

    RestraintPtr restrain(const Equation& eq, double lb, std::optional<double> ub = std::nullopt, double sigma = 1.0)
    {
        if(eq.arena() != arena_)
            throw InvalidArgumentError(fmt::format("Cannot restrain an equation from a different arena in '{}'", name_));
        auto restraint = std::make_shared<Restraint>(eq, lb, ub, sigma);
        restraints_.push_back(restraint);
        logger()->debug("Restrained '{}' to [{}, {}] in '{}'", equation::to_string(eq), restraint->lower(),
                        restraint->upper(), name_);
        return restraint;
    }

    /// Restrain from above only: the lower bound is -inf.
    RestraintPtr restrain_upper(const std::string& text, double ub, double sigma = 1.0, const Namespace& ns = {})
    {
        return restrain(text, -std::numeric_limits<double>::infinity(), ub, sigma, ns);
    }

    RestraintPtr restrain_upper(const Equation& eq, double ub, double sigma = 1.0)
    {
        return restrain(eq, -std::numeric_limits<double>::infinity(), ub, sigma);
    }

    /// Restrain from below only: the upper bound is +inf.
    RestraintPtr restrain_lower(const std::string& text, double lb, double sigma = 1.0, const Namespace& ns = {})
    {
        return restrain(text, lb, std::numeric_limits<double>::infinity(), sigma, ns);
    }

    RestraintPtr restrain_lower(const Equation& eq, double lb, double sigma = 1.0)
    {
        return restrain(eq, lb, std::numeric_limits<double>::infinity(), sigma);
    }

    /// Remove a restraint owned here. Returns false when it is not.
    bool unrestrain(const RestraintPtr& restraint)
    {
        auto it = std::find(restraints_.begin(), restraints_.end(), restraint);
        if(it == restraints_.end())
            return false;
        restraints_.erase(it);
        logger()->debug("Unrestrained '{}' in '{}'", equation::to_string(restraint->equation()), name_);
        return true;
    }

    void clear_restraints() { restraints_.clear(); }

    /// Restraints owned here and below, each once.
    std::vector<RestraintPtr> get_restraints() const
    {
        std::vector<RestraintPtr> result;
        collect_restraints(result);
        return result;
    }

    /// Sum of the penalties of get_restraints().
    double total_penalty() const
    {
        double total = 0.0;
        for(const auto& r : get_restraints())
            total += r->penalty();
        return total;
    }

    //--------------------------------------------------------------------------
    // Queries
    //--------------------------------------------------------------------------

    /// Parameters an optimizer may vary: neither constant nor constrained, each once.
    std::vector<Parameter> get_free_parameters() const
    {
        std::vector<Parameter> result;
        std::unordered_set<NodeId> seen;
        collect_free_parameters(result, seen);
        return result;
    }

    /// Build `text` with this organizer's names and evaluate it.
    Value evaluate_equation(const std::string& text, const Namespace& ns = {}) const
    {
        return factory_.build(text, ns).value();
    }

    void register_function(const std::string& name, equation::Function function)
    {
        factory_.register_function(name, std::move(function));
    }

    void register_function(const std::string& name, size_t min_args, size_t max_args, equation::Function::Body body,
                           std::vector<std::string> keywords = {})
    {
        factory_.register_function(name, min_args, max_args, std::move(body), std::move(keywords));
    }

  private:
    using ParameterList = std::vector<std::pair<std::string, Parameter>>;
    using OrganizerList = std::vector<std::pair<std::string, OrganizerPtr>>;

    ParameterList::const_iterator find_parameter(const std::string& name) const
    {
        return std::find_if(parameters_.begin(), parameters_.end(), [&](const auto& entry) { return entry.first == name; });
    }

    ParameterList::iterator find_parameter(const std::string& name)
    {
        return std::find_if(parameters_.begin(), parameters_.end(), [&](const auto& entry) { return entry.first == name; });
    }

    OrganizerList::const_iterator find_organizer(const std::string& name) const
    {
        return std::find_if(organizers_.begin(), organizers_.end(), [&](const auto& entry) { return entry.first == name; });
    }

    void check_free_name(const std::string& name) const
    {
        if(name.empty())
            throw NameConflictError(fmt::format("Cannot add an unnamed parameter to '{}'", name_));
        if(find_parameter(name) != parameters_.end() || find_organizer(name) != organizers_.end())
            throw NameConflictError(fmt::format("The name '{}' is already used in '{}'", name, name_));
    }

    void add_named(const std::string& name, const Parameter& par)
    {
        if(name.empty())
            throw NameConflictError(fmt::format("Cannot add an unnamed parameter to '{}'", name_));
        if(par.arena() != arena_)
            throw InvalidArgumentError(fmt::format("Parameter '{}' uses a different arena than '{}'", name, name_));

        auto it = find_parameter(name);
        if(it != parameters_.end()) {
            if(it->second.is(par))
                return;
            throw NameConflictError(fmt::format("The name '{}' is already used in '{}'", name, name_));
        }
        if(find_organizer(name) != organizers_.end())
            throw NameConflictError(fmt::format("The name '{}' is already used in '{}'", name, name_));

        factory_.register_argument(name, par.id());
        parameters_.emplace_back(name, par);
        arena_->clocks().add_subject(clock_, arena_->at(par.id()).clock);
        logger()->debug("Added parameter '{}' to '{}'", name, name_);
    }

    void collect_constraints(std::map<NodeId, const Constraint*>& result) const
    {
        for(const auto& entry : constraints_)
            result.emplace(entry.first, &entry.second);
        for(const auto& entry : organizers_)
            entry.second->collect_constraints(result);
    }

    void collect_restraints(std::vector<RestraintPtr>& result) const
    {
        for(const auto& r : restraints_)
            if(std::find(result.begin(), result.end(), r) == result.end())
                result.push_back(r);
        for(const auto& entry : organizers_)
            entry.second->collect_restraints(result);
    }

    void collect_free_parameters(std::vector<Parameter>& result, std::unordered_set<NodeId>& seen) const
    {
        for(const auto& entry : parameters_) {
            const Parameter& par = entry.second;
            if(par.is_const() || par.is_constrained())
                continue;
            if(seen.insert(par.id()).second)
                result.push_back(par);
        }
        for(const auto& entry : organizers_)
            entry.second->collect_free_parameters(result, seen);
    }
};

} // namespace fitbase
} // namespace fitgraph
