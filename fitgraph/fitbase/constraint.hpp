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
#include <optional>

// fmt includes
#include <fmt/format.h>

// fitgraph includes
#include <fitgraph/common/errors.hpp>
#include <fitgraph/common/logging.hpp>
#include <fitgraph/equation/visitors.hpp>
#include <fitgraph/fitbase/parameter.hpp>

namespace fitgraph {
namespace fitbase {

/**
 * @brief Binding of a Parameter to an equation that computes its value
 *
 * A constraint is owned by exactly one organizer. While it is active the
 * parameter refuses direct writes and reads its value from the equation.
 */
class Constraint
{
  private:
    std::optional<Parameter> par_;
    std::optional<Equation> eq_;

  public:
    Constraint() = default;

    Constraint(const Parameter& par, const Equation& eq) { constrain(par, eq); }

    bool active() const { return par_.has_value(); }

    const Parameter& parameter() const
    {
        if(!par_)
            throw InvalidArgumentError("The constraint is not active");
        return *par_;
    }

    const Equation& equation() const
    {
        if(!eq_)
            throw InvalidArgumentError("The constraint is not active");
        return *eq_;
    }

    /**
     * @brief Bind `par` to `eq` and evaluate once
     *
     * Constant or already constrained parameters are refused. A binding whose
     * first evaluation fails (a cycle through the parameter, for instance) is
     * rolled back before the error propagates.
     */
    void constrain(const Parameter& par, const Equation& eq)
    {
        if(active())
            throw ConstraintConflictError(fmt::format("The constraint already binds '{}'", par_->name()));
        if(par.arena() != eq.arena())
            throw InvalidArgumentError(fmt::format("'{}' and its constraint must share the same arena", par.name()));
        if(par.is_const())
            throw ConstraintConflictError(fmt::format("The parameter '{}' is constant", par.name()));
        if(par.is_constrained())
            throw ConstraintConflictError(fmt::format("The parameter '{}' is already constrained", par.name()));

        auto& arena = *par.arena();
        arena.attach_constraint(par.id(), eq.id());
        try {
            arena.value(par.id());
        } catch(const Error&) {
            arena.detach_constraint(par.id());
            throw;
        }
        par_ = par;
        eq_ = eq;
        logger()->debug("Constrained '{}' to '{}'", par.name(), equation::to_string(eq));
    }

    /// Keep the current value of the parameter as its plain value and release it.
    void unconstrain()
    {
        if(!active())
            return;
        auto& arena = *par_->arena();
        arena.value(par_->id());
        arena.detach_constraint(par_->id());
        logger()->debug("Unconstrained '{}'", par_->name());
        par_.reset();
        eq_.reset();
    }

    /// Release the parameter without evaluating the equation. It keeps its last stored value.
    void release()
    {
        if(!active())
            return;
        par_->arena()->detach_constraint(par_->id());
        par_.reset();
        eq_.reset();
    }

    /// Push the current value of the equation into the parameter.
    void update()
    {
        if(active())
            par_->value();
    }
};

} // namespace fitbase
} // namespace fitgraph
