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
#include <algorithm>
#include <optional>

// fmt includes
#include <fmt/format.h>

// fitgraph includes
#include <fitgraph/common/errors.hpp>
#include <fitgraph/equation/equation.hpp>
#include <fitgraph/equation/visitors.hpp>

namespace fitgraph {
namespace fitbase {

using equation::Equation;

/**
 * @brief Soft bound on the value of an equation
 *
 * The penalty is zero inside [lb, ub] and grows linearly outside:
 *
 *     penalty = max(0, lb - v, v - ub) / sigma
 *
 * An optimizer adds it to the fit residual. The equation is validated and
 * evaluated once on construction and must produce a scalar.
 */
class Restraint
{
  private:
    Equation eq_;
    double lb_;
    double ub_;
    double sigma_;

  public:
    Restraint(const Equation& eq, double lb, std::optional<double> ub = std::nullopt, double sigma = 1.0)
        : eq_(eq), lb_(lb), ub_(ub.value_or(lb)), sigma_(sigma)
    {
        if(sigma_ == 0.0)
            throw RestraintDomainError(fmt::format("Restraint on '{}' has zero sigma", eq_.arena()->display_name(eq_.id())));
        equation::validate(eq_);
        scalar_value();
    }

    const Equation& equation() const { return eq_; }
    double lower() const { return lb_; }
    double upper() const { return ub_; }
    double sigma() const { return sigma_; }

    double penalty() const
    {
        const double x = scalar_value();
        return std::max({0.0, lb_ - x, x - ub_}) / sigma_;
    }

  private:
    double scalar_value() const
    {
        const Value v = eq_.value();
        if(!v.is_scalar())
            throw EvaluationError(eq_.arena()->display_name(eq_.id()), "a restrained equation must evaluate to a scalar");
        return v.scalar();
    }
};

} // namespace fitbase
} // namespace fitgraph
