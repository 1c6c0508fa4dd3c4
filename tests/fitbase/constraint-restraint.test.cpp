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

// C++ includes
#include <limits>
#include <memory>

// Catch includes
#include <catch2/catch_test_macros.hpp>

// fitgraph includes
#include <fitgraph/fitbase/constraint.hpp>
#include <fitgraph/fitbase/restraint.hpp>
#include <tests/utils/catch.hpp>

using namespace fitgraph;
using namespace fitgraph::equation;
using namespace fitgraph::fitbase;

TEST_CASE("testing fitgraph::fitbase::Constraint", "[fitbase][constraint]")
{
    auto arena = std::make_shared<EquationArena>();
    auto p = Parameter::create(arena, "p", Value(1.0));
    auto q = Parameter::create(arena, "q", Value(3.0));

    SECTION("testing a constrained parameter follows its equation")
    {
        Constraint c(p, 2.0 * q);
        CHECK(c.active());
        CHECK(c.parameter().is(p));
        CHECK(p.is_constrained());
        CHECK(p.value().scalar() == approx(6.0));

        q.set_value(Value(10.0));
        CHECK(p.value().scalar() == approx(20.0));
        REQUIRE(p.constraint());
        CHECK(p.constraint()->is(c.equation()));

        q.set_value(Value(0.5));
        c.update();
        CHECK((*arena)[p.id()].value.scalar() == approx(1.0));
    }

    SECTION("testing constrained parameters refuse direct writes")
    {
        Constraint c(p, 2.0 * q);
        CHECK_THROWS_AS(p.set_value(Value(5.0)), ImmutableValueError);
        CHECK_THROWS_AS(Constraint(p, q + 1.0), ConstraintConflictError);
        CHECK_THROWS_AS(c.constrain(q, p * 1.0), ConstraintConflictError);
    }

    SECTION("testing unconstraining keeps the last value")
    {
        Constraint c(p, 2.0 * q);
        q.set_value(Value(10.0));
        c.unconstrain();
        CHECK(!c.active());
        CHECK(!p.is_constrained());
        CHECK(p.value().scalar() == approx(20.0));

        p.set_value(Value(5.0));
        CHECK(p.value().scalar() == approx(5.0));
        q.set_value(Value(1.0));
        CHECK(p.value().scalar() == approx(5.0));

        // Releasing twice is harmless
        CHECK_NOTHROW(c.unconstrain());
        CHECK_THROWS_AS(c.parameter(), InvalidArgumentError);
    }

    SECTION("testing constant parameters cannot be constrained")
    {
        p.set_const();
        CHECK_THROWS_AS(Constraint(p, q * 2.0), ConstraintConflictError);
        CHECK(!p.is_constrained());
    }

    SECTION("testing a constraint through the parameter itself is rolled back")
    {
        CHECK_THROWS_AS(Constraint(p, p + 1.0), EvaluationError);
        CHECK(!p.is_constrained());
        CHECK(p.value().scalar() == approx(1.0));
        p.set_value(Value(2.0));
        CHECK(p.value().scalar() == approx(2.0));
    }

    SECTION("testing equations above the parameter see the constraint")
    {
        auto top = p + 1.0;
        CHECK(top.value().scalar() == approx(2.0));

        Constraint c(p, q);
        CHECK(top.value().scalar() == approx(4.0));
        q.set_value(Value(7.0));
        CHECK(top.value().scalar() == approx(8.0));

        c.unconstrain();
        p.set_value(Value(0.0));
        CHECK(top.value().scalar() == approx(1.0));
    }

    SECTION("testing parameters and equations must share an arena")
    {
        auto other = std::make_shared<EquationArena>();
        auto r = Parameter::create(other, "r", Value(1.0));
        CHECK_THROWS_AS(Constraint(p, r * 2.0), InvalidArgumentError);
    }
}

TEST_CASE("testing fitgraph::fitbase::Restraint", "[fitbase][restraint]")
{
    auto arena = std::make_shared<EquationArena>();
    auto x = Parameter::create(arena, "x", Value(5.0));

    SECTION("testing the penalty is zero inside the bounds and linear outside")
    {
        Restraint r(x, 0.0, 10.0);
        CHECK(r.penalty() == approx(0.0));

        x.set_value(Value(15.0));
        CHECK(r.penalty() == approx(5.0));

        x.set_value(Value(-3.0));
        CHECK(r.penalty() == approx(3.0));

        x.set_value(Value(10.0));
        CHECK(r.penalty() == approx(0.0));
    }

    SECTION("testing sigma scales the penalty")
    {
        Restraint r(x, 0.0, 1.0, 2.0);
        CHECK(r.sigma() == 2.0);
        CHECK(r.penalty() == approx(2.0));
        CHECK_THROWS_AS(Restraint(x, 0.0, 1.0, 0.0), RestraintDomainError);
    }

    SECTION("testing open bounds")
    {
        const auto inf = std::numeric_limits<double>::infinity();
        Restraint below(x * 2.0, -inf, 4.0);
        CHECK(below.penalty() == approx(6.0));
        x.set_value(Value(-1e6));
        CHECK(below.penalty() == approx(0.0));
    }

    SECTION("testing the upper bound defaults to the lower bound")
    {
        Restraint r(x, 1.0);
        CHECK(r.upper() == 1.0);
        CHECK(r.penalty() == approx(4.0));
    }

    SECTION("testing array-valued equations are refused on construction")
    {
        auto v = Parameter::create(arena, "v", Value{1.0, 2.0});
        CHECK_THROWS_AS(Restraint(v, 0.0, 1.0), EvaluationError);
        CHECK_NOTHROW(Restraint(equation::sum(v.equation()), 0.0, 1.0));
    }

    SECTION("testing a scalar equation that later turns into an array fails at evaluation")
    {
        auto v = Parameter::create(arena, "v", Value(1.0));
        Restraint r(v, 0.0, 1.0);
        v.set_value(Value{1.0, 2.0});
        CHECK_THROWS_AS(r.penalty(), EvaluationError);
    }

    SECTION("testing malformed equations are refused on construction")
    {
        Equation bad(arena, arena->add_function(builtin_function("sin"), {x.id(), x.id()}));
        CHECK_THROWS_AS(Restraint(bad, 0.0, 10.0), StructuralError);

        Equation dangling(arena, arena->add_operator(OpType::Add, {x.id(), INVALID_NODE_ID}));
        CHECK_THROWS_AS(Restraint(dangling, 0.0, 10.0), StructuralError);
    }
}
