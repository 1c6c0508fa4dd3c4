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
#include <memory>
#include <vector>

// Catch includes
#include <catch2/catch_test_macros.hpp>

// fitgraph includes
#include <fitgraph/equation/generator.hpp>
#include <fitgraph/equation/visitors.hpp>
#include <tests/utils/catch.hpp>

using namespace fitgraph;
using namespace fitgraph::equation;

TEST_CASE("testing fitgraph::equation::Generator", "[equation][generator]")
{
    auto arena = std::make_shared<EquationArena>();
    Equation a(arena, arena->add_argument("a", Value(3.0)));

    SECTION("testing a generator without a literal cannot be evaluated")
    {
        auto gen = Generator::create(arena, "gen");
        CHECK(!gen.literal());
        CHECK_THROWS_AS(gen.value(), EvaluationError);
        CHECK_THROWS_AS((Equation(gen) + 1.0).value(), EvaluationError);
    }

    SECTION("testing a generator evaluates to its literal")
    {
        auto gen = Generator::create(arena, "gen");
        gen.set_literal(a * 2.0);
        auto eq = Equation(gen) + 1.0;
        CHECK(eq.value().scalar() == approx(7.0));

        arena->set_value(a.id(), Value(4.0));
        CHECK(eq.value().scalar() == approx(9.0));

        // Replacing the literal invalidates the observers of the generator
        gen.set_literal(a);
        CHECK(eq.value().scalar() == approx(5.0));
    }

    SECTION("testing the policy sees the stamp of the observing operator")
    {
        std::vector<ClockState> observed;
        auto gen = Generator::create(arena, "gen", [&](EquationArena& ar, NodeId self, ClockState observer) {
            observed.push_back(observer);
            if(ar[self].literal == INVALID_NODE_ID)
                ar.set_literal(self, ar.add_constant(Value(1.5)));
        });
        auto eq = Equation(gen) * a;

        CHECK(eq.value().scalar() == approx(4.5));
        REQUIRE(observed.size() == 1);
        CHECK(observed[0] == 0);

        // Cached operators do not ask again
        eq.value();
        CHECK(observed.size() == 1);

        arena->set_value(a.id(), Value(2.0));
        CHECK(eq.value().scalar() == approx(3.0));
        REQUIRE(observed.size() == 2);
        CHECK(observed[1] > 0);
        CHECK(observed[1] < eq.clock().state());
    }

    SECTION("testing regeneration only when an arg changed")
    {
        int rebuilds = 0;
        auto gen = Generator::create(arena, "doubled", regenerate_if_stale([&](EquationArena& ar, NodeId) {
            ++rebuilds;
            return ar.add_constant(Value(ar.value(a.id()).scalar() * 2.0));
        }));
        gen.add_arg(a);
        auto eq = Equation(gen) + 1.0;

        CHECK(eq.value().scalar() == approx(7.0));
        CHECK(rebuilds == 1);

        eq.value();
        gen.value();
        CHECK(rebuilds == 1);

        arena->set_value(a.id(), Value(5.0));
        CHECK(eq.clock() >= a.clock());
        CHECK(eq.value().scalar() == approx(11.0));
        CHECK(rebuilds == 2);

        arena->reset_session();
        CHECK(eq.value().scalar() == approx(11.0));
        CHECK(rebuilds == 3);
    }

    SECTION("testing regeneration after a session reset ignores stamps from before the reset")
    {
        Equation u(arena, arena->add_argument("u", Value(0.0)));
        int rebuilds = 0;
        auto gen = Generator::create(arena, "doubled", regenerate_if_stale([&](EquationArena& ar, NodeId) {
            ++rebuilds;
            return ar.add_constant(Value(ar.value(a.id()).scalar() * 2.0));
        }));
        gen.add_arg(a);

        for(int i = 1; i <= 5; ++i)
            arena->set_value(u.id(), Value(static_cast<double>(i)));
        CHECK(gen.value().scalar() == approx(6.0));
        CHECK(rebuilds == 1);
        const ClockState before_reset = arena->clocks().now();

        arena->reset_session();
        arena->set_value(a.id(), Value(10.0));
        for(int i = 1; i <= 20; ++i)
            arena->set_value(u.id(), Value(100.0 + i));
        REQUIRE(arena->clocks().now() > before_reset);
        REQUIRE(a.clock().state() < before_reset);

        CHECK(gen.value().scalar() == approx(20.0));
        CHECK(rebuilds == 2);
        CHECK(gen.value().scalar() == approx(20.0));
        CHECK(rebuilds == 2);
    }

    SECTION("testing visitors run the policy first")
    {
        auto gen = Generator::create(arena, "lazy", [](EquationArena& ar, NodeId self, ClockState) {
            if(ar[self].literal == INVALID_NODE_ID)
                ar.set_literal(self, ar.add_constant(Value(2.0)));
        });
        CHECK(check(Equation(gen) + a).empty());
        REQUIRE(gen.literal());
        CHECK(gen.literal()->value().scalar() == approx(2.0));
        CHECK(to_string(Equation(gen) + a) == "(lazy + a)");
    }

    SECTION("testing nodes from another arena are refused")
    {
        auto other = std::make_shared<EquationArena>();
        Equation b(other, other->add_argument("b", Value(1.0)));
        auto gen = Generator::create(arena, "gen");
        CHECK_THROWS_AS(gen.set_literal(b), InvalidArgumentError);
        CHECK_THROWS_AS(gen.add_arg(b), InvalidArgumentError);
        CHECK_THROWS_AS(Generator(arena, a.id()), InvalidArgumentError);
    }
}
