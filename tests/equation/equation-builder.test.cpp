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
#include <string>
#include <vector>

// Catch includes
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

// fitgraph includes
#include <fitgraph/equation/builder.hpp>
#include <fitgraph/equation/visitors.hpp>
#include <tests/utils/catch.hpp>

using namespace fitgraph;
using namespace fitgraph::equation;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("testing fitgraph::equation::EquationFactory", "[equation][builder]")
{
    auto arena = std::make_shared<EquationArena>();
    EquationFactory factory(arena);

    Equation a(arena, arena->add_argument("a", Value(2.0)));
    Equation b(arena, arena->add_argument("b", Value(3.0)));
    factory.register_argument("a", a);
    factory.register_argument("b", b);

    auto eval = [&](const std::string& text) { return factory.build(text).value().scalar(); };

    SECTION("testing operator precedence and associativity")
    {
        CHECK(eval("a + b * 2") == approx(8.0));
        CHECK(eval("(a + b) * 2") == approx(10.0));
        CHECK(eval("a - b - 1") == approx(-2.0));
        CHECK(eval("b / a / 2") == approx(0.75));
        CHECK(eval("-a**2") == approx(-4.0));
        CHECK(eval("a**-1") == approx(0.5));
        CHECK(eval("2**3**2") == approx(512.0));
        CHECK(eval("-b + +a") == approx(-1.0));
        CHECK(eval("b % a * 4") == approx(4.0));
        CHECK(eval("-7 % 3") == approx(2.0));
    }

    SECTION("testing numeric literals")
    {
        CHECK(eval("1") == approx(1.0));
        CHECK(eval("2.5 * a") == approx(5.0));
        CHECK(eval("1e-3 * 1000") == approx(1.0));
        CHECK(eval("1.5E+2") == approx(150.0));
        CHECK(eval(".5 + a") == approx(2.5));

        // Literals become unnamed constants
        auto eq = factory.build("a + 4");
        const auto& node = (*arena)[eq.node().args[1]];
        CHECK(node.is_constant);
        CHECK(node.name.empty());
    }

    SECTION("testing built-in functions")
    {
        CHECK(eval("sqrt(a * 8)") == approx(4.0));
        CHECK(eval("abs(a - b)") == approx(1.0));
        CHECK(eval("minimum(a, b) + maximum(a, b)") == approx(5.0));
        CHECK(eval("remainder(b, a)") == approx(1.0));
        CHECK(eval("negative(a)") == approx(-2.0));
        CHECK(eval("exp(log(a))") == approx(2.0));
        CHECK(eval("log10(100)") == approx(2.0));
        CHECK(eval("sum(a, initial=b)") == approx(5.0));
    }

    SECTION("testing registered functions with keywords")
    {
        factory.register_function("scale", 1, 1, [](const std::vector<Value>& args, const KeywordValues& kwargs) {
            Value factor(1.0);
            for(const auto& kw : kwargs)
                if(kw.first == "by")
                    factor = kw.second;
            return args[0] * factor;
        }, {"by"});
        CHECK(factory.has_function("scale"));
        CHECK(eval("scale(a)") == approx(2.0));
        CHECK(eval("scale(a, by=b + 1)") == approx(8.0));
        CHECK_THROWS_AS(factory.build("scale(a, times=2)"), StructuralError);
    }

    SECTION("testing names resolve to the registered nodes")
    {
        auto eq = factory.build("a * a + b");
        auto args = get_args(eq);
        REQUIRE(args.size() == 2);
        CHECK(args[0] == a.id());
        CHECK(args[1] == b.id());

        arena->set_value(a.id(), Value(4.0));
        CHECK(eq.value().scalar() == approx(19.0));
    }

    SECTION("testing registration conflicts")
    {
        Equation other(arena, arena->add_argument("a", Value(0.0)));
        CHECK_NOTHROW(factory.register_argument("a", a));
        CHECK_THROWS_AS(factory.register_argument("a", other), ConflictError);
        CHECK_THROWS_AS(factory.register_argument("", other), InvalidArgumentError);

        CHECK(factory.deregister("a"));
        CHECK(!factory.deregister("a"));
        CHECK(!factory.has_argument("a"));
        factory.register_argument("a", other);
        CHECK(factory.argument("a")->is(other));
    }

    SECTION("testing transient namespaces")
    {
        Equation q(arena, arena->add_argument("q", Value(10.0)));
        auto eq = factory.build("a + b + q", {{"q", q}});
        CHECK(eq.value().scalar() == approx(15.0));
        CHECK(!factory.has_argument("q"));
        CHECK_THROWS_AS(factory.build("a + q"), NameResolutionError);

        // A namespace entry may repeat a registered binding but not shadow it
        CHECK_NOTHROW(factory.build("a + b", {{"b", b}}));
        CHECK_THROWS_AS(factory.build("a + b", {{"b", q}}), ConflictError);
    }

    SECTION("testing unresolved names")
    {
        try {
            factory.build("a + c + d");
            FAIL("build() should have thrown");
        } catch(const NameResolutionError& e) {
            CHECK(e.name() == "c");
        }
        CHECK_THROWS_AS(factory.build("foo(a)"), NameResolutionError);
        CHECK_THROWS_WITH(factory.build("foo(a)"), ContainsSubstring("'foo' is not defined"));
    }

    SECTION("testing arity errors are structural")
    {
        CHECK_THROWS_AS(factory.build("sin(a, b)"), StructuralError);
        CHECK_THROWS_AS(factory.build("minimum(a)"), StructuralError);
        CHECK_THROWS_AS(factory.build("sin(a, x=1)"), StructuralError);
        try {
            factory.build("sin(a, b) + cos()");
            FAIL("build() should have thrown");
        } catch(const StructuralError& e) {
            CHECK(e.problems().size() == 2);
        }
    }

    SECTION("testing syntax errors carry a position")
    {
        CHECK_THROWS_AS(factory.build(""), ParseError);
        CHECK_THROWS_AS(factory.build("a +"), ParseError);
        CHECK_THROWS_AS(factory.build("(a + b"), ParseError);
        CHECK_THROWS_AS(factory.build("a b"), ParseError);
        CHECK_THROWS_AS(factory.build("1e+"), ParseError);
        CHECK_THROWS_AS(factory.build("sum(initial=a, b)"), ParseError);
        CHECK_THROWS_AS(factory.build("sum(a, initial=a, initial=b)"), ParseError);
        try {
            factory.build("a $ b");
            FAIL("build() should have thrown");
        } catch(const ParseError& e) {
            CHECK(e.position() == 2);
        }
    }

    SECTION("testing failed builds leave the arena untouched")
    {
        const auto size = arena->size();
        CHECK_THROWS(factory.build("a + b * 2 + c"));
        CHECK_THROWS(factory.build("sin(a, b) * 2"));
        CHECK_THROWS(factory.build("a + (2 * b"));
        CHECK(arena->size() == size);
    }
}
