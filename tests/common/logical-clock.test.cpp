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

// Catch includes
#include <catch2/catch_test_macros.hpp>

// fitgraph includes
#include <fitgraph/common/clock.hpp>

using namespace fitgraph;

TEST_CASE("testing fitgraph::ClockNetwork", "[common][clock]")
{
    ClockNetwork net;
    const ClockId a = net.create();
    const ClockId b = net.create();
    const ClockId c = net.create();

    SECTION("testing clicks issue ever newer stamps")
    {
        CHECK(net.state(a) == 0);
        CHECK(net.now() == 0);

        net.click(a);
        net.click(b);
        CHECK(net.state(b) > net.state(a));

        net.click(a);
        CHECK(net.state(a) > net.state(b));
        CHECK(net.now() == net.state(a));
    }

    SECTION("testing observers follow their subjects transitively")
    {
        net.add_subject(b, a);
        net.add_subject(c, b);

        net.click(a);
        CHECK(net.state(b) == net.state(a));
        CHECK(net.state(c) == net.state(a));
        CHECK(net.observed(c, a));

        // Clicking an observer leaves its subjects alone
        net.click(c);
        CHECK(net.state(c) > net.state(a));
        CHECK(!net.observed(a, c));
    }

    SECTION("testing a new subject makes the observer catch up")
    {
        net.click(a);
        CHECK(net.state(b) < net.state(a));
        net.add_subject(b, a);
        CHECK(net.state(b) == net.state(a));

        // Adding twice keeps one link
        net.add_subject(b, a);
        CHECK(net.subjects(b).size() == 1);
        CHECK(net.observers(a).size() == 1);
    }

    SECTION("testing removed subjects no longer propagate")
    {
        net.add_subject(b, a);
        net.click(a);
        const ClockState before = net.state(b);

        net.remove_subject(b, a);
        CHECK(net.subjects(b).empty());
        net.click(a);
        CHECK(net.state(b) == before);
        CHECK(net.state(a) > net.state(b));
    }

    SECTION("testing observer cycles terminate")
    {
        net.add_subject(a, b);
        net.add_subject(b, a);
        net.click(a);
        CHECK(net.state(a) == net.state(b));
        net.click(b);
        CHECK(net.state(a) == net.state(b));
    }

    SECTION("testing reset starts a new session")
    {
        net.add_subject(b, a);
        net.click(a);
        net.click(c);
        CHECK(net.session() == 0);
        net.reset();
        CHECK(net.session() == 1);
        CHECK(net.now() == 0);
        CHECK(net.state(a) == 0);
        CHECK(net.state(b) == 0);
        CHECK(net.state(c) == 0);

        // Links survive the reset
        net.click(a);
        CHECK(net.state(a) == 1);
        CHECK(net.state(b) == 1);
    }

    SECTION("testing clock views compare like their states")
    {
        net.add_subject(b, a);
        net.click(a);
        ClockView va(net, a);
        ClockView vb(net, b);
        ClockView vc(net, c);
        CHECK(vb >= va);
        CHECK(va <= vb);
        CHECK(va > vc);
        CHECK(vc < va);
        CHECK(!(vc >= va));
    }

    SECTION("testing invalid clock ids are rejected")
    {
        CHECK_THROWS_AS(net.click(42), InvalidArgumentError);
        CHECK_THROWS_AS(net.state(INVALID_CLOCK_ID), InvalidArgumentError);
        CHECK_THROWS_AS(net.add_subject(a, 42), InvalidArgumentError);
    }
}
