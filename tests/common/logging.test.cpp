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
#include <fitgraph/common/logging.hpp>

using namespace fitgraph;

TEST_CASE("testing fitgraph::logger", "[common][logging]")
{
    SECTION("testing the logger is created once and registered by name")
    {
        const auto& log = logger();
        REQUIRE(log);
        CHECK(&log == &logger());
        CHECK(log->name() == LOGGER_NAME);
        CHECK(spdlog::get(LOGGER_NAME) == log);
    }

    SECTION("testing the level can be changed")
    {
        const auto previous = logger()->level();
        set_log_level(spdlog::level::trace);
        CHECK(logger()->should_log(spdlog::level::trace));
        set_log_level(spdlog::level::warn);
        CHECK(!logger()->should_log(spdlog::level::trace));
        CHECK(logger()->should_log(spdlog::level::warn));
        set_log_level(previous);
    }
}
