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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// fitgraph includes
#include <fitgraph/equation/arena.hpp>
#include <fitgraph/equation/equation.hpp>

namespace fitgraph {
namespace equation {

/**
 * @brief Handle to a generator node
 *
 * A generator is a leaf whose value is produced by another node, its
 * literal. The literal is installed and refreshed by the generator's
 * policy, which runs every time the generator is evaluated or identified by
 * a visitor. Nodes added with add_arg() are observed for change propagation
 * only.
 */
class Generator
{
  private:
    std::shared_ptr<EquationArena> arena_;
    NodeId id_;

  public:
    Generator(std::shared_ptr<EquationArena> arena, NodeId id)
        : arena_(std::move(arena)), id_(id)
    {
        if(!arena_)
            throw InvalidArgumentError("Generator requires an arena");
        if(arena_->at(id_).kind != NodeKind::Generator)
            throw InvalidArgumentError(fmt::format("'{}' is not a generator", arena_->display_name(id_)));
    }

    static Generator create(const std::shared_ptr<EquationArena>& arena, const std::string& name, GeneratePolicy policy = {})
    {
        if(!arena)
            throw InvalidArgumentError("Generator requires an arena");
        return Generator(arena, arena->add_generator(name, std::move(policy)));
    }

    NodeId id() const { return id_; }
    const std::shared_ptr<EquationArena>& arena() const { return arena_; }
    const std::string& name() const { return (*arena_)[id_].name; }

    void set_policy(GeneratePolicy policy) { (*arena_)[id_].policy = std::move(policy); }

    void set_literal(const Equation& literal)
    {
        ensure_same_arena(literal);
        arena_->set_literal(id_, literal.id());
    }

    std::optional<Equation> literal() const
    {
        const NodeId lit = (*arena_)[id_].literal;
        if(lit == INVALID_NODE_ID)
            return std::nullopt;
        return Equation(arena_, lit);
    }

    void add_arg(const Equation& arg)
    {
        ensure_same_arena(arg);
        arena_->add_generator_arg(id_, arg.id());
    }

    const std::vector<NodeId>& args() const { return (*arena_)[id_].args; }

    /// Run the policy on behalf of an observer at clock state `observer`.
    void generate(ClockState observer = 0) { arena_->generate(id_, observer); }

    Value value() const { return arena_->value(id_); }

    ClockView clock() const { return arena_->clock(id_); }

    operator Equation() const { return Equation(arena_, id_); }

  private:
    void ensure_same_arena(const Equation& e) const
    {
        if(e.arena() != arena_)
            throw InvalidArgumentError("Generator and node must share the same arena");
    }
};

using Rebuild = std::function<NodeId(EquationArena&, NodeId)>;

/**
 * @brief Policy that rebuilds the literal only when it is out of date
 *
 * `rebuild` returns the new literal. It is called when the generator has no
 * literal yet, when one of the generator's args changed since the last
 * rebuild, or when the session was reset since the last rebuild.
 */
inline GeneratePolicy regenerate_if_stale(Rebuild rebuild)
{
    struct Stamp
    {
        ClockState state = 0;
        uint64_t session = 0;
    };
    auto generated = std::make_shared<Stamp>();
    return [rebuild = std::move(rebuild), generated](EquationArena& arena, NodeId self, ClockState) {
        const NodeData& node = arena[self];
        bool stale = node.literal == INVALID_NODE_ID || arena.clocks().session() != generated->session;
        for(NodeId arg : node.args)
            stale = stale || arena.clock(arg).state() > generated->state;
        if(!stale)
            return;
        if(logger()->should_log(spdlog::level::trace))
            logger()->trace("Regenerating '{}'", arena.display_name(self));
        arena.set_literal(self, rebuild(arena, self));
        generated->state = arena.clocks().now();
        generated->session = arena.clocks().session();
    };
}

} // namespace equation
} // namespace fitgraph
