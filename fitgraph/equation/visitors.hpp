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
 * @file visitors.hpp
 * @brief Traversals over equation graphs
 *
 * DESIGN:
 * =======
 *
 * The node kinds are closed, so dispatch is a single switch in identify().
 * A visitor derives from Visitor<R>, where R is what each callback returns,
 * and overrides the callbacks for the kinds it handles. The others throw
 * NotImplementedError.
 *
 * Identifying a generator runs its policy before the callback, so visitors
 * always see an up-to-date literal.
 *
 * Traversals follow positional children, keyword children, generator args
 * and the constraint equation of a constrained parameter.
 *
 * Visitors shipped here:
 *
 *   ArgFinder   reachable arguments, unique, first-seen order
 *   Printer     human-readable rendering
 *   Validator   structural problems (missing children, arity, cycles)
 *   Swapper     in-place replacement of one node by another
 *   NodeFinder  reachability of one node
 */

#pragma once

// C++ includes
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

// fmt includes
#include <fmt/format.h>

// fitgraph includes
#include <fitgraph/common/errors.hpp>
#include <fitgraph/common/logging.hpp>
#include <fitgraph/equation/arena.hpp>
#include <fitgraph/equation/equation.hpp>

namespace fitgraph {
namespace equation {

template<typename R>
class Visitor
{
  protected:
    EquationArena& arena_;

  public:
    explicit Visitor(EquationArena& arena)
        : arena_(arena)
    {
    }

    virtual ~Visitor() = default;

    EquationArena& arena() const { return arena_; }

    virtual R on_argument(NodeId id)
    {
        throw NotImplementedError(fmt::format("Visitor does not handle argument '{}'", arena_.display_name(id)));
    }

    virtual R on_operator(NodeId id)
    {
        throw NotImplementedError(fmt::format("Visitor does not handle operator '{}'", arena_.display_name(id)));
    }

    virtual R on_generator(NodeId id)
    {
        throw NotImplementedError(fmt::format("Visitor does not handle generator '{}'", arena_.display_name(id)));
    }
};

/// Dispatch a node to the visitor callback of its kind.
template<typename R>
R identify(EquationArena& arena, NodeId id, Visitor<R>& visitor)
{
    switch(arena.at(id).kind) {
    case NodeKind::Argument:
        return visitor.on_argument(id);
    case NodeKind::Operator:
        return visitor.on_operator(id);
    case NodeKind::Generator:
        arena.generate(id, 0);
        return visitor.on_generator(id);
    }
    throw InvalidArgumentError(fmt::format("Unknown kind of node {}", id));
}

//------------------------------------------------------------------------------
// ArgFinder
//------------------------------------------------------------------------------

/**
 * @brief Collect the arguments reachable from a root
 *
 * Constant arguments are skipped unless `getconsts` is set. Each argument is
 * reported once, in the order it is first reached depth-first.
 */
class ArgFinder : public Visitor<void>
{
  private:
    bool getconsts_;
    std::unordered_set<NodeId> seen_;
    std::vector<NodeId> args_;

  public:
    ArgFinder(EquationArena& arena, bool getconsts = true)
        : Visitor<void>(arena), getconsts_(getconsts)
    {
    }

    const std::vector<NodeId>& args() const { return args_; }

    void on_argument(NodeId id) override
    {
        if(!seen_.insert(id).second)
            return;
        const NodeData& node = arena_[id];
        if(getconsts_ || !node.is_constant)
            args_.push_back(id);
        if(node.is_constrained())
            identify(arena_, node.constraint, *this);
    }

    void on_operator(NodeId id) override
    {
        if(!seen_.insert(id).second)
            return;
        const NodeData& node = arena_[id];
        for(NodeId child : node.args)
            if(child != INVALID_NODE_ID)
                identify(arena_, child, *this);
        for(const auto& kw : node.kwargs)
            if(kw.second != INVALID_NODE_ID)
                identify(arena_, kw.second, *this);
    }

    void on_generator(NodeId id) override
    {
        if(!seen_.insert(id).second)
            return;
        for(NodeId arg : arena_[id].args)
            identify(arena_, arg, *this);
    }
};

//------------------------------------------------------------------------------
// Printer
//------------------------------------------------------------------------------

/**
 * @brief Render a graph as text
 *
 * add, subtract, multiply, divide and power render infix, negation renders
 * prefix and everything else renders as `name(arg, ..., kw=val)`. Every
 * operator is parenthesized unless its rendering is already enclosed in one
 * pair of parentheses. Arguments render as their name, or as their value
 * when unnamed or named with a leading underscore.
 */
class Printer : public Visitor<std::string>
{
  public:
    using Visitor<std::string>::Visitor;

    std::string on_argument(NodeId id) override
    {
        const NodeData& node = arena_[id];
        if(node.name.empty() || node.name[0] == '_')
            return arena_.value(id).to_string();
        return node.name;
    }

    std::string on_operator(NodeId id) override
    {
        const NodeData& node = arena_[id];
        std::string out;
        if(const char* symbol = infix_symbol(node.op)) {
            out = render(node.args, 0) + " " + symbol + " " + render(node.args, 1);
        } else if(node.op == OpType::Negate || is_builtin_negative(node)) {
            out = "-" + render(node.args, 0);
        } else {
            std::vector<std::string> parts;
            for(size_t i = 0; i < node.args.size(); ++i)
                parts.push_back(render(node.args, i));
            for(const auto& kw : node.kwargs)
                parts.push_back(kw.first + "=" + render_child(kw.second));
            return fmt::format("{}({})", node.name, fmt::join(parts, ", "));
        }
        return enclosed(out) ? out : "(" + out + ")";
    }

    std::string on_generator(NodeId id) override
    {
        const NodeData& node = arena_[id];
        if(!node.name.empty() && node.name[0] != '_')
            return node.name;
        if(node.literal != INVALID_NODE_ID)
            return identify(arena_, node.literal, *this);
        return "<generator>";
    }

    /// True when `s` is a single parenthesized group, e.g. "(a + b)" but not "(a) * (b)".
    static bool enclosed(const std::string& s)
    {
        if(s.size() < 2 || s.front() != '(' || s.back() != ')')
            return false;
        int depth = 0;
        for(size_t i = 0; i < s.size(); ++i) {
            if(s[i] == '(')
                ++depth;
            else if(s[i] == ')' && --depth == 0)
                return i + 1 == s.size();
        }
        return false;
    }

  private:
    // negative(x) from the builtin registry prints like unary minus
    static bool is_builtin_negative(const NodeData& node)
    {
        return node.op == OpType::Function && node.args.size() == 1 && node.kwargs.empty() &&
               node.function == builtin_function("negative");
    }

    static const char* infix_symbol(OpType op)
    {
        switch(op) {
        case OpType::Add: return "+";
        case OpType::Subtract: return "-";
        case OpType::Multiply: return "*";
        case OpType::Divide: return "/";
        case OpType::Power: return "**";
        default: return nullptr;
        }
    }

    std::string render(const std::vector<NodeId>& args, size_t i)
    {
        return i < args.size() ? render_child(args[i]) : "?";
    }

    std::string render_child(NodeId id)
    {
        return id == INVALID_NODE_ID ? "?" : identify(arena_, id, *this);
    }
};

//------------------------------------------------------------------------------
// Validator
//------------------------------------------------------------------------------

/**
 * @brief Collect the structural problems of a graph
 *
 * Reports absent children, positional and keyword arguments that do not fit
 * the evaluation function, generators without a literal and, when
 * `check_cycles` is set, nodes reachable from themselves.
 */
class Validator : public Visitor<void>
{
  private:
    bool check_cycles_;
    std::unordered_set<NodeId> path_;
    std::unordered_set<NodeId> done_;
    std::vector<std::string> errors_;

  public:
    Validator(EquationArena& arena, bool check_cycles = true)
        : Visitor<void>(arena), check_cycles_(check_cycles)
    {
    }

    const std::vector<std::string>& errors() const { return errors_; }

    void on_argument(NodeId id) override
    {
        const NodeData& node = arena_[id];
        if(!node.is_constrained() || !enter(id))
            return;
        visit(node.constraint);
        leave(id);
    }

    void on_operator(NodeId id) override
    {
        if(!enter(id))
            return;
        const NodeData& node = arena_[id];
        const std::string name = arena_.display_name(id);

        if(node.op == OpType::Function) {
            if(!node.function) {
                errors_.push_back(fmt::format("'{}' has no evaluation function", name));
            } else {
                if(!node.function->accepts_count(node.args.size()))
                    errors_.push_back(fmt::format("'{}' takes {} positional argument(s), {} given", name,
                                                  node.function->describe_arity(), node.args.size()));
                for(const auto& kw : node.kwargs)
                    if(!node.function->accepts_keyword(kw.first))
                        errors_.push_back(fmt::format("'{}' does not accept keyword '{}'", name, kw.first));
            }
        } else {
            if(node.args.size() != op_arity(node.op))
                errors_.push_back(fmt::format("'{}' takes {} positional argument(s), {} given", name,
                                              op_arity(node.op), node.args.size()));
            if(!node.kwargs.empty())
                errors_.push_back(fmt::format("'{}' does not accept keyword arguments", name));
        }

        for(size_t i = 0; i < node.args.size(); ++i) {
            if(node.args[i] == INVALID_NODE_ID)
                errors_.push_back(fmt::format("'{}' is missing positional argument {}", name, i + 1));
            else
                visit(node.args[i]);
        }
        for(const auto& kw : node.kwargs) {
            if(kw.second == INVALID_NODE_ID)
                errors_.push_back(fmt::format("'{}' is missing keyword argument '{}'", name, kw.first));
            else
                visit(kw.second);
        }
        leave(id);
    }

    void on_generator(NodeId id) override
    {
        if(!enter(id))
            return;
        const NodeData& node = arena_[id];
        if(node.literal == INVALID_NODE_ID)
            errors_.push_back(fmt::format("Generator '{}' has no literal", arena_.display_name(id)));
        else
            visit(node.literal);
        for(NodeId arg : node.args)
            visit(arg);
        leave(id);
    }

  private:
    void visit(NodeId id) { identify(arena_, id, *this); }

    // False when the node needs no (further) visit
    bool enter(NodeId id)
    {
        if(path_.count(id)) {
            if(check_cycles_)
                errors_.push_back(fmt::format("Cycle detected: '{}' is reachable from itself", arena_.display_name(id)));
            return false;
        }
        if(done_.count(id))
            return false;
        path_.insert(id);
        return true;
    }

    void leave(NodeId id)
    {
        path_.erase(id);
        done_.insert(id);
    }
};

//------------------------------------------------------------------------------
// Swapper
//------------------------------------------------------------------------------

/**
 * @brief Replace every reference to one node by another
 *
 * Owners are rewritten in place: their clocks move to the new child and their
 * caches are invalidated. An operator shared with other graphs is rewritten
 * for all of them. A root equal to the old node cannot be rewritten; use the
 * node returned by swap() as the new root.
 */
class Swapper : public Visitor<void>
{
  private:
    NodeId old_;
    NodeId new_;
    std::unordered_set<NodeId> visited_;
    size_t replaced_ = 0;

  public:
    Swapper(EquationArena& arena, NodeId old_node, NodeId new_node)
        : Visitor<void>(arena), old_(old_node), new_(new_node)
    {
    }

    size_t replaced() const { return replaced_; }

    void on_argument(NodeId) override {}

    void on_operator(NodeId id) override { rewrite(id); }

    void on_generator(NodeId id) override { rewrite(id); }

  private:
    void rewrite(NodeId id)
    {
        if(id == new_ || !visited_.insert(id).second)
            return;
        replaced_ += arena_.replace_child(id, old_, new_);
        const NodeData& node = arena_[id];
        std::vector<NodeId> children = node.args;
        for(const auto& kw : node.kwargs)
            children.push_back(kw.second);
        for(NodeId child : children)
            if(child != INVALID_NODE_ID && child != new_)
                identify(arena_, child, *this);
    }
};

//------------------------------------------------------------------------------
// NodeFinder
//------------------------------------------------------------------------------

/// Tell whether a node is reachable from a root.
class NodeFinder : public Visitor<void>
{
  private:
    NodeId target_;
    std::unordered_set<NodeId> visited_;
    bool found_ = false;

  public:
    NodeFinder(EquationArena& arena, NodeId target)
        : Visitor<void>(arena), target_(target)
    {
    }

    bool found() const { return found_; }

    void on_argument(NodeId id) override
    {
        if(!check(id))
            return;
        const NodeData& node = arena_[id];
        if(node.is_constrained())
            identify(arena_, node.constraint, *this);
    }

    void on_operator(NodeId id) override
    {
        if(!check(id))
            return;
        const NodeData& node = arena_[id];
        for(NodeId child : node.args)
            if(child != INVALID_NODE_ID && !found_)
                identify(arena_, child, *this);
        for(const auto& kw : node.kwargs)
            if(kw.second != INVALID_NODE_ID && !found_)
                identify(arena_, kw.second, *this);
    }

    void on_generator(NodeId id) override
    {
        if(!check(id))
            return;
        const NodeData& node = arena_[id];
        if(node.literal != INVALID_NODE_ID)
            identify(arena_, node.literal, *this);
        for(NodeId arg : node.args)
            if(!found_)
                identify(arena_, arg, *this);
    }

  private:
    // True when the traversal should continue below `id`
    bool check(NodeId id)
    {
        if(id == target_)
            found_ = true;
        return !found_ && visited_.insert(id).second;
    }
};

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

/// Arguments reachable from `eq`, constants included when `getconsts` is set.
inline std::vector<NodeId> get_args(const Equation& eq, bool getconsts = true)
{
    ArgFinder finder(*eq.arena(), getconsts);
    identify(*eq.arena(), eq.id(), finder);
    return finder.args();
}

inline std::string to_string(const Equation& eq)
{
    Printer printer(*eq.arena());
    return identify(*eq.arena(), eq.id(), printer);
}

inline void pretty_print(const Equation& eq, std::ostream& out = std::cout)
{
    out << to_string(eq) << std::endl;
}

/// Structural problems of `eq`; empty when the graph is sound.
inline std::vector<std::string> check(const Equation& eq, bool check_cycles = true)
{
    Validator validator(*eq.arena(), check_cycles);
    identify(*eq.arena(), eq.id(), validator);
    return validator.errors();
}

/// Throw a StructuralError listing every problem of `eq`.
inline void validate(const Equation& eq, bool check_cycles = true)
{
    auto errors = check(eq, check_cycles);
    if(!errors.empty())
        throw StructuralError(eq.arena()->display_name(eq.id()), std::move(errors));
}

/**
 * @brief Replace `old_node` by `new_node` everywhere below `eq`
 *
 * Returns the root to use from now on: `new_node` when `eq` itself is
 * `old_node`, `eq` otherwise.
 */
inline Equation swap(const Equation& eq, const Equation& old_node, const Equation& new_node)
{
    eq.ensure_same_arena(old_node);
    eq.ensure_same_arena(new_node);
    if(eq.is(old_node))
        return new_node;
    Swapper swapper(*eq.arena(), old_node.id(), new_node.id());
    identify(*eq.arena(), eq.id(), swapper);
    logger()->debug("Swapped '{}' for '{}' in {} slot(s)", eq.arena()->display_name(old_node.id()),
                    eq.arena()->display_name(new_node.id()), swapper.replaced());
    return eq;
}

inline bool contains(const Equation& eq, const Equation& node)
{
    if(eq.arena() != node.arena())
        return false;
    NodeFinder finder(*eq.arena(), node.id());
    identify(*eq.arena(), eq.id(), finder);
    return finder.found();
}

} // namespace equation
} // namespace fitgraph
