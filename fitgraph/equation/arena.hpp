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
 * @file arena.hpp
 * @brief Flat node storage and change-tracked evaluation for equation graphs
 *
 * DESIGN:
 * =======
 *
 * Every node of a fitting session lives in one EquationArena and is
 * addressed by a NodeId. A node is a single NodeData record; its NodeKind
 * selects which fields are meaningful:
 *
 *   NodeKind::Argument   value, constant flag, parameter data (bounds,
 *                        constraint, external getter/setter)
 *   NodeKind::Operator   OpType (+ Function), positional and keyword
 *                        children, cached result and value stamp
 *   NodeKind::Generator  literal slot, auxiliary args, regeneration policy
 *
 * Children are referenced by NodeId, so one node may appear in any number of
 * equations: the graph is a DAG with shared leaves. Nodes are never removed.
 *
 * CHANGE TRACKING:
 * ================
 *
 * Each node owns a clock in the arena's ClockNetwork. An operator observes
 * the clocks of its children, so a click on any leaf reaches every operator
 * above it without walking the graph. An operator recomputes exactly when
 * its clock is newer than the stamp recorded with its cache; afterwards it
 * clicks and records the new stamp.
 *
 * STORAGE:
 * ========
 *
 * Nodes are kept in a std::deque. Appending never moves existing records,
 * so references stay valid while a generator policy adds nodes in the middle
 * of an evaluation.
 */

#pragma once

// C++ includes
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// fmt includes
#include <fmt/format.h>

// fitgraph includes
#include <fitgraph/common/clock.hpp>
#include <fitgraph/common/errors.hpp>
#include <fitgraph/common/logging.hpp>
#include <fitgraph/common/value.hpp>

#ifndef FITGRAPH_DEFAULT_ARENA_CAPACITY
#define FITGRAPH_DEFAULT_ARENA_CAPACITY 1000
#endif

namespace fitgraph {
namespace equation {

class EquationArena;

using NodeIndex_t = uint32_t;
using NodeId = NodeIndex_t;

static_assert(sizeof(NodeIndex_t) == 4, "NodeIndex_t must be 32-bit");

constexpr NodeId INVALID_NODE_ID = std::numeric_limits<NodeIndex_t>::max();

enum class NodeKind : uint8_t
{
    Argument,
    Operator,
    Generator
};

/**
 * @brief Evaluation function of an operator node
 *
 * The arithmetic operators of the equation language are enumerated so that
 * visitors (the printer in particular) can recognize them. Everything else is
 * OpType::Function and carries a Function.
 */
enum class OpType : uint8_t
{
    Add,
    Subtract,
    Multiply,
    Divide,
    Power,
    Remainder,
    Negate,
    Function
};

inline const char* op_name(OpType op)
{
    switch(op) {
    case OpType::Add: return "add";
    case OpType::Subtract: return "subtract";
    case OpType::Multiply: return "multiply";
    case OpType::Divide: return "divide";
    case OpType::Power: return "power";
    case OpType::Remainder: return "remainder";
    case OpType::Negate: return "negative";
    case OpType::Function: return "function";
    }
    return "unknown";
}

// Number of positional operands of the enumerated operators
inline size_t op_arity(OpType op)
{
    return op == OpType::Negate ? 1 : 2;
}

using KeywordValues = std::vector<std::pair<std::string, Value>>;

/**
 * @brief A named evaluation function with its call signature
 *
 * `min_args`/`max_args` bound the number of positional arguments and
 * `keywords` lists the keyword arguments accepted. Calling the function
 * checks the signature before invoking `body`.
 */
struct Function
{
    static constexpr size_t VARIADIC = std::numeric_limits<size_t>::max();

    using Body = std::function<Value(const std::vector<Value>&, const KeywordValues&)>;

    std::string name;
    size_t min_args = 0;
    size_t max_args = VARIADIC;
    std::vector<std::string> keywords;
    Body body;

    bool accepts_keyword(const std::string& kw) const
    {
        for(const auto& k : keywords)
            if(k == kw)
                return true;
        return false;
    }

    bool accepts_count(size_t n) const { return n >= min_args && n <= max_args; }

    std::string describe_arity() const
    {
        if(max_args == VARIADIC)
            return fmt::format("at least {}", min_args);
        if(min_args == max_args)
            return fmt::format("{}", min_args);
        return fmt::format("{} to {}", min_args, max_args);
    }

    Value operator()(const std::vector<Value>& args, const KeywordValues& kwargs) const
    {
        if(!accepts_count(args.size()))
            throw InvalidArgumentError(fmt::format("{}() takes {} positional argument(s), {} given", name, describe_arity(), args.size()));
        for(const auto& kw : kwargs)
            if(!accepts_keyword(kw.first))
                throw InvalidArgumentError(fmt::format("{}() got an unexpected keyword argument '{}'", name, kw.first));
        return body(args, kwargs);
    }
};

using FunctionPtr = std::shared_ptr<const Function>;

// External storage accessors of wrapped parameters
using Getter = std::function<Value()>;
using Setter = std::function<void(const Value&)>;

/**
 * @brief Regeneration hook of a generator node
 *
 * Called with the arena, the generator and the clock state of the observer
 * asking for it (the stamp of the operator evaluating the generator, or 0
 * when a visitor asks). The policy decides whether regeneration is due.
 */
using GeneratePolicy = std::function<void(EquationArena&, NodeId, ClockState)>;

struct Bounds
{
    double lower = -std::numeric_limits<double>::infinity();
    double upper = std::numeric_limits<double>::infinity();
};

/**
 * @brief Unified node record
 *
 * A discriminated record covering every node kind. Fields not used by a
 * kind keep their defaults.
 */
struct NodeData
{
    NodeKind kind = NodeKind::Argument;
    std::string name;
    ClockId clock = INVALID_CLOCK_ID;

    // Argument
    Value value;
    bool is_constant = false;
    bool is_parameter = false;
    Bounds bounds;
    NodeId constraint = INVALID_NODE_ID;
    Getter getter;
    Setter setter;

    // Operator (args are also the auxiliary nodes of a generator)
    OpType op = OpType::Function;
    FunctionPtr function;
    std::vector<NodeId> args;
    std::vector<std::pair<std::string, NodeId>> kwargs;
    Value cached;
    bool has_cache = false;
    ClockState value_stamp = 0;

    // Generator
    NodeId literal = INVALID_NODE_ID;
    GeneratePolicy policy;

    // Set while the node is being evaluated; a second entry is a cycle
    bool evaluating = false;

    bool is_constrained() const { return constraint != INVALID_NODE_ID; }
    bool is_external() const { return static_cast<bool>(getter); }

    static NodeData argument(std::string name, Value value, bool is_constant = false)
    {
        NodeData data;
        data.kind = NodeKind::Argument;
        data.name = std::move(name);
        data.value = std::move(value);
        data.is_constant = is_constant;
        return data;
    }

    static NodeData operation(OpType op, FunctionPtr function, std::vector<NodeId> args,
                              std::vector<std::pair<std::string, NodeId>> kwargs = {})
    {
        NodeData data;
        data.kind = NodeKind::Operator;
        data.op = op;
        data.name = function ? function->name : op_name(op);
        data.function = std::move(function);
        data.args = std::move(args);
        data.kwargs = std::move(kwargs);
        return data;
    }

    static NodeData generator(std::string name, GeneratePolicy policy)
    {
        NodeData data;
        data.kind = NodeKind::Generator;
        data.name = std::move(name);
        data.policy = std::move(policy);
        return data;
    }
};

/**
 * @brief Flat node container and evaluation engine
 *
 * OPERATIONS:
 * ===========
 * - add_node() and the add_* shortcuts append a node and wire its clock
 * - evaluate()/value() pull a value, recomputing only stale operators
 * - set_value() mutates a leaf and clicks its clock
 * - attach_constraint()/detach_constraint() bind a parameter to an equation
 * - replace_child() rewrites an owner's child slots in place
 * - reset_session() restarts the logical clocks for a new fitting session
 *
 * Not thread-safe: one evaluation at a time.
 */
class EquationArena
{
  private:
    std::deque<NodeData> nodes_;
    ClockNetwork clocks_;

  public:
    explicit EquationArena(size_t initial_capacity = FITGRAPH_DEFAULT_ARENA_CAPACITY)
    {
        this->reserve(initial_capacity);
    }

    EquationArena(const EquationArena&) = delete;
    EquationArena& operator=(const EquationArena&) = delete;

    void reserve(size_t new_capacity)
    {
        clocks_.reserve(new_capacity);
    }

    // Add node to arena and return its ID
    NodeId add_node(NodeData&& node)
    {
        if(nodes_.size() >= static_cast<size_t>(std::numeric_limits<NodeIndex_t>::max()))
            throw Error("Equation arena exceeded maximum index for NodeId");

        for(NodeId child : node.args)
            check_reference(child);
        for(const auto& kw : node.kwargs)
            check_reference(kw.second);

        const auto id = static_cast<NodeId>(nodes_.size());
        node.clock = clocks_.create();
        nodes_.emplace_back(std::move(node));

        const NodeData& added = nodes_.back();
        for(NodeId child : added.args)
            if(child != INVALID_NODE_ID)
                clocks_.add_subject(added.clock, nodes_[child].clock);
        for(const auto& kw : added.kwargs)
            if(kw.second != INVALID_NODE_ID)
                clocks_.add_subject(added.clock, nodes_[kw.second].clock);
        return id;
    }

    NodeId add_argument(const std::string& name, const Value& value, bool is_constant = false)
    {
        return add_node(NodeData::argument(name, value, is_constant));
    }

    // Unnamed constant, printed by value
    NodeId add_constant(const Value& value)
    {
        return add_node(NodeData::argument("", value, true));
    }

    NodeId add_operator(OpType op, std::vector<NodeId> args)
    {
        return add_node(NodeData::operation(op, nullptr, std::move(args)));
    }

    NodeId add_function(FunctionPtr function, std::vector<NodeId> args, std::vector<std::pair<std::string, NodeId>> kwargs = {})
    {
        if(!function)
            throw InvalidArgumentError("Cannot create a function node without a function");
        return add_node(NodeData::operation(OpType::Function, std::move(function), std::move(args), std::move(kwargs)));
    }

    NodeId add_generator(const std::string& name, GeneratePolicy policy)
    {
        return add_node(NodeData::generator(name, std::move(policy)));
    }

    NodeData& operator[](NodeId id) { return nodes_[id]; }
    const NodeData& operator[](NodeId id) const { return nodes_[id]; }

    NodeData& at(NodeId id)
    {
        if(id >= nodes_.size())
            throw InvalidArgumentError(fmt::format("Invalid node id {}", id));
        return nodes_[id];
    }

    const NodeData& at(NodeId id) const
    {
        if(id >= nodes_.size())
            throw InvalidArgumentError(fmt::format("Invalid node id {}", id));
        return nodes_[id];
    }

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    bool contains(NodeId id) const { return id < nodes_.size(); }

    ClockNetwork& clocks() { return clocks_; }
    const ClockNetwork& clocks() const { return clocks_; }

    ClockView clock(NodeId id) const { return ClockView(clocks_, at(id).clock); }

    /// Name used in messages: the node name, or a description of an unnamed node.
    std::string display_name(NodeId id) const
    {
        const NodeData& node = at(id);
        switch(node.kind) {
        case NodeKind::Argument:
            return node.name.empty() ? node.value.to_string() : node.name;
        case NodeKind::Operator:
            return fmt::format("{}#{}", node.name, id);
        case NodeKind::Generator:
            return node.name.empty() ? fmt::format("generator#{}", id) : node.name;
        }
        return fmt::format("node#{}", id);
    }

    Value value(NodeId id) { return evaluate(id, 0); }

    /**
     * @brief Pull the value of a node
     *
     * `observer` is the clock state of whoever asks; it is forwarded to
     * generator policies.
     */
    Value evaluate(NodeId id, ClockState observer = 0)
    {
        switch(at(id).kind) {
        case NodeKind::Argument:
            return evaluate_argument(id);
        case NodeKind::Operator:
            return evaluate_operator(id);
        case NodeKind::Generator:
            return evaluate_generator(id, observer);
        }
        throw EvaluationError(display_name(id), "unknown node kind");
    }

    /// Set the value of a leaf. Clicks only when the value changes.
    void set_value(NodeId id, const Value& value)
    {
        NodeData& node = at(id);
        if(node.kind != NodeKind::Argument)
            throw InvalidArgumentError(fmt::format("'{}' is not an argument and holds no settable value", display_name(id)));
        if(node.is_constant)
            throw ImmutableValueError(fmt::format("The value of '{}' is constant", display_name(id)));
        if(node.is_constrained())
            throw ImmutableValueError(fmt::format("The value of '{}' is constrained; unconstrain it first", display_name(id)));

        if(node.is_external()) {
            if(node.getter() == value)
                return;
            node.setter(value);
        } else {
            if(node.value == value)
                return;
            node.value = value;
        }
        clocks_.click(node.clock);
    }

    /// Toggle the constant flag. The flag does not affect an active constraint.
    void set_constant(NodeId id, bool is_constant)
    {
        NodeData& node = at(id);
        if(node.kind != NodeKind::Argument)
            throw InvalidArgumentError(fmt::format("'{}' is not an argument", display_name(id)));
        node.is_constant = is_constant;
    }

    /// Bind a parameter to an equation root and click it. Callers check the preconditions.
    void attach_constraint(NodeId par, NodeId eq)
    {
        NodeData& node = at(par);
        check_reference(eq);
        node.constraint = eq;
        clocks_.add_subject(node.clock, nodes_[eq].clock);
        clocks_.click(node.clock);
    }

    void detach_constraint(NodeId par)
    {
        NodeData& node = at(par);
        if(!node.is_constrained())
            return;
        clocks_.remove_subject(node.clock, nodes_[node.constraint].clock);
        node.constraint = INVALID_NODE_ID;
        clocks_.click(node.clock);
    }

    /**
     * @brief Replace every reference to `old_child` held by `owner`
     *
     * Covers positional and keyword children of operators and the args of
     * generators. The owner's clock moves from the old child to the new one
     * and the owner is clicked so that it and everything above it recompute.
     *
     * Returns the number of slots replaced.
     */
    size_t replace_child(NodeId owner, NodeId old_child, NodeId new_child)
    {
        NodeData& node = at(owner);
        check_reference(new_child);
        size_t count = 0;
        for(NodeId& slot : node.args) {
            if(slot == old_child) {
                slot = new_child;
                ++count;
            }
        }
        for(auto& kw : node.kwargs) {
            if(kw.second == old_child) {
                kw.second = new_child;
                ++count;
            }
        }
        if(count == 0)
            return 0;
        if(old_child != INVALID_NODE_ID)
            clocks_.remove_subject(node.clock, nodes_[old_child].clock);
        if(new_child != INVALID_NODE_ID)
            clocks_.add_subject(node.clock, nodes_[new_child].clock);
        clocks_.click(node.clock);
        return count;
    }

    /// Install the literal a generator evaluates to.
    void set_literal(NodeId generator, NodeId literal)
    {
        NodeData& node = at(generator);
        if(node.kind != NodeKind::Generator)
            throw InvalidArgumentError(fmt::format("'{}' is not a generator", display_name(generator)));
        check_reference(literal);
        if(node.literal == literal)
            return;
        if(node.literal != INVALID_NODE_ID)
            clocks_.remove_subject(node.clock, nodes_[node.literal].clock);
        node.literal = literal;
        clocks_.add_subject(node.clock, nodes_[literal].clock);
        clocks_.click(node.clock);
    }

    /// Make a generator depend on `node` for change propagation.
    void add_generator_arg(NodeId generator, NodeId node)
    {
        NodeData& gen = at(generator);
        if(gen.kind != NodeKind::Generator)
            throw InvalidArgumentError(fmt::format("'{}' is not a generator", display_name(generator)));
        check_reference(node);
        gen.args.push_back(node);
        clocks_.add_subject(gen.clock, nodes_[node].clock);
    }

    /// Run the regeneration policy of a generator, if it has one.
    void generate(NodeId id, ClockState observer)
    {
        NodeData& node = at(id);
        if(node.kind != NodeKind::Generator || !node.policy)
            return;
        // The policy may reinstall itself; call a copy
        GeneratePolicy policy = node.policy;
        policy(*this, id, observer);
    }

    /// Start a new fitting session: clocks restart at zero and every cache is dropped.
    void reset_session()
    {
        clocks_.reset();
        for(auto& node : nodes_) {
            node.has_cache = false;
            node.value_stamp = 0;
        }
        logger()->debug("Equation arena session reset ({} nodes)", nodes_.size());
    }

  private:
    void check_reference(NodeId id) const
    {
        if(id != INVALID_NODE_ID && id >= nodes_.size())
            throw InvalidArgumentError(fmt::format("Invalid node id {}", id));
    }

    // Marks a node as being evaluated for the lifetime of the guard
    class EvaluationGuard
    {
      private:
        NodeData& node_;

      public:
        EvaluationGuard(EquationArena& arena, NodeId id)
            : node_(arena.nodes_[id])
        {
            if(node_.evaluating)
                throw EvaluationError(arena.display_name(id), "cycle detected: the node depends on itself");
            node_.evaluating = true;
        }

        ~EvaluationGuard() { node_.evaluating = false; }

        EvaluationGuard(const EvaluationGuard&) = delete;
        EvaluationGuard& operator=(const EvaluationGuard&) = delete;
    };

    Value evaluate_argument(NodeId id)
    {
        NodeData& node = nodes_[id];
        if(node.is_constrained()) {
            EvaluationGuard guard(*this, id);
            Value v = evaluate(node.constraint, clocks_.state(node.clock));
            store(id, v);
            return v;
        }
        if(node.is_external()) {
            try {
                return node.getter();
            } catch(const Error&) {
                throw;
            } catch(const std::exception& e) {
                throw EvaluationError(display_name(id), e.what());
            }
        }
        return node.value;
    }

    Value evaluate_operator(NodeId id)
    {
        NodeData& node = nodes_[id];
        if(node.has_cache && node.value_stamp >= clocks_.state(node.clock))
            return node.cached;

        EvaluationGuard guard(*this, id);
        if(logger()->should_log(spdlog::level::trace))
            logger()->trace("Recomputing '{}'", display_name(id));

        try {
            std::vector<Value> args;
            args.reserve(node.args.size());
            for(NodeId child : node.args) {
                if(child == INVALID_NODE_ID)
                    throw EvaluationError(display_name(id), "missing positional argument");
                args.push_back(evaluate(child, node.value_stamp));
            }
            KeywordValues kwargs;
            kwargs.reserve(node.kwargs.size());
            for(const auto& kw : node.kwargs) {
                if(kw.second == INVALID_NODE_ID)
                    throw EvaluationError(display_name(id), fmt::format("missing keyword argument '{}'", kw.first));
                kwargs.emplace_back(kw.first, evaluate(kw.second, node.value_stamp));
            }
            node.cached = apply(node, args, kwargs);
        } catch(const EvaluationError&) {
            throw;
        } catch(const std::exception& e) {
            throw EvaluationError(display_name(id), e.what());
        }

        node.has_cache = true;
        clocks_.click(node.clock);
        node.value_stamp = clocks_.state(node.clock);
        return node.cached;
    }

    Value evaluate_generator(NodeId id, ClockState observer)
    {
        generate(id, observer);
        NodeData& node = nodes_[id];
        if(node.literal == INVALID_NODE_ID)
            throw EvaluationError(display_name(id), "the generator has not produced a literal");
        EvaluationGuard guard(*this, id);
        return evaluate(node.literal, observer);
    }

    static Value apply(const NodeData& node, const std::vector<Value>& args, const KeywordValues& kwargs)
    {
        if(node.op != OpType::Function) {
            if(args.size() != op_arity(node.op) || !kwargs.empty())
                throw InvalidArgumentError(fmt::format("{} takes {} positional argument(s), {} given", op_name(node.op), op_arity(node.op), args.size()));
        }
        switch(node.op) {
        case OpType::Add: return args[0] + args[1];
        case OpType::Subtract: return args[0] - args[1];
        case OpType::Multiply: return args[0] * args[1];
        case OpType::Divide: return args[0] / args[1];
        case OpType::Power: return pow(args[0], args[1]);
        case OpType::Remainder: return remainder(args[0], args[1]);
        case OpType::Negate: return -args[0];
        case OpType::Function:
            if(!node.function)
                throw InvalidArgumentError("operator has no function");
            return (*node.function)(args, kwargs);
        }
        throw InvalidArgumentError("unknown operation");
    }

    // Write a computed value into a leaf without clicking
    void store(NodeId id, const Value& v)
    {
        NodeData& node = nodes_[id];
        if(node.is_external())
            node.setter(v);
        else
            node.value = v;
    }
};

} // namespace equation
} // namespace fitgraph
