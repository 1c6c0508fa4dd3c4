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
 * @file builder.hpp
 * @brief Build equation graphs from text
 *
 * GRAMMAR:
 * ========
 *
 *   expression := term (('+' | '-') term)*
 *   term       := unary (('*' | '/' | '%') unary)*
 *   unary      := ('-' | '+') unary | power
 *   power      := primary ('**' unary)?
 *   primary    := number | name | name '(' arguments? ')' | '(' expression ')'
 *   arguments  := argument (',' argument)*
 *   argument   := expression | name '=' expression
 *
 * `**` is right associative and binds tighter than unary minus, so `-a**2`
 * is `-(a**2)` while `a**-1` is accepted.
 *
 * Building is done in three passes: the text is parsed into a small syntax
 * tree, every name in the tree is resolved and every call checked against
 * its signature, and only then are nodes appended to the arena. A failed
 * build leaves the arena untouched.
 */

#pragma once

// C++ includes
#include <cctype>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// fmt includes
#include <fmt/format.h>

// fitgraph includes
#include <fitgraph/common/errors.hpp>
#include <fitgraph/common/logging.hpp>
#include <fitgraph/equation/arena.hpp>
#include <fitgraph/equation/equation.hpp>
#include <fitgraph/equation/functions.hpp>

namespace fitgraph {
namespace equation {
namespace detail {

enum class TokenType : uint8_t
{
    Number,
    Identifier,
    Plus,
    Minus,
    Star,
    Slash,
    Percent,
    Power,
    LParen,
    RParen,
    Comma,
    Assign,
    End
};

struct Token
{
    TokenType type = TokenType::End;
    std::string text;
    double number = 0.0;
    size_t position = 0;
};

inline std::vector<Token> tokenize(const std::string& text)
{
    std::vector<Token> tokens;
    size_t i = 0;
    auto is_ident_start = [](char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; };
    auto is_ident_char = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };
    auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    while(i < text.size()) {
        const char c = text[i];
        if(std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        Token token;
        token.position = i;

        if(is_digit(c) || (c == '.' && i + 1 < text.size() && is_digit(text[i + 1]))) {
            size_t j = i;
            while(j < text.size() && is_digit(text[j]))
                ++j;
            if(j < text.size() && text[j] == '.') {
                ++j;
                while(j < text.size() && is_digit(text[j]))
                    ++j;
            }
            if(j < text.size() && (text[j] == 'e' || text[j] == 'E')) {
                size_t k = j + 1;
                if(k < text.size() && (text[k] == '+' || text[k] == '-'))
                    ++k;
                if(k >= text.size() || !is_digit(text[k]))
                    throw ParseError(text, k, "malformed exponent in number");
                while(k < text.size() && is_digit(text[k]))
                    ++k;
                j = k;
            }
            token.type = TokenType::Number;
            token.text = text.substr(i, j - i);
            token.number = std::strtod(token.text.c_str(), nullptr);
            tokens.push_back(token);
            i = j;
            continue;
        }

        if(is_ident_start(c)) {
            size_t j = i;
            while(j < text.size() && is_ident_char(text[j]))
                ++j;
            token.type = TokenType::Identifier;
            token.text = text.substr(i, j - i);
            tokens.push_back(token);
            i = j;
            continue;
        }

        switch(c) {
        case '+': token.type = TokenType::Plus; break;
        case '-': token.type = TokenType::Minus; break;
        case '/': token.type = TokenType::Slash; break;
        case '%': token.type = TokenType::Percent; break;
        case '(': token.type = TokenType::LParen; break;
        case ')': token.type = TokenType::RParen; break;
        case ',': token.type = TokenType::Comma; break;
        case '=': token.type = TokenType::Assign; break;
        case '*':
            if(i + 1 < text.size() && text[i + 1] == '*') {
                token.type = TokenType::Power;
                token.text = "**";
                tokens.push_back(token);
                i += 2;
                continue;
            }
            token.type = TokenType::Star;
            break;
        default:
            throw ParseError(text, i, fmt::format("unexpected character '{}'", c));
        }
        token.text = std::string(1, c);
        tokens.push_back(token);
        ++i;
    }

    Token end;
    end.type = TokenType::End;
    end.position = text.size();
    tokens.push_back(end);
    return tokens;
}

struct SyntaxNode
{
    enum class Kind : uint8_t
    {
        Number,
        Name,
        Operation,
        Call
    };

    Kind kind = Kind::Number;
    double number = 0.0;
    std::string name;
    OpType op = OpType::Function;
    std::vector<SyntaxNode> args;
    std::vector<std::pair<std::string, SyntaxNode>> kwargs;
    size_t position = 0;
};

class Parser
{
  private:
    const std::string& text_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;

  public:
    explicit Parser(const std::string& text)
        : text_(text), tokens_(tokenize(text))
    {
    }

    SyntaxNode parse()
    {
        if(peek().type == TokenType::End)
            throw ParseError(text_, 0, "empty equation");
        SyntaxNode root = parse_expression();
        if(peek().type != TokenType::End)
            fail(peek(), "unexpected");
        return root;
    }

  private:
    const Token& peek(size_t ahead = 0) const
    {
        const size_t i = pos_ + ahead;
        return i < tokens_.size() ? tokens_[i] : tokens_.back();
    }

    const Token& advance() { return tokens_[pos_ < tokens_.size() - 1 ? pos_++ : pos_]; }

    bool accept(TokenType type)
    {
        if(peek().type != type)
            return false;
        advance();
        return true;
    }

    [[noreturn]] void fail(const Token& token, const std::string& what) const
    {
        if(token.type == TokenType::End)
            throw ParseError(text_, token.position, "unexpected end of equation");
        throw ParseError(text_, token.position, fmt::format("{} '{}'", what, token.text));
    }

    void expect(TokenType type, const char* description)
    {
        if(!accept(type))
            fail(peek(), fmt::format("expected {}, found", description));
    }

    static SyntaxNode operation(OpType op, std::vector<SyntaxNode> args, size_t position)
    {
        SyntaxNode node;
        node.kind = SyntaxNode::Kind::Operation;
        node.op = op;
        node.args = std::move(args);
        node.position = position;
        return node;
    }

    SyntaxNode parse_expression()
    {
        SyntaxNode left = parse_term();
        while(peek().type == TokenType::Plus || peek().type == TokenType::Minus) {
            const Token& token = advance();
            const OpType op = token.type == TokenType::Plus ? OpType::Add : OpType::Subtract;
            SyntaxNode right = parse_term();
            left = operation(op, {std::move(left), std::move(right)}, token.position);
        }
        return left;
    }

    SyntaxNode parse_term()
    {
        SyntaxNode left = parse_unary();
        while(peek().type == TokenType::Star || peek().type == TokenType::Slash || peek().type == TokenType::Percent) {
            const Token& token = advance();
            OpType op = OpType::Multiply;
            if(token.type == TokenType::Slash)
                op = OpType::Divide;
            else if(token.type == TokenType::Percent)
                op = OpType::Remainder;
            SyntaxNode right = parse_unary();
            left = operation(op, {std::move(left), std::move(right)}, token.position);
        }
        return left;
    }

    SyntaxNode parse_unary()
    {
        if(peek().type == TokenType::Minus) {
            const size_t position = advance().position;
            return operation(OpType::Negate, {parse_unary()}, position);
        }
        if(accept(TokenType::Plus))
            return parse_unary();
        return parse_power();
    }

    SyntaxNode parse_power()
    {
        SyntaxNode base = parse_primary();
        if(peek().type == TokenType::Power) {
            const size_t position = advance().position;
            SyntaxNode exponent = parse_unary(); // Right-associative
            return operation(OpType::Power, {std::move(base), std::move(exponent)}, position);
        }
        return base;
    }

    SyntaxNode parse_primary()
    {
        const Token& token = peek();
        if(token.type == TokenType::Number) {
            advance();
            SyntaxNode node;
            node.kind = SyntaxNode::Kind::Number;
            node.number = token.number;
            node.position = token.position;
            return node;
        }
        if(token.type == TokenType::Identifier) {
            advance();
            SyntaxNode node;
            node.name = token.text;
            node.position = token.position;
            if(accept(TokenType::LParen)) {
                node.kind = SyntaxNode::Kind::Call;
                parse_arguments(node);
                expect(TokenType::RParen, "')'");
            } else {
                node.kind = SyntaxNode::Kind::Name;
            }
            return node;
        }
        if(accept(TokenType::LParen)) {
            SyntaxNode inner = parse_expression();
            expect(TokenType::RParen, "')'");
            return inner;
        }
        fail(token, "unexpected");
    }

    void parse_arguments(SyntaxNode& call)
    {
        if(peek().type == TokenType::RParen)
            return;
        do {
            if(peek().type == TokenType::Identifier && peek(1).type == TokenType::Assign) {
                const Token& kw = advance();
                advance();
                for(const auto& seen : call.kwargs)
                    if(seen.first == kw.text)
                        throw ParseError(text_, kw.position, fmt::format("keyword argument '{}' repeated", kw.text));
                call.kwargs.emplace_back(kw.text, parse_expression());
            } else {
                if(!call.kwargs.empty())
                    throw ParseError(text_, peek().position, "positional argument follows keyword argument");
                call.args.push_back(parse_expression());
            }
        } while(accept(TokenType::Comma));
    }
};

} // namespace detail

/**
 * @brief Registry of named nodes and functions that turns text into graphs
 *
 * Names registered here (and names passed in a transient namespace for one
 * build) resolve to existing nodes, so equations built from the same factory
 * share their leaves. Functions are looked up by name among the built-ins
 * and the functions registered on this factory.
 */
class EquationFactory
{
  public:
    using Namespace = std::map<std::string, Equation>;

  private:
    std::shared_ptr<EquationArena> arena_;
    std::map<std::string, NodeId> arguments_;
    FunctionRegistry functions_;

  public:
    explicit EquationFactory(std::shared_ptr<EquationArena> arena = std::make_shared<EquationArena>())
        : arena_(std::move(arena)), functions_(builtin_functions())
    {
        if(!arena_)
            throw InvalidArgumentError("EquationFactory requires an arena");
    }

    const std::shared_ptr<EquationArena>& arena() const { return arena_; }

    /// Bind `name` to `node`. Binding the same node again is a no-op.
    void register_argument(const std::string& name, const Equation& node)
    {
        if(node.arena() != arena_)
            throw InvalidArgumentError(fmt::format("Cannot register '{}' from a different arena", name));
        register_argument(name, node.id());
    }

    void register_argument(const std::string& name, NodeId node)
    {
        if(name.empty())
            throw InvalidArgumentError("Cannot register a node without a name");
        if(!arena_->contains(node))
            throw InvalidArgumentError(fmt::format("Invalid node id {}", node));
        auto it = arguments_.find(name);
        if(it != arguments_.end()) {
            if(it->second == node)
                return;
            throw ConflictError(fmt::format("The name '{}' is already registered to a different node", name));
        }
        arguments_.emplace(name, node);
    }

    /// Remove a binding. Returns false when the name is not registered.
    bool deregister(const std::string& name) { return arguments_.erase(name) > 0; }

    bool has_argument(const std::string& name) const { return arguments_.count(name) > 0; }

    std::optional<Equation> argument(const std::string& name) const
    {
        auto it = arguments_.find(name);
        if(it == arguments_.end())
            return std::nullopt;
        return Equation(arena_, it->second);
    }

    const std::map<std::string, NodeId>& arguments() const { return arguments_; }

    /// Register (or replace) a function under `name`.
    void register_function(const std::string& name, Function function)
    {
        if(name.empty())
            throw InvalidArgumentError("Cannot register a function without a name");
        function.name = name;
        functions_[name] = std::make_shared<const Function>(std::move(function));
    }

    void register_function(const std::string& name, size_t min_args, size_t max_args, Function::Body body,
                           std::vector<std::string> keywords = {})
    {
        if(name.empty())
            throw InvalidArgumentError("Cannot register a function without a name");
        functions_[name] = make_function(name, min_args, max_args, std::move(body), std::move(keywords));
    }

    bool has_function(const std::string& name) const { return functions_.count(name) > 0; }

    FunctionPtr function(const std::string& name) const
    {
        auto it = functions_.find(name);
        if(it == functions_.end())
            throw NameResolutionError(name);
        return it->second;
    }

    /**
     * @brief Build the graph described by `text`
     *
     * Names are looked up in the registry, then in `ns`. The namespace is
     * used for this build only.
     */
    Equation build(const std::string& text, const Namespace& ns = {}) const
    {
        for(const auto& entry : ns) {
            if(entry.second.arena() != arena_)
                throw InvalidArgumentError(fmt::format("Namespace entry '{}' belongs to a different arena", entry.first));
            auto it = arguments_.find(entry.first);
            if(it != arguments_.end() && it->second != entry.second.id())
                throw ConflictError(fmt::format("The name '{}' is already registered to a different node", entry.first));
        }

        detail::Parser parser(text);
        const detail::SyntaxNode tree = parser.parse();

        std::vector<std::string> problems;
        resolve(tree, ns, problems);
        if(!problems.empty())
            throw StructuralError(text, std::move(problems));

        const NodeId root = materialize(tree, ns);
        logger()->debug("Built equation '{}'", text);
        return Equation(arena_, root);
    }

  private:
    NodeId lookup(const std::string& name, const Namespace& ns) const
    {
        auto it = arguments_.find(name);
        if(it != arguments_.end())
            return it->second;
        auto local = ns.find(name);
        if(local != ns.end())
            return local->second.id();
        return INVALID_NODE_ID;
    }

    // Check names and call signatures without touching the arena
    void resolve(const detail::SyntaxNode& node, const Namespace& ns, std::vector<std::string>& problems) const
    {
        using Kind = detail::SyntaxNode::Kind;
        switch(node.kind) {
        case Kind::Number:
            return;
        case Kind::Name:
            if(lookup(node.name, ns) == INVALID_NODE_ID)
                throw NameResolutionError(node.name);
            return;
        case Kind::Operation:
            for(const auto& arg : node.args)
                resolve(arg, ns, problems);
            return;
        case Kind::Call: {
            auto it = functions_.find(node.name);
            if(it == functions_.end())
                throw NameResolutionError(node.name);
            const Function& fn = *it->second;
            if(!fn.accepts_count(node.args.size()))
                problems.push_back(fmt::format("'{}' takes {} positional argument(s), {} given", node.name,
                                               fn.describe_arity(), node.args.size()));
            for(const auto& kw : node.kwargs)
                if(!fn.accepts_keyword(kw.first))
                    problems.push_back(fmt::format("'{}' does not accept keyword '{}'", node.name, kw.first));
            for(const auto& arg : node.args)
                resolve(arg, ns, problems);
            for(const auto& kw : node.kwargs)
                resolve(kw.second, ns, problems);
            return;
        }
        }
    }

    NodeId materialize(const detail::SyntaxNode& node, const Namespace& ns) const
    {
        using Kind = detail::SyntaxNode::Kind;
        switch(node.kind) {
        case Kind::Number:
            return arena_->add_constant(Value(node.number));
        case Kind::Name:
            return lookup(node.name, ns);
        case Kind::Operation: {
            std::vector<NodeId> args;
            for(const auto& arg : node.args)
                args.push_back(materialize(arg, ns));
            return arena_->add_operator(node.op, std::move(args));
        }
        case Kind::Call: {
            std::vector<NodeId> args;
            for(const auto& arg : node.args)
                args.push_back(materialize(arg, ns));
            std::vector<std::pair<std::string, NodeId>> kwargs;
            for(const auto& kw : node.kwargs)
                kwargs.emplace_back(kw.first, materialize(kw.second, ns));
            return arena_->add_function(functions_.at(node.name), std::move(args), std::move(kwargs));
        }
        }
        throw InvalidArgumentError("Unknown syntax node");
    }
};

} // namespace equation
} // namespace fitgraph
