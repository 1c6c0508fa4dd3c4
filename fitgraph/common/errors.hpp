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
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// fmt includes
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fitgraph {

/// Base class of every error raised by fitgraph.
class Error : public std::runtime_error
{
  public:
    explicit Error(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/**
 * @brief Aggregated structural problems found in an equation graph
 *
 * Raised by validate() and by the equation builder with one message per
 * problem (absent children, arity mismatches, cycles).
 */
class StructuralError : public Error
{
  private:
    std::vector<std::string> problems_;

  public:
    StructuralError(const std::string& subject, std::vector<std::string> problems)
        : Error(fmt::format("Errors found in equation '{}'\n{}", subject, fmt::join(problems, "\n"))),
          problems_(std::move(problems))
    {
    }

    const std::vector<std::string>& problems() const { return problems_; }
};

/// An identifier in an equation does not resolve to a registered node or function.
class NameResolutionError : public Error
{
  private:
    std::string name_;

  public:
    explicit NameResolutionError(const std::string& name)
        : Error(fmt::format("The name '{}' is not defined", name)), name_(name)
    {
    }

    const std::string& name() const { return name_; }
};

/// A name is already bound to a different object.
class ConflictError : public Error
{
  public:
    explicit ConflictError(const std::string& message)
        : Error(message)
    {
    }
};

/// Organizer flavour of ConflictError (empty or duplicate member names).
class NameConflictError : public ConflictError
{
  public:
    explicit NameConflictError(const std::string& message)
        : ConflictError(message)
    {
    }
};

/// Constraining a constant or an already constrained parameter.
class ConstraintConflictError : public Error
{
  public:
    explicit ConstraintConflictError(const std::string& message)
        : Error(message)
    {
    }
};

/// Restraint with an invalid domain (zero sigma).
class RestraintDomainError : public Error
{
  public:
    explicit RestraintDomainError(const std::string& message)
        : Error(message)
    {
    }
};

/// Failure while evaluating a node. Tagged with the node name.
class EvaluationError : public Error
{
  private:
    std::string node_;

  public:
    EvaluationError(const std::string& node, const std::string& reason)
        : Error(fmt::format("Evaluation of '{}' failed: {}", node, reason)), node_(node)
    {
    }

    const std::string& node() const { return node_; }
};

/// Malformed equation text.
class ParseError : public Error
{
  private:
    size_t position_;

  public:
    ParseError(const std::string& text, size_t position, const std::string& reason)
        : Error(fmt::format("Cannot parse '{}' at position {}: {}", text, position, reason)), position_(position)
    {
    }

    size_t position() const { return position_; }
};

/// Write to a constant or constrained value.
class ImmutableValueError : public Error
{
  public:
    explicit ImmutableValueError(const std::string& message)
        : Error(message)
    {
    }
};

class InvalidArgumentError : public Error
{
  public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message)
    {
    }
};

/// Default behaviour of visitor callbacks a visitor does not handle.
class NotImplementedError : public Error
{
  public:
    explicit NotImplementedError(const std::string& message)
        : Error(message)
    {
    }
};

} // namespace fitgraph
