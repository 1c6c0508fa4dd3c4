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
#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

// fitgraph includes
#include <fitgraph/common/errors.hpp>

namespace fitgraph {

class ClockNetwork;

using ClockId = uint32_t;
using ClockState = uint64_t;

constexpr ClockId INVALID_CLOCK_ID = std::numeric_limits<ClockId>::max();

/**
 * @brief Logical clocks of one fitting session
 *
 * Every node (and every organizer) owns one clock. A clock's state is a
 * stamp drawn from a single counter shared by the whole network, so a larger
 * state always means "changed later". Clicking a clock issues a fresh stamp
 * and pushes it to every observer, transitively. An observer is therefore at
 * least as new as everything it observes, and the question "has X changed
 * since Y last looked" is a single comparison.
 *
 * The counter belongs to the network rather than to the process, so each
 * session starts from zero and can be reset explicitly.
 *
 * Not thread-safe.
 */
class ClockNetwork
{
  private:
    struct ClockData
    {
        ClockState state = 0;
        std::vector<ClockId> observers;
        std::vector<ClockId> subjects;
    };

    std::vector<ClockData> clocks_;
    ClockState counter_ = 0;
    uint64_t session_ = 0;

  public:
    void reserve(size_t capacity) { clocks_.reserve(capacity); }

    ClockId create()
    {
        if(clocks_.size() >= static_cast<size_t>(std::numeric_limits<ClockId>::max()))
            throw Error("Clock network exceeded maximum index for ClockId");
        clocks_.emplace_back();
        return static_cast<ClockId>(clocks_.size() - 1);
    }

    size_t size() const { return clocks_.size(); }

    ClockState state(ClockId id) const { return at(id).state; }

    // The most recent stamp issued by this network
    ClockState now() const { return counter_; }

    // Number of resets so far. Stamps are only comparable within one session.
    uint64_t session() const { return session_; }

    /// Advance the clock past every stamp issued so far and notify observers.
    void click(ClockId id)
    {
        at(id).state = ++counter_;
        propagate(id);
    }

    /// Make `observer` follow `subject`. The observer adopts the subject's state if it is newer.
    void add_subject(ClockId observer, ClockId subject)
    {
        auto& obs = at(observer);
        auto& sub = at(subject);
        if(std::find(sub.observers.begin(), sub.observers.end(), observer) == sub.observers.end()) {
            sub.observers.push_back(observer);
            obs.subjects.push_back(subject);
        }
        if(sub.state > obs.state) {
            obs.state = sub.state;
            propagate(observer);
        }
    }

    void remove_subject(ClockId observer, ClockId subject)
    {
        auto& obs = at(observer);
        auto& sub = at(subject);
        sub.observers.erase(std::remove(sub.observers.begin(), sub.observers.end(), observer), sub.observers.end());
        obs.subjects.erase(std::remove(obs.subjects.begin(), obs.subjects.end(), subject), obs.subjects.end());
    }

    const std::vector<ClockId>& subjects(ClockId id) const { return at(id).subjects; }
    const std::vector<ClockId>& observers(ClockId id) const { return at(id).observers; }

    /// True when `a` has observed everything `b` has produced so far.
    bool observed(ClockId a, ClockId b) const { return state(a) >= state(b); }

    /// Start a new session: every clock and the counter go back to zero.
    void reset()
    {
        counter_ = 0;
        ++session_;
        for(auto& clock : clocks_)
            clock.state = 0;
    }

  private:
    ClockData& at(ClockId id)
    {
        if(id >= clocks_.size())
            throw InvalidArgumentError("Invalid clock id");
        return clocks_[id];
    }

    const ClockData& at(ClockId id) const
    {
        if(id >= clocks_.size())
            throw InvalidArgumentError("Invalid clock id");
        return clocks_[id];
    }

    // Push the state of `source` downstream. Observers already at or past
    // that state are skipped, which also terminates observer cycles.
    void propagate(ClockId source)
    {
        const ClockState stamp = clocks_[source].state;
        std::vector<ClockId> stack{source};
        while(!stack.empty()) {
            const ClockId id = stack.back();
            stack.pop_back();
            for(ClockId obs : clocks_[id].observers) {
                if(clocks_[obs].state >= stamp)
                    continue;
                clocks_[obs].state = stamp;
                stack.push_back(obs);
            }
        }
    }
};

/**
 * @brief Read-only view of one clock, comparable with other views
 *
 * `a >= b` reads "a has observed everything b has produced so far".
 */
class ClockView
{
  private:
    const ClockNetwork* network_;
    ClockId id_;

  public:
    ClockView(const ClockNetwork& network, ClockId id)
        : network_(&network), id_(id)
    {
    }

    ClockId id() const { return id_; }
    ClockState state() const { return network_->state(id_); }

    friend bool operator>=(const ClockView& a, const ClockView& b) { return a.state() >= b.state(); }
    friend bool operator>(const ClockView& a, const ClockView& b) { return a.state() > b.state(); }
    friend bool operator<=(const ClockView& a, const ClockView& b) { return a.state() <= b.state(); }
    friend bool operator<(const ClockView& a, const ClockView& b) { return a.state() < b.state(); }
};

} // namespace fitgraph
