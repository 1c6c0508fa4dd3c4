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
#include <memory>
#include <string>

// spdlog includes
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace fitgraph {

constexpr const char* LOGGER_NAME = "fitgraph";

/**
 * @brief The library logger
 *
 * Created on first use with a colour sink on stderr at level warn, so a
 * fitting loop stays quiet unless asked otherwise. Applications may register
 * their own logger named "fitgraph" before first use to redirect output.
 * The logger is looked up once and kept for the life of the process.
 */
inline const std::shared_ptr<spdlog::logger>& logger()
{
    static const std::shared_ptr<spdlog::logger> log = [] {
        if(auto existing = spdlog::get(LOGGER_NAME))
            return existing;
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return log;
}

inline void set_log_level(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

/// Apply levels from the SPDLOG_LEVEL environment variable, e.g. SPDLOG_LEVEL=fitgraph=debug
inline void configure_logging_from_env()
{
    logger();
    spdlog::cfg::load_env_levels();
}

} // namespace fitgraph
