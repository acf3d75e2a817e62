// Copyright 2025 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCLUDED_SRC_CASCLIENT_LOGGING_LOG_SINK_HPP
#define INCLUDED_SRC_CASCLIENT_LOGGING_LOG_SINK_HPP

#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "src/casclient/logging/log_level.hpp"

class Logger;

/// \brief Destination of formatted log messages.
class ILogSink {
  public:
    using Ptr = std::shared_ptr<ILogSink>;
    ILogSink() noexcept = default;
    ILogSink(ILogSink const&) = delete;
    ILogSink(ILogSink&&) = delete;
    auto operator=(ILogSink const&) -> ILogSink& = delete;
    auto operator=(ILogSink&&) -> ILogSink& = delete;
    virtual ~ILogSink() noexcept = default;

    /// \brief Thread-safe emitting of log messages.
    /// Logger is 'nullptr' for messages logged via Logger::Log.
    virtual void Emit(Logger const* logger,
                      LogLevel level,
                      std::string const& msg) const noexcept = 0;

  protected:
    /// \brief Split a message into lines, keeping at least one (empty) line.
    [[nodiscard]] static auto SplitLines(std::string const& msg)
        -> std::vector<std::string> {
        std::vector<std::string> lines{};
        std::istringstream iss{msg};
        for (std::string line; std::getline(iss, line);) {
            lines.emplace_back(std::move(line));
        }
        if (lines.empty()) {
            lines.emplace_back();
        }
        return lines;
    }
};

using LogSinkFactory = std::function<ILogSink::Ptr()>;

#endif  // INCLUDED_SRC_CASCLIENT_LOGGING_LOG_SINK_HPP
