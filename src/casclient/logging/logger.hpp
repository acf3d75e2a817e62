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

#ifndef INCLUDED_SRC_CASCLIENT_LOGGING_LOGGER_HPP
#define INCLUDED_SRC_CASCLIENT_LOGGING_LOGGER_HPP

#include <algorithm>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "fmt/core.h"
#include "src/casclient/logging/log_config.hpp"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/log_sink.hpp"

/// \brief Named logger forwarding fmt-formatted messages to sinks.
/// Components own an instance (e.g., Logger logger_{"BatchDispatcher"}),
/// free functions use the static Logger::Log.
class Logger {
  public:
    using MessageCreateFunc = std::function<std::string()>;

    /// \brief Create logger with the sinks and limit from LogConfig.
    explicit Logger(std::string name) noexcept
        : name_{std::move(name)},
          log_limit_{LogConfig::LogLimit()},
          sinks_{LogConfig::Sinks()} {}

    /// \brief Create logger with dedicated sinks.
    Logger(std::string name, std::vector<ILogSink::Ptr> sinks) noexcept
        : name_{std::move(name)},
          log_limit_{LogConfig::LogLimit()},
          sinks_{std::move(sinks)} {}

    ~Logger() noexcept = default;
    Logger(Logger const&) noexcept = delete;
    Logger(Logger&&) noexcept = delete;
    auto operator=(Logger const&) noexcept -> Logger& = delete;
    auto operator=(Logger&&) noexcept -> Logger& = delete;

    [[nodiscard]] auto Name() const& noexcept -> std::string const& {
        return name_;
    }

    [[nodiscard]] auto LogLimit() const noexcept -> LogLevel {
        return log_limit_;
    }

    void SetLogLimit(LogLevel level) noexcept { log_limit_ = level; }

    template <class... TArgs>
    void Emit(LogLevel level,
              std::string const& msg,
              TArgs&&... args) const noexcept {
        if (Enabled(level, log_limit_)) {
            Forward(this, sinks_, level, msg, std::forward<TArgs>(args)...);
        }
    }

    /// \brief Emit a lazily created message, only built if enabled.
    void Emit(LogLevel level,
              MessageCreateFunc const& msg_creator) const noexcept {
        if (Enabled(level, log_limit_)) {
            Forward(this, sinks_, level, msg_creator());
        }
    }

    template <class... TArgs>
    static void Log(LogLevel level,
                    std::string const& msg,
                    TArgs&&... args) noexcept {
        if (Enabled(level, LogConfig::LogLimit())) {
            Forward(nullptr,
                    LogConfig::Sinks(),
                    level,
                    msg,
                    std::forward<TArgs>(args)...);
        }
    }

    static void Log(LogLevel level,
                    MessageCreateFunc const& msg_creator) noexcept {
        if (Enabled(level, LogConfig::LogLimit())) {
            Forward(nullptr, LogConfig::Sinks(), level, msg_creator());
        }
    }

  private:
    std::string name_;
    LogLevel log_limit_;
    std::vector<ILogSink::Ptr> sinks_;

    [[nodiscard]] static auto Enabled(LogLevel level, LogLevel limit) noexcept
        -> bool {
        return static_cast<int>(level) <= static_cast<int>(limit);
    }

    template <class... TArgs>
    static void Forward(Logger const* logger,
                        std::vector<ILogSink::Ptr> const& sinks,
                        LogLevel level,
                        std::string const& msg,
                        TArgs&&... args) noexcept {
        if constexpr (sizeof...(TArgs) == 0) {
            std::for_each(sinks.begin(), sinks.end(), [&](auto const& sink) {
                sink->Emit(logger, level, msg);
            });
        }
        else {
            std::string formatted{};
            try {
                formatted = fmt::vformat(msg, fmt::make_format_args(args...));
            } catch (fmt::format_error const& e) {
                formatted = fmt::format("{} [format error: {}]", msg, e.what());
            }
            Forward(logger, sinks, level, formatted);
        }
    }
};

#endif  // INCLUDED_SRC_CASCLIENT_LOGGING_LOGGER_HPP
