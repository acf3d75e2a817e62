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

#ifndef INCLUDED_SRC_CASCLIENT_LOGGING_LOG_SINK_CMDLINE_HPP
#define INCLUDED_SRC_CASCLIENT_LOGGING_LOG_SINK_CMDLINE_HPP

#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "fmt/color.h"
#include "fmt/core.h"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/log_sink.hpp"
#include "src/casclient/logging/logger.hpp"

/// \brief Sink writing to stderr, optionally colored.
class LogSinkCmdLine final : public ILogSink {
  public:
    /// \param max_level    Drop messages above this level, independent of the
    ///                     log limit of the emitting logger.
    static auto CreateFactory(bool colored = true,
                              std::optional<LogLevel> max_level = std::nullopt)
        -> LogSinkFactory {
        return [=]() {
            return std::make_shared<LogSinkCmdLine>(colored, max_level);
        };
    }

    LogSinkCmdLine(bool colored, std::optional<LogLevel> max_level) noexcept
        : colored_{colored}, max_level_{max_level} {}

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        if (max_level_ and
            static_cast<int>(*max_level_) < static_cast<int>(level)) {
            return;
        }
        try {
            auto prefix = logger == nullptr
                              ? fmt::format("{}:", LogLevelToString(level))
                              : fmt::format("{} ({}):",
                                            LogLevelToString(level),
                                            logger->Name());
            auto const indent = std::string(prefix.size(), ' ');
            auto styled = Style(level, prefix);
            auto const lines = SplitLines(msg);

            std::lock_guard lock{Mutex()};
            for (std::size_t i = 0; i < lines.size(); ++i) {
                fmt::print(stderr,
                           "{} {}\n",
                           i == 0 ? styled : indent,
                           lines[i]);
            }
            std::fflush(stderr);
        } catch (std::exception const& e) {
            std::fprintf(stderr, "log sink failure: %s\n", e.what());
        }
    }

  private:
    bool colored_;
    std::optional<LogLevel> max_level_;

    [[nodiscard]] static auto Mutex() noexcept -> std::mutex& {
        static std::mutex mutex{};
        return mutex;
    }

    [[nodiscard]] auto Style(LogLevel level, std::string const& prefix) const
        -> std::string {
        if (not colored_) {
            return prefix;
        }
        fmt::text_style style{};
        switch (level) {
            case LogLevel::Error:
                style = fg(fmt::color::red);
                break;
            case LogLevel::Warning:
                style = fg(fmt::color::orange);
                break;
            case LogLevel::Info:
                style = fg(fmt::color::lime_green);
                break;
            case LogLevel::Progress:
                style = fg(fmt::color::dark_green);
                break;
            case LogLevel::Debug:
                style = fg(fmt::color::sky_blue);
                break;
            case LogLevel::Trace:
                style = fg(fmt::color::deep_sky_blue);
                break;
        }
        return fmt::format(style, "{}", prefix);
    }
};

#endif  // INCLUDED_SRC_CASCLIENT_LOGGING_LOG_SINK_CMDLINE_HPP
