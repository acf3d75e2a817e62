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

#ifndef INCLUDED_SRC_CASCLIENT_LOGGING_LOG_LEVEL_HPP
#define INCLUDED_SRC_CASCLIENT_LOGGING_LOG_LEVEL_HPP

#include <algorithm>
#include <string>
#include <type_traits>

#include "gsl/gsl"

enum class LogLevel {
    Error,     ///< Failures that abort a transfer or leave data unusable
    Warning,   ///< Per-blob failures and degraded modes
    Info,      ///< Summary of finished transfers
    Progress,  ///< Retries and transfer progress
    Debug,     ///< Protocol details, batch composition
    Trace      ///< Per-chunk and per-entry details
};

constexpr auto kFirstLogLevel = LogLevel::Error;
constexpr auto kLastLogLevel = LogLevel::Trace;

/// \brief Clamp an integral value into the range of known log levels.
[[nodiscard]] static inline auto ToLogLevel(
    std::underlying_type_t<LogLevel> level) noexcept -> LogLevel {
    auto const first = static_cast<std::underlying_type_t<LogLevel>>(
        kFirstLogLevel);
    auto const last =
        static_cast<std::underlying_type_t<LogLevel>>(kLastLogLevel);
    return static_cast<LogLevel>(std::clamp(level, first, last));
}

[[nodiscard]] static inline auto LogLevelToString(LogLevel level)
    -> std::string {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Progress:
            return "PROG";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
    }
    Ensures(false);  // unreachable
}

#endif  // INCLUDED_SRC_CASCLIENT_LOGGING_LOG_LEVEL_HPP
