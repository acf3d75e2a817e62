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

#ifndef INCLUDED_SRC_CASCLIENT_REMOTE_RETRY_CONFIG_HPP
#define INCLUDED_SRC_CASCLIENT_REMOTE_RETRY_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "fmt/core.h"
#include "src/casclient/logging/log_level.hpp"
#include "src/utils/cpp/expected.hpp"

inline constexpr std::chrono::milliseconds kDefaultInitialBackoff{225};
inline constexpr std::chrono::milliseconds kDefaultMaxBackoff{2000};
inline constexpr unsigned int kDefaultAttempts{6};
inline constexpr auto kRetryLogLevel = LogLevel::Progress;

class RetryConfig final {
  public:
    class Builder;

    RetryConfig() = default;

    [[nodiscard]] auto GetMaxAttempts() const noexcept -> unsigned int {
        return attempts_;
    }

    [[nodiscard]] auto GetInitialBackoff() const noexcept
        -> std::chrono::milliseconds {
        return initial_backoff_;
    }

    [[nodiscard]] auto GetMaxBackoff() const noexcept
        -> std::chrono::milliseconds {
        return max_backoff_;
    }

    [[nodiscard]] auto HasJitter() const noexcept -> bool { return jitter_; }

    /// \brief The waiting time is doubled at each \p attempt until it reaches
    /// the maximal backoff.
    ///
    /// To avoid overloading of the reachable resources, a jitter (aka,
    /// random value of at most half the backoff) is added to distribute the
    /// workload.
    [[nodiscard]] auto GetSleepTime(unsigned int attempt) const noexcept
        -> std::chrono::milliseconds {
        auto backoff = initial_backoff_;
        // on the first attempt, we don't double the backoff time
        // also we do it in a for loop to avoid overflow
        for (auto x = 1U; x < attempt; ++x) {
            backoff *= 2;
            if (backoff >= max_backoff_) {
                backoff = max_backoff_;
                break;
            }
        }
        if (not jitter_) {
            return backoff;
        }
        return backoff + std::chrono::milliseconds{Jitter(backoff.count())};
    }

  private:
    std::chrono::milliseconds initial_backoff_ = kDefaultInitialBackoff;
    std::chrono::milliseconds max_backoff_ = kDefaultMaxBackoff;
    unsigned int attempts_ = kDefaultAttempts;
    bool jitter_ = true;

    RetryConfig(std::chrono::milliseconds initial_backoff,
                std::chrono::milliseconds max_backoff,
                unsigned int attempts,
                bool jitter)
        : initial_backoff_{initial_backoff},
          max_backoff_{max_backoff},
          attempts_{attempts},
          jitter_{jitter} {}

    using dist_type = std::uniform_int_distribution<std::int64_t>;

    [[nodiscard]] static auto Jitter(std::int64_t backoff) noexcept
        -> std::int64_t {
        static std::mutex mutex;
        static std::mt19937 rng{std::random_device{}()};
        dist_type dist{0, backoff / 2};
        std::unique_lock lock(mutex);
        return dist(rng);
    }
};

class RetryConfig::Builder final {
  public:
    auto SetInitialBackoff(std::optional<std::chrono::milliseconds> x) noexcept
        -> Builder& {
        initial_backoff_ = x;
        return *this;
    }

    auto SetMaxBackoff(std::optional<std::chrono::milliseconds> x) noexcept
        -> Builder& {
        max_backoff_ = x;
        return *this;
    }

    auto SetMaxAttempts(std::optional<unsigned int> x) noexcept -> Builder& {
        attempts_ = x;
        return *this;
    }

    auto SetJitter(bool x) noexcept -> Builder& {
        jitter_ = x;
        return *this;
    }

    [[nodiscard]] auto Build() const noexcept
        -> expected<RetryConfig, std::string> {
        auto initial_backoff = kDefaultInitialBackoff;
        if (initial_backoff_.has_value()) {
            if (initial_backoff_->count() < 1) {
                return unexpected{fmt::format(
                    "Invalid initial backoff provided: {}ms.\nValue must be "
                    "strictly greater than 0.",
                    initial_backoff_->count())};
            }
            initial_backoff = *initial_backoff_;
        }

        auto max_backoff = kDefaultMaxBackoff;
        if (max_backoff_.has_value()) {
            if (max_backoff_->count() < 1) {
                return unexpected{
                    fmt::format("Invalid max backoff provided: {}ms.\nValue "
                                "must be strictly greater than 0.",
                                max_backoff_->count())};
            }
            max_backoff = *max_backoff_;
        }
        if (max_backoff < initial_backoff) {
            return unexpected{fmt::format(
                "Max backoff {}ms is smaller than the initial backoff {}ms.",
                max_backoff.count(),
                initial_backoff.count())};
        }

        unsigned int attempts = kDefaultAttempts;
        if (attempts_.has_value()) {
            if (*attempts_ < 1) {
                return unexpected{
                    fmt::format("Invalid max number of attempts provided: "
                                "{}.\nValue must be strictly greater than 0.",
                                *attempts_)};
            }
            attempts = *attempts_;
        }

        return RetryConfig(initial_backoff, max_backoff, attempts, jitter_);
    }

  private:
    std::optional<std::chrono::milliseconds> initial_backoff_;
    std::optional<std::chrono::milliseconds> max_backoff_;
    std::optional<unsigned int> attempts_;
    bool jitter_{true};
};

#endif  // INCLUDED_SRC_CASCLIENT_REMOTE_RETRY_CONFIG_HPP
