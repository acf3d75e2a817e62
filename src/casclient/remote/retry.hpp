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

#ifndef INCLUDED_SRC_CASCLIENT_REMOTE_RETRY_HPP
#define INCLUDED_SRC_CASCLIENT_REMOTE_RETRY_HPP

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <optional>
#include <type_traits>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/logging/logger.hpp"
#include "src/casclient/multithreading/cancellation.hpp"
#include "src/casclient/remote/retry_config.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Number of retries shared by all jobs of one dispatch. Without a
/// limit, every request is granted.
class RetryBudget final {
  public:
    explicit RetryBudget(std::optional<std::size_t> limit = std::nullopt)
        : limit_{limit} {}

    /// \brief Request one retry.
    /// \returns false if the budget is exhausted.
    [[nodiscard]] auto TryConsume() noexcept -> bool {
        auto const used = used_.fetch_add(1);
        return not limit_ or used < *limit_;
    }

    /// \brief Number of granted retries.
    [[nodiscard]] auto Used() const noexcept -> std::size_t {
        auto const used = used_.load();
        return limit_ ? std::min(used, *limit_) : used;
    }

  private:
    std::optional<std::size_t> limit_;
    std::atomic<std::size_t> used_{0};
};

/// \brief Decide whether a failed attempt is followed by another one and wait
/// the backoff time if so.
/// \returns std::nullopt if the caller should retry, otherwise the error to
/// report: the original error if it is not transient or attempts are
/// exhausted, RetryBudgetExceeded if the budget is used up, or Cancelled if
/// the token fired before or during the backoff.
[[nodiscard]] auto PrepareRetry(CasError const& error,
                                unsigned int attempt,
                                RetryConfig const& retry_config,
                                Logger const& logger,
                                CancellationToken const& cancel,
                                RetryBudget* budget) noexcept
    -> std::optional<CasError>;

/// \brief Calls a function returning expected<T, CasError> with a retry
/// strategy using a backoff algorithm. Only transient errors are retried.
/// The cancellation token is checked before every attempt.
template <class TFunc>
[[nodiscard]] auto WithRetry(TFunc const& f,
                             RetryConfig const& retry_config,
                             Logger const& logger,
                             CancellationToken const& cancel,
                             RetryBudget* budget = nullptr) noexcept
    -> std::invoke_result_t<TFunc const&> {
    try {
        for (auto attempt = 1U;; ++attempt) {
            if (cancel.IsCancelled()) {
                return MakeError(ErrorKind::Cancelled,
                                 "cancelled before attempt {}",
                                 attempt);
            }
            auto result = f();
            if (result) {
                return result;
            }
            if (auto err = PrepareRetry(result.error(),
                                        attempt,
                                        retry_config,
                                        logger,
                                        cancel,
                                        budget)) {
                return unexpected{*std::move(err)};
            }
        }
    } catch (std::exception const& e) {
        return MakeError(
            ErrorKind::Internal, "WithRetry: caught exception:\n{}", e.what());
    }
}

#endif  // INCLUDED_SRC_CASCLIENT_REMOTE_RETRY_HPP
