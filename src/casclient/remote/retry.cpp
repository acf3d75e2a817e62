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

#include "src/casclient/remote/retry.hpp"

#include "fmt/core.h"

auto PrepareRetry(CasError const& error,
                  unsigned int attempt,
                  RetryConfig const& retry_config,
                  Logger const& logger,
                  CancellationToken const& cancel,
                  RetryBudget* budget) noexcept -> std::optional<CasError> {
    auto const attempts = retry_config.GetMaxAttempts();
    if (not error.IsTransient()) {
        return error;
    }
    // don't wait if it was the last attempt
    if (attempt >= attempts) {
        logger.Emit(LogLevel::Debug,
                    "After {} attempts: {}",
                    attempt,
                    error.ToString());
        return error;
    }
    if (budget != nullptr and not budget->TryConsume()) {
        return CasError{
            .kind = ErrorKind::RetryBudgetExceeded,
            .message = fmt::format("retry budget exhausted, last error: {}",
                                   error.ToString())};
    }
    auto const sleep_time = retry_config.GetSleepTime(attempt);
    logger.Emit(kRetryLogLevel,
                "Attempt {}/{} failed: {}. Retrying in {}ms.",
                attempt,
                attempts,
                error.ToString(),
                sleep_time.count());
    if (cancel.WaitFor(sleep_time)) {
        return CasError{.kind = ErrorKind::Cancelled,
                        .message = fmt::format("cancelled while waiting to "
                                               "retry after: {}",
                                               error.ToString())};
    }
    return std::nullopt;
}
