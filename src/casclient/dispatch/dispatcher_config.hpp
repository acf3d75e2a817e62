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

#ifndef INCLUDED_SRC_CASCLIENT_DISPATCH_DISPATCHER_CONFIG_HPP
#define INCLUDED_SRC_CASCLIENT_DISPATCH_DISPATCHER_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "fmt/core.h"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/remote/retry_config.hpp"
#include "src/casclient/remote/rpc_timeouts.hpp"
#include "src/utils/cpp/expected.hpp"

inline constexpr std::size_t kDefaultConcurrencyLimit{500};
// 4 MiB gRPC message limit minus room for the request envelope
inline constexpr std::size_t kDefaultMaxBatchSize{(4UL * 1024 * 1024) - 1024};
inline constexpr std::size_t kDefaultChunkSize{1024UL * 1024};
inline constexpr std::size_t kDefaultMaxQueryBatchDigests{10'000};

/// \brief Validated settings of a BatchDispatcher. Create via Builder.
class DispatcherConfig final {
  public:
    class Builder;

    DispatcherConfig() = default;

    /// \brief Maximum number of jobs executing at the same time.
    [[nodiscard]] auto ConcurrencyLimit() const noexcept -> std::size_t {
        return concurrency_limit_;
    }
    /// \brief Maximum cumulative blob size of one batch job.
    [[nodiscard]] auto MaxBatchSize() const noexcept -> std::size_t {
        return max_batch_size_;
    }
    /// \brief Blobs larger than this are streamed instead of batched.
    [[nodiscard]] auto LargeBlobThreshold() const noexcept -> std::size_t {
        return large_blob_threshold_;
    }
    [[nodiscard]] auto ChunkSize() const noexcept -> std::size_t {
        return chunk_size_;
    }
    [[nodiscard]] auto MaxQueryBatchDigests() const noexcept -> std::size_t {
        return max_query_batch_digests_;
    }
    [[nodiscard]] auto AssumeMissingOnPresenceFailure() const noexcept
        -> bool {
        return assume_missing_on_presence_failure_;
    }
    [[nodiscard]] auto Retry() const noexcept -> RetryConfig const& {
        return retry_;
    }
    /// \brief Retries granted to all jobs of one dispatch together; none
    /// means unlimited.
    [[nodiscard]] auto MaxTotalRetries() const noexcept
        -> std::optional<std::size_t> {
        return max_total_retries_;
    }
    [[nodiscard]] auto Timeouts() const noexcept -> RpcTimeouts const& {
        return timeouts_;
    }
    [[nodiscard]] auto GetHashFunction() const noexcept -> HashFunction {
        return hash_function_;
    }

  private:
    std::size_t concurrency_limit_{kDefaultConcurrencyLimit};
    std::size_t max_batch_size_{kDefaultMaxBatchSize};
    std::size_t large_blob_threshold_{kDefaultMaxBatchSize};
    std::size_t chunk_size_{kDefaultChunkSize};
    std::size_t max_query_batch_digests_{kDefaultMaxQueryBatchDigests};
    bool assume_missing_on_presence_failure_{false};
    RetryConfig retry_;
    std::optional<std::size_t> max_total_retries_;
    RpcTimeouts timeouts_;
    HashFunction hash_function_;
};

class DispatcherConfig::Builder final {
  public:
    auto SetConcurrencyLimit(std::optional<std::size_t> x) noexcept
        -> Builder& {
        concurrency_limit_ = x;
        return *this;
    }

    auto SetMaxBatchSize(std::optional<std::size_t> x) noexcept -> Builder& {
        max_batch_size_ = x;
        return *this;
    }

    /// \brief Defaults to the maximum batch size.
    auto SetLargeBlobThreshold(std::optional<std::size_t> x) noexcept
        -> Builder& {
        large_blob_threshold_ = x;
        return *this;
    }

    auto SetChunkSize(std::optional<std::size_t> x) noexcept -> Builder& {
        chunk_size_ = x;
        return *this;
    }

    auto SetMaxQueryBatchDigests(std::optional<std::size_t> x) noexcept
        -> Builder& {
        max_query_batch_digests_ = x;
        return *this;
    }

    auto SetAssumeMissingOnPresenceFailure(bool x) noexcept -> Builder& {
        assume_missing_ = x;
        return *this;
    }

    auto SetRetryConfig(RetryConfig x) noexcept -> Builder& {
        retry_ = x;
        return *this;
    }

    auto SetMaxTotalRetries(std::optional<std::size_t> x) noexcept
        -> Builder& {
        max_total_retries_ = x;
        return *this;
    }

    auto SetTimeouts(RpcTimeouts x) noexcept -> Builder& {
        timeouts_ = x;
        return *this;
    }

    auto SetHashFunction(HashFunction x) noexcept -> Builder& {
        hash_function_ = x;
        return *this;
    }

    [[nodiscard]] auto Build() const noexcept
        -> expected<DispatcherConfig, std::string> {
        DispatcherConfig config{};
        if (auto err = Positive(concurrency_limit_,
                                "concurrency limit",
                                &config.concurrency_limit_)) {
            return unexpected{*std::move(err)};
        }
        if (auto err = Positive(max_batch_size_,
                                "max batch size",
                                &config.max_batch_size_)) {
            return unexpected{*std::move(err)};
        }
        config.large_blob_threshold_ = config.max_batch_size_;
        if (auto err = Positive(large_blob_threshold_,
                                "large blob threshold",
                                &config.large_blob_threshold_)) {
            return unexpected{*std::move(err)};
        }
        if (auto err =
                Positive(chunk_size_, "chunk size", &config.chunk_size_)) {
            return unexpected{*std::move(err)};
        }
        if (auto err = Positive(max_query_batch_digests_,
                                "max query batch digests",
                                &config.max_query_batch_digests_)) {
            return unexpected{*std::move(err)};
        }
        config.assume_missing_on_presence_failure_ = assume_missing_;
        config.retry_ = retry_;
        config.max_total_retries_ = max_total_retries_;
        config.timeouts_ = timeouts_;
        config.hash_function_ = hash_function_;
        return config;
    }

  private:
    std::optional<std::size_t> concurrency_limit_;
    std::optional<std::size_t> max_batch_size_;
    std::optional<std::size_t> large_blob_threshold_;
    std::optional<std::size_t> chunk_size_;
    std::optional<std::size_t> max_query_batch_digests_;
    bool assume_missing_{false};
    RetryConfig retry_;
    std::optional<std::size_t> max_total_retries_;
    RpcTimeouts timeouts_;
    HashFunction hash_function_;

    /// \brief Store value in target if set and strictly positive.
    [[nodiscard]] static auto Positive(std::optional<std::size_t> value,
                                       char const* name,
                                       std::size_t* target) noexcept
        -> std::optional<std::string> {
        if (not value) {
            return std::nullopt;
        }
        if (*value < 1) {
            return fmt::format(
                "Invalid {} provided: {}.\nValue must be strictly greater "
                "than 0.",
                name,
                *value);
        }
        *target = *value;
        return std::nullopt;
    }
};

#endif  // INCLUDED_SRC_CASCLIENT_DISPATCH_DISPATCHER_CONFIG_HPP
