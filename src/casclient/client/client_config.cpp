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

#include "src/casclient/client/client_config.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <utility>

#include "fmt/core.h"
#include "src/casclient/remote/retry_config.hpp"
#include "src/casclient/remote/rpc_timeouts.hpp"
#include "src/utils/cpp/json.hpp"

namespace {
/// \brief Read an optional non-negative integer.
[[nodiscard]] auto ReadSize(nlohmann::json const& json, std::string const& key)
    -> expected<std::optional<std::size_t>, std::string> {
    auto value = ExtractOptionalValueAs<std::int64_t>(json, key);
    if (not value) {
        return unexpected{std::move(value).error()};
    }
    if (not *value) {
        return std::optional<std::size_t>{};
    }
    if (**value < 0) {
        return unexpected{
            fmt::format("\"{}\" must not be negative, found {}", key, **value)};
    }
    return std::optional{static_cast<std::size_t>(**value)};
}

[[nodiscard]] auto ReadRetryConfig(nlohmann::json const& json)
    -> expected<RetryConfig, std::string> {
    RetryConfig::Builder builder{};
    auto initial = ReadSize(json, "initial_backoff_ms");
    if (not initial) {
        return unexpected{std::move(initial).error()};
    }
    if (*initial) {
        builder.SetInitialBackoff(std::chrono::milliseconds{**initial});
    }
    auto max = ReadSize(json, "max_backoff_ms");
    if (not max) {
        return unexpected{std::move(max).error()};
    }
    if (*max) {
        builder.SetMaxBackoff(std::chrono::milliseconds{**max});
    }
    auto attempts = ExtractOptionalValueAs<unsigned int>(json, "max_attempts");
    if (not attempts) {
        return unexpected{std::move(attempts).error()};
    }
    builder.SetMaxAttempts(*attempts);
    auto jitter = ExtractOptionalValueAs<bool>(json, "jitter");
    if (not jitter) {
        return unexpected{std::move(jitter).error()};
    }
    builder.SetJitter(jitter->value_or(true));
    return builder.Build();
}
}  // namespace

auto ClientConfig::FromJson(nlohmann::json const& json) noexcept
    -> expected<ClientConfig, std::string> {
    try {
        if (not json.is_object()) {
            return unexpected{fmt::format(
                "client configuration must be an object, found {}",
                json.type_name())};
        }
        ClientConfig config{};

        auto instance = ExtractOptionalValueAs<std::string>(json, "instance_name");
        if (not instance) {
            return unexpected{std::move(instance).error()};
        }
        config.instance_name = instance->value_or("");

        auto hash_name =
            ExtractOptionalValueAs<std::string>(json, "hash_function");
        if (not hash_name) {
            return unexpected{std::move(hash_name).error()};
        }
        if (*hash_name) {
            auto hash_function = HashFunction::FromString(**hash_name);
            if (not hash_function) {
                return unexpected{fmt::format("unknown hash function \"{}\"",
                                              **hash_name)};
            }
            config.hash_function = *hash_function;
        }

        DispatcherConfig::Builder builder{};
        builder.SetHashFunction(config.hash_function);
        struct SizeSetting {
            char const* key;
            DispatcherConfig::Builder& (DispatcherConfig::Builder::*setter)(
                std::optional<std::size_t>) noexcept;
        };
        for (auto const& [key, setter] :
             {SizeSetting{"concurrency_limit",
                          &DispatcherConfig::Builder::SetConcurrencyLimit},
              SizeSetting{"max_batch_size",
                          &DispatcherConfig::Builder::SetMaxBatchSize},
              SizeSetting{"large_blob_threshold",
                          &DispatcherConfig::Builder::SetLargeBlobThreshold},
              SizeSetting{"chunk_size",
                          &DispatcherConfig::Builder::SetChunkSize},
              SizeSetting{"max_query_batch_digests",
                          &DispatcherConfig::Builder::SetMaxQueryBatchDigests},
              SizeSetting{"max_total_retries",
                          &DispatcherConfig::Builder::SetMaxTotalRetries}}) {
            auto value = ReadSize(json, key);
            if (not value) {
                return unexpected{std::move(value).error()};
            }
            (builder.*setter)(*value);
        }

        auto assume_missing = ExtractOptionalValueAs<bool>(
            json, "assume_missing_on_presence_failure");
        if (not assume_missing) {
            return unexpected{std::move(assume_missing).error()};
        }
        builder.SetAssumeMissingOnPresenceFailure(
            assume_missing->value_or(false));

        if (auto it = json.find("retry"); it != json.end()) {
            if (not it->is_object()) {
                return unexpected{std::string{"\"retry\" must be an object"}};
            }
            auto retry = ReadRetryConfig(*it);
            if (not retry) {
                return unexpected{std::move(retry).error()};
            }
            builder.SetRetryConfig(*retry);
        }

        auto timeouts_str =
            ExtractOptionalValueAs<std::string>(json, "rpc_timeouts");
        if (not timeouts_str) {
            return unexpected{std::move(timeouts_str).error()};
        }
        if (*timeouts_str) {
            auto timeouts =
                RpcTimeouts::Builder{}.SetFromString(**timeouts_str).Build();
            if (not timeouts) {
                return unexpected{std::move(timeouts).error()};
            }
            builder.SetTimeouts(*timeouts);
        }

        auto dispatcher = builder.Build();
        if (not dispatcher) {
            return unexpected{std::move(dispatcher).error()};
        }
        config.dispatcher = *std::move(dispatcher);

        auto cache_file = ExtractOptionalValueAs<std::string>(json, "cache_file");
        if (not cache_file) {
            return unexpected{std::move(cache_file).error()};
        }
        if (*cache_file) {
            config.cache_file = std::filesystem::path{**cache_file};
        }

        auto depth = ReadSize(json, "max_tree_depth");
        if (not depth) {
            return unexpected{std::move(depth).error()};
        }
        if (*depth) {
            config.max_tree_depth = **depth;
        }
        return config;
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("reading client configuration failed:\n{}", e.what())};
    }
}

auto ClientConfig::FromFile(std::filesystem::path const& file) noexcept
    -> expected<ClientConfig, std::string> {
    try {
        std::ifstream in{file};
        if (not in.is_open()) {
            return unexpected{
                fmt::format("cannot open configuration file {}", file.string())};
        }
        return FromJson(nlohmann::json::parse(in));
    } catch (std::exception const& e) {
        return unexpected{fmt::format(
            "parsing configuration file {} failed:\n{}", file.string(), e.what())};
    }
}
