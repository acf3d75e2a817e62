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

#ifndef INCLUDED_SRC_CASCLIENT_CLIENT_CLIENT_CONFIG_HPP
#define INCLUDED_SRC_CASCLIENT_CLIENT_CLIENT_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/dispatch/dispatcher_config.hpp"
#include "src/casclient/tree/tree_flattener.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Settings of one TransferClient. Independent clients with different
/// settings may coexist in one process.
struct ClientConfig {
    /// Server-side namespace of all requests.
    std::string instance_name;
    HashFunction hash_function{};
    DispatcherConfig dispatcher;
    /// File the metadata cache is loaded from and saved to, if any.
    std::optional<std::filesystem::path> cache_file;
    std::size_t max_tree_depth{TreeFlattener::kDefaultMaxDepth};

    /// \brief Read a configuration object. All keys are optional:
    ///   "instance_name": string,
    ///   "hash_function": "sha1" | "sha256" | "sha512",
    ///   "concurrency_limit", "max_batch_size", "large_blob_threshold",
    ///   "chunk_size", "max_query_batch_digests", "max_total_retries",
    ///   "max_tree_depth": positive integers,
    ///   "assume_missing_on_presence_failure": bool,
    ///   "retry": {"initial_backoff_ms", "max_backoff_ms", "max_attempts",
    ///             "jitter"},
    ///   "rpc_timeouts": string of the form "Kind=duration,...,default=d",
    ///   "cache_file": string.
    [[nodiscard]] static auto FromJson(nlohmann::json const& json) noexcept
        -> expected<ClientConfig, std::string>;

    /// \brief Read a configuration file in the format of FromJson.
    [[nodiscard]] static auto FromFile(
        std::filesystem::path const& file) noexcept
        -> expected<ClientConfig, std::string>;
};

#endif  // INCLUDED_SRC_CASCLIENT_CLIENT_CLIENT_CONFIG_HPP
