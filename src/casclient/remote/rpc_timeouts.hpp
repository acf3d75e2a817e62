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

#ifndef INCLUDED_SRC_CASCLIENT_REMOTE_RPC_TIMEOUTS_HPP
#define INCLUDED_SRC_CASCLIENT_REMOTE_RPC_TIMEOUTS_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "src/utils/cpp/expected.hpp"

/// \brief Remote procedures issued by the transfer engine.
enum class RpcKind : std::uint8_t {
    FindMissingBlobs,
    BatchUpdateBlobs,
    BatchReadBlobs,
    GetTree,
    Write,
    Read,
    QueryWriteStatus
};

inline constexpr std::array kAllRpcKinds{RpcKind::FindMissingBlobs,
                                         RpcKind::BatchUpdateBlobs,
                                         RpcKind::BatchReadBlobs,
                                         RpcKind::GetTree,
                                         RpcKind::Write,
                                         RpcKind::Read,
                                         RpcKind::QueryWriteStatus};

[[nodiscard]] auto ToString(RpcKind kind) -> std::string;

[[nodiscard]] auto ToRpcKind(std::string_view name) noexcept
    -> std::optional<RpcKind>;

/// \brief Per-RPC deadlines. A zero duration means no deadline. Every kind
/// has a value after building.
class RpcTimeouts final {
  public:
    class Builder;

    static constexpr std::chrono::milliseconds kDefaultTimeout{20'000};
    static constexpr std::chrono::milliseconds kBatchTimeout{60'000};

    /// \brief Built-in timeouts: the default for all kinds except batch
    /// transfers and GetTree.
    RpcTimeouts() noexcept;

    [[nodiscard]] auto Get(RpcKind kind) const noexcept
        -> std::chrono::milliseconds;

    [[nodiscard]] auto HasDeadline(RpcKind kind) const noexcept -> bool {
        return Get(kind).count() > 0;
    }

  private:
    std::array<std::chrono::milliseconds, kAllRpcKinds.size()> timeouts_{};
};

class RpcTimeouts::Builder final {
  public:
    /// \brief Fallback for kinds without an explicit timeout. Setting it
    /// replaces the built-in per-kind values.
    auto SetDefault(std::chrono::milliseconds timeout) noexcept -> Builder&;

    auto Set(RpcKind kind, std::chrono::milliseconds timeout) noexcept
        -> Builder&;

    /// \brief Parse overrides of the form "Kind=duration,...,default=d".
    /// Durations are non-negative integers with a unit suffix "ms", "s", "m",
    /// or "h"; a plain "0" disables the deadline. The string is validated by
    /// Build().
    auto SetFromString(std::string overrides) noexcept -> Builder&;

    [[nodiscard]] auto Build() const noexcept
        -> expected<RpcTimeouts, std::string>;

  private:
    std::optional<std::chrono::milliseconds> default_;
    std::map<RpcKind, std::chrono::milliseconds> timeouts_;
    std::optional<std::string> overrides_;
};

/// \brief Parse a single duration, e.g., "250ms", "20s", "5m", "1h", or "0".
[[nodiscard]] auto ParseDuration(std::string_view str) noexcept
    -> std::optional<std::chrono::milliseconds>;

#endif  // INCLUDED_SRC_CASCLIENT_REMOTE_RPC_TIMEOUTS_HPP
