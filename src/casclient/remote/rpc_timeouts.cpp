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

#include "src/casclient/remote/rpc_timeouts.hpp"

#include <charconv>
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

#include "fmt/core.h"
#include "gsl/gsl"

namespace {
[[nodiscard]] auto Index(RpcKind kind) noexcept -> std::size_t {
    return static_cast<std::size_t>(kind);
}

[[nodiscard]] auto Trim(std::string_view str) noexcept -> std::string_view {
    auto const first = str.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto const last = str.find_last_not_of(" \t");
    return str.substr(first, last - first + 1);
}

[[nodiscard]] auto Split(std::string_view str, char sep)
    -> std::vector<std::string_view> {
    std::vector<std::string_view> parts{};
    std::size_t start = 0;
    while (true) {
        auto const pos = str.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(str.substr(start));
            return parts;
        }
        parts.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }
}
}  // namespace

auto ToString(RpcKind kind) -> std::string {
    switch (kind) {
        case RpcKind::FindMissingBlobs:
            return "FindMissingBlobs";
        case RpcKind::BatchUpdateBlobs:
            return "BatchUpdateBlobs";
        case RpcKind::BatchReadBlobs:
            return "BatchReadBlobs";
        case RpcKind::GetTree:
            return "GetTree";
        case RpcKind::Write:
            return "Write";
        case RpcKind::Read:
            return "Read";
        case RpcKind::QueryWriteStatus:
            return "QueryWriteStatus";
    }
    Ensures(false);  // unreachable
}

auto ToRpcKind(std::string_view name) noexcept -> std::optional<RpcKind> {
    for (auto kind : kAllRpcKinds) {
        if (ToString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

auto ParseDuration(std::string_view str) noexcept
    -> std::optional<std::chrono::milliseconds> {
    std::int64_t value{};
    auto const* const begin = str.data();
    auto const* const end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} or ptr == begin or value < 0) {
        return std::nullopt;
    }
    auto const unit = std::string_view{ptr, static_cast<std::size_t>(end - ptr)};
    if (unit.empty()) {
        // only zero may omit the unit
        if (value == 0) {
            return std::chrono::milliseconds{0};
        }
        return std::nullopt;
    }
    if (unit == "ms") {
        return std::chrono::milliseconds{value};
    }
    if (unit == "s") {
        return std::chrono::seconds{value};
    }
    if (unit == "m") {
        return std::chrono::minutes{value};
    }
    if (unit == "h") {
        return std::chrono::hours{value};
    }
    return std::nullopt;
}

RpcTimeouts::RpcTimeouts() noexcept {
    timeouts_.fill(kDefaultTimeout);
    timeouts_.at(Index(RpcKind::BatchUpdateBlobs)) = kBatchTimeout;
    timeouts_.at(Index(RpcKind::BatchReadBlobs)) = kBatchTimeout;
    timeouts_.at(Index(RpcKind::GetTree)) = kBatchTimeout;
}

auto RpcTimeouts::Get(RpcKind kind) const noexcept
    -> std::chrono::milliseconds {
    return timeouts_.at(Index(kind));
}

auto RpcTimeouts::Builder::SetDefault(std::chrono::milliseconds timeout) noexcept
    -> Builder& {
    default_ = timeout;
    return *this;
}

auto RpcTimeouts::Builder::Set(RpcKind kind,
                               std::chrono::milliseconds timeout) noexcept
    -> Builder& {
    timeouts_.insert_or_assign(kind, timeout);
    return *this;
}

auto RpcTimeouts::Builder::SetFromString(std::string overrides) noexcept
    -> Builder& {
    overrides_ = std::move(overrides);
    return *this;
}

auto RpcTimeouts::Builder::Build() const noexcept
    -> expected<RpcTimeouts, std::string> {
    try {
        auto fallback = default_;
        auto explicit_timeouts = timeouts_;
        if (overrides_ and not Trim(*overrides_).empty()) {
            for (auto const entry : Split(*overrides_, ',')) {
                auto const pos = entry.find('=');
                if (pos == std::string_view::npos) {
                    return unexpected{fmt::format(
                        "Invalid timeout entry \"{}\", expected "
                        "Kind=duration.",
                        entry)};
                }
                auto const name = Trim(entry.substr(0, pos));
                auto const value = Trim(entry.substr(pos + 1));
                auto duration = ParseDuration(value);
                if (not duration) {
                    return unexpected{fmt::format(
                        "Invalid duration \"{}\" for {}.", value, name)};
                }
                if (name == "default") {
                    fallback = *duration;
                    continue;
                }
                auto kind = ToRpcKind(name);
                if (not kind) {
                    return unexpected{
                        fmt::format("Unknown RPC kind \"{}\".", name)};
                }
                // programmatic values take precedence over the string
                explicit_timeouts.try_emplace(*kind, *duration);
            }
        }
        for (auto const& [kind, timeout] : explicit_timeouts) {
            if (timeout.count() < 0) {
                return unexpected{fmt::format("Negative timeout {}ms for {}.",
                                              timeout.count(),
                                              ToString(kind))};
            }
        }
        if (fallback and fallback->count() < 0) {
            return unexpected{fmt::format("Negative default timeout {}ms.",
                                          fallback->count())};
        }

        RpcTimeouts result{};
        if (fallback) {
            result.timeouts_.fill(*fallback);
        }
        for (auto const& [kind, timeout] : explicit_timeouts) {
            result.timeouts_.at(Index(kind)) = timeout;
        }
        return result;
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("Building RPC timeouts failed:\n{}", e.what())};
    }
}
