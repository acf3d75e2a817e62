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

#include "src/casclient/remote/bytestream_utils.hpp"

#include <charconv>
#include <cstddef>
#include <exception>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "fmt/core.h"

namespace {
/// \brief Split a resource name at '/'.
[[nodiscard]] auto SplitRequest(std::string const& request)
    -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::string_view rest{request};
    while (true) {
        auto const pos = rest.find('/');
        if (pos == std::string_view::npos) {
            parts.emplace_back(rest);
            return parts;
        }
        parts.emplace_back(rest.substr(0, pos));
        rest.remove_prefix(pos + 1);
    }
}

[[nodiscard]] auto ParseSize(std::string_view str) noexcept
    -> std::optional<std::size_t> {
    std::size_t size{};
    auto const* const end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, size);
    if (ec != std::errc{} or ptr != end or str.empty()) {
        return std::nullopt;
    }
    return size;
}

/// \brief Join the instance name (if any) with the remaining components.
[[nodiscard]] auto WithInstance(std::string const& instance_name,
                                std::string const& rest) -> std::string {
    return instance_name.empty() ? rest
                                 : fmt::format("{}/{}", instance_name, rest);
}

/// \brief Index of the first component equal to marker. The components
/// before it form the instance name.
[[nodiscard]] auto FindMarker(std::vector<std::string_view> const& parts,
                                 std::string_view marker) noexcept
    -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i] == marker) {
            return i;
        }
    }
    return std::nullopt;
}

[[nodiscard]] auto JoinParts(std::vector<std::string_view> const& parts,
                             std::size_t count) -> std::string {
    std::string result{};
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) {
            result += '/';
        }
        result += parts[i];
    }
    return result;
}
}  // namespace

ByteStreamUtils::ReadRequest::ReadRequest(std::string instance_name,
                                          Digest const& digest) noexcept
    : instance_name_{std::move(instance_name)},
      hash_{digest.hash()},
      size_{digest.size()} {}

auto ByteStreamUtils::ReadRequest::ToString() const -> std::string {
    return WithInstance(instance_name_,
                        fmt::format("{}/{}/{}", kBlobs, hash_, size_));
}

auto ByteStreamUtils::ReadRequest::FromString(
    std::string const& request) noexcept -> std::optional<ReadRequest> {
    static constexpr std::size_t kTrailingParts = 3U;  // blobs/hash/size
    try {
        auto const parts = SplitRequest(request);
        auto const blobs = FindMarker(parts, kBlobs);
        if (not blobs or parts.size() != *blobs + kTrailingParts) {
            return std::nullopt;
        }
        auto size = ParseSize(parts[*blobs + 2]);
        if (not size) {
            return std::nullopt;
        }
        ReadRequest result;
        result.instance_name_ = JoinParts(parts, *blobs);
        result.hash_ = std::string{parts[*blobs + 1]};
        result.size_ = *size;
        return result;
    } catch (std::exception const&) {
        return std::nullopt;
    }
}

auto ByteStreamUtils::ReadRequest::GetDigest(HashFunction hash_function)
    const noexcept -> expected<Digest, CasError> {
    return Digest::Create(hash_, size_, hash_function);
}

ByteStreamUtils::WriteRequest::WriteRequest(std::string instance_name,
                                            std::string uuid,
                                            Digest const& digest) noexcept
    : instance_name_{std::move(instance_name)},
      uuid_{std::move(uuid)},
      hash_{digest.hash()},
      size_{digest.size()} {}

auto ByteStreamUtils::WriteRequest::ToString() const -> std::string {
    return WithInstance(
        instance_name_,
        fmt::format("{}/{}/{}/{}/{}", kUploads, uuid_, kBlobs, hash_, size_));
}

auto ByteStreamUtils::WriteRequest::FromString(
    std::string const& request) noexcept -> std::optional<WriteRequest> {
    // uploads/uuid/blobs/hash/size
    static constexpr std::size_t kTrailingParts = 5U;
    try {
        auto const parts = SplitRequest(request);
        auto const uploads = FindMarker(parts, kUploads);
        if (not uploads or parts.size() != *uploads + kTrailingParts or
            parts[*uploads + 2] != kBlobs) {
            return std::nullopt;
        }
        auto size = ParseSize(parts[*uploads + 4]);
        if (not size) {
            return std::nullopt;
        }
        WriteRequest result;
        result.instance_name_ = JoinParts(parts, *uploads);
        result.uuid_ = std::string{parts[*uploads + 1]};
        result.hash_ = std::string{parts[*uploads + 3]};
        result.size_ = *size;
        return result;
    } catch (std::exception const&) {
        return std::nullopt;
    }
}

auto ByteStreamUtils::WriteRequest::GetDigest(HashFunction hash_function)
    const noexcept -> expected<Digest, CasError> {
    return Digest::Create(hash_, size_, hash_function);
}
