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

#ifndef INCLUDED_SRC_CASCLIENT_COMMON_DIGEST_HPP
#define INCLUDED_SRC_CASCLIENT_COMMON_DIGEST_HPP

#include <compare>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Content identifier: lowercase hex hash of the content and its size.
/// Digests are ordered by hash, then by size.
class Digest final {
  public:
    Digest() noexcept = default;

    /// \brief Parse the canonical form "<hash>/<size>".
    /// Fails with MalformedDigest if the hash is not a hex string of the
    /// length produced by hash_function or the size is not a decimal number.
    [[nodiscard]] static auto Parse(
        std::string_view str,
        HashFunction hash_function = HashFunction{}) noexcept
        -> expected<Digest, CasError>;

    /// \brief Validate a hash/size pair, e.g., as received from the wire.
    [[nodiscard]] static auto Create(
        std::string hash,
        std::size_t size,
        HashFunction hash_function = HashFunction{}) noexcept
        -> expected<Digest, CasError>;

    [[nodiscard]] static auto FromContent(HashFunction hash_function,
                                          std::string_view content) noexcept
        -> Digest;

    /// \brief Hash a local file. Fails with FileUnreadable on any I/O error.
    [[nodiscard]] static auto FromFile(
        HashFunction hash_function,
        std::filesystem::path const& path) noexcept
        -> expected<Digest, CasError>;

    /// \brief Digest of the empty blob.
    [[nodiscard]] static auto Empty(HashFunction hash_function) noexcept
        -> Digest;

    [[nodiscard]] auto hash() const& noexcept -> std::string const& {
        return hash_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

    /// \brief Zero-size digests denote the empty blob, which every CAS is
    /// assumed to hold.
    [[nodiscard]] auto IsEmpty() const noexcept -> bool { return size_ == 0; }

    [[nodiscard]] auto ToString() const -> std::string;

    [[nodiscard]] auto operator==(Digest const& other) const noexcept
        -> bool = default;
    [[nodiscard]] auto operator<=>(Digest const& other) const noexcept
        -> std::strong_ordering = default;

  private:
    std::string hash_;
    std::size_t size_{};

    Digest(std::string hash, std::size_t size) noexcept
        : hash_{std::move(hash)}, size_{size} {}
};

namespace std {
template <>
struct hash<Digest> {
    [[nodiscard]] auto operator()(Digest const& digest) const noexcept
        -> std::size_t {
        // the hash already identifies the content
        return std::hash<std::string>{}(digest.hash());
    }
};
}  // namespace std

#endif  // INCLUDED_SRC_CASCLIENT_COMMON_DIGEST_HPP
