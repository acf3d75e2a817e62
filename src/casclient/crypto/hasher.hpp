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

#ifndef INCLUDED_SRC_CASCLIENT_CRYPTO_HASHER_HPP
#define INCLUDED_SRC_CASCLIENT_CRYPTO_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>  // std::move

#include "src/utils/cpp/hex_string.hpp"

/// \brief Incremental hasher backed by an OpenSSL message digest context.
class Hasher final {
  public:
    /// \brief Hash algorithms supported for content digests.
    enum class HashType : std::uint8_t { SHA1, SHA256, SHA512 };

    /// \brief Finalized hash value in raw bytes.
    class HashDigest final {
        friend Hasher;

      public:
        [[nodiscard]] auto Bytes() const& noexcept -> std::string const& {
            return bytes_;
        }

        [[nodiscard]] auto HexString() const -> std::string {
            return ToHexString(bytes_);
        }

        [[nodiscard]] auto Length() const noexcept -> std::size_t {
            return bytes_.size();
        }

      private:
        std::string bytes_;

        explicit HashDigest(std::string bytes) : bytes_{std::move(bytes)} {}
    };

    /// \brief Create and initialize a hasher.
    /// \return An initialized hasher or std::nullopt if the algorithm is not
    /// available in the linked OpenSSL.
    [[nodiscard]] static auto Create(HashType type) noexcept
        -> std::optional<Hasher>;

    Hasher(Hasher&& other) noexcept;
    auto operator=(Hasher&& other) noexcept -> Hasher&;
    Hasher(Hasher const& other) = delete;
    auto operator=(Hasher const& other) -> Hasher& = delete;
    ~Hasher() noexcept;

    /// \brief Feed data to the hasher.
    [[nodiscard]] auto Update(std::string_view data) noexcept -> bool;

    /// \brief Finalize hash. The hasher must not be used afterwards.
    [[nodiscard]] auto Finalize() && noexcept -> std::optional<HashDigest>;

    /// \brief Length of the hexadecimal representation of the hash.
    [[nodiscard]] static auto GetHexLength(HashType type) noexcept
        -> std::size_t;

  private:
    struct Context;
    std::unique_ptr<Context> ctx_;

    explicit Hasher(std::unique_ptr<Context> ctx) noexcept;
};

#endif  // INCLUDED_SRC_CASCLIENT_CRYPTO_HASHER_HPP
