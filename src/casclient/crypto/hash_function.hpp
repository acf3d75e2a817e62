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

#ifndef INCLUDED_SRC_CASCLIENT_CRYPTO_HASH_FUNCTION_HPP
#define INCLUDED_SRC_CASCLIENT_CRYPTO_HASH_FUNCTION_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "src/casclient/crypto/hasher.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Hash function used for all digests of one client instance.
/// Passed and stored by value.
class HashFunction {
  public:
    using Type = Hasher::HashType;

    explicit HashFunction(Type type = Type::SHA256) noexcept : type_{type} {}

    [[nodiscard]] auto GetType() const noexcept -> Type { return type_; }

    /// \brief Number of hex characters of a hash produced by this function.
    [[nodiscard]] auto HexLength() const noexcept -> std::size_t {
        return Hasher::GetHexLength(type_);
    }

    /// \brief Hash in-memory data.
    [[nodiscard]] auto HashData(std::string_view data) const noexcept
        -> Hasher::HashDigest;

    /// \brief Hash a file by streaming its content.
    /// \returns The hash and the number of bytes hashed, or an error message.
    [[nodiscard]] auto HashFile(std::filesystem::path const& path)
        const noexcept
        -> expected<std::pair<Hasher::HashDigest, std::uintmax_t>, std::string>;

    /// \brief Obtain an incremental hasher of this function's type.
    [[nodiscard]] auto MakeHasher() const noexcept -> Hasher;

    /// \brief Lowercase name, as used in configuration files.
    [[nodiscard]] static auto ToString(Type type) noexcept -> std::string;

    [[nodiscard]] static auto FromString(std::string_view name) noexcept
        -> std::optional<HashFunction>;

    [[nodiscard]] auto operator==(HashFunction const&) const noexcept
        -> bool = default;

  private:
    Type type_;
};

#endif  // INCLUDED_SRC_CASCLIENT_CRYPTO_HASH_FUNCTION_HPP
