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

#include "src/casclient/common/digest.hpp"

#include <charconv>
#include <system_error>

#include "fmt/core.h"
#include "src/utils/cpp/hex_string.hpp"

auto Digest::Parse(std::string_view str, HashFunction hash_function) noexcept
    -> expected<Digest, CasError> {
    auto const sep = str.find('/');
    if (sep == std::string_view::npos or sep + 1 == str.size()) {
        return MakeError(ErrorKind::MalformedDigest,
                         "expected \"<hash>/<size>\", got \"{}\"",
                         str);
    }
    auto const size_str = str.substr(sep + 1);
    std::size_t size{};
    auto const [end, ec] = std::from_chars(
        size_str.data(), size_str.data() + size_str.size(), size);
    if (ec != std::errc{} or end != size_str.data() + size_str.size()) {
        return MakeError(ErrorKind::MalformedDigest,
                         "invalid size \"{}\" in digest \"{}\"",
                         size_str,
                         str);
    }
    return Create(std::string{str.substr(0, sep)}, size, hash_function);
}

auto Digest::Create(std::string hash,
                    std::size_t size,
                    HashFunction hash_function) noexcept
    -> expected<Digest, CasError> {
    if (hash.size() != hash_function.HexLength() or not IsHexString(hash)) {
        return MakeError(ErrorKind::MalformedDigest,
                         "invalid {} hash \"{}\"",
                         HashFunction::ToString(hash_function.GetType()),
                         hash);
    }
    return Digest{std::move(hash), size};
}

auto Digest::FromContent(HashFunction hash_function,
                         std::string_view content) noexcept -> Digest {
    return Digest{hash_function.HashData(content).HexString(), content.size()};
}

auto Digest::FromFile(HashFunction hash_function,
                      std::filesystem::path const& path) noexcept
    -> expected<Digest, CasError> {
    auto hashed = hash_function.HashFile(path);
    if (not hashed) {
        return MakeError(ErrorKind::FileUnreadable, "{}", hashed.error());
    }
    return Digest{hashed->first.HexString(),
                  static_cast<std::size_t>(hashed->second)};
}

auto Digest::Empty(HashFunction hash_function) noexcept -> Digest {
    return FromContent(hash_function, std::string_view{});
}

auto Digest::ToString() const -> std::string {
    return fmt::format("{}/{}", hash_, size_);
}
