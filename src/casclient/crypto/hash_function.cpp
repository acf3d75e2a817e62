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

#include "src/casclient/crypto/hash_function.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/logger.hpp"

namespace {
inline constexpr std::size_t kFileReadChunk = 64UL * 1024;

void CloseFile(gsl::owner<std::FILE*> file) noexcept {
    if (file != nullptr) {
        std::fclose(file);
    }
}
}  // namespace

auto HashFunction::MakeHasher() const noexcept -> Hasher {
    auto hasher = Hasher::Create(type_);
    if (not hasher) {
        Logger::Log(LogLevel::Error,
                    "HashFunction: no hasher available for {}",
                    ToString(type_));
        Ensures(false);
    }
    return *std::move(hasher);
}

auto HashFunction::HashData(std::string_view data) const noexcept
    -> Hasher::HashDigest {
    auto hasher = MakeHasher();
    auto updated = hasher.Update(data);
    auto digest = std::move(hasher).Finalize();
    Ensures(updated and digest.has_value());
    return *std::move(digest);
}

auto HashFunction::HashFile(std::filesystem::path const& path) const noexcept
    -> expected<std::pair<Hasher::HashDigest, std::uintmax_t>, std::string> {
    try {
        auto file = std::unique_ptr<std::FILE, decltype(&CloseFile)>{
            std::fopen(path.c_str(), "rb"), CloseFile};
        if (file == nullptr) {
            return unexpected{fmt::format("cannot open {}: {}",
                                          path.string(),
                                          std::strerror(errno))};
        }
        auto hasher = MakeHasher();
        std::string buffer(kFileReadChunk, '\0');
        std::uintmax_t total = 0;
        while (true) {
            auto const read =
                std::fread(buffer.data(), 1, buffer.size(), file.get());
            if (read > 0) {
                if (not hasher.Update(std::string_view{buffer.data(), read})) {
                    return unexpected{fmt::format(
                        "hash update failed for {}", path.string())};
                }
                total += read;
            }
            if (read < buffer.size()) {
                break;
            }
        }
        if (std::ferror(file.get()) != 0) {
            return unexpected{
                fmt::format("read error while hashing {}", path.string())};
        }
        auto digest = std::move(hasher).Finalize();
        if (not digest) {
            return unexpected{
                fmt::format("finalizing hash of {} failed", path.string())};
        }
        return std::make_pair(*std::move(digest), total);
    } catch (std::exception const& e) {
        return unexpected{fmt::format(
            "hashing {} failed with:\n{}", path.string(), e.what())};
    }
}

auto HashFunction::ToString(Type type) noexcept -> std::string {
    switch (type) {
        case Type::SHA1:
            return "sha1";
        case Type::SHA256:
            return "sha256";
        case Type::SHA512:
            return "sha512";
    }
    Ensures(false);  // unreachable
}

auto HashFunction::FromString(std::string_view name) noexcept
    -> std::optional<HashFunction> {
    for (auto type : {Type::SHA1, Type::SHA256, Type::SHA512}) {
        if (name == ToString(type)) {
            return HashFunction{type};
        }
    }
    return std::nullopt;
}
