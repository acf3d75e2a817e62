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

#include "src/casclient/crypto/hasher.hpp"

#include <array>

#include "gsl/gsl"
#include "openssl/evp.h"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/logger.hpp"

namespace {
inline constexpr int kOpenSslTrue = 1;
inline constexpr std::size_t kSha1Length = 20;
inline constexpr std::size_t kSha256Length = 32;
inline constexpr std::size_t kSha512Length = 64;

[[nodiscard]] auto GetMessageDigest(Hasher::HashType type) noexcept
    -> EVP_MD const* {
    switch (type) {
        case Hasher::HashType::SHA1:
            return EVP_sha1();
        case Hasher::HashType::SHA256:
            return EVP_sha256();
        case Hasher::HashType::SHA512:
            return EVP_sha512();
    }
    return nullptr;  // make gcc happy
}
}  // namespace

// Owns the EVP context; EVP_MD_CTX is opaque and cannot be forward declared in
// the header.
struct Hasher::Context final {
    gsl::owner<EVP_MD_CTX*> md_ctx{EVP_MD_CTX_new()};

    Context() = default;
    Context(Context const&) = delete;
    Context(Context&&) = delete;
    auto operator=(Context const&) -> Context& = delete;
    auto operator=(Context&&) -> Context& = delete;
    ~Context() noexcept { EVP_MD_CTX_free(md_ctx); }
};

Hasher::Hasher(std::unique_ptr<Context> ctx) noexcept : ctx_{std::move(ctx)} {}

// Defaulted out of line, so that std::unique_ptr sees the complete Context.
Hasher::Hasher(Hasher&& other) noexcept = default;
auto Hasher::operator=(Hasher&& other) noexcept -> Hasher& = default;
Hasher::~Hasher() noexcept = default;

auto Hasher::Create(HashType type) noexcept -> std::optional<Hasher> {
    try {
        auto ctx = std::make_unique<Context>();
        auto const* md = GetMessageDigest(type);
        if (ctx->md_ctx == nullptr or md == nullptr or
            EVP_DigestInit_ex(ctx->md_ctx, md, nullptr) != kOpenSslTrue) {
            Logger::Log(LogLevel::Error, "Hasher: failed to initialize.");
            return std::nullopt;
        }
        return Hasher{std::move(ctx)};
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error, "Hasher: creation failed:\n{}", e.what());
        return std::nullopt;
    }
}

auto Hasher::Update(std::string_view data) noexcept -> bool {
    if (ctx_ == nullptr) {
        return false;
    }
    return EVP_DigestUpdate(ctx_->md_ctx, data.data(), data.size()) ==
           kOpenSslTrue;
}

auto Hasher::Finalize() && noexcept -> std::optional<HashDigest> {
    if (ctx_ == nullptr) {
        return std::nullopt;
    }
    auto out = std::array<unsigned char, EVP_MAX_MD_SIZE>{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_->md_ctx, out.data(), &length) !=
        kOpenSslTrue) {
        return std::nullopt;
    }
    ctx_.reset();
    try {
        return HashDigest{std::string(out.begin(), out.begin() + length)};
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error, "Hasher: finalizing failed:\n{}", e.what());
        return std::nullopt;
    }
}

auto Hasher::GetHexLength(HashType type) noexcept -> std::size_t {
    switch (type) {
        case HashType::SHA1:
            return 2 * kSha1Length;
        case HashType::SHA256:
            return 2 * kSha256Length;
        case HashType::SHA512:
            return 2 * kSha512Length;
    }
    Ensures(false);  // unreachable
}
