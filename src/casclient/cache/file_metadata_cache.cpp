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

#include "src/casclient/cache/file_metadata_cache.hpp"

#include <cstdint>
#include <exception>
#include <mutex>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/casclient/logging/log_level.hpp"
#include "src/utils/cpp/json.hpp"

namespace {
inline constexpr int kFormatVersion = 1;

[[nodiscard]] auto ValidatorToJson(Validator const& v) -> nlohmann::json {
    return nlohmann::json{
        {"size", v.size}, {"mtime_ns", v.mtime_ns}, {"mode", v.mode}};
}

[[nodiscard]] auto ValidatorFromJson(nlohmann::json const& j) noexcept
    -> expected<Validator, std::string> {
    auto size = ExtractValueAs<std::uintmax_t>(j, "size");
    if (not size) {
        return unexpected{size.error()};
    }
    auto mtime = ExtractValueAs<std::int64_t>(j, "mtime_ns");
    if (not mtime) {
        return unexpected{mtime.error()};
    }
    auto mode = ExtractValueAs<std::uint32_t>(j, "mode");
    if (not mode) {
        return unexpected{mode.error()};
    }
    return Validator{.size = *size, .mtime_ns = *mtime, .mode = *mode};
}
}  // namespace

auto FileMetadataCache::Key(std::filesystem::path const& path) noexcept
    -> std::optional<std::string> {
    auto abs = FileSystemManager::MakeAbsolute(path);
    if (not abs) {
        return std::nullopt;
    }
    return abs->string();
}

auto FileMetadataCache::Lookup(std::string const& key,
                               Validator const& current) const noexcept
    -> std::optional<Digest> {
    {
        std::shared_lock lock{mutex_};
        auto it = entries_.find(key);
        if (it != entries_.end() and it->second.validator == current) {
            ++hits_;
            return it->second.digest;
        }
    }
    ++misses_;
    return std::nullopt;
}

auto FileMetadataCache::Get(std::filesystem::path const& path) const noexcept
    -> std::optional<Digest> {
    auto key = Key(path);
    auto current = FileSystemManager::Signature(path);
    if (not key or not current) {
        ++misses_;
        return std::nullopt;
    }
    return Lookup(*key, *current);
}

auto FileMetadataCache::IsExecutable(std::filesystem::path const& path) const
    noexcept -> std::optional<bool> {
    auto key = Key(path);
    auto current = FileSystemManager::Signature(path);
    if (not key or not current) {
        return std::nullopt;
    }
    std::shared_lock lock{mutex_};
    auto it = entries_.find(*key);
    if (it == entries_.end() or it->second.validator != *current) {
        return std::nullopt;
    }
    return it->second.validator.IsExecutable();
}

void FileMetadataCache::Put(std::filesystem::path const& path,
                            Digest const& digest,
                            Validator const& validator) noexcept {
    auto key = Key(path);
    if (not key) {
        return;
    }
    try {
        std::unique_lock lock{mutex_};
        entries_.insert_or_assign(
            *std::move(key), Entry{.digest = digest, .validator = validator});
    } catch (std::exception const& e) {
        logger_.Emit(LogLevel::Warning,
                     "storing entry for {} failed:\n{}",
                     path.string(),
                     e.what());
    }
}

auto FileMetadataCache::ComputeOrGet(std::filesystem::path const& path) noexcept
    -> expected<Digest, CasError> {
    auto key = Key(path);
    if (not key) {
        return MakeError(
            ErrorKind::FileUnreadable, "invalid path {}", path.string());
    }
    auto before = FileSystemManager::Signature(*key);
    if (not before) {
        return MakeError(ErrorKind::FileUnreadable,
                         "{} does not exist or is inaccessible",
                         *key);
    }
    if (auto cached = Lookup(*key, *before)) {
        return *std::move(cached);
    }
    if (not S_ISREG(before->mode)) {
        return MakeError(
            ErrorKind::FileUnreadable, "{} is not a regular file", *key);
    }

    ++computations_;
    auto digest = Digest::FromFile(hash_function_, *key);
    if (not digest) {
        return digest;
    }
    auto after = FileSystemManager::Signature(*key);
    if (not after or *after != *before or digest->size() != before->size) {
        return MakeError(ErrorKind::FileUnreadable,
                         "{} changed while it was hashed",
                         *key);
    }
    logger_.Emit(LogLevel::Trace, "computed {} for {}", digest->ToString(), *key);
    Put(*key, *digest, *after);
    return digest;
}

auto FileMetadataCache::Evict(std::filesystem::path const& path) noexcept
    -> bool {
    auto key = Key(path);
    if (not key) {
        return false;
    }
    std::unique_lock lock{mutex_};
    return entries_.erase(*key) > 0;
}

void FileMetadataCache::Clear() noexcept {
    std::unique_lock lock{mutex_};
    entries_.clear();
}

auto FileMetadataCache::Size() const noexcept -> std::size_t {
    std::shared_lock lock{mutex_};
    return entries_.size();
}

auto FileMetadataCache::Save(std::filesystem::path const& file) const noexcept
    -> expected<std::size_t, CasError> {
    try {
        auto entries = nlohmann::json::object();
        {
            std::shared_lock lock{mutex_};
            for (auto const& [path, entry] : entries_) {
                entries[path] = nlohmann::json{
                    {"digest", entry.digest.ToString()},
                    {"validator", ValidatorToJson(entry.validator)}};
            }
        }
        auto const count = entries.size();
        nlohmann::json const content{
            {"version", kFormatVersion},
            {"hash_function",
             HashFunction::ToString(hash_function_.GetType())},
            {"entries", std::move(entries)}};
        if (not FileSystemManager::WriteFile(content.dump(), file)) {
            return MakeError(ErrorKind::LocalIoError,
                             "cannot write cache file {}",
                             file.string());
        }
        logger_.Emit(LogLevel::Debug,
                     "saved {} entries to {}",
                     count,
                     file.string());
        return count;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::LocalIoError,
                         "serializing cache to {} failed:\n{}",
                         file.string(),
                         e.what());
    }
}

auto FileMetadataCache::Load(std::filesystem::path const& file) noexcept
    -> expected<std::size_t, CasError> {
    auto content = FileSystemManager::ReadFile(file);
    if (not content) {
        return MakeError(ErrorKind::FileUnreadable,
                         "cannot read cache file {}",
                         file.string());
    }
    nlohmann::json json{};
    try {
        json = nlohmann::json::parse(*content);
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::InvalidConfig,
                         "cache file {} is not valid JSON:\n{}",
                         file.string(),
                         e.what());
    }
    auto version = ExtractValueAs<int>(json, "version");
    if (not version or *version != kFormatVersion) {
        return MakeError(ErrorKind::InvalidConfig,
                         "cache file {} has an unsupported format",
                         file.string());
    }
    auto hash_name = ExtractValueAs<std::string>(json, "hash_function");
    if (not hash_name or
        *hash_name != HashFunction::ToString(hash_function_.GetType())) {
        return MakeError(ErrorKind::InvalidConfig,
                         "cache file {} was written for a different hash "
                         "function",
                         file.string());
    }
    auto entries = ExtractValueAs<nlohmann::json>(json, "entries");
    if (not entries or not entries->is_object()) {
        return MakeError(ErrorKind::InvalidConfig,
                         "cache file {} has no entries object",
                         file.string());
    }

    std::vector<std::pair<std::string, Entry>> loaded{};
    try {
        for (auto const& [path, value] : entries->items()) {
            auto digest_str = ExtractValueAs<std::string>(value, "digest");
            auto validator_json =
                ExtractValueAs<nlohmann::json>(value, "validator");
            if (not digest_str or not validator_json) {
                logger_.Emit(LogLevel::Warning,
                             "skipping incomplete cache entry for {}",
                             path);
                continue;
            }
            auto digest = Digest::Parse(*digest_str, hash_function_);
            auto validator = ValidatorFromJson(*validator_json);
            if (not digest or not validator) {
                logger_.Emit(LogLevel::Warning,
                             "skipping malformed cache entry for {}",
                             path);
                continue;
            }
            loaded.emplace_back(
                path, Entry{.digest = *digest, .validator = *validator});
        }
        std::unique_lock lock{mutex_};
        for (auto& [path, entry] : loaded) {
            entries_.insert_or_assign(path, std::move(entry));
        }
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::InvalidConfig,
                         "loading cache file {} failed:\n{}",
                         file.string(),
                         e.what());
    }
    logger_.Emit(
        LogLevel::Debug, "loaded {} entries from {}", loaded.size(), file.string());
    return loaded.size();
}
