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

#ifndef INCLUDED_SRC_CASCLIENT_CACHE_FILE_METADATA_CACHE_HPP
#define INCLUDED_SRC_CASCLIENT_CACHE_FILE_METADATA_CACHE_HPP

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/file_system/file_system_manager.hpp"
#include "src/casclient/logging/logger.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Validity signature of a cached entry: (size, mtime, mode).
using Validator = FileSignature;

/// \brief Maps local file paths to their digests. An entry is only trusted
/// while the file's current signature equals the stored validator.
///
/// Thread-safe. The internal lock is never held during file system access.
/// Concurrent misses for the same path may compute the digest more than once;
/// the entry written last is kept.
class FileMetadataCache final {
  public:
    struct Entry {
        Digest digest;
        Validator validator;
    };

    explicit FileMetadataCache(HashFunction hash_function = HashFunction{})
        : hash_function_{hash_function} {}

    [[nodiscard]] auto GetHashFunction() const noexcept -> HashFunction {
        return hash_function_;
    }

    /// \brief Look up the digest of a path, validated against the current
    /// state of the file.
    [[nodiscard]] auto Get(std::filesystem::path const& path) const noexcept
        -> std::optional<Digest>;

    /// \brief Executable bit recorded in the validator of a valid entry.
    [[nodiscard]] auto IsExecutable(std::filesystem::path const& path) const
        noexcept -> std::optional<bool>;

    /// \brief Unconditionally store an entry.
    void Put(std::filesystem::path const& path,
             Digest const& digest,
             Validator const& validator) noexcept;

    /// \brief Return the cached digest or compute, store, and return it.
    /// Fails with FileUnreadable if the file vanishes, is not a regular file,
    /// cannot be read, or changes while being hashed.
    [[nodiscard]] auto ComputeOrGet(std::filesystem::path const& path) noexcept
        -> expected<Digest, CasError>;

    /// \brief Remove the entry of a path.
    /// \returns true if an entry existed.
    auto Evict(std::filesystem::path const& path) noexcept -> bool;

    void Clear() noexcept;

    [[nodiscard]] auto Size() const noexcept -> std::size_t;

    [[nodiscard]] auto Hits() const noexcept -> std::size_t { return hits_; }
    [[nodiscard]] auto Misses() const noexcept -> std::size_t {
        return misses_;
    }
    /// \brief Number of files hashed by ComputeOrGet.
    [[nodiscard]] auto Computations() const noexcept -> std::size_t {
        return computations_;
    }

    /// \brief Persist all entries as JSON.
    /// \returns The number of entries written.
    [[nodiscard]] auto Save(std::filesystem::path const& file) const noexcept
        -> expected<std::size_t, CasError>;

    /// \brief Merge persisted entries into the cache. Loaded entries are
    /// validated on every lookup like any other entry. Malformed entries are
    /// skipped.
    /// \returns The number of entries loaded.
    [[nodiscard]] auto Load(std::filesystem::path const& file) noexcept
        -> expected<std::size_t, CasError>;

  private:
    HashFunction hash_function_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::atomic<std::size_t> hits_{0};
    mutable std::atomic<std::size_t> misses_{0};
    std::atomic<std::size_t> computations_{0};
    Logger logger_{"FileMetadataCache"};

    [[nodiscard]] static auto Key(std::filesystem::path const& path) noexcept
        -> std::optional<std::string>;

    [[nodiscard]] auto Lookup(std::string const& key,
                              Validator const& current) const noexcept
        -> std::optional<Digest>;
};

#endif  // INCLUDED_SRC_CASCLIENT_CACHE_FILE_METADATA_CACHE_HPP
