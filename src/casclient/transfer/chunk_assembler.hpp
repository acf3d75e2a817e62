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

#ifndef INCLUDED_SRC_CASCLIENT_TRANSFER_CHUNK_ASSEMBLER_HPP
#define INCLUDED_SRC_CASCLIENT_TRANSFER_CHUNK_ASSEMBLER_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/crypto/hasher.hpp"
#include "src/utils/cpp/expected.hpp"

struct Chunk;

/// \brief Reassembles a blob from chunks delivered in offset order and writes
/// it to memory or to a file. The content is hashed while it is appended, so
/// that Finish() reports the digest of exactly what was written.
class ChunkAssembler final {
  public:
    [[nodiscard]] static auto ToMemory(HashFunction hash_function,
                                       std::size_t total_size) noexcept
        -> ChunkAssembler;

    /// \brief Write to the given file, creating parent directories. A partial
    /// file is removed if the assembler is destroyed before Finish()
    /// succeeded. Fails with LocalIoError if the file cannot be created.
    [[nodiscard]] static auto ToFile(HashFunction hash_function,
                                     std::filesystem::path const& path,
                                     std::size_t total_size,
                                     bool executable = false) noexcept
        -> expected<ChunkAssembler, CasError>;

    ChunkAssembler(ChunkAssembler&&) noexcept;
    auto operator=(ChunkAssembler&&) noexcept -> ChunkAssembler&;
    ChunkAssembler(ChunkAssembler const&) = delete;
    auto operator=(ChunkAssembler const&) -> ChunkAssembler& = delete;
    ~ChunkAssembler() noexcept;

    /// \brief Append the next chunk. The chunk must start exactly at the
    /// current offset, otherwise OutOfOrderChunk is reported. Chunks reaching
    /// beyond the declared total size are rejected as well.
    /// \returns The new offset.
    [[nodiscard]] auto Append(Chunk const& chunk) noexcept
        -> expected<std::size_t, CasError>;

    /// \brief Drop all content appended so far, e.g., before a full retry.
    [[nodiscard]] auto Reset() noexcept -> expected<std::size_t, CasError>;

    /// \brief Complete the blob. Fails with IncompleteBlob if fewer bytes
    /// than declared were appended.
    /// \returns The digest of the assembled content.
    [[nodiscard]] auto Finish() noexcept -> expected<Digest, CasError>;

    /// \brief Take the assembled content of a memory sink.
    [[nodiscard]] auto TakeContent() && noexcept -> std::optional<std::string>;

    [[nodiscard]] auto Offset() const noexcept -> std::size_t {
        return offset_;
    }

    [[nodiscard]] auto TotalSize() const noexcept -> std::size_t {
        return total_size_;
    }

  private:
    struct FileSink;

    HashFunction hash_function_;
    std::size_t total_size_;
    std::size_t offset_{0};
    Hasher hasher_;
    std::optional<std::string> memory_;
    std::unique_ptr<FileSink> file_;

    ChunkAssembler(HashFunction hash_function,
                   std::size_t total_size,
                   std::optional<std::string> memory,
                   std::unique_ptr<FileSink> file) noexcept;
};

#endif  // INCLUDED_SRC_CASCLIENT_TRANSFER_CHUNK_ASSEMBLER_HPP
