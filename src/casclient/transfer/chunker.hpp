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

#ifndef INCLUDED_SRC_CASCLIENT_TRANSFER_CHUNKER_HPP
#define INCLUDED_SRC_CASCLIENT_TRANSFER_CHUNKER_HPP

#include <cstddef>
#include <string>
#include <utility>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/transfer/blob_source.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief One contiguous piece of a blob.
struct Chunk {
    std::size_t offset{};
    std::string data;

    [[nodiscard]] auto Length() const noexcept -> std::size_t {
        return data.size();
    }
    [[nodiscard]] auto End() const noexcept -> std::size_t {
        return offset + data.size();
    }
};

/// \brief Splits a blob into a restartable sequence of bounded chunks.
/// - Chunks have strictly increasing, contiguous offsets; the last chunk ends
///   exactly at the blob size.
/// - An empty blob yields exactly one empty chunk.
/// - A blob smaller than the inline threshold yields exactly one chunk with
///   the whole content.
/// The chunker owns its source and thereby any open file handle.
class Chunker final {
  public:
    /// \brief Create a chunker for the given source.
    /// \param chunk_size       Maximum chunk length, must be greater than 0.
    /// \param inline_threshold Blobs below this size are delivered in one
    ///                         chunk.
    [[nodiscard]] static auto ForSource(BlobSource source,
                                        std::size_t chunk_size,
                                        std::size_t inline_threshold = 0)
        noexcept -> expected<Chunker, CasError>;

    [[nodiscard]] auto HasNext() const noexcept -> bool { return not done_; }

    /// \brief Produce the next chunk. Fails with ChunkerExhausted after the
    /// last chunk was delivered.
    [[nodiscard]] auto Next() noexcept -> expected<Chunk, CasError>;

    /// \brief Restart from the beginning, re-opening the source.
    [[nodiscard]] auto Reset() noexcept -> expected<std::size_t, CasError>;

    /// \brief Continue from the given offset, e.g., the size the remote side
    /// already committed. Fails with SeekError for offsets beyond the blob or
    /// if the source cannot be re-opened.
    [[nodiscard]] auto Seek(std::size_t offset) noexcept
        -> expected<std::size_t, CasError>;

    [[nodiscard]] auto TotalSize() const noexcept -> std::size_t {
        return source_.Size();
    }

    [[nodiscard]] auto ChunkSize() const noexcept -> std::size_t {
        return chunk_size_;
    }

    /// \brief Offset of the next chunk.
    [[nodiscard]] auto Offset() const noexcept -> std::size_t {
        return offset_;
    }

  private:
    BlobSource source_;
    std::size_t chunk_size_;
    std::size_t offset_{0};
    bool done_{false};

    Chunker(BlobSource source, std::size_t chunk_size) noexcept
        : source_{std::move(source)}, chunk_size_{chunk_size} {}
};

#endif  // INCLUDED_SRC_CASCLIENT_TRANSFER_CHUNKER_HPP
