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

#include "src/casclient/transfer/chunker.hpp"

#include <algorithm>

auto Chunker::ForSource(BlobSource source,
                        std::size_t chunk_size,
                        std::size_t inline_threshold) noexcept
    -> expected<Chunker, CasError> {
    if (chunk_size == 0) {
        return MakeError(ErrorKind::InvalidConfig,
                         "chunk size must be greater than 0");
    }
    if (source.Size() < inline_threshold) {
        chunk_size = std::max(chunk_size, source.Size());
    }
    return Chunker{std::move(source), chunk_size};
}

auto Chunker::Next() noexcept -> expected<Chunk, CasError> {
    if (done_) {
        return MakeError(ErrorKind::ChunkerExhausted,
                         "all {} bytes were already delivered",
                         TotalSize());
    }
    auto const length = std::min(chunk_size_, TotalSize() - offset_);
    auto data = source_.ReadAt(offset_, length);
    if (not data) {
        return unexpected{std::move(data).error()};
    }
    Chunk chunk{.offset = offset_, .data = *std::move(data)};
    offset_ += chunk.Length();
    done_ = offset_ >= TotalSize();
    return chunk;
}

auto Chunker::Reset() noexcept -> expected<std::size_t, CasError> {
    return Seek(0);
}

auto Chunker::Seek(std::size_t offset) noexcept
    -> expected<std::size_t, CasError> {
    if (offset > TotalSize()) {
        return MakeError(ErrorKind::SeekError,
                         "cannot seek to {} in a blob of {} bytes",
                         offset,
                         TotalSize());
    }
    if (auto reopened = source_.Reopen(); not reopened) {
        return reopened;
    }
    offset_ = offset;
    // an empty blob still has its one empty chunk to deliver
    done_ = offset == TotalSize() and TotalSize() > 0;
    return offset_;
}
