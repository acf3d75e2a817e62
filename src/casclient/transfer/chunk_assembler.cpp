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

#include "src/casclient/transfer/chunk_assembler.hpp"

#include <cstdio>
#include <exception>
#include <utility>

#include "gsl/gsl"
#include "src/casclient/file_system/file_system_manager.hpp"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/logger.hpp"
#include "src/casclient/transfer/chunker.hpp"

// Owns the open output file. Unless committed, the partial file is removed on
// destruction.
struct ChunkAssembler::FileSink final {
    std::filesystem::path path;
    bool executable{false};
    gsl::owner<std::FILE*> handle{nullptr};
    bool committed{false};

    FileSink(std::filesystem::path p, bool exec) noexcept
        : path{std::move(p)}, executable{exec} {}
    FileSink(FileSink const&) = delete;
    FileSink(FileSink&&) = delete;
    auto operator=(FileSink const&) -> FileSink& = delete;
    auto operator=(FileSink&&) -> FileSink& = delete;

    ~FileSink() noexcept {
        Close();
        if (not committed and not FileSystemManager::RemoveFile(path)) {
            Logger::Log(LogLevel::Warning,
                        "could not remove partial file {}",
                        path.string());
        }
    }

    [[nodiscard]] auto Open() noexcept -> bool {
        Close();
        handle = std::fopen(path.c_str(), "wb");
        return handle != nullptr;
    }

    [[nodiscard]] auto Close() noexcept -> bool {
        if (handle == nullptr) {
            return true;
        }
        auto const ok = std::fclose(handle) == 0;
        handle = nullptr;
        return ok;
    }
};

ChunkAssembler::ChunkAssembler(HashFunction hash_function,
                               std::size_t total_size,
                               std::optional<std::string> memory,
                               std::unique_ptr<FileSink> file) noexcept
    : hash_function_{hash_function},
      total_size_{total_size},
      hasher_{hash_function.MakeHasher()},
      memory_{std::move(memory)},
      file_{std::move(file)} {}

ChunkAssembler::ChunkAssembler(ChunkAssembler&&) noexcept = default;
auto ChunkAssembler::operator=(ChunkAssembler&&) noexcept
    -> ChunkAssembler& = default;
ChunkAssembler::~ChunkAssembler() noexcept = default;

auto ChunkAssembler::ToMemory(HashFunction hash_function,
                              std::size_t total_size) noexcept
    -> ChunkAssembler {
    return ChunkAssembler{
        hash_function, total_size, std::string{}, /*file=*/nullptr};
}

auto ChunkAssembler::ToFile(HashFunction hash_function,
                            std::filesystem::path const& path,
                            std::size_t total_size,
                            bool executable) noexcept
    -> expected<ChunkAssembler, CasError> {
    if (not FileSystemManager::CreateDirectory(path.parent_path()) or
        not FileSystemManager::RemoveFile(path)) {
        return MakeError(
            ErrorKind::LocalIoError, "cannot prepare output {}", path.string());
    }
    try {
        auto sink = std::make_unique<FileSink>(path, executable);
        if (not sink->Open()) {
            return MakeError(ErrorKind::LocalIoError,
                             "cannot open {} for writing",
                             path.string());
        }
        return ChunkAssembler{
            hash_function, total_size, std::nullopt, std::move(sink)};
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::LocalIoError,
                         "cannot create sink for {}:\n{}",
                         path.string(),
                         e.what());
    }
}

auto ChunkAssembler::Append(Chunk const& chunk) noexcept
    -> expected<std::size_t, CasError> {
    if (chunk.offset != offset_) {
        return MakeError(ErrorKind::OutOfOrderChunk,
                         "expected chunk at offset {}, got offset {}",
                         offset_,
                         chunk.offset);
    }
    if (chunk.End() > total_size_) {
        return MakeError(ErrorKind::OutOfOrderChunk,
                         "chunk [{}, {}) exceeds the declared size {}",
                         chunk.offset,
                         chunk.End(),
                         total_size_);
    }
    if (file_ != nullptr) {
        if (file_->handle == nullptr or
            std::fwrite(chunk.data.data(),
                        sizeof(char),
                        chunk.data.size(),
                        file_->handle) != chunk.data.size()) {
            return MakeError(ErrorKind::LocalIoError,
                             "writing to {} failed",
                             file_->path.string());
        }
    }
    else {
        try {
            memory_->append(chunk.data);
        } catch (std::exception const& e) {
            return MakeError(
                ErrorKind::LocalIoError, "buffering chunk failed:\n{}", e.what());
        }
    }
    if (not hasher_.Update(chunk.data)) {
        return MakeError(ErrorKind::Internal, "hashing chunk failed");
    }
    offset_ = chunk.End();
    return offset_;
}

auto ChunkAssembler::Reset() noexcept -> expected<std::size_t, CasError> {
    if (file_ != nullptr) {
        if (file_->committed or not file_->Open()) {
            return MakeError(ErrorKind::LocalIoError,
                             "cannot reset output {}",
                             file_->path.string());
        }
    }
    else {
        memory_->clear();
    }
    hasher_ = hash_function_.MakeHasher();
    offset_ = 0;
    return offset_;
}

auto ChunkAssembler::Finish() noexcept -> expected<Digest, CasError> {
    if (offset_ != total_size_) {
        return MakeError(ErrorKind::IncompleteBlob,
                         "received {} of {} bytes",
                         offset_,
                         total_size_);
    }
    if (file_ != nullptr) {
        if (file_->committed) {
            return MakeError(ErrorKind::Internal, "blob already finished");
        }
        if (not file_->Close() or
            not FileSystemManager::SetExecutable(file_->path,
                                                 file_->executable)) {
            return MakeError(ErrorKind::LocalIoError,
                             "cannot finalize {}",
                             file_->path.string());
        }
        file_->committed = true;
    }
    auto hash = std::move(hasher_).Finalize();
    hasher_ = hash_function_.MakeHasher();
    if (not hash) {
        return MakeError(ErrorKind::Internal, "finalizing hash failed");
    }
    auto digest = Digest::Create(hash->HexString(), total_size_, hash_function_);
    if (not digest) {
        return unexpected{std::move(digest).error()};
    }
    return *std::move(digest);
}

auto ChunkAssembler::TakeContent() && noexcept -> std::optional<std::string> {
    return std::move(memory_);
}
