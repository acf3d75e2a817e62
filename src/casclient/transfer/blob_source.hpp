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

#ifndef INCLUDED_SRC_CASCLIENT_TRANSFER_BLOB_SOURCE_HPP
#define INCLUDED_SRC_CASCLIENT_TRANSFER_BLOB_SOURCE_HPP

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>

#include "src/casclient/common/cas_error.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Seekable provider of the bytes of one blob, backed by either a
/// local file or an in-memory buffer. Any region can be read repeatedly.
class BlobSource final {
  public:
    /// \brief Bind to a regular file. The file is opened lazily on first read.
    /// Fails with FileUnreadable if the path is not a readable regular file.
    [[nodiscard]] static auto FromFile(
        std::filesystem::path const& path) noexcept
        -> expected<BlobSource, CasError>;

    [[nodiscard]] static auto FromMemory(std::string data) noexcept
        -> BlobSource;

    [[nodiscard]] static auto FromMemory(
        std::shared_ptr<std::string const> data) noexcept -> BlobSource;

    [[nodiscard]] auto Size() const noexcept -> std::size_t { return size_; }

    [[nodiscard]] auto IsFile() const noexcept -> bool {
        return std::holds_alternative<FileSource>(content_);
    }

    /// \brief Read up to length bytes starting at offset.
    /// Fails with SeekError if the offset lies beyond the end or the file
    /// cannot be repositioned, and with FileUnreadable if the file cannot be
    /// read or was truncated.
    [[nodiscard]] auto ReadAt(std::size_t offset,
                              std::size_t length) noexcept
        -> expected<std::string, CasError>;

    /// \brief Close and re-open the underlying file (no-op for memory).
    [[nodiscard]] auto Reopen() noexcept -> expected<std::size_t, CasError>;

  private:
    struct FileSource {
        std::filesystem::path path;
        std::shared_ptr<std::FILE> handle;
    };
    using MemorySource = std::shared_ptr<std::string const>;

    std::size_t size_{};
    std::variant<FileSource, MemorySource> content_;

    BlobSource(std::size_t size,
               std::variant<FileSource, MemorySource> content) noexcept
        : size_{size}, content_{std::move(content)} {}

    [[nodiscard]] static auto Open(std::filesystem::path const& path) noexcept
        -> std::shared_ptr<std::FILE>;

    [[nodiscard]] auto ReadFromFile(FileSource* file,
                                    std::size_t offset,
                                    std::size_t length) noexcept
        -> expected<std::string, CasError>;
};

#endif  // INCLUDED_SRC_CASCLIENT_TRANSFER_BLOB_SOURCE_HPP
