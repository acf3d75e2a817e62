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

#include "src/casclient/transfer/blob_source.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <utility>

#include "gsl/gsl"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/logger.hpp"

namespace {
void DisposeFile(gsl::owner<std::FILE*> file) noexcept {
    if (file != nullptr) {
        std::fclose(file);
    }
}
}  // namespace

auto BlobSource::FromFile(std::filesystem::path const& path) noexcept
    -> expected<BlobSource, CasError> {
    try {
        if (not std::filesystem::is_regular_file(path)) {
            return MakeError(ErrorKind::FileUnreadable,
                             "not a regular file: {}",
                             path.string());
        }
        auto const size = std::filesystem::file_size(path);
        return BlobSource{gsl::narrow<std::size_t>(size),
                          FileSource{.path = path, .handle = nullptr}};
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::FileUnreadable,
                         "cannot inspect {}:\n{}",
                         path.string(),
                         e.what());
    }
}

auto BlobSource::FromMemory(std::string data) noexcept -> BlobSource {
    return FromMemory(std::make_shared<std::string const>(std::move(data)));
}

auto BlobSource::FromMemory(std::shared_ptr<std::string const> data) noexcept
    -> BlobSource {
    Expects(data != nullptr);
    auto const size = data->size();
    return BlobSource{size, std::move(data)};
}

auto BlobSource::ReadAt(std::size_t offset, std::size_t length) noexcept
    -> expected<std::string, CasError> {
    if (offset > size_) {
        return MakeError(ErrorKind::SeekError,
                         "offset {} is beyond the blob size {}",
                         offset,
                         size_);
    }
    length = std::min(length, size_ - offset);
    if (auto* file = std::get_if<FileSource>(&content_)) {
        return ReadFromFile(file, offset, length);
    }
    try {
        auto const& data = std::get<MemorySource>(content_);
        return data->substr(offset, length);
    } catch (std::exception const& e) {
        return MakeError(
            ErrorKind::Internal, "reading from memory failed:\n{}", e.what());
    }
}

auto BlobSource::Reopen() noexcept -> expected<std::size_t, CasError> {
    auto* file = std::get_if<FileSource>(&content_);
    if (file == nullptr) {
        return size_;
    }
    file->handle = Open(file->path);
    if (file->handle == nullptr) {
        return MakeError(
            ErrorKind::SeekError, "cannot re-open {}", file->path.string());
    }
    return size_;
}

auto BlobSource::Open(std::filesystem::path const& path) noexcept
    -> std::shared_ptr<std::FILE> {
    try {
        return std::shared_ptr<std::FILE>{std::fopen(path.c_str(), "rb"),
                                          DisposeFile};
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Debug,
                    "opening {} failed with:\n{}",
                    path.string(),
                    e.what());
        return nullptr;
    }
}

auto BlobSource::ReadFromFile(FileSource* file,
                              std::size_t offset,
                              std::size_t length) noexcept
    -> expected<std::string, CasError> {
    if (file->handle == nullptr) {
        file->handle = Open(file->path);
        if (file->handle == nullptr) {
            return MakeError(ErrorKind::FileUnreadable,
                             "cannot open {}",
                             file->path.string());
        }
    }
    if (std::fseek(file->handle.get(),
                   gsl::narrow<std::int64_t>(offset),
                   SEEK_SET) != 0) {
        return MakeError(ErrorKind::SeekError,
                         "cannot seek to offset {} in {}",
                         offset,
                         file->path.string());
    }
    try {
        std::string buffer(length, '\0');
        std::size_t read = 0;
        while (read < length) {
            auto const n = std::fread(
                &buffer[read], sizeof(char), length - read, file->handle.get());
            if (n == 0) {
                break;
            }
            read += n;
        }
        if (std::ferror(file->handle.get()) != 0) {
            std::clearerr(file->handle.get());
            return MakeError(ErrorKind::FileUnreadable,
                             "read error in {}",
                             file->path.string());
        }
        if (read != length) {
            return MakeError(ErrorKind::FileUnreadable,
                             "{} shrank while reading: expected {} bytes at "
                             "offset {}, got {}",
                             file->path.string(),
                             length,
                             offset,
                             read);
        }
        return buffer;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::FileUnreadable,
                         "reading {} failed:\n{}",
                         file->path.string(),
                         e.what());
    }
}
