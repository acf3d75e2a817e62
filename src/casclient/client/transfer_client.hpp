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

#ifndef INCLUDED_SRC_CASCLIENT_CLIENT_TRANSFER_CLIENT_HPP
#define INCLUDED_SRC_CASCLIENT_CLIENT_TRANSFER_CLIENT_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "src/casclient/cache/file_metadata_cache.hpp"
#include "src/casclient/client/client_config.hpp"
#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/dispatch/batch_dispatcher.hpp"
#include "src/casclient/logging/logger.hpp"
#include "src/casclient/multithreading/cancellation.hpp"
#include "src/casclient/remote/cas_transport.hpp"
#include "src/casclient/tree/tree_flattener.hpp"
#include "src/utils/cpp/expected.hpp"

struct PathFailure {
    std::filesystem::path path;
    CasError error;
};

struct FilesUploadResult {
    /// Digest of every file that could be hashed.
    std::map<std::filesystem::path, Digest> digests;
    /// Files that could not be hashed and were therefore not uploaded.
    std::vector<PathFailure> unreadable;
    DispatchResult result;

    [[nodiscard]] auto Ok() const noexcept -> bool {
        return unreadable.empty() and result.Ok();
    }
};

struct TreeUploadResult {
    Digest root;
    DispatchResult result;
};

/// \brief Upload and download of files, blobs, and directory trees. Combines
/// the metadata cache, the Merkle tree builder, the flattener, and the batch
/// dispatcher on top of one transport.
class TransferClient final {
  public:
    TransferClient(ICasTransport::Ptr transport, ClientConfig config) noexcept;

    [[nodiscard]] auto Config() const noexcept -> ClientConfig const& {
        return config_;
    }

    [[nodiscard]] auto Cache() noexcept -> FileMetadataCache& {
        return cache_;
    }

    [[nodiscard]] auto Dispatcher() const noexcept -> BatchDispatcher const& {
        return dispatcher_;
    }

    /// \brief Load the metadata cache from the configured cache file. A
    /// missing file is not an error.
    /// \returns The number of loaded entries.
    [[nodiscard]] auto LoadCache() noexcept -> expected<std::size_t, CasError>;

    /// \brief Save the metadata cache to the configured cache file.
    /// \returns The number of saved entries.
    [[nodiscard]] auto SaveCache() const noexcept
        -> expected<std::size_t, CasError>;

    /// \brief Hash the files through the cache and upload the missing ones.
    [[nodiscard]] auto UploadFiles(std::vector<std::filesystem::path> const& paths,
                                   CancellationToken const& cancel) noexcept
        -> FilesUploadResult;

    /// \brief Build the Merkle tree of a local directory and upload all its
    /// files and directory nodes.
    [[nodiscard]] auto UploadTree(std::filesystem::path const& dir,
                                  CancellationToken const& cancel) noexcept
        -> expected<TreeUploadResult, CasError>;

    [[nodiscard]] auto UploadBlob(std::string content,
                                  CancellationToken const& cancel) noexcept
        -> expected<Digest, CasError>;

    /// \brief Download a blob to a file.
    /// \returns The number of bytes written.
    [[nodiscard]] auto DownloadBlob(Digest const& digest,
                                    std::filesystem::path const& target,
                                    bool is_executable,
                                    CancellationToken const& cancel) noexcept
        -> expected<std::size_t, CasError>;

    [[nodiscard]] auto ReadBlob(Digest const& digest,
                                CancellationToken const& cancel) noexcept
        -> expected<std::string, CasError>;

    /// \brief Fetch and flatten the remote tree below root.
    [[nodiscard]] auto FlattenRemoteTree(Digest const& root,
                                         CancellationToken const& cancel)
        noexcept -> expected<FlatTree, CasError>;

    /// \brief Materialize the remote tree below root in target_dir: files
    /// with their executable bit, empty directories, and symlinks.
    /// \returns The dispatch result of the file downloads.
    [[nodiscard]] auto DownloadDirectory(
        Digest const& root,
        std::filesystem::path const& target_dir,
        CancellationToken const& cancel) noexcept
        -> expected<DispatchResult, CasError>;

    /// \brief Listing of the remote tree below root, one line per entry.
    [[nodiscard]] auto ShowTree(Digest const& root,
                                CancellationToken const& cancel) noexcept
        -> expected<std::string, CasError>;

  private:
    ClientConfig config_;
    ICasTransport::Ptr transport_;
    FileMetadataCache cache_;
    BatchDispatcher dispatcher_;
    Logger logger_{"TransferClient"};
};

#endif  // INCLUDED_SRC_CASCLIENT_CLIENT_TRANSFER_CLIENT_HPP
