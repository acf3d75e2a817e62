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

#include "src/casclient/client/transfer_client.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <optional>
#include <utility>

#include "fmt/core.h"
#include "src/casclient/file_system/file_system_manager.hpp"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/multithreading/task_system.hpp"
#include "src/casclient/remote/retry.hpp"
#include "src/casclient/remote/rpc_timeouts.hpp"
#include "src/casclient/transfer/blob_source.hpp"
#include "src/casclient/tree/directory_tree_builder.hpp"

namespace {

/// \brief The error a single-item dispatch ended with, if any.
[[nodiscard]] auto FirstError(DispatchResult const& result) noexcept
    -> std::optional<CasError> {
    if (result.fatal) {
        return result.fatal;
    }
    if (not result.failures.empty()) {
        return result.failures.front().error;
    }
    return std::nullopt;
}

}  // namespace

TransferClient::TransferClient(ICasTransport::Ptr transport,
                               ClientConfig config) noexcept
    : config_{std::move(config)},
      transport_{std::move(transport)},
      cache_{config_.dispatcher.GetHashFunction()},
      dispatcher_{transport_, config_.dispatcher} {}

auto TransferClient::LoadCache() noexcept -> expected<std::size_t, CasError> {
    if (not config_.cache_file or
        FileSystemManager::Type(*config_.cache_file) == std::nullopt) {
        return std::size_t{0};
    }
    return cache_.Load(*config_.cache_file);
}

auto TransferClient::SaveCache() const noexcept
    -> expected<std::size_t, CasError> {
    if (not config_.cache_file) {
        return std::size_t{0};
    }
    return cache_.Save(*config_.cache_file);
}

auto TransferClient::UploadFiles(
    std::vector<std::filesystem::path> const& paths,
    CancellationToken const& cancel) noexcept -> FilesUploadResult {
    FilesUploadResult upload{};
    try {
        // hash in parallel, the cache deduplicates repeated paths
        std::vector<std::optional<expected<Digest, CasError>>> digests(
            paths.size());
        {
            TaskSystem ts{std::min<std::size_t>(
                std::max<std::size_t>(paths.size(), 1),
                config_.dispatcher.ConcurrencyLimit())};
            for (std::size_t i = 0; i < paths.size(); ++i) {
                ts.QueueTask([this, &paths, &digests, i]() {
                    digests[i] = cache_.ComputeOrGet(paths[i]);
                });
            }
        }

        std::vector<UploadItem> items{};
        items.reserve(paths.size());
        for (std::size_t i = 0; i < paths.size(); ++i) {
            auto const& digest = *digests[i];
            if (not digest) {
                upload.unreadable.push_back(
                    PathFailure{.path = paths[i], .error = digest.error()});
                continue;
            }
            auto source = BlobSource::FromFile(paths[i]);
            if (not source) {
                upload.unreadable.push_back(
                    PathFailure{.path = paths[i], .error = source.error()});
                continue;
            }
            upload.digests.emplace(paths[i], *digest);
            items.push_back(
                UploadItem{.digest = *digest, .source = *std::move(source)});
        }
        for (auto const& failure : upload.unreadable) {
            logger_.Emit(LogLevel::Warning,
                         "skipping {}: {}",
                         failure.path.string(),
                         failure.error.ToString());
        }
        upload.result = dispatcher_.Upload(std::move(items), cancel);
    } catch (std::exception const& e) {
        upload.result.fatal =
            MakeError(
                ErrorKind::Internal, "uploading files failed with:\n{}", e.what())
                .error();
    }
    return upload;
}

auto TransferClient::UploadTree(std::filesystem::path const& dir,
                                CancellationToken const& cancel) noexcept
    -> expected<TreeUploadResult, CasError> {
    auto tree = DirectoryTreeBuilder::FromLocalPath(
        dir, &cache_, config_.max_tree_depth);
    if (not tree) {
        return unexpected{std::move(tree).error()};
    }
    try {
        std::vector<UploadItem> items{};
        std::vector<ItemFailure> unreadable{};
        items.reserve(tree->directories.size() + tree->files.size());
        for (auto& [digest, bytes] : tree->directories) {
            items.push_back(UploadItem{
                .digest = digest,
                .source = BlobSource::FromMemory(std::move(bytes))});
        }
        for (auto const& [digest, file] : tree->files) {
            auto source = BlobSource::FromFile(file.path);
            if (not source) {
                unreadable.push_back(
                    ItemFailure{.digest = digest, .error = source.error()});
                continue;
            }
            items.push_back(
                UploadItem{.digest = digest, .source = *std::move(source)});
        }
        logger_.Emit(LogLevel::Debug,
                     "uploading tree {} of {}: {} directories, {} files",
                     tree->root.ToString(),
                     dir.string(),
                     tree->directories.size(),
                     tree->files.size());
        auto result = dispatcher_.Upload(std::move(items), cancel);
        std::move(unreadable.begin(),
                  unreadable.end(),
                  std::back_inserter(result.failures));
        return TreeUploadResult{.root = tree->root, .result = std::move(result)};
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "uploading tree {} failed with:\n{}",
                         dir.string(),
                         e.what());
    }
}

auto TransferClient::UploadBlob(std::string content,
                                CancellationToken const& cancel) noexcept
    -> expected<Digest, CasError> {
    try {
        auto const digest = Digest::FromContent(
            config_.dispatcher.GetHashFunction(), content);
        std::vector<UploadItem> items{};
        items.push_back(UploadItem{
            .digest = digest,
            .source = BlobSource::FromMemory(std::move(content))});
        auto result = dispatcher_.Upload(std::move(items), cancel);
        if (auto error = FirstError(result)) {
            return unexpected{*std::move(error)};
        }
        return digest;
    } catch (std::exception const& e) {
        return MakeError(
            ErrorKind::Internal, "uploading blob failed with:\n{}", e.what());
    }
}

auto TransferClient::DownloadBlob(Digest const& digest,
                                  std::filesystem::path const& target,
                                  bool is_executable,
                                  CancellationToken const& cancel) noexcept
    -> expected<std::size_t, CasError> {
    try {
        auto result = dispatcher_.Download(
            {DownloadItem{
                .digest = digest, .path = target, .is_executable = is_executable}},
            cancel);
        if (auto error = FirstError(result)) {
            return unexpected{*std::move(error)};
        }
        return digest.size();
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "downloading {} failed with:\n{}",
                         digest.ToString(),
                         e.what());
    }
}

auto TransferClient::ReadBlob(Digest const& digest,
                              CancellationToken const& cancel) noexcept
    -> expected<std::string, CasError> {
    try {
        auto result = dispatcher_.Download(
            {DownloadItem{.digest = digest, .path = std::nullopt}}, cancel);
        if (auto error = FirstError(result)) {
            return unexpected{*std::move(error)};
        }
        if (auto it = result.contents.find(digest);
            it != result.contents.end()) {
            return std::move(it->second);
        }
        if (digest.IsEmpty()) {
            return std::string{};
        }
        return MakeError(ErrorKind::Internal,
                         "no content received for {}",
                         digest.ToString());
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "reading {} failed with:\n{}",
                         digest.ToString(),
                         e.what());
    }
}

auto TransferClient::FlattenRemoteTree(Digest const& root,
                                       CancellationToken const& cancel) noexcept
    -> expected<FlatTree, CasError> {
    auto const& dispatch_config = config_.dispatcher;
    RetryBudget budget{dispatch_config.MaxTotalRetries()};
    auto nodes = WithRetry(
        [this, &root, &cancel, &dispatch_config]() {
            return transport_->GetTree(
                root,
                RpcOptions{
                    .timeout = dispatch_config.Timeouts().Get(RpcKind::GetTree),
                    .cancel = cancel});
        },
        dispatch_config.Retry(),
        logger_,
        cancel,
        &budget);
    if (not nodes) {
        return unexpected{std::move(nodes).error()};
    }
    try {
        auto resolver = TreeFlattener::MakeResolver(
            *std::move(nodes), dispatch_config.GetHashFunction());
        if (not resolver) {
            return unexpected{std::move(resolver).error()};
        }
        return TreeFlattener::Flatten(root, *resolver, config_.max_tree_depth);
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "flattening tree {} failed with:\n{}",
                         root.ToString(),
                         e.what());
    }
}

auto TransferClient::DownloadDirectory(
    Digest const& root,
    std::filesystem::path const& target_dir,
    CancellationToken const& cancel) noexcept
    -> expected<DispatchResult, CasError> {
    auto tree = FlattenRemoteTree(root, cancel);
    if (not tree) {
        return unexpected{std::move(tree).error()};
    }
    try {
        if (not FileSystemManager::CreateDirectory(target_dir)) {
            return MakeError(ErrorKind::LocalIoError,
                             "cannot create directory {}",
                             target_dir.string());
        }
        std::vector<DownloadItem> files{};
        for (auto const& [path, entry] : *tree) {
            auto const local = path.empty() ? target_dir : target_dir / path;
            switch (entry.kind) {
                case FlatEntryKind::File:
                    files.push_back(
                        DownloadItem{.digest = entry.digest,
                                     .path = local,
                                     .is_executable = entry.is_executable});
                    break;
                case FlatEntryKind::EmptyDirectory:
                    if (not FileSystemManager::CreateDirectory(local)) {
                        return MakeError(ErrorKind::LocalIoError,
                                         "cannot create directory {}",
                                         local.string());
                    }
                    break;
                case FlatEntryKind::Symlink:
                    if (not FileSystemManager::CreateSymlink(entry.target,
                                                             local)) {
                        return MakeError(ErrorKind::LocalIoError,
                                         "cannot create symlink {}",
                                         local.string());
                    }
                    break;
            }
        }
        // parent directories of files are created on delivery
        logger_.Emit(LogLevel::Debug,
                     "downloading {} entries of tree {} to {}",
                     tree->size(),
                     root.ToString(),
                     target_dir.string());
        return dispatcher_.Download(files, cancel);
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "downloading tree {} failed with:\n{}",
                         root.ToString(),
                         e.what());
    }
}

auto TransferClient::ShowTree(Digest const& root,
                              CancellationToken const& cancel) noexcept
    -> expected<std::string, CasError> {
    auto tree = FlattenRemoteTree(root, cancel);
    if (not tree) {
        return unexpected{std::move(tree).error()};
    }
    try {
        return FormatFlatTree(*tree);
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "formatting tree {} failed with:\n{}",
                         root.ToString(),
                         e.what());
    }
}
