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

#include "src/casclient/tree/directory_tree_builder.hpp"

#include <exception>
#include <optional>
#include <utility>
#include <vector>

#include "fmt/core.h"
#include "src/casclient/file_system/file_system_manager.hpp"
#include "src/casclient/file_system/object_type.hpp"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/logger.hpp"
#include "src/casclient/tree/directory_node.hpp"

namespace {
// NOLINTNEXTLINE(misc-no-recursion)
[[nodiscard]] auto StoreDirectory(std::filesystem::path const& dir,
                                  std::size_t depth,
                                  std::size_t max_depth,
                                  FileMetadataCache* cache,
                                  LocalTree* tree)
    -> expected<Digest, CasError> {
    if (depth > max_depth) {
        return MakeError(ErrorKind::TreeTooDeep,
                         "{} is nested deeper than {} levels",
                         dir.string(),
                         max_depth);
    }

    std::vector<FileChild> files{};
    std::vector<DirectoryChild> dirs{};
    std::vector<SymlinkChild> symlinks{};
    std::optional<CasError> error{};

    auto dir_reader = [&](std::filesystem::path const& name,
                          ObjectType type) -> bool {
        auto const full_name = dir / name;
        if (IsDirectoryObject(type)) {
            auto digest =
                StoreDirectory(full_name, depth + 1, max_depth, cache, tree);
            if (not digest) {
                error = std::move(digest).error();
                return false;
            }
            dirs.push_back(DirectoryChild{.name = name.string(),
                                          .digest = *std::move(digest)});
            return true;
        }
        if (IsSymlinkObject(type)) {
            auto target = FileSystemManager::ReadSymlink(full_name);
            if (not target) {
                error = CasError{
                    .kind = ErrorKind::FileUnreadable,
                    .message = fmt::format("cannot read symlink {}",
                                           full_name.string())};
                return false;
            }
            symlinks.push_back(
                SymlinkChild{.name = name.string(), .target = *target});
            return true;
        }
        auto digest = cache->ComputeOrGet(full_name);
        if (not digest) {
            error = std::move(digest).error();
            return false;
        }
        bool const executable = IsExecutableObject(type);
        tree->files.try_emplace(
            *digest,
            LocalFile{.path = full_name, .is_executable = executable});
        files.push_back(FileChild{.name = name.string(),
                                  .digest = *std::move(digest),
                                  .is_executable = executable});
        return true;
    };

    if (not FileSystemManager::ReadDirectory(dir, dir_reader)) {
        if (error) {
            return unexpected{*std::move(error)};
        }
        return MakeError(ErrorKind::FileUnreadable,
                         "cannot read directory {}",
                         dir.string());
    }

    auto node = DirectoryNode::Create(
        std::move(files), std::move(dirs), std::move(symlinks));
    if (not node) {
        return unexpected{std::move(node).error()};
    }
    auto bytes = node->Serialize();
    if (not bytes) {
        return unexpected{std::move(bytes).error()};
    }
    auto digest = Digest::FromContent(cache->GetHashFunction(), *bytes);
    Logger::Log(LogLevel::Trace,
                "directory {} has digest {}",
                dir.string(),
                digest.ToString());
    tree->directories.try_emplace(digest, *std::move(bytes));
    return digest;
}
}  // namespace

auto DirectoryTreeBuilder::FromLocalPath(
    std::filesystem::path const& root,
    gsl::not_null<FileMetadataCache*> const& cache,
    std::size_t max_depth) noexcept -> expected<LocalTree, CasError> {
    try {
        auto type = FileSystemManager::Type(root);
        if (not type or not IsDirectoryObject(*type)) {
            return MakeError(ErrorKind::FileUnreadable,
                             "{} is not a directory",
                             root.string());
        }
        LocalTree tree{};
        auto digest = StoreDirectory(root, 0, max_depth, cache.get(), &tree);
        if (not digest) {
            return unexpected{std::move(digest).error()};
        }
        tree.root = *std::move(digest);
        Logger::Log(LogLevel::Debug,
                    "built tree {} of {} with {} directories and {} files",
                    tree.root.ToString(),
                    root.string(),
                    tree.directories.size(),
                    tree.files.size());
        return tree;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "building tree of {} failed:\n{}",
                         root.string(),
                         e.what());
    }
}
