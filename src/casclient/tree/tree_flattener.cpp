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

#include "src/casclient/tree/tree_flattener.hpp"

#include <exception>
#include <memory>
#include <unordered_map>
#include <utility>

#include "fmt/core.h"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/logger.hpp"

namespace {
[[nodiscard]] auto JoinPath(std::string const& parent, std::string const& name)
    -> std::string {
    return parent.empty() ? name : fmt::format("{}/{}", parent, name);
}

[[nodiscard]] auto Resolve(NodeResolver const& resolver,
                           Digest const& digest,
                           std::string const& path)
    -> expected<DirectoryNode, CasError> {
    auto node = resolver(digest);
    if (not node and node.error().kind == ErrorKind::NotFound) {
        return MakeError(ErrorKind::MissingNode,
                         "directory {} at \"{}\" cannot be resolved",
                         digest.ToString(),
                         path);
    }
    return node;
}

// NOLINTNEXTLINE(misc-no-recursion)
[[nodiscard]] auto FlattenNode(DirectoryNode const& node,
                               std::string const& prefix,
                               std::size_t depth,
                               NodeResolver const& resolver,
                               std::size_t max_depth,
                               FlatTree* out) -> std::optional<CasError> {
    if (depth > max_depth) {
        return CasError{
            .kind = ErrorKind::TreeTooDeep,
            .message = fmt::format("\"{}\" is nested deeper than {} levels",
                                   prefix,
                                   max_depth)};
    }
    for (auto const& f : node.Files()) {
        auto path = JoinPath(prefix, f.name);
        out->emplace(path,
                     FlatEntry{.path = path,
                               .kind = FlatEntryKind::File,
                               .digest = f.digest,
                               .is_executable = f.is_executable});
    }
    for (auto const& s : node.Symlinks()) {
        auto path = JoinPath(prefix, s.name);
        out->emplace(path,
                     FlatEntry{.path = path,
                               .kind = FlatEntryKind::Symlink,
                               .target = s.target});
    }
    for (auto const& d : node.Directories()) {
        auto path = JoinPath(prefix, d.name);
        auto child = Resolve(resolver, d.digest, path);
        if (not child) {
            return std::move(child).error();
        }
        if (child->IsEmpty()) {
            out->emplace(path,
                         FlatEntry{.path = path,
                                   .kind = FlatEntryKind::EmptyDirectory,
                                   .digest = d.digest});
            continue;
        }
        if (auto err = FlattenNode(
                *child, path, depth + 1, resolver, max_depth, out)) {
            return err;
        }
    }
    return std::nullopt;
}
}  // namespace

auto TreeFlattener::Flatten(Digest const& root,
                            NodeResolver const& resolver,
                            std::size_t max_depth) noexcept
    -> expected<FlatTree, CasError> {
    try {
        auto node = Resolve(resolver, root, "");
        if (not node) {
            return unexpected{std::move(node).error()};
        }
        FlatTree tree{};
        if (node->IsEmpty()) {
            tree.emplace("",
                         FlatEntry{.path = "",
                                   .kind = FlatEntryKind::EmptyDirectory,
                                   .digest = root});
            return tree;
        }
        if (auto err = FlattenNode(
                *node, "", /*depth=*/0, resolver, max_depth, &tree)) {
            return unexpected{*std::move(err)};
        }
        Logger::Log(LogLevel::Trace,
                    "flattened {} into {} entries",
                    root.ToString(),
                    tree.size());
        return tree;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "flattening {} failed:\n{}",
                         root.ToString(),
                         e.what());
    }
}

auto TreeFlattener::MakeResolver(std::vector<DirectoryNode> nodes,
                                 HashFunction hash_function)
    -> expected<NodeResolver, CasError> {
    auto index = std::make_shared<std::unordered_map<Digest, DirectoryNode>>();
    for (auto& node : nodes) {
        auto digest = node.ComputeDigest(hash_function);
        if (not digest) {
            return unexpected{std::move(digest).error()};
        }
        index->insert_or_assign(*std::move(digest), std::move(node));
    }
    return NodeResolver{
        [index](Digest const& digest) -> expected<DirectoryNode, CasError> {
            auto it = index->find(digest);
            if (it == index->end()) {
                if (digest.IsEmpty()) {
                    // the empty directory serializes to the empty blob
                    return DirectoryNode{};
                }
                return MakeError(ErrorKind::MissingNode,
                                 "directory {} is not part of the tree",
                                 digest.ToString());
            }
            return it->second;
        }};
}

auto FormatFlatTree(FlatTree const& tree) -> std::string {
    std::string out{};
    for (auto const& [path, entry] : tree) {
        switch (entry.kind) {
            case FlatEntryKind::File:
                out += fmt::format(
                    "{}: [File digest: {}{}]\n",
                    path,
                    entry.digest.ToString(),
                    entry.is_executable ? ", executable" : "");
                break;
            case FlatEntryKind::EmptyDirectory:
                out += fmt::format("{}: [Directory digest: {}]\n",
                                   path,
                                   entry.digest.ToString());
                break;
            case FlatEntryKind::Symlink:
                out += fmt::format(
                    "{}: [Symlink Target: {}]\n", path, entry.target);
                break;
        }
    }
    return out;
}
