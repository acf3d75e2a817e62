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

#ifndef INCLUDED_SRC_CASCLIENT_TREE_TREE_FLATTENER_HPP
#define INCLUDED_SRC_CASCLIENT_TREE_TREE_FLATTENER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/tree/directory_node.hpp"
#include "src/utils/cpp/expected.hpp"

enum class FlatEntryKind : std::uint8_t { File, EmptyDirectory, Symlink };

/// \brief One leaf of a flattened tree.
struct FlatEntry {
    std::string path;
    FlatEntryKind kind{FlatEntryKind::File};
    Digest digest;           // file content or empty directory
    std::string target;      // symlinks only
    bool is_executable{false};

    [[nodiscard]] auto operator==(FlatEntry const&) const noexcept
        -> bool = default;
};

/// \brief Flattened tree keyed by relative, slash-separated path. Iteration
/// order is lexicographic by path.
using FlatTree = std::map<std::string, FlatEntry>;

/// \brief Resolves the digest of a directory to its node.
using NodeResolver =
    std::function<expected<DirectoryNode, CasError>(Digest const&)>;

class TreeFlattener final {
  public:
    static constexpr std::size_t kDefaultMaxDepth = 512;

    /// \brief Resolve the tree below root into its leaves: files, symlinks
    /// and empty directories. An empty root yields one empty-directory entry
    /// with the empty path.
    /// Fails with MissingNode if a directory cannot be resolved and with
    /// TreeTooDeep if directories nest deeper than max_depth.
    [[nodiscard]] static auto Flatten(
        Digest const& root,
        NodeResolver const& resolver,
        std::size_t max_depth = kDefaultMaxDepth) noexcept
        -> expected<FlatTree, CasError>;

    /// \brief Resolver over a fixed set of nodes, e.g., all directories
    /// returned by GetTree. The empty directory always resolves.
    [[nodiscard]] static auto MakeResolver(std::vector<DirectoryNode> nodes,
                                           HashFunction hash_function)
        -> expected<NodeResolver, CasError>;
};

/// \brief Human-readable listing, one line per entry in path order.
[[nodiscard]] auto FormatFlatTree(FlatTree const& tree) -> std::string;

#endif  // INCLUDED_SRC_CASCLIENT_TREE_TREE_FLATTENER_HPP
