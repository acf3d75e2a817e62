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

#ifndef INCLUDED_SRC_CASCLIENT_TREE_DIRECTORY_TREE_BUILDER_HPP
#define INCLUDED_SRC_CASCLIENT_TREE_DIRECTORY_TREE_BUILDER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

#include "gsl/gsl"
#include "src/casclient/cache/file_metadata_cache.hpp"
#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/tree/tree_flattener.hpp"
#include "src/utils/cpp/expected.hpp"

struct LocalFile {
    std::filesystem::path path;
    bool is_executable{false};
};

/// \brief Merkle tree of a local directory, ready for upload.
struct LocalTree {
    Digest root;
    /// Serialized directory nodes by digest, the root included.
    std::unordered_map<Digest, std::string> directories;
    /// Files by content digest. Of several files with equal content, one is
    /// kept.
    std::unordered_map<Digest, LocalFile> files;
};

class DirectoryTreeBuilder final {
  public:
    /// \brief Build the Merkle tree of a local directory bottom-up. File
    /// digests are obtained through the cache. Symlinks are recorded with
    /// their literal target and never followed. Special files are skipped.
    [[nodiscard]] static auto FromLocalPath(
        std::filesystem::path const& root,
        gsl::not_null<FileMetadataCache*> const& cache,
        std::size_t max_depth = TreeFlattener::kDefaultMaxDepth) noexcept
        -> expected<LocalTree, CasError>;
};

#endif  // INCLUDED_SRC_CASCLIENT_TREE_DIRECTORY_TREE_BUILDER_HPP
