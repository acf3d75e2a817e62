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

#ifndef INCLUDED_SRC_CASCLIENT_TREE_DIRECTORY_NODE_HPP
#define INCLUDED_SRC_CASCLIENT_TREE_DIRECTORY_NODE_HPP

#include <string>
#include <vector>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/utils/cpp/expected.hpp"

namespace build::bazel::remote::execution::v2 {
class Digest;
class Directory;
}  // namespace build::bazel::remote::execution::v2
namespace bazel_re = build::bazel::remote::execution::v2;

struct FileChild {
    std::string name;
    Digest digest;
    bool is_executable{false};
};

struct DirectoryChild {
    std::string name;
    Digest digest;
};

struct SymlinkChild {
    std::string name;
    std::string target;
};

/// \brief One level of a Merkle directory tree. Children of each kind are
/// kept sorted by name; a name is unique across all kinds. The node's digest
/// is the digest of its canonical serialization.
class DirectoryNode final {
  public:
    DirectoryNode() noexcept = default;

    /// \brief Create a node from unordered children.
    /// Fails with MalformedTree for empty names, names containing '/', the
    /// names "." and "..", and duplicate names.
    [[nodiscard]] static auto Create(std::vector<FileChild> files,
                                     std::vector<DirectoryChild> directories,
                                     std::vector<SymlinkChild> symlinks) noexcept
        -> expected<DirectoryNode, CasError>;

    /// \brief Parse the wire representation of a directory.
    [[nodiscard]] static auto FromProto(bazel_re::Directory const& dir,
                                        HashFunction hash_function) noexcept
        -> expected<DirectoryNode, CasError>;

    /// \brief Parse a serialized directory blob.
    [[nodiscard]] static auto Deserialize(std::string const& bytes,
                                          HashFunction hash_function) noexcept
        -> expected<DirectoryNode, CasError>;

    [[nodiscard]] auto ToProto() const -> bazel_re::Directory;

    /// \brief Canonical serialized form.
    [[nodiscard]] auto Serialize() const noexcept
        -> expected<std::string, CasError>;

    [[nodiscard]] auto ComputeDigest(HashFunction hash_function) const noexcept
        -> expected<Digest, CasError>;

    [[nodiscard]] auto Files() const& noexcept
        -> std::vector<FileChild> const& {
        return files_;
    }
    [[nodiscard]] auto Directories() const& noexcept
        -> std::vector<DirectoryChild> const& {
        return directories_;
    }
    [[nodiscard]] auto Symlinks() const& noexcept
        -> std::vector<SymlinkChild> const& {
        return symlinks_;
    }

    [[nodiscard]] auto IsEmpty() const noexcept -> bool {
        return files_.empty() and directories_.empty() and symlinks_.empty();
    }

  private:
    std::vector<FileChild> files_;
    std::vector<DirectoryChild> directories_;
    std::vector<SymlinkChild> symlinks_;
};

/// \brief Conversion between digests and their wire representation.
[[nodiscard]] auto ToBazelDigest(Digest const& digest) -> bazel_re::Digest;

[[nodiscard]] auto FromBazelDigest(bazel_re::Digest const& digest,
                                   HashFunction hash_function) noexcept
    -> expected<Digest, CasError>;

#endif  // INCLUDED_SRC_CASCLIENT_TREE_DIRECTORY_NODE_HPP
