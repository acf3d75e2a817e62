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

#include "src/casclient/tree/directory_node.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <set>
#include <utility>

#include "gsl/gsl"
#include "src/casclient/proto/remote_cas.pb.h"

namespace {
[[nodiscard]] auto IsValidName(std::string const& name) noexcept -> bool {
    return not name.empty() and name != "." and name != ".." and
           name.find('/') == std::string::npos;
}

template <class TChild>
void SortByName(std::vector<TChild>* children) {
    std::sort(children->begin(),
              children->end(),
              [](auto const& lhs, auto const& rhs) {
                  return lhs.name < rhs.name;
              });
}
}  // namespace

auto ToBazelDigest(Digest const& digest) -> bazel_re::Digest {
    bazel_re::Digest result{};
    result.set_hash(digest.hash());
    result.set_size_bytes(gsl::narrow<std::int64_t>(digest.size()));
    return result;
}

auto FromBazelDigest(bazel_re::Digest const& digest,
                     HashFunction hash_function) noexcept
    -> expected<Digest, CasError> {
    if (digest.size_bytes() < 0) {
        return MakeError(ErrorKind::MalformedDigest,
                         "negative size {} for {}",
                         digest.size_bytes(),
                         digest.hash());
    }
    return Digest::Create(digest.hash(),
                          static_cast<std::size_t>(digest.size_bytes()),
                          hash_function);
}

auto DirectoryNode::Create(std::vector<FileChild> files,
                           std::vector<DirectoryChild> directories,
                           std::vector<SymlinkChild> symlinks) noexcept
    -> expected<DirectoryNode, CasError> {
    try {
        std::set<std::string> names{};
        auto check = [&names](std::string const& name) -> bool {
            return IsValidName(name) and names.insert(name).second;
        };
        for (auto const& f : files) {
            if (not check(f.name)) {
                return MakeError(
                    ErrorKind::MalformedTree, "invalid file name \"{}\"", f.name);
            }
        }
        for (auto const& d : directories) {
            if (not check(d.name)) {
                return MakeError(ErrorKind::MalformedTree,
                                 "invalid directory name \"{}\"",
                                 d.name);
            }
        }
        for (auto const& s : symlinks) {
            if (not check(s.name)) {
                return MakeError(ErrorKind::MalformedTree,
                                 "invalid symlink name \"{}\"",
                                 s.name);
            }
        }
        DirectoryNode node{};
        node.files_ = std::move(files);
        node.directories_ = std::move(directories);
        node.symlinks_ = std::move(symlinks);
        SortByName(&node.files_);
        SortByName(&node.directories_);
        SortByName(&node.symlinks_);
        return node;
    } catch (std::exception const& e) {
        return MakeError(
            ErrorKind::Internal, "creating directory node failed:\n{}", e.what());
    }
}

auto DirectoryNode::FromProto(bazel_re::Directory const& dir,
                              HashFunction hash_function) noexcept
    -> expected<DirectoryNode, CasError> {
    try {
        std::vector<FileChild> files{};
        files.reserve(static_cast<std::size_t>(dir.files_size()));
        for (auto const& f : dir.files()) {
            auto digest = FromBazelDigest(f.digest(), hash_function);
            if (not digest) {
                return MakeError(ErrorKind::MalformedTree,
                                 "file \"{}\": {}",
                                 f.name(),
                                 digest.error().message);
            }
            files.push_back(FileChild{.name = f.name(),
                                      .digest = *std::move(digest),
                                      .is_executable = f.is_executable()});
        }
        std::vector<DirectoryChild> directories{};
        directories.reserve(static_cast<std::size_t>(dir.directories_size()));
        for (auto const& d : dir.directories()) {
            auto digest = FromBazelDigest(d.digest(), hash_function);
            if (not digest) {
                return MakeError(ErrorKind::MalformedTree,
                                 "directory \"{}\": {}",
                                 d.name(),
                                 digest.error().message);
            }
            directories.push_back(
                DirectoryChild{.name = d.name(), .digest = *std::move(digest)});
        }
        std::vector<SymlinkChild> symlinks{};
        symlinks.reserve(static_cast<std::size_t>(dir.symlinks_size()));
        for (auto const& s : dir.symlinks()) {
            symlinks.push_back(
                SymlinkChild{.name = s.name(), .target = s.target()});
        }
        return Create(
            std::move(files), std::move(directories), std::move(symlinks));
    } catch (std::exception const& e) {
        return MakeError(
            ErrorKind::MalformedTree, "reading directory failed:\n{}", e.what());
    }
}

auto DirectoryNode::Deserialize(std::string const& bytes,
                                HashFunction hash_function) noexcept
    -> expected<DirectoryNode, CasError> {
    bazel_re::Directory dir{};
    if (not dir.ParseFromString(bytes)) {
        return MakeError(ErrorKind::MalformedTree,
                         "blob of {} bytes is not a directory",
                         bytes.size());
    }
    return FromProto(dir, hash_function);
}

auto DirectoryNode::ToProto() const -> bazel_re::Directory {
    bazel_re::Directory dir{};
    for (auto const& f : files_) {
        auto* node = dir.add_files();
        node->set_name(f.name);
        *node->mutable_digest() = ToBazelDigest(f.digest);
        node->set_is_executable(f.is_executable);
    }
    for (auto const& d : directories_) {
        auto* node = dir.add_directories();
        node->set_name(d.name);
        *node->mutable_digest() = ToBazelDigest(d.digest);
    }
    for (auto const& s : symlinks_) {
        auto* node = dir.add_symlinks();
        node->set_name(s.name);
        node->set_target(s.target);
    }
    return dir;
}

auto DirectoryNode::Serialize() const noexcept
    -> expected<std::string, CasError> {
    try {
        auto const dir = ToProto();
        std::string content(dir.ByteSizeLong(), '\0');
        if (not dir.SerializeToArray(content.data(),
                                     gsl::narrow<int>(content.size()))) {
            return MakeError(ErrorKind::Internal, "serializing directory failed");
        }
        return content;
    } catch (std::exception const& e) {
        return MakeError(
            ErrorKind::Internal, "serializing directory failed:\n{}", e.what());
    }
}

auto DirectoryNode::ComputeDigest(HashFunction hash_function) const noexcept
    -> expected<Digest, CasError> {
    auto bytes = Serialize();
    if (not bytes) {
        return unexpected{std::move(bytes).error()};
    }
    return Digest::FromContent(hash_function, *bytes);
}
