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

#ifndef INCLUDED_SRC_CASCLIENT_FILE_SYSTEM_OBJECT_TYPE_HPP
#define INCLUDED_SRC_CASCLIENT_FILE_SYSTEM_OBJECT_TYPE_HPP

#include <cstdint>

enum class ObjectType : std::int8_t {
    File,
    Executable,
    Directory,
    Symlink  // never dereferenced
};

[[nodiscard]] constexpr auto IsFileObject(ObjectType type) noexcept -> bool {
    return type == ObjectType::Executable or type == ObjectType::File;
}

[[nodiscard]] constexpr auto IsExecutableObject(ObjectType type) noexcept
    -> bool {
    return type == ObjectType::Executable;
}

[[nodiscard]] constexpr auto IsDirectoryObject(ObjectType type) noexcept
    -> bool {
    return type == ObjectType::Directory;
}

[[nodiscard]] constexpr auto IsSymlinkObject(ObjectType type) noexcept -> bool {
    return type == ObjectType::Symlink;
}

#endif  // INCLUDED_SRC_CASCLIENT_FILE_SYSTEM_OBJECT_TYPE_HPP
