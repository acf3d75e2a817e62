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

#ifndef INCLUDED_SRC_CASCLIENT_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
#define INCLUDED_SRC_CASCLIENT_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>

#ifdef __unix__
#include <sys/stat.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "gsl/gsl"
#include "src/casclient/file_system/object_type.hpp"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/logging/logger.hpp"

/// \brief Identity of a file's state as observed by lstat: size, modification
/// time in nanoseconds, and mode bits.
struct FileSignature {
    std::uintmax_t size{};
    std::int64_t mtime_ns{};
    std::uint32_t mode{};

    [[nodiscard]] auto IsExecutable() const noexcept -> bool {
        return (mode & S_IXUSR) != 0;
    }

    [[nodiscard]] auto operator==(FileSignature const&) const noexcept
        -> bool = default;
};

/// \brief Implements primitive file system functionality.
/// Catches all exceptions for use with exception-free callers.
class FileSystemManager {
  public:
    using ReadDirEntryFunc =
        std::function<bool(std::filesystem::path const&, ObjectType type)>;

    /// \brief Absolute, lexically normalized form of a path.
    [[nodiscard]] static auto MakeAbsolute(
        std::filesystem::path const& path) noexcept
        -> std::optional<std::filesystem::path> {
        try {
            return std::filesystem::absolute(path).lexically_normal();
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "making {} absolute failed with:\n{}",
                        path.string(),
                        e.what());
            return std::nullopt;
        }
    }

    /// \brief Gets type of object in path, without following symlinks.
    [[nodiscard]] static auto Type(std::filesystem::path const& path) noexcept
        -> std::optional<ObjectType> {
        try {
            auto const status = std::filesystem::symlink_status(path);
            if (std::filesystem::is_regular_file(status)) {
                return HasExecPermissions(status) ? ObjectType::Executable
                                                  : ObjectType::File;
            }
            if (std::filesystem::is_directory(status)) {
                return ObjectType::Directory;
            }
            if (std::filesystem::is_symlink(status)) {
                return ObjectType::Symlink;
            }
            Logger::Log(LogLevel::Trace,
                        "unsupported or non-existing object at {}",
                        path.string());
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking type of path {} failed with:\n{}",
                        path.string(),
                        e.what());
        }
        return std::nullopt;
    }

    /// \brief Observe the current signature of a path via lstat.
    [[nodiscard]] static auto Signature(
        std::filesystem::path const& path) noexcept
        -> std::optional<FileSignature> {
        struct stat st {};
        if (::lstat(path.c_str(), &st) != 0) {
            return std::nullopt;
        }
        static constexpr std::int64_t kNanosPerSecond = 1'000'000'000;
        return FileSignature{
            .size = static_cast<std::uintmax_t>(st.st_size),
            .mtime_ns = (static_cast<std::int64_t>(st.st_mtim.tv_sec) *
                         kNanosPerSecond) +
                        static_cast<std::int64_t>(st.st_mtim.tv_nsec),
            .mode = static_cast<std::uint32_t>(st.st_mode)};
    }

    [[nodiscard]] static auto CreateDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        try {
            if (dir.empty() or std::filesystem::is_directory(dir)) {
                return true;
            }
            std::filesystem::create_directories(dir);
            return std::filesystem::is_directory(dir);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "creating directory {} failed with:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    /// \brief Create a symlink with literal target, replacing existing files.
    [[nodiscard]] static auto CreateSymlink(
        std::string const& target,
        std::filesystem::path const& link) noexcept -> bool {
        try {
            if (not CreateDirectory(link.parent_path()) or
                not RemoveFile(link)) {
                return false;
            }
            std::filesystem::create_directory_symlink(target, link);
            return std::filesystem::is_symlink(link);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "symlinking {} to {} failed with:\n{}",
                        link.string(),
                        target,
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto ReadSymlink(
        std::filesystem::path const& link) noexcept
        -> std::optional<std::string> {
        try {
            return std::filesystem::read_symlink(link).string();
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "reading symlink {} failed with:\n{}",
                        link.string(),
                        e.what());
            return std::nullopt;
        }
    }

    /// \brief Removes a regular file or symlink. Succeeds if nothing exists.
    [[nodiscard]] static auto RemoveFile(
        std::filesystem::path const& file) noexcept -> bool {
        try {
            auto const status = std::filesystem::symlink_status(file);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_regular_file(status) and
                not std::filesystem::is_symlink(status)) {
                return false;
            }
            return std::filesystem::remove(file);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing file {} failed with:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto RemoveDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        try {
            auto const status = std::filesystem::symlink_status(dir);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_directory(status)) {
                return false;
            }
            std::filesystem::remove_all(dir);
            return true;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing directory {} failed with:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto ReadFile(
        std::filesystem::path const& file) noexcept
        -> std::optional<std::string> {
        try {
            std::ifstream in{file, std::ios::binary};
            if (not in.is_open()) {
                return std::nullopt;
            }
            std::string content{std::istreambuf_iterator<char>{in},
                                std::istreambuf_iterator<char>{}};
            if (in.bad()) {
                return std::nullopt;
            }
            return content;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "reading file {} failed with:\n{}",
                        file.string(),
                        e.what());
            return std::nullopt;
        }
    }

    /// \brief Write content to a file, creating parent directories.
    [[nodiscard]] static auto WriteFile(std::string const& content,
                                        std::filesystem::path const& file,
                                        bool executable = false) noexcept
        -> bool {
        try {
            if (not CreateDirectory(file.parent_path()) or
                not RemoveFile(file)) {
                return false;
            }
            {
                std::ofstream out{file, std::ios::binary | std::ios::trunc};
                if (not out.is_open()) {
                    return false;
                }
                out.write(content.data(),
                          gsl::narrow<std::streamsize>(content.size()));
                if (not out.good()) {
                    return false;
                }
            }
            return SetExecutable(file, executable);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "writing file {} failed with:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    /// \brief Copy a regular file, replacing the destination.
    [[nodiscard]] static auto CopyFile(std::filesystem::path const& src,
                                       std::filesystem::path const& dst,
                                       bool executable = false) noexcept
        -> bool {
        try {
            if (not CreateDirectory(dst.parent_path()) or
                not RemoveFile(dst)) {
                return false;
            }
            if (not std::filesystem::copy_file(src, dst)) {
                return false;
            }
            return SetExecutable(dst, executable);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "copying {} to {} failed with:\n{}",
                        src.string(),
                        dst.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto SetExecutable(std::filesystem::path const& file,
                                            bool executable) noexcept -> bool {
        using std::filesystem::perms;
        static constexpr auto kExec =
            perms::owner_exec | perms::group_exec | perms::others_exec;
        std::error_code ec{};
        std::filesystem::permissions(file,
                                     kExec,
                                     executable
                                         ? std::filesystem::perm_options::add
                                         : std::filesystem::perm_options::remove,
                                     ec);
        if (ec) {
            Logger::Log(LogLevel::Error,
                        "setting permissions of {} failed: {}",
                        file.string(),
                        ec.message());
            return false;
        }
        return true;
    }

    /// \brief Iterate the entries of a directory in unspecified order.
    /// Entries other than files, directories, and symlinks are skipped.
    [[nodiscard]] static auto ReadDirectory(
        std::filesystem::path const& dir,
        ReadDirEntryFunc const& read_entry) noexcept -> bool {
        try {
            for (auto const& entry : std::filesystem::directory_iterator{dir}) {
                auto type = Type(entry.path());
                if (not type) {
                    Logger::Log(LogLevel::Debug,
                                "skipping special entry {}",
                                entry.path().string());
                    continue;
                }
                if (not read_entry(entry.path().filename(), *type)) {
                    return false;
                }
            }
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "reading directory {} failed with:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
        return true;
    }

  private:
    [[nodiscard]] static auto HasExecPermissions(
        std::filesystem::file_status const& status) noexcept -> bool {
        try {
            return (status.permissions() & std::filesystem::perms::owner_exec) !=
                   std::filesystem::perms::none;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking exec permissions failed with:\n{}",
                        e.what());
            return false;
        }
    }
};

#endif  // INCLUDED_SRC_CASCLIENT_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
