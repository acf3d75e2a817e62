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

#ifndef INCLUDED_SRC_CASCLIENT_REMOTE_BYTESTREAM_UTILS_HPP
#define INCLUDED_SRC_CASCLIENT_REMOTE_BYTESTREAM_UTILS_HPP

#include <optional>
#include <string>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Resource names of the google.bytestream.ByteStream service.
class ByteStreamUtils final {
    static constexpr auto* kBlobs = "blobs";
    static constexpr auto* kUploads = "uploads";

  public:
    /// \brief Resource name of a read request. The pattern is:
    /// "{instance_name}/blobs/{digest.hash()}/{digest.size()}".
    /// An empty instance name omits the leading component.
    class ReadRequest final {
      public:
        ReadRequest(std::string instance_name, Digest const& digest) noexcept;

        [[nodiscard]] auto ToString() const -> std::string;

        [[nodiscard]] static auto FromString(
            std::string const& request) noexcept -> std::optional<ReadRequest>;

        [[nodiscard]] auto GetInstanceName() const noexcept
            -> std::string const& {
            return instance_name_;
        }

        [[nodiscard]] auto GetDigest(HashFunction hash_function) const noexcept
            -> expected<Digest, CasError>;

      private:
        std::string instance_name_;
        std::string hash_;
        std::size_t size_ = 0;

        ReadRequest() = default;
    };

    /// \brief Resource name of a write request. The pattern is:
    /// "{instance_name}/uploads/{uuid}/blobs/{digest.hash()}/{digest.size()}".
    class WriteRequest final {
      public:
        WriteRequest(std::string instance_name,
                     std::string uuid,
                     Digest const& digest) noexcept;

        [[nodiscard]] auto ToString() const -> std::string;

        [[nodiscard]] static auto FromString(
            std::string const& request) noexcept -> std::optional<WriteRequest>;

        [[nodiscard]] auto GetInstanceName() const noexcept
            -> std::string const& {
            return instance_name_;
        }

        [[nodiscard]] auto GetUUID() const noexcept -> std::string const& {
            return uuid_;
        }

        [[nodiscard]] auto GetDigest(HashFunction hash_function) const noexcept
            -> expected<Digest, CasError>;

      private:
        std::string instance_name_;
        std::string uuid_;
        std::string hash_;
        std::size_t size_ = 0;

        WriteRequest() = default;
    };
};

#endif  // INCLUDED_SRC_CASCLIENT_REMOTE_BYTESTREAM_UTILS_HPP
