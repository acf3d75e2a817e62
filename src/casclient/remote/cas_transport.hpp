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

#ifndef INCLUDED_SRC_CASCLIENT_REMOTE_CAS_TRANSPORT_HPP
#define INCLUDED_SRC_CASCLIENT_REMOTE_CAS_TRANSPORT_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gsl/gsl"
#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/multithreading/cancellation.hpp"
#include "src/casclient/transfer/chunk_assembler.hpp"
#include "src/casclient/transfer/chunker.hpp"
#include "src/casclient/tree/directory_node.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Per-call options. A zero timeout means no deadline.
struct RpcOptions {
    std::chrono::milliseconds timeout{0};
    CancellationToken cancel;
    // deadline of the status query a broken Write issues before resuming
    std::chrono::milliseconds query_timeout{0};
};

/// \brief Blob sent in a batch update.
struct BlobUpload {
    Digest digest;
    std::string content;
};

/// \brief Outcome of one item of a batch request.
struct BlobStatus {
    Digest digest;
    std::optional<CasError> error;  // std::nullopt on success
};

/// \brief Outcome of one item of a batch read.
struct BlobContent {
    Digest digest;
    std::string content;
    std::optional<CasError> error;  // std::nullopt on success
};

/// \brief Remote content-addressable storage as seen by the transfer engine.
/// Implementations are safe to be called concurrently. A whole-call failure
/// is reported as error; batch calls additionally report per-item statuses.
class ICasTransport {
  public:
    using Ptr = std::shared_ptr<ICasTransport>;

    ICasTransport() = default;
    ICasTransport(ICasTransport const&) = delete;
    ICasTransport(ICasTransport&&) = delete;
    auto operator=(ICasTransport const&) -> ICasTransport& = delete;
    auto operator=(ICasTransport&&) -> ICasTransport& = delete;
    virtual ~ICasTransport() = default;

    /// \brief Determine which of the given digests are not stored remotely.
    [[nodiscard]] virtual auto FindMissingBlobs(
        std::vector<Digest> const& digests,
        RpcOptions const& options) noexcept
        -> expected<std::vector<Digest>, CasError> = 0;

    [[nodiscard]] virtual auto BatchUpdateBlobs(
        std::vector<BlobUpload> const& blobs,
        RpcOptions const& options) noexcept
        -> expected<std::vector<BlobStatus>, CasError> = 0;

    [[nodiscard]] virtual auto BatchReadBlobs(
        std::vector<Digest> const& digests,
        RpcOptions const& options) noexcept
        -> expected<std::vector<BlobContent>, CasError> = 0;

    /// \brief Stream a blob from its chunker, starting at the chunker's
    /// current offset.
    /// \returns The size committed by the remote side.
    [[nodiscard]] virtual auto WriteStream(
        Digest const& digest,
        gsl::not_null<Chunker*> const& chunker,
        RpcOptions const& options) noexcept
        -> expected<std::size_t, CasError> = 0;

    /// \brief Stream a blob into the assembler, starting at the assembler's
    /// current offset. Received data stays appended on failure so that a
    /// retry can resume.
    /// \returns The number of bytes received by this call.
    [[nodiscard]] virtual auto ReadStream(
        Digest const& digest,
        gsl::not_null<ChunkAssembler*> const& assembler,
        RpcOptions const& options) noexcept
        -> expected<std::size_t, CasError> = 0;

    /// \brief Fetch all directory nodes of the tree below root, root
    /// included.
    [[nodiscard]] virtual auto GetTree(Digest const& root,
                                       RpcOptions const& options) noexcept
        -> expected<std::vector<DirectoryNode>, CasError> = 0;
};

#endif  // INCLUDED_SRC_CASCLIENT_REMOTE_CAS_TRANSPORT_HPP
