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

#ifndef INCLUDED_SRC_CASCLIENT_REMOTE_GRPC_CAS_TRANSPORT_HPP
#define INCLUDED_SRC_CASCLIENT_REMOTE_GRPC_CAS_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "gsl/gsl"
#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/logging/logger.hpp"
#include "src/casclient/proto/bytestream.grpc.pb.h"
#include "src/casclient/proto/remote_cas.grpc.pb.h"
#include "src/casclient/remote/cas_transport.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Classify a gRPC status code.
[[nodiscard]] auto ToErrorKind(grpc::StatusCode code) noexcept -> ErrorKind;

/// \brief Convert a failed gRPC status into an error.
[[nodiscard]] auto ToCasError(grpc::Status const& status,
                              std::string const& context) -> CasError;

/// \brief Transport on the ContentAddressableStorage and ByteStream services.
/// The channel is created by the caller, which thereby controls the
/// endpoint, credentials, and channel arguments.
class GrpcCasTransport final : public ICasTransport {
  public:
    GrpcCasTransport(std::string instance_name,
                     std::shared_ptr<grpc::Channel> const& channel,
                     HashFunction hash_function = HashFunction{}) noexcept;

    [[nodiscard]] auto FindMissingBlobs(std::vector<Digest> const& digests,
                                        RpcOptions const& options) noexcept
        -> expected<std::vector<Digest>, CasError> final;

    [[nodiscard]] auto BatchUpdateBlobs(std::vector<BlobUpload> const& blobs,
                                        RpcOptions const& options) noexcept
        -> expected<std::vector<BlobStatus>, CasError> final;

    [[nodiscard]] auto BatchReadBlobs(std::vector<Digest> const& digests,
                                      RpcOptions const& options) noexcept
        -> expected<std::vector<BlobContent>, CasError> final;

    /// \brief Upload through ByteStream.Write. If the stream breaks, the
    /// committed size is queried and the chunker is positioned there, so
    /// that the next call continues the upload.
    [[nodiscard]] auto WriteStream(Digest const& digest,
                                   gsl::not_null<Chunker*> const& chunker,
                                   RpcOptions const& options) noexcept
        -> expected<std::size_t, CasError> final;

    [[nodiscard]] auto ReadStream(
        Digest const& digest,
        gsl::not_null<ChunkAssembler*> const& assembler,
        RpcOptions const& options) noexcept
        -> expected<std::size_t, CasError> final;

    [[nodiscard]] auto GetTree(Digest const& root,
                               RpcOptions const& options) noexcept
        -> expected<std::vector<DirectoryNode>, CasError> final;

  private:
    std::string instance_name_;
    HashFunction hash_function_;
    std::unique_ptr<build::bazel::remote::execution::v2::
                        ContentAddressableStorage::Stub>
        cas_stub_;
    std::unique_ptr<google::bytestream::ByteStream::Stub> bytestream_stub_;
    Logger logger_{"GrpcCasTransport"};

    [[nodiscard]] auto QueryWriteStatus(std::string const& resource_name,
                                        RpcOptions const& options)
        const noexcept -> std::optional<std::int64_t>;

    /// \brief Position the chunker at the size the server has committed.
    [[nodiscard]] auto PrepareResume(std::string const& resource_name,
                                     gsl::not_null<Chunker*> const& chunker,
                                     RpcOptions const& options) const noexcept
        -> std::optional<CasError>;
};

#endif  // INCLUDED_SRC_CASCLIENT_REMOTE_GRPC_CAS_TRANSPORT_HPP
