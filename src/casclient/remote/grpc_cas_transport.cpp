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

#include "src/casclient/remote/grpc_cas_transport.hpp"

#include <chrono>
#include <exception>
#include <tuple>
#include <unordered_map>
#include <utility>

#include "fmt/core.h"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/proto/bytestream.pb.h"
#include "src/casclient/proto/remote_cas.pb.h"
#include "src/casclient/remote/bytestream_utils.hpp"
#include "src/casclient/remote/ids.hpp"
#include "src/casclient/transfer/chunker.hpp"

namespace {

void SetDeadline(grpc::ClientContext* ctx, RpcOptions const& options) {
    if (options.timeout.count() > 0) {
        ctx->set_deadline(std::chrono::system_clock::now() + options.timeout);
    }
}

[[nodiscard]] auto CancelledError(std::string const& context) -> CasError {
    return CasError{.kind = ErrorKind::Cancelled,
                    .message = fmt::format("{}: cancelled", context)};
}

/// \brief Convert the status of a single batch item.
[[nodiscard]] auto ToItemError(bazel_re::Status const& status,
                               Digest const& digest)
    -> std::optional<CasError> {
    static constexpr int kMaxStatusCode = grpc::StatusCode::UNAUTHENTICATED;
    if (status.code() == grpc::StatusCode::OK) {
        return std::nullopt;
    }
    auto const kind =
        (status.code() > 0 and status.code() <= kMaxStatusCode)
            ? ToErrorKind(static_cast<grpc::StatusCode>(status.code()))
            : ErrorKind::Internal;
    return CasError{.kind = kind,
                    .message = fmt::format("{}: {}: {}",
                                           digest.ToString(),
                                           status.code(),
                                           status.message())};
}

[[nodiscard]] auto MissingItemError(Digest const& digest) -> CasError {
    return CasError{
        .kind = ErrorKind::MalformedResponse,
        .message = fmt::format("no response for {}", digest.ToString())};
}

/// \brief UUID of the calling thread for upload resource names.
[[nodiscard]] auto ThreadUUID() -> std::string const& {
    thread_local static std::string const uuid =
        CreateUUIDVersion4(CreateProcessUniqueId());
    return uuid;
}

}  // namespace

auto ToErrorKind(grpc::StatusCode code) noexcept -> ErrorKind {
    // NOLINTBEGIN(bugprone-branch-clone)
    switch (code) {
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return ErrorKind::DeadlineExceeded;
        case grpc::StatusCode::UNAVAILABLE:
            return ErrorKind::Unavailable;
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            return ErrorKind::ResourceExhausted;
        case grpc::StatusCode::ABORTED:
        case grpc::StatusCode::DATA_LOSS:
            // broken connection or stream, worth retrying
            return ErrorKind::TransportReset;
        case grpc::StatusCode::UNAUTHENTICATED:
            return ErrorKind::Unauthenticated;
        case grpc::StatusCode::PERMISSION_DENIED:
            return ErrorKind::PermissionDenied;
        case grpc::StatusCode::NOT_FOUND:
            return ErrorKind::NotFound;
        case grpc::StatusCode::CANCELLED:
            return ErrorKind::Cancelled;
        case grpc::StatusCode::OUT_OF_RANGE:
            return ErrorKind::SeekError;
        case grpc::StatusCode::INVALID_ARGUMENT:
        case grpc::StatusCode::FAILED_PRECONDITION:
            return ErrorKind::MalformedResponse;
        case grpc::StatusCode::OK:
        case grpc::StatusCode::UNKNOWN:
        case grpc::StatusCode::ALREADY_EXISTS:
        case grpc::StatusCode::UNIMPLEMENTED:
        case grpc::StatusCode::INTERNAL:
        case grpc::StatusCode::DO_NOT_USE:
            return ErrorKind::Internal;
    }
    // NOLINTEND(bugprone-branch-clone)
    return ErrorKind::Internal;
}

auto ToCasError(grpc::Status const& status, std::string const& context)
    -> CasError {
    return CasError{.kind = ToErrorKind(status.error_code()),
                    .message = fmt::format("{}: {}: {}",
                                           context,
                                           static_cast<int>(status.error_code()),
                                           status.error_message())};
}

GrpcCasTransport::GrpcCasTransport(
    std::string instance_name,
    std::shared_ptr<grpc::Channel> const& channel,
    HashFunction hash_function) noexcept
    : instance_name_{std::move(instance_name)},
      hash_function_{hash_function},
      cas_stub_{bazel_re::ContentAddressableStorage::NewStub(channel)},
      bytestream_stub_{google::bytestream::ByteStream::NewStub(channel)} {}

auto GrpcCasTransport::FindMissingBlobs(std::vector<Digest> const& digests,
                                        RpcOptions const& options) noexcept
    -> expected<std::vector<Digest>, CasError> {
    try {
        if (options.cancel.IsCancelled()) {
            return unexpected{CancelledError("FindMissingBlobs")};
        }
        bazel_re::FindMissingBlobsRequest request{};
        request.set_instance_name(instance_name_);
        for (auto const& digest : digests) {
            *request.add_blob_digests() = ToBazelDigest(digest);
        }
        logger_.Emit(LogLevel::Trace,
                     "FindMissingBlobs - Request size: {} bytes",
                     request.ByteSizeLong());

        grpc::ClientContext context{};
        SetDeadline(&context, options);
        bazel_re::FindMissingBlobsResponse response{};
        auto status = cas_stub_->FindMissingBlobs(&context, request, &response);
        if (not status.ok()) {
            return unexpected{ToCasError(status, "FindMissingBlobs")};
        }
        std::vector<Digest> missing{};
        missing.reserve(
            static_cast<std::size_t>(response.missing_blob_digests_size()));
        for (auto const& d : response.missing_blob_digests()) {
            auto digest = FromBazelDigest(d, hash_function_);
            if (not digest) {
                return MakeError(ErrorKind::MalformedResponse,
                                 "FindMissingBlobs: {}",
                                 digest.error().message);
            }
            missing.emplace_back(*std::move(digest));
        }
        return missing;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "FindMissingBlobs: caught exception:\n{}",
                         e.what());
    }
}

auto GrpcCasTransport::BatchUpdateBlobs(std::vector<BlobUpload> const& blobs,
                                        RpcOptions const& options) noexcept
    -> expected<std::vector<BlobStatus>, CasError> {
    try {
        if (options.cancel.IsCancelled()) {
            return unexpected{CancelledError("BatchUpdateBlobs")};
        }
        bazel_re::BatchUpdateBlobsRequest request{};
        request.set_instance_name(instance_name_);
        for (auto const& blob : blobs) {
            auto* r = request.add_requests();
            *r->mutable_digest() = ToBazelDigest(blob.digest);
            r->set_data(blob.content);
        }
        logger_.Emit(LogLevel::Trace,
                     "BatchUpdateBlobs - Request size: {} bytes",
                     request.ByteSizeLong());

        grpc::ClientContext context{};
        SetDeadline(&context, options);
        bazel_re::BatchUpdateBlobsResponse response{};
        auto status = cas_stub_->BatchUpdateBlobs(&context, request, &response);
        if (not status.ok()) {
            return unexpected{ToCasError(status, "BatchUpdateBlobs")};
        }

        std::unordered_map<Digest, std::optional<CasError>> answered{};
        for (auto const& r : response.responses()) {
            auto digest = FromBazelDigest(r.digest(), hash_function_);
            if (not digest) {
                return MakeError(ErrorKind::MalformedResponse,
                                 "BatchUpdateBlobs: {}",
                                 digest.error().message);
            }
            auto error = ToItemError(r.status(), *digest);
            answered.insert_or_assign(*std::move(digest), std::move(error));
        }
        std::vector<BlobStatus> result{};
        result.reserve(blobs.size());
        for (auto const& blob : blobs) {
            auto it = answered.find(blob.digest);
            result.push_back(BlobStatus{
                .digest = blob.digest,
                .error = it != answered.end()
                             ? it->second
                             : std::optional{MissingItemError(blob.digest)}});
        }
        return result;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "BatchUpdateBlobs: caught exception:\n{}",
                         e.what());
    }
}

auto GrpcCasTransport::BatchReadBlobs(std::vector<Digest> const& digests,
                                      RpcOptions const& options) noexcept
    -> expected<std::vector<BlobContent>, CasError> {
    try {
        if (options.cancel.IsCancelled()) {
            return unexpected{CancelledError("BatchReadBlobs")};
        }
        bazel_re::BatchReadBlobsRequest request{};
        request.set_instance_name(instance_name_);
        for (auto const& digest : digests) {
            *request.add_digests() = ToBazelDigest(digest);
        }

        grpc::ClientContext context{};
        SetDeadline(&context, options);
        bazel_re::BatchReadBlobsResponse response{};
        auto status = cas_stub_->BatchReadBlobs(&context, request, &response);
        if (not status.ok()) {
            return unexpected{ToCasError(status, "BatchReadBlobs")};
        }

        std::unordered_map<Digest, BlobContent> answered{};
        for (auto& r : *response.mutable_responses()) {
            auto digest = FromBazelDigest(r.digest(), hash_function_);
            if (not digest) {
                return MakeError(ErrorKind::MalformedResponse,
                                 "BatchReadBlobs: {}",
                                 digest.error().message);
            }
            auto error = ToItemError(r.status(), *digest);
            answered.insert_or_assign(
                *digest,
                BlobContent{.digest = *digest,
                            .content = std::move(*r.mutable_data()),
                            .error = std::move(error)});
        }
        std::vector<BlobContent> result{};
        result.reserve(digests.size());
        for (auto const& digest : digests) {
            auto it = answered.find(digest);
            if (it == answered.end()) {
                result.push_back(BlobContent{
                    .digest = digest, .error = MissingItemError(digest)});
                continue;
            }
            result.push_back(it->second);
        }
        return result;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "BatchReadBlobs: caught exception:\n{}",
                         e.what());
    }
}

auto GrpcCasTransport::WriteStream(Digest const& digest,
                                   gsl::not_null<Chunker*> const& chunker,
                                   RpcOptions const& options) noexcept
    -> expected<std::size_t, CasError> {
    try {
        auto const resource_name =
            ByteStreamUtils::WriteRequest{instance_name_, ThreadUUID(), digest}
                .ToString();
        if (options.cancel.IsCancelled()) {
            return unexpected{CancelledError(resource_name)};
        }

        grpc::ClientContext context{};
        SetDeadline(&context, options);
        google::bytestream::WriteResponse response{};
        auto writer = bytestream_stub_->Write(&context, &response);

        google::bytestream::WriteRequest request{};
        request.set_resource_name(resource_name);
        bool broken = false;
        while (chunker->HasNext()) {
            if (options.cancel.IsCancelled()) {
                context.TryCancel();
                std::ignore = writer->Finish();
                return unexpected{CancelledError(resource_name)};
            }
            auto chunk = chunker->Next();
            if (not chunk) {
                context.TryCancel();
                std::ignore = writer->Finish();
                return unexpected{std::move(chunk).error()};
            }
            request.set_write_offset(
                gsl::narrow<std::int64_t>(chunk->offset));
            request.set_finish_write(chunk->End() == chunker->TotalSize());
            *request.mutable_data() = std::move(chunk->data);
            if (not writer->Write(request)) {
                // According to the ByteStream docs, if the connection is
                // broken during Write(), the client should query the status
                // and continue writing from the returned committed size.
                broken = true;
                break;
            }
        }
        if (not broken and not writer->WritesDone()) {
            broken = true;
        }
        auto status = writer->Finish();
        if (broken or not status.ok()) {
            auto error = status.ok()
                             ? CasError{.kind = ErrorKind::TransportReset,
                                        .message = fmt::format(
                                            "broken stream for upload to {}",
                                            resource_name)}
                             : ToCasError(status, resource_name);
            if (error.IsTransient()) {
                if (auto seek_error =
                        PrepareResume(resource_name, chunker, options)) {
                    return unexpected{*std::move(seek_error)};
                }
            }
            return unexpected{std::move(error)};
        }
        auto const committed =
            gsl::narrow<std::size_t>(response.committed_size());
        if (committed != digest.size()) {
            return MakeError(ErrorKind::MalformedResponse,
                             "committed size {} of {} differs from {}",
                             committed,
                             resource_name,
                             digest.size());
        }
        return committed;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "WriteStream: caught exception:\n{}",
                         e.what());
    }
}

auto GrpcCasTransport::ReadStream(
    Digest const& digest,
    gsl::not_null<ChunkAssembler*> const& assembler,
    RpcOptions const& options) noexcept -> expected<std::size_t, CasError> {
    try {
        auto const resource_name =
            ByteStreamUtils::ReadRequest{instance_name_, digest}.ToString();
        if (options.cancel.IsCancelled()) {
            return unexpected{CancelledError(resource_name)};
        }

        google::bytestream::ReadRequest request{};
        request.set_resource_name(resource_name);
        request.set_read_offset(gsl::narrow<std::int64_t>(assembler->Offset()));

        grpc::ClientContext context{};
        SetDeadline(&context, options);
        auto reader = bytestream_stub_->Read(&context, request);

        std::size_t received{};
        google::bytestream::ReadResponse response{};
        while (reader->Read(&response)) {
            if (options.cancel.IsCancelled()) {
                context.TryCancel();
                std::ignore = reader->Finish();
                return unexpected{CancelledError(resource_name)};
            }
            Chunk chunk{.offset = assembler->Offset(),
                        .data = std::move(*response.mutable_data())};
            auto appended = assembler->Append(chunk);
            if (not appended) {
                context.TryCancel();
                std::ignore = reader->Finish();
                return unexpected{std::move(appended).error()};
            }
            received += chunk.Length();
        }
        auto status = reader->Finish();
        if (not status.ok()) {
            logger_.Emit(LogLevel::Debug,
                         "reading {} stopped after {} bytes",
                         resource_name,
                         received);
            return unexpected{ToCasError(status, resource_name)};
        }
        return received;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "ReadStream: caught exception:\n{}",
                         e.what());
    }
}

auto GrpcCasTransport::GetTree(Digest const& root,
                               RpcOptions const& options) noexcept
    -> expected<std::vector<DirectoryNode>, CasError> {
    try {
        std::vector<DirectoryNode> result{};
        std::string page_token{};
        do {
            if (options.cancel.IsCancelled()) {
                return unexpected{CancelledError("GetTree")};
            }
            bazel_re::GetTreeRequest request{};
            request.set_instance_name(instance_name_);
            *request.mutable_root_digest() = ToBazelDigest(root);
            request.set_page_token(page_token);
            page_token.clear();

            grpc::ClientContext context{};
            SetDeadline(&context, options);
            auto stream = cas_stub_->GetTree(&context, request);
            bazel_re::GetTreeResponse response{};
            while (stream->Read(&response)) {
                for (auto const& dir : response.directories()) {
                    auto node = DirectoryNode::FromProto(dir, hash_function_);
                    if (not node) {
                        context.TryCancel();
                        std::ignore = stream->Finish();
                        return unexpected{std::move(node).error()};
                    }
                    result.emplace_back(*std::move(node));
                }
                if (not response.next_page_token().empty()) {
                    page_token = response.next_page_token();
                }
            }
            auto status = stream->Finish();
            if (not status.ok()) {
                return unexpected{ToCasError(
                    status, fmt::format("GetTree {}", root.ToString()))};
            }
        } while (not page_token.empty());
        logger_.Emit(LogLevel::Trace,
                     "GetTree {} returned {} directories",
                     root.ToString(),
                     result.size());
        return result;
    } catch (std::exception const& e) {
        return MakeError(
            ErrorKind::Internal, "GetTree: caught exception:\n{}", e.what());
    }
}

auto GrpcCasTransport::QueryWriteStatus(std::string const& resource_name,
                                        RpcOptions const& options)
    const noexcept -> std::optional<std::int64_t> {
    try {
        grpc::ClientContext context{};
        SetDeadline(&context, options);
        google::bytestream::QueryWriteStatusRequest request{};
        request.set_resource_name(resource_name);
        google::bytestream::QueryWriteStatusResponse response{};
        auto status =
            bytestream_stub_->QueryWriteStatus(&context, request, &response);
        if (not status.ok()) {
            logger_.Emit(LogLevel::Debug, [&status, &resource_name]() {
                return ToCasError(status, resource_name).ToString();
            });
            return std::nullopt;
        }
        return response.committed_size();
    } catch (std::exception const& e) {
        logger_.Emit(LogLevel::Debug,
                     "QueryWriteStatus: caught exception:\n{}",
                     e.what());
        return std::nullopt;
    }
}

auto GrpcCasTransport::PrepareResume(std::string const& resource_name,
                                     gsl::not_null<Chunker*> const& chunker,
                                     RpcOptions const& options) const noexcept
    -> std::optional<CasError> {
    auto const committed = QueryWriteStatus(
        resource_name,
        RpcOptions{.timeout = options.query_timeout, .cancel = options.cancel});
    auto const resumable =
        committed and *committed > 0 and
        static_cast<std::uint64_t>(*committed) < chunker->TotalSize();
    auto positioned =
        resumable ? chunker->Seek(static_cast<std::size_t>(*committed))
                  : chunker->Reset();
    if (not positioned) {
        return std::move(positioned).error();
    }
    logger_.Emit(LogLevel::Debug,
                 "upload to {} resumes at offset {}",
                 resource_name,
                 *positioned);
    return std::nullopt;
}
