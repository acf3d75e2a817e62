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


#include <cstddef>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "catch2/catch.hpp"
#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/proto/bytestream.grpc.pb.h"
#include "src/casclient/proto/remote_cas.grpc.pb.h"
#include "src/casclient/remote/bytestream_utils.hpp"
#include "src/casclient/remote/cas_transport.hpp"
#include "src/casclient/remote/grpc_cas_transport.hpp"
#include "src/casclient/transfer/blob_source.hpp"
#include "src/casclient/transfer/chunk_assembler.hpp"
#include "src/casclient/transfer/chunker.hpp"
#include "src/casclient/tree/directory_node.hpp"

namespace {

constexpr auto kInstance = "test-instance";
constexpr std::size_t kServerChunkSize = 1024;

/// \brief Minimal CAS server keeping all blobs in memory.
class InMemoryCas final {
  public:
    void Put(std::string const& hash, std::string content) {
        std::unique_lock lock{mutex_};
        blobs_.insert_or_assign(hash, std::move(content));
    }

    [[nodiscard]] auto Get(std::string const& hash) const
        -> std::optional<std::string> {
        std::unique_lock lock{mutex_};
        auto it = blobs_.find(hash);
        if (it == blobs_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> blobs_;
};

[[nodiscard]] auto Matches(bazel_re::Digest const& digest,
                           std::string const& content) -> bool {
    auto const actual = Digest::FromContent(HashFunction{}, content);
    return actual.hash() == digest.hash() and
           static_cast<std::int64_t>(actual.size()) == digest.size_bytes();
}

class CasService final : public bazel_re::ContentAddressableStorage::Service {
  public:
    explicit CasService(InMemoryCas* storage) : storage_{storage} {}

    auto FindMissingBlobs(
        grpc::ServerContext* /*context*/,
        const bazel_re::FindMissingBlobsRequest* request,
        bazel_re::FindMissingBlobsResponse* response) -> grpc::Status final {
        if (request->instance_name() != kInstance) {
            return {grpc::StatusCode::INVALID_ARGUMENT, "unknown instance"};
        }
        for (auto const& digest : request->blob_digests()) {
            if (not storage_->Get(digest.hash())) {
                *response->add_missing_blob_digests() = digest;
            }
        }
        return grpc::Status::OK;
    }

    auto BatchUpdateBlobs(
        grpc::ServerContext* /*context*/,
        const bazel_re::BatchUpdateBlobsRequest* request,
        bazel_re::BatchUpdateBlobsResponse* response) -> grpc::Status final {
        for (auto const& r : request->requests()) {
            auto* answer = response->add_responses();
            *answer->mutable_digest() = r.digest();
            if (not Matches(r.digest(), r.data())) {
                answer->mutable_status()->set_code(
                    grpc::StatusCode::INVALID_ARGUMENT);
                answer->mutable_status()->set_message("digest mismatch");
                continue;
            }
            storage_->Put(r.digest().hash(), r.data());
        }
        return grpc::Status::OK;
    }

    auto BatchReadBlobs(grpc::ServerContext* /*context*/,
                        const bazel_re::BatchReadBlobsRequest* request,
                        bazel_re::BatchReadBlobsResponse* response)
        -> grpc::Status final {
        for (auto const& digest : request->digests()) {
            auto* answer = response->add_responses();
            *answer->mutable_digest() = digest;
            if (auto content = storage_->Get(digest.hash())) {
                answer->set_data(*std::move(content));
            }
            else {
                answer->mutable_status()->set_code(grpc::StatusCode::NOT_FOUND);
            }
        }
        return grpc::Status::OK;
    }

    /// \brief Answer in two pages: the root first, then everything below.
    auto GetTree(grpc::ServerContext* /*context*/,
                 const bazel_re::GetTreeRequest* request,
                 grpc::ServerWriter<bazel_re::GetTreeResponse>* writer)
        -> grpc::Status final {
        auto root = storage_->Get(request->root_digest().hash());
        if (not root) {
            return {grpc::StatusCode::NOT_FOUND, "unknown root"};
        }
        bazel_re::Directory root_dir{};
        if (not root_dir.ParseFromString(*root)) {
            return {grpc::StatusCode::INTERNAL, "not a directory"};
        }
        bazel_re::GetTreeResponse response{};
        if (request->page_token().empty()) {
            *response.add_directories() = root_dir;
            response.set_next_page_token("below-root");
            writer->Write(response);
            return grpc::Status::OK;
        }

        std::deque<bazel_re::Directory> queue{root_dir};
        std::unordered_set<std::string> seen{};
        while (not queue.empty()) {
            auto current = std::move(queue.front());
            queue.pop_front();
            for (auto const& child : current.directories()) {
                if (not seen.insert(child.digest().hash()).second) {
                    continue;
                }
                auto content = storage_->Get(child.digest().hash());
                if (not content) {
                    continue;
                }
                bazel_re::Directory dir{};
                if (not dir.ParseFromString(*content)) {
                    return {grpc::StatusCode::INTERNAL, "not a directory"};
                }
                *response.add_directories() = dir;
                queue.emplace_back(std::move(dir));
            }
        }
        writer->Write(response);
        return grpc::Status::OK;
    }

  private:
    InMemoryCas* storage_;
};

class ByteStreamService final : public google::bytestream::ByteStream::Service {
  public:
    explicit ByteStreamService(InMemoryCas* storage) : storage_{storage} {}

    auto Read(grpc::ServerContext* /*context*/,
              const google::bytestream::ReadRequest* request,
              grpc::ServerWriter<google::bytestream::ReadResponse>* writer)
        -> grpc::Status final {
        auto parsed =
            ByteStreamUtils::ReadRequest::FromString(request->resource_name());
        if (not parsed or parsed->GetInstanceName() != kInstance) {
            return {grpc::StatusCode::INVALID_ARGUMENT, "bad resource name"};
        }
        auto digest = parsed->GetDigest(HashFunction{});
        if (not digest) {
            return {grpc::StatusCode::INVALID_ARGUMENT, "bad digest"};
        }
        auto content = storage_->Get(digest->hash());
        if (not content) {
            return {grpc::StatusCode::NOT_FOUND, "unknown blob"};
        }
        auto offset = static_cast<std::size_t>(request->read_offset());
        if (offset > content->size()) {
            return {grpc::StatusCode::OUT_OF_RANGE, "offset too large"};
        }
        google::bytestream::ReadResponse response{};
        while (offset < content->size()) {
            response.set_data(content->substr(offset, kServerChunkSize));
            offset += response.data().size();
            if (not writer->Write(response)) {
                break;
            }
        }
        return grpc::Status::OK;
    }

    auto Write(grpc::ServerContext* /*context*/,
               grpc::ServerReader<google::bytestream::WriteRequest>* reader,
               google::bytestream::WriteResponse* response)
        -> grpc::Status final {
        google::bytestream::WriteRequest request{};
        std::optional<ByteStreamUtils::WriteRequest> resource{};
        std::string data{};
        while (reader->Read(&request)) {
            if (not resource) {
                resource = ByteStreamUtils::WriteRequest::FromString(
                    request.resource_name());
                if (not resource) {
                    return {grpc::StatusCode::INVALID_ARGUMENT,
                            "bad resource name"};
                }
            }
            if (static_cast<std::size_t>(request.write_offset()) !=
                data.size()) {
                return {grpc::StatusCode::INVALID_ARGUMENT, "bad offset"};
            }
            data.append(request.data());
            if (request.finish_write()) {
                break;
            }
        }
        if (not resource) {
            return {grpc::StatusCode::INVALID_ARGUMENT, "no requests"};
        }
        auto digest = resource->GetDigest(HashFunction{});
        if (not digest or
            Digest::FromContent(HashFunction{}, data) != *digest) {
            return {grpc::StatusCode::INVALID_ARGUMENT, "digest mismatch"};
        }
        response->set_committed_size(static_cast<std::int64_t>(data.size()));
        storage_->Put(digest->hash(), std::move(data));
        return grpc::Status::OK;
    }

    auto QueryWriteStatus(
        grpc::ServerContext* /*context*/,
        const google::bytestream::QueryWriteStatusRequest* /*request*/,
        google::bytestream::QueryWriteStatusResponse* /*response*/)
        -> grpc::Status final {
        return {grpc::StatusCode::NOT_FOUND, "no partial uploads"};
    }

  private:
    InMemoryCas* storage_;
};

/// \brief In-process server and a transport connected to it.
class TestServer final {
  public:
    TestServer() {
        grpc::ServerBuilder builder{};
        builder.RegisterService(&cas_);
        builder.RegisterService(&bytestream_);
        server_ = builder.BuildAndStart();
        REQUIRE(server_);
        transport_ = std::make_shared<GrpcCasTransport>(
            kInstance, server_->InProcessChannel(grpc::ChannelArguments{}));
    }
    TestServer(TestServer const&) = delete;
    TestServer(TestServer&&) = delete;
    auto operator=(TestServer const&) -> TestServer& = delete;
    auto operator=(TestServer&&) -> TestServer& = delete;
    ~TestServer() { server_->Shutdown(); }

    [[nodiscard]] auto Transport() const -> ICasTransport& {
        return *transport_;
    }

    auto Store(std::string content) -> Digest {
        auto digest = Digest::FromContent(HashFunction{}, content);
        storage_.Put(digest.hash(), std::move(content));
        return digest;
    }

    [[nodiscard]] auto Content(Digest const& digest) const
        -> std::optional<std::string> {
        return storage_.Get(digest.hash());
    }

  private:
    InMemoryCas storage_;
    CasService cas_{&storage_};
    ByteStreamService bytestream_{&storage_};
    std::unique_ptr<grpc::Server> server_;
    std::shared_ptr<ICasTransport> transport_;
};

[[nodiscard]] auto StoreDirectory(TestServer* server, DirectoryNode const& node)
    -> Digest {
    auto bytes = node.Serialize();
    REQUIRE(bytes);
    return server->Store(*std::move(bytes));
}

}  // namespace

TEST_CASE("gRPC status codes are classified", "[grpc_status]") {
    using grpc::StatusCode;
    CHECK(ToErrorKind(StatusCode::DEADLINE_EXCEEDED) ==
          ErrorKind::DeadlineExceeded);
    CHECK(ToErrorKind(StatusCode::UNAVAILABLE) == ErrorKind::Unavailable);
    CHECK(ToErrorKind(StatusCode::RESOURCE_EXHAUSTED) ==
          ErrorKind::ResourceExhausted);
    CHECK(ToErrorKind(StatusCode::ABORTED) == ErrorKind::TransportReset);
    CHECK(ToErrorKind(StatusCode::DATA_LOSS) == ErrorKind::TransportReset);
    CHECK(ToErrorKind(StatusCode::UNAUTHENTICATED) ==
          ErrorKind::Unauthenticated);
    CHECK(ToErrorKind(StatusCode::PERMISSION_DENIED) ==
          ErrorKind::PermissionDenied);
    CHECK(ToErrorKind(StatusCode::NOT_FOUND) == ErrorKind::NotFound);
    CHECK(ToErrorKind(StatusCode::CANCELLED) == ErrorKind::Cancelled);
    CHECK(ToErrorKind(StatusCode::OUT_OF_RANGE) == ErrorKind::SeekError);
    CHECK(ToErrorKind(StatusCode::INVALID_ARGUMENT) ==
          ErrorKind::MalformedResponse);
    CHECK(ToErrorKind(StatusCode::FAILED_PRECONDITION) ==
          ErrorKind::MalformedResponse);
    CHECK(ToErrorKind(StatusCode::UNKNOWN) == ErrorKind::Internal);
    CHECK(ToErrorKind(StatusCode::UNIMPLEMENTED) == ErrorKind::Internal);
    CHECK(ToErrorKind(StatusCode::INTERNAL) == ErrorKind::Internal);

    SECTION("transient and fatal codes") {
        CHECK(IsTransient(ToErrorKind(StatusCode::UNAVAILABLE)));
        CHECK(IsTransient(ToErrorKind(StatusCode::ABORTED)));
        CHECK_FALSE(IsTransient(ToErrorKind(StatusCode::NOT_FOUND)));
        CHECK(IsFatal(ToErrorKind(StatusCode::UNAUTHENTICATED)));
        CHECK(IsFatal(ToErrorKind(StatusCode::PERMISSION_DENIED)));
        CHECK_FALSE(IsFatal(ToErrorKind(StatusCode::DEADLINE_EXCEEDED)));
    }

    SECTION("conversion keeps context and message") {
        auto error = ToCasError(
            grpc::Status{StatusCode::UNAVAILABLE, "connection refused"},
            "FindMissingBlobs");
        CHECK(error.kind == ErrorKind::Unavailable);
        CHECK(error.message.find("FindMissingBlobs") != std::string::npos);
        CHECK(error.message.find("connection refused") != std::string::npos);
    }
}

TEST_CASE("gRPC transport against an in-process server", "[grpc_transport]") {
    TestServer server{};
    auto& transport = server.Transport();
    RpcOptions options{.timeout = std::chrono::milliseconds{10000}};

    SECTION("find missing blobs") {
        auto stored = server.Store("stored");
        auto absent = Digest::FromContent(HashFunction{}, "absent");
        auto missing = transport.FindMissingBlobs({stored, absent}, options);
        REQUIRE(missing);
        REQUIRE(missing->size() == 1);
        CHECK(missing->front() == absent);
    }

    SECTION("batch update and read") {
        std::vector<BlobUpload> blobs{
            {.digest = Digest::FromContent(HashFunction{}, "foo"),
             .content = "foo"},
            {.digest = Digest::FromContent(HashFunction{}, "bar"),
             .content = "bar"}};
        auto statuses = transport.BatchUpdateBlobs(blobs, options);
        REQUIRE(statuses);
        REQUIRE(statuses->size() == 2);
        for (auto const& status : *statuses) {
            CHECK_FALSE(status.error);
        }
        CHECK(server.Content(blobs[0].digest) == "foo");

        auto absent = Digest::FromContent(HashFunction{}, "absent");
        auto read = transport.BatchReadBlobs(
            {blobs[1].digest, absent, blobs[0].digest}, options);
        REQUIRE(read);
        REQUIRE(read->size() == 3);
        CHECK((*read)[0].content == "bar");
        CHECK_FALSE((*read)[0].error);
        REQUIRE((*read)[1].error);
        CHECK((*read)[1].error->kind == ErrorKind::NotFound);
        CHECK((*read)[2].content == "foo");
    }

    SECTION("batch update reports rejected items") {
        std::vector<BlobUpload> blobs{
            {.digest = Digest::FromContent(HashFunction{}, "expected"),
             .content = "corrupted"}};
        auto statuses = transport.BatchUpdateBlobs(blobs, options);
        REQUIRE(statuses);
        REQUIRE(statuses->size() == 1);
        REQUIRE(statuses->front().error);
        CHECK(statuses->front().error->kind == ErrorKind::MalformedResponse);
    }

    SECTION("stream a blob up and down") {
        std::string content(5 * kServerChunkSize + 17, 'x');
        for (std::size_t i = 0; i < content.size(); ++i) {
            content[i] = static_cast<char>('a' + (i % 26));
        }
        auto digest = Digest::FromContent(HashFunction{}, content);

        auto chunker = Chunker::ForSource(BlobSource::FromMemory(content),
                                          /*chunk_size=*/777);
        REQUIRE(chunker);
        auto committed = transport.WriteStream(digest, &*chunker, options);
        REQUIRE(committed);
        CHECK(*committed == content.size());
        CHECK(server.Content(digest) == content);

        auto assembler =
            ChunkAssembler::ToMemory(HashFunction{}, content.size());
        auto received = transport.ReadStream(digest, &assembler, options);
        REQUIRE(received);
        CHECK(*received == content.size());
        auto finished = assembler.Finish();
        REQUIRE(finished);
        CHECK(*finished == digest);
        CHECK(std::move(assembler).TakeContent() == content);
    }

    SECTION("read resumes at the assembler offset") {
        auto digest = server.Store("0123456789");
        auto assembler = ChunkAssembler::ToMemory(HashFunction{}, 10);
        REQUIRE(assembler.Append(Chunk{.offset = 0, .data = "0123"}));
        auto received = transport.ReadStream(digest, &assembler, options);
        REQUIRE(received);
        CHECK(*received == 6);
        REQUIRE(assembler.Finish());
        CHECK(std::move(assembler).TakeContent() == "0123456789");
    }

    SECTION("reading an unknown blob") {
        auto digest = Digest::FromContent(HashFunction{}, "unknown");
        auto assembler = ChunkAssembler::ToMemory(HashFunction{}, 7);
        auto received = transport.ReadStream(digest, &assembler, options);
        REQUIRE_FALSE(received);
        CHECK(received.error().kind == ErrorKind::NotFound);
    }

    SECTION("cancelled calls are not sent") {
        RpcOptions cancelled{.timeout = options.timeout,
                             .cancel = options.cancel.MakeChild()};
        cancelled.cancel.Cancel();
        auto missing = transport.FindMissingBlobs(
            {Digest::FromContent(HashFunction{}, "x")}, cancelled);
        REQUIRE_FALSE(missing);
        CHECK(missing.error().kind == ErrorKind::Cancelled);
    }

    SECTION("tree is fetched across pages") {
        auto file = server.Store("file content");
        auto leaf = DirectoryNode::Create(
            {{.name = "c", .digest = file, .is_executable = true}}, {}, {});
        REQUIRE(leaf);
        auto leaf_digest = StoreDirectory(&server, *leaf);
        auto root = DirectoryNode::Create(
            {{.name = "a.txt", .digest = file}},
            {{.name = "b", .digest = leaf_digest}},
            {{.name = "link", .target = "a.txt"}});
        REQUIRE(root);
        auto root_digest = StoreDirectory(&server, *root);

        auto tree = transport.GetTree(root_digest, options);
        REQUIRE(tree);
        REQUIRE(tree->size() == 2);
        CHECK((*tree)[0].Files().size() == 1);
        CHECK((*tree)[0].Symlinks().size() == 1);
        REQUIRE((*tree)[1].Files().size() == 1);
        CHECK((*tree)[1].Files()[0].is_executable);

        auto unknown = transport.GetTree(
            Digest::FromContent(HashFunction{}, "no tree"), options);
        REQUIRE_FALSE(unknown);
        CHECK(unknown.error().kind == ErrorKind::NotFound);
    }
}
