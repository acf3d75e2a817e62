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


#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "catch2/catch.hpp"
#include "src/casclient/client/client_config.hpp"
#include "src/casclient/client/transfer_client.hpp"
#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/dispatch/dispatcher_config.hpp"
#include "src/casclient/file_system/file_system_manager.hpp"
#include "src/casclient/file_system/object_type.hpp"
#include "src/casclient/multithreading/cancellation.hpp"
#include "src/casclient/remote/retry_config.hpp"
#include "src/casclient/remote/rpc_timeouts.hpp"
#include "src/casclient/tree/directory_node.hpp"
#include "test/utils/casclient/fake_cas_transport.hpp"
#include "test/utils/test_env.hpp"

namespace {

[[nodiscard]] auto MakeClientConfig(
    std::optional<std::filesystem::path> cache_file = std::nullopt)
    -> ClientConfig {
    auto retry = RetryConfig::Builder{}
                     .SetInitialBackoff(std::chrono::milliseconds{1})
                     .SetMaxBackoff(std::chrono::milliseconds{2})
                     .SetMaxAttempts(3)
                     .SetJitter(false)
                     .Build();
    REQUIRE(retry);
    auto dispatcher = DispatcherConfig::Builder{}
                          .SetConcurrencyLimit(4)
                          .SetMaxBatchSize(4096)
                          .SetLargeBlobThreshold(512)
                          .SetChunkSize(32)
                          .SetRetryConfig(*retry)
                          .Build();
    REQUIRE(dispatcher);
    ClientConfig config{};
    config.instance_name = "tests";
    config.dispatcher = *dispatcher;
    config.cache_file = std::move(cache_file);
    return config;
}

[[nodiscard]] auto LargeContent() -> std::string {
    std::string content(1000, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>('A' + (i % 23));
    }
    return content;
}

/// \brief Populate a directory with files, an executable, an empty
/// directory, nested directories, and a symlink.
void CreateSampleTree(std::filesystem::path const& root) {
    REQUIRE(FileSystemManager::WriteFile("hello", root / "a.txt"));
    REQUIRE(FileSystemManager::WriteFile(
        "#!/bin/sh\necho hi\n", root / "bin" / "tool", /*executable=*/true));
    REQUIRE(FileSystemManager::CreateDirectory(root / "empty"));
    REQUIRE(FileSystemManager::WriteFile(
        "deep", root / "nested" / "deeper" / "file.txt"));
    REQUIRE(FileSystemManager::WriteFile(LargeContent(),
                                         root / "nested" / "large.bin"));
    REQUIRE(FileSystemManager::CreateSymlink("a.txt", root / "link"));
}

}  // namespace

TEST_CASE("Upload and download a directory", "[transfer_client]") {
    auto transport = std::make_shared<FakeCasTransport>();
    TransferClient client{transport, MakeClientConfig()};
    CancellationToken cancel{};
    auto dir = CreateTestDir();
    REQUIRE(dir);
    auto const src = dir->GetPath() / "src";
    auto const dst = dir->GetPath() / "dst";
    CreateSampleTree(src);

    auto uploaded = client.UploadTree(src, cancel);
    REQUIRE(uploaded);
    CHECK(uploaded->result.Ok());
    CHECK(transport->Contains(uploaded->root));
    CHECK(transport->Calls(RpcKind::Write) == 1);

    SECTION("uploading again transfers nothing") {
        auto again = client.UploadTree(src, cancel);
        REQUIRE(again);
        CHECK(again->root == uploaded->root);
        CHECK(again->result.Ok());
        CHECK(transport->Calls(RpcKind::BatchUpdateBlobs) == 1);
        CHECK(transport->Calls(RpcKind::Write) == 1);
    }

    SECTION("the tree is restored") {
        auto downloaded = client.DownloadDirectory(uploaded->root, dst, cancel);
        REQUIRE(downloaded);
        CHECK(downloaded->Ok());
        CHECK(FileSystemManager::ReadFile(dst / "a.txt") == "hello");
        CHECK(FileSystemManager::ReadFile(dst / "bin" / "tool") ==
              "#!/bin/sh\necho hi\n");
        CHECK(FileSystemManager::Type(dst / "bin" / "tool") ==
              ObjectType::Executable);
        CHECK(FileSystemManager::Type(dst / "a.txt") == ObjectType::File);
        CHECK(FileSystemManager::Type(dst / "empty") == ObjectType::Directory);
        CHECK(FileSystemManager::ReadFile(dst / "nested" / "deeper" /
                                          "file.txt") == "deep");
        CHECK(FileSystemManager::ReadFile(dst / "nested" / "large.bin") ==
              LargeContent());
        CHECK(FileSystemManager::Type(dst / "link") == ObjectType::Symlink);
        CHECK(FileSystemManager::ReadSymlink(dst / "link") == "a.txt");
    }

    SECTION("the tree is listed") {
        auto listing = client.ShowTree(uploaded->root, cancel);
        REQUIRE(listing);
        auto const hello = Digest::FromContent(HashFunction{}, "hello");
        CHECK(listing->find("a.txt: [File digest: " + hello.ToString() +
                            "]\n") != std::string::npos);
        CHECK(listing->find("link: [Symlink Target: a.txt]\n") !=
              std::string::npos);
        CHECK(listing->find("empty: [Directory digest: ") !=
              std::string::npos);
        CHECK(listing->find("nested/deeper/file.txt: [File digest: ") !=
              std::string::npos);

        auto flat = client.FlattenRemoteTree(uploaded->root, cancel);
        REQUIRE(flat);
        CHECK(flat->size() == 6);
        REQUIRE(flat->contains("bin/tool"));
        CHECK(flat->at("bin/tool").is_executable);
    }

    SECTION("missing subtrees are reported") {
        auto nested_node = DirectoryNode::Create(
            {FileChild{.name = "file.txt",
                       .digest = Digest::FromContent(HashFunction{}, "deep")}},
            {},
            {});
        REQUIRE(nested_node);
        auto deeper = nested_node->ComputeDigest(HashFunction{});
        REQUIRE(deeper);
        transport->Remove(*deeper);
        auto broken = client.FlattenRemoteTree(uploaded->root, cancel);
        REQUIRE_FALSE(broken);
        CHECK(broken.error().kind == ErrorKind::MissingNode);
    }

    SECTION("unknown roots are not found") {
        auto unknown = client.DownloadDirectory(
            Digest::FromContent(HashFunction{}, "no tree"), dst, cancel);
        REQUIRE_FALSE(unknown);
        CHECK(unknown.error().kind == ErrorKind::NotFound);
        CHECK_FALSE(FileSystemManager::Type(dst));
    }
}

TEST_CASE("Single blobs", "[transfer_client]") {
    auto transport = std::make_shared<FakeCasTransport>();
    TransferClient client{transport, MakeClientConfig()};
    CancellationToken cancel{};

    SECTION("upload and read back") {
        auto digest = client.UploadBlob("some content", cancel);
        REQUIRE(digest);
        CHECK(*digest == Digest::FromContent(HashFunction{}, "some content"));
        CHECK(transport->Content(*digest) == "some content");
        auto content = client.ReadBlob(*digest, cancel);
        REQUIRE(content);
        CHECK(*content == "some content");
    }

    SECTION("large blobs") {
        auto digest = client.UploadBlob(LargeContent(), cancel);
        REQUIRE(digest);
        auto content = client.ReadBlob(*digest, cancel);
        REQUIRE(content);
        CHECK(*content == LargeContent());
    }

    SECTION("empty blob") {
        auto content =
            client.ReadBlob(Digest::Empty(HashFunction{}), cancel);
        REQUIRE(content);
        CHECK(content->empty());
    }

    SECTION("download to a file") {
        auto dir = CreateTestDir();
        REQUIRE(dir);
        auto digest = transport->Store("payload");
        auto const target = dir->GetPath() / "out" / "payload";
        auto size = client.DownloadBlob(digest, target, true, cancel);
        REQUIRE(size);
        CHECK(*size == 7);
        CHECK(FileSystemManager::ReadFile(target) == "payload");
        CHECK(FileSystemManager::Type(target) == ObjectType::Executable);
    }

    SECTION("errors are passed on") {
        auto missing = client.ReadBlob(
            Digest::FromContent(HashFunction{}, "missing"), cancel);
        REQUIRE_FALSE(missing);
        CHECK(missing.error().kind == ErrorKind::NotFound);

        transport->FailCalls(
            RpcKind::FindMissingBlobs,
            CasError{.kind = ErrorKind::PermissionDenied, .message = "no"});
        auto denied = client.UploadBlob("denied", cancel);
        REQUIRE_FALSE(denied);
        CHECK(denied.error().kind == ErrorKind::PermissionDenied);
    }
}

TEST_CASE("Upload files", "[transfer_client]") {
    auto transport = std::make_shared<FakeCasTransport>();
    CancellationToken cancel{};
    auto dir = CreateTestDir();
    REQUIRE(dir);
    auto const cache_file = dir->GetPath() / "cache" / "metadata.json";
    TransferClient client{transport, MakeClientConfig(cache_file)};

    auto const one = dir->GetPath() / "one.txt";
    auto const two = dir->GetPath() / "two.txt";
    auto const absent = dir->GetPath() / "absent.txt";
    REQUIRE(FileSystemManager::WriteFile("one", one));
    REQUIRE(FileSystemManager::WriteFile("two", two));

    auto upload = client.UploadFiles({one, two, absent, dir->GetPath()}, cancel);
    CHECK_FALSE(upload.Ok());
    CHECK(upload.result.Ok());
    CHECK(upload.digests.size() == 2);
    CHECK(upload.digests.at(one) == Digest::FromContent(HashFunction{}, "one"));
    REQUIRE(upload.unreadable.size() == 2);
    CHECK(upload.unreadable[0].path == absent);
    CHECK(upload.unreadable[0].error.kind == ErrorKind::FileUnreadable);
    CHECK(upload.unreadable[1].error.kind == ErrorKind::FileUnreadable);
    CHECK(transport->BlobCount() == 2);

    SECTION("cached digests are reused") {
        auto const computed = client.Cache().Computations();
        auto again = client.UploadFiles({one, two}, cancel);
        CHECK(again.Ok());
        CHECK(client.Cache().Computations() == computed);
    }

    SECTION("the cache survives the client") {
        auto saved = client.SaveCache();
        REQUIRE(saved);
        CHECK(*saved == 2);

        TransferClient next{transport, MakeClientConfig(cache_file)};
        auto loaded = next.LoadCache();
        REQUIRE(loaded);
        CHECK(*loaded == 2);
        CHECK(next.Cache().Get(two) ==
              Digest::FromContent(HashFunction{}, "two"));
    }

    SECTION("no cache file yet") {
        TransferClient fresh{
            transport, MakeClientConfig(dir->GetPath() / "none.json")};
        auto loaded = fresh.LoadCache();
        REQUIRE(loaded);
        CHECK(*loaded == 0);
    }
}
