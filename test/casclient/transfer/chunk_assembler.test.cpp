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
#include <optional>
#include <string>

#include "catch2/catch.hpp"
#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/file_system/file_system_manager.hpp"
#include "src/casclient/file_system/object_type.hpp"
#include "src/casclient/transfer/blob_source.hpp"
#include "src/casclient/transfer/chunk_assembler.hpp"
#include "src/casclient/transfer/chunker.hpp"
#include "test/utils/test_env.hpp"

TEST_CASE("Assemble chunks in memory", "[chunk_assembler]") {
    std::string const content{"hello chunked world"};
    auto const digest = Digest::FromContent(HashFunction{}, content);
    auto chunker = Chunker::ForSource(BlobSource::FromMemory(content), 4);
    REQUIRE(chunker);

    auto assembler = ChunkAssembler::ToMemory(HashFunction{}, content.size());
    while (chunker->HasNext()) {
        auto chunk = chunker->Next();
        REQUIRE(chunk);
        auto offset = assembler.Append(*chunk);
        REQUIRE(offset);
        CHECK(*offset == chunk->End());
    }
    auto finished = assembler.Finish();
    REQUIRE(finished);
    CHECK(*finished == digest);
    auto result = std::move(assembler).TakeContent();
    REQUIRE(result);
    CHECK(*result == content);
}

TEST_CASE("Chunked blobs reassemble bit for bit", "[chunk_assembler]") {
    for (std::size_t size : {0, 1, 7, 64, 100}) {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i) {
            content[i] = static_cast<char>(i * 31);
        }
        // 8 divides 64, the other sizes leave a partial last chunk
        for (std::size_t chunk_size : {1, 8, 13, 1000}) {
            auto chunker =
                Chunker::ForSource(BlobSource::FromMemory(content), chunk_size);
            REQUIRE(chunker);
            auto assembler = ChunkAssembler::ToMemory(HashFunction{}, size);
            while (chunker->HasNext()) {
                auto chunk = chunker->Next();
                REQUIRE(chunk);
                REQUIRE(assembler.Append(*chunk));
            }
            auto finished = assembler.Finish();
            REQUIRE(finished);
            CHECK(*finished == Digest::FromContent(HashFunction{}, content));
            CHECK(std::move(assembler).TakeContent() == content);
        }
    }
}

TEST_CASE("Assembler rejects out-of-order chunks", "[chunk_assembler]") {
    auto assembler = ChunkAssembler::ToMemory(HashFunction{}, 8);
    REQUIRE(assembler.Append(Chunk{.offset = 0, .data = "abcd"}));

    SECTION("Gap") {
        auto appended = assembler.Append(Chunk{.offset = 6, .data = "gh"});
        REQUIRE_FALSE(appended);
        CHECK(appended.error().kind == ErrorKind::OutOfOrderChunk);
    }
    SECTION("Overlap") {
        auto appended = assembler.Append(Chunk{.offset = 2, .data = "cdef"});
        REQUIRE_FALSE(appended);
        CHECK(appended.error().kind == ErrorKind::OutOfOrderChunk);
    }
    SECTION("Beyond declared size") {
        auto appended =
            assembler.Append(Chunk{.offset = 4, .data = "efghij"});
        REQUIRE_FALSE(appended);
        CHECK(appended.error().kind == ErrorKind::OutOfOrderChunk);
    }
    // rejected chunks leave the state untouched
    CHECK(assembler.Offset() == 4);
    REQUIRE(assembler.Append(Chunk{.offset = 4, .data = "efgh"}));
    auto finished = assembler.Finish();
    REQUIRE(finished);
    CHECK(*finished == Digest::FromContent(HashFunction{}, "abcdefgh"));
}

TEST_CASE("Assembler detects incomplete blob", "[chunk_assembler]") {
    auto assembler = ChunkAssembler::ToMemory(HashFunction{}, 8);
    REQUIRE(assembler.Append(Chunk{.offset = 0, .data = "abcd"}));
    auto finished = assembler.Finish();
    REQUIRE_FALSE(finished);
    CHECK(finished.error().kind == ErrorKind::IncompleteBlob);
}

TEST_CASE("Assembler reset", "[chunk_assembler]") {
    auto assembler = ChunkAssembler::ToMemory(HashFunction{}, 4);
    REQUIRE(assembler.Append(Chunk{.offset = 0, .data = "xx"}));
    auto reset = assembler.Reset();
    REQUIRE(reset);
    CHECK(*reset == 0);
    REQUIRE(assembler.Append(Chunk{.offset = 0, .data = "test"}));
    auto finished = assembler.Finish();
    REQUIRE(finished);
    CHECK(*finished == Digest::FromContent(HashFunction{}, "test"));
}

TEST_CASE("Assemble chunks to file", "[chunk_assembler]") {
    auto tmp = CreateTestDir();
    REQUIRE(tmp);
    auto const target = tmp->GetPath() / "sub" / "out";
    std::string const content{"executable content"};

    {
        auto assembler = ChunkAssembler::ToFile(
            HashFunction{}, target, content.size(), /*executable=*/true);
        REQUIRE(assembler);
        REQUIRE(assembler->Append(
            Chunk{.offset = 0, .data = content.substr(0, 5)}));
        REQUIRE(assembler->Append(Chunk{.offset = 5, .data = content.substr(5)}));
        auto finished = assembler->Finish();
        REQUIRE(finished);
        CHECK(*finished == Digest::FromContent(HashFunction{}, content));
    }
    CHECK(FileSystemManager::ReadFile(target) == content);
    CHECK(FileSystemManager::Type(target) == ObjectType::Executable);
}

TEST_CASE("Unfinished file output is removed", "[chunk_assembler]") {
    auto tmp = CreateTestDir();
    REQUIRE(tmp);
    auto const target = tmp->GetPath() / "partial";
    {
        auto assembler = ChunkAssembler::ToFile(HashFunction{}, target, 10);
        REQUIRE(assembler);
        REQUIRE(assembler->Append(Chunk{.offset = 0, .data = "abc"}));
    }
    CHECK_FALSE(FileSystemManager::Type(target));
}
