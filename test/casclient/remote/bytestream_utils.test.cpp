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

#include <string>

#include "catch2/catch.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/remote/bytestream_utils.hpp"
#include "src/casclient/remote/ids.hpp"

TEST_CASE("ByteStream read resource names", "[bytestream]") {
    auto const digest = Digest::FromContent(HashFunction{}, "test");

    SECTION("With instance name") {
        ByteStreamUtils::ReadRequest request{"main/instance", digest};
        auto const name = request.ToString();
        CHECK(name == "main/instance/blobs/" + digest.hash() + "/4");

        auto parsed = ByteStreamUtils::ReadRequest::FromString(name);
        REQUIRE(parsed);
        CHECK(parsed->GetInstanceName() == "main/instance");
        auto parsed_digest = parsed->GetDigest(HashFunction{});
        REQUIRE(parsed_digest);
        CHECK(*parsed_digest == digest);
    }

    SECTION("Without instance name") {
        ByteStreamUtils::ReadRequest request{"", digest};
        CHECK(request.ToString() == "blobs/" + digest.hash() + "/4");
        auto parsed = ByteStreamUtils::ReadRequest::FromString(
            request.ToString());
        REQUIRE(parsed);
        CHECK(parsed->GetInstanceName().empty());
    }

    SECTION("Malformed names") {
        CHECK_FALSE(ByteStreamUtils::ReadRequest::FromString(""));
        CHECK_FALSE(ByteStreamUtils::ReadRequest::FromString(
            "blobs/" + digest.hash()));
        CHECK_FALSE(ByteStreamUtils::ReadRequest::FromString(
            "blobs/" + digest.hash() + "/four"));
        CHECK_FALSE(ByteStreamUtils::ReadRequest::FromString(
            "instance/" + digest.hash() + "/4"));
    }
}

TEST_CASE("ByteStream write resource names", "[bytestream]") {
    auto const digest = Digest::FromContent(HashFunction{}, "test");
    auto const uuid = CreateUUIDVersion4("seed");

    ByteStreamUtils::WriteRequest request{"instance", uuid, digest};
    auto const name = request.ToString();
    CHECK(name ==
          "instance/uploads/" + uuid + "/blobs/" + digest.hash() + "/4");

    auto parsed = ByteStreamUtils::WriteRequest::FromString(name);
    REQUIRE(parsed);
    CHECK(parsed->GetInstanceName() == "instance");
    CHECK(parsed->GetUUID() == uuid);
    auto parsed_digest = parsed->GetDigest(HashFunction{});
    REQUIRE(parsed_digest);
    CHECK(*parsed_digest == digest);

    CHECK_FALSE(ByteStreamUtils::WriteRequest::FromString(
        "instance/uploads/" + uuid + "/" + digest.hash() + "/4"));
    CHECK_FALSE(ByteStreamUtils::WriteRequest::FromString(
        "instance/blobs/" + digest.hash() + "/4"));
}

TEST_CASE("Upload UUIDs", "[bytestream]") {
    auto const uuid = CreateUUIDVersion4("seed");
    REQUIRE(uuid.size() == 36);
    CHECK(uuid[8] == '-');
    CHECK(uuid[13] == '-');
    CHECK(uuid[14] == '4');  // version
    CHECK(uuid[18] == '-');
    CHECK((uuid[19] == '8' or uuid[19] == '9' or uuid[19] == 'a' or
           uuid[19] == 'b'));  // variant
    CHECK(uuid[23] == '-');

    CHECK(CreateUUIDVersion4("seed") == uuid);
    CHECK(CreateUUIDVersion4("other") != uuid);
    CHECK_FALSE(CreateProcessUniqueId().empty());
}
