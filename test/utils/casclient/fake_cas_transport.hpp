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

#ifndef INCLUDED_SRC_TEST_UTILS_CASCLIENT_FAKE_CAS_TRANSPORT_HPP
#define INCLUDED_SRC_TEST_UTILS_CASCLIENT_FAKE_CAS_TRANSPORT_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/crypto/hash_function.hpp"
#include "src/casclient/remote/cas_transport.hpp"
#include "src/casclient/remote/rpc_timeouts.hpp"
#include "src/casclient/transfer/chunk_assembler.hpp"
#include "src/casclient/transfer/chunker.hpp"
#include "src/casclient/tree/directory_node.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief In-memory CAS server behind the transport interface. Supports
/// injection of per-call and per-blob failures, broken streams, corrupted
/// content, and artificial latency. Records call counts and the maximum
/// number of concurrently active calls.
class FakeCasTransport final : public ICasTransport {
  public:
    static constexpr auto kForever = std::numeric_limits<std::size_t>::max();

    explicit FakeCasTransport(HashFunction hash_function = HashFunction{})
        : hash_function_{hash_function} {}

    auto Store(std::string content) -> Digest {
        auto digest = Digest::FromContent(hash_function_, content);
        std::unique_lock lock{mutex_};
        blobs_[digest] = std::move(content);
        return digest;
    }

    auto StoreDirectory(DirectoryNode const& node) -> Digest {
        auto bytes = node.Serialize();
        ThrowOnError(bytes);
        return Store(*std::move(bytes));
    }

    [[nodiscard]] auto Content(Digest const& digest) const
        -> std::optional<std::string> {
        std::unique_lock lock{mutex_};
        if (auto it = blobs_.find(digest); it != blobs_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto Contains(Digest const& digest) const -> bool {
        return digest.IsEmpty() or Content(digest).has_value();
    }

    [[nodiscard]] auto BlobCount() const -> std::size_t {
        std::unique_lock lock{mutex_};
        return blobs_.size();
    }

    void Remove(Digest const& digest) {
        std::unique_lock lock{mutex_};
        blobs_.erase(digest);
    }

    /// \brief Fail the next `times` calls of the given kind as a whole.
    void FailCalls(RpcKind kind, CasError error, std::size_t times = kForever) {
        std::unique_lock lock{mutex_};
        call_failures_[kind] = Injected{std::move(error), times};
    }

    /// \brief Fail the next `times` transfers of the given blob, in batches
    /// as item status and in streams as call error.
    void FailBlob(Digest const& digest,
                  CasError error,
                  std::size_t times = kForever) {
        std::unique_lock lock{mutex_};
        blob_failures_[digest] = Injected{std::move(error), times};
    }

    /// \brief Serve the given content instead of the stored one.
    void CorruptBlob(Digest const& digest, std::string content) {
        std::unique_lock lock{mutex_};
        corrupted_[digest] = std::move(content);
    }

    /// \brief Break the next `times` streams after transferring `bytes`.
    void BreakStreamsAfter(std::size_t bytes, std::size_t times) {
        std::unique_lock lock{mutex_};
        break_after_ = bytes;
        breaks_left_ = times;
    }

    /// \brief Let every call take at least the given time. Calls return
    /// early with Cancelled if their token fires.
    void SetLatency(std::chrono::milliseconds latency) { latency_ = latency; }

    void SetReadChunkSize(std::size_t size) { read_chunk_size_ = size; }

    [[nodiscard]] auto Calls(RpcKind kind) const -> std::size_t {
        std::unique_lock lock{mutex_};
        auto it = calls_.find(kind);
        return it != calls_.end() ? it->second : 0;
    }

    [[nodiscard]] auto MaxConcurrentCalls() const -> std::size_t {
        return max_active_;
    }

    /// \brief Digest lists of all batch update calls, in call order.
    [[nodiscard]] auto UpdateBatches() const
        -> std::vector<std::vector<Digest>> {
        std::unique_lock lock{mutex_};
        return update_batches_;
    }

    [[nodiscard]] auto LastTimeout(RpcKind kind) const
        -> std::optional<std::chrono::milliseconds> {
        std::unique_lock lock{mutex_};
        if (auto it = timeouts_.find(kind); it != timeouts_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto FindMissingBlobs(std::vector<Digest> const& digests,
                                        RpcOptions const& options) noexcept
        -> expected<std::vector<Digest>, CasError> final {
        auto call = Enter(RpcKind::FindMissingBlobs, options);
        if (auto error = call.Error()) {
            return unexpected{*std::move(error)};
        }
        std::vector<Digest> missing{};
        std::unique_lock lock{mutex_};
        for (auto const& digest : digests) {
            if (not digest.IsEmpty() and not blobs_.contains(digest)) {
                missing.push_back(digest);
            }
        }
        return missing;
    }

    [[nodiscard]] auto BatchUpdateBlobs(std::vector<BlobUpload> const& blobs,
                                        RpcOptions const& options) noexcept
        -> expected<std::vector<BlobStatus>, CasError> final {
        auto call = Enter(RpcKind::BatchUpdateBlobs, options);
        if (auto error = call.Error()) {
            return unexpected{*std::move(error)};
        }
        std::vector<BlobStatus> statuses{};
        std::vector<Digest> batch{};
        std::unique_lock lock{mutex_};
        for (auto const& blob : blobs) {
            batch.push_back(blob.digest);
            if (auto error = TakeBlobFailure(blob.digest)) {
                statuses.push_back(
                    BlobStatus{.digest = blob.digest, .error = error});
                continue;
            }
            if (Digest::FromContent(hash_function_, blob.content) !=
                blob.digest) {
                statuses.push_back(BlobStatus{
                    .digest = blob.digest,
                    .error = CasError{.kind = ErrorKind::MalformedResponse,
                                      .message = "digest mismatch"}});
                continue;
            }
            blobs_[blob.digest] = blob.content;
            statuses.push_back(
                BlobStatus{.digest = blob.digest, .error = std::nullopt});
        }
        update_batches_.push_back(std::move(batch));
        return statuses;
    }

    [[nodiscard]] auto BatchReadBlobs(std::vector<Digest> const& digests,
                                      RpcOptions const& options) noexcept
        -> expected<std::vector<BlobContent>, CasError> final {
        auto call = Enter(RpcKind::BatchReadBlobs, options);
        if (auto error = call.Error()) {
            return unexpected{*std::move(error)};
        }
        std::vector<BlobContent> contents{};
        std::unique_lock lock{mutex_};
        for (auto const& digest : digests) {
            if (auto error = TakeBlobFailure(digest)) {
                contents.push_back(
                    BlobContent{.digest = digest, .error = error});
                continue;
            }
            auto content = ServedContent(digest);
            if (not content) {
                contents.push_back(BlobContent{
                    .digest = digest, .error = NotFound(digest)});
                continue;
            }
            contents.push_back(BlobContent{.digest = digest,
                                           .content = *std::move(content),
                                           .error = std::nullopt});
        }
        return contents;
    }

    [[nodiscard]] auto WriteStream(Digest const& digest,
                                   gsl::not_null<Chunker*> const& chunker,
                                   RpcOptions const& options) noexcept
        -> expected<std::size_t, CasError> final {
        auto call = Enter(RpcKind::Write, options);
        if (auto error = call.Error()) {
            return unexpected{*std::move(error)};
        }
        std::unique_lock lock{mutex_};
        if (auto error = TakeBlobFailure(digest)) {
            return unexpected{*std::move(error)};
        }
        auto& partial = partial_writes_[digest];
        if (chunker->Offset() > partial.size()) {
            return Malformed("write beyond committed size");
        }
        partial.resize(chunker->Offset());
        auto const start = partial.size();
        auto const breaks = TakeBreak();
        while (chunker->HasNext()) {
            auto chunk = chunker->Next();
            if (not chunk) {
                return unexpected{std::move(chunk).error()};
            }
            if (chunk->offset != partial.size()) {
                return Malformed("non-contiguous write");
            }
            partial += chunk->data;
            if (breaks and partial.size() - start >= break_after_ and
                partial.size() < chunker->TotalSize()) {
                // a client resumes after asking for the committed size
                ++calls_[RpcKind::QueryWriteStatus];
                timeouts_[RpcKind::QueryWriteStatus] = options.query_timeout;
                std::ignore = chunker->Seek(partial.size());
                return unexpected{CasError{.kind = ErrorKind::TransportReset,
                                           .message = "stream broken"}};
            }
        }
        auto content = std::move(partial);
        partial_writes_.erase(digest);
        if (Digest::FromContent(hash_function_, content) != digest) {
            return Malformed("digest mismatch");
        }
        auto const size = content.size();
        blobs_[digest] = std::move(content);
        return size;
    }

    [[nodiscard]] auto ReadStream(
        Digest const& digest,
        gsl::not_null<ChunkAssembler*> const& assembler,
        RpcOptions const& options) noexcept
        -> expected<std::size_t, CasError> final {
        auto call = Enter(RpcKind::Read, options);
        if (auto error = call.Error()) {
            return unexpected{*std::move(error)};
        }
        std::unique_lock lock{mutex_};
        if (auto error = TakeBlobFailure(digest)) {
            return unexpected{*std::move(error)};
        }
        auto content = ServedContent(digest);
        if (not content) {
            return unexpected{NotFound(digest)};
        }
        auto const breaks = TakeBreak();
        std::size_t received = 0;
        auto offset = assembler->Offset();
        while (offset < content->size()) {
            auto length = std::min(read_chunk_size_, content->size() - offset);
            auto appended = assembler->Append(
                Chunk{.offset = offset, .data = content->substr(offset, length)});
            if (not appended) {
                return unexpected{std::move(appended).error()};
            }
            offset += length;
            received += length;
            if (breaks and received >= break_after_ and
                offset < content->size()) {
                return unexpected{CasError{.kind = ErrorKind::TransportReset,
                                           .message = "stream broken"}};
            }
        }
        return received;
    }

    [[nodiscard]] auto GetTree(Digest const& root,
                               RpcOptions const& options) noexcept
        -> expected<std::vector<DirectoryNode>, CasError> final {
        auto call = Enter(RpcKind::GetTree, options);
        if (auto error = call.Error()) {
            return unexpected{*std::move(error)};
        }
        std::unique_lock lock{mutex_};
        std::vector<DirectoryNode> nodes{};
        std::deque<Digest> queue{root};
        std::unordered_map<Digest, bool> seen{};
        while (not queue.empty()) {
            auto digest = queue.front();
            queue.pop_front();
            if (seen[digest]) {
                continue;
            }
            seen[digest] = true;
            auto content = ServedContent(digest);
            if (not content) {
                if (digest == root) {
                    return unexpected{NotFound(digest)};
                }
                continue;  // incomplete tree, as a server may return it
            }
            auto node = DirectoryNode::Deserialize(*content, hash_function_);
            if (not node) {
                return unexpected{std::move(node).error()};
            }
            for (auto const& dir : node->Directories()) {
                queue.push_back(dir.digest);
            }
            nodes.push_back(*std::move(node));
        }
        return nodes;
    }

  private:
    struct Injected {
        CasError error;
        std::size_t times{};
    };

    /// \brief Bookkeeping of one active call.
    class ActiveCall final {
      public:
        ActiveCall(gsl::not_null<FakeCasTransport*> const& owner,
                   std::optional<CasError> error)
            : owner_{owner}, error_{std::move(error)} {}
        ActiveCall(ActiveCall const&) = delete;
        ActiveCall(ActiveCall&&) = delete;
        auto operator=(ActiveCall const&) -> ActiveCall& = delete;
        auto operator=(ActiveCall&&) -> ActiveCall& = delete;
        ~ActiveCall() { --owner_->active_; }

        [[nodiscard]] auto Error() const -> std::optional<CasError> {
            return error_;
        }

      private:
        gsl::not_null<FakeCasTransport*> owner_;
        std::optional<CasError> error_;
    };

    HashFunction hash_function_;
    mutable std::mutex mutex_;
    std::unordered_map<Digest, std::string> blobs_;
    std::unordered_map<Digest, std::string> partial_writes_;
    std::unordered_map<Digest, std::string> corrupted_;
    std::map<RpcKind, Injected> call_failures_;
    std::unordered_map<Digest, Injected> blob_failures_;
    std::map<RpcKind, std::size_t> calls_;
    std::map<RpcKind, std::chrono::milliseconds> timeouts_;
    std::vector<std::vector<Digest>> update_batches_;
    std::size_t break_after_{0};
    std::size_t breaks_left_{0};
    std::size_t read_chunk_size_{1024};
    std::atomic<std::chrono::milliseconds> latency_{
        std::chrono::milliseconds{0}};
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> max_active_{0};

    static void ThrowOnError(
        expected<std::string, CasError> const& bytes) {
        if (not bytes) {
            throw std::runtime_error{bytes.error().ToString()};
        }
    }

    [[nodiscard]] auto Enter(RpcKind kind, RpcOptions const& options)
        -> ActiveCall {
        auto const active = ++active_;
        auto max = max_active_.load();
        while (active > max and
               not max_active_.compare_exchange_weak(max, active)) {
        }
        {
            std::unique_lock lock{mutex_};
            ++calls_[kind];
            timeouts_[kind] = options.timeout;
        }
        auto const latency = latency_.load();
        if (latency.count() > 0 ? options.cancel.WaitFor(latency)
                                : options.cancel.IsCancelled()) {
            return ActiveCall{this,
                              CasError{.kind = ErrorKind::Cancelled,
                                       .message = "call cancelled"}};
        }
        std::unique_lock lock{mutex_};
        if (auto it = call_failures_.find(kind);
            it != call_failures_.end() and it->second.times > 0) {
            --it->second.times;
            return ActiveCall{this, it->second.error};
        }
        return ActiveCall{this, std::nullopt};
    }

    [[nodiscard]] auto TakeBlobFailure(Digest const& digest)
        -> std::optional<CasError> {
        if (auto it = blob_failures_.find(digest);
            it != blob_failures_.end() and it->second.times > 0) {
            --it->second.times;
            return it->second.error;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto TakeBreak() -> bool {
        if (breaks_left_ > 0) {
            --breaks_left_;
            return true;
        }
        return false;
    }

    [[nodiscard]] auto ServedContent(Digest const& digest) const
        -> std::optional<std::string> {
        if (digest.IsEmpty()) {
            return std::string{};
        }
        if (auto it = corrupted_.find(digest); it != corrupted_.end()) {
            return it->second;
        }
        if (auto it = blobs_.find(digest); it != blobs_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] static auto NotFound(Digest const& digest) -> CasError {
        return CasError{
            .kind = ErrorKind::NotFound,
            .message = fmt::format("blob {} not found", digest.ToString())};
    }

    [[nodiscard]] static auto Malformed(std::string const& message)
        -> unexpected<CasError> {
        return unexpected{
            CasError{.kind = ErrorKind::MalformedResponse, .message = message}};
    }
};

#endif  // INCLUDED_SRC_TEST_UTILS_CASCLIENT_FAKE_CAS_TRANSPORT_HPP
