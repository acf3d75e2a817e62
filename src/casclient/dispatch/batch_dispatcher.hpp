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

#ifndef INCLUDED_SRC_CASCLIENT_DISPATCH_BATCH_DISPATCHER_HPP
#define INCLUDED_SRC_CASCLIENT_DISPATCH_BATCH_DISPATCHER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "src/casclient/common/cas_error.hpp"
#include "src/casclient/common/digest.hpp"
#include "src/casclient/dispatch/dispatcher_config.hpp"
#include "src/casclient/logging/logger.hpp"
#include "src/casclient/multithreading/cancellation.hpp"
#include "src/casclient/remote/cas_transport.hpp"
#include "src/casclient/remote/retry.hpp"
#include "src/casclient/remote/rpc_timeouts.hpp"
#include "src/casclient/transfer/blob_source.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Blob to upload together with the provider of its content.
struct UploadItem {
    Digest digest;
    BlobSource source;
};

/// \brief Blob to download, either to a file or, without a path, to memory.
struct DownloadItem {
    Digest digest;
    std::optional<std::filesystem::path> path;
    bool is_executable{false};
};

struct ItemFailure {
    Digest digest;
    CasError error;
};

/// \brief Outcome of a dispatch. Items are either completed or failed, never
/// both. A fatal error aborts the dispatch; items not processed by then are
/// reported as Cancelled.
struct DispatchResult {
    std::vector<Digest> completed;
    std::vector<ItemFailure> failures;
    std::optional<CasError> fatal;
    /// Content of blobs downloaded to memory.
    std::unordered_map<Digest, std::string> contents;

    [[nodiscard]] auto Ok() const noexcept -> bool {
        return failures.empty() and not fatal;
    }
};

enum class JobKind : std::uint8_t { Batch, Stream };

/// \brief Unit of work executed by one worker.
struct BatchJob {
    JobKind kind{JobKind::Batch};
    std::vector<Digest> digests;
    std::size_t total_size{};
};

/// \brief Split digests into jobs. Duplicates and empty blobs are dropped.
/// Each digest larger than min(large_blob_threshold, max_batch_size) gets a
/// stream job of its own. The remaining digests are ordered by size and
/// packed greedily into batch jobs of at most max_batch_size bytes.
[[nodiscard]] auto PartitionJobs(std::vector<Digest> digests,
                                 std::size_t max_batch_size,
                                 std::size_t large_blob_threshold)
    -> std::vector<BatchJob>;

/// \brief Moves blobs between the local side and the remote CAS with bounded
/// concurrency. Small blobs travel in batch requests, large blobs are
/// streamed in chunks.
class BatchDispatcher final {
  public:
    BatchDispatcher(ICasTransport::Ptr transport,
                    DispatcherConfig config) noexcept;

    [[nodiscard]] auto Config() const noexcept -> DispatcherConfig const& {
        return config_;
    }

    /// \brief Upload the blobs the remote side does not have yet.
    [[nodiscard]] auto Upload(std::vector<UploadItem> items,
                              CancellationToken const& cancel) const noexcept
        -> DispatchResult;

    /// \brief Download blobs and verify them against their digests.
    [[nodiscard]] auto Download(std::vector<DownloadItem> const& items,
                                CancellationToken const& cancel) const noexcept
        -> DispatchResult;

    /// \brief Determine which of the digests are missing remotely. Empty
    /// blobs are never missing.
    [[nodiscard]] auto FindMissing(std::vector<Digest> const& digests,
                                   CancellationToken const& cancel)
        const noexcept -> expected<std::vector<Digest>, CasError>;

  private:
    class Collector;

    ICasTransport::Ptr transport_;
    DispatcherConfig config_;
    Logger logger_{"BatchDispatcher"};

    [[nodiscard]] auto Options(RpcKind kind,
                               CancellationToken const& cancel) const
        -> RpcOptions;

    [[nodiscard]] auto QueryMissing(std::vector<Digest> const& digests,
                                    CancellationToken const& cancel,
                                    RetryBudget* budget) const noexcept
        -> expected<std::vector<Digest>, CasError>;

    /// \brief Run jobs on at most ConcurrencyLimit() workers.
    template <class TRunJob>
    void RunJobs(std::vector<BatchJob> const& jobs,
                 TRunJob const& run_job,
                 Collector* collector) const noexcept;

    void UploadBatch(BatchJob const& job,
                     std::unordered_map<Digest, BlobSource> const& sources,
                     Collector* collector) const noexcept;

    void UploadStream(Digest const& digest,
                      BlobSource source,
                      Collector* collector) const noexcept;

    void DownloadBatch(
        BatchJob const& job,
        std::unordered_map<Digest, std::vector<DownloadItem>> const& targets,
        Collector* collector) const noexcept;

    void DownloadStream(Digest const& digest,
                        std::vector<DownloadItem> const& targets,
                        Collector* collector) const noexcept;
};

#endif  // INCLUDED_SRC_CASCLIENT_DISPATCH_BATCH_DISPATCHER_HPP
