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

#include "src/casclient/dispatch/batch_dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iterator>
#include <mutex>
#include <unordered_set>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/casclient/file_system/file_system_manager.hpp"
#include "src/casclient/logging/log_level.hpp"
#include "src/casclient/multithreading/task_system.hpp"
#include "src/casclient/transfer/chunk_assembler.hpp"
#include "src/casclient/transfer/chunker.hpp"

/// \brief Thread-safe accumulator of a dispatch result. Owns the token that
/// aborts the dispatch on fatal errors.
class BatchDispatcher::Collector final {
  public:
    Collector(CancellationToken const& cancel,
              std::optional<std::size_t> max_total_retries,
              Logger const* logger)
        : abort_{cancel.MakeChild()},
          budget_{max_total_retries},
          logger_{logger} {}

    [[nodiscard]] auto Abort() const noexcept -> CancellationToken const& {
        return abort_;
    }

    [[nodiscard]] auto Budget() noexcept -> RetryBudget* { return &budget_; }

    void Complete(Digest const& digest) noexcept {
        std::unique_lock lock{mutex_};
        result_.completed.push_back(digest);
    }

    /// \brief Record a failed item. Fatal errors additionally abort the
    /// dispatch.
    void Fail(Digest const& digest, CasError error) noexcept {
        if (error.IsFatal()) {
            Fatal(error);
        }
        else if (error.kind != ErrorKind::Cancelled) {
            logger_->Emit(LogLevel::Warning,
                          "{} failed: {}",
                          digest.ToString(),
                          error.ToString());
        }
        std::unique_lock lock{mutex_};
        result_.failures.push_back(
            ItemFailure{.digest = digest, .error = std::move(error)});
    }

    /// \brief Abort the dispatch. The first fatal error is kept.
    void Fatal(CasError const& error) noexcept {
        {
            std::unique_lock lock{mutex_};
            if (result_.fatal) {
                return;
            }
            result_.fatal = error;
        }
        logger_->Emit(
            LogLevel::Error, "aborting dispatch: {}", error.ToString());
        abort_.Cancel();
    }

    /// \brief Report items that were not processed because of cancellation.
    void CancelAll(std::vector<Digest> const& digests) noexcept {
        std::string reason{"cancelled"};
        {
            std::unique_lock lock{mutex_};
            if (result_.fatal) {
                reason = fmt::format("aborted after fatal error: {}",
                                     result_.fatal->ToString());
            }
        }
        for (auto const& digest : digests) {
            Fail(digest,
                 CasError{.kind = ErrorKind::Cancelled, .message = reason});
        }
    }

    /// \brief Write verified content to all targets of its digest.
    void Deliver(Digest const& digest,
                 std::string content,
                 std::vector<DownloadItem> const& targets) noexcept {
        bool to_memory = false;
        for (auto const& target : targets) {
            if (not target.path) {
                to_memory = true;
                continue;
            }
            if (not FileSystemManager::WriteFile(
                    content, *target.path, target.is_executable)) {
                Fail(digest,
                     CasError{.kind = ErrorKind::LocalIoError,
                              .message = fmt::format("cannot write {}",
                                                     target.path->string())});
                return;
            }
        }
        std::unique_lock lock{mutex_};
        if (to_memory) {
            result_.contents.insert_or_assign(digest, std::move(content));
        }
        result_.completed.push_back(digest);
    }

    void AddContent(Digest const& digest, std::string content) noexcept {
        std::unique_lock lock{mutex_};
        result_.contents.insert_or_assign(digest, std::move(content));
    }

    [[nodiscard]] auto Take() && noexcept -> DispatchResult {
        std::unique_lock lock{mutex_};
        return std::move(result_);
    }

  private:
    std::mutex mutex_;
    DispatchResult result_;
    CancellationToken abort_;
    RetryBudget budget_;
    Logger const* logger_;
};

namespace {

[[nodiscard]] auto DigestsOf(std::vector<BlobUpload> const& blobs)
    -> std::vector<Digest> {
    std::vector<Digest> digests{};
    digests.reserve(blobs.size());
    std::transform(blobs.begin(),
                   blobs.end(),
                   std::back_inserter(digests),
                   [](auto const& blob) { return blob.digest; });
    return digests;
}

[[nodiscard]] auto MismatchError(Digest const& expected_digest,
                                 Digest const& actual_digest) -> CasError {
    return CasError{.kind = ErrorKind::DigestMismatch,
                    .message = fmt::format("expected {}, got {}",
                                           expected_digest.ToString(),
                                           actual_digest.ToString())};
}

/// \brief Hash the content behind a chunker and rewind it to the start.
[[nodiscard]] auto HashChunks(HashFunction hash_function,
                              Chunker* chunker) noexcept
    -> expected<Digest, CasError> {
    auto hasher = hash_function.MakeHasher();
    std::size_t size{};
    while (chunker->HasNext()) {
        auto chunk = chunker->Next();
        if (not chunk) {
            return unexpected{std::move(chunk).error()};
        }
        if (not hasher.Update(chunk->data)) {
            return MakeError(ErrorKind::Internal,
                             "hashing chunk at offset {} failed",
                             chunk->offset);
        }
        size += chunk->Length();
    }
    auto hash = std::move(hasher).Finalize();
    if (not hash) {
        return MakeError(ErrorKind::Internal, "finalizing hash failed");
    }
    if (auto rewound = chunker->Reset(); not rewound) {
        return unexpected{std::move(rewound).error()};
    }
    return Digest::Create(hash->HexString(), size, hash_function);
}

}  // namespace

auto PartitionJobs(std::vector<Digest> digests,
                   std::size_t max_batch_size,
                   std::size_t large_blob_threshold) -> std::vector<BatchJob> {
    std::sort(digests.begin(), digests.end());
    digests.erase(std::unique(digests.begin(), digests.end()), digests.end());
    std::erase_if(digests, [](Digest const& d) { return d.IsEmpty(); });

    auto const stream_limit = std::min(large_blob_threshold, max_batch_size);
    std::vector<BatchJob> jobs{};
    std::vector<Digest> small{};
    for (auto& digest : digests) {
        if (digest.size() > stream_limit) {
            auto const size = digest.size();
            jobs.push_back(BatchJob{.kind = JobKind::Stream,
                                    .digests = {std::move(digest)},
                                    .total_size = size});
        }
        else {
            small.push_back(std::move(digest));
        }
    }

    std::stable_sort(
        small.begin(), small.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.size() < rhs.size();
        });
    BatchJob current{};
    for (auto& digest : small) {
        if (not current.digests.empty() and
            current.total_size + digest.size() > max_batch_size) {
            jobs.push_back(std::move(current));
            current = BatchJob{};
        }
        current.total_size += digest.size();
        current.digests.push_back(std::move(digest));
    }
    if (not current.digests.empty()) {
        jobs.push_back(std::move(current));
    }
    return jobs;
}

BatchDispatcher::BatchDispatcher(ICasTransport::Ptr transport,
                                 DispatcherConfig config) noexcept
    : transport_{std::move(transport)}, config_{std::move(config)} {
    Expects(transport_ != nullptr);
}

auto BatchDispatcher::Options(RpcKind kind,
                              CancellationToken const& cancel) const
    -> RpcOptions {
    auto const& timeouts = config_.Timeouts();
    return RpcOptions{
        .timeout = timeouts.Get(kind),
        .cancel = cancel,
        .query_timeout = kind == RpcKind::Write
                             ? timeouts.Get(RpcKind::QueryWriteStatus)
                             : std::chrono::milliseconds{0}};
}

template <class TRunJob>
void BatchDispatcher::RunJobs(std::vector<BatchJob> const& jobs,
                              TRunJob const& run_job,
                              Collector* collector) const noexcept {
    if (jobs.empty()) {
        return;
    }
    auto const workers = std::min(config_.ConcurrencyLimit(), jobs.size());
    logger_.Emit(LogLevel::Debug,
                 "running {} jobs on {} workers",
                 jobs.size(),
                 workers);
    std::size_t queued{};
    try {
        TaskSystem ts{workers};
        for (auto const& job : jobs) {
            ts.QueueTask([&job, &run_job, collector]() {
                if (collector->Abort().IsCancelled()) {
                    collector->CancelAll(job.digests);
                    return;
                }
                run_job(job);
            });
            ++queued;
        }
    } catch (std::exception const& e) {
        // queued jobs have run or cancelled themselves by now
        collector->Fatal(CasError{
            .kind = ErrorKind::Internal,
            .message = fmt::format("scheduling jobs failed:\n{}", e.what())});
        for (auto i = queued; i < jobs.size(); ++i) {
            collector->CancelAll(jobs[i].digests);
        }
    }
}

auto BatchDispatcher::QueryMissing(std::vector<Digest> const& digests,
                                   CancellationToken const& cancel,
                                   RetryBudget* budget) const noexcept
    -> expected<std::vector<Digest>, CasError> {
    try {
        std::vector<Digest> missing{};
        auto const group_size = config_.MaxQueryBatchDigests();
        for (std::size_t start = 0; start < digests.size();
             start += group_size) {
            auto const end = std::min(start + group_size, digests.size());
            std::vector<Digest> group(
                digests.begin() + gsl::narrow<std::ptrdiff_t>(start),
                digests.begin() + gsl::narrow<std::ptrdiff_t>(end));
            auto result = WithRetry(
                [this, &group, &cancel]() {
                    return transport_->FindMissingBlobs(
                        group, Options(RpcKind::FindMissingBlobs, cancel));
                },
                config_.Retry(),
                logger_,
                cancel,
                budget);
            if (not result) {
                return unexpected{std::move(result).error()};
            }
            std::move(result->begin(),
                      result->end(),
                      std::back_inserter(missing));
        }
        return missing;
    } catch (std::exception const& e) {
        return MakeError(ErrorKind::Internal,
                         "existence query failed:\n{}",
                         e.what());
    }
}

auto BatchDispatcher::FindMissing(std::vector<Digest> const& digests,
                                  CancellationToken const& cancel)
    const noexcept -> expected<std::vector<Digest>, CasError> {
    try {
        std::vector<Digest> unique{};
        std::unordered_set<Digest> seen{};
        for (auto const& digest : digests) {
            if (not digest.IsEmpty() and seen.insert(digest).second) {
                unique.push_back(digest);
            }
        }
        if (unique.empty()) {
            return std::vector<Digest>{};
        }
        RetryBudget budget{config_.MaxTotalRetries()};
        auto missing = QueryMissing(unique, cancel, &budget);
        if (not missing) {
            return missing;
        }
        // drop anything not asked for
        std::erase_if(*missing,
                      [&seen](Digest const& d) { return not seen.contains(d); });
        return missing;
    } catch (std::exception const& e) {
        return MakeError(
            ErrorKind::Internal, "FindMissing failed:\n{}", e.what());
    }
}

auto BatchDispatcher::Upload(std::vector<UploadItem> items,
                             CancellationToken const& cancel) const noexcept
    -> DispatchResult {
    try {
        Collector collector{cancel, config_.MaxTotalRetries(), &logger_};
        std::unordered_map<Digest, BlobSource> sources{};
        std::vector<Digest> digests{};
        std::unordered_set<Digest> empty{};
        for (auto& item : items) {
            if (item.digest.IsEmpty()) {
                // the empty blob is always present
                if (empty.insert(item.digest).second) {
                    collector.Complete(item.digest);
                }
                continue;
            }
            if (sources.try_emplace(item.digest, std::move(item.source))
                    .second) {
                digests.push_back(item.digest);
            }
        }
        if (digests.empty()) {
            return std::move(collector).Take();
        }

        auto missing =
            QueryMissing(digests, collector.Abort(), collector.Budget());
        if (not missing) {
            auto const& error = missing.error();
            if (error.kind == ErrorKind::Cancelled) {
                collector.CancelAll(digests);
                return std::move(collector).Take();
            }
            if (error.IsFatal() or
                not config_.AssumeMissingOnPresenceFailure()) {
                collector.Fatal(
                    error.IsFatal()
                        ? error
                        : CasError{.kind = ErrorKind::PresenceCheckFailed,
                                   .message = fmt::format(
                                       "existence query failed: {}",
                                       error.ToString())});
                collector.CancelAll(digests);
                return std::move(collector).Take();
            }
            logger_.Emit(LogLevel::Warning,
                         "existence query failed, assuming all {} blobs are "
                         "missing: {}",
                         digests.size(),
                         error.ToString());
            missing = digests;
        }

        std::unordered_set<Digest> const missing_set{missing->begin(),
                                                     missing->end()};
        std::vector<Digest> to_upload{};
        for (auto const& digest : digests) {
            if (missing_set.contains(digest)) {
                to_upload.push_back(digest);
            }
            else {
                collector.Complete(digest);
            }
        }
        logger_.Emit(LogLevel::Debug,
                     "{} of {} blobs are missing remotely",
                     to_upload.size(),
                     digests.size());

        auto const jobs = PartitionJobs(std::move(to_upload),
                                        config_.MaxBatchSize(),
                                        config_.LargeBlobThreshold());
        RunJobs(
            jobs,
            [this, &sources, &collector](BatchJob const& job) {
                if (job.kind == JobKind::Stream) {
                    auto const& digest = job.digests.front();
                    UploadStream(digest, sources.at(digest), &collector);
                }
                else {
                    UploadBatch(job, sources, &collector);
                }
            },
            &collector);
        return std::move(collector).Take();
    } catch (std::exception const& e) {
        DispatchResult result{};
        result.fatal = CasError{
            .kind = ErrorKind::Internal,
            .message = fmt::format("upload failed:\n{}", e.what())};
        return result;
    }
}

auto BatchDispatcher::Download(std::vector<DownloadItem> const& items,
                               CancellationToken const& cancel) const noexcept
    -> DispatchResult {
    try {
        Collector collector{cancel, config_.MaxTotalRetries(), &logger_};
        std::unordered_map<Digest, std::vector<DownloadItem>> targets{};
        for (auto const& item : items) {
            targets[item.digest].push_back(item);
        }
        std::vector<Digest> digests{};
        digests.reserve(targets.size());
        for (auto const& [digest, digest_targets] : targets) {
            if (digest.IsEmpty()) {
                collector.Deliver(digest, std::string{}, digest_targets);
            }
            else {
                digests.push_back(digest);
            }
        }

        auto const jobs = PartitionJobs(std::move(digests),
                                        config_.MaxBatchSize(),
                                        config_.LargeBlobThreshold());
        RunJobs(
            jobs,
            [this, &targets, &collector](BatchJob const& job) {
                if (job.kind == JobKind::Stream) {
                    auto const& digest = job.digests.front();
                    DownloadStream(digest, targets.at(digest), &collector);
                }
                else {
                    DownloadBatch(job, targets, &collector);
                }
            },
            &collector);
        return std::move(collector).Take();
    } catch (std::exception const& e) {
        DispatchResult result{};
        result.fatal = CasError{
            .kind = ErrorKind::Internal,
            .message = fmt::format("download failed:\n{}", e.what())};
        return result;
    }
}

void BatchDispatcher::UploadBatch(
    BatchJob const& job,
    std::unordered_map<Digest, BlobSource> const& sources,
    Collector* collector) const noexcept {
    try {
        auto const& abort = collector->Abort();
        std::vector<BlobUpload> pending{};
        pending.reserve(job.digests.size());
        for (auto const& digest : job.digests) {
            auto source = sources.at(digest);
            auto content = source.ReadAt(0, digest.size());
            if (not content) {
                collector->Fail(digest, std::move(content).error());
                continue;
            }
            auto actual =
                Digest::FromContent(config_.GetHashFunction(), *content);
            if (actual != digest) {
                collector->Fail(digest, MismatchError(digest, actual));
                continue;
            }
            pending.push_back(
                BlobUpload{.digest = digest, .content = *std::move(content)});
        }

        for (auto attempt = 1U; not pending.empty(); ++attempt) {
            if (abort.IsCancelled()) {
                collector->CancelAll(DigestsOf(pending));
                return;
            }
            auto statuses = transport_->BatchUpdateBlobs(
                pending, Options(RpcKind::BatchUpdateBlobs, abort));
            std::vector<BlobUpload> retry{};
            std::optional<CasError> retry_error{};
            if (not statuses) {
                if (not statuses.error().IsTransient()) {
                    for (auto const& blob : pending) {
                        collector->Fail(blob.digest, statuses.error());
                    }
                    return;
                }
                retry_error = std::move(statuses).error();
                retry = std::move(pending);
            }
            else {
                std::unordered_map<Digest, std::optional<CasError>> outcome{};
                for (auto& status : *statuses) {
                    outcome.insert_or_assign(status.digest,
                                             std::move(status.error));
                }
                for (auto& blob : pending) {
                    auto it = outcome.find(blob.digest);
                    if (it == outcome.end()) {
                        collector->Fail(
                            blob.digest,
                            CasError{.kind = ErrorKind::MalformedResponse,
                                     .message = "no status in response"});
                    }
                    else if (not it->second) {
                        collector->Complete(blob.digest);
                    }
                    else if (it->second->IsTransient()) {
                        retry_error = *it->second;
                        retry.push_back(std::move(blob));
                    }
                    else {
                        collector->Fail(blob.digest, *it->second);
                    }
                }
            }
            if (retry.empty()) {
                return;
            }
            if (auto error = PrepareRetry(*retry_error,
                                          attempt,
                                          config_.Retry(),
                                          logger_,
                                          abort,
                                          collector->Budget())) {
                for (auto const& blob : retry) {
                    collector->Fail(blob.digest, *error);
                }
                return;
            }
            pending = std::move(retry);
        }
    } catch (std::exception const& e) {
        collector->Fatal(CasError{
            .kind = ErrorKind::Internal,
            .message = fmt::format("batch upload failed:\n{}", e.what())});
    }
}

void BatchDispatcher::UploadStream(Digest const& digest,
                                   BlobSource source,
                                   Collector* collector) const noexcept {
    auto const& abort = collector->Abort();
    auto chunker = Chunker::ForSource(std::move(source), config_.ChunkSize());
    if (not chunker) {
        collector->Fail(digest, std::move(chunker).error());
        return;
    }
    auto actual = HashChunks(config_.GetHashFunction(), &*chunker);
    if (not actual) {
        collector->Fail(digest, std::move(actual).error());
        return;
    }
    if (*actual != digest) {
        collector->Fail(digest, MismatchError(digest, *actual));
        return;
    }
    auto committed = WithRetry(
        [this, &digest, &chunker, &abort]() {
            return transport_->WriteStream(
                digest, &*chunker, Options(RpcKind::Write, abort));
        },
        config_.Retry(),
        logger_,
        abort,
        collector->Budget());
    if (not committed) {
        collector->Fail(digest, std::move(committed).error());
        return;
    }
    logger_.Emit(LogLevel::Trace,
                 "streamed {} ({} bytes committed)",
                 digest.ToString(),
                 *committed);
    collector->Complete(digest);
}

void BatchDispatcher::DownloadBatch(
    BatchJob const& job,
    std::unordered_map<Digest, std::vector<DownloadItem>> const& targets,
    Collector* collector) const noexcept {
    try {
        auto const& abort = collector->Abort();
        auto pending = job.digests;
        for (auto attempt = 1U; not pending.empty(); ++attempt) {
            if (abort.IsCancelled()) {
                collector->CancelAll(pending);
                return;
            }
            auto blobs = transport_->BatchReadBlobs(
                pending, Options(RpcKind::BatchReadBlobs, abort));
            std::vector<Digest> retry{};
            std::optional<CasError> retry_error{};
            if (not blobs) {
                if (not blobs.error().IsTransient()) {
                    for (auto const& digest : pending) {
                        collector->Fail(digest, blobs.error());
                    }
                    return;
                }
                retry_error = std::move(blobs).error();
                retry = std::move(pending);
            }
            else {
                std::unordered_map<Digest, BlobContent*> outcome{};
                for (auto& blob : *blobs) {
                    outcome.insert_or_assign(blob.digest, &blob);
                }
                for (auto const& digest : pending) {
                    auto it = outcome.find(digest);
                    if (it == outcome.end()) {
                        collector->Fail(
                            digest,
                            CasError{.kind = ErrorKind::MalformedResponse,
                                     .message = "no content in response"});
                        continue;
                    }
                    auto* blob = it->second;
                    if (blob->error) {
                        if (blob->error->IsTransient()) {
                            retry_error = *blob->error;
                            retry.push_back(digest);
                        }
                        else {
                            collector->Fail(digest, *blob->error);
                        }
                        continue;
                    }
                    auto actual = Digest::FromContent(
                        config_.GetHashFunction(), blob->content);
                    if (actual != digest) {
                        collector->Fail(digest, MismatchError(digest, actual));
                        continue;
                    }
                    collector->Deliver(
                        digest, std::move(blob->content), targets.at(digest));
                }
            }
            if (retry.empty()) {
                return;
            }
            if (auto error = PrepareRetry(*retry_error,
                                          attempt,
                                          config_.Retry(),
                                          logger_,
                                          abort,
                                          collector->Budget())) {
                for (auto const& digest : retry) {
                    collector->Fail(digest, *error);
                }
                return;
            }
            pending = std::move(retry);
        }
    } catch (std::exception const& e) {
        collector->Fatal(CasError{
            .kind = ErrorKind::Internal,
            .message = fmt::format("batch download failed:\n{}", e.what())});
    }
}

void BatchDispatcher::DownloadStream(Digest const& digest,
                                     std::vector<DownloadItem> const& targets,
                                     Collector* collector) const noexcept {
    try {
        auto const& abort = collector->Abort();
        auto const first_file =
            std::find_if(targets.begin(), targets.end(), [](auto const& t) {
                return t.path.has_value();
            });
        expected<ChunkAssembler, CasError> assembler =
            first_file != targets.end()
                ? ChunkAssembler::ToFile(config_.GetHashFunction(),
                                         *first_file->path,
                                         digest.size(),
                                         first_file->is_executable)
                : expected<ChunkAssembler, CasError>{ChunkAssembler::ToMemory(
                      config_.GetHashFunction(), digest.size())};
        if (not assembler) {
            collector->Fail(digest, std::move(assembler).error());
            return;
        }
        auto received = WithRetry(
            [this, &digest, &assembler, &abort]() {
                return transport_->ReadStream(
                    digest, &*assembler, Options(RpcKind::Read, abort));
            },
            config_.Retry(),
            logger_,
            abort,
            collector->Budget());
        if (not received) {
            collector->Fail(digest, std::move(received).error());
            return;
        }
        auto actual = assembler->Finish();
        if (not actual) {
            collector->Fail(digest, std::move(actual).error());
            return;
        }
        if (*actual != digest) {
            if (first_file != targets.end() and
                not FileSystemManager::RemoveFile(*first_file->path)) {
                logger_.Emit(LogLevel::Warning,
                             "cannot remove corrupt download {}",
                             first_file->path->string());
            }
            collector->Fail(digest, MismatchError(digest, *actual));
            return;
        }

        bool to_memory = false;
        for (auto it = targets.begin(); it != targets.end(); ++it) {
            if (not it->path) {
                to_memory = true;
                continue;
            }
            if (it == first_file) {
                continue;
            }
            if (not FileSystemManager::CopyFile(
                    *first_file->path, *it->path, it->is_executable)) {
                collector->Fail(
                    digest,
                    CasError{.kind = ErrorKind::LocalIoError,
                             .message = fmt::format("cannot write {}",
                                                    it->path->string())});
                return;
            }
        }
        if (to_memory) {
            auto content =
                first_file != targets.end()
                    ? FileSystemManager::ReadFile(*first_file->path)
                    : std::move(*assembler).TakeContent();
            if (not content) {
                collector->Fail(
                    digest,
                    CasError{.kind = ErrorKind::LocalIoError,
                             .message = "cannot obtain downloaded content"});
                return;
            }
            collector->AddContent(digest, *std::move(content));
        }
        collector->Complete(digest);
    } catch (std::exception const& e) {
        collector->Fatal(CasError{
            .kind = ErrorKind::Internal,
            .message = fmt::format("stream download failed:\n{}", e.what())});
    }
}
