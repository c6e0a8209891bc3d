#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "archive_validator.hpp"
#include "auth_bundle.hpp"
#include "progress_ledger.hpp"
#include "transfer_engine.hpp"

/**
 * Counters for one scheduling pass.
 */
struct RunSummary
{
    std::size_t dispatched = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t expired = 0;
    std::size_t interrupted = 0;
    std::chrono::steady_clock::duration elapsed{};
};

/**
 * Blocking multi-producer queue that carries one outcome per dispatched URL
 * from the workers back to the dispatching thread.
 */
class ResultChannel
{
public:
    using Result = std::pair<std::string, TransferOutcome>;

    explicit ResultChannel(std::size_t producers) : openProducers_(producers) {}

    void push(Result result);

    /**
     * Called once by each producer when it will push no more results.
     */
    void close();

    /**
     * Block until a result is available.
     *
     * @return std::nullopt once every producer has closed and the queue is drained
     */
    std::optional<Result> pop();

private:
    std::deque<Result> results_;
    std::size_t openProducers_;
    std::mutex mutex_;
    std::condition_variable ready_;
};

/**
 * Bounded-concurrency dispatcher: computes which URLs need work and runs them
 * through the TransferEngine on a fixed pool of worker threads.
 */
class Scheduler
{
public:
    static constexpr int DEFAULT_MAX_ATTEMPTS = 3;

    Scheduler(ProgressLedger &ledger,
              TransferEngine &engine,
              const ArchiveValidator &validator,
              AuthBundle auth,
              int maxAttempts = DEFAULT_MAX_ATTEMPTS,
              const std::atomic<bool> *stopRequested = nullptr);

    /**
     * URLs that need a transfer, in input order. Creates ledger records for
     * URLs seen for the first time.
     *
     * A URL is pending when it has no record, is Pending, is Failed with
     * fewer than maxAttempts failures, or claims Completed/Downloading while
     * its file is missing or fails validation. Expired URLs never are.
     * A Downloading record whose file already validates is marked Completed
     * here instead of being transferred again.
     */
    std::vector<std::string> pendingUrls(const std::vector<std::string> &urls);

    /**
     * Download every pending URL with at most `concurrency` transfers in
     * flight. Outcomes are collected in completion order; one URL's failure
     * never stops the others.
     */
    RunSummary run(const std::vector<std::string> &urls, int concurrency);

private:
    ProgressLedger &ledger_;
    TransferEngine &engine_;
    const ArchiveValidator &validator_;
    AuthBundle auth_;
    int maxAttempts_;
    const std::atomic<bool> *stopRequested_;

    bool needsTransfer(const DownloadRecord &record) const;

    /**
     * Record a finished file left behind by an interrupted run as Completed.
     */
    void adoptFinishedFile(DownloadRecord &record);
    bool stopRequested() const { return stopRequested_ && stopRequested_->load(); }
};
