#include "scheduler.hpp"

#include <algorithm>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "format_utils.hpp"

void ResultChannel::push(Result result)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        results_.push_back(std::move(result));
    }
    ready_.notify_one();
}

void ResultChannel::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (openProducers_ > 0)
        {
            --openProducers_;
        }
    }
    ready_.notify_all();
}

std::optional<ResultChannel::Result> ResultChannel::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this]
                { return !results_.empty() || openProducers_ == 0; });
    if (results_.empty())
    {
        return std::nullopt;
    }
    Result result = std::move(results_.front());
    results_.pop_front();
    return result;
}

Scheduler::Scheduler(ProgressLedger &ledger,
                     TransferEngine &engine,
                     const ArchiveValidator &validator,
                     AuthBundle auth,
                     int maxAttempts,
                     const std::atomic<bool> *stopRequested)
    : ledger_(ledger),
      engine_(engine),
      validator_(validator),
      auth_(std::move(auth)),
      maxAttempts_(maxAttempts),
      stopRequested_(stopRequested)
{
}

bool Scheduler::needsTransfer(const DownloadRecord &record) const
{
    switch (record.status)
    {
    case DownloadStatus::Pending:
        return true;
    case DownloadStatus::Failed:
        return record.retryCount < maxAttempts_;
    case DownloadStatus::Expired:
        return false; // Needs a fresh link from the operator
    case DownloadStatus::Completed:
    case DownloadStatus::Downloading:
    {
        // Self-heal stale markers and transfers cut short by a crash
        std::filesystem::path filePath = engine_.options().outputDir / record.filename;
        std::error_code ec;
        if (!std::filesystem::exists(filePath, ec))
        {
            return true;
        }
        return !validator_.isValid(filePath);
    }
    }
    return true;
}

std::vector<std::string> Scheduler::pendingUrls(const std::vector<std::string> &urls)
{
    std::vector<std::string> pending;
    for (const auto &url : urls)
    {
        if (std::find(pending.begin(), pending.end(), url) != pending.end())
        {
            continue; // One transfer per URL
        }
        DownloadRecord record = ledger_.getOrCreate(url);
        if (needsTransfer(record))
        {
            pending.push_back(url);
        }
        else if (record.status == DownloadStatus::Downloading)
        {
            adoptFinishedFile(record);
        }
    }
    return pending;
}

void Scheduler::adoptFinishedFile(DownloadRecord &record)
{
    std::filesystem::path filePath = engine_.options().outputDir / record.filename;
    std::error_code ec;
    auto size = std::filesystem::file_size(filePath, ec);
    if (ec)
    {
        return;
    }

    record.status = DownloadStatus::Completed;
    record.bytesDownloaded = static_cast<std::uint64_t>(size);
    record.totalBytes = static_cast<std::uint64_t>(size);
    record.completedAt = currentTimestamp();
    record.errorMessage.reset();
    ledger_.commit(record);
    fmt::print("✓ Completed: {} ({}, finished by an earlier run)\n", record.filename, formatBytes(record.bytesDownloaded));
}

RunSummary Scheduler::run(const std::vector<std::string> &urls, int concurrency)
{
    RunSummary summary;
    auto start = std::chrono::steady_clock::now();

    std::vector<std::string> pending = pendingUrls(urls);
    if (pending.empty())
    {
        fmt::print("All downloads already completed!\n");
        summary.elapsed = std::chrono::steady_clock::now() - start;
        return summary;
    }

    std::size_t workerCount = std::min<std::size_t>(static_cast<std::size_t>(std::max(concurrency, 1)),
                                                    pending.size());
    fmt::print("Starting download of {} files with {} concurrent workers\n", pending.size(), workerCount);

    // Workers claim the next queued URL; excess work waits in the queue
    std::atomic<std::size_t> nextIndex{0};
    ResultChannel channel(workerCount);

    auto worker = [&]()
    {
        while (!stopRequested())
        {
            std::size_t index = nextIndex.fetch_add(1);
            if (index >= pending.size())
            {
                break;
            }

            const std::string &url = pending[index];
            TransferOutcome outcome = TransferOutcome::Failed;
            auto record = ledger_.get(url);
            if (record)
            {
                outcome = engine_.fetch(*record, auth_);
            }
            channel.push({url, outcome});
        }
        channel.close();
    };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        workers.emplace_back(worker);
    }

    // Collect in completion order until every worker has drained
    while (auto result = channel.pop())
    {
        const auto &[url, outcome] = *result;
        ++summary.dispatched;

        auto record = ledger_.get(url);
        std::string filename = record ? record->filename : url;
        switch (outcome)
        {
        case TransferOutcome::Completed:
            ++summary.completed;
            fmt::print("✓ Successfully downloaded: {}\n", filename);
            break;
        case TransferOutcome::Failed:
            ++summary.failed;
            fmt::print("✗ Failed to download: {}\n", filename);
            break;
        case TransferOutcome::Expired:
            ++summary.expired;
            fmt::print("✗ Link expired: {}\n", filename);
            break;
        case TransferOutcome::Interrupted:
            ++summary.interrupted;
            break;
        }
    }

    for (auto &thread : workers)
    {
        thread.join();
    }

    summary.elapsed = std::chrono::steady_clock::now() - start;
    fmt::print("Run finished in {}\n",
               formatDuration(static_cast<long>(
                   std::chrono::duration_cast<std::chrono::seconds>(summary.elapsed).count())));
    return summary;
}
