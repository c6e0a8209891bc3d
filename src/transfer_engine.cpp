#include "transfer_engine.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "format_utils.hpp"

std::string outcomeToString(TransferOutcome outcome)
{
    switch (outcome)
    {
    case TransferOutcome::Completed:
        return "completed";
    case TransferOutcome::Failed:
        return "failed";
    case TransferOutcome::Expired:
        return "expired";
    case TransferOutcome::Interrupted:
        return "interrupted";
    }
    return "failed";
}

TransferEngine::TransferEngine(ProgressLedger &ledger,
                               Transport &transport,
                               const ArchiveValidator &validator,
                               TransferOptions options,
                               const std::atomic<bool> *stopRequested)
    : ledger_(ledger),
      transport_(transport),
      validator_(validator),
      options_(std::move(options)),
      stopRequested_(stopRequested)
{
    if (options_.persistEveryChunks < 1)
    {
        options_.persistEveryChunks = 1;
    }
}

TransferOutcome TransferEngine::fetch(DownloadRecord &record, const AuthBundle &auth)
{
    std::filesystem::path filePath = options_.outputDir / record.filename;
    bool restartFromZero = false;

    // 1. A completion marker is only trusted if the file still validates
    if (record.status == DownloadStatus::Completed)
    {
        std::error_code ec;
        if (std::filesystem::exists(filePath, ec) && validator_.isValid(filePath))
        {
            fmt::print("✓ Already completed: {}\n", record.filename);
            return TransferOutcome::Completed;
        }
        fmt::print(stderr, "Warning: {} is marked completed but is missing or invalid, downloading again\n",
                   record.filename);
        record.status = DownloadStatus::Pending;
        record.completedAt.reset();
        restartFromZero = true;
    }
    else if (record.status == DownloadStatus::Failed && record.totalBytes > 0 &&
             record.bytesDownloaded >= record.totalBytes)
    {
        // Previous attempt received a full body that failed validation
        restartFromZero = true;
    }

    try
    {
        return download(record, filePath, auth, restartFromZero);
    }
    catch (const TransferInterrupted &)
    {
        // Keep Downloading so the next run resumes from the persisted offset
        ledger_.commit(record);
        fmt::print(stderr, "Interrupted: {} ({} saved)\n", record.filename, formatBytes(record.bytesDownloaded));
        return TransferOutcome::Interrupted;
    }
    catch (const std::exception &e)
    {
        markFailed(record, e.what());
        return TransferOutcome::Failed;
    }
}

TransferOutcome TransferEngine::download(DownloadRecord &record,
                                         const std::filesystem::path &filePath,
                                         const AuthBundle &auth,
                                         bool restartFromZero)
{
    // 2. Resume offset is whatever already made it to disk
    std::uint64_t offset = 0;
    if (restartFromZero)
    {
        record.bytesDownloaded = 0;
        record.totalBytes = 0;
    }
    else if (std::filesystem::exists(filePath))
    {
        offset = static_cast<std::uint64_t>(std::filesystem::file_size(filePath));
        if (offset > 0)
        {
            fmt::print("Resuming {} from byte {}\n", record.filename, offset);
        }
    }

    // 3. Mark in flight
    record.status = DownloadStatus::Downloading;
    record.startedAt = currentTimestamp();
    record.completedAt.reset();
    record.errorMessage.reset();
    ledger_.commit(record);

    // 4. Request: custom headers plus Range when resuming, cookies separately
    HttpRequest request;
    request.url = record.url;
    request.headers = auth.headers;
    request.cookies = auth.cookies;
    request.chunkSize = options_.chunkSize;
    request.stallTimeoutSeconds = options_.stallTimeoutSeconds;
    request.cancel = stopRequested_;
    if (offset > 0)
    {
        request.headers["Range"] = fmt::format("bytes={}-", offset);
    }

    std::ofstream outFile;
    bool expired = false;
    bool rangeNotSatisfiable = false;
    long unexpectedStatus = 0;
    int chunksSincePersist = 0;
    std::uint64_t declaredTotal = 0;

    // 5. Decide what to do with the response before any byte is written
    auto onHead = [&](const HttpResponseHead &head) -> bool
    {
        if (head.status == 403 || head.status == 404)
        {
            expired = true;
            return false;
        }
        if (head.status == 416 && offset > 0)
        {
            // Local file already reaches or passes the end of the resource
            rangeNotSatisfiable = true;
            return false;
        }
        if (head.status != 200 && head.status != 206)
        {
            unexpectedStatus = head.status;
            return false;
        }

        if (head.status == 206)
        {
            std::uint64_t first = 0;
            std::uint64_t total = 0;
            if (!parseContentRange(head.contentRange, first, total))
            {
                throw TransferError(fmt::format("Invalid Content-Range in partial response: '{}'", head.contentRange));
            }
            if (first != offset)
            {
                throw TransferError(fmt::format("Server resumed at byte {} instead of {}", first, offset));
            }
            if (record.totalBytes == 0 && total > 0)
            {
                record.totalBytes = total;
            }
        }
        else
        {
            if (offset > 0)
            {
                // Range ignored: appending a full body would corrupt the file
                fmt::print("Server doesn't support resume for {}. Restarting download from beginning...\n",
                           record.filename);
                offset = 0;
                record.totalBytes = 0;
            }
            if (record.totalBytes == 0 && head.contentLength > 0)
            {
                record.totalBytes = static_cast<std::uint64_t>(head.contentLength);
            }
        }
        declaredTotal = record.totalBytes;

        // Append when resuming, truncate when starting fresh
        std::ios::openmode mode = std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc);
        outFile.open(filePath, mode);
        if (!outFile)
        {
            throw TransferError(fmt::format("Cannot open file for writing: {}", filePath.string()));
        }

        record.bytesDownloaded = offset;
        ledger_.commit(record);
        return true;
    };

    // 6. Stream the body, persisting every N chunks
    auto onChunk = [&](const char *data, std::size_t size)
    {
        if (stopRequested_ && stopRequested_->load())
        {
            throw TransferInterrupted();
        }

        outFile.write(data, static_cast<std::streamsize>(size));
        if (!outFile.good())
        {
            throw TransferError(fmt::format("Failed to write to {}", filePath.string()));
        }
        record.bytesDownloaded += size;

        if (++chunksSincePersist >= options_.persistEveryChunks)
        {
            chunksSincePersist = 0;
            outFile.flush(); // Disk must never lag behind the ledger
            ledger_.commit(record);

            if (record.totalBytes > 0)
            {
                double percentage = static_cast<double>(record.bytesDownloaded) * 100.0 /
                                    static_cast<double>(record.totalBytes);
                fmt::print("  {}: {} / {} ({:.1f}%)\n", record.filename, formatBytes(record.bytesDownloaded),
                           formatBytes(record.totalBytes), percentage);
            }
            else
            {
                fmt::print("  {}: {}\n", record.filename, formatBytes(record.bytesDownloaded));
            }
        }
    };

    HttpResponseHead head = transport_.get(request, onHead, onChunk);

    if (expired)
    {
        record.status = DownloadStatus::Expired;
        record.errorMessage = fmt::format("Link expired (HTTP {})", head.status);
        ledger_.commit(record);
        fmt::print(stderr, "✗ Link expired: {}\n", record.filename);
        return TransferOutcome::Expired;
    }

    if (rangeNotSatisfiable)
    {
        fmt::print("Server rejected resume of {} at byte {}. Restarting download from beginning...\n",
                   record.filename, offset);
        return download(record, filePath, auth, true);
    }

    if (unexpectedStatus != 0)
    {
        throw TransferError(fmt::format("HTTP error {}: {}", unexpectedStatus, httpStatusText(unexpectedStatus)));
    }

    outFile.close();
    if (outFile.fail())
    {
        throw TransferError(fmt::format("Failed to finish writing {}", filePath.string()));
    }

    // 7. Observed size is the truth
    if (declaredTotal > 0 && declaredTotal != record.bytesDownloaded)
    {
        fmt::print(stderr, "Warning: {} declared {} but {} were received\n", record.filename,
                   formatBytes(declaredTotal), formatBytes(record.bytesDownloaded));
    }
    record.totalBytes = record.bytesDownloaded;
    ledger_.commit(record);

    // 8. Reject login/error pages served as downloads; keep the file for diagnosis
    if (!validator_.isValid(filePath))
    {
        markFailed(record, "Not a valid archive (likely an authentication page)");
        return TransferOutcome::Failed;
    }

    // 9. Done
    record.status = DownloadStatus::Completed;
    record.completedAt = currentTimestamp();
    ledger_.commit(record);
    fmt::print("✓ Completed: {} ({})\n", record.filename, formatBytes(record.bytesDownloaded));
    return TransferOutcome::Completed;
}

bool TransferEngine::parseContentRange(const std::string &value,
                                       std::uint64_t &first,
                                       std::uint64_t &total)
{
    // bytes <first>-<last>/<total or *>
    const std::string unit = "bytes ";
    if (value.compare(0, unit.size(), unit) != 0)
    {
        return false;
    }

    auto dash = value.find('-', unit.size());
    auto slash = value.find('/', unit.size());
    if (dash == std::string::npos || slash == std::string::npos || dash > slash)
    {
        return false;
    }

    try
    {
        std::size_t consumed = 0;
        std::string firstText = value.substr(unit.size(), dash - unit.size());
        first = std::stoull(firstText, &consumed);
        if (consumed != firstText.size())
        {
            return false;
        }

        std::string totalText = value.substr(slash + 1);
        total = (totalText == "*") ? 0 : std::stoull(totalText);
    }
    catch (const std::logic_error &)
    {
        // std::invalid_argument / std::out_of_range from stoull
        return false;
    }
    return true;
}

void TransferEngine::markFailed(DownloadRecord &record, const std::string &message)
{
    record.status = DownloadStatus::Failed;
    record.errorMessage = message;
    record.retryCount += 1;
    ledger_.commit(record);
    fmt::print(stderr, "✗ Failed: {} - {}\n", record.filename, message);
}
