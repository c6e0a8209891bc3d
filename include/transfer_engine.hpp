#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "archive_validator.hpp"
#include "auth_bundle.hpp"
#include "download_record.hpp"
#include "http_client.hpp"
#include "progress_ledger.hpp"

/**
 * Definite result of one fetch() call.
 */
enum class TransferOutcome
{
    Completed,
    Failed,
    Expired,
    Interrupted // Shutdown requested; record left in Downloading state for resume
};

std::string outcomeToString(TransferOutcome outcome);

struct TransferOptions
{
    std::filesystem::path outputDir;
    std::size_t chunkSize = 8192;
    int persistEveryChunks = 100;
    int stallTimeoutSeconds = 30;
};

/**
 * Downloads one URL with byte-range resume.
 *
 * All state changes go through ProgressLedger::commit, so the ledger on disk
 * follows the transfer. fetch() never throws: every failure is folded into
 * the record and the returned outcome.
 */
class TransferEngine
{
public:
    TransferEngine(ProgressLedger &ledger,
                   Transport &transport,
                   const ArchiveValidator &validator,
                   TransferOptions options,
                   const std::atomic<bool> *stopRequested = nullptr);

    /**
     * Download (or resume) record.url into outputDir / record.filename.
     *
     * @param record Ledger record for the URL; updated in place
     * @param auth Cookies and headers to send
     * @return Completed, Failed, Expired, or Interrupted on shutdown
     */
    TransferOutcome fetch(DownloadRecord &record, const AuthBundle &auth);

    const TransferOptions &options() const { return options_; }

private:
    ProgressLedger &ledger_;
    Transport &transport_;
    const ArchiveValidator &validator_;
    TransferOptions options_;
    const std::atomic<bool> *stopRequested_;

    /**
     * Steps after the completion check: stream, finalize, validate.
     * A 416 reply to a resume request repeats the transfer once from byte 0.
     * Throws on any transfer or filesystem problem.
     */
    TransferOutcome download(DownloadRecord &record,
                             const std::filesystem::path &filePath,
                             const AuthBundle &auth,
                             bool restartFromZero);

    /**
     * Parse "bytes <first>-<last>/<total>".
     *
     * @return false if the value is not a byte range
     */
    static bool parseContentRange(const std::string &value,
                                  std::uint64_t &first,
                                  std::uint64_t &total);

    void markFailed(DownloadRecord &record, const std::string &message);
};
