#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "download_record.hpp"

/**
 * Unreadable or malformed ledger file, or a failed snapshot.
 */
class LedgerError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Persistent map of URL -> DownloadRecord shared by all transfer workers.
 *
 * Every operation runs inside one critical section guarded by a single mutex,
 * including the file write of a snapshot. The map itself is never handed out;
 * callers only ever see copies.
 */
class ProgressLedger
{
public:
    static constexpr const char *DEFAULT_FILENAME = "download_progress.json";

    explicit ProgressLedger(std::filesystem::path file);

    // The mutex pins the ledger in place
    ProgressLedger(const ProgressLedger &) = delete;
    ProgressLedger &operator=(const ProgressLedger &) = delete;

    /**
     * Load records from the backing file. A missing file is an empty ledger.
     * Individual malformed entries are skipped with a warning.
     *
     * @return Number of records loaded
     * @throws LedgerError if the file exists but is not a JSON object
     */
    std::size_t load();

    /**
     * Write the whole map to disk: serialize to "<file>.tmp", then rename it
     * over the ledger so a crash never leaves a truncated file behind.
     *
     * @throws LedgerError if the file cannot be written
     */
    void snapshot();

    std::optional<DownloadRecord> get(const std::string &url) const;

    /**
     * Insert or overwrite the record stored under record.url.
     */
    void upsert(const DownloadRecord &record);

    /**
     * Upsert and snapshot in one critical section.
     * Snapshot failures are reported on stderr, not thrown: a transfer in
     * progress must not be aborted because the ledger could not be written.
     *
     * @return true if the snapshot reached disk
     */
    bool commit(const DownloadRecord &record);

    /**
     * Return the record for url, creating a pending one if none exists.
     * A new record gets deriveFilename(url), suffixed with _1, _2, ... when
     * another record already owns that filename.
     */
    DownloadRecord getOrCreate(const std::string &url);

    /**
     * Copy of every record, ordered by URL.
     */
    std::vector<DownloadRecord> records() const;

    std::size_t size() const;

private:
    std::filesystem::path file_;
    std::map<std::string, DownloadRecord> records_;
    mutable std::mutex mutex_;

    // Callers must hold mutex_
    void writeLocked() const;
    bool filenameTakenLocked(const std::string &filename) const;
};
