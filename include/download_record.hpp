#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

/**
 * Lifecycle of a single URL in the progress ledger.
 */
enum class DownloadStatus
{
    Pending,
    Downloading,
    Completed,
    Failed,
    Expired
};

/**
 * Status record for one target URL.
 * The ledger keys records by url; filename is fixed when the record is created.
 */
struct DownloadRecord
{
    std::string url;
    std::string filename;
    DownloadStatus status = DownloadStatus::Pending;
    std::uint64_t bytesDownloaded = 0;
    std::uint64_t totalBytes = 0; // 0 until known
    std::optional<std::string> startedAt;
    std::optional<std::string> completedAt;
    std::optional<std::string> errorMessage; // Set only for Failed / Expired
    int retryCount = 0;
};

/**
 * Lowercase wire name of a status ("pending", "downloading", ...).
 */
std::string statusToString(DownloadStatus status);

/**
 * Parse a wire name back into a status.
 *
 * @return std::nullopt for unknown names
 */
std::optional<DownloadStatus> parseStatus(const std::string &name);

/**
 * Serialize a record to the ledger's JSON shape (snake_case keys).
 */
nlohmann::json recordToJson(const DownloadRecord &record);

/**
 * Build a record from a ledger entry.
 * filename and a known status are required; counters default to 0 and
 * optional fields to absent. camelCase key spellings are accepted too.
 *
 * @param url Ledger key, authoritative over any "url" field in the entry
 * @param entry JSON object for this URL
 * @return std::nullopt if the entry is malformed
 */
std::optional<DownloadRecord> recordFromJson(const std::string &url, const nlohmann::json &entry);

/**
 * Derive the local filename for a URL.
 * Order: URL path basename if it ends in ".zip" (percent-decoded), then a
 * "takeout-....zip" token found anywhere in the URL, then a timestamped
 * synthetic name.
 */
std::string deriveFilename(const std::string &url);

/**
 * Current local time as ISO-8601 ("2024-05-01T13:45:10").
 */
std::string currentTimestamp();
