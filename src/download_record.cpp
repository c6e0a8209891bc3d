#include "download_record.hpp"

#include <algorithm>
#include <ctime>
#include <limits>
#include <memory>

#include <curl/curl.h>
#include <fmt/chrono.h>
#include <fmt/core.h>

namespace
{
    const char *const TAKEOUT_TOKEN = "takeout-";
    const char *const ARCHIVE_SUFFIX = ".zip";

    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Path separators in a decoded name would escape the output directory
    std::string sanitize(std::string name)
    {
        std::replace(name.begin(), name.end(), '/', '_');
        std::replace(name.begin(), name.end(), '\\', '_');
        if (name == "." || name == "..")
        {
            name = "_";
        }
        return name;
    }

    std::string percentDecode(const std::string &text)
    {
        int decodedLength = 0;
        std::unique_ptr<char, decltype(&curl_free)> decoded(
            curl_easy_unescape(nullptr, text.c_str(), static_cast<int>(text.size()), &decodedLength),
            curl_free);
        if (!decoded)
        {
            return text;
        }
        return std::string(decoded.get(), static_cast<std::size_t>(decodedLength));
    }

    // Path component of the URL, or empty if curl cannot parse it
    std::string urlPath(const std::string &url)
    {
        std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), curl_url_cleanup);
        if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
        {
            return {};
        }

        char *path = nullptr;
        if (curl_url_get(handle.get(), CURLUPART_PATH, &path, 0) != CURLUE_OK || !path)
        {
            return {};
        }
        std::string result(path);
        curl_free(path);
        return result;
    }

    std::optional<std::string> optionalString(const nlohmann::json &entry,
                                              const char *snakeKey,
                                              const char *camelKey)
    {
        for (const char *key : {snakeKey, camelKey})
        {
            auto it = entry.find(key);
            if (it != entry.end() && it->is_string())
            {
                return it->get<std::string>();
            }
        }
        return std::nullopt;
    }

    // Missing counters default to 0; present but non-numeric ones are an error
    bool readCounter(const nlohmann::json &entry,
                     const char *snakeKey,
                     const char *camelKey,
                     std::uint64_t &out)
    {
        for (const char *key : {snakeKey, camelKey})
        {
            auto it = entry.find(key);
            if (it == entry.end() || it->is_null())
            {
                continue;
            }
            if (!it->is_number_integer() || it->get<std::int64_t>() < 0)
            {
                return false;
            }
            out = it->get<std::uint64_t>();
            return true;
        }
        out = 0;
        return true;
    }
}

std::string statusToString(DownloadStatus status)
{
    switch (status)
    {
    case DownloadStatus::Pending:
        return "pending";
    case DownloadStatus::Downloading:
        return "downloading";
    case DownloadStatus::Completed:
        return "completed";
    case DownloadStatus::Failed:
        return "failed";
    case DownloadStatus::Expired:
        return "expired";
    }
    return "pending";
}

std::optional<DownloadStatus> parseStatus(const std::string &name)
{
    if (name == "pending")
        return DownloadStatus::Pending;
    if (name == "downloading")
        return DownloadStatus::Downloading;
    if (name == "completed")
        return DownloadStatus::Completed;
    if (name == "failed")
        return DownloadStatus::Failed;
    if (name == "expired")
        return DownloadStatus::Expired;
    return std::nullopt;
}

nlohmann::json recordToJson(const DownloadRecord &record)
{
    auto optionalField = [](const std::optional<std::string> &value) -> nlohmann::json
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    };

    return nlohmann::json{
        {"url", record.url},
        {"filename", record.filename},
        {"status", statusToString(record.status)},
        {"bytes_downloaded", record.bytesDownloaded},
        {"total_bytes", record.totalBytes},
        {"started_at", optionalField(record.startedAt)},
        {"completed_at", optionalField(record.completedAt)},
        {"error_message", optionalField(record.errorMessage)},
        {"retry_count", record.retryCount},
    };
}

std::optional<DownloadRecord> recordFromJson(const std::string &url, const nlohmann::json &entry)
{
    if (!entry.is_object())
    {
        return std::nullopt;
    }

    DownloadRecord record;
    record.url = url;

    auto filename = entry.find("filename");
    if (filename == entry.end() || !filename->is_string() || filename->get<std::string>().empty())
    {
        return std::nullopt;
    }
    record.filename = sanitize(filename->get<std::string>());

    auto statusField = entry.find("status");
    if (statusField == entry.end() || !statusField->is_string())
    {
        return std::nullopt;
    }
    auto status = parseStatus(statusField->get<std::string>());
    if (!status)
    {
        return std::nullopt;
    }
    record.status = *status;

    if (!readCounter(entry, "bytes_downloaded", "bytesDownloaded", record.bytesDownloaded) ||
        !readCounter(entry, "total_bytes", "totalBytes", record.totalBytes))
    {
        return std::nullopt;
    }

    std::uint64_t retries = 0;
    if (!readCounter(entry, "retry_count", "retryCount", retries) ||
        retries > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }
    record.retryCount = static_cast<int>(retries);

    record.startedAt = optionalString(entry, "started_at", "startedAt");
    record.completedAt = optionalString(entry, "completed_at", "completedAt");
    record.errorMessage = optionalString(entry, "error_message", "errorMessage");

    return record;
}

std::string deriveFilename(const std::string &url)
{
    // 1. Basename of the URL path
    std::string path = urlPath(url);
    auto slash = path.find_last_of('/');
    std::string basename = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (!basename.empty() && endsWith(basename, ARCHIVE_SUFFIX))
    {
        return sanitize(percentDecode(basename));
    }

    // 2. Archive-name token in the query string (signed Takeout links)
    auto start = url.find(TAKEOUT_TOKEN);
    if (start != std::string::npos)
    {
        auto end = url.find(ARCHIVE_SUFFIX, start);
        if (end != std::string::npos)
        {
            return sanitize(url.substr(start, end - start + 4));
        }
    }

    // 3. Synthetic name
    return fmt::format("takeout_download_{:%Y%m%d_%H%M%S}.zip", fmt::localtime(std::time(nullptr)));
}

std::string currentTimestamp()
{
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::localtime(std::time(nullptr)));
}
