#include "progress_ledger.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

ProgressLedger::ProgressLedger(std::filesystem::path file) : file_(std::move(file))
{
}

std::size_t ProgressLedger::load()
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(file_, ec))
    {
        return 0;
    }

    std::ifstream in(file_);
    if (!in)
    {
        throw LedgerError(fmt::format("Cannot open progress file: {}", file_.string()));
    }

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw LedgerError(fmt::format("Progress file {} is not valid JSON: {}", file_.string(), e.what()));
    }

    if (!data.is_object())
    {
        throw LedgerError(fmt::format("Progress file {} must contain a JSON object", file_.string()));
    }

    records_.clear();
    for (const auto &[url, entry] : data.items())
    {
        auto record = recordFromJson(url, entry);
        if (!record)
        {
            fmt::print(stderr, "Warning: Skipping malformed progress entry for {}\n", url);
            continue;
        }
        records_[url] = *record;
    }

    return records_.size();
}

void ProgressLedger::snapshot()
{
    std::lock_guard<std::mutex> lock(mutex_);
    writeLocked();
}

void ProgressLedger::writeLocked() const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[url, record] : records_)
    {
        data[url] = recordToJson(record);
    }

    std::filesystem::path tempPath = file_;
    tempPath += ".tmp";

    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out)
        {
            throw LedgerError(fmt::format("Cannot open {} for writing", tempPath.string()));
        }
        out << data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        out.flush();
        if (!out.good())
        {
            throw LedgerError(fmt::format("Failed to write {}", tempPath.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, file_, ec);
    if (ec)
    {
        throw LedgerError(fmt::format("Failed to replace {}: {}", file_.string(), ec.message()));
    }
}

std::optional<DownloadRecord> ProgressLedger::get(const std::string &url) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(url);
    if (it == records_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void ProgressLedger::upsert(const DownloadRecord &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.url] = record;
}

bool ProgressLedger::commit(const DownloadRecord &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.url] = record;
    try
    {
        writeLocked();
        return true;
    }
    catch (const LedgerError &e)
    {
        fmt::print(stderr, "Warning: Could not save progress: {}\n", e.what());
        return false;
    }
}

bool ProgressLedger::filenameTakenLocked(const std::string &filename) const
{
    for (const auto &entry : records_)
    {
        if (entry.second.filename == filename)
        {
            return true;
        }
    }
    return false;
}

DownloadRecord ProgressLedger::getOrCreate(const std::string &url)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(url);
    if (it != records_.end())
    {
        return it->second;
    }

    std::string filename = deriveFilename(url);
    if (filenameTakenLocked(filename))
    {
        std::filesystem::path base(filename);
        std::string stem = base.stem().string();
        std::string extension = base.extension().string();
        for (int suffix = 1;; ++suffix)
        {
            std::string candidate = fmt::format("{}_{}{}", stem, suffix, extension);
            if (!filenameTakenLocked(candidate))
            {
                filename = candidate;
                break;
            }
        }
    }

    DownloadRecord record;
    record.url = url;
    record.filename = filename;
    record.status = DownloadStatus::Pending;
    records_[url] = record;
    return record;
}

std::vector<DownloadRecord> ProgressLedger::records() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadRecord> result;
    result.reserve(records_.size());
    for (const auto &entry : records_)
    {
        result.push_back(entry.second);
    }
    return result;
}

std::size_t ProgressLedger::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}
