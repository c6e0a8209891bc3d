#include "reporter.hpp"

#include <fmt/core.h>

std::size_t Report::count(DownloadStatus status) const
{
    auto it = counts.find(status);
    return it == counts.end() ? 0 : it->second;
}

Report Reporter::summarize(const std::vector<DownloadRecord> &records)
{
    Report report;
    report.total = records.size();

    for (const auto &record : records)
    {
        ++report.counts[record.status];

        if (record.status == DownloadStatus::Failed)
        {
            report.failed.push_back({record.filename, record.errorMessage.value_or("unknown error")});
        }
        else if (record.status == DownloadStatus::Expired)
        {
            report.expired.push_back({record.filename, record.errorMessage.value_or("link expired")});
        }
    }

    return report;
}

std::string Reporter::render(const Report &report)
{
    std::string out;
    out += "\n=== Download Summary ===\n";
    out += fmt::format("Total files: {}\n", report.total);
    out += fmt::format("Completed: {}\n", report.count(DownloadStatus::Completed));
    out += fmt::format("Failed: {}\n", report.count(DownloadStatus::Failed));
    out += fmt::format("Expired: {}\n", report.count(DownloadStatus::Expired));

    // Only shown when a run was cut short
    std::size_t unfinished = report.count(DownloadStatus::Pending) + report.count(DownloadStatus::Downloading);
    if (unfinished > 0)
    {
        out += fmt::format("Unfinished: {}\n", unfinished);
    }

    if (!report.failed.empty())
    {
        out += "\nFailed downloads:\n";
        for (const auto &problem : report.failed)
        {
            out += fmt::format("  - {}: {}\n", problem.filename, problem.message);
        }
    }

    if (!report.expired.empty())
    {
        out += "\nExpired links (request a fresh export link):\n";
        for (const auto &problem : report.expired)
        {
            out += fmt::format("  - {}: {}\n", problem.filename, problem.message);
        }
    }

    return out;
}

void Reporter::print(const Report &report)
{
    fmt::print("{}", render(report));
}
