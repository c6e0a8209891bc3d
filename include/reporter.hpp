#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "download_record.hpp"

/**
 * Read-only summary of the ledger at the end of a run.
 */
struct Report
{
    struct Problem
    {
        std::string filename;
        std::string message;
    };

    std::size_t total = 0;
    std::map<DownloadStatus, std::size_t> counts;
    std::vector<Problem> failed;
    std::vector<Problem> expired;

    std::size_t count(DownloadStatus status) const;
};

class Reporter
{
public:
    /**
     * Reduce records to counts per status plus the failed/expired details.
     */
    static Report summarize(const std::vector<DownloadRecord> &records);

    /**
     * Render the summary block, e.g.
     *
     *   === Download Summary ===
     *   Total files: 3
     *   Completed: 1
     *   ...
     */
    static std::string render(const Report &report);

    static void print(const Report &report);
};
