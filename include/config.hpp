#pragma once

#include <cstddef>
#include <optional> // C++17 feature for optional values
#include <stdexcept>
#include <string>

/**
 * Configuration for the archive downloader.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct DownloadConfig
{
    // Required parameters
    std::string urlsFile;

    // Optional parameters with sensible defaults
    std::string outputDir = "./downloads";
    int maxWorkers = 4;                 // Parallel transfers
    std::size_t chunkSize = 8192;       // Streaming chunk size in bytes
    std::size_t minArchiveBytes = 50000; // Anything smaller is an error page
    int persistEveryChunks = 100;       // Ledger snapshot interval during a transfer
    int stallTimeoutSeconds = 30;       // Abort when no data arrives for this long
    int maxAttempts = 3;                // Cumulative failed attempts before giving up

    // Cookies/headers bundle (JSON or Netscape cookie file)
    std::optional<std::string> authFile;

    // Flags
    bool writeManifest = false; // Write SHA256SUMS for completed archives
    bool showVersion = false;   // Display version and exit
};

/**
 * Startup configuration problem (missing input, unwritable output).
 * Always fatal: no partial run is attempted.
 */
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
