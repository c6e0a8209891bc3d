#include <atomic>
#include <csignal>
#include <filesystem>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header

#include "archive_validator.hpp"
#include "auth_bundle.hpp"
#include "checksum.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "progress_ledger.hpp"
#include "reporter.hpp"
#include "scheduler.hpp"
#include "transfer_engine.hpp"

namespace
{
    // Set from the signal handler; everything else only reads it
    std::atomic<bool> g_stopRequested{false};

    void handleStopSignal(int)
    {
        g_stopRequested.store(true);
    }

    constexpr int EXIT_INTERRUPTED = 130;
    const char *const DEFAULT_AUTH_FILE = "headers.json";

    AuthBundle resolveAuth(const DownloadConfig &config)
    {
        if (config.authFile)
        {
            AuthBundle auth = loadAuthBundle(*config.authFile);
            fmt::print("Loaded {} cookies and {} headers from {}\n",
                       auth.cookies.size(), auth.headers.size(), *config.authFile);
            return auth;
        }

        std::error_code ec;
        if (std::filesystem::exists(DEFAULT_AUTH_FILE, ec))
        {
            AuthBundle auth = loadAuthBundle(DEFAULT_AUTH_FILE);
            fmt::print("Loaded {} cookies and {} headers from {}\n",
                       auth.cookies.size(), auth.headers.size(), DEFAULT_AUTH_FILE);
            return auth;
        }

        fmt::print(stderr, "Warning: No auth file given, requests will be sent without cookies\n");
        return {};
    }

    void prepareOutputDir(const std::filesystem::path &outputDir)
    {
        std::error_code ec;
        std::filesystem::create_directories(outputDir, ec);
        if (ec || !std::filesystem::is_directory(outputDir))
        {
            throw ConfigError(fmt::format("Cannot create output directory {}: {}",
                                          outputDir.string(), ec ? ec.message() : "not a directory"));
        }
    }
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("archive-fetch v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: HTTP/HTTPS transfers with range resume\n");
            fmt::print("  - libarchive: zip structure validation\n");
            fmt::print("  - nlohmann/json: progress ledger and auth bundles\n");
            fmt::print("  - OpenSSL: SHA-256 manifests\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            return 0;
        }
    }

    CLI::App app{"archive-fetch v1.0 - Resumable concurrent downloader for authenticated archive links"};

    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("URLS_FILE", config.urlsFile, "Text file with one download URL per line")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-o,--output-dir", config.outputDir, "Directory to save downloads")
        ->default_val("./downloads");

    app.add_option("-w,--max-workers", config.maxWorkers, "Maximum concurrent downloads")
        ->check(CLI::Range(1, 64))
        ->default_val(4);

    app.add_option("-c,--chunk-size", config.chunkSize, "Download chunk size in bytes")
        ->check(CLI::PositiveNumber)
        ->default_val(8192);

    app.add_option("-a,--auth,--cookies", config.authFile,
                   "Cookies/headers bundle (JSON or Netscape format); defaults to ./headers.json if present")
        ->check(CLI::ExistingFile);

    app.add_option("--min-archive-size", config.minArchiveBytes,
                   "Smallest file size accepted as a real archive, in bytes")
        ->default_val(ArchiveValidator::DEFAULT_MIN_BYTES);

    app.add_option("--persist-every", config.persistEveryChunks,
                   "Save progress every N chunks during a transfer")
        ->check(CLI::PositiveNumber)
        ->default_val(100);

    app.add_option("-t,--stall-timeout", config.stallTimeoutSeconds,
                   "Abort a transfer after this many seconds without data")
        ->check(CLI::PositiveNumber)
        ->default_val(30);

    app.add_option("-r,--max-attempts", config.maxAttempts,
                   "Failed attempts (across runs) before a URL is no longer retried")
        ->check(CLI::Range(1, 100))
        ->default_val(Scheduler::DEFAULT_MAX_ATTEMPTS);

    app.add_flag("-m,--manifest", config.writeManifest,
                 "Write SHA256SUMS for completed archives after the run");

    // Optional flag: --version (for help display only, actual handling is done above)
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // ====================================================================
    // DISPLAY CONFIGURATION
    // ====================================================================

    fmt::print("archive-fetch v1.0\n");
    fmt::print("====================================\n\n");

    fmt::print("Configuration:\n");
    fmt::print("  URLs file:   {}\n", config.urlsFile);
    fmt::print("  Output dir:  {}\n", config.outputDir);
    fmt::print("  Workers:     {}\n", config.maxWorkers);
    fmt::print("  Chunk size:  {}\n", config.chunkSize);
    fmt::print("  Max retries: {}\n", config.maxAttempts);
    if (config.authFile)
    {
        fmt::print("  Auth file:   {}\n", config.authFile.value());
    }
    fmt::print("\n");

    // ====================================================================
    // PERFORM DOWNLOADS
    // ====================================================================

    try
    {
        std::vector<std::string> urls = loadUrlList(config.urlsFile);
        fmt::print("Loaded {} URLs from {}\n", urls.size(), config.urlsFile);
        if (urls.empty())
        {
            fmt::print(stderr, "✗ No valid URLs found in {}\n", config.urlsFile);
            return 1;
        }

        AuthBundle auth = resolveAuth(config);

        std::filesystem::path outputDir(config.outputDir);
        prepareOutputDir(outputDir);

        ProgressLedger ledger(outputDir / ProgressLedger::DEFAULT_FILENAME);
        std::size_t loaded = ledger.load();
        if (loaded > 0)
        {
            fmt::print("Loaded progress for {} downloads\n", loaded);
        }

        // Fails here, before any transfer, if the output directory is not writable
        ledger.snapshot();

        // RAII: libcurl global state lives until main returns
        CurlGlobal curlGlobal;
        HttpClient client;

        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);

        ArchiveValidator validator(config.minArchiveBytes);

        TransferOptions options;
        options.outputDir = outputDir;
        options.chunkSize = config.chunkSize;
        options.persistEveryChunks = config.persistEveryChunks;
        options.stallTimeoutSeconds = config.stallTimeoutSeconds;

        TransferEngine engine(ledger, client, validator, options, &g_stopRequested);
        Scheduler scheduler(ledger, engine, validator, auth, config.maxAttempts, &g_stopRequested);

        RunSummary summary = scheduler.run(urls, config.maxWorkers);

        // Final state of every record, including offsets of interrupted transfers
        ledger.snapshot();

        if (g_stopRequested.load())
        {
            fmt::print(stderr, "\nDownload interrupted by user. Progress saved ({} transfers paused).\n",
                       summary.interrupted);
            Reporter::print(Reporter::summarize(ledger.records()));
            return EXIT_INTERRUPTED;
        }

        Reporter::print(Reporter::summarize(ledger.records()));

        if (config.writeManifest)
        {
            std::size_t entries = ChecksumManifest::write(outputDir, ledger.records());
            fmt::print("\n✓ Wrote {} checksums to {}\n", entries,
                       (outputDir / ChecksumManifest::MANIFEST_FILENAME).string());
        }

        return (summary.failed > 0 || summary.expired > 0) ? 1 : 0;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
