#include "scheduler.hpp"

#include <fmt/core.h>

#include "reporter.hpp"
#include "test_support.hpp"

using testing_support::Checks;
using testing_support::FakeResponse;
using testing_support::FakeTransport;
using testing_support::TempDir;

namespace
{
    /**
     * One output directory shared by successive "runs", each run with a
     * freshly loaded ledger like a restarted process.
     */
    struct Workspace
    {
        explicit Workspace(const std::string &name, std::size_t minBytes = ArchiveValidator::DEFAULT_MIN_BYTES)
            : dir(name), validator(minBytes)
        {
            std::filesystem::create_directories(outputDir());
        }

        std::filesystem::path outputDir() const { return dir.path() / "downloads"; }
        std::filesystem::path ledgerFile() const { return outputDir() / ProgressLedger::DEFAULT_FILENAME; }

        RunSummary run(const std::vector<std::string> &urls, int concurrency, int maxAttempts = 3)
        {
            ProgressLedger ledger(ledgerFile());
            ledger.load();

            TransferOptions options;
            options.outputDir = outputDir();
            options.chunkSize = 8192;
            options.persistEveryChunks = 4;

            TransferEngine engine(ledger, transport, validator, options);
            Scheduler scheduler(ledger, engine, validator, auth, maxAttempts);
            return scheduler.run(urls, concurrency);
        }

        std::optional<DownloadRecord> record(const std::string &url) const
        {
            ProgressLedger ledger(ledgerFile());
            ledger.load();
            return ledger.get(url);
        }

        TempDir dir;
        FakeTransport transport;
        ArchiveValidator validator;
        AuthBundle auth;
    };

    std::string urlFor(int index)
    {
        return fmt::format("https://example.com/exports/takeout-{:03}.zip", index);
    }
}

int main()
{
    Checks checks;

    try
    {
        // Test 1: pending-set rules
        {
            Workspace ws("sched-pending");
            ProgressLedger ledger(ws.ledgerFile());
            TransferOptions options;
            options.outputDir = ws.outputDir();
            TransferEngine engine(ledger, ws.transport, ws.validator, options);
            Scheduler scheduler(ledger, engine, ws.validator, ws.auth, 3);

            auto seed = [&](int index, DownloadStatus status, int retries)
            {
                DownloadRecord record = ledger.getOrCreate(urlFor(index));
                record.status = status;
                record.retryCount = retries;
                ledger.upsert(record);
                return record;
            };

            seed(1, DownloadStatus::Pending, 0);
            seed(2, DownloadStatus::Failed, 2);
            seed(3, DownloadStatus::Failed, 3);
            seed(4, DownloadStatus::Expired, 0);
            DownloadRecord done = seed(5, DownloadStatus::Completed, 0);
            testing_support::writeFile(ws.outputDir() / done.filename, testing_support::largeZip());
            seed(6, DownloadStatus::Completed, 0); // File missing
            DownloadRecord stale = seed(7, DownloadStatus::Downloading, 0);
            testing_support::writeFile(ws.outputDir() / stale.filename, "partial");

            std::vector<std::string> urls;
            for (int i = 1; i <= 8; ++i)
            {
                urls.push_back(urlFor(i));
            }
            urls.push_back(urlFor(1)); // Duplicate

            std::vector<std::string> pending = scheduler.pendingUrls(urls);
            checks.expect(pending == std::vector<std::string>{urlFor(1), urlFor(2), urlFor(6), urlFor(7), urlFor(8)},
                          "pending set follows status rules, input order, no duplicates");
            checks.expect(ledger.get(urlFor(8)).has_value(), "unseen URL gets a record");
        }

        // Test 2: bounded concurrency and idempotence
        {
            Workspace ws("sched-concurrency");
            std::vector<std::string> urls;
            for (int i = 1; i <= 5; ++i)
            {
                urls.push_back(urlFor(i));
                FakeResponse response{200, testing_support::largeZip(static_cast<unsigned>(i))};
                response.delayMs = 30;
                ws.transport.respond(urlFor(i), response);
            }

            RunSummary summary = ws.run(urls, 2);
            checks.expect(summary.dispatched == 5 && summary.completed == 5, "all five archives downloaded");
            checks.expect(ws.transport.maxConcurrent() <= 2,
                          fmt::format("at most two transfers in flight ({})", ws.transport.maxConcurrent()));
            checks.expect(ws.transport.maxConcurrent() == 2, "pool actually ran transfers in parallel");

            RunSummary again = ws.run(urls, 2);
            checks.expect(again.dispatched == 0 && ws.transport.requestCount() == 5,
                          "second run issues no requests");
        }

        // Test 3: cumulative retry cap across runs
        {
            Workspace ws("sched-retry");
            const std::string url = urlFor(1);
            ws.transport.respond(url, {500, "error"});

            for (int i = 0; i < 4; ++i)
            {
                ws.run({url}, 4);
            }
            auto record = ws.record(url);
            checks.expect(ws.transport.requestCount() == 3, "failing URL attempted three times over four runs");
            checks.expect(record && record->status == DownloadStatus::Failed && record->retryCount == 3,
                          "record reflects exhausted attempts");
        }

        // Test 4: expired links are terminal
        {
            Workspace ws("sched-expired");
            const std::string url = urlFor(1);
            ws.transport.respond(url, {403, "forbidden"});

            RunSummary first = ws.run({url}, 1);
            RunSummary second = ws.run({url}, 1);
            checks.expect(first.expired == 1 && second.dispatched == 0 && ws.transport.requestCount() == 1,
                          "expired URL never requested again");
        }

        // Test 5: mixed outcomes with isolated failures
        {
            Workspace ws("sched-mixed", 64);
            const std::string good = "https://example.com/good.zip";
            const std::string login = "https://example.com/login.zip";
            const std::string gone = "https://example.com/gone.zip";
            const std::string unreachable = "https://unreachable.example.com/x.zip";

            ws.transport.respond(good, {200, testing_support::makeZip({{"a.txt", std::string(200, 'a')}})});
            ws.transport.respond(login, {200, testing_support::htmlPage(200)});
            ws.transport.respond(gone, {404, "not found"});

            RunSummary summary = ws.run({good, login, gone, unreachable}, 3);
            checks.expect(summary.dispatched == 4 && summary.completed == 1 && summary.failed == 2 &&
                              summary.expired == 1,
                          "each URL reaches its own outcome");

            auto goodRecord = ws.record(good);
            auto loginRecord = ws.record(login);
            auto goneRecord = ws.record(gone);
            auto unreachableRecord = ws.record(unreachable);
            checks.expect(goodRecord && goodRecord->status == DownloadStatus::Completed, "archive completed");
            checks.expect(loginRecord && loginRecord->status == DownloadStatus::Failed &&
                              std::filesystem::exists(ws.outputDir() / loginRecord->filename),
                          "login page failed and kept");
            checks.expect(goneRecord && goneRecord->status == DownloadStatus::Expired, "404 expired");
            checks.expect(unreachableRecord && unreachableRecord->status == DownloadStatus::Failed &&
                              unreachableRecord->retryCount == 1,
                          "network failure isolated to its URL");
        }

        // Test 6: three-link export with one good archive, one dead link and one login page
        {
            Workspace ws("sched-three", 64);
            const std::string archiveUrl = "https://example.com/exports/takeout-001.zip";
            const std::string goneUrl = "https://example.com/exports/takeout-002.zip";
            const std::string loginUrl = "https://example.com/exports/takeout-003.zip";

            std::string smallArchive = testing_support::makeZip({{"a.txt", "hello"}});
            ws.transport.respond(archiveUrl, {206, smallArchive});
            ws.transport.respond(goneUrl, {404, "not found"});
            ws.transport.respond(loginUrl, {200, testing_support::htmlPage(40000)});

            std::vector<std::string> urls = {archiveUrl, goneUrl, loginUrl};
            ws.run(urls, 4);

            ProgressLedger ledger(ws.ledgerFile());
            ledger.load();
            Report report = Reporter::summarize(ledger.records());
            checks.expect(report.total == 3 && report.count(DownloadStatus::Completed) == 1 &&
                              report.count(DownloadStatus::Failed) == 1 && report.count(DownloadStatus::Expired) == 1,
                          "summary shows 1 completed, 1 failed, 1 expired");

            auto archiveRecord = ledger.get(archiveUrl);
            checks.expect(archiveRecord && archiveRecord->bytesDownloaded == smallArchive.size() &&
                              archiveRecord->totalBytes == smallArchive.size(),
                          "partial-content archive stored whole");
            checks.expect(report.failed.size() == 1 &&
                              report.failed[0].message == "Not a valid archive (likely an authentication page)",
                          "login page reported as invalid archive");
            checks.expect(report.expired.size() == 1 && report.expired[0].message == "Link expired (HTTP 404)",
                          "dead link reported as expired");
        }

        // Test 7: finished file of a record still marked downloading
        {
            Workspace ws("sched-adopt");
            const std::string url = urlFor(1);
            const std::string archive = testing_support::largeZip();

            {
                ProgressLedger ledger(ws.ledgerFile());
                DownloadRecord record = ledger.getOrCreate(url);
                record.status = DownloadStatus::Downloading;
                record.bytesDownloaded = 4096;
                ledger.commit(record);
                testing_support::writeFile(ws.outputDir() / record.filename, archive);
            }

            RunSummary first = ws.run({url}, 2);
            auto record = ws.record(url);
            checks.expect(first.dispatched == 0 && ws.transport.requestCount() == 0,
                          "valid file is not downloaded again");
            checks.expect(record && record->status == DownloadStatus::Completed && record->completedAt &&
                              record->bytesDownloaded == archive.size() && record->totalBytes == archive.size(),
                          "downloading record with valid file becomes completed");

            ws.run({url}, 2);
            ProgressLedger ledger(ws.ledgerFile());
            ledger.load();
            Report report = Reporter::summarize(ledger.records());
            checks.expect(report.count(DownloadStatus::Completed) == 1 && report.count(DownloadStatus::Downloading) == 0,
                          "no unfinished record left after later runs");
        }

        // Test 8: scheduler keeps its own copy of the credentials
        {
            Workspace ws("sched-auth");
            const std::string url = urlFor(1);
            ws.transport.respond(url, {200, testing_support::largeZip()});

            ProgressLedger ledger(ws.ledgerFile());
            TransferOptions options;
            options.outputDir = ws.outputDir();
            TransferEngine engine(ledger, ws.transport, ws.validator, options);

            auto makeAuth = []()
            {
                AuthBundle auth;
                auth.cookies["SID"] = "abc";
                auth.headers["X-Goog-AuthUser"] = "0";
                return auth;
            };
            Scheduler scheduler(ledger, engine, ws.validator, makeAuth(), 3);
            RunSummary summary = scheduler.run({url}, 1);

            HttpRequest request = ws.transport.requests().at(0);
            checks.expect(summary.completed == 1 && request.cookies.at("SID") == "abc" &&
                              request.headers.at("X-Goog-AuthUser") == "0",
                          "credentials passed as a temporary reach every request");
        }

        // Test 9: result channel drains after every producer closes
        {
            ResultChannel channel(2);
            channel.push({"a", TransferOutcome::Completed});
            channel.close();
            channel.push({"b", TransferOutcome::Failed});
            channel.close();

            auto first = channel.pop();
            auto second = channel.pop();
            auto end = channel.pop();
            checks.expect(first && first->first == "a" && second && second->second == TransferOutcome::Failed && !end,
                          "channel yields queued results then end");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return checks.summary();
}
