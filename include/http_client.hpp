#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

/**
 * Network, protocol or local write failure during a transfer.
 */
class TransferError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Transfer aborted because a shutdown was requested.
 */
class TransferInterrupted : public TransferError
{
public:
    TransferInterrupted() : TransferError("Transfer interrupted by shutdown request") {}
};

/**
 * One GET request. Headers and cookies are sent on every hop of a redirect chain.
 */
struct HttpRequest
{
    std::string url;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
    std::size_t chunkSize = 8192;
    int stallTimeoutSeconds = 30;
    const std::atomic<bool> *cancel = nullptr; // Abort when set
};

/**
 * Final response metadata (after redirects).
 */
struct HttpResponseHead
{
    long status = 0;
    std::int64_t contentLength = -1; // -1 if not announced
    std::string contentRange;        // Raw Content-Range value, empty if absent
};

/**
 * Called once with the final response head, before any body bytes.
 * Return false to stop without reading the body (not an error).
 */
using HeadHandler = std::function<bool(const HttpResponseHead &)>;

/**
 * Called for every received body chunk. Throw to abort the transfer.
 */
using ChunkHandler = std::function<void(const char *data, std::size_t size)>;

/**
 * Abstract GET transport so the transfer logic can run against a scripted
 * server in tests.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    /**
     * Perform a GET, streaming the body into onChunk.
     *
     * @return Head of the final response
     * @throws TransferError on network failure
     * @throws TransferInterrupted if request.cancel was set mid-transfer
     * @throws any exception thrown by onHead / onChunk
     */
    virtual HttpResponseHead get(const HttpRequest &request,
                                 const HeadHandler &onHead,
                                 const ChunkHandler &onChunk) = 0;
};

/**
 * RAII owner of libcurl's global state. Create exactly one, in main(),
 * before any worker thread starts.
 */
class CurlGlobal
{
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal &) = delete;
    CurlGlobal &operator=(const CurlGlobal &) = delete;
};

/**
 * HTTP client for downloading files using libcurl.
 * Each get() uses its own CURL easy handle, so one client can be shared by
 * all worker threads.
 */
class HttpClient : public Transport
{
public:
    explicit HttpClient(std::string userAgent = "archive-fetch/1.0");

    HttpResponseHead get(const HttpRequest &request,
                         const HeadHandler &onHead,
                         const ChunkHandler &onChunk) override;

private:
    std::string userAgent_;

    /**
     * Per-request state shared with the libcurl callbacks.
     */
    struct Exchange;

    /**
     * Static callback for libcurl to deliver response header lines.
     * Used to capture Content-Range of the final hop.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * Static callback for libcurl to write downloaded data.
     * libcurl is C library, so callbacks must be static or free functions.
     * Exceptions never cross into libcurl: they are stored in the exchange
     * and rethrown once curl_easy_perform returns.
     *
     * @return Number of bytes consumed (anything else aborts the transfer)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static progress callback for libcurl, used only for cancellation.
     *
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    /**
     * Deliver the response head to the caller exactly once.
     */
    static bool deliverHead(Exchange &exchange);

    /**
     * Join cookies into a "name=value; name2=value2" Cookie string.
     */
    static std::string buildCookieString(const std::map<std::string, std::string> &cookies);
};
