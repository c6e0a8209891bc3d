#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <utility>

#include <fmt/core.h>

#include "format_utils.hpp"

namespace
{
    constexpr long MAX_REDIRECTS = 10;
    constexpr long CONNECT_TIMEOUT_SECONDS = 30;
    constexpr long MIN_BUFFER_SIZE = 1024; // libcurl rejects smaller receive buffers

    std::string trim(const std::string &value)
    {
        auto begin = value.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
            return {};
        }
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(begin, end - begin + 1);
    }

    bool startsWithNoCase(const std::string &value, const std::string &prefix)
    {
        if (value.size() < prefix.size())
        {
            return false;
        }
        return std::equal(prefix.begin(), prefix.end(), value.begin(),
                          [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }
}

struct HttpClient::Exchange
{
    CURL *handle = nullptr;
    const HttpRequest *request = nullptr;
    const HeadHandler *onHead = nullptr;
    const ChunkHandler *onChunk = nullptr;

    HttpResponseHead head;
    bool headDelivered = false;
    bool stoppedByHandler = false; // onHead declined the body
    std::exception_ptr error;      // Exception raised inside a callback
};

CurlGlobal::CurlGlobal()
{
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}

HttpClient::HttpClient(std::string userAgent) : userAgent_(std::move(userAgent))
{
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *exchange = static_cast<Exchange *>(userdata);
    std::string line(buffer, totalSize);

    // A new status line starts a new hop of the redirect chain
    if (startsWithNoCase(line, "HTTP/"))
    {
        exchange->head.contentRange.clear();
    }
    else if (startsWithNoCase(line, "content-range:"))
    {
        exchange->head.contentRange = trim(line.substr(std::string("content-range:").size()));
    }

    return totalSize;
}

bool HttpClient::deliverHead(Exchange &exchange)
{
    if (exchange.headDelivered)
    {
        return !exchange.stoppedByHandler;
    }
    exchange.headDelivered = true;

    curl_easy_getinfo(exchange.handle, CURLINFO_RESPONSE_CODE, &exchange.head.status);
    curl_off_t contentLength = -1;
    if (curl_easy_getinfo(exchange.handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength) == CURLE_OK)
    {
        exchange.head.contentLength = static_cast<std::int64_t>(contentLength);
    }

    exchange.stoppedByHandler = !(*exchange.onHead)(exchange.head);
    return !exchange.stoppedByHandler;
}

size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *exchange = static_cast<Exchange *>(userdata);

    try
    {
        if (!deliverHead(*exchange))
        {
            return 0; // Caller does not want the body
        }
        (*exchange->onChunk)(ptr, totalSize);
    }
    catch (...)
    {
        exchange->error = std::current_exception();
        return 0; // Abort transfer, rethrown after curl_easy_perform
    }

    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *exchange = static_cast<Exchange *>(clientp);
    const std::atomic<bool> *cancel = exchange->request->cancel;
    return (cancel && cancel->load()) ? 1 : 0;
}

std::string HttpClient::buildCookieString(const std::map<std::string, std::string> &cookies)
{
    std::string result;
    for (const auto &[name, value] : cookies)
    {
        if (!result.empty())
        {
            result += "; ";
        }
        result += name;
        result += '=';
        result += value;
    }
    return result;
}

HttpResponseHead HttpClient::get(const HttpRequest &request,
                                 const HeadHandler &onHead,
                                 const ChunkHandler &onChunk)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
    {
        throw TransferError("Failed to initialize CURL (out of memory or library error)");
    }

    Exchange exchange;
    exchange.handle = curl.get();
    exchange.request = &request;
    exchange.onHead = &onHead;
    exchange.onChunk = &onChunk;

    // Custom headers (Range is one of them when resuming)
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList(nullptr, curl_slist_free_all);
    for (const auto &[name, value] : request.headers)
    {
        std::string line = fmt::format("{}: {}", name, value);
        curl_slist *appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended)
        {
            throw TransferError("Failed to build request headers");
        }
        headerList.release();
        headerList.reset(appended);
    }

    std::string cookieString = buildCookieString(request.cookies);

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    if (headerList)
    {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    }
    if (!cookieString.empty())
    {
        curl_easy_setopt(curl.get(), CURLOPT_COOKIE, cookieString.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &exchange);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &exchange);

    // Chunk size maps onto libcurl's receive buffer
    long bufferSize = std::max(MIN_BUFFER_SIZE,
                               static_cast<long>(std::min<std::size_t>(request.chunkSize, CURL_MAX_READ_SIZE)));
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, bufferSize);

    // HTTPS settings
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    // Signed archive links bounce through several redirects
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, MAX_REDIRECTS);

    // Large archives take hours: no overall timeout, abort only on stalls
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SECONDS);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.stallTimeoutSeconds));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // Required for multi-threaded use

    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &exchange);

    CURLcode res = curl_easy_perform(curl.get());

    if (exchange.error)
    {
        std::rethrow_exception(exchange.error);
    }

    if (exchange.stoppedByHandler)
    {
        return exchange.head;
    }

    if (res == CURLE_ABORTED_BY_CALLBACK && request.cancel && request.cancel->load())
    {
        throw TransferInterrupted();
    }

    if (res != CURLE_OK)
    {
        long httpCode = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
        if (httpCode > 0)
        {
            throw TransferError(fmt::format("{} (HTTP {} {})", curl_easy_strerror(res),
                                            httpCode, httpStatusText(httpCode)));
        }
        throw TransferError(curl_easy_strerror(res));
    }

    // Empty bodies never reach writeCallback
    if (!exchange.headDelivered)
    {
        deliverHead(exchange);
    }

    return exchange.head;
}
