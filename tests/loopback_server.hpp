#pragma once

// Minimal HTTP/1.1 server bound to 127.0.0.1 on an ephemeral port, so the
// libcurl client can be exercised over a real socket. One connection at a
// time, "Connection: close" on every reply.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "format_utils.hpp"

namespace testing_support
{
    /**
     * Scripted reply for one request path.
     */
    struct LoopbackRoute
    {
        long status = 200;
        std::string body;
        std::vector<std::pair<std::string, std::string>> headers;
        bool supportsRange = true; // Answer "Range: bytes=N-" with 206
    };

    class LoopbackServer
    {
    public:
        LoopbackServer()
        {
            listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listenFd_ < 0)
            {
                throw std::runtime_error("Cannot create listen socket");
            }

            int opt = 1;
            ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            socklen_t length = sizeof(addr);
            if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
                ::listen(listenFd_, 16) != 0 ||
                ::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&addr), &length) != 0)
            {
                ::close(listenFd_);
                throw std::runtime_error("Cannot listen on 127.0.0.1");
            }
            port_ = ntohs(addr.sin_port);

            running_ = true;
            thread_ = std::thread([this]()
                                  { serve(); });
        }

        ~LoopbackServer()
        {
            running_ = false;
            // Wakes the blocked accept()
            ::shutdown(listenFd_, SHUT_RDWR);
            thread_.join();
            ::close(listenFd_);
        }

        LoopbackServer(const LoopbackServer &) = delete;
        LoopbackServer &operator=(const LoopbackServer &) = delete;

        void route(const std::string &path, LoopbackRoute reply)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            routes_[path] = std::move(reply);
        }

        std::string url(const std::string &path) const
        {
            return fmt::format("http://127.0.0.1:{}{}", port_, path);
        }

        /**
         * Raw request heads received so far, in arrival order.
         */
        std::vector<std::string> requests() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

    private:
        void serve()
        {
            while (running_)
            {
                int client = ::accept(listenFd_, nullptr, nullptr);
                if (client < 0)
                {
                    if (running_ && errno == EINTR)
                    {
                        continue;
                    }
                    break;
                }
                handle(client);
                ::close(client);
            }
        }

        void handle(int client)
        {
            std::string head;
            char buffer[4096];
            while (head.find("\r\n\r\n") == std::string::npos)
            {
                ssize_t received = ::recv(client, buffer, sizeof(buffer), 0);
                if (received <= 0)
                {
                    return; // Client gave up before sending a full request
                }
                head.append(buffer, static_cast<std::size_t>(received));
            }

            // "GET /path HTTP/1.1"
            auto firstSpace = head.find(' ');
            auto secondSpace = head.find(' ', firstSpace + 1);
            std::string path = head.substr(firstSpace + 1, secondSpace - firstSpace - 1);

            LoopbackRoute reply;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(head);
                auto it = routes_.find(path);
                if (it == routes_.end())
                {
                    reply.status = 404;
                }
                else
                {
                    reply = it->second;
                }
            }

            long status = reply.status;
            std::string body = reply.body;
            std::vector<std::pair<std::string, std::string>> headers = reply.headers;

            std::size_t offset = rangeStart(head);
            if (status == 200 && reply.supportsRange && offset > 0 && offset < reply.body.size())
            {
                status = 206;
                headers.emplace_back("Content-Range", fmt::format("bytes {}-{}/{}", offset, reply.body.size() - 1,
                                                                  reply.body.size()));
                body = reply.body.substr(offset);
            }

            std::string response = fmt::format("HTTP/1.1 {} {}\r\n", status, httpStatusText(status));
            response += fmt::format("Content-Length: {}\r\n", body.size());
            response += "Connection: close\r\n";
            for (const auto &[name, value] : headers)
            {
                response += fmt::format("{}: {}\r\n", name, value);
            }
            response += "\r\n";
            response += body;

            std::size_t sent = 0;
            while (sent < response.size())
            {
                // MSG_NOSIGNAL: an aborted client must not raise SIGPIPE
                ssize_t written = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (written <= 0)
                {
                    return;
                }
                sent += static_cast<std::size_t>(written);
            }
        }

        // Offset N of a "Range: bytes=N-" header, 0 if absent
        static std::size_t rangeStart(const std::string &head)
        {
            std::string lower = head;
            for (auto &ch : lower)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            auto pos = lower.find("\r\nrange: bytes=");
            if (pos == std::string::npos)
            {
                return 0;
            }
            pos += std::string("\r\nrange: bytes=").size();
            auto dash = lower.find('-', pos);
            if (dash == std::string::npos || dash == pos)
            {
                return 0;
            }
            return static_cast<std::size_t>(std::stoull(lower.substr(pos, dash - pos)));
        }

        int listenFd_ = -1;
        unsigned short port_ = 0;
        std::atomic<bool> running_{false};
        std::thread thread_;
        mutable std::mutex mutex_;
        std::map<std::string, LoopbackRoute> routes_;
        std::vector<std::string> requests_;
    };
}
