#pragma once

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace vine {
namespace testing {

/**
 * @brief One-shot HTTP server on 127.0.0.1 for backend tests
 *
 * Accepts a single connection on an ephemeral port, reads the request and
 * answers with a fixed status and body. With hold_response set it never
 * answers and keeps the connection open until destroyed.
 */
class CannedHttpServer {
public:
    CannedHttpServer(int status, std::string body, bool hold_response = false)
        : status_(status)
        , body_(std::move(body))
        , hold_response_(hold_response) {
        server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (server_fd_ < 0) {
            return;
        }
        int opt = 1;
        setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(server_fd_, 1) < 0) {
            ::close(server_fd_);
            server_fd_ = -1;
            return;
        }

        socklen_t len = sizeof(addr);
        if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
            port_ = ntohs(addr.sin_port);
        }
        thread_ = std::thread([this]() { serve(); });
    }

    ~CannedHttpServer() {
        stop_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
        if (server_fd_ >= 0) {
            ::close(server_fd_);
        }
    }

    CannedHttpServer(const CannedHttpServer&) = delete;
    CannedHttpServer& operator=(const CannedHttpServer&) = delete;

    bool is_listening() const { return port_ != 0; }

    std::string base_url() const {
        return "http://127.0.0.1:" + std::to_string(port_) + "/v1";
    }

    std::string received_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_;
    }

private:
    // Waits in short slices so the destructor is never blocked for long.
    bool wait_readable(int fd) {
        while (!stop_) {
            struct pollfd pfd = {fd, POLLIN, 0};
            int ret = ::poll(&pfd, 1, 50);
            if (ret > 0) {
                return true;
            }
        }
        return false;
    }

    void serve() {
        if (!wait_readable(server_fd_)) {
            return;
        }
        int client_fd = ::accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            return;
        }

        std::string request;
        char chunk[4096];
        while (!request_complete(request) && wait_readable(client_fd)) {
            ssize_t n = ::read(client_fd, chunk, sizeof(chunk));
            if (n <= 0) {
                break;
            }
            request.append(chunk, static_cast<size_t>(n));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_ = request;
        }

        if (hold_response_) {
            while (!stop_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        } else {
            std::string response = "HTTP/1.1 " + std::to_string(status_) + " Canned\r\n"
                                    "Content-Type: application/json\r\n"
                                    "Content-Length: " + std::to_string(body_.size()) + "\r\n"
                                    "Connection: close\r\n\r\n" + body_;
            size_t offset = 0;
            while (offset < response.size()) {
                ssize_t n = ::write(client_fd, response.data() + offset, response.size() - offset);
                if (n <= 0) {
                    break;
                }
                offset += static_cast<size_t>(n);
            }
        }
        ::close(client_fd);
    }

    static bool request_complete(const std::string& request) {
        size_t header_end = request.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return false;
        }
        size_t length = 0;
        size_t pos = request.find("Content-Length:");
        if (pos != std::string::npos && pos < header_end) {
            length = std::stoul(request.substr(pos + 15));
        }
        return request.size() >= header_end + 4 + length;
    }

    int status_;
    std::string body_;
    bool hold_response_;
    int server_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::string request_;
};

} // namespace testing
} // namespace vine
