/*
 * TCP Socket Implementation
 */

#include "tcp_socket.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <netdb.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace net {

static int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

static int remaining_ms(int64_t deadline_ms) {
    int64_t left = deadline_ms - now_ms();
    return left > 0 ? static_cast<int>(left) : 0;
}

TcpSocket::TcpSocket()
    : fd_(-1)
    , buffer_pos_(0)
    , timed_out_(false)
{
}

TcpSocket::~TcpSocket() {
    close();
}

ConnectResult TcpSocket::connect_to(const std::string& host, int port, int timeout_ms) {
    close();
    last_error_.clear();

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (rc != 0) {
        last_error_ = "Failed to resolve " + host + ": " + gai_strerror(rc);
        return ConnectResult::Error;
    }

    ConnectResult result = ConnectResult::Error;

    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error_ = std::string("Failed to create socket: ") + strerror(errno);
            continue;
        }

        // Non-blocking connect so the handshake can be bounded by poll()
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_error_ = std::string("Failed to set non-blocking mode: ") + strerror(errno);
            ::close(fd);
            continue;
        }

        int err = 0;
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                err = errno;
            } else {
                struct pollfd pfd;
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                int ready = poll(&pfd, 1, timeout_ms);
                if (ready == 0) {
                    err = ETIMEDOUT;
                } else if (ready < 0) {
                    err = errno;
                } else {
                    socklen_t len = sizeof(err);
                    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
                        err = errno;
                    }
                }
            }
        }

        if (err != 0) {
            last_error_ = "Connect to " + host + ":" + port_str + " failed: " + strerror(err);
            if (err == ECONNREFUSED) {
                result = ConnectResult::Refused;
            } else if (err == ETIMEDOUT) {
                result = ConnectResult::Timeout;
            }
            ::close(fd);
            continue;
        }

        // Back to blocking for writes; reads are bounded by poll()
        if (fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
            last_error_ = std::string("Failed to restore blocking mode: ") + strerror(errno);
            ::close(fd);
            result = ConnectResult::Error;
            continue;
        }

        // Input events are tiny; don't let Nagle batch them
        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        fd_ = fd;
        result = ConnectResult::Ok;
        break;
    }

    freeaddrinfo(results);
    return result;
}

void TcpSocket::close() {
    {
        // Held across ::close so a concurrent shutdown() never sees a
        // descriptor number that has already been released and reused
        std::lock_guard<std::mutex> lock(fd_mutex_);
        int fd = fd_.exchange(-1);
        if (fd >= 0) {
            ::close(fd);
        }
    }
    buffer_.clear();
    buffer_pos_ = 0;
}

void TcpSocket::shutdown() {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    int fd = fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void TcpSocket::compact() {
    if (buffer_pos_ > 0 && buffer_pos_ == buffer_.size()) {
        buffer_.clear();
        buffer_pos_ = 0;
    } else if (buffer_pos_ > 64 * 1024) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + buffer_pos_);
        buffer_pos_ = 0;
    }
}

bool TcpSocket::fill(int64_t deadline_ms) {
    int fd = fd_.load();
    if (fd < 0) {
        last_error_ = "Socket not connected";
        return false;
    }

    while (true) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, remaining_ms(deadline_ms));
        if (ready < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("poll failed: ") + strerror(errno);
            return false;
        }
        if (ready == 0) {
            timed_out_ = true;
            last_error_ = "Read timed out";
            return false;
        }

        uint8_t chunk[65536];
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            last_error_ = std::string("recv failed: ") + strerror(errno);
            return false;
        }
        if (n == 0) {
            last_error_ = "Connection closed by peer";
            return false;
        }

        compact();
        buffer_.insert(buffer_.end(), chunk, chunk + n);
        return true;
    }
}

int TcpSocket::wait_readable(int timeout_ms) {
    timed_out_ = false;
    if (buffered() > 0) return 1;
    if (!fill(now_ms() + timeout_ms)) {
        return timed_out_ ? 0 : -1;
    }
    return 1;
}

bool TcpSocket::read_exact(void* buf, size_t len, int timeout_ms) {
    timed_out_ = false;
    int64_t deadline = now_ms() + timeout_ms;
    while (buffered() < len) {
        if (!fill(deadline)) return false;
    }
    if (len > 0) {
        memcpy(buf, buffer_.data() + buffer_pos_, len);
        buffer_pos_ += len;
    }
    compact();
    return true;
}

bool TcpSocket::skip(size_t len, int timeout_ms) {
    timed_out_ = false;
    int64_t deadline = now_ms() + timeout_ms;
    while (len > 0) {
        if (buffered() == 0 && !fill(deadline)) return false;
        size_t take = std::min(len, buffered());
        buffer_pos_ += take;
        len -= take;
        compact();
    }
    return true;
}

bool TcpSocket::read_line(std::string& line, int timeout_ms, size_t max_len) {
    timed_out_ = false;
    int64_t deadline = now_ms() + timeout_ms;
    size_t scanned = 0;

    while (true) {
        const uint8_t* start = buffer_.data() + buffer_pos_;
        const void* nl = nullptr;
        if (buffered() > scanned) {
            nl = memchr(start + scanned, '\n', buffered() - scanned);
        }
        if (nl) {
            size_t len = static_cast<const uint8_t*>(nl) - start;
            line.assign(reinterpret_cast<const char*>(start), len);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            buffer_pos_ += len + 1;
            compact();
            return true;
        }
        scanned = buffered();
        if (scanned > max_len) {
            last_error_ = "Line exceeds maximum length";
            return false;
        }
        if (!fill(deadline)) return false;
    }
}

bool TcpSocket::write_all(const void* buf, size_t len) {
    int fd = fd_.load();
    if (fd < 0) {
        last_error_ = "Socket not connected";
        return false;
    }

    const uint8_t* p = static_cast<const uint8_t*>(buf);
    while (len > 0) {
        ssize_t n = send(fd, p, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            last_error_ = std::string("send failed: ") + strerror(errno);
            return false;
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace net
