/*
 * TCP Socket
 *
 * Blocking-with-timeout TCP stream used by the QMP and VNC clients.
 * All waits go through poll() so a caller never blocks longer than the
 * timeout it passes, and shutdown() from another thread wakes a reader
 * that is parked in poll().
 *
 * Reads are buffered: read_line() and read_exact() can be mixed freely.
 */

#ifndef TCP_SOCKET_H
#define TCP_SOCKET_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace net {

enum class ConnectResult {
    Ok,
    Refused,    // Nothing listening yet (ECONNREFUSED)
    Timeout,    // No answer within the connect timeout
    Error       // Resolution failure or any other socket error
};

class TcpSocket {
public:
    TcpSocket();
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    /**
     * Connect to host:port
     * @param timeout_ms Maximum time to wait for the TCP handshake
     * @return Ok on success; Refused/Timeout are worth retrying
     */
    ConnectResult connect_to(const std::string& host, int port, int timeout_ms);

    /**
     * Close the descriptor and drop buffered data.
     * Must not race with a reader; call shutdown() first to wake it.
     */
    void close();

    /**
     * Shut down both directions without closing the descriptor.
     * Safe to call from another thread while a read is in progress, or
     * while close() runs; after close() it does nothing.
     */
    void shutdown();

    bool is_open() const { return fd_.load() >= 0; }

    /**
     * Wait for incoming data (buffered bytes count as available)
     * @return 1 if readable, 0 on timeout, -1 on error or peer close
     */
    int wait_readable(int timeout_ms);

    // Read exactly len bytes within timeout_ms. False on timeout/error/EOF.
    bool read_exact(void* buf, size_t len, int timeout_ms);

    // Discard exactly len bytes within timeout_ms
    bool skip(size_t len, int timeout_ms);

    // Read one '\n' terminated line (terminator and any '\r' stripped)
    bool read_line(std::string& line, int timeout_ms, size_t max_len = 1024 * 1024);

    bool write_all(const void* buf, size_t len);
    bool write_all(const std::string& data) { return write_all(data.data(), data.size()); }

    // True if the last failed read ran out of time rather than hitting EOF/error
    bool timed_out() const { return timed_out_; }

    const std::string& last_error() const { return last_error_; }

private:
    // Pull more bytes into buffer_, waiting until deadline_ms (steady clock)
    bool fill(int64_t deadline_ms);
    size_t buffered() const { return buffer_.size() - buffer_pos_; }
    void compact();

    std::atomic<int> fd_;
    std::mutex fd_mutex_;       // Orders close() against shutdown()
    std::vector<uint8_t> buffer_;
    size_t buffer_pos_;
    bool timed_out_;
    std::string last_error_;
};

} // namespace net

#endif // TCP_SOCKET_H
