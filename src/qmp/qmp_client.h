/*
 * QMP Client
 *
 * Line-delimited JSON control channel to QEMU (QEMU Machine Protocol).
 * Used for keyboard/mouse injection and screenshots.
 *
 * Protocol:
 *   server: {"QMP": {"version": ..., "capabilities": [...]}}
 *   client: {"execute": "qmp_capabilities"}
 *   server: {"return": {}}
 *   client: {"execute": "<cmd>", "arguments": {...}, "id": N}
 *   server: {"return": ...} | {"error": {"class": ..., "desc": ...}}
 *   Asynchronous {"event": ...} lines may arrive at any time.
 *
 * Only one command is in flight at a time; concurrent callers queue on
 * an internal mutex.
 */

#ifndef QMP_CLIENT_H
#define QMP_CLIENT_H

#include "net/tcp_socket.h"
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace qmp {

using json = nlohmann::json;

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

const char* state_name(ConnectionState state);

// Base for all errors thrown by QMPClient::execute()
class QMPError : public std::runtime_error {
public:
    explicit QMPError(const std::string& what) : std::runtime_error(what) {}
};

// Transport failure; the session is Disconnected afterwards
class ConnectionError : public QMPError {
public:
    explicit ConnectionError(const std::string& what) : QMPError(what) {}
};

// QEMU rejected the command; the session stays up
class CommandError : public QMPError {
public:
    CommandError(const std::string& error_class, const std::string& description)
        : QMPError("QMP error " + error_class + ": " + description)
        , error_class_(error_class)
        , description_(description)
    {}

    const std::string& error_class() const { return error_class_; }
    const std::string& description() const { return description_; }

private:
    std::string error_class_;
    std::string description_;
};

enum class MouseButton {
    Left,
    Middle,
    Right
};

// "left", "middle", "right" (case-insensitive); anything else is Left
MouseButton mouse_button_from_name(const std::string& name);

// QMP InputButton enum value
const char* mouse_button_name(MouseButton button);

/**
 * Delays used by the composite input operations
 * All values in milliseconds
 */
struct InputTiming {
    int key_hold_ms = 50;          // send-key hold-time for a single key
    int combo_hold_ms = 100;       // send-key hold-time for a chord
    int type_delay_ms = 20;        // Between characters in type_text
    int click_release_ms = 50;     // Button down -> up
    int double_click_gap_ms = 100; // Between the two clicks
    int drag_settle_ms = 50;       // After moving to the drag start
    int drag_step_ms = 10;         // Between intermediate drag positions
    int drag_steps = 20;
};

struct QMPClientOptions {
    std::string host = "localhost";
    int port = 4444;
    int connect_timeout_ms = 5000;
    int reply_timeout_ms = 10000;
    bool debug = false;            // Log every request and reply
};

using EventCallback = std::function<void(const json& event)>;

class QMPClient {
public:
    explicit QMPClient(const QMPClientOptions& options);
    ~QMPClient();

    QMPClient(const QMPClient&) = delete;
    QMPClient& operator=(const QMPClient&) = delete;

    /**
     * Connect and negotiate capabilities
     * Refused/timed out connects are retried after retry_delay_ms; a bad
     * greeting or capabilities reply fails at once.
     * @return true if connected (see last_error() otherwise)
     */
    bool connect(int max_retries = 5, int retry_delay_ms = 1000);

    // Idempotent; wakes a caller blocked in execute()
    void disconnect();

    /**
     * Send a command and wait for its reply
     * @param arguments Omitted from the request when null or empty
     * @return The "return" member of the reply
     * @throws CommandError if QEMU answered with an error
     * @throws ConnectionError on transport failure or when not connected
     */
    json execute(const std::string& command, const json& arguments = json());

    // Called (on the executing thread) for every event received
    void set_event_callback(EventCallback callback);

    // Input primitives
    void mouse_move(int x, int y);
    void mouse_click(const std::string& button = "left");
    void mouse_double_click(const std::string& button = "left");
    void mouse_drag(int start_x, int start_y, int end_x, int end_y);
    void key_press(const std::string& key);
    void key_combo(const std::vector<std::string>& keys);
    void key_combo(const std::string& combo);   // "ctrl+alt+delete"
    void type_text(const std::string& text);

    /**
     * Dump the screen to a PPM file on the host
     * @return The file name written by QEMU
     */
    std::string screenshot(const std::string& filename = "/tmp/screenshot.ppm");

    /**
     * Guest screen size used to scale absolute pointer coordinates.
     * 0x0 (default) sends coordinates unchanged.
     */
    void set_screen_size(int width, int height);

    void set_timing(const InputTiming& timing) { timing_ = timing; }
    const InputTiming& timing() const { return timing_; }

    ConnectionState state() const { return state_.load(); }
    bool is_connected() const { return state_.load() == ConnectionState::Connected; }
    uint64_t requests_sent() const { return request_id_.load(); }
    std::string last_error() const;

    const QMPClientOptions& options() const { return options_; }

private:
    enum class AttemptResult { Ok, Retry, Fatal };

    // execute_mutex_ held
    AttemptResult attempt_connect();
    json transact(const std::string& command, const json& arguments);
    json read_reply();
    [[noreturn]] void fail(const std::string& reason);

    void send_button(MouseButton button, bool down);
    void send_keys(const std::vector<std::string>& keys, int hold_ms);
    int scale_axis(int value, int extent) const;
    void set_error(const std::string& error);

    const QMPClientOptions options_;
    InputTiming timing_;

    std::mutex execute_mutex_;
    net::TcpSocket socket_;
    std::atomic<ConnectionState> state_;
    std::atomic<uint64_t> request_id_;

    std::atomic<int> screen_width_;
    std::atomic<int> screen_height_;

    std::mutex callback_mutex_;
    EventCallback event_callback_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace qmp

#endif // QMP_CLIENT_H
