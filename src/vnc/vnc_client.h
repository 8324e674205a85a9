/*
 * VNC Client
 *
 * Connects to the emulator's VNC server, keeps a local copy of the
 * framebuffer up to date and exports it as encoded still frames, either
 * on demand (capture_frame) or from a paced streaming thread.
 *
 * Thread model: one io mutex covers the socket, the framebuffer and the
 * cached frame, so an update cycle and the export that follows it are
 * never interleaved with another caller. disconnect() may be called from
 * any thread; it wakes a blocked reader by shutting the socket down.
 */

#ifndef VNC_CLIENT_H
#define VNC_CLIENT_H

#include "codec.h"
#include "framebuffer.h"
#include "rfb_protocol.h"
#include "net/tcp_socket.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace vnc {

enum class ClientState {
    Disconnected,
    Connecting,
    Handshaking,
    Active
};

const char* state_name(ClientState state);

struct VNCClientOptions {
    std::string host = "localhost";
    int port = 5900;

    int fps = 30;                   // Streaming rate
    int output_width = 0;           // Exported frame size, 0 = framebuffer size
    int output_height = 0;
    int quality = 80;               // WebP lossy quality

    int connect_timeout_ms = 5000;  // Per TCP connect attempt
    int update_timeout_ms = 500;    // Wait for the server to answer an update request
    int read_timeout_ms = 5000;     // Finish a message once it has started

    bool debug = false;             // Log protocol traffic
    bool debug_frames = false;      // Log encoder stats
};

using FrameCallback = std::function<void(const EncodedFrame&)>;
using ResizeCallback = std::function<void(int width, int height)>;

class VNCClient {
public:
    // Exports WebP frames at options.quality
    explicit VNCClient(const VNCClientOptions& options);
    VNCClient(const VNCClientOptions& options, std::unique_ptr<ImageCodec> codec);
    ~VNCClient();

    VNCClient(const VNCClient&) = delete;
    VNCClient& operator=(const VNCClient&) = delete;

    /**
     * Connect and complete the RFB handshake
     * Refused or timed out connects are retried; handshake failures
     * (security rejected, bad version) are not.
     * @return true once Active
     */
    bool connect(int max_retries = 10, int retry_delay_ms = 1000);

    /**
     * Stop streaming, close the connection and drop the framebuffer.
     * The cached last frame is kept. Idempotent.
     */
    void disconnect();

    /**
     * Run one update cycle and export the framebuffer
     * @return The new frame, or the cached one if nothing changed or the
     *         cycle failed. Empty only if no frame was ever captured.
     */
    EncodedFrame capture_frame();

    /**
     * Run one update cycle and copy the framebuffer
     * @return width*height*3 RGB bytes, empty if there is no framebuffer
     */
    std::vector<uint8_t> capture_frame_raw();

    void set_frame_callback(FrameCallback callback);

    // Called after an update cycle that changed the framebuffer size
    // (DesktopSize, or a rectangle that grew it), outside the io lock
    void set_resize_callback(ResizeCallback callback);

    /**
     * Start the streaming thread (capture -> callback at options.fps)
     * @return false if not connected
     */
    bool start_streaming();

    // Returns within about one frame interval; no callback runs after it
    // returns (unless called from the callback)
    void stop_streaming();

    bool is_streaming() const { return streaming_.load(); }

    ClientState state() const { return state_.load(); }
    bool is_connected() const { return state_.load() == ClientState::Active; }

    int width() const;
    int height() const;
    PixelFormat pixel_format() const;
    std::string desktop_name() const;
    std::string last_error() const;
    uint64_t frames_captured() const { return frames_captured_.load(); }

    const VNCClientOptions& options() const { return options_; }

private:
    enum class AttemptResult { Ok, Retry, Fatal };

    // All of these run with io_mutex_ held
    AttemptResult attempt_connect();
    AttemptResult handshake();
    AttemptResult negotiate_security(int major, int minor);
    bool read_reason(std::string& reason);
    bool update_cycle(bool& changed, int wait_ms);
    bool process_message(bool& changed);
    bool handle_framebuffer_update(bool& changed);
    bool skip_rect(const RectHeader& rect);
    bool read(void* buf, size_t len);
    bool skip(size_t len);
    bool send(const std::vector<uint8_t>& msg);
    void drop_connection(const std::string& reason);
    bool encode_frame();
    EncodedFrame capture(int wait_ms);
    void notify_resize(int width, int height);

    void streaming_loop();
    void set_error(const std::string& error);

    const VNCClientOptions options_;

    // Connection (io_mutex_)
    mutable std::mutex io_mutex_;
    net::TcpSocket socket_;
    FrameBuffer framebuffer_;
    PixelFormat pixel_format_;
    std::string desktop_name_;
    bool need_full_update_;
    std::vector<uint8_t> rect_buffer_;
    std::set<int32_t> warned_encodings_;

    // Export (io_mutex_)
    std::unique_ptr<ImageCodec> encoder_;
    EncodedFrame last_frame_;
    std::atomic<uint64_t> frames_captured_;

    std::atomic<ClientState> state_;
    std::atomic<bool> disconnecting_;

    // Streaming
    std::thread stream_thread_;
    std::atomic<bool> streaming_;
    std::mutex stream_mutex_;
    std::condition_variable stream_cv_;
    bool stream_stop_;

    std::mutex callback_mutex_;
    FrameCallback frame_callback_;
    ResizeCallback resize_callback_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

} // namespace vnc

#endif // VNC_CLIENT_H
