/*
 * VNC Client Implementation
 */

#include "vnc_client.h"
#include "webp_encoder.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <utility>

namespace vnc {

// Server-supplied strings (reasons, desktop name) larger than this are rejected
static const uint32_t MAX_SERVER_STRING = 64 * 1024;

const char* state_name(ClientState state) {
    switch (state) {
        case ClientState::Disconnected: return "disconnected";
        case ClientState::Connecting:   return "connecting";
        case ClientState::Handshaking:  return "handshaking";
        case ClientState::Active:       return "active";
    }
    return "unknown";
}

static uint64_t realtime_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

VNCClient::VNCClient(const VNCClientOptions& options)
    : VNCClient(options, std::make_unique<WebPEncoder>(options.quality, options.debug_frames))
{
}

VNCClient::VNCClient(const VNCClientOptions& options, std::unique_ptr<ImageCodec> codec)
    : options_(options)
    , need_full_update_(true)
    , encoder_(std::move(codec))
    , frames_captured_(0)
    , state_(ClientState::Disconnected)
    , disconnecting_(false)
    , streaming_(false)
    , stream_stop_(false)
{
}

VNCClient::~VNCClient() {
    disconnect();
}

void VNCClient::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
}

std::string VNCClient::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

int VNCClient::width() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return framebuffer_.width();
}

int VNCClient::height() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return framebuffer_.height();
}

PixelFormat VNCClient::pixel_format() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return pixel_format_;
}

std::string VNCClient::desktop_name() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return desktop_name_;
}

// ============================================================================
// Connection
// ============================================================================

bool VNCClient::connect(int max_retries, int retry_delay_ms) {
    if (state_.load() == ClientState::Active) {
        return true;
    }

    int attempts = std::max(1, max_retries);
    for (int attempt = 1; attempt <= attempts; attempt++) {
        AttemptResult result;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            result = attempt_connect();
        }

        if (result == AttemptResult::Ok) {
            fprintf(stderr, "VNC: Connected to %s:%d (%dx%d, \"%s\")\n",
                    options_.host.c_str(), options_.port,
                    width(), height(), desktop_name().c_str());
            return true;
        }
        if (result == AttemptResult::Fatal) {
            fprintf(stderr, "VNC: Connection failed: %s\n", last_error().c_str());
            return false;
        }

        if (attempt < attempts) {
            if (options_.debug) {
                fprintf(stderr, "VNC: Attempt %d/%d failed (%s), retrying in %dms\n",
                        attempt, attempts, last_error().c_str(), retry_delay_ms);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(retry_delay_ms));
        }
    }

    fprintf(stderr, "VNC: Giving up on %s:%d after %d attempts: %s\n",
            options_.host.c_str(), options_.port, attempts, last_error().c_str());
    return false;
}

VNCClient::AttemptResult VNCClient::attempt_connect() {
    state_ = ClientState::Connecting;

    net::ConnectResult cr = socket_.connect_to(options_.host, options_.port,
                                               options_.connect_timeout_ms);
    if (cr != net::ConnectResult::Ok) {
        set_error(socket_.last_error());
        state_ = ClientState::Disconnected;
        if (cr == net::ConnectResult::Refused || cr == net::ConnectResult::Timeout) {
            return AttemptResult::Retry;
        }
        return AttemptResult::Fatal;
    }

    state_ = ClientState::Handshaking;
    AttemptResult result = handshake();
    if (result != AttemptResult::Ok) {
        socket_.close();
        framebuffer_.clear();
        state_ = ClientState::Disconnected;
        return result;
    }

    need_full_update_ = true;
    state_ = ClientState::Active;
    return AttemptResult::Ok;
}

VNCClient::AttemptResult VNCClient::handshake() {
    int timeout = options_.read_timeout_ms;

    // ProtocolVersion
    char version[RFB_VERSION_LENGTH];
    if (!socket_.read_exact(version, sizeof(version), timeout)) {
        set_error("Failed to read protocol version: " + socket_.last_error());
        return AttemptResult::Retry;
    }

    int major = 0, minor = 0;
    if (!parse_version(version, major, minor)) {
        set_error("Invalid protocol version from server");
        return AttemptResult::Fatal;
    }

    const char* reply = client_version_for(major, minor);
    if (!socket_.write_all(reply, RFB_VERSION_LENGTH)) {
        set_error("Failed to send protocol version: " + socket_.last_error());
        return AttemptResult::Retry;
    }
    if (options_.debug) {
        fprintf(stderr, "VNC: Server RFB %d.%d, using %.11s\n", major, minor, reply);
    }

    AttemptResult sec = negotiate_security(major, minor);
    if (sec != AttemptResult::Ok) {
        return sec;
    }

    // ClientInit: shared session, so QEMU's own display isn't disconnected
    uint8_t shared = 1;
    if (!socket_.write_all(&shared, 1)) {
        set_error("Failed to send ClientInit: " + socket_.last_error());
        return AttemptResult::Retry;
    }

    // ServerInit
    uint8_t init[RFB_SERVER_INIT_SIZE];
    if (!socket_.read_exact(init, sizeof(init), timeout)) {
        set_error("Failed to read ServerInit: " + socket_.last_error());
        return AttemptResult::Retry;
    }

    int fb_width = read_u16(init);
    int fb_height = read_u16(init + 2);
    PixelFormat server_format = PixelFormat::parse(init + 4);
    uint32_t name_len = read_u32(init + 20);
    if (name_len > MAX_SERVER_STRING) {
        set_error("Desktop name too long (" + std::to_string(name_len) + " bytes)");
        return AttemptResult::Fatal;
    }

    std::string name(name_len, '\0');
    if (name_len > 0 && !socket_.read_exact(&name[0], name_len, timeout)) {
        set_error("Failed to read desktop name: " + socket_.last_error());
        return AttemptResult::Retry;
    }

    if (options_.debug) {
        fprintf(stderr, "VNC: ServerInit %dx%d, server format %s\n",
                fb_width, fb_height, server_format.describe().c_str());
    }

    // Always ask for 32bpp BGRX regardless of what the server prefers
    PixelFormat wanted = PixelFormat::preferred();
    std::vector<int32_t> encodings = { RFB_ENCODING_RAW, RFB_ENCODING_DESKTOP_SIZE };
    if (!socket_.write_all(build_set_pixel_format(wanted).data(), 4 + RFB_PIXEL_FORMAT_SIZE)) {
        set_error("Failed to send SetPixelFormat: " + socket_.last_error());
        return AttemptResult::Retry;
    }
    std::vector<uint8_t> set_enc = build_set_encodings(encodings);
    if (!socket_.write_all(set_enc.data(), set_enc.size())) {
        set_error("Failed to send SetEncodings: " + socket_.last_error());
        return AttemptResult::Retry;
    }

    pixel_format_ = wanted;
    desktop_name_ = name;
    framebuffer_.resize(fb_width, fb_height);
    warned_encodings_.clear();
    return AttemptResult::Ok;
}

VNCClient::AttemptResult VNCClient::negotiate_security(int major, int minor) {
    int timeout = options_.read_timeout_ms;
    bool v33 = major == 3 && minor < 7;
    bool v38 = major > 3 || (major == 3 && minor >= 8);

    if (v33) {
        // Server picks the type
        uint8_t buf[4];
        if (!socket_.read_exact(buf, 4, timeout)) {
            set_error("Failed to read security type: " + socket_.last_error());
            return AttemptResult::Retry;
        }
        uint32_t type = read_u32(buf);
        if (type == RFB_SECURITY_INVALID) {
            std::string reason;
            read_reason(reason);
            set_error("Server refused connection: " + reason);
            return AttemptResult::Fatal;
        }
        if (type != RFB_SECURITY_NONE) {
            set_error("Unsupported security type " + std::to_string(type));
            return AttemptResult::Fatal;
        }
        return AttemptResult::Ok;
    }

    uint8_t count = 0;
    if (!socket_.read_exact(&count, 1, timeout)) {
        set_error("Failed to read security types: " + socket_.last_error());
        return AttemptResult::Retry;
    }
    if (count == 0) {
        std::string reason;
        read_reason(reason);
        set_error("Server refused connection: " + reason);
        return AttemptResult::Fatal;
    }

    std::vector<uint8_t> types(count);
    if (!socket_.read_exact(types.data(), count, timeout)) {
        set_error("Failed to read security types: " + socket_.last_error());
        return AttemptResult::Retry;
    }

    if (std::find(types.begin(), types.end(), RFB_SECURITY_NONE) == types.end()) {
        std::string offered;
        for (uint8_t t : types) {
            if (!offered.empty()) offered += ",";
            offered += std::to_string(t);
        }
        set_error("No supported security type (server offers " + offered + ")");
        return AttemptResult::Fatal;
    }

    uint8_t choice = RFB_SECURITY_NONE;
    if (!socket_.write_all(&choice, 1)) {
        set_error("Failed to select security type: " + socket_.last_error());
        return AttemptResult::Retry;
    }

    // 3.7 sends no SecurityResult for "None"
    if (!v38) {
        return AttemptResult::Ok;
    }

    uint8_t result[4];
    if (!socket_.read_exact(result, 4, timeout)) {
        set_error("Failed to read security result: " + socket_.last_error());
        return AttemptResult::Retry;
    }
    if (read_u32(result) != 0) {
        std::string reason;
        read_reason(reason);
        set_error("Security handshake failed: " + (reason.empty() ? "no reason given" : reason));
        return AttemptResult::Fatal;
    }
    return AttemptResult::Ok;
}

bool VNCClient::read_reason(std::string& reason) {
    uint8_t buf[4];
    if (!socket_.read_exact(buf, 4, options_.read_timeout_ms)) {
        reason = "(no reason)";
        return false;
    }
    uint32_t len = read_u32(buf);
    if (len > MAX_SERVER_STRING) {
        reason = "(reason too long)";
        return false;
    }
    reason.assign(len, '\0');
    if (len > 0 && !socket_.read_exact(&reason[0], len, options_.read_timeout_ms)) {
        reason = "(truncated reason)";
        return false;
    }
    return true;
}

void VNCClient::disconnect() {
    bool was_connected = state_.load() != ClientState::Disconnected;

    // Wake a reader parked in poll() before waiting on the io mutex
    disconnecting_ = true;
    socket_.shutdown();
    stop_streaming();

    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        socket_.close();
        framebuffer_.clear();
        state_ = ClientState::Disconnected;
    }
    disconnecting_ = false;

    if (was_connected) {
        fprintf(stderr, "VNC: Disconnected from %s:%d\n", options_.host.c_str(), options_.port);
    }
}

void VNCClient::drop_connection(const std::string& reason) {
    if (!disconnecting_.load()) {
        fprintf(stderr, "VNC: Connection lost: %s\n", reason.c_str());
        set_error(reason);
    }
    socket_.close();
    framebuffer_.clear();
    state_ = ClientState::Disconnected;
    stream_cv_.notify_all();
}

// ============================================================================
// Update cycle
// ============================================================================

bool VNCClient::read(void* buf, size_t len) {
    if (socket_.read_exact(buf, len, options_.read_timeout_ms)) {
        return true;
    }
    drop_connection(socket_.timed_out() ? "Timed out in the middle of a message"
                                        : socket_.last_error());
    return false;
}

bool VNCClient::skip(size_t len) {
    if (socket_.skip(len, options_.read_timeout_ms)) {
        return true;
    }
    drop_connection(socket_.timed_out() ? "Timed out in the middle of a message"
                                        : socket_.last_error());
    return false;
}

bool VNCClient::send(const std::vector<uint8_t>& msg) {
    if (socket_.write_all(msg.data(), msg.size())) {
        return true;
    }
    drop_connection(socket_.last_error());
    return false;
}

bool VNCClient::update_cycle(bool& changed, int wait_ms) {
    changed = false;
    if (state_.load() != ClientState::Active) {
        return false;
    }

    bool incremental = !need_full_update_ && !framebuffer_.empty();
    uint16_t w = static_cast<uint16_t>(framebuffer_.width());
    uint16_t h = static_cast<uint16_t>(framebuffer_.height());
    if (!send(build_update_request(incremental, 0, 0, w, h))) {
        return false;
    }
    need_full_update_ = false;

    int ready = socket_.wait_readable(wait_ms);
    if (ready == 0) {
        return true;  // Nothing new
    }
    if (ready < 0) {
        drop_connection(socket_.last_error());
        return false;
    }

    // Drain everything already queued (e.g. a bell before the update)
    do {
        if (!process_message(changed)) {
            return false;
        }
        ready = socket_.wait_readable(0);
    } while (ready == 1);

    if (ready < 0) {
        drop_connection(socket_.last_error());
        return false;
    }
    return true;
}

bool VNCClient::process_message(bool& changed) {
    uint8_t type;
    if (!read(&type, 1)) return false;

    switch (type) {
        case RFB_MSG_FRAMEBUFFER_UPDATE:
            return handle_framebuffer_update(changed);

        case RFB_MSG_SET_COLOUR_MAP_ENTRIES: {
            // padding, first-colour, number-of-colours, then 6 bytes per colour
            uint8_t hdr[5];
            if (!read(hdr, sizeof(hdr))) return false;
            uint16_t count = read_u16(hdr + 3);
            if (options_.debug) {
                fprintf(stderr, "VNC: Ignoring SetColourMapEntries (%u colours)\n", count);
            }
            return skip(static_cast<size_t>(count) * 6);
        }

        case RFB_MSG_BELL:
            if (options_.debug) {
                fprintf(stderr, "VNC: Bell\n");
            }
            return true;

        case RFB_MSG_SERVER_CUT_TEXT: {
            uint8_t hdr[7];  // 3 padding + length
            if (!read(hdr, sizeof(hdr))) return false;
            uint32_t len = read_u32(hdr + 3);
            if (options_.debug) {
                fprintf(stderr, "VNC: Ignoring ServerCutText (%u bytes)\n", len);
            }
            return skip(len);
        }

        default:
            drop_connection("Unknown server message type " + std::to_string(type));
            return false;
    }
}

bool VNCClient::handle_framebuffer_update(bool& changed) {
    uint8_t hdr[3];  // padding + number-of-rectangles
    if (!read(hdr, sizeof(hdr))) return false;
    uint16_t num_rects = read_u16(hdr + 1);

    for (uint16_t i = 0; i < num_rects; i++) {
        uint8_t raw_header[RFB_RECT_HEADER_SIZE];
        if (!read(raw_header, sizeof(raw_header))) return false;
        RectHeader rect = RectHeader::parse(raw_header);

        if (options_.debug) {
            fprintf(stderr, "VNC: Rect %u/%u %s %ux%u+%u+%u\n", i + 1, num_rects,
                    encoding_name(rect.encoding), rect.width, rect.height, rect.x, rect.y);
        }

        switch (rect.encoding) {
            case RFB_ENCODING_RAW: {
                size_t len = static_cast<size_t>(rect.width) * rect.height *
                             pixel_format_.bytes_per_pixel();
                rect_buffer_.resize(len);
                if (len > 0 && !read(rect_buffer_.data(), len)) return false;
                if (rect.width == 0 || rect.height == 0) break;

                if (framebuffer_.grow_to_fit(rect.x + rect.width, rect.y + rect.height)) {
                    fprintf(stderr, "VNC: Rectangle outside framebuffer, grew to %dx%d\n",
                            framebuffer_.width(), framebuffer_.height());
                }
                framebuffer_.blit(rect.x, rect.y, rect.width, rect.height,
                                  rect_buffer_.data(), pixel_format_);
                changed = true;
                break;
            }

            case RFB_ENCODING_DESKTOP_SIZE:
                fprintf(stderr, "VNC: Desktop resized %dx%d -> %ux%u\n",
                        framebuffer_.width(), framebuffer_.height(), rect.width, rect.height);
                framebuffer_.resize(rect.width, rect.height);
                need_full_update_ = true;
                changed = true;
                break;

            case RFB_ENCODING_LAST_RECT:
                return true;

            default:
                if (!skip_rect(rect)) return false;
                break;
        }
    }
    return true;
}

bool VNCClient::skip_rect(const RectHeader& rect) {
    if (warned_encodings_.insert(rect.encoding).second) {
        fprintf(stderr, "VNC: Warning: skipping unsupported encoding %s (%d)\n",
                encoding_name(rect.encoding), rect.encoding);
    }

    if (rect.encoding == RFB_ENCODING_EXTENDED_DESKTOP_SIZE) {
        // number-of-screens, 3 padding, then 16 bytes per screen
        uint8_t hdr[4];
        if (!read(hdr, sizeof(hdr))) return false;
        return skip(static_cast<size_t>(hdr[0]) * 16);
    }

    size_t len = 0;
    if (!encoding_payload_length(rect.encoding, rect.width, rect.height,
                                 pixel_format_.bytes_per_pixel(), len)) {
        drop_connection(std::string("Cannot skip encoding ") + encoding_name(rect.encoding) +
                        " (" + std::to_string(rect.encoding) + ")");
        return false;
    }
    return skip(len);
}

// ============================================================================
// Export
// ============================================================================

bool VNCClient::encode_frame() {
    int out_w = options_.output_width > 0 ? options_.output_width : framebuffer_.width();
    int out_h = options_.output_height > 0 ? options_.output_height : framebuffer_.height();

    EncodedFrame frame;
    if (!encoder_->encode_rgb(framebuffer_.pixels().data(), framebuffer_.width(),
                              framebuffer_.height(), framebuffer_.stride(),
                              out_w, out_h, frame.data)) {
        fprintf(stderr, "VNC: Failed to encode %dx%d %s frame\n", out_w, out_h, encoder_->name());
        return false;
    }

    frame.width = out_w;
    frame.height = out_h;
    frame.sequence = ++frames_captured_;
    frame.timestamp_us = realtime_us();
    last_frame_ = std::move(frame);
    return true;
}

EncodedFrame VNCClient::capture_frame() {
    return capture(options_.update_timeout_ms);
}

EncodedFrame VNCClient::capture(int wait_ms) {
    EncodedFrame frame;
    int new_width = 0;
    int new_height = 0;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        int old_width = framebuffer_.width();
        int old_height = framebuffer_.height();

        bool changed = false;
        if (update_cycle(changed, wait_ms) && !framebuffer_.empty() &&
            (changed || last_frame_.empty())) {
            encode_frame();
        }
        if (!framebuffer_.empty() &&
            (framebuffer_.width() != old_width || framebuffer_.height() != old_height)) {
            new_width = framebuffer_.width();
            new_height = framebuffer_.height();
        }
        frame = last_frame_;
    }

    if (new_width > 0) {
        notify_resize(new_width, new_height);
    }
    return frame;
}

std::vector<uint8_t> VNCClient::capture_frame_raw() {
    std::vector<uint8_t> pixels;
    int new_width = 0;
    int new_height = 0;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        int old_width = framebuffer_.width();
        int old_height = framebuffer_.height();

        bool changed = false;
        update_cycle(changed, options_.update_timeout_ms);
        if (framebuffer_.empty()) {
            return pixels;
        }
        if (framebuffer_.width() != old_width || framebuffer_.height() != old_height) {
            new_width = framebuffer_.width();
            new_height = framebuffer_.height();
        }
        pixels = framebuffer_.pixels();
    }

    if (new_width > 0) {
        notify_resize(new_width, new_height);
    }
    return pixels;
}

void VNCClient::set_resize_callback(ResizeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    resize_callback_ = std::move(callback);
}

void VNCClient::notify_resize(int width, int height) {
    ResizeCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = resize_callback_;
    }
    if (callback) {
        callback(width, height);
    }
}

// ============================================================================
// Streaming
// ============================================================================

void VNCClient::set_frame_callback(FrameCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    frame_callback_ = std::move(callback);
}

bool VNCClient::start_streaming() {
    if (state_.load() != ClientState::Active) {
        set_error("Cannot stream: not connected");
        return false;
    }
    if (streaming_.load()) {
        return true;
    }

    // A previous loop may have exited on its own
    if (stream_thread_.joinable()) {
        stream_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        need_full_update_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream_stop_ = false;
    }

    streaming_ = true;
    stream_thread_ = std::thread(&VNCClient::streaming_loop, this);
    fprintf(stderr, "VNC: Streaming at %d fps\n", options_.fps);
    return true;
}

void VNCClient::stop_streaming() {
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stream_stop_ = true;
    }
    stream_cv_.notify_all();

    if (!stream_thread_.joinable()) {
        return;
    }
    // Called from the frame callback: the loop exits after it returns
    if (stream_thread_.get_id() == std::this_thread::get_id()) {
        return;
    }

    stream_thread_.join();
    streaming_ = false;
}

void VNCClient::streaming_loop() {
    auto interval = std::chrono::microseconds(1000000 / std::max(1, options_.fps));
    auto next_frame = std::chrono::steady_clock::now();

    while (true) {
        {
            std::lock_guard<std::mutex> lock(stream_mutex_);
            if (stream_stop_) break;
        }
        if (state_.load() != ClientState::Active) {
            fprintf(stderr, "VNC: Streaming stopped, connection is %s\n",
                    state_name(state_.load()));
            break;
        }

        // Wait for the server no longer than this frame's slot, so a stop
        // request is seen within one interval
        next_frame += interval;
        auto slot = std::chrono::duration_cast<std::chrono::milliseconds>(
            next_frame - std::chrono::steady_clock::now()).count();
        int wait_ms = static_cast<int>(std::max<int64_t>(0,
            std::min<int64_t>(slot, options_.update_timeout_ms)));

        EncodedFrame frame = capture(wait_ms);

        {
            std::lock_guard<std::mutex> lock(stream_mutex_);
            if (stream_stop_) break;
        }

        // Invoked unlocked so the callback may replace itself
        FrameCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = frame_callback_;
        }
        if (callback && !frame.empty()) {
            callback(frame);
        }

        // Fixed-rate pacing; re-anchor if we fell behind
        auto now = std::chrono::steady_clock::now();
        if (next_frame < now) {
            next_frame = now;
        }

        std::unique_lock<std::mutex> lock(stream_mutex_);
        stream_cv_.wait_until(lock, next_frame, [this] {
            return stream_stop_ || state_.load() != ClientState::Active;
        });
    }

    streaming_ = false;
}

} // namespace vnc
