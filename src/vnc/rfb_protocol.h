/*
 * RFB (Remote Framebuffer) Protocol - client side wire format
 *
 * Message layouts from RFC 6143. All multi-byte fields are big-endian.
 *
 * Handshake:  ProtocolVersion -> Security -> SecurityResult (3.8)
 *             -> ClientInit -> ServerInit
 * Then:       SetPixelFormat, SetEncodings, FramebufferUpdateRequest ...
 *
 * Only the Raw encoding and the DesktopSize pseudo-encoding are
 * requested. Other encodings a server might still send are skipped when
 * their payload length can be derived from the rectangle header.
 */

#ifndef RFB_PROTOCOL_H
#define RFB_PROTOCOL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ProtocolVersion is always 12 bytes: "RFB xxx.yyy\n"
#define RFB_VERSION_LENGTH 12

// Security types
#define RFB_SECURITY_INVALID 0
#define RFB_SECURITY_NONE    1

// Client -> server messages
#define RFB_MSG_SET_PIXEL_FORMAT            0
#define RFB_MSG_SET_ENCODINGS               2
#define RFB_MSG_FRAMEBUFFER_UPDATE_REQUEST  3

// Server -> client messages
#define RFB_MSG_FRAMEBUFFER_UPDATE      0
#define RFB_MSG_SET_COLOUR_MAP_ENTRIES  1
#define RFB_MSG_BELL                    2
#define RFB_MSG_SERVER_CUT_TEXT         3

// Encodings (signed 32-bit)
#define RFB_ENCODING_RAW                    0
#define RFB_ENCODING_COPYRECT               1
#define RFB_ENCODING_DESKTOP_SIZE        (-223)
#define RFB_ENCODING_LAST_RECT           (-224)
#define RFB_ENCODING_CURSOR              (-239)
#define RFB_ENCODING_XCURSOR             (-240)
#define RFB_ENCODING_EXTENDED_DESKTOP_SIZE (-308)

// Fixed sizes
#define RFB_PIXEL_FORMAT_SIZE   16
#define RFB_SERVER_INIT_SIZE    24   // w, h, pixel format, name length
#define RFB_RECT_HEADER_SIZE    12

namespace vnc {

/**
 * PIXEL_FORMAT record (16 bytes on the wire, 3 trailing pad bytes)
 */
struct PixelFormat {
    uint8_t bits_per_pixel = 32;
    uint8_t depth = 24;
    uint8_t big_endian = 0;
    uint8_t true_colour = 1;
    uint16_t red_max = 255;
    uint16_t green_max = 255;
    uint16_t blue_max = 255;
    uint8_t red_shift = 16;
    uint8_t green_shift = 8;
    uint8_t blue_shift = 0;

    int bytes_per_pixel() const { return bits_per_pixel / 8; }

    /**
     * The layout this client always asks for: 32bpp true colour,
     * little-endian, R<<16 | G<<8 | B. In memory each pixel is the bytes
     * B,G,R,X, which libyuv calls "ARGB".
     */
    static PixelFormat preferred();

    // True if pixels are B,G,R,X bytes (the libyuv fast path applies)
    bool is_bgrx() const;

    static PixelFormat parse(const uint8_t* data);
    void serialize(uint8_t* out) const;

    std::string describe() const;

    bool operator==(const PixelFormat& other) const;
    bool operator!=(const PixelFormat& other) const { return !(*this == other); }
};

struct RectHeader {
    uint16_t x = 0;
    uint16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;
    int32_t encoding = 0;

    static RectHeader parse(const uint8_t* data);
};

// Big-endian field access
uint16_t read_u16(const uint8_t* p);
uint32_t read_u32(const uint8_t* p);
int32_t read_s32(const uint8_t* p);
void append_u16(std::vector<uint8_t>& out, uint16_t v);
void append_u32(std::vector<uint8_t>& out, uint32_t v);

/**
 * Parse "RFB 003.008\n"
 * @return false if the string is not a protocol version
 */
bool parse_version(const char* data, int& major, int& minor);

// Version string this client answers with for a given server version
const char* client_version_for(int major, int minor);

std::vector<uint8_t> build_set_pixel_format(const PixelFormat& pf);
std::vector<uint8_t> build_set_encodings(const std::vector<int32_t>& encodings);
std::vector<uint8_t> build_update_request(bool incremental, uint16_t x, uint16_t y,
                                          uint16_t width, uint16_t height);

/**
 * Payload size of a rectangle whose encoding this client doesn't decode
 * @param len Receives the number of bytes following the rectangle header
 * @return false if the size depends on payload contents or is unknown
 */
bool encoding_payload_length(int32_t encoding, int width, int height,
                             int bytes_per_pixel, size_t& len);

const char* encoding_name(int32_t encoding);

} // namespace vnc

#endif // RFB_PROTOCOL_H
