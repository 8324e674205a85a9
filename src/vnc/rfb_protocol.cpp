/*
 * RFB Protocol helpers
 */

#include "rfb_protocol.h"
#include <cstdio>
#include <cstring>

namespace vnc {

PixelFormat PixelFormat::preferred() {
    return PixelFormat();
}

bool PixelFormat::is_bgrx() const {
    return bits_per_pixel == 32 && true_colour && !big_endian &&
           red_max == 255 && green_max == 255 && blue_max == 255 &&
           red_shift == 16 && green_shift == 8 && blue_shift == 0;
}

PixelFormat PixelFormat::parse(const uint8_t* data) {
    PixelFormat pf;
    pf.bits_per_pixel = data[0];
    pf.depth = data[1];
    pf.big_endian = data[2] ? 1 : 0;
    pf.true_colour = data[3] ? 1 : 0;
    pf.red_max = read_u16(data + 4);
    pf.green_max = read_u16(data + 6);
    pf.blue_max = read_u16(data + 8);
    pf.red_shift = data[10];
    pf.green_shift = data[11];
    pf.blue_shift = data[12];
    // data[13..15] padding
    return pf;
}

void PixelFormat::serialize(uint8_t* out) const {
    out[0] = bits_per_pixel;
    out[1] = depth;
    out[2] = big_endian;
    out[3] = true_colour;
    out[4] = static_cast<uint8_t>(red_max >> 8);
    out[5] = static_cast<uint8_t>(red_max);
    out[6] = static_cast<uint8_t>(green_max >> 8);
    out[7] = static_cast<uint8_t>(green_max);
    out[8] = static_cast<uint8_t>(blue_max >> 8);
    out[9] = static_cast<uint8_t>(blue_max);
    out[10] = red_shift;
    out[11] = green_shift;
    out[12] = blue_shift;
    out[13] = out[14] = out[15] = 0;
}

std::string PixelFormat::describe() const {
    char buf[128];
    snprintf(buf, sizeof(buf), "%ubpp depth %u %s-endian %s max %u/%u/%u shift %u/%u/%u",
             bits_per_pixel, depth, big_endian ? "big" : "little",
             true_colour ? "true-colour" : "palette",
             red_max, green_max, blue_max, red_shift, green_shift, blue_shift);
    return buf;
}

bool PixelFormat::operator==(const PixelFormat& other) const {
    return bits_per_pixel == other.bits_per_pixel && depth == other.depth &&
           big_endian == other.big_endian && true_colour == other.true_colour &&
           red_max == other.red_max && green_max == other.green_max &&
           blue_max == other.blue_max && red_shift == other.red_shift &&
           green_shift == other.green_shift && blue_shift == other.blue_shift;
}

RectHeader RectHeader::parse(const uint8_t* data) {
    RectHeader r;
    r.x = read_u16(data);
    r.y = read_u16(data + 2);
    r.width = read_u16(data + 4);
    r.height = read_u16(data + 6);
    r.encoding = read_s32(data + 8);
    return r;
}

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t read_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

int32_t read_s32(const uint8_t* p) {
    return static_cast<int32_t>(read_u32(p));
}

void append_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void append_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

bool parse_version(const char* data, int& major, int& minor) {
    if (memcmp(data, "RFB ", 4) != 0 || data[7] != '.' || data[11] != '\n') {
        return false;
    }
    for (int i : {4, 5, 6, 8, 9, 10}) {
        if (data[i] < '0' || data[i] > '9') return false;
    }
    major = (data[4] - '0') * 100 + (data[5] - '0') * 10 + (data[6] - '0');
    minor = (data[8] - '0') * 100 + (data[9] - '0') * 10 + (data[10] - '0');
    return true;
}

const char* client_version_for(int major, int minor) {
    if (major > 3 || (major == 3 && minor >= 8)) return "RFB 003.008\n";
    if (major == 3 && minor == 7) return "RFB 003.007\n";
    return "RFB 003.003\n";
}

std::vector<uint8_t> build_set_pixel_format(const PixelFormat& pf) {
    std::vector<uint8_t> msg(4 + RFB_PIXEL_FORMAT_SIZE, 0);
    msg[0] = RFB_MSG_SET_PIXEL_FORMAT;
    // msg[1..3] padding
    pf.serialize(msg.data() + 4);
    return msg;
}

std::vector<uint8_t> build_set_encodings(const std::vector<int32_t>& encodings) {
    std::vector<uint8_t> msg;
    msg.push_back(RFB_MSG_SET_ENCODINGS);
    msg.push_back(0);  // padding
    append_u16(msg, static_cast<uint16_t>(encodings.size()));
    for (int32_t enc : encodings) {
        append_u32(msg, static_cast<uint32_t>(enc));
    }
    return msg;
}

std::vector<uint8_t> build_update_request(bool incremental, uint16_t x, uint16_t y,
                                          uint16_t width, uint16_t height) {
    std::vector<uint8_t> msg;
    msg.push_back(RFB_MSG_FRAMEBUFFER_UPDATE_REQUEST);
    msg.push_back(incremental ? 1 : 0);
    append_u16(msg, x);
    append_u16(msg, y);
    append_u16(msg, width);
    append_u16(msg, height);
    return msg;
}

bool encoding_payload_length(int32_t encoding, int width, int height,
                             int bytes_per_pixel, size_t& len) {
    size_t w = static_cast<size_t>(width);
    size_t h = static_cast<size_t>(height);
    size_t mask_bytes = ((w + 7) / 8) * h;

    switch (encoding) {
        case RFB_ENCODING_RAW:
            len = w * h * static_cast<size_t>(bytes_per_pixel);
            return true;
        case RFB_ENCODING_COPYRECT:
            len = 4;  // src-x, src-y
            return true;
        case RFB_ENCODING_DESKTOP_SIZE:
        case RFB_ENCODING_LAST_RECT:
            len = 0;
            return true;
        case RFB_ENCODING_CURSOR:
            len = w * h * static_cast<size_t>(bytes_per_pixel) + mask_bytes;
            return true;
        case RFB_ENCODING_XCURSOR:
            // Two RGB colours, then source bitmap and mask
            len = (w * h > 0) ? 6 + 2 * mask_bytes : 0;
            return true;
        default:
            return false;
    }
}

const char* encoding_name(int32_t encoding) {
    switch (encoding) {
        case RFB_ENCODING_RAW:                   return "Raw";
        case RFB_ENCODING_COPYRECT:              return "CopyRect";
        case 2:                                  return "RRE";
        case 5:                                  return "Hextile";
        case 6:                                  return "Zlib";
        case 7:                                  return "Tight";
        case 16:                                 return "ZRLE";
        case RFB_ENCODING_DESKTOP_SIZE:          return "DesktopSize";
        case RFB_ENCODING_LAST_RECT:             return "LastRect";
        case RFB_ENCODING_CURSOR:                return "Cursor";
        case RFB_ENCODING_XCURSOR:               return "XCursor";
        case RFB_ENCODING_EXTENDED_DESKTOP_SIZE: return "ExtendedDesktopSize";
        default:                                 return "Unknown";
    }
}

} // namespace vnc
