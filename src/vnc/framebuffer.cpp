/*
 * VNC Framebuffer Implementation
 */

#include "framebuffer.h"
#include <algorithm>
#include <cstring>

// libyuv for the B,G,R,X -> R,G,B fast path
#include <libyuv.h>

namespace vnc {

void FrameBuffer::resize(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    pixels_.assign(static_cast<size_t>(width_) * height_ * 3, 0);
}

bool FrameBuffer::grow_to_fit(int right, int bottom) {
    int new_width = std::max(width_, right);
    int new_height = std::max(height_, bottom);
    if (new_width == width_ && new_height == height_) {
        return false;
    }

    std::vector<uint8_t> grown(static_cast<size_t>(new_width) * new_height * 3, 0);
    for (int row = 0; row < height_; row++) {
        memcpy(grown.data() + static_cast<size_t>(row) * new_width * 3,
               pixels_.data() + static_cast<size_t>(row) * width_ * 3,
               static_cast<size_t>(width_) * 3);
    }

    pixels_.swap(grown);
    width_ = new_width;
    height_ = new_height;
    return true;
}

void FrameBuffer::clear() {
    width_ = 0;
    height_ = 0;
    pixels_.clear();
    pixels_.shrink_to_fit();
}

void FrameBuffer::blit(int x, int y, int width, int height,
                       const uint8_t* data, const PixelFormat& pf) {
    if (width <= 0 || height <= 0) return;

    if (pf.is_bgrx()) {
        uint8_t* dst = pixels_.data() + (static_cast<size_t>(y) * width_ + x) * 3;
        libyuv::ARGBToRAW(
            data, width * 4,
            dst, stride(),
            width, height
        );
        return;
    }

    blit_generic(x, y, width, height, data, pf);
}

// Arbitrary true-colour formats: 8/16/32 bpp, either byte order
void FrameBuffer::blit_generic(int x, int y, int width, int height,
                               const uint8_t* data, const PixelFormat& pf) {
    int bpp = pf.bytes_per_pixel();
    uint32_t rmax = pf.red_max ? pf.red_max : 1;
    uint32_t gmax = pf.green_max ? pf.green_max : 1;
    uint32_t bmax = pf.blue_max ? pf.blue_max : 1;

    for (int row = 0; row < height; row++) {
        const uint8_t* src = data + static_cast<size_t>(row) * width * bpp;
        uint8_t* dst = pixels_.data() + (static_cast<size_t>(y + row) * width_ + x) * 3;

        for (int col = 0; col < width; col++) {
            uint32_t value = 0;
            switch (bpp) {
                case 1:
                    value = src[0];
                    break;
                case 2:
                    value = pf.big_endian ? (src[0] << 8) | src[1]
                                          : (src[1] << 8) | src[0];
                    break;
                default:
                    value = pf.big_endian ? read_u32(src)
                                          : (static_cast<uint32_t>(src[3]) << 24) |
                                            (static_cast<uint32_t>(src[2]) << 16) |
                                            (static_cast<uint32_t>(src[1]) << 8) |
                                            static_cast<uint32_t>(src[0]);
                    break;
            }

            uint32_t r = (value >> pf.red_shift) & pf.red_max;
            uint32_t g = (value >> pf.green_shift) & pf.green_max;
            uint32_t b = (value >> pf.blue_shift) & pf.blue_max;
            dst[0] = static_cast<uint8_t>(r * 255 / rmax);
            dst[1] = static_cast<uint8_t>(g * 255 / gmax);
            dst[2] = static_cast<uint8_t>(b * 255 / bmax);

            src += bpp;
            dst += 3;
        }
    }
}

} // namespace vnc
