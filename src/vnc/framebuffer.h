/*
 * VNC Framebuffer
 *
 * Client-side copy of the remote screen, stored as packed RGB24
 * (bytes R,G,B, no row padding). Pixel data from the server is
 * converted on the way in according to the negotiated PixelFormat.
 */

#ifndef VNC_FRAMEBUFFER_H
#define VNC_FRAMEBUFFER_H

#include "rfb_protocol.h"
#include <cstdint>
#include <vector>

namespace vnc {

class FrameBuffer {
public:
    FrameBuffer() = default;

    // Reallocate to width x height, all black
    void resize(int width, int height);

    /**
     * Enlarge so that (right, bottom) fits, keeping existing pixels
     * @return true if the size changed
     */
    bool grow_to_fit(int right, int bottom);

    /**
     * Copy a rectangle of server pixels into the buffer
     * Caller must make sure the rectangle is inside the buffer.
     * @param data width*height pixels in the given format
     */
    void blit(int x, int y, int width, int height,
              const uint8_t* data, const PixelFormat& pf);

    void clear();

    int width() const { return width_; }
    int height() const { return height_; }
    int stride() const { return width_ * 3; }
    bool empty() const { return width_ == 0 || height_ == 0; }

    const std::vector<uint8_t>& pixels() const { return pixels_; }

private:
    void blit_generic(int x, int y, int width, int height,
                      const uint8_t* data, const PixelFormat& pf);

    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> pixels_;
};

} // namespace vnc

#endif // VNC_FRAMEBUFFER_H
