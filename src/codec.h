/*
 * Image Codec Abstraction
 *
 * Still-image codecs used to export the VNC framebuffer. Every frame is
 * self-contained (no inter-frame state), so callers can drop or cache
 * frames freely.
 */

#ifndef CODEC_H
#define CODEC_H

#include <vector>
#include <cstdint>

struct EncodedFrame {
    std::vector<uint8_t> data;   // Compressed image bytes
    int width = 0;               // Output size (after scaling)
    int height = 0;
    uint64_t sequence = 0;       // 1-based capture counter, 0 = no frame
    uint64_t timestamp_us = 0;   // Capture time (CLOCK_REALTIME microseconds)

    bool empty() const { return data.empty(); }
};

class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    // Get codec name for display/logging
    virtual const char* name() const = 0;

    // MIME type of the produced bytes
    virtual const char* mime_type() const = 0;

    /**
     * Encode an RGB24 image (bytes R,G,B)
     * @param stride Bytes per source row
     * @param out_width,out_height Output size; the image is scaled if it differs
     * @param output Receives the encoded bytes
     * @return false on failure (output is left empty)
     */
    virtual bool encode_rgb(const uint8_t* rgb, int width, int height, int stride,
                            int out_width, int out_height,
                            std::vector<uint8_t>& output) = 0;
};

#endif // CODEC_H
