/*
 * WebP Encoder using libwebp
 * Lossy still frames at a fixed quality, with libyuv box scaling when
 * the framebuffer size differs from the requested output size.
 */

#ifndef WEBP_ENCODER_H
#define WEBP_ENCODER_H

#include "codec.h"
#include <vector>

class WebPEncoder : public ImageCodec {
public:
    explicit WebPEncoder(int quality = 80, bool debug = false);
    ~WebPEncoder() override = default;

    const char* name() const override { return "WebP"; }
    const char* mime_type() const override { return "image/webp"; }

    bool encode_rgb(const uint8_t* rgb, int width, int height, int stride,
                    int out_width, int out_height,
                    std::vector<uint8_t>& output) override;

    int quality() const { return quality_; }

private:
    // Scale RGB24 to out size; result is BGRA (libyuv "ARGB") in scaled_buffer_
    void scale_to_argb(const uint8_t* rgb, int width, int height, int stride,
                       int out_width, int out_height);

    bool encode_picture(const uint8_t* pixels, int width, int height, int stride,
                        bool bgra, std::vector<uint8_t>& output);

    int quality_;
    bool debug_;

    // Working buffers
    std::vector<uint8_t> argb_buffer_;    // Source converted to BGRA
    std::vector<uint8_t> scaled_buffer_;  // Scaled BGRA

    // Stats
    int frame_count_ = 0;
    int64_t total_size_ = 0;
};

#endif // WEBP_ENCODER_H
