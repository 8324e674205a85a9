/*
 * WebP Encoder using libwebp (lossy mode)
 * Quality is fixed per encoder; method 2 keeps per-frame latency low
 * at screen-streaming rates.
 */

#include "webp_encoder.h"
#include <webp/encode.h>
#include <cstdio>

// libyuv for RGB -> BGRA conversion and scaling
#include <libyuv.h>

WebPEncoder::WebPEncoder(int quality, bool debug)
    : quality_(quality)
    , debug_(debug)
{
}

void WebPEncoder::scale_to_argb(const uint8_t* rgb, int width, int height, int stride,
                                int out_width, int out_height) {
    // RGB bytes (libyuv "RAW") -> B,G,R,A bytes (libyuv "ARGB")
    argb_buffer_.resize(static_cast<size_t>(width) * height * 4);
    libyuv::RAWToARGB(
        rgb, stride,
        argb_buffer_.data(), width * 4,
        width, height
    );

    scaled_buffer_.resize(static_cast<size_t>(out_width) * out_height * 4);
    libyuv::ARGBScale(
        argb_buffer_.data(), width * 4, width, height,
        scaled_buffer_.data(), out_width * 4, out_width, out_height,
        libyuv::kFilterBox
    );
}

bool WebPEncoder::encode_picture(const uint8_t* pixels, int width, int height, int stride,
                                 bool bgra, std::vector<uint8_t>& output) {
    output.clear();

    WebPConfig config;
    if (!WebPConfigPreset(&config, WEBP_PRESET_DEFAULT, static_cast<float>(quality_))) {
        fprintf(stderr, "WebP: Failed to initialize config\n");
        return false;
    }
    config.method = 2;

    if (!WebPValidateConfig(&config)) {
        fprintf(stderr, "WebP: Invalid config (quality %d)\n", quality_);
        return false;
    }

    WebPPicture picture;
    if (!WebPPictureInit(&picture)) {
        fprintf(stderr, "WebP: Failed to initialize picture\n");
        return false;
    }
    picture.width = width;
    picture.height = height;

    int imported = bgra ? WebPPictureImportBGRA(&picture, pixels, stride)
                        : WebPPictureImportRGB(&picture, pixels, stride);
    if (!imported) {
        fprintf(stderr, "WebP: Failed to import %dx%d picture\n", width, height);
        WebPPictureFree(&picture);
        return false;
    }

    WebPMemoryWriter writer;
    WebPMemoryWriterInit(&writer);
    picture.writer = WebPMemoryWrite;
    picture.custom_ptr = &writer;

    if (!WebPEncode(&config, &picture)) {
        fprintf(stderr, "WebP: Encoding failed (error code: %d)\n", picture.error_code);
        WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
        return false;
    }

    output.assign(writer.mem, writer.mem + writer.size);

    WebPPictureFree(&picture);
    WebPMemoryWriterClear(&writer);
    return true;
}

bool WebPEncoder::encode_rgb(const uint8_t* rgb, int width, int height, int stride,
                             int out_width, int out_height,
                             std::vector<uint8_t>& output) {
    output.clear();
    if (!rgb || width <= 0 || height <= 0) {
        return false;
    }
    if (out_width <= 0 || out_height <= 0) {
        out_width = width;
        out_height = height;
    }

    bool ok;
    if (out_width == width && out_height == height) {
        ok = encode_picture(rgb, width, height, stride, false, output);
    } else {
        scale_to_argb(rgb, width, height, stride, out_width, out_height);
        ok = encode_picture(scaled_buffer_.data(), out_width, out_height, out_width * 4, true, output);
    }

    if (!ok) {
        return false;
    }

    frame_count_++;
    total_size_ += output.size();

    // Log every 30 frames (only if debug enabled)
    if (debug_ && frame_count_ % 30 == 0) {
        float avg_size = static_cast<float>(total_size_) / frame_count_;
        fprintf(stderr, "WebP: frame=%d %dx%d size=%zu bytes (avg %.1f KB)\n",
                frame_count_, out_width, out_height, output.size(), avg_size / 1024.0f);
    }

    return true;
}
