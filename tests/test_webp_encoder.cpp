/**
 * @file test_webp_encoder.cpp
 * @brief WebP still-frame encoding and scaling.
 */

#include <gtest/gtest.h>
#include "webp_encoder.h"

#include <webp/decode.h>

static std::vector<uint8_t> gradient(int width, int height) {
    std::vector<uint8_t> rgb(static_cast<size_t>(width) * height * 3);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            uint8_t* p = rgb.data() + (static_cast<size_t>(y) * width + x) * 3;
            p[0] = static_cast<uint8_t>(x * 4);
            p[1] = static_cast<uint8_t>(y * 4);
            p[2] = 128;
        }
    }
    return rgb;
}

TEST(WebPEncoderTest, Describes) {
    WebPEncoder encoder;
    EXPECT_STREQ(encoder.name(), "WebP");
    EXPECT_STREQ(encoder.mime_type(), "image/webp");
    EXPECT_EQ(encoder.quality(), 80);
}

TEST(WebPEncoderTest, EncodesAtSourceSize) {
    WebPEncoder encoder;
    std::vector<uint8_t> rgb = gradient(64, 48);
    std::vector<uint8_t> out;

    ASSERT_TRUE(encoder.encode_rgb(rgb.data(), 64, 48, 64 * 3, 64, 48, out));
    ASSERT_GT(out.size(), 12u);
    EXPECT_EQ(std::string(out.begin(), out.begin() + 4), "RIFF");
    EXPECT_EQ(std::string(out.begin() + 8, out.begin() + 12), "WEBP");

    int w = 0, h = 0;
    ASSERT_TRUE(WebPGetInfo(out.data(), out.size(), &w, &h));
    EXPECT_EQ(w, 64);
    EXPECT_EQ(h, 48);
}

TEST(WebPEncoderTest, ScalesToOutputSize) {
    WebPEncoder encoder;
    std::vector<uint8_t> rgb = gradient(64, 48);
    std::vector<uint8_t> out;

    ASSERT_TRUE(encoder.encode_rgb(rgb.data(), 64, 48, 64 * 3, 32, 24, out));

    int w = 0, h = 0;
    ASSERT_TRUE(WebPGetInfo(out.data(), out.size(), &w, &h));
    EXPECT_EQ(w, 32);
    EXPECT_EQ(h, 24);
}

TEST(WebPEncoderTest, SameInputSameBytes) {
    WebPEncoder encoder;
    std::vector<uint8_t> rgb = gradient(32, 32);
    std::vector<uint8_t> a, b;

    ASSERT_TRUE(encoder.encode_rgb(rgb.data(), 32, 32, 32 * 3, 32, 32, a));
    ASSERT_TRUE(encoder.encode_rgb(rgb.data(), 32, 32, 32 * 3, 32, 32, b));
    EXPECT_EQ(a, b);
}

TEST(WebPEncoderTest, RejectsEmptyImage) {
    WebPEncoder encoder;
    std::vector<uint8_t> out;
    uint8_t dummy[3] = {0, 0, 0};
    EXPECT_FALSE(encoder.encode_rgb(dummy, 0, 0, 0, 0, 0, out));
    EXPECT_TRUE(out.empty());
}
