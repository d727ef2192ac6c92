#include "ptt_dictation/audio/capture_callback.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

using ptt_dictation::CaptureCallback;
using ptt_dictation::CaptureConfig;
using ptt_dictation::ChannelStatus;
using ptt_dictation::SampleBuffer;
using ptt_dictation::SampleFormat;
using ptt_dictation::make_channel;

namespace {

CaptureConfig make_config(int channels, SampleFormat format, int rate = 48000) {
    CaptureConfig config;
    config.sample_rate = rate;
    config.channels = channels;
    config.format = format;
    return config;
}

template <typename T>
void feed(CaptureCallback& callback, const std::vector<T>& interleaved) {
    callback(reinterpret_cast<const uint8_t*>(interleaved.data()),
             static_cast<int>(interleaved.size() * sizeof(T)));
}

} // namespace

TEST(CaptureCallback, StereoFloatFramesAreAveraged) {
    auto channel = make_channel<SampleBuffer>();
    CaptureCallback callback(make_config(2, SampleFormat::F32), channel.first);

    feed<float>(callback, {0.2f, 0.4f, -1.0f, 1.0f, 0.5f, 0.0f});

    SampleBuffer chunk;
    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    ASSERT_EQ(chunk.size(), 3u);
    EXPECT_FLOAT_EQ(chunk[0], 0.3f);
    EXPECT_FLOAT_EQ(chunk[1], 0.0f);
    EXPECT_FLOAT_EQ(chunk[2], 0.25f);
}

TEST(CaptureCallback, EachHardwareBufferBecomesOneChunk) {
    auto channel = make_channel<SampleBuffer>();
    CaptureCallback callback(make_config(1, SampleFormat::F32), channel.first);

    feed<float>(callback, {0.1f, 0.2f});
    feed<float>(callback, {0.3f});

    SampleBuffer chunk;
    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    EXPECT_EQ(chunk.size(), 2u);
    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    EXPECT_EQ(chunk.size(), 1u);
    EXPECT_EQ(channel.second.try_recv(chunk), ChannelStatus::Empty);
}

TEST(CaptureCallback, SignedSixteenBitIsScaledToUnitRange) {
    auto channel = make_channel<SampleBuffer>();
    CaptureCallback callback(make_config(1, SampleFormat::S16), channel.first);

    feed<int16_t>(callback, {16384, -32768, 0});

    SampleBuffer chunk;
    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    ASSERT_EQ(chunk.size(), 3u);
    EXPECT_FLOAT_EQ(chunk[0], 0.5f);
    EXPECT_FLOAT_EQ(chunk[1], -1.0f);
    EXPECT_FLOAT_EQ(chunk[2], 0.0f);
}

TEST(CaptureCallback, UnsignedFormatsAreCentred) {
    auto channel = make_channel<SampleBuffer>();
    CaptureCallback u8(make_config(1, SampleFormat::U8), channel.first);
    CaptureCallback u16(make_config(2, SampleFormat::U16), channel.first);

    feed<uint8_t>(u8, {128, 0, 192});
    feed<uint16_t>(u16, {32768, 49152});

    SampleBuffer chunk;
    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    ASSERT_EQ(chunk.size(), 3u);
    EXPECT_FLOAT_EQ(chunk[0], 0.0f);
    EXPECT_FLOAT_EQ(chunk[1], -1.0f);
    EXPECT_FLOAT_EQ(chunk[2], 0.5f);

    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    ASSERT_EQ(chunk.size(), 1u);
    EXPECT_FLOAT_EQ(chunk[0], 0.25f);
}

TEST(CaptureCallback, ThirtyTwoBitAndEightBitSigned) {
    auto channel = make_channel<SampleBuffer>();
    CaptureCallback s32(make_config(1, SampleFormat::S32), channel.first);
    CaptureCallback s8(make_config(1, SampleFormat::S8), channel.first);

    feed<int32_t>(s32, {1073741824});
    feed<int8_t>(s8, {-64});

    SampleBuffer chunk;
    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    EXPECT_FLOAT_EQ(chunk.at(0), 0.5f);
    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    EXPECT_FLOAT_EQ(chunk.at(0), -0.5f);
}

TEST(CaptureCallback, TrailingPartialFrameIsIgnored) {
    auto channel = make_channel<SampleBuffer>();
    CaptureCallback callback(make_config(2, SampleFormat::F32), channel.first);

    feed<float>(callback, {0.5f, 0.5f, 0.9f});

    SampleBuffer chunk;
    ASSERT_EQ(channel.second.try_recv(chunk), ChannelStatus::Ok);
    ASSERT_EQ(chunk.size(), 1u);
    EXPECT_FLOAT_EQ(chunk[0], 0.5f);
}

TEST(CaptureCallback, EmptyBufferSendsNothing) {
    auto channel = make_channel<SampleBuffer>();
    CaptureCallback callback(make_config(2, SampleFormat::F32), channel.first);

    callback(nullptr, 0);
    feed<float>(callback, {0.1f});

    SampleBuffer chunk;
    EXPECT_EQ(channel.second.try_recv(chunk), ChannelStatus::Empty);
}

TEST(CaptureCallback, ChunksAreDroppedWhenWorkerIsGone) {
    auto channel = make_channel<SampleBuffer>();
    CaptureCallback callback(make_config(1, SampleFormat::F32), channel.first);
    channel.second = ptt_dictation::Receiver<SampleBuffer>();

    EXPECT_NO_THROW(feed<float>(callback, {0.1f, 0.2f}));
}

TEST(CaptureCallback, RejectsZeroChannels) {
    auto channel = make_channel<SampleBuffer>();
    EXPECT_THROW(CaptureCallback(make_config(0, SampleFormat::F32), channel.first),
                 std::invalid_argument);
}
